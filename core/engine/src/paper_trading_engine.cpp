#include "papertrade/engine/paper_trading_engine.hpp"

#include "papertrade/common/errors.hpp"
#include "papertrade/market/simulated_market_data_provider.hpp"
#include "papertrade/market/zmq_market_data_provider.hpp"
#include "papertrade/serialization/json_codec.hpp"
#include "papertrade/storage/ledger_snapshot.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <iostream>
#include <sstream>
#include <utility>
#include <vector>

namespace papertrade {

namespace {

constexpr std::size_t kDefaultQueryLimit = 50;

std::size_t parseLimit(const std::vector<std::string>& args, std::size_t index) {
  if (args.size() <= index) {
    return kDefaultQueryLimit;
  }
  try {
    std::size_t consumed = 0;
    const unsigned long value = std::stoul(args[index], &consumed);
    if (consumed != args[index].size() || value == 0) {
      throw ValidationError("limit must be a positive integer");
    }
    return static_cast<std::size_t>(value);
  } catch (const std::logic_error&) {
    throw ValidationError("limit must be a positive integer: " + args[index]);
  }
}

const std::string& requireArg(const std::vector<std::string>& args, std::size_t index,
                              const char* what) {
  if (args.size() <= index) {
    throw ValidationError(std::string("missing argument: ") + what);
  }
  return args[index];
}

nlohmann::json ok() { return nlohmann::json{{"status", "ok"}}; }

nlohmann::json error(const std::string& message) {
  return nlohmann::json{{"status", "error"}, {"message", message}};
}

nlohmann::json jobStatusJson(const JobStatus& status) {
  nlohmann::json j;
  j["name"] = status.spec.name;
  j["state"] = jobStateToString(status.state);
  j["enabled"] = status.spec.enabled;
  j["cadence_ms"] = status.spec.cadence_ms;
  j["market_hours_only"] = status.spec.market_hours_only;
  j["next_due_ms"] = status.next_due_ms;
  j["consecutive_failures"] = status.consecutive_failures;
  if (status.last_run) {
    j["last_run"] = *status.last_run;
  } else {
    j["last_run"] = nullptr;
  }
  return j;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
PaperTradingEngine::PaperTradingEngine(EngineConfig config, const ITimeProvider& clock,
                                       std::unique_ptr<IMarketDataProvider> provider)
    : config_(std::move(config)),
      clock_(clock),
      calendar_(config_.market),
      audit_(event_bus_, config_.storage.audit_capacity),
      ledger_(clock_),
      cache_(clock_, config_.storage.history_capacity),
      rate_limiter_(clock_, config_.provider.rate_limit.capacity,
                    config_.provider.rate_limit.refill_per_second),
      watchlist_(config_.watchlist),
      strategies_(config_.strategies),
      provider_(provider ? std::move(provider) : makeProvider(config_.provider, clock_)) {
  // ---  1) Ledger contents: snapshot first, then any seed not yet present --
  restoreLedger();
  seedAccounts();

  // ---  2) Jobs, each borrowing the shared state it works on ---------------
  ExecutionSettings settings;
  settings.max_quote_age_ms = config_.execution.max_quote_age_ms;
  execution_ = std::make_unique<OrderExecutionEngine>(
      ledger_, cache_, audit_, clock_, makeFillPolicy(config_.execution.fill_policy),
      settings);
  valuation_ = std::make_unique<PositionValuationService>(
      ledger_, cache_, audit_, clock_, config_.execution.max_quote_age_ms);
  refresher_ = std::make_unique<PriceFeedRefresher>(*provider_, cache_, rate_limiter_,
                                                    ledger_, watchlist_, strategies_);
  signals_ = std::make_unique<StrategySignalEngine>(strategies_, ledger_, cache_,
                                                    *execution_, audit_, clock_,
                                                    provider_.get(), &rate_limiter_);

  // ---  3) Scheduler ---------------------------------------------------------
  scheduler_ = std::make_unique<JobScheduler>(clock_, calendar_, audit_);
  registerJobs();

  std::cout << "[PaperTradingEngine] ready. provider=" << provider_->name()
            << " fill_policy=" << execution_->fillPolicy().name()
            << " accounts=" << ledger_.accounts().size()
            << " strategies=" << strategies_.all().size() << "\n";
}

PaperTradingEngine::~PaperTradingEngine() { stop(); }

std::unique_ptr<IMarketDataProvider> PaperTradingEngine::makeProvider(
    const ProviderConfig& config, const ITimeProvider& clock) {
  if (config.type == "zmq") {
    return std::make_unique<ZmqMarketDataProvider>(
        config.endpoint, std::chrono::milliseconds(config.timeout_ms));
  }
  if (config.type == "simulated") {
    return std::make_unique<SimulatedMarketDataProvider>(clock, config.simulated);
  }
  throw ConfigError("unknown provider type: " + config.type);
}

std::unique_ptr<IFillPolicy> PaperTradingEngine::makeFillPolicy(
    const FillPolicyConfig& config) {
  if (config.type == "liquidity_capped") {
    return std::make_unique<LiquidityCappedFillPolicy>(config.max_fill_quantity);
  }
  if (config.type == "full") {
    return std::make_unique<FullFillPolicy>();
  }
  throw ConfigError("unknown fill policy: " + config.type);
}

void PaperTradingEngine::restoreLedger() {
  if (config_.storage.snapshot_path.empty()) {
    return;
  }
  loadLedgerSnapshot(ledger_, config_.storage.snapshot_path);
}

void PaperTradingEngine::seedAccounts() {
  for (const auto& seed : config_.accounts) {
    if (ledger_.account(seed.id)) {
      continue;
    }
    domain::Account account;
    account.id = seed.id;
    account.cash_balance = seed.cash;
    account.initial_cash = seed.cash;
    account.strategy_id = seed.strategy_id;
    account.auto_trade = seed.auto_trade;
    ledger_.openAccount(std::move(account));
    std::cout << "[PaperTradingEngine] opened account " << seed.id << " cash="
              << seed.cash << (seed.auto_trade ? " (auto trade)" : "") << "\n";
  }
}

// Registration order is the cycle order: fresh prices, then fills against
// them, then valuation of the result, then new signals for the next pass.
void PaperTradingEngine::registerJobs() {
  const std::pair<const char*, IJob*> jobs[] = {
      {kPriceFeedJob, refresher_.get()},
      {kOrderExecutionJob, execution_.get()},
      {kPositionValuationJob, valuation_.get()},
      {kStrategySignalsJob, signals_.get()},
  };
  const auto defaults = EngineConfig::defaultJobs();
  for (const auto& [name, job] : jobs) {
    const JobSpec* spec = config_.job(name);
    if (spec == nullptr) {
      spec = &*std::find_if(defaults.begin(), defaults.end(),
                            [&](const JobSpec& s) { return s.name == name; });
    }
    scheduler_->registerJob(*spec, *job);
  }
}

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void PaperTradingEngine::start() {
  if (running_) {
    return;
  }

  // ---  1) IPC server and telemetry bridge ----------------------------------
  if (!config_.ipc.cmd_endpoint.empty() && !config_.ipc.pub_endpoint.empty()) {
    ipc_server_ = std::make_unique<IpcServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        config_.ipc.cmd_endpoint, config_.ipc.pub_endpoint);
    ipc_server_->start();
    telemetry_subscription_ = event_bus_.subscribe(
        [this](const Event& event) { ipc_server_->pushTelemetry(event); });
  }

  // ---  2) Job threads LAST (ticks begin) -----------------------------------
  scheduler_->start();
  running_ = true;

  std::cout << "[PaperTradingEngine] started. Market "
            << (calendar_.isOpen(clock_.now_ms()) ? "open" : "closed") << ".\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void PaperTradingEngine::stop() {
  if (!running_) {
    return;
  }

  // ---  1) No more ticks ------------------------------------------------------
  scheduler_->stop();

  // ---  2) IPC server joins before the components it queries go away ------
  if (telemetry_subscription_) {
    event_bus_.unsubscribe(*telemetry_subscription_);
    telemetry_subscription_.reset();
  }
  ipc_server_.reset();

  // ---  3) Persist the ledger --------------------------------------------------
  if (!config_.storage.snapshot_path.empty()) {
    try {
      saveLedgerSnapshot(ledger_, config_.storage.snapshot_path);
    } catch (const StorageUnavailableError& e) {
      std::cerr << "[PaperTradingEngine] CRITICAL: ledger snapshot not saved: "
                << e.what() << "\n";
    }
  }

  running_ = false;
  std::cout << "[PaperTradingEngine] stopped. All threads joined.\n";
}

std::size_t PaperTradingEngine::runDueJobs() { return scheduler_->runDueJobs(); }

domain::JobRun PaperTradingEngine::runJob(const std::string& name) {
  return scheduler_->forceRun(name);
}

// -----------------------------------------------------------------------------
// executeCommand(): handle IPC command requests
// -----------------------------------------------------------------------------
std::string PaperTradingEngine::executeCommand(const std::string& cmd) {
  std::istringstream stream(cmd);
  std::vector<std::string> args;
  for (std::string token; stream >> token;) {
    args.push_back(token);
  }
  if (args.empty()) {
    return error("empty command").dump();
  }
  std::string verb = args[0];
  std::transform(verb.begin(), verb.end(), verb.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

  nlohmann::json response = ok();
  try {
    if (verb == "PING") {
      response["response"] = "PONG";
    } else if (verb == "STATUS") {
      const std::int64_t now = clock_.now_ms();
      response["now_ms"] = now;
      response["market_open"] = calendar_.isOpen(now);
      response["next_open_ms"] = calendar_.nextOpen(now);
      response["running"] = running_;
      response["provider"] = provider_->name();
      response["accounts"] = ledger_.accounts().size();
      response["open_orders"] = ledger_.openOrders().size();
      response["cached_quotes"] = cache_.size();
      response["rate_limit_tokens"] = rate_limiter_.available();
      nlohmann::json jobs = nlohmann::json::array();
      for (const auto& status : scheduler_->status()) {
        jobs.push_back(jobStatusJson(status));
      }
      response["jobs"] = std::move(jobs);
    } else if (verb == "JOBS") {
      nlohmann::json jobs = nlohmann::json::array();
      for (const auto& status : scheduler_->status()) {
        jobs.push_back(jobStatusJson(status));
      }
      response["jobs"] = std::move(jobs);
      response["recent_runs"] = audit_.recentJobRuns(parseLimit(args, 1));
    } else if (verb == "RUN") {
      response["run"] = scheduler_->forceRun(requireArg(args, 1, "job name"));
    } else if (verb == "PERFORMANCE") {
      response["performance"] = valuation_->performance(requireArg(args, 1, "account"));
    } else if (verb == "HOLDINGS") {
      const auto performance = valuation_->performance(requireArg(args, 1, "account"));
      response["account_id"] = performance.summary.account_id;
      response["cash_balance"] = performance.summary.cash_balance;
      response["holdings"] = performance.holdings;
    } else if (verb == "ORDERS") {
      response["orders"] = ledger_.orders(requireArg(args, 1, "account"), parseLimit(args, 2));
    } else if (verb == "TRADES") {
      response["trades"] = ledger_.trades(requireArg(args, 1, "account"), parseLimit(args, 2));
    } else if (verb == "SIGNALS") {
      response["signals"] = audit_.recentSignals(parseLimit(args, 1));
    } else if (verb == "SUBMIT") {
      const auto payload_start = cmd.find_first_of("{");
      if (payload_start == std::string::npos) {
        throw ValidationError("SUBMIT expects a JSON order");
      }
      const auto request =
          nlohmann::json::parse(cmd.substr(payload_start)).get<domain::OrderRequest>();
      response["order"] = execution_->submitOrder(request);
    } else if (verb == "CANCEL") {
      const auto& id_text = requireArg(args, 1, "order id");
      domain::OrderId id = 0;
      try {
        id = std::stoull(id_text);
      } catch (const std::logic_error&) {
        throw ValidationError("invalid order id: " + id_text);
      }
      response["cancelled"] = execution_->cancelOrder(id);
      if (auto order = ledger_.order(id)) {
        response["order"] = *order;
      } else {
        throw ValidationError("unknown order: " + id_text);
      }
    } else if (verb == "AUTOTRADE") {
      const auto& account_id = requireArg(args, 1, "account");
      std::string mode = requireArg(args, 2, "on|off");
      std::transform(mode.begin(), mode.end(), mode.begin(),
                     [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
      if (mode != "on" && mode != "off") {
        throw ValidationError("AUTOTRADE expects on or off, got " + mode);
      }
      ledger_.setAutoTrade(account_id, mode == "on");
      response["account"] = *ledger_.account(account_id);
    } else if (verb == "QUOTES") {
      nlohmann::json quotes = nlohmann::json::array();
      for (const auto& symbol : cache_.symbols()) {
        const auto quote = cache_.get(symbol);
        const auto age = cache_.staleness(symbol);
        if (!quote || !age) {
          continue;
        }
        nlohmann::json entry = *quote;
        entry["age_ms"] = age->count();
        entry["stale"] = age->count() > config_.execution.max_quote_age_ms;
        quotes.push_back(std::move(entry));
      }
      response["quotes"] = std::move(quotes);
    } else if (verb == "WATCH") {
      response["added"] = watchlist_.add(requireArg(args, 1, "symbol"));
    } else if (verb == "UNWATCH") {
      response["removed"] = watchlist_.remove(requireArg(args, 1, "symbol"));
    } else {
      response = error("Unknown command: " + args[0]);
    }
  } catch (const ValidationError& e) {
    response = error(e.what());
  } catch (const StorageUnavailableError& e) {
    response = error(std::string("storage unavailable: ") + e.what());
  } catch (const nlohmann::json::exception& e) {
    response = error(std::string("malformed request: ") + e.what());
  }

  return response.dump();
}

}  // namespace papertrade
