#include "papertrade/config/engine_config.hpp"

#include "papertrade/common/errors.hpp"
#include "papertrade/storage/strategy_repository.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iostream>
#include <map>
#include <set>
#include <utility>

namespace papertrade {

using nlohmann::json;

namespace {

void requireObject(const json& node, const std::string& where) {
  if (!node.is_object()) {
    throw ConfigError(where + ": expected a JSON object");
  }
}

// Copies node[key] into out when present. Missing keys and nulls keep the
// default already in out.
template <typename T>
void read(const json& node, const char* key, T& out, const std::string& where) {
  auto it = node.find(key);
  if (it == node.end() || it->is_null()) {
    return;
  }
  try {
    out = it->template get<T>();
  } catch (const json::exception& e) {
    throw ConfigError(where + "." + key + ": " + e.what());
  }
}

template <typename T>
T required(const json& node, const char* key, const std::string& where) {
  auto it = node.find(key);
  if (it == node.end() || it->is_null()) {
    throw ConfigError(where + "." + key + ": missing");
  }
  T value{};
  read(node, key, value, where);
  return value;
}

void requirePositive(double value, const std::string& what) {
  if (!std::isfinite(value) || value <= 0.0) {
    throw ConfigError(what + " must be positive");
  }
}

MarketCalendarConfig parseMarket(const json& node) {
  const std::string where = "market";
  requireObject(node, where);
  MarketCalendarConfig market;
  read(node, "utc_offset_minutes", market.standard_utc_offset_minutes, where);
  read(node, "us_daylight_saving", market.us_daylight_saving, where);

  std::string open;
  std::string close;
  read(node, "open", open, where);
  read(node, "close", close, where);
  if (!open.empty()) market.open_minute_of_day = parseMinuteOfDay(open);
  if (!close.empty()) market.close_minute_of_day = parseMinuteOfDay(close);
  if (market.open_minute_of_day >= market.close_minute_of_day) {
    throw ConfigError("market: open must be before close");
  }

  std::vector<std::string> holidays;
  read(node, "extra_holidays", holidays, where);
  for (const auto& text : holidays) {
    market.extra_holidays.push_back(parseCivilDate(text));
  }
  return market;
}

void parseJobs(const json& node, std::vector<JobSpec>& jobs) {
  requireObject(node, "jobs");
  for (auto it = node.begin(); it != node.end(); ++it) {
    const std::string where = "jobs." + it.key();
    auto spec = std::find_if(jobs.begin(), jobs.end(),
                             [&](const JobSpec& s) { return s.name == it.key(); });
    if (spec == jobs.end()) {
      throw ConfigError(where + ": unknown job");
    }
    requireObject(it.value(), where);
    read(it.value(), "cadence_ms", spec->cadence_ms, where);
    read(it.value(), "market_hours_only", spec->market_hours_only, where);
    read(it.value(), "max_duration_ms", spec->max_duration_ms, where);
    read(it.value(), "backoff_max_ms", spec->backoff_max_ms, where);
    read(it.value(), "enabled", spec->enabled, where);
    if (spec->cadence_ms <= 0) throw ConfigError(where + ".cadence_ms must be positive");
    if (spec->max_duration_ms <= 0) {
      throw ConfigError(where + ".max_duration_ms must be positive");
    }
    if (spec->backoff_max_ms < spec->cadence_ms) {
      throw ConfigError(where + ".backoff_max_ms must not be below cadence_ms");
    }
  }
}

ProviderConfig parseProvider(const json& node) {
  const std::string where = "provider";
  requireObject(node, where);
  ProviderConfig provider;
  read(node, "type", provider.type, where);
  read(node, "endpoint", provider.endpoint, where);
  read(node, "timeout_ms", provider.timeout_ms, where);
  if (provider.type != "simulated" && provider.type != "zmq") {
    throw ConfigError("provider.type must be \"simulated\" or \"zmq\"");
  }
  if (provider.timeout_ms <= 0) {
    throw ConfigError("provider.timeout_ms must be positive");
  }
  if (provider.type == "zmq" && provider.endpoint.empty()) {
    throw ConfigError("provider.endpoint is required for the zmq provider");
  }

  if (auto rl = node.find("rate_limit"); rl != node.end()) {
    requireObject(*rl, "provider.rate_limit");
    read(*rl, "capacity", provider.rate_limit.capacity, "provider.rate_limit");
    read(*rl, "refill_per_second", provider.rate_limit.refill_per_second,
         "provider.rate_limit");
  }
  requirePositive(provider.rate_limit.capacity, "provider.rate_limit.capacity");
  requirePositive(provider.rate_limit.refill_per_second,
                  "provider.rate_limit.refill_per_second");

  if (auto sim = node.find("simulated"); sim != node.end()) {
    const std::string sim_where = "provider.simulated";
    requireObject(*sim, sim_where);
    auto& cfg = provider.simulated;
    read(*sim, "seed", cfg.seed, sim_where);
    read(*sim, "failure_rate", cfg.failure_rate, sim_where);
    read(*sim, "volatility", cfg.volatility, sim_where);
    read(*sim, "default_start_price", cfg.default_start_price, sim_where);
    std::map<std::string, double> prices;
    read(*sim, "start_prices", prices, sim_where);
    for (const auto& [symbol, price] : prices) {
      requirePositive(price, sim_where + ".start_prices." + symbol);
      cfg.start_prices[domain::normalizeSymbol(symbol)] = price;
    }
    if (cfg.failure_rate < 0.0 || cfg.failure_rate > 1.0) {
      throw ConfigError(sim_where + ".failure_rate must be within [0, 1]");
    }
    if (!std::isfinite(cfg.volatility) || cfg.volatility < 0.0) {
      throw ConfigError(sim_where + ".volatility must not be negative");
    }
    requirePositive(cfg.default_start_price, sim_where + ".default_start_price");
  }
  return provider;
}

ExecutionConfig parseExecution(const json& node) {
  const std::string where = "execution";
  requireObject(node, where);
  ExecutionConfig execution;
  read(node, "max_quote_age_ms", execution.max_quote_age_ms, where);
  if (execution.max_quote_age_ms <= 0) {
    throw ConfigError("execution.max_quote_age_ms must be positive");
  }
  if (auto fp = node.find("fill_policy"); fp != node.end()) {
    requireObject(*fp, "execution.fill_policy");
    read(*fp, "type", execution.fill_policy.type, "execution.fill_policy");
    read(*fp, "max_fill_quantity", execution.fill_policy.max_fill_quantity,
         "execution.fill_policy");
  }
  const auto& type = execution.fill_policy.type;
  if (type == "liquidity_capped") {
    requirePositive(execution.fill_policy.max_fill_quantity,
                    "execution.fill_policy.max_fill_quantity");
  } else if (type != "full") {
    throw ConfigError("execution.fill_policy.type must be \"full\" or \"liquidity_capped\"");
  }
  return execution;
}

std::vector<AccountSeed> parseAccounts(const json& node) {
  if (!node.is_array()) {
    throw ConfigError("accounts: expected an array");
  }
  std::vector<AccountSeed> seeds;
  std::set<domain::AccountId> seen;
  for (std::size_t i = 0; i < node.size(); ++i) {
    const std::string where = "accounts[" + std::to_string(i) + "]";
    const json& entry = node[i];
    requireObject(entry, where);
    AccountSeed seed;
    seed.id = required<std::string>(entry, "id", where);
    read(entry, "cash", seed.cash, where);
    read(entry, "auto_trade", seed.auto_trade, where);
    if (auto sid = entry.find("strategy_id"); sid != entry.end() && !sid->is_null()) {
      seed.strategy_id = required<domain::StrategyId>(entry, "strategy_id", where);
    }
    if (seed.id.empty()) throw ConfigError(where + ".id must not be empty");
    if (!std::isfinite(seed.cash) || seed.cash < 0.0) {
      throw ConfigError(where + ".cash must not be negative");
    }
    if (!seen.insert(seed.id).second) {
      throw ConfigError(where + ": duplicate account id " + seed.id);
    }
    seeds.push_back(std::move(seed));
  }
  return seeds;
}

domain::StrategyRules parseRules(const std::string& kind, const json& params,
                                 const std::string& where) {
  if (kind == "rsi_reversion") {
    domain::RsiReversionRules rules;
    read(params, "period", rules.period, where);
    read(params, "oversold", rules.oversold, where);
    read(params, "overbought", rules.overbought, where);
    return rules;
  }
  if (kind == "ma_crossover") {
    domain::MovingAverageCrossRules rules;
    read(params, "short_window", rules.short_window, where);
    read(params, "long_window", rules.long_window, where);
    return rules;
  }
  if (kind == "composite_score") {
    domain::CompositeScoreRules rules;
    read(params, "rsi_period", rules.rsi_period, where);
    read(params, "oversold", rules.oversold, where);
    read(params, "overbought", rules.overbought, where);
    read(params, "short_window", rules.short_window, where);
    read(params, "long_window", rules.long_window, where);
    read(params, "bollinger_window", rules.bollinger_window, where);
    read(params, "proximity_percent", rules.proximity_percent, where);
    read(params, "buy_score", rules.buy_score, where);
    read(params, "sell_score", rules.sell_score, where);
    return rules;
  }
  throw ConfigError(where + ".kind: unknown strategy kind \"" + kind + "\"");
}

domain::PositionSizing parseSizing(const json& node, const std::string& where) {
  requireObject(node, where);
  const auto type = required<std::string>(node, "type", where);
  if (type == "fixed_notional") {
    domain::FixedNotionalSizing sizing;
    read(node, "notional", sizing.notional, where);
    return sizing;
  }
  if (type == "percent_of_equity") {
    domain::PercentOfEquitySizing sizing;
    read(node, "percent", sizing.percent, where);
    return sizing;
  }
  throw ConfigError(where + ".type: unknown sizing rule \"" + type + "\"");
}

}  // namespace

std::vector<JobSpec> EngineConfig::defaultJobs() {
  JobSpec price_feed;
  price_feed.name = kPriceFeedJob;
  price_feed.cadence_ms = 60'000;
  price_feed.market_hours_only = true;

  JobSpec execution;
  execution.name = kOrderExecutionJob;
  execution.cadence_ms = 5'000;

  JobSpec valuation;
  valuation.name = kPositionValuationJob;
  valuation.cadence_ms = 30'000;

  JobSpec signals;
  signals.name = kStrategySignalsJob;
  signals.cadence_ms = 300'000;
  signals.market_hours_only = true;

  return {price_feed, execution, valuation, signals};
}

const JobSpec* EngineConfig::job(const std::string& name) const {
  for (const auto& spec : jobs) {
    if (spec.name == name) {
      return &spec;
    }
  }
  return nullptr;
}

int parseMinuteOfDay(const std::string& text) {
  int hours = -1;
  int minutes = -1;
  char colon = 0;
  if (text.size() == 5) {
    try {
      hours = std::stoi(text.substr(0, 2));
      colon = text[2];
      minutes = std::stoi(text.substr(3, 2));
    } catch (const std::exception&) {
      hours = -1;
    }
  }
  if (colon != ':' || hours < 0 || hours > 23 || minutes < 0 || minutes > 59) {
    throw ConfigError("invalid time of day \"" + text + "\", expected HH:MM");
  }
  return hours * 60 + minutes;
}

CivilDate parseCivilDate(const std::string& text) {
  CivilDate date;
  bool ok = text.size() == 10 && text[4] == '-' && text[7] == '-';
  if (ok) {
    try {
      date.year = std::stoi(text.substr(0, 4));
      date.month = static_cast<unsigned>(std::stoi(text.substr(5, 2)));
      date.day = static_cast<unsigned>(std::stoi(text.substr(8, 2)));
    } catch (const std::exception&) {
      ok = false;
    }
  }
  if (!ok || date.month < 1 || date.month > 12 || date.day < 1 || date.day > 31) {
    throw ConfigError("invalid date \"" + text + "\", expected YYYY-MM-DD");
  }
  return date;
}

domain::Strategy parseStrategy(const json& node) {
  requireObject(node, "strategy");
  domain::Strategy strategy;
  strategy.id = required<domain::StrategyId>(node, "id", "strategy");
  const std::string where = "strategies[" + std::to_string(strategy.id) + "]";

  read(node, "name", strategy.name, where);
  read(node, "active", strategy.active, where);
  read(node, "universe", strategy.universe, where);
  read(node, "confidence_threshold", strategy.confidence_threshold, where);
  read(node, "max_positions", strategy.max_positions, where);

  const auto kind = required<std::string>(node, "kind", where);
  json params = json::object();
  if (auto it = node.find("params"); it != node.end() && !it->is_null()) {
    requireObject(*it, where + ".params");
    params = *it;
  }
  strategy.rules = parseRules(kind, params, where + ".params");

  if (auto it = node.find("sizing"); it != node.end() && !it->is_null()) {
    strategy.sizing = parseSizing(*it, where + ".sizing");
  }

  for (auto& symbol : strategy.universe) {
    symbol = domain::normalizeSymbol(symbol);
    if (symbol.empty()) {
      throw ConfigError(where + ".universe: empty symbol");
    }
  }
  StrategyRepository::validate(strategy);
  return strategy;
}

// -----------------------------------------------------------------------------
// parseConfig()
// -----------------------------------------------------------------------------
// Sections are independent; a missing section keeps its defaults. Cross
// section checks (an account linked to an unknown strategy) run last.
// -----------------------------------------------------------------------------
EngineConfig parseConfig(const json& document) {
  requireObject(document, "config");
  EngineConfig config;
  config.jobs = EngineConfig::defaultJobs();

  if (auto it = document.find("market"); it != document.end()) {
    config.market = parseMarket(*it);
  }
  if (auto it = document.find("jobs"); it != document.end()) {
    parseJobs(*it, config.jobs);
  }
  if (auto it = document.find("provider"); it != document.end()) {
    config.provider = parseProvider(*it);
  }
  if (auto it = document.find("execution"); it != document.end()) {
    config.execution = parseExecution(*it);
  }
  if (auto it = document.find("ipc"); it != document.end()) {
    requireObject(*it, "ipc");
    read(*it, "cmd_endpoint", config.ipc.cmd_endpoint, "ipc");
    read(*it, "pub_endpoint", config.ipc.pub_endpoint, "ipc");
  }
  if (auto it = document.find("storage"); it != document.end()) {
    requireObject(*it, "storage");
    read(*it, "snapshot_path", config.storage.snapshot_path, "storage");
    read(*it, "audit_capacity", config.storage.audit_capacity, "storage");
    read(*it, "history_capacity", config.storage.history_capacity, "storage");
    if (config.storage.audit_capacity == 0 || config.storage.history_capacity == 0) {
      throw ConfigError("storage capacities must be positive");
    }
  }
  if (auto it = document.find("accounts"); it != document.end()) {
    config.accounts = parseAccounts(*it);
  }
  if (auto it = document.find("watchlist"); it != document.end()) {
    std::vector<std::string> symbols;
    read(document, "watchlist", symbols, "config");
    for (const auto& symbol : symbols) {
      auto normalized = domain::normalizeSymbol(symbol);
      if (normalized.empty()) {
        throw ConfigError("watchlist: empty symbol");
      }
      config.watchlist.push_back(std::move(normalized));
    }
  }
  if (auto it = document.find("strategies"); it != document.end()) {
    if (!it->is_array()) {
      throw ConfigError("strategies: expected an array");
    }
    std::set<domain::StrategyId> ids;
    for (const auto& node : *it) {
      auto strategy = parseStrategy(node);
      if (!ids.insert(strategy.id).second) {
        throw ConfigError("strategies: duplicate id " + std::to_string(strategy.id));
      }
      config.strategies.push_back(std::move(strategy));
    }
  }

  for (const auto& seed : config.accounts) {
    if (!seed.strategy_id) {
      continue;
    }
    const bool known = std::any_of(
        config.strategies.begin(), config.strategies.end(),
        [&](const domain::Strategy& s) { return s.id == *seed.strategy_id; });
    if (!known) {
      throw ConfigError("account " + seed.id + " links unknown strategy " +
                        std::to_string(*seed.strategy_id));
    }
  }
  return config;
}

EngineConfig loadConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("cannot open config file " + path);
  }
  json document;
  try {
    in >> document;
  } catch (const json::parse_error& e) {
    throw ConfigError(path + ": " + e.what());
  }
  std::cout << "[Config] loaded " << path << "\n";
  return parseConfig(document);
}

}  // namespace papertrade
