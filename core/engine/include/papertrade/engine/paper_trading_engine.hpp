#pragma once

#include "papertrade/config/engine_config.hpp"
#include "papertrade/domain/job_run.hpp"
#include "papertrade/eventbus/event_bus.hpp"
#include "papertrade/execution/fill_policy.hpp"
#include "papertrade/execution/order_execution_engine.hpp"
#include "papertrade/market/i_market_data_provider.hpp"
#include "papertrade/market/market_data_cache.hpp"
#include "papertrade/market/price_feed_refresher.hpp"
#include "papertrade/market/token_bucket.hpp"
#include "papertrade/market/watchlist.hpp"
#include "papertrade/network/ipc_server.hpp"
#include "papertrade/scheduler/job_scheduler.hpp"
#include "papertrade/storage/audit_log.hpp"
#include "papertrade/storage/ledger.hpp"
#include "papertrade/storage/strategy_repository.hpp"
#include "papertrade/strategy/strategy_signal_engine.hpp"
#include "papertrade/time/i_time_provider.hpp"
#include "papertrade/time/market_calendar.hpp"
#include "papertrade/valuation/position_valuation_service.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace papertrade {

// -----------------------------------------------------------------------------
// PaperTradingEngine — top-level orchestrator
// -----------------------------------------------------------------------------
//
// @brief  Owns every component of the paper-trading core, wires them
//         together from an EngineConfig and exposes the query and admin
//         surface used by the IPC server.
//
// @details
// Construction builds the object graph in dependency order:
//
//   EventBus → AuditLog → Ledger (+ snapshot restore, seed accounts)
//     → MarketDataCache, TokenBucket, Watchlist, StrategyRepository
//     → market-data provider (simulated or ZeroMQ, from config)
//     → OrderExecutionEngine → PositionValuationService
//     → PriceFeedRefresher → StrategySignalEngine
//     → JobScheduler with the four jobs registered in cycle order:
//         price_feed, order_execution, position_valuation, strategy_signals
//
// Nothing runs until start() (threaded, one worker per job) or until the
// caller drives the scheduler directly with runDueJobs() / runJob(), which
// is how tests and replays use a SimulationTimeProvider.
//
// Thread model:
//   start()/stop() from the owning thread. Queries and executeCommand() are
//   safe from any thread: they only use the thread-safe component APIs.
//
// Ownership:
//   The clock is borrowed and must outlive the engine. Everything else is
//   owned here and destroyed in reverse construction order after stop().
// -----------------------------------------------------------------------------
class PaperTradingEngine {
 public:
  // provider overrides the one described by config.provider (tests inject a
  // scripted fake here).
  PaperTradingEngine(EngineConfig config, const ITimeProvider& clock,
                     std::unique_ptr<IMarketDataProvider> provider = nullptr);

  ~PaperTradingEngine();

  PaperTradingEngine(const PaperTradingEngine&) = delete;
  PaperTradingEngine& operator=(const PaperTradingEngine&) = delete;
  PaperTradingEngine(PaperTradingEngine&&) = delete;
  PaperTradingEngine& operator=(PaperTradingEngine&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  //
  // @brief  Brings the IPC server online (when configured) and starts the
  //         scheduler's job threads.
  //
  // @details
  // Telemetry is bridged before the scheduler starts, so the first job run
  // is already published. Idempotent.
  // -------------------------------------------------------------------------
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  //
  // @brief  Stops the scheduler, then the IPC server, then writes the
  //         ledger snapshot (when configured).
  //
  // @details
  // The scheduler is joined first, so no job tick is mid-fill when the
  // snapshot is taken. Idempotent; also called by the destructor.
  // -------------------------------------------------------------------------
  void stop();

  bool running() const { return running_; }

  // Synchronous driving, see JobScheduler.
  std::size_t runDueJobs();
  domain::JobRun runJob(const std::string& name);

  // -------------------------------------------------------------------------
  // executeCommand(cmd)
  // -------------------------------------------------------------------------
  //
  // @brief  Handles one command line from the IPC REP socket and returns
  //         the JSON reply.
  //
  // @details
  //   PING                          → {"response": "PONG"}
  //   STATUS                        → clock, market state, counts, jobs
  //   JOBS [limit]                  → job table and recent job runs
  //   RUN <job>                     → force-run, returns the JobRun
  //   PERFORMANCE <account>         → AccountPerformance
  //   HOLDINGS <account>            → cash and valued positions
  //   ORDERS <account> [limit]      → newest first
  //   TRADES <account> [limit]      → newest first
  //   SIGNALS [limit]               → newest first
  //   SUBMIT <order json>           → the accepted PENDING order
  //   CANCEL <order id>             → {"cancelled": bool, "order": ...}
  //   AUTOTRADE <account> on|off    → the updated account
  //   QUOTES                        → cached quotes with age and stale flag
  //   WATCH <symbol> / UNWATCH <symbol>
  //
  // Every reply has "status": "ok" or "error" (with "message"). Rejected
  // input never throws out of here.
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& cmd);

  const EngineConfig& config() const { return config_; }
  EventBus& eventBus() { return event_bus_; }
  AuditLog& audit() { return audit_; }
  Ledger& ledger() { return ledger_; }
  MarketDataCache& cache() { return cache_; }
  Watchlist& watchlist() { return watchlist_; }
  StrategyRepository& strategies() { return strategies_; }
  const MarketCalendar& calendar() const { return calendar_; }
  IMarketDataProvider& provider() { return *provider_; }
  OrderExecutionEngine& execution() { return *execution_; }
  PositionValuationService& valuation() { return *valuation_; }
  StrategySignalEngine& signals() { return *signals_; }
  JobScheduler& scheduler() { return *scheduler_; }

  static std::unique_ptr<IMarketDataProvider> makeProvider(const ProviderConfig& config,
                                                           const ITimeProvider& clock);
  static std::unique_ptr<IFillPolicy> makeFillPolicy(const FillPolicyConfig& config);

 private:
  void restoreLedger();
  void seedAccounts();
  void registerJobs();

  EngineConfig config_;
  const ITimeProvider& clock_;
  MarketCalendar calendar_;

  EventBus event_bus_;
  AuditLog audit_;
  Ledger ledger_;
  MarketDataCache cache_;
  TokenBucket rate_limiter_;
  Watchlist watchlist_;
  StrategyRepository strategies_;

  std::unique_ptr<IMarketDataProvider> provider_;
  std::unique_ptr<OrderExecutionEngine> execution_;
  std::unique_ptr<PositionValuationService> valuation_;
  std::unique_ptr<PriceFeedRefresher> refresher_;
  std::unique_ptr<StrategySignalEngine> signals_;
  std::unique_ptr<JobScheduler> scheduler_;

  std::unique_ptr<IpcServer> ipc_server_;
  std::optional<EventBus::SubscriptionId> telemetry_subscription_;

  bool running_{false};
};

}  // namespace papertrade
