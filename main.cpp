// -----------------------------------------------------------------------------
// papertrade — daemon entry point.
//
//   papertrade [config.json]
//
//   1) Load the EngineConfig (compiled-in defaults when no path is given).
//   2) Create the wall clock and the PaperTradingEngine. Construction
//      restores the ledger snapshot and opens the seed accounts.
//   3) Subscribe logging callbacks for fills and order state changes.
//   4) Start the engine: IPC server, then one thread per job.
//   5) Sleep on the main thread until SIGINT/SIGTERM.
//   6) Stop the engine (joins all threads, writes the ledger snapshot).
//
// Thread layout:
//   main thread          → waits for a shutdown signal
//   job threads (4)      → price_feed, order_execution, position_valuation,
//                          strategy_signals
//   ipc thread           → REP commands + PUB telemetry
// -----------------------------------------------------------------------------

#include "papertrade/common/errors.hpp"
#include "papertrade/config/engine_config.hpp"
#include "papertrade/engine/paper_trading_engine.hpp"
#include "papertrade/events/event_types.hpp"
#include "papertrade/time/live_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

// Set by the signal handler, polled by main(). Lock-free atomic<bool> is
// async-signal-safe to store.
static std::atomic<bool> g_shutdown_requested{false};

static void shutdown_handler(int /*signum*/) { g_shutdown_requested.store(true); }

int main(int argc, char** argv) {
  // -------------------------------------------------------------------------
  // 1) Configuration.
  // -------------------------------------------------------------------------
  papertrade::EngineConfig config;
  try {
    if (argc > 1) {
      config = papertrade::loadConfig(argv[1]);
    } else {
      config = papertrade::parseConfig(nlohmann::json::object());
      std::cout << "[main] no config file given, using defaults\n";
    }
  } catch (const papertrade::ConfigError& e) {
    std::cerr << "[main] CRITICAL: " << e.what() << "\n";
    return 2;
  }

  // -------------------------------------------------------------------------
  // 2) Engine.
  // -------------------------------------------------------------------------
  papertrade::LiveTimeProvider clock;
  try {
    papertrade::PaperTradingEngine engine(std::move(config), clock);

    // -----------------------------------------------------------------------
    // 3) Logging callbacks. These run on the job thread that published.
    // -----------------------------------------------------------------------
    engine.eventBus().subscribe<papertrade::TradeEvent>(
        [](const papertrade::TradeEvent& e) {
          std::cout << "[Trade] account=" << e.trade.account_id
                    << " order=" << e.trade.order_id << " "
                    << papertrade::domain::sideToString(e.trade.side) << " "
                    << e.trade.quantity << " " << e.trade.symbol << " @ "
                    << e.trade.price << " realized=" << e.trade.realized_pnl << "\n";
        });
    engine.eventBus().subscribe<papertrade::OrderUpdateEvent>(
        [](const papertrade::OrderUpdateEvent& e) {
          if (e.order.status == papertrade::domain::OrderStatus::Rejected) {
            std::cerr << "[OrderUpdate] WARNING: order " << e.order.id
                      << " rejected: " << e.order.status_reason << "\n";
          }
        });

    // -----------------------------------------------------------------------
    // 4) Start and wait for a shutdown signal.
    // -----------------------------------------------------------------------
    std::signal(SIGINT, shutdown_handler);
    std::signal(SIGTERM, shutdown_handler);

    engine.start();
    std::cout << "[main] Press Ctrl-C to shut down.\n";

    while (!g_shutdown_requested.load()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    // -----------------------------------------------------------------------
    // 5) Clean shutdown.
    // -----------------------------------------------------------------------
    std::cout << "\n[main] shutdown requested. Stopping engine...\n";
    engine.stop();
  } catch (const papertrade::ConfigError& e) {
    std::cerr << "[main] CRITICAL: " << e.what() << "\n";
    return 2;
  } catch (const papertrade::StorageUnavailableError& e) {
    std::cerr << "[main] CRITICAL: " << e.what() << "\n";
    return 3;
  }

  return 0;
}
