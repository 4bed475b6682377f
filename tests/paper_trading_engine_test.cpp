// =============================================================================
// paper_trading_engine_test.cpp
// =============================================================================
// Integration tests for papertrade::PaperTradingEngine.
//
// All tests drive the engine synchronously with a SimulationTimeProvider and
// a scripted provider; the IPC endpoints are left empty so no sockets open.
//
// Validates:
//   - Seed accounts are opened from config
//   - Full cycle: SUBMIT → price_feed → order_execution → valuation, seen
//     through the command interface
//   - Command errors are replies, never exceptions
//   - AUTOTRADE toggles the opt-in that gates strategy orders
//   - QUOTES lists cached quotes with their age
//   - Strategy-driven orders flow through the same execution path
//   - The ledger survives a stop() / restart through the snapshot file
//   - Telemetry formatting for every event type
// =============================================================================

#include "fakes/fake_market_data_provider.hpp"

#include "papertrade/config/engine_config.hpp"
#include "papertrade/engine/paper_trading_engine.hpp"
#include "papertrade/events/event_types.hpp"
#include "papertrade/network/ipc_server.hpp"
#include "papertrade/time/simulation_time_provider.hpp"

#include "test_times.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <cstdint>
#include <cstdio>
#include <memory>
#include <string>

using nlohmann::json;
using papertrade::PaperTradingEngine;
using papertrade::testing::FakeMarketDataProvider;

namespace {

papertrade::EngineConfig baseConfig() {
  papertrade::EngineConfig config = papertrade::parseConfig(json::parse(R"({
    "ipc": { "cmd_endpoint": "", "pub_endpoint": "" },
    "provider": { "rate_limit": { "capacity": 20, "refill_per_second": 5 } },
    "accounts": [
      { "id": "manual", "cash": 10000 },
      { "id": "bot", "cash": 10000, "strategy_id": 1, "auto_trade": true }
    ],
    "strategies": [
      { "id": 1, "name": "rsi", "kind": "rsi_reversion", "universe": ["MSFT"],
        "params": { "period": 3 },
        "sizing": { "type": "fixed_notional", "notional": 1000 } }
    ]
  })"));
  return config;
}

}  // namespace

class PaperTradingEngineTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto fake = std::make_unique<FakeMarketDataProvider>(clock);
    provider = fake.get();
    provider->setPrice("AAPL", 50.0);
    engine = std::make_unique<PaperTradingEngine>(baseConfig(), clock, std::move(fake));
  }

  json command(const std::string& text) { return json::parse(engine->executeCommand(text)); }

  papertrade::SimulationTimeProvider clock{papertrade::testing::tuesdaySessionMs()};
  FakeMarketDataProvider* provider{nullptr};
  std::unique_ptr<PaperTradingEngine> engine;
};

TEST_F(PaperTradingEngineTest, SeedAccountsAreOpened) {
  auto accounts = engine->ledger().accounts();
  ASSERT_EQ(accounts.size(), 2u);
  EXPECT_EQ(accounts[0].id, "bot");
  EXPECT_TRUE(accounts[0].auto_trade);
  EXPECT_DOUBLE_EQ(accounts[1].initial_cash, 10'000.0);
  EXPECT_EQ(engine->scheduler().status().size(), 4u);
}

// -----------------------------------------------------------------------------
// 1. Market buy of 10 @ 50, then a limit sell at 60 that fills at 61.
// -----------------------------------------------------------------------------
TEST_F(PaperTradingEngineTest, ManualOrderLifecycleThroughCommands) {
  auto submitted = command(
      R"(SUBMIT {"account_id":"manual","symbol":"aapl","side":"BUY","quantity":10})");
  ASSERT_EQ(submitted["status"], "ok");
  EXPECT_EQ(submitted["order"]["status"], "PENDING");
  EXPECT_EQ(submitted["order"]["symbol"], "AAPL");

  EXPECT_EQ(command("RUN price_feed")["run"]["outcome"], "SUCCESS");
  EXPECT_EQ(command("RUN order_execution")["run"]["outcome"], "SUCCESS");

  auto holdings = command("HOLDINGS manual");
  EXPECT_DOUBLE_EQ(holdings["cash_balance"].get<double>(), 9'500.0);
  ASSERT_EQ(holdings["holdings"].size(), 1u);
  EXPECT_DOUBLE_EQ(holdings["holdings"][0]["quantity"].get<double>(), 10.0);
  EXPECT_DOUBLE_EQ(holdings["holdings"][0]["average_entry_price"].get<double>(), 50.0);

  auto sell = command(R"(SUBMIT {"account_id":"manual","symbol":"AAPL","side":"SELL",
                                 "quantity":10,"kind":"LIMIT","limit_price":60})");
  const auto sell_id = sell["order"]["id"].get<std::uint64_t>();

  clock.advance_by(60'000);
  provider->setPrice("AAPL", 55.0);
  command("RUN price_feed");
  command("RUN order_execution");
  EXPECT_EQ(engine->ledger().order(sell_id)->status,
            papertrade::domain::OrderStatus::Pending);

  clock.advance_by(60'000);
  provider->setPrice("AAPL", 61.0);
  command("RUN price_feed");
  command("RUN order_execution");

  auto performance = command("PERFORMANCE manual")["performance"];
  EXPECT_DOUBLE_EQ(performance["cash_balance"].get<double>(), 10'110.0);
  EXPECT_DOUBLE_EQ(performance["total_pnl"].get<double>(), 110.0);
  EXPECT_EQ(performance["trade_count"], 2);
  EXPECT_TRUE(performance["holdings"].empty());

  auto trades = command("TRADES manual 1")["trades"];
  ASSERT_EQ(trades.size(), 1u);
  EXPECT_EQ(trades[0]["side"], "SELL");
  EXPECT_EQ(command("ORDERS manual")["orders"].size(), 2u);
}

TEST_F(PaperTradingEngineTest, CommandErrorsAreReplies) {
  EXPECT_EQ(command("ping")["response"], "PONG");
  EXPECT_EQ(command("FLY away")["message"], "Unknown command: FLY");
  EXPECT_EQ(command("")["status"], "error");
  EXPECT_EQ(command("PERFORMANCE ghost")["status"], "error");
  EXPECT_EQ(command("ORDERS manual zero")["status"], "error");
  EXPECT_EQ(command("RUN nope")["status"], "error");
  EXPECT_EQ(command("SUBMIT not-json")["status"], "error");
  EXPECT_EQ(command(R"(SUBMIT {"account_id":"manual"})")["status"], "error");
  EXPECT_EQ(command(R"(SUBMIT {"account_id":"manual","symbol":"AAPL","side":"BUY","quantity":-1})")
                ["status"],
            "error");
  EXPECT_EQ(command("CANCEL 999")["status"], "error");
  EXPECT_EQ(command("CANCEL abc")["status"], "error");

  engine->ledger().setAvailable(false);
  auto outage = command("STATUS");
  EXPECT_EQ(outage["status"], "error");
  engine->ledger().setAvailable(true);
}

TEST_F(PaperTradingEngineTest, CancelWatchAndStatus) {
  auto order = command(
      R"(SUBMIT {"account_id":"manual","symbol":"TSLA","side":"BUY","quantity":1})");
  const auto id = order["order"]["id"].get<std::uint64_t>();

  auto cancelled = command("CANCEL " + std::to_string(id));
  EXPECT_TRUE(cancelled["cancelled"].get<bool>());
  EXPECT_EQ(cancelled["order"]["status"], "CANCELLED");
  EXPECT_FALSE(command("CANCEL " + std::to_string(id))["cancelled"].get<bool>());

  EXPECT_TRUE(command("WATCH spy")["added"].get<bool>());
  EXPECT_FALSE(command("WATCH SPY")["added"].get<bool>());
  EXPECT_TRUE(command("UNWATCH SPY")["removed"].get<bool>());

  auto status = command("STATUS");
  EXPECT_EQ(status["status"], "ok");
  EXPECT_TRUE(status["market_open"].get<bool>());
  EXPECT_EQ(status["accounts"], 2);
  EXPECT_EQ(status["open_orders"], 0);
  EXPECT_EQ(status["jobs"].size(), 4u);
}

TEST_F(PaperTradingEngineTest, AutoTradeToggleGatesStrategyOrders) {
  auto off = command("AUTOTRADE bot off");
  ASSERT_EQ(off["status"], "ok");
  EXPECT_FALSE(off["account"]["auto_trade"].get<bool>());
  EXPECT_FALSE(engine->ledger().account("bot")->auto_trade);

  provider->setHistory("MSFT", {100.0, 90.0, 80.0, 70.0});
  provider->setPrice("MSFT", 70.0);
  engine->runDueJobs();
  EXPECT_TRUE(engine->ledger().openOrders("bot").empty());

  EXPECT_TRUE(command("AUTOTRADE bot ON")["account"]["auto_trade"].get<bool>());
  command("RUN strategy_signals");
  EXPECT_EQ(engine->ledger().openOrders("bot").size(), 1u);

  EXPECT_EQ(command("AUTOTRADE bot maybe")["status"], "error");
  EXPECT_EQ(command("AUTOTRADE ghost on")["status"], "error");
  EXPECT_EQ(command("AUTOTRADE bot")["status"], "error");
}

TEST_F(PaperTradingEngineTest, QuotesReportAgeAndStaleness) {
  EXPECT_TRUE(command("QUOTES")["quotes"].empty());

  command("WATCH AAPL");
  command("RUN price_feed");
  auto fresh = command("QUOTES")["quotes"];
  ASSERT_EQ(fresh.size(), 1u);
  EXPECT_EQ(fresh[0]["symbol"], "AAPL");
  EXPECT_DOUBLE_EQ(fresh[0]["price"].get<double>(), 50.0);
  EXPECT_EQ(fresh[0]["age_ms"], 0);
  EXPECT_FALSE(fresh[0]["stale"].get<bool>());

  clock.advance_by(10 * 60'000);
  auto aged = command("QUOTES")["quotes"];
  EXPECT_EQ(aged[0]["age_ms"], 10 * 60'000);
  EXPECT_TRUE(aged[0]["stale"].get<bool>());
}

// -----------------------------------------------------------------------------
// 2. One scheduled cycle in registration order: the signal from this pass
//    becomes an order that fills on the next execution tick.
// -----------------------------------------------------------------------------
TEST_F(PaperTradingEngineTest, StrategySignalBecomesFilledOrder) {
  provider->setHistory("MSFT", {100.0, 90.0, 80.0, 70.0});
  provider->setPrice("MSFT", 70.0);

  EXPECT_EQ(engine->runDueJobs(), 4u);
  auto signals = command("SIGNALS 5")["signals"];
  ASSERT_EQ(signals.size(), 1u);
  EXPECT_EQ(signals[0]["type"], "BUY");

  auto pending = engine->ledger().openOrders("bot");
  ASSERT_EQ(pending.size(), 1u);
  EXPECT_DOUBLE_EQ(pending[0].quantity, 14.0);

  command("RUN order_execution");
  auto position = engine->ledger().position("bot", "MSFT");
  ASSERT_TRUE(position.has_value());
  EXPECT_DOUBLE_EQ(position->quantity, 14.0);
  EXPECT_DOUBLE_EQ(engine->ledger().account("bot")->cash_balance, 10'000.0 - 14 * 70.0);

  auto jobs = command("JOBS 10");
  EXPECT_GE(jobs["recent_runs"].size(), 5u);
}

// -----------------------------------------------------------------------------
// 3. stop() writes the snapshot; a new engine restores it and does not
//    reopen seeded accounts with fresh cash.
// -----------------------------------------------------------------------------
TEST(PaperTradingEnginePersistenceTest, LedgerSurvivesRestart) {
  const std::string path = ::testing::TempDir() + "papertrade_engine_snapshot.json";
  std::remove(path.c_str());
  papertrade::SimulationTimeProvider clock{papertrade::testing::saturdayMs()};

  auto config = baseConfig();
  config.storage.snapshot_path = path;
  {
    auto fake = std::make_unique<FakeMarketDataProvider>(clock);
    PaperTradingEngine engine(config, clock, std::move(fake));
    engine.ledger().withAccount("manual", [](papertrade::AccountBook& book) {
      book.account.cash_balance = 1'234.0;
    });
    engine.start();
    engine.stop();
  }

  auto fake = std::make_unique<FakeMarketDataProvider>(clock);
  PaperTradingEngine restored(config, clock, std::move(fake));
  EXPECT_DOUBLE_EQ(restored.ledger().account("manual")->cash_balance, 1'234.0);
  EXPECT_EQ(restored.ledger().accounts().size(), 2u);
  std::remove(path.c_str());
}

TEST(IpcTelemetryTest, EveryEventTypeIsTagged) {
  papertrade::TradeEvent trade;
  trade.trade.symbol = "AAPL";
  auto j = json::parse(papertrade::IpcServer::formatTelemetry(trade));
  EXPECT_EQ(j["type"], "trade");
  EXPECT_EQ(j["symbol"], "AAPL");

  papertrade::OrderUpdateEvent update;
  update.order.status = papertrade::domain::OrderStatus::Filled;
  update.previous_status = papertrade::domain::OrderStatus::Pending;
  j = json::parse(papertrade::IpcServer::formatTelemetry(update));
  EXPECT_EQ(j["type"], "order_update");
  EXPECT_EQ(j["status"], "FILLED");
  EXPECT_EQ(j["previous_status"], "PENDING");

  EXPECT_EQ(json::parse(papertrade::IpcServer::formatTelemetry(papertrade::JobRunEvent{}))["type"],
            "job_run");
  EXPECT_EQ(json::parse(papertrade::IpcServer::formatTelemetry(papertrade::SignalEvent{}))["type"],
            "signal");
  EXPECT_EQ(json::parse(papertrade::IpcServer::formatTelemetry(
                papertrade::AccountSnapshotEvent{}))["type"],
            "account_snapshot");
}
