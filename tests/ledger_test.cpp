// =============================================================================
// ledger_test.cpp
// =============================================================================
// Unit tests for papertrade::Ledger and its JSON snapshot persistence.
//
// Validates:
//   - Account opening rules (empty / duplicate id, negative cash)
//   - Order ids are assigned in ascending order and indexed by account
//   - openOrders() is ordered by id across accounts
//   - referencedSymbols() covers positions and working orders only
//   - A valuation computed before a fill is not written over the new quantity
//   - An unavailable store fails every call with StorageUnavailableError
//   - Snapshot save → load restores balances, positions, orders, trades and
//     continues the id sequences
// =============================================================================

#include "papertrade/common/errors.hpp"
#include "papertrade/storage/ledger.hpp"
#include "papertrade/storage/ledger_snapshot.hpp"
#include "papertrade/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <string>
#include <vector>

using papertrade::AccountBook;
using papertrade::domain::Order;
using papertrade::domain::OrderStatus;
using papertrade::domain::Side;

namespace {

papertrade::domain::Account account(const std::string& id, double cash) {
  papertrade::domain::Account a;
  a.id = id;
  a.cash_balance = cash;
  return a;
}

Order order(const std::string& account_id, const std::string& symbol, double qty) {
  Order o;
  o.account_id = account_id;
  o.symbol = symbol;
  o.side = Side::Buy;
  o.quantity = qty;
  return o;
}

}  // namespace

class LedgerTest : public ::testing::Test {
 protected:
  papertrade::SimulationTimeProvider clock{5'000};
  papertrade::Ledger ledger{clock};
};

TEST_F(LedgerTest, OpenAccountDefaultsAndValidation) {
  auto opened = ledger.openAccount(account("a1", 10'000.0));
  EXPECT_DOUBLE_EQ(opened.initial_cash, 10'000.0);
  EXPECT_EQ(opened.created_at_ms, 5'000);

  EXPECT_THROW(ledger.openAccount(account("a1", 1.0)), papertrade::ValidationError);
  EXPECT_THROW(ledger.openAccount(account("", 1.0)), papertrade::ValidationError);
  EXPECT_THROW(ledger.openAccount(account("neg", -1.0)), papertrade::ValidationError);

  EXPECT_FALSE(ledger.account("missing").has_value());
  EXPECT_THROW(ledger.positions("missing"), papertrade::ValidationError);
}

// -----------------------------------------------------------------------------
// 1. Order ids grow monotonically across accounts and resolve back to their
//    owner; openOrders() merges accounts in id order.
// -----------------------------------------------------------------------------
TEST_F(LedgerTest, OrdersAreIndexedAndOrderedById) {
  ledger.openAccount(account("a1", 1'000.0));
  ledger.openAccount(account("a2", 1'000.0));

  auto first = ledger.addOrder(order("a2", "MSFT", 1));
  auto second = ledger.addOrder(order("a1", "AAPL", 1));
  auto third = ledger.addOrder(order("a2", "AAPL", 1));

  EXPECT_LT(first.id, second.id);
  EXPECT_LT(second.id, third.id);
  EXPECT_EQ(*ledger.orderAccount(second.id), "a1");

  const auto open = ledger.openOrders();
  ASSERT_EQ(open.size(), 3u);
  EXPECT_EQ(open[0].id, first.id);
  EXPECT_EQ(open[1].id, second.id);
  EXPECT_EQ(open[2].id, third.id);

  const auto recent = ledger.orders("a2", 1);
  ASSERT_EQ(recent.size(), 1u);
  EXPECT_EQ(recent[0].id, third.id);
}

TEST_F(LedgerTest, TerminalOrdersLeaveOpenSet) {
  ledger.openAccount(account("a1", 1'000.0));
  auto o = ledger.addOrder(order("a1", "AAPL", 1));

  ledger.withAccount("a1", [&](AccountBook& book) {
    book.orders.at(o.id).status = OrderStatus::Cancelled;
  });

  EXPECT_TRUE(ledger.openOrders().empty());
  EXPECT_EQ(ledger.order(o.id)->status, OrderStatus::Cancelled);
}

TEST_F(LedgerTest, ReferencedSymbolsCoverPositionsAndWorkingOrders) {
  ledger.openAccount(account("a1", 1'000.0));
  ledger.addOrder(order("a1", "MSFT", 1));
  auto done = ledger.addOrder(order("a1", "TSLA", 1));
  ledger.withAccount("a1", [&](AccountBook& book) {
    book.orders.at(done.id).status = OrderStatus::Filled;
    papertrade::domain::Position p;
    p.account_id = "a1";
    p.symbol = "AAPL";
    p.quantity = 3;
    p.average_entry_price = 10;
    book.positions["AAPL"] = p;
  });

  EXPECT_EQ(ledger.referencedSymbols(), std::vector<std::string>({"AAPL", "MSFT"}));
}

TEST_F(LedgerTest, ValuationOfClosedPositionIsRefused) {
  ledger.openAccount(account("a1", 1'000.0));
  papertrade::domain::Position valued;
  valued.account_id = "a1";
  valued.symbol = "AAPL";
  valued.quantity = 1;
  valued.valuation = papertrade::domain::PositionValuation{};
  EXPECT_FALSE(ledger.recordValuation(valued));
}

// -----------------------------------------------------------------------------
// 1b. A fill that lands between reading a position and writing its
//     valuation wins: the valuation computed for the old quantity is
//     refused, and one computed for the current quantity is stored.
// -----------------------------------------------------------------------------
TEST_F(LedgerTest, ValuationForSupersededQuantityIsRefused) {
  ledger.openAccount(account("a1", 1'000.0));
  ledger.withAccount("a1", [](AccountBook& book) {
    papertrade::domain::Position p;
    p.account_id = "a1";
    p.symbol = "AAPL";
    p.quantity = 10;
    p.average_entry_price = 20.0;
    book.positions["AAPL"] = p;
  });

  auto valued = *ledger.position("a1", "AAPL");
  papertrade::domain::PositionValuation valuation;
  valuation.last_price = 25.0;
  valuation.market_value = 250.0;
  valuation.unrealized_pnl = 50.0;
  valued.valuation = valuation;

  // A buy of 5 more at 26 commits in between.
  ledger.withAccount("a1", [](AccountBook& book) {
    auto& p = book.positions.at("AAPL");
    p.average_entry_price = (10 * 20.0 + 5 * 26.0) / 15;
    p.quantity = 15;
  });

  EXPECT_FALSE(ledger.recordValuation(valued));
  EXPECT_FALSE(ledger.position("a1", "AAPL")->valuation.has_value());

  auto current = *ledger.position("a1", "AAPL");
  valuation.market_value = 15 * 25.0;
  valuation.unrealized_pnl = 15 * 25.0 - 15 * current.average_entry_price;
  current.valuation = valuation;
  EXPECT_TRUE(ledger.recordValuation(current));
  EXPECT_DOUBLE_EQ(ledger.position("a1", "AAPL")->valuation->market_value, 375.0);
}

// -----------------------------------------------------------------------------
// 2. An outage surfaces as StorageUnavailableError on every path.
// -----------------------------------------------------------------------------
TEST_F(LedgerTest, UnavailableStoreThrows) {
  ledger.openAccount(account("a1", 1'000.0));
  ledger.setAvailable(false);

  EXPECT_THROW(ledger.accounts(), papertrade::StorageUnavailableError);
  EXPECT_THROW(ledger.openOrders(), papertrade::StorageUnavailableError);
  EXPECT_THROW(ledger.addOrder(order("a1", "AAPL", 1)),
               papertrade::StorageUnavailableError);

  ledger.setAvailable(true);
  EXPECT_EQ(ledger.accounts().size(), 1u);
}

// -----------------------------------------------------------------------------
// 3. Save and restore through a JSON file.
// -----------------------------------------------------------------------------
TEST_F(LedgerTest, SnapshotRestoresStateAndIdSequences) {
  ledger.openAccount(account("a1", 9'500.0));
  ledger.registerInstrument("AAPL");
  auto working = ledger.addOrder(order("a1", "AAPL", 10));
  ledger.withAccount("a1", [&](AccountBook& book) {
    papertrade::domain::Position p;
    p.account_id = "a1";
    p.symbol = "AAPL";
    p.quantity = 10;
    p.average_entry_price = 50;
    book.positions["AAPL"] = p;

    papertrade::domain::Trade t;
    t.id = ledger.tradeIds().next_id();
    t.order_id = working.id;
    t.account_id = "a1";
    t.symbol = "AAPL";
    t.quantity = 10;
    t.price = 50;
    book.trades.push_back(t);
  });

  const std::string path = ::testing::TempDir() + "papertrade_ledger_test.json";
  papertrade::saveLedgerSnapshot(ledger, path);

  papertrade::Ledger restored(clock);
  ASSERT_TRUE(papertrade::loadLedgerSnapshot(restored, path));
  std::remove(path.c_str());

  auto a1 = restored.account("a1");
  ASSERT_TRUE(a1.has_value());
  EXPECT_DOUBLE_EQ(a1->cash_balance, 9'500.0);
  ASSERT_TRUE(restored.position("a1", "AAPL").has_value());
  EXPECT_DOUBLE_EQ(restored.position("a1", "AAPL")->average_entry_price, 50.0);
  EXPECT_EQ(restored.tradeCount("a1"), 1u);
  EXPECT_EQ(restored.openOrders().size(), 1u);
  EXPECT_TRUE(restored.instrument("AAPL").has_value());

  // New ids continue after the restored ones.
  auto next = restored.addOrder(order("a1", "AAPL", 1));
  EXPECT_GT(next.id, working.id);
}

TEST_F(LedgerTest, MissingSnapshotIsNotAnError) {
  EXPECT_FALSE(papertrade::loadLedgerSnapshot(
      ledger, ::testing::TempDir() + "papertrade_no_such_snapshot.json"));
}
