// =============================================================================
// price_feed_refresher_test.cpp
// =============================================================================
// Unit tests for papertrade::PriceFeedRefresher.
//
// Validates:
//   - Target set is the union of positions, working orders, watchlist and
//     strategy universes, each fetched once
//   - One failing instrument does not stop the others
//   - An empty token bucket defers the tail, which goes first next pass
//   - Provider RateLimited defers like an empty bucket
//   - Out-of-order quotes are dropped with a warning, not stored
// =============================================================================

#include "fakes/fake_market_data_provider.hpp"

#include "papertrade/common/errors.hpp"
#include "papertrade/market/market_data_cache.hpp"
#include "papertrade/market/price_feed_refresher.hpp"
#include "papertrade/market/token_bucket.hpp"
#include "papertrade/market/watchlist.hpp"
#include "papertrade/storage/ledger.hpp"
#include "papertrade/storage/strategy_repository.hpp"
#include "papertrade/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using papertrade::ProviderErrorKind;
using Symbols = std::vector<std::string>;

class PriceFeedRefresherTest : public ::testing::Test {
 protected:
  void SetUp() override {
    papertrade::domain::Account a;
    a.id = "acct";
    a.cash_balance = 1'000.0;
    ledger.openAccount(a);

    for (const char* symbol : {"AAPL", "MSFT", "SPY", "TSLA"}) {
      provider.setPrice(symbol, 100.0);
    }
  }

  void addWorkingOrder(const std::string& symbol) {
    papertrade::domain::Order o;
    o.account_id = "acct";
    o.symbol = symbol;
    o.quantity = 1;
    ledger.addOrder(o);
  }

  papertrade::SimulationTimeProvider clock{1'000'000};
  papertrade::testing::FakeMarketDataProvider provider{clock};
  papertrade::MarketDataCache cache{clock};
  papertrade::TokenBucket bucket{clock, 10.0, 0.0};
  papertrade::Ledger ledger{clock};
  papertrade::Watchlist watchlist;
  papertrade::StrategyRepository strategies;
  papertrade::PriceFeedRefresher refresher{provider, cache, bucket, ledger,
                                           watchlist, strategies};
};

// -----------------------------------------------------------------------------
// 1. Every source contributes, duplicates collapse, order is by symbol.
// -----------------------------------------------------------------------------
TEST_F(PriceFeedRefresherTest, TargetsAreDeduplicatedUnion) {
  addWorkingOrder("MSFT");
  watchlist.add("SPY");
  watchlist.add("MSFT");

  papertrade::domain::Strategy s;
  s.id = 1;
  s.universe = {"AAPL", "SPY"};
  strategies.upsert(s);

  EXPECT_EQ(refresher.targetSymbols(), (Symbols{"AAPL", "MSFT", "SPY"}));

  auto report = refresher.refresh();
  EXPECT_EQ(report.requested, 3u);
  EXPECT_EQ(report.updated, 3u);
  EXPECT_EQ(provider.quoteRequests(), (Symbols{"AAPL", "MSFT", "SPY"}));
  EXPECT_EQ(cache.size(), 3u);
}

// -----------------------------------------------------------------------------
// 2. MSFT times out, AAPL and SPY still refresh.
// -----------------------------------------------------------------------------
TEST_F(PriceFeedRefresherTest, FailureIsIsolatedPerInstrument) {
  watchlist.add("AAPL");
  watchlist.add("MSFT");
  watchlist.add("SPY");
  provider.failWith("MSFT", ProviderErrorKind::Timeout);

  auto report = refresher.refresh();
  EXPECT_EQ(report.updated, 2u);
  EXPECT_EQ(report.failed, 1u);
  ASSERT_EQ(report.errors.size(), 1u);
  EXPECT_EQ(report.errors[0].first, "MSFT");
  EXPECT_TRUE(cache.get("AAPL").has_value());
  EXPECT_FALSE(cache.get("MSFT").has_value());
  EXPECT_TRUE(cache.get("SPY").has_value());

  papertrade::JobContext context;
  auto outcome = refresher.tick(context);
  EXPECT_FALSE(outcome.failed);
  EXPECT_EQ(outcome.items_failed, 1u);
}

// -----------------------------------------------------------------------------
// 3. Two tokens for four instruments: the last two are deferred and lead
//    the next pass.
// Why: Without rotation a long instrument list starves its tail forever.
// -----------------------------------------------------------------------------
TEST(PriceFeedRefresherRateLimitTest, EmptyBucketDefersTailToNextPass) {
  papertrade::SimulationTimeProvider clock{1'000'000};
  papertrade::testing::FakeMarketDataProvider provider{clock};
  papertrade::MarketDataCache cache{clock};
  papertrade::TokenBucket bucket{clock, 2.0, 1.0};
  papertrade::Ledger ledger{clock};
  papertrade::Watchlist watchlist({"AAPL", "MSFT", "SPY", "TSLA"});
  papertrade::StrategyRepository strategies;
  papertrade::PriceFeedRefresher refresher{provider, cache, bucket, ledger,
                                           watchlist, strategies};
  for (const char* symbol : {"AAPL", "MSFT", "SPY", "TSLA"}) {
    provider.setPrice(symbol, 10.0);
  }

  auto first = refresher.refresh();
  EXPECT_EQ(first.updated, 2u);
  EXPECT_EQ(first.deferred, 2u);
  EXPECT_EQ(refresher.deferredSymbols(), (Symbols{"SPY", "TSLA"}));

  provider.clearRequests();
  clock.advance_by(2'000);
  auto second = refresher.refresh();
  EXPECT_EQ(second.updated, 2u);
  EXPECT_EQ(provider.quoteRequests(), (Symbols{"SPY", "TSLA"}));
  EXPECT_EQ(refresher.deferredSymbols(), (Symbols{"AAPL", "MSFT"}));
}

TEST_F(PriceFeedRefresherTest, ProviderRateLimitDefersRemainder) {
  watchlist.add("AAPL");
  watchlist.add("MSFT");
  watchlist.add("SPY");
  provider.failWith("MSFT", ProviderErrorKind::RateLimited);

  auto report = refresher.refresh();
  EXPECT_EQ(report.updated, 1u);
  EXPECT_EQ(report.failed, 0u);
  EXPECT_EQ(refresher.deferredSymbols(), (Symbols{"MSFT", "SPY"}));
}

TEST_F(PriceFeedRefresherTest, OlderQuoteIsDroppedAsStale) {
  watchlist.add("AAPL");
  refresher.refresh();

  papertrade::domain::Quote old;
  old.symbol = "AAPL";
  old.price = 1.0;
  old.as_of_ms = 1;
  provider.setQuote("AAPL", old);
  const auto cached_as_of = cache.get("AAPL")->as_of_ms;

  ::testing::internal::CaptureStderr();
  auto report = refresher.refresh();
  const std::string log = ::testing::internal::GetCapturedStderr();

  EXPECT_EQ(report.dropped_stale, 1u);
  EXPECT_DOUBLE_EQ(cache.get("AAPL")->price, 100.0);
  EXPECT_NE(log.find("WARNING: out-of-order quote for AAPL"), std::string::npos) << log;
  EXPECT_NE(log.find("as_of 1 < cached " + std::to_string(cached_as_of)), std::string::npos)
      << log;
}

TEST_F(PriceFeedRefresherTest, LedgerOutageFailsTheTick) {
  ledger.setAvailable(false);
  EXPECT_THROW(refresher.refresh(), papertrade::StorageUnavailableError);
}
