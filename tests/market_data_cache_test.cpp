// =============================================================================
// market_data_cache_test.cpp
// =============================================================================
// Unit tests for papertrade::MarketDataCache.
//
// Validates:
//   - get() on a missing instrument reports not found, never throws
//   - Monotonic cache: an older quote never replaces a newer one
//   - Unusable prices are rejected at the boundary
//   - staleness() against the injected clock
//   - Bounded history and seeding with older points only
//   - Concurrent readers never observe a torn quote
// =============================================================================

#include "papertrade/market/market_data_cache.hpp"
#include "papertrade/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <cmath>
#include <limits>
#include <thread>
#include <vector>

using papertrade::PutResult;

namespace {

papertrade::domain::Quote quote(double price, std::int64_t as_of_ms) {
  papertrade::domain::Quote q;
  q.price = price;
  q.as_of_ms = as_of_ms;
  q.source = "test";
  return q;
}

}  // namespace

class MarketDataCacheTest : public ::testing::Test {
 protected:
  papertrade::SimulationTimeProvider clock{1'000'000};
  papertrade::MarketDataCache cache{clock, 4};
};

TEST_F(MarketDataCacheTest, MissingInstrumentIsNotFound) {
  EXPECT_FALSE(cache.get("AAPL").has_value());
  EXPECT_FALSE(cache.staleness("AAPL").has_value());
  EXPECT_TRUE(cache.history("AAPL", 10).empty());
}

// -----------------------------------------------------------------------------
// 1. put(A) then put(B) with B older than A leaves A in place.
// Why: Provider responses can arrive out of order; the price must never move
//      back in time.
// -----------------------------------------------------------------------------
TEST_F(MarketDataCacheTest, OlderQuoteIsDroppedAndNewerIsKept) {
  ASSERT_EQ(cache.put("AAPL", quote(150.0, 2'000)), PutResult::Stored);
  EXPECT_EQ(cache.put("AAPL", quote(140.0, 1'000)), PutResult::DroppedStale);

  auto cached = cache.get("AAPL");
  ASSERT_TRUE(cached.has_value());
  EXPECT_DOUBLE_EQ(cached->price, 150.0);
  EXPECT_EQ(cached->as_of_ms, 2'000);
  EXPECT_EQ(cached->symbol, "AAPL");
}

TEST_F(MarketDataCacheTest, EqualTimestampReplacesLatestAndHistoryPoint) {
  cache.put("AAPL", quote(150.0, 2'000));
  EXPECT_EQ(cache.put("AAPL", quote(151.0, 2'000)), PutResult::Stored);

  EXPECT_DOUBLE_EQ(cache.get("AAPL")->price, 151.0);
  EXPECT_EQ(cache.history("AAPL", 10), std::vector<double>({151.0}));
}

TEST_F(MarketDataCacheTest, UnusablePricesAreRejected) {
  EXPECT_EQ(cache.put("AAPL", quote(0.0, 1)), PutResult::Rejected);
  EXPECT_EQ(cache.put("AAPL", quote(-5.0, 1)), PutResult::Rejected);
  EXPECT_EQ(cache.put("AAPL", quote(std::nan(""), 1)), PutResult::Rejected);
  EXPECT_EQ(cache.put("AAPL", quote(std::numeric_limits<double>::infinity(), 1)),
            PutResult::Rejected);
  EXPECT_EQ(cache.put("", quote(10.0, 1)), PutResult::Rejected);
  EXPECT_FALSE(cache.get("AAPL").has_value());
  EXPECT_EQ(cache.size(), 0u);
}

TEST_F(MarketDataCacheTest, StalenessIsAgeAgainstClock) {
  cache.put("AAPL", quote(150.0, 990'000));
  auto age = cache.staleness("AAPL");
  ASSERT_TRUE(age.has_value());
  EXPECT_EQ(age->count(), 10'000);

  clock.advance_by(5'000);
  EXPECT_EQ(cache.staleness("AAPL")->count(), 15'000);
}

// -----------------------------------------------------------------------------
// 2. History keeps the newest points up to capacity, oldest first.
// -----------------------------------------------------------------------------
TEST_F(MarketDataCacheTest, HistoryIsBounded) {
  for (int i = 1; i <= 6; ++i) {
    cache.put("MSFT", quote(100.0 + i, i * 1'000));
  }
  EXPECT_EQ(cache.history("MSFT", 10), std::vector<double>({103.0, 104.0, 105.0, 106.0}));
  EXPECT_EQ(cache.history("MSFT", 2), std::vector<double>({105.0, 106.0}));
}

TEST_F(MarketDataCacheTest, SeedHistoryOnlyPrependsOlderPoints) {
  cache.put("MSFT", quote(200.0, 10'000));

  const auto added = cache.seedHistory(
      "MSFT", {{7'000, 197.0}, {8'000, 198.0}, {10'000, 999.0}, {12'000, 999.0},
               {9'000, -1.0}});

  EXPECT_EQ(added, 2u);
  EXPECT_EQ(cache.history("MSFT", 10), std::vector<double>({197.0, 198.0, 200.0}));
  // Seeding never changes the latest quote.
  EXPECT_DOUBLE_EQ(cache.get("MSFT")->price, 200.0);
}

TEST_F(MarketDataCacheTest, SeedingWithoutQuoteDoesNotCreateLatest) {
  cache.seedHistory("TSLA", {{1'000, 10.0}, {2'000, 11.0}});
  EXPECT_FALSE(cache.get("TSLA").has_value());
  EXPECT_EQ(cache.size(), 0u);
  EXPECT_EQ(cache.history("TSLA", 10), std::vector<double>({10.0, 11.0}));
}

// -----------------------------------------------------------------------------
// 3. One writer and several readers: every observed quote is one that was
//    written as a whole (price and timestamp move together).
// -----------------------------------------------------------------------------
TEST_F(MarketDataCacheTest, ReadersNeverSeeTornQuotes) {
  std::atomic<bool> done{false};
  std::atomic<int> torn{0};

  std::vector<std::thread> readers;
  for (int r = 0; r < 3; ++r) {
    readers.emplace_back([&] {
      while (!done.load()) {
        if (auto q = cache.get("SPY")) {
          if (q->price != static_cast<double>(q->as_of_ms)) {
            torn.fetch_add(1);
          }
        }
      }
    });
  }

  for (int i = 1; i <= 5'000; ++i) {
    cache.put("SPY", quote(static_cast<double>(i), i));
  }
  done.store(true);
  for (auto& t : readers) t.join();

  EXPECT_EQ(torn.load(), 0);
  EXPECT_EQ(cache.get("SPY")->as_of_ms, 5'000);
}
