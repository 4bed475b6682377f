#pragma once

#include "papertrade/domain/instrument.hpp"
#include "papertrade/scheduler/i_job.hpp"

#include <cstddef>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace papertrade {

class IMarketDataProvider;
class Ledger;
class MarketDataCache;
class StrategyRepository;
class TokenBucket;
class Watchlist;

struct RefreshReport {
  std::size_t requested{0};
  std::size_t updated{0};
  std::size_t dropped_stale{0};
  std::size_t failed{0};
  std::size_t deferred{0};
  // (symbol, error message) for every failed instrument.
  std::vector<std::pair<domain::Symbol, std::string>> errors;
};

// -----------------------------------------------------------------------------
// PriceFeedRefresher — keeps the MarketDataCache current
// -----------------------------------------------------------------------------
//
// @brief  On each tick, fetches a quote for every instrument the engine
//         currently cares about and writes it into the cache.
//
// @details
// The instrument set is the de-duplicated union of:
//   - instruments with an open position in any account,
//   - instruments with a non-terminal order,
//   - the watchlist,
//   - the universes of active strategies.
// Each instrument is fetched at most once per tick no matter how many
// accounts reference it.
//
// Every provider call costs one token from the shared TokenBucket. When the
// bucket is empty (or the provider itself reports RateLimited) the remaining
// instruments are deferred and are fetched FIRST on the next tick, so a
// large instrument set is covered fairly across ticks instead of the tail
// starving.
//
// Failures are per instrument: a timeout, an unknown symbol or an unusable
// price is counted, logged and skipped, and the rest of the pass continues.
// Only a ledger outage (StorageUnavailableError while building the
// instrument set) fails the tick.
//
// Thread model:
//   Runs on the price_feed job thread. The deferred list is guarded by a
//   mutex so it can be inspected from tests and the query interface.
// -----------------------------------------------------------------------------
class PriceFeedRefresher final : public IJob {
 public:
  PriceFeedRefresher(IMarketDataProvider& provider, MarketDataCache& cache,
                     TokenBucket& rate_limiter, const Ledger& ledger,
                     const Watchlist& watchlist,
                     const StrategyRepository& strategies);

  PriceFeedRefresher(const PriceFeedRefresher&) = delete;
  PriceFeedRefresher& operator=(const PriceFeedRefresher&) = delete;

  RefreshReport refresh();

  // Sorted union of all instrument sources.
  std::vector<domain::Symbol> targetSymbols() const;

  std::vector<domain::Symbol> deferredSymbols() const;

  std::string name() const override { return "price_feed"; }
  JobOutcome tick(const JobContext& context) override;

 private:
  IMarketDataProvider& provider_;
  MarketDataCache& cache_;
  TokenBucket& rate_limiter_;
  const Ledger& ledger_;
  const Watchlist& watchlist_;
  const StrategyRepository& strategies_;

  mutable std::mutex deferred_mutex_;
  std::vector<domain::Symbol> deferred_;
};

}  // namespace papertrade
