#pragma once

#include "papertrade/domain/quote.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace papertrade {

class ITimeProvider;

enum class PutResult {
  Stored,        // Quote accepted as the latest
  DroppedStale,  // Older than the quote already cached
  Rejected,      // Unusable price (NaN, zero, negative) or empty symbol
};

const char* putResultToString(PutResult result);

// -----------------------------------------------------------------------------
// MarketDataCache — latest quote per instrument
// -----------------------------------------------------------------------------
//
// @brief  Shared in-memory view of prices. The PriceFeedRefresher writes;
//         execution, valuation and strategy evaluation read.
//
// @details
// Last-writer-wins by observation time: put() replaces the cached quote only
// when the new quote's as_of_ms is greater than or equal to the cached one.
// A late, older quote is reported as DroppedStale and leaves the cache
// untouched, so a reader can never see the price go back in time.
//
// Each instrument also keeps a bounded history of (as_of_ms, price) points
// fed by accepted quotes. Strategies read closing-price series from it, and
// the StrategySignalEngine seeds it from provider history when it is too
// short (seedHistory only prepends points older than what is already held).
//
// A quote of age 0 is fresh. Whether a quote is too old for a given use is
// the reader's decision; staleness() reports the age against the injected
// clock.
//
// Thread model:
//   std::shared_mutex: get/staleness/history take a shared lock, put and
//   seedHistory take an exclusive lock for the duration of one map update.
//   Readers therefore never observe a half-written quote.
// -----------------------------------------------------------------------------
class MarketDataCache {
 public:
  explicit MarketDataCache(const ITimeProvider& clock,
                           std::size_t history_capacity = 256);

  MarketDataCache(const MarketDataCache&) = delete;
  MarketDataCache& operator=(const MarketDataCache&) = delete;

  std::optional<domain::Quote> get(const domain::Symbol& symbol) const;

  // Stores quote under symbol (quote.symbol is overwritten with symbol).
  PutResult put(const domain::Symbol& symbol, domain::Quote quote);

  // Age of the cached quote relative to the clock, or nullopt when absent.
  std::optional<std::chrono::milliseconds> staleness(
      const domain::Symbol& symbol) const;

  // Up to max_points most recent prices, oldest first.
  std::vector<double> history(const domain::Symbol& symbol,
                              std::size_t max_points) const;

  // Prepends points older than the oldest held point. points are
  // (timestamp_ms, price) in any order; unusable prices are ignored.
  // Returns the number of points added.
  std::size_t seedHistory(const domain::Symbol& symbol,
                          std::vector<std::pair<std::int64_t, double>> points);

  std::vector<domain::Symbol> symbols() const;

  std::size_t size() const;

 private:
  struct Entry {
    std::optional<domain::Quote> latest;
    std::deque<std::pair<std::int64_t, double>> history;
  };

  void trimHistory(Entry& entry);

  const ITimeProvider& clock_;
  const std::size_t history_capacity_;

  mutable std::shared_mutex mutex_;
  std::unordered_map<domain::Symbol, Entry> entries_;
};

}  // namespace papertrade
