#include "papertrade/market/market_data_cache.hpp"

#include "papertrade/time/i_time_provider.hpp"

#include <algorithm>
#include <cstddef>
#include <limits>
#include <mutex>

namespace papertrade {

const char* putResultToString(PutResult result) {
  switch (result) {
    case PutResult::Stored:       return "stored";
    case PutResult::DroppedStale: return "dropped_stale";
    case PutResult::Rejected:     return "rejected";
  }
  return "unknown";
}

MarketDataCache::MarketDataCache(const ITimeProvider& clock,
                                 std::size_t history_capacity)
    : clock_(clock), history_capacity_(std::max<std::size_t>(history_capacity, 1)) {}

std::optional<domain::Quote> MarketDataCache::get(
    const domain::Symbol& symbol) const {
  std::shared_lock lock(mutex_);
  auto it = entries_.find(symbol);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second.latest;
}

// -----------------------------------------------------------------------------
// put()
// -----------------------------------------------------------------------------
// Validation happens before the lock is taken. Under the exclusive lock the
// new quote is compared with the cached one:
//   new.as_of <  cached.as_of → DroppedStale, nothing changes
//   new.as_of >= cached.as_of → replace latest, append (or overwrite the
//                               same-timestamp) history point
// -----------------------------------------------------------------------------
PutResult MarketDataCache::put(const domain::Symbol& symbol, domain::Quote quote) {
  if (symbol.empty() || !domain::isUsablePrice(quote.price)) {
    return PutResult::Rejected;
  }
  quote.symbol = symbol;

  std::unique_lock lock(mutex_);
  Entry& entry = entries_[symbol];
  if (entry.latest && quote.as_of_ms < entry.latest->as_of_ms) {
    return PutResult::DroppedStale;
  }

  if (!entry.history.empty() && entry.history.back().first == quote.as_of_ms) {
    entry.history.back().second = quote.price;
  } else {
    entry.history.emplace_back(quote.as_of_ms, quote.price);
    trimHistory(entry);
  }
  entry.latest = std::move(quote);
  return PutResult::Stored;
}

std::optional<std::chrono::milliseconds> MarketDataCache::staleness(
    const domain::Symbol& symbol) const {
  std::int64_t as_of = 0;
  {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(symbol);
    if (it == entries_.end() || !it->second.latest) {
      return std::nullopt;
    }
    as_of = it->second.latest->as_of_ms;
  }
  const std::int64_t age = clock_.now_ms() - as_of;
  return std::chrono::milliseconds(std::max<std::int64_t>(age, 0));
}

std::vector<double> MarketDataCache::history(const domain::Symbol& symbol,
                                             std::size_t max_points) const {
  std::shared_lock lock(mutex_);
  auto it = entries_.find(symbol);
  if (it == entries_.end()) {
    return {};
  }
  const auto& points = it->second.history;
  const std::size_t count = std::min(max_points, points.size());
  std::vector<double> prices;
  prices.reserve(count);
  for (auto p = points.end() - static_cast<std::ptrdiff_t>(count); p != points.end(); ++p) {
    prices.push_back(p->second);
  }
  return prices;
}

std::size_t MarketDataCache::seedHistory(
    const domain::Symbol& symbol,
    std::vector<std::pair<std::int64_t, double>> points) {
  points.erase(std::remove_if(points.begin(), points.end(),
                              [](const auto& p) { return !domain::isUsablePrice(p.second); }),
               points.end());
  std::sort(points.begin(), points.end());

  std::unique_lock lock(mutex_);
  Entry& entry = entries_[symbol];
  const std::int64_t oldest = entry.history.empty()
                                  ? std::numeric_limits<std::int64_t>::max()
                                  : entry.history.front().first;

  std::size_t added = 0;
  // Walk newest to oldest so push_front keeps ascending order.
  for (auto it = points.rbegin(); it != points.rend(); ++it) {
    if (entry.history.size() >= history_capacity_) {
      break;
    }
    if (it->first >= oldest) {
      continue;
    }
    if (!entry.history.empty() && entry.history.front().first == it->first) {
      continue;
    }
    entry.history.emplace_front(*it);
    ++added;
  }
  return added;
}

std::vector<domain::Symbol> MarketDataCache::symbols() const {
  std::shared_lock lock(mutex_);
  std::vector<domain::Symbol> result;
  result.reserve(entries_.size());
  for (const auto& [symbol, entry] : entries_) {
    if (entry.latest) {
      result.push_back(symbol);
    }
  }
  std::sort(result.begin(), result.end());
  return result;
}

std::size_t MarketDataCache::size() const {
  std::shared_lock lock(mutex_);
  return static_cast<std::size_t>(
      std::count_if(entries_.begin(), entries_.end(),
                    [](const auto& kv) { return kv.second.latest.has_value(); }));
}

void MarketDataCache::trimHistory(Entry& entry) {
  while (entry.history.size() > history_capacity_) {
    entry.history.pop_front();
  }
}

}  // namespace papertrade
