#include "papertrade/market/simulated_market_data_provider.hpp"

#include "papertrade/common/errors.hpp"
#include "papertrade/time/i_time_provider.hpp"
#include "papertrade/time/time_utils.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace papertrade {

namespace {

std::int64_t intervalMillis(const std::string& interval) {
  if (interval == "1m") return kMillisPerMinute;
  if (interval == "5m") return 5 * kMillisPerMinute;
  if (interval == "1h") return kMillisPerHour;
  return kMillisPerDay;
}

}  // namespace

SimulatedMarketDataProvider::SimulatedMarketDataProvider(
    const ITimeProvider& clock, SimulatedProviderConfig config)
    : clock_(clock), config_(std::move(config)), rng_(config_.seed) {}

void SimulatedMarketDataProvider::markUnknown(const domain::Symbol& symbol) {
  std::lock_guard lock(mutex_);
  unknown_.push_back(symbol);
}

double SimulatedMarketDataProvider::currentPriceLocked(
    const domain::Symbol& symbol) {
  auto it = prices_.find(symbol);
  if (it != prices_.end()) {
    return it->second;
  }
  auto seeded = config_.start_prices.find(symbol);
  const double start = seeded != config_.start_prices.end()
                           ? seeded->second
                           : config_.default_start_price;
  prices_.emplace(symbol, start);
  return start;
}

void SimulatedMarketDataProvider::maybeFailLocked(const domain::Symbol& symbol) {
  if (std::find(unknown_.begin(), unknown_.end(), symbol) != unknown_.end()) {
    throw ProviderError(ProviderErrorKind::NotFound, "unknown symbol " + symbol);
  }
  if (config_.failure_rate > 0.0) {
    std::uniform_real_distribution<double> coin(0.0, 1.0);
    if (coin(rng_) < config_.failure_rate) {
      throw ProviderError(ProviderErrorKind::Unavailable,
                          "simulated outage for " + symbol);
    }
  }
}

domain::Quote SimulatedMarketDataProvider::fetchQuote(
    const domain::Symbol& symbol) {
  std::lock_guard lock(mutex_);
  maybeFailLocked(symbol);

  std::normal_distribution<double> step(0.0, config_.volatility);
  const double price = currentPriceLocked(symbol) * std::exp(step(rng_));
  prices_[symbol] = price;

  domain::Quote quote;
  quote.symbol = symbol;
  quote.price = price;
  quote.as_of_ms = clock_.now_ms();
  quote.source = name();
  return quote;
}

// -----------------------------------------------------------------------------
// fetchHistory(): walks backwards from the current price so the series ends
// where live quotes continue.
// -----------------------------------------------------------------------------
std::vector<domain::Bar> SimulatedMarketDataProvider::fetchHistory(
    const domain::Symbol& symbol, const HistoryRange& range) {
  std::lock_guard lock(mutex_);
  maybeFailLocked(symbol);

  const std::int64_t step_ms = intervalMillis(range.interval);
  if (range.to_ms < range.from_ms) {
    return {};
  }

  std::normal_distribution<double> step(0.0, config_.volatility);
  double close = currentPriceLocked(symbol);
  std::vector<domain::Bar> bars;
  for (std::int64_t t = range.to_ms; t >= range.from_ms; t -= step_ms) {
    const double open = close / std::exp(step(rng_));
    domain::Bar bar;
    bar.timestamp_ms = t;
    bar.open = open;
    bar.close = close;
    bar.high = std::max(open, close) * 1.005;
    bar.low = std::min(open, close) * 0.995;
    bar.volume = 1'000'000.0;
    bars.push_back(bar);
    close = open;
  }
  std::reverse(bars.begin(), bars.end());
  return bars;
}

}  // namespace papertrade
