#pragma once

#include "papertrade/market/i_market_data_provider.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <random>
#include <string>
#include <vector>

namespace papertrade {

class ITimeProvider;

struct SimulatedProviderConfig {
  std::uint32_t seed{42};
  // Probability in [0, 1] that a call throws ProviderError(Unavailable).
  double failure_rate{0.0};
  // Standard deviation of the per-call log return.
  double volatility{0.01};
  double default_start_price{100.0};
  std::map<domain::Symbol, double> start_prices;
};

// -----------------------------------------------------------------------------
// SimulatedMarketDataProvider — seeded random-walk price source
// -----------------------------------------------------------------------------
//
// @brief  Offline provider used by the demo configuration and tests.
//
// @details
// Every fetchQuote() moves the instrument's price by a normally distributed
// log return and stamps the quote with the injected clock. With a fixed
// seed and clock the sequence is reproducible. fetchHistory() produces one
// bar per interval step walking backwards from the current price, so the
// newest bar closes at the last quoted price.
//
// Symbols listed as unknown are reported as NotFound, which lets tests
// exercise the refresher's per-symbol error path.
//
// Thread model:
//   A std::mutex serializes access to the generator and the price map.
// -----------------------------------------------------------------------------
class SimulatedMarketDataProvider final : public IMarketDataProvider {
 public:
  SimulatedMarketDataProvider(const ITimeProvider& clock,
                              SimulatedProviderConfig config = {});

  domain::Quote fetchQuote(const domain::Symbol& symbol) override;

  std::vector<domain::Bar> fetchHistory(const domain::Symbol& symbol,
                                        const HistoryRange& range) override;

  std::string name() const override { return "simulated"; }

  void markUnknown(const domain::Symbol& symbol);

 private:
  double currentPriceLocked(const domain::Symbol& symbol);
  void maybeFailLocked(const domain::Symbol& symbol);

  const ITimeProvider& clock_;
  const SimulatedProviderConfig config_;

  std::mutex mutex_;
  std::mt19937 rng_;
  std::map<domain::Symbol, double> prices_;
  std::vector<domain::Symbol> unknown_;
};

}  // namespace papertrade
