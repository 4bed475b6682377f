#pragma once

#include <cstddef>
#include <optional>
#include <vector>

namespace papertrade {
namespace indicators {

// -----------------------------------------------------------------------------
// Technical indicators over closing-price series
// -----------------------------------------------------------------------------
// Pure functions. Every series is ordered oldest first and every function
// returns nullopt when the series is too short for the requested window, so
// callers can treat "not enough history" uniformly as Hold.
// -----------------------------------------------------------------------------

// Mean of the last window prices.
std::optional<double> simpleMovingAverage(const std::vector<double>& prices,
                                          std::size_t window);

// Relative Strength Index over the last period price changes, using the
// simple average of gains and losses. Needs period + 1 prices. A window
// with no losses yields 100.
std::optional<double> relativeStrengthIndex(const std::vector<double>& prices,
                                            std::size_t period);

struct BollingerBands {
  double upper{0.0};
  double middle{0.0};
  double lower{0.0};
};

// SMA(window) +/- num_std population standard deviations.
std::optional<BollingerBands> bollingerBands(const std::vector<double>& prices,
                                             std::size_t window,
                                             double num_std = 2.0);

enum class Trend {
  Bullish,   // price > short SMA > long SMA
  Bearish,   // price < short SMA < long SMA
  Sideways,
};

std::optional<Trend> priceTrend(const std::vector<double>& prices,
                                std::size_t short_window,
                                std::size_t long_window);

struct SupportResistance {
  double pivot{0.0};
  double support{0.0};
  double resistance{0.0};
  double recent_high{0.0};
  double recent_low{0.0};
};

// Classic pivot over the last lookback closes:
//   pivot      = (high + low + close) / 3
//   support    = 2 * pivot - high
//   resistance = 2 * pivot - low
std::optional<SupportResistance> supportResistance(const std::vector<double>& prices,
                                                   std::size_t lookback = 20);

// True when price is within percent of level.
bool isNear(double price, double level, double percent);

const char* trendToString(Trend trend);

}  // namespace indicators
}  // namespace papertrade
