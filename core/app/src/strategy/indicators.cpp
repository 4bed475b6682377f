#include "papertrade/strategy/indicators.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace papertrade {
namespace indicators {

std::optional<double> simpleMovingAverage(const std::vector<double>& prices,
                                          std::size_t window) {
  if (window == 0 || prices.size() < window) {
    return std::nullopt;
  }
  const double sum = std::accumulate(prices.end() - static_cast<std::ptrdiff_t>(window),
                                     prices.end(), 0.0);
  return sum / static_cast<double>(window);
}

std::optional<double> relativeStrengthIndex(const std::vector<double>& prices,
                                            std::size_t period) {
  if (period == 0 || prices.size() < period + 1) {
    return std::nullopt;
  }
  double gains = 0.0;
  double losses = 0.0;
  for (std::size_t i = prices.size() - period; i < prices.size(); ++i) {
    const double change = prices[i] - prices[i - 1];
    if (change > 0.0) {
      gains += change;
    } else {
      losses -= change;
    }
  }
  const double avg_gain = gains / static_cast<double>(period);
  const double avg_loss = losses / static_cast<double>(period);
  if (avg_loss == 0.0) {
    return 100.0;
  }
  const double rs = avg_gain / avg_loss;
  return 100.0 - 100.0 / (1.0 + rs);
}

std::optional<BollingerBands> bollingerBands(const std::vector<double>& prices,
                                             std::size_t window, double num_std) {
  const auto middle = simpleMovingAverage(prices, window);
  if (!middle) {
    return std::nullopt;
  }
  double variance = 0.0;
  for (auto it = prices.end() - static_cast<std::ptrdiff_t>(window); it != prices.end(); ++it) {
    variance += (*it - *middle) * (*it - *middle);
  }
  const double deviation = std::sqrt(variance / static_cast<double>(window));

  BollingerBands bands;
  bands.middle = *middle;
  bands.upper = *middle + num_std * deviation;
  bands.lower = *middle - num_std * deviation;
  return bands;
}

std::optional<Trend> priceTrend(const std::vector<double>& prices,
                                std::size_t short_window, std::size_t long_window) {
  const auto short_sma = simpleMovingAverage(prices, short_window);
  const auto long_sma = simpleMovingAverage(prices, long_window);
  if (!short_sma || !long_sma) {
    return std::nullopt;
  }
  const double price = prices.back();
  if (price > *short_sma && *short_sma > *long_sma) {
    return Trend::Bullish;
  }
  if (price < *short_sma && *short_sma < *long_sma) {
    return Trend::Bearish;
  }
  return Trend::Sideways;
}

std::optional<SupportResistance> supportResistance(const std::vector<double>& prices,
                                                   std::size_t lookback) {
  if (lookback == 0 || prices.size() < lookback) {
    return std::nullopt;
  }
  const auto first = prices.end() - static_cast<std::ptrdiff_t>(lookback);
  const auto [low_it, high_it] = std::minmax_element(first, prices.end());

  SupportResistance levels;
  levels.recent_high = *high_it;
  levels.recent_low = *low_it;
  levels.pivot = (levels.recent_high + levels.recent_low + prices.back()) / 3.0;
  levels.support = 2.0 * levels.pivot - levels.recent_high;
  levels.resistance = 2.0 * levels.pivot - levels.recent_low;
  return levels;
}

bool isNear(double price, double level, double percent) {
  if (level == 0.0) {
    return false;
  }
  return std::abs(price - level) / std::abs(level) * 100.0 <= percent;
}

const char* trendToString(Trend trend) {
  switch (trend) {
    case Trend::Bullish:  return "bullish";
    case Trend::Bearish:  return "bearish";
    case Trend::Sideways: return "sideways";
  }
  return "unknown";
}

}  // namespace indicators
}  // namespace papertrade
