#pragma once

#include "papertrade/domain/account.hpp"
#include "papertrade/domain/instrument.hpp"

#include <algorithm>
#include <cstddef>
#include <string>
#include <variant>
#include <vector>

namespace papertrade {
namespace domain {

// -----------------------------------------------------------------------------
// Strategy rules
// -----------------------------------------------------------------------------
//
// @brief  One alternative per strategy kind, each carrying only its own
//         parameters.
//
// @details
//   RsiReversionRules       → buy below oversold, sell above overbought.
//   MovingAverageCrossRules → buy on a golden cross of the short SMA over the
//                             long SMA, sell on a death cross.
//   CompositeScoreRules     → additive score over RSI, trend, Bollinger band
//                             position and support/resistance proximity.
//
// StrategySignalEngine::evaluate dispatches on the active alternative.
// -----------------------------------------------------------------------------
struct RsiReversionRules {
  int period{14};
  double oversold{30.0};
  double overbought{70.0};
};

struct MovingAverageCrossRules {
  int short_window{20};
  int long_window{50};
};

struct CompositeScoreRules {
  int rsi_period{14};
  double oversold{30.0};
  double overbought{70.0};
  int short_window{20};
  int long_window{50};
  int bollinger_window{20};
  double proximity_percent{2.0};
  int buy_score{3};
  int sell_score{-3};
};

using StrategyRules =
    std::variant<RsiReversionRules, MovingAverageCrossRules, CompositeScoreRules>;

// Position sizing for synthesized buy orders.
struct FixedNotionalSizing {
  double notional{1000.0};
};

struct PercentOfEquitySizing {
  double percent{10.0};
};

using PositionSizing = std::variant<FixedNotionalSizing, PercentOfEquitySizing>;

// -----------------------------------------------------------------------------
// Strategy
// -----------------------------------------------------------------------------
// Reference data loaded from configuration. Only strategies with at least
// one linked account (Account::strategy_id) are evaluated.
// -----------------------------------------------------------------------------
struct Strategy {
  StrategyId id{};
  std::string name;
  bool active{true};
  std::vector<Symbol> universe;
  StrategyRules rules{RsiReversionRules{}};
  PositionSizing sizing{PercentOfEquitySizing{}};
  double confidence_threshold{0.6};
  std::size_t max_positions{10};
};

inline const char* strategyKindName(const StrategyRules& rules) {
  if (std::holds_alternative<MovingAverageCrossRules>(rules)) return "ma_crossover";
  if (std::holds_alternative<CompositeScoreRules>(rules)) return "composite_score";
  return "rsi_reversion";
}

// Number of closing prices a strategy needs before it can produce anything
// other than Hold.
inline std::size_t requiredHistory(const StrategyRules& rules) {
  if (const auto* rsi = std::get_if<RsiReversionRules>(&rules)) {
    return static_cast<std::size_t>(rsi->period) + 1;
  }
  if (const auto* cross = std::get_if<MovingAverageCrossRules>(&rules)) {
    return static_cast<std::size_t>(cross->long_window) + 1;
  }
  const auto& composite = std::get<CompositeScoreRules>(rules);
  const int needed = std::max({composite.rsi_period + 1, composite.long_window,
                               composite.bollinger_window, 20});
  return static_cast<std::size_t>(needed);
}

}  // namespace domain
}  // namespace papertrade
