#pragma once

#include "papertrade/domain/account.hpp"
#include "papertrade/domain/instrument.hpp"

#include <cstdint>
#include <string>

namespace papertrade {
namespace domain {

enum class SignalType {
  Buy,
  Sell,
  Hold,
};

// -----------------------------------------------------------------------------
// TradingSignal
// -----------------------------------------------------------------------------
// Outcome of evaluating one strategy against one instrument. Every
// evaluation is recorded, including Hold, so the audit trail shows why no
// order was placed.
//
// strength is rule specific (distance past the threshold, score magnitude).
// confidence is in [0, 1] and is compared with the strategy's
// confidence_threshold before any order is synthesized.
// -----------------------------------------------------------------------------
struct TradingSignal {
  std::uint64_t id{};
  StrategyId strategy_id{};
  Symbol symbol;
  SignalType type{SignalType::Hold};
  double strength{0.0};
  double confidence{0.0};
  double price{0.0};
  std::string reason;
  std::int64_t timestamp_ms{0};
};

inline const char* signalTypeToString(SignalType type) {
  switch (type) {
    case SignalType::Buy:  return "BUY";
    case SignalType::Sell: return "SELL";
    case SignalType::Hold: return "HOLD";
  }
  return "UNKNOWN";
}

}  // namespace domain
}  // namespace papertrade
