#pragma once

#include "papertrade/domain/instrument.hpp"

#include <cmath>
#include <cstdint>
#include <string>

namespace papertrade {
namespace domain {

// -----------------------------------------------------------------------------
// Quote — latest observed price for one instrument
// -----------------------------------------------------------------------------
//
// @brief  Value type stored in the MarketDataCache.
//
// @details
// as_of_ms is the provider's observation time in UTC epoch milliseconds, not
// the time the engine received it. The cache compares as_of_ms to decide
// last-writer-wins and the execution engine compares it to now() to decide
// whether the quote is fresh enough to fill against.
// -----------------------------------------------------------------------------
struct Quote {
  Symbol symbol;
  double price{0.0};
  std::int64_t as_of_ms{0};
  std::string source;
  double volume{0.0};
};

// Daily (or intraday) OHLCV bar returned by history requests.
struct Bar {
  std::int64_t timestamp_ms{0};
  double open{0.0};
  double high{0.0};
  double low{0.0};
  double close{0.0};
  double volume{0.0};
};

// NaN, infinite, zero and negative prices are treated as absent data.
inline bool isUsablePrice(double price) {
  return std::isfinite(price) && price > 0.0;
}

}  // namespace domain
}  // namespace papertrade
