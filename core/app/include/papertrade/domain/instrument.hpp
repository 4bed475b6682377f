#pragma once

#include <string>

namespace papertrade {
namespace domain {

// Instrument symbols are the instrument identity throughout the engine
// (upper-case ticker, e.g. "AAPL").
using Symbol = std::string;

// Reference data. Instruments are registered lazily the first time an order,
// watchlist entry or strategy universe mentions them and are never mutated by
// the job core afterwards.
struct Instrument {
  Symbol symbol;
  std::string exchange;
  std::string currency{"USD"};
};

// Canonical form used for every map key: trimmed, upper-case.
Symbol normalizeSymbol(const std::string& raw);

}  // namespace domain
}  // namespace papertrade
