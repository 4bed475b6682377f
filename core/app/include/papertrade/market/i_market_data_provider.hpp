#pragma once

#include "papertrade/domain/quote.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace papertrade {

// Time window for history requests. interval is provider vocabulary
// ("1d", "1h", ...).
struct HistoryRange {
  std::int64_t from_ms{0};
  std::int64_t to_ms{0};
  std::string interval{"1d"};
};

// -----------------------------------------------------------------------------
// IMarketDataProvider — external price source
// -----------------------------------------------------------------------------
//
// @brief  Boundary to whatever supplies prices: a simulated random walk in
//         tests and demos, or a ZeroMQ request/reply data service.
//
// @details
// Calls are synchronous and may be slow. Implementations must bound every
// call with their own timeout and report failures by throwing ProviderError
// with the matching kind (Timeout, RateLimited, Unavailable, BadResponse,
// NotFound). They must not block indefinitely: a job tick waits on them.
//
// Rate limiting is the caller's job (TokenBucket); a provider that is
// throttled upstream reports RateLimited.
//
// Thread model:
//   Implementations must be safe to call from more than one job thread.
// -----------------------------------------------------------------------------
class IMarketDataProvider {
 public:
  virtual ~IMarketDataProvider() = default;

  virtual domain::Quote fetchQuote(const domain::Symbol& symbol) = 0;

  // Bars in ascending timestamp order.
  virtual std::vector<domain::Bar> fetchHistory(const domain::Symbol& symbol,
                                                const HistoryRange& range) = 0;

  virtual std::string name() const = 0;
};

}  // namespace papertrade
