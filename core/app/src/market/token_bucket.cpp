#include "papertrade/market/token_bucket.hpp"

#include "papertrade/common/errors.hpp"
#include "papertrade/time/i_time_provider.hpp"

#include <algorithm>
#include <cmath>

namespace papertrade {

TokenBucket::TokenBucket(const ITimeProvider& clock, double capacity,
                         double refill_per_second)
    : clock_(clock),
      capacity_(capacity),
      refill_per_second_(refill_per_second),
      tokens_(capacity),
      last_refill_ms_(clock.now_ms()) {
  if (!(capacity > 0.0) || !std::isfinite(capacity)) {
    throw ConfigError("rate limit capacity must be positive");
  }
  if (refill_per_second < 0.0 || !std::isfinite(refill_per_second)) {
    throw ConfigError("rate limit refill rate must be non-negative");
  }
}

// A clock that moves backwards adds nothing.
double TokenBucket::refilledLocked(std::int64_t now_ms) const {
  const std::int64_t elapsed_ms = std::max<std::int64_t>(now_ms - last_refill_ms_, 0);
  const double added = static_cast<double>(elapsed_ms) / 1000.0 * refill_per_second_;
  return std::min(capacity_, tokens_ + added);
}

bool TokenBucket::tryAcquire(double tokens) {
  const std::int64_t now = clock_.now_ms();
  std::lock_guard lock(mutex_);
  tokens_ = refilledLocked(now);
  last_refill_ms_ = std::max(last_refill_ms_, now);
  if (tokens_ + 1e-9 < tokens) {
    return false;
  }
  tokens_ = std::max(0.0, tokens_ - tokens);
  return true;
}

double TokenBucket::available() const {
  const std::int64_t now = clock_.now_ms();
  std::lock_guard lock(mutex_);
  return refilledLocked(now);
}

}  // namespace papertrade
