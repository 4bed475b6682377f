#pragma once

#include <cstdint>
#include <mutex>

namespace papertrade {

class ITimeProvider;

// -----------------------------------------------------------------------------
// TokenBucket — provider call budget
// -----------------------------------------------------------------------------
//
// @brief  Classic token bucket shared by every component that calls the
//         market-data provider (quote refresh and history seeding).
//
// @details
// The bucket starts full. Tokens refill continuously at refill_per_second,
// computed lazily from the injected clock on every call, and never exceed
// capacity. tryAcquire() never blocks: a caller that gets false defers the
// work to a later tick instead of waiting, which keeps job ticks bounded.
//
// Thread model:
//   A std::mutex guards the token count and last refill time.
// -----------------------------------------------------------------------------
class TokenBucket {
 public:
  TokenBucket(const ITimeProvider& clock, double capacity,
              double refill_per_second);

  TokenBucket(const TokenBucket&) = delete;
  TokenBucket& operator=(const TokenBucket&) = delete;

  // Takes tokens if available. Returns false (and takes nothing) otherwise.
  bool tryAcquire(double tokens = 1.0);

  // Tokens available right now.
  double available() const;

  double capacity() const { return capacity_; }
  double refillPerSecond() const { return refill_per_second_; }

 private:
  double refilledLocked(std::int64_t now_ms) const;

  const ITimeProvider& clock_;
  const double capacity_;
  const double refill_per_second_;

  mutable std::mutex mutex_;
  double tokens_;
  std::int64_t last_refill_ms_;
};

}  // namespace papertrade
