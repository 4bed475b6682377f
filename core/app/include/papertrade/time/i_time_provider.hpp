#pragma once

#include <cstdint>

namespace papertrade {

// -----------------------------------------------------------------------------
// ITimeProvider — injected source of "now"
// -----------------------------------------------------------------------------
//
// @brief  Abstracts the wall clock away from every component that stamps or
//         compares times.
//
// @details
// The scheduler decides which jobs are due, the market calendar decides
// whether the exchange is open, the execution engine decides whether a
// quote is fresh and the token bucket refills, all from now_ms(). Injecting
// the clock lets tests walk through a trading day (or a weekend) in
// microseconds:
//   - LiveTimeProvider       → std::chrono::system_clock.
//   - SimulationTimeProvider → value set by the test or replay harness.
//
// All times in the engine are UTC epoch milliseconds.
//
// Thread-safety contract:
//   Implementations must be safe for concurrent reads from every job thread.
//
// Ownership:
//   Components hold a const reference. The provider outlives them.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // Current time as milliseconds since 1970-01-01 00:00:00 UTC.
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace papertrade
