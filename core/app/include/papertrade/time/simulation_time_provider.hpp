#pragma once

#include "papertrade/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace papertrade {

// -----------------------------------------------------------------------------
// SimulationTimeProvider — externally driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose "now" only moves when the owner moves it.
//
// @details
// Tests and replays set the clock to a known instant (for example a Tuesday
// at 10:00 New York time) and then step it forward to make jobs due, age
// quotes past the freshness limit or refill the token bucket. Nothing in
// the engine sleeps on this clock, so a whole trading day can be replayed
// without waiting.
//
// Internal storage is a std::atomic<int64_t>: one writer (the harness) and
// many readers (job threads) without a mutex on the read path.
//
// Monotonicity is not enforced; setting an earlier time is allowed so tests
// can exercise out-of-order quotes.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;
  explicit SimulationTimeProvider(std::int64_t start_ms);

  std::int64_t now_ms() const override;

  // Sets the clock to new_time_ms.
  void advance_time(std::int64_t new_time_ms);

  // Moves the clock forward by delta_ms and returns the new time.
  std::int64_t advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace papertrade
