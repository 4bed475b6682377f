#pragma once

#include "papertrade/time/i_time_provider.hpp"

namespace papertrade {

// -----------------------------------------------------------------------------
// LiveTimeProvider — wall-clock ITimeProvider
// -----------------------------------------------------------------------------
// Used by the daemon. std::chrono::system_clock::now() is safe to call from
// any thread, so there is no internal state to protect.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace papertrade
