#include "papertrade/time/live_time_provider.hpp"

#include <chrono>

namespace papertrade {

std::int64_t LiveTimeProvider::now_ms() const {
  auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
  return std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch)
      .count();
}

}  // namespace papertrade
