#pragma once

#include "papertrade/time/time_utils.hpp"

#include <cstdint>

namespace papertrade {
namespace testing {

// UTC epoch milliseconds for a calendar instant.
inline std::int64_t utcMs(int year, unsigned month, unsigned day, int hour = 0,
                          int minute = 0) {
  return daysFromCivil(year, month, day) * kMillisPerDay + hour * kMillisPerHour +
         minute * kMillisPerMinute;
}

// Tuesday 2024-03-05 10:00 New York (EST), regular session.
inline std::int64_t tuesdaySessionMs() { return utcMs(2024, 3, 5, 15, 0); }

// Saturday 2024-03-09 12:00 New York, market closed.
inline std::int64_t saturdayMs() { return utcMs(2024, 3, 9, 17, 0); }

}  // namespace testing
}  // namespace papertrade
