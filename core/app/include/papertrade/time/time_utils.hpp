#pragma once

#include <cstdint>
#include <cstdio>
#include <string>

namespace papertrade {

// -----------------------------------------------------------------------------
// Calendar arithmetic on epoch milliseconds
// -----------------------------------------------------------------------------
//
// @brief  Stateless helpers converting between epoch days and proleptic
//         Gregorian dates, used by the MarketCalendar and for rendering
//         timestamps in JSON.
//
// @details
// The conversions are the well-known days-from-civil / civil-from-days
// algorithms: exact for every date, no time zone database, no locale. The
// engine only ever needs one exchange time zone with a fixed daylight-saving
// rule, which the MarketCalendar applies on top of these.
//
// Weekdays are numbered Monday = 0 ... Sunday = 6.
//
// Thread-safety: Stateless, safe from any thread.
// -----------------------------------------------------------------------------

constexpr std::int64_t kMillisPerMinute = 60LL * 1000;
constexpr std::int64_t kMillisPerHour = 60 * kMillisPerMinute;
constexpr std::int64_t kMillisPerDay = 24 * kMillisPerHour;

struct CivilDate {
  int year{1970};
  unsigned month{1};
  unsigned day{1};

  bool operator==(const CivilDate& other) const {
    return year == other.year && month == other.month && day == other.day;
  }
  bool operator!=(const CivilDate& other) const { return !(*this == other); }
  bool operator<(const CivilDate& other) const {
    if (year != other.year) return year < other.year;
    if (month != other.month) return month < other.month;
    return day < other.day;
  }
};

// Division rounding toward negative infinity.
inline std::int64_t floorDiv(std::int64_t value, std::int64_t divisor) {
  std::int64_t q = value / divisor;
  if ((value % divisor != 0) && ((value < 0) != (divisor < 0))) {
    --q;
  }
  return q;
}

// Days since 1970-01-01 for the given date.
inline std::int64_t daysFromCivil(int y, unsigned m, unsigned d) {
  y -= m <= 2 ? 1 : 0;
  const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

inline std::int64_t daysFromCivil(const CivilDate& date) {
  return daysFromCivil(date.year, date.month, date.day);
}

inline CivilDate civilFromDays(std::int64_t z) {
  z += 719468;
  const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const unsigned doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const std::int64_t y = static_cast<std::int64_t>(yoe) + era * 400;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  const unsigned d = doy - (153 * mp + 2) / 5 + 1;
  const unsigned m = mp < 10 ? mp + 3 : mp - 9;
  return CivilDate{static_cast<int>(y + (m <= 2 ? 1 : 0)), m, d};
}

// Monday = 0 ... Sunday = 6. 1970-01-01 was a Thursday.
inline unsigned weekdayFromDays(std::int64_t days) {
  std::int64_t w = (days + 3) % 7;
  if (w < 0) w += 7;
  return static_cast<unsigned>(w);
}

// -----------------------------------------------------------------------------
// formatIsoUtc
// -----------------------------------------------------------------------------
// @brief  Renders epoch milliseconds as "YYYY-MM-DDTHH:MM:SS.mmmZ".
//
// Used by the JSON codec so telemetry and query responses carry both the raw
// epoch value and a readable timestamp.
// -----------------------------------------------------------------------------
inline std::string formatIsoUtc(std::int64_t epoch_ms) {
  const std::int64_t days = floorDiv(epoch_ms, kMillisPerDay);
  const std::int64_t in_day = epoch_ms - days * kMillisPerDay;
  const CivilDate date = civilFromDays(days);
  const int hours = static_cast<int>(in_day / kMillisPerHour);
  const int minutes = static_cast<int>((in_day % kMillisPerHour) / kMillisPerMinute);
  const int seconds = static_cast<int>((in_day % kMillisPerMinute) / 1000);
  const int millis = static_cast<int>(in_day % 1000);

  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02uT%02d:%02d:%02d.%03dZ",
                date.year, date.month, date.day, hours, minutes, seconds,
                millis);
  return buffer;
}

}  // namespace papertrade
