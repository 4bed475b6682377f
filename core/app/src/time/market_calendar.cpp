#include "papertrade/time/market_calendar.hpp"

#include <algorithm>
#include <utility>

namespace papertrade {

namespace {

constexpr unsigned kMonday = 0;
constexpr unsigned kThursday = 3;
constexpr unsigned kSaturday = 5;
constexpr unsigned kSunday = 6;

// Long enough to cover any run of weekends and holidays.
constexpr int kMaxDaysToScan = 14;

unsigned daysInMonth(int year, unsigned month) {
  const std::int64_t first = daysFromCivil(year, month, 1);
  const std::int64_t next = month == 12 ? daysFromCivil(year + 1, 1, 1)
                                        : daysFromCivil(year, month + 1, 1);
  return static_cast<unsigned>(next - first);
}

}  // namespace

MarketCalendar::MarketCalendar(MarketCalendarConfig config)
    : config_(std::move(config)) {}

// -----------------------------------------------------------------------------
// Holiday rules
// -----------------------------------------------------------------------------
CivilDate MarketCalendar::nthWeekdayOfMonth(int year, unsigned month,
                                            unsigned weekday, unsigned n) {
  const std::int64_t first = daysFromCivil(year, month, 1);
  const unsigned first_weekday = weekdayFromDays(first);
  const unsigned offset = (weekday + 7 - first_weekday) % 7;
  return civilFromDays(first + offset + 7 * (n - 1));
}

CivilDate MarketCalendar::lastWeekdayOfMonth(int year, unsigned month,
                                             unsigned weekday) {
  const std::int64_t last = daysFromCivil(year, month, daysInMonth(year, month));
  const unsigned last_weekday = weekdayFromDays(last);
  const unsigned back = (last_weekday + 7 - weekday) % 7;
  return civilFromDays(last - back);
}

CivilDate MarketCalendar::observedDate(const CivilDate& holiday) {
  const std::int64_t days = daysFromCivil(holiday);
  const unsigned weekday = weekdayFromDays(days);
  if (weekday == kSaturday) return civilFromDays(days - 1);
  if (weekday == kSunday) return civilFromDays(days + 1);
  return holiday;
}

std::vector<CivilDate> MarketCalendar::holidaysForYear(int year) {
  return {
      observedDate({year, 1, 1}),
      nthWeekdayOfMonth(year, 1, kMonday, 3),
      nthWeekdayOfMonth(year, 2, kMonday, 3),
      lastWeekdayOfMonth(year, 5, kMonday),
      observedDate({year, 6, 19}),
      observedDate({year, 7, 4}),
      nthWeekdayOfMonth(year, 9, kMonday, 1),
      nthWeekdayOfMonth(year, 11, kThursday, 4),
      observedDate({year, 12, 25}),
  };
}

bool MarketCalendar::isHoliday(const CivilDate& local_date) const {
  const auto holidays = holidaysForYear(local_date.year);
  if (std::find(holidays.begin(), holidays.end(), local_date) != holidays.end()) {
    return true;
  }
  return std::find(config_.extra_holidays.begin(), config_.extra_holidays.end(),
                   local_date) != config_.extra_holidays.end();
}

bool MarketCalendar::isTradingDay(const CivilDate& local_date) const {
  const unsigned weekday = weekdayFromDays(daysFromCivil(local_date));
  if (weekday >= kSaturday) {
    return false;
  }
  return !isHoliday(local_date);
}

// -----------------------------------------------------------------------------
// Daylight saving
// -----------------------------------------------------------------------------
// The switch instants are computed in UTC for the year of utc_ms:
//   start = second Sunday of March, 02:00 standard time
//   end   = first Sunday of November, 02:00 daylight time
// -----------------------------------------------------------------------------
bool MarketCalendar::daylightSavingInEffect(std::int64_t utc_ms) const {
  if (!config_.us_daylight_saving) {
    return false;
  }
  const std::int64_t standard_offset_ms =
      static_cast<std::int64_t>(config_.standard_utc_offset_minutes) *
      kMillisPerMinute;
  const int year =
      civilFromDays(floorDiv(utc_ms + standard_offset_ms, kMillisPerDay)).year;

  const CivilDate start_day = nthWeekdayOfMonth(year, 3, kSunday, 2);
  const CivilDate end_day = nthWeekdayOfMonth(year, 11, kSunday, 1);

  const std::int64_t start_utc = daysFromCivil(start_day) * kMillisPerDay +
                                 2 * kMillisPerHour - standard_offset_ms;
  const std::int64_t end_utc = daysFromCivil(end_day) * kMillisPerDay +
                               2 * kMillisPerHour -
                               (standard_offset_ms + kMillisPerHour);
  return utc_ms >= start_utc && utc_ms < end_utc;
}

int MarketCalendar::utcOffsetMinutes(std::int64_t utc_ms) const {
  return config_.standard_utc_offset_minutes +
         (daylightSavingInEffect(utc_ms) ? 60 : 0);
}

// -----------------------------------------------------------------------------
// isOpen
// -----------------------------------------------------------------------------
bool MarketCalendar::isOpen(std::int64_t utc_ms) const {
  const std::int64_t local_ms =
      utc_ms + static_cast<std::int64_t>(utcOffsetMinutes(utc_ms)) * kMillisPerMinute;
  const std::int64_t local_day = floorDiv(local_ms, kMillisPerDay);
  const std::int64_t minute_of_day =
      (local_ms - local_day * kMillisPerDay) / kMillisPerMinute;

  if (!isTradingDay(civilFromDays(local_day))) {
    return false;
  }
  return minute_of_day >= config_.open_minute_of_day &&
         minute_of_day < config_.close_minute_of_day;
}

// -----------------------------------------------------------------------------
// nextOpen
// -----------------------------------------------------------------------------
// Walks forward one local day at a time from the day containing utc_ms and
// returns the first session open that is not in the past. The UTC offset is
// re-evaluated for each candidate so that sessions across a daylight-saving
// change still open at 09:30 local.
// -----------------------------------------------------------------------------
std::int64_t MarketCalendar::nextOpen(std::int64_t utc_ms) const {
  if (isOpen(utc_ms)) {
    return utc_ms;
  }

  const std::int64_t local_ms =
      utc_ms + static_cast<std::int64_t>(utcOffsetMinutes(utc_ms)) * kMillisPerMinute;
  const std::int64_t today = floorDiv(local_ms, kMillisPerDay);

  for (int i = 0; i <= kMaxDaysToScan; ++i) {
    const std::int64_t day = today + i;
    if (!isTradingDay(civilFromDays(day))) {
      continue;
    }
    const std::int64_t open_local =
        day * kMillisPerDay + config_.open_minute_of_day * kMillisPerMinute;
    // Standard-time guess first, then correct with the offset in force at
    // that instant.
    const std::int64_t guess =
        open_local - config_.standard_utc_offset_minutes * kMillisPerMinute;
    const std::int64_t open_utc =
        open_local - static_cast<std::int64_t>(utcOffsetMinutes(guess)) * kMillisPerMinute;
    if (open_utc >= utc_ms) {
      return open_utc;
    }
  }
  return utc_ms + kMaxDaysToScan * kMillisPerDay;
}

}  // namespace papertrade
