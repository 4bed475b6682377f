#pragma once

#include "papertrade/time/time_utils.hpp"

#include <cstdint>
#include <vector>

namespace papertrade {

// Exchange session definition. Defaults describe the US equity market:
// New York time (UTC-5, UTC-4 under US daylight saving), 09:30 to 16:00.
struct MarketCalendarConfig {
  int standard_utc_offset_minutes{-5 * 60};
  bool us_daylight_saving{true};
  int open_minute_of_day{9 * 60 + 30};
  int close_minute_of_day{16 * 60};
  // Additional full-day closures on top of the built-in holiday rules.
  std::vector<CivilDate> extra_holidays;
};

// -----------------------------------------------------------------------------
// MarketCalendar — market-hours predicate
// -----------------------------------------------------------------------------
//
// @brief  Answers "is the exchange open at instant T" and "when does it next
//         open" for the JobScheduler's market-hours gate.
//
// @details
// A session is open on weekdays that are not holidays, from the open minute
// (inclusive) to the close minute (exclusive), in exchange local time.
//
// Built-in holidays, each shifted to its observed date (a Saturday holiday
// is observed on the Friday before, a Sunday holiday on the Monday after):
//   New Year's Day (Jan 1), Martin Luther King Jr. Day (3rd Monday of Jan),
//   Presidents' Day (3rd Monday of Feb), Memorial Day (last Monday of May),
//   Juneteenth (Jun 19), Independence Day (Jul 4), Labor Day (1st Monday of
//   Sep), Thanksgiving (4th Thursday of Nov), Christmas (Dec 25).
//
// Local time is derived from UTC with the configured standard offset, plus
// one hour while US daylight saving is in effect (from 02:00 local on the
// second Sunday of March to 02:00 local on the first Sunday of November).
//
// Thread model:
//   Immutable after construction. All methods are const and safe to call
//   from any thread.
// -----------------------------------------------------------------------------
class MarketCalendar {
 public:
  explicit MarketCalendar(MarketCalendarConfig config = {});

  // True when utc_ms falls inside a trading session.
  bool isOpen(std::int64_t utc_ms) const;

  // Start of the next session at or after utc_ms (utc_ms itself when the
  // market is already open).
  std::int64_t nextOpen(std::int64_t utc_ms) const;

  // True for weekdays on which the exchange is closed all day.
  bool isHoliday(const CivilDate& local_date) const;

  // True for a weekday that is not a holiday.
  bool isTradingDay(const CivilDate& local_date) const;

  // Offset of exchange local time from UTC at the given instant, in minutes.
  int utcOffsetMinutes(std::int64_t utc_ms) const;

  const MarketCalendarConfig& config() const { return config_; }

  // n-th (1-based) occurrence of weekday (Monday = 0) in the month.
  static CivilDate nthWeekdayOfMonth(int year, unsigned month, unsigned weekday,
                                     unsigned n);

  // Last occurrence of weekday (Monday = 0) in the month.
  static CivilDate lastWeekdayOfMonth(int year, unsigned month, unsigned weekday);

  // Weekend holidays moved to the adjacent weekday.
  static CivilDate observedDate(const CivilDate& holiday);

  // Built-in holiday rules for one calendar year, already observed.
  static std::vector<CivilDate> holidaysForYear(int year);

 private:
  bool daylightSavingInEffect(std::int64_t utc_ms) const;

  MarketCalendarConfig config_;
};

}  // namespace papertrade
