#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace breakout {

// -----------------------------------------------------------------------------
// Session time utilities
// -----------------------------------------------------------------------------
//
// @brief  Free functions that convert between epoch milliseconds (what the
//         ITimeProvider and ticks carry) and exchange-local calendar values
//         (what users type: "11:00", expiry "2026-10-20").
//
// @details
// NSE/BSE sessions are defined in IST (UTC+05:30). The offset is a
// configuration value (Settings::market.utc_offset_minutes) rather than a
// hard-coded constant so replay files recorded elsewhere still line up.
// No time zone database is involved: India has no daylight saving, so a
// fixed offset is exact.
//
// Thread-safety: Stateless: safe to call from any thread.
// -----------------------------------------------------------------------------

constexpr std::int64_t kMsPerMinute = 60'000;
constexpr std::int64_t kMsPerDay = 86'400'000;

// Calendar date in exchange-local time.
struct TradingDate {
  int year{1970};
  int month{1};
  int day{1};

  friend bool operator==(const TradingDate& a, const TradingDate& b) {
    return a.year == b.year && a.month == b.month && a.day == b.day;
  }
  friend bool operator!=(const TradingDate& a, const TradingDate& b) {
    return !(a == b);
  }
  friend bool operator<(const TradingDate& a, const TradingDate& b) {
    if (a.year != b.year) return a.year < b.year;
    if (a.month != b.month) return a.month < b.month;
    return a.day < b.day;
  }
};

// -------------------------------------------------------------------------
// days_from_civil / civil_from_days
// -------------------------------------------------------------------------
// @brief  Proleptic Gregorian date <-> days since 1970-01-01.
//
// @details
// Howard Hinnant's algorithms; exact for every date the exchange will ever
// list and free of <ctime>'s global time zone state.
// -------------------------------------------------------------------------
std::int64_t days_from_civil(const TradingDate& date);
TradingDate civil_from_days(std::int64_t days);

// Epoch ms of local midnight for `date`.
std::int64_t local_midnight_ms(const TradingDate& date,
                               int utc_offset_minutes);

// Epoch ms of `minutes_of_day` (local) on `date`.
inline std::int64_t session_time_ms(const TradingDate& date,
                                    int minutes_of_day,
                                    int utc_offset_minutes) {
  return local_midnight_ms(date, utc_offset_minutes) +
         static_cast<std::int64_t>(minutes_of_day) * kMsPerMinute;
}

// Local calendar date containing epoch instant `ms`.
TradingDate trading_date_of(std::int64_t ms, int utc_offset_minutes);

// Local minutes since midnight for epoch instant `ms`.
int minutes_of_day(std::int64_t ms, int utc_offset_minutes);

// -------------------------------------------------------------------------
// parse_hhmm / format_hhmm
// -------------------------------------------------------------------------
// @brief  "HH:MM" <-> minutes since midnight.
//
// @return parse_hhmm returns std::nullopt for anything that is not two
//         colon-separated integers within 00:00..23:59.
// -------------------------------------------------------------------------
std::optional<int> parse_hhmm(const std::string& text);
std::string format_hhmm(int minutes_of_day);

// "YYYY-MM-DD" <-> TradingDate.
std::optional<TradingDate> parse_date(const std::string& text);
std::string format_date(const TradingDate& date);

// "HH:MM:SS" local rendering of an epoch instant, used in log lines.
std::string format_local_time(std::int64_t ms, int utc_offset_minutes);

}  // namespace breakout
