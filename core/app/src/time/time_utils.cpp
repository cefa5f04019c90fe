#include "breakout/time/time_utils.hpp"

#include <cstdio>
#include <sstream>

namespace breakout {

namespace {

// Floor division; C++ integer division truncates toward zero, which is wrong
// for instants before the epoch or before a negative offset is applied.
std::int64_t floor_div(std::int64_t a, std::int64_t b) {
  std::int64_t q = a / b;
  if ((a % b != 0) && ((a < 0) != (b < 0))) {
    --q;
  }
  return q;
}

bool read_int(std::istringstream& in, int& out) {
  if (!(in >> out)) {
    return false;
  }
  return true;
}

}  // namespace

// -----------------------------------------------------------------------------
// days_from_civil
// -----------------------------------------------------------------------------
std::int64_t days_from_civil(const TradingDate& date) {
  const std::int64_t y = date.year - (date.month <= 2 ? 1 : 0);
  const std::int64_t era = floor_div(y, 400);
  const std::int64_t yoe = y - era * 400;
  const std::int64_t m = date.month;
  const std::int64_t doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + date.day - 1;
  const std::int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + doe - 719468;
}

// -----------------------------------------------------------------------------
// civil_from_days
// -----------------------------------------------------------------------------
TradingDate civil_from_days(std::int64_t days) {
  const std::int64_t z = days + 719468;
  const std::int64_t era = floor_div(z, 146097);
  const std::int64_t doe = z - era * 146097;
  const std::int64_t yoe =
      (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const std::int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const std::int64_t mp = (5 * doy + 2) / 153;
  const std::int64_t d = doy - (153 * mp + 2) / 5 + 1;
  const std::int64_t m = mp + (mp < 10 ? 3 : -9);

  TradingDate date;
  date.year = static_cast<int>(yoe + era * 400 + (m <= 2 ? 1 : 0));
  date.month = static_cast<int>(m);
  date.day = static_cast<int>(d);
  return date;
}

std::int64_t local_midnight_ms(const TradingDate& date,
                               int utc_offset_minutes) {
  return days_from_civil(date) * kMsPerDay -
         static_cast<std::int64_t>(utc_offset_minutes) * kMsPerMinute;
}

TradingDate trading_date_of(std::int64_t ms, int utc_offset_minutes) {
  const std::int64_t local_ms =
      ms + static_cast<std::int64_t>(utc_offset_minutes) * kMsPerMinute;
  return civil_from_days(floor_div(local_ms, kMsPerDay));
}

int minutes_of_day(std::int64_t ms, int utc_offset_minutes) {
  const std::int64_t local_ms =
      ms + static_cast<std::int64_t>(utc_offset_minutes) * kMsPerMinute;
  const std::int64_t into_day = local_ms - floor_div(local_ms, kMsPerDay) * kMsPerDay;
  return static_cast<int>(into_day / kMsPerMinute);
}

// -----------------------------------------------------------------------------
// parse_hhmm(): "11:00" → 660
// -----------------------------------------------------------------------------
std::optional<int> parse_hhmm(const std::string& text) {
  std::istringstream in(text);
  int hours = 0;
  int minutes = 0;
  char colon = 0;
  if (!read_int(in, hours) || !(in >> colon) || colon != ':' ||
      !read_int(in, minutes)) {
    return std::nullopt;
  }
  // Reject trailing garbage such as "11:00x".
  char extra = 0;
  if (in >> extra) {
    return std::nullopt;
  }
  if (hours < 0 || hours > 23 || minutes < 0 || minutes > 59) {
    return std::nullopt;
  }
  return hours * 60 + minutes;
}

std::string format_hhmm(int minutes_of_day) {
  char buf[8];
  std::snprintf(buf, sizeof(buf), "%02d:%02d", minutes_of_day / 60,
                minutes_of_day % 60);
  return buf;
}

// -----------------------------------------------------------------------------
// parse_date(): "2026-10-20" → {2026, 10, 20}
// -----------------------------------------------------------------------------
std::optional<TradingDate> parse_date(const std::string& text) {
  TradingDate date;
  char dash1 = 0;
  char dash2 = 0;
  std::istringstream in(text);
  if (!read_int(in, date.year) || !(in >> dash1) || dash1 != '-' ||
      !read_int(in, date.month) || !(in >> dash2) || dash2 != '-' ||
      !read_int(in, date.day)) {
    return std::nullopt;
  }
  if (date.month < 1 || date.month > 12 || date.day < 1 || date.day > 31) {
    return std::nullopt;
  }
  // Round-trip through the day count to reject 2026-02-30 and friends.
  if (civil_from_days(days_from_civil(date)) != date) {
    return std::nullopt;
  }
  return date;
}

std::string format_date(const TradingDate& date) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", date.year, date.month,
                date.day);
  return buf;
}

std::string format_local_time(std::int64_t ms, int utc_offset_minutes) {
  const std::int64_t local_ms =
      ms + static_cast<std::int64_t>(utc_offset_minutes) * kMsPerMinute;
  const std::int64_t into_day = local_ms - floor_div(local_ms, kMsPerDay) * kMsPerDay;
  const std::int64_t seconds = into_day / 1000;
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d",
                static_cast<int>(seconds / 3600),
                static_cast<int>((seconds / 60) % 60),
                static_cast<int>(seconds % 60));
  return buf;
}

}  // namespace breakout
