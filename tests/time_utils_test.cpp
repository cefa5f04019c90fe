// =============================================================================
// time_utils_test.cpp
// =============================================================================
// Unit tests for the session time helpers: civil date arithmetic, the fixed
// exchange offset, and the "HH:MM" / "YYYY-MM-DD" parsers.
// =============================================================================

#include "breakout/time/time_utils.hpp"

#include <gtest/gtest.h>

using breakout::TradingDate;

namespace {
constexpr int kIst = 330;
}

TEST(TimeUtilsTest, DaysFromCivilKnownDates) {
  EXPECT_EQ(breakout::days_from_civil({1970, 1, 1}), 0);
  EXPECT_EQ(breakout::days_from_civil({2000, 1, 1}), 10957);
  EXPECT_EQ(breakout::days_from_civil({1969, 12, 31}), -1);
}

TEST(TimeUtilsTest, CivilFromDaysInvertsDaysFromCivil) {
  for (std::int64_t days : {-1000, -1, 0, 59, 60, 10957, 20746}) {
    TradingDate date = breakout::civil_from_days(days);
    EXPECT_EQ(breakout::days_from_civil(date), days) << days;
  }
}

// -----------------------------------------------------------------------------
// IST midnight is 18:30 UTC of the previous day.
// -----------------------------------------------------------------------------
TEST(TimeUtilsTest, LocalMidnightAppliesOffset) {
  EXPECT_EQ(breakout::local_midnight_ms({1970, 1, 2}, kIst),
            86'400'000 - 330 * breakout::kMsPerMinute);
  EXPECT_EQ(breakout::local_midnight_ms({1970, 1, 2}, 0), 86'400'000);
}

TEST(TimeUtilsTest, TradingDateAndMinutesOfEpochInstant) {
  // 1970-01-01T00:00Z is 05:30 IST on the same day.
  EXPECT_EQ(breakout::trading_date_of(0, kIst), (TradingDate{1970, 1, 1}));
  EXPECT_EQ(breakout::minutes_of_day(0, kIst), 330);

  // One millisecond before the epoch is still the previous UTC day.
  EXPECT_EQ(breakout::trading_date_of(-1, 0), (TradingDate{1969, 12, 31}));
  EXPECT_EQ(breakout::minutes_of_day(-1, 0), 23 * 60 + 59);
}

TEST(TimeUtilsTest, SessionTimeRoundTrip) {
  const TradingDate day{2026, 10, 20};
  const std::int64_t entry = breakout::session_time_ms(day, 11 * 60, kIst);

  EXPECT_EQ(breakout::trading_date_of(entry, kIst), day);
  EXPECT_EQ(breakout::minutes_of_day(entry, kIst), 11 * 60);
  EXPECT_EQ(breakout::format_local_time(entry, kIst), "11:00:00");
}

TEST(TimeUtilsTest, ParseHhmmAcceptsValidTimes) {
  EXPECT_EQ(breakout::parse_hhmm("11:00"), 660);
  EXPECT_EQ(breakout::parse_hhmm("09:15"), 555);
  EXPECT_EQ(breakout::parse_hhmm("00:00"), 0);
  EXPECT_EQ(breakout::parse_hhmm("23:59"), 23 * 60 + 59);
}

TEST(TimeUtilsTest, ParseHhmmRejectsGarbage) {
  EXPECT_FALSE(breakout::parse_hhmm("").has_value());
  EXPECT_FALSE(breakout::parse_hhmm("24:00").has_value());
  EXPECT_FALSE(breakout::parse_hhmm("11:60").has_value());
  EXPECT_FALSE(breakout::parse_hhmm("11-00").has_value());
  EXPECT_FALSE(breakout::parse_hhmm("11:00x").has_value());
  EXPECT_FALSE(breakout::parse_hhmm("eleven").has_value());
}

TEST(TimeUtilsTest, FormatHhmmPadsWithZeros) {
  EXPECT_EQ(breakout::format_hhmm(555), "09:15");
  EXPECT_EQ(breakout::format_hhmm(0), "00:00");
}

TEST(TimeUtilsTest, ParseDateValidatesCalendar) {
  auto date = breakout::parse_date("2026-10-20");
  ASSERT_TRUE(date.has_value());
  EXPECT_EQ(*date, (TradingDate{2026, 10, 20}));
  EXPECT_EQ(breakout::format_date(*date), "2026-10-20");

  EXPECT_TRUE(breakout::parse_date("2024-02-29").has_value());
  EXPECT_FALSE(breakout::parse_date("2026-02-29").has_value());
  EXPECT_FALSE(breakout::parse_date("2026-13-01").has_value());
  EXPECT_FALSE(breakout::parse_date("20-10-2026x").has_value());
}
