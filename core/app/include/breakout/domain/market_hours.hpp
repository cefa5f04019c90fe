#pragma once

#include "breakout/time/time_utils.hpp"

#include <cstdint>

namespace breakout {
namespace domain {

// -----------------------------------------------------------------------------
// MarketHours
// -----------------------------------------------------------------------------
// Exchange session in local minutes since midnight, plus the local UTC
// offset. Defaults are NSE: 09:15 to 15:30 IST (UTC+05:30).
// -----------------------------------------------------------------------------
struct MarketHours {
  int utc_offset_minutes{330};
  int open_minutes{9 * 60 + 15};
  int close_minutes{15 * 60 + 30};

  std::int64_t openMs(const TradingDate& date) const {
    return session_time_ms(date, open_minutes, utc_offset_minutes);
  }
  std::int64_t closeMs(const TradingDate& date) const {
    return session_time_ms(date, close_minutes, utc_offset_minutes);
  }
  TradingDate dateOf(std::int64_t ms) const {
    return trading_date_of(ms, utc_offset_minutes);
  }
};

}  // namespace domain
}  // namespace breakout
