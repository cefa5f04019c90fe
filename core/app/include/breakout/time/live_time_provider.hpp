#pragma once

#include "breakout/time/i_time_provider.hpp"

namespace breakout {

// -----------------------------------------------------------------------------
// LiveTimeProvider: wall-clock time implementation of ITimeProvider
// -----------------------------------------------------------------------------
//
// @brief  Returns real wall-clock time via std::chrono::system_clock.
//
// @details
// Used when the engine tracks a live session. The tick transport stamps
// ticks with exchange time; the phase timer compares strategies against this
// clock, so the host must be NTP-synchronised for entry times to fire on the
// minute.
//
// Thread model:
//   system_clock::now() is safe to call from any thread. No internal state.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace breakout
