#pragma once

#include <cstdint>

namespace breakout {

// -----------------------------------------------------------------------------
// ITimeProvider: abstract time source interface
// -----------------------------------------------------------------------------
//
// @brief  Pure virtual interface that abstracts "current time" away from
//         std::chrono::system_clock.
//
// @details
// Every phase decision in the tracker is a comparison between a strategy's
// session times (lookback start, entry, market close) and now_ms(). When the
// engine replays a recorded session, "now" must follow the replayed ticks,
// not the wall clock; when tests drive a strategy from 09:45 to 11:00 they
// must do it in microseconds, not in an hour and a quarter.
//
//   - LiveTimeProvider       → delegates to std::chrono::system_clock.
//   - SimulationTimeProvider → returns a value set by the replay layer or by
//                              a test.
//
// Components receive `const ITimeProvider&` and never read the system clock
// themselves.
//
// Why int64_t milliseconds:
//   Tick payloads from the transport carry integer epoch milliseconds, the
//   checkpoint and the tick archive store them as JSON integers, and all
//   window arithmetic is plain integer arithmetic.
//
// Thread-safety contract:
//   Implementations MUST be safe for concurrent reads from any thread (tick
//   workers, the phase timer, the command thread).
//
// Ownership:
//   Components hold a const reference; the provider must outlive them.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // -------------------------------------------------------------------------
  // now_ms()
  // -------------------------------------------------------------------------
  // @brief  Returns the current time as milliseconds since the Unix epoch.
  //
  // @return int64_t  Epoch time in milliseconds (UTC). May be 0 before a
  //         simulation clock has been advanced.
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // Side-effects:  None.
  // -------------------------------------------------------------------------
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace breakout
