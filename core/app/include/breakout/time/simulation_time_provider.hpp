#pragma once

#include "breakout/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace breakout {

// -----------------------------------------------------------------------------
// SimulationTimeProvider: externally-driven clock for replay and tests
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider implementation whose "current time" is set explicitly
//         rather than read from the system clock.
//
// @details
// In replay mode the MarketDataGateway calls advance_time() with each tick's
// exchange timestamp before handing the tick to the ingestor, so the phase
// timer sees the session unfold at replay speed. Tests call advance_time()
// directly to step a strategy across its lookback start, entry time and
// market close.
//
// Internal storage:
//   std::atomic<int64_t> current_time_ms_. The gateway thread writes; tick
//   workers, the phase timer and the command thread read. The atomic gives
//   visibility without a lock on the hot path.
//
// Monotonicity is the caller's responsibility and is not enforced here.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;

  // Convenience for tests: start the clock at a given epoch millisecond.
  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  // -------------------------------------------------------------------------
  // now_ms() override
  // -------------------------------------------------------------------------
  // @brief  Returns the last time set by advance_time() (0 if never set).
  //
  // Thread-safety: Safe to call from any thread. Lock-free.
  // -------------------------------------------------------------------------
  std::int64_t now_ms() const override;

  // -------------------------------------------------------------------------
  // advance_time(new_time_ms)
  // -------------------------------------------------------------------------
  // @brief  Sets the simulation clock to the given epoch milliseconds.
  //
  // @param  new_time_ms  Epoch milliseconds of the current simulated instant.
  //
  // Thread-safety: Safe to call from any thread; intended single writer.
  // Side-effects:  Changes the value returned by now_ms() for every reader.
  // -------------------------------------------------------------------------
  void advance_time(std::int64_t new_time_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace breakout
