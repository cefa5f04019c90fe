#include "breakout/time/simulation_time_provider.hpp"

namespace breakout {

// -----------------------------------------------------------------------------
// now_ms(): atomic read of the simulated clock
// -----------------------------------------------------------------------------
std::int64_t SimulationTimeProvider::now_ms() const {
  return current_time_ms_.load();
}

// -----------------------------------------------------------------------------
// advance_time(): atomic write to the simulated clock
// -----------------------------------------------------------------------------
void SimulationTimeProvider::advance_time(std::int64_t new_time_ms) {
  // Not clamped to be monotonic: tests rewind the clock to build scenarios,
  // and the gateway is responsible for feeding ticks in order.
  current_time_ms_.store(new_time_ms);
}

}  // namespace breakout
