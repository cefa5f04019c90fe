#pragma once

#include "breakout/domain/instrument.hpp"
#include "breakout/domain/tracker_state.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace breakout {

// -----------------------------------------------------------------------------
// TrackerKey: (instrument, window) composite key
// -----------------------------------------------------------------------------
struct TrackerKey {
  domain::InstrumentKey instrument;
  domain::TrackingWindow window;

  friend bool operator==(const TrackerKey& a, const TrackerKey& b) {
    return a.instrument == b.instrument && a.window == b.window;
  }
};

struct TrackerKeyHash {
  std::size_t operator()(const TrackerKey& k) const noexcept {
    std::size_t h = domain::InstrumentKeyHash{}(k.instrument);
    h ^= std::hash<std::int64_t>{}(k.window.start_ms) + 0x9e3779b97f4a7c15ULL +
         (h << 6) + (h >> 2);
    h ^= std::hash<std::int64_t>{}(k.window.end_ms) + 0x9e3779b97f4a7c15ULL +
         (h << 6) + (h >> 2);
    return h;
  }
};

// -----------------------------------------------------------------------------
// TrackerUpdate: result of one LowHighTracker::update()
// -----------------------------------------------------------------------------
struct TrackerUpdate {
  bool applied{false};                        // Sample counted
  std::optional<domain::TrackerState> state;  // State after the call, if any
  std::optional<domain::ExtremeEvent> extreme;
};

// -----------------------------------------------------------------------------
// LowHighTracker
// -----------------------------------------------------------------------------
//
// @brief  Running low/high/first/current per (instrument, window).
//
// @details
// Rules for update(instrument, window, price, at):
//   - at outside [window.start, window.end]: ignored, nothing created.
//   - first in-window sample for the key: state created with
//     low = high = first = current = price, sample_count = 1, no event.
//   - later in-window samples: sample_count++, current = price;
//       price <  low  → NewLow  {old = low,  new = price}
//       price >  high → high updated; NewHigh emitted only if enabled
//     Equal prices never emit.
//   - frozen state: ignored.
//
// So after the first sample, low <= current <= high always holds.
//
// Thread model:
//   NOT thread-safe. Each instance belongs to exactly one Strategy and is
//   only touched under that strategy's mutex.
// -----------------------------------------------------------------------------
class LowHighTracker {
 public:
  explicit LowHighTracker(bool emit_high_events = false)
      : emit_high_events_(emit_high_events) {}

  TrackerUpdate update(const domain::InstrumentKey& instrument,
                       const domain::TrackingWindow& window, double price,
                       std::int64_t at_ms);

  std::optional<domain::TrackerState> state(
      const domain::InstrumentKey& instrument,
      const domain::TrackingWindow& window) const;

  // Freezes every state for `window`. Further samples are ignored.
  void freeze(const domain::TrackingWindow& window);

  // Freezes every state whose window ended before now_ms.
  void freezeEnded(std::int64_t now_ms);

  // Re-inserts a state captured by a checkpoint.
  void restore(const TrackerKey& key, const domain::TrackerState& state);

  std::vector<std::pair<TrackerKey, domain::TrackerState>> states() const;

  std::size_t size() const { return states_.size(); }
  void clear() { states_.clear(); }

 private:
  bool emit_high_events_;
  std::unordered_map<TrackerKey, domain::TrackerState, TrackerKeyHash> states_;
};

}  // namespace breakout
