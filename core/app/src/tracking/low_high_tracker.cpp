#include "breakout/tracking/low_high_tracker.hpp"

namespace breakout {

// -----------------------------------------------------------------------------
// update()
// -----------------------------------------------------------------------------
TrackerUpdate LowHighTracker::update(const domain::InstrumentKey& instrument,
                                     const domain::TrackingWindow& window,
                                     double price, std::int64_t at_ms) {
  TrackerUpdate result;
  TrackerKey key{instrument, window};
  auto it = states_.find(key);

  if (!window.contains(at_ms)) {
    if (it != states_.end()) {
      result.state = it->second;
    }
    return result;
  }

  if (it == states_.end()) {
    domain::TrackerState s;
    s.low = s.high = s.first_price = s.current_price = price;
    s.sample_count = 1;
    s.first_update_ms = s.last_update_ms = at_ms;
    states_.emplace(key, s);
    result.applied = true;
    result.state = s;
    return result;
  }

  domain::TrackerState& s = it->second;
  if (s.frozen) {
    result.state = s;
    return result;
  }

  ++s.sample_count;
  s.current_price = price;
  s.last_update_ms = at_ms;

  if (price < s.low) {
    result.extreme = domain::ExtremeEvent{domain::ExtremeKind::NewLow,
                                          instrument, s.low, price, at_ms};
    s.low = price;
  }
  if (price > s.high) {
    if (emit_high_events_) {
      result.extreme = domain::ExtremeEvent{domain::ExtremeKind::NewHigh,
                                            instrument, s.high, price, at_ms};
    }
    s.high = price;
  }

  result.applied = true;
  result.state = s;
  return result;
}

// -----------------------------------------------------------------------------
// state()
// -----------------------------------------------------------------------------
std::optional<domain::TrackerState> LowHighTracker::state(
    const domain::InstrumentKey& instrument,
    const domain::TrackingWindow& window) const {
  auto it = states_.find(TrackerKey{instrument, window});
  if (it == states_.end()) {
    return std::nullopt;
  }
  return it->second;
}

// -----------------------------------------------------------------------------
// freeze() / freezeEnded()
// -----------------------------------------------------------------------------
void LowHighTracker::freeze(const domain::TrackingWindow& window) {
  for (auto& [key, state] : states_) {
    if (key.window == window) {
      state.frozen = true;
    }
  }
}

void LowHighTracker::freezeEnded(std::int64_t now_ms) {
  for (auto& [key, state] : states_) {
    if (key.window.hasEnded(now_ms)) {
      state.frozen = true;
    }
  }
}

// -----------------------------------------------------------------------------
// restore() / states()
// -----------------------------------------------------------------------------
void LowHighTracker::restore(const TrackerKey& key,
                             const domain::TrackerState& state) {
  states_[key] = state;
}

std::vector<std::pair<TrackerKey, domain::TrackerState>>
LowHighTracker::states() const {
  return {states_.begin(), states_.end()};
}

}  // namespace breakout
