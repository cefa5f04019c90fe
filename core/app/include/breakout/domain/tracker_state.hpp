#pragma once

#include "breakout/domain/instrument.hpp"

#include <cstdint>
#include <optional>

namespace breakout {
namespace domain {

// -----------------------------------------------------------------------------
// TrackingWindow
// -----------------------------------------------------------------------------
// Responsibility: The interval over which a LowHighTracker accumulates
// statistics. Both ends are inclusive. granularity_ms is the polling /
// aggregation period the window was opened with; it is informational for
// the tracker and drives how often the phase timer re-evaluates it.
//
// A strategy opens two windows: lookback [entry - lookback, entry - 1ms]
// and monitoring [entry, market close].
// -----------------------------------------------------------------------------
struct TrackingWindow {
  std::int64_t start_ms{0};
  std::int64_t end_ms{0};
  std::int64_t granularity_ms{1000};

  bool contains(std::int64_t at_ms) const {
    return at_ms >= start_ms && at_ms <= end_ms;
  }

  bool hasEnded(std::int64_t now_ms) const { return now_ms > end_ms; }

  friend bool operator==(const TrackingWindow& a, const TrackingWindow& b) {
    return a.start_ms == b.start_ms && a.end_ms == b.end_ms &&
           a.granularity_ms == b.granularity_ms;
  }
};

// -----------------------------------------------------------------------------
// TrackerState
// -----------------------------------------------------------------------------
// Responsibility: Running statistics for one (instrument, window) key.
//
// Invariants (after the first sample):
//   low <= current_price <= high
//   sample_count >= 1
//   low never increases and high never decreases while the window is open
//
// `frozen` is set once the owning window's end has passed; a frozen state
// accepts no further samples but stays readable for snapshots and the
// checkpoint.
// -----------------------------------------------------------------------------
struct TrackerState {
  double low{0.0};
  double high{0.0};
  double first_price{0.0};
  double current_price{0.0};
  std::uint64_t sample_count{0};
  std::int64_t first_update_ms{0};
  std::int64_t last_update_ms{0};
  bool frozen{false};
};

// -----------------------------------------------------------------------------
// ExtremeEvent
// -----------------------------------------------------------------------------
// Responsibility: Emitted by LowHighTracker when a sample strictly beats the
// current low (or high, when high events are enabled). Carries the previous
// and new extreme so the Notifier can stay stateless.
// -----------------------------------------------------------------------------
enum class ExtremeKind {
  NewLow,
  NewHigh,
};

struct ExtremeEvent {
  ExtremeKind kind{ExtremeKind::NewLow};
  InstrumentKey instrument;
  double old_value{0.0};
  double new_value{0.0};
  std::int64_t at_ms{0};
};

// -------------------------------------------------------------------------
// dropPercent(old_low, new_price)
// -------------------------------------------------------------------------
// @brief  (old_low - new_price) / old_low * 100.
//
// @return std::nullopt when old_low <= 0 (undefined for a zero or negative
//         reference price).
// -------------------------------------------------------------------------
inline std::optional<double> dropPercent(double old_low, double new_price) {
  if (old_low <= 0.0) {
    return std::nullopt;
  }
  return (old_low - new_price) / old_low * 100.0;
}

}  // namespace domain
}  // namespace breakout
