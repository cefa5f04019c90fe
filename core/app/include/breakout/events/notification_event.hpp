#pragma once

#include "breakout/domain/strategy_config.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace breakout {

// -----------------------------------------------------------------------------
// NotificationKind
// -----------------------------------------------------------------------------
//   NewLow      : a tracked instrument printed a strictly lower low. The
//                 NEAR_TARGET condition rides on it as near_target.
//   StopLossHit : the selected instrument's P&L breached -stop_loss_percent.
//   EntrySignal : the strategy fixed its selected instrument at entry time.
// -----------------------------------------------------------------------------
enum class NotificationKind {
  NewLow,
  StopLossHit,
  EntrySignal,
};

// -----------------------------------------------------------------------------
// NotificationEvent
// -----------------------------------------------------------------------------
//
// @brief  Immutable, append-only record produced by the Notifier and
//         consumed by alert sinks (console, ZeroMQ telemetry).
//
// @details
// old_value / new_value meaning per kind:
//   NewLow            : previous low, new low.
//   StopLossHit       : entry price, price that breached the stop.
//   EntrySignal       : lookback low of the selection, entry price.
//
// drop_percent is set for NewLow when the previous low was positive.
// near_target is the Notifier's near-band check on new_value; it is
// attached to every NewLow so consumers can filter without recomputing.
//
// Thread model:
//   Created on a tick worker or on the phase timer thread, then copied into
//   the publish loop's queue. Plain value type; safe to copy across threads.
// -----------------------------------------------------------------------------
struct NotificationEvent {
  domain::StrategyId strategy_id{0};
  std::string instrument_id;
  NotificationKind kind{NotificationKind::NewLow};
  double old_value{0.0};
  double new_value{0.0};
  std::optional<double> drop_percent;
  bool near_target{false};
  std::int64_t timestamp_ms{0};
};

const char* notificationKindToString(NotificationKind kind);

}  // namespace breakout
