#include "breakout/alerts/notifier.hpp"

#include <cmath>

namespace breakout {

const char* notificationKindToString(NotificationKind kind) {
  switch (kind) {
    case NotificationKind::NewLow:      return "NEW_LOW";
    case NotificationKind::StopLossHit: return "STOP_LOSS_HIT";
    case NotificationKind::EntrySignal: return "ENTRY_SIGNAL";
  }
  return "UNKNOWN";
}

bool Notifier::isNearTarget(double price, double target_premium) const {
  return std::abs(price - target_premium) <= config_.near_threshold;
}

// -----------------------------------------------------------------------------
// evaluate()
// -----------------------------------------------------------------------------
std::vector<NotificationEvent> Notifier::evaluate(
    const domain::ExtremeEvent& extreme, const StrategyContext& ctx) const {
  std::vector<NotificationEvent> out;
  if (extreme.kind != domain::ExtremeKind::NewLow) {
    return out;
  }

  const auto drop = domain::dropPercent(extreme.old_value, extreme.new_value);
  const bool near = isNearTarget(extreme.new_value, ctx.target_premium);

  const bool qualifies = drop ? *drop >= config_.min_drop_percent
                              : config_.min_drop_percent <= 0.0;
  if (qualifies) {
    NotificationEvent n;
    n.strategy_id = ctx.strategy_id;
    n.instrument_id = ctx.instrument_id;
    n.kind = NotificationKind::NewLow;
    n.old_value = extreme.old_value;
    n.new_value = extreme.new_value;
    n.drop_percent = drop;
    n.near_target = near;
    n.timestamp_ms = extreme.at_ms;
    out.push_back(std::move(n));
  }

  return out;
}

// -----------------------------------------------------------------------------
// stopLoss()
// -----------------------------------------------------------------------------
NotificationEvent Notifier::stopLoss(const StrategyContext& ctx,
                                     double entry_price, double price,
                                     std::int64_t at_ms) const {
  NotificationEvent n;
  n.strategy_id = ctx.strategy_id;
  n.instrument_id = ctx.instrument_id;
  n.kind = NotificationKind::StopLossHit;
  n.old_value = entry_price;
  n.new_value = price;
  n.drop_percent = domain::dropPercent(entry_price, price);
  n.near_target = isNearTarget(price, ctx.target_premium);
  n.timestamp_ms = at_ms;
  return n;
}

// -----------------------------------------------------------------------------
// entrySignal()
// -----------------------------------------------------------------------------
NotificationEvent Notifier::entrySignal(const StrategyContext& ctx,
                                        double lookback_low,
                                        double entry_price,
                                        std::int64_t at_ms) const {
  NotificationEvent n;
  n.strategy_id = ctx.strategy_id;
  n.instrument_id = ctx.instrument_id;
  n.kind = NotificationKind::EntrySignal;
  n.old_value = lookback_low;
  n.new_value = entry_price;
  n.near_target = isNearTarget(entry_price, ctx.target_premium);
  n.timestamp_ms = at_ms;
  return n;
}

}  // namespace breakout
