#pragma once

#include "breakout/domain/strategy_config.hpp"
#include "breakout/domain/tracker_state.hpp"
#include "breakout/events/notification_event.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace breakout {

struct NotifierConfig {
  double near_threshold{15.0};    // abs(price - target) <= this is "near"
  double min_drop_percent{0.0};   // NEW_LOW below this drop is suppressed
};

// -----------------------------------------------------------------------------
// StrategyContext: what the notifier needs to know about the owner
// -----------------------------------------------------------------------------
struct StrategyContext {
  domain::StrategyId strategy_id{0};
  std::string instrument_id;
  double target_premium{0.0};
};

// -----------------------------------------------------------------------------
// Notifier
// -----------------------------------------------------------------------------
//
// @brief  Turns tracker extremes and strategy milestones into
//         NotificationEvent values. Pure: no history, no I/O, no clock.
//
// @details
// evaluate(NewLow extreme):
//   exactly one NEW_LOW whenever the drop is at least min_drop_percent (an
//   undefined drop, old low <= 0, passes only when the minimum is 0), with
//   near_target = abs(new - target) <= near_threshold. Nothing otherwise.
// NewHigh extremes yield nothing. There is no rate limiting: every extreme
// is evaluated on its own.
//
// Thread model: const and stateless; safe from any thread.
// -----------------------------------------------------------------------------
class Notifier {
 public:
  explicit Notifier(NotifierConfig config = {}) : config_(config) {}

  std::vector<NotificationEvent> evaluate(const domain::ExtremeEvent& extreme,
                                          const StrategyContext& ctx) const;

  // STOP_LOSS_HIT: old = entry price, new = breaching price, drop = loss %.
  NotificationEvent stopLoss(const StrategyContext& ctx, double entry_price,
                             double price, std::int64_t at_ms) const;

  // ENTRY_SIGNAL: old = lookback low, new = entry price.
  NotificationEvent entrySignal(const StrategyContext& ctx,
                                double lookback_low, double entry_price,
                                std::int64_t at_ms) const;

  bool isNearTarget(double price, double target_premium) const;

  const NotifierConfig& config() const { return config_; }

 private:
  NotifierConfig config_;
};

}  // namespace breakout
