#pragma once

#include "breakout/alerts/notifier.hpp"
#include "breakout/domain/instrument.hpp"
#include "breakout/domain/market_hours.hpp"
#include "breakout/domain/strategy_config.hpp"
#include "breakout/domain/strategy_phase.hpp"
#include "breakout/domain/strategy_snapshot.hpp"
#include "breakout/domain/tick.hpp"
#include "breakout/domain/tracker_state.hpp"
#include "breakout/events/event_types.hpp"
#include "breakout/events/notification_event.hpp"
#include "breakout/tracking/low_high_tracker.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace breakout {

// -----------------------------------------------------------------------------
// StrategySchedule: absolute instants for one session
// -----------------------------------------------------------------------------
struct StrategySchedule {
  TradingDate session_date{};
  std::int64_t lookback_start_ms{0};
  std::int64_t entry_ms{0};
  std::int64_t market_close_ms{0};

  // [lookback_start, entry - 1ms]: the entry instant belongs to monitoring.
  domain::TrackingWindow lookbackWindow() const {
    return {lookback_start_ms, entry_ms - 1, 1000};
  }
  domain::TrackingWindow monitoringWindow() const {
    return {entry_ms, market_close_ms, 1000};
  }
};

StrategySchedule makeSchedule(const TradingDate& session_date,
                              const domain::StrategyConfig& config,
                              const domain::MarketHours& hours);

// -----------------------------------------------------------------------------
// StrategyRecord: plain-data image of a Strategy for checkpoints
// -----------------------------------------------------------------------------
struct StrategyRecord {
  domain::StrategyId id{0};
  domain::StrategyConfig config;
  StrategySchedule schedule;
  std::int64_t created_at_ms{0};
  std::int64_t updated_at_ms{0};
  std::int64_t completed_at_ms{0};
  domain::StrategyPhase phase{domain::StrategyPhase::Pending};
  domain::CompletionReason completion_reason{domain::CompletionReason::None};
  int atm_strike{0};
  std::vector<domain::Instrument> candidates;
  std::optional<domain::Instrument> selected;
  std::optional<double> entry_price;
  std::optional<double> entry_low;
  std::optional<double> current_price;
  std::vector<std::pair<TrackerKey, domain::TrackerState>> lookback_states;
  std::vector<std::pair<TrackerKey, domain::TrackerState>> monitoring_states;
};

// -----------------------------------------------------------------------------
// StrategyEffects: what one Strategy call asks the outside world to see
// -----------------------------------------------------------------------------
struct StrategyEffects {
  std::vector<NotificationEvent> notifications;
  std::vector<PhaseChangeEvent> phase_changes;
  bool changed{false};

  bool empty() const {
    return notifications.empty() && phase_changes.empty() && !changed;
  }
};

// -----------------------------------------------------------------------------
// Strategy
// -----------------------------------------------------------------------------
//
// @brief  One user-defined tracking configuration and its lifecycle.
//
// @details
// Phase machine (forward only, time-driven by advance(now)):
//
//   PENDING    now <  lookback_start            no tracker activity
//   LOOKBACK   lookback_start <= now < entry    lookback tracker accumulates
//                                               every accepted candidate
//   MONITORING entry <= now < market_close      selected instrument only;
//                                               stop loss checked per tick
//   COMPLETED  stop loss, market close, or no candidate had data at entry
//   CANCELLED  explicit removal, from any non-terminal phase
//
// advance() walks through every intermediate phase, so a strategy found
// PENDING after market close still records LOOKBACK and MONITORING (or the
// NoCandidates completion) in order.
//
// Selection at entry: among accepted candidates with at least one lookback
// sample, the smallest abs(low - target_premium); the earlier candidate in
// resolver order wins exact ties. selected() is assigned exactly once.
//
// Thread model:
//   NOT thread-safe. StrategyManager serializes every call on a
//   per-strategy mutex.
// -----------------------------------------------------------------------------
class Strategy {
 public:
  Strategy(domain::StrategyId id, domain::StrategyConfig config,
           StrategySchedule schedule, std::vector<domain::Instrument> candidates,
           int atm_strike, std::int64_t created_at_ms);

  explicit Strategy(const StrategyRecord& record);

  // Moves the phase forward to where `now_ms` puts it.
  void advance(std::int64_t now_ms, const Notifier& notifier,
               domain::EntryPriceSource entry_source, StrategyEffects& out);

  // Applies one tick (already routed to this strategy) in the current phase.
  void onTick(const domain::Tick& tick, const Notifier& notifier,
              StrategyEffects& out);

  // Feeds an archived lookback tick without notifications. Returns true if
  // the sample was counted.
  bool seedLookback(const std::string& instrument_id, double price,
                    std::int64_t at_ms);

  // Moves a non-terminal strategy to CANCELLED(Removed).
  void cancel(std::int64_t now_ms, StrategyEffects& out);

  // Config edits; the caller has already checked editability and validity.
  void reconfigure(const domain::StrategyConfig& config,
                   const StrategySchedule& schedule, std::int64_t now_ms);

  // Index roll: replaces the candidate ladder while PENDING.
  void replaceCandidates(std::vector<domain::Instrument> candidates,
                         int atm_strike, std::int64_t now_ms);

  bool watches(const std::string& instrument_id) const;

  // Top `count` candidates of `type` by distance of lookback low to target,
  // ties in resolver order.
  std::vector<domain::CandidateView> topCandidates(domain::OptionType type,
                                                   std::size_t count) const;

  domain::StrategySnapshot snapshot(std::size_t top_count) const;
  StrategyRecord record() const;

  domain::StrategyId id() const { return id_; }
  const domain::StrategyConfig& config() const { return config_; }
  const StrategySchedule& schedule() const { return schedule_; }
  domain::StrategyPhase phase() const { return phase_; }
  domain::CompletionReason completionReason() const { return reason_; }
  const std::optional<domain::Instrument>& selected() const {
    return selected_;
  }
  std::optional<double> entryPrice() const { return entry_price_; }
  std::optional<double> pnlPercent() const;
  int atmStrike() const { return atm_strike_; }
  std::int64_t completedAtMs() const { return completed_at_ms_; }
  const std::vector<domain::Instrument>& candidates() const {
    return candidates_;
  }

 private:
  void transition(domain::StrategyPhase to, domain::CompletionReason reason,
                  std::int64_t at_ms, StrategyEffects& out);
  void enterMonitoring(std::int64_t at_ms, const Notifier& notifier,
                       domain::EntryPriceSource entry_source,
                       StrategyEffects& out);
  void onLookbackTick(const domain::Instrument& instrument,
                      const domain::Tick& tick, const Notifier& notifier,
                      StrategyEffects& out);
  void onMonitoringTick(const domain::Tick& tick, const Notifier& notifier,
                        StrategyEffects& out);
  StrategyContext contextFor(const std::string& instrument_id) const;
  const domain::Instrument* findCandidate(const std::string& id) const;
  void reindex();

  domain::StrategyId id_;
  domain::StrategyConfig config_;
  StrategySchedule schedule_;
  std::int64_t created_at_ms_;
  std::int64_t updated_at_ms_;
  std::int64_t completed_at_ms_{0};

  domain::StrategyPhase phase_{domain::StrategyPhase::Pending};
  domain::CompletionReason reason_{domain::CompletionReason::None};

  int atm_strike_;
  std::vector<domain::Instrument> candidates_;  // Resolver order
  std::unordered_map<std::string, std::size_t> candidate_index_;

  std::optional<domain::Instrument> selected_;
  std::optional<double> entry_price_;
  std::optional<double> entry_low_;
  std::optional<double> current_price_;

  LowHighTracker lookback_;
  LowHighTracker monitoring_;
};

}  // namespace breakout
