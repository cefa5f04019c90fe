#include "breakout/strategy/strategy.hpp"

#include <algorithm>
#include <cmath>

namespace breakout {

using domain::CompletionReason;
using domain::StrategyPhase;

// -----------------------------------------------------------------------------
// makeSchedule()
// -----------------------------------------------------------------------------
StrategySchedule makeSchedule(const TradingDate& session_date,
                              const domain::StrategyConfig& config,
                              const domain::MarketHours& hours) {
  StrategySchedule s;
  s.session_date = session_date;
  s.entry_ms = session_time_ms(session_date, config.entry_minutes,
                               hours.utc_offset_minutes);
  s.lookback_start_ms =
      s.entry_ms - static_cast<std::int64_t>(config.lookback_minutes) *
                       kMsPerMinute;
  s.market_close_ms = hours.closeMs(session_date);
  return s;
}

// -----------------------------------------------------------------------------
// Constructors
// -----------------------------------------------------------------------------
Strategy::Strategy(domain::StrategyId id, domain::StrategyConfig config,
                   StrategySchedule schedule,
                   std::vector<domain::Instrument> candidates, int atm_strike,
                   std::int64_t created_at_ms)
    : id_(id),
      config_(std::move(config)),
      schedule_(schedule),
      created_at_ms_(created_at_ms),
      updated_at_ms_(created_at_ms),
      atm_strike_(atm_strike),
      candidates_(std::move(candidates)) {
  reindex();
}

Strategy::Strategy(const StrategyRecord& record)
    : id_(record.id),
      config_(record.config),
      schedule_(record.schedule),
      created_at_ms_(record.created_at_ms),
      updated_at_ms_(record.updated_at_ms),
      completed_at_ms_(record.completed_at_ms),
      phase_(record.phase),
      reason_(record.completion_reason),
      atm_strike_(record.atm_strike),
      candidates_(record.candidates),
      selected_(record.selected),
      entry_price_(record.entry_price),
      entry_low_(record.entry_low),
      current_price_(record.current_price) {
  reindex();
  for (const auto& [key, state] : record.lookback_states) {
    lookback_.restore(key, state);
  }
  for (const auto& [key, state] : record.monitoring_states) {
    monitoring_.restore(key, state);
  }
}

void Strategy::reindex() {
  candidate_index_.clear();
  for (std::size_t i = 0; i < candidates_.size(); ++i) {
    candidate_index_.emplace(candidates_[i].id, i);
  }
}

const domain::Instrument* Strategy::findCandidate(const std::string& id) const {
  auto it = candidate_index_.find(id);
  return it == candidate_index_.end() ? nullptr : &candidates_[it->second];
}

bool Strategy::watches(const std::string& instrument_id) const {
  return candidate_index_.count(instrument_id) > 0;
}

StrategyContext Strategy::contextFor(const std::string& instrument_id) const {
  return StrategyContext{id_, instrument_id, config_.target_premium};
}

std::optional<double> Strategy::pnlPercent() const {
  if (!entry_price_ || !current_price_ || *entry_price_ <= 0.0) {
    return std::nullopt;
  }
  return (*current_price_ - *entry_price_) / *entry_price_ * 100.0;
}

// -----------------------------------------------------------------------------
// transition(): the only place phase_ changes
// -----------------------------------------------------------------------------
void Strategy::transition(StrategyPhase to, CompletionReason reason,
                          std::int64_t at_ms, StrategyEffects& out) {
  if (!domain::isForwardTransition(phase_, to)) {
    return;
  }
  out.phase_changes.push_back(PhaseChangeEvent{id_, phase_, to, reason, at_ms});
  phase_ = to;
  if (domain::isTerminal(to)) {
    reason_ = reason;
    completed_at_ms_ = at_ms;
  }
  updated_at_ms_ = at_ms;
  out.changed = true;
}

// -----------------------------------------------------------------------------
// advance()
// -----------------------------------------------------------------------------
void Strategy::advance(std::int64_t now_ms, const Notifier& notifier,
                       domain::EntryPriceSource entry_source,
                       StrategyEffects& out) {
  if (phase_ == StrategyPhase::Pending &&
      now_ms >= schedule_.lookback_start_ms) {
    transition(StrategyPhase::Lookback, CompletionReason::None, now_ms, out);
  }
  if (phase_ == StrategyPhase::Lookback && now_ms >= schedule_.entry_ms) {
    enterMonitoring(now_ms, notifier, entry_source, out);
  }
  if (phase_ == StrategyPhase::Monitoring &&
      now_ms >= schedule_.market_close_ms) {
    monitoring_.freeze(schedule_.monitoringWindow());
    transition(StrategyPhase::Completed, CompletionReason::MarketClose,
               now_ms, out);
  }
}

// -----------------------------------------------------------------------------
// enterMonitoring(): pick the candidate nearest target at the entry instant
// -----------------------------------------------------------------------------
void Strategy::enterMonitoring(std::int64_t at_ms, const Notifier& notifier,
                               domain::EntryPriceSource entry_source,
                               StrategyEffects& out) {
  const auto window = schedule_.lookbackWindow();
  lookback_.freeze(window);

  const domain::Instrument* best = nullptr;
  domain::TrackerState best_state;
  double best_distance = 0.0;
  for (const auto& candidate : candidates_) {
    if (!domain::accepts(config_.option_filter, candidate.key.type)) {
      continue;
    }
    auto state = lookback_.state(candidate.key, window);
    if (!state || state->sample_count == 0) {
      continue;
    }
    const double distance = std::abs(state->low - config_.target_premium);
    // Strict less keeps the earlier candidate on exact ties.
    if (best == nullptr || distance < best_distance) {
      best = &candidate;
      best_state = *state;
      best_distance = distance;
    }
  }

  if (best == nullptr) {
    transition(StrategyPhase::Completed, CompletionReason::NoCandidates, at_ms,
               out);
    return;
  }

  selected_ = *best;
  entry_low_ = best_state.low;
  entry_price_ = entry_source == domain::EntryPriceSource::LookbackLow
                     ? best_state.low
                     : best_state.current_price;
  current_price_ = entry_price_;

  // The monitoring window opens with the entry price as its first sample.
  monitoring_.update(selected_->key, schedule_.monitoringWindow(),
                     *entry_price_, schedule_.entry_ms);

  transition(StrategyPhase::Monitoring, CompletionReason::None, at_ms, out);
  out.notifications.push_back(notifier.entrySignal(
      contextFor(selected_->id), *entry_low_, *entry_price_, at_ms));
}

// -----------------------------------------------------------------------------
// onTick()
// -----------------------------------------------------------------------------
void Strategy::onTick(const domain::Tick& tick, const Notifier& notifier,
                      StrategyEffects& out) {
  switch (phase_) {
    case StrategyPhase::Lookback: {
      const domain::Instrument* candidate = findCandidate(tick.instrument_id);
      if (candidate != nullptr &&
          domain::accepts(config_.option_filter, candidate->key.type)) {
        onLookbackTick(*candidate, tick, notifier, out);
      }
      break;
    }
    case StrategyPhase::Monitoring:
      if (selected_ && selected_->id == tick.instrument_id) {
        onMonitoringTick(tick, notifier, out);
      }
      break;
    case StrategyPhase::Pending:
    case StrategyPhase::Completed:
    case StrategyPhase::Cancelled:
      break;
  }
}

void Strategy::onLookbackTick(const domain::Instrument& instrument,
                              const domain::Tick& tick,
                              const Notifier& notifier,
                              StrategyEffects& out) {
  auto update = lookback_.update(instrument.key, schedule_.lookbackWindow(),
                                 tick.ltp, tick.exchange_ts_ms);
  if (!update.applied) {
    return;
  }
  out.changed = true;
  updated_at_ms_ = tick.exchange_ts_ms;

  if (update.extreme) {
    for (auto& n : notifier.evaluate(*update.extreme,
                                     contextFor(instrument.id))) {
      out.notifications.push_back(std::move(n));
    }
  }
}

void Strategy::onMonitoringTick(const domain::Tick& tick,
                                const Notifier& notifier,
                                StrategyEffects& out) {
  const auto window = schedule_.monitoringWindow();
  auto update = monitoring_.update(selected_->key, window, tick.ltp,
                                   tick.exchange_ts_ms);
  if (!update.applied) {
    return;
  }
  out.changed = true;
  current_price_ = tick.ltp;
  updated_at_ms_ = tick.exchange_ts_ms;

  const auto ctx = contextFor(selected_->id);
  if (update.extreme) {
    for (auto& n : notifier.evaluate(*update.extreme, ctx)) {
      out.notifications.push_back(std::move(n));
    }
  }

  auto pnl = pnlPercent();
  if (pnl && *pnl <= -config_.stop_loss_percent) {
    out.notifications.push_back(
        notifier.stopLoss(ctx, *entry_price_, tick.ltp, tick.exchange_ts_ms));
    monitoring_.freeze(window);
    transition(StrategyPhase::Completed, CompletionReason::StopLoss,
               tick.exchange_ts_ms, out);
  }
}

// -----------------------------------------------------------------------------
// seedLookback()
// -----------------------------------------------------------------------------
bool Strategy::seedLookback(const std::string& instrument_id, double price,
                            std::int64_t at_ms) {
  if (phase_ != StrategyPhase::Pending && phase_ != StrategyPhase::Lookback) {
    return false;
  }
  const domain::Instrument* candidate = findCandidate(instrument_id);
  if (candidate == nullptr ||
      !domain::accepts(config_.option_filter, candidate->key.type)) {
    return false;
  }
  return lookback_
      .update(candidate->key, schedule_.lookbackWindow(), price, at_ms)
      .applied;
}

// -----------------------------------------------------------------------------
// cancel()
// -----------------------------------------------------------------------------
void Strategy::cancel(std::int64_t now_ms, StrategyEffects& out) {
  if (domain::isTerminal(phase_)) {
    return;
  }
  lookback_.freeze(schedule_.lookbackWindow());
  monitoring_.freeze(schedule_.monitoringWindow());
  transition(StrategyPhase::Cancelled, CompletionReason::Removed, now_ms, out);
}

// -----------------------------------------------------------------------------
// reconfigure() / replaceCandidates()
// -----------------------------------------------------------------------------
void Strategy::reconfigure(const domain::StrategyConfig& config,
                           const StrategySchedule& schedule,
                           std::int64_t now_ms) {
  config_ = config;
  schedule_ = schedule;
  updated_at_ms_ = now_ms;
}

void Strategy::replaceCandidates(std::vector<domain::Instrument> candidates,
                                 int atm_strike, std::int64_t now_ms) {
  candidates_ = std::move(candidates);
  atm_strike_ = atm_strike;
  lookback_.clear();
  reindex();
  updated_at_ms_ = now_ms;
}

// -----------------------------------------------------------------------------
// topCandidates()
// -----------------------------------------------------------------------------
std::vector<domain::CandidateView> Strategy::topCandidates(
    domain::OptionType type, std::size_t count) const {
  std::vector<domain::CandidateView> views;
  if (!domain::accepts(config_.option_filter, type)) {
    return views;
  }
  const auto window = schedule_.lookbackWindow();
  for (const auto& candidate : candidates_) {
    if (candidate.key.type != type) {
      continue;
    }
    auto state = lookback_.state(candidate.key, window);
    if (!state) {
      continue;
    }
    domain::CandidateView v;
    v.instrument = candidate;
    v.low = state->low;
    v.high = state->high;
    v.ltp = state->current_price;
    v.sample_count = state->sample_count;
    v.distance = std::abs(state->low - config_.target_premium);
    views.push_back(std::move(v));
  }
  std::stable_sort(views.begin(), views.end(),
                   [](const domain::CandidateView& a,
                      const domain::CandidateView& b) {
                     return a.distance < b.distance;
                   });
  if (views.size() > count) {
    views.resize(count);
  }
  return views;
}

// -----------------------------------------------------------------------------
// snapshot()
// -----------------------------------------------------------------------------
domain::StrategySnapshot Strategy::snapshot(std::size_t top_count) const {
  domain::StrategySnapshot s;
  s.id = id_;
  s.config = config_;
  s.session_date = schedule_.session_date;
  s.phase = phase_;
  s.completion_reason = reason_;
  s.created_at_ms = created_at_ms_;
  s.lookback_start_ms = schedule_.lookback_start_ms;
  s.entry_ms = schedule_.entry_ms;
  s.market_close_ms = schedule_.market_close_ms;
  s.candidate_count = candidates_.size();
  s.top_calls = topCandidates(domain::OptionType::Call, top_count);
  s.top_puts = topCandidates(domain::OptionType::Put, top_count);
  s.selected = selected_;
  s.entry_price = entry_price_;
  s.current_price = current_price_;
  s.pnl_percent = pnlPercent();
  if (selected_) {
    s.monitoring = monitoring_.state(selected_->key,
                                     schedule_.monitoringWindow());
  }
  s.updated_at_ms = updated_at_ms_;
  return s;
}

// -----------------------------------------------------------------------------
// record()
// -----------------------------------------------------------------------------
StrategyRecord Strategy::record() const {
  StrategyRecord r;
  r.id = id_;
  r.config = config_;
  r.schedule = schedule_;
  r.created_at_ms = created_at_ms_;
  r.updated_at_ms = updated_at_ms_;
  r.completed_at_ms = completed_at_ms_;
  r.phase = phase_;
  r.completion_reason = reason_;
  r.atm_strike = atm_strike_;
  r.candidates = candidates_;
  r.selected = selected_;
  r.entry_price = entry_price_;
  r.entry_low = entry_low_;
  r.current_price = current_price_;
  r.lookback_states = lookback_.states();
  r.monitoring_states = monitoring_.states();
  return r;
}

}  // namespace breakout
