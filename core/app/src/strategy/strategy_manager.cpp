#include "breakout/strategy/strategy_manager.hpp"
#include "breakout/domain/errors.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <limits>
#include <unordered_set>
#include <utility>

namespace breakout {

using domain::StrategyPhase;

const char* updateOutcomeToString(UpdateOutcome outcome) {
  switch (outcome) {
    case UpdateOutcome::Ok:          return "ok";
    case UpdateOutcome::NotFound:    return "not_found";
    case UpdateOutcome::NotEditable: return "not_editable";
    case UpdateOutcome::Invalid:     return "invalid";
  }
  return "unknown";
}

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
StrategyManager::StrategyManager(const ITimeProvider& clock,
                                 const InstrumentResolver& resolver,
                                 const Notifier& notifier,
                                 StrategyManagerConfig config, EventSink sink,
                                 const ITickHistory* history)
    : clock_(clock),
      resolver_(resolver),
      notifier_(notifier),
      config_(std::move(config)),
      sink_(std::move(sink)),
      history_(history) {
  for (const auto& [index, id] : config_.spot_instruments) {
    if (!id.empty()) {
      spot_ids_.emplace(id, index);
    }
  }
}

// -----------------------------------------------------------------------------
// validate(): parameter checks shared by create, update and preview
// -----------------------------------------------------------------------------
void StrategyManager::validate(const domain::StrategyConfig& config) const {
  const auto& m = config_.market;
  if (config.entry_minutes < m.open_minutes ||
      config.entry_minutes >= m.close_minutes) {
    throw ConfigError("entry time " + format_hhmm(config.entry_minutes) +
                      " is outside market hours " +
                      format_hhmm(m.open_minutes) + "-" +
                      format_hhmm(m.close_minutes));
  }
  if (config.lookback_minutes <= 0 ||
      config.lookback_minutes > config.entry_minutes) {
    throw ConfigError("lookback_minutes must be in 1.." +
                      std::to_string(config.entry_minutes));
  }
  if (!(config.target_premium > 0.0)) {
    throw ConfigError("target_premium must be positive");
  }
  if (!(config.stop_loss_percent > 0.0) || config.stop_loss_percent > 100.0) {
    throw ConfigError("stop_loss_percent must be in (0, 100]");
  }
}

// -----------------------------------------------------------------------------
// spotFor(): explicit spot wins, else the last observed spot tick
// -----------------------------------------------------------------------------
double StrategyManager::spotFor(const domain::StrategyConfig& config) const {
  if (config.spot_price) {
    return *config.spot_price;
  }
  if (auto s = spot(config.index)) {
    return *s;
  }
  throw ResolutionError(std::string("no spot price known for ") +
                        domain::indexToString(config.index) +
                        "; pass spot_price explicitly");
}

// -----------------------------------------------------------------------------
// seedFromHistory(): replay archived ticks for the elapsed lookback part
// -----------------------------------------------------------------------------
void StrategyManager::seedFromHistory(Strategy& strategy,
                                      std::int64_t now_ms) const {
  const auto& schedule = strategy.schedule();
  if (history_ == nullptr || now_ms <= schedule.lookback_start_ms) {
    return;
  }

  std::unordered_set<std::string> ids;
  for (const auto& c : strategy.candidates()) {
    ids.insert(c.id);
  }
  const auto end_ms = std::min(now_ms, schedule.entry_ms - 1);
  std::size_t seeded = 0;
  for (const auto& tick :
       history_->query(schedule.lookback_start_ms, end_ms, ids)) {
    if (strategy.seedLookback(tick.instrument_id, tick.ltp,
                              tick.exchange_ts_ms)) {
      ++seeded;
    }
  }
  if (seeded > 0) {
    std::cout << "[StrategyManager] strategy " << strategy.id()
              << " seeded with " << seeded << " archived tick(s)\n";
  }
}

// -----------------------------------------------------------------------------
// emit(): caller holds slot.mutex
// -----------------------------------------------------------------------------
void StrategyManager::emit(const Slot& slot, StrategyEffects& effects) {
  for (auto& n : effects.notifications) {
    sink_(std::move(n));
  }
  for (auto& change : effects.phase_changes) {
    sink_(change);
  }
  if (effects.changed) {
    sink_(StrategySnapshotEvent{slot.strategy.snapshot(config_.top_candidates)});
  }
  effects = StrategyEffects{};
}

// -----------------------------------------------------------------------------
// Routing: caller holds live_mutex_ exclusively
// -----------------------------------------------------------------------------
void StrategyManager::addRoutesLocked(const SlotPtr& slot) {
  std::lock_guard slot_lock(slot->mutex);
  for (const auto& c : slot->strategy.candidates()) {
    routes_[c.id].push_back(slot);
  }
}

void StrategyManager::removeRoutesLocked(const SlotPtr& slot) {
  for (auto it = routes_.begin(); it != routes_.end();) {
    auto& watchers = it->second;
    watchers.erase(std::remove(watchers.begin(), watchers.end(), slot),
                   watchers.end());
    if (watchers.empty()) {
      it = routes_.erase(it);
    } else {
      ++it;
    }
  }
}

std::vector<StrategyManager::SlotPtr> StrategyManager::allSlots() const {
  std::shared_lock lock(live_mutex_);
  std::vector<SlotPtr> out;
  out.reserve(slots_.size());
  for (const auto& [id, slot] : slots_) {
    out.push_back(slot);
  }
  return out;
}

StrategyManager::SlotPtr StrategyManager::find(domain::StrategyId id) const {
  std::shared_lock lock(live_mutex_);
  auto it = slots_.find(id);
  return it == slots_.end() ? nullptr : it->second;
}

// -----------------------------------------------------------------------------
// create()
// -----------------------------------------------------------------------------
domain::StrategyId StrategyManager::create(
    const domain::StrategyConfig& requested) {
  validate(requested);

  const std::int64_t now = clock_.now_ms();
  domain::StrategyConfig config = requested;
  config.spot_price = spotFor(requested);

  auto candidates = resolver_.resolve(config.index, *config.spot_price, now);
  const int atm = resolver_.atmStrike(config.index, *config.spot_price);
  const auto schedule =
      makeSchedule(config_.market.dateOf(now), config, config_.market);

  const domain::StrategyId id = ids_.next_id();
  auto slot = std::make_shared<Slot>(
      Strategy(id, config, schedule, std::move(candidates), atm, now));
  seedFromHistory(slot->strategy, now);

  {
    std::unique_lock lock(live_mutex_);
    slots_.emplace(id, slot);
    addRoutesLocked(slot);
  }

  std::cout << "[StrategyManager] created strategy " << id << " "
            << domain::indexToString(config.index) << " entry="
            << format_hhmm(config.entry_minutes) << " lookback="
            << config.lookback_minutes << "m target=" << config.target_premium
            << " sl=" << config.stop_loss_percent << "% atm=" << atm
            << " candidates=" << slot->strategy.candidates().size() << "\n";

  std::lock_guard slot_lock(slot->mutex);
  StrategyEffects effects;
  slot->strategy.advance(now, notifier_, config_.entry_price_source, effects);
  effects.changed = true;
  emit(*slot, effects);
  return id;
}

// -----------------------------------------------------------------------------
// remove()
// -----------------------------------------------------------------------------
bool StrategyManager::remove(domain::StrategyId id) {
  SlotPtr slot;
  {
    std::unique_lock lock(live_mutex_);
    auto it = slots_.find(id);
    if (it == slots_.end()) {
      return false;
    }
    slot = it->second;
    slots_.erase(it);
    removeRoutesLocked(slot);
  }

  const std::int64_t now = clock_.now_ms();
  std::lock_guard slot_lock(slot->mutex);
  slot->detached = true;
  StrategyEffects effects;
  slot->strategy.cancel(now, effects);
  emit(*slot, effects);
  sink_(StrategyRemovedEvent{id, now});

  std::cout << "[StrategyManager] removed strategy " << id << "\n";
  return true;
}

// -----------------------------------------------------------------------------
// update()
// -----------------------------------------------------------------------------
UpdateOutcome StrategyManager::update(domain::StrategyId id,
                                      const domain::StrategyUpdate& changes) {
  SlotPtr slot = find(id);
  if (!slot) {
    return UpdateOutcome::NotFound;
  }

  const bool timing = changes.entry_minutes || changes.lookback_minutes;
  const bool pricing = changes.target_premium || changes.stop_loss_percent;
  if (!timing && !pricing) {
    return UpdateOutcome::Invalid;
  }

  const std::int64_t now = clock_.now_ms();
  std::lock_guard slot_lock(slot->mutex);
  if (slot->detached) {
    return UpdateOutcome::NotFound;
  }

  Strategy& strategy = slot->strategy;
  const auto phase = strategy.phase();
  if (timing && phase != StrategyPhase::Pending) {
    return UpdateOutcome::NotEditable;
  }
  if (pricing && phase != StrategyPhase::Pending &&
      phase != StrategyPhase::Lookback) {
    return UpdateOutcome::NotEditable;
  }

  domain::StrategyConfig config = strategy.config();
  if (changes.entry_minutes) config.entry_minutes = *changes.entry_minutes;
  if (changes.lookback_minutes) {
    config.lookback_minutes = *changes.lookback_minutes;
  }
  if (changes.target_premium) config.target_premium = *changes.target_premium;
  if (changes.stop_loss_percent) {
    config.stop_loss_percent = *changes.stop_loss_percent;
  }

  try {
    validate(config);
  } catch (const ConfigError& e) {
    std::cerr << "[StrategyManager] WARNING: update of strategy " << id
              << " rejected: " << e.what() << "\n";
    return UpdateOutcome::Invalid;
  }

  const auto schedule =
      timing ? makeSchedule(strategy.schedule().session_date, config,
                            config_.market)
             : strategy.schedule();
  strategy.reconfigure(config, schedule, now);
  if (timing) {
    seedFromHistory(strategy, now);
  }

  StrategyEffects effects;
  strategy.advance(now, notifier_, config_.entry_price_source, effects);
  effects.changed = true;
  emit(*slot, effects);

  std::cout << "[StrategyManager] updated strategy " << id << "\n";
  return UpdateOutcome::Ok;
}

// -----------------------------------------------------------------------------
// preview()
// -----------------------------------------------------------------------------
domain::PreviewResult StrategyManager::preview(
    const domain::StrategyConfig& requested) const {
  validate(requested);

  const std::int64_t now = clock_.now_ms();
  domain::StrategyConfig config = requested;
  config.spot_price = spotFor(requested);

  auto candidates = resolver_.resolve(config.index, *config.spot_price, now);
  const int atm = resolver_.atmStrike(config.index, *config.spot_price);
  const auto schedule =
      makeSchedule(config_.market.dateOf(now), config, config_.market);

  // A throwaway Strategy reuses the exact lookback and ranking rules.
  Strategy scratch(0, config, schedule, candidates, atm, now);
  if (history_ != nullptr) {
    std::unordered_set<std::string> ids;
    for (const auto& c : candidates) {
      ids.insert(c.id);
    }
    const auto window = schedule.lookbackWindow();
    for (const auto& tick : history_->query(window.start_ms, window.end_ms,
                                            ids)) {
      scratch.seedLookback(tick.instrument_id, tick.ltp, tick.exchange_ts_ms);
    }
  }

  domain::PreviewResult result;
  result.config = config;
  result.lookback_start_ms = schedule.lookback_start_ms;
  result.entry_ms = schedule.entry_ms;
  result.candidate_count = candidates.size();

  constexpr auto kAll = std::numeric_limits<std::size_t>::max();
  const auto calls = scratch.topCandidates(domain::OptionType::Call, kAll);
  const auto puts = scratch.topCandidates(domain::OptionType::Put, kAll);
  result.candidates_with_data = calls.size() + puts.size();

  // Calls precede puts in resolver order, so a call wins an exact tie.
  if (!calls.empty() &&
      (puts.empty() || calls.front().distance <= puts.front().distance)) {
    result.would_select = calls.front().instrument;
  } else if (!puts.empty()) {
    result.would_select = puts.front().instrument;
  }

  result.top_calls.assign(
      calls.begin(),
      calls.begin() + std::min(calls.size(), config_.top_candidates));
  result.top_puts.assign(
      puts.begin(),
      puts.begin() + std::min(puts.size(), config_.top_candidates));
  return result;
}

// -----------------------------------------------------------------------------
// snapshot() / list()
// -----------------------------------------------------------------------------
std::optional<domain::StrategySnapshot> StrategyManager::snapshot(
    domain::StrategyId id) const {
  SlotPtr slot = find(id);
  if (!slot) {
    return std::nullopt;
  }
  std::lock_guard slot_lock(slot->mutex);
  if (slot->detached) {
    return std::nullopt;
  }
  return slot->strategy.snapshot(config_.top_candidates);
}

std::vector<domain::StrategySnapshot> StrategyManager::list() const {
  std::vector<domain::StrategySnapshot> out;
  for (const auto& slot : allSlots()) {
    std::lock_guard slot_lock(slot->mutex);
    if (!slot->detached) {
      out.push_back(slot->strategy.snapshot(config_.top_candidates));
    }
  }
  return out;
}

// -----------------------------------------------------------------------------
// onTick(): ingest worker thread
// -----------------------------------------------------------------------------
void StrategyManager::onTick(const domain::Tick& tick) {
  const std::int64_t now = clock_.now_ms();

  if (config_.clock_skew_tolerance_ms > 0 &&
      std::llabs(tick.exchange_ts_ms - now) > config_.clock_skew_tolerance_ms) {
    const auto n = clock_skew_.fetch_add(1) + 1;
    if (n == 1 || n % 100 == 0) {
      std::cerr << "[StrategyManager] WARNING: clock skew, tick "
                << tick.instrument_id << " at " << tick.exchange_ts_ms
                << " vs clock " << now << " ignored (" << n
                << " so far)\n";
    }
    return;
  }

  auto spot_it = spot_ids_.find(tick.instrument_id);
  if (spot_it != spot_ids_.end()) {
    setSpot(spot_it->second, tick.ltp);
  }

  std::vector<SlotPtr> targets;
  {
    std::shared_lock lock(live_mutex_);
    auto it = routes_.find(tick.instrument_id);
    if (it == routes_.end()) {
      return;
    }
    targets = it->second;
  }

  for (const auto& slot : targets) {
    try {
      std::lock_guard slot_lock(slot->mutex);
      if (slot->detached) {
        continue;
      }
      // The tick is applied at its own instant before the clock catches up,
      // so a lookback tick that arrives just after entry still counts
      // towards the selection.
      StrategyEffects effects;
      slot->strategy.advance(std::min(tick.exchange_ts_ms, now), notifier_,
                             config_.entry_price_source, effects);
      slot->strategy.onTick(tick, notifier_, effects);
      slot->strategy.advance(now, notifier_, config_.entry_price_source,
                             effects);
      if (!effects.empty()) {
        emit(*slot, effects);
      }
    } catch (const std::exception& e) {
      handler_errors_.fetch_add(1);
      std::cerr << "[StrategyManager] ERROR: tick " << tick.instrument_id
                << " failed for strategy " << slot->strategy.id() << ": "
                << e.what() << "\n";
    }
  }
}

// -----------------------------------------------------------------------------
// advancePhases(): phase timer
// -----------------------------------------------------------------------------
void StrategyManager::advancePhases() {
  const std::int64_t now = clock_.now_ms();
  for (const auto& slot : allSlots()) {
    try {
      std::lock_guard slot_lock(slot->mutex);
      if (slot->detached) {
        continue;
      }
      StrategyEffects effects;
      slot->strategy.advance(now, notifier_, config_.entry_price_source,
                             effects);
      if (!effects.empty()) {
        emit(*slot, effects);
      }
    } catch (const std::exception& e) {
      handler_errors_.fetch_add(1);
      std::cerr << "[StrategyManager] ERROR: phase advance failed for "
                << "strategy " << slot->strategy.id() << ": " << e.what()
                << "\n";
    }
  }
}

// -----------------------------------------------------------------------------
// purgeExpired(): drop terminal strategies past the retention horizon
// -----------------------------------------------------------------------------
std::size_t StrategyManager::purgeExpired() {
  const std::int64_t now = clock_.now_ms();
  const std::int64_t retention_ms =
      static_cast<std::int64_t>(config_.retention_minutes) * kMsPerMinute;

  std::vector<SlotPtr> expired;
  for (const auto& slot : allSlots()) {
    std::lock_guard slot_lock(slot->mutex);
    if (!slot->detached && domain::isTerminal(slot->strategy.phase()) &&
        slot->strategy.completedAtMs() + retention_ms <= now) {
      expired.push_back(slot);
    }
  }
  if (expired.empty()) {
    return 0;
  }

  {
    std::unique_lock lock(live_mutex_);
    for (const auto& slot : expired) {
      slots_.erase(slot->strategy.id());
      removeRoutesLocked(slot);
    }
  }
  for (const auto& slot : expired) {
    std::lock_guard slot_lock(slot->mutex);
    slot->detached = true;
    sink_(StrategyRemovedEvent{slot->strategy.id(), now});
  }

  std::cout << "[StrategyManager] purged " << expired.size()
            << " expired strategy(ies)\n";
  return expired.size();
}

// -----------------------------------------------------------------------------
// applyIndexRoll(): re-resolve PENDING strategies whose ATM or expiry moved
// -----------------------------------------------------------------------------
std::size_t StrategyManager::applyIndexRoll() {
  const std::int64_t now = clock_.now_ms();
  std::vector<SlotPtr> rerouted;

  for (const auto& slot : allSlots()) {
    std::lock_guard slot_lock(slot->mutex);
    Strategy& strategy = slot->strategy;
    if (slot->detached || strategy.phase() != StrategyPhase::Pending) {
      continue;
    }
    const auto index = strategy.config().index;
    auto spot_price = spot(index);
    if (!spot_price) {
      continue;
    }

    const int atm = resolver_.atmStrike(index, *spot_price);
    const auto expiry = resolver_.nearestExpiry(index, now);
    const bool expiry_moved =
        expiry && (strategy.candidates().empty() ||
                   strategy.candidates().front().key.expiry != *expiry);
    if (atm == strategy.atmStrike() && !expiry_moved) {
      continue;
    }

    std::vector<domain::Instrument> candidates;
    try {
      candidates = resolver_.resolve(index, *spot_price, now);
    } catch (const ResolutionError& e) {
      std::cerr << "[StrategyManager] WARNING: index roll for strategy "
                << strategy.id() << " kept old candidates: " << e.what()
                << "\n";
      continue;
    }

    domain::StrategyConfig config = strategy.config();
    config.spot_price = *spot_price;
    strategy.reconfigure(config, strategy.schedule(), now);
    strategy.replaceCandidates(std::move(candidates), atm, now);

    std::cout << "[StrategyManager] index roll: strategy " << strategy.id()
              << " re-resolved around ATM " << atm << "\n";

    StrategyEffects effects;
    effects.changed = true;
    emit(*slot, effects);
    rerouted.push_back(slot);
  }

  if (!rerouted.empty()) {
    std::unique_lock lock(live_mutex_);
    for (const auto& slot : rerouted) {
      if (slots_.count(slot->strategy.id()) == 0) {
        continue;  // Removed meanwhile
      }
      removeRoutesLocked(slot);
      addRoutesLocked(slot);
    }
  }
  return rerouted.size();
}

// -----------------------------------------------------------------------------
// records() / restore()
// -----------------------------------------------------------------------------
std::vector<StrategyRecord> StrategyManager::records() const {
  std::vector<StrategyRecord> out;
  for (const auto& slot : allSlots()) {
    std::lock_guard slot_lock(slot->mutex);
    if (!slot->detached) {
      out.push_back(slot->strategy.record());
    }
  }
  return out;
}

std::size_t StrategyManager::restore(const std::vector<StrategyRecord>& records,
                                     domain::StrategyId next_id) {
  std::vector<SlotPtr> restored;
  {
    std::unique_lock lock(live_mutex_);
    for (const auto& record : records) {
      if (slots_.count(record.id) > 0) {
        std::cerr << "[StrategyManager] WARNING: checkpoint strategy "
                  << record.id << " already live, skipped\n";
        continue;
      }
      auto slot = std::make_shared<Slot>(Strategy(record));
      slots_.emplace(record.id, slot);
      addRoutesLocked(slot);
      ids_.advancePast(record.id);
      restored.push_back(slot);
    }
  }
  if (next_id > 0) {
    ids_.advancePast(next_id - 1);
  }

  for (const auto& slot : restored) {
    std::lock_guard slot_lock(slot->mutex);
    StrategyEffects effects;
    effects.changed = true;
    emit(*slot, effects);
  }
  return restored.size();
}

// -----------------------------------------------------------------------------
// Spot book
// -----------------------------------------------------------------------------
void StrategyManager::setSpot(domain::IndexName index, double price) {
  if (!(price > 0.0)) {
    return;
  }
  std::lock_guard lock(spot_mutex_);
  spot_book_[index] = price;
}

std::optional<double> StrategyManager::spot(domain::IndexName index) const {
  std::lock_guard lock(spot_mutex_);
  auto it = spot_book_.find(index);
  if (it == spot_book_.end()) {
    return std::nullopt;
  }
  return it->second;
}

// -----------------------------------------------------------------------------
// oldestLookbackStart() / liveCount()
// -----------------------------------------------------------------------------
std::optional<std::int64_t> StrategyManager::oldestLookbackStart() const {
  std::optional<std::int64_t> oldest;
  for (const auto& slot : allSlots()) {
    std::lock_guard slot_lock(slot->mutex);
    if (slot->detached || domain::isTerminal(slot->strategy.phase())) {
      continue;
    }
    const auto start = slot->strategy.schedule().lookback_start_ms;
    if (!oldest || start < *oldest) {
      oldest = start;
    }
  }
  return oldest;
}

std::size_t StrategyManager::liveCount() const {
  std::shared_lock lock(live_mutex_);
  return slots_.size();
}

}  // namespace breakout
