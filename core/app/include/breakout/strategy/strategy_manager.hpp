#pragma once

#include "breakout/alerts/notifier.hpp"
#include "breakout/concurrent/strategy_id_generator.hpp"
#include "breakout/domain/market_hours.hpp"
#include "breakout/domain/strategy_config.hpp"
#include "breakout/domain/strategy_snapshot.hpp"
#include "breakout/domain/tick.hpp"
#include "breakout/events/event.hpp"
#include "breakout/instruments/instrument_resolver.hpp"
#include "breakout/persistence/i_tick_history.hpp"
#include "breakout/strategy/strategy.hpp"
#include "breakout/time/i_time_provider.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace breakout {

// -----------------------------------------------------------------------------
// StrategyManagerConfig
// -----------------------------------------------------------------------------
struct StrategyManagerConfig {
  domain::MarketHours market;
  std::int64_t clock_skew_tolerance_ms{60'000};  // 0 disables the check
  domain::EntryPriceSource entry_price_source{
      domain::EntryPriceSource::LastPrice};
  int retention_minutes{24 * 60};
  std::size_t top_candidates{3};
  // Spot (index) instrument id per index; its ticks feed the spot book.
  std::map<domain::IndexName, std::string> spot_instruments;
};

enum class UpdateOutcome {
  Ok,
  NotFound,
  NotEditable,
  Invalid,
};

const char* updateOutcomeToString(UpdateOutcome outcome);

// -----------------------------------------------------------------------------
// StrategyManager
// -----------------------------------------------------------------------------
//
// @brief  Owns the live strategies, routes ticks to them, drives their phase
//         machines and serves the control surface.
//
// @details
// Data structures:
//   slots_   StrategyId → shared_ptr<Slot>, where a Slot pairs a Strategy
//            with its own mutex and a `detached` flag.
//   routes_  instrument id → slots watching it, so a tick touches only the
//            strategies whose candidate set contains its instrument.
//   Both maps live under one std::shared_mutex (readers: tick path, timer,
//   queries; writers: create, remove, purge, index roll).
//
// Locking order: live-set lock first, then at most one slot mutex. The tick
// path copies the slot pointers under a shared lock and releases it before
// locking any slot, so a slow strategy never blocks create/remove.
//
// Removal takes the strategy out of both maps, then marks it CANCELLED and
// detached under its mutex. A tick worker that copied the pointer before
// removal finds it detached and does nothing.
//
// Output: every notification, phase change and snapshot goes to the event
// sink (the publish loop's push), emitted while the slot mutex is held so a
// strategy's events keep their order.
//
// Errors:
//   create()/preview() throw ResolutionError (no expiry, no spot, no
//   listed strikes) or ConfigError (invalid parameters); nothing is added.
//   Per-tick exceptions are caught per strategy, logged and counted.
//   Ticks whose exchange time is further than the tolerance from the clock
//   are ignored and counted as clock-skew rejections.
//
// Thread model:
//   Every public method is safe from any thread.
// -----------------------------------------------------------------------------
class StrategyManager {
 public:
  using EventSink = std::function<void(Event)>;

  StrategyManager(const ITimeProvider& clock,
                  const InstrumentResolver& resolver,
                  const Notifier& notifier, StrategyManagerConfig config,
                  EventSink sink, const ITickHistory* history = nullptr);

  StrategyManager(const StrategyManager&) = delete;
  StrategyManager& operator=(const StrategyManager&) = delete;

  // -------------------------------------------------------------------------
  // create(config)
  // -------------------------------------------------------------------------
  // @brief  Resolves candidates, schedules today's session, seeds the
  //         elapsed part of the lookback window from tick history and adds
  //         the strategy to the live set.
  //
  // @return The new strategy id.
  // @throws ResolutionError, ConfigError. The live set is unchanged.
  // -------------------------------------------------------------------------
  domain::StrategyId create(const domain::StrategyConfig& config);

  // @return false when the id is not live (NotFound). No state change then.
  bool remove(domain::StrategyId id);

  // -------------------------------------------------------------------------
  // update(id, changes)
  // -------------------------------------------------------------------------
  // target_premium / stop_loss_percent: PENDING or LOOKBACK.
  // entry_minutes / lookback_minutes:   PENDING only.
  // -------------------------------------------------------------------------
  UpdateOutcome update(domain::StrategyId id,
                       const domain::StrategyUpdate& changes);

  // Read-only replay of tick history over the configured lookback window.
  // @throws ResolutionError, ConfigError.
  domain::PreviewResult preview(const domain::StrategyConfig& config) const;

  std::optional<domain::StrategySnapshot> snapshot(domain::StrategyId id) const;
  std::vector<domain::StrategySnapshot> list() const;

  // Tick path: called on ingest partition workers.
  void onTick(const domain::Tick& tick);

  // Timer path.
  void advancePhases();
  std::size_t purgeExpired();
  std::size_t applyIndexRoll();

  // Checkpoint support.
  std::vector<StrategyRecord> records() const;
  domain::StrategyId nextId() const { return ids_.peek(); }
  // Replaces nothing: restored strategies are added to the live set.
  std::size_t restore(const std::vector<StrategyRecord>& records,
                      domain::StrategyId next_id);

  // Spot book.
  void setSpot(domain::IndexName index, double price);
  std::optional<double> spot(domain::IndexName index) const;

  // Earliest lookback start among non-terminal strategies, for archive
  // pruning. nullopt when none is live.
  std::optional<std::int64_t> oldestLookbackStart() const;

  std::size_t liveCount() const;
  std::uint64_t clockSkewRejections() const { return clock_skew_.load(); }
  std::uint64_t handlerErrors() const { return handler_errors_.load(); }

  const StrategyManagerConfig& config() const { return config_; }

 private:
  struct Slot {
    explicit Slot(Strategy s) : strategy(std::move(s)) {}
    std::mutex mutex;
    Strategy strategy;
    bool detached{false};  // Guarded by mutex
  };
  using SlotPtr = std::shared_ptr<Slot>;

  void validate(const domain::StrategyConfig& config) const;
  double spotFor(const domain::StrategyConfig& config) const;
  void seedFromHistory(Strategy& strategy, std::int64_t now_ms) const;

  // Caller holds slot.mutex.
  void emit(const Slot& slot, StrategyEffects& effects);

  // Caller holds live_mutex_ exclusively.
  void addRoutesLocked(const SlotPtr& slot);
  void removeRoutesLocked(const SlotPtr& slot);

  std::vector<SlotPtr> allSlots() const;
  SlotPtr find(domain::StrategyId id) const;

  const ITimeProvider& clock_;
  const InstrumentResolver& resolver_;
  const Notifier& notifier_;
  StrategyManagerConfig config_;
  EventSink sink_;
  const ITickHistory* history_;

  StrategyIdGenerator ids_;

  mutable std::shared_mutex live_mutex_;
  std::map<domain::StrategyId, SlotPtr> slots_;
  std::unordered_map<std::string, std::vector<SlotPtr>> routes_;

  std::unordered_map<std::string, domain::IndexName> spot_ids_;
  mutable std::mutex spot_mutex_;
  std::map<domain::IndexName, double> spot_book_;

  std::atomic<std::uint64_t> clock_skew_{0};
  std::atomic<std::uint64_t> handler_errors_{0};
};

}  // namespace breakout
