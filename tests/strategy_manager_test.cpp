// =============================================================================
// strategy_manager_test.cpp
// =============================================================================
// Tests for breakout::StrategyManager on a SimulationTimeProvider, with the
// event sink collecting into a vector and tick history served from memory.
//
// Validates:
//   - The NIFTY session end to end: create, lookback, selection, stop loss
//   - Spot resolution (explicit, spot book, missing) and parameter checks
//   - Removal, the update editability rules and preview
//   - Clock-skew rejection, history seeding, retention purge, index roll
//   - A lookback tick processed just after entry still counts
//   - Checkpoint records restore into a fresh manager
//   - Ticks, the phase timer and removal running concurrently
// =============================================================================

#include "breakout/domain/errors.hpp"
#include "breakout/instruments/instrument_catalog.hpp"
#include "breakout/strategy/strategy_manager.hpp"
#include "breakout/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <variant>
#include <vector>

using breakout::NotificationEvent;
using breakout::NotificationKind;
using breakout::UpdateOutcome;
using breakout::domain::CompletionReason;
using breakout::domain::IndexName;
using breakout::domain::StrategyPhase;

namespace {

const breakout::TradingDate kSession{2026, 10, 20};
constexpr int kIst = 330;
const std::string kNiftySpot = "NSE_INDEX|Nifty 50";

std::int64_t at(int hh, int mm, int ss = 0) {
  return breakout::session_time_ms(kSession, hh * 60 + mm, kIst) + ss * 1000;
}

std::string niftyId(int strike, const char* type) {
  return "NSE_FO|NIFTY26OCT" + std::to_string(strike) + type;
}

breakout::domain::Tick makeTick(const std::string& id, double ltp,
                                std::int64_t ts) {
  breakout::domain::Tick t;
  t.instrument_id = id;
  t.ltp = ltp;
  t.exchange_ts_ms = ts;
  t.receipt_ts_ms = ts;
  return t;
}

// In-memory ITickHistory.
class FakeHistory : public breakout::ITickHistory {
 public:
  std::vector<breakout::domain::Tick> query(
      std::int64_t start_ms, std::int64_t end_ms,
      const std::unordered_set<std::string>& ids) const override {
    std::vector<breakout::domain::Tick> out;
    for (const auto& t : ticks) {
      if (t.exchange_ts_ms >= start_ms && t.exchange_ts_ms <= end_ms &&
          (ids.empty() || ids.count(t.instrument_id) > 0)) {
        out.push_back(t);
      }
    }
    return out;
  }

  std::vector<breakout::domain::Tick> ticks;
};

}  // namespace

class StrategyManagerTest : public ::testing::Test {
 protected:
  StrategyManagerTest() : clock(at(9, 45)) {
    catalog.addSeries(IndexName::Nifty, kSession, "NSE_FO|NIFTY", 25000,
                      27000, 50);
    resolver_config.strikes_per_side = 2;
    manager_config.spot_instruments[IndexName::Nifty] = kNiftySpot;
  }

  void SetUp() override { build(); }

  void build(const breakout::ITickHistory* history = nullptr) {
    manager.reset();
    resolver = std::make_unique<breakout::InstrumentResolver>(
        catalog, resolver_config);
    manager = std::make_unique<breakout::StrategyManager>(
        clock, *resolver, notifier, manager_config,
        [this](breakout::Event e) { events.push_back(std::move(e)); },
        history);
  }

  breakout::domain::StrategyConfig niftyConfig(
      std::optional<double> spot = 26210.0) {
    breakout::domain::StrategyConfig c;
    c.index = IndexName::Nifty;
    c.entry_minutes = 11 * 60;
    c.lookback_minutes = 60;
    c.target_premium = 50.0;
    c.stop_loss_percent = 50.0;
    c.spot_price = spot;
    return c;
  }

  // Ticks arrive "live": the clock follows the exchange timestamp.
  void feed(const std::string& id, double ltp, std::int64_t ts) {
    clock.advance_time(ts);
    manager->onTick(makeTick(id, ltp, ts));
  }

  template <typename T>
  std::vector<T> eventsOf() const {
    std::vector<T> out;
    for (const auto& e : events) {
      if (const auto* p = std::get_if<T>(&e)) {
        out.push_back(*p);
      }
    }
    return out;
  }

  std::vector<NotificationEvent> notificationsOf(NotificationKind kind) const {
    std::vector<NotificationEvent> out;
    for (const auto& n : eventsOf<NotificationEvent>()) {
      if (n.kind == kind) {
        out.push_back(n);
      }
    }
    return out;
  }

  StrategyPhase phaseOf(breakout::domain::StrategyId id) const {
    auto s = manager->snapshot(id);
    EXPECT_TRUE(s.has_value());
    return s ? s->phase : StrategyPhase::Cancelled;
  }

  breakout::SimulationTimeProvider clock;
  breakout::InstrumentCatalog catalog;
  breakout::ResolverConfig resolver_config;
  breakout::Notifier notifier;
  breakout::StrategyManagerConfig manager_config;
  std::unique_ptr<breakout::InstrumentResolver> resolver;
  std::unique_ptr<breakout::StrategyManager> manager;
  std::vector<breakout::Event> events;
};

// -----------------------------------------------------------------------------
// 1. Created at 09:45 (PENDING); first tick at 10:00 moves it to LOOKBACK;
//    at 11:00 the 48.75 low on 26200CE wins over 53.10 on 26250CE; 24.00
//    breaches the 50% stop.
// -----------------------------------------------------------------------------
TEST_F(StrategyManagerTest, NiftySessionEndToEnd) {
  auto id = manager->create(niftyConfig());
  EXPECT_EQ(id, 1u);
  EXPECT_EQ(phaseOf(id), StrategyPhase::Pending);
  EXPECT_EQ(manager->liveCount(), 1u);

  auto created = manager->snapshot(id);
  ASSERT_TRUE(created.has_value());
  EXPECT_EQ(created->candidate_count, 6u);
  EXPECT_EQ(created->entry_ms, at(11, 0));
  EXPECT_EQ(created->lookback_start_ms, at(10, 0));
  ASSERT_TRUE(created->config.spot_price.has_value());
  EXPECT_DOUBLE_EQ(*created->config.spot_price, 26210.0);
  EXPECT_EQ(eventsOf<breakout::StrategySnapshotEvent>().size(), 1u);

  feed(niftyId(26200, "CE"), 55.00, at(10, 0));
  EXPECT_EQ(phaseOf(id), StrategyPhase::Lookback);
  feed(niftyId(26250, "CE"), 53.10, at(10, 1));
  feed(niftyId(26200, "CE"), 48.75, at(10, 30));

  auto lows = notificationsOf(NotificationKind::NewLow);
  ASSERT_EQ(lows.size(), 1u);
  EXPECT_EQ(lows[0].instrument_id, niftyId(26200, "CE"));
  EXPECT_TRUE(lows[0].near_target);

  clock.advance_time(at(11, 0));
  manager->advancePhases();

  auto entry = manager->snapshot(id);
  ASSERT_TRUE(entry.has_value());
  EXPECT_EQ(entry->phase, StrategyPhase::Monitoring);
  ASSERT_TRUE(entry->selected.has_value());
  EXPECT_EQ(entry->selected->id, niftyId(26200, "CE"));
  ASSERT_TRUE(entry->entry_price.has_value());
  EXPECT_DOUBLE_EQ(*entry->entry_price, 48.75);
  EXPECT_EQ(notificationsOf(NotificationKind::EntrySignal).size(), 1u);

  feed(niftyId(26200, "CE"), 24.00, at(11, 5));

  auto done = manager->snapshot(id);
  ASSERT_TRUE(done.has_value());
  EXPECT_EQ(done->phase, StrategyPhase::Completed);
  EXPECT_EQ(done->completion_reason, CompletionReason::StopLoss);
  ASSERT_EQ(notificationsOf(NotificationKind::StopLossHit).size(), 1u);

  // Phase changes were published in order.
  auto changes = eventsOf<breakout::PhaseChangeEvent>();
  ASSERT_EQ(changes.size(), 3u);
  EXPECT_EQ(changes[0].to, StrategyPhase::Lookback);
  EXPECT_EQ(changes[1].to, StrategyPhase::Monitoring);
  EXPECT_EQ(changes[2].to, StrategyPhase::Completed);
}

TEST_F(StrategyManagerTest, SpotFromBookWhenNotGiven) {
  EXPECT_THROW(manager->create(niftyConfig(std::nullopt)),
               breakout::ResolutionError);
  EXPECT_EQ(manager->liveCount(), 0u);

  feed(kNiftySpot, 26420.0, at(9, 46));
  ASSERT_TRUE(manager->spot(IndexName::Nifty).has_value());
  EXPECT_DOUBLE_EQ(*manager->spot(IndexName::Nifty), 26420.0);

  auto id = manager->create(niftyConfig(std::nullopt));
  auto s = manager->snapshot(id);
  ASSERT_TRUE(s.has_value());
  EXPECT_DOUBLE_EQ(*s->config.spot_price, 26420.0);
}

TEST_F(StrategyManagerTest, InvalidParametersRaiseConfigError) {
  auto c = niftyConfig();
  c.entry_minutes = 8 * 60;
  EXPECT_THROW(manager->create(c), breakout::ConfigError);

  c = niftyConfig();
  c.entry_minutes = 15 * 60 + 30;
  EXPECT_THROW(manager->create(c), breakout::ConfigError);

  c = niftyConfig();
  c.lookback_minutes = 0;
  EXPECT_THROW(manager->create(c), breakout::ConfigError);

  c = niftyConfig();
  c.target_premium = 0.0;
  EXPECT_THROW(manager->create(c), breakout::ConfigError);

  c = niftyConfig();
  c.stop_loss_percent = 150.0;
  EXPECT_THROW(manager->create(c), breakout::ConfigError);

  EXPECT_EQ(manager->liveCount(), 0u);
  EXPECT_TRUE(events.empty());
}

TEST_F(StrategyManagerTest, RemoveCancelsAndStopsRouting) {
  auto id = manager->create(niftyConfig());
  feed(niftyId(26200, "CE"), 55.0, at(10, 5));

  EXPECT_TRUE(manager->remove(id));
  EXPECT_FALSE(manager->snapshot(id).has_value());
  EXPECT_TRUE(manager->list().empty());
  EXPECT_EQ(manager->liveCount(), 0u);

  auto removed = eventsOf<breakout::StrategyRemovedEvent>();
  ASSERT_EQ(removed.size(), 1u);
  EXPECT_EQ(removed[0].strategy_id, id);
  auto changes = eventsOf<breakout::PhaseChangeEvent>();
  ASSERT_FALSE(changes.empty());
  EXPECT_EQ(changes.back().to, StrategyPhase::Cancelled);
  EXPECT_EQ(changes.back().reason, CompletionReason::Removed);

  const auto before = events.size();
  feed(niftyId(26200, "CE"), 10.0, at(10, 6));
  EXPECT_EQ(events.size(), before);

  EXPECT_FALSE(manager->remove(id));
  EXPECT_FALSE(manager->remove(999));
}

// -----------------------------------------------------------------------------
// Timing edits only while PENDING; pricing edits through LOOKBACK.
// -----------------------------------------------------------------------------
TEST_F(StrategyManagerTest, UpdateEditabilityRules) {
  auto id = manager->create(niftyConfig());

  breakout::domain::StrategyUpdate timing;
  timing.entry_minutes = 11 * 60 + 30;
  EXPECT_EQ(manager->update(id, timing), UpdateOutcome::Ok);
  auto s = manager->snapshot(id);
  EXPECT_EQ(s->entry_ms, at(11, 30));
  EXPECT_EQ(s->lookback_start_ms, at(10, 30));

  EXPECT_EQ(manager->update(id, {}), UpdateOutcome::Invalid);

  breakout::domain::StrategyUpdate bad;
  bad.lookback_minutes = 0;
  EXPECT_EQ(manager->update(id, bad), UpdateOutcome::Invalid);
  EXPECT_EQ(manager->snapshot(id)->config.lookback_minutes, 60);

  feed(niftyId(26200, "CE"), 55.0, at(10, 31));
  ASSERT_EQ(phaseOf(id), StrategyPhase::Lookback);

  EXPECT_EQ(manager->update(id, timing), UpdateOutcome::NotEditable);

  breakout::domain::StrategyUpdate pricing;
  pricing.target_premium = 45.0;
  EXPECT_EQ(manager->update(id, pricing), UpdateOutcome::Ok);
  EXPECT_DOUBLE_EQ(manager->snapshot(id)->config.target_premium, 45.0);

  clock.advance_time(at(11, 30));
  manager->advancePhases();
  ASSERT_EQ(phaseOf(id), StrategyPhase::Monitoring);
  EXPECT_EQ(manager->update(id, pricing), UpdateOutcome::NotEditable);

  EXPECT_EQ(manager->update(42, pricing), UpdateOutcome::NotFound);
  EXPECT_STREQ(breakout::updateOutcomeToString(UpdateOutcome::NotEditable),
               "not_editable");
}

TEST_F(StrategyManagerTest, SkewedTicksAreIgnored) {
  auto id = manager->create(niftyConfig());
  clock.advance_time(at(10, 10));
  manager->advancePhases();
  const auto before = events.size();

  manager->onTick(makeTick(niftyId(26200, "CE"), 40.0, at(10, 12, 1)));

  EXPECT_EQ(manager->clockSkewRejections(), 1u);
  EXPECT_EQ(events.size(), before);
  EXPECT_TRUE(manager->snapshot(id)->top_calls.empty());
}

TEST_F(StrategyManagerTest, PreviewReplaysHistoryWithoutCreating) {
  FakeHistory history;
  history.ticks = {
      makeTick(niftyId(26250, "CE"), 70.0, at(9, 30)),  // Before lookback
      makeTick(niftyId(26200, "CE"), 60.0, at(10, 5)),
      makeTick(niftyId(26200, "CE"), 52.0, at(10, 20)),
      makeTick(niftyId(26150, "PE"), 49.0, at(10, 10)),
      makeTick(niftyId(26900, "CE"), 50.0, at(10, 10)),  // Not a candidate
  };
  build(&history);
  clock.advance_time(at(10, 45));

  auto preview = manager->preview(niftyConfig());

  EXPECT_EQ(manager->liveCount(), 0u);
  EXPECT_TRUE(events.empty());
  EXPECT_EQ(preview.candidate_count, 6u);
  EXPECT_EQ(preview.candidates_with_data, 2u);
  EXPECT_EQ(preview.lookback_start_ms, at(10, 0));
  ASSERT_EQ(preview.top_calls.size(), 1u);
  EXPECT_DOUBLE_EQ(preview.top_calls[0].low, 52.0);
  EXPECT_EQ(preview.top_calls[0].sample_count, 2u);
  ASSERT_EQ(preview.top_puts.size(), 1u);
  ASSERT_TRUE(preview.would_select.has_value());
  EXPECT_EQ(preview.would_select->id, niftyId(26150, "PE"));
}

TEST_F(StrategyManagerTest, CreateSeedsElapsedLookbackFromHistory) {
  FakeHistory history;
  history.ticks = {
      makeTick(niftyId(26200, "CE"), 58.0, at(10, 5)),
      makeTick(niftyId(26200, "CE"), 51.0, at(10, 15)),
      makeTick(niftyId(26200, "CE"), 40.0, at(10, 45)),  // After now
  };
  build(&history);
  clock.advance_time(at(10, 30));

  auto id = manager->create(niftyConfig());

  auto s = manager->snapshot(id);
  ASSERT_TRUE(s.has_value());
  EXPECT_EQ(s->phase, StrategyPhase::Lookback);
  ASSERT_EQ(s->top_calls.size(), 1u);
  EXPECT_DOUBLE_EQ(s->top_calls[0].low, 51.0);
  EXPECT_EQ(s->top_calls[0].sample_count, 2u);
  // Seeding is silent.
  EXPECT_TRUE(eventsOf<NotificationEvent>().empty());
}

TEST_F(StrategyManagerTest, PurgeDropsTerminalStrategiesPastRetention) {
  manager_config.retention_minutes = 60;
  build();

  auto id = manager->create(niftyConfig());
  clock.advance_time(at(11, 0));
  manager->advancePhases();
  auto s = manager->snapshot(id);
  ASSERT_EQ(s->phase, StrategyPhase::Completed);
  EXPECT_EQ(s->completion_reason, CompletionReason::NoCandidates);
  EXPECT_FALSE(manager->oldestLookbackStart().has_value());

  clock.advance_time(at(11, 59));
  EXPECT_EQ(manager->purgeExpired(), 0u);

  clock.advance_time(at(12, 0));
  EXPECT_EQ(manager->purgeExpired(), 1u);
  EXPECT_EQ(manager->liveCount(), 0u);
  EXPECT_EQ(eventsOf<breakout::StrategyRemovedEvent>().size(), 1u);
}

// -----------------------------------------------------------------------------
// A PENDING strategy follows the spot: 26210 -> 26420 moves ATM from 26200 to
// 26400, so the new ladder is routed and the old one is not.
// -----------------------------------------------------------------------------
TEST_F(StrategyManagerTest, IndexRollReresolvesPendingStrategies) {
  auto id = manager->create(niftyConfig());
  EXPECT_EQ(manager->applyIndexRoll(), 0u);  // No spot tick yet

  feed(kNiftySpot, 26420.0, at(9, 50));
  EXPECT_EQ(manager->applyIndexRoll(), 1u);
  EXPECT_EQ(manager->applyIndexRoll(), 0u);  // Already at the new ATM
  EXPECT_DOUBLE_EQ(*manager->snapshot(id)->config.spot_price, 26420.0);

  feed(niftyId(26400, "CE"), 50.0, at(10, 1));
  feed(niftyId(26200, "CE"), 50.0, at(10, 2));

  auto s = manager->snapshot(id);
  ASSERT_EQ(s->top_calls.size(), 1u);
  EXPECT_EQ(s->top_calls[0].instrument.id, niftyId(26400, "CE"));
}

TEST_F(StrategyManagerTest, IndexRollLeavesLookbackAlone) {
  manager->create(niftyConfig());
  feed(niftyId(26200, "CE"), 50.0, at(10, 1));
  feed(kNiftySpot, 26420.0, at(10, 2));

  EXPECT_EQ(manager->applyIndexRoll(), 0u);
}

TEST_F(StrategyManagerTest, RecordsRestoreIntoFreshManager) {
  auto first = manager->create(niftyConfig());
  auto second = manager->create(niftyConfig());
  feed(niftyId(26200, "CE"), 48.75, at(10, 5));
  manager->remove(first);

  auto records = manager->records();
  auto next = manager->nextId();
  ASSERT_EQ(records.size(), 1u);
  EXPECT_EQ(next, 3u);

  events.clear();
  build();
  EXPECT_EQ(manager->restore(records, next), 1u);
  EXPECT_EQ(eventsOf<breakout::StrategySnapshotEvent>().size(), 1u);

  auto s = manager->snapshot(second);
  ASSERT_TRUE(s.has_value());
  EXPECT_EQ(s->phase, StrategyPhase::Lookback);
  ASSERT_EQ(s->top_calls.size(), 1u);
  EXPECT_DOUBLE_EQ(s->top_calls[0].low, 48.75);
  ASSERT_TRUE(manager->oldestLookbackStart().has_value());
  EXPECT_EQ(*manager->oldestLookbackStart(), at(10, 0));

  // Restored strategies keep receiving ticks, and ids never repeat.
  feed(niftyId(26200, "CE"), 47.0, at(10, 6));
  EXPECT_DOUBLE_EQ(manager->snapshot(second)->top_calls[0].low, 47.0);
  EXPECT_EQ(manager->create(niftyConfig()), 3u);

  // Restoring the same records twice skips the live one.
  EXPECT_EQ(manager->restore(records, next), 0u);
}

// -----------------------------------------------------------------------------
// A 10:59:59.900 tick on 26250CE reaches the manager at 11:00:00.200, before
// the phase timer ran: it is still a lookback low and wins the selection.
// -----------------------------------------------------------------------------
TEST_F(StrategyManagerTest, LateLookbackTickCountsTowardsSelection) {
  auto id = manager->create(niftyConfig());
  feed(niftyId(26200, "CE"), 48.75, at(10, 10));
  ASSERT_EQ(phaseOf(id), StrategyPhase::Lookback);

  clock.advance_time(at(11, 0) + 200);
  manager->onTick(makeTick(niftyId(26250, "CE"), 50.0, at(10, 59, 59) + 900));

  auto snapshot = manager->snapshot(id);
  ASSERT_TRUE(snapshot.has_value());
  EXPECT_EQ(snapshot->phase, StrategyPhase::Monitoring);
  ASSERT_TRUE(snapshot->selected.has_value());
  EXPECT_EQ(snapshot->selected->id, niftyId(26250, "CE"));
  EXPECT_DOUBLE_EQ(*snapshot->entry_price, 50.0);
}

// -----------------------------------------------------------------------------
// Tick workers, the phase timer and the control surface hit the same live set
// at once. Every removal succeeds exactly once and leaves nothing behind.
// -----------------------------------------------------------------------------
TEST_F(StrategyManagerTest, ConcurrentTicksPhasesAndRemoval) {
  std::atomic<std::size_t> published{0};
  manager.reset();
  manager = std::make_unique<breakout::StrategyManager>(
      clock, *resolver, notifier, manager_config,
      [&published](breakout::Event) { published.fetch_add(1); }, nullptr);

  const auto now = at(10, 30);
  clock.advance_time(now);
  std::vector<breakout::domain::StrategyId> created;
  for (int i = 0; i < 4; ++i) {
    created.push_back(manager->create(niftyConfig()));
  }
  ASSERT_EQ(manager->liveCount(), 4u);

  const std::vector<std::string> ids = {niftyId(26200, "CE"),
                                        niftyId(26250, "CE"),
                                        niftyId(26200, "PE"),
                                        niftyId(26150, "PE")};
  std::atomic<bool> go{false};
  std::vector<std::thread> threads;
  for (int t = 0; t < 2; ++t) {
    threads.emplace_back([&, t] {
      while (!go.load()) {
      }
      for (int i = 0; i < 2000; ++i) {
        manager->onTick(
            makeTick(ids[(i + t) % ids.size()], 80.0 - (i % 50) * 0.5, now));
      }
    });
  }
  threads.emplace_back([&] {
    while (!go.load()) {
    }
    for (int i = 0; i < 500; ++i) {
      manager->advancePhases();
    }
  });
  threads.emplace_back([&] {
    while (!go.load()) {
    }
    for (auto id : created) {
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
      EXPECT_TRUE(manager->remove(id));
    }
  });

  go.store(true);
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(manager->liveCount(), 0u);
  for (auto id : created) {
    EXPECT_FALSE(manager->remove(id));
    EXPECT_FALSE(manager->snapshot(id).has_value());
  }
  EXPECT_EQ(manager->handlerErrors(), 0u);
  EXPECT_EQ(manager->clockSkewRejections(), 0u);
  EXPECT_GT(published.load(), 0u);

  manager.reset();
}
