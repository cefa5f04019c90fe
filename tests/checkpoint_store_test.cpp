// =============================================================================
// checkpoint_store_test.cpp
// =============================================================================
// Tests for breakout::CheckpointStore.
//
// Validates:
//   - save() then load() yields the same strategies, phases and tracker state
//   - A missing checkpoint loads as nullopt
//   - A corrupt checkpoint is moved aside and loads as nullopt
//   - Failed writes retry, then flag durability degraded until a save succeeds
// =============================================================================

#include "breakout/persistence/checkpoint_store.hpp"
#include "breakout/alerts/notifier.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;

using breakout::domain::IndexName;
using breakout::domain::Instrument;
using breakout::domain::OptionType;
using breakout::domain::StrategyPhase;

namespace {

const breakout::TradingDate kSession{2026, 10, 20};

std::int64_t at(int hh, int mm) {
  return breakout::session_time_ms(kSession, hh * 60 + mm, 330);
}

Instrument option(int strike, OptionType type) {
  Instrument i;
  i.key = {IndexName::Nifty, kSession, strike, type};
  i.id = std::string("NSE_FO|NIFTY26OCT") + std::to_string(strike) +
         breakout::domain::optionTypeToString(type);
  return i;
}

breakout::domain::Tick tick(const Instrument& instrument, double ltp,
                            std::int64_t ts) {
  breakout::domain::Tick t;
  t.instrument_id = instrument.id;
  t.ltp = ltp;
  t.exchange_ts_ms = ts;
  t.receipt_ts_ms = ts;
  return t;
}

}  // namespace

class CheckpointStoreTest : public ::testing::Test {
 protected:
  void SetUp() override {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    dir = fs::path(::testing::TempDir()) /
          (std::string("checkpoint_") + info->name());
    fs::remove_all(dir);
    fs::create_directories(dir);
    path = (dir / "checkpoint.json").string();

    config.index = IndexName::Nifty;
    config.entry_minutes = 11 * 60;
    config.lookback_minutes = 60;
    config.target_premium = 50.0;
    config.stop_loss_percent = 50.0;
  }

  void TearDown() override { fs::remove_all(dir); }

  // A strategy in MONITORING on 26200CE, entered at 48.75, now at 40.
  breakout::Strategy monitoringStrategy() {
    breakout::Strategy s(1, config,
                         breakout::makeSchedule(kSession, config, hours),
                         {ce, pe}, 26200, at(9, 45));
    breakout::StrategyEffects out;
    s.advance(at(10, 0), notifier, breakout::domain::EntryPriceSource::LastPrice,
              out);
    s.onTick(tick(ce, 48.75, at(10, 10)), notifier, out);
    s.onTick(tick(pe, 70.00, at(10, 20)), notifier, out);
    s.advance(at(11, 0), notifier, breakout::domain::EntryPriceSource::LastPrice,
              out);
    s.onTick(tick(ce, 40.00, at(11, 5)), notifier, out);
    return s;
  }

  breakout::CheckpointConfig storeConfig() const {
    breakout::CheckpointConfig c;
    c.path = path;
    c.max_attempts = 2;
    c.initial_backoff = std::chrono::milliseconds(1);
    return c;
  }

  fs::path dir;
  std::string path;
  const Instrument ce = option(26200, OptionType::Call);
  const Instrument pe = option(26200, OptionType::Put);
  breakout::domain::StrategyConfig config;
  breakout::domain::MarketHours hours;
  breakout::Notifier notifier;
};

// -----------------------------------------------------------------------------
// 1. Round trip: a MONITORING strategy and a PENDING one come back with the
//    same ids, phases, selection and tracker state, and next_id survives.
// -----------------------------------------------------------------------------
TEST_F(CheckpointStoreTest, SaveThenLoadRestoresStrategies) {
  auto live = monitoringStrategy();

  breakout::domain::StrategyConfig later = config;
  later.entry_minutes = 14 * 60;
  breakout::Strategy pending(2, later,
                             breakout::makeSchedule(kSession, later, hours),
                             {ce, pe}, 26200, at(9, 45));

  breakout::Checkpoint checkpoint;
  checkpoint.strategies = {live.record(), pending.record()};
  checkpoint.next_id = 3;
  checkpoint.written_at_ms = at(11, 6);

  breakout::CheckpointStore store(storeConfig());
  ASSERT_TRUE(store.save(checkpoint));
  EXPECT_FALSE(store.degraded());
  EXPECT_EQ(store.lastSuccessMs(), at(11, 6));
  EXPECT_FALSE(fs::exists(path + ".tmp"));

  breakout::CheckpointStore reader(storeConfig());
  auto loaded = reader.load();
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->next_id, 3u);
  EXPECT_EQ(loaded->written_at_ms, at(11, 6));
  ASSERT_EQ(loaded->strategies.size(), 2u);

  const auto& first = loaded->strategies[0];
  EXPECT_EQ(first.id, 1u);
  EXPECT_EQ(first.phase, StrategyPhase::Monitoring);
  EXPECT_EQ(first.schedule.entry_ms, at(11, 0));
  EXPECT_EQ(first.candidates.size(), 2u);
  ASSERT_TRUE(first.selected.has_value());
  EXPECT_EQ(first.selected->id, ce.id);
  ASSERT_TRUE(first.entry_price.has_value());
  EXPECT_DOUBLE_EQ(*first.entry_price, 48.75);
  EXPECT_EQ(first.lookback_states.size(), live.record().lookback_states.size());
  ASSERT_EQ(first.monitoring_states.size(), 1u);
  EXPECT_DOUBLE_EQ(first.monitoring_states[0].second.low, 40.00);

  const auto& second = loaded->strategies[1];
  EXPECT_EQ(second.id, 2u);
  EXPECT_EQ(second.phase, StrategyPhase::Pending);
  EXPECT_EQ(second.config.entry_minutes, 14 * 60);
  EXPECT_FALSE(second.selected.has_value());

  // The restored strategy reports the same P&L as the live one.
  breakout::Strategy restored(first);
  ASSERT_TRUE(restored.pnlPercent().has_value());
  EXPECT_DOUBLE_EQ(*restored.pnlPercent(), *live.pnlPercent());
}

TEST_F(CheckpointStoreTest, MissingFileLoadsNothing) {
  breakout::CheckpointStore store(storeConfig());
  EXPECT_FALSE(store.load().has_value());
}

TEST_F(CheckpointStoreTest, CorruptFileIsMovedAside) {
  {
    std::ofstream out(path);
    out << R"({"version":1,"next_id":4,"strategies":[{"id":)";
  }

  breakout::CheckpointStore store(storeConfig());
  EXPECT_FALSE(store.load().has_value());
  EXPECT_FALSE(fs::exists(path));
  EXPECT_TRUE(fs::exists(path + ".corrupt"));
}

TEST_F(CheckpointStoreTest, InvalidStrategyIsTreatedAsCorrupt) {
  {
    std::ofstream out(path);
    out << R"({"version":1,"next_id":2,"strategies":[{"id":1,"phase":"x"}]})";
  }

  breakout::CheckpointStore store(storeConfig());
  EXPECT_FALSE(store.load().has_value());
  EXPECT_TRUE(fs::exists(path + ".corrupt"));
}

// -----------------------------------------------------------------------------
// 2. Every attempt fails while the directory is missing; once it exists the
//    next save clears the degraded flag.
// -----------------------------------------------------------------------------
TEST_F(CheckpointStoreTest, FailedWritesDegradeUntilRecovery) {
  auto c = storeConfig();
  const fs::path missing = dir / "not-yet";
  c.path = (missing / "checkpoint.json").string();
  breakout::CheckpointStore store(c);

  breakout::Checkpoint checkpoint;
  checkpoint.written_at_ms = 1'000;

  EXPECT_FALSE(store.save(checkpoint));
  EXPECT_TRUE(store.degraded());
  EXPECT_EQ(store.failedAttempts(), 2u);
  EXPECT_EQ(store.lastSuccessMs(), 0);

  fs::create_directories(missing);
  checkpoint.written_at_ms = 2'000;
  EXPECT_TRUE(store.save(checkpoint));
  EXPECT_FALSE(store.degraded());
  EXPECT_EQ(store.lastSuccessMs(), 2'000);
  EXPECT_EQ(store.failedAttempts(), 2u);
}
