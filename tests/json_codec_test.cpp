// =============================================================================
// json_codec_test.cpp
// =============================================================================
// Unit tests for breakout::codec.
//
// Validates:
//   - Strategy config requests: defaults, "HH:MM" and integer entry times,
//     option filter names, ConfigError on bad input
//   - Partial updates only set the fields present
//   - Telemetry payloads carry a "type" and the wire names of enums
//   - Instruments and tracker state decode with their documented defaults
// =============================================================================

#include "breakout/codec/json_codec.hpp"
#include "breakout/domain/errors.hpp"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

using breakout::ConfigError;
using breakout::domain::IndexName;
using breakout::domain::OptionFilter;
using breakout::domain::OptionType;
using breakout::domain::StrategyConfig;
using breakout::domain::StrategyPhase;
using nlohmann::json;

namespace codec = breakout::codec;

TEST(JsonCodecConfigTest, ParsesFullRequest) {
  auto j = json::parse(R"({
    "index": "banknifty",
    "entry_time": "13:45",
    "lookback_minutes": 30,
    "target_premium": 120.5,
    "stop_loss_percent": 40,
    "option_type": "PE",
    "spot_price": 51234.5
  })");

  auto config = codec::configFromJson(j, StrategyConfig{});

  EXPECT_EQ(config.index, IndexName::BankNifty);
  EXPECT_EQ(config.entry_minutes, 13 * 60 + 45);
  EXPECT_EQ(config.lookback_minutes, 30);
  EXPECT_DOUBLE_EQ(config.target_premium, 120.5);
  EXPECT_DOUBLE_EQ(config.stop_loss_percent, 40.0);
  EXPECT_EQ(config.option_filter, OptionFilter::PutsOnly);
  ASSERT_TRUE(config.spot_price.has_value());
  EXPECT_DOUBLE_EQ(*config.spot_price, 51234.5);
}

TEST(JsonCodecConfigTest, MissingFieldsComeFromDefaults) {
  StrategyConfig defaults;
  defaults.lookback_minutes = 45;
  defaults.target_premium = 80.0;
  defaults.stop_loss_percent = 30.0;

  auto config = codec::configFromJson(
      json{{"index", "NIFTY"}, {"entry_time", 600}}, defaults);

  EXPECT_EQ(config.entry_minutes, 600);
  EXPECT_EQ(config.lookback_minutes, 45);
  EXPECT_DOUBLE_EQ(config.target_premium, 80.0);
  EXPECT_DOUBLE_EQ(config.stop_loss_percent, 30.0);
  EXPECT_EQ(config.option_filter, OptionFilter::Both);
  EXPECT_FALSE(config.spot_price.has_value());

  // spot_price: null means "resolve from the spot feed".
  auto nulled = codec::configFromJson(
      json{{"index", "NIFTY"}, {"spot_price", nullptr}}, defaults);
  EXPECT_FALSE(nulled.spot_price.has_value());
}

TEST(JsonCodecConfigTest, RejectsMalformedRequests) {
  const StrategyConfig defaults;
  EXPECT_THROW(codec::configFromJson(json::array(), defaults), ConfigError);
  EXPECT_THROW(codec::configFromJson(json::object(), defaults), ConfigError);
  EXPECT_THROW(codec::configFromJson(json{{"index", "NASDAQ"}}, defaults),
               ConfigError);
  EXPECT_THROW(codec::configFromJson(
                   json{{"index", "NIFTY"}, {"entry_time", "11h"}}, defaults),
               ConfigError);
  EXPECT_THROW(codec::configFromJson(
                   json{{"index", "NIFTY"}, {"option_type", "FUT"}}, defaults),
               ConfigError);
  EXPECT_THROW(
      codec::configFromJson(
          json{{"index", "NIFTY"}, {"target_premium", "fifty"}}, defaults),
      ConfigError);
}

TEST(JsonCodecConfigTest, EncodesWireNames) {
  StrategyConfig config;
  config.index = IndexName::FinNifty;
  config.entry_minutes = 9 * 60 + 5;
  config.option_filter = OptionFilter::CallsOnly;

  auto j = codec::toJson(config);

  EXPECT_EQ(j.at("index"), "FINNIFTY");
  EXPECT_EQ(j.at("entry_time"), "09:05");
  EXPECT_EQ(j.at("option_type"), "CE");
  EXPECT_TRUE(j.at("spot_price").is_null());
}

TEST(JsonCodecUpdateTest, OnlyPresentFieldsAreSet) {
  auto update = codec::updateFromJson(
      json{{"target_premium", 60.0}, {"entry_time", "12:15"}});

  ASSERT_TRUE(update.target_premium.has_value());
  EXPECT_DOUBLE_EQ(*update.target_premium, 60.0);
  ASSERT_TRUE(update.entry_minutes.has_value());
  EXPECT_EQ(*update.entry_minutes, 12 * 60 + 15);
  EXPECT_FALSE(update.lookback_minutes.has_value());
  EXPECT_FALSE(update.stop_loss_percent.has_value());

  EXPECT_THROW(codec::updateFromJson(json{{"lookback_minutes", "ten"}}),
               ConfigError);
}

TEST(JsonCodecInstrumentTest, DecodesAndRejectsBadType) {
  auto j = json::parse(R"({"id":"NSE_FO|52910","index":"NIFTY",
                           "expiry":"2026-10-27","strike":26200,"type":"PE"})");
  auto instrument = codec::instrumentFromJson(j);

  EXPECT_EQ(instrument.id, "NSE_FO|52910");
  EXPECT_EQ(instrument.key.index, IndexName::Nifty);
  EXPECT_EQ(instrument.key.expiry, (breakout::TradingDate{2026, 10, 27}));
  EXPECT_EQ(instrument.key.strike, 26200);
  EXPECT_EQ(instrument.key.type, OptionType::Put);
  EXPECT_EQ(codec::toJson(instrument), j);

  j["type"] = "FUT";
  EXPECT_THROW(codec::instrumentFromJson(j), ConfigError);
  j["type"] = "CE";
  j["expiry"] = "2026-13-01";
  EXPECT_THROW(codec::instrumentFromJson(j), ConfigError);
}

TEST(JsonCodecTrackerStateTest, OptionalFieldsDefault) {
  auto state = codec::trackerStateFromJson(
      json{{"low", 48.75}, {"high", 55.0}, {"current_price", 50.0},
           {"sample_count", 4}});

  EXPECT_DOUBLE_EQ(state.low, 48.75);
  EXPECT_DOUBLE_EQ(state.first_price, 48.75);
  EXPECT_EQ(state.sample_count, 4u);
  EXPECT_FALSE(state.frozen);

  EXPECT_THROW(codec::trackerStateFromJson(json{{"low", 1.0}}), ConfigError);
}

// -----------------------------------------------------------------------------
// Telemetry: every payload is a JSON object with a "type" discriminator.
// -----------------------------------------------------------------------------
TEST(JsonCodecTelemetryTest, PhaseChangeAndDrops) {
  breakout::PhaseChangeEvent change;
  change.strategy_id = 9;
  change.from = StrategyPhase::Lookback;
  change.to = StrategyPhase::Completed;
  change.reason = breakout::domain::CompletionReason::NoCandidates;
  change.timestamp_ms = 1'234;

  auto j = json::parse(codec::formatTelemetry(change, 330));
  EXPECT_EQ(j.at("type"), "phase_change");
  EXPECT_EQ(j.at("strategy_id"), 9);
  EXPECT_EQ(j.at("from"), "lookback");
  EXPECT_EQ(j.at("to"), "completed");
  EXPECT_EQ(j.at("reason"), "no_candidates");

  breakout::TickDroppedEvent drop;
  drop.instrument_id = "NSE_FO|1";
  drop.instrument_dropped = 2;
  drop.total_dropped = 5;
  auto d = json::parse(codec::formatTelemetry(drop, 330));
  EXPECT_EQ(d.at("type"), "tick_dropped");
  EXPECT_EQ(d.at("instrument_dropped"), 2);
  EXPECT_EQ(d.at("total_dropped"), 5);
}

TEST(JsonCodecTelemetryTest, NotificationWithoutDropIsNull) {
  breakout::NotificationEvent n;
  n.strategy_id = 3;
  n.instrument_id = "NSE_FO|NIFTY26OCT26200CE";
  n.kind = breakout::NotificationKind::StopLossHit;
  n.old_value = 48.75;
  n.new_value = 24.0;

  auto j = json::parse(codec::formatTelemetry(n, 330));
  EXPECT_EQ(j.at("type"), "notification");
  EXPECT_EQ(j.at("kind"), "STOP_LOSS_HIT");
  EXPECT_TRUE(j.at("drop_percent").is_null());
  EXPECT_DOUBLE_EQ(j.at("new_value").get<double>(), 24.0);
}

TEST(JsonCodecTelemetryTest, SnapshotIsNestedUnderStrategy) {
  breakout::StrategySnapshotEvent event;
  event.snapshot.id = 4;
  event.snapshot.phase = StrategyPhase::Lookback;
  event.snapshot.session_date = {2026, 10, 20};
  event.snapshot.lookback_start_ms = 0;

  auto j = json::parse(codec::formatTelemetry(event, 330));
  EXPECT_EQ(j.at("type"), "strategy_snapshot");
  const auto& s = j.at("strategy");
  EXPECT_EQ(s.at("id"), 4);
  EXPECT_EQ(s.at("phase"), "lookback");
  EXPECT_EQ(s.at("session_date"), "2026-10-20");
  EXPECT_EQ(s.at("lookback_start"), "05:30:00");
  EXPECT_TRUE(s.at("selected").is_null());
  EXPECT_TRUE(s.at("top_calls").is_array());
}

TEST(JsonCodecTelemetryTest, EngineStatusIsFlat) {
  breakout::EngineStatusEvent event;
  event.status.live_strategies = 2;
  event.status.durability_degraded = true;

  auto j = json::parse(codec::formatTelemetry(event, 0));
  EXPECT_EQ(j.at("type"), "engine_status");
  EXPECT_EQ(j.at("live_strategies"), 2);
  EXPECT_EQ(j.at("durability_degraded"), true);
}
