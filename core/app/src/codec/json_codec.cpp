#include "breakout/codec/json_codec.hpp"
#include "breakout/domain/errors.hpp"
#include "breakout/time/time_utils.hpp"

#include <type_traits>
#include <utility>
#include <variant>

namespace breakout {
namespace codec {

using nlohmann::json;

namespace {

template <typename T>
json optionalJson(const std::optional<T>& value) {
  return value ? json(*value) : json(nullptr);
}

std::optional<double> optionalDouble(const json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return std::nullopt;
  }
  return it->get<double>();
}

TradingDate dateField(const json& j, const char* key) {
  auto date = parse_date(j.at(key).get<std::string>());
  if (!date) {
    throw ConfigError(std::string("invalid date in '") + key + "'");
  }
  return *date;
}

json windowJson(const domain::TrackingWindow& w) {
  return {{"start_ms", w.start_ms},
          {"end_ms", w.end_ms},
          {"granularity_ms", w.granularity_ms}};
}

domain::TrackingWindow windowFromJson(const json& j) {
  domain::TrackingWindow w;
  w.start_ms = j.at("start_ms").get<std::int64_t>();
  w.end_ms = j.at("end_ms").get<std::int64_t>();
  w.granularity_ms = j.value("granularity_ms", std::int64_t{1000});
  return w;
}

json keyJson(const domain::InstrumentKey& key) {
  return {{"index", domain::indexToString(key.index)},
          {"expiry", format_date(key.expiry)},
          {"strike", key.strike},
          {"type", domain::optionTypeToString(key.type)}};
}

domain::InstrumentKey keyFromJson(const json& j) {
  domain::InstrumentKey key;
  auto index = domain::parseIndex(j.at("index").get<std::string>());
  auto type = domain::parseOptionType(j.at("type").get<std::string>());
  if (!index || !type) {
    throw ConfigError("invalid index or option type in instrument key");
  }
  key.index = *index;
  key.type = *type;
  key.expiry = dateField(j, "expiry");
  key.strike = j.at("strike").get<int>();
  return key;
}

json statesJson(
    const std::vector<std::pair<TrackerKey, domain::TrackerState>>& states) {
  json out = json::array();
  for (const auto& [key, state] : states) {
    out.push_back({{"instrument", keyJson(key.instrument)},
                   {"window", windowJson(key.window)},
                   {"state", toJson(state)}});
  }
  return out;
}

std::vector<std::pair<TrackerKey, domain::TrackerState>> statesFromJson(
    const json& j) {
  std::vector<std::pair<TrackerKey, domain::TrackerState>> out;
  for (const auto& item : j) {
    TrackerKey key{keyFromJson(item.at("instrument")),
                   windowFromJson(item.at("window"))};
    out.emplace_back(key, trackerStateFromJson(item.at("state")));
  }
  return out;
}

int minutesField(const json& j, const char* key) {
  const auto& v = j.at(key);
  if (v.is_number_integer()) {
    return v.get<int>();
  }
  auto minutes = parse_hhmm(v.get<std::string>());
  if (!minutes) {
    throw ConfigError(std::string("'") + key + "' must be HH:MM");
  }
  return *minutes;
}

// Runs `fn`, turning nlohmann's type/key errors into ConfigError.
template <typename Fn>
auto guarded(const char* what, Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const json::exception& e) {
    throw ConfigError(std::string("malformed ") + what + ": " + e.what());
  }
}

}  // namespace

// -----------------------------------------------------------------------------
// Instrument
// -----------------------------------------------------------------------------
json toJson(const domain::Instrument& instrument) {
  json j = keyJson(instrument.key);
  j["id"] = instrument.id;
  return j;
}

domain::Instrument instrumentFromJson(const json& j) {
  return guarded("instrument", [&] {
    domain::Instrument instrument;
    instrument.id = j.at("id").get<std::string>();
    instrument.key = keyFromJson(j);
    return instrument;
  });
}

// -----------------------------------------------------------------------------
// StrategyConfig / StrategyUpdate
// -----------------------------------------------------------------------------
json toJson(const domain::StrategyConfig& config) {
  return {{"index", domain::indexToString(config.index)},
          {"entry_time", format_hhmm(config.entry_minutes)},
          {"lookback_minutes", config.lookback_minutes},
          {"target_premium", config.target_premium},
          {"stop_loss_percent", config.stop_loss_percent},
          {"option_type", domain::optionFilterToString(config.option_filter)},
          {"spot_price", optionalJson(config.spot_price)}};
}

domain::StrategyConfig configFromJson(const json& j,
                                      const domain::StrategyConfig& defaults) {
  return guarded("strategy config", [&] {
    if (!j.is_object()) {
      throw ConfigError("strategy config must be a JSON object");
    }
    domain::StrategyConfig config = defaults;

    auto index = domain::parseIndex(j.at("index").get<std::string>());
    if (!index) {
      throw ConfigError("unknown index '" + j.at("index").get<std::string>() +
                        "'");
    }
    config.index = *index;

    if (j.contains("entry_time")) {
      config.entry_minutes = minutesField(j, "entry_time");
    }
    config.lookback_minutes =
        j.value("lookback_minutes", config.lookback_minutes);
    config.target_premium = j.value("target_premium", config.target_premium);
    config.stop_loss_percent =
        j.value("stop_loss_percent", config.stop_loss_percent);

    if (j.contains("option_type")) {
      auto filter =
          domain::parseOptionFilter(j.at("option_type").get<std::string>());
      if (!filter) {
        throw ConfigError("option_type must be CE, PE or both");
      }
      config.option_filter = *filter;
    }
    if (auto spot = optionalDouble(j, "spot_price")) {
      config.spot_price = spot;
    }
    return config;
  });
}

domain::StrategyUpdate updateFromJson(const json& j) {
  return guarded("strategy update", [&] {
    domain::StrategyUpdate update;
    if (j.contains("entry_time")) {
      update.entry_minutes = minutesField(j, "entry_time");
    }
    if (j.contains("lookback_minutes")) {
      update.lookback_minutes = j.at("lookback_minutes").get<int>();
    }
    update.target_premium = optionalDouble(j, "target_premium");
    update.stop_loss_percent = optionalDouble(j, "stop_loss_percent");
    return update;
  });
}

// -----------------------------------------------------------------------------
// TrackerState
// -----------------------------------------------------------------------------
json toJson(const domain::TrackerState& state) {
  return {{"low", state.low},
          {"high", state.high},
          {"first_price", state.first_price},
          {"current_price", state.current_price},
          {"sample_count", state.sample_count},
          {"first_update_ms", state.first_update_ms},
          {"last_update_ms", state.last_update_ms},
          {"frozen", state.frozen}};
}

domain::TrackerState trackerStateFromJson(const json& j) {
  return guarded("tracker state", [&] {
    domain::TrackerState state;
    state.low = j.at("low").get<double>();
    state.high = j.at("high").get<double>();
    state.first_price = j.value("first_price", state.low);
    state.current_price = j.at("current_price").get<double>();
    state.sample_count = j.at("sample_count").get<std::uint64_t>();
    state.first_update_ms = j.value("first_update_ms", std::int64_t{0});
    state.last_update_ms = j.value("last_update_ms", std::int64_t{0});
    state.frozen = j.value("frozen", false);
    return state;
  });
}

// -----------------------------------------------------------------------------
// Snapshot / preview / status / notification
// -----------------------------------------------------------------------------
json toJson(const domain::CandidateView& view) {
  json j = toJson(view.instrument);
  j["low"] = view.low;
  j["high"] = view.high;
  j["ltp"] = view.ltp;
  j["samples"] = view.sample_count;
  j["distance"] = view.distance;
  return j;
}

namespace {

json candidatesJson(const std::vector<domain::CandidateView>& views) {
  json out = json::array();
  for (const auto& v : views) {
    out.push_back(toJson(v));
  }
  return out;
}

}  // namespace

json toJson(const domain::StrategySnapshot& s, int utc_offset_minutes) {
  json j;
  j["id"] = s.id;
  j["config"] = toJson(s.config);
  j["session_date"] = format_date(s.session_date);
  j["phase"] = domain::phaseToString(s.phase);
  j["completion_reason"] = domain::completionReasonToString(s.completion_reason);
  j["created_at_ms"] = s.created_at_ms;
  j["lookback_start"] = format_local_time(s.lookback_start_ms,
                                          utc_offset_minutes);
  j["lookback_start_ms"] = s.lookback_start_ms;
  j["entry_ms"] = s.entry_ms;
  j["market_close_ms"] = s.market_close_ms;
  j["candidate_count"] = s.candidate_count;
  j["top_calls"] = candidatesJson(s.top_calls);
  j["top_puts"] = candidatesJson(s.top_puts);
  j["selected"] = s.selected ? toJson(*s.selected) : json(nullptr);
  j["entry_price"] = optionalJson(s.entry_price);
  j["current_price"] = optionalJson(s.current_price);
  j["pnl_percent"] = optionalJson(s.pnl_percent);
  j["monitoring"] = s.monitoring ? toJson(*s.monitoring) : json(nullptr);
  j["updated_at_ms"] = s.updated_at_ms;
  return j;
}

json toJson(const domain::PreviewResult& p) {
  json j;
  j["config"] = toJson(p.config);
  j["lookback_start_ms"] = p.lookback_start_ms;
  j["entry_ms"] = p.entry_ms;
  j["candidate_count"] = p.candidate_count;
  j["candidates_with_data"] = p.candidates_with_data;
  j["top_calls"] = candidatesJson(p.top_calls);
  j["top_puts"] = candidatesJson(p.top_puts);
  j["would_select"] = p.would_select ? toJson(*p.would_select) : json(nullptr);
  return j;
}

json toJson(const domain::EngineStatus& s) {
  return {{"ticks_ingested", s.ticks_ingested},
          {"ticks_processed", s.ticks_processed},
          {"ticks_dropped", s.ticks_dropped},
          {"clock_skew_rejections", s.clock_skew_rejections},
          {"handler_errors", s.handler_errors},
          {"publish_dropped", s.publish_dropped},
          {"live_strategies", s.live_strategies},
          {"durability_degraded", s.durability_degraded},
          {"last_checkpoint_ms", s.last_checkpoint_ms},
          {"as_of_ms", s.as_of_ms}};
}

json toJson(const NotificationEvent& n) {
  return {{"strategy_id", n.strategy_id},
          {"instrument_id", n.instrument_id},
          {"kind", notificationKindToString(n.kind)},
          {"old_value", n.old_value},
          {"new_value", n.new_value},
          {"drop_percent", optionalJson(n.drop_percent)},
          {"near_target", n.near_target},
          {"timestamp_ms", n.timestamp_ms}};
}

// -----------------------------------------------------------------------------
// StrategyRecord (checkpoint)
// -----------------------------------------------------------------------------
json toJson(const StrategyRecord& r) {
  json j;
  j["id"] = r.id;
  j["config"] = toJson(r.config);
  j["session_date"] = format_date(r.schedule.session_date);
  j["lookback_start_ms"] = r.schedule.lookback_start_ms;
  j["entry_ms"] = r.schedule.entry_ms;
  j["market_close_ms"] = r.schedule.market_close_ms;
  j["created_at_ms"] = r.created_at_ms;
  j["updated_at_ms"] = r.updated_at_ms;
  j["completed_at_ms"] = r.completed_at_ms;
  j["phase"] = domain::phaseToString(r.phase);
  j["completion_reason"] = domain::completionReasonToString(r.completion_reason);
  j["atm_strike"] = r.atm_strike;

  json candidates = json::array();
  for (const auto& c : r.candidates) {
    candidates.push_back(toJson(c));
  }
  j["candidates"] = std::move(candidates);
  j["selected"] = r.selected ? toJson(*r.selected) : json(nullptr);
  j["entry_price"] = optionalJson(r.entry_price);
  j["entry_low"] = optionalJson(r.entry_low);
  j["current_price"] = optionalJson(r.current_price);
  j["lookback_states"] = statesJson(r.lookback_states);
  j["monitoring_states"] = statesJson(r.monitoring_states);
  return j;
}

StrategyRecord recordFromJson(const json& j) {
  return guarded("checkpoint strategy", [&] {
    StrategyRecord r;
    r.id = j.at("id").get<domain::StrategyId>();
    r.config = configFromJson(j.at("config"), domain::StrategyConfig{});
    r.schedule.session_date = dateField(j, "session_date");
    r.schedule.lookback_start_ms = j.at("lookback_start_ms").get<std::int64_t>();
    r.schedule.entry_ms = j.at("entry_ms").get<std::int64_t>();
    r.schedule.market_close_ms = j.at("market_close_ms").get<std::int64_t>();
    r.created_at_ms = j.value("created_at_ms", std::int64_t{0});
    r.updated_at_ms = j.value("updated_at_ms", r.created_at_ms);
    r.completed_at_ms = j.value("completed_at_ms", std::int64_t{0});

    auto phase = domain::parsePhase(j.at("phase").get<std::string>());
    auto reason = domain::parseCompletionReason(
        j.value("completion_reason", std::string("none")));
    if (!phase || !reason) {
      throw ConfigError("invalid phase or completion reason for strategy " +
                        std::to_string(r.id));
    }
    r.phase = *phase;
    r.completion_reason = *reason;
    r.atm_strike = j.value("atm_strike", 0);

    for (const auto& c : j.at("candidates")) {
      r.candidates.push_back(instrumentFromJson(c));
    }
    if (j.contains("selected") && !j.at("selected").is_null()) {
      r.selected = instrumentFromJson(j.at("selected"));
    }
    r.entry_price = optionalDouble(j, "entry_price");
    r.entry_low = optionalDouble(j, "entry_low");
    r.current_price = optionalDouble(j, "current_price");
    r.lookback_states = statesFromJson(j.value("lookback_states", json::array()));
    r.monitoring_states =
        statesFromJson(j.value("monitoring_states", json::array()));
    return r;
  });
}

// -----------------------------------------------------------------------------
// formatTelemetry(): dispatch Event variant to its PUB payload
// -----------------------------------------------------------------------------
std::string formatTelemetry(const Event& event, int utc_offset_minutes) {
  return std::visit(
      [utc_offset_minutes](const auto& e) -> std::string {
        using T = std::decay_t<decltype(e)>;
        json j;
        if constexpr (std::is_same_v<T, NotificationEvent>) {
          j = toJson(e);
          j["type"] = "notification";
        } else if constexpr (std::is_same_v<T, StrategySnapshotEvent>) {
          j["type"] = "strategy_snapshot";
          j["strategy"] = toJson(e.snapshot, utc_offset_minutes);
        } else if constexpr (std::is_same_v<T, StrategyRemovedEvent>) {
          j["type"] = "strategy_removed";
          j["strategy_id"] = e.strategy_id;
          j["timestamp_ms"] = e.timestamp_ms;
        } else if constexpr (std::is_same_v<T, PhaseChangeEvent>) {
          j["type"] = "phase_change";
          j["strategy_id"] = e.strategy_id;
          j["from"] = domain::phaseToString(e.from);
          j["to"] = domain::phaseToString(e.to);
          j["reason"] = domain::completionReasonToString(e.reason);
          j["timestamp_ms"] = e.timestamp_ms;
        } else if constexpr (std::is_same_v<T, EngineStatusEvent>) {
          j = toJson(e.status);
          j["type"] = "engine_status";
        } else if constexpr (std::is_same_v<T, TickDroppedEvent>) {
          j["type"] = "tick_dropped";
          j["instrument_id"] = e.instrument_id;
          j["instrument_dropped"] = e.instrument_dropped;
          j["total_dropped"] = e.total_dropped;
          j["timestamp_ms"] = e.timestamp_ms;
        }
        return j.dump();
      },
      event);
}

}  // namespace codec
}  // namespace breakout
