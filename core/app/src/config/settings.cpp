#include "breakout/config/settings.hpp"
#include "breakout/codec/json_codec.hpp"
#include "breakout/domain/errors.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>

namespace breakout {

using nlohmann::json;

namespace {

int timeOfDay(const json& section, const char* key, int fallback) {
  if (!section.contains(key)) {
    return fallback;
  }
  auto minutes = parse_hhmm(section.at(key).get<std::string>());
  if (!minutes) {
    throw ConfigError(std::string("market.") + key + " must be HH:MM");
  }
  return *minutes;
}

std::chrono::milliseconds millis(const json& section, const char* key,
                                 std::chrono::milliseconds fallback) {
  const auto value = section.value(key, static_cast<std::int64_t>(
                                            fallback.count()));
  if (value <= 0) {
    throw ConfigError(std::string(key) + " must be positive");
  }
  return std::chrono::milliseconds(value);
}

domain::IndexName indexField(const std::string& text) {
  auto index = domain::parseIndex(text);
  if (!index) {
    throw ConfigError("unknown index '" + text + "'");
  }
  return *index;
}

const json& section(const json& doc, const char* name) {
  static const json kEmpty = json::object();
  auto it = doc.find(name);
  if (it == doc.end() || it->is_null()) {
    return kEmpty;
  }
  if (!it->is_object()) {
    throw ConfigError(std::string("section '") + name +
                      "' must be a JSON object");
  }
  return *it;
}

void parseMarket(const json& m, Settings& s) {
  s.market.utc_offset_minutes =
      m.value("utc_offset_minutes", s.market.utc_offset_minutes);
  s.market.open_minutes = timeOfDay(m, "open", s.market.open_minutes);
  s.market.close_minutes = timeOfDay(m, "close", s.market.close_minutes);
  s.clock_skew_tolerance_ms =
      m.value("clock_skew_tolerance_ms", s.clock_skew_tolerance_ms);
  if (s.market.open_minutes >= s.market.close_minutes) {
    throw ConfigError("market.open must be before market.close");
  }
  if (s.clock_skew_tolerance_ms < 0) {
    throw ConfigError("market.clock_skew_tolerance_ms must be >= 0");
  }
}

void parseIndices(const json& indices, Settings& s) {
  for (auto it = indices.begin(); it != indices.end(); ++it) {
    if (it.key() == "strikes_per_side") {
      s.strikes_per_side = it.value().get<int>();
      continue;
    }
    IndexSettings idx;
    const auto& v = it.value();
    idx.strike_step = v.value("strike_step", 0);
    idx.strikes_per_side = v.value("strikes_per_side", -1);
    idx.spot_instrument = v.value("spot_instrument", std::string());
    idx.option_prefix = v.value("option_prefix", std::string());
    if (idx.strike_step < 0) {
      throw ConfigError("indices." + it.key() + ".strike_step must be >= 0");
    }
    s.indices[indexField(it.key())] = idx;
  }
  if (s.strikes_per_side < 0) {
    throw ConfigError("indices.strikes_per_side must be >= 0");
  }
}

void parseCatalog(const json& c, Settings& s) {
  s.contracts_file = c.value("contracts_file", s.contracts_file);
  for (const auto& item : c.value("series", json::array())) {
    SeriesSettings series;
    series.index = indexField(item.at("index").get<std::string>());
    auto expiry = parse_date(item.at("expiry").get<std::string>());
    if (!expiry) {
      throw ConfigError("catalog.series expiry must be YYYY-MM-DD");
    }
    series.expiry = *expiry;
    series.min_strike = item.at("min_strike").get<int>();
    series.max_strike = item.at("max_strike").get<int>();
    series.step = item.value("step", 0);
    s.series.push_back(series);
  }
}

void parseIngestAndNotifier(const json& ingest, const json& notifier,
                            Settings& s) {
  s.ingest.partitions = ingest.value("partitions", s.ingest.partitions);
  s.ingest.queue_capacity =
      ingest.value("queue_capacity", s.ingest.queue_capacity);
  if (s.ingest.partitions == 0 || s.ingest.queue_capacity == 0) {
    throw ConfigError("ingest.partitions and ingest.queue_capacity must be > 0");
  }

  s.notifier.near_threshold =
      notifier.value("near_threshold", s.notifier.near_threshold);
  s.notifier.min_drop_percent =
      notifier.value("min_drop_percent", s.notifier.min_drop_percent);
  s.publish_queue_capacity =
      notifier.value("publish_queue_capacity", s.publish_queue_capacity);
  if (s.notifier.near_threshold < 0.0 || s.notifier.min_drop_percent < 0.0) {
    throw ConfigError("notifier thresholds must be >= 0");
  }
}

void parseStrategy(const json& st, Settings& s) {
  s.strategy_defaults.stop_loss_percent = st.value(
      "default_stop_loss_percent", s.strategy_defaults.stop_loss_percent);
  s.strategy_defaults.target_premium =
      st.value("default_target_premium", s.strategy_defaults.target_premium);
  s.strategy_defaults.lookback_minutes = st.value(
      "default_lookback_minutes", s.strategy_defaults.lookback_minutes);
  s.phase_interval = millis(st, "phase_interval_ms", s.phase_interval);
  s.retention_minutes = st.value("retention_minutes", s.retention_minutes);
  s.top_candidates = st.value("top_candidates", s.top_candidates);
  if (st.contains("entry_price_source")) {
    auto source = domain::parseEntryPriceSource(
        st.at("entry_price_source").get<std::string>());
    if (!source) {
      throw ConfigError(
          "strategy.entry_price_source must be last_price or lookback_low");
    }
    s.entry_price_source = *source;
  }
  if (s.retention_minutes < 0) {
    throw ConfigError("strategy.retention_minutes must be >= 0");
  }
}

void parsePersistence(const json& p, Settings& s) {
  s.checkpoint.path = p.value("checkpoint_path", s.checkpoint.path);
  s.checkpoint.max_attempts =
      p.value("max_attempts", s.checkpoint.max_attempts);
  s.checkpoint.initial_backoff =
      millis(p, "initial_backoff_ms", s.checkpoint.initial_backoff);
  s.checkpoint_interval =
      millis(p, "checkpoint_interval_ms", s.checkpoint_interval);
  s.tick_archive_path = p.value("tick_archive_path", s.tick_archive_path);
  s.tick_archive_buffer =
      p.value("tick_archive_buffer", s.tick_archive_buffer);
  s.maintenance_interval =
      millis(p, "maintenance_interval_ms", s.maintenance_interval);
}

void parseNetwork(const json& n, Settings& s) {
  s.market_data_endpoint = n.value("market_data", s.market_data_endpoint);
  s.command_endpoint = n.value("commands", s.command_endpoint);
  s.telemetry_endpoint = n.value("telemetry", s.telemetry_endpoint);
  s.simulation_clock = n.value("simulation_clock", s.simulation_clock);
}

}  // namespace

// -----------------------------------------------------------------------------
// fromJson()
// -----------------------------------------------------------------------------
Settings Settings::fromJson(const json& doc) {
  if (!doc.is_object()) {
    throw ConfigError("settings root must be a JSON object");
  }
  Settings s;
  try {
    parseMarket(section(doc, "market"), s);
    parseIndices(section(doc, "indices"), s);
    parseCatalog(section(doc, "catalog"), s);
    parseIngestAndNotifier(section(doc, "ingest"), section(doc, "notifier"),
                           s);
    parseStrategy(section(doc, "strategy"), s);
    parsePersistence(section(doc, "persistence"), s);
    parseNetwork(section(doc, "network"), s);

    for (const auto& item : doc.value("strategies", json::array())) {
      s.strategies.push_back(codec::configFromJson(item, s.strategy_defaults));
    }
  } catch (const json::exception& e) {
    throw ConfigError(std::string("invalid settings: ") + e.what());
  }
  return s;
}

// -----------------------------------------------------------------------------
// loadFile()
// -----------------------------------------------------------------------------
Settings Settings::loadFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("cannot open settings file " + path);
  }
  json doc;
  try {
    doc = json::parse(in);
  } catch (const json::parse_error& e) {
    throw ConfigError("settings file " + path + " is not valid JSON: " +
                      e.what());
  }
  auto settings = fromJson(doc);
  std::cout << "[Settings] loaded " << path << "\n";
  return settings;
}

// -----------------------------------------------------------------------------
// Component views
// -----------------------------------------------------------------------------
ResolverConfig Settings::resolverConfig() const {
  ResolverConfig rc;
  rc.strikes_per_side = strikes_per_side;
  rc.utc_offset_minutes = market.utc_offset_minutes;
  rc.market_close_minutes = market.close_minutes;
  for (const auto& [index, idx] : indices) {
    if (idx.strike_step > 0) {
      rc.strike_steps[index] = idx.strike_step;
    }
    if (idx.strikes_per_side >= 0) {
      rc.strikes_per_index[index] = idx.strikes_per_side;
    }
  }
  return rc;
}

StrategyManagerConfig Settings::managerConfig() const {
  StrategyManagerConfig mc;
  mc.market = market;
  mc.clock_skew_tolerance_ms = clock_skew_tolerance_ms;
  mc.entry_price_source = entry_price_source;
  mc.retention_minutes = retention_minutes;
  mc.top_candidates = top_candidates;
  for (const auto& [index, idx] : indices) {
    if (!idx.spot_instrument.empty()) {
      mc.spot_instruments[index] = idx.spot_instrument;
    }
  }
  return mc;
}

std::string Settings::optionPrefix(domain::IndexName index) const {
  auto it = indices.find(index);
  if (it != indices.end() && !it->second.option_prefix.empty()) {
    return it->second.option_prefix;
  }
  return domain::indexToString(index);
}

}  // namespace breakout
