#pragma once

#include "breakout/alerts/notifier.hpp"
#include "breakout/domain/instrument.hpp"
#include "breakout/domain/market_hours.hpp"
#include "breakout/domain/strategy_config.hpp"
#include "breakout/ingest/tick_ingestor.hpp"
#include "breakout/instruments/instrument_resolver.hpp"
#include "breakout/persistence/checkpoint_store.hpp"
#include "breakout/strategy/strategy_manager.hpp"

#include <nlohmann/json_fwd.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace breakout {

// Per-index instrument conventions.
struct IndexSettings {
  int strike_step{0};          // 0 = exchange default
  int strikes_per_side{-1};    // -1 = Settings::strikes_per_side
  std::string spot_instrument; // e.g. "NSE_INDEX|Nifty 50"; empty = none
  std::string option_prefix;   // Trading-symbol prefix for generated series
};

// One generated expiry series: every strike in [min, max] at `step`, CE+PE.
struct SeriesSettings {
  domain::IndexName index{domain::IndexName::Nifty};
  TradingDate expiry{};
  int min_strike{0};
  int max_strike{0};
  int step{0};  // 0 = the index's strike step
};

// -----------------------------------------------------------------------------
// Settings
// -----------------------------------------------------------------------------
//
// @brief  Engine configuration, loaded from one JSON file.
//
// @details
// Every field has a default, so `{}` is a valid (offline, no network)
// configuration and a file only names what it changes:
//
//   {
//     "market":      {"utc_offset_minutes":330, "open":"09:15",
//                     "close":"15:30", "clock_skew_tolerance_ms":60000},
//     "indices":     {"NIFTY": {"strike_step":50, "strikes_per_side":15,
//                               "spot_instrument":"NSE_INDEX|Nifty 50",
//                               "option_prefix":"NIFTY"}},
//     "catalog":     {"contracts_file":"contracts.json",
//                     "series":[{"index":"NIFTY","expiry":"2026-10-20",
//                                "min_strike":24000,"max_strike":28000}]},
//     "ingest":      {"partitions":4, "queue_capacity":10000},
//     "notifier":    {"near_threshold":15, "min_drop_percent":0,
//                     "publish_queue_capacity":4096},
//     "strategy":    {"default_stop_loss_percent":50,
//                     "phase_interval_ms":1000, "retention_minutes":1440,
//                     "entry_price_source":"last_price",
//                     "top_candidates":3},
//     "persistence": {"checkpoint_path":"...", "checkpoint_interval_ms":5000,
//                     "max_attempts":3, "initial_backoff_ms":100,
//                     "tick_archive_path":"...", "tick_archive_buffer":100,
//                     "maintenance_interval_ms":60000},
//     "network":     {"market_data":"tcp://127.0.0.1:5555",
//                     "commands":"tcp://127.0.0.1:5556",
//                     "telemetry":"tcp://127.0.0.1:5557",
//                     "simulation_clock":false},
//     "strategies":  [{"index":"NIFTY","entry_time":"11:00", ...}]
//   }
//
// An empty path or endpoint disables that part (no checkpoint, no archive,
// no socket).
//
// Errors: fromJson()/loadFile() throw ConfigError for an unreadable file,
// malformed JSON, a wrong field type or an out-of-range value.
// -----------------------------------------------------------------------------
struct Settings {
  // market
  domain::MarketHours market;
  std::int64_t clock_skew_tolerance_ms{60'000};

  // indices / catalog
  int strikes_per_side{15};
  std::map<domain::IndexName, IndexSettings> indices;
  std::string contracts_file;
  std::vector<SeriesSettings> series;

  // ingest / notifier
  TickIngestorConfig ingest;
  NotifierConfig notifier;
  std::size_t publish_queue_capacity{4096};

  // strategy
  domain::StrategyConfig strategy_defaults;
  std::chrono::milliseconds phase_interval{1000};
  int retention_minutes{24 * 60};
  domain::EntryPriceSource entry_price_source{
      domain::EntryPriceSource::LastPrice};
  std::size_t top_candidates{3};

  // persistence
  CheckpointConfig checkpoint{"", 3, std::chrono::milliseconds{100}};
  std::chrono::milliseconds checkpoint_interval{5000};
  std::string tick_archive_path;
  std::size_t tick_archive_buffer{100};
  std::chrono::milliseconds maintenance_interval{60'000};

  // network
  std::string market_data_endpoint;
  std::string command_endpoint;
  std::string telemetry_endpoint;
  bool simulation_clock{false};

  // Created at startup, after checkpoint restore.
  std::vector<domain::StrategyConfig> strategies;

  static Settings fromJson(const nlohmann::json& doc);
  static Settings loadFile(const std::string& path);

  // Views consumed by the components.
  ResolverConfig resolverConfig() const;
  StrategyManagerConfig managerConfig() const;
  std::string optionPrefix(domain::IndexName index) const;
};

}  // namespace breakout
