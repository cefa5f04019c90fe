#pragma once

#include "breakout/domain/instrument.hpp"
#include "breakout/domain/strategy_config.hpp"
#include "breakout/domain/strategy_snapshot.hpp"
#include "breakout/domain/tracker_state.hpp"
#include "breakout/events/event.hpp"
#include "breakout/strategy/strategy.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace breakout {
namespace codec {

// -----------------------------------------------------------------------------
// JSON codec
// -----------------------------------------------------------------------------
//
// @brief  One JSON rendering of every domain value that leaves the process:
//         command requests and replies, PUB telemetry, and the checkpoint.
//
// @details
// Keeping the field names in one place means a snapshot read from the
// telemetry feed and the same strategy read back from `list_strategies`
// look identical.
//
// Conventions:
//   - times of day are "HH:MM" strings, dates "YYYY-MM-DD", instants epoch ms
//   - enums are their upper-case/lower-case wire names (NIFTY, CE, lookback,
//     stop_loss)
//   - absent optionals are JSON null
//
// The *FromJson functions throw ConfigError naming the offending field; the
// nlohmann exceptions never escape this module.
// -----------------------------------------------------------------------------

nlohmann::json toJson(const domain::Instrument& instrument);
domain::Instrument instrumentFromJson(const nlohmann::json& j);

// -------------------------------------------------------------------------
// StrategyConfig
// -------------------------------------------------------------------------
// Request form:
//   {"index":"NIFTY", "entry_time":"11:00", "lookback_minutes":60,
//    "target_premium":50, "stop_loss_percent":50, "option_type":"both",
//    "spot_price":26190.5}
// Only "index" is required; missing fields come from `defaults`.
// -------------------------------------------------------------------------
nlohmann::json toJson(const domain::StrategyConfig& config);
domain::StrategyConfig configFromJson(const nlohmann::json& j,
                                      const domain::StrategyConfig& defaults);

// Fields present in `j` become the set fields of the update.
domain::StrategyUpdate updateFromJson(const nlohmann::json& j);

nlohmann::json toJson(const domain::TrackerState& state);
domain::TrackerState trackerStateFromJson(const nlohmann::json& j);

nlohmann::json toJson(const domain::CandidateView& view);
nlohmann::json toJson(const domain::StrategySnapshot& snapshot,
                      int utc_offset_minutes);
nlohmann::json toJson(const domain::PreviewResult& preview);
nlohmann::json toJson(const domain::EngineStatus& status);
nlohmann::json toJson(const NotificationEvent& event);

// Checkpoint image of one strategy.
nlohmann::json toJson(const StrategyRecord& record);
StrategyRecord recordFromJson(const nlohmann::json& j);

// -------------------------------------------------------------------------
// formatTelemetry(event, utc_offset_minutes)
// -------------------------------------------------------------------------
// @return The PUB payload ({"type": ..., ...}) for every Event alternative.
// -------------------------------------------------------------------------
std::string formatTelemetry(const Event& event, int utc_offset_minutes);

}  // namespace codec
}  // namespace breakout
