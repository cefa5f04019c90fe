#pragma once

#include "breakout/domain/instrument.hpp"
#include "breakout/domain/strategy_config.hpp"
#include "breakout/domain/strategy_phase.hpp"
#include "breakout/domain/tracker_state.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace breakout {
namespace domain {

// -----------------------------------------------------------------------------
// CandidateView
// -----------------------------------------------------------------------------
// One lookback candidate as shown to a viewer: its tracked low / last price
// and how far that low sits from the strategy's target premium.
// -----------------------------------------------------------------------------
struct CandidateView {
  Instrument instrument;
  double low{0.0};
  double high{0.0};
  double ltp{0.0};
  std::uint64_t sample_count{0};
  double distance{0.0};  // abs(low - target_premium)
};

// -----------------------------------------------------------------------------
// StrategySnapshot
// -----------------------------------------------------------------------------
// Responsibility: Read-only projection of one live strategy, copied out
// under the strategy's lock and pushed to the snapshot feed on every state
// change. Owns no references into the Strategy; safe to hand to any thread.
// -----------------------------------------------------------------------------
struct StrategySnapshot {
  StrategyId id{0};
  StrategyConfig config;
  TradingDate session_date{};
  StrategyPhase phase{StrategyPhase::Pending};
  CompletionReason completion_reason{CompletionReason::None};
  std::int64_t created_at_ms{0};
  std::int64_t lookback_start_ms{0};
  std::int64_t entry_ms{0};
  std::int64_t market_close_ms{0};
  std::size_t candidate_count{0};

  // Top candidates per option type, nearest-to-target first.
  std::vector<CandidateView> top_calls;
  std::vector<CandidateView> top_puts;

  // Set once the strategy has entered MONITORING.
  std::optional<Instrument> selected;
  std::optional<double> entry_price;
  std::optional<double> current_price;
  std::optional<double> pnl_percent;
  std::optional<TrackerState> monitoring;

  std::int64_t updated_at_ms{0};
};

// -----------------------------------------------------------------------------
// EngineStatus
// -----------------------------------------------------------------------------
// Responsibility: Engine-wide counters and health flags for the dashboard.
// `durability_degraded` is true while checkpoint writes are failing.
// -----------------------------------------------------------------------------
struct EngineStatus {
  std::uint64_t ticks_ingested{0};
  std::uint64_t ticks_processed{0};
  std::uint64_t ticks_dropped{0};
  std::uint64_t clock_skew_rejections{0};
  std::uint64_t handler_errors{0};
  std::uint64_t publish_dropped{0};
  std::size_t live_strategies{0};
  bool durability_degraded{false};
  std::int64_t last_checkpoint_ms{0};
  std::int64_t as_of_ms{0};
};

// -----------------------------------------------------------------------------
// PreviewResult
// -----------------------------------------------------------------------------
// Responsibility: Hypothetical lookback outcome for a config that has not
// been created, computed over archived ticks. Read-only; produced by
// StrategyManager::preview().
// -----------------------------------------------------------------------------
struct PreviewResult {
  StrategyConfig config;
  std::int64_t lookback_start_ms{0};
  std::int64_t entry_ms{0};
  std::size_t candidate_count{0};
  std::size_t candidates_with_data{0};
  std::vector<CandidateView> top_calls;
  std::vector<CandidateView> top_puts;
  std::optional<Instrument> would_select;
};

}  // namespace domain
}  // namespace breakout
