#pragma once

#include "breakout/domain/strategy_phase.hpp"
#include "breakout/domain/strategy_snapshot.hpp"

#include <cstdint>
#include <string>

namespace breakout {

// -----------------------------------------------------------------------------
// StrategySnapshotEvent
// -----------------------------------------------------------------------------
// Responsibility: Carries one strategy's projection to the snapshot feed.
// Why in architecture: The strategy manager pushes one of these whenever a
// strategy's observable state changes (tick applied, phase advanced, edit),
// so dashboards are pushed to rather than polling.
// -----------------------------------------------------------------------------
struct StrategySnapshotEvent {
  domain::StrategySnapshot snapshot;
};

// -----------------------------------------------------------------------------
// StrategyRemovedEvent
// -----------------------------------------------------------------------------
// Responsibility: Tells snapshot consumers a strategy left the live set
// (explicit removal or retention purge) so they can drop their row.
// -----------------------------------------------------------------------------
struct StrategyRemovedEvent {
  domain::StrategyId strategy_id{0};
  std::int64_t timestamp_ms{0};
};

// -----------------------------------------------------------------------------
// PhaseChangeEvent
// -----------------------------------------------------------------------------
// Responsibility: Records a strategy's lifecycle transition. Published on
// every forward transition, including the walk through intermediate phases
// when the phase timer catches up.
// -----------------------------------------------------------------------------
struct PhaseChangeEvent {
  domain::StrategyId strategy_id{0};
  domain::StrategyPhase from{domain::StrategyPhase::Pending};
  domain::StrategyPhase to{domain::StrategyPhase::Pending};
  domain::CompletionReason reason{domain::CompletionReason::None};
  std::int64_t timestamp_ms{0};
};

// -----------------------------------------------------------------------------
// EngineStatusEvent
// -----------------------------------------------------------------------------
// Responsibility: Engine-wide counters and the degraded-durability flag.
// Published by the engine when the checkpoint outcome changes and on every
// status tick of the phase timer.
// -----------------------------------------------------------------------------
struct EngineStatusEvent {
  domain::EngineStatus status;
};

// -----------------------------------------------------------------------------
// TickDroppedEvent
// -----------------------------------------------------------------------------
// Responsibility: Diagnostic for a tick evicted by ingest backpressure.
// Carries the counters after the drop so a consumer never has to sum them.
// -----------------------------------------------------------------------------
struct TickDroppedEvent {
  std::string instrument_id;
  std::uint64_t instrument_dropped{0};  // Drops so far for this instrument
  std::uint64_t total_dropped{0};       // Drops so far across the ingestor
  std::int64_t timestamp_ms{0};
};

}  // namespace breakout
