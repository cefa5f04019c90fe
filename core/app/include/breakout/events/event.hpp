#pragma once

#include "breakout/events/event_types.hpp"
#include "breakout/events/notification_event.hpp"

#include <variant>

namespace breakout {

// -----------------------------------------------------------------------------
// Event (type alias)
// -----------------------------------------------------------------------------
// Responsibility: The single envelope for everything the tracker publishes
// to the outside: notifications, snapshots and diagnostics. One variant lets
// one publish loop and one EventBus carry every kind without void* or a
// base class.
//
// Ticks are deliberately NOT an Event: they travel through the TickIngestor's
// partitioned queues, which have per-instrument ordering and eviction rules
// the generic publish loop does not.
// -----------------------------------------------------------------------------
using Event = std::variant<
    NotificationEvent,
    StrategySnapshotEvent,
    StrategyRemovedEvent,
    PhaseChangeEvent,
    EngineStatusEvent,
    TickDroppedEvent>;

}  // namespace breakout
