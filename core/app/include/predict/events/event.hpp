#pragma once

#include "predict/events/event_types.hpp"

#include <variant>

namespace predict {

// -----------------------------------------------------------------------------
// Event
// -----------------------------------------------------------------------------
// The single envelope carried by the EventBus and the IPC telemetry queue.
// Adding a payload means adding it here and to every std::visit site
// (IpcServer::formatTelemetry).
// -----------------------------------------------------------------------------
using Event = std::variant<
    SignalEvaluatedEvent,
    BetPlacedEvent,
    PositionUpdateEvent,
    ResolutionEvent,
    RiskRejectEvent,
    RiskViolationEvent,
    TickEvent>;

}  // namespace predict
