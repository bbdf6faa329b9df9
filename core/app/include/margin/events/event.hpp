#pragma once

#include "event_types.hpp"
#include "liquidation_event.hpp"
#include "position_update_event.hpp"
#include "risk_alert_event.hpp"
#include <variant>

namespace margin {

// -----------------------------------------------------------------------------
// Event (type alias)
// -----------------------------------------------------------------------------
// Responsibility: The single "envelope" type for all events in the engine.
// One EventBus carries every event kind; subscribers dispatch with
// std::get_if or the typed subscribe<T>().
//
// Adding a new event type means adding it here and updating the visit and
// get_if sites (telemetry formatting in CommandCodec).
// -----------------------------------------------------------------------------
using Event = std::variant<
    PriceTickEvent,
    PositionUpdateEvent,
    LiquidationEvent,
    RiskAlertEvent,
    LiquidationWarningEvent>;

}  // namespace margin
