#pragma once

#include "ordersim/events/event_types.hpp"
#include "ordersim/events/fill_event.hpp"
#include "ordersim/events/order_rejected_event.hpp"
#include "ordersim/events/order_update_event.hpp"
#include "ordersim/events/position_update_event.hpp"
#include "ordersim/events/risk_violation_event.hpp"

#include <variant>

namespace ordersim {

// -----------------------------------------------------------------------------
// Event
// -----------------------------------------------------------------------------
// Envelope for everything a Backtester publishes on its EventBus. Observers
// (loggers, the risk kill switch, tests) subscribe to the alternatives they
// care about; the simulation core itself never reads the bus.
// -----------------------------------------------------------------------------
using Event = std::variant<
    OrderUpdateEvent,
    OrderRejectedEvent,
    FillEvent,
    PositionUpdateEvent,
    DataErrorEvent,
    BarProcessedEvent,
    RiskViolationEvent>;

}  // namespace ordersim
