#pragma once

#include "event_types.hpp"
#include "order_filled_event.hpp"
#include "position_closed_event.hpp"
#include "risk_violation_event.hpp"
#include <variant>

namespace optexec {

// -----------------------------------------------------------------------------
// Event
// -----------------------------------------------------------------------------
// Closed set of messages carried by the EventBus and the EventLoopThread
// queues. Adding an alternative requires no change to the bus; typed
// subscribers only see their own alternative.
// -----------------------------------------------------------------------------
using Event = std::variant<
    MarketDataEvent,
    CandleEvent,
    SignalEvent,
    OrderFilledEvent,
    PositionClosedEvent,
    RiskViolationEvent>;

}  // namespace optexec
