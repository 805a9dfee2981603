#pragma once

#include "swapcore/events/retry_event.hpp"
#include "swapcore/events/risk_events.hpp"
#include "swapcore/events/trade_events.hpp"

#include <functional>
#include <variant>

namespace swapcore {

// -----------------------------------------------------------------------------
// Event (type alias)
// -----------------------------------------------------------------------------
// Responsibility: The single envelope carried by EventBus and the execution
// loop's queue. Request intake and terminal records travel alongside the
// observability events, so one PUB socket can stream all of them.
//
// TradeRequestEvent comes first so that Event stays default-constructible
// (TradeExecutionEvent is not: TradeExecution has no empty state).
// -----------------------------------------------------------------------------
using Event = std::variant<
    TradeRequestEvent,
    TradeExecutionEvent,
    RetryEvent,
    RiskBlockEvent,
    CircuitBreakerEvent>;

// -----------------------------------------------------------------------------
// EventSink
// -----------------------------------------------------------------------------
// How components that emit events, but should not depend on EventBus, hand
// them out. The wiring code binds it to a bus:
//
//   EventSink sink = [&bus](Event e) { bus.publish(e); };
//
// An empty sink is allowed and means "drop".
// -----------------------------------------------------------------------------
using EventSink = std::function<void(Event)>;

}  // namespace swapcore
