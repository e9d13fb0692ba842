#pragma once

#include "riskguard/events/event_types.hpp"

#include <variant>

namespace riskguard {

// -----------------------------------------------------------------------------
// Event
// -----------------------------------------------------------------------------
// Closed set of event types carried by ThreadSafeQueue<Event> and EventBus.
// Subscribers use EventBus::subscribe<AlertEvent>(...) or std::visit. Adding
// a type means adding it here; the compiler then points at every visitor.
// -----------------------------------------------------------------------------
using Event = std::variant<AlertEvent, TradeExecutedEvent,
                           RebalanceCompletedEvent>;

}  // namespace riskguard
