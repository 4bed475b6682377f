#pragma once

#include "papertrade/events/event_types.hpp"

#include <variant>

namespace papertrade {

// Closed set of everything that travels on the EventBus. Subscribers use
// std::get_if (or EventBus::subscribe<T>) to pick the alternatives they
// care about.
using Event = std::variant<JobRunEvent, SignalEvent, OrderUpdateEvent,
                           TradeEvent, AccountSnapshotEvent>;

}  // namespace papertrade
