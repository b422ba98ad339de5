#pragma once

#include "oms/events/fill_recorded_event.hpp"
#include "oms/events/order_update_event.hpp"
#include "oms/events/position_update_event.hpp"
#include "oms/events/session_status_event.hpp"

#include <variant>

namespace oms {

// -----------------------------------------------------------------------------
// Event (type alias)
// -----------------------------------------------------------------------------
// The envelope carried by the EventBus. Every kind is plain data with value
// semantics; subscribers dispatch with std::get_if or the typed
// EventBus::subscribe<T>().
// -----------------------------------------------------------------------------
using Event = std::variant<
    OrderUpdateEvent,
    FillRecordedEvent,
    PositionUpdateEvent,
    SessionStatusEvent>;

}  // namespace oms
