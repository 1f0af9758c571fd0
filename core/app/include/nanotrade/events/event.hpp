#pragma once

#include "nanotrade/events/event_types.hpp"

#include <variant>

namespace nanotrade {

// -----------------------------------------------------------------------------
// Event (type alias)
// -----------------------------------------------------------------------------
// The single envelope carried by EventBus and the tick loop's queue. A
// closed std::variant: adding an alternative makes every std::visit site
// that must handle it fail to compile until it does.
// -----------------------------------------------------------------------------
using Event = std::variant<
    MarketTickEvent,
    TickReportEvent,
    BreakerTransitionEvent,
    CascadeEvent>;

}  // namespace nanotrade
