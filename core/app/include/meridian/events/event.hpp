#pragma once

#include "meridian/events/event_types.hpp"

#include <variant>

namespace meridian {

// Single sum type delivered over every EventBus. Subscribers either match a
// concrete alternative with EventBus::subscribe<T>() or visit the variant.
using Event = std::variant<MarketFeedEvent,
                           MarketDataEvent,
                           SignalEvent,
                           OrderEvent,
                           ExecutionEvent,
                           EndOfDayEvent,
                           PositionUpdateEvent,
                           OrderUpdateEvent,
                           AccountUpdateEvent,
                           BrokerPositionEvent,
                           BrokerOpenOrderEvent,
                           BrokerOrderStatusEvent,
                           BrokerAccountEvent>;

}  // namespace meridian
