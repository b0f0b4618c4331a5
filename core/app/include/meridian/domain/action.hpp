#pragma once

#include <string>

namespace meridian::domain {

// -----------------------------------------------------------------------------
// Action: trade direction as expressed by a strategy
// -----------------------------------------------------------------------------
//
// LONG / SHORT open new exposure, SELL / COVER close existing exposure of the
// opposite sign. On the broker wire the four collapse onto two sides:
//
//   LONG, COVER  -> BUY   (quantity sign +1)
//   SHORT, SELL  -> SELL  (quantity sign -1)
// -----------------------------------------------------------------------------
enum class Action { Long, Short, Sell, Cover };

enum class BrokerSide { Buy, Sell };

inline BrokerSide toBrokerSide(Action action) {
  return (action == Action::Long || action == Action::Cover)
             ? BrokerSide::Buy
             : BrokerSide::Sell;
}

inline bool isEntry(Action action) {
  return action == Action::Long || action == Action::Short;
}

// +1.0 for buy-side actions, -1.0 for sell-side actions.
inline double actionSign(Action action) {
  return toBrokerSide(action) == BrokerSide::Buy ? 1.0 : -1.0;
}

const char* toString(Action action);
const char* toString(BrokerSide side);

// Accepts "LONG", "SHORT", "SELL", "COVER". Throws std::invalid_argument.
Action actionFromString(const std::string& text);

// Accepts "BUY" / "SELL" (and the broker's "BOT" / "SLD" execution sides).
// Throws std::invalid_argument.
BrokerSide brokerSideFromString(const std::string& text);

}  // namespace meridian::domain
