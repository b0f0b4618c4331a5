#include "meridian/domain/action.hpp"

#include <stdexcept>

namespace meridian::domain {

const char* toString(Action action) {
  switch (action) {
    case Action::Long:  return "LONG";
    case Action::Short: return "SHORT";
    case Action::Sell:  return "SELL";
    case Action::Cover: return "COVER";
  }
  return "UNKNOWN";
}

const char* toString(BrokerSide side) {
  switch (side) {
    case BrokerSide::Buy:  return "BUY";
    case BrokerSide::Sell: return "SELL";
  }
  return "UNKNOWN";
}

Action actionFromString(const std::string& text) {
  if (text == "LONG") return Action::Long;
  if (text == "SHORT") return Action::Short;
  if (text == "SELL") return Action::Sell;
  if (text == "COVER") return Action::Cover;
  throw std::invalid_argument("unknown action: " + text);
}

BrokerSide brokerSideFromString(const std::string& text) {
  // Executions report BOT / SLD rather than BUY / SELL.
  if (text == "BUY" || text == "BOT") return BrokerSide::Buy;
  if (text == "SELL" || text == "SLD") return BrokerSide::Sell;
  throw std::invalid_argument("unknown broker side: " + text);
}

}  // namespace meridian::domain
