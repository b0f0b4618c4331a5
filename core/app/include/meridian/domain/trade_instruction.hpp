#pragma once

#include "meridian/domain/action.hpp"
#include "meridian/domain/order.hpp"

#include <optional>
#include <string>

namespace meridian::domain {

// -----------------------------------------------------------------------------
// TradeInstruction: one leg of a strategy signal
// -----------------------------------------------------------------------------
//
// quantity == 0 asks the OrderManager to size the leg itself (from weight and
// the signal's trade capital for entries, from the open position for exits).
// -----------------------------------------------------------------------------
struct TradeInstruction {
  std::string ticker;
  OrderType order_type{OrderType::Market};
  Action action{Action::Long};
  int trade_id{0};
  int leg_id{0};
  double weight{0.0};
  double quantity{0.0};
  std::optional<double> limit_price;
  std::optional<double> aux_price;
};

// Throws std::invalid_argument: empty ticker, non-positive trade/leg id,
// negative quantity, LIMIT without a positive limit price, STOP without a
// positive aux price.
void validateInstruction(const TradeInstruction& instruction);

}  // namespace meridian::domain
