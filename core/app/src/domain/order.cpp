#include "meridian/domain/order.hpp"
#include "meridian/domain/trade_instruction.hpp"

#include <cmath>
#include <stdexcept>

namespace meridian::domain {

const char* toString(OrderType type) {
  switch (type) {
    case OrderType::Market: return "MKT";
    case OrderType::Limit:  return "LMT";
    case OrderType::Stop:   return "STP";
  }
  return "UNKNOWN";
}

OrderType orderTypeFromString(const std::string& text) {
  if (text == "MKT") return OrderType::Market;
  if (text == "LMT") return OrderType::Limit;
  if (text == "STP") return OrderType::Stop;
  throw std::invalid_argument("unknown order type: " + text);
}

OrderType Order::type() const {
  if (std::holds_alternative<LimitOrder>(kind)) return OrderType::Limit;
  if (std::holds_alternative<StopOrder>(kind)) return OrderType::Stop;
  return OrderType::Market;
}

double Order::commission(const Instrument& instrument) const {
  return std::abs(signed_quantity) * instrument.fees;
}

double Order::orderValue(const Instrument& instrument, double price) const {
  const double size = std::abs(signed_quantity);
  return instrument.isLeveraged() ? size * instrument.initial_margin
                                  : size * price;
}

std::optional<double> Order::limitPrice() const {
  if (const auto* limit = std::get_if<LimitOrder>(&kind)) {
    return limit->limit_price;
  }
  return std::nullopt;
}

std::optional<double> Order::auxPrice() const {
  if (const auto* stop = std::get_if<StopOrder>(&kind)) {
    return stop->aux_price;
  }
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// makeOrder
// -----------------------------------------------------------------------------
Order makeOrder(Action action, double quantity, OrderType type,
                std::optional<double> limit_price,
                std::optional<double> aux_price) {
  if (!std::isfinite(quantity) || quantity == 0.0) {
    throw std::invalid_argument("order quantity must be non-zero");
  }

  Order order;
  order.action = action;
  order.signed_quantity = actionSign(action) * std::abs(quantity);

  switch (type) {
    case OrderType::Market:
      order.kind = MarketOrder{};
      break;
    case OrderType::Limit:
      if (!limit_price || !(*limit_price > 0.0)) {
        throw std::invalid_argument("limit order requires a limit price > 0");
      }
      order.kind = LimitOrder{*limit_price};
      break;
    case OrderType::Stop:
      if (!aux_price || !(*aux_price > 0.0)) {
        throw std::invalid_argument("stop order requires an aux price > 0");
      }
      order.kind = StopOrder{*aux_price};
      break;
  }
  return order;
}

// -----------------------------------------------------------------------------
// validateInstruction
// -----------------------------------------------------------------------------
void validateInstruction(const TradeInstruction& instruction) {
  if (instruction.ticker.empty()) {
    throw std::invalid_argument("instruction ticker must not be empty");
  }
  if (instruction.trade_id <= 0) {
    throw std::invalid_argument("trade_id must be > 0");
  }
  if (instruction.leg_id <= 0) {
    throw std::invalid_argument("leg_id must be > 0");
  }
  if (!std::isfinite(instruction.quantity) || instruction.quantity < 0.0) {
    throw std::invalid_argument("instruction quantity must be >= 0");
  }
  if (!std::isfinite(instruction.weight)) {
    throw std::invalid_argument("instruction weight must be finite");
  }
  if (instruction.order_type == OrderType::Limit &&
      !(instruction.limit_price && *instruction.limit_price > 0.0)) {
    throw std::invalid_argument("LMT instruction requires limit_price > 0");
  }
  if (instruction.order_type == OrderType::Stop &&
      !(instruction.aux_price && *instruction.aux_price > 0.0)) {
    throw std::invalid_argument("STP instruction requires aux_price > 0");
  }
}

}  // namespace meridian::domain
