#pragma once

#include "meridian/domain/action.hpp"
#include "meridian/domain/instrument.hpp"

#include <optional>
#include <string>
#include <variant>

namespace meridian::domain {

enum class OrderType { Market, Limit, Stop };

// Broker codes: MKT, LMT, STP.
const char* toString(OrderType type);
OrderType orderTypeFromString(const std::string& text);

struct MarketOrder {};

struct LimitOrder {
  double limit_price{0.0};
};

struct StopOrder {
  double aux_price{0.0};
};

using OrderKind = std::variant<MarketOrder, LimitOrder, StopOrder>;

// -----------------------------------------------------------------------------
// Order: one broker order for one instrument
// -----------------------------------------------------------------------------
//
// @brief  Tagged union over the three order kinds with a shared contract:
//         quantity(), commission(), orderValue().
//
// @details
// The quantity is signed and its sign always follows the action: buy-side
// actions (LONG, COVER) are positive, sell-side actions (SHORT, SELL)
// negative. Build orders through makeOrder() so the sign and the per-kind
// price are validated once; a default-constructed Order is not usable.
// -----------------------------------------------------------------------------
struct Order {
  Action action{Action::Long};
  double signed_quantity{0.0};
  OrderKind kind{MarketOrder{}};

  OrderType type() const;

  double quantity() const { return signed_quantity; }

  BrokerSide side() const { return toBrokerSide(action); }

  // |quantity| * instrument fee rate.
  double commission(const Instrument& instrument) const;

  // Capital the order ties up: |quantity| * initial_margin for leveraged
  // instruments, |quantity| * price otherwise.
  double orderValue(const Instrument& instrument, double price) const;

  std::optional<double> limitPrice() const;
  std::optional<double> auxPrice() const;
};

// Builds a validated order. `quantity` is taken as an absolute size; the sign
// is derived from `action`. Throws std::invalid_argument on a zero or
// non-finite quantity, or when a LIMIT/STOP order lacks a positive price.
Order makeOrder(Action action, double quantity, OrderType type,
                std::optional<double> limit_price = std::nullopt,
                std::optional<double> aux_price = std::nullopt);

}  // namespace meridian::domain
