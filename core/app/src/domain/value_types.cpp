#include "meridian/domain/account.hpp"
#include "meridian/domain/active_order.hpp"
#include "meridian/domain/position.hpp"
#include "meridian/domain/trade.hpp"

#include <stdexcept>
#include <tuple>

namespace meridian::domain {

// -----------------------------------------------------------------------------
// Equality: field-wise. The portfolio uses it to skip no-op updates.
// -----------------------------------------------------------------------------
bool operator==(const Position& lhs, const Position& rhs) {
  return std::tie(lhs.ticker, lhs.security_type, lhs.side, lhs.quantity,
                  lhs.avg_price, lhs.quantity_multiplier, lhs.price_multiplier,
                  lhs.initial_margin, lhs.market_price, lhs.market_value,
                  lhs.unrealized_pnl, lhs.settled_pnl) ==
         std::tie(rhs.ticker, rhs.security_type, rhs.side, rhs.quantity,
                  rhs.avg_price, rhs.quantity_multiplier, rhs.price_multiplier,
                  rhs.initial_margin, rhs.market_price, rhs.market_value,
                  rhs.unrealized_pnl, rhs.settled_pnl);
}

bool operator!=(const Position& lhs, const Position& rhs) {
  return !(lhs == rhs);
}

bool operator==(const Account& lhs, const Account& rhs) {
  return std::tie(lhs.timestamp, lhs.currency, lhs.available_funds,
                  lhs.required_margin, lhs.net_liquidation, lhs.unrealized_pnl,
                  lhs.maintenance_margin, lhs.excess_liquidity,
                  lhs.buying_power, lhs.futures_pnl, lhs.cash_balance) ==
         std::tie(rhs.timestamp, rhs.currency, rhs.available_funds,
                  rhs.required_margin, rhs.net_liquidation, rhs.unrealized_pnl,
                  rhs.maintenance_margin, rhs.excess_liquidity,
                  rhs.buying_power, rhs.futures_pnl, rhs.cash_balance);
}

bool operator!=(const Account& lhs, const Account& rhs) {
  return !(lhs == rhs);
}

bool operator==(const Trade& lhs, const Trade& rhs) {
  return std::tie(lhs.timestamp, lhs.trade_id, lhs.leg_id, lhs.ticker,
                  lhs.quantity, lhs.price, lhs.cost, lhs.action, lhs.fees) ==
         std::tie(rhs.timestamp, rhs.trade_id, rhs.leg_id, rhs.ticker,
                  rhs.quantity, rhs.price, rhs.cost, rhs.action, rhs.fees);
}

bool operator!=(const Trade& lhs, const Trade& rhs) { return !(lhs == rhs); }

// -----------------------------------------------------------------------------
// OrderStatus conversions
// -----------------------------------------------------------------------------
const char* toString(OrderStatus status) {
  using S = OrderStatus;
  switch (status) {
    case S::PendingSubmit: return "PendingSubmit";
    case S::PendingCancel: return "PendingCancel";
    case S::PreSubmitted:  return "PreSubmitted";
    case S::Submitted:     return "Submitted";
    case S::ApiCancelled:  return "ApiCancelled";
    case S::Cancelled:     return "Cancelled";
    case S::Filled:        return "Filled";
    case S::Inactive:      return "Inactive";
  }
  return "Unknown";
}

OrderStatus orderStatusFromString(const std::string& text) {
  using S = OrderStatus;
  if (text == "PendingSubmit") return S::PendingSubmit;
  if (text == "PendingCancel") return S::PendingCancel;
  if (text == "PreSubmitted") return S::PreSubmitted;
  if (text == "Submitted") return S::Submitted;
  if (text == "ApiCancelled") return S::ApiCancelled;
  if (text == "Cancelled") return S::Cancelled;
  if (text == "Filled") return S::Filled;
  if (text == "Inactive") return S::Inactive;
  throw std::invalid_argument("unknown order status: " + text);
}

void applyStatus(ActiveOrder& order, const OrderStatusUpdate& update) {
  order.status = update.status;
  order.filled = update.filled;
  order.remaining = update.remaining;
  order.avg_fill_price = update.avg_fill_price;
  order.last_fill_price = update.last_fill_price;
  order.mkt_cap_price = update.mkt_cap_price;
  order.why_held = update.why_held;
  if (update.perm_id != 0) {
    order.perm_id = update.perm_id;
  }
  if (update.parent_id != 0) {
    order.parent_id = update.parent_id;
  }
}

}  // namespace meridian::domain
