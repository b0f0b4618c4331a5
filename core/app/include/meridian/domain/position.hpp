#pragma once

#include "meridian/domain/action.hpp"
#include "meridian/domain/instrument.hpp"

#include <string>

namespace meridian::domain {

// -----------------------------------------------------------------------------
// Position: net exposure in one instrument
// -----------------------------------------------------------------------------
//
// @brief  Plain value type shared by the backtest ledger and the live broker
//         portfolio pushes.
//
// @details
// avg_price is stored per unit of quantity in account currency, i.e. the fill
// price already scaled by price_multiplier * quantity_multiplier. This keeps
// every valuation below a single multiplication by quantity.
//
// settled_pnl applies to leveraged instruments only: it is the part of the
// open profit/loss that mark-to-market has already moved into available
// funds. The remainder (open PnL - settled_pnl) is what the position still
// contributes to net liquidation.
//
// A Position with quantity == 0 never lives in a ledger; it is used on the
// update path to signal removal.
// -----------------------------------------------------------------------------
struct Position {
  std::string ticker;
  SecurityType security_type{SecurityType::Equity};
  BrokerSide side{BrokerSide::Buy};
  double quantity{0.0};
  double avg_price{0.0};
  double quantity_multiplier{1.0};
  double price_multiplier{1.0};
  double initial_margin{0.0};
  double market_price{0.0};
  double market_value{0.0};
  double unrealized_pnl{0.0};
  double settled_pnl{0.0};

  bool isLeveraged() const { return security_type == SecurityType::Future; }

  double contractMultiplier() const {
    return price_multiplier * quantity_multiplier;
  }

  // Signed value of the position at `price`.
  double currentValue(double price) const {
    return price * contractMultiplier() * quantity;
  }

  double entryValue() const { return avg_price * quantity; }

  double openPnl(double price) const {
    return currentValue(price) - entryValue();
  }

  // What closing now would add to net liquidation: the full signed market
  // value for cash instruments, the unsettled open PnL for leveraged ones.
  double liquidationValue(double price) const {
    return isLeveraged() ? openPnl(price) - settled_pnl
                         : currentValue(price);
  }

  double requiredMargin() const {
    return isLeveraged() ? initial_margin * (quantity < 0 ? -quantity
                                                          : quantity)
                         : 0.0;
  }
};

bool operator==(const Position& lhs, const Position& rhs);
bool operator!=(const Position& lhs, const Position& rhs);

}  // namespace meridian::domain
