#pragma once

#include "meridian/domain/account.hpp"
#include "meridian/domain/instrument.hpp"
#include "meridian/domain/order.hpp"
#include "meridian/domain/position.hpp"
#include "meridian/domain/symbol_registry.hpp"
#include "meridian/domain/trade.hpp"
#include "meridian/eventbus/event_bus.hpp"
#include "meridian/events/event_types.hpp"
#include "meridian/execution/i_execution_engine.hpp"
#include "meridian/market/order_book.hpp"
#include "meridian/portfolio/portfolio_server.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace meridian {

// -----------------------------------------------------------------------------
// ExecutionSimulator: backtest broker
// -----------------------------------------------------------------------------
//
// @brief  Fills every order immediately at the OrderBook's current price
//         (plus slippage), charges commission and keeps a broker-style
//         position and account ledger for equities and futures.
//
// @details
// Cash ledger (available funds):
//   - commission is always deducted at fill time;
//   - cash instruments move fill notional through funds (buys consume,
//     sells release);
//   - leveraged instruments move only realized PnL through funds, less the
//     part mark-to-market already settled.
//
// Everything else in the Account is derived from the positions and the
// book's prices on every change (recomputeAccountLocked()):
//   required_margin  = sum |qty| * initial_margin   (leveraged only)
//   unrealized_pnl   = sum (price * multipliers * qty - avg * qty)
//   net_liquidation  = funds + sum Position::liquidationValue(price)
//
// Position arithmetic per fill of signed quantity q at unit notional u
// (fill price * price_multiplier * quantity_multiplier), position Q at avg A:
//
//   Case 1  no position        create: qty = q, avg = u
//   Case 2  same direction     avg = (A*Q + u*q) / (Q + q), qty = Q + q
//   Case 3  |q| <  |Q|         realize (u - A) * overlap, avg unchanged
//   Case 4  |q| == |Q|         realize everything, remove the position
//   Case 5  |q| >  |Q|         realize everything, reopen Q + q at u
//
// where overlap is the closed part of Q (sign of Q). On a leveraged partial
// close the settled mark-to-market PnL is released in proportion to the
// closed quantity.
//
// Subscriptions: OrderEvent (placeOrder), EndOfDayEvent (endOfDay).
// Publishes:     ExecutionEvent, one per fill, after the ledger and the
//                PortfolioServer have been updated.
//
// Thread model:
//   Driven from one thread (the backtest replay). The ledger is guarded by a
//   mutex so that a fill's position and account change are observed together
//   by concurrent readers; PortfolioServer and the bus are called with the
//   mutex released.
// -----------------------------------------------------------------------------
class ExecutionSimulator final : public IExecutionEngine {
 public:
  ExecutionSimulator(EventBus& bus, const domain::SymbolRegistry& symbols,
                     const OrderBook& book, PortfolioServer& portfolio,
                     double capital);
  ~ExecutionSimulator() override;

  ExecutionSimulator(const ExecutionSimulator&) = delete;
  ExecutionSimulator& operator=(const ExecutionSimulator&) = delete;

  // Event entry point. Ledger failures (unknown instrument, no price) are
  // logged and the order is dropped.
  void placeOrder(const OrderEvent& event) override;

  // -------------------------------------------------------------------------
  // placeOrder(timestamp, trade_id, leg_id, action, instrument, order)
  // -------------------------------------------------------------------------
  //
  // @brief  Fills `order` in full and returns the recorded trade.
  //
  // @throws LedgerError when the book has no price for the instrument. The
  //         ledger is unchanged in that case.
  // -------------------------------------------------------------------------
  domain::Trade placeOrder(std::int64_t timestamp, int trade_id, int leg_id,
                           domain::Action action,
                           const domain::Instrument& instrument,
                           const domain::Order& order);

  // Settles leveraged open PnL into funds at current prices and refreshes
  // every position and the account. Generates no trade.
  void markToMarket();

  // True iff available funds < required initial margin. Signals only.
  bool checkMarginCall() const;

  // Closes every open position at its current price with zero commission.
  // Each closing trade reuses the trade/leg id of the instrument's last trade
  // and supersedes it. Returns the closing trades.
  std::vector<domain::Trade> liquidatePositions();

  // markToMarket() followed by checkMarginCall(); counts and logs a call.
  bool endOfDay(std::int64_t timestamp);

  // Market price adjusted against the trader: buy-side actions pay
  // slippage, sell-side actions give it up.
  static double fillPrice(const domain::Instrument& instrument,
                          domain::Action action, double market_price);

  domain::Account account() const;
  std::optional<domain::Position> position(const std::string& ticker) const;
  std::vector<domain::Position> positions() const;
  std::optional<domain::Trade> lastTrade(const std::string& ticker) const;
  double realizedPnl() const;
  double totalFees() const;
  int marginCalls() const;
  int rejectedOrders() const;

 private:
  void applyFillLocked(const domain::Instrument& instrument,
                       double signed_quantity, double fill_price, double fees);

  void recomputeAccountLocked();

  double priceLocked(const std::string& ticker) const;

  // Pushes the given positions (quantity 0 = removed) and the account to the
  // PortfolioServer. Called without mutex_ held.
  void syncPortfolio(const std::vector<domain::Position>& changed,
                     const domain::Account& account);

  domain::Position removedPosition(const std::string& ticker) const;

  EventBus& bus_;
  const domain::SymbolRegistry& symbols_;
  const OrderBook& book_;
  PortfolioServer& portfolio_;

  EventBus::SubscriptionId order_sub_id_{0};
  EventBus::SubscriptionId eod_sub_id_{0};

  mutable std::mutex mutex_;
  std::map<std::string, domain::Position> positions_;
  std::map<std::string, domain::Trade> last_trades_;
  domain::Account account_;
  double realized_pnl_{0.0};
  double total_fees_{0.0};
  int margin_calls_{0};
  int rejected_orders_{0};
};

}  // namespace meridian
