#pragma once

#include "meridian/domain/order.hpp"
#include "meridian/domain/symbol_registry.hpp"
#include "meridian/domain/trade_instruction.hpp"
#include "meridian/eventbus/event_bus.hpp"
#include "meridian/events/event_types.hpp"
#include "meridian/market/order_book.hpp"
#include "meridian/portfolio/portfolio_server.hpp"

#include <atomic>
#include <string>
#include <vector>

namespace meridian {

// -----------------------------------------------------------------------------
// OrderManager
// -----------------------------------------------------------------------------
//
// @brief  Converts strategy signals into OrderEvents after a duplicate-order
//         check and a capital check. A signal is submitted whole or not at
//         all.
//
// @details
// Listens for SignalEvent on the bus it is given. For each signal:
//
//   1. Duplicate guard: if any instruction's ticker is in
//      PortfolioServer::activeOrderTickers() (a working order, or a fill
//      whose position has not been refreshed yet) the signal is dropped.
//
//   2. Build: every instruction is validated, sized when its quantity is 0,
//      and turned into a domain::Order. Unknown instruments, missing prices
//      and zero sizes drop the signal.
//
//   3. Capital check: the orders' values (Order::orderValue) are summed. The
//      signal passes iff
//          account.available_funds - account.required_margin >= total.
//
//   4. Publish one OrderEvent per instruction, in instruction order.
//
// Dropped signals are logged to stderr and counted; they are expected
// control flow, not errors.
//
// Thread model:
//   Callbacks run on whichever thread publishes SignalEvent on the bus (the
//   replay thread in a backtest, the engine loop live). OrderBook and
//   PortfolioServer are read through their own locks.
// -----------------------------------------------------------------------------
class OrderManager {
 public:
  OrderManager(EventBus& bus, const domain::SymbolRegistry& symbols,
               const OrderBook& book, const PortfolioServer& portfolio);
  ~OrderManager();

  OrderManager(const OrderManager&) = delete;
  OrderManager& operator=(const OrderManager&) = delete;

  // -------------------------------------------------------------------------
  // onSignal(event)
  // -------------------------------------------------------------------------
  //
  // @return true when the signal's orders were published.
  // -------------------------------------------------------------------------
  bool onSignal(const SignalEvent& event);

  int acceptedSignals() const { return accepted_signals_.load(); }
  int rejectedSignals() const { return rejected_signals_.load(); }

 private:
  // Absolute order size for `instruction`: its own quantity, or sized from
  // trade capital (entries) or the open position (exits) when it is 0.
  double sizeOf(const domain::TradeInstruction& instruction,
                const domain::Instrument& instrument, double price,
                double trade_capital) const;

  void reject(const SignalEvent& event, const std::string& reason);

  EventBus& bus_;
  const domain::SymbolRegistry& symbols_;
  const OrderBook& book_;
  const PortfolioServer& portfolio_;
  EventBus::SubscriptionId signal_sub_id_{0};

  std::atomic<int> accepted_signals_{0};
  std::atomic<int> rejected_signals_{0};
};

}  // namespace meridian
