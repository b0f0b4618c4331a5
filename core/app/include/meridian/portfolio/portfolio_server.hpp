#pragma once

#include "meridian/domain/account.hpp"
#include "meridian/domain/active_order.hpp"
#include "meridian/domain/position.hpp"
#include "meridian/eventbus/event_bus.hpp"
#include "meridian/events/event_types.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <vector>

namespace meridian {

// -----------------------------------------------------------------------------
// PortfolioServer: positions, working orders and account in one place
// -----------------------------------------------------------------------------
//
// @brief  Single source of truth for the engine's portfolio state. Every
//         mutation is applied, announced on the bus and logged.
//
// @details
// Three stores:
//   positions         ticker   -> Position
//   active orders     order id -> ActiveOrder (non-terminal orders only)
//   account           latest Account snapshot
// plus the set of tickers waiting for a position refresh: an order that
// reached Filled marks its ticker, and the next position change for that
// ticker clears it. activeOrderTickers() returns the union of tickers with a
// working order and tickers awaiting a refresh; the OrderManager refuses
// signals touching any of them.
//
// Notifications (published on the bus passed at construction):
//   PositionUpdateEvent   updatePositions() changed or removed a position
//   OrderUpdateEvent      updateOrders() changed the active set
//   AccountUpdateEvent    updateAccountDetails()
// Updates that change nothing (an identical position, a terminal status for
// an order that is already gone) publish nothing, which makes re-delivered
// broker callbacks harmless.
//
// Inputs:
//   Backtest: ExecutionSimulator calls the update methods directly.
//   Live:     BrokerWrapper pushes Broker*Event messages into the portfolio
//             event loop; the subscriptions made here apply them on that loop
//             thread, which is the only writer.
//
// Thread model:
//   Writers are serialized by their caller (one thread per mode). Readers
//   (OrderManager on the engine loop, IpcServer) may run concurrently, so the
//   stores sit behind a shared_mutex. Events are published after the lock is
//   released.
// -----------------------------------------------------------------------------
class PortfolioServer {
 public:
  explicit PortfolioServer(EventBus& bus);
  ~PortfolioServer();

  PortfolioServer(const PortfolioServer&) = delete;
  PortfolioServer& operator=(const PortfolioServer&) = delete;

  // -------------------------------------------------------------------------
  // updatePositions(ticker, position)
  // -------------------------------------------------------------------------
  //
  // @brief  Stores the position for `ticker`; a zero quantity removes it.
  //
  // @details
  // A position equal to the stored one is a no-op. Any change clears the
  // ticker's pending-refresh mark.
  // -------------------------------------------------------------------------
  void updatePositions(const std::string& ticker,
                       const domain::Position& position);

  // -------------------------------------------------------------------------
  // updateOrders(order)  (open-order report)
  // updateOrders(update) (order-status report)
  // -------------------------------------------------------------------------
  //
  // @details
  // Status handling, identical for both overloads:
  //   Filled                  remove from the active set and mark the ticker
  //                           for a position refresh
  //   Cancelled/ApiCancelled/ remove from the active set
  //   Inactive
  //   anything else           insert, or merge into the existing entry
  // A terminal status for an order that is not in the active set changes
  // nothing.
  // -------------------------------------------------------------------------
  void updateOrders(const domain::ActiveOrder& order);
  void updateOrders(const domain::OrderStatusUpdate& update);

  void updateAccountDetails(const domain::Account& account);

  std::set<std::string> activeOrderTickers() const;

  std::optional<domain::Position> position(const std::string& ticker) const;
  std::vector<domain::Position> positions() const;
  std::vector<domain::ActiveOrder> activeOrders() const;
  std::optional<domain::ActiveOrder> activeOrder(std::int64_t order_id) const;
  domain::Account account() const;
  bool pendingPositionRefresh(const std::string& ticker) const;

 private:
  // Applies a terminal status while holding the lock. Returns the removed
  // order, or nullopt when there was nothing to remove.
  std::optional<domain::ActiveOrder> removeTerminalLocked(
      std::int64_t order_id, domain::OrderStatus status);

  void logOrder(const char* verb, const domain::ActiveOrder& order) const;

  EventBus& bus_;
  EventBus::SubscriptionId position_sub_id_{0};
  EventBus::SubscriptionId open_order_sub_id_{0};
  EventBus::SubscriptionId order_status_sub_id_{0};
  EventBus::SubscriptionId account_sub_id_{0};

  mutable std::shared_mutex mutex_;
  std::map<std::string, domain::Position> positions_;
  std::map<std::int64_t, domain::ActiveOrder> active_orders_;
  std::set<std::string> pending_position_refresh_;
  domain::Account account_;
};

}  // namespace meridian
