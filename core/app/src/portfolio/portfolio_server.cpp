#include "meridian/portfolio/portfolio_server.hpp"

#include <iostream>
#include <mutex>

namespace meridian {

// -----------------------------------------------------------------------------
// Constructor: broker message subscriptions (live path)
// -----------------------------------------------------------------------------
PortfolioServer::PortfolioServer(EventBus& bus) : bus_(bus) {
  position_sub_id_ = bus_.subscribe<BrokerPositionEvent>(
      [this](const BrokerPositionEvent& e) {
        updatePositions(e.position.ticker, e.position);
      });
  open_order_sub_id_ = bus_.subscribe<BrokerOpenOrderEvent>(
      [this](const BrokerOpenOrderEvent& e) { updateOrders(e.order); });
  order_status_sub_id_ = bus_.subscribe<BrokerOrderStatusEvent>(
      [this](const BrokerOrderStatusEvent& e) { updateOrders(e.update); });
  account_sub_id_ = bus_.subscribe<BrokerAccountEvent>(
      [this](const BrokerAccountEvent& e) { updateAccountDetails(e.account); });
}

PortfolioServer::~PortfolioServer() {
  bus_.unsubscribe(account_sub_id_);
  bus_.unsubscribe(order_status_sub_id_);
  bus_.unsubscribe(open_order_sub_id_);
  bus_.unsubscribe(position_sub_id_);
}

// -----------------------------------------------------------------------------
// updatePositions
// -----------------------------------------------------------------------------
void PortfolioServer::updatePositions(const std::string& ticker,
                                      const domain::Position& position) {
  PositionUpdateEvent update;
  update.ticker = ticker;

  {
    std::unique_lock lock(mutex_);
    auto it = positions_.find(ticker);

    if (position.quantity == 0.0) {
      if (it == positions_.end()) {
        // Nothing held: still honour the refresh the fill asked for.
        pending_position_refresh_.erase(ticker);
        return;
      }
      positions_.erase(it);
    } else {
      if (it != positions_.end() && it->second == position) {
        return;
      }
      positions_.insert_or_assign(ticker, position);
      update.position = position;
    }
    pending_position_refresh_.erase(ticker);
  }

  bus_.publish(update);

  if (update.position) {
    std::cout << "[PortfolioServer] position " << ticker << ": "
              << domain::toString(update.position->side)
              << " qty=" << update.position->quantity
              << " avg=" << update.position->avg_price << "\n";
  } else {
    std::cout << "[PortfolioServer] position " << ticker << " closed\n";
  }
}

// -----------------------------------------------------------------------------
// removeTerminalLocked
// -----------------------------------------------------------------------------
std::optional<domain::ActiveOrder> PortfolioServer::removeTerminalLocked(
    std::int64_t order_id, domain::OrderStatus status) {
  auto it = active_orders_.find(order_id);
  if (it == active_orders_.end()) {
    return std::nullopt;
  }

  domain::ActiveOrder removed = it->second;
  removed.status = status;
  active_orders_.erase(it);

  if (status == domain::OrderStatus::Filled && !removed.ticker.empty()) {
    pending_position_refresh_.insert(removed.ticker);
  }
  return removed;
}

// -----------------------------------------------------------------------------
// updateOrders(ActiveOrder): open-order report
// -----------------------------------------------------------------------------
void PortfolioServer::updateOrders(const domain::ActiveOrder& order) {
  OrderUpdateEvent update;

  {
    std::unique_lock lock(mutex_);

    if (domain::isTerminal(order.status)) {
      auto removed = removeTerminalLocked(order.order_id, order.status);
      if (!removed) {
        return;
      }
      // The report may know more than the stored entry did.
      if (removed->ticker.empty() && !order.ticker.empty()) {
        removed->ticker = order.ticker;
        if (order.status == domain::OrderStatus::Filled) {
          pending_position_refresh_.insert(order.ticker);
        }
      }
      update.order = *removed;
      update.active = false;
    } else {
      auto it = active_orders_.find(order.order_id);
      domain::ActiveOrder merged = order;
      if (it != active_orders_.end()) {
        // Open-order reports carry no fill progress; keep what status
        // reports already told us.
        merged.filled = it->second.filled;
        merged.remaining = it->second.remaining;
        merged.avg_fill_price = it->second.avg_fill_price;
        merged.last_fill_price = it->second.last_fill_price;
        merged.mkt_cap_price = it->second.mkt_cap_price;
      }
      active_orders_.insert_or_assign(order.order_id, merged);
      update.order = merged;
      update.active = true;
    }
  }

  bus_.publish(update);
  logOrder(update.active ? "open" : "closed", update.order);
}

// -----------------------------------------------------------------------------
// updateOrders(OrderStatusUpdate): order-status report
// -----------------------------------------------------------------------------
void PortfolioServer::updateOrders(const domain::OrderStatusUpdate& status) {
  OrderUpdateEvent update;

  {
    std::unique_lock lock(mutex_);

    if (domain::isTerminal(status.status)) {
      auto removed = removeTerminalLocked(status.order_id, status.status);
      if (!removed) {
        return;
      }
      domain::applyStatus(*removed, status);
      update.order = *removed;
      update.active = false;
    } else {
      auto it = active_orders_.find(status.order_id);
      if (it == active_orders_.end()) {
        // Status seen before the open-order report; the ticker arrives later.
        domain::ActiveOrder fresh;
        fresh.order_id = status.order_id;
        it = active_orders_.emplace(status.order_id, fresh).first;
      }
      domain::applyStatus(it->second, status);
      update.order = it->second;
      update.active = true;
    }
  }

  bus_.publish(update);
  logOrder(update.active ? "status" : "closed", update.order);
}

// -----------------------------------------------------------------------------
// updateAccountDetails
// -----------------------------------------------------------------------------
void PortfolioServer::updateAccountDetails(const domain::Account& account) {
  {
    std::unique_lock lock(mutex_);
    account_ = account;
  }

  AccountUpdateEvent update;
  update.account = account;
  bus_.publish(update);

  std::cout << "[PortfolioServer] account ts=" << account.timestamp
            << " funds=" << account.available_funds
            << " margin=" << account.required_margin
            << " net_liq=" << account.net_liquidation
            << " upnl=" << account.unrealized_pnl << "\n";
}

// -----------------------------------------------------------------------------
// Readers
// -----------------------------------------------------------------------------
std::set<std::string> PortfolioServer::activeOrderTickers() const {
  std::shared_lock lock(mutex_);
  std::set<std::string> tickers = pending_position_refresh_;
  for (const auto& [id, order] : active_orders_) {
    if (!order.ticker.empty()) {
      tickers.insert(order.ticker);
    }
  }
  return tickers;
}

std::optional<domain::Position> PortfolioServer::position(
    const std::string& ticker) const {
  std::shared_lock lock(mutex_);
  auto it = positions_.find(ticker);
  if (it == positions_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<domain::Position> PortfolioServer::positions() const {
  std::shared_lock lock(mutex_);
  std::vector<domain::Position> result;
  result.reserve(positions_.size());
  for (const auto& [ticker, pos] : positions_) {
    result.push_back(pos);
  }
  return result;
}

std::vector<domain::ActiveOrder> PortfolioServer::activeOrders() const {
  std::shared_lock lock(mutex_);
  std::vector<domain::ActiveOrder> result;
  result.reserve(active_orders_.size());
  for (const auto& [id, order] : active_orders_) {
    result.push_back(order);
  }
  return result;
}

std::optional<domain::ActiveOrder> PortfolioServer::activeOrder(
    std::int64_t order_id) const {
  std::shared_lock lock(mutex_);
  auto it = active_orders_.find(order_id);
  if (it == active_orders_.end()) {
    return std::nullopt;
  }
  return it->second;
}

domain::Account PortfolioServer::account() const {
  std::shared_lock lock(mutex_);
  return account_;
}

bool PortfolioServer::pendingPositionRefresh(const std::string& ticker) const {
  std::shared_lock lock(mutex_);
  return pending_position_refresh_.count(ticker) != 0;
}

void PortfolioServer::logOrder(const char* verb,
                               const domain::ActiveOrder& order) const {
  std::cout << "[PortfolioServer] order " << verb << " id=" << order.order_id
            << " ticker=" << (order.ticker.empty() ? "?" : order.ticker)
            << " status=" << domain::toString(order.status)
            << " filled=" << order.filled << " remaining=" << order.remaining
            << "\n";
}

}  // namespace meridian
