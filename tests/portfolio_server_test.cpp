// =============================================================================
// portfolio_server_test.cpp
// =============================================================================
// Unit tests for meridian::PortfolioServer.
//
// Validates:
//   - Position insert / replace / remove, with one notification per change
//   - Re-delivered identical updates publish nothing
//   - Order lifecycle: open report, status merge, terminal removal
//   - Filled orders hold their ticker until the position refresh
//   - Broker*Event messages on the bus drive the same update paths
// =============================================================================

#include "meridian/eventbus/event_bus.hpp"
#include "meridian/portfolio/portfolio_server.hpp"

#include <gtest/gtest.h>

#include <vector>

namespace domain = meridian::domain;

class PortfolioServerTest : public ::testing::Test {
 protected:
  PortfolioServerTest() {
    bus.subscribe<meridian::PositionUpdateEvent>(
        [this](const meridian::PositionUpdateEvent& e) {
          position_updates.push_back(e);
        });
    bus.subscribe<meridian::OrderUpdateEvent>(
        [this](const meridian::OrderUpdateEvent& e) {
          order_updates.push_back(e);
        });
    bus.subscribe<meridian::AccountUpdateEvent>(
        [this](const meridian::AccountUpdateEvent&) { ++account_updates; });
  }

  static domain::Position position(const std::string& ticker, double qty) {
    domain::Position p;
    p.ticker = ticker;
    p.quantity = qty;
    p.side = qty > 0 ? domain::BrokerSide::Buy : domain::BrokerSide::Sell;
    p.avg_price = 100.0;
    return p;
  }

  static domain::ActiveOrder working(std::int64_t id, const std::string& ticker) {
    domain::ActiveOrder o;
    o.order_id = id;
    o.ticker = ticker;
    o.action = "BUY";
    o.order_type = "MKT";
    o.total_quantity = 10.0;
    o.status = domain::OrderStatus::Submitted;
    return o;
  }

  meridian::EventBus bus;
  meridian::PortfolioServer portfolio{bus};
  std::vector<meridian::PositionUpdateEvent> position_updates;
  std::vector<meridian::OrderUpdateEvent> order_updates;
  int account_updates = 0;
};

// -----------------------------------------------------------------------------
// 1. Insert, replace, remove.
// -----------------------------------------------------------------------------
TEST_F(PortfolioServerTest, PositionLifecycle) {
  portfolio.updatePositions("AAPL", position("AAPL", 5.0));
  ASSERT_TRUE(portfolio.position("AAPL").has_value());
  EXPECT_DOUBLE_EQ(portfolio.position("AAPL")->quantity, 5.0);

  portfolio.updatePositions("AAPL", position("AAPL", 8.0));
  EXPECT_DOUBLE_EQ(portfolio.position("AAPL")->quantity, 8.0);

  portfolio.updatePositions("AAPL", position("AAPL", 0.0));
  EXPECT_FALSE(portfolio.position("AAPL").has_value());
  EXPECT_TRUE(portfolio.positions().empty());

  ASSERT_EQ(position_updates.size(), 3u);
  EXPECT_TRUE(position_updates[1].position.has_value());
  EXPECT_FALSE(position_updates[2].position.has_value());
  EXPECT_EQ(position_updates[2].ticker, "AAPL");
}

// -----------------------------------------------------------------------------
// 2. Re-delivered updates are no-ops.
// Why: the broker repeats portfolio and status callbacks after reconnects.
// -----------------------------------------------------------------------------
TEST_F(PortfolioServerTest, IdenticalUpdatesPublishNothing) {
  portfolio.updatePositions("AAPL", position("AAPL", 5.0));
  portfolio.updatePositions("AAPL", position("AAPL", 5.0));
  portfolio.updatePositions("MSFT", position("MSFT", 0.0));
  EXPECT_EQ(position_updates.size(), 1u);

  domain::OrderStatusUpdate cancelled;
  cancelled.order_id = 99;
  cancelled.status = domain::OrderStatus::Cancelled;
  portfolio.updateOrders(cancelled);
  portfolio.updateOrders(cancelled);
  EXPECT_TRUE(order_updates.empty());
}

// -----------------------------------------------------------------------------
// 3. Status reports merge into the open order; Cancelled removes it.
// -----------------------------------------------------------------------------
TEST_F(PortfolioServerTest, OrderStatusMergeAndCancel) {
  portfolio.updateOrders(working(1, "AAPL"));

  domain::OrderStatusUpdate partial;
  partial.order_id = 1;
  partial.status = domain::OrderStatus::Submitted;
  partial.filled = 4.0;
  partial.remaining = 6.0;
  portfolio.updateOrders(partial);

  auto stored = portfolio.activeOrder(1);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->ticker, "AAPL");
  EXPECT_DOUBLE_EQ(stored->filled, 4.0);

  // A repeated open-order report keeps the fill progress.
  portfolio.updateOrders(working(1, "AAPL"));
  EXPECT_DOUBLE_EQ(portfolio.activeOrder(1)->filled, 4.0);

  domain::OrderStatusUpdate cancelled;
  cancelled.order_id = 1;
  cancelled.status = domain::OrderStatus::Cancelled;
  portfolio.updateOrders(cancelled);

  EXPECT_FALSE(portfolio.activeOrder(1).has_value());
  EXPECT_TRUE(portfolio.activeOrderTickers().empty());
  ASSERT_FALSE(order_updates.empty());
  EXPECT_FALSE(order_updates.back().active);
  EXPECT_EQ(order_updates.back().order.status, domain::OrderStatus::Cancelled);
}

// -----------------------------------------------------------------------------
// 4. Filled: order leaves the active set, ticker waits for its position.
// -----------------------------------------------------------------------------
TEST_F(PortfolioServerTest, FilledOrderAwaitsPositionRefresh) {
  portfolio.updateOrders(working(2, "HEJ4"));
  EXPECT_EQ(portfolio.activeOrderTickers().count("HEJ4"), 1u);

  domain::OrderStatusUpdate filled;
  filled.order_id = 2;
  filled.status = domain::OrderStatus::Filled;
  filled.filled = 10.0;
  portfolio.updateOrders(filled);

  EXPECT_TRUE(portfolio.activeOrders().empty());
  EXPECT_TRUE(portfolio.pendingPositionRefresh("HEJ4"));
  EXPECT_EQ(portfolio.activeOrderTickers().count("HEJ4"), 1u);

  portfolio.updatePositions("HEJ4", position("HEJ4", 10.0));
  EXPECT_FALSE(portfolio.pendingPositionRefresh("HEJ4"));
  EXPECT_TRUE(portfolio.activeOrderTickers().empty());
}

// -----------------------------------------------------------------------------
// 5. A status that arrives before the open-order report creates the entry;
//    the report fills in the ticker later.
// -----------------------------------------------------------------------------
TEST_F(PortfolioServerTest, StatusBeforeOpenOrder) {
  domain::OrderStatusUpdate pre;
  pre.order_id = 5;
  pre.status = domain::OrderStatus::PreSubmitted;
  portfolio.updateOrders(pre);

  ASSERT_TRUE(portfolio.activeOrder(5).has_value());
  EXPECT_TRUE(portfolio.activeOrderTickers().empty());

  portfolio.updateOrders(working(5, "AAPL"));
  EXPECT_EQ(portfolio.activeOrder(5)->ticker, "AAPL");
  EXPECT_EQ(portfolio.activeOrderTickers().count("AAPL"), 1u);
}

// -----------------------------------------------------------------------------
// 6. Account snapshots replace each other and are always announced.
// -----------------------------------------------------------------------------
TEST_F(PortfolioServerTest, AccountDetails) {
  domain::Account account;
  account.timestamp = 10;
  account.available_funds = 5000.0;
  account.net_liquidation = 7000.0;
  account.buying_power = 20000.0;
  portfolio.updateAccountDetails(account);

  EXPECT_EQ(portfolio.account(), account);
  EXPECT_EQ(account_updates, 1);
}

// -----------------------------------------------------------------------------
// 7. Broker messages published on the bus reach the stores.
// -----------------------------------------------------------------------------
TEST_F(PortfolioServerTest, BrokerEventsDriveUpdates) {
  bus.publish(meridian::BrokerOpenOrderEvent{working(8, "AAPL")});
  bus.publish(meridian::BrokerPositionEvent{position("AAPL", 3.0)});

  domain::Account account;
  account.net_liquidation = 123.0;
  bus.publish(meridian::BrokerAccountEvent{account});

  domain::OrderStatusUpdate filled;
  filled.order_id = 8;
  filled.status = domain::OrderStatus::Filled;
  bus.publish(meridian::BrokerOrderStatusEvent{filled});

  EXPECT_DOUBLE_EQ(portfolio.position("AAPL")->quantity, 3.0);
  EXPECT_DOUBLE_EQ(portfolio.account().net_liquidation, 123.0);
  EXPECT_FALSE(portfolio.activeOrder(8).has_value());
  EXPECT_TRUE(portfolio.pendingPositionRefresh("AAPL"));
}
