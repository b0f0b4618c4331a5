// =============================================================================
// order_manager_test.cpp
// =============================================================================
// Unit tests for meridian::OrderManager.
//
// Validates:
//   - A signal yields one OrderEvent per instruction, or none at all
//   - Capital check uses available funds net of required margin
//   - Working orders and fills awaiting a position refresh block new signals
//   - Sizing: explicit quantity, capital x weight for entries, position size
//     for exits
// =============================================================================

#include "meridian/domain/symbol_registry.hpp"
#include "meridian/eventbus/event_bus.hpp"
#include "meridian/market/order_book.hpp"
#include "meridian/portfolio/portfolio_server.hpp"
#include "meridian/risk/order_manager.hpp"

#include <gtest/gtest.h>

#include <vector>

namespace domain = meridian::domain;

namespace {

domain::Instrument apple() {
  domain::Instrument i;
  i.ticker = "AAPL";
  i.security_type = domain::SecurityType::Equity;
  i.fees = 0.005;
  return i;
}

domain::Instrument leanHogs() {
  domain::Instrument i;
  i.ticker = "HEJ4";
  i.security_type = domain::SecurityType::Future;
  i.fees = 0.85;
  i.initial_margin = 4564.17;
  i.quantity_multiplier = 40000;
  i.price_multiplier = 0.01;
  i.tick_size = 0.00025;
  return i;
}

domain::TradeInstruction leg(const std::string& ticker, domain::Action action,
                             double weight, int leg_id = 1) {
  domain::TradeInstruction instruction;
  instruction.ticker = ticker;
  instruction.action = action;
  instruction.trade_id = 1;
  instruction.leg_id = leg_id;
  instruction.weight = weight;
  return instruction;
}

}  // namespace

class OrderManagerTest : public ::testing::Test {
 protected:
  OrderManagerTest() {
    bus.subscribe<meridian::OrderEvent>(
        [this](const meridian::OrderEvent& e) { orders.push_back(e); });

    domain::BarData aapl;
    aapl.open = aapl.high = aapl.low = aapl.close = 100.0;
    domain::BarData hogs;
    hogs.open = hogs.high = hogs.low = hogs.close = 50.0;
    book.updateMarketData({{"AAPL", aapl}, {"HEJ4", hogs}}, 1000);

    setAccount(100000.0, 0.0);
  }

  void setAccount(double funds, double margin) {
    domain::Account account;
    account.available_funds = funds;
    account.required_margin = margin;
    portfolio.updateAccountDetails(account);
  }

  meridian::SignalEvent signal(std::vector<domain::TradeInstruction> legs,
                               double trade_capital = 20000.0) {
    meridian::SignalEvent s;
    s.timestamp = 1000;
    s.trade_capital = trade_capital;
    s.instructions = std::move(legs);
    return s;
  }

  meridian::EventBus bus;
  domain::SymbolRegistry symbols{{apple(), leanHogs()}};
  meridian::OrderBook book{bus, domain::MarketDataType::Bar};
  meridian::PortfolioServer portfolio{bus};
  meridian::OrderManager manager{bus, symbols, book, portfolio};
  std::vector<meridian::OrderEvent> orders;
};

// -----------------------------------------------------------------------------
// 1. Affordable pair: one order per leg, sized from capital x |weight|.
// -----------------------------------------------------------------------------
TEST_F(OrderManagerTest, AffordableSignalEmitsEveryLeg) {
  EXPECT_TRUE(manager.onSignal(signal(
      {leg("AAPL", domain::Action::Long, 0.5, 1),
       leg("HEJ4", domain::Action::Short, -0.5, 2)})));

  ASSERT_EQ(orders.size(), 2u);
  EXPECT_EQ(orders[0].ticker, "AAPL");
  EXPECT_DOUBLE_EQ(orders[0].order.quantity(), 100.0);
  EXPECT_EQ(orders[0].leg_id, 1);

  // 10000 / (50 * 400) contracts, sold.
  EXPECT_EQ(orders[1].ticker, "HEJ4");
  EXPECT_DOUBLE_EQ(orders[1].order.quantity(), -0.5);
  EXPECT_EQ(orders[1].action, domain::Action::Short);

  EXPECT_EQ(manager.acceptedSignals(), 1);
  EXPECT_EQ(manager.rejectedSignals(), 0);
}

// -----------------------------------------------------------------------------
// 2. One unaffordable leg drops the whole signal.
// Why: a pair trade with one leg filled is an unhedged position.
// -----------------------------------------------------------------------------
TEST_F(OrderManagerTest, UnaffordableSignalEmitsNothing) {
  setAccount(5000.0, 0.0);

  EXPECT_FALSE(manager.onSignal(signal(
      {leg("HEJ4", domain::Action::Short, -0.1, 1),
       leg("AAPL", domain::Action::Long, 0.5, 2)})));

  EXPECT_TRUE(orders.empty());
  EXPECT_EQ(manager.rejectedSignals(), 1);
}

// -----------------------------------------------------------------------------
// 3. Margin already in use reduces the capital available.
// -----------------------------------------------------------------------------
TEST_F(OrderManagerTest, RequiredMarginReducesFreeCapital) {
  setAccount(20000.0, 15000.0);
  EXPECT_FALSE(manager.onSignal(signal({leg("AAPL", domain::Action::Long, 0.5)})));

  setAccount(20000.0, 10000.0);
  EXPECT_TRUE(manager.onSignal(signal({leg("AAPL", domain::Action::Long, 0.5)})));
  EXPECT_EQ(orders.size(), 1u);
}

// -----------------------------------------------------------------------------
// 4. A working order on any leg's ticker blocks the signal.
// -----------------------------------------------------------------------------
TEST_F(OrderManagerTest, WorkingOrderBlocksSignal) {
  domain::ActiveOrder working;
  working.order_id = 12;
  working.ticker = "HEJ4";
  working.status = domain::OrderStatus::Submitted;
  portfolio.updateOrders(working);

  EXPECT_FALSE(manager.onSignal(signal(
      {leg("AAPL", domain::Action::Long, 0.5, 1),
       leg("HEJ4", domain::Action::Short, -0.5, 2)})));
  EXPECT_TRUE(orders.empty());

  // Filled: still blocked until the position refresh arrives.
  domain::OrderStatusUpdate filled;
  filled.order_id = 12;
  filled.status = domain::OrderStatus::Filled;
  portfolio.updateOrders(filled);
  EXPECT_FALSE(manager.onSignal(signal({leg("HEJ4", domain::Action::Short, -0.5)})));

  domain::Position refreshed;
  refreshed.ticker = "HEJ4";
  refreshed.security_type = domain::SecurityType::Future;
  refreshed.side = domain::BrokerSide::Sell;
  refreshed.quantity = -1.0;
  portfolio.updatePositions("HEJ4", refreshed);
  EXPECT_TRUE(manager.onSignal(signal({leg("HEJ4", domain::Action::Short, -0.5)})));
  EXPECT_EQ(manager.rejectedSignals(), 2);
}

// -----------------------------------------------------------------------------
// 5. An explicit quantity wins over the weight.
// -----------------------------------------------------------------------------
TEST_F(OrderManagerTest, ExplicitQuantityOverridesWeight) {
  auto instruction = leg("AAPL", domain::Action::Long, 0.9);
  instruction.quantity = 3.0;

  EXPECT_TRUE(manager.onSignal(signal({instruction})));
  ASSERT_EQ(orders.size(), 1u);
  EXPECT_DOUBLE_EQ(orders[0].order.quantity(), 3.0);
}

// -----------------------------------------------------------------------------
// 6. Exits without a quantity close the whole held position.
// -----------------------------------------------------------------------------
TEST_F(OrderManagerTest, ExitSizedFromHeldPosition) {
  domain::Position held;
  held.ticker = "AAPL";
  held.quantity = 7.0;
  held.avg_price = 95.0;
  portfolio.updatePositions("AAPL", held);

  EXPECT_TRUE(manager.onSignal(signal({leg("AAPL", domain::Action::Sell, 0.5)})));
  ASSERT_EQ(orders.size(), 1u);
  EXPECT_DOUBLE_EQ(orders[0].order.quantity(), -7.0);
  EXPECT_EQ(orders[0].order.side(), domain::BrokerSide::Sell);
}

// -----------------------------------------------------------------------------
// 7. Limit instructions carry their price onto the order.
// -----------------------------------------------------------------------------
TEST_F(OrderManagerTest, LimitInstructionBecomesLimitOrder) {
  auto instruction = leg("AAPL", domain::Action::Long, 0.1);
  instruction.order_type = domain::OrderType::Limit;
  instruction.limit_price = 99.5;

  EXPECT_TRUE(manager.onSignal(signal({instruction})));
  ASSERT_EQ(orders.size(), 1u);
  EXPECT_EQ(orders[0].order.type(), domain::OrderType::Limit);
  EXPECT_DOUBLE_EQ(orders[0].order.limitPrice().value_or(0.0), 99.5);
}

// -----------------------------------------------------------------------------
// 8. Signals that cannot be sized or priced are rejected whole.
// -----------------------------------------------------------------------------
TEST_F(OrderManagerTest, UnusableSignalsRejected) {
  EXPECT_FALSE(manager.onSignal(signal({})));
  EXPECT_FALSE(manager.onSignal(signal({leg("MSFT", domain::Action::Long, 0.5)})));
  // Exit with nothing held.
  EXPECT_FALSE(manager.onSignal(signal({leg("AAPL", domain::Action::Cover, 0.5)})));
  // Entry with no capital to size from.
  EXPECT_FALSE(manager.onSignal(
      signal({leg("AAPL", domain::Action::Long, 0.5)}, 0.0)));
  // Invalid leg id.
  EXPECT_FALSE(manager.onSignal(
      signal({leg("AAPL", domain::Action::Long, 0.5, 0)})));

  EXPECT_TRUE(orders.empty());
  EXPECT_EQ(manager.rejectedSignals(), 5);
  EXPECT_EQ(manager.acceptedSignals(), 0);
}

// -----------------------------------------------------------------------------
// 9. SignalEvent published on the bus goes through onSignal().
// -----------------------------------------------------------------------------
TEST_F(OrderManagerTest, SubscribedToSignalEvents) {
  bus.publish(signal({leg("AAPL", domain::Action::Long, 0.25)}));

  ASSERT_EQ(orders.size(), 1u);
  EXPECT_DOUBLE_EQ(orders[0].order.quantity(), 50.0);
  EXPECT_EQ(orders[0].timestamp, 1000);
}
