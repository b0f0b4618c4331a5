// =============================================================================
// broker_wrapper_test.cpp
// =============================================================================
// Unit tests for meridian::BrokerWrapper and the broker message codec.
//
// Validates:
//   - Account values are buffered and flushed once per debounced burst
//   - accountDownloadEnd flushes at once, logs and signals the handshake
//   - Portfolio pushes become BrokerPositionEvents; unknown tickers dropped
//   - Error 502 reaches the fatal handler; error 200 fails validation
//   - Contract replies only count for the request id in flight
//   - nextValidId resets the shared id generator; connectionClosed marks the
//     session lost until the next handshake
//   - dispatchBrokerMessage routes wire messages to the right callback
//
// Fixtures:
//   The portfolio sink collects events into a vector (guarded: the debounce
//   flush runs on the timer thread). A real PerformanceCollector on a private
//   bus receives the live-only records.
// =============================================================================

#include "meridian/broker/broker_codec.hpp"
#include "meridian/broker/broker_wrapper.hpp"
#include "meridian/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
namespace domain = meridian::domain;

namespace {

domain::Instrument apple() {
  domain::Instrument i;
  i.ticker = "AAPL";
  i.security_type = domain::SecurityType::Equity;
  i.exchange = "SMART";
  return i;
}

domain::Instrument leanHogs() {
  domain::Instrument i;
  i.ticker = "HEJ4";
  i.security_type = domain::SecurityType::Future;
  i.exchange = "CME";
  i.initial_margin = 4564.17;
  i.quantity_multiplier = 40000;
  i.price_multiplier = 0.01;
  return i;
}

}  // namespace

class BrokerWrapperTest : public ::testing::Test {
 protected:
  template <typename T>
  std::vector<T> collected() {
    std::lock_guard lock(mutex);
    std::vector<T> out;
    for (const auto& e : events) {
      if (const auto* typed = std::get_if<T>(&e)) {
        out.push_back(*typed);
      }
    }
    return out;
  }

  template <typename T>
  bool waitFor(std::size_t count, std::chrono::milliseconds limit) {
    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
      if (collected<T>().size() >= count) {
        return true;
      }
      std::this_thread::sleep_for(2ms);
    }
    return collected<T>().size() >= count;
  }

  void pushAccountBurst(const std::string& net_liquidation) {
    wrapper.updateAccountValue("FullAvailableFunds", "50000", "USD", "DU1");
    wrapper.updateAccountValue("FullInitMarginReq", "1200", "USD", "DU1");
    wrapper.updateAccountValue("NetLiquidation", net_liquidation, "USD", "DU1");
    wrapper.updateAccountValue("UnrealizedPnL", "-35.5", "USD", "DU1");
  }

  std::mutex mutex;
  std::vector<meridian::Event> events;
  std::vector<int> fatal_codes;

  meridian::EventBus perf_bus;
  meridian::PerformanceCollector performance{perf_bus,
                                             nlohmann::json::object(), 1e5};
  meridian::SimulationTimeProvider clock{42};
  meridian::OrderIdGenerator ids;
  domain::SymbolRegistry symbols{{apple(), leanHogs()}};
  meridian::BrokerWrapper wrapper{
      symbols,
      [this](meridian::Event e) {
        std::lock_guard lock(mutex);
        events.push_back(std::move(e));
      },
      performance,
      clock,
      ids,
      40ms,
      [this](int code, const std::string&) { fatal_codes.push_back(code); }};
};

// -----------------------------------------------------------------------------
// 1. A burst of account values is flushed once, after the quiet period.
// -----------------------------------------------------------------------------
TEST_F(BrokerWrapperTest, AccountBurstFlushedOnce) {
  pushAccountBurst("70000");
  EXPECT_TRUE(wrapper.accountFlushPending());
  EXPECT_TRUE(collected<meridian::BrokerAccountEvent>().empty());

  ASSERT_TRUE(waitFor<meridian::BrokerAccountEvent>(1, 2s));
  std::this_thread::sleep_for(80ms);

  auto flushed = collected<meridian::BrokerAccountEvent>();
  ASSERT_EQ(flushed.size(), 1u);
  const auto& account = flushed[0].account;
  EXPECT_DOUBLE_EQ(account.available_funds, 50000.0);
  EXPECT_DOUBLE_EQ(account.required_margin, 1200.0);
  EXPECT_DOUBLE_EQ(account.net_liquidation, 70000.0);
  EXPECT_DOUBLE_EQ(account.unrealized_pnl, -35.5);
  EXPECT_FALSE(account.buying_power.has_value());
  EXPECT_EQ(account.timestamp, 42);
}

// -----------------------------------------------------------------------------
// 2. Keys outside the tracked set and non-numeric values are ignored.
// -----------------------------------------------------------------------------
TEST_F(BrokerWrapperTest, UntrackedAndMalformedValuesIgnored) {
  wrapper.updateAccountValue("AccountCode", "DU1", "", "DU1");
  wrapper.updateAccountValue("NetLiquidation", "n/a", "USD", "DU1");
  wrapper.updateAccountValue("BuyingPower", "200000", "USD", "DU1");
  wrapper.updateAccountValue("Currency", "EUR", "", "DU1");

  auto account = wrapper.bufferedAccount();
  EXPECT_DOUBLE_EQ(account.net_liquidation, 0.0);
  EXPECT_DOUBLE_EQ(account.buying_power.value_or(0.0), 200000.0);
  EXPECT_EQ(account.currency, "EUR");
  EXPECT_FALSE(wrapper.accountFlushPending());
}

// -----------------------------------------------------------------------------
// 3. accountDownloadEnd flushes immediately and completes the handshake step.
// -----------------------------------------------------------------------------
TEST_F(BrokerWrapperTest, DownloadEndFlushesAndSignals) {
  pushAccountBurst("65000");
  wrapper.accountDownloadEnd("DU1");

  EXPECT_FALSE(wrapper.accountFlushPending());
  EXPECT_TRUE(wrapper.accountDownload().isSet());
  auto flushed = collected<meridian::BrokerAccountEvent>();
  ASSERT_EQ(flushed.size(), 1u);
  EXPECT_DOUBLE_EQ(flushed[0].account.net_liquidation, 65000.0);
  EXPECT_EQ(performance.accountLogSize(), 1u);

  // The cancelled timer must not flush a second copy.
  std::this_thread::sleep_for(80ms);
  EXPECT_EQ(collected<meridian::BrokerAccountEvent>().size(), 1u);
}

// -----------------------------------------------------------------------------
// 4. Portfolio pushes carry the instrument's contract terms.
// -----------------------------------------------------------------------------
TEST_F(BrokerWrapperTest, PortfolioPushBecomesPositionEvent) {
  meridian::BrokerPortfolioItem item;
  item.contract.ticker = "HEJ4";
  item.position = -2.0;
  item.average_cost = 36000.0;
  item.market_price = 0.9;
  item.unrealized_pnl = 150.0;
  wrapper.updatePortfolio(item);

  item.contract.ticker = "ZZZZ";
  wrapper.updatePortfolio(item);

  auto pushed = collected<meridian::BrokerPositionEvent>();
  ASSERT_EQ(pushed.size(), 1u);
  const auto& position = pushed[0].position;
  EXPECT_EQ(position.ticker, "HEJ4");
  EXPECT_EQ(position.security_type, domain::SecurityType::Future);
  EXPECT_EQ(position.side, domain::BrokerSide::Sell);
  EXPECT_DOUBLE_EQ(position.quantity, -2.0);
  EXPECT_DOUBLE_EQ(position.avg_price, 36000.0);
  EXPECT_DOUBLE_EQ(position.initial_margin, 4564.17);
}

// -----------------------------------------------------------------------------
// 5. Order callbacks are forwarded to the portfolio loop unchanged.
// -----------------------------------------------------------------------------
TEST_F(BrokerWrapperTest, OrderCallbacksForwarded) {
  domain::ActiveOrder order;
  order.order_id = 7;
  order.ticker = "AAPL";
  wrapper.openOrder(order);
  wrapper.openOrderEnd();

  domain::OrderStatusUpdate update;
  update.order_id = 7;
  update.status = domain::OrderStatus::Filled;
  wrapper.orderStatus(update);

  EXPECT_TRUE(wrapper.openOrders().isSet());
  ASSERT_EQ(collected<meridian::BrokerOpenOrderEvent>().size(), 1u);
  auto statuses = collected<meridian::BrokerOrderStatusEvent>();
  ASSERT_EQ(statuses.size(), 1u);
  EXPECT_EQ(statuses[0].update.status, domain::OrderStatus::Filled);
}

// -----------------------------------------------------------------------------
// 6. 502 is fatal; 200 fails the contract validation in flight; others log.
// -----------------------------------------------------------------------------
TEST_F(BrokerWrapperTest, ErrorCodes) {
  wrapper.beginContractValidation(3);
  EXPECT_FALSE(wrapper.contractValid().has_value());

  // 200 for some other request leaves the one in flight pending.
  wrapper.error(2, meridian::BrokerWrapper::kContractNotFoundError,
                "No security definition");
  EXPECT_FALSE(wrapper.contractDetailsReceived().isSet());
  EXPECT_FALSE(wrapper.contractValid().has_value());

  wrapper.error(3, meridian::BrokerWrapper::kContractNotFoundError,
                "No security definition");
  EXPECT_TRUE(wrapper.contractDetailsReceived().isSet());
  EXPECT_EQ(wrapper.contractValid(), std::optional<bool>(false));
  EXPECT_TRUE(fatal_codes.empty());

  wrapper.error(-1, 2104, "Market data farm connection is OK");
  EXPECT_TRUE(fatal_codes.empty());

  wrapper.error(-1, meridian::BrokerWrapper::kWrongEndpointError,
                "Couldn't connect to TWS");
  ASSERT_EQ(fatal_codes.size(), 1u);
  EXPECT_EQ(fatal_codes[0], 502);
}

// -----------------------------------------------------------------------------
// 7. Contract details mark the contract valid once the end marker arrives.
// -----------------------------------------------------------------------------
TEST_F(BrokerWrapperTest, ContractDetailsValidate) {
  wrapper.beginContractValidation(4);
  meridian::BrokerContract contract;
  contract.ticker = "AAPL";

  // Details and end marker of an earlier request are not ours.
  wrapper.contractDetails(1, contract);
  wrapper.contractDetailsEnd(1);
  EXPECT_FALSE(wrapper.contractDetailsReceived().isSet());
  EXPECT_FALSE(wrapper.contractValid().has_value());

  wrapper.contractDetails(4, contract);
  EXPECT_FALSE(wrapper.contractDetailsReceived().isSet());
  wrapper.contractDetailsEnd(4);

  EXPECT_TRUE(wrapper.contractDetailsReceived().isSet());
  EXPECT_EQ(wrapper.contractValid(), std::optional<bool>(true));
}

// -----------------------------------------------------------------------------
// 8. nextValidId moves the shared id sequence forward, never backwards.
// -----------------------------------------------------------------------------
TEST_F(BrokerWrapperTest, NextValidIdResetsGenerator) {
  wrapper.connectAck();
  wrapper.nextValidId(100);
  EXPECT_TRUE(wrapper.connected().isSet());
  EXPECT_TRUE(wrapper.validId().isSet());
  EXPECT_EQ(ids.next_id(), 100);

  wrapper.nextValidId(50);
  EXPECT_EQ(ids.next_id(), 101);

  wrapper.connectionClosed();
  EXPECT_FALSE(wrapper.connected().isSet());
  EXPECT_TRUE(wrapper.sessionLost());

  // A later ack does not clear the loss; only a new handshake does.
  wrapper.connectAck();
  EXPECT_TRUE(wrapper.sessionLost());

  wrapper.resetHandshake();
  EXPECT_FALSE(wrapper.validId().isSet());
  EXPECT_FALSE(wrapper.sessionLost());
}

// -----------------------------------------------------------------------------
// 9. Execution and commission reports land in the performance record.
// -----------------------------------------------------------------------------
TEST_F(BrokerWrapperTest, ExecutionsRecorded) {
  domain::ExecutionDetail detail;
  detail.exec_id = "0001.01";
  detail.ticker = "AAPL";
  detail.quantity = 10.0;
  detail.price = 150.0;
  wrapper.execDetails(-1, detail);

  domain::CommissionReport report;
  report.exec_id = "0001.01";
  report.commission = 1.0;
  wrapper.commissionReport(report);

  auto summary = performance.summary();
  ASSERT_TRUE(summary.contains("executions"));
  ASSERT_EQ(summary["executions"].size(), 1u);
  EXPECT_DOUBLE_EQ(summary["executions"][0]["commission"].get<double>(), 1.0);
}

// =============================================================================
// dispatchBrokerMessage
// =============================================================================

TEST_F(BrokerWrapperTest, CodecDispatchesWireMessages) {
  meridian::dispatchBrokerMessage(
      nlohmann::json{{"type", "next_valid_id"}, {"order_id", 900}}, wrapper);
  EXPECT_EQ(ids.peek(), 900);

  meridian::dispatchBrokerMessage(
      nlohmann::json{{"type", "portfolio"},
                     {"contract", {{"symbol", "AAPL"}, {"sec_type", "STK"}}},
                     {"position", 12.0},
                     {"average_cost", 101.5}},
      wrapper);
  auto pushed = collected<meridian::BrokerPositionEvent>();
  ASSERT_EQ(pushed.size(), 1u);
  EXPECT_DOUBLE_EQ(pushed[0].position.quantity, 12.0);

  meridian::dispatchBrokerMessage(
      nlohmann::json{{"type", "order_status"},
                     {"order_id", 900},
                     {"status", "Cancelled"}},
      wrapper);
  auto statuses = collected<meridian::BrokerOrderStatusEvent>();
  ASSERT_EQ(statuses.size(), 1u);
  EXPECT_EQ(statuses[0].update.status, domain::OrderStatus::Cancelled);

  wrapper.beginContractValidation(5);
  meridian::dispatchBrokerMessage(
      nlohmann::json{{"type", "error"}, {"req_id", 5}, {"code", 200}}, wrapper);
  EXPECT_EQ(wrapper.contractValid(), std::optional<bool>(false));
}

TEST_F(BrokerWrapperTest, CodecRejectsUnknownAndMalformedMessages) {
  EXPECT_THROW(meridian::dispatchBrokerMessage(
                   nlohmann::json{{"type", "tick_price"}}, wrapper),
               std::invalid_argument);
  EXPECT_THROW(meridian::dispatchBrokerMessage(
                   nlohmann::json{{"type", "next_valid_id"}}, wrapper),
               nlohmann::json::exception);
}

TEST(BrokerCodecTest, PlaceOrderEncoding) {
  domain::Instrument instrument = leanHogs();
  auto order = domain::makeOrder(domain::Action::Short, 3.0,
                                 domain::OrderType::Limit, 0.92);

  auto j = meridian::encodePlaceOrder(17, meridian::contractFor(instrument),
                                      order);
  EXPECT_EQ(j["type"], "place_order");
  EXPECT_EQ(j["order_id"], 17);
  EXPECT_EQ(j["contract"]["symbol"], "HEJ4");
  EXPECT_EQ(j["contract"]["sec_type"], "FUT");
  EXPECT_EQ(j["action"], "SELL");
  EXPECT_DOUBLE_EQ(j["total_quantity"].get<double>(), 3.0);
  EXPECT_EQ(j["order_type"], "LMT");
  EXPECT_DOUBLE_EQ(j["limit_price"].get<double>(), 0.92);
}
