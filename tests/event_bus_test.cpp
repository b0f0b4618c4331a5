// =============================================================================
// event_bus_test.cpp
// =============================================================================
// Unit tests for meridian::EventBus and meridian::EventLoopThread.
//
// Validates:
//   - Typed subscriptions only see their alternative of the Event variant
//   - Registration order is delivery order
//   - unsubscribe() stops delivery; unknown ids are harmless
//   - Publishing from inside a callback (the backtest fill chain) works
//   - EventLoopThread delivers pushed events on its worker and drains on stop
// =============================================================================

#include "meridian/concurrent/event_loop_thread.hpp"
#include "meridian/eventbus/event_bus.hpp"
#include "meridian/events/event.hpp"
#include "meridian/events/event_types.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <string>
#include <thread>
#include <vector>

class EventBusTest : public ::testing::Test {
 protected:
  meridian::EventBus bus;

  static meridian::MarketFeedEvent makeFeed(const std::string& ticker,
                                            double close,
                                            std::int64_t ts = 1) {
    meridian::domain::BarData bar;
    bar.timestamp = ts;
    bar.open = bar.high = bar.low = bar.close = close;
    meridian::MarketFeedEvent e;
    e.timestamp = ts;
    e.data.emplace(ticker, bar);
    return e;
  }
};

// -----------------------------------------------------------------------------
// 1. A generic subscriber sees every alternative.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, GenericSubscriberReceivesAllEvents) {
  int calls = 0;
  bus.subscribe([&calls](const meridian::Event&) { ++calls; });

  bus.publish(makeFeed("AAPL", 150.0));
  bus.publish(meridian::SignalEvent{});
  bus.publish(meridian::EndOfDayEvent{42});

  EXPECT_EQ(calls, 3);
  EXPECT_EQ(bus.subscriberCount(), 1u);
}

// -----------------------------------------------------------------------------
// 2. subscribe<T> filters on the variant alternative.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TypedSubscriberFiltersCorrectly) {
  int feeds = 0;
  int end_of_days = 0;
  bus.subscribe<meridian::MarketFeedEvent>(
      [&feeds](const meridian::MarketFeedEvent&) { ++feeds; });
  bus.subscribe<meridian::EndOfDayEvent>(
      [&end_of_days](const meridian::EndOfDayEvent&) { ++end_of_days; });

  bus.publish(makeFeed("AAPL", 150.0));
  bus.publish(meridian::SignalEvent{});
  bus.publish(meridian::EndOfDayEvent{1});
  bus.publish(meridian::EndOfDayEvent{2});

  EXPECT_EQ(feeds, 1);
  EXPECT_EQ(end_of_days, 2);
}

// -----------------------------------------------------------------------------
// 3. Subscribers run in registration order.
// Why: OrderBook must apply a batch before anything that prices off it.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, DeliveryFollowsRegistrationOrder) {
  std::vector<std::string> order;
  bus.subscribe<meridian::EndOfDayEvent>(
      [&order](const meridian::EndOfDayEvent&) { order.push_back("first"); });
  bus.subscribe<meridian::EndOfDayEvent>(
      [&order](const meridian::EndOfDayEvent&) { order.push_back("second"); });
  bus.subscribe<meridian::EndOfDayEvent>(
      [&order](const meridian::EndOfDayEvent&) { order.push_back("third"); });

  bus.publish(meridian::EndOfDayEvent{1});

  EXPECT_EQ(order, (std::vector<std::string>{"first", "second", "third"}));
}

// -----------------------------------------------------------------------------
// 4. unsubscribe(id) stops delivery; a bogus id is a no-op.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, UnsubscribeStopsDelivery) {
  int calls = 0;
  auto id = bus.subscribe<meridian::EndOfDayEvent>(
      [&calls](const meridian::EndOfDayEvent&) { ++calls; });

  bus.publish(meridian::EndOfDayEvent{1});
  bus.unsubscribe(id);
  bus.publish(meridian::EndOfDayEvent{2});
  EXPECT_EQ(calls, 1);

  EXPECT_NO_FATAL_FAILURE(bus.unsubscribe(9999));
  EXPECT_EQ(bus.subscriberCount(), 0u);
}

// -----------------------------------------------------------------------------
// 5. A callback may publish: signal -> order runs inside one outer publish.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, SubscriberCanPublishInsideCallback) {
  std::vector<std::string> tickers;
  bus.subscribe<meridian::OrderEvent>(
      [&tickers](const meridian::OrderEvent& e) { tickers.push_back(e.ticker); });
  bus.subscribe<meridian::SignalEvent>([this](const meridian::SignalEvent& s) {
    for (const auto& instruction : s.instructions) {
      meridian::OrderEvent order;
      order.timestamp = s.timestamp;
      order.ticker = instruction.ticker;
      bus.publish(order);
    }
  });

  meridian::SignalEvent signal;
  signal.timestamp = 5;
  signal.instructions.resize(2);
  signal.instructions[0].ticker = "AAPL";
  signal.instructions[1].ticker = "MSFT";
  bus.publish(signal);

  EXPECT_EQ(tickers, (std::vector<std::string>{"AAPL", "MSFT"}));
}

// -----------------------------------------------------------------------------
// 6. Payload survives the variant dispatch.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TypedSubscriberReceivesCorrectData) {
  double close = 0.0;
  std::int64_t ts = 0;
  bus.subscribe<meridian::MarketFeedEvent>(
      [&](const meridian::MarketFeedEvent& e) {
        ts = e.timestamp;
        close = meridian::domain::priceOf(e.data.at("TSLA"));
      });

  bus.publish(makeFeed("TSLA", 237.5, 1700000000000000000));

  EXPECT_EQ(ts, 1700000000000000000);
  EXPECT_DOUBLE_EQ(close, 237.5);
}

// =============================================================================
// EventLoopThread
// =============================================================================

// -----------------------------------------------------------------------------
// 7. Pushed events are published on the worker thread, not the caller's.
// -----------------------------------------------------------------------------
TEST(EventLoopThreadTest, DeliversOnWorkerThread) {
  meridian::EventLoopThread loop("test-loop");
  std::promise<std::thread::id> delivered_on;
  loop.eventBus().subscribe<meridian::EndOfDayEvent>(
      [&delivered_on](const meridian::EndOfDayEvent&) {
        delivered_on.set_value(std::this_thread::get_id());
      });

  loop.start();
  loop.push(meridian::EndOfDayEvent{1});

  auto future = delivered_on.get_future();
  ASSERT_EQ(future.wait_for(std::chrono::seconds(2)),
            std::future_status::ready);
  EXPECT_NE(future.get(), std::this_thread::get_id());
  EXPECT_EQ(loop.name(), "test-loop");

  loop.stop();
  EXPECT_FALSE(loop.isRunning());
}

// -----------------------------------------------------------------------------
// 8. stop() publishes everything still queued before joining.
// -----------------------------------------------------------------------------
TEST(EventLoopThreadTest, StopDrainsQueue) {
  meridian::EventLoopThread loop;
  std::atomic<int> seen{0};
  loop.eventBus().subscribe<meridian::EndOfDayEvent>(
      [&seen](const meridian::EndOfDayEvent&) { ++seen; });

  loop.start();
  for (int i = 0; i < 500; ++i) {
    loop.push(meridian::EndOfDayEvent{i});
  }
  loop.stop();

  EXPECT_EQ(seen.load(), 500);
}

// -----------------------------------------------------------------------------
// 9. start() and stop() are idempotent.
// -----------------------------------------------------------------------------
TEST(EventLoopThreadTest, StartStopIdempotent) {
  meridian::EventLoopThread loop;
  loop.start();
  loop.start();
  EXPECT_TRUE(loop.isRunning());
  loop.stop();
  loop.stop();
  EXPECT_FALSE(loop.isRunning());
}
