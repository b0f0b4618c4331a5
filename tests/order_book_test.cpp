// =============================================================================
// order_book_test.cpp
// =============================================================================
// Unit tests for meridian::OrderBook.
//
// Validates:
//   - Bar books price at the close, quote books at the mid
//   - A batch is applied wholesale and announced once
//   - A batch with one bad entry (wrong kind or invalid range) changes nothing
//   - A batch older than the last update is refused; equal times are applied
//   - Feed events on the bus reach updateMarketData(); rejects are dropped
// =============================================================================

#include "meridian/eventbus/event_bus.hpp"
#include "meridian/market/order_book.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

namespace domain = meridian::domain;

namespace {

domain::BarData bar(double close, std::int64_t ts = 1) {
  domain::BarData b;
  b.timestamp = ts;
  b.open = b.high = b.low = b.close = close;
  b.volume = 100.0;
  return b;
}

domain::QuoteData quote(double bid, double ask, std::int64_t ts = 1) {
  domain::QuoteData q;
  q.timestamp = ts;
  q.bid = bid;
  q.ask = ask;
  q.bid_size = 10.0;
  q.ask_size = 12.0;
  return q;
}

}  // namespace

class OrderBookTest : public ::testing::Test {
 protected:
  meridian::EventBus bus;
  meridian::OrderBook book{bus, domain::MarketDataType::Bar};
};

// -----------------------------------------------------------------------------
// 1. Unknown tickers have no price; an applied batch sets price and time.
// -----------------------------------------------------------------------------
TEST_F(OrderBookTest, BatchSetsPricesAndLastUpdated) {
  EXPECT_FALSE(book.currentPrice("AAPL").has_value());

  book.updateMarketData({{"AAPL", bar(150.0)}, {"MSFT", bar(300.0)}}, 1000);

  EXPECT_DOUBLE_EQ(book.currentPrice("AAPL").value(), 150.0);
  EXPECT_DOUBLE_EQ(book.currentPrice("MSFT").value(), 300.0);
  EXPECT_EQ(book.lastUpdated(), 1000);
  EXPECT_EQ(book.currentPrices().size(), 2u);
}

// -----------------------------------------------------------------------------
// 2. Later batches overwrite only the tickers they carry.
// -----------------------------------------------------------------------------
TEST_F(OrderBookTest, LaterBatchOverwritesOnlyItsTickers) {
  book.updateMarketData({{"AAPL", bar(150.0)}, {"MSFT", bar(300.0)}}, 1000);
  book.updateMarketData({{"AAPL", bar(151.0, 2)}}, 2000);

  EXPECT_DOUBLE_EQ(book.currentPrice("AAPL").value(), 151.0);
  EXPECT_DOUBLE_EQ(book.currentPrice("MSFT").value(), 300.0);
  EXPECT_EQ(book.lastUpdated(), 2000);

  auto stored = book.marketData("AAPL");
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(domain::timestampOf(*stored), 2);
}

// -----------------------------------------------------------------------------
// 3. One MarketDataEvent per batch, carrying the whole batch.
// -----------------------------------------------------------------------------
TEST_F(OrderBookTest, PublishesOneEventPerBatch) {
  int events = 0;
  std::size_t tickers = 0;
  bus.subscribe<meridian::MarketDataEvent>(
      [&](const meridian::MarketDataEvent& e) {
        ++events;
        tickers = e.data.size();
        EXPECT_EQ(e.timestamp, 5000);
      });

  book.updateMarketData({{"AAPL", bar(150.0)}, {"MSFT", bar(300.0)}}, 5000);

  EXPECT_EQ(events, 1);
  EXPECT_EQ(tickers, 2u);
}

// -----------------------------------------------------------------------------
// 4. A quote sent to a bar book rejects the whole batch.
// Why: a half-applied batch would leave prices from two different moments.
// -----------------------------------------------------------------------------
TEST_F(OrderBookTest, WrongKindRejectsWholeBatch) {
  book.updateMarketData({{"AAPL", bar(150.0)}}, 1000);

  EXPECT_THROW(book.updateMarketData(
                   {{"AAPL", bar(999.0)}, {"MSFT", quote(1.0, 2.0)}}, 2000),
               std::invalid_argument);

  EXPECT_DOUBLE_EQ(book.currentPrice("AAPL").value(), 150.0);
  EXPECT_FALSE(book.currentPrice("MSFT").has_value());
  EXPECT_EQ(book.lastUpdated(), 1000);
}

// -----------------------------------------------------------------------------
// 5. Non-positive prices are invalid.
// -----------------------------------------------------------------------------
TEST_F(OrderBookTest, InvalidBarRejected) {
  auto broken = bar(150.0);
  broken.low = 0.0;
  EXPECT_THROW(book.updateMarketData({{"AAPL", broken}}, 1000),
               std::invalid_argument);
  EXPECT_FALSE(book.currentPrice("AAPL").has_value());
}

// -----------------------------------------------------------------------------
// 6. Quote books price at the mid and replace quotes wholesale.
// -----------------------------------------------------------------------------
TEST(QuoteOrderBookTest, MidPriceAndReplacement) {
  meridian::EventBus bus;
  meridian::OrderBook book(bus, domain::MarketDataType::Quote);

  book.updateMarketData({{"ES", quote(99.0, 101.0)}}, 1);
  EXPECT_DOUBLE_EQ(book.currentPrice("ES").value(), 100.0);

  book.updateMarketData({{"ES", quote(102.0, 102.5, 2)}}, 2);
  EXPECT_DOUBLE_EQ(book.currentPrice("ES").value(), 102.25);

  auto stored = book.marketData("ES");
  ASSERT_TRUE(stored.has_value());
  const auto& q = std::get<domain::QuoteData>(*stored);
  EXPECT_DOUBLE_EQ(q.bid, 102.0);
  EXPECT_DOUBLE_EQ(q.ask, 102.5);
  EXPECT_EQ(book.dataType(), domain::MarketDataType::Quote);
}

// -----------------------------------------------------------------------------
// 7. MarketFeedEvent on the bus drives the book; a bad feed is logged and
//    dropped without throwing out of publish().
// -----------------------------------------------------------------------------
TEST_F(OrderBookTest, FeedEventsOnBus) {
  meridian::MarketFeedEvent good;
  good.timestamp = 10;
  good.data.emplace("AAPL", bar(123.0));
  bus.publish(good);
  EXPECT_DOUBLE_EQ(book.currentPrice("AAPL").value(), 123.0);

  meridian::MarketFeedEvent bad;
  bad.timestamp = 20;
  bad.data.emplace("AAPL", quote(1.0, 2.0));
  EXPECT_NO_THROW(bus.publish(bad));
  EXPECT_DOUBLE_EQ(book.currentPrice("AAPL").value(), 123.0);
  EXPECT_EQ(book.lastUpdated(), 10);
}

// -----------------------------------------------------------------------------
// 8. Out-of-order batches: an older timestamp changes nothing, whether it
//    comes through updateMarketData() or the feed.
// -----------------------------------------------------------------------------
TEST_F(OrderBookTest, OlderBatchRejected) {
  book.updateMarketData({{"ES", bar(100.0, 200)}}, 200);

  EXPECT_THROW(book.updateMarketData({{"ES", bar(90.0, 100)}}, 100),
               std::invalid_argument);
  EXPECT_EQ(book.lastUpdated(), 200);
  EXPECT_DOUBLE_EQ(book.currentPrice("ES").value(), 100.0);

  meridian::MarketFeedEvent late;
  late.timestamp = 150;
  late.data.emplace("ES", bar(80.0, 150));
  EXPECT_NO_THROW(bus.publish(late));
  EXPECT_EQ(book.lastUpdated(), 200);
  EXPECT_DOUBLE_EQ(book.currentPrice("ES").value(), 100.0);

  book.updateMarketData({{"ES", bar(101.0, 200)}}, 200);
  EXPECT_DOUBLE_EQ(book.currentPrice("ES").value(), 101.0);
}
