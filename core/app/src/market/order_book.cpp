#include "meridian/market/order_book.hpp"

#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>

namespace meridian {

// -----------------------------------------------------------------------------
// Constructor / destructor: feed subscription
// -----------------------------------------------------------------------------
OrderBook::OrderBook(EventBus& bus, domain::MarketDataType data_type)
    : bus_(bus), data_type_(data_type) {
  feed_sub_id_ = bus_.subscribe<MarketFeedEvent>(
      [this](const MarketFeedEvent& e) { onFeed(e); });
}

OrderBook::~OrderBook() { bus_.unsubscribe(feed_sub_id_); }

// -----------------------------------------------------------------------------
// onFeed: feed batches that fail validation are dropped, not applied
// -----------------------------------------------------------------------------
void OrderBook::onFeed(const MarketFeedEvent& event) {
  try {
    updateMarketData(event.data, event.timestamp);
  } catch (const std::invalid_argument& e) {
    std::cerr << "[OrderBook] rejected batch at ts=" << event.timestamp
              << ": " << e.what() << "\n";
  }
}

// -----------------------------------------------------------------------------
// updateMarketData
// -----------------------------------------------------------------------------
void OrderBook::updateMarketData(const domain::MarketDataBatch& data,
                                 std::int64_t timestamp) {
  {
    std::shared_lock lock(mutex_);
    if (timestamp < last_updated_) {
      throw std::invalid_argument(
          "batch timestamp " + std::to_string(timestamp) +
          " is older than last update " + std::to_string(last_updated_));
    }
  }

  for (const auto& [ticker, entry] : data) {
    if (domain::dataTypeOf(entry) != data_type_) {
      throw std::invalid_argument(
          "ticker " + ticker + ": " + domain::toString(domain::dataTypeOf(entry)) +
          " data sent to a " + domain::toString(data_type_) + " order book");
    }
    try {
      domain::validateMarketData(entry);
    } catch (const std::invalid_argument& e) {
      throw std::invalid_argument("ticker " + ticker + ": " + e.what());
    }
  }

  {
    std::unique_lock lock(mutex_);
    for (const auto& [ticker, entry] : data) {
      book_.insert_or_assign(ticker, entry);
    }
    last_updated_ = timestamp;
  }

  MarketDataEvent event;
  event.timestamp = timestamp;
  event.data = data;
  bus_.publish(event);
}

// -----------------------------------------------------------------------------
// Price accessors
// -----------------------------------------------------------------------------
std::optional<double> OrderBook::currentPrice(const std::string& ticker) const {
  std::shared_lock lock(mutex_);
  auto it = book_.find(ticker);
  if (it == book_.end()) {
    return std::nullopt;
  }
  return domain::priceOf(it->second);
}

std::unordered_map<std::string, double> OrderBook::currentPrices() const {
  std::shared_lock lock(mutex_);
  std::unordered_map<std::string, double> prices;
  prices.reserve(book_.size());
  for (const auto& [ticker, entry] : book_) {
    prices.emplace(ticker, domain::priceOf(entry));
  }
  return prices;
}

std::optional<domain::MarketData> OrderBook::marketData(
    const std::string& ticker) const {
  std::shared_lock lock(mutex_);
  auto it = book_.find(ticker);
  if (it == book_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::int64_t OrderBook::lastUpdated() const {
  std::shared_lock lock(mutex_);
  return last_updated_;
}

}  // namespace meridian
