#pragma once

#include "meridian/domain/market_data.hpp"
#include "meridian/eventbus/event_bus.hpp"
#include "meridian/events/event_types.hpp"

#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace meridian {

// -----------------------------------------------------------------------------
// OrderBook: latest market data per ticker
// -----------------------------------------------------------------------------
//
// @brief  Stores the most recent bar or quote for every ticker, derives a
//         current price from it, and announces each applied batch with a
//         MarketDataEvent.
//
// @details
// One book serves one data kind, fixed at construction. A batch is applied
// wholesale: every entry is validated first (kind and field ranges), and only
// then are all tickers overwritten and last_updated advanced. Timestamps
// never move backwards: a batch older than last_updated is rejected. Equal
// timestamps are accepted. A rejected batch leaves the book exactly as it
// was.
//
// Quotes replace the stored quote entirely; bid and ask sides are never
// merged across updates.
//
// Subscriptions: MarketFeedEvent on the given bus (calls updateMarketData).
// Publishes:     MarketDataEvent after each applied batch.
//
// Thread model:
//   Writers run on one thread (the replay driver or the engine loop). The
//   execution engine and order manager read prices on that same thread, while
//   the IPC server and tests may read from others, so state sits behind a
//   shared_mutex. publish() runs after the lock is released.
// -----------------------------------------------------------------------------
class OrderBook {
 public:
  OrderBook(EventBus& bus, domain::MarketDataType data_type);
  ~OrderBook();

  OrderBook(const OrderBook&) = delete;
  OrderBook& operator=(const OrderBook&) = delete;

  // -------------------------------------------------------------------------
  // updateMarketData(data, timestamp)
  // -------------------------------------------------------------------------
  //
  // @brief  Overwrites the entry of every ticker in `data`, sets
  //         last_updated = timestamp and publishes one MarketDataEvent for
  //         the whole batch.
  //
  // @throws std::invalid_argument when timestamp < lastUpdated(), or when any
  //         entry has the wrong kind for this book or fails
  //         validateMarketData(). Nothing is applied then.
  // -------------------------------------------------------------------------
  void updateMarketData(const domain::MarketDataBatch& data,
                        std::int64_t timestamp);

  // Close for bar books, mid for quote books. nullopt for unknown tickers.
  std::optional<double> currentPrice(const std::string& ticker) const;

  std::unordered_map<std::string, double> currentPrices() const;

  std::optional<domain::MarketData> marketData(const std::string& ticker) const;

  std::int64_t lastUpdated() const;

  domain::MarketDataType dataType() const { return data_type_; }

 private:
  void onFeed(const MarketFeedEvent& event);

  EventBus& bus_;
  const domain::MarketDataType data_type_;
  EventBus::SubscriptionId feed_sub_id_{0};

  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, domain::MarketData> book_;
  std::int64_t last_updated_{0};
};

}  // namespace meridian
