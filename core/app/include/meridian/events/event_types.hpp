#pragma once

#include "meridian/domain/account.hpp"
#include "meridian/domain/action.hpp"
#include "meridian/domain/active_order.hpp"
#include "meridian/domain/market_data.hpp"
#include "meridian/domain/order.hpp"
#include "meridian/domain/position.hpp"
#include "meridian/domain/trade.hpp"
#include "meridian/domain/trade_instruction.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace meridian {

// -----------------------------------------------------------------------------
// Event payloads
// -----------------------------------------------------------------------------
//
// Plain value types carried by the Event variant (event.hpp). All timestamps
// are UNIX epoch nanoseconds. Every struct is copyable so a bus can fan it
// out and a ThreadSafeQueue can move it across threads.
//
// Flow (one tick):
//   MarketFeedEvent -> OrderBook -> MarketDataEvent
//   SignalEvent -> OrderManager -> OrderEvent
//   OrderEvent -> execution engine -> ExecutionEvent
//   ledger changes -> PortfolioServer -> Position/Order/AccountUpdateEvent
// -----------------------------------------------------------------------------

// Raw batch from a feed, before the order book has applied it.
struct MarketFeedEvent {
  std::int64_t timestamp{0};
  domain::MarketDataBatch data;
};

// Emitted by the OrderBook once a whole batch is applied.
struct MarketDataEvent {
  std::int64_t timestamp{0};
  domain::MarketDataBatch data;
};

// A strategy decision. trade_capital sizes legs that carry no quantity.
struct SignalEvent {
  std::int64_t timestamp{0};
  double trade_capital{0.0};
  std::vector<domain::TradeInstruction> instructions;
};

struct OrderEvent {
  std::int64_t timestamp{0};
  int trade_id{0};
  int leg_id{0};
  domain::Action action{domain::Action::Long};
  std::string ticker;
  domain::Order order;
};

struct ExecutionEvent {
  std::int64_t timestamp{0};
  domain::Trade trade;
  domain::Action action{domain::Action::Long};
  std::string ticker;
};

// Backtest session boundary: mark-to-market and margin check.
struct EndOfDayEvent {
  std::int64_t timestamp{0};
};

// --- Portfolio notifications --------------------------------------------------

// position is empty when the instrument's position was removed.
struct PositionUpdateEvent {
  std::string ticker;
  std::optional<domain::Position> position;
};

// active is false when the update removed the order from the active set.
struct OrderUpdateEvent {
  domain::ActiveOrder order;
  bool active{true};
};

struct AccountUpdateEvent {
  domain::Account account;
};

// --- Broker callback messages (live) ------------------------------------------
//
// Pushed by BrokerWrapper from the transport thread into the portfolio event
// loop, where PortfolioServer applies them. They never carry partially built
// state: each one is a complete snapshot of what the callback reported.

struct BrokerPositionEvent {
  domain::Position position;
};

struct BrokerOpenOrderEvent {
  domain::ActiveOrder order;
};

struct BrokerOrderStatusEvent {
  domain::OrderStatusUpdate update;
};

struct BrokerAccountEvent {
  domain::Account account;
};

}  // namespace meridian
