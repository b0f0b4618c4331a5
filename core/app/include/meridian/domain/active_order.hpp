#pragma once

#include <cstdint>
#include <string>

namespace meridian::domain {

// -----------------------------------------------------------------------------
// OrderStatus: broker-reported order lifecycle
// -----------------------------------------------------------------------------
//
// @brief  The statuses the broker reports for a working order.
//
// @details
// The engine does not drive these transitions; it mirrors what the broker
// says. What matters to the portfolio is which states end an order's life:
//
//   PendingSubmit ──> PreSubmitted ──> Submitted ──> Filled     (terminal)
//         │                │               │    └──> Cancelled  (terminal)
//         └────────────────┴───────────────┴──────> Inactive   (terminal)
//
// ApiCancelled is reported for cancels issued through the API and is
// treated like Cancelled. PendingCancel keeps the order active.
//
// Thread model: plain enum, freely copied across threads.
// -----------------------------------------------------------------------------
enum class OrderStatus {
  PendingSubmit,
  PendingCancel,
  PreSubmitted,
  Submitted,
  ApiCancelled,
  Cancelled,
  Filled,
  Inactive,
};

const char* toString(OrderStatus status);

// Broker spelling ("PendingSubmit", "Filled", ...). Throws
// std::invalid_argument on unknown text.
OrderStatus orderStatusFromString(const std::string& text);

inline bool isTerminal(OrderStatus status) {
  return status == OrderStatus::Filled || status == OrderStatus::Cancelled ||
         status == OrderStatus::ApiCancelled ||
         status == OrderStatus::Inactive;
}

// -----------------------------------------------------------------------------
// ActiveOrder: the engine's view of one working broker order
// -----------------------------------------------------------------------------
//
// Created from an open-order callback (descriptive fields) and refreshed by
// order-status callbacks (status and fill progress).
// -----------------------------------------------------------------------------
struct ActiveOrder {
  std::int64_t order_id{0};
  std::int64_t perm_id{0};
  std::int64_t client_id{0};
  std::int64_t parent_id{0};
  std::string account;
  std::string ticker;
  std::string security_type;
  std::string exchange;
  std::string action;      // BUY / SELL
  std::string order_type;  // MKT / LMT / STP
  double total_quantity{0.0};
  double cash_quantity{0.0};
  double limit_price{0.0};
  double aux_price{0.0};
  OrderStatus status{OrderStatus::PendingSubmit};
  double filled{0.0};
  double remaining{0.0};
  double avg_fill_price{0.0};
  double last_fill_price{0.0};
  double mkt_cap_price{0.0};
  std::string why_held;
};

// Order-status callback payload. Carries no instrument: the aggregator
// resolves the ticker from the ActiveOrder it already holds.
struct OrderStatusUpdate {
  std::int64_t order_id{0};
  std::int64_t perm_id{0};
  std::int64_t parent_id{0};
  OrderStatus status{OrderStatus::PendingSubmit};
  double filled{0.0};
  double remaining{0.0};
  double avg_fill_price{0.0};
  double last_fill_price{0.0};
  double mkt_cap_price{0.0};
  std::string why_held;
};

// Copies status and fill progress from `update` into `order`.
void applyStatus(ActiveOrder& order, const OrderStatusUpdate& update);

}  // namespace meridian::domain
