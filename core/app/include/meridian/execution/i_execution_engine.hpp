#pragma once

#include "meridian/events/event_types.hpp"

namespace meridian {

// -----------------------------------------------------------------------------
// IExecutionEngine: where OrderEvents go
// -----------------------------------------------------------------------------
//
// @brief  Common seam for the two execution paths.
//
// @details
//   ExecutionSimulator  backtest: fills immediately against the OrderBook and
//                       keeps its own position/account ledger
//   BrokerClient        live: forwards to the broker; fills, statuses and
//                       account pushes come back through BrokerWrapper
//
// Implementations subscribe to OrderEvent on the bus they are given and route
// each one to placeOrder(). TradingEngine creates only the one the configured
// mode needs and keeps it under its concrete type, since each mode also
// drives calls outside this seam (liquidation, the broker handshake).
//
// Thread model: placeOrder() is called on the thread that publishes the
// OrderEvent (the replay thread or the engine loop).
// -----------------------------------------------------------------------------
class IExecutionEngine {
 public:
  virtual ~IExecutionEngine() = default;

  virtual void placeOrder(const OrderEvent& event) = 0;
};

}  // namespace meridian
