#pragma once

#include "meridian/broker/broker_transport.hpp"
#include "meridian/broker/broker_wrapper.hpp"
#include "meridian/concurrent/order_id_generator.hpp"
#include "meridian/config/engine_config.hpp"
#include "meridian/domain/symbol_registry.hpp"
#include "meridian/eventbus/event_bus.hpp"
#include "meridian/execution/i_execution_engine.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>

namespace meridian {

// -----------------------------------------------------------------------------
// BrokerClient: live execution path
// -----------------------------------------------------------------------------
//
// @brief  Runs the connection handshake and forwards orders to the broker
//         transport.
//
// @details
// connect() completes four steps in strict order, each a bounded wait on a
// BrokerWrapper signal:
//   1. transport.connect()             -> wait connectAck
//   2.                                 -> wait nextValidId
//   3. reqAccountUpdates(subscribe)    -> wait accountDownloadEnd
//   4. reqOpenOrders()                 -> wait openOrderEnd
// A wait that exceeds handshake_timeout_ms throws BrokerError and leaves the
// client not ready. Once the bridge reports connectionClosed the client stays
// not ready, even if a new connect_ack arrives, until reconnect() has torn
// the transport down and run the whole handshake again.
//
// Orders: placeOrder() (subscribed to OrderEvent) draws an id from the
// shared OrderIdGenerator and sends it. While the client is not ready
// (handshake incomplete, connection closed) orders are refused and logged.
// Fills and statuses come back through BrokerWrapper, never from here.
//
// Thread model:
//   connect()/reconnect()/disconnect() from the main thread; placeOrder()
//   on the engine loop. The transport serializes outbound requests.
// -----------------------------------------------------------------------------
class BrokerClient final : public IExecutionEngine {
 public:
  BrokerClient(EventBus& bus, IBrokerTransport& transport,
               BrokerWrapper& wrapper, OrderIdGenerator& id_gen,
               const domain::SymbolRegistry& symbols, BrokerConfig config);
  ~BrokerClient() override;

  BrokerClient(const BrokerClient&) = delete;
  BrokerClient& operator=(const BrokerClient&) = delete;

  // Throws BrokerError when a handshake step times out.
  void connect();
  void reconnect();
  void disconnect();

  bool isReady() const;

  void placeOrder(const OrderEvent& event) override;

  // Returns the order id used, or -1 when the order was refused.
  std::int64_t placeOrder(const BrokerContract& contract,
                          const domain::Order& order);

  void cancelOrder(std::int64_t order_id);

  // Requests the account summary fields for all accounts; the answer is
  // recorded by BrokerWrapper. Returns the request id.
  int requestAccountSummary();

  int refusedOrders() const { return refused_orders_.load(); }

 private:
  void awaitStep(SyncEvent& signal, const char* step);

  EventBus& bus_;
  IBrokerTransport& transport_;
  BrokerWrapper& wrapper_;
  OrderIdGenerator& id_gen_;
  const domain::SymbolRegistry& symbols_;
  const BrokerConfig config_;
  EventBus::SubscriptionId order_sub_id_{0};

  std::mutex connection_mutex_;
  std::atomic<bool> ready_{false};
  std::atomic<int> refused_orders_{0};
};

}  // namespace meridian
