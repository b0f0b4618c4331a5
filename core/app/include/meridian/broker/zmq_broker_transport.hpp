#pragma once

#include "meridian/broker/broker_transport.hpp"
#include "meridian/concurrent/thread_safe_queue.hpp"

#include <nlohmann/json.hpp>
#include <zmq.hpp>

#include <atomic>
#include <memory>
#include <string>
#include <thread>

namespace meridian {

// -----------------------------------------------------------------------------
// ZmqBrokerTransport: broker bridge over a ZeroMQ DEALER socket
// -----------------------------------------------------------------------------
//
// @brief  IBrokerTransport that talks JSON (broker_codec.hpp) to a bridge
//         process holding the real broker session.
//
// @details
// connect() opens the DEALER socket, starts the transport thread and queues
// a connect request. The thread alternates between sending queued requests
// and receiving callback frames (receive timeout kPollTimeoutMs), which it
// decodes and dispatches to the IBrokerCallbacks. All socket use stays on
// that thread; request methods only enqueue.
//
// isConnected() turns true on connect_ack and false on connection_closed or
// disconnect(). Requests made before connect(), or after a socket error ended
// the thread, throw BrokerError. disconnect() joins any finished or running
// thread and drops unsent requests; connect() calls it first, so a transport
// can always be connected again. Malformed frames are logged and skipped.
// -----------------------------------------------------------------------------
class ZmqBrokerTransport final : public IBrokerTransport {
 public:
  ZmqBrokerTransport() = default;
  ~ZmqBrokerTransport() override;

  ZmqBrokerTransport(const ZmqBrokerTransport&) = delete;
  ZmqBrokerTransport& operator=(const ZmqBrokerTransport&) = delete;

  void connect(const std::string& endpoint, int client_id,
               IBrokerCallbacks& callbacks) override;
  void disconnect() override;
  bool isConnected() const override { return connected_.load(); }

  void placeOrder(std::int64_t order_id, const BrokerContract& contract,
                  const domain::Order& order) override;
  void cancelOrder(std::int64_t order_id) override;
  void reqAccountUpdates(bool subscribe, const std::string& account) override;
  void reqOpenOrders() override;
  void reqAccountSummary(int req_id, const std::string& group,
                         const std::string& tags) override;
  void reqContractDetails(int req_id, const BrokerContract& contract) override;

 private:
  static constexpr int kPollTimeoutMs = 50;

  void send(const nlohmann::json& request);
  void run();
  void flushOutbound();
  void handleFrame(const std::string& payload);

  IBrokerCallbacks* callbacks_{nullptr};

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> socket_;

  ThreadSafeQueue<std::string> outbound_;
  std::thread thread_;
  std::atomic<bool> running_{false};
  std::atomic<bool> connected_{false};
};

}  // namespace meridian
