#pragma once

#include "meridian/concurrent/thread_safe_queue.hpp"
#include "meridian/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace meridian {

// -----------------------------------------------------------------------------
// IpcServer: operator commands and portfolio telemetry over ZeroMQ
// -----------------------------------------------------------------------------
//
// @brief  Runs a REP command socket and a PUB telemetry socket on one
//         background thread.
//
// @details
// Commands: a text request on the REP socket is passed to the command
// handler (TradingEngine::executeCommand) and its return value is sent back.
// Supported commands are PING, STATUS and ACCOUNT.
//
// Telemetry: pushTelemetry() enqueues PositionUpdateEvent, OrderUpdateEvent
// and AccountUpdateEvent from the portfolio loop. The worker drains the queue
// and publishes one JSON document per event:
//   {"type":"position_update","ticker":..,"position":{..}|null}
//   {"type":"order_update","active":bool,"order":{..}}
//   {"type":"account_update","account":{..}}
// Other event kinds are ignored.
//
// Thread model:
//   start()/stop() from the owning thread. pushTelemetry() from any thread.
//   Both sockets are used only by the worker thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  explicit IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint = "tcp://*:5557",
                     std::string pub_endpoint = "tcp://*:5556");

  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;

  void start();

  void stop();

  void pushTelemetry(Event event);

  // JSON text for a telemetry event, or nullopt for kinds not published.
  static std::optional<std::string> formatTelemetry(const Event& event);

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();

  void processTelemetry();

  void processCommands();

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> telemetry_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace meridian
