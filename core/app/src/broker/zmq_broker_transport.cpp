#include "meridian/broker/zmq_broker_transport.hpp"
#include "meridian/broker/broker_codec.hpp"
#include "meridian/errors.hpp"

#include <iostream>
#include <stdexcept>

namespace meridian {

ZmqBrokerTransport::~ZmqBrokerTransport() { disconnect(); }

// -----------------------------------------------------------------------------
// connect(): open socket, start transport thread, request the session
// -----------------------------------------------------------------------------
void ZmqBrokerTransport::connect(const std::string& endpoint, int client_id,
                                 IBrokerCallbacks& callbacks) {
  // A previous session (live or ended by a socket error) is torn down first.
  disconnect();

  callbacks_ = &callbacks;
  context_ = std::make_unique<zmq::context_t>(1);
  socket_ = std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::dealer);
  socket_->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
  socket_->set(zmq::sockopt::linger, 0);
  socket_->connect(endpoint);

  running_.store(true);
  send({{"type", "connect"}, {"client_id", client_id}});
  thread_ = std::thread([this] { run(); });
}

// -----------------------------------------------------------------------------
// disconnect(): best-effort goodbye, then stop and join
// -----------------------------------------------------------------------------
void ZmqBrokerTransport::disconnect() {
  if (!thread_.joinable()) {
    return;
  }

  if (running_.load()) {
    outbound_.push(nlohmann::json{{"type", "disconnect"}}.dump());
    running_.store(false);
  }
  thread_.join();
  connected_.store(false);

  // Requests that never left must not leak into the next session.
  while (outbound_.try_pop()) {
  }

  socket_.reset();
  context_.reset();
  callbacks_ = nullptr;
}

// -----------------------------------------------------------------------------
// Requests
// -----------------------------------------------------------------------------
void ZmqBrokerTransport::send(const nlohmann::json& request) {
  if (!running_.load()) {
    throw BrokerError("broker transport is not connected");
  }
  outbound_.push(request.dump());
}

void ZmqBrokerTransport::placeOrder(std::int64_t order_id,
                                    const BrokerContract& contract,
                                    const domain::Order& order) {
  send(encodePlaceOrder(order_id, contract, order));
}

void ZmqBrokerTransport::cancelOrder(std::int64_t order_id) {
  send({{"type", "cancel_order"}, {"order_id", order_id}});
}

void ZmqBrokerTransport::reqAccountUpdates(bool subscribe,
                                           const std::string& account) {
  send({{"type", "req_account_updates"},
        {"subscribe", subscribe},
        {"account", account}});
}

void ZmqBrokerTransport::reqOpenOrders() {
  send({{"type", "req_open_orders"}});
}

void ZmqBrokerTransport::reqAccountSummary(int req_id, const std::string& group,
                                           const std::string& tags) {
  send({{"type", "req_account_summary"},
        {"req_id", req_id},
        {"group", group},
        {"tags", tags}});
}

void ZmqBrokerTransport::reqContractDetails(int req_id,
                                            const BrokerContract& contract) {
  send({{"type", "req_contract_details"},
        {"req_id", req_id},
        {"contract", encodeContract(contract)}});
}

// -----------------------------------------------------------------------------
// run(): transport thread
// -----------------------------------------------------------------------------
void ZmqBrokerTransport::run() {
  try {
    while (running_.load()) {
      flushOutbound();

      zmq::message_t frame;
      zmq::recv_result_t result;
      try {
        result = socket_->recv(frame, zmq::recv_flags::none);
      } catch (const zmq::error_t& e) {
        if (e.num() == EINTR) {
          continue;
        }
        throw;
      }
      if (result.has_value()) {
        handleFrame(frame.to_string());
      }
    }
    flushOutbound();
  } catch (const zmq::error_t& e) {
    std::cerr << "[ZmqBrokerTransport] socket error: " << e.what() << "\n";
    running_.store(false);
    connected_.store(false);
    if (callbacks_) {
      callbacks_->connectionClosed();
    }
  }
}

void ZmqBrokerTransport::flushOutbound() {
  while (auto request = outbound_.try_pop()) {
    zmq::message_t msg(request->data(), request->size());
    socket_->send(msg, zmq::send_flags::none);
  }
}

void ZmqBrokerTransport::handleFrame(const std::string& payload) {
  try {
    const auto message = nlohmann::json::parse(payload);
    const std::string type = message.at("type").get<std::string>();
    if (type == "connect_ack") {
      connected_.store(true);
    } else if (type == "connection_closed") {
      connected_.store(false);
    }
    dispatchBrokerMessage(message, *callbacks_);
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[ZmqBrokerTransport] JSON error: " << e.what()
              << " | frame: " << payload << "\n";
  } catch (const std::invalid_argument& e) {
    std::cerr << "[ZmqBrokerTransport] invalid frame: " << e.what()
              << " | frame: " << payload << "\n";
  }
}

}  // namespace meridian
