#include "meridian/gateway/market_data_gateway.hpp"
#include "meridian/gateway/json_codec.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <stdexcept>
#include <string>

namespace meridian {

// -----------------------------------------------------------------------------
// Constructor: SUB socket with receive timeout
// -----------------------------------------------------------------------------
MarketDataGateway::MarketDataGateway(EventSink event_sink,
                                     const std::string& endpoint)
    : event_sink_(std::move(event_sink)) {
  socket_.set(zmq::sockopt::subscribe, "");
  socket_.set(zmq::sockopt::rcvtimeo, kRecvTimeoutMs);
  socket_.connect(endpoint);
}

// -----------------------------------------------------------------------------
// run(): blocking recv loop
// -----------------------------------------------------------------------------
void MarketDataGateway::run() {
  running_.store(true);

  while (running_.load()) {
    zmq::message_t msg;
    zmq::recv_result_t result;

    try {
      result = socket_.recv(msg, zmq::recv_flags::none);
    } catch (const zmq::error_t& e) {
      if (e.num() == EINTR) {
        continue;
      }
      throw;
    }

    if (!result.has_value()) {
      continue;
    }

    handleMessage(msg.to_string());
  }
}

void MarketDataGateway::stop() { running_.store(false); }

// -----------------------------------------------------------------------------
// handleMessage(): decode and forward
// -----------------------------------------------------------------------------
bool MarketDataGateway::handleMessage(const std::string& payload) {
  try {
    event_sink_(decodeFeedMessage(payload));
    return true;
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[MarketDataGateway] JSON error: " << e.what()
              << " | payload: " << payload << "\n";
  } catch (const std::invalid_argument& e) {
    std::cerr << "[MarketDataGateway] invalid message: " << e.what()
              << " | payload: " << payload << "\n";
  }
  ++rejected_;
  return false;
}

}  // namespace meridian
