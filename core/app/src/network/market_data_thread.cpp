#include "meridian/network/market_data_thread.hpp"

#include <iostream>
#include <utility>

namespace meridian {

MarketDataThread::MarketDataThread(EventSink event_sink, std::string endpoint)
    : event_sink_(std::move(event_sink)), endpoint_(std::move(endpoint)) {}

MarketDataThread::~MarketDataThread() { stop(); }

// -----------------------------------------------------------------------------
// start(): create gateway and spawn recv thread
// -----------------------------------------------------------------------------
void MarketDataThread::start() {
  if (thread_.joinable()) {
    return;
  }

  gateway_ = std::make_unique<MarketDataGateway>(event_sink_, endpoint_);

  thread_ = std::thread([this] {
    std::cout << "[MarketDataThread] listening on " << endpoint_ << "\n";
    try {
      gateway_->run();
    } catch (const zmq::error_t& e) {
      std::cerr << "[MarketDataThread] socket error: " << e.what() << "\n";
    }
    std::cout << "[MarketDataThread] recv loop exited.\n";
  });
}

// -----------------------------------------------------------------------------
// stop(): signal gateway and join thread
// -----------------------------------------------------------------------------
void MarketDataThread::stop() {
  if (gateway_) {
    gateway_->stop();
  }

  if (thread_.joinable()) {
    thread_.join();
  }

  gateway_.reset();
}

}  // namespace meridian
