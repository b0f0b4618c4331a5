#pragma once

#include "meridian/events/event.hpp"
#include "meridian/gateway/market_data_gateway.hpp"

#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace meridian {

// -----------------------------------------------------------------------------
// MarketDataThread: dedicated I/O thread for the live feed
// -----------------------------------------------------------------------------
//
// @brief  Owns a MarketDataGateway and the std::thread that runs its recv
//         loop, so TradingEngine can start and stop the feed as one RAII
//         component.
//
// @details
// The gateway is created in start(), not in the constructor: TradingEngine
// constructs this early but only opens the socket once the broker handshake
// has completed and the engine is ready to trade.
//
// Thread model: start()/stop() from the owning thread (main). The internal
// thread runs MarketDataGateway::run() exclusively.
// -----------------------------------------------------------------------------
class MarketDataThread {
 public:
  using EventSink = std::function<void(Event)>;

  MarketDataThread(EventSink event_sink,
                   std::string endpoint = "tcp://127.0.0.1:5555");

  ~MarketDataThread();

  MarketDataThread(const MarketDataThread&) = delete;
  MarketDataThread& operator=(const MarketDataThread&) = delete;

  // Idempotent.
  void start();

  // Idempotent; safe if never started. Blocks until the thread exits.
  void stop();

  bool isRunning() const { return thread_.joinable(); }

 private:
  EventSink event_sink_;
  std::string endpoint_;

  std::unique_ptr<MarketDataGateway> gateway_;
  std::thread thread_;
};

}  // namespace meridian
