#pragma once

#include "meridian/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <string>

namespace meridian {

// -----------------------------------------------------------------------------
// MarketDataGateway: ZeroMQ SUB bridge for live market data and signals
// -----------------------------------------------------------------------------
//
// @brief  Listens on a ZeroMQ SUB socket for JSON feed messages (the same
//         format as the backtest replay file, see json_codec.hpp) and hands
//         each decoded event to the event sink.
//
// @details
// A feed process publishes market_data batches, strategy signals and
// end_of_day markers over ZeroMQ PUB. run() loops on recv, decodes each
// message with decodeFeedMessage() and calls event_sink_(event). In the live
// engine the sink is the engine loop's push(), so the OrderBook, the
// OrderManager and BrokerClient all see the event on the engine thread.
//
// Malformed payloads (bad JSON, missing keys, invalid values) are logged to
// stderr and skipped; they never stop the loop.
//
// Shutdown: the socket has a receive timeout (kRecvTimeoutMs) so that run()
// re-checks the stop flag periodically even when nothing arrives.
//
// Thread model:
//   run() blocks; call it from a dedicated thread (MarketDataThread).
//   stop() may be called from any thread.
// -----------------------------------------------------------------------------
class MarketDataGateway {
 public:
  using EventSink = std::function<void(Event)>;

  explicit MarketDataGateway(
      EventSink event_sink,
      const std::string& endpoint = "tcp://127.0.0.1:5555");

  ~MarketDataGateway() = default;

  MarketDataGateway(const MarketDataGateway&) = delete;
  MarketDataGateway& operator=(const MarketDataGateway&) = delete;

  void run();

  void stop();

  // Decodes one payload and forwards it to the sink. Returns false (after
  // logging) when the payload was rejected.
  bool handleMessage(const std::string& payload);

  std::size_t rejectedMessages() const { return rejected_.load(); }

 private:
  static constexpr int kRecvTimeoutMs = 100;

  EventSink event_sink_;

  zmq::context_t context_{1};
  zmq::socket_t socket_{context_, zmq::socket_type::sub};

  std::atomic<bool> running_{false};
  std::atomic<std::size_t> rejected_{0};
};

}  // namespace meridian
