// -----------------------------------------------------------------------------
// meridian_engine: single executable entry point.
//
// Usage: meridian_engine <config.json>
//
//   backtest  Replays config.replay_file through the simulated execution
//             path, liquidates at the end and writes the run summary
//             (config.summary_file, or stdout when unset).
//   live      Connects to the broker bridge, validates every contract, then
//             trades on the market data feed until Ctrl-C.
//
// Exit codes: 0 on success, 1 on usage or configuration errors, 2 when the
// broker session cannot be established.
// -----------------------------------------------------------------------------

#include "meridian/broker/zmq_broker_transport.hpp"
#include "meridian/config/engine_config.hpp"
#include "meridian/engine/trading_engine.hpp"
#include "meridian/errors.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>

// Set by the SIGINT handler, polled by the live run loop. The only global in
// the program.
static std::atomic<bool> g_stop_requested{false};

static void sigint_handler(int /*signum*/) { g_stop_requested.store(true); }

static int runLive(meridian::TradingEngine& engine) {
  meridian::ZmqBrokerTransport transport;
  try {
    engine.start(transport);
  } catch (const meridian::BrokerError& e) {
    std::cerr << "[main] broker session failed: " << e.what() << "\n";
    engine.stop();
    return 2;
  }

  std::signal(SIGINT, sigint_handler);
  std::cout << "[main] Running. Press Ctrl-C to stop.\n";
  while (!g_stop_requested.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  std::cout << "\n[main] SIGINT received. Shutting down...\n";
  engine.stop();
  return 0;
}

int main(int argc, char* argv[]) {
  if (argc != 2) {
    std::cerr << "usage: " << argv[0] << " <config.json>\n";
    return 1;
  }

  meridian::EngineConfig config;
  try {
    config = meridian::loadEngineConfig(argv[1]);
  } catch (const meridian::ConfigError& e) {
    std::cerr << "[main] configuration error: " << e.what() << "\n";
    return 1;
  }

  const bool print_summary = config.summary_file.empty();
  std::unique_ptr<meridian::TradingEngine> engine;
  try {
    engine = std::make_unique<meridian::TradingEngine>(std::move(config));
  } catch (const meridian::ConfigError& e) {
    std::cerr << "[main] configuration error: " << e.what() << "\n";
    return 1;
  }

  if (engine->config().mode == meridian::EngineMode::Live) {
    return runLive(*engine);
  }

  try {
    const auto summary = engine->runBacktest();
    if (print_summary) {
      std::cout << summary.dump(2) << "\n";
    }
  } catch (const meridian::ConfigError& e) {
    std::cerr << "[main] configuration error: " << e.what() << "\n";
    return 1;
  } catch (const std::runtime_error& e) {
    std::cerr << "[main] backtest failed: " << e.what() << "\n";
    return 1;
  }

  std::cout << "[main] Clean shutdown complete.\n";
  return 0;
}
