#pragma once

#include "meridian/broker/broker_client.hpp"
#include "meridian/broker/broker_transport.hpp"
#include "meridian/broker/broker_wrapper.hpp"
#include "meridian/broker/contract_manager.hpp"
#include "meridian/concurrent/event_loop_thread.hpp"
#include "meridian/concurrent/order_id_generator.hpp"
#include "meridian/config/engine_config.hpp"
#include "meridian/domain/symbol_registry.hpp"
#include "meridian/execution/execution_simulator.hpp"
#include "meridian/market/order_book.hpp"
#include "meridian/network/ipc_server.hpp"
#include "meridian/network/market_data_thread.hpp"
#include "meridian/performance/performance_collector.hpp"
#include "meridian/portfolio/portfolio_server.hpp"
#include "meridian/risk/order_manager.hpp"
#include "meridian/time/live_time_provider.hpp"
#include "meridian/time/simulation_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <istream>
#include <memory>
#include <string>
#include <vector>

namespace meridian {

// -----------------------------------------------------------------------------
// TradingEngine
// -----------------------------------------------------------------------------
//
// @brief  Owns every component of a run and wires them for the configured
//         mode.
//
// @details
// Backtest (runBacktest):
//   One thread, one bus (the engine loop's bus, never started as a thread).
//   Each replay line is decoded, the simulation clock is advanced to its
//   timestamp, and the event is published synchronously, so one batch drains
//   through OrderBook -> OrderManager -> ExecutionSimulator ->
//   PortfolioServer before the next line is read. After the feed the
//   simulator liquidates every position and the PerformanceCollector builds
//   the run summary.
//
// Live (start/stop):
//   engine loop     OrderBook, OrderManager, BrokerClient, PerformanceCollector
//   portfolio loop  PortfolioServer; the only writer of portfolio state
//   transport       broker callbacks -> BrokerWrapper -> portfolio loop
//   market data     ZeroMQ SUB -> engine loop
//   IPC             commands and portfolio telemetry
//
//   start() order: loops, broker handshake (bounded; BrokerError on
//   timeout), contract validation, IPC server, market data last.
//   stop() reverses it: market data, IPC, broker, loops.
//
// Thread model: construct, run and stop from the main thread.
// -----------------------------------------------------------------------------
class TradingEngine {
 public:
  explicit TradingEngine(EngineConfig config);
  ~TradingEngine();

  TradingEngine(const TradingEngine&) = delete;
  TradingEngine& operator=(const TradingEngine&) = delete;
  TradingEngine(TradingEngine&&) = delete;
  TradingEngine& operator=(TradingEngine&&) = delete;

  // --- Backtest ---------------------------------------------------------------

  // Replays config.replay_file and writes config.summary_file when set.
  // Throws ConfigError when the replay file cannot be opened.
  nlohmann::json runBacktest();

  // Replays every line of `feed`, then finishBacktest().
  nlohmann::json runBacktest(std::istream& feed);

  // Decodes and publishes one feed line. Returns false (after logging) for
  // a malformed line or a timestamp older than the simulation clock.
  bool replayLine(const std::string& line);

  // Liquidates all positions and returns the run summary.
  nlohmann::json finishBacktest();

  // --- Live -------------------------------------------------------------------

  // Throws BrokerError when the handshake does not complete.
  void start(IBrokerTransport& transport);
  void stop();

  void pushEvent(Event event);

  std::string executeCommand(const std::string& cmd);

  // Replaces the handler run on broker error 502 (default: exit the process).
  void setFatalHandler(BrokerWrapper::FatalHandler handler);

  // --- Accessors --------------------------------------------------------------
  const EngineConfig& config() const { return config_; }
  const domain::SymbolRegistry& symbols() const { return symbols_; }
  OrderBook& orderBook() { return *order_book_; }
  PortfolioServer& portfolio() { return *portfolio_; }
  OrderManager& orderManager() { return *order_manager_; }
  PerformanceCollector& performance() { return *performance_; }
  ExecutionSimulator* simulator() { return simulator_.get(); }
  BrokerClient* brokerClient() { return broker_client_.get(); }

  EventBus& engineEventBus() { return engine_loop_.eventBus(); }
  EventBus& portfolioEventBus() { return portfolio_loop_.eventBus(); }

  bool isRunning() const { return running_; }
  std::size_t rejectedLines() const { return rejected_lines_; }

 private:
  const EngineConfig config_;
  domain::SymbolRegistry symbols_;

  SimulationTimeProvider sim_clock_;
  LiveTimeProvider live_clock_;
  OrderIdGenerator order_id_gen_;
  BrokerWrapper::FatalHandler fatal_handler_;

  EventLoopThread engine_loop_{"engine"};
  EventLoopThread portfolio_loop_{"portfolio"};

  std::unique_ptr<OrderBook> order_book_;
  std::unique_ptr<PortfolioServer> portfolio_;
  std::unique_ptr<ExecutionSimulator> simulator_;
  std::unique_ptr<OrderManager> order_manager_;
  std::unique_ptr<PerformanceCollector> performance_;

  std::unique_ptr<BrokerWrapper> broker_wrapper_;
  std::unique_ptr<BrokerClient> broker_client_;
  std::unique_ptr<ContractManager> contract_manager_;
  std::unique_ptr<IpcServer> ipc_server_;
  std::unique_ptr<MarketDataThread> market_data_thread_;

  std::vector<EventBus::SubscriptionId> bridge_sub_ids_;
  std::size_t rejected_lines_{0};
  bool running_{false};
};

}  // namespace meridian
