#include "meridian/engine/trading_engine.hpp"
#include "meridian/errors.hpp"
#include "meridian/gateway/json_codec.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <utility>

namespace meridian {

namespace {

std::optional<std::int64_t> timestampOf(const Event& event) {
  if (const auto* feed = std::get_if<MarketFeedEvent>(&event)) {
    return feed->timestamp;
  }
  if (const auto* signal = std::get_if<SignalEvent>(&event)) {
    return signal->timestamp;
  }
  if (const auto* eod = std::get_if<EndOfDayEvent>(&event)) {
    return eod->timestamp;
  }
  return std::nullopt;
}

void exitOnFatalBrokerError(int code, const std::string& message) {
  std::cerr << "[TradingEngine] fatal broker error " << code << ": " << message
            << ", exiting\n";
  std::cerr.flush();
  std::cout.flush();
  std::_Exit(EXIT_FAILURE);
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: build the components of the configured mode
// -----------------------------------------------------------------------------
TradingEngine::TradingEngine(EngineConfig config)
    : config_(std::move(config)),
      symbols_(config_.symbols),
      fatal_handler_(exitOnFatalBrokerError) {
  EventBus& engine_bus = engine_loop_.eventBus();

  order_book_ = std::make_unique<OrderBook>(engine_bus, config_.data_type);

  if (config_.mode == EngineMode::Backtest) {
    // Single bus: the whole fill path runs inside publish().
    portfolio_ = std::make_unique<PortfolioServer>(engine_bus);
    simulator_ = std::make_unique<ExecutionSimulator>(
        engine_bus, symbols_, *order_book_, *portfolio_, config_.capital);
  } else {
    portfolio_ = std::make_unique<PortfolioServer>(portfolio_loop_.eventBus());
  }

  order_manager_ = std::make_unique<OrderManager>(engine_bus, symbols_,
                                                  *order_book_, *portfolio_);
  performance_ = std::make_unique<PerformanceCollector>(
      engine_bus, config_.parameters, config_.capital);

  std::cout << "[TradingEngine] " << toString(config_.mode) << " engine for '"
            << config_.strategy << "' with " << symbols_.size()
            << " instrument(s), capital " << config_.capital << "\n";
}

// -----------------------------------------------------------------------------
// Destructor: RAII stop
// -----------------------------------------------------------------------------
TradingEngine::~TradingEngine() { stop(); }

// -----------------------------------------------------------------------------
// Backtest
// -----------------------------------------------------------------------------
nlohmann::json TradingEngine::runBacktest() {
  std::ifstream feed(config_.replay_file);
  if (!feed) {
    throw ConfigError("cannot open replay file: " + config_.replay_file);
  }

  auto summary = runBacktest(feed);
  if (!config_.summary_file.empty()) {
    performance_->writeSummary(config_.summary_file);
    std::cout << "[TradingEngine] summary written to " << config_.summary_file
              << "\n";
  }
  return summary;
}

nlohmann::json TradingEngine::runBacktest(std::istream& feed) {
  if (!simulator_) {
    throw std::logic_error("runBacktest() requires a backtest engine");
  }

  std::size_t replayed = 0;
  std::string line;
  while (std::getline(feed, line)) {
    if (line.find_first_not_of(" \t\r") == std::string::npos) {
      continue;
    }
    if (replayLine(line)) {
      ++replayed;
    }
  }

  std::cout << "[TradingEngine] replayed " << replayed << " message(s), "
            << rejected_lines_ << " skipped\n";
  return finishBacktest();
}

bool TradingEngine::replayLine(const std::string& line) {
  Event event;
  try {
    event = decodeFeedMessage(line);
  } catch (const nlohmann::json::exception& e) {
    ++rejected_lines_;
    std::cerr << "[TradingEngine] JSON error: " << e.what()
              << " | line: " << line << "\n";
    return false;
  } catch (const std::invalid_argument& e) {
    ++rejected_lines_;
    std::cerr << "[TradingEngine] invalid message: " << e.what()
              << " | line: " << line << "\n";
    return false;
  }

  const auto timestamp = timestampOf(event);
  if (timestamp && !sim_clock_.advance_time(*timestamp)) {
    ++rejected_lines_;
    std::cerr << "[TradingEngine] out-of-order message at " << *timestamp
              << " (clock at " << sim_clock_.now_ns() << "), skipped\n";
    return false;
  }

  engine_loop_.eventBus().publish(event);
  return true;
}

nlohmann::json TradingEngine::finishBacktest() {
  if (!simulator_) {
    throw std::logic_error("finishBacktest() requires a backtest engine");
  }

  const auto closing = simulator_->liquidatePositions();
  std::cout << "[TradingEngine] liquidated " << closing.size()
            << " position(s) at end of run\n";

  performance_->setRunCounters(order_manager_->rejectedSignals(),
                               simulator_->marginCalls());
  return performance_->summary();
}

// -----------------------------------------------------------------------------
// start(): live wiring
// -----------------------------------------------------------------------------
void TradingEngine::start(IBrokerTransport& transport) {
  if (running_) {
    return;
  }
  if (config_.mode != EngineMode::Live) {
    throw std::logic_error("start() requires a live engine");
  }

  // ---  1) Event loops and cross-thread bridges -----------------------------
  engine_loop_.start();
  portfolio_loop_.start();
  running_ = true;

  // Account snapshots feed the equity curve on the engine loop.
  bridge_sub_ids_.push_back(
      portfolio_loop_.eventBus().subscribe<AccountUpdateEvent>(
          [this](const AccountUpdateEvent& e) { engine_loop_.push(e); }));

  // ---  2) Broker session ---------------------------------------------------
  broker_wrapper_ = std::make_unique<BrokerWrapper>(
      symbols_,
      [this](Event event) { portfolio_loop_.push(std::move(event)); },
      *performance_, live_clock_, order_id_gen_,
      std::chrono::milliseconds(config_.broker.account_debounce_ms),
      [this](int code, const std::string& message) {
        fatal_handler_(code, message);
      });
  broker_client_ = std::make_unique<BrokerClient>(
      engine_loop_.eventBus(), transport, *broker_wrapper_, order_id_gen_,
      symbols_, config_.broker);

  broker_client_->connect();
  broker_client_->requestAccountSummary();

  // ---  3) Contract validation ----------------------------------------------
  contract_manager_ = std::make_unique<ContractManager>(
      transport, *broker_wrapper_, order_id_gen_,
      std::chrono::milliseconds(config_.broker.handshake_timeout_ms));
  for (const auto& instrument : symbols_.all()) {
    if (!contract_manager_->validate(*instrument)) {
      std::cerr << "[TradingEngine] contract for " << instrument->ticker
                << " could not be validated\n";
    }
  }

  // ---  4) IPC server (commands + portfolio telemetry) ----------------------
  if (config_.ipc) {
    ipc_server_ = std::make_unique<IpcServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        config_.ipc->command_endpoint, config_.ipc->telemetry_endpoint);
    ipc_server_->start();

    EventBus& portfolio_bus = portfolio_loop_.eventBus();
    bridge_sub_ids_.push_back(portfolio_bus.subscribe<PositionUpdateEvent>(
        [this](const PositionUpdateEvent& e) {
          ipc_server_->pushTelemetry(e);
        }));
    bridge_sub_ids_.push_back(portfolio_bus.subscribe<OrderUpdateEvent>(
        [this](const OrderUpdateEvent& e) { ipc_server_->pushTelemetry(e); }));
    bridge_sub_ids_.push_back(portfolio_bus.subscribe<AccountUpdateEvent>(
        [this](const AccountUpdateEvent& e) {
          ipc_server_->pushTelemetry(e);
        }));
  }

  // ---  5) Market data LAST (ticks begin flowing) ---------------------------
  if (!config_.market_data_endpoint.empty()) {
    market_data_thread_ = std::make_unique<MarketDataThread>(
        [this](Event event) { pushEvent(std::move(event)); },
        config_.market_data_endpoint);
    market_data_thread_->start();
  }

  std::cout << "[TradingEngine] started. Threads: engine, portfolio, broker"
            << (ipc_server_ ? ", ipc" : "")
            << (market_data_thread_ ? ", market_data" : "") << ".\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void TradingEngine::stop() {
  if (!running_) {
    return;
  }

  // ---  1) Stop market data inflow FIRST ------------------------------------
  market_data_thread_.reset();

  // ---  2) Detach bridges, then stop IPC (executeCommand() reads state) -----
  for (const auto id : bridge_sub_ids_) {
    portfolio_loop_.eventBus().unsubscribe(id);
  }
  bridge_sub_ids_.clear();
  ipc_server_.reset();

  // ---  3) Close the broker session -----------------------------------------
  if (broker_client_) {
    broker_client_->disconnect();
  }
  contract_manager_.reset();
  broker_client_.reset();

  // ---  4) Stop event loops (drain, then join) ------------------------------
  engine_loop_.stop();
  portfolio_loop_.stop();

  // The transport has joined, so no callback can reach the wrapper now.
  broker_wrapper_.reset();

  running_ = false;
  std::cout << "[TradingEngine] stopped. All threads joined.\n";
}

void TradingEngine::pushEvent(Event event) {
  engine_loop_.push(std::move(event));
}

void TradingEngine::setFatalHandler(BrokerWrapper::FatalHandler handler) {
  fatal_handler_ = std::move(handler);
}

// -----------------------------------------------------------------------------
// executeCommand(): handle IPC command requests
// -----------------------------------------------------------------------------
std::string TradingEngine::executeCommand(const std::string& cmd) {
  nlohmann::json response;

  if (cmd == "PING") {
    response["status"] = "ok";
    response["response"] = "PONG";
  } else if (cmd == "STATUS") {
    response["status"] = "ok";
    response["mode"] = toString(config_.mode);
    response["broker_ready"] = broker_client_ && broker_client_->isReady();
    response["accepted_signals"] = order_manager_->acceptedSignals();
    response["rejected_signals"] = order_manager_->rejectedSignals();

    nlohmann::json positions_json = nlohmann::json::array();
    for (const auto& position : portfolio_->positions()) {
      positions_json.push_back(toJson(position));
    }
    response["positions"] = std::move(positions_json);

    nlohmann::json orders_json = nlohmann::json::array();
    for (const auto& order : portfolio_->activeOrders()) {
      orders_json.push_back(toJson(order));
    }
    response["active_orders"] = std::move(orders_json);
  } else if (cmd == "ACCOUNT") {
    response["status"] = "ok";
    response["account"] = toJson(portfolio_->account());
  } else {
    response["status"] = "error";
    response["response"] = "Unknown command: " + cmd;
  }

  return response.dump();
}

}  // namespace meridian
