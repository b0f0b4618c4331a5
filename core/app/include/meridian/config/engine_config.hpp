#pragma once

#include "meridian/domain/instrument.hpp"
#include "meridian/domain/market_data.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace meridian {

enum class EngineMode { Backtest, Live };

const char* toString(EngineMode mode);

struct BrokerConfig {
  std::string endpoint{"tcp://127.0.0.1:7497"};
  int client_id{0};
  std::string account;
  int handshake_timeout_ms{10000};
  int account_debounce_ms{2000};
};

struct IpcConfig {
  std::string command_endpoint{"tcp://*:5557"};
  std::string telemetry_endpoint{"tcp://*:5556"};
};

// -----------------------------------------------------------------------------
// EngineConfig: the whole run, as loaded from one JSON document
// -----------------------------------------------------------------------------
//
// Backtest runs need replay_file; live runs need market_data_endpoint and
// broker. `parameters` is opaque to the engine and echoed into the run
// summary.
// -----------------------------------------------------------------------------
struct EngineConfig {
  EngineMode mode{EngineMode::Backtest};
  std::string strategy;
  double capital{0.0};
  domain::MarketDataType data_type{domain::MarketDataType::Bar};
  nlohmann::json parameters = nlohmann::json::object();
  std::vector<domain::Instrument> symbols;

  std::string replay_file;
  std::string summary_file;

  std::string market_data_endpoint{"tcp://127.0.0.1:5555"};
  std::optional<IpcConfig> ipc;
  BrokerConfig broker;
};

// Throws ConfigError on a missing key, a wrong type or an invalid value.
EngineConfig parseEngineConfig(const nlohmann::json& document);

// Reads and parses `path`. Throws ConfigError when the file cannot be opened
// or is not valid JSON.
EngineConfig loadEngineConfig(const std::string& path);

domain::Instrument parseInstrument(const nlohmann::json& entry);

}  // namespace meridian
