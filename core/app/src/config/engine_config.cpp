#include "meridian/config/engine_config.hpp"
#include "meridian/errors.hpp"

#include <fstream>
#include <set>

namespace meridian {

namespace {

template <typename T>
T required(const nlohmann::json& object, const char* key) {
  if (!object.contains(key)) {
    throw ConfigError(std::string("missing required key '") + key + "'");
  }
  try {
    return object.at(key).get<T>();
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError(std::string("bad value for '") + key + "': " + e.what());
  }
}

template <typename T>
T valueOr(const nlohmann::json& object, const char* key, T fallback) {
  if (!object.contains(key) || object.at(key).is_null()) {
    return fallback;
  }
  try {
    return object.at(key).get<T>();
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError(std::string("bad value for '") + key + "': " + e.what());
  }
}

EngineMode modeFromString(const std::string& text) {
  if (text == "backtest") return EngineMode::Backtest;
  if (text == "live") return EngineMode::Live;
  throw ConfigError("unknown mode: " + text);
}

}  // namespace

const char* toString(EngineMode mode) {
  return mode == EngineMode::Live ? "live" : "backtest";
}

// -----------------------------------------------------------------------------
// parseInstrument
// -----------------------------------------------------------------------------
domain::Instrument parseInstrument(const nlohmann::json& entry) {
  if (!entry.is_object()) {
    throw ConfigError("symbol entry must be an object");
  }

  domain::Instrument instrument;
  instrument.ticker = required<std::string>(entry, "ticker");
  instrument.data_ticker =
      valueOr<std::string>(entry, "data_ticker", instrument.ticker);
  instrument.security_type = domain::securityTypeFromString(
      required<std::string>(entry, "security_type"));
  instrument.currency = valueOr<std::string>(entry, "currency", "USD");
  instrument.exchange = valueOr<std::string>(entry, "exchange", "");
  instrument.fees = required<double>(entry, "fees");
  instrument.initial_margin = valueOr<double>(entry, "initial_margin", 0.0);
  instrument.quantity_multiplier =
      valueOr<double>(entry, "quantity_multiplier", 1.0);
  instrument.price_multiplier =
      valueOr<double>(entry, "price_multiplier", 1.0);
  instrument.tick_size = valueOr<double>(entry, "tick_size", 1.0);
  instrument.slippage_factor = valueOr<double>(entry, "slippage_factor", 0.0);

  domain::validateInstrument(instrument);
  return instrument;
}

// -----------------------------------------------------------------------------
// parseEngineConfig
// -----------------------------------------------------------------------------
EngineConfig parseEngineConfig(const nlohmann::json& document) {
  if (!document.is_object()) {
    throw ConfigError("config root must be an object");
  }

  EngineConfig config;
  config.mode = modeFromString(required<std::string>(document, "mode"));
  config.strategy = valueOr<std::string>(document, "strategy", "");
  config.capital = required<double>(document, "capital");
  if (!(config.capital > 0.0)) {
    throw ConfigError("capital must be > 0");
  }
  config.data_type = domain::marketDataTypeFromString(
      required<std::string>(document, "data_type"));

  if (document.contains("parameters")) {
    config.parameters = document.at("parameters");
  }

  if (!document.contains("symbols")) {
    throw ConfigError("missing required key 'symbols'");
  }
  const auto& symbols = document.at("symbols");
  if (!symbols.is_array() || symbols.empty()) {
    throw ConfigError("'symbols' must be a non-empty array");
  }
  std::set<std::string> seen;
  for (const auto& entry : symbols) {
    domain::Instrument instrument = parseInstrument(entry);
    if (!seen.insert(instrument.ticker).second) {
      throw ConfigError("duplicate instrument ticker: " + instrument.ticker);
    }
    config.symbols.push_back(std::move(instrument));
  }

  config.summary_file = valueOr<std::string>(document, "summary_file", "");

  if (config.mode == EngineMode::Backtest) {
    config.replay_file = required<std::string>(document, "replay_file");
    return config;
  }

  config.market_data_endpoint = valueOr<std::string>(
      document, "market_data_endpoint", config.market_data_endpoint);

  if (document.contains("ipc")) {
    const auto& ipc = document.at("ipc");
    IpcConfig ipc_config;
    ipc_config.command_endpoint = valueOr<std::string>(
        ipc, "command_endpoint", ipc_config.command_endpoint);
    ipc_config.telemetry_endpoint = valueOr<std::string>(
        ipc, "telemetry_endpoint", ipc_config.telemetry_endpoint);
    config.ipc = ipc_config;
  }

  if (!document.contains("broker")) {
    throw ConfigError("live mode requires a 'broker' section");
  }
  const auto& broker = document.at("broker");
  config.broker.endpoint = required<std::string>(broker, "endpoint");
  config.broker.client_id = valueOr<int>(broker, "client_id", 0);
  config.broker.account = valueOr<std::string>(broker, "account", "");
  config.broker.handshake_timeout_ms = valueOr<int>(
      broker, "handshake_timeout_ms", config.broker.handshake_timeout_ms);
  config.broker.account_debounce_ms = valueOr<int>(
      broker, "account_debounce_ms", config.broker.account_debounce_ms);
  if (config.broker.handshake_timeout_ms <= 0) {
    throw ConfigError("broker.handshake_timeout_ms must be > 0");
  }
  if (config.broker.account_debounce_ms < 0) {
    throw ConfigError("broker.account_debounce_ms must be >= 0");
  }
  return config;
}

// -----------------------------------------------------------------------------
// loadEngineConfig
// -----------------------------------------------------------------------------
EngineConfig loadEngineConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("cannot open config file: " + path);
  }

  nlohmann::json document;
  try {
    in >> document;
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError("config file " + path + " is not valid JSON: " +
                      e.what());
  }
  return parseEngineConfig(document);
}

}  // namespace meridian
