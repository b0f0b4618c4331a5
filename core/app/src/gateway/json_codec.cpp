#include "meridian/gateway/json_codec.hpp"

#include <cmath>
#include <stdexcept>

namespace meridian {

namespace {

double round4(double value) { return std::round(value * 1e4) / 1e4; }

}  // namespace

// -----------------------------------------------------------------------------
// Decoding
// -----------------------------------------------------------------------------
Event decodeFeedMessage(const std::string& payload) {
  return decodeFeedMessage(nlohmann::json::parse(payload));
}

Event decodeFeedMessage(const nlohmann::json& message) {
  const std::string type = message.at("type").get<std::string>();
  const std::int64_t timestamp = message.at("timestamp").get<std::int64_t>();

  if (type == "market_data") {
    MarketFeedEvent feed;
    feed.timestamp = timestamp;
    for (const auto& [ticker, entry] : message.at("data").items()) {
      feed.data.emplace(ticker, decodeMarketData(entry, timestamp));
    }
    return feed;
  }

  if (type == "signal") {
    SignalEvent signal;
    signal.timestamp = timestamp;
    signal.trade_capital = message.at("trade_capital").get<double>();
    for (const auto& entry : message.at("instructions")) {
      signal.instructions.push_back(decodeInstruction(entry));
    }
    return signal;
  }

  if (type == "end_of_day") {
    return EndOfDayEvent{timestamp};
  }

  throw std::invalid_argument("unknown feed message type: " + type);
}

domain::MarketData decodeMarketData(const nlohmann::json& entry,
                                    std::int64_t default_timestamp) {
  const std::int64_t timestamp =
      entry.value("timestamp", default_timestamp);

  if (entry.contains("close")) {
    domain::BarData bar;
    bar.timestamp = timestamp;
    bar.open = entry.at("open").get<double>();
    bar.high = entry.at("high").get<double>();
    bar.low = entry.at("low").get<double>();
    bar.close = entry.at("close").get<double>();
    bar.volume = entry.value("volume", 0.0);
    return bar;
  }

  domain::QuoteData quote;
  quote.timestamp = timestamp;
  quote.bid = entry.at("bid").get<double>();
  quote.bid_size = entry.at("bid_size").get<double>();
  quote.ask = entry.at("ask").get<double>();
  quote.ask_size = entry.at("ask_size").get<double>();
  return quote;
}

domain::TradeInstruction decodeInstruction(const nlohmann::json& entry) {
  domain::TradeInstruction instruction;
  instruction.ticker = entry.at("ticker").get<std::string>();
  instruction.order_type = domain::orderTypeFromString(
      entry.value("order_type", std::string("MKT")));
  instruction.action =
      domain::actionFromString(entry.at("action").get<std::string>());
  instruction.trade_id = entry.at("trade_id").get<int>();
  instruction.leg_id = entry.at("leg_id").get<int>();
  instruction.weight = entry.value("weight", 0.0);
  instruction.quantity = entry.value("quantity", 0.0);
  if (entry.contains("limit_price") && !entry.at("limit_price").is_null()) {
    instruction.limit_price = entry.at("limit_price").get<double>();
  }
  if (entry.contains("aux_price") && !entry.at("aux_price").is_null()) {
    instruction.aux_price = entry.at("aux_price").get<double>();
  }
  return instruction;
}

// -----------------------------------------------------------------------------
// Encoding
// -----------------------------------------------------------------------------
nlohmann::json toJson(const domain::Trade& trade) {
  return {{"timestamp", trade.timestamp},
          {"trade_id", trade.trade_id},
          {"leg_id", trade.leg_id},
          {"ticker", trade.ticker},
          {"quantity", trade.quantity},
          {"avg_price", trade.price},
          {"trade_value", trade.cost},
          {"action", domain::toString(trade.action)},
          {"fees", trade.fees}};
}

nlohmann::json toJson(const domain::Position& position) {
  return {{"ticker", position.ticker},
          {"security_type", domain::toString(position.security_type)},
          {"action", domain::toString(position.side)},
          {"quantity", position.quantity},
          {"avg_price", position.avg_price},
          {"quantity_multiplier", position.quantity_multiplier},
          {"price_multiplier", position.price_multiplier},
          {"initial_margin", position.initial_margin},
          {"market_price", position.market_price},
          {"market_value", position.market_value},
          {"unrealized_pnl", position.unrealized_pnl}};
}

nlohmann::json toJson(const domain::ActiveOrder& order) {
  return {{"order_id", order.order_id},
          {"perm_id", order.perm_id},
          {"client_id", order.client_id},
          {"parent_id", order.parent_id},
          {"account", order.account},
          {"ticker", order.ticker},
          {"security_type", order.security_type},
          {"exchange", order.exchange},
          {"action", order.action},
          {"order_type", order.order_type},
          {"total_quantity", order.total_quantity},
          {"limit_price", order.limit_price},
          {"aux_price", order.aux_price},
          {"status", domain::toString(order.status)},
          {"filled", order.filled},
          {"remaining", order.remaining},
          {"avg_fill_price", order.avg_fill_price},
          {"last_fill_price", order.last_fill_price},
          {"why_held", order.why_held}};
}

nlohmann::json toJson(const domain::Account& account) {
  nlohmann::json j = {{"timestamp", account.timestamp},
                      {"currency", account.currency},
                      {"available_funds", account.available_funds},
                      {"required_margin", account.required_margin},
                      {"net_liquidation", account.net_liquidation},
                      {"unrealized_pnl", account.unrealized_pnl}};
  if (account.maintenance_margin) {
    j["maintenance_margin"] = *account.maintenance_margin;
  }
  if (account.excess_liquidity) {
    j["excess_liquidity"] = *account.excess_liquidity;
  }
  if (account.buying_power) {
    j["buying_power"] = *account.buying_power;
  }
  if (account.futures_pnl) {
    j["futures_pnl"] = *account.futures_pnl;
  }
  if (account.cash_balance) {
    j["cash_balance"] = *account.cash_balance;
  }
  return j;
}

nlohmann::json toJson(const domain::TradeInstruction& instruction) {
  nlohmann::json j = {{"ticker", instruction.ticker},
                      {"order_type", domain::toString(instruction.order_type)},
                      {"action", domain::toString(instruction.action)},
                      {"trade_id", instruction.trade_id},
                      {"leg_id", instruction.leg_id},
                      {"weight", round4(instruction.weight)},
                      {"quantity", instruction.quantity}};
  if (instruction.limit_price) {
    j["limit_price"] = *instruction.limit_price;
  }
  if (instruction.aux_price) {
    j["aux_price"] = *instruction.aux_price;
  }
  return j;
}

nlohmann::json toJson(const SignalEvent& signal) {
  nlohmann::json instructions = nlohmann::json::array();
  for (const auto& instruction : signal.instructions) {
    instructions.push_back(toJson(instruction));
  }
  return {{"timestamp", signal.timestamp},
          {"trade_capital", signal.trade_capital},
          {"trade_instructions", std::move(instructions)}};
}

nlohmann::json toJson(const domain::ExecutionDetail& detail) {
  return {{"timestamp", detail.timestamp},
          {"exec_id", detail.exec_id},
          {"order_id", detail.order_id},
          {"perm_id", detail.perm_id},
          {"ticker", detail.ticker},
          {"side", domain::toString(detail.side)},
          {"quantity", detail.quantity},
          {"price", detail.price},
          {"cumulative_quantity", detail.cumulative_quantity},
          {"avg_price", detail.avg_price}};
}

}  // namespace meridian
