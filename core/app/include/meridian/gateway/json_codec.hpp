#pragma once

#include "meridian/domain/account.hpp"
#include "meridian/domain/active_order.hpp"
#include "meridian/domain/market_data.hpp"
#include "meridian/domain/position.hpp"
#include "meridian/domain/trade.hpp"
#include "meridian/domain/trade_instruction.hpp"
#include "meridian/events/event.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace meridian {

// -----------------------------------------------------------------------------
// JSON codec for feed messages and outbound documents
// -----------------------------------------------------------------------------
//
// Feed messages (replay file lines and the live market-data SUB socket):
//
//   {"type":"market_data","timestamp":T,
//    "data":{"AAPL":{"open":..,"high":..,"low":..,"close":..,"volume":..},
//            "ES":{"bid":..,"bid_size":..,"ask":..,"ask_size":..}}}
//   {"type":"signal","timestamp":T,"trade_capital":C,
//    "instructions":[{"ticker":"AAPL","order_type":"MKT","action":"LONG",
//                     "trade_id":1,"leg_id":1,"weight":0.5,"quantity":0}]}
//   {"type":"end_of_day","timestamp":T}
//
// An entry's own "timestamp" defaults to the message timestamp.
//
// Decoders throw nlohmann::json::exception on a malformed document and
// std::invalid_argument on a well-formed one carrying invalid values
// (an unknown message type, action or order type). Callers at a wire
// boundary catch both, log and skip.
// -----------------------------------------------------------------------------

// Decodes one feed message into a MarketFeedEvent, SignalEvent or
// EndOfDayEvent.
Event decodeFeedMessage(const std::string& payload);
Event decodeFeedMessage(const nlohmann::json& message);

domain::MarketData decodeMarketData(const nlohmann::json& entry,
                                    std::int64_t default_timestamp);

domain::TradeInstruction decodeInstruction(const nlohmann::json& entry);

// --- Encoders ----------------------------------------------------------------

nlohmann::json toJson(const domain::Trade& trade);
nlohmann::json toJson(const domain::Position& position);
nlohmann::json toJson(const domain::ActiveOrder& order);
nlohmann::json toJson(const domain::Account& account);
nlohmann::json toJson(const domain::TradeInstruction& instruction);
nlohmann::json toJson(const SignalEvent& signal);
nlohmann::json toJson(const domain::ExecutionDetail& detail);

}  // namespace meridian
