#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <variant>

namespace meridian::domain {

// One order book serves exactly one of these kinds.
enum class MarketDataType { Bar, Quote };

// "BAR" / "QUOTE". Unknown text is a configuration error (ConfigError).
MarketDataType marketDataTypeFromString(const std::string& text);
const char* toString(MarketDataType type);

// Timestamps are UNIX epoch nanoseconds throughout the engine.
struct BarData {
  std::int64_t timestamp{0};
  double open{0.0};
  double high{0.0};
  double low{0.0};
  double close{0.0};
  double volume{0.0};
};

struct QuoteData {
  std::int64_t timestamp{0};
  double bid{0.0};
  double bid_size{0.0};
  double ask{0.0};
  double ask_size{0.0};
};

using MarketData = std::variant<BarData, QuoteData>;

// ticker -> latest data, as delivered by one feed batch.
using MarketDataBatch = std::unordered_map<std::string, MarketData>;

MarketDataType dataTypeOf(const MarketData& data);

// Close for bars, (ask + bid) / 2 for quotes.
double priceOf(const MarketData& data);

std::int64_t timestampOf(const MarketData& data);

// Throws std::invalid_argument unless every price/size field is > 0 and the
// bar volume is >= 0.
void validateMarketData(const MarketData& data);

}  // namespace meridian::domain
