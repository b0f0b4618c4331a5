#include "meridian/domain/market_data.hpp"
#include "meridian/errors.hpp"

#include <stdexcept>
#include <type_traits>

namespace meridian::domain {

MarketDataType marketDataTypeFromString(const std::string& text) {
  if (text == "BAR") return MarketDataType::Bar;
  if (text == "QUOTE") return MarketDataType::Quote;
  throw ConfigError("unknown market data type: " + text);
}

const char* toString(MarketDataType type) {
  switch (type) {
    case MarketDataType::Bar:   return "BAR";
    case MarketDataType::Quote: return "QUOTE";
  }
  return "UNKNOWN";
}

MarketDataType dataTypeOf(const MarketData& data) {
  return std::holds_alternative<BarData>(data) ? MarketDataType::Bar
                                               : MarketDataType::Quote;
}

double priceOf(const MarketData& data) {
  return std::visit(
      [](const auto& d) -> double {
        using T = std::decay_t<decltype(d)>;
        if constexpr (std::is_same_v<T, BarData>) {
          return d.close;
        } else {
          return (d.ask + d.bid) / 2.0;
        }
      },
      data);
}

std::int64_t timestampOf(const MarketData& data) {
  return std::visit([](const auto& d) { return d.timestamp; }, data);
}

// -----------------------------------------------------------------------------
// validateMarketData
// -----------------------------------------------------------------------------
void validateMarketData(const MarketData& data) {
  auto positive = [](double v) { return v > 0.0; };

  if (const auto* bar = std::get_if<BarData>(&data)) {
    if (!positive(bar->open) || !positive(bar->high) || !positive(bar->low) ||
        !positive(bar->close)) {
      throw std::invalid_argument("bar prices must be > 0");
    }
    if (!(bar->volume >= 0.0)) {
      throw std::invalid_argument("bar volume must be >= 0");
    }
    return;
  }

  const auto& quote = std::get<QuoteData>(data);
  if (!positive(quote.bid) || !positive(quote.ask) ||
      !positive(quote.bid_size) || !positive(quote.ask_size)) {
    throw std::invalid_argument("quote prices and sizes must be > 0");
  }
}

}  // namespace meridian::domain
