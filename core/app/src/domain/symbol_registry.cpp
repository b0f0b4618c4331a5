#include "meridian/domain/symbol_registry.hpp"
#include "meridian/errors.hpp"

#include <algorithm>
#include <utility>

namespace meridian::domain {

SymbolRegistry::SymbolRegistry(const std::vector<Instrument>& instruments) {
  for (const auto& instrument : instruments) {
    add(instrument);
  }
}

void SymbolRegistry::add(Instrument instrument) {
  validateInstrument(instrument);

  if (instrument.data_ticker.empty()) {
    instrument.data_ticker = instrument.ticker;
  }

  const std::string ticker = instrument.ticker;
  auto [it, inserted] = instruments_.emplace(
      ticker, std::make_shared<const Instrument>(std::move(instrument)));
  if (!inserted) {
    throw ConfigError("duplicate instrument ticker: " + ticker);
  }
}

std::shared_ptr<const Instrument> SymbolRegistry::find(
    const std::string& ticker) const {
  auto it = instruments_.find(ticker);
  return (it != instruments_.end()) ? it->second : nullptr;
}

const Instrument& SymbolRegistry::at(const std::string& ticker) const {
  auto it = instruments_.find(ticker);
  if (it == instruments_.end()) {
    throw LedgerError("unknown instrument: " + ticker);
  }
  return *it->second;
}

bool SymbolRegistry::contains(const std::string& ticker) const {
  return instruments_.count(ticker) != 0;
}

std::vector<std::shared_ptr<const Instrument>> SymbolRegistry::all() const {
  std::vector<std::shared_ptr<const Instrument>> result;
  result.reserve(instruments_.size());
  for (const auto& [ticker, instrument] : instruments_) {
    result.push_back(instrument);
  }
  // Stable order for logging and tests.
  std::sort(result.begin(), result.end(),
            [](const auto& a, const auto& b) { return a->ticker < b->ticker; });
  return result;
}

}  // namespace meridian::domain
