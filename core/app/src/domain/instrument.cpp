#include "meridian/domain/instrument.hpp"
#include "meridian/errors.hpp"

#include <cmath>

namespace meridian::domain {

const char* toString(SecurityType type) {
  switch (type) {
    case SecurityType::Equity: return "STK";
    case SecurityType::Future: return "FUT";
    case SecurityType::Option: return "OPT";
    case SecurityType::Index:  return "IND";
    case SecurityType::Crypto: return "CRYPTO";
    case SecurityType::Bond:   return "BOND";
  }
  return "UNKNOWN";
}

SecurityType securityTypeFromString(const std::string& text) {
  if (text == "STK") return SecurityType::Equity;
  if (text == "FUT") return SecurityType::Future;
  if (text == "OPT") return SecurityType::Option;
  if (text == "IND") return SecurityType::Index;
  if (text == "CRYPTO") return SecurityType::Crypto;
  if (text == "BOND") return SecurityType::Bond;
  throw ConfigError("unknown security type: " + text);
}

// -----------------------------------------------------------------------------
// validateInstrument
// -----------------------------------------------------------------------------
void validateInstrument(const Instrument& instrument) {
  const std::string where = "instrument '" + instrument.ticker + "': ";

  if (instrument.ticker.empty()) {
    throw ConfigError("instrument ticker must not be empty");
  }
  if (!std::isfinite(instrument.fees) || instrument.fees < 0.0) {
    throw ConfigError(where + "fees must be >= 0");
  }
  if (!std::isfinite(instrument.initial_margin) ||
      instrument.initial_margin < 0.0) {
    throw ConfigError(where + "initial_margin must be >= 0");
  }
  if (!(instrument.quantity_multiplier > 0.0)) {
    throw ConfigError(where + "quantity_multiplier must be > 0");
  }
  if (!(instrument.price_multiplier > 0.0)) {
    throw ConfigError(where + "price_multiplier must be > 0");
  }
  if (!(instrument.tick_size > 0.0)) {
    throw ConfigError(where + "tick_size must be > 0");
  }
  if (!std::isfinite(instrument.slippage_factor) ||
      instrument.slippage_factor < 0.0) {
    throw ConfigError(where + "slippage_factor must be >= 0");
  }
  if (instrument.currency.empty()) {
    throw ConfigError(where + "currency must not be empty");
  }
}

}  // namespace meridian::domain
