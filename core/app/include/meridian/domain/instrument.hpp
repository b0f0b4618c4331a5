#pragma once

#include <string>

namespace meridian::domain {

enum class SecurityType { Equity, Future, Option, Index, Crypto, Bond };

// Wire codes used in configuration and on the broker bridge:
// STK, FUT, OPT, IND, CRYPTO, BOND.
const char* toString(SecurityType type);
SecurityType securityTypeFromString(const std::string& text);

// -----------------------------------------------------------------------------
// Instrument: static per-ticker trading parameters
// -----------------------------------------------------------------------------
//
// @brief  Fees, margin, multipliers and tick size for one tradable ticker.
//
// @details
// Instances are created once from configuration, validated by
// validateInstrument(), and then owned by SymbolRegistry as
// shared_ptr<const Instrument>. Every component resolves the same object, so
// no component can hold a diverging copy of the parameters.
//
// Field semantics:
//   fees                 commission per unit of quantity
//   initial_margin       margin reserved per unit (leveraged kinds only)
//   quantity_multiplier  contract size (1 for equities)
//   price_multiplier     quote-to-currency scaling (1 for most instruments)
//   tick_size            minimum price increment; only futures carry a
//                        configured tick, other kinds slip by 1.0 per tick
//   slippage_factor      ticks of adverse price movement applied to fills
// -----------------------------------------------------------------------------
struct Instrument {
  std::string ticker;
  std::string data_ticker;
  SecurityType security_type{SecurityType::Equity};
  std::string currency{"USD"};
  std::string exchange;
  double fees{0.0};
  double initial_margin{0.0};
  double quantity_multiplier{1.0};
  double price_multiplier{1.0};
  double tick_size{1.0};
  double slippage_factor{0.0};

  // Futures reserve margin instead of consuming cash at entry.
  bool isLeveraged() const { return security_type == SecurityType::Future; }

  double contractMultiplier() const {
    return price_multiplier * quantity_multiplier;
  }

  // Per-tick price offset applied by the backtest fill model.
  double slippage() const {
    const double tick = isLeveraged() ? tick_size : 1.0;
    return tick * slippage_factor;
  }
};

// Throws ConfigError naming the offending field.
void validateInstrument(const Instrument& instrument);

}  // namespace meridian::domain
