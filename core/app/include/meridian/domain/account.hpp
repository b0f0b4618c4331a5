#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace meridian::domain {

// -----------------------------------------------------------------------------
// Account: account-level snapshot
// -----------------------------------------------------------------------------
//
// Backtest: produced by ExecutionSimulator from the position ledger, current
// prices and the realized cash flows. Live: assembled from broker account
// value pushes. The optional fields are only reported by the broker.
// -----------------------------------------------------------------------------
struct Account {
  std::int64_t timestamp{0};
  std::string currency{"USD"};
  double available_funds{0.0};
  double required_margin{0.0};
  double net_liquidation{0.0};
  double unrealized_pnl{0.0};

  std::optional<double> maintenance_margin;
  std::optional<double> excess_liquidity;
  std::optional<double> buying_power;
  std::optional<double> futures_pnl;
  std::optional<double> cash_balance;
};

bool operator==(const Account& lhs, const Account& rhs);
bool operator!=(const Account& lhs, const Account& rhs);

}  // namespace meridian::domain
