#pragma once

#include "meridian/domain/action.hpp"

#include <cstdint>
#include <string>

namespace meridian::domain {

// One fill, as recorded by the backtest simulator. `cost` is the signed
// notional (fill price * multipliers * quantity).
struct Trade {
  std::int64_t timestamp{0};
  int trade_id{0};
  int leg_id{0};
  std::string ticker;
  double quantity{0.0};
  double price{0.0};
  double cost{0.0};
  Action action{Action::Long};
  double fees{0.0};
};

bool operator==(const Trade& lhs, const Trade& rhs);
bool operator!=(const Trade& lhs, const Trade& rhs);

// Broker execution report (live). Matched to its CommissionReport by exec_id.
struct ExecutionDetail {
  std::int64_t timestamp{0};
  std::string exec_id;
  std::int64_t order_id{0};
  std::int64_t perm_id{0};
  std::string ticker;
  BrokerSide side{BrokerSide::Buy};
  double quantity{0.0};
  double price{0.0};
  double cumulative_quantity{0.0};
  double avg_price{0.0};
};

struct CommissionReport {
  std::string exec_id;
  double commission{0.0};
  std::string currency;
  double realized_pnl{0.0};
};

}  // namespace meridian::domain
