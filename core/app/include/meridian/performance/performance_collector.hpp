#pragma once

#include "meridian/domain/account.hpp"
#include "meridian/domain/trade.hpp"
#include "meridian/eventbus/event_bus.hpp"
#include "meridian/events/event_types.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace meridian {

struct EquityPoint {
  std::int64_t timestamp{0};
  double equity{0.0};
};

// -----------------------------------------------------------------------------
// PerformanceCollector
// -----------------------------------------------------------------------------
//
// @brief  Records what a run did (signals, trades, the equity curve, broker
//         account snapshots and executions) and turns it into the run
//         summary document.
//
// @details
// Subscriptions (on the bus given at construction):
//   SignalEvent         appended to the signal log
//   ExecutionEvent      trade appended unless an identical record exists
//   AccountUpdateEvent  net liquidation appended to the equity curve; a point
//                       with the timestamp of the last one replaces it
//
// BrokerWrapper feeds the live-only records (account summaries, execution
// details, commission reports) through the update* methods directly.
//
// Summary layout:
//   { "parameters": {...},
//     "static_stats": { net_profit, total_return, total_fees, ending_equity,
//                       max_drawdown, total_trades, total_signals,
//                       rejected_signals, margin_calls },
//     "timeseries_stats": [ {timestamp, equity, period_return, drawdown} ],
//     "trades": [...], "signals": [...] }
// max_drawdown and drawdown are fractions of the running peak (<= 0).
//
// Thread model: internally locked. Live writers are the engine loop and
// the broker callback thread.
// -----------------------------------------------------------------------------
class PerformanceCollector {
 public:
  PerformanceCollector(EventBus& bus, nlohmann::json parameters,
                       double starting_capital);
  ~PerformanceCollector();

  PerformanceCollector(const PerformanceCollector&) = delete;
  PerformanceCollector& operator=(const PerformanceCollector&) = delete;

  void updateSignals(const SignalEvent& signal);
  void updateTrades(const domain::Trade& trade);
  void updateEquity(const EquityPoint& point);
  void updateAccountLog(const domain::Account& account);
  void updateExecution(const domain::ExecutionDetail& detail);
  void updateCommission(const domain::CommissionReport& report);

  // Counters owned by other components, copied in before summary().
  void setRunCounters(int rejected_signals, int margin_calls);

  std::vector<domain::Trade> trades() const;
  std::vector<EquityPoint> equityCurve() const;
  std::size_t signalCount() const;
  std::size_t accountLogSize() const;

  nlohmann::json summary() const;

  // Writes summary() to `path`. Throws std::runtime_error when the file
  // cannot be written.
  void writeSummary(const std::string& path) const;

 private:
  EventBus& bus_;
  EventBus::SubscriptionId signal_sub_id_{0};
  EventBus::SubscriptionId execution_sub_id_{0};
  EventBus::SubscriptionId account_sub_id_{0};

  const nlohmann::json parameters_;
  const double starting_capital_;

  mutable std::mutex mutex_;
  std::vector<SignalEvent> signals_;
  std::vector<domain::Trade> trades_;
  std::vector<EquityPoint> equity_;
  std::vector<domain::Account> account_log_;
  std::vector<domain::ExecutionDetail> executions_;
  std::vector<domain::CommissionReport> commissions_;
  int rejected_signals_{0};
  int margin_calls_{0};
};

}  // namespace meridian
