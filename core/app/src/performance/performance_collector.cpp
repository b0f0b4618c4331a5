#include "meridian/performance/performance_collector.hpp"
#include "meridian/gateway/json_codec.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace meridian {

PerformanceCollector::PerformanceCollector(EventBus& bus,
                                           nlohmann::json parameters,
                                           double starting_capital)
    : bus_(bus),
      parameters_(std::move(parameters)),
      starting_capital_(starting_capital) {
  signal_sub_id_ = bus_.subscribe<SignalEvent>(
      [this](const SignalEvent& e) { updateSignals(e); });
  execution_sub_id_ = bus_.subscribe<ExecutionEvent>(
      [this](const ExecutionEvent& e) { updateTrades(e.trade); });
  account_sub_id_ = bus_.subscribe<AccountUpdateEvent>(
      [this](const AccountUpdateEvent& e) {
        updateEquity({e.account.timestamp, e.account.net_liquidation});
      });
}

PerformanceCollector::~PerformanceCollector() {
  bus_.unsubscribe(account_sub_id_);
  bus_.unsubscribe(execution_sub_id_);
  bus_.unsubscribe(signal_sub_id_);
}

// -----------------------------------------------------------------------------
// Recording
// -----------------------------------------------------------------------------
void PerformanceCollector::updateSignals(const SignalEvent& signal) {
  std::lock_guard lock(mutex_);
  signals_.push_back(signal);
}

void PerformanceCollector::updateTrades(const domain::Trade& trade) {
  std::lock_guard lock(mutex_);
  if (std::find(trades_.begin(), trades_.end(), trade) != trades_.end()) {
    return;
  }
  trades_.push_back(trade);
}

void PerformanceCollector::updateEquity(const EquityPoint& point) {
  std::lock_guard lock(mutex_);
  if (!equity_.empty() && equity_.back().timestamp == point.timestamp) {
    equity_.back() = point;
    return;
  }
  equity_.push_back(point);
}

void PerformanceCollector::updateAccountLog(const domain::Account& account) {
  std::lock_guard lock(mutex_);
  account_log_.push_back(account);
}

void PerformanceCollector::updateExecution(
    const domain::ExecutionDetail& detail) {
  std::lock_guard lock(mutex_);
  executions_.push_back(detail);
}

void PerformanceCollector::updateCommission(
    const domain::CommissionReport& report) {
  std::lock_guard lock(mutex_);
  commissions_.push_back(report);
}

void PerformanceCollector::setRunCounters(int rejected_signals,
                                          int margin_calls) {
  std::lock_guard lock(mutex_);
  rejected_signals_ = rejected_signals;
  margin_calls_ = margin_calls;
}

// -----------------------------------------------------------------------------
// Readers
// -----------------------------------------------------------------------------
std::vector<domain::Trade> PerformanceCollector::trades() const {
  std::lock_guard lock(mutex_);
  return trades_;
}

std::vector<EquityPoint> PerformanceCollector::equityCurve() const {
  std::lock_guard lock(mutex_);
  return equity_;
}

std::size_t PerformanceCollector::signalCount() const {
  std::lock_guard lock(mutex_);
  return signals_.size();
}

std::size_t PerformanceCollector::accountLogSize() const {
  std::lock_guard lock(mutex_);
  return account_log_.size();
}

// -----------------------------------------------------------------------------
// summary
// -----------------------------------------------------------------------------
nlohmann::json PerformanceCollector::summary() const {
  std::lock_guard lock(mutex_);

  nlohmann::json timeseries = nlohmann::json::array();
  double peak = starting_capital_;
  double previous = starting_capital_;
  double max_drawdown = 0.0;
  for (const auto& point : equity_) {
    peak = std::max(peak, point.equity);
    const double period_return =
        previous != 0.0 ? point.equity / previous - 1.0 : 0.0;
    const double drawdown = peak != 0.0 ? point.equity / peak - 1.0 : 0.0;
    max_drawdown = std::min(max_drawdown, drawdown);
    previous = point.equity;

    timeseries.push_back({{"timestamp", point.timestamp},
                          {"equity", point.equity},
                          {"period_return", period_return},
                          {"drawdown", drawdown}});
  }

  double total_fees = 0.0;
  nlohmann::json trades = nlohmann::json::array();
  for (const auto& trade : trades_) {
    total_fees += trade.fees;
    trades.push_back(toJson(trade));
  }

  nlohmann::json signals = nlohmann::json::array();
  for (const auto& signal : signals_) {
    signals.push_back(toJson(signal));
  }

  const double ending_equity =
      equity_.empty() ? starting_capital_ : equity_.back().equity;
  const double net_profit = ending_equity - starting_capital_;

  nlohmann::json document;
  document["parameters"] = parameters_;
  document["static_stats"] = {
      {"net_profit", net_profit},
      {"total_return",
       starting_capital_ != 0.0 ? net_profit / starting_capital_ : 0.0},
      {"total_fees", total_fees},
      {"ending_equity", ending_equity},
      {"max_drawdown", max_drawdown},
      {"total_trades", trades_.size()},
      {"total_signals", signals_.size()},
      {"rejected_signals", rejected_signals_},
      {"margin_calls", margin_calls_}};
  document["timeseries_stats"] = std::move(timeseries);
  document["trades"] = std::move(trades);
  document["signals"] = std::move(signals);

  if (!account_log_.empty()) {
    nlohmann::json log = nlohmann::json::array();
    for (const auto& account : account_log_) {
      log.push_back(toJson(account));
    }
    document["account_log"] = std::move(log);
  }
  if (!executions_.empty()) {
    nlohmann::json executions = nlohmann::json::array();
    for (const auto& detail : executions_) {
      nlohmann::json entry = toJson(detail);
      for (const auto& report : commissions_) {
        if (report.exec_id == detail.exec_id) {
          entry["commission"] = report.commission;
          entry["realized_pnl"] = report.realized_pnl;
        }
      }
      executions.push_back(std::move(entry));
    }
    document["executions"] = std::move(executions);
  }
  return document;
}

void PerformanceCollector::writeSummary(const std::string& path) const {
  std::ofstream out(path);
  if (!out) {
    throw std::runtime_error("cannot write summary file: " + path);
  }
  out << summary().dump(2) << "\n";
  std::cout << "[PerformanceCollector] summary written to " << path << "\n";
}

}  // namespace meridian
