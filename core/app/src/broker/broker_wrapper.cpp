#include "meridian/broker/broker_wrapper.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace meridian {

const std::vector<std::string> BrokerWrapper::kAccountKeys = {
    "FullAvailableFunds", "FullInitMarginReq", "NetLiquidation",
    "UnrealizedPnL",      "FullMaintMarginReq", "ExcessLiquidity",
    "Currency",           "BuyingPower",        "FuturesPNL",
    "TotalCashBalance"};

namespace {

bool isAccountKey(const std::string& key) {
  const auto& keys = BrokerWrapper::kAccountKeys;
  return std::find(keys.begin(), keys.end(), key) != keys.end();
}

std::optional<double> lookup(const std::map<std::string, double>& values,
                             const char* key) {
  auto it = values.find(key);
  if (it == values.end()) {
    return std::nullopt;
  }
  return it->second;
}

}  // namespace

BrokerWrapper::BrokerWrapper(const domain::SymbolRegistry& symbols,
                             EventSink portfolio_sink,
                             PerformanceCollector& performance,
                             const ITimeProvider& clock,
                             OrderIdGenerator& id_gen,
                             std::chrono::milliseconds account_debounce,
                             FatalHandler fatal_handler)
    : symbols_(symbols),
      portfolio_sink_(std::move(portfolio_sink)),
      performance_(performance),
      clock_(clock),
      id_gen_(id_gen),
      fatal_handler_(std::move(fatal_handler)),
      account_timer_(account_debounce, [this] { flushAccount(); }) {}

// -----------------------------------------------------------------------------
// Connection
// -----------------------------------------------------------------------------
void BrokerWrapper::connectAck() {
  std::cout << "[BrokerWrapper] broker connection established\n";
  connected_.set();
}

void BrokerWrapper::connectionClosed() {
  session_lost_.store(true);
  connected_.clear();
  std::cerr << "[BrokerWrapper] broker connection closed\n";
}

void BrokerWrapper::nextValidId(std::int64_t order_id) {
  id_gen_.reset(order_id);
  std::cout << "[BrokerWrapper] next valid id " << order_id << "\n";
  valid_id_.set();
}

void BrokerWrapper::resetHandshake() {
  session_lost_.store(false);
  connected_.clear();
  valid_id_.clear();
  account_download_.clear();
  open_orders_.clear();
}

// -----------------------------------------------------------------------------
// Account values: buffered, flushed by the debounce timer
// -----------------------------------------------------------------------------
void BrokerWrapper::updateAccountValue(const std::string& key,
                                       const std::string& value,
                                       const std::string& currency,
                                       const std::string& /*account*/) {
  if (!isAccountKey(key)) {
    return;
  }

  {
    std::lock_guard lock(mutex_);
    if (key == "Currency") {
      account_currency_ = value;
    } else {
      try {
        account_values_[key] = std::stod(value);
      } catch (const std::logic_error&) {
        std::cerr << "[BrokerWrapper] non-numeric account value " << key
                  << "=" << value << "\n";
        return;
      }
      if (!currency.empty() && currency != "BASE") {
        account_currency_ = currency;
      }
    }
  }

  if (key == "UnrealizedPnL") {
    account_timer_.touch();
  }
}

void BrokerWrapper::accountDownloadEnd(const std::string& account) {
  account_timer_.cancel();
  flushAccount();
  performance_.updateAccountLog(bufferedAccount());

  std::cout << "[BrokerWrapper] account download complete for "
            << (account.empty() ? "?" : account) << "\n";
  account_download_.set();
}

void BrokerWrapper::flushAccount() {
  portfolio_sink_(BrokerAccountEvent{bufferedAccount()});
}

domain::Account BrokerWrapper::bufferedAccount() const {
  std::lock_guard lock(mutex_);
  return accountFrom(account_values_, account_currency_, clock_.now_ns());
}

domain::Account BrokerWrapper::accountFrom(
    const std::map<std::string, double>& values, const std::string& currency,
    std::int64_t timestamp) {
  domain::Account account;
  account.timestamp = timestamp;
  account.currency = currency;
  account.available_funds = lookup(values, "FullAvailableFunds").value_or(0.0);
  account.required_margin = lookup(values, "FullInitMarginReq").value_or(0.0);
  account.net_liquidation = lookup(values, "NetLiquidation").value_or(0.0);
  account.unrealized_pnl = lookup(values, "UnrealizedPnL").value_or(0.0);
  account.maintenance_margin = lookup(values, "FullMaintMarginReq");
  account.excess_liquidity = lookup(values, "ExcessLiquidity");
  account.buying_power = lookup(values, "BuyingPower");
  account.futures_pnl = lookup(values, "FuturesPNL");
  account.cash_balance = lookup(values, "TotalCashBalance");
  return account;
}

// -----------------------------------------------------------------------------
// Portfolio pushes
// -----------------------------------------------------------------------------
void BrokerWrapper::updatePortfolio(const BrokerPortfolioItem& item) {
  auto instrument = symbols_.find(item.contract.ticker);
  if (!instrument) {
    std::cerr << "[BrokerWrapper] portfolio push for unknown instrument "
              << item.contract.ticker << " ignored\n";
    return;
  }

  domain::Position position;
  position.ticker = instrument->ticker;
  position.security_type = instrument->security_type;
  position.side =
      item.position < 0.0 ? domain::BrokerSide::Sell : domain::BrokerSide::Buy;
  position.quantity = item.position;
  position.avg_price = item.average_cost;
  position.quantity_multiplier = instrument->quantity_multiplier;
  position.price_multiplier = instrument->price_multiplier;
  position.initial_margin = instrument->initial_margin;
  position.market_price = item.market_price;
  position.market_value = item.market_value;
  position.unrealized_pnl = item.unrealized_pnl;

  portfolio_sink_(BrokerPositionEvent{position});
}

// -----------------------------------------------------------------------------
// Orders
// -----------------------------------------------------------------------------
void BrokerWrapper::openOrder(const domain::ActiveOrder& order) {
  portfolio_sink_(BrokerOpenOrderEvent{order});
}

void BrokerWrapper::openOrderEnd() {
  std::cout << "[BrokerWrapper] initial open orders received\n";
  open_orders_.set();
}

void BrokerWrapper::orderStatus(const domain::OrderStatusUpdate& update) {
  if (domain::isTerminal(update.status)) {
    std::cout << "[BrokerWrapper] order " << update.order_id << " -> "
              << domain::toString(update.status) << " filled=" << update.filled
              << " avg=" << update.avg_fill_price << "\n";
  }
  portfolio_sink_(BrokerOrderStatusEvent{update});
}

// -----------------------------------------------------------------------------
// Account summary (on request)
// -----------------------------------------------------------------------------
void BrokerWrapper::accountSummary(int /*req_id*/, const std::string& /*account*/,
                                   const std::string& tag,
                                   const std::string& value,
                                   const std::string& currency) {
  if (!isAccountKey(tag) || tag == "Currency") {
    return;
  }
  std::lock_guard lock(mutex_);
  try {
    summary_values_[tag] = std::stod(value);
  } catch (const std::logic_error&) {
    std::cerr << "[BrokerWrapper] non-numeric summary value " << tag << "="
              << value << "\n";
    return;
  }
  if (!currency.empty()) {
    summary_currency_ = currency;
  }
}

void BrokerWrapper::accountSummaryEnd(int req_id) {
  domain::Account snapshot;
  {
    std::lock_guard lock(mutex_);
    snapshot = accountFrom(summary_values_, summary_currency_, clock_.now_ns());
  }
  performance_.updateAccountLog(snapshot);
  std::cout << "[BrokerWrapper] account summary " << req_id << " complete\n";
}

// -----------------------------------------------------------------------------
// Executions
// -----------------------------------------------------------------------------
void BrokerWrapper::execDetails(int /*req_id*/,
                                const domain::ExecutionDetail& execution) {
  performance_.updateExecution(execution);
  std::cout << "[BrokerWrapper] execution " << execution.exec_id << " "
            << domain::toString(execution.side) << " " << execution.quantity
            << " " << execution.ticker << " @ " << execution.price << "\n";
}

void BrokerWrapper::commissionReport(const domain::CommissionReport& report) {
  performance_.updateCommission(report);
}

// -----------------------------------------------------------------------------
// Contract validation
// -----------------------------------------------------------------------------
void BrokerWrapper::beginContractValidation(int req_id) {
  {
    std::lock_guard lock(mutex_);
    contract_valid_.reset();
    contract_req_id_ = req_id;
  }
  contract_event_.clear();
}

void BrokerWrapper::contractDetails(int req_id,
                                    const BrokerContract& contract) {
  std::lock_guard lock(mutex_);
  if (!isContractRequest(req_id)) {
    std::cerr << "[BrokerWrapper] stale contract details for "
              << contract.ticker << " (req " << req_id << ") ignored\n";
    return;
  }
  contract_valid_ = true;
}

void BrokerWrapper::contractDetailsEnd(int req_id) {
  {
    std::lock_guard lock(mutex_);
    if (!isContractRequest(req_id)) {
      return;
    }
    contract_req_id_ = kNoContractRequest;
  }
  contract_event_.set();
}

bool BrokerWrapper::isContractRequest(int req_id) const {
  return contract_req_id_ != kNoContractRequest && req_id == contract_req_id_;
}

std::optional<bool> BrokerWrapper::contractValid() const {
  std::lock_guard lock(mutex_);
  return contract_valid_;
}

// -----------------------------------------------------------------------------
// error
// -----------------------------------------------------------------------------
void BrokerWrapper::error(int req_id, int code, const std::string& message) {
  if (code == kWrongEndpointError) {
    std::cerr << "[BrokerWrapper] FATAL " << code
              << ": cannot reach broker endpoint: " << message << "\n";
    fatal_handler_(code, message);
    return;
  }

  if (code == kContractNotFoundError) {
    std::cerr << "[BrokerWrapper] " << code << " (req " << req_id
              << "): " << message << "\n";
    {
      std::lock_guard lock(mutex_);
      if (!isContractRequest(req_id)) {
        return;
      }
      contract_valid_ = false;
      contract_req_id_ = kNoContractRequest;
    }
    contract_event_.set();
    return;
  }

  std::cerr << "[BrokerWrapper] error " << code << " (req " << req_id
            << "): " << message << "\n";
}

}  // namespace meridian
