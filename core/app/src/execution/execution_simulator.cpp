#include "meridian/execution/execution_simulator.hpp"
#include "meridian/errors.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

namespace meridian {

namespace {

double roundTo(double value, int decimals) {
  const double scale = std::pow(10.0, decimals);
  return std::round(value * scale) / scale;
}

bool sameDirection(double a, double b) {
  return (a > 0.0 && b > 0.0) || (a < 0.0 && b < 0.0);
}

domain::BrokerSide sideOf(double quantity) {
  return quantity > 0.0 ? domain::BrokerSide::Buy : domain::BrokerSide::Sell;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: seed the account with the starting capital
// -----------------------------------------------------------------------------
ExecutionSimulator::ExecutionSimulator(EventBus& bus,
                                       const domain::SymbolRegistry& symbols,
                                       const OrderBook& book,
                                       PortfolioServer& portfolio,
                                       double capital)
    : bus_(bus), symbols_(symbols), book_(book), portfolio_(portfolio) {
  if (!(capital > 0.0)) {
    throw ConfigError("starting capital must be > 0");
  }
  account_.available_funds = capital;
  account_.net_liquidation = capital;

  portfolio_.updateAccountDetails(account_);

  order_sub_id_ = bus_.subscribe<OrderEvent>(
      [this](const OrderEvent& e) { placeOrder(e); });
  eod_sub_id_ = bus_.subscribe<EndOfDayEvent>(
      [this](const EndOfDayEvent& e) { endOfDay(e.timestamp); });
}

ExecutionSimulator::~ExecutionSimulator() {
  bus_.unsubscribe(eod_sub_id_);
  bus_.unsubscribe(order_sub_id_);
}

// -----------------------------------------------------------------------------
// fillPrice
// -----------------------------------------------------------------------------
double ExecutionSimulator::fillPrice(const domain::Instrument& instrument,
                                     domain::Action action,
                                     double market_price) {
  return market_price + domain::actionSign(action) * instrument.slippage();
}

// -----------------------------------------------------------------------------
// placeOrder(OrderEvent)
// -----------------------------------------------------------------------------
void ExecutionSimulator::placeOrder(const OrderEvent& event) {
  try {
    const domain::Instrument& instrument = symbols_.at(event.ticker);
    placeOrder(event.timestamp, event.trade_id, event.leg_id, event.action,
               instrument, event.order);
  } catch (const LedgerError& e) {
    {
      std::lock_guard lock(mutex_);
      ++rejected_orders_;
    }
    std::cerr << "[ExecutionSimulator] order for " << event.ticker
              << " dropped: " << e.what() << "\n";
  }
}

// -----------------------------------------------------------------------------
// placeOrder(...): fill price, commission, ledger, record, emit
// -----------------------------------------------------------------------------
domain::Trade ExecutionSimulator::placeOrder(std::int64_t timestamp,
                                             int trade_id, int leg_id,
                                             domain::Action action,
                                             const domain::Instrument& instrument,
                                             const domain::Order& order) {
  const std::string& ticker = instrument.ticker;
  const double quantity = order.quantity();
  const double fees = order.commission(instrument);

  domain::Trade trade;
  std::vector<domain::Position> changed;
  domain::Account account;

  {
    std::lock_guard lock(mutex_);

    const double fill = fillPrice(instrument, action, priceLocked(ticker));

    applyFillLocked(instrument, quantity, fill, fees);
    recomputeAccountLocked();

    trade.timestamp = timestamp;
    trade.trade_id = trade_id;
    trade.leg_id = leg_id;
    trade.ticker = ticker;
    trade.quantity = roundTo(quantity, 4);
    trade.price = fill;
    trade.cost = roundTo(fill * instrument.contractMultiplier() * quantity, 2);
    trade.action = action;
    trade.fees = roundTo(fees, 4);
    last_trades_.insert_or_assign(ticker, trade);

    auto it = positions_.find(ticker);
    changed.push_back(it != positions_.end() ? it->second
                                             : removedPosition(ticker));
    account = account_;
  }

  syncPortfolio(changed, account);

  ExecutionEvent execution;
  execution.timestamp = timestamp;
  execution.trade = trade;
  execution.action = action;
  execution.ticker = ticker;
  bus_.publish(execution);

  std::cout << "[ExecutionSimulator] filled " << domain::toString(action)
            << " " << quantity << " " << ticker << " @ " << trade.price
            << " fees=" << trade.fees << " (trade " << trade_id << "/"
            << leg_id << ")\n";
  return trade;
}

// -----------------------------------------------------------------------------
// applyFillLocked: cash movement and position arithmetic for one fill
// -----------------------------------------------------------------------------
void ExecutionSimulator::applyFillLocked(const domain::Instrument& instrument,
                                         double signed_quantity,
                                         double fill_price, double fees) {
  const std::string& ticker = instrument.ticker;
  const double unit = fill_price * instrument.contractMultiplier();

  account_.available_funds -= fees;
  total_fees_ += fees;

  if (!instrument.isLeveraged()) {
    account_.available_funds -= unit * signed_quantity;
  }

  auto it = positions_.find(ticker);

  // ----- Case 1: no prior exposure -------------------------------------------
  if (it == positions_.end()) {
    domain::Position pos;
    pos.ticker = ticker;
    pos.security_type = instrument.security_type;
    pos.side = sideOf(signed_quantity);
    pos.quantity = signed_quantity;
    pos.avg_price = unit;
    pos.quantity_multiplier = instrument.quantity_multiplier;
    pos.price_multiplier = instrument.price_multiplier;
    pos.initial_margin = instrument.initial_margin;
    positions_.emplace(ticker, pos);
    return;
  }

  domain::Position& pos = it->second;
  const double current = pos.quantity;

  // ----- Case 2: adding in the same direction --------------------------------
  if (sameDirection(current, signed_quantity)) {
    const double total = current + signed_quantity;
    pos.avg_price =
        (pos.avg_price * current + unit * signed_quantity) / total;
    pos.quantity = total;
    return;
  }

  // Opposite direction: realize the overlapping part at the fill.
  const double abs_current = std::abs(current);
  const double abs_fill = std::abs(signed_quantity);
  const double closed = std::min(abs_current, abs_fill);
  const double overlap = current > 0.0 ? closed : -closed;
  const double realized = (unit - pos.avg_price) * overlap;
  realized_pnl_ += realized;

  if (instrument.isLeveraged()) {
    const double settled_share = pos.settled_pnl * (closed / abs_current);
    account_.available_funds += realized - settled_share;
    pos.settled_pnl -= settled_share;
  }

  // ----- Case 3: partial reduction -------------------------------------------
  if (abs_fill < abs_current) {
    pos.quantity = current + signed_quantity;
    return;
  }

  // ----- Case 4: exact close -------------------------------------------------
  if (abs_fill == abs_current) {
    positions_.erase(it);
    return;
  }

  // ----- Case 5: flip --------------------------------------------------------
  pos.quantity = current + signed_quantity;
  pos.side = sideOf(pos.quantity);
  pos.avg_price = unit;
  pos.settled_pnl = 0.0;
}

// -----------------------------------------------------------------------------
// recomputeAccountLocked: derive margin, PnL and liquidation from positions
// -----------------------------------------------------------------------------
void ExecutionSimulator::recomputeAccountLocked() {
  double margin = 0.0;
  double unrealized = 0.0;
  double liquidation = 0.0;

  for (auto& [ticker, pos] : positions_) {
    const double price = priceLocked(ticker);
    pos.market_price = price;
    pos.market_value = pos.currentValue(price);
    pos.unrealized_pnl = pos.openPnl(price);

    margin += pos.requiredMargin();
    unrealized += pos.unrealized_pnl;
    liquidation += pos.liquidationValue(price);
  }

  account_.timestamp = book_.lastUpdated();
  account_.required_margin = margin;
  account_.unrealized_pnl = unrealized;
  account_.net_liquidation = account_.available_funds + liquidation;
}

double ExecutionSimulator::priceLocked(const std::string& ticker) const {
  auto price = book_.currentPrice(ticker);
  if (!price) {
    throw LedgerError("no market price for " + ticker);
  }
  return *price;
}

domain::Position ExecutionSimulator::removedPosition(
    const std::string& ticker) const {
  domain::Position pos;
  pos.ticker = ticker;
  pos.quantity = 0.0;
  return pos;
}

// -----------------------------------------------------------------------------
// markToMarket
// -----------------------------------------------------------------------------
void ExecutionSimulator::markToMarket() {
  std::vector<domain::Position> changed;
  domain::Account account;

  {
    std::lock_guard lock(mutex_);

    for (auto& [ticker, pos] : positions_) {
      if (!pos.isLeveraged()) {
        continue;
      }
      const double open_pnl = pos.openPnl(priceLocked(ticker));
      account_.available_funds += open_pnl - pos.settled_pnl;
      pos.settled_pnl = open_pnl;
    }
    recomputeAccountLocked();

    for (const auto& [ticker, pos] : positions_) {
      changed.push_back(pos);
    }
    account = account_;
  }

  syncPortfolio(changed, account);
}

bool ExecutionSimulator::checkMarginCall() const {
  std::lock_guard lock(mutex_);
  return account_.available_funds < account_.required_margin;
}

// -----------------------------------------------------------------------------
// endOfDay
// -----------------------------------------------------------------------------
bool ExecutionSimulator::endOfDay(std::int64_t timestamp) {
  try {
    markToMarket();
  } catch (const LedgerError& e) {
    std::cerr << "[ExecutionSimulator] end-of-day mark failed at ts="
              << timestamp << ": " << e.what() << "\n";
    return false;
  }

  const bool margin_call = checkMarginCall();
  if (margin_call) {
    const domain::Account snapshot = account();
    {
      std::lock_guard lock(mutex_);
      ++margin_calls_;
    }
    std::cerr << "[ExecutionSimulator] MARGIN CALL at ts=" << timestamp
              << ": funds=" << snapshot.available_funds
              << " < required margin=" << snapshot.required_margin << "\n";
  }
  return margin_call;
}

// -----------------------------------------------------------------------------
// liquidatePositions
// -----------------------------------------------------------------------------
std::vector<domain::Trade> ExecutionSimulator::liquidatePositions() {
  std::vector<domain::Trade> trades;
  std::vector<domain::Position> changed;
  domain::Account account;

  {
    std::lock_guard lock(mutex_);

    // Snapshot first: applyFillLocked erases from positions_.
    std::vector<domain::Position> open;
    for (const auto& [ticker, pos] : positions_) {
      open.push_back(pos);
    }

    for (const auto& pos : open) {
      const domain::Instrument& instrument = symbols_.at(pos.ticker);
      const double price = priceLocked(pos.ticker);
      const double quantity = -pos.quantity;
      const domain::Action action =
          pos.quantity > 0.0 ? domain::Action::Sell : domain::Action::Cover;

      applyFillLocked(instrument, quantity, price, 0.0);

      domain::Trade trade;
      auto last = last_trades_.find(pos.ticker);
      if (last != last_trades_.end()) {
        trade.trade_id = last->second.trade_id;
        trade.leg_id = last->second.leg_id;
      }
      auto data = book_.marketData(pos.ticker);
      trade.timestamp = data ? domain::timestampOf(*data) : book_.lastUpdated();
      trade.ticker = pos.ticker;
      trade.quantity = roundTo(quantity, 4);
      trade.price = price;
      trade.cost =
          roundTo(price * instrument.contractMultiplier() * quantity, 2);
      trade.action = action;
      trade.fees = 0.0;
      last_trades_.insert_or_assign(pos.ticker, trade);

      trades.push_back(trade);
      changed.push_back(removedPosition(pos.ticker));
    }

    recomputeAccountLocked();
    account = account_;
  }

  syncPortfolio(changed, account);

  for (const auto& trade : trades) {
    ExecutionEvent execution;
    execution.timestamp = trade.timestamp;
    execution.trade = trade;
    execution.action = trade.action;
    execution.ticker = trade.ticker;
    bus_.publish(execution);
  }

  std::cout << "[ExecutionSimulator] liquidated " << trades.size()
            << " position(s); net_liq=" << account.net_liquidation << "\n";
  return trades;
}

// -----------------------------------------------------------------------------
// syncPortfolio
// -----------------------------------------------------------------------------
void ExecutionSimulator::syncPortfolio(
    const std::vector<domain::Position>& changed,
    const domain::Account& account) {
  for (const auto& pos : changed) {
    portfolio_.updatePositions(pos.ticker, pos);
  }
  portfolio_.updateAccountDetails(account);
}

// -----------------------------------------------------------------------------
// Accessors
// -----------------------------------------------------------------------------
domain::Account ExecutionSimulator::account() const {
  std::lock_guard lock(mutex_);
  return account_;
}

std::optional<domain::Position> ExecutionSimulator::position(
    const std::string& ticker) const {
  std::lock_guard lock(mutex_);
  auto it = positions_.find(ticker);
  if (it == positions_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<domain::Position> ExecutionSimulator::positions() const {
  std::lock_guard lock(mutex_);
  std::vector<domain::Position> result;
  for (const auto& [ticker, pos] : positions_) {
    result.push_back(pos);
  }
  return result;
}

std::optional<domain::Trade> ExecutionSimulator::lastTrade(
    const std::string& ticker) const {
  std::lock_guard lock(mutex_);
  auto it = last_trades_.find(ticker);
  if (it == last_trades_.end()) {
    return std::nullopt;
  }
  return it->second;
}

double ExecutionSimulator::realizedPnl() const {
  std::lock_guard lock(mutex_);
  return realized_pnl_;
}

double ExecutionSimulator::totalFees() const {
  std::lock_guard lock(mutex_);
  return total_fees_;
}

int ExecutionSimulator::marginCalls() const {
  std::lock_guard lock(mutex_);
  return margin_calls_;
}

int ExecutionSimulator::rejectedOrders() const {
  std::lock_guard lock(mutex_);
  return rejected_orders_;
}

}  // namespace meridian
