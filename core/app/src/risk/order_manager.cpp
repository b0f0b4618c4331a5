#include "meridian/risk/order_manager.hpp"

#include <cmath>
#include <iostream>
#include <set>
#include <stdexcept>

namespace meridian {

// -----------------------------------------------------------------------------
// Constructor / destructor
// -----------------------------------------------------------------------------
OrderManager::OrderManager(EventBus& bus,
                           const domain::SymbolRegistry& symbols,
                           const OrderBook& book,
                           const PortfolioServer& portfolio)
    : bus_(bus), symbols_(symbols), book_(book), portfolio_(portfolio) {
  signal_sub_id_ = bus_.subscribe<SignalEvent>(
      [this](const SignalEvent& e) { onSignal(e); });
}

OrderManager::~OrderManager() { bus_.unsubscribe(signal_sub_id_); }

// -----------------------------------------------------------------------------
// onSignal
// -----------------------------------------------------------------------------
bool OrderManager::onSignal(const SignalEvent& event) {
  if (event.instructions.empty()) {
    reject(event, "no instructions");
    return false;
  }

  // --- Duplicate guard --------------------------------------------------------
  const std::set<std::string> busy = portfolio_.activeOrderTickers();
  for (const auto& instruction : event.instructions) {
    if (busy.count(instruction.ticker) != 0) {
      reject(event, "pending order on " + instruction.ticker);
      return false;
    }
  }

  // --- Build every order before publishing any --------------------------------
  std::vector<OrderEvent> orders;
  orders.reserve(event.instructions.size());
  double required = 0.0;

  for (const auto& instruction : event.instructions) {
    try {
      domain::validateInstruction(instruction);
    } catch (const std::invalid_argument& e) {
      reject(event, e.what());
      return false;
    }

    auto instrument = symbols_.find(instruction.ticker);
    if (!instrument) {
      reject(event, "unknown instrument " + instruction.ticker);
      return false;
    }

    auto price = book_.currentPrice(instruction.ticker);
    if (!price) {
      reject(event, "no market price for " + instruction.ticker);
      return false;
    }

    const double size =
        sizeOf(instruction, *instrument, *price, event.trade_capital);
    if (!(size > 0.0)) {
      reject(event, "zero size for " + instruction.ticker);
      return false;
    }

    OrderEvent order_event;
    order_event.timestamp = event.timestamp;
    order_event.trade_id = instruction.trade_id;
    order_event.leg_id = instruction.leg_id;
    order_event.action = instruction.action;
    order_event.ticker = instruction.ticker;
    try {
      order_event.order =
          domain::makeOrder(instruction.action, size, instruction.order_type,
                            instruction.limit_price, instruction.aux_price);
    } catch (const std::invalid_argument& e) {
      reject(event, e.what());
      return false;
    }

    required += order_event.order.orderValue(*instrument, *price);
    orders.push_back(std::move(order_event));
  }

  // --- Capital check ----------------------------------------------------------
  const domain::Account account = portfolio_.account();
  const double free_capital = account.available_funds - account.required_margin;
  if (free_capital < required) {
    reject(event, "insufficient capital: required=" + std::to_string(required) +
                      " available=" + std::to_string(free_capital));
    return false;
  }

  ++accepted_signals_;
  std::cout << "[OrderManager] signal ts=" << event.timestamp << " accepted: "
            << orders.size() << " order(s), required=" << required << "\n";

  for (const auto& order_event : orders) {
    bus_.publish(order_event);
  }
  return true;
}

// -----------------------------------------------------------------------------
// sizeOf
// -----------------------------------------------------------------------------
double OrderManager::sizeOf(const domain::TradeInstruction& instruction,
                            const domain::Instrument& instrument, double price,
                            double trade_capital) const {
  if (instruction.quantity > 0.0) {
    return instruction.quantity;
  }

  if (domain::isEntry(instruction.action)) {
    const double unit = price * instrument.contractMultiplier();
    if (!(trade_capital > 0.0) || !(unit > 0.0)) {
      return 0.0;
    }
    return trade_capital * std::abs(instruction.weight) / unit;
  }

  auto position = portfolio_.position(instruction.ticker);
  return position ? std::abs(position->quantity) : 0.0;
}

void OrderManager::reject(const SignalEvent& event, const std::string& reason) {
  ++rejected_signals_;
  std::cerr << "[OrderManager] signal ts=" << event.timestamp
            << " dropped: " << reason << "\n";
}

}  // namespace meridian
