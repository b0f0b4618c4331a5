#include "meridian/broker/broker_codec.hpp"

#include <cmath>
#include <stdexcept>

namespace meridian {

BrokerContract contractFor(const domain::Instrument& instrument) {
  BrokerContract contract;
  contract.ticker = instrument.ticker;
  contract.security_type = domain::toString(instrument.security_type);
  contract.exchange = instrument.exchange;
  contract.currency = instrument.currency;
  return contract;
}

// -----------------------------------------------------------------------------
// Contracts and orders
// -----------------------------------------------------------------------------
nlohmann::json encodeContract(const BrokerContract& contract) {
  return {{"symbol", contract.ticker},
          {"sec_type", contract.security_type},
          {"exchange", contract.exchange},
          {"currency", contract.currency}};
}

BrokerContract decodeContract(const nlohmann::json& j) {
  BrokerContract contract;
  contract.ticker = j.at("symbol").get<std::string>();
  contract.security_type = j.value("sec_type", std::string());
  contract.exchange = j.value("exchange", std::string());
  contract.currency = j.value("currency", std::string("USD"));
  return contract;
}

nlohmann::json encodePlaceOrder(std::int64_t order_id,
                                const BrokerContract& contract,
                                const domain::Order& order) {
  nlohmann::json j = {{"type", "place_order"},
                      {"order_id", order_id},
                      {"contract", encodeContract(contract)},
                      {"action", domain::toString(order.side())},
                      {"total_quantity", std::abs(order.quantity())},
                      {"order_type", domain::toString(order.type())}};
  if (auto limit = order.limitPrice()) {
    j["limit_price"] = *limit;
  }
  if (auto aux = order.auxPrice()) {
    j["aux_price"] = *aux;
  }
  return j;
}

namespace {

domain::ActiveOrder decodeOpenOrder(const nlohmann::json& j) {
  domain::ActiveOrder order;
  order.order_id = j.at("order_id").get<std::int64_t>();
  order.perm_id = j.value("perm_id", std::int64_t{0});
  order.client_id = j.value("client_id", std::int64_t{0});
  order.parent_id = j.value("parent_id", std::int64_t{0});
  order.account = j.value("account", std::string());
  order.ticker = j.at("symbol").get<std::string>();
  order.security_type = j.value("sec_type", std::string());
  order.exchange = j.value("exchange", std::string());
  order.action = j.at("action").get<std::string>();
  order.order_type = j.value("order_type", std::string("MKT"));
  order.total_quantity = j.at("total_quantity").get<double>();
  order.cash_quantity = j.value("cash_quantity", 0.0);
  order.limit_price = j.value("limit_price", 0.0);
  order.aux_price = j.value("aux_price", 0.0);
  order.status = domain::orderStatusFromString(j.at("status").get<std::string>());
  order.remaining = order.total_quantity;
  return order;
}

domain::OrderStatusUpdate decodeOrderStatus(const nlohmann::json& j) {
  domain::OrderStatusUpdate update;
  update.order_id = j.at("order_id").get<std::int64_t>();
  update.perm_id = j.value("perm_id", std::int64_t{0});
  update.parent_id = j.value("parent_id", std::int64_t{0});
  update.status =
      domain::orderStatusFromString(j.at("status").get<std::string>());
  update.filled = j.value("filled", 0.0);
  update.remaining = j.value("remaining", 0.0);
  update.avg_fill_price = j.value("avg_fill_price", 0.0);
  update.last_fill_price = j.value("last_fill_price", 0.0);
  update.mkt_cap_price = j.value("mkt_cap_price", 0.0);
  update.why_held = j.value("why_held", std::string());
  return update;
}

domain::ExecutionDetail decodeExecution(const nlohmann::json& j) {
  domain::ExecutionDetail detail;
  detail.timestamp = j.value("timestamp", std::int64_t{0});
  detail.exec_id = j.at("exec_id").get<std::string>();
  detail.order_id = j.value("order_id", std::int64_t{0});
  detail.perm_id = j.value("perm_id", std::int64_t{0});
  detail.ticker = j.at("symbol").get<std::string>();
  detail.side = domain::brokerSideFromString(j.at("side").get<std::string>());
  detail.quantity = j.at("shares").get<double>();
  detail.price = j.at("price").get<double>();
  detail.cumulative_quantity = j.value("cum_qty", detail.quantity);
  detail.avg_price = j.value("avg_price", detail.price);
  return detail;
}

}  // namespace

// -----------------------------------------------------------------------------
// dispatchBrokerMessage
// -----------------------------------------------------------------------------
void dispatchBrokerMessage(const nlohmann::json& message,
                           IBrokerCallbacks& callbacks) {
  const std::string type = message.at("type").get<std::string>();

  if (type == "connect_ack") {
    callbacks.connectAck();
  } else if (type == "connection_closed") {
    callbacks.connectionClosed();
  } else if (type == "next_valid_id") {
    callbacks.nextValidId(message.at("order_id").get<std::int64_t>());
  } else if (type == "account_value") {
    callbacks.updateAccountValue(message.at("key").get<std::string>(),
                                 message.at("value").get<std::string>(),
                                 message.value("currency", std::string()),
                                 message.value("account", std::string()));
  } else if (type == "portfolio") {
    BrokerPortfolioItem item;
    item.contract = decodeContract(message.at("contract"));
    item.position = message.at("position").get<double>();
    item.market_price = message.value("market_price", 0.0);
    item.market_value = message.value("market_value", 0.0);
    item.average_cost = message.value("average_cost", 0.0);
    item.unrealized_pnl = message.value("unrealized_pnl", 0.0);
    item.realized_pnl = message.value("realized_pnl", 0.0);
    item.account = message.value("account", std::string());
    callbacks.updatePortfolio(item);
  } else if (type == "account_download_end") {
    callbacks.accountDownloadEnd(message.value("account", std::string()));
  } else if (type == "open_order") {
    callbacks.openOrder(decodeOpenOrder(message.at("order")));
  } else if (type == "open_order_end") {
    callbacks.openOrderEnd();
  } else if (type == "order_status") {
    callbacks.orderStatus(decodeOrderStatus(message));
  } else if (type == "account_summary") {
    callbacks.accountSummary(message.at("req_id").get<int>(),
                             message.value("account", std::string()),
                             message.at("tag").get<std::string>(),
                             message.at("value").get<std::string>(),
                             message.value("currency", std::string()));
  } else if (type == "account_summary_end") {
    callbacks.accountSummaryEnd(message.at("req_id").get<int>());
  } else if (type == "exec_details") {
    callbacks.execDetails(message.value("req_id", -1),
                          decodeExecution(message.at("execution")));
  } else if (type == "commission_report") {
    domain::CommissionReport report;
    report.exec_id = message.at("exec_id").get<std::string>();
    report.commission = message.at("commission").get<double>();
    report.currency = message.value("currency", std::string());
    report.realized_pnl = message.value("realized_pnl", 0.0);
    callbacks.commissionReport(report);
  } else if (type == "contract_details") {
    callbacks.contractDetails(message.at("req_id").get<int>(),
                              decodeContract(message.at("contract")));
  } else if (type == "contract_details_end") {
    callbacks.contractDetailsEnd(message.at("req_id").get<int>());
  } else if (type == "error") {
    callbacks.error(message.value("req_id", -1), message.at("code").get<int>(),
                    message.value("message", std::string()));
  } else {
    throw std::invalid_argument("unknown broker message type: " + type);
  }
}

}  // namespace meridian
