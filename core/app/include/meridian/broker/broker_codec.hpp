#pragma once

#include "meridian/broker/broker_transport.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace meridian {

// -----------------------------------------------------------------------------
// Broker bridge wire format
// -----------------------------------------------------------------------------
//
// Every frame exchanged with the broker bridge is one JSON object with a
// "type" field.
//
// Requests (engine -> bridge):
//   connect{client_id}  disconnect
//   place_order{order_id, contract, action, total_quantity, order_type,
//               limit_price?, aux_price?}
//   cancel_order{order_id}
//   req_account_updates{subscribe, account}  req_open_orders
//   req_account_summary{req_id, group, tags}
//   req_contract_details{req_id, contract}
//
// Callbacks (bridge -> engine), one per IBrokerCallbacks method:
//   connect_ack  connection_closed  next_valid_id{order_id}
//   account_value{key, value, currency, account}
//   portfolio{contract, position, market_price, market_value, average_cost,
//             unrealized_pnl, realized_pnl, account}
//   account_download_end{account}
//   open_order{order}  open_order_end
//   order_status{order_id, perm_id, parent_id, status, filled, remaining,
//                avg_fill_price, last_fill_price, mkt_cap_price, why_held}
//   account_summary{req_id, account, tag, value, currency}
//   account_summary_end{req_id}
//   exec_details{req_id, execution}  commission_report{exec_id, commission,
//                                                      currency, realized_pnl}
//   contract_details{req_id, contract}  contract_details_end{req_id}
//   error{req_id, code, message}
// -----------------------------------------------------------------------------

nlohmann::json encodeContract(const BrokerContract& contract);
BrokerContract decodeContract(const nlohmann::json& j);

nlohmann::json encodePlaceOrder(std::int64_t order_id,
                                const BrokerContract& contract,
                                const domain::Order& order);

// Decodes one callback frame and invokes the matching method. Throws
// nlohmann::json::exception on a malformed frame and std::invalid_argument
// on an unknown type or enum value.
void dispatchBrokerMessage(const nlohmann::json& message,
                           IBrokerCallbacks& callbacks);

}  // namespace meridian
