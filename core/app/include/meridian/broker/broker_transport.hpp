#pragma once

#include "meridian/domain/active_order.hpp"
#include "meridian/domain/instrument.hpp"
#include "meridian/domain/order.hpp"
#include "meridian/domain/trade.hpp"

#include <cstdint>
#include <string>

namespace meridian {

// Contract identity as the broker sees it.
struct BrokerContract {
  std::string ticker;
  std::string security_type;  // STK, FUT, ...
  std::string exchange;
  std::string currency{"USD"};
};

BrokerContract contractFor(const domain::Instrument& instrument);

// One portfolio push from the account-updates subscription.
struct BrokerPortfolioItem {
  BrokerContract contract;
  double position{0.0};
  double market_price{0.0};
  double market_value{0.0};
  double average_cost{0.0};
  double unrealized_pnl{0.0};
  double realized_pnl{0.0};
  std::string account;
};

// -----------------------------------------------------------------------------
// IBrokerCallbacks: everything the broker can tell us
// -----------------------------------------------------------------------------
//
// Invoked on the transport's callback thread. Implementations must not block
// it for long; BrokerWrapper forwards state changes to the portfolio loop.
// -----------------------------------------------------------------------------
class IBrokerCallbacks {
 public:
  virtual ~IBrokerCallbacks() = default;

  virtual void connectAck() = 0;
  virtual void connectionClosed() = 0;
  virtual void nextValidId(std::int64_t order_id) = 0;

  virtual void updateAccountValue(const std::string& key,
                                  const std::string& value,
                                  const std::string& currency,
                                  const std::string& account) = 0;
  virtual void updatePortfolio(const BrokerPortfolioItem& item) = 0;
  virtual void accountDownloadEnd(const std::string& account) = 0;

  virtual void openOrder(const domain::ActiveOrder& order) = 0;
  virtual void openOrderEnd() = 0;
  virtual void orderStatus(const domain::OrderStatusUpdate& update) = 0;

  virtual void accountSummary(int req_id, const std::string& account,
                              const std::string& tag, const std::string& value,
                              const std::string& currency) = 0;
  virtual void accountSummaryEnd(int req_id) = 0;

  virtual void execDetails(int req_id,
                           const domain::ExecutionDetail& execution) = 0;
  virtual void commissionReport(const domain::CommissionReport& report) = 0;

  virtual void contractDetails(int req_id, const BrokerContract& contract) = 0;
  virtual void contractDetailsEnd(int req_id) = 0;

  virtual void error(int req_id, int code, const std::string& message) = 0;
};

// -----------------------------------------------------------------------------
// IBrokerTransport: requests to the broker
// -----------------------------------------------------------------------------
//
// connect() starts delivering callbacks to `callbacks` on a thread owned by
// the transport; disconnect() stops it and must be safe to call at any time,
// including after the broker already closed the session or when nothing is
// open. Requests are asynchronous: their
// answers arrive as callbacks. Requests on a transport that is not connected
// throw BrokerError.
// -----------------------------------------------------------------------------
class IBrokerTransport {
 public:
  virtual ~IBrokerTransport() = default;

  virtual void connect(const std::string& endpoint, int client_id,
                       IBrokerCallbacks& callbacks) = 0;
  virtual void disconnect() = 0;
  virtual bool isConnected() const = 0;

  virtual void placeOrder(std::int64_t order_id, const BrokerContract& contract,
                          const domain::Order& order) = 0;
  virtual void cancelOrder(std::int64_t order_id) = 0;

  virtual void reqAccountUpdates(bool subscribe, const std::string& account) = 0;
  virtual void reqOpenOrders() = 0;
  virtual void reqAccountSummary(int req_id, const std::string& group,
                                 const std::string& tags) = 0;
  virtual void reqContractDetails(int req_id,
                                  const BrokerContract& contract) = 0;
};

}  // namespace meridian
