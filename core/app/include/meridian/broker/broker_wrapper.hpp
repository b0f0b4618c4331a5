#pragma once

#include "meridian/broker/broker_transport.hpp"
#include "meridian/concurrent/debounce_timer.hpp"
#include "meridian/concurrent/order_id_generator.hpp"
#include "meridian/concurrent/sync_event.hpp"
#include "meridian/domain/account.hpp"
#include "meridian/domain/symbol_registry.hpp"
#include "meridian/events/event.hpp"
#include "meridian/performance/performance_collector.hpp"
#include "meridian/time/i_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace meridian {

// -----------------------------------------------------------------------------
// BrokerWrapper: applies broker callbacks to the engine's state
// -----------------------------------------------------------------------------
//
// @brief  IBrokerCallbacks implementation. Turns each callback into a typed
//         Broker*Event for the portfolio loop, a record for the
//         PerformanceCollector, or a handshake signal for BrokerClient.
//
// @details
// Handshake signals (SyncEvent, waited on by BrokerClient::connect()):
//   connected        connectAck
//   validId          nextValidId (also resets the OrderIdGenerator)
//   accountDownload  accountDownloadEnd
//   openOrders       openOrderEnd
//   contractDetails  contractDetailsEnd, or error 200
//
// connectionClosed() marks the session lost until the next resetHandshake(),
// so a connect_ack that arrives later cannot make the client ready again
// without a full handshake.
//
// Contract replies are matched on req_id: details, end markers and error 200
// for any request other than the one in flight are ignored.
//
// Account values: the fields listed in kAccountKeys are buffered as they
// arrive. An UnrealizedPnL value (the last field of each broker burst)
// restarts the debounce timer; when it fires, the buffer is flushed as one
// BrokerAccountEvent. accountDownloadEnd cancels the timer and flushes
// immediately, so the first snapshot is in place before the handshake
// continues.
//
// Portfolio pushes become BrokerPositionEvents; a zero position carries
// quantity 0 and removes the entry.
//
// Errors: 502 (cannot reach the broker) calls the fatal handler; 200
// (contract not found) fails the contract validation in flight. Every other
// code is logged.
//
// Thread model:
//   Callbacks run on the transport thread; the debounce flush runs on the
//   timer thread. The account buffer and contract state are mutex-guarded.
//   The portfolio sink is thread-safe (EventLoopThread::push).
// -----------------------------------------------------------------------------
class BrokerWrapper final : public IBrokerCallbacks {
 public:
  using EventSink = std::function<void(Event)>;
  using FatalHandler = std::function<void(int code, const std::string&)>;

  static constexpr int kWrongEndpointError = 502;
  static constexpr int kContractNotFoundError = 200;

  static const std::vector<std::string> kAccountKeys;

  static constexpr int kNoContractRequest = -1;

  BrokerWrapper(const domain::SymbolRegistry& symbols, EventSink portfolio_sink,
                PerformanceCollector& performance, const ITimeProvider& clock,
                OrderIdGenerator& id_gen,
                std::chrono::milliseconds account_debounce,
                FatalHandler fatal_handler);

  BrokerWrapper(const BrokerWrapper&) = delete;
  BrokerWrapper& operator=(const BrokerWrapper&) = delete;

  // --- IBrokerCallbacks -------------------------------------------------------
  void connectAck() override;
  void connectionClosed() override;
  void nextValidId(std::int64_t order_id) override;
  void updateAccountValue(const std::string& key, const std::string& value,
                          const std::string& currency,
                          const std::string& account) override;
  void updatePortfolio(const BrokerPortfolioItem& item) override;
  void accountDownloadEnd(const std::string& account) override;
  void openOrder(const domain::ActiveOrder& order) override;
  void openOrderEnd() override;
  void orderStatus(const domain::OrderStatusUpdate& update) override;
  void accountSummary(int req_id, const std::string& account,
                      const std::string& tag, const std::string& value,
                      const std::string& currency) override;
  void accountSummaryEnd(int req_id) override;
  void execDetails(int req_id,
                   const domain::ExecutionDetail& execution) override;
  void commissionReport(const domain::CommissionReport& report) override;
  void contractDetails(int req_id, const BrokerContract& contract) override;
  void contractDetailsEnd(int req_id) override;
  void error(int req_id, int code, const std::string& message) override;

  // --- Handshake --------------------------------------------------------------
  // Clears the four connection signals and the lost flag before a
  // (re)connect.
  void resetHandshake();

  // true from connectionClosed() until resetHandshake().
  bool sessionLost() const { return session_lost_.load(); }

  SyncEvent& connected() { return connected_; }
  SyncEvent& validId() { return valid_id_; }
  SyncEvent& accountDownload() { return account_download_; }
  SyncEvent& openOrders() { return open_orders_; }

  // --- Contract validation (ContractManager) -----------------------------------
  void beginContractValidation(int req_id);
  SyncEvent& contractDetailsReceived() { return contract_event_; }
  // true once details arrived, false after error 200, nullopt before either.
  std::optional<bool> contractValid() const;

  // Snapshot of the buffered account values as an Account.
  domain::Account bufferedAccount() const;

  // Pushes the buffered account to the portfolio loop.
  void flushAccount();

  bool accountFlushPending() const { return account_timer_.pending(); }

 private:
  static domain::Account accountFrom(const std::map<std::string, double>& values,
                                     const std::string& currency,
                                     std::int64_t timestamp);

  // Caller holds mutex_.
  bool isContractRequest(int req_id) const;

  const domain::SymbolRegistry& symbols_;
  EventSink portfolio_sink_;
  PerformanceCollector& performance_;
  const ITimeProvider& clock_;
  OrderIdGenerator& id_gen_;
  FatalHandler fatal_handler_;

  SyncEvent connected_;
  SyncEvent valid_id_;
  SyncEvent account_download_;
  SyncEvent open_orders_;
  SyncEvent contract_event_;

  mutable std::mutex mutex_;
  std::map<std::string, double> account_values_;
  std::string account_currency_{"USD"};
  std::map<std::string, double> summary_values_;
  std::string summary_currency_{"USD"};
  std::optional<bool> contract_valid_;
  int contract_req_id_{kNoContractRequest};
  std::atomic<bool> session_lost_{false};

  // Last member: its thread calls flushAccount() and must stop first.
  DebounceTimer account_timer_;
};

}  // namespace meridian
