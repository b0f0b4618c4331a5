#include "meridian/broker/broker_client.hpp"
#include "meridian/errors.hpp"

#include <iostream>
#include <sstream>

namespace meridian {

BrokerClient::BrokerClient(EventBus& bus, IBrokerTransport& transport,
                           BrokerWrapper& wrapper, OrderIdGenerator& id_gen,
                           const domain::SymbolRegistry& symbols,
                           BrokerConfig config)
    : bus_(bus),
      transport_(transport),
      wrapper_(wrapper),
      id_gen_(id_gen),
      symbols_(symbols),
      config_(std::move(config)) {
  order_sub_id_ = bus_.subscribe<OrderEvent>(
      [this](const OrderEvent& e) { placeOrder(e); });
}

BrokerClient::~BrokerClient() { bus_.unsubscribe(order_sub_id_); }

// -----------------------------------------------------------------------------
// connect(): four-step handshake
// -----------------------------------------------------------------------------
void BrokerClient::connect() {
  std::lock_guard lock(connection_mutex_);
  ready_.store(false);
  // Whatever is left of an earlier session goes before the signals reset.
  transport_.disconnect();
  wrapper_.resetHandshake();

  std::cout << "[BrokerClient] connecting to " << config_.endpoint
            << " (client " << config_.client_id << ")\n";
  transport_.connect(config_.endpoint, config_.client_id, wrapper_);
  awaitStep(wrapper_.connected(), "connection acknowledgement");
  awaitStep(wrapper_.validId(), "next valid id");

  transport_.reqAccountUpdates(true, config_.account);
  awaitStep(wrapper_.accountDownload(), "account download");

  transport_.reqOpenOrders();
  awaitStep(wrapper_.openOrders(), "open orders");

  if (wrapper_.sessionLost()) {
    std::cerr << "[BrokerClient] connection closed during handshake\n";
    throw BrokerError("broker connection closed during handshake");
  }
  ready_.store(true);
  std::cout << "[BrokerClient] handshake complete, ready to trade\n";
}

void BrokerClient::awaitStep(SyncEvent& signal, const char* step) {
  const std::chrono::milliseconds timeout(config_.handshake_timeout_ms);
  if (!signal.wait_for(timeout)) {
    std::cerr << "[BrokerClient] timed out after " << timeout.count()
              << " ms waiting for " << step << "\n";
    throw BrokerError(std::string("broker handshake timed out waiting for ") +
                      step);
  }
  std::cout << "[BrokerClient] " << step << " received\n";
}

void BrokerClient::reconnect() {
  std::cout << "[BrokerClient] reconnecting\n";
  disconnect();
  connect();
}

// The transport is always torn down, even after the bridge dropped the
// session, so the next connect() starts from a fresh socket.
void BrokerClient::disconnect() {
  std::lock_guard lock(connection_mutex_);
  ready_.store(false);
  if (transport_.isConnected()) {
    try {
      transport_.reqAccountUpdates(false, config_.account);
    } catch (const BrokerError& e) {
      std::cerr << "[BrokerClient] unsubscribe failed: " << e.what() << "\n";
    }
  }
  transport_.disconnect();
  std::cout << "[BrokerClient] disconnected\n";
}

bool BrokerClient::isReady() const {
  return ready_.load() && !wrapper_.sessionLost() && transport_.isConnected();
}

// -----------------------------------------------------------------------------
// Orders
// -----------------------------------------------------------------------------
void BrokerClient::placeOrder(const OrderEvent& event) {
  auto instrument = symbols_.find(event.ticker);
  if (!instrument) {
    ++refused_orders_;
    std::cerr << "[BrokerClient] order for unknown instrument "
              << event.ticker << " refused\n";
    return;
  }
  placeOrder(contractFor(*instrument), event.order);
}

std::int64_t BrokerClient::placeOrder(const BrokerContract& contract,
                                      const domain::Order& order) {
  if (!isReady()) {
    ++refused_orders_;
    std::cerr << "[BrokerClient] not connected, order for " << contract.ticker
              << " refused\n";
    return -1;
  }

  const std::int64_t order_id = id_gen_.next_id();
  try {
    transport_.placeOrder(order_id, contract, order);
  } catch (const BrokerError& e) {
    ++refused_orders_;
    std::cerr << "[BrokerClient] order " << order_id << " for "
              << contract.ticker << " not sent: " << e.what() << "\n";
    return -1;
  }

  std::cout << "[BrokerClient] order " << order_id << " sent: "
            << domain::toString(order.action) << " " << order.quantity()
            << " " << contract.ticker << " " << domain::toString(order.type())
            << "\n";
  return order_id;
}

void BrokerClient::cancelOrder(std::int64_t order_id) {
  transport_.cancelOrder(order_id);
  std::cout << "[BrokerClient] cancel requested for order " << order_id
            << "\n";
}

int BrokerClient::requestAccountSummary() {
  std::ostringstream tags;
  for (std::size_t i = 0; i < BrokerWrapper::kAccountKeys.size(); ++i) {
    if (i != 0) {
      tags << ",";
    }
    tags << BrokerWrapper::kAccountKeys[i];
  }

  const int req_id = static_cast<int>(id_gen_.next_id());
  transport_.reqAccountSummary(req_id, "All", tags.str());
  std::cout << "[BrokerClient] account summary requested (req " << req_id
            << ")\n";
  return req_id;
}

}  // namespace meridian
