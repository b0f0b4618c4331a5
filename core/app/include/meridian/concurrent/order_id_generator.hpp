#pragma once

#include <cstdint>
#include <mutex>

namespace meridian {

// -----------------------------------------------------------------------------
// OrderIdGenerator: serialized broker request/order id allocation
// -----------------------------------------------------------------------------
//
// @brief  Hands out one id per request, strictly increasing, from the value
//         the broker announced as its next valid id.
//
// @details
// The broker dictates the starting point: the nextValidId callback calls
// reset() (possibly again after a reconnect) and every placeOrder,
// reqContractDetails and reqAccountSummary draws from next_id(). Order ids
// and request ids share one sequence, matching the broker's expectation that
// an id is never reused within a session.
//
// reset() never moves the sequence backwards: an announced id lower than
// what was already issued is ignored, so ids stay unique across reconnects.
//
// Thread model:
//   next_id() runs on the engine loop (orders) and on the main thread
//   (contract validation) while reset() runs on the broker callback thread.
//   A mutex serializes all three.
//
// Ownership: owned by TradingEngine; BrokerWrapper resets it, BrokerClient
//            and ContractManager draw from it.
// -----------------------------------------------------------------------------
class OrderIdGenerator {
 public:
  OrderIdGenerator() = default;

  OrderIdGenerator(const OrderIdGenerator&) = delete;
  OrderIdGenerator& operator=(const OrderIdGenerator&) = delete;
  OrderIdGenerator(OrderIdGenerator&&) = delete;
  OrderIdGenerator& operator=(OrderIdGenerator&&) = delete;

  // Returns the current id and advances the sequence by one.
  std::int64_t next_id() {
    std::lock_guard lock(mutex_);
    return next_id_++;
  }

  void reset(std::int64_t next_valid_id) {
    std::lock_guard lock(mutex_);
    if (next_valid_id > next_id_) {
      next_id_ = next_valid_id;
    }
  }

  std::int64_t peek() const {
    std::lock_guard lock(mutex_);
    return next_id_;
  }

 private:
  mutable std::mutex mutex_;
  std::int64_t next_id_{1};
};

}  // namespace meridian
