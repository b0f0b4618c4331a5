#pragma once

#include "meridian/broker/broker_transport.hpp"
#include "meridian/broker/broker_wrapper.hpp"
#include "meridian/concurrent/order_id_generator.hpp"
#include "meridian/domain/instrument.hpp"

#include <chrono>
#include <mutex>
#include <set>
#include <string>

namespace meridian {

// -----------------------------------------------------------------------------
// ContractManager: one-time broker validation per instrument
// -----------------------------------------------------------------------------
//
// validate() asks the broker for the instrument's contract details and waits
// (bounded) for the answer. A ticker that validated once is cached and never
// asked about again. Validations are serialized: the wrapper tracks one
// request id at a time, so a late reply to a request that timed out is not
// credited to the next instrument.
//
// Outcomes: true when details arrived; false on error 200 (contract not
// found) or when no answer came within the timeout. Failures are not cached.
// -----------------------------------------------------------------------------
class ContractManager {
 public:
  ContractManager(IBrokerTransport& transport, BrokerWrapper& wrapper,
                  OrderIdGenerator& id_gen, std::chrono::milliseconds timeout);

  bool validate(const domain::Instrument& instrument);

  bool isValidated(const std::string& ticker) const;

 private:
  IBrokerTransport& transport_;
  BrokerWrapper& wrapper_;
  OrderIdGenerator& id_gen_;
  const std::chrono::milliseconds timeout_;

  mutable std::mutex mutex_;
  std::set<std::string> validated_;
};

}  // namespace meridian
