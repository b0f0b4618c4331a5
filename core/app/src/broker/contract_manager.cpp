#include "meridian/broker/contract_manager.hpp"

#include <iostream>

namespace meridian {

ContractManager::ContractManager(IBrokerTransport& transport,
                                 BrokerWrapper& wrapper,
                                 OrderIdGenerator& id_gen,
                                 std::chrono::milliseconds timeout)
    : transport_(transport),
      wrapper_(wrapper),
      id_gen_(id_gen),
      timeout_(timeout) {}

bool ContractManager::validate(const domain::Instrument& instrument) {
  std::lock_guard lock(mutex_);

  if (validated_.count(instrument.ticker) != 0) {
    return true;
  }

  const int req_id = static_cast<int>(id_gen_.next_id());
  wrapper_.beginContractValidation(req_id);
  transport_.reqContractDetails(req_id, contractFor(instrument));

  if (!wrapper_.contractDetailsReceived().wait_for(timeout_)) {
    std::cerr << "[ContractManager] no contract details for "
              << instrument.ticker << " within " << timeout_.count()
              << " ms\n";
    return false;
  }

  if (wrapper_.contractValid().value_or(false)) {
    validated_.insert(instrument.ticker);
    std::cout << "[ContractManager] contract " << instrument.ticker
              << " validated\n";
    return true;
  }

  std::cerr << "[ContractManager] contract " << instrument.ticker
            << " validation failed\n";
  return false;
}

bool ContractManager::isValidated(const std::string& ticker) const {
  std::lock_guard lock(mutex_);
  return validated_.count(ticker) != 0;
}

}  // namespace meridian
