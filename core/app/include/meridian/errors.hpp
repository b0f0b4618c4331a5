#pragma once

#include <stdexcept>

namespace meridian {

// -----------------------------------------------------------------------------
// Engine exception taxonomy
// -----------------------------------------------------------------------------
//
// ConfigError  malformed configuration or instrument definition. Raised at
//              construction time; main() treats it as fatal.
// LedgerError  an invariant on the position/account ledger was violated
//              (unknown instrument, no price for an instrument being filled
//              or marked). The ledger is left untouched when it is thrown.
// BrokerError  the live broker session could not be established or used
//              (handshake wait expired, transport closed).
//
// Business rejections (insufficient capital, duplicate pending order) are
// not exceptions; components log and drop them.
// -----------------------------------------------------------------------------
class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class LedgerError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class BrokerError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

}  // namespace meridian
