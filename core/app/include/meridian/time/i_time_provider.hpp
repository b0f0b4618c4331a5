#pragma once

#include <cstdint>

namespace meridian {

// -----------------------------------------------------------------------------
// ITimeProvider: clock abstraction
// -----------------------------------------------------------------------------
//
// @brief  Supplies "now" as UNIX epoch nanoseconds.
//
// @details
// Components that stamp records with the current time (the live broker
// wrapper stamping account snapshots, the backtest replay) read it through
// this interface, so tests and backtests can drive time explicitly.
//
//   LiveTimeProvider        wall clock (std::chrono::system_clock)
//   SimulationTimeProvider  last timestamp set by the replay driver
//
// Thread-safety: implementations must be safe to read from any thread.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  virtual std::int64_t now_ns() const = 0;
};

}  // namespace meridian
