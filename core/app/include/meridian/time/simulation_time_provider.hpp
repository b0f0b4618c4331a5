#pragma once

#include "meridian/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace meridian {

// -----------------------------------------------------------------------------
// SimulationTimeProvider: replay-driven clock
// -----------------------------------------------------------------------------
//
// @brief  Returns whatever time the replay driver last set.
//
// @details
// The backtest engine advances the clock to each feed message's timestamp
// before dispatching it. Starts at 0 ("nothing replayed yet").
// advance_time() keeps the clock monotonic: a timestamp older than the
// current one is ignored and reported false, so out-of-order feed lines
// cannot move time backwards.
//
// Thread-safety: lock-free atomic reads and writes.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;
  explicit SimulationTimeProvider(std::int64_t start_ns)
      : current_time_ns_(start_ns) {}

  std::int64_t now_ns() const override;

  // Returns false (and leaves the clock alone) when new_time_ns is older
  // than the current time.
  bool advance_time(std::int64_t new_time_ns);

 private:
  std::atomic<std::int64_t> current_time_ns_{0};
};

}  // namespace meridian
