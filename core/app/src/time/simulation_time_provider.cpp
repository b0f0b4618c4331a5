#include "meridian/time/simulation_time_provider.hpp"

namespace meridian {

std::int64_t SimulationTimeProvider::now_ns() const {
  return current_time_ns_.load();
}

// -----------------------------------------------------------------------------
// advance_time(): compare-exchange so concurrent writers cannot rewind
// -----------------------------------------------------------------------------
bool SimulationTimeProvider::advance_time(std::int64_t new_time_ns) {
  std::int64_t current = current_time_ns_.load();
  while (new_time_ns >= current) {
    if (current_time_ns_.compare_exchange_weak(current, new_time_ns)) {
      return true;
    }
  }
  return false;
}

}  // namespace meridian
