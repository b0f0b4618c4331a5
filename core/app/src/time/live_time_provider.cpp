#include "meridian/time/live_time_provider.hpp"

#include <chrono>

namespace meridian {

std::int64_t LiveTimeProvider::now_ns() const {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

}  // namespace meridian
