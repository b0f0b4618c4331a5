#pragma once

#include "meridian/time/i_time_provider.hpp"

namespace meridian {

// Wall-clock time. Used by the live runtime.
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ns() const override;
};

}  // namespace meridian
