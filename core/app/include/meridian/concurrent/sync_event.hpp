#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace meridian {

// -----------------------------------------------------------------------------
// SyncEvent: resettable one-shot flag with bounded waits
// -----------------------------------------------------------------------------
//
// set() releases every current and future waiter until clear() is called.
// Used for the broker handshake checkpoints and contract validation replies.
//
// Thread model: all members are safe from any thread.
// -----------------------------------------------------------------------------
class SyncEvent {
 public:
  SyncEvent() = default;

  SyncEvent(const SyncEvent&) = delete;
  SyncEvent& operator=(const SyncEvent&) = delete;

  void set() {
    {
      std::lock_guard lock(mutex_);
      flag_ = true;
    }
    cv_.notify_all();
  }

  void clear() {
    std::lock_guard lock(mutex_);
    flag_ = false;
  }

  bool isSet() const {
    std::lock_guard lock(mutex_);
    return flag_;
  }

  // True if the flag was set before `timeout` elapsed.
  template <typename Rep, typename Period>
  bool wait_for(std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return flag_; });
  }

 private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  bool flag_{false};
};

}  // namespace meridian
