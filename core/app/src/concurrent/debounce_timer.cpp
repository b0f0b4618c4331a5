#include "meridian/concurrent/debounce_timer.hpp"

#include <utility>

namespace meridian {

DebounceTimer::DebounceTimer(std::chrono::milliseconds quiet_period,
                             Action action)
    : quiet_period_(quiet_period), action_(std::move(action)) {
  thread_ = std::thread([this] { run(); });
}

DebounceTimer::~DebounceTimer() {
  {
    std::lock_guard lock(mutex_);
    stopping_ = true;
    deadline_.reset();
  }
  cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
}

void DebounceTimer::touch() {
  {
    std::lock_guard lock(mutex_);
    deadline_ = Clock::now() + quiet_period_;
  }
  cv_.notify_all();
}

void DebounceTimer::cancel() {
  {
    std::lock_guard lock(mutex_);
    deadline_.reset();
  }
  cv_.notify_all();
}

bool DebounceTimer::pending() const {
  std::lock_guard lock(mutex_);
  return deadline_.has_value();
}

// -----------------------------------------------------------------------------
// run(): wait for a deadline, re-evaluate on every touch/cancel, fire once
// -----------------------------------------------------------------------------
void DebounceTimer::run() {
  std::unique_lock lock(mutex_);
  while (!stopping_) {
    if (!deadline_) {
      cv_.wait(lock, [this] { return stopping_ || deadline_.has_value(); });
      continue;
    }

    const auto deadline = *deadline_;
    if (Clock::now() < deadline) {
      // Wakes early on touch()/cancel(); the loop re-reads deadline_.
      cv_.wait_until(lock, deadline);
      continue;
    }

    deadline_.reset();
    lock.unlock();
    action_();
    lock.lock();
  }
}

}  // namespace meridian
