#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>

namespace meridian {

// -----------------------------------------------------------------------------
// DebounceTimer: fire once after a quiet period
// -----------------------------------------------------------------------------
//
// @brief  Coalesces bursts of touch() calls into one invocation of the action,
//         run `quiet_period` after the last touch.
//
// @details
// Account value pushes arrive as dozens of single-field callbacks. Each one
// calls touch(); the timer restarts on every call and fires only when the
// burst is over, so the portfolio receives one account snapshot per burst
// instead of one per field.
//
// cancel() disarms a pending deadline without firing it. The action runs on
// the timer's own thread, never under the timer's mutex.
//
// Thread model: touch(), cancel() and pending() are safe from any thread.
// Ownership:    Owns one worker thread, joined in the destructor. The
//               destructor does not fire a pending action.
// -----------------------------------------------------------------------------
class DebounceTimer {
 public:
  using Clock = std::chrono::steady_clock;
  using Action = std::function<void()>;

  DebounceTimer(std::chrono::milliseconds quiet_period, Action action);
  ~DebounceTimer();

  DebounceTimer(const DebounceTimer&) = delete;
  DebounceTimer& operator=(const DebounceTimer&) = delete;
  DebounceTimer(DebounceTimer&&) = delete;
  DebounceTimer& operator=(DebounceTimer&&) = delete;

  // (Re)arms the timer: the action fires quiet_period from now unless
  // touched or cancelled again first.
  void touch();

  void cancel();

  bool pending() const;

  std::chrono::milliseconds quietPeriod() const { return quiet_period_; }

 private:
  void run();

  const std::chrono::milliseconds quiet_period_;
  Action action_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::optional<Clock::time_point> deadline_;
  bool stopping_{false};
  std::thread thread_;
};

}  // namespace meridian
