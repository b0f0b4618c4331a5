#include "meridian/concurrent/event_loop_thread.hpp"

#include <chrono>
#include <iostream>

namespace meridian {

namespace {

// Idle wait between queue polls; bounds how long stop() waits for a sleeping
// worker.
constexpr auto kIdleWaitTimeout = std::chrono::milliseconds(10);

}  // namespace

EventLoopThread::EventLoopThread(std::string name) : name_(std::move(name)) {}

EventLoopThread::~EventLoopThread() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void EventLoopThread::start() {
  if (thread_.joinable()) {
    return;
  }
  running_.store(true);
  thread_ = std::thread([this] { run(); });
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void EventLoopThread::stop() {
  if (!thread_.joinable()) {
    return;
  }
  running_.store(false);
  stop_cv_.notify_all();
  thread_.join();
}

// -----------------------------------------------------------------------------
// run(): worker loop
// -----------------------------------------------------------------------------
void EventLoopThread::run() {
  while (running_.load()) {
    if (drain() > 0) {
      continue;
    }
    std::unique_lock lock(stop_mutex_);
    stop_cv_.wait_for(lock, kIdleWaitTimeout,
                      [this] { return !running_.load(); });
  }

  // Events pushed before stop() still get delivered.
  const std::size_t remaining = drain();
  if (remaining > 0) {
    std::cout << "[EventLoopThread:" << name_ << "] drained " << remaining
              << " event(s) on shutdown.\n";
  }
}

std::size_t EventLoopThread::drain() {
  std::size_t count = 0;
  while (auto event = queue_.try_pop()) {
    bus_.publish(*event);
    ++count;
  }
  return count;
}

}  // namespace meridian
