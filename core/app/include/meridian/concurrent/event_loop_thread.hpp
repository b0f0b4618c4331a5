#pragma once

#include "meridian/concurrent/thread_safe_queue.hpp"
#include "meridian/eventbus/event_bus.hpp"
#include "meridian/events/event.hpp"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

namespace meridian {

// -----------------------------------------------------------------------------
// EventLoopThread
// -----------------------------------------------------------------------------
//
// @brief  One worker thread that drains an Event queue and publishes each
//         event on its own EventBus.
//
// @details
// The live engine runs two of these:
//   engine loop     market data, signals, order routing
//   portfolio loop  the only thread that mutates PortfolioServer
// Other threads hand work over with push(); every subscriber on eventBus()
// therefore runs serialized on the loop thread.
//
// stop() lets the worker drain what is already queued before it exits, so
// events pushed before stop() are never lost.
//
// Thread model: start(), stop() and push() are safe from any thread.
// Ownership:    Owns the thread, the queue and the bus. Components that hold
//               a reference to eventBus() must be destroyed before the loop.
// -----------------------------------------------------------------------------
class EventLoopThread {
 public:
  explicit EventLoopThread(std::string name = "event-loop");

  ~EventLoopThread();

  EventLoopThread(const EventLoopThread&) = delete;
  EventLoopThread& operator=(const EventLoopThread&) = delete;
  EventLoopThread(EventLoopThread&&) = delete;
  EventLoopThread& operator=(EventLoopThread&&) = delete;

  // Idempotent.
  void start();

  // Drains the queue, then joins the worker. Idempotent.
  void stop();

  void push(Event event) { queue_.push(std::move(event)); }

  EventBus& eventBus() { return bus_; }
  const EventBus& eventBus() const { return bus_; }

  bool isRunning() const { return running_.load(); }

  const std::string& name() const { return name_; }

 private:
  void run();

  // Publishes everything currently queued. Returns the number of events.
  std::size_t drain();

  std::string name_;
  ThreadSafeQueue<Event> queue_;
  EventBus bus_;

  std::atomic<bool> running_{false};
  std::mutex stop_mutex_;
  std::condition_variable stop_cv_;
  std::thread thread_;
};

}  // namespace meridian
