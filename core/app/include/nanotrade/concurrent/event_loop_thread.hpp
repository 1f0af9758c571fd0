#pragma once

#include "nanotrade/concurrent/thread_safe_queue.hpp"
#include "nanotrade/eventbus/event_bus.hpp"
#include "nanotrade/events/event.hpp"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace nanotrade {

// -----------------------------------------------------------------------------
// EventLoopThread
// -----------------------------------------------------------------------------
// Responsibility: The tick loop. One worker thread drains a
// ThreadSafeQueue<Event> and publishes each event on its own EventBus, so
// every subscriber (the tick processor above all) runs on this thread and
// ticks are processed strictly one at a time, in arrival order.
//
// Thread model: start(), stop() and push() may be called from any thread.
// Subscriber callbacks run only on the worker.
//
// Shutdown: stop() lets the worker finish the event it is dispatching and
// exit; events still queued are discarded.
// -----------------------------------------------------------------------------
class EventLoopThread {
 public:
  EventLoopThread() = default;

  // Joins the worker if it is still running.
  ~EventLoopThread();

  EventLoopThread(const EventLoopThread&) = delete;
  EventLoopThread& operator=(const EventLoopThread&) = delete;
  EventLoopThread(EventLoopThread&&) = delete;
  EventLoopThread& operator=(EventLoopThread&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // Spawns the worker. A no-op if it is already running.
  // -------------------------------------------------------------------------
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  // Clears the running flag, wakes the worker and joins it. Idempotent;
  // start() may be called again afterwards.
  // -------------------------------------------------------------------------
  void stop();

  void push(Event event) { queue_.push(std::move(event)); }

  bool running() const { return running_.load(); }

  EventBus& eventBus() { return bus_; }
  const EventBus& eventBus() const { return bus_; }

 private:
  // Worker entry point: try_pop and publish, or wait briefly for work or a
  // stop request.
  void run();

  ThreadSafeQueue<Event> queue_;
  EventBus bus_;

  std::atomic<bool> running_{false};
  std::mutex stop_mutex_;
  std::condition_variable stop_cv_;
  std::thread thread_;
};

}  // namespace nanotrade
