#include "nanotrade/concurrent/event_loop_thread.hpp"

#include <chrono>

namespace nanotrade {

namespace {

// Upper bound on how long an idle worker takes to notice stop().
constexpr auto kIdleWaitTimeout = std::chrono::milliseconds(5);

}  // namespace

EventLoopThread::~EventLoopThread() { stop(); }

void EventLoopThread::start() {
  if (thread_.joinable()) {
    return;
  }
  running_.store(true);
  thread_ = std::thread([this] { run(); });
}

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
    if (std::optional<Event> event = queue_.try_pop()) {
      bus_.publish(*event);
      continue;
    }

    std::unique_lock lock(stop_mutex_);
    stop_cv_.wait_for(lock, kIdleWaitTimeout,
                      [this] { return !running_.load(); });
  }
}

}  // namespace nanotrade
