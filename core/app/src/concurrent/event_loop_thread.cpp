#include "breakout/concurrent/event_loop_thread.hpp"

#include <chrono>
#include <exception>
#include <iostream>

namespace breakout {

namespace {

// How long the worker waits on an empty queue before re-checking running_.
constexpr auto kIdleWaitTimeout = std::chrono::milliseconds(10);

}  // namespace

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
// push(event)
// -----------------------------------------------------------------------------
bool EventLoopThread::push(Event event) {
  auto evicted = queue_.push(std::move(event));
  if (!evicted) {
    return false;
  }
  const auto total = dropped_.fetch_add(1) + 1;
  // Log the first drop and then every 1000th so a stuck sink is visible
  // without flooding stderr.
  if (total == 1 || total % 1000 == 0) {
    std::cerr << "[EventLoop] WARNING: publish queue full, dropped "
              << total << " event(s) so far\n";
  }
  return true;
}

// -----------------------------------------------------------------------------
// run(): worker loop
// -----------------------------------------------------------------------------
void EventLoopThread::run() {
  while (running_.load()) {
    std::optional<Event> event = queue_.try_pop();

    if (event) {
      publishGuarded(*event);
      continue;
    }

    std::unique_lock lock(stop_mutex_);
    stop_cv_.wait_for(lock, kIdleWaitTimeout,
                      [this] { return !running_.load(); });
  }

  // Final drain: deliver what producers queued before stop().
  while (auto event = queue_.try_pop()) {
    publishGuarded(*event);
  }
}

// -----------------------------------------------------------------------------
// publishGuarded(): EventBus already isolates subscriber exceptions; this
// guards the loop itself against anything else thrown during dispatch.
// -----------------------------------------------------------------------------
void EventLoopThread::publishGuarded(const Event& event) {
  try {
    bus_.publish(event);
  } catch (const std::exception& e) {
    std::cerr << "[EventLoop] ERROR: publish failed: " << e.what() << "\n";
  }
}

}  // namespace breakout
