#include "breakout/concurrent/periodic_timer.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace breakout {

PeriodicTimer::PeriodicTimer(std::string name,
                             std::chrono::milliseconds interval,
                             Callback callback)
    : name_(std::move(name)),
      interval_(interval),
      callback_(std::move(callback)) {}

PeriodicTimer::~PeriodicTimer() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void PeriodicTimer::start() {
  if (thread_.joinable()) {
    return;
  }
  running_.store(true);
  thread_ = std::thread([this] { run(); });
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void PeriodicTimer::stop() {
  if (!thread_.joinable()) {
    return;
  }
  {
    // Store under the mutex so the worker cannot miss the notify between
    // evaluating its predicate and blocking.
    std::lock_guard lock(stop_mutex_);
    running_.store(false);
  }
  stop_cv_.notify_all();
  thread_.join();
}

// -----------------------------------------------------------------------------
// run(): timer thread
// -----------------------------------------------------------------------------
void PeriodicTimer::run() {
  while (true) {
    {
      std::unique_lock lock(stop_mutex_);
      if (stop_cv_.wait_for(lock, interval_,
                            [this] { return !running_.load(); })) {
        return;
      }
    }

    try {
      callback_();
    } catch (const std::exception& e) {
      failures_.fetch_add(1);
      std::cerr << "[" << name_ << "] ERROR: timer callback threw: "
                << e.what() << "\n";
    }
    runs_.fetch_add(1);
  }
}

}  // namespace breakout
