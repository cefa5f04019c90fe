#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace breakout {

// -----------------------------------------------------------------------------
// PeriodicTimer
// -----------------------------------------------------------------------------
// Responsibility: Runs a callback on its own thread every `interval` until
// stopped. The engine uses one for the phase timer (phase advancement,
// retention purge, index roll) and one for checkpointing.
//
// The wait is on a condition variable, not a sleep, so stop() returns within
// one callback duration instead of one interval. The interval is measured in
// wall time; the callback reads whatever clock it was given for domain time.
//
// A callback that throws a std::exception is logged and counted; the timer
// keeps running.
//
// Thread model: start()/stop() from the owning thread. The callback runs
// only on the timer thread, never concurrently with itself.
// -----------------------------------------------------------------------------
class PeriodicTimer {
 public:
  using Callback = std::function<void()>;

  PeriodicTimer(std::string name, std::chrono::milliseconds interval,
                Callback callback);

  ~PeriodicTimer();

  PeriodicTimer(const PeriodicTimer&) = delete;
  PeriodicTimer& operator=(const PeriodicTimer&) = delete;
  PeriodicTimer(PeriodicTimer&&) = delete;
  PeriodicTimer& operator=(PeriodicTimer&&) = delete;

  // Spawns the timer thread. The first callback runs after one interval.
  // Idempotent.
  void start();

  // Wakes and joins the timer thread. Idempotent.
  void stop();

  // Number of completed callback invocations (including ones that threw).
  std::uint64_t runs() const { return runs_.load(); }
  std::uint64_t failures() const { return failures_.load(); }

 private:
  void run();

  std::string name_;
  std::chrono::milliseconds interval_;
  Callback callback_;

  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> runs_{0};
  std::atomic<std::uint64_t> failures_{0};

  std::mutex stop_mutex_;
  std::condition_variable stop_cv_;
  std::thread thread_;
};

}  // namespace breakout
