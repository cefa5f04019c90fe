#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace breakout {

// -----------------------------------------------------------------------------
// ThreadSafeQueue<T>
// -----------------------------------------------------------------------------
// Responsibility: A FIFO queue that multiple threads can push to and pop from
// without data races, optionally bounded. Provides blocking pop(), timed
// pop_for() and non-blocking try_pop().
//
// Why in architecture: Every thread boundary in the tracker is one of these:
// the transport thread hands ticks to the ingest partitions, tick workers
// and the phase timer hand notifications and snapshots to the publish loop,
// and the publish loop hands telemetry to the IPC server.
//
// Bounded mode (capacity > 0):
//   A producer must never block on a slow consumer. When the queue is full,
//   push() evicts the OLDEST element and returns it so the caller can count
//   the drop. push_evicting() lets the caller say which element to prefer
//   evicting (the tick ingestor evicts the oldest tick for the same
//   instrument first: only the latest price per instrument matters).
//   Both are O(capacity) in the worst case, a constant bound.
//
// Thread model: Safe for multiple producers and multiple consumers.
// -----------------------------------------------------------------------------
template <typename T>
class ThreadSafeQueue {
 public:
  // Unbounded queue.
  ThreadSafeQueue() = default;

  // Bounded queue; capacity 0 means unbounded.
  explicit ThreadSafeQueue(std::size_t capacity) : capacity_(capacity) {}

  // Non-copyable, non-movable: owns a mutex and a condition variable.
  ThreadSafeQueue(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue(ThreadSafeQueue&&) = delete;
  ThreadSafeQueue& operator=(ThreadSafeQueue&&) = delete;

  // -------------------------------------------------------------------------
  // push(value)
  // -------------------------------------------------------------------------
  // @brief  Appends one item. If the queue is bounded and full, the front
  //         (oldest) item is evicted first.
  //
  // @return The evicted item, or std::nullopt if nothing was evicted.
  //
  // Thread-safety: Safe from any thread. Never blocks on consumers.
  // -------------------------------------------------------------------------
  std::optional<T> push(T value) {
    return push_evicting(std::move(value), [](const T&) { return true; });
  }

  // -------------------------------------------------------------------------
  // push_evicting(value, prefer)
  // -------------------------------------------------------------------------
  // @brief  Appends one item; when full, evicts the oldest element for which
  //         prefer(element) is true, or the front element if none matches.
  //
  // @param  prefer  Predicate over queued elements, evaluated under the lock.
  //                 Must not touch the queue.
  //
  // @return The evicted item, or std::nullopt if nothing was evicted.
  // -------------------------------------------------------------------------
  template <typename Pred>
  std::optional<T> push_evicting(T value, Pred prefer) {
    std::optional<T> evicted;
    {
      std::lock_guard lock(mutex_);
      if (capacity_ > 0 && queue_.size() >= capacity_) {
        auto victim = queue_.begin();
        for (auto it = queue_.begin(); it != queue_.end(); ++it) {
          if (prefer(*it)) {
            victim = it;
            break;
          }
        }
        evicted = std::move(*victim);
        queue_.erase(victim);
      }
      queue_.push_back(std::move(value));
    }
    // Notify outside the lock so the woken consumer does not immediately
    // block on the mutex we still hold.
    condition_.notify_one();
    return evicted;
  }

  // -------------------------------------------------------------------------
  // pop(): blocking
  // -------------------------------------------------------------------------
  // @brief  Removes and returns the front item, waiting until one exists.
  // -------------------------------------------------------------------------
  T pop() {
    std::unique_lock lock(mutex_);
    condition_.wait(lock, [this] { return !queue_.empty(); });
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // -------------------------------------------------------------------------
  // pop_for(timeout): timed
  // -------------------------------------------------------------------------
  // @brief  Like pop(), but gives up after `timeout` and returns nullopt.
  //
  // @details
  // Worker loops use this so they can re-check their stop flag at least
  // once per timeout without busy-waiting.
  // -------------------------------------------------------------------------
  template <typename Rep, typename Period>
  std::optional<T> pop_for(std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock lock(mutex_);
    if (!condition_.wait_for(lock, timeout,
                             [this] { return !queue_.empty(); })) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // -------------------------------------------------------------------------
  // try_pop(): non-blocking
  // -------------------------------------------------------------------------
  std::optional<T> try_pop() {
    std::lock_guard lock(mutex_);
    if (queue_.empty()) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // Wakes every waiter in pop_for() so stop paths need not wait a timeout.
  void notify_all() { condition_.notify_all(); }

  bool empty() const {
    std::lock_guard lock(mutex_);
    return queue_.empty();
  }

  std::size_t size() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
  }

  std::size_t capacity() const { return capacity_; }

 private:
  const std::size_t capacity_{0};

  // Protects queue_; used with condition_. mutable so const readers lock.
  mutable std::mutex mutex_;
  std::condition_variable condition_;
  std::deque<T> queue_;
};

}  // namespace breakout
