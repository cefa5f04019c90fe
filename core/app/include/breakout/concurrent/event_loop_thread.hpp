#pragma once

#include "breakout/concurrent/thread_safe_queue.hpp"
#include "breakout/eventbus/event_bus.hpp"
#include "breakout/events/event.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <thread>

namespace breakout {

// -----------------------------------------------------------------------------
// EventLoopThread
// -----------------------------------------------------------------------------
// Responsibility: Owns one worker thread that drains a bounded
// ThreadSafeQueue<Event> and publishes each event to its EventBus on that
// thread. Tick workers, the phase timer and the control surface push
// notifications and snapshots here; sinks subscribe to the bus.
//
// Why in architecture: This is the publish loop. It decouples the tick path
// from sinks: a slow sink delays only this thread, and once the queue is
// full the oldest undelivered event is dropped and counted instead of the
// producer blocking.
//
// Thread model: The worker runs in the owned std::thread. start() and stop()
// may be called from any thread. push() is thread-safe. All EventBus
// subscriber callbacks run on the loop thread, in push order.
// -----------------------------------------------------------------------------
class EventLoopThread {
 public:
  static constexpr std::size_t kDefaultCapacity = 4096;

  explicit EventLoopThread(std::size_t capacity = kDefaultCapacity)
      : queue_(capacity) {}

  // Joins the worker so it never outlives the queue and bus.
  ~EventLoopThread();

  EventLoopThread(const EventLoopThread&) = delete;
  EventLoopThread& operator=(const EventLoopThread&) = delete;
  EventLoopThread(EventLoopThread&&) = delete;
  EventLoopThread& operator=(EventLoopThread&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // Starts the worker thread. Idempotent.
  // -------------------------------------------------------------------------
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  // Signals the worker to exit and joins it. Events already queued when
  // stop() is called are still published before the worker exits. After
  // stop(), start() may be called again. Idempotent.
  // -------------------------------------------------------------------------
  void stop();

  // -------------------------------------------------------------------------
  // push(event)
  // -------------------------------------------------------------------------
  // @brief  Enqueues one event for publication on the loop thread.
  //
  // @return true if the queue was full and the oldest event was dropped to
  //         make room. The drop is already counted in dropped().
  //
  // Thread-safety: Safe from any thread. Never blocks on subscribers.
  // -------------------------------------------------------------------------
  bool push(Event event);

  // Total events dropped on overflow since construction.
  std::uint64_t dropped() const { return dropped_.load(); }

  // Events waiting to be published.
  std::size_t pending() const { return queue_.size(); }

  EventBus& eventBus() { return bus_; }
  const EventBus& eventBus() const { return bus_; }

 private:
  // Worker loop: try_pop and publish; when idle wait on stop_cv_ with a
  // short timeout so stop() is noticed promptly.
  void run();

  void publishGuarded(const Event& event);

  ThreadSafeQueue<Event> queue_;
  EventBus bus_;

  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> dropped_{0};

  std::mutex stop_mutex_;
  std::condition_variable stop_cv_;

  std::thread thread_;
};

}  // namespace breakout
