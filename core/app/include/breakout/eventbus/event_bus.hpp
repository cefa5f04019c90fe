#pragma once

#include "breakout/events/event.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace breakout {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
// Responsibility: Publish-subscribe channel for everything the tracker emits
// (notifications, snapshots, diagnostics). Sinks register callbacks; the
// publish loop posts Event values; the bus invokes every matching callback.
//
// Why in architecture: Sinks (console alert log, ZeroMQ telemetry, tests)
// attach without the strategy manager knowing they exist. Adding a sink is a
// subscribe() call, not an edit to the core.
//
// Failure isolation: a subscriber that throws a std::exception is logged and
// counted; the remaining subscribers still receive the event. One broken sink
// cannot silence the others.
//
// Thread model: Thread-safe subscribe, unsubscribe and publish from any
// thread. Callbacks run synchronously on the thread that calls publish()
// (in the engine, the publish loop thread).
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const Event&)>;
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // -------------------------------------------------------------------------
  // subscribe(GenericCallback)
  // -------------------------------------------------------------------------
  // @brief  Registers a callback invoked for every published event.
  // @return SubscriptionId for unsubscribe().
  // -------------------------------------------------------------------------
  SubscriptionId subscribe(GenericCallback callback);

  // -------------------------------------------------------------------------
  // subscribe<EventType>(callback)
  // -------------------------------------------------------------------------
  // @brief  Registers a callback invoked only when the event holds
  //         EventType (e.g. NotificationEvent).
  // -------------------------------------------------------------------------
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // -------------------------------------------------------------------------
  // unsubscribe(id)
  // -------------------------------------------------------------------------
  // @brief  Removes a subscription. A publish() already in progress may
  //         still deliver the current event to it.
  // -------------------------------------------------------------------------
  void unsubscribe(SubscriptionId id);

  // -------------------------------------------------------------------------
  // publish(event)
  // -------------------------------------------------------------------------
  // @brief  Delivers the event to every current subscriber on the calling
  //         thread.
  //
  // @details
  // The subscriber list is copied under the lock and callbacks run without
  // it, so a callback may itself subscribe, unsubscribe or publish.
  // -------------------------------------------------------------------------
  void publish(const Event& event);

  // Number of subscriber callbacks that threw since construction.
  std::uint64_t subscriberFailures() const { return failures_.load(); }

 private:
  using SubscriberEntry = std::pair<SubscriptionId, GenericCallback>;

  std::mutex mutex_;              // Protects subscribers_ and next_id_
  SubscriptionId next_id_{0};
  std::vector<SubscriberEntry> subscribers_;
  std::atomic<std::uint64_t> failures_{0};
};

// -----------------------------------------------------------------------------
// Template implementation: typed subscribe
// -----------------------------------------------------------------------------
template <typename EventType>
EventBus::SubscriptionId EventBus::subscribe(
    std::function<void(const EventType&)> callback) {
  GenericCallback wrapped = [cb = std::move(callback)](const Event& event) {
    if (const auto* ptr = std::get_if<EventType>(&event)) {
      cb(*ptr);
    }
  };
  return subscribe(std::move(wrapped));
}

}  // namespace breakout
