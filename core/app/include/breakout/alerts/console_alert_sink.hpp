#pragma once

#include "breakout/eventbus/event_bus.hpp"
#include "breakout/events/event_types.hpp"
#include "breakout/events/notification_event.hpp"

#include <atomic>
#include <cstdint>
#include <ostream>
#include <string>

namespace breakout {

// -----------------------------------------------------------------------------
// ConsoleAlertSink
// -----------------------------------------------------------------------------
//
// @brief  Prints every notification and phase change as a tagged log line.
//
// @details
// Subscribes to the publish loop's EventBus in the constructor and
// unsubscribes in the destructor, the same lifecycle every bus subscriber in
// the engine follows. Lines look like:
//
//   [Alert] 10:42:17 NEW_LOW strategy=3 NSE_FO|NIFTY25JAN26200CE
//           52.40 -> 51.80 drop=1.15% near_target=yes
//
// Thread model:
//   Callbacks run on the publish loop thread. The stream is written only
//   from there.
// -----------------------------------------------------------------------------
class ConsoleAlertSink {
 public:
  ConsoleAlertSink(EventBus& bus, std::ostream& out, int utc_offset_minutes);
  ~ConsoleAlertSink();

  ConsoleAlertSink(const ConsoleAlertSink&) = delete;
  ConsoleAlertSink& operator=(const ConsoleAlertSink&) = delete;

  std::uint64_t printed() const { return printed_.load(); }

  // One formatted line, without the trailing newline.
  static std::string format(const NotificationEvent& n,
                            int utc_offset_minutes);

 private:
  void onNotification(const NotificationEvent& n);
  void onPhaseChange(const PhaseChangeEvent& e);

  EventBus& bus_;
  std::ostream& out_;
  int utc_offset_minutes_;
  EventBus::SubscriptionId notification_sub_{0};
  EventBus::SubscriptionId phase_sub_{0};
  std::atomic<std::uint64_t> printed_{0};
};

}  // namespace breakout
