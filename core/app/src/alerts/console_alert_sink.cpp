#include "breakout/alerts/console_alert_sink.hpp"
#include "breakout/time/time_utils.hpp"

#include <functional>
#include <iomanip>
#include <sstream>

namespace breakout {

ConsoleAlertSink::ConsoleAlertSink(EventBus& bus, std::ostream& out,
                                   int utc_offset_minutes)
    : bus_(bus), out_(out), utc_offset_minutes_(utc_offset_minutes) {
  notification_sub_ = bus_.subscribe<NotificationEvent>(
      std::function<void(const NotificationEvent&)>(
          [this](const NotificationEvent& n) { onNotification(n); }));
  phase_sub_ = bus_.subscribe<PhaseChangeEvent>(
      std::function<void(const PhaseChangeEvent&)>(
          [this](const PhaseChangeEvent& e) { onPhaseChange(e); }));
}

ConsoleAlertSink::~ConsoleAlertSink() {
  bus_.unsubscribe(notification_sub_);
  bus_.unsubscribe(phase_sub_);
}

// -----------------------------------------------------------------------------
// format()
// -----------------------------------------------------------------------------
std::string ConsoleAlertSink::format(const NotificationEvent& n,
                                     int utc_offset_minutes) {
  std::ostringstream line;
  line << std::fixed << std::setprecision(2);
  line << "[Alert] " << format_local_time(n.timestamp_ms, utc_offset_minutes)
       << " " << notificationKindToString(n.kind)
       << " strategy=" << n.strategy_id << " " << n.instrument_id << " "
       << n.old_value << " -> " << n.new_value;
  if (n.drop_percent) {
    line << " drop=" << *n.drop_percent << "%";
  }
  line << " near_target=" << (n.near_target ? "yes" : "no");
  return line.str();
}

void ConsoleAlertSink::onNotification(const NotificationEvent& n) {
  out_ << format(n, utc_offset_minutes_) << "\n";
  printed_.fetch_add(1);
}

void ConsoleAlertSink::onPhaseChange(const PhaseChangeEvent& e) {
  out_ << "[Alert] " << format_local_time(e.timestamp_ms, utc_offset_minutes_)
       << " strategy=" << e.strategy_id << " "
       << domain::phaseToString(e.from) << " -> "
       << domain::phaseToString(e.to);
  if (e.reason != domain::CompletionReason::None) {
    out_ << " (" << domain::completionReasonToString(e.reason) << ")";
  }
  out_ << "\n";
}

}  // namespace breakout
