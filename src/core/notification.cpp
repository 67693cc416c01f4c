#include "notification.hpp"
#include "utils/utils.hpp"

#include <sstream>
#include <utility>

const char *notification_kind_to_string(NotificationKind kind) {
  switch (kind) {
  case NotificationKind::CLASSIFIER_ERROR:
    return "ClassifierError";
  case NotificationKind::RULESET_CHANGED:
    return "RuleSetChanged";
  case NotificationKind::SEVERITY_THRESHOLD_EXCEEDED:
    return "SeverityThresholdExceeded";
  case NotificationKind::HARDENING_CYCLE_FAILED:
    return "HardeningCycleFailed";
  }
  return "Unknown";
}

Notification::Notification(NotificationKind kind, std::string subject,
                           std::string summary, nlohmann::json details)
    : kind(kind), subject(std::move(subject)), summary(std::move(summary)),
      details(std::move(details)), created_at_ms(Utils::get_current_time_ms()) {}

nlohmann::json Notification::to_json() const {
  return {{"kind", notification_kind_to_string(kind)},
          {"subject", subject},
          {"summary", summary},
          {"created_at", Utils::format_ms_as_iso8601(created_at_ms)},
          {"details", details}};
}

std::string Notification::to_text() const {
  std::ostringstream ss;
  ss << "[" << notification_kind_to_string(kind) << "] " << summary;
  if (!subject.empty())
    ss << " | subject: " << subject;
  if (!details.empty())
    ss << " | " << details.dump();
  return ss.str();
}
