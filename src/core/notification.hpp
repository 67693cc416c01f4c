#ifndef NOTIFICATION_HPP
#define NOTIFICATION_HPP

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

enum class NotificationKind {
  CLASSIFIER_ERROR,
  RULESET_CHANGED,
  SEVERITY_THRESHOLD_EXCEEDED,
  HARDENING_CYCLE_FAILED
};

const char *notification_kind_to_string(NotificationKind kind);

struct Notification {
  NotificationKind kind;
  // Throttling key within a kind, e.g. the failing stage or the window.
  std::string subject;
  std::string summary;
  nlohmann::json details = nlohmann::json::object();
  uint64_t created_at_ms = 0;

  Notification(NotificationKind kind, std::string subject, std::string summary,
               nlohmann::json details = nlohmann::json::object());

  nlohmann::json to_json() const;
  // Plain-text rendering for syslog and mail bodies.
  std::string to_text() const;
};

#endif // NOTIFICATION_HPP
