#include "syslog_dispatcher.hpp"
#include "core/logger.hpp"

#include <syslog.h>

SyslogDispatcher::SyslogDispatcher() {
  openlog("waf_hardener", LOG_PID | LOG_CONS, LOG_USER);
}

SyslogDispatcher::~SyslogDispatcher() { closelog(); }

bool SyslogDispatcher::dispatch(const Notification &notification) {
  const std::string text = notification.to_text();
  const int priority =
      notification.kind == NotificationKind::RULESET_CHANGED ? LOG_NOTICE
                                                             : LOG_WARNING;
  LOG(LogLevel::TRACE, LogComponent::IO_NOTIFY,
      "Dispatching notification to syslog: " << text);
  syslog(priority, "%s", text.c_str());
  return true;
}
