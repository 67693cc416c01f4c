#include "notifier.hpp"
#include "core/logger.hpp"
#include "core/metrics_registry.hpp"
#include "io/notify/file_dispatcher.hpp"
#include "io/notify/http_dispatcher.hpp"
#include "io/notify/mail_dispatcher.hpp"
#include "io/notify/syslog_dispatcher.hpp"

#include <exception>
#include <utility>

Notifier::Notifier(const Config::NotificationConfig &config) {
  reconfigure(config);
}

Notifier::Notifier(std::vector<std::unique_ptr<INotificationDispatcher>> dispatchers,
                   uint32_t throttle_seconds)
    : dispatchers_(std::move(dispatchers)),
      throttle_duration_ms_(static_cast<uint64_t>(throttle_seconds) * 1000) {}

void Notifier::reconfigure(const Config::NotificationConfig &config) {
  std::vector<std::unique_ptr<INotificationDispatcher>> dispatchers;

  if (config.file_enabled && !config.file_path.empty()) {
    dispatchers.push_back(std::make_unique<FileDispatcher>(config.file_path));
    LOG(LogLevel::INFO, LogComponent::IO_NOTIFY,
        "FileDispatcher enabled, writing to " << config.file_path);
  }
  if (config.syslog_enabled) {
    dispatchers.push_back(std::make_unique<SyslogDispatcher>());
    LOG(LogLevel::INFO, LogComponent::IO_NOTIFY, "SyslogDispatcher enabled.");
  }
  if (config.http_enabled && !config.http_webhook_url.empty()) {
    dispatchers.push_back(std::make_unique<HttpDispatcher>(
        config.http_webhook_url, config.transport_timeout_seconds));
    LOG(LogLevel::INFO, LogComponent::IO_NOTIFY,
        "HttpDispatcher enabled for URL: " << config.http_webhook_url);
  }
  if (config.mail_enabled && !config.mail_recipients.empty()) {
    dispatchers.push_back(std::make_unique<MailDispatcher>(
        config.mail_command, config.mail_from, config.mail_recipients,
        config.transport_timeout_seconds));
    LOG(LogLevel::INFO, LogComponent::IO_NOTIFY,
        "MailDispatcher enabled for " << config.mail_recipients.size()
                                      << " recipients");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  dispatchers_ = std::move(dispatchers);
  throttle_duration_ms_ = static_cast<uint64_t>(config.throttle_seconds) * 1000;
  LOG(LogLevel::INFO, LogComponent::IO_NOTIFY,
      "Notifier configured. Active dispatchers: " << dispatchers_.size());
}

bool Notifier::should_throttle(const Notification &notification) {
  // Cycle failures and rule changes are always delivered.
  if (notification.kind == NotificationKind::RULESET_CHANGED ||
      notification.kind == NotificationKind::HARDENING_CYCLE_FAILED ||
      throttle_duration_ms_ == 0)
    return false;

  const std::string key = std::string(notification_kind_to_string(notification.kind)) +
                          ":" + notification.subject;
  auto it = last_sent_ms_.find(key);
  if (it != last_sent_ms_.end() &&
      notification.created_at_ms < it->second + throttle_duration_ms_)
    return true;
  last_sent_ms_[key] = notification.created_at_ms;
  return false;
}

size_t Notifier::notify(const Notification &notification) noexcept {
  std::lock_guard<std::mutex> lock(mutex_);
  if (should_throttle(notification)) {
    ++throttled_;
    LOG(LogLevel::DEBUG, LogComponent::IO_NOTIFY,
        "Throttled " << notification_kind_to_string(notification.kind)
                     << " for subject '" << notification.subject << "'");
    return 0;
  }

  recent_.push_front(notification);
  if (recent_.size() > MAX_RECENT_NOTIFICATIONS)
    recent_.pop_back();

  size_t delivered = 0;
  for (const auto &dispatcher : dispatchers_) {
    bool ok = false;
    try {
      ok = dispatcher->dispatch(notification);
    } catch (const std::exception &e) {
      LOG(LogLevel::ERROR, LogComponent::IO_NOTIFY,
          dispatcher->get_name() << " threw while dispatching "
                                 << notification_kind_to_string(notification.kind)
                                 << ": " << e.what());
    }
    if (ok) {
      ++delivered;
      continue;
    }
    LOG(LogLevel::WARN, LogComponent::IO_NOTIFY,
        dispatcher->get_name() << " failed to deliver "
                               << notification_kind_to_string(notification.kind));
    try {
      PipelineMetrics::instance()
          .notifications_failed.Add({{"dispatcher", dispatcher->get_dispatcher_type()}})
          .Increment();
    } catch (const std::exception &e) {
      LOG(LogLevel::ERROR, LogComponent::IO_NOTIFY,
          "Could not count notification failure: " << e.what());
    }
  }

  LOG(LogLevel::INFO, LogComponent::IO_NOTIFY,
      notification_kind_to_string(notification.kind)
          << " delivered via " << delivered << "/" << dispatchers_.size()
          << " dispatchers: " << notification.summary);
  return delivered;
}

std::vector<Notification> Notifier::get_recent_notifications(size_t limit) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Notification> copy;
  for (const auto &n : recent_) {
    if (copy.size() >= limit)
      break;
    copy.push_back(n);
  }
  return copy;
}

size_t Notifier::dispatcher_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return dispatchers_.size();
}

size_t Notifier::throttled_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return throttled_;
}
