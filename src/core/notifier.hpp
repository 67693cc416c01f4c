#ifndef NOTIFIER_HPP
#define NOTIFIER_HPP

#include "core/config.hpp"
#include "core/notification.hpp"
#include "io/notify/base_dispatcher.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

// Fans a notification out to every configured transport. Best effort: a
// failing or throwing dispatcher is logged and counted, and notify() itself
// never throws.
class Notifier {
public:
  explicit Notifier(const Config::NotificationConfig &config);
  Notifier(std::vector<std::unique_ptr<INotificationDispatcher>> dispatchers,
           uint32_t throttle_seconds);

  void reconfigure(const Config::NotificationConfig &config);

  // Returns the number of dispatchers that reported success. A throttled
  // notification returns 0 without touching any dispatcher.
  size_t notify(const Notification &notification) noexcept;

  std::vector<Notification> get_recent_notifications(size_t limit) const;
  size_t dispatcher_count() const;
  size_t throttled_count() const;

private:
  bool should_throttle(const Notification &notification);

  mutable std::mutex mutex_;
  std::vector<std::unique_ptr<INotificationDispatcher>> dispatchers_;
  uint64_t throttle_duration_ms_ = 0;
  std::unordered_map<std::string, uint64_t> last_sent_ms_;
  size_t throttled_ = 0;

  std::deque<Notification> recent_;
  static constexpr size_t MAX_RECENT_NOTIFICATIONS = 50;
};

#endif // NOTIFIER_HPP
