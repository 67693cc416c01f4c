#ifndef BASE_DISPATCHER_HPP
#define BASE_DISPATCHER_HPP

#include "core/notification.hpp"

#include <string>

class INotificationDispatcher {
public:
  virtual ~INotificationDispatcher() = default;
  // Returns false on delivery failure. May also throw; the Notifier contains
  // both.
  virtual bool dispatch(const Notification &notification) = 0;
  virtual const char *get_name() const = 0;
  virtual std::string get_dispatcher_type() const = 0;
};

#endif // BASE_DISPATCHER_HPP
