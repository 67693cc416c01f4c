#ifndef HTTP_DISPATCHER_HPP
#define HTTP_DISPATCHER_HPP

#include "base_dispatcher.hpp"

#include <cstdint>
#include <string>

// POSTs the notification JSON to a webhook.
class HttpDispatcher : public INotificationDispatcher {
public:
  HttpDispatcher(const std::string &webhook_url, uint32_t timeout_seconds);
  bool dispatch(const Notification &notification) override;
  const char *get_name() const override { return "HttpDispatcher"; }
  std::string get_dispatcher_type() const override { return "http"; }

  bool is_valid() const { return !host_.empty(); }

private:
  std::string host_;
  std::string path_;
  bool is_https_ = false;
  uint32_t timeout_seconds_;
};

#endif // HTTP_DISPATCHER_HPP
