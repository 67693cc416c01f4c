#include "http_dispatcher.hpp"
#include "core/logger.hpp"

#include <httplib.h>

#include <regex>
#include <type_traits>

HttpDispatcher::HttpDispatcher(const std::string &webhook_url,
                               uint32_t timeout_seconds)
    : timeout_seconds_(timeout_seconds) {
  // Group 1: scheme, group 2: host[:port], group 3: path
  std::regex url_regex(R"(^(https?):\/\/([^\/]+)(\/.*)?$)");
  std::smatch match;

  if (std::regex_match(webhook_url, match, url_regex)) {
    host_ = match[2].str();
    path_ = match[3].matched ? match[3].str() : "/";
    is_https_ = match[1].str() == "https";
    LOG(LogLevel::TRACE, LogComponent::IO_NOTIFY,
        "HttpDispatcher initialized | Host: " << host_ << " | Path: " << path_
                                              << " | Protocol: "
                                              << (is_https_ ? "HTTPS" : "HTTP"));
  } else {
    LOG(LogLevel::ERROR, LogComponent::IO_NOTIFY,
        "Invalid webhook URL format provided to HttpDispatcher: " << webhook_url);
  }
}

bool HttpDispatcher::dispatch(const Notification &notification) {
  if (host_.empty()) {
    LOG(LogLevel::ERROR, LogComponent::IO_NOTIFY,
        "Cannot dispatch notification: HttpDispatcher has no valid URL.");
    return false;
  }

  bool success = false;
  auto send_request = [&](auto &client) {
    client.set_connection_timeout(timeout_seconds_, 0);
    client.set_read_timeout(timeout_seconds_, 0);
    client.set_write_timeout(timeout_seconds_, 0);

    const std::string body = notification.to_json().dump();
    auto res = client.Post(path_.c_str(), body, "application/json");

    if (res && res->status < 400) {
      LOG(LogLevel::TRACE, LogComponent::IO_NOTIFY,
          "Notification delivered to " << host_ << path_
                                       << " | Status: " << res->status);
      success = true;
    } else {
      LOG(LogLevel::ERROR, LogComponent::IO_NOTIFY,
          "Webhook delivery to "
              << (is_https_ ? "https://" : "http://") << host_ << path_
              << " failed | Status: "
              << (res ? std::to_string(res->status)
                      : httplib::to_string(res.error())));
    }
  };

  if (is_https_) {
    httplib::SSLClient cli(host_);
    send_request(cli);
  } else {
    httplib::Client cli(host_);
    send_request(cli);
  }
  return success;
}
