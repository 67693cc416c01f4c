#ifndef MAIL_DISPATCHER_HPP
#define MAIL_DISPATCHER_HPP

#include "base_dispatcher.hpp"

#include <cstdint>
#include <string>
#include <vector>

// Pipes an RFC 5322 message into a local sendmail-compatible command
// ("sendmail -t" reads the recipients from the headers). The command runs
// under coreutils `timeout` so a stuck transport cannot block a cycle.
class MailDispatcher : public INotificationDispatcher {
public:
  MailDispatcher(std::string mail_command, std::string from,
                 std::vector<std::string> recipients, uint32_t timeout_seconds);

  bool dispatch(const Notification &notification) override;
  const char *get_name() const override { return "MailDispatcher"; }
  std::string get_dispatcher_type() const override { return "mail"; }

  std::string build_message(const Notification &notification) const;

private:
  std::string mail_command_;
  std::string from_;
  std::vector<std::string> recipients_;
  uint32_t timeout_seconds_;
};

#endif // MAIL_DISPATCHER_HPP
