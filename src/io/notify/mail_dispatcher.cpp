#include "mail_dispatcher.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <cstdio>
#include <sstream>
#include <sys/wait.h>
#include <utility>

MailDispatcher::MailDispatcher(std::string mail_command, std::string from,
                               std::vector<std::string> recipients,
                               uint32_t timeout_seconds)
    : mail_command_(std::move(mail_command)), from_(std::move(from)),
      recipients_(std::move(recipients)), timeout_seconds_(timeout_seconds) {}

std::string MailDispatcher::build_message(const Notification &notification) const {
  std::ostringstream msg;
  msg << "From: " << from_ << "\r\n";
  msg << "To: ";
  for (size_t i = 0; i < recipients_.size(); ++i)
    msg << (i ? ", " : "") << recipients_[i];
  msg << "\r\n";
  msg << "Subject: [waf_hardener] " << notification_kind_to_string(notification.kind)
      << ": " << notification.summary << "\r\n";
  msg << "Content-Type: text/plain; charset=utf-8\r\n\r\n";

  msg << notification.summary << "\n\n";
  msg << "Kind:    " << notification_kind_to_string(notification.kind) << "\n";
  if (!notification.subject.empty())
    msg << "Subject: " << notification.subject << "\n";
  msg << "Time:    " << Utils::format_ms_as_iso8601(notification.created_at_ms)
      << "\n\n";
  msg << notification.details.dump(2) << "\n";
  return msg.str();
}

bool MailDispatcher::dispatch(const Notification &notification) {
  if (recipients_.empty()) {
    LOG(LogLevel::WARN, LogComponent::IO_NOTIFY,
        "MailDispatcher has no recipients configured.");
    return false;
  }

  const std::string command =
      "timeout " + std::to_string(timeout_seconds_) + " " + mail_command_;
  FILE *pipe = ::popen(command.c_str(), "w");
  if (!pipe) {
    LOG(LogLevel::ERROR, LogComponent::IO_NOTIFY,
        "Could not start mail command: " << mail_command_);
    return false;
  }

  const std::string message = build_message(notification);
  const size_t written = std::fwrite(message.data(), 1, message.size(), pipe);
  const int status = ::pclose(pipe);

  if (written != message.size() || status == -1 || !WIFEXITED(status) ||
      WEXITSTATUS(status) != 0) {
    LOG(LogLevel::ERROR, LogComponent::IO_NOTIFY,
        "Mail command failed for " << notification_kind_to_string(notification.kind)
                                   << " (exit status "
                                   << (WIFEXITED(status) ? WEXITSTATUS(status) : -1)
                                   << ")");
    return false;
  }
  LOG(LogLevel::DEBUG, LogComponent::IO_NOTIFY,
      "Mailed " << notification_kind_to_string(notification.kind) << " to "
                << recipients_.size() << " recipients");
  return true;
}
