#ifndef FILE_DISPATCHER_HPP
#define FILE_DISPATCHER_HPP

#include "base_dispatcher.hpp"

#include <fstream>
#include <mutex>
#include <string>

// One JSON object per line, appended.
class FileDispatcher : public INotificationDispatcher {
public:
  explicit FileDispatcher(const std::string &file_path);
  ~FileDispatcher() override;

  bool dispatch(const Notification &notification) override;
  const char *get_name() const override { return "FileDispatcher"; }
  std::string get_dispatcher_type() const override { return "file"; }

private:
  std::string output_path_;
  std::ofstream output_stream_;
  std::mutex stream_mutex_;
};

#endif // FILE_DISPATCHER_HPP
