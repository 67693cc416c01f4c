#include "file_dispatcher.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

FileDispatcher::FileDispatcher(const std::string &file_path)
    : output_path_(file_path) {
  if (!output_path_.empty()) {
    Utils::create_directory_for_file(output_path_);
    output_stream_.open(output_path_, std::ios::app);
    if (!output_stream_.is_open())
      LOG(LogLevel::ERROR, LogComponent::IO_NOTIFY,
          "FileDispatcher could not open notification file: " << output_path_);
  }
}

FileDispatcher::~FileDispatcher() {
  if (output_stream_.is_open()) {
    output_stream_.flush();
    output_stream_.close();
    LOG(LogLevel::TRACE, LogComponent::IO_NOTIFY,
        "FileDispatcher closed notification file: " << output_path_);
  }
}

bool FileDispatcher::dispatch(const Notification &notification) {
  std::lock_guard<std::mutex> lock(stream_mutex_);
  if (!output_stream_.is_open())
    return false;

  const std::string line = notification.to_json().dump();
  output_stream_ << line << std::endl;
  if (!output_stream_.good()) {
    LOG(LogLevel::ERROR, LogComponent::IO_NOTIFY,
        "Failed to write notification to file: " << output_path_);
    output_stream_.clear();
    return false;
  }
  LOG(LogLevel::TRACE, LogComponent::IO_NOTIFY,
      "Notification written to " << output_path_ << " | " << line);
  return true;
}
