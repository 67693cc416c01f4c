#include "rule_set_store.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <sys/file.h>
#include <thread>
#include <unistd.h>
#include <utility>

namespace {

// Exclusive flock held for the lifetime of the object.
class FileLock {
public:
  FileLock(const std::string &lock_path, std::chrono::milliseconds timeout) {
    if (!Utils::create_directory_for_file(lock_path))
      throw RulePersistenceError("Cannot create directory for " + lock_path);
    fd_ = ::open(lock_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd_ < 0)
      throw RulePersistenceError("Cannot open rule lock " + lock_path + ": " +
                                 std::strerror(errno));

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (::flock(fd_, LOCK_EX | LOCK_NB) != 0) {
      if (errno != EWOULDBLOCK && errno != EINTR) {
        const std::string reason = std::strerror(errno);
        ::close(fd_);
        throw RulePersistenceError("Cannot lock " + lock_path + ": " + reason);
      }
      if (std::chrono::steady_clock::now() >= deadline) {
        ::close(fd_);
        throw RuleConflictError("Rule set is locked by another writer (" +
                                lock_path + ")");
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
  }

  ~FileLock() {
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
  }

  FileLock(const FileLock &) = delete;
  FileLock &operator=(const FileLock &) = delete;

private:
  int fd_ = -1;
};

} // namespace

FileRuleSetStore::FileRuleSetStore(std::string path,
                                   std::chrono::milliseconds lock_timeout)
    : path_(std::move(path)), lock_path_(path_ + ".lock"),
      lock_timeout_(lock_timeout) {}

RuleSetState FileRuleSetStore::read_unlocked() const {
  std::error_code ec;
  if (!std::filesystem::exists(path_, ec))
    return RuleSetState{};

  auto content = Utils::read_file(path_);
  if (!content)
    throw RulePersistenceError("Rule state " + path_ + " cannot be read");
  try {
    return rule_set_from_json(nlohmann::json::parse(*content));
  } catch (const nlohmann::json::exception &e) {
    throw RulePersistenceError("Rule state " + path_ + " is corrupt: " +
                               e.what());
  } catch (const WafError &e) {
    throw RulePersistenceError("Rule state " + path_ + " is corrupt: " +
                               e.what());
  }
}

RuleSetState FileRuleSetStore::load() {
  FileLock lock(lock_path_, lock_timeout_);
  RuleSetState state = read_unlocked();
  LOG(LogLevel::DEBUG, LogComponent::IO_RULESTORE,
      "Loaded rule set version " << state.version << " with "
                                 << state.rules.size() << " rules");
  return state;
}

void FileRuleSetStore::compare_and_write(uint64_t expected_version,
                                         const RuleSetState &next) {
  FileLock lock(lock_path_, lock_timeout_);

  const uint64_t stored_version = read_unlocked().version;
  if (stored_version != expected_version) {
    throw RuleConflictError("Rule set moved from version " +
                            std::to_string(expected_version) + " to " +
                            std::to_string(stored_version) +
                            " during the cycle");
  }

  if (!Utils::write_file_atomically(path_, rule_set_to_json(next).dump(2)))
    throw RulePersistenceError("Could not write rule state to " + path_);

  LOG(LogLevel::INFO, LogComponent::IO_RULESTORE,
      "Rule set version " << expected_version << " -> " << next.version
                          << " written to " << path_);
}

RuleChangeLog::RuleChangeLog(std::string path) : path_(std::move(path)) {}

void RuleChangeLog::append(const std::vector<RuleDiff> &diffs) {
  if (diffs.empty())
    return;
  if (!Utils::create_directory_for_file(path_))
    throw RulePersistenceError("Cannot create directory for " + path_);
  std::ofstream out(path_, std::ios::app);
  if (!out.is_open())
    throw RulePersistenceError("Cannot open rule change log " + path_);
  for (const auto &diff : diffs)
    out << diff_to_json(diff).dump() << '\n';
  out.flush();
  if (!out)
    throw RulePersistenceError("Failed appending to rule change log " + path_);
}

std::vector<RuleDiff> RuleChangeLog::read_version(uint64_t version) const {
  std::vector<RuleDiff> diffs;
  std::ifstream in(path_);
  if (!in.is_open())
    return diffs;

  std::string line;
  size_t line_number = 0;
  while (std::getline(in, line)) {
    ++line_number;
    if (Utils::trim_copy(line).empty())
      continue;
    try {
      RuleDiff diff = diff_from_json(nlohmann::json::parse(line));
      if (diff.target_version == version)
        diffs.push_back(std::move(diff));
    } catch (const nlohmann::json::exception &e) {
      LOG(LogLevel::WARN, LogComponent::IO_RULESTORE,
          "Skipping malformed change log line " << line_number << " in "
                                                << path_ << ": " << e.what());
    } catch (const WafError &e) {
      LOG(LogLevel::WARN, LogComponent::IO_RULESTORE,
          "Skipping malformed change log line " << line_number << " in "
                                                << path_ << ": " << e.what());
    }
  }
  return diffs;
}
