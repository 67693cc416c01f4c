#include "run_status.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <atomic>
#include <deque>
#include <fstream>
#include <utility>

const char *run_kind_to_string(RunKind kind) {
  switch (kind) {
  case RunKind::CLASSIFICATION:
    return "classification";
  case RunKind::HARDENING:
    return "hardening";
  case RunKind::ROLLBACK:
    return "rollback";
  }
  return "unknown";
}

const char *run_outcome_to_string(RunOutcome outcome) {
  switch (outcome) {
  case RunOutcome::COMPLETED:
    return "completed";
  case RunOutcome::ABORTED:
    return "aborted";
  case RunOutcome::CANCELLED:
    return "cancelled";
  case RunOutcome::SKIPPED:
    return "skipped";
  }
  return "unknown";
}

nlohmann::json RunStatus::to_json() const {
  nlohmann::json j;
  j["run_id"] = run_id;
  j["kind"] = run_kind_to_string(kind);
  j["started_at"] = Utils::format_ms_as_iso8601(started_at_ms);
  j["finished_at"] = Utils::format_ms_as_iso8601(finished_at_ms);
  j["outcome"] = run_outcome_to_string(outcome);
  j["counts"] = counts;
  if (error.empty())
    j["error"] = nullptr;
  else
    j["error"] = error;
  return j;
}

std::string make_run_id(RunKind kind, uint64_t started_at_ms) {
  static std::atomic<uint64_t> sequence{0};
  return std::string(run_kind_to_string(kind)) + "-" +
         std::to_string(started_at_ms) + "-" + std::to_string(++sequence);
}

RunStatusLog::RunStatusLog(std::string path) : path_(std::move(path)) {}

void RunStatusLog::append(const RunStatus &status) {
  std::lock_guard<std::mutex> lock(mutex_);
  Utils::create_directory_for_file(path_);
  std::ofstream out(path_, std::ios::app);
  if (!out.is_open()) {
    LOG(LogLevel::ERROR, LogComponent::STATE_PERSIST,
        "Cannot open run status log " << path_);
    return;
  }
  out << status.to_json().dump() << '\n';
  if (!out.flush())
    LOG(LogLevel::ERROR, LogComponent::STATE_PERSIST,
        "Failed writing run " << status.run_id << " to " << path_);
}

std::vector<nlohmann::json> RunStatusLog::latest(size_t limit) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::deque<std::string> tail;
  std::ifstream in(path_);
  std::string line;
  while (std::getline(in, line)) {
    if (line.empty())
      continue;
    tail.push_back(std::move(line));
    if (tail.size() > limit)
      tail.pop_front();
  }

  std::vector<nlohmann::json> records;
  for (auto it = tail.rbegin(); it != tail.rend(); ++it) {
    auto parsed = nlohmann::json::parse(*it, nullptr, false);
    if (parsed.is_discarded()) {
      LOG(LogLevel::WARN, LogComponent::STATE_PERSIST,
          "Skipping malformed run status line in " << path_);
      continue;
    }
    records.push_back(std::move(parsed));
  }
  return records;
}
