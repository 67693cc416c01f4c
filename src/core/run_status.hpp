#ifndef RUN_STATUS_HPP
#define RUN_STATUS_HPP

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

enum class RunKind { CLASSIFICATION, HARDENING, ROLLBACK };
enum class RunOutcome { COMPLETED, ABORTED, CANCELLED, SKIPPED };

const char *run_kind_to_string(RunKind kind);
const char *run_outcome_to_string(RunOutcome outcome);

struct RunStatus {
  std::string run_id;
  RunKind kind = RunKind::CLASSIFICATION;
  uint64_t started_at_ms = 0;
  uint64_t finished_at_ms = 0;
  RunOutcome outcome = RunOutcome::COMPLETED;
  nlohmann::json counts = nlohmann::json::object();
  std::string error;

  nlohmann::json to_json() const;
};

// Unique per process: "<kind>-<start ms>-<sequence>".
std::string make_run_id(RunKind kind, uint64_t started_at_ms);

// Append-only JSONL history of runs and cycles.
class RunStatusLog {
public:
  explicit RunStatusLog(std::string path);

  // Failures are logged; the run being reported is not affected.
  void append(const RunStatus &status);
  // Most recent first.
  std::vector<nlohmann::json> latest(size_t limit) const;

private:
  std::string path_;
  mutable std::mutex mutex_;
};

#endif // RUN_STATUS_HPP
