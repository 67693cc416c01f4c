#ifndef RULE_SET_STORE_HPP
#define RULE_SET_STORE_HPP

#include "detection/rule_state.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

class IRuleSetStore {
public:
  virtual ~IRuleSetStore() = default;

  // An absent store yields the empty version-0 state.
  virtual RuleSetState load() = 0;

  // Persists `next` only if the stored version still equals
  // `expected_version`. Throws RuleConflictError when it does not and
  // RulePersistenceError when the write itself fails. Either way the stored
  // state is left untouched.
  virtual void compare_and_write(uint64_t expected_version,
                                 const RuleSetState &next) = 0;
};

// JSON document on local disk, guarded by an advisory lock on "<path>.lock"
// and replaced through a temp file + rename.
class FileRuleSetStore : public IRuleSetStore {
public:
  explicit FileRuleSetStore(std::string path,
                            std::chrono::milliseconds lock_timeout =
                                std::chrono::milliseconds(5000));

  RuleSetState load() override;
  void compare_and_write(uint64_t expected_version,
                         const RuleSetState &next) override;

  const std::string &path() const { return path_; }

private:
  RuleSetState read_unlocked() const;

  std::string path_;
  std::string lock_path_;
  std::chrono::milliseconds lock_timeout_;
};

// Append-only JSONL history of signed diffs. Rollback reads it back.
class RuleChangeLog {
public:
  explicit RuleChangeLog(std::string path);

  // Throws RulePersistenceError if the lines cannot be appended.
  void append(const std::vector<RuleDiff> &diffs);
  // Diffs whose target_version equals `version`, in commit order. Lines that
  // fail to parse are logged and skipped.
  std::vector<RuleDiff> read_version(uint64_t version) const;

private:
  std::string path_;
};

#endif // RULE_SET_STORE_HPP
