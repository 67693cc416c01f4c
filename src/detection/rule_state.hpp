#ifndef RULE_STATE_HPP
#define RULE_STATE_HPP

#include "analysis/trend_aggregator.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

enum class RuleLifecycle { INACTIVE, CANDIDATE, ACTIVE, DEMOTED };

const char *lifecycle_to_string(RuleLifecycle state);
std::optional<RuleLifecycle> lifecycle_from_string(const std::string &text);

struct RuleEntry {
  RuleLifecycle state = RuleLifecycle::INACTIVE;
  int paranoia_level = 0;
  uint32_t qualifying_streak = 0;
  uint64_t last_transition_at_ms = 0;

  bool operator==(const RuleEntry &other) const {
    return state == other.state && paranoia_level == other.paranoia_level &&
           qualifying_streak == other.qualifying_streak &&
           last_transition_at_ms == other.last_transition_at_ms;
  }
};

struct RuleDiff {
  std::string rule_id;
  RuleLifecycle from = RuleLifecycle::INACTIVE;
  RuleLifecycle to = RuleLifecycle::INACTIVE;
  RuleStat supporting;
  uint64_t target_version = 0;
  uint64_t created_at_ms = 0;
  std::string signature; // hex keyed FNV-1a over canonical_json()

  // Sorted-key JSON of every field except the signature.
  std::string canonical_json() const;
};

// The versioned aggregate the inspection layer consumes. Only `active` rules
// are enforced; every other state is inactive as far as the live config goes.
struct RuleSetState {
  uint64_t version = 0;
  uint64_t updated_at_ms = 0;
  std::map<std::string, RuleEntry> rules;
  std::vector<RuleDiff> last_cycle_diffs;

  std::set<std::string> live_active_rules() const;
};

std::string sign_diff(const RuleDiff &diff, const std::string &key);
bool verify_diff(const RuleDiff &diff, const std::string &key);

nlohmann::json rule_stat_to_json(const RuleStat &stat);
RuleStat rule_stat_from_json(const nlohmann::json &j);

nlohmann::json diff_to_json(const RuleDiff &diff);
// Both readers throw nlohmann::json::exception on malformed input and
// WafError on an unknown lifecycle state.
RuleDiff diff_from_json(const nlohmann::json &j);

nlohmann::json rule_set_to_json(const RuleSetState &state);
RuleSetState rule_set_from_json(const nlohmann::json &j);

#endif // RULE_STATE_HPP
