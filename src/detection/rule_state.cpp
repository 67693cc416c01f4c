#include "rule_state.hpp"
#include "core/errors.hpp"
#include "utils/utils.hpp"

using json = nlohmann::json;

const char *lifecycle_to_string(RuleLifecycle state) {
  switch (state) {
  case RuleLifecycle::INACTIVE:
    return "inactive";
  case RuleLifecycle::CANDIDATE:
    return "candidate";
  case RuleLifecycle::ACTIVE:
    return "active";
  case RuleLifecycle::DEMOTED:
    return "demoted";
  }
  return "inactive";
}

std::optional<RuleLifecycle> lifecycle_from_string(const std::string &text) {
  if (text == "inactive")
    return RuleLifecycle::INACTIVE;
  if (text == "candidate")
    return RuleLifecycle::CANDIDATE;
  if (text == "active")
    return RuleLifecycle::ACTIVE;
  if (text == "demoted")
    return RuleLifecycle::DEMOTED;
  return std::nullopt;
}

std::set<std::string> RuleSetState::live_active_rules() const {
  std::set<std::string> active;
  for (const auto &[id, entry] : rules)
    if (entry.state == RuleLifecycle::ACTIVE)
      active.insert(id);
  return active;
}

json rule_stat_to_json(const RuleStat &stat) {
  json j;
  j["rule_id"] = stat.rule_id;
  j["paranoia_level"] = stat.paranoia_level;
  j["trigger_count"] = stat.trigger_count;
  j["malicious_count"] = stat.malicious_count;
  j["benign_count"] = stat.benign_count;
  j["trigger_rate"] = stat.trigger_rate;
  if (stat.precision)
    j["precision"] = *stat.precision;
  else
    j["precision"] = nullptr;
  return j;
}

RuleStat rule_stat_from_json(const json &j) {
  RuleStat stat;
  stat.rule_id = j.at("rule_id").get<std::string>();
  stat.paranoia_level = j.value("paranoia_level", 0);
  stat.trigger_count = j.value("trigger_count", uint64_t{0});
  stat.malicious_count = j.value("malicious_count", uint64_t{0});
  stat.benign_count = j.value("benign_count", uint64_t{0});
  stat.trigger_rate = j.value("trigger_rate", 0.0);
  auto precision = j.find("precision");
  if (precision != j.end() && precision->is_number())
    stat.precision = precision->get<double>();
  return stat;
}

std::string RuleDiff::canonical_json() const {
  json j;
  j["rule_id"] = rule_id;
  j["from"] = lifecycle_to_string(from);
  j["to"] = lifecycle_to_string(to);
  j["supporting"] = rule_stat_to_json(supporting);
  j["target_version"] = target_version;
  j["created_at_ms"] = created_at_ms;
  return j.dump();
}

std::string sign_diff(const RuleDiff &diff, const std::string &key) {
  return Utils::to_hex(Utils::fnv1a_64(key + "\n" + diff.canonical_json()));
}

bool verify_diff(const RuleDiff &diff, const std::string &key) {
  return diff.signature == sign_diff(diff, key);
}

json diff_to_json(const RuleDiff &diff) {
  json j = json::parse(diff.canonical_json());
  j["signature"] = diff.signature;
  return j;
}

RuleDiff diff_from_json(const json &j) {
  RuleDiff diff;
  diff.rule_id = j.at("rule_id").get<std::string>();
  auto from = lifecycle_from_string(j.at("from").get<std::string>());
  auto to = lifecycle_from_string(j.at("to").get<std::string>());
  if (!from || !to)
    throw WafError("Change for rule " + diff.rule_id +
                   " names an unknown lifecycle state");
  diff.from = *from;
  diff.to = *to;
  diff.supporting = rule_stat_from_json(j.at("supporting"));
  diff.target_version = j.at("target_version").get<uint64_t>();
  diff.created_at_ms = j.value("created_at_ms", uint64_t{0});
  diff.signature = j.value("signature", std::string());
  return diff;
}

json rule_set_to_json(const RuleSetState &state) {
  json j;
  j["version"] = state.version;
  j["updated_at"] = Utils::format_ms_as_iso8601(state.updated_at_ms);
  j["updated_at_ms"] = state.updated_at_ms;

  json rules = json::object();
  for (const auto &[id, entry] : state.rules) {
    rules[id] = {{"state", lifecycle_to_string(entry.state)},
                 {"paranoia_level", entry.paranoia_level},
                 {"qualifying_streak", entry.qualifying_streak},
                 {"last_transition_at_ms", entry.last_transition_at_ms}};
  }
  j["rules"] = rules;

  json diffs = json::array();
  for (const auto &diff : state.last_cycle_diffs)
    diffs.push_back(diff_to_json(diff));
  j["last_cycle_diffs"] = diffs;
  return j;
}

RuleSetState rule_set_from_json(const json &j) {
  RuleSetState state;
  state.version = j.at("version").get<uint64_t>();
  state.updated_at_ms = j.value("updated_at_ms", uint64_t{0});

  for (const auto &[id, entry_json] : j.at("rules").items()) {
    RuleEntry entry;
    auto lifecycle = lifecycle_from_string(entry_json.at("state").get<std::string>());
    if (!lifecycle)
      throw WafError("Rule " + id + " is in an unknown lifecycle state");
    entry.state = *lifecycle;
    entry.paranoia_level = entry_json.value("paranoia_level", 0);
    entry.qualifying_streak = entry_json.value("qualifying_streak", uint32_t{0});
    entry.last_transition_at_ms = entry_json.value("last_transition_at_ms", uint64_t{0});
    state.rules[id] = entry;
  }

  auto diffs = j.find("last_cycle_diffs");
  if (diffs != j.end() && diffs->is_array())
    for (const auto &diff : *diffs)
      state.last_cycle_diffs.push_back(diff_from_json(diff));
  return state;
}
