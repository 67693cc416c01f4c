#include "rule_hardening_engine.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "core/metrics_registry.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <iterator>
#include <optional>
#include <utility>

HardeningPolicy HardeningPolicy::from_config(const Config::HardeningConfig &config) {
  HardeningPolicy policy;
  policy.min_paranoia_level = config.min_paranoia_level;
  policy.min_sample_count = config.min_sample_count;
  policy.promotion_threshold = config.promotion_threshold;
  policy.demotion_threshold = config.demotion_threshold;
  policy.confirmation_cycles = std::max<uint32_t>(1, config.confirmation_cycles);
  policy.signing_key = config.signing_key;
  return policy;
}

const char *cycle_outcome_to_string(CycleOutcome outcome) {
  switch (outcome) {
  case CycleOutcome::COMMITTED:
    return "committed";
  case CycleOutcome::NO_CHANGE:
    return "no_change";
  case CycleOutcome::CONFLICT:
    return "conflict";
  case CycleOutcome::PERSISTENCE_FAILED:
    return "persistence_failed";
  }
  return "unknown";
}

namespace {

bool meets_promotion(const RuleStat *stat, const HardeningPolicy &policy) {
  return stat && stat->trigger_count >= policy.min_sample_count &&
         stat->precision && *stat->precision >= policy.promotion_threshold;
}

// No data is never a reason to demote.
bool falls_below_demotion(const RuleStat *stat, const HardeningPolicy &policy) {
  return stat && stat->trigger_count >= policy.min_sample_count &&
         stat->precision && *stat->precision < policy.demotion_threshold;
}

} // namespace

Evaluation evaluate_rules(const RuleSetState &current, const WindowStats &stats,
                          const HardeningPolicy &policy, uint64_t now_ms,
                          const std::map<std::string, int> &catalog_levels) {
  std::map<std::string, const RuleStat *> stat_by_id;
  for (const auto &stat : stats.rules)
    stat_by_id[stat.rule_id] = &stat;

  // Every rule that may take part: already tracked, seen this window, or
  // known from the catalog.
  std::map<std::string, int> levels;
  for (const auto &[id, entry] : current.rules)
    levels[id] = entry.paranoia_level;
  for (const auto &stat : stats.rules)
    levels[stat.rule_id] = std::max(levels[stat.rule_id], stat.paranoia_level);
  for (const auto &[id, level] : catalog_levels)
    levels[id] = std::max(levels[id], level);

  Evaluation eval;
  eval.next = current;
  const uint64_t target_version = current.version + 1;

  for (const auto &[rule_id, level] : levels) {
    if (level < policy.min_paranoia_level)
      continue;

    auto stat_it = stat_by_id.find(rule_id);
    const RuleStat *stat = stat_it == stat_by_id.end() ? nullptr : stat_it->second;

    auto existing = current.rules.find(rule_id);
    RuleEntry entry = existing != current.rules.end() ? existing->second : RuleEntry{};
    entry.paranoia_level = level;

    auto transition = [&](RuleLifecycle to) {
      RuleDiff diff;
      diff.rule_id = rule_id;
      diff.from = entry.state;
      diff.to = to;
      if (stat) {
        diff.supporting = *stat;
      } else {
        diff.supporting.rule_id = rule_id;
        diff.supporting.paranoia_level = level;
      }
      diff.target_version = target_version;
      diff.created_at_ms = now_ms;
      diff.signature = sign_diff(diff, policy.signing_key);
      eval.diffs.push_back(std::move(diff));

      entry.state = to;
      entry.last_transition_at_ms = now_ms;
    };

    const bool qualifies = meets_promotion(stat, policy);
    switch (entry.state) {
    case RuleLifecycle::INACTIVE:
      if (qualifies) {
        entry.qualifying_streak = 1;
        transition(RuleLifecycle::CANDIDATE);
        if (entry.qualifying_streak >= policy.confirmation_cycles) {
          entry.qualifying_streak = 0;
          transition(RuleLifecycle::ACTIVE);
        }
      }
      break;
    case RuleLifecycle::CANDIDATE:
      if (qualifies) {
        ++entry.qualifying_streak;
        if (entry.qualifying_streak >= policy.confirmation_cycles) {
          entry.qualifying_streak = 0;
          transition(RuleLifecycle::ACTIVE);
        }
      } else {
        entry.qualifying_streak = 0;
        transition(RuleLifecycle::INACTIVE);
      }
      break;
    case RuleLifecycle::ACTIVE:
      if (falls_below_demotion(stat, policy)) {
        entry.qualifying_streak = 0;
        transition(RuleLifecycle::DEMOTED);
      }
      break;
    case RuleLifecycle::DEMOTED:
      // Re-entering candidate keeps the streak, so one more qualifying
      // cycle is needed before the rule is active again.
      if (qualifies) {
        ++entry.qualifying_streak;
        if (entry.qualifying_streak >= policy.confirmation_cycles)
          transition(RuleLifecycle::CANDIDATE);
      } else {
        entry.qualifying_streak = 0;
      }
      break;
    }

    const bool untracked_default =
        existing == current.rules.end() &&
        entry.state == RuleLifecycle::INACTIVE && entry.qualifying_streak == 0;
    if (!untracked_default)
      eval.next.rules[rule_id] = entry;
  }

  eval.changed = eval.next.rules != current.rules;
  if (eval.changed) {
    eval.next.version = target_version;
    eval.next.updated_at_ms = now_ms;
    eval.next.last_cycle_diffs = eval.diffs;
  }
  return eval;
}

RuleHardeningEngine::RuleHardeningEngine(
    IRuleSetStore &store, HardeningPolicy policy,
    std::shared_ptr<const CrsRuleCatalog> catalog,
    std::unique_ptr<RuleChangeLog> change_log, std::string custom_rules_path)
    : store_(store), policy_(std::move(policy)), catalog_(std::move(catalog)),
      change_log_(std::move(change_log)),
      custom_rules_path_(std::move(custom_rules_path)) {}

CycleReport RuleHardeningEngine::run_cycle(const WindowStats &stats,
                                           uint64_t now_ms) {
  CycleReport report;
  RuleSetState current;
  try {
    current = store_.load();
  } catch (const RuleConflictError &e) {
    report.outcome = CycleOutcome::CONFLICT;
    report.error = e.what();
    LOG(LogLevel::ERROR, LogComponent::RULES_HARDENING,
        "Hardening cycle aborted: " << e.what());
    return report;
  } catch (const RulePersistenceError &e) {
    report.outcome = CycleOutcome::PERSISTENCE_FAILED;
    report.error = e.what();
    LOG(LogLevel::ERROR, LogComponent::RULES_HARDENING,
        "Hardening cycle aborted: " << e.what());
    return report;
  }

  Evaluation eval =
      evaluate_rules(current, stats, policy_, now_ms,
                     catalog_ ? catalog_->paranoia_levels()
                              : std::map<std::string, int>{});

  if (!eval.changed) {
    report.from_version = report.to_version = current.version;
    LOG(LogLevel::INFO, LogComponent::RULES_HARDENING,
        "No rule changes at version " << current.version << " ("
                                      << stats.rules.size()
                                      << " rules evaluated)");
    return report;
  }
  return commit(current, std::move(eval.next), std::move(eval.diffs), now_ms);
}

CycleReport RuleHardeningEngine::commit(const RuleSetState &current,
                                        RuleSetState next,
                                        std::vector<RuleDiff> diffs,
                                        uint64_t now_ms) {
  CycleReport report;
  report.from_version = current.version;
  report.to_version = current.version;

  try {
    store_.compare_and_write(current.version, next);
  } catch (const RuleConflictError &e) {
    report.outcome = CycleOutcome::CONFLICT;
    report.error = e.what();
    LOG(LogLevel::ERROR, LogComponent::RULES_HARDENING,
        "Rule set conflict, " << diffs.size()
                              << " diffs discarded: " << e.what());
    return report;
  } catch (const RulePersistenceError &e) {
    report.outcome = CycleOutcome::PERSISTENCE_FAILED;
    report.error = e.what();
    LOG(LogLevel::ERROR, LogComponent::RULES_HARDENING,
        "Rule set could not be persisted, " << diffs.size()
                                            << " diffs discarded: " << e.what());
    return report;
  }

  report.outcome = CycleOutcome::COMMITTED;
  report.to_version = next.version;

  const auto before = current.live_active_rules();
  const auto after = next.live_active_rules();
  std::set_difference(after.begin(), after.end(), before.begin(), before.end(),
                      std::inserter(report.activated, report.activated.end()));
  std::set_difference(before.begin(), before.end(), after.begin(), after.end(),
                      std::inserter(report.deactivated, report.deactivated.end()));

  auto &metrics = PipelineMetrics::instance();
  for (const auto &diff : diffs) {
    metrics.transitions
        .Add({{"from", lifecycle_to_string(diff.from)},
              {"to", lifecycle_to_string(diff.to)}})
        .Increment();
    LOG(LogLevel::INFO, LogComponent::RULES_HARDENING,
        "Rule " << diff.rule_id << ": " << lifecycle_to_string(diff.from)
                << " -> " << lifecycle_to_string(diff.to) << " (triggers "
                << diff.supporting.trigger_count << ", precision "
                << (diff.supporting.precision
                        ? std::to_string(*diff.supporting.precision)
                        : std::string("n/a"))
                << ")");
  }
  metrics.ruleset_version.Set(static_cast<double>(next.version));
  metrics.active_rules.Set(static_cast<double>(after.size()));

  report.diffs = std::move(diffs);
  after_commit(report, next);

  LOG(LogLevel::INFO, LogComponent::RULES_HARDENING,
      "Committed rule set version " << report.to_version << " with "
                                    << report.diffs.size() << " transitions ("
                                    << report.activated.size() << " activated, "
                                    << report.deactivated.size()
                                    << " deactivated) at "
                                    << Utils::format_ms_as_iso8601(now_ms));
  return report;
}

void RuleHardeningEngine::after_commit(const CycleReport &report,
                                       const RuleSetState &next) {
  // The state is durable at this point. Failures below are reported but
  // cannot undo the commit.
  if (change_log_) {
    try {
      change_log_->append(report.diffs);
    } catch (const RulePersistenceError &e) {
      LOG(LogLevel::ERROR, LogComponent::RULES_HARDENING,
          "Version " << report.to_version
                     << " committed but its change log entry was lost: "
                     << e.what());
    }
  }

  if (!catalog_ || custom_rules_path_.empty())
    return;
  const std::string rendered =
      catalog_->render_custom_rules(next.live_active_rules(), next.version);
  if (!Utils::write_file_atomically(custom_rules_path_, rendered)) {
    LOG(LogLevel::ERROR, LogComponent::RULES_HARDENING,
        "Could not render custom rules to " << custom_rules_path_);
  }
}

CycleReport RuleHardeningEngine::rollback(uint64_t version, uint64_t now_ms) {
  if (!change_log_)
    throw WafError("Rollback needs a rule change log");

  const auto recorded = change_log_->read_version(version);
  if (recorded.empty())
    throw WafError("No recorded diffs for rule set version " +
                   std::to_string(version));
  for (const auto &diff : recorded) {
    if (!verify_diff(diff, policy_.signing_key))
      throw WafError("Diff for rule " + diff.rule_id + " at version " +
                     std::to_string(version) + " fails its signature check");
  }

  const RuleSetState current = store_.load();
  RuleSetState next = current;
  next.version = current.version + 1;
  next.updated_at_ms = now_ms;

  std::vector<RuleDiff> inverse;
  for (auto it = recorded.rbegin(); it != recorded.rend(); ++it) {
    RuleEntry &entry = next.rules[it->rule_id];
    if (entry.paranoia_level == 0)
      entry.paranoia_level = it->supporting.paranoia_level;
    if (entry.state == it->from)
      continue;

    RuleDiff diff;
    diff.rule_id = it->rule_id;
    diff.from = entry.state;
    diff.to = it->from;
    diff.supporting = it->supporting;
    diff.target_version = next.version;
    diff.created_at_ms = now_ms;
    diff.signature = sign_diff(diff, policy_.signing_key);
    inverse.push_back(diff);

    entry.state = it->from;
    entry.qualifying_streak = 0;
    entry.last_transition_at_ms = now_ms;
  }

  if (inverse.empty()) {
    CycleReport report;
    report.from_version = report.to_version = current.version;
    LOG(LogLevel::INFO, LogComponent::RULES_HARDENING,
        "Rollback of version " << version << " changes nothing at version "
                               << current.version);
    return report;
  }

  LOG(LogLevel::WARN, LogComponent::RULES_HARDENING,
      "Rolling back version " << version << " as version " << next.version);
  next.last_cycle_diffs = inverse;
  return commit(current, std::move(next), std::move(inverse), now_ms);
}
