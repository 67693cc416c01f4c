#ifndef RULE_HARDENING_ENGINE_HPP
#define RULE_HARDENING_ENGINE_HPP

#include "analysis/trend_aggregator.hpp"
#include "core/config.hpp"
#include "detection/crs_rule_catalog.hpp"
#include "detection/rule_state.hpp"
#include "io/rules/rule_set_store.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

struct HardeningPolicy {
  int min_paranoia_level = 3;
  uint64_t min_sample_count = 20;
  double promotion_threshold = 0.9;
  double demotion_threshold = 0.7;
  uint32_t confirmation_cycles = 2;
  std::string signing_key;

  static HardeningPolicy from_config(const Config::HardeningConfig &config);
};

struct Evaluation {
  RuleSetState next;
  std::vector<RuleDiff> diffs;
  bool changed = false; // any entry differs, including streak-only updates
};

enum class CycleOutcome { COMMITTED, NO_CHANGE, CONFLICT, PERSISTENCE_FAILED };

const char *cycle_outcome_to_string(CycleOutcome outcome);

struct CycleReport {
  CycleOutcome outcome = CycleOutcome::NO_CHANGE;
  uint64_t from_version = 0;
  uint64_t to_version = 0;
  std::vector<RuleDiff> diffs;
  std::set<std::string> activated;
  std::set<std::string> deactivated;
  std::string error;

  bool live_set_changed() const {
    return !activated.empty() || !deactivated.empty();
  }
};

// Pure state machine step. `catalog_levels` (id -> paranoia level) adds the
// rules known from the CRS catalog to the eligible set.
Evaluation evaluate_rules(const RuleSetState &current, const WindowStats &stats,
                          const HardeningPolicy &policy, uint64_t now_ms,
                          const std::map<std::string, int> &catalog_levels = {});

// Drives one hardening cycle: load, evaluate, compare-and-write, then the
// post-commit side effects (change log, rendered custom rules). A cycle
// either commits every diff or none of them.
class RuleHardeningEngine {
public:
  RuleHardeningEngine(IRuleSetStore &store, HardeningPolicy policy,
                      std::shared_ptr<const CrsRuleCatalog> catalog,
                      std::unique_ptr<RuleChangeLog> change_log,
                      std::string custom_rules_path);

  CycleReport run_cycle(const WindowStats &stats, uint64_t now_ms);

  // Applies the inverse of `version`'s diffs as a new version. Throws
  // WafError when the version has no recorded diffs or a diff fails its
  // signature check.
  CycleReport rollback(uint64_t version, uint64_t now_ms);

private:
  CycleReport commit(const RuleSetState &current, RuleSetState next,
                     std::vector<RuleDiff> diffs, uint64_t now_ms);
  void after_commit(const CycleReport &report, const RuleSetState &next);

  IRuleSetStore &store_;
  HardeningPolicy policy_;
  std::shared_ptr<const CrsRuleCatalog> catalog_;
  std::unique_ptr<RuleChangeLog> change_log_;
  std::string custom_rules_path_;
};

#endif // RULE_HARDENING_ENGINE_HPP
