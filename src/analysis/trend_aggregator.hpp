#ifndef TREND_AGGREGATOR_HPP
#define TREND_AGGREGATOR_HPP

#include "core/config.hpp"
#include "io/store/store_interfaces.hpp"
#include "utils/retry_policy.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

struct RuleStat {
  std::string rule_id;
  int paranoia_level = 0;
  uint64_t trigger_count = 0;
  uint64_t malicious_count = 0;
  uint64_t benign_count = 0;
  double trigger_rate = 0.0; // trigger_count / records in window
  // malicious_count / trigger_count; absent when the rule never triggered.
  std::optional<double> precision;
};

struct WindowStats {
  uint64_t window_start_ms = 0;
  uint64_t window_end_ms = 0;
  uint64_t total_records = 0;
  uint64_t malicious_records = 0;
  double attack_percentage = 0.0;
  std::vector<RuleStat> rules; // sorted by rule id
};

// Recomputes per-rule statistics from scratch over the classified buckets of
// a window. Keeps no state between calls.
class TrendAggregator {
public:
  TrendAggregator(IClassifiedStore &store, Config::BucketGranularity granularity,
                  RetryPolicy retry);

  // `known_rules` (id -> paranoia level) get an entry even with no triggers,
  // so "no data" is reported as an absent precision. Throws FetchError after
  // the retry ceiling.
  WindowStats aggregate(uint64_t window_start_ms, uint64_t window_end_ms,
                        const std::string &model_version,
                        const std::map<std::string, int> &known_rules = {});

private:
  IClassifiedStore &store_;
  Config::BucketGranularity granularity_;
  RetryPolicy retry_;
};

#endif // TREND_AGGREGATOR_HPP
