#include "trend_aggregator.hpp"
#include "core/logger.hpp"
#include "core/metrics_registry.hpp"
#include "detection/crs_rule_catalog.hpp"
#include "io/store/bucket_naming.hpp"

#include <algorithm>
#include <set>
#include <unordered_map>
#include <utility>

TrendAggregator::TrendAggregator(IClassifiedStore &store,
                                 Config::BucketGranularity granularity,
                                 RetryPolicy retry)
    : store_(store), granularity_(granularity), retry_(std::move(retry)) {}

WindowStats TrendAggregator::aggregate(uint64_t window_start_ms,
                                       uint64_t window_end_ms,
                                       const std::string &model_version,
                                       const std::map<std::string, int> &known_rules) {
  WindowStats stats;
  stats.window_start_ms = window_start_ms;
  stats.window_end_ms = window_end_ms;

  std::unordered_map<std::string, RuleStat> by_rule;
  for (const auto &[rule_id, level] : known_rules) {
    RuleStat &stat = by_rule[rule_id];
    stat.rule_id = rule_id;
    stat.paranoia_level = level;
  }

  auto visit = [&](const ClassifiedRecord &record) {
    if (record.timestamp_ms < window_start_ms || record.timestamp_ms > window_end_ms)
      return;
    ++stats.total_records;
    const bool malicious = record.label == Label::MALICIOUS;
    if (malicious)
      ++stats.malicious_records;

    // A rule firing several times on one record counts once.
    std::set<std::string> seen;
    for (const auto &rule : record.triggered_rules) {
      // Activated copies fire under their custom id; count them as the CRS rule.
      const std::string rule_id = canonical_rule_id(rule.rule_id);
      if (!seen.insert(rule_id).second)
        continue;
      RuleStat &stat = by_rule[rule_id];
      stat.rule_id = rule_id;
      stat.paranoia_level = std::max(stat.paranoia_level, rule.paranoia_level);
      ++stat.trigger_count;
      if (malicious)
        ++stat.malicious_count;
      else
        ++stat.benign_count;
    }
  };

  for (const auto &bucket :
       buckets_between(window_start_ms, window_end_ms, granularity_)) {
    retry_with_backoff(
        retry_, "Scan of classified bucket " + bucket,
        LogComponent::ANALYSIS_TRENDS,
        [&] {
          // A retried scan must not double count what the failed one saw.
          auto snapshot_stats = stats;
          auto snapshot_rules = by_rule;
          try {
            store_.scan(bucket, model_version, visit);
          } catch (...) {
            stats = std::move(snapshot_stats);
            by_rule = std::move(snapshot_rules);
            throw;
          }
        },
        [] { PipelineMetrics::instance().fetch_retries.Increment(); });
  }

  if (stats.total_records > 0)
    stats.attack_percentage = 100.0 * static_cast<double>(stats.malicious_records) /
                              static_cast<double>(stats.total_records);

  stats.rules.reserve(by_rule.size());
  for (auto &[rule_id, stat] : by_rule) {
    if (stat.trigger_count > 0) {
      stat.precision = static_cast<double>(stat.malicious_count) /
                       static_cast<double>(stat.trigger_count);
    }
    if (stats.total_records > 0)
      stat.trigger_rate = static_cast<double>(stat.trigger_count) /
                          static_cast<double>(stats.total_records);
    stats.rules.push_back(std::move(stat));
  }
  std::sort(stats.rules.begin(), stats.rules.end(),
            [](const RuleStat &a, const RuleStat &b) { return a.rule_id < b.rule_id; });

  LOG(LogLevel::INFO, LogComponent::ANALYSIS_TRENDS,
      "Aggregated " << stats.total_records << " classified records ("
                    << stats.malicious_records << " malicious) over "
                    << stats.rules.size() << " rules for model " << model_version);
  return stats;
}
