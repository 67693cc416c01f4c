#include "metrics_registry.hpp"

MetricsRegistry &MetricsRegistry::instance() {
  static MetricsRegistry instance;
  return instance;
}

MetricsRegistry::MetricsRegistry()
    : registry_(std::make_shared<prometheus::Registry>()) {}

std::shared_ptr<prometheus::Registry> MetricsRegistry::get_registry() {
  return registry_;
}

prometheus::Counter &MetricsRegistry::create_counter(const std::string &name,
                                                     const std::string &help) {

  auto &counter_family =
      prometheus::BuildCounter().Name(name).Help(help).Register(*registry_);

  return counter_family.Add({});
}

prometheus::Gauge &MetricsRegistry::create_gauge(const std::string &name,
                                                 const std::string &help) {

  auto &gauge_family =
      prometheus::BuildGauge().Name(name).Help(help).Register(*registry_);

  return gauge_family.Add({});
}

prometheus::Histogram &MetricsRegistry::create_histogram(
    const std::string &name, const std::string &help,
    const std::vector<double> &bucket_boundaries) {

  auto &histogram_family =
      prometheus::BuildHistogram().Name(name).Help(help).Register(*registry_);

  return histogram_family.Add({}, bucket_boundaries);
}

prometheus::Family<prometheus::Counter> &
MetricsRegistry::create_counter_family(const std::string &name,
                                       const std::string &help) {

  return prometheus::BuildCounter().Name(name).Help(help).Register(*registry_);
}

PipelineMetrics &PipelineMetrics::instance() {
  static PipelineMetrics instance;
  return instance;
}

PipelineMetrics::PipelineMetrics()
    : records_fetched(MetricsRegistry::instance().create_counter(
          "waf_records_fetched_total",
          "Audit records pulled from unclassified buckets.")),
      records_classified(MetricsRegistry::instance().create_counter(
          "waf_records_classified_total",
          "Audit records classified and durably written.")),
      records_skipped(MetricsRegistry::instance().create_counter(
          "waf_records_skipped_total",
          "Audit records skipped because of a per-record error.")),
      records_already_classified(MetricsRegistry::instance().create_counter(
          "waf_records_already_classified_total",
          "Audit records found already classified under the active model.")),
      fetch_retries(MetricsRegistry::instance().create_counter(
          "waf_fetch_retries_total", "Retried store fetches.")),
      write_retries(MetricsRegistry::instance().create_counter(
          "waf_write_retries_total", "Retried classified-store writes.")),
      inference_duration(MetricsRegistry::instance().create_histogram(
          "waf_inference_duration_seconds",
          "Latency of a single classifier inference call.",
          {0.0001, 0.0005, 0.001, 0.005, 0.01, 0.05, 0.1})),
      classification_run_duration(MetricsRegistry::instance().create_histogram(
          "waf_classification_run_duration_seconds",
          "Wall time of a complete classification run.",
          {0.1, 0.5, 1, 5, 15, 60, 300, 900})),
      runs(MetricsRegistry::instance().create_counter_family(
          "waf_runs_total", "Classification runs and hardening cycles by "
                            "kind and outcome.")),
      transitions(MetricsRegistry::instance().create_counter_family(
          "waf_rule_transitions_total",
          "Rule state transitions committed by the hardening engine.")),
      notifications_failed(MetricsRegistry::instance().create_counter_family(
          "waf_notifications_failed_total",
          "Notifications a dispatcher failed to deliver.")),
      active_rules(MetricsRegistry::instance().create_gauge(
          "waf_active_hardened_rules", "Rules currently in active state.")),
      ruleset_version(MetricsRegistry::instance().create_gauge(
          "waf_ruleset_version", "Version of the committed rule set state.")) {}
