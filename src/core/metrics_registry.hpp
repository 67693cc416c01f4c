#ifndef METRICS_REGISTRY_HPP
#define METRICS_REGISTRY_HPP

#include <map>
#include <memory>
#include <prometheus/counter.h>
#include <prometheus/family.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>
#include <string>
#include <vector>

class MetricsRegistry {
public:
  static MetricsRegistry &instance();

  MetricsRegistry(const MetricsRegistry &) = delete;
  MetricsRegistry &operator=(const MetricsRegistry &) = delete;

  std::shared_ptr<prometheus::Registry> get_registry();

  prometheus::Counter &create_counter(const std::string &name,
                                      const std::string &help);

  prometheus::Gauge &create_gauge(const std::string &name,
                                  const std::string &help);

  prometheus::Histogram &
  create_histogram(const std::string &name, const std::string &help,
                   const std::vector<double> &bucket_boundaries);

  prometheus::Family<prometheus::Counter> &
  create_counter_family(const std::string &name, const std::string &help);

private:
  MetricsRegistry();
  ~MetricsRegistry() = default;

  std::shared_ptr<prometheus::Registry> registry_;
};

// Every metric the pipeline exports, registered once on first use.
struct PipelineMetrics {
  static PipelineMetrics &instance();

  prometheus::Counter &records_fetched;
  prometheus::Counter &records_classified;
  prometheus::Counter &records_skipped;
  prometheus::Counter &records_already_classified;
  prometheus::Counter &fetch_retries;
  prometheus::Counter &write_retries;
  prometheus::Histogram &inference_duration;
  prometheus::Histogram &classification_run_duration;
  prometheus::Family<prometheus::Counter> &runs;        // {kind, outcome}
  prometheus::Family<prometheus::Counter> &transitions; // {from, to}
  prometheus::Family<prometheus::Counter> &notifications_failed; // {dispatcher}
  prometheus::Gauge &active_rules;
  prometheus::Gauge &ruleset_version;

private:
  PipelineMetrics();
};

#endif // METRICS_REGISTRY_HPP
