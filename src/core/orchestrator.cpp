#include "orchestrator.hpp"
#include "analysis/trend_aggregator.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "core/metrics_registry.hpp"
#include "detection/rule_hardening_engine.hpp"
#include "io/store/log_fetcher.hpp"
#include "io/store/result_writer.hpp"
#include "models/feature_extractor.hpp"
#include "utils/scoped_timer.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <map>
#include <mutex>
#include <thread>
#include <optional>
#include <utility>
#include <vector>

namespace {

struct RecordOutcome {
  bool already_classified = false;
  std::optional<Prediction> prediction;
  std::string error;
};

// Extracts and scores `pending` records of a micro-batch across up to
// `worker_count` threads. Inference failures are retried under `retry`. A
// SchemaMismatchError, or an InferenceError past the retry ceiling, is
// rethrown on the calling thread; other per-record failures land in the
// outcome.
void classify_in_parallel(const std::vector<AuditRecord> &records,
                          const std::vector<size_t> &pending,
                          std::vector<RecordOutcome> &outcomes,
                          const FeatureExtractor &extractor,
                          const Classifier &classifier, const RetryPolicy &retry,
                          uint32_t worker_count) {
  if (pending.empty())
    return;

  std::atomic<size_t> next{0};
  std::mutex fatal_mutex;
  std::exception_ptr fatal;

  auto record_fatal = [&] {
    std::lock_guard<std::mutex> lock(fatal_mutex);
    if (!fatal)
      fatal = std::current_exception();
    next = pending.size();
  };

  auto work = [&] {
    for (size_t i = next++; i < pending.size(); i = next++) {
      const size_t index = pending[i];
      try {
        FeatureVector vector = extractor.extract(records[index]);
        outcomes[index].prediction = retry_with_backoff(
            retry, "Inference for record " + records[index].id,
            LogComponent::ML_INFERENCE, [&] { return classifier.classify(vector); });
      } catch (const SchemaMismatchError &) {
        record_fatal();
        return;
      } catch (const TransientIOError &) {
        record_fatal();
        return;
      } catch (const std::exception &e) {
        outcomes[index].error = e.what();
      }
    }
  };

  const size_t threads =
      std::min<size_t>(std::max<uint32_t>(1, worker_count), pending.size());
  std::vector<std::thread> workers;
  workers.reserve(threads - 1);
  for (size_t t = 1; t < threads; ++t)
    workers.emplace_back(work);
  work();
  for (auto &worker : workers)
    worker.join();

  if (fatal)
    std::rethrow_exception(fatal);
}

nlohmann::json stat_summary(const RuleStat &stat) {
  nlohmann::json j = {{"rule_id", stat.rule_id},
                      {"paranoia_level", stat.paranoia_level},
                      {"trigger_count", stat.trigger_count}};
  if (stat.precision)
    j["precision"] = *stat.precision;
  else
    j["precision"] = nullptr;
  return j;
}

} // namespace

Orchestrator::Orchestrator(std::shared_ptr<const Config::AppConfig> config,
                           PipelineDependencies deps)
    : config_(std::move(config)), deps_(std::move(deps)) {
  if (!deps_.clock)
    deps_.clock = [] { return Utils::get_current_time_ms(); };
}

Orchestrator::~Orchestrator() { stop(); }

std::shared_ptr<const Config::AppConfig> Orchestrator::config() const {
  std::lock_guard<std::mutex> lock(config_mutex_);
  return config_;
}

void Orchestrator::update_config(std::shared_ptr<const Config::AppConfig> config) {
  {
    std::lock_guard<std::mutex> lock(config_mutex_);
    config_ = config;
  }
  deps_.notifier.reconfigure(config->notification);
  LOG(LogLevel::INFO, LogComponent::CONFIG,
      "Configuration updated. New thresholds apply from the next cycle.");
}

RetryPolicy Orchestrator::make_retry_policy(const Config::AppConfig &config) const {
  RetryPolicy policy = RetryPolicy::from_config(config.fetcher);
  if (deps_.retry_sleeper)
    policy.sleeper = deps_.retry_sleeper;
  return policy;
}

void Orchestrator::finish_run(RunStatus &status) {
  status.finished_at_ms = deps_.clock();
  PipelineMetrics::instance()
      .runs
      .Add({{"kind", run_kind_to_string(status.kind)},
            {"outcome", run_outcome_to_string(status.outcome)}})
      .Increment();
  if (deps_.run_log)
    deps_.run_log->append(status);
}

RunStatus Orchestrator::run_classification() {
  RunStatus status;
  status.kind = RunKind::CLASSIFICATION;
  status.started_at_ms = deps_.clock();
  status.run_id = make_run_id(status.kind, status.started_at_ms);

  std::unique_lock<std::mutex> single_flight(classify_mutex_, std::try_to_lock);
  if (!single_flight.owns_lock()) {
    status.outcome = RunOutcome::SKIPPED;
    status.error = "classification run already in progress";
    LOG(LogLevel::INFO, LogComponent::ORCH_CLASSIFY,
        "Skipping " << status.run_id << ": " << status.error);
    finish_run(status);
    return status;
  }

  if (!deps_.classifier) {
    status.outcome = RunOutcome::ABORTED;
    status.error = "no classification model loaded";
    finish_run(status);
    return status;
  }

  const auto cfg = config();
  const RetryPolicy retry = make_retry_policy(*cfg);
  LogFetcher fetcher(deps_.unclassified_store, deps_.cursor_store, cfg->store,
                     cfg->fetcher, retry);
  ResultWriter writer(deps_.classified_store, retry);
  FeatureExtractor extractor;
  const Classifier &classifier = *deps_.classifier;
  const std::string &model_version = classifier.model_version();
  auto &metrics = PipelineMetrics::instance();

  ClassifyCounts counts;
  ScopedTimer run_timer(metrics.classification_run_duration);
  LOG(LogLevel::INFO, LogComponent::ORCH_CLASSIFY,
      "Starting " << status.run_id << " with model " << model_version);

  try {
    auto sequence = fetcher.fetch(status.started_at_ms);
    const size_t micro_batch =
        std::max<size_t>(1, cfg->classifier.micro_batch_size);

    while (auto batch = sequence.next_batch()) {
      if (cancel_requested_) {
        status.outcome = RunOutcome::CANCELLED;
        break;
      }
      ++counts.batches;
      if (fetcher.cursor().bucket != batch->bucket)
        fetcher.advance_to_bucket(batch->bucket);
      counts.fetched += batch->records.size();

      const auto &records = batch->records;
      std::vector<RecordOutcome> outcomes(records.size());
      for (size_t begin = 0; begin < records.size(); begin += micro_batch) {
        if (cancel_requested_) {
          status.outcome = RunOutcome::CANCELLED;
          break;
        }
        const size_t end = std::min(records.size(), begin + micro_batch);

        // Existence is checked before inference so a record whose write
        // landed before a crash is neither scored nor written again.
        std::vector<size_t> pending;
        for (size_t i = begin; i < end; ++i) {
          if (writer.already_classified(batch->bucket, records[i], model_version))
            outcomes[i].already_classified = true;
          else
            pending.push_back(i);
        }

        classify_in_parallel(records, pending, outcomes, extractor, classifier,
                             retry, cfg->classifier.worker_count);

        // Single committer: results are written and the cursor advanced in
        // record order.
        for (size_t i = begin; i < end; ++i) {
          const AuditRecord &record = records[i];
          const RecordKey key = record_key(record);
          RecordOutcome &outcome = outcomes[i];

          if (outcome.already_classified) {
            ++counts.already_classified;
            metrics.records_already_classified.Increment();
          } else if (!outcome.prediction) {
            ++counts.skipped;
            metrics.records_skipped.Increment();
            LOG(LogLevel::WARN, LogComponent::ORCH_CLASSIFY,
                "Skipping record " << record.id << ": " << outcome.error);
            deps_.notifier.notify(Notification(
                NotificationKind::CLASSIFIER_ERROR, "record",
                "Record skipped by the classifier",
                {{"run_id", status.run_id},
                 {"bucket", batch->bucket},
                 {"record_id", record.id},
                 {"error", outcome.error},
                 {"model_version", model_version}}));
          } else {
            ClassificationResult result;
            result.record_id = record.id;
            result.label = outcome.prediction->label;
            result.confidence = outcome.prediction->confidence;
            result.model_version = model_version;
            result.feature_schema_version = classifier.feature_schema_version();
            result.classified_at_ms = deps_.clock();
            if (writer.write(batch->bucket, record, result))
              ++counts.written;
            ++counts.classified;
            metrics.records_classified.Increment();
          }
          fetcher.advance(batch->bucket, key);
        }
      }
      fetcher.checkpoint();
      if (status.outcome == RunOutcome::CANCELLED)
        break;
    }
    fetcher.checkpoint();
  } catch (const WafError &e) {
    status.outcome = RunOutcome::ABORTED;
    status.error = e.what();
    LOG(LogLevel::ERROR, LogComponent::ORCH_CLASSIFY,
        "Run " << status.run_id << " aborted: " << e.what());

    // Progress made before the failure is committed work; keep it.
    try {
      fetcher.checkpoint();
    } catch (const WafError &checkpoint_error) {
      LOG(LogLevel::ERROR, LogComponent::ORCH_CLASSIFY,
          "Cursor checkpoint after abort failed: " << checkpoint_error.what());
    }

    const char *stage = dynamic_cast<const SchemaMismatchError *>(&e) ? "schema"
                        : dynamic_cast<const InferenceError *>(&e)   ? "inference"
                        : dynamic_cast<const FetchError *>(&e)       ? "fetch"
                        : dynamic_cast<const StoreWriteError *>(&e)  ? "write"
                                                                     : "run";
    deps_.notifier.notify(Notification(
        NotificationKind::CLASSIFIER_ERROR, stage,
        "Classification run aborted", {{"run_id", status.run_id},
                                       {"stage", stage},
                                       {"error", e.what()},
                                       {"model_version", model_version}}));
  }

  // A cancel aimed at this run ends with it.
  cancel_requested_ = false;

  status.counts = {{"fetched", counts.fetched},
                   {"classified", counts.classified},
                   {"written", counts.written},
                   {"already_classified", counts.already_classified},
                   {"skipped", counts.skipped},
                   {"batches", counts.batches}};
  finish_run(status);
  LOG(LogLevel::INFO, LogComponent::ORCH_CLASSIFY,
      "Run " << status.run_id << " " << run_outcome_to_string(status.outcome)
             << ": " << counts.classified << " classified, "
             << counts.already_classified << " already classified, "
             << counts.skipped << " skipped of " << counts.fetched << " fetched");
  return status;
}

RunStatus Orchestrator::run_hardening_cycle() {
  RunStatus status;
  status.kind = RunKind::HARDENING;
  status.started_at_ms = deps_.clock();
  status.run_id = make_run_id(status.kind, status.started_at_ms);

  std::unique_lock<std::mutex> single_flight(hardening_mutex_, std::try_to_lock);
  if (!single_flight.owns_lock()) {
    status.outcome = RunOutcome::SKIPPED;
    status.error = "hardening cycle already in progress";
    LOG(LogLevel::INFO, LogComponent::ORCH_HARDEN,
        "Skipping " << status.run_id << ": " << status.error);
    finish_run(status);
    return status;
  }

  const auto cfg = config();
  if (!cfg->hardening.enabled) {
    status.outcome = RunOutcome::SKIPPED;
    status.error = "hardening disabled";
    finish_run(status);
    return status;
  }

  if (!deps_.classifier) {
    status.outcome = RunOutcome::ABORTED;
    status.error = "no classification model loaded";
    finish_run(status);
    return status;
  }

  const uint64_t now = status.started_at_ms;
  const uint64_t lookback_ms =
      static_cast<uint64_t>(cfg->hardening.lookback_hours) * 3600ULL * 1000ULL;
  const uint64_t window_start = now > lookback_ms ? now - lookback_ms : 0;

  std::map<std::string, int> known_rules;
  if (deps_.catalog)
    for (const auto &[id, level] : deps_.catalog->paranoia_levels())
      if (level >= cfg->hardening.min_paranoia_level)
        known_rules[id] = level;

  WindowStats stats;
  try {
    TrendAggregator aggregator(deps_.classified_store,
                               cfg->store.bucket_granularity,
                               make_retry_policy(*cfg));
    stats = aggregator.aggregate(window_start, now,
                                 deps_.classifier->model_version(), known_rules);
  } catch (const WafError &e) {
    status.outcome = RunOutcome::ABORTED;
    status.error = e.what();
    LOG(LogLevel::ERROR, LogComponent::ORCH_HARDEN,
        "Cycle " << status.run_id << " aborted during aggregation: " << e.what());
    deps_.notifier.notify(Notification(
        NotificationKind::HARDENING_CYCLE_FAILED, "aggregation",
        "Hardening cycle aborted", {{"run_id", status.run_id},
                                    {"stage", "aggregation"},
                                    {"error", e.what()}}));
    finish_run(status);
    return status;
  }

  const auto &notify_cfg = cfg->notification;
  const bool severity_exceeded =
      stats.total_records >= notify_cfg.min_records_for_severity &&
      stats.attack_percentage > notify_cfg.attack_threshold_percent;
  if (severity_exceeded) {
    LOG(LogLevel::WARN, LogComponent::ORCH_HARDEN,
        "Attack percentage " << stats.attack_percentage << "% over "
                             << stats.total_records << " records exceeds "
                             << notify_cfg.attack_threshold_percent << "%");
    deps_.notifier.notify(Notification(
        NotificationKind::SEVERITY_THRESHOLD_EXCEEDED, "attack_percentage",
        "Attack traffic above threshold",
        {{"total_records", stats.total_records},
         {"malicious_records", stats.malicious_records},
         {"attack_percentage", stats.attack_percentage},
         {"threshold_percent", notify_cfg.attack_threshold_percent},
         {"window_start", Utils::format_ms_as_iso8601(stats.window_start_ms)},
         {"window_end", Utils::format_ms_as_iso8601(stats.window_end_ms)}}));
  }

  RuleHardeningEngine engine(
      deps_.rule_store, HardeningPolicy::from_config(cfg->hardening),
      deps_.catalog,
      std::make_unique<RuleChangeLog>(cfg->hardening.change_log_path),
      cfg->hardening.custom_rules_output_path);
  CycleReport report = engine.run_cycle(stats, now);

  status.counts = {{"total_records", stats.total_records},
                   {"malicious_records", stats.malicious_records},
                   {"attack_percentage", stats.attack_percentage},
                   {"rules_evaluated", stats.rules.size()},
                   {"transitions", report.diffs.size()},
                   {"activated", report.activated.size()},
                   {"deactivated", report.deactivated.size()},
                   {"ruleset_version", report.to_version},
                   {"severity_exceeded", severity_exceeded},
                   {"cycle_outcome", cycle_outcome_to_string(report.outcome)}};

  switch (report.outcome) {
  case CycleOutcome::COMMITTED:
  case CycleOutcome::NO_CHANGE:
    status.outcome = RunOutcome::COMPLETED;
    break;
  case CycleOutcome::CONFLICT:
  case CycleOutcome::PERSISTENCE_FAILED:
    status.outcome = RunOutcome::ABORTED;
    status.error = report.error;
    deps_.notifier.notify(Notification(
        NotificationKind::HARDENING_CYCLE_FAILED,
        cycle_outcome_to_string(report.outcome), "Hardening cycle aborted",
        {{"run_id", status.run_id},
         {"stage", cycle_outcome_to_string(report.outcome)},
         {"error", report.error},
         {"expected_version", report.from_version}}));
    break;
  }

  if (report.outcome == CycleOutcome::COMMITTED && report.live_set_changed()) {
    nlohmann::json transitions = nlohmann::json::array();
    for (const auto &diff : report.diffs)
      transitions.push_back({{"rule_id", diff.rule_id},
                             {"from", lifecycle_to_string(diff.from)},
                             {"to", lifecycle_to_string(diff.to)},
                             {"supporting", stat_summary(diff.supporting)},
                             {"signature", diff.signature}});
    deps_.notifier.notify(Notification(
        NotificationKind::RULESET_CHANGED,
        "version " + std::to_string(report.to_version),
        "Hardened rule set changed",
        {{"version", report.to_version},
         {"activated", report.activated},
         {"deactivated", report.deactivated},
         {"transitions", transitions}}));
  }

  finish_run(status);
  return status;
}

RunStatus Orchestrator::rollback(uint64_t version) {
  RunStatus status;
  status.kind = RunKind::ROLLBACK;
  status.started_at_ms = deps_.clock();
  status.run_id = make_run_id(status.kind, status.started_at_ms);

  std::unique_lock<std::mutex> single_flight(hardening_mutex_, std::try_to_lock);
  if (!single_flight.owns_lock()) {
    status.outcome = RunOutcome::SKIPPED;
    status.error = "hardening cycle in progress";
    finish_run(status);
    return status;
  }

  const auto cfg = config();
  RuleHardeningEngine engine(
      deps_.rule_store, HardeningPolicy::from_config(cfg->hardening),
      deps_.catalog,
      std::make_unique<RuleChangeLog>(cfg->hardening.change_log_path),
      cfg->hardening.custom_rules_output_path);

  try {
    CycleReport report = engine.rollback(version, status.started_at_ms);
    status.counts = {{"rolled_back_version", version},
                     {"transitions", report.diffs.size()},
                     {"ruleset_version", report.to_version},
                     {"cycle_outcome", cycle_outcome_to_string(report.outcome)}};
    if (report.outcome == CycleOutcome::CONFLICT ||
        report.outcome == CycleOutcome::PERSISTENCE_FAILED) {
      status.outcome = RunOutcome::ABORTED;
      status.error = report.error;
    } else if (report.live_set_changed()) {
      deps_.notifier.notify(Notification(
          NotificationKind::RULESET_CHANGED,
          "version " + std::to_string(report.to_version),
          "Rule set rolled back",
          {{"version", report.to_version},
           {"rolled_back_version", version},
           {"activated", report.activated},
           {"deactivated", report.deactivated}}));
    }
  } catch (const WafError &e) {
    status.outcome = RunOutcome::ABORTED;
    status.error = e.what();
    LOG(LogLevel::ERROR, LogComponent::ORCH_HARDEN,
        "Rollback of version " << version << " failed: " << e.what());
  }

  finish_run(status);
  return status;
}

void Orchestrator::request_classification() {
  {
    std::lock_guard<std::mutex> lock(schedule_mutex_);
    classify_requested_ = true;
  }
  schedule_cv_.notify_all();
}

void Orchestrator::request_hardening() {
  {
    std::lock_guard<std::mutex> lock(schedule_mutex_);
    harden_requested_ = true;
  }
  schedule_cv_.notify_all();
}

void Orchestrator::start() {
  if (scheduler_thread_.joinable())
    return;
  {
    std::lock_guard<std::mutex> lock(schedule_mutex_);
    stop_requested_ = false;
  }
  cancel_requested_ = false;
  scheduler_thread_ = std::thread(&Orchestrator::scheduler_loop, this);
}

void Orchestrator::stop() {
  {
    std::lock_guard<std::mutex> lock(schedule_mutex_);
    stop_requested_ = true;
  }
  cancel_requested_ = true;
  schedule_cv_.notify_all();
  if (scheduler_thread_.joinable())
    scheduler_thread_.join();
}

void Orchestrator::scheduler_loop() {
  using clock = std::chrono::steady_clock;
  LOG(LogLevel::INFO, LogComponent::CORE, "Scheduler thread started.");

  auto cfg = config();
  const auto now = clock::now();
  auto next_classify =
      cfg->orchestrator.run_on_start
          ? now
          : now + std::chrono::seconds(cfg->orchestrator.classification_interval_seconds);
  auto next_harden =
      cfg->orchestrator.run_on_start
          ? now
          : now + std::chrono::seconds(cfg->orchestrator.hardening_interval_seconds);

  while (true) {
    bool do_classify = false;
    bool do_harden = false;
    {
      std::unique_lock<std::mutex> lock(schedule_mutex_);
      schedule_cv_.wait_until(lock, std::min(next_classify, next_harden), [&] {
        return stop_requested_ || classify_requested_ || harden_requested_ ||
               clock::now() >= std::min(next_classify, next_harden);
      });
      if (stop_requested_)
        break;
      const auto woke = clock::now();
      do_classify = classify_requested_ || woke >= next_classify;
      do_harden = harden_requested_ || woke >= next_harden;
      classify_requested_ = false;
      harden_requested_ = false;
    }

    cfg = config();
    if (do_classify) {
      run_classification();
      next_classify = clock::now() +
                      std::chrono::seconds(cfg->orchestrator.classification_interval_seconds);
    }
    if (do_harden) {
      run_hardening_cycle();
      next_harden = clock::now() +
                    std::chrono::seconds(cfg->orchestrator.hardening_interval_seconds);
    }
  }
  LOG(LogLevel::INFO, LogComponent::CORE, "Scheduler thread stopped.");
}
