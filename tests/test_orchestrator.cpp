#include "analysis/trend_aggregator.hpp"
#include "core/orchestrator.hpp"
#include "io/store/bucket_naming.hpp"
#include "test_fakes.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <limits>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace {

const std::string kBucket = "2025.06.19.04";
const char *kSqliUri = "/search?q=1%20union%20select%20password%20from%20users";

} // namespace

class OrchestratorTest : public ::testing::Test {
protected:
  void SetUp() override {
    dir_ = std::filesystem::temp_directory_path() /
           (std::string("waf_orch_") +
            ::testing::UnitTest::GetInstance()->current_test_info()->name());
    std::filesystem::remove_all(dir_);
    std::filesystem::create_directories(dir_);

    auto config = std::make_shared<Config::AppConfig>();
    config->fetcher.initial_lookback_buckets = 0;
    config->fetcher.max_attempts = 3;
    config->classifier.worker_count = 2;
    config->classifier.micro_batch_size = 4;
    config->hardening.change_log_path = (dir_ / "changes.jsonl").string();
    config->hardening.custom_rules_output_path = (dir_ / "custom.conf").string();
    config->hardening.min_paranoia_level = 3;
    config->hardening.min_sample_count = 20;
    config->hardening.promotion_threshold = 0.9;
    config->hardening.demotion_threshold = 0.7;
    config->hardening.confirmation_cycles = 2;
    config->hardening.signing_key = "test-key";
    config->notification.min_records_for_severity = 10;
    config->notification.attack_threshold_percent = 50.0;
    config_ = config;

    auto dispatcher = std::make_unique<RecordingDispatcher>();
    dispatcher_ = dispatcher.get();
    std::vector<std::unique_ptr<INotificationDispatcher>> dispatchers;
    dispatchers.push_back(std::move(dispatcher));
    notifier_ = std::make_unique<Notifier>(std::move(dispatchers), 0);

    model_ = std::make_shared<FakeModel>();
    now_ms_ = kBaseTimeMs + 30 * 60 * 1000;
  }

  void TearDown() override { std::filesystem::remove_all(dir_); }

  std::unique_ptr<Orchestrator> make_orchestrator() {
    classifier_ = std::make_shared<const Classifier>(model_, 0.5);
    PipelineDependencies deps{audit_store_, audit_store_, cursor_store_,
                              rule_store_,  classifier_,  nullptr,
                              *notifier_,   nullptr,      [this] { return now_ms_; },
                              [](std::chrono::milliseconds) {}};
    return std::make_unique<Orchestrator>(config_, deps);
  }

  void seed_unclassified(int count) {
    for (int i = 0; i < count; ++i) {
      const bool attack = i % 2 == 0;
      audit_store_.add_unclassified(
          kBucket, make_record("tx-" + std::to_string(i), kBaseTimeMs + i * 1000,
                               {{"942100", 1}}, attack ? kSqliUri : "/index.html"));
    }
  }

  // 48 of 50 triggers of PL3 rule 942110 on malicious traffic.
  void seed_precise_rule_traffic(const std::string &prefix, uint64_t from_ms) {
    for (int i = 0; i < 50; ++i) {
      auto record = make_record(prefix + "-" + std::to_string(i), from_ms + i * 100,
                                {{"942110", 3}});
      audit_store_.add_classified(bucket_for_timestamp(record.timestamp_ms,
                                                       Config::BucketGranularity::HOURLY),
                                  record, i < 48 ? Label::MALICIOUS : Label::BENIGN,
                                  "test-model-1");
    }
  }

  std::shared_ptr<Config::AppConfig> mutable_config() {
    auto copy = std::make_shared<Config::AppConfig>(*config_);
    config_ = copy;
    return copy;
  }

  std::filesystem::path dir_;
  std::shared_ptr<const Config::AppConfig> config_;
  InMemoryAuditStore audit_store_;
  InMemoryCursorStore cursor_store_;
  InMemoryRuleSetStore rule_store_;
  RecordingDispatcher *dispatcher_ = nullptr;
  std::unique_ptr<Notifier> notifier_;
  std::shared_ptr<FakeModel> model_;
  std::shared_ptr<const Classifier> classifier_;
  uint64_t now_ms_ = 0;
};

TEST_F(OrchestratorTest, ClassifiesEveryFetchedRecordAndAdvancesCursor) {
  seed_unclassified(10);
  auto orchestrator = make_orchestrator();

  RunStatus status = orchestrator->run_classification();

  EXPECT_EQ(status.outcome, RunOutcome::COMPLETED);
  EXPECT_EQ(status.counts["fetched"], 10);
  EXPECT_EQ(status.counts["classified"], 10);
  EXPECT_EQ(audit_store_.classified_count(), 10u);

  auto attack = audit_store_.classified("tx-0", "test-model-1");
  ASSERT_TRUE(attack.has_value());
  EXPECT_EQ(attack->result.label, Label::MALICIOUS);
  EXPECT_EQ(attack->result.feature_schema_version, FEATURE_SCHEMA_VERSION);
  auto benign = audit_store_.classified("tx-1", "test-model-1");
  ASSERT_TRUE(benign.has_value());
  EXPECT_EQ(benign->result.label, Label::BENIGN);

  ASSERT_TRUE(cursor_store_.state.has_value());
  EXPECT_EQ(cursor_store_.state->bucket, kBucket);
  ASSERT_TRUE(cursor_store_.state->last.has_value());
  EXPECT_EQ(cursor_store_.state->last->id, "tx-9");
}

TEST_F(OrchestratorTest, SecondRunOverSameDataWritesNothing) {
  seed_unclassified(6);
  auto orchestrator = make_orchestrator();
  ASSERT_EQ(orchestrator->run_classification().outcome, RunOutcome::COMPLETED);
  const int upserts = audit_store_.upsert_calls;

  RunStatus second = orchestrator->run_classification();
  EXPECT_EQ(second.outcome, RunOutcome::COMPLETED);
  EXPECT_EQ(second.counts["fetched"], 0);
  EXPECT_EQ(audit_store_.upsert_calls, upserts);
  EXPECT_EQ(audit_store_.classified_count(), 6u);
}

TEST_F(OrchestratorTest, ReplayFromLostCursorSkipsAlreadyClassifiedRecords) {
  seed_unclassified(6);
  auto orchestrator = make_orchestrator();
  ASSERT_EQ(orchestrator->run_classification().outcome, RunOutcome::COMPLETED);
  const int upserts = audit_store_.upsert_calls;
  const int predictions = model_->predict_calls;

  cursor_store_.state.reset();
  RunStatus replay = orchestrator->run_classification();

  EXPECT_EQ(replay.outcome, RunOutcome::COMPLETED);
  EXPECT_EQ(replay.counts["fetched"], 6);
  EXPECT_EQ(replay.counts["already_classified"], 6);
  EXPECT_EQ(replay.counts["classified"], 0);
  EXPECT_EQ(audit_store_.upsert_calls, upserts);
  EXPECT_EQ(model_->predict_calls, predictions);
  EXPECT_EQ(audit_store_.classified_count(), 6u);
}

TEST_F(OrchestratorTest, CrashBeforeCursorSaveDoesNotDuplicateOnRestart) {
  seed_unclassified(5);
  cursor_store_.fail_saves = true;
  auto orchestrator = make_orchestrator();

  RunStatus crashed = orchestrator->run_classification();
  EXPECT_EQ(crashed.outcome, RunOutcome::ABORTED);
  EXPECT_EQ(audit_store_.classified_count(), 5u);
  EXPECT_FALSE(cursor_store_.state.has_value());
  const int upserts = audit_store_.upsert_calls;
  const int predictions = model_->predict_calls;

  cursor_store_.fail_saves = false;
  RunStatus restarted = orchestrator->run_classification();

  EXPECT_EQ(restarted.outcome, RunOutcome::COMPLETED);
  EXPECT_EQ(restarted.counts["already_classified"], 5);
  EXPECT_EQ(audit_store_.upsert_calls, upserts);
  EXPECT_EQ(model_->predict_calls, predictions);
  EXPECT_EQ(audit_store_.classified_count(), 5u);
  ASSERT_TRUE(cursor_store_.state.has_value());
  EXPECT_EQ(cursor_store_.state->last->id, "tx-4");
}

TEST_F(OrchestratorTest, FetchFailureAtRetryCeilingAbortsWithoutMovingCursor) {
  seed_unclassified(3);
  audit_store_.failing_fetches = 3;
  auto orchestrator = make_orchestrator();

  RunStatus status = orchestrator->run_classification();

  EXPECT_EQ(status.outcome, RunOutcome::ABORTED);
  EXPECT_EQ(audit_store_.fetch_calls, 3);
  EXPECT_EQ(dispatcher_->count(NotificationKind::CLASSIFIER_ERROR), 1u);
  EXPECT_EQ(dispatcher_->received.front().subject, "fetch");
  EXPECT_FALSE(cursor_store_.state.has_value());
  EXPECT_EQ(cursor_store_.save_calls, 0);
  EXPECT_EQ(audit_store_.classified_count(), 0u);
}

TEST_F(OrchestratorTest, FetchRecoversWithinRetryCeiling) {
  seed_unclassified(3);
  audit_store_.failing_fetches = 2;
  auto orchestrator = make_orchestrator();

  RunStatus status = orchestrator->run_classification();

  EXPECT_EQ(status.outcome, RunOutcome::COMPLETED);
  EXPECT_EQ(audit_store_.classified_count(), 3u);
  EXPECT_EQ(dispatcher_->count(NotificationKind::CLASSIFIER_ERROR), 0u);
}

TEST_F(OrchestratorTest, SchemaMismatchIsFatalToTheRun) {
  seed_unclassified(4);
  model_ = std::make_shared<FakeModel>("test-model-2", FEATURE_SCHEMA_VERSION + 1);
  auto orchestrator = make_orchestrator();

  RunStatus status = orchestrator->run_classification();

  EXPECT_EQ(status.outcome, RunOutcome::ABORTED);
  EXPECT_EQ(audit_store_.classified_count(), 0u);
  ASSERT_EQ(dispatcher_->count(NotificationKind::CLASSIFIER_ERROR), 1u);
  EXPECT_EQ(dispatcher_->received.front().subject, "schema");
  EXPECT_EQ(model_->predict_calls, 0);
}

TEST_F(OrchestratorTest, InferenceFailureAtRetryCeilingAbortsBeforeTheRecord) {
  seed_unclassified(4);
  model_->throw_on_predict = true;
  auto orchestrator = make_orchestrator();

  RunStatus status = orchestrator->run_classification();

  EXPECT_EQ(status.outcome, RunOutcome::ABORTED);
  EXPECT_EQ(status.counts["skipped"], 0);
  EXPECT_EQ(audit_store_.classified_count(), 0u);
  EXPECT_GE(model_->predict_calls, 3);
  EXPECT_TRUE(!cursor_store_.state.has_value() || !cursor_store_.state->last.has_value());
  ASSERT_EQ(dispatcher_->count(NotificationKind::CLASSIFIER_ERROR), 1u);
  EXPECT_EQ(dispatcher_->received.front().subject, "inference");

  model_->throw_on_predict = false;
  RunStatus retried = orchestrator->run_classification();
  EXPECT_EQ(retried.outcome, RunOutcome::COMPLETED);
  EXPECT_EQ(audit_store_.classified_count(), 4u);
}

TEST_F(OrchestratorTest, InferenceRecoversWithinRetryCeiling) {
  seed_unclassified(4);
  mutable_config()->classifier.worker_count = 1;
  model_->failing_predicts = 2;
  auto orchestrator = make_orchestrator();

  RunStatus status = orchestrator->run_classification();

  EXPECT_EQ(status.outcome, RunOutcome::COMPLETED);
  EXPECT_EQ(status.counts["classified"], 4);
  EXPECT_EQ(status.counts["skipped"], 0);
  EXPECT_EQ(dispatcher_->count(NotificationKind::CLASSIFIER_ERROR), 0u);
}

TEST_F(OrchestratorTest, NonFiniteScoreSkipsTheRecordAndNotifies) {
  seed_unclassified(4);
  model_->scorer = [](const std::vector<double> &features) {
    const size_t sqli = static_cast<size_t>(Feature::SQLI_PATTERN_HITS);
    return features.at(sqli) > 0 ? std::numeric_limits<double>::quiet_NaN() : 0.03;
  };
  auto orchestrator = make_orchestrator();

  RunStatus status = orchestrator->run_classification();

  EXPECT_EQ(status.outcome, RunOutcome::COMPLETED);
  EXPECT_EQ(status.counts["skipped"], 2);
  EXPECT_EQ(status.counts["classified"], 2);
  ASSERT_EQ(dispatcher_->count(NotificationKind::CLASSIFIER_ERROR), 2u);
  EXPECT_EQ(dispatcher_->received.front().subject, "record");
  EXPECT_EQ(dispatcher_->received.front().details["record_id"], "tx-0");
  ASSERT_TRUE(cursor_store_.state.has_value());
  EXPECT_EQ(cursor_store_.state->last->id, "tx-3");
}

TEST_F(OrchestratorTest, CancelStopsAtMicroBatchBoundaryAndKeepsCommittedWork) {
  seed_unclassified(10);
  auto orchestrator = make_orchestrator();
  Orchestrator *running = orchestrator.get();
  model_->scorer = [running](const std::vector<double> &) {
    running->request_cancel();
    return 0.03;
  };

  RunStatus cancelled = orchestrator->run_classification();

  EXPECT_EQ(cancelled.outcome, RunOutcome::CANCELLED);
  EXPECT_EQ(cancelled.counts["classified"], 4);
  ASSERT_TRUE(cursor_store_.state.has_value());
  EXPECT_EQ(cursor_store_.state->last->id, "tx-3");

  model_->scorer = nullptr;
  RunStatus resumed = orchestrator->run_classification();

  EXPECT_EQ(resumed.outcome, RunOutcome::COMPLETED);
  EXPECT_EQ(resumed.counts["classified"], 6);
  EXPECT_EQ(audit_store_.classified_count(), 10u);
  EXPECT_EQ(cursor_store_.state->last->id, "tx-9");
}

TEST_F(OrchestratorTest, CancelRequestedBeforeTheRunIsHonoured) {
  seed_unclassified(3);
  auto orchestrator = make_orchestrator();

  orchestrator->request_cancel();
  RunStatus status = orchestrator->run_classification();

  EXPECT_EQ(status.outcome, RunOutcome::CANCELLED);
  EXPECT_EQ(audit_store_.classified_count(), 0u);
  EXPECT_EQ(orchestrator->run_classification().outcome, RunOutcome::COMPLETED);
}

TEST_F(OrchestratorTest, OverlappingClassificationRunIsSkipped) {
  seed_unclassified(2);
  auto orchestrator = make_orchestrator();
  Orchestrator *running = orchestrator.get();
  std::mutex overlap_mutex;
  std::vector<RunOutcome> overlapping;
  model_->scorer = [&, running](const std::vector<double> &) {
    std::thread other([&] {
      RunOutcome outcome = running->run_classification().outcome;
      std::lock_guard<std::mutex> lock(overlap_mutex);
      overlapping.push_back(outcome);
    });
    other.join();
    return 0.03;
  };

  RunStatus status = orchestrator->run_classification();

  EXPECT_EQ(status.outcome, RunOutcome::COMPLETED);
  ASSERT_EQ(overlapping.size(), 2u);
  EXPECT_EQ(overlapping[0], RunOutcome::SKIPPED);
  EXPECT_EQ(overlapping[1], RunOutcome::SKIPPED);
  EXPECT_EQ(audit_store_.classified_count(), 2u);
}

TEST_F(OrchestratorTest, MaliciousRecordRaisesRuleCountsInNextAggregation) {
  model_->scorer = [](const std::vector<double> &) { return 0.93; };
  AuditRecord record = make_record("tx-sqli", kBaseTimeMs + 5000,
                                   {{"942100", 1}, {"930100", 1}}, kSqliUri);
  record.triggered_rules[0].anomaly_score = 10.0;
  audit_store_.add_unclassified(kBucket, record);
  auto orchestrator = make_orchestrator();

  RetryPolicy retry;
  retry.sleeper = [](std::chrono::milliseconds) {};
  TrendAggregator aggregator(audit_store_, Config::BucketGranularity::HOURLY, retry);
  auto before = aggregator.aggregate(kBaseTimeMs, now_ms_, "test-model-1");
  EXPECT_TRUE(before.rules.empty());

  ASSERT_EQ(orchestrator->run_classification().outcome, RunOutcome::COMPLETED);

  auto stored = audit_store_.classified("tx-sqli", "test-model-1");
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->result.label, Label::MALICIOUS);
  EXPECT_DOUBLE_EQ(stored->result.confidence, 0.93);

  auto after = aggregator.aggregate(kBaseTimeMs, now_ms_, "test-model-1");
  ASSERT_EQ(after.rules.size(), 2u);
  EXPECT_EQ(after.rules[0].rule_id, "930100");
  EXPECT_EQ(after.rules[0].malicious_count, 1u);
  EXPECT_EQ(after.rules[1].rule_id, "942100");
  EXPECT_EQ(after.rules[1].malicious_count, 1u);
}

TEST_F(OrchestratorTest, ConsistentlyPreciseRuleIsActivatedAfterTwoCycles) {
  mutable_config()->hardening.lookback_hours = 1;
  seed_precise_rule_traffic("h0", kBaseTimeMs);
  auto orchestrator = make_orchestrator();

  RunStatus first = orchestrator->run_hardening_cycle();
  EXPECT_EQ(first.outcome, RunOutcome::COMPLETED);
  EXPECT_EQ(rule_store_.state.rules.at("942110").state, RuleLifecycle::CANDIDATE);
  EXPECT_EQ(dispatcher_->count(NotificationKind::RULESET_CHANGED), 0u);

  now_ms_ += kHourMs;
  seed_precise_rule_traffic("h1", kBaseTimeMs + 45 * 60 * 1000);
  RunStatus second = orchestrator->run_hardening_cycle();
  EXPECT_EQ(second.outcome, RunOutcome::COMPLETED);
  EXPECT_EQ(rule_store_.state.rules.at("942110").state, RuleLifecycle::ACTIVE);
  EXPECT_EQ(rule_store_.state.version, 2u);
  EXPECT_EQ(dispatcher_->count(NotificationKind::RULESET_CHANGED), 1u);

  // Nothing moves on a third cycle with the same evidence.
  now_ms_ += kHourMs;
  seed_precise_rule_traffic("h2", kBaseTimeMs + 100 * 60 * 1000);
  orchestrator->run_hardening_cycle();
  EXPECT_EQ(rule_store_.state.version, 2u);
  EXPECT_EQ(dispatcher_->count(NotificationKind::RULESET_CHANGED), 1u);
}

TEST_F(OrchestratorTest, SingleBurstIsNotConfirmedByTheNextWindow) {
  mutable_config()->hardening.lookback_hours = 1;
  seed_precise_rule_traffic("burst", kBaseTimeMs);
  auto orchestrator = make_orchestrator();

  orchestrator->run_hardening_cycle();
  ASSERT_EQ(rule_store_.state.rules.at("942110").state, RuleLifecycle::CANDIDATE);

  now_ms_ += kHourMs;
  RunStatus second = orchestrator->run_hardening_cycle();

  EXPECT_EQ(second.outcome, RunOutcome::COMPLETED);
  EXPECT_EQ(rule_store_.state.rules.at("942110").state, RuleLifecycle::INACTIVE);
  EXPECT_EQ(dispatcher_->count(NotificationKind::RULESET_CHANGED), 0u);
}

TEST_F(OrchestratorTest, AttackPercentageAboveThresholdNotifies) {
  for (int i = 0; i < 12; ++i) {
    auto record = make_record("s-" + std::to_string(i), kBaseTimeMs + i * 100);
    audit_store_.add_classified(kBucket, record,
                                i < 8 ? Label::MALICIOUS : Label::BENIGN,
                                "test-model-1");
  }
  auto orchestrator = make_orchestrator();

  RunStatus status = orchestrator->run_hardening_cycle();

  EXPECT_EQ(status.outcome, RunOutcome::COMPLETED);
  EXPECT_TRUE(status.counts["severity_exceeded"].get<bool>());
  EXPECT_EQ(dispatcher_->count(NotificationKind::SEVERITY_THRESHOLD_EXCEEDED), 1u);
}

TEST_F(OrchestratorTest, SmallWindowNeverTriggersSeverity) {
  for (int i = 0; i < 5; ++i) {
    auto record = make_record("s-" + std::to_string(i), kBaseTimeMs + i * 100);
    audit_store_.add_classified(kBucket, record, Label::MALICIOUS, "test-model-1");
  }
  auto orchestrator = make_orchestrator();

  orchestrator->run_hardening_cycle();

  EXPECT_EQ(dispatcher_->count(NotificationKind::SEVERITY_THRESHOLD_EXCEEDED), 0u);
}

TEST_F(OrchestratorTest, ConcurrentRuleChangeAbortsCycle) {
  for (int i = 0; i < 30; ++i) {
    auto record = make_record("c-" + std::to_string(i), kBaseTimeMs + i * 100,
                              {{"942110", 3}});
    audit_store_.add_classified(kBucket, record, Label::MALICIOUS, "test-model-1");
  }
  rule_store_.before_write = [](InMemoryRuleSetStore &store) {
    store.state.version += 1;
  };
  auto orchestrator = make_orchestrator();

  RunStatus status = orchestrator->run_hardening_cycle();

  EXPECT_EQ(status.outcome, RunOutcome::ABORTED);
  EXPECT_TRUE(rule_store_.state.rules.empty());
  EXPECT_EQ(dispatcher_->count(NotificationKind::HARDENING_CYCLE_FAILED), 1u);
}

TEST_F(OrchestratorTest, OverlappingHardeningCycleAndRollbackAreSkipped) {
  for (int i = 0; i < 30; ++i) {
    auto record = make_record("o-" + std::to_string(i), kBaseTimeMs + i * 100,
                              {{"942110", 3}});
    audit_store_.add_classified(kBucket, record, Label::MALICIOUS, "test-model-1");
  }
  auto orchestrator = make_orchestrator();
  Orchestrator *running = orchestrator.get();
  std::optional<RunStatus> overlapping_cycle;
  std::optional<RunStatus> overlapping_rollback;
  rule_store_.before_write = [&, running](InMemoryRuleSetStore &) {
    if (overlapping_cycle)
      return;
    std::thread other([&] {
      overlapping_cycle = running->run_hardening_cycle();
      overlapping_rollback = running->rollback(0);
    });
    other.join();
  };

  RunStatus status = orchestrator->run_hardening_cycle();

  EXPECT_EQ(status.outcome, RunOutcome::COMPLETED);
  ASSERT_TRUE(overlapping_cycle.has_value());
  EXPECT_EQ(overlapping_cycle->outcome, RunOutcome::SKIPPED);
  ASSERT_TRUE(overlapping_rollback.has_value());
  EXPECT_EQ(overlapping_rollback->outcome, RunOutcome::SKIPPED);
  EXPECT_EQ(rule_store_.write_calls, 1);
  EXPECT_EQ(rule_store_.state.version, 1u);
}

TEST_F(OrchestratorTest, AggregationFailureAbortsCycle) {
  audit_store_.failing_scans = 10;
  auto orchestrator = make_orchestrator();

  RunStatus status = orchestrator->run_hardening_cycle();

  EXPECT_EQ(status.outcome, RunOutcome::ABORTED);
  EXPECT_EQ(rule_store_.write_calls, 0);
  ASSERT_EQ(dispatcher_->count(NotificationKind::HARDENING_CYCLE_FAILED), 1u);
  EXPECT_EQ(dispatcher_->received.front().subject, "aggregation");
}

TEST_F(OrchestratorTest, DisabledHardeningIsSkipped) {
  mutable_config()->hardening.enabled = false;
  auto orchestrator = make_orchestrator();

  RunStatus status = orchestrator->run_hardening_cycle();

  EXPECT_EQ(status.outcome, RunOutcome::SKIPPED);
  EXPECT_EQ(audit_store_.scan_calls, 0);
}

TEST_F(OrchestratorTest, RollbackRevertsCommittedActivation) {
  for (int i = 0; i < 50; ++i) {
    auto record = make_record("r-" + std::to_string(i), kBaseTimeMs + i * 100,
                              {{"942110", 3}});
    audit_store_.add_classified(kBucket, record, Label::MALICIOUS, "test-model-1");
  }
  auto orchestrator = make_orchestrator();
  orchestrator->run_hardening_cycle();
  orchestrator->run_hardening_cycle();
  ASSERT_EQ(rule_store_.state.rules.at("942110").state, RuleLifecycle::ACTIVE);

  RunStatus status = orchestrator->rollback(2);

  EXPECT_EQ(status.outcome, RunOutcome::COMPLETED);
  EXPECT_EQ(rule_store_.state.version, 3u);
  EXPECT_EQ(rule_store_.state.rules.at("942110").state, RuleLifecycle::CANDIDATE);
  EXPECT_EQ(dispatcher_->count(NotificationKind::RULESET_CHANGED), 2u);
}

TEST_F(OrchestratorTest, ScheduledRunHonoursRunOnStart) {
  seed_unclassified(2);
  auto config = mutable_config();
  config->hardening.enabled = false;
  config->orchestrator.run_on_start = true;
  auto orchestrator = make_orchestrator();

  orchestrator->start();
  for (int i = 0; i < 200 && audit_store_.classified_count() < 2; ++i)
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  orchestrator->stop();

  EXPECT_EQ(audit_store_.classified_count(), 2u);
}
