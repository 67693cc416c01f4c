#include "core/config.hpp"
#include "core/logger.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

class ConfigTest : public ::testing::Test {
protected:
  void SetUp() override {
    test_dir = std::filesystem::temp_directory_path() /
               ("config_test_" + std::string(::testing::UnitTest::GetInstance()
                                                 ->current_test_info()
                                                 ->name()));
    std::filesystem::create_directories(test_dir);
  }

  void TearDown() override {
    if (std::filesystem::exists(test_dir)) {
      std::filesystem::remove_all(test_dir);
    }
  }

  std::string createTestConfigFile(const std::string &content) {
    auto config_path = test_dir / "test_config.ini";
    std::ofstream file(config_path);
    file << content;
    file.close();
    return config_path.string();
  }

  std::filesystem::path test_dir;
};

TEST_F(ConfigTest, DefaultsAreValid) {
  Config::AppConfig defaults;
  std::vector<std::string> errors;
  EXPECT_TRUE(Config::validate_app_config(defaults, errors));
  EXPECT_TRUE(errors.empty());

  EXPECT_EQ(defaults.store.bucket_granularity, Config::BucketGranularity::HOURLY);
  EXPECT_EQ(defaults.hardening.min_paranoia_level, 3);
  EXPECT_EQ(defaults.hardening.confirmation_cycles, 2u);
  EXPECT_DOUBLE_EQ(defaults.notification.attack_threshold_percent, 50.0);
}

TEST_F(ConfigTest, FullFileIsParsedIntoSections) {
  std::string config_content = R"(
# Global settings
cursor_state_path = /var/lib/waf/cursor.json
run_status_path = /var/lib/waf/runs.jsonl

[Store]
uri = mongodb://db.internal:27017
database = modsec
unclassified_prefix = raw_
classified_prefix = labelled_
bucket_granularity = daily
timestamp_field_name = ts
id_field_name = unique_id
page_size = 250

[Fetcher]
max_attempts = 5
base_delay_ms = 250
backoff_multiplier = 1.5
max_delay_ms = 4000
initial_lookback_buckets = 3
bucket_settle_seconds = 120

[Classifier]
model_path = /opt/models/waf.onnx
model_metadata_path = /opt/models/waf.json
decision_threshold = 0.65
worker_count = 8
micro_batch_size = 64

[Hardening]
enabled = yes
crs_rule_sources = /etc/crs/REQUEST-942-APPLICATION-ATTACK-SQLI.conf , /etc/crs/REQUEST-941-APPLICATION-ATTACK-XSS.conf
min_paranoia_level = 2
lookback_hours = 48
min_sample_count = 50
promotion_threshold = 0.95
demotion_threshold = 0.8
confirmation_cycles = 3
signing_key = s3cret

[Orchestrator]
classification_interval_seconds = 60
hardening_interval_seconds = 172800
run_on_start = false

[Notification]
file_enabled = on
file_path = /var/log/waf/notifications.jsonl
mail_enabled = true
mail_recipients = secops@example.org, oncall@example.org
attack_threshold_percent = 25
min_records_for_severity = 100
throttle_seconds = 0

[Monitoring]
web_server_enabled = true
web_server_port = 9200

[Logging]
default_level = DEBUG
io.* = ERROR

[Unknown]
anything = kept
)";

  Config::ConfigManager manager;
  ASSERT_TRUE(manager.load_configuration(createTestConfigFile(config_content)));
  auto config = manager.get_config();

  EXPECT_EQ(config->cursor_state_path, "/var/lib/waf/cursor.json");
  EXPECT_EQ(config->run_status_path, "/var/lib/waf/runs.jsonl");

  EXPECT_EQ(config->store.uri, "mongodb://db.internal:27017");
  EXPECT_EQ(config->store.database, "modsec");
  EXPECT_EQ(config->store.unclassified_prefix, "raw_");
  EXPECT_EQ(config->store.classified_prefix, "labelled_");
  EXPECT_EQ(config->store.bucket_granularity, Config::BucketGranularity::DAILY);
  EXPECT_EQ(config->store.timestamp_field_name, "ts");
  EXPECT_EQ(config->store.id_field_name, "unique_id");
  EXPECT_EQ(config->store.page_size, 250u);

  EXPECT_EQ(config->fetcher.max_attempts, 5u);
  EXPECT_EQ(config->fetcher.base_delay_ms, 250u);
  EXPECT_DOUBLE_EQ(config->fetcher.backoff_multiplier, 1.5);
  EXPECT_EQ(config->fetcher.max_delay_ms, 4000u);
  EXPECT_EQ(config->fetcher.initial_lookback_buckets, 3u);
  EXPECT_EQ(config->fetcher.bucket_settle_seconds, 120u);

  EXPECT_EQ(config->classifier.model_path, "/opt/models/waf.onnx");
  EXPECT_DOUBLE_EQ(config->classifier.decision_threshold, 0.65);
  EXPECT_EQ(config->classifier.worker_count, 8u);
  EXPECT_EQ(config->classifier.micro_batch_size, 64u);

  EXPECT_TRUE(config->hardening.enabled);
  ASSERT_EQ(config->hardening.crs_rule_sources.size(), 2u);
  EXPECT_EQ(config->hardening.crs_rule_sources[1],
            "/etc/crs/REQUEST-941-APPLICATION-ATTACK-XSS.conf");
  EXPECT_EQ(config->hardening.min_paranoia_level, 2);
  EXPECT_EQ(config->hardening.lookback_hours, 48u);
  EXPECT_EQ(config->hardening.min_sample_count, 50u);
  EXPECT_DOUBLE_EQ(config->hardening.promotion_threshold, 0.95);
  EXPECT_DOUBLE_EQ(config->hardening.demotion_threshold, 0.8);
  EXPECT_EQ(config->hardening.confirmation_cycles, 3u);
  EXPECT_EQ(config->hardening.signing_key, "s3cret");

  EXPECT_EQ(config->orchestrator.classification_interval_seconds, 60u);
  EXPECT_EQ(config->orchestrator.hardening_interval_seconds, 172800u);
  EXPECT_FALSE(config->orchestrator.run_on_start);

  EXPECT_TRUE(config->notification.mail_enabled);
  EXPECT_EQ(config->notification.mail_recipients,
            (std::vector<std::string>{"secops@example.org", "oncall@example.org"}));
  EXPECT_DOUBLE_EQ(config->notification.attack_threshold_percent, 25.0);
  EXPECT_EQ(config->notification.min_records_for_severity, 100u);
  EXPECT_EQ(config->notification.throttle_seconds, 0u);

  EXPECT_TRUE(config->monitoring.web_server_enabled);
  EXPECT_EQ(config->monitoring.web_server_port, 9200);

  EXPECT_EQ(config->logging.log_levels.at(LogComponent::CORE), LogLevel::DEBUG);
  EXPECT_EQ(config->logging.log_levels.at(LogComponent::IO_FETCHER),
            LogLevel::ERROR);
  EXPECT_EQ(config->logging.log_levels.at(LogComponent::IO_NOTIFY),
            LogLevel::ERROR);
  EXPECT_EQ(config->logging.log_levels.at(LogComponent::ML_INFERENCE),
            LogLevel::DEBUG);

  EXPECT_EQ(config->custom_settings.at("Unknown.anything"), "kept");
}

TEST_F(ConfigTest, MissingFileKeepsPreviousConfig) {
  Config::ConfigManager manager;
  auto before = manager.get_config();
  EXPECT_FALSE(manager.load_configuration((test_dir / "absent.ini").string()));
  EXPECT_EQ(manager.get_config(), before);
}

TEST_F(ConfigTest, MalformedLineFailsTheLoad) {
  Config::ConfigManager manager;
  EXPECT_FALSE(manager.load_configuration(createTestConfigFile(R"(
[Store]
database
)")));
  EXPECT_EQ(manager.get_config()->store.database, "waf");
}

TEST_F(ConfigTest, UnknownGranularityIsRejected) {
  Config::ConfigManager manager;
  EXPECT_FALSE(manager.load_configuration(createTestConfigFile(R"(
[Store]
bucket_granularity = weekly
)")));
}

TEST_F(ConfigTest, InvalidValuesKeepPreviousConfig) {
  Config::ConfigManager manager;
  ASSERT_TRUE(manager.load_configuration(createTestConfigFile(R"(
[Classifier]
decision_threshold = 0.7
)")));
  auto good = manager.get_config();

  EXPECT_FALSE(manager.load_configuration(createTestConfigFile(R"(
[Hardening]
promotion_threshold = 0.6
demotion_threshold = 0.8
)")));
  EXPECT_EQ(manager.get_config(), good);
  EXPECT_DOUBLE_EQ(manager.get_config()->classifier.decision_threshold, 0.7);
}

TEST_F(ConfigTest, NonNumericValueLeavesDefault) {
  Config::ConfigManager manager;
  ASSERT_TRUE(manager.load_configuration(createTestConfigFile(R"(
[Fetcher]
max_attempts = lots
)")));
  EXPECT_EQ(manager.get_config()->fetcher.max_attempts, 3u);
}

TEST(ConfigValidationTest, LogLevelNamesIgnoreCaseAndHighBitBytes) {
  EXPECT_EQ(Config::string_to_log_level(" debug "), LogLevel::DEBUG);
  EXPECT_EQ(Config::string_to_log_level("Warn"), LogLevel::WARN);
  EXPECT_EQ(Config::string_to_log_level("\xE9rror"), Config::string_to_log_level("bogus"));
}

TEST(ConfigValidationTest, ReportsEveryProblem) {
  Config::AppConfig config;
  config.store.classified_prefix = config.store.unclassified_prefix;
  config.classifier.decision_threshold = 1.5;
  config.hardening.min_paranoia_level = 7;
  config.notification.mail_enabled = true;

  std::vector<std::string> errors;
  EXPECT_FALSE(Config::validate_app_config(config, errors));
  EXPECT_EQ(errors.size(), 4u);
}

TEST(ConfigValidationTest, LookbackLongerThanHardeningIntervalIsRejected) {
  Config::AppConfig config;
  config.hardening.lookback_hours = 24;
  config.orchestrator.hardening_interval_seconds = 3600;

  std::vector<std::string> errors;
  EXPECT_FALSE(Config::validate_app_config(config, errors));
  ASSERT_EQ(errors.size(), 1u);

  errors.clear();
  config.hardening.lookback_hours = 1;
  EXPECT_TRUE(Config::validate_app_config(config, errors));

  errors.clear();
  config.hardening.lookback_hours = 24;
  config.hardening.enabled = false;
  EXPECT_TRUE(Config::validate_app_config(config, errors));
}

TEST(ConfigValidationTest, PlaceholderSigningKeyIsReported) {
  Config::AppConfig config;
  EXPECT_EQ(Config::collect_config_warnings(config).size(), 1u);
  config.hardening.signing_key = "change-me";
  EXPECT_EQ(Config::collect_config_warnings(config).size(), 1u);
  config.hardening.signing_key = "0f9c2e7a-rotated";
  EXPECT_TRUE(Config::collect_config_warnings(config).empty());
}

TEST(ConfigValidationTest, DisabledHardeningSkipsItsChecks) {
  Config::HardeningConfig hardening;
  hardening.enabled = false;
  hardening.min_paranoia_level = 0;
  std::vector<std::string> errors;
  EXPECT_TRUE(Config::validate_hardening_config(hardening, errors));
}

TEST(ConfigValidationTest, HttpNeedsWebhookUrl) {
  Config::NotificationConfig notification;
  notification.http_enabled = true;
  std::vector<std::string> errors;
  EXPECT_FALSE(Config::validate_notification_config(notification, errors));
  ASSERT_EQ(errors.size(), 1u);
}
