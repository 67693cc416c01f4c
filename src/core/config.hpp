#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

enum class LogLevel;
enum class LogComponent;

namespace Config {

namespace Keys {

// General Settings
constexpr const char *CURSOR_STATE_PATH = "cursor_state_path";
constexpr const char *RUN_STATUS_PATH = "run_status_path";

// Store Settings
constexpr const char *ST_URI = "uri";
constexpr const char *ST_DATABASE = "database";
constexpr const char *ST_UNCLASSIFIED_PREFIX = "unclassified_prefix";
constexpr const char *ST_CLASSIFIED_PREFIX = "classified_prefix";
constexpr const char *ST_BUCKET_GRANULARITY = "bucket_granularity";
constexpr const char *ST_TIMESTAMP_FIELD_NAME = "timestamp_field_name";
constexpr const char *ST_ID_FIELD_NAME = "id_field_name";
constexpr const char *ST_OPERATION_TIMEOUT_MS = "operation_timeout_ms";
constexpr const char *ST_PAGE_SIZE = "page_size";

// Fetcher Settings
constexpr const char *FE_MAX_ATTEMPTS = "max_attempts";
constexpr const char *FE_BASE_DELAY_MS = "base_delay_ms";
constexpr const char *FE_BACKOFF_MULTIPLIER = "backoff_multiplier";
constexpr const char *FE_MAX_DELAY_MS = "max_delay_ms";
constexpr const char *FE_INITIAL_LOOKBACK_BUCKETS = "initial_lookback_buckets";
constexpr const char *FE_BUCKET_SETTLE_SECONDS = "bucket_settle_seconds";

// Classifier Settings
constexpr const char *CL_MODEL_PATH = "model_path";
constexpr const char *CL_MODEL_METADATA_PATH = "model_metadata_path";
constexpr const char *CL_DECISION_THRESHOLD = "decision_threshold";
constexpr const char *CL_WORKER_COUNT = "worker_count";
constexpr const char *CL_MICRO_BATCH_SIZE = "micro_batch_size";

// Hardening Settings
constexpr const char *HA_ENABLED = "enabled";
constexpr const char *HA_RULE_STATE_PATH = "rule_state_path";
constexpr const char *HA_CHANGE_LOG_PATH = "change_log_path";
constexpr const char *HA_CUSTOM_RULES_OUTPUT_PATH = "custom_rules_output_path";
constexpr const char *HA_CRS_RULE_SOURCES = "crs_rule_sources";
constexpr const char *HA_MIN_PARANOIA_LEVEL = "min_paranoia_level";
constexpr const char *HA_LOOKBACK_HOURS = "lookback_hours";
constexpr const char *HA_MIN_SAMPLE_COUNT = "min_sample_count";
constexpr const char *HA_PROMOTION_THRESHOLD = "promotion_threshold";
constexpr const char *HA_DEMOTION_THRESHOLD = "demotion_threshold";
constexpr const char *HA_CONFIRMATION_CYCLES = "confirmation_cycles";
constexpr const char *HA_SIGNING_KEY = "signing_key";

// Orchestrator Settings
constexpr const char *OR_CLASSIFICATION_INTERVAL_SECONDS =
    "classification_interval_seconds";
constexpr const char *OR_HARDENING_INTERVAL_SECONDS =
    "hardening_interval_seconds";
constexpr const char *OR_RUN_ON_START = "run_on_start";

// Notification Settings
constexpr const char *NO_FILE_ENABLED = "file_enabled";
constexpr const char *NO_FILE_PATH = "file_path";
constexpr const char *NO_SYSLOG_ENABLED = "syslog_enabled";
constexpr const char *NO_HTTP_ENABLED = "http_enabled";
constexpr const char *NO_HTTP_WEBHOOK_URL = "http_webhook_url";
constexpr const char *NO_MAIL_ENABLED = "mail_enabled";
constexpr const char *NO_MAIL_COMMAND = "mail_command";
constexpr const char *NO_MAIL_FROM = "mail_from";
constexpr const char *NO_MAIL_RECIPIENTS = "mail_recipients";
constexpr const char *NO_TRANSPORT_TIMEOUT_SECONDS =
    "transport_timeout_seconds";
constexpr const char *NO_ATTACK_THRESHOLD_PERCENT = "attack_threshold_percent";
constexpr const char *NO_MIN_RECORDS_FOR_SEVERITY = "min_records_for_severity";
constexpr const char *NO_THROTTLE_SECONDS = "throttle_seconds";

// Monitoring Settings
constexpr const char *MO_WEB_SERVER_ENABLED = "web_server_enabled";
constexpr const char *MO_WEB_SERVER_HOST = "web_server_host";
constexpr const char *MO_WEB_SERVER_PORT = "web_server_port";

// Logging Settings
constexpr const char *LOGGING_DEFAULT_LEVEL = "default_level";
} // namespace Keys

struct LoggingConfig {
  std::map<LogComponent, LogLevel> log_levels;
};

enum class BucketGranularity { HOURLY, DAILY };

struct StoreConfig {
  std::string uri = "mongodb://localhost:27017/?serverSelectionTimeoutMS=5000"
                    "&socketTimeoutMS=10000";
  std::string database = "waf";
  std::string unclassified_prefix = "unclassified_";
  std::string classified_prefix = "classified_";
  BucketGranularity bucket_granularity = BucketGranularity::HOURLY;
  std::string timestamp_field_name = "timestamp";
  std::string id_field_name = "transaction_id";
  uint32_t operation_timeout_ms = 10000;
  uint32_t page_size = 500;
};

struct FetcherConfig {
  uint32_t max_attempts = 3;
  uint32_t base_delay_ms = 500;
  double backoff_multiplier = 2.0;
  uint32_t max_delay_ms = 30000;
  uint32_t initial_lookback_buckets = 24;
  uint32_t bucket_settle_seconds = 0;
};

struct ClassifierConfig {
  std::string model_path = "models/waf_classifier.onnx";
  std::string model_metadata_path = "models/waf_classifier.json";
  double decision_threshold = 0.5;
  uint32_t worker_count = 4;
  uint32_t micro_batch_size = 200;
};

struct HardeningConfig {
  bool enabled = true;
  std::string rule_state_path = "data/rule_state.json";
  std::string change_log_path = "data/rule_changes.jsonl";
  std::string custom_rules_output_path = "data/custom_rules.conf";
  std::vector<std::string> crs_rule_sources;
  int min_paranoia_level = 3;
  uint32_t lookback_hours = 24;
  uint64_t min_sample_count = 20;
  double promotion_threshold = 0.9;
  double demotion_threshold = 0.7;
  uint32_t confirmation_cycles = 2;
  std::string signing_key;
};

struct OrchestratorConfig {
  uint32_t classification_interval_seconds = 300;
  uint32_t hardening_interval_seconds = 86400;
  bool run_on_start = true;
};

struct NotificationConfig {
  bool file_enabled = true;
  std::string file_path = "data/notifications.jsonl";
  bool syslog_enabled = false;
  bool http_enabled = false;
  std::string http_webhook_url;
  bool mail_enabled = false;
  std::string mail_command = "/usr/sbin/sendmail -t";
  std::string mail_from = "waf-hardener@localhost";
  std::vector<std::string> mail_recipients;
  uint32_t transport_timeout_seconds = 10;
  double attack_threshold_percent = 50.0;
  uint64_t min_records_for_severity = 10;
  uint32_t throttle_seconds = 900;
};

struct MonitoringConfig {
  bool web_server_enabled = false;
  std::string web_server_host = "127.0.0.1";
  int web_server_port = 9095;
};

struct AppConfig {
  std::string cursor_state_path = "data/cursor_state.json";
  std::string run_status_path = "data/run_status.jsonl";

  StoreConfig store;
  FetcherConfig fetcher;
  ClassifierConfig classifier;
  HardeningConfig hardening;
  OrchestratorConfig orchestrator;
  NotificationConfig notification;
  MonitoringConfig monitoring;
  LoggingConfig logging;

  std::unordered_map<std::string, std::string> custom_settings;

  AppConfig() = default;
};

// Validation functions for configuration parameters
bool validate_store_config(const StoreConfig &config,
                           std::vector<std::string> &errors);
bool validate_fetcher_config(const FetcherConfig &config,
                             std::vector<std::string> &errors);
bool validate_classifier_config(const ClassifierConfig &config,
                                std::vector<std::string> &errors);
bool validate_hardening_config(const HardeningConfig &config,
                               std::vector<std::string> &errors);
bool validate_notification_config(const NotificationConfig &config,
                                  std::vector<std::string> &errors);
bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors);

// Settings that load but should not reach production.
std::vector<std::string> collect_config_warnings(const AppConfig &config);

LogLevel string_to_log_level(const std::string &level_str_raw);

std::string granularity_to_string(BucketGranularity granularity);

class ConfigManager {
public:
  ConfigManager() = default;
  bool load_configuration(const std::string &filepath);
  std::shared_ptr<const AppConfig> get_config() const;

private:
  std::string config_filepath_;
  std::shared_ptr<const AppConfig> current_config_ =
      std::make_shared<AppConfig>();
  mutable std::mutex config_mutex_;
};

} // namespace Config

#endif // CONFIG_HPP
