#include "config.hpp"
#include "logger.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace Config {

LogLevel string_to_log_level(const std::string &level_str_raw) {
  std::string level_str = Utils::trim_copy(level_str_raw);
  std::transform(level_str.begin(), level_str.end(), level_str.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  if (level_str == "TRACE")
    return LogLevel::TRACE;
  if (level_str == "DEBUG")
    return LogLevel::DEBUG;
  if (level_str == "INFO")
    return LogLevel::INFO;
  if (level_str == "WARN")
    return LogLevel::WARN;
  if (level_str == "ERROR")
    return LogLevel::ERROR;
  if (level_str == "FATAL")
    return LogLevel::FATAL;
  return LogLevel::INFO; // A safe default
}

const std::map<std::string, LogComponent> key_to_component_map = {
    {"core", LogComponent::CORE},
    {"config", LogComponent::CONFIG},
    {"web", LogComponent::WEB},
    {"io.store", LogComponent::IO_STORE},
    {"io.fetcher", LogComponent::IO_FETCHER},
    {"io.writer", LogComponent::IO_WRITER},
    {"io.notify", LogComponent::IO_NOTIFY},
    {"io.rulestore", LogComponent::IO_RULESTORE},
    {"ml.features", LogComponent::ML_FEATURES},
    {"ml.inference", LogComponent::ML_INFERENCE},
    {"ml.lifecycle", LogComponent::ML_LIFECYCLE},
    {"analysis.trends", LogComponent::ANALYSIS_TRENDS},
    {"rules.hardening", LogComponent::RULES_HARDENING},
    {"rules.catalog", LogComponent::RULES_CATALOG},
    {"orch.classify", LogComponent::ORCH_CLASSIFY},
    {"orch.harden", LogComponent::ORCH_HARDEN},
    {"state.persist", LogComponent::STATE_PERSIST}};

// Convert string to boolean using common truthy values
bool string_to_bool(const std::string &val_str_raw) {
  std::string val_str = Utils::to_lower_copy(Utils::trim_copy(val_str_raw));
  return (val_str == "true" || val_str == "1" || val_str == "yes" ||
          val_str == "on");
}

std::optional<BucketGranularity>
string_to_granularity(const std::string &value) {
  std::string v = Utils::to_lower_copy(Utils::trim_copy(value));
  if (v == "hourly")
    return BucketGranularity::HOURLY;
  if (v == "daily")
    return BucketGranularity::DAILY;
  return std::nullopt;
}

std::string granularity_to_string(BucketGranularity granularity) {
  switch (granularity) {
  case BucketGranularity::HOURLY:
    return "hourly";
  case BucketGranularity::DAILY:
    return "daily";
  }
  return "hourly";
}

bool validate_store_config(const StoreConfig &config,
                           std::vector<std::string> &errors) {
  bool valid = true;

  if (config.uri.empty()) {
    errors.push_back("Store URI must not be empty");
    valid = false;
  }
  if (config.database.empty()) {
    errors.push_back("Store database must not be empty");
    valid = false;
  }
  if (config.unclassified_prefix.empty() || config.classified_prefix.empty()) {
    errors.push_back("Store collection prefixes must not be empty");
    valid = false;
  } else if (config.unclassified_prefix == config.classified_prefix) {
    errors.push_back(
        "Store unclassified and classified prefixes must be different");
    valid = false;
  }
  if (config.timestamp_field_name.empty() || config.id_field_name.empty()) {
    errors.push_back("Store timestamp and id field names must not be empty");
    valid = false;
  }
  if (config.operation_timeout_ms < 100 ||
      config.operation_timeout_ms > 600000) {
    errors.push_back(
        "Store operation timeout must be between 100 and 600000 ms");
    valid = false;
  }
  if (config.page_size < 1 || config.page_size > 100000) {
    errors.push_back("Store page size must be between 1 and 100000");
    valid = false;
  }

  return valid;
}

bool validate_fetcher_config(const FetcherConfig &config,
                             std::vector<std::string> &errors) {
  bool valid = true;

  if (config.max_attempts < 1 || config.max_attempts > 100) {
    errors.push_back("Fetcher max attempts must be between 1 and 100");
    valid = false;
  }
  if (config.backoff_multiplier < 1.0 || config.backoff_multiplier > 10.0) {
    errors.push_back("Fetcher backoff multiplier must be between 1.0 and 10.0");
    valid = false;
  }
  if (config.max_delay_ms < config.base_delay_ms) {
    errors.push_back("Fetcher max delay must not be below the base delay");
    valid = false;
  }
  if (config.initial_lookback_buckets < 1 ||
      config.initial_lookback_buckets > 24 * 366) {
    errors.push_back(
        "Fetcher initial lookback must be between 1 and 8784 buckets");
    valid = false;
  }

  return valid;
}

bool validate_classifier_config(const ClassifierConfig &config,
                                std::vector<std::string> &errors) {
  bool valid = true;

  if (config.model_path.empty() || config.model_metadata_path.empty()) {
    errors.push_back("Classifier model and metadata paths must not be empty");
    valid = false;
  }
  if (config.decision_threshold < 0.0 || config.decision_threshold > 1.0) {
    errors.push_back("Classifier decision threshold must be between 0 and 1");
    valid = false;
  }
  if (config.worker_count < 1 || config.worker_count > 256) {
    errors.push_back("Classifier worker count must be between 1 and 256");
    valid = false;
  }
  if (config.micro_batch_size < 1 || config.micro_batch_size > 100000) {
    errors.push_back("Classifier micro batch size must be between 1 and 100000");
    valid = false;
  }

  return valid;
}

bool validate_hardening_config(const HardeningConfig &config,
                               std::vector<std::string> &errors) {
  bool valid = true;

  if (!config.enabled)
    return true;

  if (config.rule_state_path.empty() || config.change_log_path.empty()) {
    errors.push_back(
        "Hardening rule state and change log paths must not be empty");
    valid = false;
  }
  if (config.min_paranoia_level < 1 || config.min_paranoia_level > 4) {
    errors.push_back("Hardening minimum paranoia level must be between 1 and 4");
    valid = false;
  }
  if (config.lookback_hours < 1 || config.lookback_hours > 24 * 90) {
    errors.push_back("Hardening lookback must be between 1 and 2160 hours");
    valid = false;
  }
  if (config.min_sample_count < 1) {
    errors.push_back("Hardening min sample count must be positive");
    valid = false;
  }
  if (config.promotion_threshold < 0.0 || config.promotion_threshold > 1.0 ||
      config.demotion_threshold < 0.0 || config.demotion_threshold > 1.0) {
    errors.push_back(
        "Hardening promotion and demotion thresholds must be between 0 and 1");
    valid = false;
  } else if (config.demotion_threshold >= config.promotion_threshold) {
    errors.push_back(
        "Hardening demotion threshold must be below the promotion threshold");
    valid = false;
  }
  if (config.confirmation_cycles < 1 || config.confirmation_cycles > 100) {
    errors.push_back(
        "Hardening confirmation cycles must be between 1 and 100");
    valid = false;
  }

  return valid;
}

bool validate_notification_config(const NotificationConfig &config,
                                  std::vector<std::string> &errors) {
  bool valid = true;

  if (config.file_enabled && config.file_path.empty()) {
    errors.push_back("Notification file path must be set when file is enabled");
    valid = false;
  }
  if (config.http_enabled && config.http_webhook_url.empty()) {
    errors.push_back(
        "Notification webhook URL must be set when http is enabled");
    valid = false;
  }
  if (config.mail_enabled &&
      (config.mail_command.empty() || config.mail_recipients.empty())) {
    errors.push_back("Notification mail command and recipients must be set "
                     "when mail is enabled");
    valid = false;
  }
  if (config.transport_timeout_seconds < 1 ||
      config.transport_timeout_seconds > 300) {
    errors.push_back(
        "Notification transport timeout must be between 1 and 300 seconds");
    valid = false;
  }
  if (config.attack_threshold_percent < 0.0 ||
      config.attack_threshold_percent > 100.0) {
    errors.push_back(
        "Notification attack threshold must be between 0 and 100 percent");
    valid = false;
  }

  return valid;
}

bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors) {
  bool valid = true;

  if (config.cursor_state_path.empty()) {
    errors.push_back("Cursor state path must not be empty");
    valid = false;
  }

  if (!validate_store_config(config.store, errors))
    valid = false;

  if (!validate_fetcher_config(config.fetcher, errors))
    valid = false;

  if (!validate_classifier_config(config.classifier, errors))
    valid = false;

  if (!validate_hardening_config(config.hardening, errors))
    valid = false;

  if (!validate_notification_config(config.notification, errors))
    valid = false;

  if (config.orchestrator.classification_interval_seconds < 1 ||
      config.orchestrator.hardening_interval_seconds < 1) {
    errors.push_back("Orchestrator intervals must be positive");
    valid = false;
  }

  // Consecutive cycles must see disjoint windows, otherwise a single burst
  // counts towards every confirmation cycle it overlaps.
  if (config.hardening.enabled &&
      uint64_t{config.hardening.lookback_hours} * 3600 >
          config.orchestrator.hardening_interval_seconds) {
    errors.push_back("Hardening lookback of " +
                     std::to_string(config.hardening.lookback_hours) +
                     "h exceeds the hardening interval of " +
                     std::to_string(config.orchestrator.hardening_interval_seconds) +
                     "s");
    valid = false;
  }

  if (config.monitoring.web_server_enabled &&
      (config.monitoring.web_server_port < 1 ||
       config.monitoring.web_server_port > 65535)) {
    errors.push_back("Monitoring web server port must be between 1 and 65535");
    valid = false;
  }

  return valid;
}

std::vector<std::string> collect_config_warnings(const AppConfig &config) {
  std::vector<std::string> warnings;
  if (config.hardening.enabled &&
      (config.hardening.signing_key.empty() ||
       config.hardening.signing_key == "change-me"))
    warnings.push_back("Hardening signing key is unset or the shipped "
                       "placeholder; change log signatures can be forged");
  return warnings;
}

namespace {

template <typename T> void assign_number(const std::string &value, T &target) {
  target = Utils::string_to_number<T>(value).value_or(target);
}

void parse_store_key(const std::string &key, const std::string &value,
                     StoreConfig &store) {
  if (key == Keys::ST_URI)
    store.uri = value;
  else if (key == Keys::ST_DATABASE)
    store.database = value;
  else if (key == Keys::ST_UNCLASSIFIED_PREFIX)
    store.unclassified_prefix = value;
  else if (key == Keys::ST_CLASSIFIED_PREFIX)
    store.classified_prefix = value;
  else if (key == Keys::ST_BUCKET_GRANULARITY) {
    auto granularity = string_to_granularity(value);
    if (!granularity)
      throw std::invalid_argument("expected 'hourly' or 'daily'");
    store.bucket_granularity = *granularity;
  } else if (key == Keys::ST_TIMESTAMP_FIELD_NAME)
    store.timestamp_field_name = value;
  else if (key == Keys::ST_ID_FIELD_NAME)
    store.id_field_name = value;
  else if (key == Keys::ST_OPERATION_TIMEOUT_MS)
    assign_number(value, store.operation_timeout_ms);
  else if (key == Keys::ST_PAGE_SIZE)
    assign_number(value, store.page_size);
}

void parse_fetcher_key(const std::string &key, const std::string &value,
                       FetcherConfig &fetcher) {
  if (key == Keys::FE_MAX_ATTEMPTS)
    assign_number(value, fetcher.max_attempts);
  else if (key == Keys::FE_BASE_DELAY_MS)
    assign_number(value, fetcher.base_delay_ms);
  else if (key == Keys::FE_BACKOFF_MULTIPLIER)
    assign_number(value, fetcher.backoff_multiplier);
  else if (key == Keys::FE_MAX_DELAY_MS)
    assign_number(value, fetcher.max_delay_ms);
  else if (key == Keys::FE_INITIAL_LOOKBACK_BUCKETS)
    assign_number(value, fetcher.initial_lookback_buckets);
  else if (key == Keys::FE_BUCKET_SETTLE_SECONDS)
    assign_number(value, fetcher.bucket_settle_seconds);
}

void parse_classifier_key(const std::string &key, const std::string &value,
                          ClassifierConfig &classifier) {
  if (key == Keys::CL_MODEL_PATH)
    classifier.model_path = value;
  else if (key == Keys::CL_MODEL_METADATA_PATH)
    classifier.model_metadata_path = value;
  else if (key == Keys::CL_DECISION_THRESHOLD)
    assign_number(value, classifier.decision_threshold);
  else if (key == Keys::CL_WORKER_COUNT)
    assign_number(value, classifier.worker_count);
  else if (key == Keys::CL_MICRO_BATCH_SIZE)
    assign_number(value, classifier.micro_batch_size);
}

void parse_hardening_key(const std::string &key, const std::string &value,
                         HardeningConfig &hardening) {
  if (key == Keys::HA_ENABLED)
    hardening.enabled = string_to_bool(value);
  else if (key == Keys::HA_RULE_STATE_PATH)
    hardening.rule_state_path = value;
  else if (key == Keys::HA_CHANGE_LOG_PATH)
    hardening.change_log_path = value;
  else if (key == Keys::HA_CUSTOM_RULES_OUTPUT_PATH)
    hardening.custom_rules_output_path = value;
  else if (key == Keys::HA_CRS_RULE_SOURCES)
    hardening.crs_rule_sources = Utils::split_and_trim(value, ',');
  else if (key == Keys::HA_MIN_PARANOIA_LEVEL)
    assign_number(value, hardening.min_paranoia_level);
  else if (key == Keys::HA_LOOKBACK_HOURS)
    assign_number(value, hardening.lookback_hours);
  else if (key == Keys::HA_MIN_SAMPLE_COUNT)
    assign_number(value, hardening.min_sample_count);
  else if (key == Keys::HA_PROMOTION_THRESHOLD)
    assign_number(value, hardening.promotion_threshold);
  else if (key == Keys::HA_DEMOTION_THRESHOLD)
    assign_number(value, hardening.demotion_threshold);
  else if (key == Keys::HA_CONFIRMATION_CYCLES)
    assign_number(value, hardening.confirmation_cycles);
  else if (key == Keys::HA_SIGNING_KEY)
    hardening.signing_key = value;
}

void parse_notification_key(const std::string &key, const std::string &value,
                            NotificationConfig &notification) {
  if (key == Keys::NO_FILE_ENABLED)
    notification.file_enabled = string_to_bool(value);
  else if (key == Keys::NO_FILE_PATH)
    notification.file_path = value;
  else if (key == Keys::NO_SYSLOG_ENABLED)
    notification.syslog_enabled = string_to_bool(value);
  else if (key == Keys::NO_HTTP_ENABLED)
    notification.http_enabled = string_to_bool(value);
  else if (key == Keys::NO_HTTP_WEBHOOK_URL)
    notification.http_webhook_url = value;
  else if (key == Keys::NO_MAIL_ENABLED)
    notification.mail_enabled = string_to_bool(value);
  else if (key == Keys::NO_MAIL_COMMAND)
    notification.mail_command = value;
  else if (key == Keys::NO_MAIL_FROM)
    notification.mail_from = value;
  else if (key == Keys::NO_MAIL_RECIPIENTS)
    notification.mail_recipients = Utils::split_and_trim(value, ',');
  else if (key == Keys::NO_TRANSPORT_TIMEOUT_SECONDS)
    assign_number(value, notification.transport_timeout_seconds);
  else if (key == Keys::NO_ATTACK_THRESHOLD_PERCENT)
    assign_number(value, notification.attack_threshold_percent);
  else if (key == Keys::NO_MIN_RECORDS_FOR_SEVERITY)
    assign_number(value, notification.min_records_for_severity);
  else if (key == Keys::NO_THROTTLE_SECONDS)
    assign_number(value, notification.throttle_seconds);
}

void parse_logging_key(const std::string &key, const std::string &value,
                       LoggingConfig &logging) {
  if (key == Keys::LOGGING_DEFAULT_LEVEL) {
    LogLevel default_level = string_to_log_level(value);
    for (auto &pair : logging.log_levels)
      pair.second = default_level;
    return;
  }

  std::string lowered = Utils::to_lower_copy(key);
  auto comp_it = key_to_component_map.find(lowered);
  if (comp_it != key_to_component_map.end()) {
    logging.log_levels[comp_it->second] = string_to_log_level(value);
  } else if (lowered.length() > 2 &&
             lowered.substr(lowered.length() - 2) == ".*") {
    // Wildcard match, e.g., "io.* = DEBUG"
    std::string prefix = lowered.substr(0, lowered.length() - 1);
    for (const auto &pair : key_to_component_map) {
      if (pair.first.rfind(prefix, 0) == 0)
        logging.log_levels[pair.second] = string_to_log_level(value);
    }
  }
}

} // namespace

bool parse_config_into(const std::string &filepath, AppConfig &config) {
  // By default, everything is set to a high level (WARN)
  for (const auto &pair : key_to_component_map) {
    config.logging.log_levels[pair.second] = LogLevel::WARN;
  }
  // Except for CORE, which we want to see INFO messages from by default
  config.logging.log_levels[LogComponent::CORE] = LogLevel::INFO;

  std::cout << "Attempting to load configuration from " << filepath
            << std::endl;
  std::ifstream config_file(filepath);

  if (!config_file.is_open()) {
    std::cerr << "Warning: Could not open config file '" << filepath
              << "'." << std::endl;
    return false;
  }

  std::string line;
  std::string current_section;
  bool parse_ok = true;

  int line_num = 0;
  while (std::getline(config_file, line)) {
    line_num++;
    std::string trimmed_line = Utils::trim_copy(line);

    // Skip empty lines and comments
    if (trimmed_line.empty() || trimmed_line[0] == '#' ||
        trimmed_line[0] == ';')
      continue;

    // Section header [SectionName]
    if (trimmed_line[0] == '[' && trimmed_line.back() == ']') {
      current_section =
          Utils::trim_copy(trimmed_line.substr(1, trimmed_line.length() - 2));
      continue;
    }

    // Key-value pair parsing
    size_t delimiter_pos = trimmed_line.find('=');
    if (delimiter_pos == std::string::npos) {
      std::cerr << "Error (Config Line " << line_num
                << "): Invalid format (missing '='): " << trimmed_line
                << std::endl;
      parse_ok = false;
      continue;
    }

    std::string key = Utils::trim_copy(trimmed_line.substr(0, delimiter_pos));
    std::string value =
        Utils::trim_copy(trimmed_line.substr(delimiter_pos + 1));

    if (key.empty()) {
      std::cerr << "Error (Config Line " << line_num << "): Empty key found."
                << std::endl;
      parse_ok = false;
      continue;
    }

    try {
      // Global (non-section) keys
      if (current_section.empty()) {
        if (key == Keys::CURSOR_STATE_PATH)
          config.cursor_state_path = value;
        else if (key == Keys::RUN_STATUS_PATH)
          config.run_status_path = value;
        else
          config.custom_settings[key] = value;
      } else if (current_section == "Store") {
        parse_store_key(key, value, config.store);
      } else if (current_section == "Fetcher") {
        parse_fetcher_key(key, value, config.fetcher);
      } else if (current_section == "Classifier") {
        parse_classifier_key(key, value, config.classifier);
      } else if (current_section == "Hardening") {
        parse_hardening_key(key, value, config.hardening);
      } else if (current_section == "Orchestrator") {
        if (key == Keys::OR_CLASSIFICATION_INTERVAL_SECONDS)
          assign_number(value,
                        config.orchestrator.classification_interval_seconds);
        else if (key == Keys::OR_HARDENING_INTERVAL_SECONDS)
          assign_number(value, config.orchestrator.hardening_interval_seconds);
        else if (key == Keys::OR_RUN_ON_START)
          config.orchestrator.run_on_start = string_to_bool(value);
      } else if (current_section == "Notification") {
        parse_notification_key(key, value, config.notification);
      } else if (current_section == "Monitoring") {
        if (key == Keys::MO_WEB_SERVER_ENABLED)
          config.monitoring.web_server_enabled = string_to_bool(value);
        else if (key == Keys::MO_WEB_SERVER_HOST)
          config.monitoring.web_server_host = value;
        else if (key == Keys::MO_WEB_SERVER_PORT)
          assign_number(value, config.monitoring.web_server_port);
      } else if (current_section == "Logging") {
        parse_logging_key(key, value, config.logging);
      } else {
        config.custom_settings[current_section + "." + key] = value;
      }
    } catch (const std::invalid_argument &e) {
      std::cerr << "Error (Config Line " << line_num
                << "): Invalid value for key '" << key << "': '" << value
                << "' - " << e.what() << std::endl;
      parse_ok = false;
    }
  }

  config_file.close();
  if (parse_ok)
    std::cout << "Configuration parsed from " << filepath << std::endl;
  return parse_ok;
}

bool ConfigManager::load_configuration(const std::string &filepath) {
  config_filepath_ = filepath;
  auto new_config = std::make_shared<AppConfig>();

  // Use the parsing logic to fill the new config object
  if (!parse_config_into(filepath, *new_config)) {
    std::cerr << "Failed to parse configuration file: " << filepath
              << ". Keeping existing settings." << std::endl;
    return false;
  }

  // Validate the configuration
  std::vector<std::string> validation_errors;
  if (!validate_app_config(*new_config, validation_errors)) {
    std::cerr << "Configuration validation failed:" << std::endl;
    for (const auto &error : validation_errors) {
      std::cerr << "  - " << error << std::endl;
    }
    std::cerr << "Keeping existing settings." << std::endl;
    return false;
  }

  for (const auto &warning : collect_config_warnings(*new_config))
    std::cerr << "Configuration warning: " << warning << std::endl;

  // Atomically swap the pointer
  std::lock_guard<std::mutex> lock(config_mutex_);
  current_config_ = new_config;
  std::cout << "Configuration loaded and validated successfully from "
            << config_filepath_ << std::endl;
  return true;
}

std::shared_ptr<const AppConfig> ConfigManager::get_config() const {
  std::lock_guard<std::mutex> lock(config_mutex_);
  return current_config_;
}

} // namespace Config
