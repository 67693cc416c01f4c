#ifndef AUDIT_RECORD_HPP
#define AUDIT_RECORD_HPP

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

struct TriggeredRule {
  std::string rule_id;
  int paranoia_level = 0; // 0 when the upstream layer did not report it
  double anomaly_score = 0.0;
  std::string severity;
  std::string message;
};

// One inspected HTTP transaction as written by the inspection layer. Every
// field the inspection layer may omit is optional; the feature extractor
// resolves absence to its sentinels.
struct AuditRecord {
  std::string id;
  uint64_t timestamp_ms = 0;

  std::optional<std::string> client_ip;
  std::optional<std::string> http_method;
  std::optional<std::string> request_uri;
  std::optional<std::string> http_version;
  std::optional<std::string> request_body;
  std::optional<std::string> user_agent;
  std::optional<uint64_t> content_length;

  // Sorted by header name (lower-cased) so iteration order is stable.
  std::vector<std::pair<std::string, std::string>> request_headers;

  std::vector<TriggeredRule> triggered_rules;
  std::optional<double> total_anomaly_score;

  // The source document, carried into the classified copy.
  nlohmann::json source_document;

  // Timestamp and id exactly as the store sorts them, set by the store that
  // produced the record. Null for records built elsewhere.
  nlohmann::json store_key;

  // Returns nullopt only when no usable id can be found. Any other malformed
  // field is dropped to absent.
  static std::optional<AuditRecord>
  from_json(const nlohmann::json &doc, const std::string &id_field = "transaction_id",
            const std::string &timestamp_field = "timestamp");
};

// Reads a BSON-extended-JSON or plain date value: {"$date": ...}, an
// ISO-8601 string, or a number of epoch milliseconds.
std::optional<uint64_t> parse_timestamp_value(const nlohmann::json &value);

// "Content-Length: 42", "42" or 42.
std::optional<uint64_t> parse_content_length_value(const nlohmann::json &value);

// Pulls the level out of a "paranoia-level/N" tag list, if present.
int paranoia_level_from_tags(const nlohmann::json &tags);

#endif // AUDIT_RECORD_HPP
