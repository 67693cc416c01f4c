#include "audit_record.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace {

std::optional<std::string> string_field(const nlohmann::json &doc,
                                        const char *name) {
  auto it = doc.find(name);
  if (it == doc.end() || it->is_null())
    return std::nullopt;
  if (it->is_string())
    return it->get<std::string>();
  if (it->is_number() || it->is_boolean())
    return it->dump();
  return std::nullopt;
}

std::optional<double> number_field(const nlohmann::json &value) {
  if (value.is_number())
    return value.get<double>();
  if (value.is_string())
    return Utils::string_to_number<double>(Utils::trim_copy(value.get<std::string>()));
  // {"$numberLong": "..."} / {"$numberDouble": "..."}
  if (value.is_object() && value.size() == 1) {
    const auto &inner = value.begin().value();
    if (inner.is_string())
      return Utils::string_to_number<double>(inner.get<std::string>());
  }
  return std::nullopt;
}

std::optional<std::string> id_value(const nlohmann::json &value) {
  if (value.is_string()) {
    auto s = value.get<std::string>();
    if (s.empty())
      return std::nullopt;
    return s;
  }
  if (value.is_number_integer())
    return std::to_string(value.get<int64_t>());
  if (value.is_object()) {
    auto oid = value.find("$oid");
    if (oid != value.end() && oid->is_string())
      return oid->get<std::string>();
  }
  return std::nullopt;
}

std::string rule_id_value(const nlohmann::json &value) {
  if (value.is_string())
    return Utils::trim_copy(value.get<std::string>());
  if (value.is_number_integer())
    return std::to_string(value.get<int64_t>());
  if (value.is_number()) {
    double d = value.get<double>();
    if (std::isfinite(d))
      return std::to_string(static_cast<int64_t>(d));
  }
  return {};
}

} // namespace

std::optional<uint64_t> parse_timestamp_value(const nlohmann::json &value) {
  if (value.is_number_unsigned())
    return value.get<uint64_t>();
  if (value.is_number_integer()) {
    int64_t v = value.get<int64_t>();
    return v < 0 ? std::nullopt : std::optional<uint64_t>(static_cast<uint64_t>(v));
  }
  if (value.is_number_float()) {
    double v = value.get<double>();
    if (!std::isfinite(v) || v < 0)
      return std::nullopt;
    return static_cast<uint64_t>(v);
  }
  if (value.is_string())
    return Utils::parse_iso8601_to_ms(value.get<std::string>());
  if (value.is_object()) {
    auto date = value.find("$date");
    if (date != value.end())
      return parse_timestamp_value(*date);
    auto number_long = value.find("$numberLong");
    if (number_long != value.end() && number_long->is_string()) {
      auto v = Utils::string_to_number<int64_t>(number_long->get<std::string>());
      if (v && *v >= 0)
        return static_cast<uint64_t>(*v);
    }
  }
  return std::nullopt;
}

std::optional<uint64_t> parse_content_length_value(const nlohmann::json &value) {
  if (value.is_number()) {
    auto v = number_field(value);
    if (v && *v >= 0 && std::isfinite(*v))
      return static_cast<uint64_t>(*v);
    return std::nullopt;
  }
  if (!value.is_string())
    return std::nullopt;

  std::string text = value.get<std::string>();
  const std::string marker = "Content-Length:";
  auto pos = text.find(marker);
  if (pos != std::string::npos)
    text = text.substr(pos + marker.size());
  return Utils::string_to_number<uint64_t>(Utils::trim_copy(text));
}

int paranoia_level_from_tags(const nlohmann::json &tags) {
  if (!tags.is_array())
    return 0;
  const std::string marker = "paranoia-level/";
  for (const auto &tag : tags) {
    if (!tag.is_string())
      continue;
    const auto &s = tag.get_ref<const std::string &>();
    auto pos = s.find(marker);
    if (pos == std::string::npos)
      continue;
    if (auto level = Utils::string_to_number<int>(s.substr(pos + marker.size())))
      return *level;
  }
  return 0;
}

std::optional<AuditRecord> AuditRecord::from_json(const nlohmann::json &doc,
                                                  const std::string &id_field,
                                                  const std::string &timestamp_field) {
  if (!doc.is_object())
    return std::nullopt;

  AuditRecord record;

  auto id_it = doc.find(id_field);
  if (id_it != doc.end())
    if (auto id = id_value(*id_it))
      record.id = *id;
  if (record.id.empty()) {
    auto oid_it = doc.find("_id");
    if (oid_it != doc.end())
      if (auto id = id_value(*oid_it))
        record.id = *id;
  }
  if (record.id.empty())
    return std::nullopt;

  auto ts_it = doc.find(timestamp_field);
  if (ts_it != doc.end())
    record.timestamp_ms = parse_timestamp_value(*ts_it).value_or(0);

  record.client_ip = string_field(doc, "client_ip");
  record.http_method = string_field(doc, "http_method");
  record.request_uri = string_field(doc, "request_uri");
  if (!record.request_uri)
    record.request_uri = string_field(doc, "request_path");
  record.http_version = string_field(doc, "http_version");
  record.request_body = string_field(doc, "request_body");
  record.user_agent = string_field(doc, "user_agent");

  auto cl_it = doc.find("content_length");
  if (cl_it != doc.end())
    record.content_length = parse_content_length_value(*cl_it);

  auto headers_it = doc.find("request_headers");
  if (headers_it != doc.end() && headers_it->is_object()) {
    for (auto it = headers_it->begin(); it != headers_it->end(); ++it) {
      std::string value = it.value().is_string() ? it.value().get<std::string>()
                                                 : it.value().dump();
      record.request_headers.emplace_back(Utils::to_lower_copy(it.key()),
                                          std::move(value));
    }
    std::sort(record.request_headers.begin(), record.request_headers.end());
    if (!record.user_agent) {
      for (const auto &header : record.request_headers)
        if (header.first == "user-agent")
          record.user_agent = header.second;
    }
  }

  auto rules_it = doc.find("rules");
  if (rules_it != doc.end() && rules_it->is_array()) {
    for (const auto &rule_doc : *rules_it) {
      TriggeredRule rule;
      if (rule_doc.is_object()) {
        auto rid = rule_doc.find("rule_id");
        if (rid == rule_doc.end())
          rid = rule_doc.find("id");
        if (rid != rule_doc.end())
          rule.rule_id = rule_id_value(*rid);

        auto pl = rule_doc.find("paranoia_level");
        if (pl != rule_doc.end())
          rule.paranoia_level = static_cast<int>(number_field(*pl).value_or(0));
        if (rule.paranoia_level == 0) {
          auto tags = rule_doc.find("tags");
          if (tags != rule_doc.end())
            rule.paranoia_level = paranoia_level_from_tags(*tags);
        }

        auto score = rule_doc.find("anomaly_score");
        if (score != rule_doc.end())
          rule.anomaly_score = number_field(*score).value_or(0.0);
        if (!std::isfinite(rule.anomaly_score))
          rule.anomaly_score = 0.0;

        if (auto severity = string_field(rule_doc, "severity"))
          rule.severity = *severity;
        if (auto message = string_field(rule_doc, "message"))
          rule.message = *message;
      } else {
        rule.rule_id = rule_id_value(rule_doc);
      }

      if (!rule.rule_id.empty())
        record.triggered_rules.push_back(std::move(rule));
    }
  }

  auto score_it = doc.find("anomaly_score");
  if (score_it != doc.end()) {
    auto score = number_field(*score_it);
    if (score && std::isfinite(*score))
      record.total_anomaly_score = score;
  }

  record.source_document = doc;
  return record;
}
