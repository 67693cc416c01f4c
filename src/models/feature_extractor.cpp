#include "feature_extractor.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <cstddef>
#include <initializer_list>
#include <string>
#include <utility>

namespace {

struct AttackPattern {
  const char *text;
  int group;
};

// Part of schema version 1. Editing this list changes the schema.
const std::vector<AttackPattern> &attack_patterns() {
  static const std::vector<AttackPattern> patterns = {
      // SQL injection
      {"union select", 0},
      {"union all select", 0},
      {"select * from", 0},
      {"drop table", 0},
      {"drop database", 0},
      {"delete from", 0},
      {"insert into", 0},
      {"information_schema", 0},
      {"' or '1'='1", 0},
      {" or 1=1", 0},
      {"sleep(", 0},
      {"benchmark(", 0},
      // Path traversal / local file inclusion
      {"../", 1},
      {"..\\", 1},
      {"/etc/passwd", 1},
      {"/etc/shadow", 1},
      {"php://filter", 1},
      {"php://input", 1},
      {"file://", 1},
      // Cross-site scripting
      {"<script", 2},
      {"</script", 2},
      {"javascript:", 2},
      {"onerror=", 2},
      {"onload=", 2},
      {"<iframe", 2},
      {"<svg", 2},
      {"document.cookie", 2},
      // Command injection
      {"`", 3},
      {"$(", 3},
      {"; cat ", 3},
      {"| cat ", 3},
      {"; wget ", 3},
      {"; curl ", 3},
      {"| nc ", 3},
      {"/bin/sh", 3},
      {"/bin/bash", 3},
      {"cmd.exe", 3}};
  return patterns;
}

std::vector<std::string> pattern_texts() {
  std::vector<std::string> out;
  for (const auto &p : attack_patterns())
    out.emplace_back(p.text);
  return out;
}

std::vector<int> pattern_group_ids() {
  std::vector<int> out;
  for (const auto &p : attack_patterns())
    out.push_back(p.group);
  return out;
}

inline void set(std::vector<double> &f, Feature feature, double value) {
  f[static_cast<size_t>(feature)] = value;
}

bool is_plain_uri_char(unsigned char c) {
  return std::isalnum(c) || c == '/' || c == '-' || c == '.' || c == '_' ||
         c == '~';
}

// Collapses whitespace runs to one space, so "union   select" matches.
std::string normalize_for_scan(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  bool in_space = false;
  for (char c : text) {
    if (std::isspace(static_cast<unsigned char>(c))) {
      if (!in_space)
        out.push_back(' ');
      in_space = true;
    } else {
      out.push_back(c);
      in_space = false;
    }
  }
  return out;
}

bool contains_any(const std::string &haystack,
                  std::initializer_list<const char *> needles) {
  for (const char *needle : needles)
    if (haystack.find(needle) != std::string::npos)
      return true;
  return false;
}

// First "<digits>.<digits>" run, e.g. "chrome/120.0.6099" -> 120.0
double first_version_number(const std::string &ua) {
  for (size_t i = 0; i < ua.size(); ++i) {
    if (!std::isdigit(static_cast<unsigned char>(ua[i])))
      continue;
    size_t j = i;
    while (j < ua.size() && std::isdigit(static_cast<unsigned char>(ua[j])))
      ++j;
    if (j + 1 < ua.size() && ua[j] == '.' &&
        std::isdigit(static_cast<unsigned char>(ua[j + 1]))) {
      size_t k = j + 1;
      while (k < ua.size() && std::isdigit(static_cast<unsigned char>(ua[k])))
        ++k;
      // Bound the digit runs so absurd inputs cannot overflow to inf.
      std::string number = ua.substr(i, std::min<size_t>(j - i, 9)) + "." +
                           ua.substr(j + 1, std::min<size_t>(k - j - 1, 9));
      return Utils::string_to_number<double>(number).value_or(0.0);
    }
    i = j;
  }
  return 0.0;
}

} // namespace

double shannon_entropy(std::string_view text) {
  if (text.empty())
    return 0.0;
  std::array<size_t, 256> counts{};
  for (unsigned char c : text)
    ++counts[c];
  double entropy = 0.0;
  const double n = static_cast<double>(text.size());
  for (size_t count : counts) {
    if (count == 0)
      continue;
    double p = static_cast<double>(count) / n;
    entropy -= p * std::log2(p);
  }
  return entropy;
}

double special_char_ratio(std::string_view text) {
  if (text.empty())
    return 0.0;
  size_t special = 0;
  for (unsigned char c : text)
    if (!is_plain_uri_char(c))
      ++special;
  return static_cast<double>(special) / static_cast<double>(text.size());
}

FeatureExtractor::FeatureExtractor()
    : pattern_groups_(pattern_group_ids()), pattern_matcher_(pattern_texts()) {}

FeatureVector FeatureExtractor::extract(const AuditRecord &record) const {
  LOG(LogLevel::TRACE, LogComponent::ML_FEATURES,
      "Extracting features for record " << record.id);

  FeatureVector vector;
  vector.schema_version = FEATURE_SCHEMA_VERSION;
  vector.values.assign(static_cast<size_t>(Feature::FEATURE_COUNT), 0.0);
  auto &f = vector.values;

  extract_uri(record, f);
  extract_body(record, f);

  set(f, Feature::HEADER_COUNT,
      static_cast<double>(record.request_headers.size()));
  set(f, Feature::CONTENT_LENGTH,
      static_cast<double>(record.content_length.value_or(0)));

  extract_user_agent(record, f);
  extract_method(record, f);
  extract_patterns(record, f);
  extract_rules(record, f);

  return vector;
}

void FeatureExtractor::extract_uri(const AuditRecord &record,
                                   std::vector<double> &f) const {
  if (!record.request_uri || record.request_uri->empty())
    return;
  const std::string &uri = *record.request_uri;

  set(f, Feature::URI_LENGTH, static_cast<double>(uri.size()));

  auto query_pos = uri.find('?');
  std::string_view path = std::string_view(uri).substr(0, query_pos);
  size_t depth = 0;
  for (size_t i = 0; i < path.size(); ++i)
    if (path[i] == '/' && i + 1 < path.size() && path[i + 1] != '/')
      ++depth;
  set(f, Feature::URI_PATH_DEPTH, static_cast<double>(depth));

  if (query_pos != std::string::npos && query_pos + 1 < uri.size()) {
    size_t params = 0;
    for (const auto &param : Utils::split_string(uri.substr(query_pos + 1), '&'))
      if (!param.empty())
        ++params;
    set(f, Feature::URI_QUERY_PARAM_COUNT, static_cast<double>(params));
  }

  set(f, Feature::URI_SPECIAL_CHAR_RATIO, special_char_ratio(uri));

  size_t encoded = 0;
  for (size_t i = 0; i + 2 < uri.size(); ++i) {
    if (uri[i] == '%' && std::isxdigit(static_cast<unsigned char>(uri[i + 1])) &&
        std::isxdigit(static_cast<unsigned char>(uri[i + 2]))) {
      ++encoded;
      i += 2;
    }
  }
  set(f, Feature::URI_PERCENT_ENCODED_RATIO,
      static_cast<double>(encoded * 3) / static_cast<double>(uri.size()));

  set(f, Feature::URI_ENTROPY, shannon_entropy(uri));
}

void FeatureExtractor::extract_body(const AuditRecord &record,
                                    std::vector<double> &f) const {
  if (!record.request_body || record.request_body->empty())
    return;
  const std::string &body = *record.request_body;
  set(f, Feature::BODY_LENGTH, static_cast<double>(body.size()));
  set(f, Feature::BODY_SPECIAL_CHAR_RATIO, special_char_ratio(body));
  set(f, Feature::BODY_ENTROPY, shannon_entropy(body));
}

void FeatureExtractor::extract_user_agent(const AuditRecord &record,
                                          std::vector<double> &f) const {
  std::string ua =
      record.user_agent ? Utils::to_lower_copy(Utils::trim_copy(*record.user_agent))
                        : std::string();
  if (ua.empty() || ua == "unknown" || ua == "-") {
    set(f, Feature::UA_IS_MISSING, 1.0);
    return;
  }

  set(f, Feature::UA_LENGTH, static_cast<double>(ua.size()));

  size_t words = 0;
  bool in_word = false;
  for (unsigned char c : ua) {
    if (std::isspace(c)) {
      in_word = false;
    } else if (!in_word) {
      in_word = true;
      ++words;
    }
  }
  set(f, Feature::UA_WORD_COUNT, static_cast<double>(words));

  set(f, Feature::UA_IS_BOT,
      contains_any(ua, {"bot", "crawler", "spider"}) ? 1.0 : 0.0);
  set(f, Feature::UA_IS_MOBILE,
      contains_any(ua, {"mobile", "android", "iphone", "ipad"}) ? 1.0 : 0.0);
  set(f, Feature::UA_BROWSER_VERSION, first_version_number(ua));
}

void FeatureExtractor::extract_method(const AuditRecord &record,
                                      std::vector<double> &f) const {
  if (!record.http_method)
    return;
  std::string method = Utils::trim_copy(*record.http_method);
  std::transform(method.begin(), method.end(), method.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  if (method.empty())
    return;

  if (method == "GET")
    set(f, Feature::METHOD_GET, 1.0);
  else if (method == "POST")
    set(f, Feature::METHOD_POST, 1.0);
  else if (method == "PUT")
    set(f, Feature::METHOD_PUT, 1.0);
  else if (method == "DELETE")
    set(f, Feature::METHOD_DELETE, 1.0);
  else if (method == "HEAD")
    set(f, Feature::METHOD_HEAD, 1.0);
  else
    set(f, Feature::METHOD_OTHER, 1.0);
}

void FeatureExtractor::extract_patterns(const AuditRecord &record,
                                        std::vector<double> &f) const {
  std::string text;
  if (record.request_uri)
    text += Utils::url_decode(*record.request_uri);
  text.push_back('\n');
  if (record.request_body)
    text += Utils::url_decode(*record.request_body);

  auto counts = pattern_matcher_.count_matches(normalize_for_scan(text));

  std::array<double, GROUP_COUNT> hits{};
  for (size_t i = 0; i < counts.size(); ++i)
    hits[static_cast<size_t>(pattern_groups_[i])] += static_cast<double>(counts[i]);

  set(f, Feature::SQLI_PATTERN_HITS, hits[SQLI]);
  set(f, Feature::LFI_PATTERN_HITS, hits[LFI]);
  set(f, Feature::XSS_PATTERN_HITS, hits[XSS]);
  set(f, Feature::CMDI_PATTERN_HITS, hits[CMDI]);
}

void FeatureExtractor::extract_rules(const AuditRecord &record,
                                     std::vector<double> &f) const {
  std::array<double, 4> per_level{};
  double max_score = 0.0;
  for (const auto &rule : record.triggered_rules) {
    if (rule.paranoia_level >= 1 && rule.paranoia_level <= 4)
      per_level[static_cast<size_t>(rule.paranoia_level - 1)] += 1.0;
    max_score = std::max(max_score, rule.anomaly_score);
  }

  set(f, Feature::RULES_PL1_COUNT, per_level[0]);
  set(f, Feature::RULES_PL2_COUNT, per_level[1]);
  set(f, Feature::RULES_PL3_COUNT, per_level[2]);
  set(f, Feature::RULES_PL4_COUNT, per_level[3]);
  set(f, Feature::TOTAL_ANOMALY_SCORE, record.total_anomaly_score.value_or(0.0));
  set(f, Feature::MAX_RULE_ANOMALY_SCORE, max_score);
}
