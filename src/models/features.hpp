#ifndef FEATURES_HPP
#define FEATURES_HPP

#include <string>
#include <vector>

// Bumped whenever a slot is added, removed, reordered or changes meaning.
// Model artifacts declare the version they were trained against.
constexpr int FEATURE_SCHEMA_VERSION = 1;

enum class Feature {
  // --- URI Shape ---
  URI_LENGTH,
  URI_PATH_DEPTH,
  URI_QUERY_PARAM_COUNT,
  URI_SPECIAL_CHAR_RATIO,
  URI_PERCENT_ENCODED_RATIO,
  URI_ENTROPY,

  // --- Body ---
  BODY_LENGTH,
  BODY_SPECIAL_CHAR_RATIO,
  BODY_ENTROPY,

  // --- Headers ---
  HEADER_COUNT,
  CONTENT_LENGTH,

  // --- User Agent ---
  UA_LENGTH,
  UA_WORD_COUNT,
  UA_IS_BOT,
  UA_IS_MOBILE,
  UA_IS_MISSING,
  UA_BROWSER_VERSION,

  // --- Method One-Hot ---
  METHOD_GET,
  METHOD_POST,
  METHOD_PUT,
  METHOD_DELETE,
  METHOD_HEAD,
  METHOD_OTHER,

  // --- Attack Pattern Hits (URI + body) ---
  SQLI_PATTERN_HITS,
  LFI_PATTERN_HITS,
  XSS_PATTERN_HITS,
  CMDI_PATTERN_HITS,

  // --- Triggered Rules ---
  RULES_PL1_COUNT,
  RULES_PL2_COUNT,
  RULES_PL3_COUNT,
  RULES_PL4_COUNT,
  TOTAL_ANOMALY_SCORE,
  MAX_RULE_ANOMALY_SCORE,

  // This must always be the last item. It automatically provides the total
  // count.
  FEATURE_COUNT
};

std::string get_feature_name(Feature f);

// Names in slot order; what model metadata lists as feature_names_ordered.
const std::vector<std::string> &feature_names_ordered();

#endif // FEATURES_HPP
