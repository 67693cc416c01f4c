#include "features.hpp"

#include <cstddef>

std::string get_feature_name(Feature f) {
  switch (f) {
  case Feature::URI_LENGTH:
    return "uri_length";
  case Feature::URI_PATH_DEPTH:
    return "uri_path_depth";
  case Feature::URI_QUERY_PARAM_COUNT:
    return "uri_query_param_count";
  case Feature::URI_SPECIAL_CHAR_RATIO:
    return "uri_special_char_ratio";
  case Feature::URI_PERCENT_ENCODED_RATIO:
    return "uri_percent_encoded_ratio";
  case Feature::URI_ENTROPY:
    return "uri_entropy";
  case Feature::BODY_LENGTH:
    return "body_length";
  case Feature::BODY_SPECIAL_CHAR_RATIO:
    return "body_special_char_ratio";
  case Feature::BODY_ENTROPY:
    return "body_entropy";
  case Feature::HEADER_COUNT:
    return "header_count";
  case Feature::CONTENT_LENGTH:
    return "content_length";
  case Feature::UA_LENGTH:
    return "ua_length";
  case Feature::UA_WORD_COUNT:
    return "ua_word_count";
  case Feature::UA_IS_BOT:
    return "ua_is_bot";
  case Feature::UA_IS_MOBILE:
    return "ua_is_mobile";
  case Feature::UA_IS_MISSING:
    return "ua_is_missing";
  case Feature::UA_BROWSER_VERSION:
    return "ua_browser_version";
  case Feature::METHOD_GET:
    return "http_method_GET";
  case Feature::METHOD_POST:
    return "http_method_POST";
  case Feature::METHOD_PUT:
    return "http_method_PUT";
  case Feature::METHOD_DELETE:
    return "http_method_DELETE";
  case Feature::METHOD_HEAD:
    return "http_method_HEAD";
  case Feature::METHOD_OTHER:
    return "http_method_OTHER";
  case Feature::SQLI_PATTERN_HITS:
    return "sqli_pattern_hits";
  case Feature::LFI_PATTERN_HITS:
    return "lfi_pattern_hits";
  case Feature::XSS_PATTERN_HITS:
    return "xss_pattern_hits";
  case Feature::CMDI_PATTERN_HITS:
    return "cmdi_pattern_hits";
  case Feature::RULES_PL1_COUNT:
    return "rules_pl1_count";
  case Feature::RULES_PL2_COUNT:
    return "rules_pl2_count";
  case Feature::RULES_PL3_COUNT:
    return "rules_pl3_count";
  case Feature::RULES_PL4_COUNT:
    return "rules_pl4_count";
  case Feature::TOTAL_ANOMALY_SCORE:
    return "total_anomaly_score";
  case Feature::MAX_RULE_ANOMALY_SCORE:
    return "max_rule_anomaly_score";
  case Feature::FEATURE_COUNT:
    return "FEATURE_COUNT";
  }
  return "UNKNOWN_FEATURE";
}

const std::vector<std::string> &feature_names_ordered() {
  static const std::vector<std::string> names = [] {
    std::vector<std::string> out;
    for (size_t i = 0; i < static_cast<size_t>(Feature::FEATURE_COUNT); ++i)
      out.push_back(get_feature_name(static_cast<Feature>(i)));
    return out;
  }();
  return names;
}
