#ifndef FEATURE_EXTRACTOR_HPP
#define FEATURE_EXTRACTOR_HPP

#include "core/audit_record.hpp"
#include "features.hpp"
#include "utils/aho_corasick.hpp"

#include <string_view>
#include <vector>

struct FeatureVector {
  int schema_version = FEATURE_SCHEMA_VERSION;
  std::vector<double> values;

  bool operator==(const FeatureVector &other) const {
    return schema_version == other.schema_version && values == other.values;
  }
};

// Raw audit record -> fixed-order numeric vector. Total: never throws on
// malformed input, absent fields land on zero. Values are unnormalized; any
// scaling belongs to the model graph.
class FeatureExtractor {
public:
  FeatureExtractor();

  FeatureVector extract(const AuditRecord &record) const;

  int schema_version() const { return FEATURE_SCHEMA_VERSION; }

private:
  enum PatternGroup { SQLI = 0, LFI, XSS, CMDI, GROUP_COUNT };

  void extract_uri(const AuditRecord &record, std::vector<double> &f) const;
  void extract_body(const AuditRecord &record, std::vector<double> &f) const;
  void extract_user_agent(const AuditRecord &record,
                          std::vector<double> &f) const;
  void extract_method(const AuditRecord &record, std::vector<double> &f) const;
  void extract_patterns(const AuditRecord &record,
                        std::vector<double> &f) const;
  void extract_rules(const AuditRecord &record, std::vector<double> &f) const;

  std::vector<int> pattern_groups_;
  Utils::AhoCorasick pattern_matcher_;
};

double shannon_entropy(std::string_view text);
double special_char_ratio(std::string_view text);

#endif // FEATURE_EXTRACTOR_HPP
