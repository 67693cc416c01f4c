#ifndef CRS_RULE_CATALOG_HPP
#define CRS_RULE_CATALOG_HPP

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>

struct CrsRule {
  std::string original_id;
  std::string custom_id; // "999" + original_id
  int paranoia_level = 0;
  std::string severity; // lowercased, empty if the rule declares none
  std::string source;
  std::string rewritten_text;
};

inline constexpr const char *CUSTOM_RULE_ID_PREFIX = "999";

std::string custom_rule_id(const std::string &original_id);
// Maps a custom "999xxxxxx" id back to the CRS id it was derived from. Any
// other id is returned unchanged.
std::string canonical_rule_id(const std::string &rule_id);
// Anomaly score increment for a severity; -1 when the severity is not one
// the rescale knows.
int severity_score_increment(const std::string &severity);

// The paranoia-level 3/4 subset of the Core Rule Set, rewritten into the
// custom id range so activated copies never collide with the originals.
class CrsRuleCatalog {
public:
  CrsRuleCatalog() = default;

  // Unreadable sources are logged and skipped.
  static CrsRuleCatalog load(const std::vector<std::string> &sources,
                             int min_paranoia_level);

  // Returns the number of rules kept from `text`.
  size_t add_rules_from_text(const std::string &text, int min_paranoia_level,
                             const std::string &source_name = "<inline>");

  // Accepts either the CRS id or its custom id.
  const CrsRule *find(const std::string &rule_id) const;
  std::map<std::string, int> paranoia_levels() const;
  size_t size() const { return rules_.size(); }
  bool empty() const { return rules_.empty(); }

  // Config text for the inspection layer: for each active rule, the removal
  // of the CRS original followed by its rewritten copy.
  std::string render_custom_rules(const std::set<std::string> &active_rule_ids,
                                  uint64_t version) const;

private:
  std::map<std::string, CrsRule> rules_; // keyed by original id
};

// SecRule blocks of a ModSecurity config, comments dropped, chained rules
// kept together with the rule that starts the chain.
std::vector<std::string> split_secrule_blocks(const std::string &text);
std::string rescale_anomaly_score(const std::string &rule_text,
                                  const std::string &severity,
                                  int paranoia_level);

#endif // CRS_RULE_CATALOG_HPP
