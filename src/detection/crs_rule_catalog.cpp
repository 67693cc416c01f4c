#include "crs_rule_catalog.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <regex>
#include <sstream>

namespace {

const std::regex PARANOIA_TAG_RE(R"(tag\s*:\s*'paranoia-level/(\d))");
const std::regex RULE_ID_RE(R"(id\s*:\s*(\d+))");
const std::regex SEVERITY_RE(R"(severity\s*:\s*'?(\w+))", std::regex::icase);
const std::regex CHAIN_RE(R"((^|[",\s])chain([",\s]|$))");

bool starts_with(const std::string &s, const char *prefix) {
  return s.rfind(prefix, 0) == 0;
}

} // namespace

std::string custom_rule_id(const std::string &original_id) {
  return CUSTOM_RULE_ID_PREFIX + original_id;
}

std::string canonical_rule_id(const std::string &rule_id) {
  // CRS ids are six digits, so a custom id is exactly nine.
  if (rule_id.size() == 9 && starts_with(rule_id, CUSTOM_RULE_ID_PREFIX))
    return rule_id.substr(3);
  return rule_id;
}

int severity_score_increment(const std::string &severity) {
  if (severity == "critical")
    return 2;
  if (severity == "warning" || severity == "error")
    return 1;
  if (severity == "notice")
    return 0;
  return -1;
}

std::vector<std::string> split_secrule_blocks(const std::string &text) {
  std::vector<std::string> blocks;
  std::string buffer;
  bool continues_chain = false;

  auto flush = [&] {
    if (!buffer.empty())
      blocks.push_back(std::move(buffer));
    buffer.clear();
    continues_chain = false;
  };

  std::istringstream in(text);
  std::string raw;
  while (std::getline(in, raw)) {
    std::string line = Utils::trim_copy(raw);
    if (line.empty() || line[0] == '#')
      continue;

    if (starts_with(line, "SecRule")) {
      if (continues_chain)
        continues_chain = false;
      else
        flush();
    } else if (starts_with(line, "Sec")) {
      // Any other directive ends the current rule and is not kept.
      flush();
      continue;
    } else if (buffer.empty()) {
      continue;
    }

    if (!buffer.empty())
      buffer += '\n';
    buffer += line;

    if (std::regex_search(line, CHAIN_RE))
      continues_chain = true;
  }
  flush();
  return blocks;
}

std::string rescale_anomaly_score(const std::string &rule_text,
                                  const std::string &severity,
                                  int paranoia_level) {
  const int increment = severity_score_increment(severity);
  if (increment < 0)
    return rule_text;
  const std::regex score_re(
      R"(setvar\s*:\s*'tx\.inbound_anomaly_score_pl[34]=\+%\{tx\.[^}]*_anomaly_score\}')");
  const std::string replacement = "setvar:'tx.inbound_anomaly_score_pl" +
                                  std::to_string(paranoia_level) + "=+" +
                                  std::to_string(increment) + "'";
  return std::regex_replace(rule_text, score_re, replacement);
}

size_t CrsRuleCatalog::add_rules_from_text(const std::string &text,
                                           int min_paranoia_level,
                                           const std::string &source_name) {
  size_t kept = 0;
  for (const auto &block : split_secrule_blocks(text)) {
    std::smatch pl_match;
    if (!std::regex_search(block, pl_match, PARANOIA_TAG_RE))
      continue;
    const int level = pl_match[1].str()[0] - '0';
    if (level < min_paranoia_level)
      continue;

    std::smatch id_match;
    if (!std::regex_search(block, id_match, RULE_ID_RE)) {
      LOG(LogLevel::WARN, LogComponent::RULES_CATALOG,
          "Paranoia-level " << level << " rule without an id in "
                            << source_name << ". Skipped.");
      continue;
    }

    CrsRule rule;
    rule.original_id = id_match[1].str();
    rule.custom_id = custom_rule_id(rule.original_id);
    rule.paranoia_level = level;
    rule.source = source_name;

    std::smatch severity_match;
    if (std::regex_search(block, severity_match, SEVERITY_RE))
      rule.severity = Utils::to_lower_copy(severity_match[1].str());

    std::string rewritten = std::regex_replace(
        block, RULE_ID_RE, "id:" + rule.custom_id,
        std::regex_constants::format_first_only);
    rule.rewritten_text = rescale_anomaly_score(rewritten, rule.severity, level);

    if (rules_.count(rule.original_id))
      LOG(LogLevel::WARN, LogComponent::RULES_CATALOG,
          "Rule " << rule.original_id << " redefined in " << source_name
                  << ". Keeping the later definition.");
    rules_[rule.original_id] = std::move(rule);
    ++kept;
  }
  return kept;
}

CrsRuleCatalog CrsRuleCatalog::load(const std::vector<std::string> &sources,
                                    int min_paranoia_level) {
  CrsRuleCatalog catalog;
  for (const auto &source : sources) {
    auto content = Utils::read_file(source);
    if (!content) {
      LOG(LogLevel::WARN, LogComponent::RULES_CATALOG,
          "CRS rule source " << source << " could not be read. Skipped.");
      continue;
    }
    size_t kept = catalog.add_rules_from_text(*content, min_paranoia_level, source);
    LOG(LogLevel::INFO, LogComponent::RULES_CATALOG,
        "Loaded " << kept << " paranoia-level >= " << min_paranoia_level
                  << " rules from " << source);
  }
  return catalog;
}

const CrsRule *CrsRuleCatalog::find(const std::string &rule_id) const {
  auto it = rules_.find(canonical_rule_id(rule_id));
  return it == rules_.end() ? nullptr : &it->second;
}

std::map<std::string, int> CrsRuleCatalog::paranoia_levels() const {
  std::map<std::string, int> levels;
  for (const auto &[id, rule] : rules_)
    levels[id] = rule.paranoia_level;
  return levels;
}

std::string
CrsRuleCatalog::render_custom_rules(const std::set<std::string> &active_rule_ids,
                                    uint64_t version) const {
  std::ostringstream out;
  out << "# Generated by waf_hardener. Rule set version " << version << ".\n"
      << "# Do not edit: this file is rewritten after every hardening commit.\n\n";

  for (const auto &rule_id : active_rule_ids) {
    const CrsRule *rule = find(rule_id);
    if (!rule) {
      LOG(LogLevel::WARN, LogComponent::RULES_CATALOG,
          "Active rule " << rule_id
                         << " is not in the CRS catalog. It cannot be rendered.");
      continue;
    }
    out << "# " << rule->original_id << " (paranoia level "
        << rule->paranoia_level << ", " << rule->source << ")\n"
        << "SecRuleRemoveById " << rule->original_id << "\n"
        << rule->rewritten_text << "\n\n";
  }
  return out.str();
}
