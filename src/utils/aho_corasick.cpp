#include "aho_corasick.hpp"
#include "utils.hpp"

#include <cctype>
#include <cstddef>
#include <queue>

namespace Utils {

AhoCorasick::AhoCorasick(const std::vector<std::string> &patterns) {
  trie_.emplace_back(); // Root node
  patterns_.reserve(patterns.size());

  for (size_t i = 0; i < patterns.size(); ++i) {
    patterns_.push_back(to_lower_copy(patterns[i]));
    if (patterns_.back().empty())
      continue;

    int node = 0;
    for (char ch : patterns_.back()) {
      auto it = trie_[node].children.find(ch);
      if (it == trie_[node].children.end()) {
        int next = static_cast<int>(trie_.size());
        trie_[node].children[ch] = next;
        trie_.emplace_back();
        node = next;
      } else {
        node = it->second;
      }
    }
    trie_[node].pattern_indices.push_back(static_cast<int>(i));
  }

  // Suffix and output links, breadth first from the root's children.
  std::queue<int> q;
  for (auto const &[key, val] : trie_[0].children) {
    q.push(val);
  }

  while (!q.empty()) {
    int u = q.front();
    q.pop();

    for (auto const &[ch, v] : trie_[u].children) {
      int j = trie_[u].suffix_link;
      while (j > 0 && trie_[j].children.find(ch) == trie_[j].children.end()) {
        j = trie_[j].suffix_link;
      }
      auto link = trie_[j].children.find(ch);
      if (link != trie_[j].children.end() && link->second != v) {
        trie_[v].suffix_link = link->second;
      }
      q.push(v);
    }

    int suffix_node = trie_[u].suffix_link;
    if (!trie_[suffix_node].pattern_indices.empty()) {
      trie_[u].output_link = suffix_node;
    } else {
      trie_[u].output_link = trie_[suffix_node].output_link;
    }
  }
}

int AhoCorasick::step(int node, char ch) const {
  while (node > 0 && trie_[node].children.find(ch) == trie_[node].children.end()) {
    node = trie_[node].suffix_link;
  }
  auto it = trie_[node].children.find(ch);
  return it != trie_[node].children.end() ? it->second : 0;
}

std::vector<size_t> AhoCorasick::count_matches(std::string_view text) const {
  std::vector<size_t> counts(patterns_.size(), 0);
  int current_node = 0;

  for (char raw : text) {
    char ch = static_cast<char>(std::tolower(static_cast<unsigned char>(raw)));
    current_node = step(current_node, ch);

    int temp_node = current_node;
    while (temp_node > 0) {
      for (int pattern_idx : trie_[temp_node].pattern_indices) {
        ++counts[static_cast<size_t>(pattern_idx)];
      }
      temp_node = trie_[temp_node].output_link;
    }
  }
  return counts;
}

} // namespace Utils
