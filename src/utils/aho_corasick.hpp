#ifndef AHO_CORASICK_HPP
#define AHO_CORASICK_HPP

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace Utils {

// Multi-pattern matcher. Patterns are stored lower-cased and the scanned text
// is lower-cased on the fly, so matching is ASCII case-insensitive.
class AhoCorasick {
public:
  explicit AhoCorasick(const std::vector<std::string> &patterns);

  // Number of (possibly overlapping) occurrences of each pattern, indexed
  // like the constructor argument.
  std::vector<size_t> count_matches(std::string_view text) const;

  size_t pattern_count() const { return patterns_.size(); }

private:
  struct TrieNode {
    std::unordered_map<char, int> children;
    int suffix_link = 0; // Default to root
    int output_link = 0; // Default to root
    std::vector<int> pattern_indices;
  };

  int step(int node, char ch) const;

  std::vector<TrieNode> trie_;
  std::vector<std::string> patterns_;
};

} // namespace Utils

#endif // AHO_CORASICK_HPP
