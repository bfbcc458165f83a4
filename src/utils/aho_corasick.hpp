#ifndef AHO_CORASICK_HPP
#define AHO_CORASICK_HPP

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace Utils {

// Multi-keyword matcher. Patterns and text are compared ASCII
// case-insensitively.
class AhoCorasick {
public:
  struct Match {
    size_t pattern_index;
    size_t end_position; // one past the last matched character
  };

  explicit AhoCorasick(const std::vector<std::string> &patterns);

  std::vector<Match> find_all(std::string_view text) const;

  // Earliest end position per pattern, npos where the pattern never occurs.
  std::vector<size_t> first_end_positions(std::string_view text) const;

  size_t pattern_length(size_t index) const { return pattern_lengths_[index]; }

private:
  struct TrieNode {
    std::unordered_map<char, int> children;
    int suffix_link = 0; // Default to root
    int output_link = 0; // Default to root
    std::vector<size_t> pattern_indices;
  };

  template <typename Visitor>
  void scan(std::string_view text, Visitor &&visit) const;

  std::vector<TrieNode> trie_;
  std::vector<size_t> pattern_lengths_;
};

} // namespace Utils

#endif // AHO_CORASICK_HPP
