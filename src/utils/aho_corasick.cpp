#include "aho_corasick.hpp"

#include <cctype>
#include <cstddef>
#include <queue>

namespace Utils {

namespace {
inline char fold(char ch) {
  return static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
}
} // namespace

AhoCorasick::AhoCorasick(const std::vector<std::string> &patterns) {
  trie_.emplace_back(); // Root node
  pattern_lengths_.reserve(patterns.size());

  // 1. Build the basic trie structure
  for (size_t i = 0; i < patterns.size(); ++i) {
    pattern_lengths_.push_back(patterns[i].size());
    if (patterns[i].empty())
      continue; // an empty keyword never matches
    int node = 0;
    for (char raw : patterns[i]) {
      char ch = fold(raw);
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
    trie_[node].pattern_indices.push_back(i);
  }

  // 2. Build suffix and output links using BFS
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
      auto it = trie_[j].children.find(ch);
      if (it != trie_[j].children.end() && it->second != v) {
        trie_[v].suffix_link = it->second;
      }
      q.push(v);
    }

    // Output link: nearest proper suffix that ends a pattern
    int suffix_node = trie_[u].suffix_link;
    if (!trie_[suffix_node].pattern_indices.empty()) {
      trie_[u].output_link = suffix_node;
    } else {
      trie_[u].output_link = trie_[suffix_node].output_link;
    }
  }
}

template <typename Visitor>
void AhoCorasick::scan(std::string_view text, Visitor &&visit) const {
  int current_node = 0;

  for (size_t pos = 0; pos < text.size(); ++pos) {
    char ch = fold(text[pos]);
    while (current_node > 0 && trie_[current_node].children.find(ch) ==
                                   trie_[current_node].children.end()) {
      current_node = trie_[current_node].suffix_link;
    }
    auto it = trie_[current_node].children.find(ch);
    if (it != trie_[current_node].children.end()) {
      current_node = it->second;
    }

    int temp_node = current_node;
    while (temp_node > 0) {
      for (size_t pattern_idx : trie_[temp_node].pattern_indices) {
        visit(pattern_idx, pos + 1);
      }
      temp_node = trie_[temp_node].output_link;
    }
  }
}

std::vector<AhoCorasick::Match>
AhoCorasick::find_all(std::string_view text) const {
  std::vector<Match> matches;
  scan(text, [&matches](size_t pattern_idx, size_t end) {
    matches.push_back(Match{pattern_idx, end});
  });
  return matches;
}

std::vector<size_t>
AhoCorasick::first_end_positions(std::string_view text) const {
  std::vector<size_t> first(pattern_lengths_.size(), std::string::npos);
  scan(text, [&first](size_t pattern_idx, size_t end) {
    if (first[pattern_idx] == std::string::npos)
      first[pattern_idx] = end;
  });
  return first;
}

} // namespace Utils
