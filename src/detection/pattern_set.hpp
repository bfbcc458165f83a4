#ifndef PATTERN_SET_HPP
#define PATTERN_SET_HPP

#include "detection/rule.hpp"
#include "utils/aho_corasick.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

// A rule's patterns compiled once. Regexes become case-insensitive
// std::regex objects, all literal keywords share one Aho-Corasick automaton.
// Immutable after construction and safe to share between threads.
class CompiledPatternSet {
public:
  struct Match {
    size_t pattern_index; // index into the rule's configured patterns
    size_t position;      // offset into the haystack
    size_t length;
  };

  // Throws std::regex_error when a regex pattern does not compile.
  explicit CompiledPatternSet(const std::vector<PatternSpec> &patterns);

  // Returns the match of the first pattern, in configured order, that occurs
  // in haystack. For that pattern the leftmost occurrence is used. Regexes
  // only search the first max_regex_bytes bytes, keywords search everything.
  // May throw std::regex_error if the regex engine gives up on the input.
  std::optional<Match> find_first(std::string_view haystack,
                                  size_t max_regex_bytes) const;

  size_t size() const { return specs_.size(); }
  bool has_regex() const { return regex_count_ > 0; }
  const PatternSpec &spec(size_t index) const { return specs_[index]; }

private:
  std::vector<PatternSpec> specs_;

  // Parallel to specs_: the compiled regex, or the keyword's slot in
  // keywords_.
  std::vector<std::optional<std::regex>> regexes_;
  std::vector<size_t> keyword_slot_;
  size_t regex_count_ = 0;
  std::unique_ptr<Utils::AhoCorasick> keywords_;
};

#endif // PATTERN_SET_HPP
