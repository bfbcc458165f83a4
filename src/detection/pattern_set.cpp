#include "pattern_set.hpp"

#include <string>
#include <utility>

CompiledPatternSet::CompiledPatternSet(const std::vector<PatternSpec> &patterns)
    : specs_(patterns) {
  std::vector<std::string> keyword_texts;
  regexes_.reserve(specs_.size());
  keyword_slot_.reserve(specs_.size());

  for (const auto &spec : specs_) {
    if (spec.type == PatternType::REGEX) {
      regexes_.emplace_back(std::regex(
          spec.expression, std::regex::ECMAScript | std::regex::icase));
      keyword_slot_.push_back(std::string::npos);
      regex_count_++;
    } else {
      regexes_.emplace_back(std::nullopt);
      keyword_slot_.push_back(keyword_texts.size());
      keyword_texts.push_back(spec.expression);
    }
  }

  if (!keyword_texts.empty())
    keywords_ = std::make_unique<Utils::AhoCorasick>(keyword_texts);
}

std::optional<CompiledPatternSet::Match>
CompiledPatternSet::find_first(std::string_view haystack,
                               size_t max_regex_bytes) const {
  std::string_view regex_input = haystack.substr(0, max_regex_bytes);

  // One automaton pass answers every keyword at once
  std::vector<size_t> keyword_ends;
  if (keywords_)
    keyword_ends = keywords_->first_end_positions(haystack);

  for (size_t i = 0; i < specs_.size(); ++i) {
    if (regexes_[i]) {
      std::match_results<std::string_view::const_iterator> m;
      if (std::regex_search(regex_input.begin(), regex_input.end(), m,
                            *regexes_[i])) {
        return Match{i, static_cast<size_t>(m.position(0)),
                     static_cast<size_t>(m.length(0))};
      }
      continue;
    }

    size_t slot = keyword_slot_[i];
    size_t end = keyword_ends[slot];
    if (end != std::string::npos) {
      size_t length = keywords_->pattern_length(slot);
      return Match{i, end - length, length};
    }
  }
  return std::nullopt;
}
