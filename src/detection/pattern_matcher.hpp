#ifndef PATTERN_MATCHER_HPP
#define PATTERN_MATCHER_HPP

#include "detection/detector.hpp"
#include "detection/pattern_set.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

// Stateless matcher shared by SQL injection and scanning rules. Searches
// "path query user_agent" and reports the first configured pattern found.
class PatternMatcher : public IDetector {
public:
  PatternMatcher(const Rule &rule,
                 std::shared_ptr<const CompiledPatternSet> patterns,
                 size_t max_match_bytes = DEFAULT_MAX_MATCH_BYTES);

  // A regex failure on one event is logged and counted, never propagated.
  std::optional<Finding> evaluate(const LogEntry &event) override;
  const Rule &rule() const override { return rule_; }

  static std::string build_haystack(const LogEntry &event);

  // Events whose haystack was longer than max_match_bytes. Their regexes
  // only saw the leading bytes.
  uint64_t truncated_input_count() const { return truncated_inputs_; }
  uint64_t match_error_count() const { return match_errors_; }

private:
  const Rule &rule_;
  std::shared_ptr<const CompiledPatternSet> patterns_;
  size_t max_match_bytes_;

  uint64_t truncated_inputs_ = 0;
  uint64_t match_errors_ = 0;
};

#endif // PATTERN_MATCHER_HPP
