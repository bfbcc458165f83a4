#ifndef RULE_HPP
#define RULE_HPP

#include "core/finding.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

enum class PatternType { REGEX, KEYWORD };

struct PatternSpec {
  std::string id;
  std::string expression;
  PatternType type = PatternType::REGEX;
};

// Brute-force settings. A qualifying event is one whose status is in
// failure_status_codes and, when methods is non-empty, whose method is listed.
struct FrequencySpec {
  size_t threshold_count = 5;
  uint64_t window_duration_ms = 60000;
  std::vector<int> failure_status_codes = {401, 403};
  std::vector<std::string> methods;

  // Fresh qualifying events needed after a finding before the rule fires
  // again. The window keeps max(threshold_count - rearm_count, 0) entries
  // after a finding.
  size_t rearm_count = 2;
};

struct Rule {
  std::string id;
  DetectionKind kind = DetectionKind::SQL_INJECTION;
  Severity severity = Severity::MEDIUM;
  bool enabled = true;

  std::vector<PatternSpec> patterns; // SQL_INJECTION and SCANNING
  FrequencySpec frequency;           // BRUTE_FORCE

  bool is_pattern_rule() const { return kind != DetectionKind::BRUTE_FORCE; }
};

// Regex patterns only see this many leading bytes of a request. std::regex
// recurses per character, so unbounded input can exhaust the stack.
constexpr size_t DEFAULT_MAX_MATCH_BYTES = 4096;
constexpr size_t MAX_MATCH_BYTES_LIMIT = 16384;

// Signatures used when the configuration does not define any rule.
std::vector<Rule> default_rule_set();

#endif // RULE_HPP
