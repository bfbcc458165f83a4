#include "pattern_matcher.hpp"
#include "core/logger.hpp"

#include <regex>
#include <utility>

namespace {

const char *field_at(const LogEntry &event, size_t position) {
  size_t query_start = event.request_path.size() + 1;
  size_t ua_start = query_start + event.request_query.size() + 1;
  if (position < query_start - 1)
    return "path";
  if (position < ua_start - 1)
    return "query";
  return "user_agent";
}

} // namespace

PatternMatcher::PatternMatcher(
    const Rule &rule, std::shared_ptr<const CompiledPatternSet> patterns,
    size_t max_match_bytes)
    : rule_(rule), patterns_(std::move(patterns)),
      max_match_bytes_(max_match_bytes) {}

std::string PatternMatcher::build_haystack(const LogEntry &event) {
  std::string haystack;
  haystack.reserve(event.request_path.size() + event.request_query.size() +
                   event.user_agent.size() + 2);
  haystack += event.request_path;
  haystack += ' ';
  haystack += event.request_query;
  haystack += ' ';
  haystack += event.user_agent;
  return haystack;
}

std::optional<Finding> PatternMatcher::evaluate(const LogEntry &event) {
  const std::string haystack = build_haystack(event);
  if (haystack.size() > max_match_bytes_ && patterns_->has_regex()) {
    truncated_inputs_++;
    LOG(LogLevel::DEBUG, LogComponent::DETECT_PATTERN,
        "Rule '" << rule_.id << "': request on line "
                 << event.original_line_number << " is " << haystack.size()
                 << " bytes, regexes see the first " << max_match_bytes_);
  }

  std::optional<CompiledPatternSet::Match> match;
  try {
    match = patterns_->find_first(haystack, max_match_bytes_);
  } catch (const std::regex_error &e) {
    match_errors_++;
    LOG(LogLevel::WARN, LogComponent::DETECT_PATTERN,
        "Rule '" << rule_.id << "' could not be evaluated on line "
                 << event.original_line_number << ": " << e.what());
    return std::nullopt;
  }
  if (!match)
    return std::nullopt;

  Evidence evidence;
  evidence.matched_text = haystack.substr(match->position, match->length);
  evidence.pattern_id = patterns_->spec(match->pattern_index).id;
  evidence.matched_field = field_at(event, match->position);

  LOG(LogLevel::DEBUG, LogComponent::DETECT_PATTERN,
      "Rule '" << rule_.id << "' pattern '" << evidence.pattern_id
               << "' matched '" << evidence.matched_text << "' in "
               << evidence.matched_field << " from " << event.ip_address
               << " (line " << event.original_line_number << ")");

  return Finding(event, rule_.id, rule_.kind, rule_.severity,
                 std::move(evidence));
}
