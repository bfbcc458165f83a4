#ifndef RUN_STATISTICS_HPP
#define RUN_STATISTICS_HPP

#include <cstdint>

struct RunStatistics {
  uint64_t lines_read = 0;
  uint64_t events_parsed = 0;
  uint64_t lines_malformed = 0;
  uint64_t lines_bad_timestamp = 0;
  uint64_t events_evaluated = 0;
  // Pattern rule evaluations whose request exceeded max_match_bytes
  uint64_t pattern_inputs_truncated = 0;
  // Pattern rule evaluations abandoned because the regex engine failed
  uint64_t pattern_match_errors = 0;
  bool cancelled = false;

  uint64_t lines_skipped() const {
    return lines_malformed + lines_bad_timestamp;
  }

  void merge(const RunStatistics &other) {
    lines_read += other.lines_read;
    events_parsed += other.events_parsed;
    lines_malformed += other.lines_malformed;
    lines_bad_timestamp += other.lines_bad_timestamp;
    events_evaluated += other.events_evaluated;
    pattern_inputs_truncated += other.pattern_inputs_truncated;
    pattern_match_errors += other.pattern_match_errors;
    cancelled = cancelled || other.cancelled;
  }

  bool operator==(const RunStatistics &other) const {
    return lines_read == other.lines_read &&
           events_parsed == other.events_parsed &&
           lines_malformed == other.lines_malformed &&
           lines_bad_timestamp == other.lines_bad_timestamp &&
           events_evaluated == other.events_evaluated &&
           pattern_inputs_truncated == other.pattern_inputs_truncated &&
           pattern_match_errors == other.pattern_match_errors &&
           cancelled == other.cancelled;
  }
};

#endif // RUN_STATISTICS_HPP
