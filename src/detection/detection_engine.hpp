#ifndef DETECTION_ENGINE_HPP
#define DETECTION_ENGINE_HPP

#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/finding.hpp"
#include "core/log_entry.hpp"
#include "core/run_statistics.hpp"
#include "detection/detector.hpp"
#include "detection/frequency_detector.hpp"
#include "detection/pattern_matcher.hpp"
#include "detection/rule_registry.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

struct EngineRunResult {
  std::vector<Finding> findings;
  RunStatus status = RunStatus::COMPLETED;
  // Events (or lines, for run_lines) taken from the input before returning.
  // On CANCELLED_EARLY the caller resumes with input[events_consumed..].
  size_t events_consumed = 0;
  RunStatistics stats;
};

// Runs every registered rule against each event, in input order. Owns the
// detectors and therefore all brute-force window state; one engine is meant
// to be driven by a single thread.
class DetectionEngine {
public:
  DetectionEngine(std::shared_ptr<const RuleRegistry> registry,
                  const Config::AppConfig &cfg);
  ~DetectionEngine();

  DetectionEngine(const DetectionEngine &) = delete;
  DetectionEngine &operator=(const DetectionEngine &) = delete;

  // The stop flag is checked before each event. Detector state survives a
  // cancelled run so that a second call with the remaining input resumes.
  EngineRunResult run(const std::vector<LogEntry> &events,
                      const std::atomic<bool> *stop = nullptr);

  // Parses then evaluates. Line numbers continue across calls.
  EngineRunResult run_lines(const std::vector<std::string> &lines,
                            const std::atomic<bool> *stop = nullptr);

  // Evaluates one event against all rules in registry order.
  std::vector<Finding> evaluate(const LogEntry &event);

  // Parses a batch of raw lines numbered from first_line_number, counting
  // skipped lines into stats.
  static std::vector<LogEntry> parse_lines(const std::vector<std::string> &lines,
                                           uint64_t first_line_number,
                                           bool verbose_warnings,
                                           RunStatistics &stats);

  void run_pruning(uint64_t current_timestamp_ms);
  uint64_t get_max_timestamp_seen() const { return max_timestamp_seen_ms_; }
  void reset_in_memory_state();

  size_t get_tracked_address_count() const;
  // Totals over the engine's lifetime, summed across pattern rules.
  uint64_t get_truncated_input_count() const;
  uint64_t get_match_error_count() const;
  const RuleRegistry &registry() const { return *registry_; }
  // For tests: the brute-force detector bound to rule_id, if any.
  const FrequencyDetector *frequency_detector(const std::string &rule_id) const;

private:
  std::shared_ptr<const RuleRegistry> registry_;

  std::vector<std::unique_ptr<IDetector>> detectors_;
  std::vector<FrequencyDetector *> frequency_detectors_;
  std::vector<PatternMatcher *> pattern_matchers_;

  bool verbose_parse_warnings_;
  size_t max_match_bytes_;
  bool state_pruning_enabled_;
  uint64_t state_ttl_ms_;
  uint64_t prune_interval_events_;

  uint64_t events_since_prune_ = 0;
  uint64_t max_timestamp_seen_ms_ = 0;
  uint64_t next_line_number_ = 1;
};

#endif // DETECTION_ENGINE_HPP
