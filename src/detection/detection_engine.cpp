#include "detection_engine.hpp"
#include "core/logger.hpp"
#include "detection/pattern_matcher.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

DetectionEngine::DetectionEngine(std::shared_ptr<const RuleRegistry> registry,
                                 const Config::AppConfig &cfg)
    : registry_(std::move(registry)),
      verbose_parse_warnings_(cfg.verbose_parse_warnings),
      max_match_bytes_(cfg.max_match_bytes),
      state_pruning_enabled_(cfg.state_pruning_enabled),
      state_ttl_ms_(cfg.state_ttl_seconds * 1000),
      prune_interval_events_(cfg.state_prune_interval_events) {
  for (const auto &entry : registry_->all_rules()) {
    if (entry.rule.is_pattern_rule()) {
      auto matcher = std::make_unique<PatternMatcher>(
          entry.rule, entry.patterns, max_match_bytes_);
      pattern_matchers_.push_back(matcher.get());
      detectors_.push_back(std::move(matcher));
    } else {
      auto detector = std::make_unique<FrequencyDetector>(entry.rule);
      frequency_detectors_.push_back(detector.get());
      detectors_.push_back(std::move(detector));
    }
  }
  LOG(LogLevel::DEBUG, LogComponent::ENGINE,
      "DetectionEngine created with " << detectors_.size() << " detector(s), "
                                      << frequency_detectors_.size()
                                      << " stateful.");
}

DetectionEngine::~DetectionEngine() {}

std::vector<Finding> DetectionEngine::evaluate(const LogEntry &event) {
  std::vector<Finding> findings;
  for (auto &detector : detectors_) {
    if (auto finding = detector->evaluate(event))
      findings.push_back(std::move(*finding));
  }

  max_timestamp_seen_ms_ =
      std::max(max_timestamp_seen_ms_, event.parsed_timestamp_ms);

  if (state_pruning_enabled_ && prune_interval_events_ > 0 &&
      ++events_since_prune_ >= prune_interval_events_) {
    events_since_prune_ = 0;
    run_pruning(max_timestamp_seen_ms_);
  }
  return findings;
}

EngineRunResult DetectionEngine::run(const std::vector<LogEntry> &events,
                                     const std::atomic<bool> *stop) {
  EngineRunResult result;
  const uint64_t truncated_before = get_truncated_input_count();
  const uint64_t errors_before = get_match_error_count();
  for (const auto &event : events) {
    if (stop && stop->load()) {
      result.status = RunStatus::CANCELLED_EARLY;
      break;
    }
    auto findings = evaluate(event);
    std::move(findings.begin(), findings.end(),
              std::back_inserter(result.findings));
    result.events_consumed++;
  }

  result.stats.events_evaluated = result.events_consumed;
  result.stats.pattern_inputs_truncated =
      get_truncated_input_count() - truncated_before;
  result.stats.pattern_match_errors = get_match_error_count() - errors_before;
  result.stats.cancelled = result.status == RunStatus::CANCELLED_EARLY;
  if (result.stats.cancelled)
    LOG(LogLevel::INFO, LogComponent::ENGINE,
        "Run cancelled after " << result.events_consumed << " of "
                               << events.size() << " events.");
  return result;
}

EngineRunResult DetectionEngine::run_lines(const std::vector<std::string> &lines,
                                           const std::atomic<bool> *stop) {
  EngineRunResult result;
  const uint64_t truncated_before = get_truncated_input_count();
  const uint64_t errors_before = get_match_error_count();
  for (const auto &line : lines) {
    if (stop && stop->load()) {
      result.status = RunStatus::CANCELLED_EARLY;
      break;
    }
    uint64_t line_number = next_line_number_++;
    result.stats.lines_read++;
    result.events_consumed++;

    ParseError error = ParseError::NONE;
    auto event = LogEntry::parse_from_string(line, line_number, &error,
                                             verbose_parse_warnings_);
    if (!event) {
      if (error == ParseError::BAD_TIMESTAMP)
        result.stats.lines_bad_timestamp++;
      else
        result.stats.lines_malformed++;
      continue;
    }
    result.stats.events_parsed++;

    auto findings = evaluate(*event);
    std::move(findings.begin(), findings.end(),
              std::back_inserter(result.findings));
    result.stats.events_evaluated++;
  }

  result.stats.pattern_inputs_truncated =
      get_truncated_input_count() - truncated_before;
  result.stats.pattern_match_errors = get_match_error_count() - errors_before;
  result.stats.cancelled = result.status == RunStatus::CANCELLED_EARLY;
  return result;
}

std::vector<LogEntry>
DetectionEngine::parse_lines(const std::vector<std::string> &lines,
                             uint64_t first_line_number, bool verbose_warnings,
                             RunStatistics &stats) {
  std::vector<LogEntry> events;
  events.reserve(lines.size());
  uint64_t line_number = first_line_number;
  for (const auto &line : lines) {
    stats.lines_read++;
    ParseError error = ParseError::NONE;
    auto event = LogEntry::parse_from_string(line, line_number++, &error,
                                             verbose_warnings);
    if (event) {
      stats.events_parsed++;
      events.push_back(std::move(*event));
    } else if (error == ParseError::BAD_TIMESTAMP) {
      stats.lines_bad_timestamp++;
    } else {
      stats.lines_malformed++;
    }
  }
  return events;
}

void DetectionEngine::run_pruning(uint64_t current_timestamp_ms) {
  size_t removed = 0;
  for (auto *detector : frequency_detectors_)
    removed += detector->prune_idle(current_timestamp_ms, state_ttl_ms_);

  LOG(LogLevel::DEBUG, LogComponent::STATE_PRUNE,
      "Pruned " << removed << " idle address window(s) older than "
                << state_ttl_ms_ << " ms before " << current_timestamp_ms);
}

void DetectionEngine::reset_in_memory_state() {
  for (auto *detector : frequency_detectors_)
    detector->clear();
  events_since_prune_ = 0;
  max_timestamp_seen_ms_ = 0;
  next_line_number_ = 1;
  LOG(LogLevel::INFO, LogComponent::ENGINE, "Engine state reset.");
}

size_t DetectionEngine::get_tracked_address_count() const {
  size_t total = 0;
  for (const auto *detector : frequency_detectors_)
    total += detector->tracked_address_count();
  return total;
}

uint64_t DetectionEngine::get_truncated_input_count() const {
  uint64_t total = 0;
  for (const auto *matcher : pattern_matchers_)
    total += matcher->truncated_input_count();
  return total;
}

uint64_t DetectionEngine::get_match_error_count() const {
  uint64_t total = 0;
  for (const auto *matcher : pattern_matchers_)
    total += matcher->match_error_count();
  return total;
}

const FrequencyDetector *
DetectionEngine::frequency_detector(const std::string &rule_id) const {
  for (const auto *detector : frequency_detectors_)
    if (detector->rule().id == rule_id)
      return detector;
  return nullptr;
}
