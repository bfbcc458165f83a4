#ifndef FINDING_HPP
#define FINDING_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

struct LogEntry;

// Total order: LOW < MEDIUM < HIGH < CRITICAL
enum class Severity { LOW = 0, MEDIUM = 1, HIGH = 2, CRITICAL = 3 };

enum class DetectionKind { BRUTE_FORCE, SQL_INJECTION, SCANNING };

const char *severity_to_string(Severity severity);
const char *detection_kind_to_string(DetectionKind kind);
std::optional<Severity> severity_from_string(std::string_view text);
std::optional<DetectionKind> detection_kind_from_string(std::string_view text);

inline Severity max_severity(Severity a, Severity b) {
  return static_cast<int>(a) >= static_cast<int>(b) ? a : b;
}

struct Evidence {
  // Pattern rules
  std::string matched_text;
  std::string pattern_id;
  std::string matched_field; // "path", "query" or "user_agent"

  // Frequency rules
  std::vector<uint64_t> contributing_timestamps_ms;

  size_t contributing_count() const {
    return contributing_timestamps_ms.size();
  }
  uint64_t time_span_ms() const {
    if (contributing_timestamps_ms.empty())
      return 0;
    return contributing_timestamps_ms.back() -
           contributing_timestamps_ms.front();
  }

  bool operator==(const Evidence &other) const {
    return matched_text == other.matched_text &&
           pattern_id == other.pattern_id &&
           matched_field == other.matched_field &&
           contributing_timestamps_ms == other.contributing_timestamps_ms;
  }
};

struct Finding {
  std::string source_address;
  std::string rule_id;
  DetectionKind kind;
  Severity severity;
  Evidence evidence;
  uint64_t detected_at_ms;

  uint64_t associated_log_line;
  std::string raw_log_trigger_sample;

  Finding(const LogEntry &trigger, std::string_view rule_id,
          DetectionKind kind, Severity severity, Evidence evidence);

  bool operator==(const Finding &other) const;
  bool operator!=(const Finding &other) const { return !(*this == other); }
};

#endif // FINDING_HPP
