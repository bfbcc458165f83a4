#include "finding.hpp"
#include "log_entry.hpp"
#include "utils/utils.hpp"

#include <string>
#include <utility>

const char *severity_to_string(Severity severity) {
  switch (severity) {
  case Severity::LOW:
    return "low";
  case Severity::MEDIUM:
    return "medium";
  case Severity::HIGH:
    return "high";
  case Severity::CRITICAL:
    return "critical";
  }
  return "unknown";
}

const char *detection_kind_to_string(DetectionKind kind) {
  switch (kind) {
  case DetectionKind::BRUTE_FORCE:
    return "brute_force";
  case DetectionKind::SQL_INJECTION:
    return "sql_injection";
  case DetectionKind::SCANNING:
    return "scanning";
  }
  return "unknown";
}

std::optional<Severity> severity_from_string(std::string_view text) {
  std::string lowered = Utils::to_lower_copy(Utils::trim_copy(text));
  if (lowered == "low")
    return Severity::LOW;
  if (lowered == "medium")
    return Severity::MEDIUM;
  if (lowered == "high")
    return Severity::HIGH;
  if (lowered == "critical")
    return Severity::CRITICAL;
  return std::nullopt;
}

std::optional<DetectionKind> detection_kind_from_string(std::string_view text) {
  std::string lowered = Utils::to_lower_copy(Utils::trim_copy(text));
  if (lowered == "brute_force" || lowered == "bruteforce")
    return DetectionKind::BRUTE_FORCE;
  if (lowered == "sql_injection" || lowered == "sqli")
    return DetectionKind::SQL_INJECTION;
  if (lowered == "scanning" || lowered == "scan_pattern")
    return DetectionKind::SCANNING;
  return std::nullopt;
}

Finding::Finding(const LogEntry &trigger, std::string_view rule_id,
                 DetectionKind kind, Severity severity, Evidence evidence)
    : source_address(trigger.ip_address), rule_id(rule_id), kind(kind),
      severity(severity), evidence(std::move(evidence)),
      detected_at_ms(trigger.parsed_timestamp_ms),
      associated_log_line(trigger.original_line_number),
      raw_log_trigger_sample(trigger.raw_log_line) {}

bool Finding::operator==(const Finding &other) const {
  return source_address == other.source_address && rule_id == other.rule_id &&
         kind == other.kind && severity == other.severity &&
         evidence == other.evidence && detected_at_ms == other.detected_at_ms &&
         associated_log_line == other.associated_log_line &&
         raw_log_trigger_sample == other.raw_log_trigger_sample;
}
