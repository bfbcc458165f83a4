#include "json_report_writer.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"

#include <fstream>
#include <string>

nlohmann::json JsonReportWriter::evidence_to_json_object(const Finding &finding) {
  const Evidence &evidence = finding.evidence;
  nlohmann::json j;
  if (finding.kind == DetectionKind::BRUTE_FORCE) {
    j["contributing_count"] = evidence.contributing_count();
    j["time_span_ms"] = evidence.time_span_ms();
    j["contributing_timestamps_ms"] = evidence.contributing_timestamps_ms;
  } else {
    j["pattern_id"] = evidence.pattern_id;
    j["matched_text"] = evidence.matched_text;
    j["matched_field"] = evidence.matched_field;
  }
  return j;
}

nlohmann::json JsonReportWriter::finding_to_json_object(const Finding &finding) {
  nlohmann::json j;
  j["rule_id"] = finding.rule_id;
  j["kind"] = detection_kind_to_string(finding.kind);
  j["severity"] = severity_to_string(finding.severity);
  j["detected_at_ms"] = finding.detected_at_ms;
  j["line_number"] = finding.associated_log_line;
  j["evidence"] = evidence_to_json_object(finding);
  j["raw_log_line"] = finding.raw_log_trigger_sample;
  return j;
}

nlohmann::json JsonReportWriter::summary_to_json_object(const Report &report) {
  const RunStatistics &stats = report.stats;
  RunStatus status =
      stats.cancelled ? RunStatus::CANCELLED_EARLY : RunStatus::COMPLETED;
  return {{"status", run_status_to_string(status)},
          {"lines_read", stats.lines_read},
          {"events_parsed", stats.events_parsed},
          {"lines_malformed", stats.lines_malformed},
          {"lines_bad_timestamp", stats.lines_bad_timestamp},
          {"events_evaluated", stats.events_evaluated},
          {"pattern_inputs_truncated", stats.pattern_inputs_truncated},
          {"pattern_match_errors", stats.pattern_match_errors},
          {"cancelled", stats.cancelled},
          {"total_findings", report.total_findings},
          {"address_count", report.addresses.size()}};
}

nlohmann::json JsonReportWriter::report_to_json_object(const Report &report) {
  nlohmann::json j;
  j["summary"] = summary_to_json_object(report);

  // Array, not object, so the address order survives serialisation
  nlohmann::json j_addresses = nlohmann::json::array();
  for (const auto &entry : report.addresses) {
    nlohmann::json j_address;
    j_address["source_address"] = entry.source_address;
    j_address["max_severity"] = severity_to_string(entry.max_severity);
    j_address["classified_severity"] =
        severity_to_string(entry.classified_severity);
    j_address["finding_count"] = entry.findings.size();

    nlohmann::json j_kinds = nlohmann::json::object();
    for (const auto &[kind, count] : entry.kind_counts)
      j_kinds[detection_kind_to_string(kind)] = count;
    j_address["kind_counts"] = j_kinds;

    nlohmann::json j_findings = nlohmann::json::array();
    for (const auto &finding : entry.findings)
      j_findings.push_back(finding_to_json_object(finding));
    j_address["findings"] = j_findings;

    j_addresses.push_back(j_address);
  }
  j["addresses"] = j_addresses;
  return j;
}

std::string JsonReportWriter::format_report_to_json(const Report &report,
                                                    bool pretty) {
  return report_to_json_object(report).dump(
      pretty ? 2 : -1, ' ', false, nlohmann::json::error_handler_t::replace);
}

void JsonReportWriter::write_report(const Report &report, std::ostream &out,
                                    bool pretty) {
  out << format_report_to_json(report, pretty) << '\n';
  out.flush();
}

bool JsonReportWriter::write_report_to_file(const Report &report,
                                            const std::string &filepath,
                                            bool pretty) {
  std::ofstream out(filepath, std::ios::out | std::ios::trunc);
  if (!out.is_open()) {
    LOG(LogLevel::ERROR, LogComponent::IO_REPORT,
        "Could not open report file for writing: " << filepath);
    return false;
  }
  write_report(report, out, pretty);
  if (!out) {
    LOG(LogLevel::ERROR, LogComponent::IO_REPORT,
        "Failed while writing report file: " << filepath);
    return false;
  }
  LOG(LogLevel::INFO, LogComponent::IO_REPORT,
      "Report written to " << filepath);
  return true;
}
