#include "severity_aggregator.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <string>
#include <unordered_map>

SeverityAggregator::SeverityAggregator(const Config::ClassificationConfig &cfg)
    : classification_(cfg) {}

Severity SeverityAggregator::escalation_for(const AddressReport &address) const {
  if (!classification_.enabled)
    return Severity::LOW;

  size_t busiest = 0;
  for (const auto &[kind, count] : address.kind_counts)
    busiest = std::max(busiest, count);

  auto reached = [busiest](size_t threshold) {
    return threshold > 0 && busiest >= threshold;
  };

  if (reached(classification_.critical_count))
    return Severity::CRITICAL;
  if (reached(classification_.high_count))
    return Severity::HIGH;
  if (reached(classification_.medium_count))
    return Severity::MEDIUM;
  return Severity::LOW;
}

Report SeverityAggregator::aggregate(const std::vector<Finding> &findings,
                                     const RunStatistics &stats) const {
  Report report;
  report.stats = stats;
  report.total_findings = findings.size();

  std::unordered_map<std::string, size_t> index_by_address;
  for (const auto &finding : findings) {
    auto [it, inserted] = index_by_address.emplace(finding.source_address,
                                                   report.addresses.size());
    if (inserted) {
      AddressReport entry;
      entry.source_address = finding.source_address;
      entry.max_severity = finding.severity;
      report.addresses.push_back(std::move(entry));
    }

    AddressReport &entry = report.addresses[it->second];
    entry.max_severity = max_severity(entry.max_severity, finding.severity);
    entry.kind_counts[finding.kind]++;
    entry.findings.push_back(finding);
  }

  for (auto &entry : report.addresses) {
    entry.classified_severity =
        max_severity(entry.max_severity, escalation_for(entry));
    if (entry.classified_severity != entry.max_severity)
      LOG(LogLevel::DEBUG, LogComponent::AGGREGATE,
          entry.source_address
              << " escalated from " << severity_to_string(entry.max_severity)
              << " to " << severity_to_string(entry.classified_severity)
              << " by finding frequency.");
  }

  LOG(LogLevel::INFO, LogComponent::AGGREGATE,
      "Aggregated " << report.total_findings << " finding(s) across "
                    << report.addresses.size() << " address(es).");
  return report;
}
