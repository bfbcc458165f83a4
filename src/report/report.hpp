#ifndef REPORT_HPP
#define REPORT_HPP

#include "core/finding.hpp"
#include "core/run_statistics.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <vector>

struct AddressReport {
  std::string source_address;
  Severity max_severity = Severity::LOW;
  // max_severity, raised by the frequency classification
  Severity classified_severity = Severity::LOW;
  std::map<DetectionKind, size_t> kind_counts;
  std::vector<Finding> findings; // detection order
};

// Result of one run. Addresses are kept in the order they were first seen.
struct Report {
  std::vector<AddressReport> addresses;
  RunStatistics stats;
  size_t total_findings = 0;

  const AddressReport *find(std::string_view address) const {
    for (const auto &entry : addresses)
      if (entry.source_address == address)
        return &entry;
    return nullptr;
  }
};

#endif // REPORT_HPP
