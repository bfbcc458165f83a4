#ifndef SEVERITY_AGGREGATOR_HPP
#define SEVERITY_AGGREGATOR_HPP

#include "core/config.hpp"
#include "report/report.hpp"

#include <vector>

class SeverityAggregator {
public:
  explicit SeverityAggregator(const Config::ClassificationConfig &cfg = {});

  Report aggregate(const std::vector<Finding> &findings,
                   const RunStatistics &stats) const;

  // Escalation earned by the busiest kind of an address; LOW when no
  // threshold is reached or classification is disabled.
  Severity escalation_for(const AddressReport &address) const;

private:
  Config::ClassificationConfig classification_;
};

#endif // SEVERITY_AGGREGATOR_HPP
