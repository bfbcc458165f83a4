#include "report/severity_aggregator.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

using TestHelpers::make_event;

namespace {

Finding make_finding(const std::string &ip, DetectionKind kind,
                     Severity severity, uint64_t line,
                     const std::string &rule_id = "rule") {
  LogEntry trigger =
      make_event(ip, TestHelpers::BASE_TIME_MS + line * 1000, 401, "POST",
                 "/login", line);
  Evidence evidence;
  evidence.pattern_id = "p";
  return Finding(trigger, rule_id, kind, severity, evidence);
}

} // namespace

TEST(SeverityAggregatorTest, GroupsByAddressInFirstSeenOrder) {
  std::vector<Finding> findings = {
      make_finding("10.0.0.2", DetectionKind::SCANNING, Severity::MEDIUM, 1),
      make_finding("10.0.0.1", DetectionKind::SQL_INJECTION,
                   Severity::CRITICAL, 2),
      make_finding("10.0.0.2", DetectionKind::BRUTE_FORCE, Severity::HIGH, 3),
      make_finding("10.0.0.2", DetectionKind::SCANNING, Severity::LOW, 4)};

  RunStatistics stats;
  stats.lines_read = 10;
  SeverityAggregator aggregator;
  Report report = aggregator.aggregate(findings, stats);

  EXPECT_EQ(report.total_findings, 4u);
  EXPECT_EQ(report.stats.lines_read, 10u);
  ASSERT_EQ(report.addresses.size(), 2u);
  EXPECT_EQ(report.addresses[0].source_address, "10.0.0.2");
  EXPECT_EQ(report.addresses[1].source_address, "10.0.0.1");

  const AddressReport &first = report.addresses[0];
  EXPECT_EQ(first.max_severity, Severity::HIGH);
  ASSERT_EQ(first.findings.size(), 3u);
  // Detection order is kept within an address
  EXPECT_EQ(first.findings[0].associated_log_line, 1u);
  EXPECT_EQ(first.findings[1].associated_log_line, 3u);
  EXPECT_EQ(first.findings[2].associated_log_line, 4u);
  EXPECT_EQ(first.kind_counts.at(DetectionKind::SCANNING), 2u);
  EXPECT_EQ(first.kind_counts.at(DetectionKind::BRUTE_FORCE), 1u);

  const AddressReport *second = report.find("10.0.0.1");
  ASSERT_NE(second, nullptr);
  EXPECT_EQ(second->max_severity, Severity::CRITICAL);
  EXPECT_EQ(report.find("192.0.2.1"), nullptr);
}

TEST(SeverityAggregatorTest, EmptyInputGivesEmptyReport) {
  SeverityAggregator aggregator;
  Report report = aggregator.aggregate({}, RunStatistics{});
  EXPECT_TRUE(report.addresses.empty());
  EXPECT_EQ(report.total_findings, 0u);
}

TEST(SeverityAggregatorTest, FrequentViolationsEscalateClassification) {
  std::vector<Finding> findings;
  for (uint64_t i = 0; i < 7; ++i)
    findings.push_back(
        make_finding("10.0.0.3", DetectionKind::SCANNING, Severity::LOW, i));
  for (uint64_t i = 0; i < 10; ++i)
    findings.push_back(
        make_finding("10.0.0.4", DetectionKind::SCANNING, Severity::LOW, i));
  for (uint64_t i = 0; i < 6; ++i)
    findings.push_back(
        make_finding("10.0.0.5", DetectionKind::SCANNING, Severity::LOW, i));

  SeverityAggregator aggregator; // medium at 7, high at 10
  Report report = aggregator.aggregate(findings, RunStatistics{});

  EXPECT_EQ(report.find("10.0.0.3")->classified_severity, Severity::MEDIUM);
  EXPECT_EQ(report.find("10.0.0.4")->classified_severity, Severity::HIGH);
  EXPECT_EQ(report.find("10.0.0.5")->classified_severity, Severity::LOW);
  // The findings themselves are not altered
  EXPECT_EQ(report.find("10.0.0.4")->max_severity, Severity::LOW);
  EXPECT_EQ(report.find("10.0.0.4")->findings[0].severity, Severity::LOW);
}

TEST(SeverityAggregatorTest, EscalationNeverLowersSeverity) {
  std::vector<Finding> findings;
  for (uint64_t i = 0; i < 8; ++i)
    findings.push_back(make_finding("10.0.0.6", DetectionKind::SQL_INJECTION,
                                    Severity::CRITICAL, i));

  SeverityAggregator aggregator;
  Report report = aggregator.aggregate(findings, RunStatistics{});
  EXPECT_EQ(report.find("10.0.0.6")->classified_severity, Severity::CRITICAL);
}

TEST(SeverityAggregatorTest, CountsAreTakenPerKind) {
  std::vector<Finding> findings;
  // 9 findings in total but never 7 of one kind
  for (uint64_t i = 0; i < 5; ++i)
    findings.push_back(
        make_finding("10.0.0.7", DetectionKind::SCANNING, Severity::LOW, i));
  for (uint64_t i = 0; i < 4; ++i)
    findings.push_back(make_finding("10.0.0.7", DetectionKind::BRUTE_FORCE,
                                    Severity::LOW, i));

  SeverityAggregator aggregator;
  Report report = aggregator.aggregate(findings, RunStatistics{});
  EXPECT_EQ(report.find("10.0.0.7")->classified_severity, Severity::LOW);
}

TEST(SeverityAggregatorTest, ClassificationCanBeDisabledOrExtended) {
  std::vector<Finding> findings;
  for (uint64_t i = 0; i < 12; ++i)
    findings.push_back(
        make_finding("10.0.0.8", DetectionKind::BRUTE_FORCE, Severity::LOW, i));

  Config::ClassificationConfig disabled;
  disabled.enabled = false;
  EXPECT_EQ(SeverityAggregator(disabled)
                .aggregate(findings, RunStatistics{})
                .addresses[0]
                .classified_severity,
            Severity::LOW);

  Config::ClassificationConfig with_critical;
  with_critical.critical_count = 12;
  EXPECT_EQ(SeverityAggregator(with_critical)
                .aggregate(findings, RunStatistics{})
                .addresses[0]
                .classified_severity,
            Severity::CRITICAL);
}
