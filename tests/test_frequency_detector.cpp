#include "detection/frequency_detector.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

using TestHelpers::make_event;

namespace {

constexpr uint64_t SEC = 1000;

Rule make_rule(size_t threshold, uint64_t window_ms, size_t rearm = 2) {
  Rule rule;
  rule.id = "brute-force-login";
  rule.kind = DetectionKind::BRUTE_FORCE;
  rule.severity = Severity::HIGH;
  rule.frequency.threshold_count = threshold;
  rule.frequency.window_duration_ms = window_ms;
  rule.frequency.rearm_count = rearm;
  return rule;
}

} // namespace

TEST(FrequencyDetectorTest, FiresExactlyOnceWhenThresholdReached) {
  Rule rule = make_rule(5, 60 * SEC);
  FrequencyDetector detector(rule);

  for (uint64_t t : {0, 10, 20, 30}) {
    EXPECT_FALSE(detector.evaluate(make_event("10.0.0.1", t * SEC, 401)))
        << "No finding expected at t=" << t;
  }

  auto finding = detector.evaluate(make_event("10.0.0.1", 40 * SEC, 401));
  ASSERT_TRUE(finding.has_value());
  EXPECT_EQ(finding->detected_at_ms, 40 * SEC);
  EXPECT_EQ(finding->kind, DetectionKind::BRUTE_FORCE);
  EXPECT_EQ(finding->evidence.contributing_count(), 5u);
  EXPECT_EQ(finding->evidence.time_span_ms(), 40 * SEC);
  EXPECT_EQ(finding->evidence.contributing_timestamps_ms,
            (std::vector<uint64_t>{0, 10 * SEC, 20 * SEC, 30 * SEC, 40 * SEC}));
}

TEST(FrequencyDetectorTest, DoesNotReportTheSameBurstTwice) {
  Rule rule = make_rule(5, 60 * SEC);
  FrequencyDetector detector(rule);

  int findings = 0;
  for (uint64_t t : {0, 10, 20, 30, 40})
    if (detector.evaluate(make_event("10.0.0.1", t * SEC, 401)))
      findings++;
  ASSERT_EQ(findings, 1);

  // After a finding the window holds threshold - rearm entries
  EXPECT_EQ(detector.window_snapshot("10.0.0.1").size(), 3u);

  EXPECT_FALSE(detector.evaluate(make_event("10.0.0.1", 45 * SEC, 401)));

  auto second = detector.evaluate(make_event("10.0.0.1", 50 * SEC, 401));
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(second->evidence.contributing_timestamps_ms,
            (std::vector<uint64_t>{20 * SEC, 30 * SEC, 40 * SEC, 45 * SEC,
                                   50 * SEC}));
}

TEST(FrequencyDetectorTest, EventsOutsideWindowExpire) {
  Rule rule = make_rule(2, 60 * SEC);
  FrequencyDetector detector(rule);

  EXPECT_FALSE(detector.evaluate(make_event("10.0.0.2", 0, 401)));
  EXPECT_FALSE(detector.evaluate(make_event("10.0.0.2", 65 * SEC, 401)));
  EXPECT_EQ(detector.window_snapshot("10.0.0.2"),
            (std::vector<uint64_t>{65 * SEC}));
}

TEST(FrequencyDetectorTest, EventOnWindowBoundaryIsKept) {
  Rule rule = make_rule(2, 60 * SEC);
  FrequencyDetector detector(rule);

  EXPECT_FALSE(detector.evaluate(make_event("10.0.0.2", 0, 401)));
  EXPECT_TRUE(detector.evaluate(make_event("10.0.0.2", 60 * SEC, 401)));
}

TEST(FrequencyDetectorTest, NonQualifyingEventsLeaveStateUntouched) {
  Rule rule = make_rule(2, 60 * SEC);
  rule.frequency.methods = {"POST"};
  FrequencyDetector detector(rule);

  EXPECT_FALSE(detector.evaluate(make_event("10.0.0.3", 0, 200)));
  EXPECT_FALSE(detector.evaluate(make_event("10.0.0.3", SEC, 500)));
  EXPECT_FALSE(detector.evaluate(make_event("10.0.0.3", 2 * SEC, 401, "GET")));
  EXPECT_EQ(detector.tracked_address_count(), 0u);

  // Method comparison ignores case
  EXPECT_FALSE(detector.evaluate(make_event("10.0.0.3", 3 * SEC, 403, "post")));
  EXPECT_TRUE(detector.evaluate(make_event("10.0.0.3", 4 * SEC, 401, "POST")));
}

TEST(FrequencyDetectorTest, AddressesAreTrackedIndependently) {
  Rule rule = make_rule(3, 60 * SEC);
  FrequencyDetector detector(rule);

  for (uint64_t t : {0, 1, 2}) {
    auto a = detector.evaluate(make_event("10.0.0.10", t * SEC, 401));
    auto b = detector.evaluate(make_event("10.0.0.11", t * SEC + 500, 401));
    if (t < 2) {
      EXPECT_FALSE(a);
      EXPECT_FALSE(b);
    } else {
      ASSERT_TRUE(a);
      ASSERT_TRUE(b);
      EXPECT_EQ(a->source_address, "10.0.0.10");
      EXPECT_EQ(b->source_address, "10.0.0.11");
    }
  }
  EXPECT_EQ(detector.tracked_address_count(), 2u);
}

TEST(FrequencyDetectorTest, TiesAreAllCounted) {
  Rule rule = make_rule(3, 60 * SEC);
  FrequencyDetector detector(rule);

  EXPECT_FALSE(detector.evaluate(make_event("10.0.0.4", 5 * SEC, 401)));
  EXPECT_FALSE(detector.evaluate(make_event("10.0.0.4", 5 * SEC, 401)));
  auto finding = detector.evaluate(make_event("10.0.0.4", 5 * SEC, 401));
  ASSERT_TRUE(finding.has_value());
  EXPECT_EQ(finding->evidence.contributing_count(), 3u);
  EXPECT_EQ(finding->evidence.time_span_ms(), 0u);
}

TEST(FrequencyDetectorTest, LateEventsAreInsertedInOrder) {
  Rule rule = make_rule(4, 60 * SEC);
  FrequencyDetector detector(rule);

  detector.evaluate(make_event("10.0.0.5", 30 * SEC, 401));
  detector.evaluate(make_event("10.0.0.5", 10 * SEC, 401));
  detector.evaluate(make_event("10.0.0.5", 20 * SEC, 401));

  EXPECT_EQ(detector.window_snapshot("10.0.0.5"),
            (std::vector<uint64_t>{10 * SEC, 20 * SEC, 30 * SEC}));
  EXPECT_EQ(detector.latest_timestamp("10.0.0.5").value_or(0), 30 * SEC);

  auto finding = detector.evaluate(make_event("10.0.0.5", 25 * SEC, 401));
  ASSERT_TRUE(finding.has_value());
  // Detection time is the triggering event's, even when it is late
  EXPECT_EQ(finding->detected_at_ms, 25 * SEC);
  EXPECT_EQ(finding->evidence.contributing_timestamps_ms,
            (std::vector<uint64_t>{10 * SEC, 20 * SEC, 25 * SEC, 30 * SEC}));
}

TEST(FrequencyDetectorTest, StaleLateEventIsAbsorbed) {
  Rule rule = make_rule(2, 60 * SEC);
  FrequencyDetector detector(rule);

  EXPECT_FALSE(detector.evaluate(make_event("10.0.0.6", 200 * SEC, 401)));
  // Older than the anchor's window: counted as seen but evicted at once
  EXPECT_FALSE(detector.evaluate(make_event("10.0.0.6", 100 * SEC, 401)));
  EXPECT_EQ(detector.window_snapshot("10.0.0.6"),
            (std::vector<uint64_t>{200 * SEC}));
  EXPECT_EQ(detector.latest_timestamp("10.0.0.6").value_or(0), 200 * SEC);
}

TEST(FrequencyDetectorTest, WindowStaysWithinDurationUnderShuffledInput) {
  Rule rule = make_rule(50, 30 * SEC);
  FrequencyDetector detector(rule);

  const uint64_t offsets[] = {5, 90, 12, 40, 41, 200, 150, 151, 199, 3, 180};
  for (uint64_t offset : offsets) {
    detector.evaluate(make_event("10.0.0.7", offset * SEC, 401));

    uint64_t latest = detector.latest_timestamp("10.0.0.7").value_or(0);
    auto window = detector.window_snapshot("10.0.0.7");
    for (size_t i = 0; i < window.size(); ++i) {
      EXPECT_LE(latest - window[i], rule.frequency.window_duration_ms);
      if (i > 0)
        EXPECT_LE(window[i - 1], window[i]);
    }
  }
}

TEST(FrequencyDetectorTest, WindowNeverExceedsThreshold) {
  Rule rule = make_rule(4, 3600 * SEC, 1);
  FrequencyDetector detector(rule);

  int findings = 0;
  for (uint64_t t = 0; t < 40; ++t) {
    if (detector.evaluate(make_event("10.0.0.8", t * SEC, 401)))
      findings++;
    EXPECT_LT(detector.window_snapshot("10.0.0.8").size(),
              rule.frequency.threshold_count);
  }
  // First burst after 4 failures, then one per fresh failure with rearm 1
  EXPECT_EQ(findings, 37);
}

TEST(FrequencyDetectorTest, PruneIdleDropsQuietAddresses) {
  Rule rule = make_rule(5, 60 * SEC);
  FrequencyDetector detector(rule);

  detector.evaluate(make_event("10.0.0.20", 0, 401));
  detector.evaluate(make_event("10.0.0.21", 500 * SEC, 401));

  EXPECT_EQ(detector.prune_idle(600 * SEC, 300 * SEC), 1u);
  EXPECT_EQ(detector.tracked_address_count(), 1u);
  EXPECT_TRUE(detector.window_snapshot("10.0.0.20").empty());
  EXPECT_FALSE(detector.latest_timestamp("10.0.0.20").has_value());

  detector.clear();
  EXPECT_EQ(detector.tracked_address_count(), 0u);
}
