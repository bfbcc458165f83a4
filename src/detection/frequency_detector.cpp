#include "frequency_detector.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

FrequencyDetector::FrequencyDetector(const Rule &rule) : rule_(rule) {}

bool FrequencyDetector::is_qualifying(const LogEntry &event) const {
  const FrequencySpec &spec = rule_.frequency;
  if (std::find(spec.failure_status_codes.begin(),
                spec.failure_status_codes.end(),
                event.http_status_code) == spec.failure_status_codes.end())
    return false;

  if (spec.methods.empty())
    return true;

  std::string method = event.request_method;
  std::transform(method.begin(), method.end(), method.begin(), ::toupper);
  return std::find(spec.methods.begin(), spec.methods.end(), method) !=
         spec.methods.end();
}

void FrequencyDetector::evict_expired(AddressWindow &window) const {
  const uint64_t duration = rule_.frequency.window_duration_ms;
  // Avoid underflow if the anchor is less than the duration
  if (window.latest_timestamp_ms < duration)
    return;
  uint64_t cutoff_timestamp = window.latest_timestamp_ms - duration;

  auto first_to_keep = std::lower_bound(
      window.timestamps.begin(), window.timestamps.end(), cutoff_timestamp);
  window.timestamps.erase(window.timestamps.begin(), first_to_keep);
}

std::optional<Finding> FrequencyDetector::evaluate(const LogEntry &event) {
  if (!is_qualifying(event))
    return std::nullopt;

  const uint64_t ts = event.parsed_timestamp_ms;
  AddressWindow &window = windows_[event.ip_address];

  // Equal timestamps go after the ones already present
  auto insert_at =
      std::upper_bound(window.timestamps.begin(), window.timestamps.end(), ts);
  window.timestamps.insert(insert_at, ts);
  window.latest_timestamp_ms = std::max(window.latest_timestamp_ms, ts);

  evict_expired(window);

  const FrequencySpec &spec = rule_.frequency;
  if (window.timestamps.size() < spec.threshold_count) {
    LOG(LogLevel::TRACE, LogComponent::DETECT_FREQUENCY,
        "Rule '" << rule_.id << "': " << event.ip_address << " at "
                 << window.timestamps.size() << "/" << spec.threshold_count);
    return std::nullopt;
  }

  Evidence evidence;
  evidence.contributing_timestamps_ms.assign(window.timestamps.begin(),
                                             window.timestamps.end());

  // Keep only what the next burst may build on
  size_t keep = spec.threshold_count > spec.rearm_count
                    ? spec.threshold_count - spec.rearm_count
                    : 0;
  while (window.timestamps.size() > keep)
    window.timestamps.pop_front();

  LOG(LogLevel::DEBUG, LogComponent::DETECT_FREQUENCY,
      "Rule '" << rule_.id << "' fired for " << event.ip_address << ": "
               << evidence.contributing_count() << " failures within "
               << evidence.time_span_ms() << " ms (line "
               << event.original_line_number << ")");

  return Finding(event, rule_.id, rule_.kind, rule_.severity,
                 std::move(evidence));
}

size_t FrequencyDetector::prune_idle(uint64_t now_ms, uint64_t ttl_ms) {
  size_t removed = 0;
  for (auto it = windows_.begin(); it != windows_.end();) {
    const uint64_t latest = it->second.latest_timestamp_ms;
    if (now_ms > latest && now_ms - latest > ttl_ms) {
      it = windows_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

std::vector<uint64_t>
FrequencyDetector::window_snapshot(const std::string &address) const {
  auto it = windows_.find(address);
  if (it == windows_.end())
    return {};
  return std::vector<uint64_t>(it->second.timestamps.begin(),
                               it->second.timestamps.end());
}

std::optional<uint64_t>
FrequencyDetector::latest_timestamp(const std::string &address) const {
  auto it = windows_.find(address);
  if (it == windows_.end())
    return std::nullopt;
  return it->second.latest_timestamp_ms;
}
