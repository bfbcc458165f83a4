#ifndef FREQUENCY_DETECTOR_HPP
#define FREQUENCY_DETECTOR_HPP

#include "detection/detector.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

// Brute-force detector. Keeps, per source address, the timestamps of recent
// qualifying events and fires once threshold_count of them fall within
// window_duration of the latest timestamp seen for that address.
class FrequencyDetector : public IDetector {
public:
  explicit FrequencyDetector(const Rule &rule);

  std::optional<Finding> evaluate(const LogEntry &event) override;
  const Rule &rule() const override { return rule_; }

  bool is_qualifying(const LogEntry &event) const;

  // Drops addresses whose latest timestamp is more than ttl_ms before now_ms.
  // Returns the number of addresses removed.
  size_t prune_idle(uint64_t now_ms, uint64_t ttl_ms);
  void clear() { windows_.clear(); }

  size_t tracked_address_count() const { return windows_.size(); }
  std::vector<uint64_t> window_snapshot(const std::string &address) const;
  std::optional<uint64_t> latest_timestamp(const std::string &address) const;

private:
  struct AddressWindow {
    std::deque<uint64_t> timestamps; // ascending
    uint64_t latest_timestamp_ms = 0;
  };

  void evict_expired(AddressWindow &window) const;

  const Rule &rule_;
  std::unordered_map<std::string, AddressWindow> windows_;
};

#endif // FREQUENCY_DETECTOR_HPP
