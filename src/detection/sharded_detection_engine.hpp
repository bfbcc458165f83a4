#ifndef SHARDED_DETECTION_ENGINE_HPP
#define SHARDED_DETECTION_ENGINE_HPP

#include "detection/detection_engine.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

// Parallel front end over N private DetectionEngines. Events are routed by a
// hash of the source address, so every address is always seen by the same
// shard and in input order. Findings are returned in input-event order, which
// makes the result identical to a single DetectionEngine over the same input.
class ShardedDetectionEngine {
public:
  ShardedDetectionEngine(std::shared_ptr<const RuleRegistry> registry,
                         const Config::AppConfig &cfg, size_t shard_count);

  // The stop flag is checked by the router before each event. Events already
  // handed to a shard are always finished, so events_consumed is exact and a
  // later call with the remaining events resumes cleanly.
  EngineRunResult run(const std::vector<LogEntry> &events,
                      const std::atomic<bool> *stop = nullptr);

  size_t shard_count() const { return shards_.size(); }
  size_t shard_for(const std::string &address) const;

  size_t get_tracked_address_count() const;
  uint64_t get_truncated_input_count() const;
  uint64_t get_match_error_count() const;
  void reset_in_memory_state();

private:
  std::vector<std::unique_ptr<DetectionEngine>> shards_;
};

#endif // SHARDED_DETECTION_ENGINE_HPP
