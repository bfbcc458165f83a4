#include "sharded_detection_engine.hpp"
#include "core/logger.hpp"
#include "utils/thread_safe_queue.hpp"

#include <functional>
#include <thread>
#include <utility>

namespace {

void shard_worker(size_t shard_id, DetectionEngine &engine,
                  ThreadSafeQueue<size_t> &queue,
                  const std::vector<LogEntry> &events,
                  std::vector<std::vector<Finding>> &findings_by_event) {
  LOG(LogLevel::DEBUG, LogComponent::ENGINE_SHARD,
      "Shard " << shard_id << " started.");

  uint64_t processed_count = 0;
  size_t index = 0;
  while (queue.wait_and_pop(index)) {
    // Each slot is written by exactly one shard
    findings_by_event[index] = engine.evaluate(events[index]);
    processed_count++;
  }

  LOG(LogLevel::DEBUG, LogComponent::ENGINE_SHARD,
      "Shard " << shard_id << " finished. Processed " << processed_count
               << " events.");
}

} // namespace

ShardedDetectionEngine::ShardedDetectionEngine(
    std::shared_ptr<const RuleRegistry> registry, const Config::AppConfig &cfg,
    size_t shard_count) {
  if (shard_count == 0)
    shard_count = 1;
  for (size_t i = 0; i < shard_count; ++i)
    shards_.push_back(std::make_unique<DetectionEngine>(registry, cfg));
  LOG(LogLevel::INFO, LogComponent::ENGINE,
      "Initializing sharded engine with " << shard_count << " shard(s).");
}

size_t ShardedDetectionEngine::shard_for(const std::string &address) const {
  std::hash<std::string> hasher;
  return hasher(address) % shards_.size();
}

EngineRunResult ShardedDetectionEngine::run(const std::vector<LogEntry> &events,
                                            const std::atomic<bool> *stop) {
  EngineRunResult result;
  std::vector<std::vector<Finding>> findings_by_event(events.size());
  const uint64_t truncated_before = get_truncated_input_count();
  const uint64_t errors_before = get_match_error_count();

  std::vector<std::unique_ptr<ThreadSafeQueue<size_t>>> queues;
  std::vector<std::thread> workers;
  for (size_t i = 0; i < shards_.size(); ++i) {
    queues.push_back(std::make_unique<ThreadSafeQueue<size_t>>());
    workers.emplace_back(shard_worker, i, std::ref(*shards_[i]),
                         std::ref(*queues[i]), std::cref(events),
                         std::ref(findings_by_event));
  }

  for (size_t i = 0; i < events.size(); ++i) {
    if (stop && stop->load()) {
      result.status = RunStatus::CANCELLED_EARLY;
      break;
    }
    queues[shard_for(events[i].ip_address)]->push(i);
    result.events_consumed++;
  }

  for (auto &queue : queues)
    queue->close();
  for (auto &worker : workers)
    if (worker.joinable())
      worker.join();

  // Merge back into input order
  for (size_t i = 0; i < result.events_consumed; ++i)
    for (auto &finding : findings_by_event[i])
      result.findings.push_back(std::move(finding));

  result.stats.events_evaluated = result.events_consumed;
  result.stats.pattern_inputs_truncated =
      get_truncated_input_count() - truncated_before;
  result.stats.pattern_match_errors = get_match_error_count() - errors_before;
  result.stats.cancelled = result.status == RunStatus::CANCELLED_EARLY;
  if (result.stats.cancelled)
    LOG(LogLevel::INFO, LogComponent::ENGINE,
        "Sharded run cancelled after " << result.events_consumed << " of "
                                       << events.size() << " events.");
  return result;
}

size_t ShardedDetectionEngine::get_tracked_address_count() const {
  size_t total = 0;
  for (const auto &shard : shards_)
    total += shard->get_tracked_address_count();
  return total;
}

uint64_t ShardedDetectionEngine::get_truncated_input_count() const {
  uint64_t total = 0;
  for (const auto &shard : shards_)
    total += shard->get_truncated_input_count();
  return total;
}

uint64_t ShardedDetectionEngine::get_match_error_count() const {
  uint64_t total = 0;
  for (const auto &shard : shards_)
    total += shard->get_match_error_count();
  return total;
}

void ShardedDetectionEngine::reset_in_memory_state() {
  for (auto &shard : shards_)
    shard->reset_in_memory_state();
}
