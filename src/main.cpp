#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/log_entry.hpp"
#include "core/logger.hpp"
#include "core/run_statistics.hpp"
#include "detection/detection_engine.hpp"
#include "detection/rule.hpp"
#include "detection/rule_registry.hpp"
#include "detection/sharded_detection_engine.hpp"
#include "io/log_readers/base_log_reader.hpp"
#include "io/log_readers/file_log_reader.hpp"
#include "io/report/json_report_writer.hpp"
#include "report/severity_aggregator.hpp"

#include <algorithm>
#include <atomic>
#include <csignal>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {

enum ExitCode {
  EXIT_OK = 0,
  EXIT_CONFIG_ERROR = 1,
  EXIT_IO_ERROR = 2,
  EXIT_CANCELLED = 3
};

} // namespace

// Global atomic flag for signal handling
std::atomic<bool> g_shutdown_requested = false;

// A simple, safe signal handler function
void signal_handler(int signum) {
  if (signum == SIGINT || signum == SIGTERM)
    g_shutdown_requested = true;
}

int main(int argc, char *argv[]) {
  std::ios_base::sync_with_stdio(false);

  struct sigaction action;
  action.sa_handler = signal_handler;
  sigemptyset(&action.sa_mask);
  action.sa_flags = 0;

  sigaction(SIGINT, &action, NULL);
  sigaction(SIGTERM, &action, NULL);

  // --- Load Configuration ---
  Config::ConfigManager config_manager;
  std::string config_file_to_load = "config.ini";
  if (argc > 1)
    config_file_to_load = argv[1];

  try {
    if (!config_manager.load_configuration(config_file_to_load) &&
        !config_manager.get_validation_errors().empty())
      return EXIT_CONFIG_ERROR;
  } catch (const ConfigError &e) {
    std::cerr << "Configuration error: " << e.what() << std::endl;
    return EXIT_CONFIG_ERROR;
  }

  auto current_config = config_manager.get_config();
  std::string log_input_path = current_config->log_input_path;
  if (argc > 2)
    log_input_path = argv[2];

  // --- Initialize Logging ---
  LogManager::instance().configure(current_config->logging);
  LOG(LogLevel::INFO, LogComponent::CORE, "Threat detector starting up...");

  // --- Rule Registry ---
  std::shared_ptr<const RuleRegistry> registry;
  try {
    if (current_config->rules.empty()) {
      LOG(LogLevel::INFO, LogComponent::CONFIG,
          "No [Rule:*] sections configured, using the built-in rule set.");
      registry = RuleRegistry::load(default_rule_set());
    } else {
      registry = RuleRegistry::load(current_config->rules);
    }
  } catch (const ConfigError &e) {
    LOG(LogLevel::FATAL, LogComponent::RULES_REGISTRY, e.what());
    std::cerr << "Configuration error: " << e.what() << std::endl;
    return EXIT_CONFIG_ERROR;
  }

  // --- Log Reader ---
  std::unique_ptr<ILogReader> log_reader;
  try {
    log_reader = std::make_unique<FileLogReader>(log_input_path);
  } catch (const std::runtime_error &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return EXIT_IO_ERROR;
  }

  // --- Engine ---
  std::unique_ptr<DetectionEngine> engine;
  std::unique_ptr<ShardedDetectionEngine> sharded_engine;
  if (current_config->worker_shards > 1)
    sharded_engine = std::make_unique<ShardedDetectionEngine>(
        registry, *current_config, current_config->worker_shards);
  else
    engine = std::make_unique<DetectionEngine>(registry, *current_config);

  auto run_events = [&](const std::vector<LogEntry> &events) {
    return sharded_engine ? sharded_engine->run(events, &g_shutdown_requested)
                          : engine->run(events, &g_shutdown_requested);
  };

  RunStatistics stats;
  std::vector<Finding> findings;
  std::vector<LogEntry> buffered_events; // only when sorting

  auto absorb = [&](EngineRunResult &&result) {
    std::move(result.findings.begin(), result.findings.end(),
              std::back_inserter(findings));
    stats.merge(result.stats);
  };

  // --- Main Processing Loop ---
  while (!g_shutdown_requested) {
    uint64_t first_line_number = log_reader->lines_read() + 1;
    std::vector<std::string> batch;
    try {
      batch = log_reader->get_next_batch();
    } catch (const std::runtime_error &e) {
      LOG(LogLevel::ERROR, LogComponent::IO_READER, e.what());
      std::cerr << "Error: " << e.what() << std::endl;
      return EXIT_IO_ERROR;
    }
    if (batch.empty())
      break;

    std::vector<LogEntry> events = DetectionEngine::parse_lines(
        batch, first_line_number, current_config->verbose_parse_warnings,
        stats);

    if (current_config->sort_by_timestamp) {
      std::move(events.begin(), events.end(),
                std::back_inserter(buffered_events));
      continue;
    }
    absorb(run_events(events));
  }

  if (current_config->sort_by_timestamp && !g_shutdown_requested) {
    // Stable, so lines sharing a timestamp keep file order
    std::stable_sort(buffered_events.begin(), buffered_events.end(),
                     [](const LogEntry &a, const LogEntry &b) {
                       return a.parsed_timestamp_ms < b.parsed_timestamp_ms;
                     });
    LOG(LogLevel::DEBUG, LogComponent::CORE,
        "Sorted " << buffered_events.size() << " events by timestamp.");
    absorb(run_events(buffered_events));
  }

  if (g_shutdown_requested)
    stats.cancelled = true;

  LOG(LogLevel::INFO, LogComponent::CORE,
      "Processed " << stats.lines_read << " lines: " << stats.events_parsed
                   << " parsed, " << stats.lines_skipped() << " skipped, "
                   << findings.size() << " finding(s).");
  if (stats.pattern_inputs_truncated > 0 || stats.pattern_match_errors > 0)
    LOG(LogLevel::WARN, LogComponent::DETECT_PATTERN,
        stats.pattern_inputs_truncated
            << " pattern evaluation(s) saw a truncated request, "
            << stats.pattern_match_errors << " failed in the regex engine.");

  // --- Report ---
  SeverityAggregator aggregator(current_config->classification);
  Report report = aggregator.aggregate(findings, stats);

  bool report_ok = true;
  if (current_config->report_to_stdout)
    JsonReportWriter::write_report(report, std::cout,
                                   current_config->report_pretty_print);
  if (!current_config->report_output_path.empty())
    report_ok = JsonReportWriter::write_report_to_file(
        report, current_config->report_output_path,
        current_config->report_pretty_print);

  if (!report_ok)
    return EXIT_IO_ERROR;
  if (stats.cancelled) {
    LOG(LogLevel::WARN, LogComponent::CORE,
        "Run was cancelled, the report is partial.");
    return EXIT_CANCELLED;
  }

  LOG(LogLevel::INFO, LogComponent::CORE, "Shutdown complete.");
  return EXIT_OK;
}
