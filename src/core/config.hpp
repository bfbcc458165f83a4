#ifndef CONFIG_HPP
#define CONFIG_HPP

#include "detection/rule.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

enum class LogLevel;
enum class LogComponent;

namespace Config {

namespace Keys {

// General Settings
constexpr const char *LOG_INPUT_PATH = "log_input_path";
constexpr const char *REPORT_OUTPUT_PATH = "report_output_path";
constexpr const char *REPORT_TO_STDOUT = "report_to_stdout";
constexpr const char *REPORT_PRETTY_PRINT = "report_pretty_print";
constexpr const char *VERBOSE_PARSE_WARNINGS = "verbose_parse_warnings";
constexpr const char *SORT_BY_TIMESTAMP = "sort_by_timestamp";
constexpr const char *WORKER_SHARDS = "worker_shards";
constexpr const char *MAX_MATCH_BYTES = "max_match_bytes";
constexpr const char *STATE_PRUNING_ENABLED = "state_pruning_enabled";
constexpr const char *STATE_TTL_SECONDS = "state_ttl_seconds";
constexpr const char *STATE_PRUNE_INTERVAL_EVENTS =
    "state_prune_interval_events";

// Logging Settings
constexpr const char *LOGGING_DEFAULT_LEVEL = "default_level";

// Classification Settings
constexpr const char *CL_ENABLED = "enabled";
constexpr const char *CL_MEDIUM_COUNT = "medium_count";
constexpr const char *CL_HIGH_COUNT = "high_count";
constexpr const char *CL_CRITICAL_COUNT = "critical_count";

// Rule Settings ([Rule:<id>] sections)
constexpr const char *RULE_SECTION_PREFIX = "Rule:";
constexpr const char *RULE_KIND = "kind";
constexpr const char *RULE_SEVERITY = "severity";
constexpr const char *RULE_ENABLED = "enabled";
constexpr const char *RULE_PATTERN = "pattern";
constexpr const char *RULE_KEYWORD = "keyword";
constexpr const char *RULE_KEYWORDS = "keywords";
constexpr const char *RULE_THRESHOLD_COUNT = "threshold_count";
constexpr const char *RULE_WINDOW_SECONDS = "window_seconds";
constexpr const char *RULE_FAILURE_STATUS_CODES = "failure_status_codes";
constexpr const char *RULE_METHODS = "methods";
constexpr const char *RULE_REARM_COUNT = "rearm_count";
} // namespace Keys

struct LoggingConfig {
  std::map<LogComponent, LogLevel> log_levels;
};

// Escalates an address's summary severity by how many findings of one kind
// it accumulated. A count of 0 disables that level.
struct ClassificationConfig {
  bool enabled = true;
  size_t medium_count = 7;
  size_t high_count = 10;
  size_t critical_count = 0;
};

struct AppConfig {
  std::string log_input_path = "data/access.log";
  std::string report_output_path;
  bool report_to_stdout = true;
  bool report_pretty_print = true;
  bool verbose_parse_warnings = false;
  bool sort_by_timestamp = false;
  size_t worker_shards = 1;
  size_t max_match_bytes = DEFAULT_MAX_MATCH_BYTES;

  bool state_pruning_enabled = true;
  uint64_t state_ttl_seconds = 3600;
  uint64_t state_prune_interval_events = 100000;

  LoggingConfig logging;
  ClassificationConfig classification;

  // Rules in file order. Empty means "use default_rule_set()".
  std::vector<Rule> rules;

  std::unordered_map<std::string, std::string> custom_settings;

  AppConfig() = default;
};

// Validation functions for configuration parameters
bool validate_classification_config(const ClassificationConfig &config,
                                    std::vector<std::string> &errors);
bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors);

// Parses the INI file into config. Returns false when the file cannot be
// opened (config keeps its defaults). Throws ConfigError when a rule section
// holds a value that cannot be interpreted.
bool parse_config_into(const std::string &filepath, AppConfig &config);

class ConfigManager {
public:
  ConfigManager() = default;
  bool load_configuration(const std::string &filepath);
  std::shared_ptr<const AppConfig> get_config() const;

  // Messages from the last failed validation. Empty when the last load
  // succeeded or only failed to open the file.
  const std::vector<std::string> &get_validation_errors() const {
    return validation_errors_;
  }

private:
  std::string config_filepath_;
  std::vector<std::string> validation_errors_;
  std::shared_ptr<const AppConfig> current_config_ =
      std::make_shared<AppConfig>();
  mutable std::mutex config_mutex_;
};

} // namespace Config

#endif // CONFIG_HPP
