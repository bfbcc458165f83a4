#include "config.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Config {

LogLevel string_to_log_level(const std::string &level_str_raw) {
  std::string level_str = Utils::trim_copy(level_str_raw);
  std::transform(level_str.begin(), level_str.end(), level_str.begin(),
                 ::toupper);
  if (level_str == "TRACE")
    return LogLevel::TRACE;
  if (level_str == "DEBUG")
    return LogLevel::DEBUG;
  if (level_str == "INFO")
    return LogLevel::INFO;
  if (level_str == "WARN")
    return LogLevel::WARN;
  if (level_str == "ERROR")
    return LogLevel::ERROR;
  if (level_str == "FATAL")
    return LogLevel::FATAL;
  return LogLevel::INFO; // A safe default
}

const std::map<std::string, LogComponent> key_to_component_map = {
    {"core", LogComponent::CORE},
    {"config", LogComponent::CONFIG},
    {"io.reader", LogComponent::IO_READER},
    {"io.report", LogComponent::IO_REPORT},
    {"parser", LogComponent::PARSER},
    {"rules.registry", LogComponent::RULES_REGISTRY},
    {"detect.pattern", LogComponent::DETECT_PATTERN},
    {"detect.frequency", LogComponent::DETECT_FREQUENCY},
    {"engine", LogComponent::ENGINE},
    {"engine.shard", LogComponent::ENGINE_SHARD},
    {"aggregate", LogComponent::AGGREGATE},
    {"state.prune", LogComponent::STATE_PRUNE}};

// Convert string to boolean using common truthy values
bool string_to_bool(const std::string &val_str_raw) {
  std::string val_str = Utils::to_lower_copy(Utils::trim_copy(val_str_raw));
  return (val_str == "true" || val_str == "1" || val_str == "yes" ||
          val_str == "on");
}

namespace {

template <typename T>
T parse_rule_number(const std::string &rule_id, const std::string &key,
                    const std::string &value) {
  auto parsed = Utils::string_to_number<T>(value);
  if (!parsed)
    throw ConfigError(ConfigError::Kind::INVALID_SETTING, rule_id,
                      "'" + key + "' expects a non-negative integer, got '" +
                          value + "'");
  return *parsed;
}

// Applies one key of a [Rule:<id>] section. Unknown keys are reported but do
// not abort the load.
void apply_rule_setting(Rule &rule, bool &kind_seen, const std::string &key,
                        const std::string &value, int line_num) {
  if (key == Keys::RULE_KIND) {
    auto kind = detection_kind_from_string(value);
    if (!kind)
      throw ConfigError(ConfigError::Kind::INVALID_SETTING, rule.id,
                        "unknown rule kind '" + value + "'");
    rule.kind = *kind;
    kind_seen = true;
  } else if (key == Keys::RULE_SEVERITY) {
    auto severity = severity_from_string(value);
    if (!severity)
      throw ConfigError(ConfigError::Kind::INVALID_SETTING, rule.id,
                        "unknown severity '" + value + "'");
    rule.severity = *severity;
  } else if (key == Keys::RULE_ENABLED) {
    rule.enabled = string_to_bool(value);
  } else if (key == Keys::RULE_PATTERN || key.rfind("pattern.", 0) == 0) {
    std::string id = key == Keys::RULE_PATTERN
                         ? "pattern-" + std::to_string(rule.patterns.size() + 1)
                         : key.substr(8);
    rule.patterns.push_back(PatternSpec{id, value, PatternType::REGEX});
  } else if (key == Keys::RULE_KEYWORD || key.rfind("keyword.", 0) == 0) {
    std::string id = key == Keys::RULE_KEYWORD
                         ? "keyword-" + std::to_string(rule.patterns.size() + 1)
                         : key.substr(8);
    rule.patterns.push_back(PatternSpec{id, value, PatternType::KEYWORD});
  } else if (key == Keys::RULE_KEYWORDS) {
    for (auto &keyword : Utils::split_and_trim(value, ','))
      rule.patterns.push_back(
          PatternSpec{"keyword-" + std::to_string(rule.patterns.size() + 1),
                      keyword, PatternType::KEYWORD});
  } else if (key == Keys::RULE_THRESHOLD_COUNT) {
    rule.frequency.threshold_count =
        parse_rule_number<size_t>(rule.id, key, value);
  } else if (key == Keys::RULE_WINDOW_SECONDS) {
    rule.frequency.window_duration_ms =
        parse_rule_number<uint64_t>(rule.id, key, value) * 1000;
  } else if (key == Keys::RULE_FAILURE_STATUS_CODES) {
    rule.frequency.failure_status_codes.clear();
    for (const auto &code : Utils::split_and_trim(value, ','))
      rule.frequency.failure_status_codes.push_back(
          parse_rule_number<int>(rule.id, key, code));
  } else if (key == Keys::RULE_METHODS) {
    rule.frequency.methods.clear();
    for (auto &method : Utils::split_and_trim(value, ',')) {
      std::transform(method.begin(), method.end(), method.begin(), ::toupper);
      rule.frequency.methods.push_back(method);
    }
  } else if (key == Keys::RULE_REARM_COUNT) {
    rule.frequency.rearm_count = parse_rule_number<size_t>(rule.id, key, value);
  } else {
    std::cerr << "Warning (Config Line " << line_num << "): Unknown key '"
              << key << "' in rule '" << rule.id << "'" << std::endl;
  }
}

} // namespace

bool validate_classification_config(const ClassificationConfig &config,
                                    std::vector<std::string> &errors) {
  bool valid = true;
  if (!config.enabled)
    return valid;

  if (config.medium_count > 0 && config.high_count > 0 &&
      config.medium_count >= config.high_count) {
    errors.push_back(
        "Classification medium_count must be less than high_count");
    valid = false;
  }

  if (config.high_count > 0 && config.critical_count > 0 &&
      config.high_count >= config.critical_count) {
    errors.push_back(
        "Classification high_count must be less than critical_count");
    valid = false;
  }

  return valid;
}

bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors) {
  bool valid = true;

  if (config.worker_shards < 1 || config.worker_shards > 256) {
    errors.push_back("worker_shards must be between 1 and 256");
    valid = false;
  }

  if (config.max_match_bytes < 1 ||
      config.max_match_bytes > MAX_MATCH_BYTES_LIMIT) {
    errors.push_back("max_match_bytes must be between 1 and " +
                     std::to_string(MAX_MATCH_BYTES_LIMIT));
    valid = false;
  }

  if (config.state_pruning_enabled) {
    if (config.state_ttl_seconds == 0) {
      errors.push_back("state_ttl_seconds must be greater than 0 when state "
                       "pruning is enabled");
      valid = false;
    }
    if (config.state_prune_interval_events == 0) {
      errors.push_back("state_prune_interval_events must be greater than 0 "
                       "when state pruning is enabled");
      valid = false;
    }
  }

  if (!config.report_to_stdout && config.report_output_path.empty()) {
    errors.push_back("Either report_to_stdout or report_output_path must be "
                     "set");
    valid = false;
  }

  if (!validate_classification_config(config.classification, errors))
    valid = false;

  return valid;
}

bool parse_config_into(const std::string &filepath, AppConfig &config) {
  // By default, everything is set to a high level (WARN)
  for (const auto &pair : key_to_component_map) {
    config.logging.log_levels[pair.second] = LogLevel::WARN;
  }
  // Except for CORE, which we want to see INFO messages from by default
  config.logging.log_levels[LogComponent::CORE] = LogLevel::INFO;

  std::cerr << "Attempting to load configuration from " << filepath
            << std::endl;
  std::ifstream config_file(filepath);

  if (!config_file.is_open()) {
    std::cerr << "Warning: Could not open config file '" << filepath
              << "'. Using default configuration values." << std::endl;
    return false;
  }

  const std::string rule_prefix = Keys::RULE_SECTION_PREFIX;
  std::vector<Rule> rules;
  std::vector<bool> rule_kind_seen;

  std::string line;
  std::string current_section;

  int line_num = 0;
  while (std::getline(config_file, line)) {
    line_num++;
    std::string trimmed_line = Utils::trim_copy(line);

    // Skip empty lines and comments
    if (trimmed_line.empty() || trimmed_line[0] == '#' ||
        trimmed_line[0] == ';')
      continue;

    // Section header [SectionName]
    if (trimmed_line[0] == '[' && trimmed_line.back() == ']') {
      current_section =
          Utils::trim_copy(trimmed_line.substr(1, trimmed_line.length() - 2));
      if (current_section.rfind(rule_prefix, 0) == 0) {
        Rule rule;
        rule.id = Utils::trim_copy(current_section.substr(rule_prefix.size()));
        rules.push_back(std::move(rule));
        rule_kind_seen.push_back(false);
      }
      continue;
    }

    // Key-value pair parsing. Only the first '=' splits, regex patterns may
    // contain more.
    size_t delimiter_pos = trimmed_line.find('=');
    if (delimiter_pos == std::string::npos) {
      std::cerr << "Warning (Config Line " << line_num
                << "): Invalid format (missing '='): " << trimmed_line
                << std::endl;
      continue;
    }

    std::string key = Utils::trim_copy(trimmed_line.substr(0, delimiter_pos));
    std::string value =
        Utils::trim_copy(trimmed_line.substr(delimiter_pos + 1));

    if (key.empty()) {
      std::cerr << "Warning (Config Line " << line_num << "): Empty key found."
                << std::endl;
      continue;
    }

    // Global (non-section) keys
    if (current_section.empty()) {
      if (key == Keys::LOG_INPUT_PATH)
        config.log_input_path = value;
      else if (key == Keys::REPORT_OUTPUT_PATH)
        config.report_output_path = value;
      else if (key == Keys::REPORT_TO_STDOUT)
        config.report_to_stdout = string_to_bool(value);
      else if (key == Keys::REPORT_PRETTY_PRINT)
        config.report_pretty_print = string_to_bool(value);
      else if (key == Keys::VERBOSE_PARSE_WARNINGS)
        config.verbose_parse_warnings = string_to_bool(value);
      else if (key == Keys::SORT_BY_TIMESTAMP)
        config.sort_by_timestamp = string_to_bool(value);
      else if (key == Keys::WORKER_SHARDS)
        config.worker_shards = Utils::string_to_number<size_t>(value).value_or(
            config.worker_shards);
      else if (key == Keys::MAX_MATCH_BYTES)
        config.max_match_bytes =
            Utils::string_to_number<size_t>(value).value_or(
                config.max_match_bytes);
      else if (key == Keys::STATE_PRUNING_ENABLED)
        config.state_pruning_enabled = string_to_bool(value);
      else if (key == Keys::STATE_TTL_SECONDS)
        config.state_ttl_seconds =
            Utils::string_to_number<uint64_t>(value).value_or(
                config.state_ttl_seconds);
      else if (key == Keys::STATE_PRUNE_INTERVAL_EVENTS)
        config.state_prune_interval_events =
            Utils::string_to_number<uint64_t>(value).value_or(
                config.state_prune_interval_events);
      else
        config.custom_settings[key] = value;

      // Logging Settings
    } else if (current_section == "Logging") {
      if (key == Keys::LOGGING_DEFAULT_LEVEL) {
        LogLevel default_level = string_to_log_level(value);
        for (auto &pair : config.logging.log_levels)
          pair.second = default_level;
      } else {
        auto comp_it = key_to_component_map.find(key);
        if (comp_it != key_to_component_map.end())
          config.logging.log_levels[comp_it->second] =
              string_to_log_level(value);
        else if (key.length() > 2 && key.substr(key.length() - 2) == ".*") {
          // Wildcard match, e.g., "detect.* = DEBUG"
          std::string prefix = key.substr(0, key.length() - 1);
          for (const auto &pair : key_to_component_map)
            if (pair.first.rfind(prefix, 0) == 0)
              config.logging.log_levels[pair.second] =
                  string_to_log_level(value);
        } else
          std::cerr << "Warning (Config Line " << line_num
                    << "): Unknown logging component '" << key << "'"
                    << std::endl;
      }

      // Classification Settings
    } else if (current_section == "Classification") {
      if (key == Keys::CL_ENABLED)
        config.classification.enabled = string_to_bool(value);
      else if (key == Keys::CL_MEDIUM_COUNT)
        config.classification.medium_count =
            Utils::string_to_number<size_t>(value).value_or(
                config.classification.medium_count);
      else if (key == Keys::CL_HIGH_COUNT)
        config.classification.high_count =
            Utils::string_to_number<size_t>(value).value_or(
                config.classification.high_count);
      else if (key == Keys::CL_CRITICAL_COUNT)
        config.classification.critical_count =
            Utils::string_to_number<size_t>(value).value_or(
                config.classification.critical_count);

      // Rule definitions
    } else if (current_section.rfind(rule_prefix, 0) == 0) {
      bool kind_seen = rule_kind_seen.back();
      apply_rule_setting(rules.back(), kind_seen, key, value, line_num);
      rule_kind_seen.back() = kind_seen;
    } else {
      std::cerr << "Warning (Config Line " << line_num
                << "): Key '" << key << "' in unknown section '"
                << current_section << "' ignored." << std::endl;
    }
  }

  for (size_t i = 0; i < rules.size(); ++i)
    if (!rule_kind_seen[i])
      throw ConfigError(ConfigError::Kind::INVALID_RULE, rules[i].id,
                        "rule section has no 'kind'");

  config.rules = std::move(rules);

  config_file.close();
  std::cerr << "Configuration loaded successfully from " << filepath
            << std::endl;
  return true;
}

bool ConfigManager::load_configuration(const std::string &filepath) {
  config_filepath_ = filepath;
  validation_errors_.clear();
  auto new_config = std::make_shared<AppConfig>();

  // Use the parsing logic to fill the new config object
  if (!parse_config_into(filepath, *new_config)) {
    std::cerr << "Failed to parse configuration file: " << filepath
              << ". Keeping existing settings." << std::endl;
    return false;
  }

  // Validate the configuration
  if (!validate_app_config(*new_config, validation_errors_)) {
    std::cerr << "Configuration validation failed:" << std::endl;
    for (const auto &error : validation_errors_) {
      std::cerr << "  - " << error << std::endl;
    }
    std::cerr << "Keeping existing settings." << std::endl;
    return false;
  }

  // Atomically swap the pointer
  std::lock_guard<std::mutex> lock(config_mutex_);
  current_config_ = new_config;
  std::cerr << "Configuration loaded and validated successfully from "
            << config_filepath_ << std::endl;
  return true;
}

std::shared_ptr<const AppConfig> ConfigManager::get_config() const {
  std::lock_guard<std::mutex> lock(config_mutex_);
  return current_config_;
}

} // namespace Config
