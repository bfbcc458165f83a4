#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>

class ConfigTest : public ::testing::Test {
protected:
  void SetUp() override {
    // Create a temporary directory for test files
    test_dir = std::filesystem::temp_directory_path() / "threat_detector_config_test";
    std::filesystem::create_directories(test_dir);
  }

  void TearDown() override {
    // Clean up test files
    if (std::filesystem::exists(test_dir)) {
      std::filesystem::remove_all(test_dir);
    }
  }

  std::string createTestConfigFile(const std::string &content) {
    auto config_path = test_dir / "test_config.ini";
    std::ofstream file(config_path);
    file << content;
    file.close();
    return config_path.string();
  }

  std::filesystem::path test_dir;
};

TEST_F(ConfigTest, MissingFileKeepsDefaults) {
  Config::ConfigManager manager;
  EXPECT_FALSE(manager.load_configuration((test_dir / "absent.ini").string()));
  EXPECT_TRUE(manager.get_validation_errors().empty());

  auto config = manager.get_config();
  EXPECT_EQ(config->worker_shards, 1u);
  EXPECT_EQ(config->max_match_bytes, DEFAULT_MAX_MATCH_BYTES);
  EXPECT_TRUE(config->report_to_stdout);
  EXPECT_TRUE(config->rules.empty());
  EXPECT_EQ(config->classification.medium_count, 7u);
  EXPECT_EQ(config->classification.high_count, 10u);
}

TEST_F(ConfigTest, GlobalSettingsParsing) {
  std::string config_content = R"(
# global settings
log_input_path = /var/log/nginx/access.log
report_output_path = /tmp/report.json
report_to_stdout = false
report_pretty_print = no
verbose_parse_warnings = yes
sort_by_timestamp = true
worker_shards = 4
max_match_bytes = 8192
state_pruning_enabled = true
state_ttl_seconds = 900
state_prune_interval_events = 5000
site_name = staging
)";

  std::string config_file = createTestConfigFile(config_content);
  Config::ConfigManager manager;
  ASSERT_TRUE(manager.load_configuration(config_file));

  auto config = manager.get_config();
  EXPECT_EQ(config->log_input_path, "/var/log/nginx/access.log");
  EXPECT_EQ(config->report_output_path, "/tmp/report.json");
  EXPECT_FALSE(config->report_to_stdout);
  EXPECT_FALSE(config->report_pretty_print);
  EXPECT_TRUE(config->verbose_parse_warnings);
  EXPECT_TRUE(config->sort_by_timestamp);
  EXPECT_EQ(config->worker_shards, 4u);
  EXPECT_EQ(config->max_match_bytes, 8192u);
  EXPECT_EQ(config->state_ttl_seconds, 900u);
  EXPECT_EQ(config->state_prune_interval_events, 5000u);
  ASSERT_EQ(config->custom_settings.count("site_name"), 1u);
  EXPECT_EQ(config->custom_settings.at("site_name"), "staging");
}

TEST_F(ConfigTest, RuleSectionsParsing) {
  std::string config_content = R"(
[Rule:ssh-like-login]
kind = brute_force
severity = high
threshold_count = 3
window_seconds = 30
failure_status_codes = 401, 403, 429
methods = post
rearm_count = 1

[Rule:custom-sqli]
kind = sqli
severity = CRITICAL
pattern.tautology = OR\s+'1'='1'
pattern = union\s+select
keyword.schema = information_schema

[Rule:scanners]
kind = scanning
severity = medium
enabled = false
keywords = nmap, dirb , nikto
)";

  std::string config_file = createTestConfigFile(config_content);
  Config::ConfigManager manager;
  ASSERT_TRUE(manager.load_configuration(config_file));

  auto config = manager.get_config();
  ASSERT_EQ(config->rules.size(), 3u);

  const Rule &brute = config->rules[0];
  EXPECT_EQ(brute.id, "ssh-like-login");
  EXPECT_EQ(brute.kind, DetectionKind::BRUTE_FORCE);
  EXPECT_EQ(brute.severity, Severity::HIGH);
  EXPECT_EQ(brute.frequency.threshold_count, 3u);
  EXPECT_EQ(brute.frequency.window_duration_ms, 30000u);
  EXPECT_EQ(brute.frequency.failure_status_codes,
            (std::vector<int>{401, 403, 429}));
  EXPECT_EQ(brute.frequency.methods, (std::vector<std::string>{"POST"}));
  EXPECT_EQ(brute.frequency.rearm_count, 1u);

  const Rule &sqli = config->rules[1];
  EXPECT_EQ(sqli.kind, DetectionKind::SQL_INJECTION);
  EXPECT_EQ(sqli.severity, Severity::CRITICAL);
  ASSERT_EQ(sqli.patterns.size(), 3u);
  EXPECT_EQ(sqli.patterns[0].id, "tautology");
  // Only the first '=' separates key from value
  EXPECT_EQ(sqli.patterns[0].expression, "OR\\s+'1'='1'");
  EXPECT_EQ(sqli.patterns[0].type, PatternType::REGEX);
  EXPECT_EQ(sqli.patterns[1].id, "pattern-2");
  EXPECT_EQ(sqli.patterns[2].id, "schema");
  EXPECT_EQ(sqli.patterns[2].type, PatternType::KEYWORD);

  const Rule &scan = config->rules[2];
  EXPECT_FALSE(scan.enabled);
  ASSERT_EQ(scan.patterns.size(), 3u);
  EXPECT_EQ(scan.patterns[1].expression, "dirb");
  EXPECT_EQ(scan.patterns[1].type, PatternType::KEYWORD);
}

TEST_F(ConfigTest, InvalidRuleSeverityThrows) {
  std::string config_file = createTestConfigFile(R"(
[Rule:bad-one]
kind = scanning
severity = apocalyptic
keyword = nmap
)");
  Config::ConfigManager manager;
  try {
    manager.load_configuration(config_file);
    FAIL() << "Expected ConfigError";
  } catch (const ConfigError &e) {
    EXPECT_EQ(e.kind(), ConfigError::Kind::INVALID_SETTING);
    EXPECT_EQ(e.rule_id(), "bad-one");
  }
}

TEST_F(ConfigTest, NonNumericThresholdThrows) {
  std::string config_file = createTestConfigFile(R"(
[Rule:brute]
kind = brute_force
threshold_count = five
)");
  Config::AppConfig config;
  EXPECT_THROW(Config::parse_config_into(config_file, config), ConfigError);
}

TEST_F(ConfigTest, RuleWithoutKindThrows) {
  std::string config_file = createTestConfigFile(R"(
[Rule:kindless]
severity = low
keyword = nmap
)");
  Config::AppConfig config;
  try {
    Config::parse_config_into(config_file, config);
    FAIL() << "Expected ConfigError";
  } catch (const ConfigError &e) {
    EXPECT_EQ(e.kind(), ConfigError::Kind::INVALID_RULE);
    EXPECT_EQ(e.rule_id(), "kindless");
  }
}

TEST_F(ConfigTest, LoggingLevelsAndWildcards) {
  std::string config_file = createTestConfigFile(R"(
[Logging]
default_level = ERROR
detect.* = DEBUG
engine = trace
)");
  Config::ConfigManager manager;
  ASSERT_TRUE(manager.load_configuration(config_file));

  const auto &levels = manager.get_config()->logging.log_levels;
  EXPECT_EQ(levels.at(LogComponent::CORE), LogLevel::ERROR);
  EXPECT_EQ(levels.at(LogComponent::DETECT_PATTERN), LogLevel::DEBUG);
  EXPECT_EQ(levels.at(LogComponent::DETECT_FREQUENCY), LogLevel::DEBUG);
  EXPECT_EQ(levels.at(LogComponent::ENGINE), LogLevel::TRACE);
  EXPECT_EQ(levels.at(LogComponent::ENGINE_SHARD), LogLevel::ERROR);
}

TEST_F(ConfigTest, ClassificationParsing) {
  std::string config_file = createTestConfigFile(R"(
[Classification]
enabled = true
medium_count = 3
high_count = 6
critical_count = 12
)");
  Config::ConfigManager manager;
  ASSERT_TRUE(manager.load_configuration(config_file));

  const auto &classification = manager.get_config()->classification;
  EXPECT_EQ(classification.medium_count, 3u);
  EXPECT_EQ(classification.high_count, 6u);
  EXPECT_EQ(classification.critical_count, 12u);
}

TEST_F(ConfigTest, ValidationRejectsBadSettingsAndKeepsOldConfig) {
  std::string config_file = createTestConfigFile(R"(
worker_shards = 0
state_ttl_seconds = 0

[Classification]
medium_count = 10
high_count = 5
)");
  Config::ConfigManager manager;
  EXPECT_FALSE(manager.load_configuration(config_file));
  EXPECT_EQ(manager.get_validation_errors().size(), 3u);

  // The previous (default) configuration is still in place
  EXPECT_EQ(manager.get_config()->worker_shards, 1u);
}

TEST_F(ConfigTest, ValidationBoundsMaxMatchBytes) {
  Config::AppConfig config;
  std::vector<std::string> errors;

  config.max_match_bytes = 0;
  EXPECT_FALSE(Config::validate_app_config(config, errors));
  config.max_match_bytes = MAX_MATCH_BYTES_LIMIT + 1;
  EXPECT_FALSE(Config::validate_app_config(config, errors));
  EXPECT_EQ(errors.size(), 2u);

  errors.clear();
  config.max_match_bytes = MAX_MATCH_BYTES_LIMIT;
  EXPECT_TRUE(Config::validate_app_config(config, errors));
  EXPECT_TRUE(errors.empty());
}
