#include "rule_registry.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"

#include <regex>
#include <unordered_set>
#include <utility>

namespace {

void validate_frequency_rule(const Rule &rule) {
  const FrequencySpec &spec = rule.frequency;
  if (spec.window_duration_ms == 0)
    throw ConfigError(ConfigError::Kind::INVALID_RULE, rule.id,
                      "window duration must be greater than 0");
  if (spec.threshold_count < 1)
    throw ConfigError(ConfigError::Kind::INVALID_RULE, rule.id,
                      "threshold_count must be at least 1");
  if (spec.failure_status_codes.empty())
    throw ConfigError(ConfigError::Kind::INVALID_RULE, rule.id,
                      "failure status set must not be empty");
  if (spec.rearm_count < 1)
    throw ConfigError(ConfigError::Kind::INVALID_RULE, rule.id,
                      "rearm_count must be at least 1");
}

std::shared_ptr<const CompiledPatternSet> compile_pattern_rule(const Rule &rule) {
  if (rule.patterns.empty())
    throw ConfigError(ConfigError::Kind::INVALID_RULE, rule.id,
                      "pattern rule has no patterns");

  std::unordered_set<std::string> pattern_ids;
  for (const auto &pattern : rule.patterns) {
    if (pattern.expression.empty())
      throw ConfigError(ConfigError::Kind::INVALID_RULE, rule.id,
                        "pattern '" + pattern.id + "' is empty");
    if (!pattern_ids.insert(pattern.id).second)
      throw ConfigError(ConfigError::Kind::INVALID_RULE, rule.id,
                        "duplicate pattern id '" + pattern.id + "'");
  }

  try {
    return std::make_shared<const CompiledPatternSet>(rule.patterns);
  } catch (const std::regex_error &e) {
    throw ConfigError(ConfigError::Kind::INVALID_RULE, rule.id,
                      std::string("regex does not compile: ") + e.what());
  }
}

} // namespace

std::shared_ptr<const RuleRegistry>
RuleRegistry::load(const std::vector<Rule> &rules) {
  // Built privately and only published once every rule passed
  std::shared_ptr<RuleRegistry> registry(new RuleRegistry());
  std::unordered_set<std::string> seen_ids;

  for (const auto &rule : rules) {
    if (rule.id.empty())
      throw ConfigError(ConfigError::Kind::INVALID_RULE, rule.id,
                        "rule id must not be empty");
    if (!seen_ids.insert(rule.id).second)
      throw ConfigError(ConfigError::Kind::INVALID_RULE, rule.id,
                        "duplicate rule id");

    RegisteredRule entry;
    entry.rule = rule;
    if (rule.is_pattern_rule())
      entry.patterns = compile_pattern_rule(rule);
    else
      validate_frequency_rule(rule);

    if (!rule.enabled) {
      LOG(LogLevel::DEBUG, LogComponent::RULES_REGISTRY,
          "Rule '" << rule.id << "' is disabled and will not be evaluated.");
      continue;
    }

    LOG(LogLevel::DEBUG, LogComponent::RULES_REGISTRY,
        "Registered rule '" << rule.id << "' ("
                            << detection_kind_to_string(rule.kind) << ", "
                            << severity_to_string(rule.severity) << ")");
    registry->rules_.push_back(std::move(entry));
  }

  LOG(LogLevel::INFO, LogComponent::RULES_REGISTRY,
      "Rule registry loaded with " << registry->rules_.size()
                                   << " active rule(s).");
  return registry;
}

std::vector<const RegisteredRule *>
RuleRegistry::rules_for(DetectionKind kind) const {
  std::vector<const RegisteredRule *> matching;
  for (const auto &entry : rules_)
    if (entry.rule.kind == kind)
      matching.push_back(&entry);
  return matching;
}

const RegisteredRule *RuleRegistry::find(std::string_view id) const {
  for (const auto &entry : rules_)
    if (entry.rule.id == id)
      return &entry;
  return nullptr;
}
