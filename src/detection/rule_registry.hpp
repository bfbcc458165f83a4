#ifndef RULE_REGISTRY_HPP
#define RULE_REGISTRY_HPP

#include "detection/pattern_set.hpp"
#include "detection/rule.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

struct RegisteredRule {
  Rule rule;
  // Set for pattern rules only
  std::shared_ptr<const CompiledPatternSet> patterns;
};

// The validated, compiled set of enabled rules. Built through load() and
// never modified afterwards, so one instance can back any number of engines.
class RuleRegistry {
public:
  // Validates every rule and compiles its patterns. Throws ConfigError
  // (INVALID_RULE) naming the first offending rule; nothing is returned in
  // that case. Disabled rules are validated too but not registered.
  static std::shared_ptr<const RuleRegistry> load(const std::vector<Rule> &rules);

  const std::vector<RegisteredRule> &all_rules() const { return rules_; }
  std::vector<const RegisteredRule *> rules_for(DetectionKind kind) const;
  const RegisteredRule *find(std::string_view id) const;
  size_t size() const { return rules_.size(); }

private:
  RuleRegistry() = default;

  std::vector<RegisteredRule> rules_;
};

#endif // RULE_REGISTRY_HPP
