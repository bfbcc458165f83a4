#include "rule.hpp"

#include <string>
#include <vector>

namespace {

PatternSpec regex(const char *id, const char *expression) {
  return PatternSpec{id, expression, PatternType::REGEX};
}

PatternSpec keyword(const char *id, const char *expression) {
  return PatternSpec{id, expression, PatternType::KEYWORD};
}

} // namespace

std::vector<Rule> default_rule_set() {
  std::vector<Rule> rules;

  Rule brute_force;
  brute_force.id = "brute-force-login";
  brute_force.kind = DetectionKind::BRUTE_FORCE;
  brute_force.severity = Severity::HIGH;
  rules.push_back(brute_force);

  Rule sqli;
  sqli.id = "sqli-signatures";
  sqli.kind = DetectionKind::SQL_INJECTION;
  sqli.severity = Severity::CRITICAL;
  sqli.patterns = {
      regex("union-select", R"(union(\s+all)?\s+select)"),
      regex("quoted-tautology", R"('\s*or\s+'?\w+'?\s*=\s*'?\w+)"),
      regex("numeric-tautology", R"(\bor\s+\d+\s*=\s*\d+)"),
      regex("select-from", R"(\bselect\b.+\bfrom\b)"),
      regex("stacked-drop", R"(;\s*drop\s+(table|database)\b)"),
      regex("time-based", R"(\b(sleep|benchmark|pg_sleep)\s*\()"),
      regex("comment-terminator", R"('\s*(--|#|/\*))"),
      keyword("information-schema", "information_schema"),
  };
  rules.push_back(sqli);

  Rule scanning;
  scanning.id = "scanner-user-agents";
  scanning.kind = DetectionKind::SCANNING;
  scanning.severity = Severity::MEDIUM;
  scanning.patterns = {
      keyword("nmap", "nmap"),         keyword("dirb", "dirb"),
      keyword("nikto", "nikto"),       keyword("sqlmap", "sqlmap"),
      keyword("masscan", "masscan"),   keyword("gobuster", "gobuster"),
      keyword("dirbuster", "dirbuster"), keyword("wfuzz", "wfuzz"),
      keyword("zgrab", "zgrab"),       keyword("nuclei", "nuclei"),
  };
  rules.push_back(scanning);

  return rules;
}
