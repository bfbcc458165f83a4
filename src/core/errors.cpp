#include "errors.hpp"

#include <string>

namespace {

std::string compose_message(ConfigError::Kind kind, const std::string &rule_id,
                            const std::string &message) {
  std::string prefix = kind == ConfigError::Kind::INVALID_RULE
                           ? "Invalid rule"
                           : "Invalid setting";
  if (!rule_id.empty())
    prefix += " '" + rule_id + "'";
  return prefix + ": " + message;
}

} // namespace

ConfigError::ConfigError(Kind kind, const std::string &rule_id,
                         const std::string &message)
    : std::runtime_error(compose_message(kind, rule_id, message)), kind_(kind),
      rule_id_(rule_id) {}

const char *parse_error_to_string(ParseError error) {
  switch (error) {
  case ParseError::NONE:
    return "none";
  case ParseError::MALFORMED:
    return "malformed";
  case ParseError::BAD_TIMESTAMP:
    return "bad_timestamp";
  }
  return "unknown";
}

const char *run_status_to_string(RunStatus status) {
  switch (status) {
  case RunStatus::COMPLETED:
    return "completed";
  case RunStatus::CANCELLED_EARLY:
    return "cancelled_early";
  }
  return "unknown";
}
