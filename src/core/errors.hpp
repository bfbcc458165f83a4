#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

// Per-line failures. Never fatal: the engine counts and skips them.
enum class ParseError { NONE, MALFORMED, BAD_TIMESTAMP };

// Outcome of an engine run that did not fail outright.
enum class RunStatus { COMPLETED, CANCELLED_EARLY };

const char *parse_error_to_string(ParseError error);
const char *run_status_to_string(RunStatus status);

// Raised while loading rules or settings. Aborts the run before any detection.
class ConfigError : public std::runtime_error {
public:
  enum class Kind { INVALID_RULE, INVALID_SETTING };

  ConfigError(Kind kind, const std::string &rule_id,
              const std::string &message);

  Kind kind() const noexcept { return kind_; }
  const std::string &rule_id() const noexcept { return rule_id_; }

private:
  Kind kind_;
  std::string rule_id_;
};

#endif // ERRORS_HPP
