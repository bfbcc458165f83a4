#ifndef LOGGER_HPP
#define LOGGER_HPP

#include "config.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>

// Enum for standard log severity levels
enum class LogLevel { TRACE, DEBUG, INFO, WARN, ERROR, FATAL };

// Enum for all granular application components
enum class LogComponent {
  // Top-level components
  CORE,
  CONFIG,

  // IO sub-components
  IO_READER,
  IO_REPORT,

  // Parsing
  PARSER,

  // Rules sub-components
  RULES_REGISTRY,

  // Detection sub-components
  DETECT_PATTERN,
  DETECT_FREQUENCY,

  // Engine sub-components
  ENGINE,
  ENGINE_SHARD,

  AGGREGATE,

  // State sub-components
  STATE_PRUNE
};

class LogManager {
public:
  static LogManager &instance() {
    static LogManager instance;
    return instance;
  }

  inline void configure(const Config::LoggingConfig &config) {
    log_levels_ = config.log_levels;
  }

  bool should_log(LogLevel level, LogComponent component) const {
    auto it = log_levels_.find(component);
    if (it == log_levels_.end())
      return level >= LogLevel::WARN;

    return level >= it->second;
  }

private:
  LogManager() = default; // Private constructor for singleton
  std::map<LogComponent, LogLevel> log_levels_;
};

// Shard threads log concurrently, so no std::gmtime and its shared buffer.
inline std::tm log_time_to_utc(std::time_t seconds) {
  std::tm utc{};
#if defined(_WIN32)
  gmtime_s(&utc, &seconds);
#else
  gmtime_r(&seconds, &utc);
#endif
  return utc;
}

// --- The Core Logging Macro ---
// It's a macro so that if `should_log` returns false, the message and its
// arguments are never even evaluated.
// Output goes to stderr; stdout is reserved for the JSON report.
#define LOG(level, component, message)                                         \
  do {                                                                         \
    if (LogManager::instance().should_log(level, component)) {                 \
      auto now = std::chrono::system_clock::now();                             \
      auto time_t_now = std::chrono::system_clock::to_time_t(now);             \
      auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(         \
                    now.time_since_epoch()) %                                  \
                1000;                                                          \
      std::tm utc_tm = log_time_to_utc(time_t_now);                            \
      std::ostringstream oss;                                                  \
      oss << std::put_time(&utc_tm, "%Y-%m-%dT%H:%M:%S")                       \
          << '.' << std::setw(3) << std::setfill('0') << ms.count() << "Z ";   \
      oss << "[" << level_to_string(level) << "] ";                            \
      oss << "[" << component_to_string(component) << "] ";                    \
      oss << "[" << __FILE__ << ":" << __LINE__ << "] ";                       \
      oss << message;                                                          \
      std::clog << oss.str() << std::endl;                                     \
    }                                                                          \
  } while (0)

// --- Helper Functions to Convert Enums to Strings for Printing ---

inline const char *level_to_string(LogLevel level) {
  switch (level) {
  case LogLevel::TRACE:
    return "TRACE";
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::WARN:
    return "WARN";
  case LogLevel::ERROR:
    return "ERROR";
  case LogLevel::FATAL:
    return "FATAL";
  }
  return "UNKNOWN";
}

inline const char *component_to_string(LogComponent component) {
  switch (component) {
  case LogComponent::CORE:
    return "CORE";
  case LogComponent::CONFIG:
    return "CONFIG";
  case LogComponent::IO_READER:
    return "IO.READER";
  case LogComponent::IO_REPORT:
    return "IO.REPORT";
  case LogComponent::PARSER:
    return "PARSER";
  case LogComponent::RULES_REGISTRY:
    return "RULES.REGISTRY";
  case LogComponent::DETECT_PATTERN:
    return "DETECT.PATTERN";
  case LogComponent::DETECT_FREQUENCY:
    return "DETECT.FREQUENCY";
  case LogComponent::ENGINE:
    return "ENGINE";
  case LogComponent::ENGINE_SHARD:
    return "ENGINE.SHARD";
  case LogComponent::AGGREGATE:
    return "AGGREGATE";
  case LogComponent::STATE_PRUNE:
    return "STATE.PRUNE";
  }
  return "GENERAL";
}

#endif // LOGGER_HPP
