#ifndef LOG_ENTRY_HPP
#define LOG_ENTRY_HPP

#include "errors.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// One record of an NGINX combined access log. Produced once by
// parse_from_string and treated as read-only afterwards.
struct LogEntry {
  std::string raw_log_line;
  uint64_t original_line_number;

  // Most essential data
  std::string ip_address;
  std::string timestamp_str;
  uint64_t parsed_timestamp_ms;

  std::string request_method;
  std::string request_path;  // URL-decoded, without the query string
  std::string request_query; // URL-decoded, without the leading '?'
  std::string request_protocol;

  int http_status_code;
  std::optional<uint64_t> bytes_sent;

  std::string remote_user;
  std::string referer;
  std::string user_agent;

  // Default constructor
  LogEntry();

  bool operator==(const LogEntry &other) const;
  bool operator!=(const LogEntry &other) const { return !(*this == other); }

  // Parses one line of the combined format:
  //   addr - user [time] "request" status bytes "referer" "user_agent"
  // On failure returns nullopt and, when error_out is given, the reason.
  static std::optional<LogEntry>
  parse_from_string(std::string_view log_line, uint64_t line_num,
                    ParseError *error_out = nullptr,
                    bool verbose_warnings = false);

private:
  // Helper function to parse "request" field (into request_method,
  // request_path, request_protocol)
  static void parse_request_details(std::string_view full_request_field,
                                    std::string &out_method,
                                    std::string &out_target,
                                    std::string &out_protocol);
};

#endif // LOG_ENTRY_HPP
