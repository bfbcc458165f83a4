#include "log_entry.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace {

std::string dash_to_empty(std::string_view field) {
  if (field == "-")
    return std::string();
  return std::string(field);
}

// Reads a double-quoted field starting at pos (which must point at the
// opening quote). Backslash-escaped quotes do not terminate the field.
std::optional<std::string_view> read_quoted(std::string_view line,
                                            size_t &pos) {
  if (pos >= line.size() || line[pos] != '"')
    return std::nullopt;
  size_t start = pos + 1;
  size_t cursor = start;
  while (cursor < line.size()) {
    if (line[cursor] == '\\' && cursor + 1 < line.size()) {
      cursor += 2;
      continue;
    }
    if (line[cursor] == '"')
      break;
    cursor++;
  }
  if (cursor >= line.size())
    return std::nullopt;
  pos = cursor + 1;
  return line.substr(start, cursor - start);
}

// Reads a space-delimited token, skipping leading spaces.
std::string_view read_token(std::string_view line, size_t &pos) {
  while (pos < line.size() && line[pos] == ' ')
    pos++;
  size_t start = pos;
  while (pos < line.size() && line[pos] != ' ')
    pos++;
  return line.substr(start, pos - start);
}

void skip_spaces(std::string_view line, size_t &pos) {
  while (pos < line.size() && line[pos] == ' ')
    pos++;
}

} // namespace

LogEntry::LogEntry()
    : original_line_number(0), parsed_timestamp_ms(0), http_status_code(0) {}

bool LogEntry::operator==(const LogEntry &other) const {
  return raw_log_line == other.raw_log_line &&
         original_line_number == other.original_line_number &&
         ip_address == other.ip_address &&
         timestamp_str == other.timestamp_str &&
         parsed_timestamp_ms == other.parsed_timestamp_ms &&
         request_method == other.request_method &&
         request_path == other.request_path &&
         request_query == other.request_query &&
         request_protocol == other.request_protocol &&
         http_status_code == other.http_status_code &&
         bytes_sent == other.bytes_sent && remote_user == other.remote_user &&
         referer == other.referer && user_agent == other.user_agent;
}

void LogEntry::parse_request_details(std::string_view full_request_field,
                                     std::string &out_method,
                                     std::string &out_target,
                                     std::string &out_protocol) {
  if (full_request_field == "-" || full_request_field.empty())
    return;

  // Find the first space for the method
  size_t method_end = full_request_field.find(' ');
  if (method_end == std::string_view::npos) {
    // Malformed, treat the whole thing as the target
    out_target = std::string(full_request_field);
    return;
  }
  out_method = std::string(full_request_field.substr(0, method_end));

  // Find the last space for the protocol
  size_t protocol_start = full_request_field.rfind(' ');
  if (protocol_start == std::string_view::npos ||
      protocol_start <= method_end) {
    // No protocol found, or it's the same space as the method end
    out_target = std::string(full_request_field.substr(method_end + 1));
    return;
  }
  out_protocol = std::string(full_request_field.substr(protocol_start + 1));
  // The target is everything in between; it may itself contain spaces
  out_target = std::string(full_request_field.substr(
      method_end + 1, protocol_start - (method_end + 1)));
}

std::optional<LogEntry> LogEntry::parse_from_string(std::string_view log_line,
                                                    uint64_t line_num,
                                                    ParseError *error_out,
                                                    bool verbose_warnings) {
  auto fail = [&](ParseError error, const char *reason) {
    if (error_out)
      *error_out = error;
    if (verbose_warnings)
      LOG(LogLevel::WARN, LogComponent::PARSER,
          "Line " << line_num << " (" << parse_error_to_string(error)
                  << "): " << reason << ". Skipping line.");
    return std::nullopt;
  };

  if (error_out)
    *error_out = ParseError::NONE;

  while (!log_line.empty() &&
         (log_line.back() == '\n' || log_line.back() == '\r'))
    log_line.remove_suffix(1);

  LogEntry entry;
  entry.raw_log_line = std::string(log_line);
  entry.original_line_number = line_num;

  size_t pos = 0;
  std::string_view address = read_token(log_line, pos);
  if (address.empty() || address.front() == '[' || address.front() == '"')
    return fail(ParseError::MALFORMED, "Missing remote address");
  entry.ip_address = std::string(address);

  // ident is never populated by NGINX, the next token is $remote_user
  std::string_view ident = read_token(log_line, pos);
  std::string_view user = read_token(log_line, pos);
  if (ident.empty() || user.empty())
    return fail(ParseError::MALFORMED, "Missing ident/user fields");
  entry.remote_user = dash_to_empty(user);

  skip_spaces(log_line, pos);
  if (pos >= log_line.size() || log_line[pos] != '[')
    return fail(ParseError::MALFORMED, "Missing '[' before timestamp");
  size_t time_end = log_line.find(']', pos);
  if (time_end == std::string_view::npos)
    return fail(ParseError::MALFORMED, "Unterminated timestamp");
  std::string_view time_field = log_line.substr(pos + 1, time_end - pos - 1);
  entry.timestamp_str = std::string(time_field);
  pos = time_end + 1;

  skip_spaces(log_line, pos);
  auto request = read_quoted(log_line, pos);
  if (!request)
    return fail(ParseError::MALFORMED, "Missing quoted request line");

  std::string_view status_field = read_token(log_line, pos);
  auto status = Utils::string_to_number<int>(status_field);
  if (!status || *status < 100 || *status > 599)
    return fail(ParseError::MALFORMED, "Missing or invalid status code");
  entry.http_status_code = *status;

  // Timestamp is checked after the structure so that a structurally broken
  // line is always reported as malformed.
  auto timestamp_ms = Utils::convert_log_time_to_ms(time_field);
  if (!timestamp_ms)
    return fail(ParseError::BAD_TIMESTAMP, "Failed to parse timestamp");
  entry.parsed_timestamp_ms = *timestamp_ms;

  std::string target;
  parse_request_details(*request, entry.request_method, target,
                        entry.request_protocol);
  size_t query_start = target.find('?');
  if (query_start != std::string::npos) {
    entry.request_query = Utils::url_decode(
        std::string_view(target).substr(query_start + 1));
    target.erase(query_start);
  }
  entry.request_path = Utils::url_decode(target);

  // The remaining fields are optional; some NGINX formats omit them.
  std::string_view bytes_field = read_token(log_line, pos);
  entry.bytes_sent = Utils::string_to_number<uint64_t>(bytes_field);

  skip_spaces(log_line, pos);
  if (auto referer = read_quoted(log_line, pos)) {
    entry.referer = dash_to_empty(*referer);
    skip_spaces(log_line, pos);
    if (auto user_agent = read_quoted(log_line, pos))
      entry.user_agent = dash_to_empty(*user_agent);
  }

  return entry;
}
