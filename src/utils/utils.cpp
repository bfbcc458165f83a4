#include "utils.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace Utils {

namespace {

int hex_value(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

// Digits only, so signs such as "-5" are rejected.
std::optional<int> read_fixed_int(std::string_view s, size_t pos,
                                  size_t width) {
  if (pos + width > s.size())
    return std::nullopt;
  std::string_view digits = s.substr(pos, width);
  if (!std::all_of(digits.begin(), digits.end(),
                   [](unsigned char c) { return std::isdigit(c) != 0; }))
    return std::nullopt;
  return string_to_number<int>(digits);
}

int days_in_month(int year, int month_index) {
  static const std::array<int, 12> days = {31, 28, 31, 30, 31, 30,
                                           31, 31, 30, 31, 30, 31};
  bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
  if (month_index == 1 && leap)
    return 29;
  return days[month_index];
}

} // namespace

std::string url_decode(std::string_view encoded_string) {
  std::string decoded;
  decoded.reserve(encoded_string.size());

  for (size_t i = 0; i < encoded_string.length(); i++) {
    char c = encoded_string[i];
    if (c == '%' && i + 2 < encoded_string.length()) {
      int hi = hex_value(encoded_string[i + 1]);
      int lo = hex_value(encoded_string[i + 2]);
      if (hi >= 0 && lo >= 0) {
        decoded.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
      } else
        decoded.push_back('%');
    } else if (c == '+')
      decoded.push_back(' ');
    else
      decoded.push_back(c);
  }
  return decoded;
}

std::string to_lower_copy(std::string_view s) {
  std::string lowered(s);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char ch) { return std::tolower(ch); });
  return lowered;
}

std::vector<std::string_view> split_string_view(std::string_view str,
                                                char delimiter) {
  std::vector<std::string_view> result;
  size_t start = 0;
  size_t end = str.find(delimiter);
  while (end != std::string_view::npos) {
    result.push_back(str.substr(start, end - start));
    start = end + 1;
    end = str.find(delimiter, start);
  }
  result.push_back(str.substr(start));
  return result;
}

std::vector<std::string> split_and_trim(std::string_view str, char delimiter) {
  std::vector<std::string> tokens;
  for (std::string_view piece : split_string_view(str, delimiter)) {
    std::string token = trim_copy(piece);
    if (!token.empty())
      tokens.push_back(std::move(token));
  }
  return tokens;
}

std::optional<uint64_t> convert_log_time_to_ms(std::string_view log_time_str) {
  if (log_time_str.empty() || log_time_str == "-")
    return std::nullopt;

  // Expected format: 23/May/2025:00:00:35 +0530
  //                  0123456789012345678901234
  if (log_time_str.size() != 26 || log_time_str[2] != '/' ||
      log_time_str[6] != '/' || log_time_str[11] != ':' ||
      log_time_str[14] != ':' || log_time_str[17] != ':' ||
      log_time_str[20] != ' ')
    return std::nullopt;

  static const std::array<std::string_view, 12> months = {
      "Jan", "Feb", "Mar", "Apr", "May", "Jun",
      "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

  std::tm t{};
  auto month_it =
      std::find(months.begin(), months.end(), log_time_str.substr(3, 3));
  if (month_it == months.end())
    return std::nullopt;
  t.tm_mon = static_cast<int>(month_it - months.begin());

  auto day = read_fixed_int(log_time_str, 0, 2);
  auto year = read_fixed_int(log_time_str, 7, 4);
  auto hour = read_fixed_int(log_time_str, 12, 2);
  auto minute = read_fixed_int(log_time_str, 15, 2);
  auto second = read_fixed_int(log_time_str, 18, 2);
  if (!day || !year || !hour || !minute || !second)
    return std::nullopt;

  // timegm would silently roll 31/Feb over into March
  if (*year < 1970 || *day < 1 || *day > days_in_month(*year, t.tm_mon) ||
      *hour > 23 || *minute > 59 || *second > 60)
    return std::nullopt;

  t.tm_mday = *day;
  t.tm_year = *year - 1900;
  t.tm_hour = *hour;
  t.tm_min = *minute;
  t.tm_sec = *second;

  // Timezone
  char tz_sign = log_time_str[21];
  auto tz_hour = read_fixed_int(log_time_str, 22, 2);
  auto tz_min = read_fixed_int(log_time_str, 24, 2);
  if ((tz_sign != '+' && tz_sign != '-') || !tz_hour || !tz_min ||
      *tz_hour > 23 || *tz_min > 59)
    return std::nullopt;

  // timegm treats the tm struct as UTC, avoiding locale/timezone issues
  // with mktime
#if defined(_WIN32)
  std::time_t epoch_seconds = _mkgmtime(&t);
#else
  std::time_t epoch_seconds = timegm(&t);
#endif

  if (epoch_seconds == -1)
    return std::nullopt;

  // Shift the local wall-clock time back to UTC
  int tz_offset_seconds = (*tz_hour * 3600) + (*tz_min * 60);
  if (tz_sign == '-')
    epoch_seconds += tz_offset_seconds;
  else
    epoch_seconds -= tz_offset_seconds;

  if (epoch_seconds < 0)
    return std::nullopt;

  return static_cast<uint64_t>(epoch_seconds) * 1000;
}

std::string format_ms_as_iso8601(uint64_t timestamp_ms) {
  std::time_t seconds = static_cast<std::time_t>(timestamp_ms / 1000);
  std::tm utc{};
#if defined(_WIN32)
  gmtime_s(&utc, &seconds);
#else
  gmtime_r(&seconds, &utc);
#endif
  std::ostringstream oss;
  oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3)
      << std::setfill('0') << (timestamp_ms % 1000) << 'Z';
  return oss.str();
}

} // namespace Utils
