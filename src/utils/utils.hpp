#ifndef UTILS_HPP
#define UTILS_HPP

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <vector>

namespace Utils {
std::vector<std::string_view> split_string_view(std::string_view str,
                                                char delimiter);
std::vector<std::string> split_and_trim(std::string_view str, char delimiter);

// Parses the NGINX $time_local format, eg "10/Oct/2023:13:55:36 +0200"
std::optional<uint64_t> convert_log_time_to_ms(std::string_view log_time_str);
std::string format_ms_as_iso8601(uint64_t timestamp_ms);

std::string url_decode(std::string_view encoded_string);
std::string to_lower_copy(std::string_view s);

template <typename T> std::optional<T> string_to_number(std::string_view s) {
  if (s.empty() || s == "-")
    return std::nullopt;

  T value;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);

  if (ec == std::errc() && ptr == s.data() + s.size())
    return value;
  return std::nullopt;
}

inline void ltrim_inplace(std::string &s) {
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char ch) {
            return !std::isspace(ch);
          }));
}

inline void rtrim_inplace(std::string &s) {
  s.erase(std::find_if(s.rbegin(), s.rend(),
                       [](unsigned char ch) { return !std::isspace(ch); })
              .base(),
          s.end());
}

inline void trim_inplace(std::string &s) {
  ltrim_inplace(s);
  rtrim_inplace(s);
}

inline std::string trim_copy(std::string_view sv) {
  std::string s{sv};
  trim_inplace(s);
  return s;
}
} // namespace Utils

#endif // UTILS_HPP
