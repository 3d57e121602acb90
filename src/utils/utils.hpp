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

// A parsed access-log timestamp. epoch_ms is always UTC; the offset is kept
// so the wall clock written in the log can be reproduced.
struct LogTimestamp {
  int64_t epoch_ms = 0;
  std::optional<int> utc_offset_minutes;

  bool operator<(const LogTimestamp &other) const {
    return epoch_ms < other.epoch_ms;
  }
};

std::vector<std::string> split_string(const std::string &text, char delimiter);
std::vector<std::string_view> split_string_view(std::string_view str,
                                                char delimiter);

// Accepts "10/Apr/2021:12:01:55 +0000" and, failing that, the same layout
// without the offset.
std::optional<LogTimestamp> parse_log_timestamp(std::string_view log_time_str);

// "2021-04-10T12:01:55+00:00", or without suffix for offset-less stamps.
std::string format_iso8601(const LogTimestamp &ts);

// Minute index of the wall-clock time as written in the log.
int64_t wall_clock_minute(const LogTimestamp &ts);

// Percent-decoding only; '+' is left alone and malformed escapes are copied
// through unchanged.
std::string url_decode(std::string_view encoded_string);

// Replaces every invalid UTF-8 sequence with U+FFFD.
std::string sanitize_utf8(std::string_view input);

std::string to_lower_copy(std::string_view s);
bool ends_with(std::string_view s, std::string_view suffix);

// Returns false when the parent directory could not be created.
bool create_directory_for_file(const std::string &file_path);

template <typename T> std::optional<T> string_to_number(std::string_view s) {
  if (s.empty() || s == "-") {
    if constexpr (std::is_floating_point_v<T>)
      return static_cast<T>(0.0);
    if constexpr (std::is_integral_v<T>)
      return static_cast<T>(0);
    return std::nullopt;
  }

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
