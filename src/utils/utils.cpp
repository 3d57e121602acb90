#include "utils.hpp"

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <filesystem>
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

// Reads 1..max_digits decimal digits starting at pos.
std::optional<int> read_digits(std::string_view s, size_t &pos,
                               size_t max_digits) {
  size_t start = pos;
  int value = 0;
  while (pos < s.size() && pos - start < max_digits &&
         std::isdigit(static_cast<unsigned char>(s[pos]))) {
    value = value * 10 + (s[pos] - '0');
    pos++;
  }
  if (pos == start)
    return std::nullopt;
  return value;
}

bool expect_char(std::string_view s, size_t &pos, char c) {
  if (pos >= s.size() || s[pos] != c)
    return false;
  pos++;
  return true;
}

bool is_leap_year(int year) {
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(int year, int month0) {
  static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month0 == 1 && is_leap_year(year))
    return 29;
  return days[month0];
}

std::optional<int> month_from_abbrev(std::string_view s) {
  static const char *months[] = {"jan", "feb", "mar", "apr", "may", "jun",
                                 "jul", "aug", "sep", "oct", "nov", "dec"};
  if (s.size() != 3)
    return std::nullopt;
  std::string lowered = to_lower_copy(s);
  for (int i = 0; i < 12; ++i)
    if (lowered == months[i])
      return i;
  return std::nullopt;
}

// Parses "dd/Mon/YYYY:HH:MM:SS" and leaves pos just after the seconds.
bool parse_date_time(std::string_view s, size_t &pos, std::tm &t) {
  auto day = read_digits(s, pos, 2);
  if (!day || !expect_char(s, pos, '/'))
    return false;

  if (pos + 3 > s.size())
    return false;
  auto month = month_from_abbrev(s.substr(pos, 3));
  if (!month)
    return false;
  pos += 3;
  if (!expect_char(s, pos, '/'))
    return false;

  size_t year_start = pos;
  auto year = read_digits(s, pos, 4);
  if (!year || pos - year_start != 4 || !expect_char(s, pos, ':'))
    return false;

  auto hour = read_digits(s, pos, 2);
  if (!hour || !expect_char(s, pos, ':'))
    return false;
  auto minute = read_digits(s, pos, 2);
  if (!minute || !expect_char(s, pos, ':'))
    return false;
  auto second = read_digits(s, pos, 2);
  if (!second)
    return false;

  if (*day < 1 || *day > days_in_month(*year, *month) || *hour > 23 ||
      *minute > 59 || *second > 59)
    return false;

  t = std::tm{};
  t.tm_mday = *day;
  t.tm_mon = *month;
  t.tm_year = *year - 1900;
  t.tm_hour = *hour;
  t.tm_min = *minute;
  t.tm_sec = *second;
  return true;
}

// "+HHMM", "+HH:MM" or "Z".
std::optional<int> parse_utc_offset(std::string_view s) {
  if (s == "Z" || s == "z")
    return 0;
  if (s.size() != 5 && s.size() != 6)
    return std::nullopt;
  if (s[0] != '+' && s[0] != '-')
    return std::nullopt;

  size_t pos = 1;
  size_t hour_start = pos;
  auto hours = read_digits(s, pos, 2);
  if (!hours || pos - hour_start != 2)
    return std::nullopt;
  if (s.size() == 6 && !expect_char(s, pos, ':'))
    return std::nullopt;
  size_t minute_start = pos;
  auto minutes = read_digits(s, pos, 2);
  if (!minutes || pos - minute_start != 2 || pos != s.size())
    return std::nullopt;
  if (*hours > 23 || *minutes > 59)
    return std::nullopt;

  int total = *hours * 60 + *minutes;
  return s[0] == '-' ? -total : total;
}

std::time_t to_epoch_seconds(std::tm &t) {
#if defined(_WIN32)
  return _mkgmtime(&t);
#else
  return timegm(&t);
#endif
}

} // namespace

std::string url_decode(std::string_view encoded_string) {
  std::string decoded;
  decoded.reserve(encoded_string.size());

  for (size_t i = 0; i < encoded_string.length(); i++) {
    if (encoded_string[i] == '%' && i + 2 < encoded_string.length()) {
      int hi = hex_value(encoded_string[i + 1]);
      int lo = hex_value(encoded_string[i + 2]);
      if (hi >= 0 && lo >= 0) {
        decoded.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
        continue;
      }
    }
    decoded.push_back(encoded_string[i]);
  }
  return sanitize_utf8(decoded);
}

std::string sanitize_utf8(std::string_view input) {
  static const char replacement[] = "\xEF\xBF\xBD";
  std::string out;
  out.reserve(input.size());

  size_t i = 0;
  while (i < input.size()) {
    unsigned char c = static_cast<unsigned char>(input[i]);
    if (c < 0x80) {
      out.push_back(static_cast<char>(c));
      i++;
      continue;
    }

    size_t needed = 0;
    unsigned char lo = 0x80, hi = 0xBF;
    if (c >= 0xC2 && c <= 0xDF) {
      needed = 1;
    } else if (c >= 0xE0 && c <= 0xEF) {
      needed = 2;
      if (c == 0xE0)
        lo = 0xA0;
      else if (c == 0xED)
        hi = 0x9F;
    } else if (c >= 0xF0 && c <= 0xF4) {
      needed = 3;
      if (c == 0xF0)
        lo = 0x90;
      else if (c == 0xF4)
        hi = 0x8F;
    } else {
      out.append(replacement);
      i++;
      continue;
    }

    // Only the first continuation byte has a restricted range.
    size_t consumed = 1;
    bool valid = true;
    for (size_t k = 0; k < needed; ++k) {
      if (i + consumed >= input.size()) {
        valid = false;
        break;
      }
      unsigned char cc = static_cast<unsigned char>(input[i + consumed]);
      unsigned char min = (k == 0) ? lo : 0x80;
      unsigned char max = (k == 0) ? hi : 0xBF;
      if (cc < min || cc > max) {
        valid = false;
        break;
      }
      consumed++;
    }

    if (valid)
      out.append(input.substr(i, consumed));
    else
      out.append(replacement);
    i += consumed;
  }
  return out;
}

std::vector<std::string> split_string(const std::string &text, char delimiter) {
  std::vector<std::string> tokens;
  std::string current_token;
  std::istringstream token_stream(text);

  while (std::getline(token_stream, current_token, delimiter)) {
    tokens.push_back(current_token);
  }
  return tokens;
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

std::optional<LogTimestamp> parse_log_timestamp(std::string_view log_time_str) {
  if (log_time_str.empty() || log_time_str == "-")
    return std::nullopt;

  std::tm t{};
  size_t pos = 0;
  if (!parse_date_time(log_time_str, pos, t))
    return std::nullopt;

  std::optional<int> offset_minutes;
  if (pos != log_time_str.size()) {
    // Expected format: 23/May/2025:00:00:35 +0530
    size_t gap = pos;
    while (pos < log_time_str.size() && log_time_str[pos] == ' ')
      pos++;
    if (pos == gap || pos == log_time_str.size())
      return std::nullopt;
    offset_minutes = parse_utc_offset(log_time_str.substr(pos));
    if (!offset_minutes)
      return std::nullopt;
  }

  std::time_t epoch_seconds = to_epoch_seconds(t);

  // timegm treats the fields as UTC, so shift back by the written offset
  LogTimestamp ts;
  ts.epoch_ms = static_cast<int64_t>(epoch_seconds) * 1000;
  if (offset_minutes)
    ts.epoch_ms -= static_cast<int64_t>(*offset_minutes) * 60 * 1000;
  ts.utc_offset_minutes = offset_minutes;
  return ts;
}

std::string format_iso8601(const LogTimestamp &ts) {
  int64_t wall_ms =
      ts.epoch_ms +
      static_cast<int64_t>(ts.utc_offset_minutes.value_or(0)) * 60 * 1000;
  int64_t wall_seconds = wall_ms >= 0 ? wall_ms / 1000 : (wall_ms - 999) / 1000;
  std::time_t seconds = static_cast<std::time_t>(wall_seconds);

  std::tm t{};
#if defined(_WIN32)
  gmtime_s(&t, &seconds);
#else
  gmtime_r(&seconds, &t);
#endif

  char buffer[40];
  std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d",
                t.tm_year + 1900, t.tm_mon + 1, t.tm_mday, t.tm_hour,
                t.tm_min, t.tm_sec);
  std::string out(buffer);

  if (ts.utc_offset_minutes) {
    int offset = *ts.utc_offset_minutes;
    char sign = offset < 0 ? '-' : '+';
    if (offset < 0)
      offset = -offset;
    std::snprintf(buffer, sizeof(buffer), "%c%02d:%02d", sign, offset / 60,
                  offset % 60);
    out += buffer;
  }
  return out;
}

int64_t wall_clock_minute(const LogTimestamp &ts) {
  int64_t wall_ms =
      ts.epoch_ms +
      static_cast<int64_t>(ts.utc_offset_minutes.value_or(0)) * 60 * 1000;
  if (wall_ms >= 0)
    return wall_ms / 60000;
  return -((-wall_ms + 59999) / 60000);
}

std::string to_lower_copy(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char ch) { return std::tolower(ch); });
  return out;
}

bool ends_with(std::string_view s, std::string_view suffix) {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool create_directory_for_file(const std::string &file_path) {
  std::filesystem::path parent = std::filesystem::path(file_path).parent_path();
  if (parent.empty())
    return true;
  std::error_code ec;
  std::filesystem::create_directories(parent, ec);
  return !ec;
}

} // namespace Utils
