#include "log_entry.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <string_view>

namespace {

// Fields of one combined-format line, as views into the line:
// IP - - [10/Apr/2021:12:01:55 +0000] "GET /path?q=1 HTTP/1.1" 200 1234 "-" "UA"
struct CombinedLineFields {
  std::string_view ip;
  std::string_view timestamp;
  std::string_view method;
  std::string_view target;
  std::optional<std::string_view> http_version;
  std::string_view status;
  std::string_view bytes;
  std::optional<std::string_view> referer;
  std::optional<std::string_view> user_agent;
};

bool is_space(char c) { return std::isspace(static_cast<unsigned char>(c)); }

// Walks the line by position. Every step is linear in the field it consumes.
class CombinedLineScanner {
public:
  explicit CombinedLineScanner(std::string_view line) : line_(line) {}

  std::optional<CombinedLineFields> scan() {
    CombinedLineFields fields;

    // IP, identd and user are plain tokens
    fields.ip = token();
    if (fields.ip.empty() || !skip_spaces() || token().empty() ||
        !skip_spaces() || token().empty() || !skip_spaces())
      return std::nullopt;

    if (!consume('['))
      return std::nullopt;
    size_t close = line_.find(']', pos_);
    if (close == std::string_view::npos || close == pos_)
      return std::nullopt;
    fields.timestamp = line_.substr(pos_, close - pos_);
    pos_ = close + 1;

    if (!skip_spaces() || !consume('"') || !scan_request(fields))
      return std::nullopt;

    if (!skip_spaces())
      return std::nullopt;
    fields.status = token();
    if (fields.status.size() != 3 ||
        !std::all_of(fields.status.begin(), fields.status.end(),
                     [](char c) { return c >= '0' && c <= '9'; }))
      return std::nullopt;

    if (!skip_spaces())
      return std::nullopt;
    fields.bytes = token();
    if (fields.bytes.empty())
      return std::nullopt;

    // Referer and user agent are optional as a pair
    size_t mark = pos_;
    std::optional<std::string_view> referer, user_agent;
    if (skip_spaces() && (referer = quoted()) && skip_spaces() &&
        (user_agent = quoted())) {
      fields.referer = referer;
      fields.user_agent = user_agent;
    } else {
      pos_ = mark;
    }
    return fields;
  }

private:
  // METHOD TARGET[ HTTP/version]" with the opening quote already consumed
  bool scan_request(CombinedLineFields &fields) {
    size_t method_start = pos_;
    while (pos_ < line_.size() && line_[pos_] >= 'A' && line_[pos_] <= 'Z')
      ++pos_;
    if (pos_ == method_start)
      return false;
    fields.method = line_.substr(method_start, pos_ - method_start);

    if (!skip_spaces())
      return false;
    std::string_view run = token();
    if (run.empty())
      return false;

    size_t after_run = pos_;
    if (skip_spaces() && line_.substr(pos_, 5) == "HTTP/") {
      size_t version_start = pos_ + 5;
      size_t quote = line_.find('"', version_start);
      if (quote != std::string_view::npos && quote > version_start) {
        fields.target = run;
        fields.http_version =
            line_.substr(version_start, quote - version_start);
        pos_ = quote + 1;
        return true;
      }
    }

    // No protocol: the target itself carries the closing quote
    pos_ = after_run;
    if (run.size() < 2 || run.back() != '"')
      return false;
    fields.target = run.substr(0, run.size() - 1);
    return true;
  }

  std::optional<std::string_view> quoted() {
    if (!consume('"'))
      return std::nullopt;
    size_t close = line_.find('"', pos_);
    if (close == std::string_view::npos)
      return std::nullopt;
    std::string_view value = line_.substr(pos_, close - pos_);
    pos_ = close + 1;
    return value;
  }

  std::string_view token() {
    size_t start = pos_;
    while (pos_ < line_.size() && !is_space(line_[pos_]))
      ++pos_;
    return line_.substr(start, pos_ - start);
  }

  // True when at least one whitespace character was skipped
  bool skip_spaces() {
    size_t start = pos_;
    while (pos_ < line_.size() && is_space(line_[pos_]))
      ++pos_;
    return pos_ > start;
  }

  bool consume(char expected) {
    if (pos_ >= line_.size() || line_[pos_] != expected)
      return false;
    ++pos_;
    return true;
  }

  std::string_view line_;
  size_t pos_ = 0;
};

bool is_scheme_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' ||
         c == '.';
}

} // namespace

LogEntry::LogEntry()
    : original_line_number(0), source_file_index(0), http_status_code(0),
      bytes_sent(0) {}

bool LogEntry::has_attack_tag(Signatures::AttackCategory category) const {
  return std::find(attack_tags.begin(), attack_tags.end(), category) !=
         attack_tags.end();
}

void LogEntry::parse_request_target(std::string_view target,
                                    std::string &out_path,
                                    std::string &out_query) {
  std::string_view rest = target;

  // Fragment never reaches the path or the query
  size_t hash = rest.find('#');
  if (hash != std::string_view::npos)
    rest = rest.substr(0, hash);

  // Absolute-form targets carry a scheme ("http:")
  size_t colon = rest.find(':');
  if (colon != std::string_view::npos && colon > 0 &&
      std::isalpha(static_cast<unsigned char>(rest[0])) &&
      std::all_of(rest.begin(), rest.begin() + colon, is_scheme_char))
    rest = rest.substr(colon + 1);

  if (rest.substr(0, 2) == "//") {
    size_t authority_end = rest.find_first_of("/?", 2);
    rest = authority_end == std::string_view::npos ? std::string_view{}
                                                   : rest.substr(authority_end);
  }

  size_t question = rest.find('?');
  std::string_view path = rest.substr(0, question);
  std::string_view query = question == std::string_view::npos
                               ? std::string_view{}
                               : rest.substr(question + 1);

  out_path = path.empty() ? std::string(target) : std::string(path);
  out_query = std::string(query);
}

std::optional<LogEntry> LogEntry::parse_from_string(std::string_view log_line,
                                                    uint64_t line_num) {
  auto fields = CombinedLineScanner(log_line).scan();
  if (!fields) {
    LOG(LogLevel::DEBUG, LogComponent::PARSER,
        "Line " << line_num << " does not match the combined log format");
    return std::nullopt;
  }

  LogEntry entry;
  entry.original_line_number = line_num;
  entry.ip_address = std::string(fields->ip);

  entry.timestamp = Utils::parse_log_timestamp(fields->timestamp);
  if (!entry.timestamp)
    LOG(LogLevel::DEBUG, LogComponent::PARSER,
        "Line " << line_num << ": unparseable timestamp '" << fields->timestamp
                << "', keeping event");

  entry.request_method = std::string(fields->method);
  entry.request_target = std::string(fields->target);
  parse_request_target(entry.request_target, entry.request_path,
                       entry.request_query);
  if (fields->http_version)
    entry.http_version = std::string(*fields->http_version);

  // Three digits are guaranteed by the scanner
  entry.http_status_code =
      Utils::string_to_number<int>(fields->status).value_or(0);
  entry.bytes_sent =
      Utils::string_to_number<uint64_t>(fields->bytes).value_or(0);

  if (fields->referer)
    entry.referer = std::string(*fields->referer);
  if (fields->user_agent)
    entry.user_agent = std::string(*fields->user_agent);

  entry.attack_tags = Signatures::detect_attacks(entry.request_target);
  entry.detected_tool = Signatures::detect_tool(entry.user_agent);

  return entry;
}
