#ifndef LOG_ENTRY_HPP
#define LOG_ENTRY_HPP

#include "detection/signatures.hpp"
#include "utils/utils.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// One access-log line in Apache/Nginx combined format, plus what the
// signature catalog says about it.
struct LogEntry {
  uint64_t original_line_number;
  // Position of the source file in the resolved input list
  uint32_t source_file_index;

  std::string ip_address;
  std::optional<Utils::LogTimestamp> timestamp;

  std::string request_method;
  std::string request_target; // raw, undecoded
  std::string request_path;
  std::string request_query;
  std::string http_version;

  int http_status_code;
  uint64_t bytes_sent;

  std::string user_agent;
  std::optional<std::string> referer;

  std::optional<std::string> detected_tool;
  std::vector<Signatures::AttackCategory> attack_tags;

  LogEntry();

  bool is_abnormal() const { return !attack_tags.empty(); }
  bool has_attack_tag(Signatures::AttackCategory category) const;

  // Returns nullopt when the line does not match the combined format. An
  // unparseable timestamp or byte count does not reject the line.
  static std::optional<LogEntry> parse_from_string(std::string_view log_line,
                                                   uint64_t line_num);

  // Splits a request target into path and query the way a URL parser
  // would. Falls back to the whole target when there is no path.
  static void parse_request_target(std::string_view target,
                                   std::string &out_path,
                                   std::string &out_query);
};

#endif // LOG_ENTRY_HPP
