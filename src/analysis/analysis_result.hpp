#ifndef ANALYSIS_RESULT_HPP
#define ANALYSIS_RESULT_HPP

#include "core/log_entry.hpp"
#include "utils/utils.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

struct PathCount {
  std::string path;
  size_t count = 0;
};

// Behaviour of one source address over the whole input
struct AddressProfile {
  std::string ip;
  size_t request_count = 0;
  double score = 0.0;

  std::map<int, size_t> status_codes;
  size_t client_error_count = 0; // 4xx
  size_t server_error_count = 0; // 5xx

  size_t abnormal_count = 0;
  size_t login_attempts = 0;
  size_t identity_queries = 0;
  size_t max_requests_per_minute = 0;

  // Most frequent first, ties in first-seen order. At most 10.
  std::vector<PathCount> top_paths;
  // First abnormal events in log order. At most 8.
  std::vector<LogEntry> abnormal_examples;
  // Distinct detected tools, sorted by name
  std::vector<std::string> tools_used;
};

// A path that received SQL injection attempts
struct EndpointExposure {
  std::string endpoint;
  uint64_t score = 0;
  size_t sqli_hits = 0;
  size_t sqli_5xx = 0;
  size_t unique_payloads = 0;
  // Raw request targets in encounter order. At most 5.
  std::vector<std::string> examples;
};

struct ToolSighting {
  std::string tool;
  Utils::LogTimestamp first_seen;
};

struct AnalysisResult {
  uint64_t files_read = 0;
  uint64_t parsed_events = 0;
  uint64_t parse_failures = 0;

  std::vector<AddressProfile> top_suspicious_ips;
  std::vector<ToolSighting> tools_first_seen;
  std::vector<EndpointExposure> vulnerable_endpoints;
  std::optional<std::string> inferred_scrape_section;

  // Every parsed event, uncapped
  std::vector<LogEntry> all_events;
};

#endif // ANALYSIS_RESULT_HPP
