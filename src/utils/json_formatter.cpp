#include "json_formatter.hpp"

#include <algorithm>
#include <string>

namespace {

// Helper to handle optional values cleanly
template <typename T>
nlohmann::json optional_to_json(const std::optional<T> &opt) {
  if (opt)
    return nlohmann::json(*opt);
  return nullptr;
}

// Only the top endpoints are named in the summary
constexpr size_t SUMMARY_ENDPOINT_LIMIT = 10;

} // namespace

nlohmann::json JsonFormatter::entry_to_json_object(const LogEntry &entry) {
  nlohmann::json j;
  j["ip"] = entry.ip_address;
  j["timestamp"] = entry.timestamp
                       ? nlohmann::json(Utils::format_iso8601(*entry.timestamp))
                       : nlohmann::json(nullptr);
  j["method"] = entry.request_method;
  j["url"] = entry.request_target;
  j["path"] = entry.request_path;
  j["query"] = entry.request_query;
  j["http_version"] = entry.http_version;
  j["status"] = entry.http_status_code;
  j["bytes"] = entry.bytes_sent;
  j["user_agent"] = entry.user_agent;
  j["referer"] = optional_to_json(entry.referer);
  j["tool"] = optional_to_json(entry.detected_tool);

  nlohmann::json tags = nlohmann::json::array();
  for (auto category : entry.attack_tags)
    tags.push_back(Signatures::attack_category_label(category));
  j["abnormal"] = tags;

  j["line_number"] = entry.original_line_number;
  j["source_file_index"] = entry.source_file_index;
  return j;
}

nlohmann::json
JsonFormatter::profile_to_json_object(const AddressProfile &profile) {
  nlohmann::json j;
  j["ip"] = profile.ip;
  j["request_count"] = profile.request_count;
  j["score"] = profile.score;

  // JSON object keys are strings
  nlohmann::json status_codes = nlohmann::json::object();
  for (const auto &[status, count] : profile.status_codes)
    status_codes[std::to_string(status)] = count;
  j["status_codes"] = status_codes;

  j["abnormal_count"] = profile.abnormal_count;
  j["login_attempts"] = profile.login_attempts;
  j["identity_queries"] = profile.identity_queries;
  j["max_requests_per_minute"] = profile.max_requests_per_minute;

  nlohmann::json top_paths = nlohmann::json::array();
  for (const auto &path_count : profile.top_paths)
    top_paths.push_back(
        nlohmann::json::array({path_count.path, path_count.count}));
  j["top_paths"] = top_paths;

  nlohmann::json examples = nlohmann::json::array();
  for (const auto &entry : profile.abnormal_examples)
    examples.push_back(entry_to_json_object(entry));
  j["abnormal_examples"] = examples;

  j["tools_used"] = profile.tools_used;
  return j;
}

nlohmann::json
JsonFormatter::endpoint_to_json_object(const EndpointExposure &endpoint) {
  return {{"endpoint", endpoint.endpoint},
          {"score", endpoint.score},
          {"sqli_hits", endpoint.sqli_hits},
          {"sqli_500", endpoint.sqli_5xx},
          {"unique_payloads", endpoint.unique_payloads},
          {"examples", endpoint.examples}};
}

nlohmann::json
JsonFormatter::result_to_json_object(const AnalysisResult &result,
                                     size_t event_dump_limit) {
  nlohmann::json summary;
  summary["files_read"] = result.files_read;
  summary["parsed_events"] = result.parsed_events;
  summary["parse_failures"] = result.parse_failures;

  nlohmann::json top_ips = nlohmann::json::array();
  for (const auto &profile : result.top_suspicious_ips)
    top_ips.push_back(profile.ip);
  summary["top_suspicious_ips"] = top_ips;

  nlohmann::json tools = nlohmann::json::array();
  for (const auto &sighting : result.tools_first_seen)
    tools.push_back(nlohmann::json::array(
        {sighting.tool, Utils::format_iso8601(sighting.first_seen)}));
  summary["tools_by_first_seen"] = tools;

  nlohmann::json top_endpoints = nlohmann::json::array();
  const size_t endpoint_count =
      std::min(result.vulnerable_endpoints.size(), SUMMARY_ENDPOINT_LIMIT);
  for (size_t i = 0; i < endpoint_count; ++i)
    top_endpoints.push_back(result.vulnerable_endpoints[i].endpoint);
  summary["top_sqli_endpoints"] = top_endpoints;

  summary["inferred_scrape_section"] =
      optional_to_json(result.inferred_scrape_section);

  nlohmann::json j;
  j["summary"] = summary;

  nlohmann::json details = nlohmann::json::array();
  for (const auto &profile : result.top_suspicious_ips)
    details.push_back(profile_to_json_object(profile));
  j["top_ips_detail"] = details;

  nlohmann::json endpoints = nlohmann::json::array();
  for (const auto &endpoint : result.vulnerable_endpoints)
    endpoints.push_back(endpoint_to_json_object(endpoint));
  j["vulnerable_endpoints"] = endpoints;

  nlohmann::json events = nlohmann::json::array();
  const size_t event_count =
      std::min(result.all_events.size(), event_dump_limit);
  for (size_t i = 0; i < event_count; ++i)
    events.push_back(entry_to_json_object(result.all_events[i]));
  j["events"] = events;

  return j;
}

std::string JsonFormatter::format_result_to_json(const AnalysisResult &result,
                                                 size_t event_dump_limit) {
  // Log text is sanitised on read, but replace rather than throw if an
  // invalid sequence still gets through
  return result_to_json_object(result, event_dump_limit)
      .dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}
