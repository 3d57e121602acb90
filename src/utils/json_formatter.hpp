#ifndef JSON_FORMATTER_HPP
#define JSON_FORMATTER_HPP

#include "analysis/analysis_result.hpp"
#include "core/log_entry.hpp"
#include "nlohmann/json.hpp"

#include <cstddef>
#include <string>

namespace JsonFormatter {

nlohmann::json entry_to_json_object(const LogEntry &entry);
nlohmann::json profile_to_json_object(const AddressProfile &profile);
nlohmann::json endpoint_to_json_object(const EndpointExposure &endpoint);

// summary, top_ips_detail, vulnerable_endpoints and the first
// event_dump_limit events
nlohmann::json result_to_json_object(const AnalysisResult &result,
                                     size_t event_dump_limit);

std::string format_result_to_json(const AnalysisResult &result,
                                  size_t event_dump_limit);

} // namespace JsonFormatter

#endif // JSON_FORMATTER_HPP
