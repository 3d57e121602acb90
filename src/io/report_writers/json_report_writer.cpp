#include "json_report_writer.hpp"
#include "core/logger.hpp"
#include "utils/json_formatter.hpp"

#include <exception>
#include <string>

JsonReportWriter::JsonReportWriter(size_t event_dump_limit)
    : event_dump_limit_(event_dump_limit) {}

bool JsonReportWriter::write(const AnalysisResult &result,
                             const std::string &output_path) {
  std::string json_output;
  try {
    json_output =
        JsonFormatter::format_result_to_json(result, event_dump_limit_);
  } catch (const std::exception &e) {
    LOG(LogLevel::ERROR, LogComponent::IO_REPORT,
        "Exception while serialising JSON report: " << e.what());
    return false;
  }
  json_output.push_back('\n');
  return write_report_file(output_path, json_output, get_name());
}
