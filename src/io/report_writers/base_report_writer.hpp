#ifndef BASE_REPORT_WRITER_HPP
#define BASE_REPORT_WRITER_HPP

#include "analysis/analysis_result.hpp"

#include <string>

class IReportWriter {
public:
  virtual ~IReportWriter() = default;
  // Renders the result and writes it to output_path, creating parent
  // directories. Returns false and logs the reason on failure.
  virtual bool write(const AnalysisResult &result,
                     const std::string &output_path) = 0;
  virtual const char *get_name() const = 0;
};

// Shared file sink for the writers
bool write_report_file(const std::string &output_path,
                       const std::string &content, const char *writer_name);

#endif // BASE_REPORT_WRITER_HPP
