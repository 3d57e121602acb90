#ifndef JSON_REPORT_WRITER_HPP
#define JSON_REPORT_WRITER_HPP

#include "base_report_writer.hpp"

#include <cstddef>
#include <string>

class JsonReportWriter : public IReportWriter {
public:
  explicit JsonReportWriter(size_t event_dump_limit = 20000);

  bool write(const AnalysisResult &result,
             const std::string &output_path) override;
  const char *get_name() const override { return "JsonReportWriter"; }

private:
  size_t event_dump_limit_;
};

#endif // JSON_REPORT_WRITER_HPP
