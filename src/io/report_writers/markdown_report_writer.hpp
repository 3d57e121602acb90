#ifndef MARKDOWN_REPORT_WRITER_HPP
#define MARKDOWN_REPORT_WRITER_HPP

#include "base_report_writer.hpp"

#include <string>

class MarkdownReportWriter : public IReportWriter {
public:
  bool write(const AnalysisResult &result,
             const std::string &output_path) override;
  const char *get_name() const override { return "MarkdownReportWriter"; }

  static std::string render(const AnalysisResult &result);
};

#endif // MARKDOWN_REPORT_WRITER_HPP
