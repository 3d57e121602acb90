#ifndef HTML_REPORT_WRITER_HPP
#define HTML_REPORT_WRITER_HPP

#include "base_report_writer.hpp"

#include <string>
#include <string_view>

// Self-contained single page. Every value taken from the logs is escaped.
class HtmlReportWriter : public IReportWriter {
public:
  bool write(const AnalysisResult &result,
             const std::string &output_path) override;
  const char *get_name() const override { return "HtmlReportWriter"; }

  static std::string render(const AnalysisResult &result);
  static std::string escape_html(std::string_view input);
};

#endif // HTML_REPORT_WRITER_HPP
