#include "analysis/threat_analyzer.hpp"
#include "io/report_writers/html_report_writer.hpp"
#include "io/report_writers/json_report_writer.hpp"
#include "io/report_writers/markdown_report_writer.hpp"
#include "utils/json_formatter.hpp"
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

std::vector<LogEntry> parse_lines(const std::vector<std::string> &lines) {
  std::vector<LogEntry> entries;
  uint64_t line_num = 0;
  for (const auto &line : lines) {
    auto entry = LogEntry::parse_from_string(line, ++line_num);
    if (entry)
      entries.push_back(*entry);
  }
  return entries;
}

AnalysisResult sample_result() {
  std::vector<std::string> lines;
  for (int i = 0; i < 6; ++i)
    lines.push_back("6.6.6.6 - - [10/Apr/2021:12:00:0" + std::to_string(i) +
                    " +0000] \"GET /admin.php?id=" + std::to_string(i) +
                    "%27%20OR%201%3D1-- HTTP/1.1\" 500 42 \"-\" "
                    "\"sqlmap/1.0\"");
  for (int i = 0; i < 3; ++i)
    lines.push_back("7.7.7.7 - - [10/Apr/2021:11:59:5" + std::to_string(i) +
                    " +0000] \"GET /q?x=%3Cscript%3Ealert(1)%3C/script%3E "
                    "HTTP/1.1\" 200 10 \"-\" \"curl/7.68.0\"");
  lines.push_back("8.8.8.8 - - [not-a-time] \"GET /index.html HTTP/1.1\" 200 "
                  "5 \"-\" \"Mozilla/5.0 Chrome/90.0\"");

  ThreatAnalyzer analyzer(2);
  AnalysisResult result = analyzer.analyze(parse_lines(lines), 10);
  result.files_read = 1;
  result.parse_failures = 4;
  return result;
}

std::string read_file(const fs::path &path) {
  std::ifstream in(path, std::ios::binary);
  std::stringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

bool contains(const std::string &haystack, const std::string &needle) {
  return haystack.find(needle) != std::string::npos;
}

class ReportWriterTest : public ::testing::Test {
protected:
  void SetUp() override {
    test_dir = fs::temp_directory_path() /
               ("report_writer_test_" +
                std::string(::testing::UnitTest::GetInstance()
                                ->current_test_info()
                                ->name()));
    fs::remove_all(test_dir);
    fs::create_directories(test_dir);
  }

  void TearDown() override {
    if (fs::exists(test_dir))
      fs::remove_all(test_dir);
  }

  fs::path test_dir;
};

} // namespace

TEST_F(ReportWriterTest, JsonSummaryShape) {
  AnalysisResult result = sample_result();
  nlohmann::json j = JsonFormatter::result_to_json_object(result, 100);

  const auto &summary = j.at("summary");
  EXPECT_EQ(summary.at("files_read").get<int>(), 1);
  EXPECT_EQ(summary.at("parsed_events").get<int>(), 10);
  EXPECT_EQ(summary.at("parse_failures").get<int>(), 4);

  ASSERT_EQ(summary.at("top_suspicious_ips").size(), 2u);
  EXPECT_EQ(summary.at("top_suspicious_ips")[0].get<std::string>(), "6.6.6.6");

  // Pairs of [tool, first seen], earliest first
  const auto &tools = summary.at("tools_by_first_seen");
  ASSERT_EQ(tools.size(), 2u);
  EXPECT_EQ(tools[0][0].get<std::string>(), "curl");
  EXPECT_EQ(tools[0][1].get<std::string>(), "2021-04-10T11:59:50+00:00");
  EXPECT_EQ(tools[1][0].get<std::string>(), "sqlmap");

  ASSERT_EQ(summary.at("top_sqli_endpoints").size(), 1u);
  EXPECT_EQ(summary.at("top_sqli_endpoints")[0].get<std::string>(), "/admin.php");
  EXPECT_EQ(summary.at("inferred_scrape_section").get<std::string>(), "/admin.php");
}

TEST_F(ReportWriterTest, JsonDetailSections) {
  AnalysisResult result = sample_result();
  nlohmann::json j = JsonFormatter::result_to_json_object(result, 100);

  const auto &detail = j.at("top_ips_detail")[0];
  EXPECT_EQ(detail.at("ip").get<std::string>(), "6.6.6.6");
  EXPECT_EQ(detail.at("request_count").get<int>(), 6);
  EXPECT_EQ(detail.at("status_codes").at("500").get<int>(), 6);
  EXPECT_EQ(detail.at("top_paths")[0][0].get<std::string>(), "/admin.php");
  EXPECT_EQ(detail.at("top_paths")[0][1].get<int>(), 6);
  EXPECT_EQ(detail.at("abnormal_examples").size(), 6u);
  EXPECT_EQ(detail.at("tools_used")[0].get<std::string>(), "sqlmap");

  const auto &endpoint = j.at("vulnerable_endpoints")[0];
  EXPECT_EQ(endpoint.at("endpoint").get<std::string>(), "/admin.php");
  EXPECT_EQ(endpoint.at("sqli_hits").get<int>(), 6);
  EXPECT_EQ(endpoint.at("sqli_500").get<int>(), 6);
  EXPECT_EQ(endpoint.at("unique_payloads").get<int>(), 6);
  EXPECT_EQ(endpoint.at("score").get<int>(), 3 * 6 + 2 * 6 + 6);
  EXPECT_EQ(endpoint.at("examples").size(), 5u);
}

TEST_F(ReportWriterTest, JsonEventFields) {
  AnalysisResult result = sample_result();
  nlohmann::json j = JsonFormatter::result_to_json_object(result, 100);

  const auto &events = j.at("events");
  ASSERT_EQ(events.size(), 10u);

  const auto &first = events[0];
  EXPECT_EQ(first.at("ip").get<std::string>(), "6.6.6.6");
  EXPECT_EQ(first.at("timestamp").get<std::string>(), "2021-04-10T12:00:00+00:00");
  EXPECT_EQ(first.at("method").get<std::string>(), "GET");
  EXPECT_EQ(first.at("url").get<std::string>(), "/admin.php?id=0%27%20OR%201%3D1--");
  EXPECT_EQ(first.at("path").get<std::string>(), "/admin.php");
  EXPECT_EQ(first.at("status").get<int>(), 500);
  EXPECT_EQ(first.at("tool").get<std::string>(), "sqlmap");
  EXPECT_TRUE(first.at("referer").is_null());
  EXPECT_EQ(first.at("abnormal")[0].get<std::string>(), "SQLi");

  const auto &untimed = events[9];
  EXPECT_TRUE(untimed.at("timestamp").is_null());
  EXPECT_EQ(untimed.at("tool").get<std::string>(), "browser");
  EXPECT_TRUE(untimed.at("abnormal").empty());
}

TEST_F(ReportWriterTest, JsonWriterCapsEventDump) {
  AnalysisResult result = sample_result();
  auto path = test_dir / "nested" / "dir" / "report.json";

  JsonReportWriter writer(3);
  ASSERT_TRUE(writer.write(result, path.string()));
  ASSERT_TRUE(fs::exists(path));

  nlohmann::json j = nlohmann::json::parse(read_file(path));
  EXPECT_EQ(j.at("events").size(), 3u);
  // The cap is on the dump only
  EXPECT_EQ(j.at("summary").at("parsed_events").get<int>(), 10);
  EXPECT_EQ(result.all_events.size(), 10u);
}

TEST_F(ReportWriterTest, JsonForEmptyResult) {
  AnalysisResult empty;
  nlohmann::json j = nlohmann::json::parse(
      JsonFormatter::format_result_to_json(empty, 20000));

  EXPECT_TRUE(j.at("summary").at("top_suspicious_ips").empty());
  EXPECT_TRUE(j.at("summary").at("inferred_scrape_section").is_null());
  EXPECT_TRUE(j.at("top_ips_detail").empty());
  EXPECT_TRUE(j.at("vulnerable_endpoints").empty());
  EXPECT_TRUE(j.at("events").empty());
}

TEST_F(ReportWriterTest, MarkdownSections) {
  std::string md = MarkdownReportWriter::render(sample_result());

  EXPECT_EQ(md.rfind("# Web Log Recon Report", 0), 0u);
  EXPECT_TRUE(contains(md, "- Files read: **1**"));
  EXPECT_TRUE(contains(md, "- Parsed events: **10**"));
  EXPECT_TRUE(contains(md, "## Top suspicious IPs (auto-scored)"));
  EXPECT_TRUE(contains(md, "| 1 | 6.6.6.6 |"));
  EXPECT_TRUE(contains(
      md, "- **curl**, first seen: 2021-04-10T11:59:50+00:00"));
  EXPECT_TRUE(contains(md, "## Likely vulnerable SQLi endpoints (ranked)"));
  EXPECT_TRUE(contains(md, "| 1 | `/admin.php` | 36 | 6 | 6 | 6 |"));
  EXPECT_TRUE(
      contains(md, "### Example SQLi requests targeting `/admin.php`"));
  EXPECT_TRUE(contains(md, "- Most likely section: **`/admin.php`**"));
  EXPECT_TRUE(contains(md, "### 6.6.6.6"));
  EXPECT_TRUE(contains(md, "- Status codes: 500:6"));
  EXPECT_TRUE(contains(md, "  - `/admin.php`: 6"));
  EXPECT_TRUE(contains(md, "- Abnormal query examples:"));
}

TEST_F(ReportWriterTest, MarkdownEmptyStates) {
  std::string md = MarkdownReportWriter::render(AnalysisResult{});

  EXPECT_TRUE(
      contains(md, "No IPs found matching the minimum request threshold."));
  EXPECT_TRUE(
      contains(md, "- No tool fingerprints found in User-Agent fields."));
  EXPECT_TRUE(contains(md, "- No SQLi signatures found."));
  EXPECT_TRUE(contains(md, "- Could not infer a scraping section"));
}

TEST_F(ReportWriterTest, HtmlEscapesLogText) {
  EXPECT_EQ(HtmlReportWriter::escape_html("<script>alert('x')&\"</script>"),
            "&lt;script&gt;alert(&#39;x&#39;)&amp;&quot;&lt;/script&gt;");
  EXPECT_EQ(HtmlReportWriter::escape_html("plain"), "plain");

  AnalysisResult result = sample_result();
  result.top_suspicious_ips[0].top_paths.push_back({"/<script>x", 1});
  std::string html = HtmlReportWriter::render(result);

  EXPECT_EQ(html.rfind("<!DOCTYPE html>", 0), 0u);
  EXPECT_TRUE(contains(html, "/&lt;script&gt;x"));
  EXPECT_FALSE(contains(html, "/<script>x"));
  EXPECT_TRUE(contains(html, "<span class=\"tool-badge\">sqlmap</span>"));
  EXPECT_TRUE(contains(html, "</html>"));
}

TEST_F(ReportWriterTest, HtmlEmptyStates) {
  std::string html = HtmlReportWriter::render(AnalysisResult{});
  EXPECT_TRUE(contains(
      html, "<p>No IPs found matching the minimum request threshold.</p>"));
  EXPECT_TRUE(contains(html, "<p>No SQLi signatures found.</p>"));
}

TEST_F(ReportWriterTest, WritersCreateParentDirectories) {
  AnalysisResult result = sample_result();
  std::vector<std::unique_ptr<IReportWriter>> writers;
  writers.push_back(std::make_unique<MarkdownReportWriter>());
  writers.push_back(std::make_unique<HtmlReportWriter>());

  auto md_path = test_dir / "a" / "report.md";
  auto html_path = test_dir / "b" / "c" / "report.html";
  ASSERT_TRUE(writers[0]->write(result, md_path.string()));
  ASSERT_TRUE(writers[1]->write(result, html_path.string()));

  EXPECT_EQ(read_file(md_path), MarkdownReportWriter::render(result));
  EXPECT_EQ(read_file(html_path), HtmlReportWriter::render(result));
}

TEST_F(ReportWriterTest, WriteFailsWhenParentIsAFile) {
  auto blocker = test_dir / "blocker";
  {
    std::ofstream out(blocker);
    out << "x";
  }

  MarkdownReportWriter writer;
  EXPECT_FALSE(
      writer.write(sample_result(), (blocker / "report.md").string()));
}
