#include "html_report_writer.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace {

constexpr size_t ENDPOINT_TABLE_LIMIT = 10;

constexpr const char *PAGE_HEAD = R"(<!DOCTYPE html>
<html lang="en">
<head>
<meta charset="UTF-8">
<meta name="viewport" content="width=device-width, initial-scale=1.0">
<title>Web Log Recon Report</title>
<style>
body { font-family: -apple-system, 'Segoe UI', Roboto, sans-serif; line-height: 1.6; color: #333; background: #f5f5f5; padding: 20px; }
.container { max-width: 1200px; margin: 0 auto; background: white; padding: 30px; border-radius: 8px; }
h1 { color: #2c3e50; border-bottom: 3px solid #3498db; }
h2 { color: #34495e; margin-top: 30px; border-bottom: 2px solid #ecf0f1; }
.summary { display: grid; grid-template-columns: repeat(auto-fit, minmax(200px, 1fr)); gap: 15px; }
.summary-item { background: #ecf0f1; padding: 15px; border-radius: 5px; text-align: center; }
.summary-item .value { font-size: 1.8em; font-weight: bold; }
table { width: 100%; border-collapse: collapse; margin: 15px 0; }
th, td { padding: 10px; text-align: left; border-bottom: 1px solid #ecf0f1; }
th { background: #34495e; color: white; }
.high-score { color: #e74c3c; font-weight: bold; }
.medium-score { color: #f39c12; font-weight: bold; }
.low-score { color: #27ae60; }
.tool-badge, .attack-badge { display: inline-block; padding: 3px 8px; margin: 2px; color: white; border-radius: 3px; font-size: 0.85em; }
.tool-badge { background: #3498db; }
.attack-badge { background: #e74c3c; }
code { background: #f8f9fa; padding: 2px 6px; font-family: 'Courier New', monospace; }
.ip-detail { background: #f8f9fa; padding: 20px; margin: 15px 0; border-left: 4px solid #3498db; }
.abnormal-example { margin: 5px 0; padding: 8px; background: #fff5f5; border-left: 3px solid #e74c3c; }
</style>
</head>
<body>
<div class="container">
<h1>Web Log Recon Report</h1>
)";

constexpr const char *PAGE_TAIL = "</div>\n</body>\n</html>\n";

const char *score_class(double score) {
  if (score > 10.0)
    return "high-score";
  if (score > 5.0)
    return "medium-score";
  return "low-score";
}

void summary_item(std::ostringstream &html, const char *label,
                  uint64_t value) {
  html << "<div class=\"summary-item\"><div class=\"label\">" << label
       << "</div><div class=\"value\">" << value << "</div></div>\n";
}

} // namespace

std::string HtmlReportWriter::escape_html(std::string_view input) {
  std::string out;
  out.reserve(input.size());
  for (char c : input) {
    switch (c) {
    case '&':
      out += "&amp;";
      break;
    case '<':
      out += "&lt;";
      break;
    case '>':
      out += "&gt;";
      break;
    case '"':
      out += "&quot;";
      break;
    case '\'':
      out += "&#39;";
      break;
    default:
      out += c;
    }
  }
  return out;
}

std::string HtmlReportWriter::render(const AnalysisResult &result) {
  std::ostringstream html;
  html << PAGE_HEAD;

  html << "<div class=\"summary\">\n";
  summary_item(html, "Files Processed", result.files_read);
  summary_item(html, "Events Parsed", result.parsed_events);
  summary_item(html, "Parse Failures", result.parse_failures);
  html << "</div>\n";

  html << "<h2>Top Suspicious IPs</h2>\n";
  if (result.top_suspicious_ips.empty()) {
    html << "<p>No IPs found matching the minimum request threshold.</p>\n";
  } else {
    html << "<table>\n<thead><tr><th>Rank</th><th>IP Address</th>"
            "<th>Score</th><th>Requests</th><th>Tools</th></tr></thead>\n"
            "<tbody>\n";
    size_t rank = 1;
    for (const auto &profile : result.top_suspicious_ips) {
      html << "<tr><td>" << rank++ << "</td><td><strong>"
           << escape_html(profile.ip) << "</strong></td><td class=\""
           << score_class(profile.score) << "\">" << std::fixed
           << std::setprecision(2) << profile.score << "</td><td>"
           << profile.request_count << "</td><td>";
      for (const auto &tool : profile.tools_used)
        html << "<span class=\"tool-badge\">" << escape_html(tool)
             << "</span>";
      html << "</td></tr>\n";
    }
    html << "</tbody>\n</table>\n";
  }

  html << "<h2>Attacker Tools (First Appearance)</h2>\n";
  if (result.tools_first_seen.empty()) {
    html << "<p>No tool fingerprints found in User-Agent fields.</p>\n";
  } else {
    html << "<ul>\n";
    for (const auto &sighting : result.tools_first_seen)
      html << "<li><strong>" << escape_html(sighting.tool)
           << "</strong>, first seen: "
           << Utils::format_iso8601(sighting.first_seen) << "</li>\n";
    html << "</ul>\n";
  }

  html << "<h2>Likely Vulnerable SQLi Endpoints</h2>\n";
  if (result.vulnerable_endpoints.empty()) {
    html << "<p>No SQLi signatures found.</p>\n";
  } else {
    html << "<table>\n<thead><tr><th>Rank</th><th>Endpoint</th><th>Score</th>"
            "<th>SQLi Hits</th><th>SQLi+500</th><th>Unique Payloads</th>"
            "</tr></thead>\n<tbody>\n";
    const size_t shown =
        std::min(result.vulnerable_endpoints.size(), ENDPOINT_TABLE_LIMIT);
    for (size_t i = 0; i < shown; ++i) {
      const auto &ep = result.vulnerable_endpoints[i];
      html << "<tr><td>" << i + 1 << "</td><td><code>"
           << escape_html(ep.endpoint) << "</code></td><td>" << ep.score
           << "</td><td>" << ep.sqli_hits << "</td><td>" << ep.sqli_5xx
           << "</td><td>" << ep.unique_payloads << "</td></tr>\n";
    }
    html << "</tbody>\n</table>\n";

    html << "<h3>Example SQLi Requests (Top Endpoint)</h3>\n<ul>\n";
    for (const auto &url : result.vulnerable_endpoints.front().examples)
      html << "<li><code>" << escape_html(url) << "</code></li>\n";
    html << "</ul>\n";
  }

  html << "<h2>Inferred Email Scraping Section</h2>\n";
  if (result.inferred_scrape_section)
    html << "<p>Most likely section: <strong><code>"
         << escape_html(*result.inferred_scrape_section)
         << "</code></strong></p>\n<p><em>This identity/user-related endpoint "
            "was repeatedly hit by top suspicious IPs.</em></p>\n";
  else
    html << "<p>Could not infer a scraping section (no strong identity "
            "endpoint hits among top suspicious IPs).</p>\n";

  html << "<h2>Per-IP Movement Details</h2>\n";
  for (const auto &profile : result.top_suspicious_ips) {
    html << "<div class=\"ip-detail\">\n<h3>" << escape_html(profile.ip)
         << "</h3>\n<p><strong>Requests:</strong> " << profile.request_count
         << "</p>\n<p><strong>Status codes:</strong> ";
    bool first = true;
    for (const auto &[status, count] : profile.status_codes) {
      html << (first ? "" : ", ") << status << ":" << count;
      first = false;
    }
    html << "</p>\n<p><strong>Top Endpoints:</strong></p>\n<ul>\n";
    for (const auto &path_count : profile.top_paths)
      html << "<li><code>" << escape_html(path_count.path) << "</code>: "
           << path_count.count << " requests</li>\n";
    html << "</ul>\n";

    if (!profile.abnormal_examples.empty()) {
      html << "<p><strong>Abnormal Query Examples:</strong></p>\n";
      for (const auto &entry : profile.abnormal_examples) {
        html << "<div class=\"abnormal-example\">";
        for (auto category : entry.attack_tags)
          html << "<span class=\"attack-badge\">"
               << escape_html(Signatures::attack_category_label(category))
               << "</span>";
        html << "<br><code>" << escape_html(entry.request_target)
             << "</code> (status " << entry.http_status_code << ")</div>\n";
      }
    }
    html << "</div>\n";
  }

  html << PAGE_TAIL;
  return html.str();
}

bool HtmlReportWriter::write(const AnalysisResult &result,
                             const std::string &output_path) {
  return write_report_file(output_path, render(result), get_name());
}
