#include "markdown_report_writer.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace {

constexpr size_t ENDPOINT_TABLE_LIMIT = 10;

std::string join_tags(const LogEntry &entry) {
  std::string joined;
  for (auto category : entry.attack_tags) {
    if (!joined.empty())
      joined += ',';
    joined += Signatures::attack_category_label(category);
  }
  return joined;
}

void render_summary(std::ostringstream &md, const AnalysisResult &result) {
  md << "# Web Log Recon Report\n\n";
  md << "- Files read: **" << result.files_read << "**\n";
  md << "- Parsed events: **" << result.parsed_events << "**\n";
  md << "- Parse failures (non-matching lines): **" << result.parse_failures
     << "**\n\n";
}

void render_ranked_addresses(std::ostringstream &md,
                             const AnalysisResult &result) {
  md << "## Top suspicious IPs (auto-scored)\n\n";
  if (result.top_suspicious_ips.empty()) {
    md << "No IPs found matching the minimum request threshold.\n\n";
    return;
  }
  md << "| Rank | IP | Score | Requests |\n|---:|---|---:|---:|\n";
  size_t rank = 1;
  for (const auto &profile : result.top_suspicious_ips)
    md << "| " << rank++ << " | " << profile.ip << " | " << std::fixed
       << std::setprecision(2) << profile.score << " | "
       << profile.request_count << " |\n";
  md << "\n";
}

void render_tools(std::ostringstream &md, const AnalysisResult &result) {
  md << "## Attacker tools (by first appearance in logs)\n\n";
  if (result.tools_first_seen.empty())
    md << "- No tool fingerprints found in User-Agent fields.\n";
  for (const auto &sighting : result.tools_first_seen)
    md << "- **" << sighting.tool
       << "**, first seen: " << Utils::format_iso8601(sighting.first_seen)
       << "\n";
  md << "\n";
}

void render_endpoints(std::ostringstream &md, const AnalysisResult &result) {
  md << "## Likely vulnerable SQLi endpoints (ranked)\n\n";
  if (result.vulnerable_endpoints.empty()) {
    md << "- No SQLi signatures found.\n\n";
    return;
  }

  md << "| Rank | Endpoint | Score | SQLi hits | SQLi+500 | Unique payloads "
        "|\n|---:|---|---:|---:|---:|---:|\n";
  const size_t shown =
      std::min(result.vulnerable_endpoints.size(), ENDPOINT_TABLE_LIMIT);
  for (size_t i = 0; i < shown; ++i) {
    const auto &ep = result.vulnerable_endpoints[i];
    md << "| " << i + 1 << " | `" << ep.endpoint << "` | " << ep.score
       << " | " << ep.sqli_hits << " | " << ep.sqli_5xx << " | "
       << ep.unique_payloads << " |\n";
  }
  md << "\n";

  const auto &top = result.vulnerable_endpoints.front();
  md << "### Example SQLi requests targeting `" << top.endpoint << "`\n";
  for (const auto &url : top.examples)
    md << "- `" << url << "`\n";
  md << "\n";
}

void render_scrape_section(std::ostringstream &md,
                           const AnalysisResult &result) {
  md << "## Inferred section used for email scraping\n\n";
  if (result.inferred_scrape_section)
    md << "- Most likely section: **`" << *result.inferred_scrape_section
       << "`** (identity/user-related endpoint repeatedly hit by top "
          "suspicious IPs)\n\n";
  else
    md << "- Could not infer a scraping section (no strong identity endpoint "
          "hits among top suspicious IPs).\n\n";
}

void render_address_details(std::ostringstream &md,
                            const AnalysisResult &result) {
  md << "## Per-IP movement (top suspicious IPs)\n\n";
  for (const auto &profile : result.top_suspicious_ips) {
    md << "### " << profile.ip << "\n";
    md << "- Requests: **" << profile.request_count << "**\n";

    md << "- Status codes: ";
    bool first = true;
    for (const auto &[status, count] : profile.status_codes) {
      md << (first ? "" : ", ") << status << ":" << count;
      first = false;
    }
    md << "\n";

    md << "- Top endpoints:\n";
    for (const auto &path_count : profile.top_paths)
      md << "  - `" << path_count.path << "`: " << path_count.count << "\n";

    if (!profile.abnormal_examples.empty()) {
      md << "- Abnormal query examples:\n";
      for (const auto &entry : profile.abnormal_examples)
        md << "  - **" << join_tags(entry) << "** `" << entry.request_target
           << "` (status " << entry.http_status_code << ")\n";
    }
    md << "\n";
  }
}

} // namespace

std::string MarkdownReportWriter::render(const AnalysisResult &result) {
  std::ostringstream md;
  render_summary(md, result);
  render_ranked_addresses(md, result);
  render_tools(md, result);
  render_endpoints(md, result);
  render_scrape_section(md, result);
  render_address_details(md, result);
  return md.str();
}

bool MarkdownReportWriter::write(const AnalysisResult &result,
                                 const std::string &output_path) {
  return write_report_file(output_path, render(result), get_name());
}
