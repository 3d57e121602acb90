#ifndef THREAT_ANALYZER_HPP
#define THREAT_ANALYZER_HPP

#include "analysis_result.hpp"
#include "core/log_entry.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// Batch analysis over a fully materialised event collection. Each stage is
// a separate pass so it can be exercised on its own.
class ThreatAnalyzer {
public:
  // Address name plus its events in log order
  using AddressGroup = std::pair<std::string, std::vector<const LogEntry *>>;
  using AddressGroups = std::vector<AddressGroup>;

  static constexpr size_t TOP_PATHS_LIMIT = 10;
  static constexpr size_t ABNORMAL_EXAMPLES_LIMIT = 8;
  static constexpr size_t ENDPOINT_EXAMPLES_LIMIT = 5;

  explicit ThreatAnalyzer(size_t min_requests = 50);

  size_t get_min_requests() const { return min_requests_; }

  // Consumes the events; they end up in AnalysisResult::all_events.
  // files_read and parse_failures are left for the caller to fill in.
  AnalysisResult analyze(std::vector<LogEntry> entries,
                         size_t top_n = 10) const;

  // Groups in order of first appearance
  static AddressGroups group_by_address(const std::vector<LogEntry> &entries);

  static AddressProfile
  profile_address(const std::string &ip,
                  const std::vector<const LogEntry *> &events);

  // Profiles every group with at least min_requests events, highest score
  // first. Equal scores keep grouping order.
  std::vector<AddressProfile> rank_addresses(const AddressGroups &groups) const;

  // Earliest timestamp per tool, ascending
  static std::vector<ToolSighting>
  find_tools_first_seen(const std::vector<LogEntry> &entries);

  static std::vector<EndpointExposure>
  rank_vulnerable_endpoints(const std::vector<LogEntry> &entries);

  // Looks only at the given ranked addresses
  static std::optional<std::string>
  infer_scrape_section(const AddressGroups &groups,
                       const std::vector<AddressProfile> &top_addresses);

private:
  size_t min_requests_;
};

#endif // THREAT_ANALYZER_HPP
