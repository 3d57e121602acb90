#include "threat_analyzer.hpp"
#include "core/logger.hpp"
#include "detection/signatures.hpp"
#include "scoring.hpp"

#include <algorithm>
#include <set>
#include <tuple>
#include <unordered_map>
#include <unordered_set>

namespace {

// Counts keys while remembering first-seen order, so a stable sort on the
// count gives "most common" with deterministic ties.
class OrderedCounter {
public:
  void add(const std::string &key) {
    auto it = index_.find(key);
    if (it == index_.end()) {
      index_.emplace(key, counts_.size());
      counts_.push_back({key, 1});
    } else {
      counts_[it->second].count++;
    }
  }

  std::vector<PathCount> most_common(size_t limit) const {
    std::vector<PathCount> ranked = counts_;
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const PathCount &a, const PathCount &b) {
                       return a.count > b.count;
                     });
    if (ranked.size() > limit)
      ranked.resize(limit);
    return ranked;
  }

  bool empty() const { return counts_.empty(); }

private:
  std::vector<PathCount> counts_;
  std::unordered_map<std::string, size_t> index_;
};

bool is_success(int status) { return status >= 200 && status <= 299; }
bool is_client_error(int status) { return status >= 400 && status <= 499; }
bool is_server_error(int status) { return status >= 500 && status <= 599; }

} // namespace

ThreatAnalyzer::ThreatAnalyzer(size_t min_requests)
    : min_requests_(min_requests) {}

ThreatAnalyzer::AddressGroups
ThreatAnalyzer::group_by_address(const std::vector<LogEntry> &entries) {
  AddressGroups groups;
  std::unordered_map<std::string, size_t> index;

  for (const auto &entry : entries) {
    auto it = index.find(entry.ip_address);
    if (it == index.end()) {
      index.emplace(entry.ip_address, groups.size());
      groups.emplace_back(entry.ip_address,
                          std::vector<const LogEntry *>{&entry});
    } else {
      groups[it->second].second.push_back(&entry);
    }
  }
  return groups;
}

AddressProfile
ThreatAnalyzer::profile_address(const std::string &ip,
                                const std::vector<const LogEntry *> &events) {
  AddressProfile profile;
  profile.ip = ip;
  profile.request_count = events.size();

  std::unordered_map<int64_t, size_t> per_minute;
  OrderedCounter paths;
  std::set<std::string> tools;

  for (const LogEntry *e : events) {
    profile.status_codes[e->http_status_code]++;

    if (e->is_abnormal()) {
      profile.abnormal_count++;
      if (profile.abnormal_examples.size() < ABNORMAL_EXAMPLES_LIMIT)
        profile.abnormal_examples.push_back(*e);
    }
    if (Signatures::is_login_path(e->request_path))
      profile.login_attempts++;
    if (Signatures::is_identity_path(e->request_path))
      profile.identity_queries++;

    if (e->timestamp)
      per_minute[Utils::wall_clock_minute(*e->timestamp)]++;

    paths.add(e->request_path);
    if (e->detected_tool)
      tools.insert(*e->detected_tool);
  }

  for (const auto &[status, count] : profile.status_codes) {
    if (is_client_error(status))
      profile.client_error_count += count;
    else if (is_server_error(status))
      profile.server_error_count += count;
  }

  for (const auto &[minute, count] : per_minute)
    profile.max_requests_per_minute =
        std::max(profile.max_requests_per_minute, count);

  profile.score = Scoring::address_score(
      profile.request_count, profile.server_error_count,
      profile.client_error_count, profile.abnormal_count,
      profile.login_attempts, profile.identity_queries,
      profile.max_requests_per_minute);

  profile.top_paths = paths.most_common(TOP_PATHS_LIMIT);
  profile.tools_used.assign(tools.begin(), tools.end());
  return profile;
}

std::vector<AddressProfile>
ThreatAnalyzer::rank_addresses(const AddressGroups &groups) const {
  std::vector<AddressProfile> ranked;
  for (const auto &[ip, events] : groups) {
    if (events.size() < min_requests_)
      continue;
    ranked.push_back(profile_address(ip, events));
  }

  std::stable_sort(ranked.begin(), ranked.end(),
                   [](const AddressProfile &a, const AddressProfile &b) {
                     return a.score > b.score;
                   });

  LOG(LogLevel::DEBUG, LogComponent::ANALYSIS,
      ranked.size() << " of " << groups.size()
                    << " addresses reached the " << min_requests_
                    << " request threshold");
  return ranked;
}

std::vector<ToolSighting>
ThreatAnalyzer::find_tools_first_seen(const std::vector<LogEntry> &entries) {
  std::vector<ToolSighting> sightings;
  std::unordered_map<std::string, size_t> index;

  for (const auto &entry : entries) {
    if (!entry.detected_tool || !entry.timestamp)
      continue;

    const std::string &tool = *entry.detected_tool;
    auto it = index.find(tool);
    if (it == index.end()) {
      index.emplace(tool, sightings.size());
      sightings.push_back({tool, *entry.timestamp});
    } else if (*entry.timestamp < sightings[it->second].first_seen) {
      sightings[it->second].first_seen = *entry.timestamp;
    }
  }

  std::stable_sort(sightings.begin(), sightings.end(),
                   [](const ToolSighting &a, const ToolSighting &b) {
                     return a.first_seen < b.first_seen;
                   });
  return sightings;
}

std::vector<EndpointExposure> ThreatAnalyzer::rank_vulnerable_endpoints(
    const std::vector<LogEntry> &entries) {
  std::vector<EndpointExposure> endpoints;
  std::vector<std::unordered_set<std::string>> payloads;
  std::unordered_map<std::string, size_t> index;

  for (const auto &entry : entries) {
    if (!entry.has_attack_tag(Signatures::AttackCategory::SQLI))
      continue;

    auto it = index.find(entry.request_path);
    size_t slot;
    if (it == index.end()) {
      slot = endpoints.size();
      index.emplace(entry.request_path, slot);
      endpoints.emplace_back();
      endpoints.back().endpoint = entry.request_path;
      payloads.emplace_back();
    } else {
      slot = it->second;
    }

    EndpointExposure &exposure = endpoints[slot];
    exposure.sqli_hits++;
    if (is_server_error(entry.http_status_code))
      exposure.sqli_5xx++;
    payloads[slot].insert(
        entry.request_target.substr(0, Scoring::PAYLOAD_SIGNATURE_LENGTH));
    if (exposure.examples.size() < ENDPOINT_EXAMPLES_LIMIT)
      exposure.examples.push_back(entry.request_target);
  }

  for (size_t i = 0; i < endpoints.size(); ++i) {
    EndpointExposure &exposure = endpoints[i];
    exposure.unique_payloads = payloads[i].size();
    exposure.score = Scoring::endpoint_score(
        exposure.sqli_hits, exposure.sqli_5xx, exposure.unique_payloads);
  }

  std::stable_sort(endpoints.begin(), endpoints.end(),
                   [](const EndpointExposure &a, const EndpointExposure &b) {
                     return a.score > b.score;
                   });
  return endpoints;
}

std::optional<std::string> ThreatAnalyzer::infer_scrape_section(
    const AddressGroups &groups,
    const std::vector<AddressProfile> &top_addresses) {
  std::unordered_map<std::string, size_t> group_index;
  for (size_t i = 0; i < groups.size(); ++i)
    group_index.emplace(groups[i].first, i);

  std::optional<std::string> inferred;
  std::optional<std::tuple<size_t, size_t, double>> best_metric;

  for (const auto &profile : top_addresses) {
    auto it = group_index.find(profile.ip);
    if (it == group_index.end())
      continue;

    size_t hits = 0;
    size_t ok = 0;
    double total_bytes = 0.0;
    OrderedCounter paths;

    for (const LogEntry *e : groups[it->second].second) {
      if (!Signatures::is_identity_path(e->request_path))
        continue;
      hits++;
      paths.add(e->request_path);
      if (is_success(e->http_status_code))
        ok++;
      total_bytes += static_cast<double>(e->bytes_sent);
    }

    if (hits == 0)
      continue;

    // Only a strictly better metric replaces the current pick, so true
    // ties go to the higher-ranked address
    auto metric =
        std::make_tuple(hits, ok, total_bytes / static_cast<double>(hits));
    if (!best_metric || metric > *best_metric) {
      best_metric = metric;
      inferred = paths.most_common(1).front().path;
    }
  }
  return inferred;
}

AnalysisResult ThreatAnalyzer::analyze(std::vector<LogEntry> entries,
                                       size_t top_n) const {
  AnalysisResult result;
  result.parsed_events = entries.size();

  {
    const AddressGroups groups = group_by_address(entries);

    std::vector<AddressProfile> ranked = rank_addresses(groups);
    if (ranked.size() > top_n)
      ranked.resize(top_n);
    result.top_suspicious_ips = std::move(ranked);

    result.tools_first_seen = find_tools_first_seen(entries);
    result.vulnerable_endpoints = rank_vulnerable_endpoints(entries);
    result.inferred_scrape_section =
        infer_scrape_section(groups, result.top_suspicious_ips);
  }

  LOG(LogLevel::INFO, LogComponent::ANALYSIS,
      "Analyzed " << result.parsed_events << " events: "
                  << result.top_suspicious_ips.size() << " ranked addresses, "
                  << result.tools_first_seen.size() << " tools, "
                  << result.vulnerable_endpoints.size()
                  << " SQLi endpoints");
  if (result.inferred_scrape_section)
    LOG(LogLevel::DEBUG, LogComponent::ANALYSIS,
        "Inferred scrape section: " << *result.inferred_scrape_section);

  // Groups point into entries, so the move happens only after they are gone
  result.all_events = std::move(entries);
  return result;
}
