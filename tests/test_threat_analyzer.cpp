#include "analysis/scoring.hpp"
#include "analysis/threat_analyzer.hpp"
#include <gtest/gtest.h>

#include <algorithm>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

const char *CHROME_UA = "Mozilla/5.0 (X11; Linux x86_64) Chrome/90.0";

// Wall-clock stamp `seconds` after 10/Apr/2021 12:00:00 UTC
std::string stamp(int seconds) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "10/Apr/2021:%02d:%02d:%02d +0000",
                12 + seconds / 3600, (seconds / 60) % 60, seconds % 60);
  return buf;
}

LogEntry make_entry(const std::string &ip, const std::string &time_field,
                    const std::string &method, const std::string &target,
                    int status, uint64_t bytes, const std::string &ua) {
  static uint64_t line_num = 0;
  std::string line = ip + " - - [" + time_field + "] \"" + method + " " +
                     target + " HTTP/1.1\" " + std::to_string(status) + " " +
                     std::to_string(bytes) + " \"-\" \"" + ua + "\"";
  auto entry = LogEntry::parse_from_string(line, ++line_num);
  if (!entry)
    throw std::runtime_error("test line did not parse: " + line);
  return *entry;
}

LogEntry make_entry(const std::string &ip, int seconds,
                    const std::string &method, const std::string &target,
                    int status, uint64_t bytes, const std::string &ua) {
  return make_entry(ip, stamp(seconds), method, target, status, bytes, ua);
}

std::vector<LogEntry> scenario_a() {
  std::vector<LogEntry> entries;
  for (int i = 0; i < 5; ++i)
    entries.push_back(
        make_entry("10.0.0.1", i, "GET", "/index.html", 200, 1024, CHROME_UA));
  for (int i = 0; i < 60; ++i)
    entries.push_back(make_entry(
        "10.0.0.2", 10 + i, "GET",
        "/admin.php?id=" + std::to_string(i) + "%27%20OR%201%3D1--",
        i % 2 == 0 ? 500 : 403, 300, "sqlmap/1.0"));
  for (int i = 0; i < 55; ++i)
    entries.push_back(make_entry("10.0.0.3", 200 + i, "POST", "/login", 401,
                                 64, "python-requests/2.25.1"));
  return entries;
}

const AddressProfile *find_profile(const std::vector<AddressProfile> &ranked,
                                   const std::string &ip) {
  auto it = std::find_if(ranked.begin(), ranked.end(),
                         [&](const AddressProfile &p) { return p.ip == ip; });
  return it == ranked.end() ? nullptr : &*it;
}

} // namespace

TEST(ThreatAnalyzerTest, SqlmapAddressRanksFirst) {
  ThreatAnalyzer analyzer(5);
  AnalysisResult result = analyzer.analyze(scenario_a(), 3);

  EXPECT_EQ(result.parsed_events, 120u);
  EXPECT_EQ(result.all_events.size(), 120u);
  ASSERT_EQ(result.top_suspicious_ips.size(), 3u);

  const AddressProfile &top = result.top_suspicious_ips[0];
  EXPECT_EQ(top.ip, "10.0.0.2");
  EXPECT_GT(top.score, 1.0);
  EXPECT_NE(std::find(top.tools_used.begin(), top.tools_used.end(), "sqlmap"),
            top.tools_used.end());
  EXPECT_EQ(result.top_suspicious_ips[1].ip, "10.0.0.3");
  EXPECT_EQ(result.top_suspicious_ips[2].ip, "10.0.0.1");

  ASSERT_FALSE(result.vulnerable_endpoints.empty());
  EXPECT_EQ(result.vulnerable_endpoints.front().endpoint, "/admin.php");
  EXPECT_EQ(result.inferred_scrape_section, std::optional<std::string>("/admin.php"));
}

TEST(ThreatAnalyzerTest, SqlmapAddressProfileDetails) {
  ThreatAnalyzer analyzer(5);
  AnalysisResult result = analyzer.analyze(scenario_a(), 3);
  const AddressProfile *y = find_profile(result.top_suspicious_ips, "10.0.0.2");
  ASSERT_NE(y, nullptr);

  EXPECT_EQ(y->request_count, 60u);
  EXPECT_EQ(y->status_codes.at(500), 30u);
  EXPECT_EQ(y->status_codes.at(403), 30u);
  EXPECT_EQ(y->server_error_count, 30u);
  EXPECT_EQ(y->client_error_count, 30u);
  EXPECT_EQ(y->abnormal_count, 60u);
  EXPECT_EQ(y->abnormal_examples.size(), ThreatAnalyzer::ABNORMAL_EXAMPLES_LIMIT);
  EXPECT_EQ(y->identity_queries, 60u);
  EXPECT_EQ(y->login_attempts, 0u);
  // Seconds 10..69: fifty land in the first minute
  EXPECT_EQ(y->max_requests_per_minute, 50u);
  ASSERT_EQ(y->top_paths.size(), 1u);
  EXPECT_EQ(y->top_paths[0].path, "/admin.php");
  EXPECT_EQ(y->top_paths[0].count, 60u);

  double expected = Scoring::address_score(60, 30, 30, 60, 0, 60, 50);
  EXPECT_DOUBLE_EQ(y->score, expected);

  const AddressProfile *z = find_profile(result.top_suspicious_ips, "10.0.0.3");
  ASSERT_NE(z, nullptr);
  EXPECT_EQ(z->login_attempts, 55u);
  EXPECT_EQ(z->client_error_count, 55u);
  EXPECT_EQ(z->abnormal_count, 0u);
}

TEST(ThreatAnalyzerTest, SqlmapEndpointScore) {
  ThreatAnalyzer analyzer(5);
  AnalysisResult result = analyzer.analyze(scenario_a(), 3);
  ASSERT_EQ(result.vulnerable_endpoints.size(), 1u);

  const EndpointExposure &ep = result.vulnerable_endpoints[0];
  EXPECT_EQ(ep.sqli_hits, 60u);
  EXPECT_EQ(ep.sqli_5xx, 30u);
  EXPECT_EQ(ep.unique_payloads, 60u);
  EXPECT_EQ(ep.score, 3u * 60 + 2u * 30 + 60);
  ASSERT_EQ(ep.examples.size(), ThreatAnalyzer::ENDPOINT_EXAMPLES_LIMIT);
  EXPECT_EQ(ep.examples[0], "/admin.php?id=0%27%20OR%201%3D1--");
  EXPECT_EQ(ep.examples[4], "/admin.php?id=4%27%20OR%201%3D1--");
}

TEST(ThreatAnalyzerTest, ToolsOrderedByFirstAppearance) {
  ThreatAnalyzer analyzer(5);
  AnalysisResult result = analyzer.analyze(scenario_a(), 3);

  ASSERT_EQ(result.tools_first_seen.size(), 3u);
  EXPECT_EQ(result.tools_first_seen[0].tool, "browser");
  EXPECT_EQ(result.tools_first_seen[1].tool, "sqlmap");
  EXPECT_EQ(result.tools_first_seen[2].tool, "python-requests");
  EXPECT_EQ(Utils::format_iso8601(result.tools_first_seen[1].first_seen),
            "2021-04-10T12:00:10+00:00");
}

TEST(ThreatAnalyzerTest, VolumeAloneSeparatesIdenticalBehaviour) {
  std::vector<LogEntry> entries;
  for (int i = 0; i < 100; ++i)
    entries.push_back(
        make_entry("10.1.1.1", i * 60, "GET", "/page", 200, 10, "curl/7.68.0"));
  for (int i = 0; i < 10; ++i)
    entries.push_back(
        make_entry("10.2.2.2", i * 60, "GET", "/page", 200, 10, "curl/7.68.0"));

  ThreatAnalyzer analyzer(1);
  AnalysisResult result = analyzer.analyze(std::move(entries), 10);
  ASSERT_EQ(result.top_suspicious_ips.size(), 2u);

  const AddressProfile &high = result.top_suspicious_ips[0];
  const AddressProfile &low = result.top_suspicious_ips[1];
  EXPECT_EQ(high.ip, "10.1.1.1");
  EXPECT_GT(high.score, low.score);
  EXPECT_NEAR(high.score - low.score, 90 * Scoring::AddressWeights::VOLUME,
              1e-9);
}

TEST(ThreatAnalyzerTest, MinimumRequestFloorExcludesQuietAddresses) {
  std::vector<LogEntry> entries;
  for (int i = 0; i < 4; ++i)
    entries.push_back(make_entry("10.0.0.4", i, "GET",
                                 "/a.php?id=1%27%20UNION%20SELECT%201", 500, 0,
                                 "sqlmap/1.0"));
  for (int i = 0; i < 5; ++i)
    entries.push_back(
        make_entry("10.0.0.5", i, "GET", "/", 200, 10, CHROME_UA));

  ThreatAnalyzer analyzer(5);
  EXPECT_EQ(analyzer.get_min_requests(), 5u);
  AnalysisResult result = analyzer.analyze(std::move(entries), 10);

  ASSERT_EQ(result.top_suspicious_ips.size(), 1u);
  EXPECT_EQ(result.top_suspicious_ips[0].ip, "10.0.0.5");
  // The floor applies to ranking only
  EXPECT_EQ(result.vulnerable_endpoints.size(), 1u);
  EXPECT_EQ(result.tools_first_seen.size(), 2u);
}

TEST(ThreatAnalyzerTest, TopNTruncatesRanking) {
  std::vector<LogEntry> entries;
  for (int a = 0; a < 6; ++a)
    for (int i = 0; i < 3; ++i)
      entries.push_back(make_entry("10.9.0." + std::to_string(a), i, "GET",
                                   "/", 200, 1, CHROME_UA));

  ThreatAnalyzer analyzer(1);
  AnalysisResult result = analyzer.analyze(std::move(entries), 4);
  EXPECT_EQ(result.top_suspicious_ips.size(), 4u);
}

TEST(ThreatAnalyzerTest, ZeroFloorAndZeroTopN) {
  ThreatAnalyzer no_floor(0);
  AnalysisResult floor_zero = no_floor.analyze(scenario_a(), 10);
  AnalysisResult floor_one = ThreatAnalyzer(1).analyze(scenario_a(), 10);
  ASSERT_EQ(floor_zero.top_suspicious_ips.size(), 3u);
  ASSERT_EQ(floor_one.top_suspicious_ips.size(), 3u);
  for (size_t i = 0; i < 3; ++i)
    EXPECT_EQ(floor_zero.top_suspicious_ips[i].ip,
              floor_one.top_suspicious_ips[i].ip);

  AnalysisResult none = ThreatAnalyzer(5).analyze(scenario_a(), 0);
  EXPECT_TRUE(none.top_suspicious_ips.empty());
  EXPECT_FALSE(none.inferred_scrape_section.has_value());
  EXPECT_FALSE(none.vulnerable_endpoints.empty());
}

TEST(ThreatAnalyzerTest, EqualScoresKeepFirstAppearanceOrder) {
  std::vector<LogEntry> entries;
  for (int i = 0; i < 5; ++i) {
    entries.push_back(make_entry("10.0.0.20", i, "GET", "/", 200, 1, CHROME_UA));
    entries.push_back(make_entry("10.0.0.10", i, "GET", "/", 200, 1, CHROME_UA));
  }

  ThreatAnalyzer analyzer(1);
  AnalysisResult result = analyzer.analyze(std::move(entries), 10);
  ASSERT_EQ(result.top_suspicious_ips.size(), 2u);
  EXPECT_DOUBLE_EQ(result.top_suspicious_ips[0].score,
                   result.top_suspicious_ips[1].score);
  EXPECT_EQ(result.top_suspicious_ips[0].ip, "10.0.0.20");
  EXPECT_EQ(result.top_suspicious_ips[1].ip, "10.0.0.10");
}

TEST(ThreatAnalyzerTest, GroupingFollowsFirstAppearance) {
  std::vector<LogEntry> entries = {
      make_entry("b", 0, "GET", "/", 200, 1, CHROME_UA),
      make_entry("a", 1, "GET", "/", 200, 1, CHROME_UA),
      make_entry("b", 2, "GET", "/x", 200, 1, CHROME_UA),
  };

  auto groups = ThreatAnalyzer::group_by_address(entries);
  ASSERT_EQ(groups.size(), 2u);
  EXPECT_EQ(groups[0].first, "b");
  ASSERT_EQ(groups[0].second.size(), 2u);
  EXPECT_EQ(groups[0].second[1]->request_path, "/x");
  EXPECT_EQ(groups[1].first, "a");
}

TEST(ThreatAnalyzerTest, TopPathTiesKeepFirstSeenOrder) {
  std::vector<LogEntry> entries;
  for (const char *path : {"/b", "/a", "/a", "/b", "/c"})
    entries.push_back(make_entry("10.0.0.1", 0, "GET", path, 200, 1, CHROME_UA));
  auto groups = ThreatAnalyzer::group_by_address(entries);
  ASSERT_EQ(groups.size(), 1u);

  AddressProfile profile =
      ThreatAnalyzer::profile_address(groups[0].first, groups[0].second);
  ASSERT_EQ(profile.top_paths.size(), 3u);
  EXPECT_EQ(profile.top_paths[0].path, "/b");
  EXPECT_EQ(profile.top_paths[0].count, 2u);
  EXPECT_EQ(profile.top_paths[1].path, "/a");
  EXPECT_EQ(profile.top_paths[2].path, "/c");
}

TEST(ThreatAnalyzerTest, ProfileListsAreCapped) {
  std::vector<LogEntry> entries;
  for (int i = 0; i < 20; ++i)
    entries.push_back(make_entry("10.0.0.1", i, "GET",
                                 "/p" + std::to_string(i) + "?f=../../etc/passwd",
                                 404, 0, "nikto/2.1.6"));
  auto groups = ThreatAnalyzer::group_by_address(entries);
  AddressProfile profile =
      ThreatAnalyzer::profile_address(groups[0].first, groups[0].second);

  EXPECT_EQ(profile.abnormal_count, 20u);
  ASSERT_EQ(profile.abnormal_examples.size(), 8u);
  EXPECT_EQ(profile.abnormal_examples[0].request_path, "/p0");
  EXPECT_EQ(profile.abnormal_examples[7].request_path, "/p7");
  EXPECT_EQ(profile.top_paths.size(), ThreatAnalyzer::TOP_PATHS_LIMIT);
  ASSERT_EQ(profile.tools_used.size(), 1u);
  EXPECT_EQ(profile.tools_used[0], "nikto");
}

TEST(ThreatAnalyzerTest, EventsWithoutTimestampsHaveNoPeakRate) {
  std::vector<LogEntry> entries;
  for (int i = 0; i < 3; ++i)
    entries.push_back(make_entry("10.0.0.1", "garbled-time", "GET", "/", 200,
                                 1, "curl/7.68.0"));
  ASSERT_FALSE(entries[0].timestamp.has_value());

  ThreatAnalyzer analyzer(1);
  AnalysisResult result = analyzer.analyze(std::move(entries), 10);
  ASSERT_EQ(result.top_suspicious_ips.size(), 1u);
  EXPECT_EQ(result.top_suspicious_ips[0].max_requests_per_minute, 0u);
  // A tool needs a timestamp to have a first sighting
  EXPECT_TRUE(result.tools_first_seen.empty());
}

TEST(ThreatAnalyzerTest, EarlierSightingReplacesFirstSeen) {
  std::vector<LogEntry> entries = {
      make_entry("1.1.1.1", 300, "GET", "/", 200, 1, "curl/7.68.0"),
      make_entry("1.1.1.1", 180, "GET", "/", 200, 1, "sqlmap/1.0"),
      make_entry("1.1.1.1", 60, "GET", "/", 200, 1, "curl/7.68.0"),
  };

  auto tools = ThreatAnalyzer::find_tools_first_seen(entries);
  ASSERT_EQ(tools.size(), 2u);
  EXPECT_EQ(tools[0].tool, "curl");
  EXPECT_EQ(tools[0].first_seen.epoch_ms, entries[2].timestamp->epoch_ms);
  EXPECT_EQ(tools[1].tool, "sqlmap");
}

TEST(ThreatAnalyzerTest, EndpointTiesKeepEncounterOrder) {
  std::vector<LogEntry> entries = {
      make_entry("1.1.1.1", 0, "GET", "/first?id=%27", 200, 1, "curl/7.68.0"),
      make_entry("1.1.1.1", 1, "GET", "/second?id=%27", 200, 1, "curl/7.68.0"),
      make_entry("1.1.1.1", 2, "GET", "/third?id=%27", 503, 1, "curl/7.68.0"),
      make_entry("1.1.1.1", 3, "GET", "/clean", 500, 1, "curl/7.68.0"),
  };

  auto endpoints = ThreatAnalyzer::rank_vulnerable_endpoints(entries);
  ASSERT_EQ(endpoints.size(), 3u);
  EXPECT_EQ(endpoints[0].endpoint, "/third");
  EXPECT_EQ(endpoints[0].score, 6u);
  EXPECT_EQ(endpoints[1].endpoint, "/first");
  EXPECT_EQ(endpoints[2].endpoint, "/second");
  EXPECT_EQ(endpoints[1].score, endpoints[2].score);
}

TEST(ThreatAnalyzerTest, PayloadSignatureUsesTargetPrefix) {
  std::string prefix = "/q?id=%27" + std::string(300, 'a');
  std::vector<LogEntry> entries = {
      make_entry("1.1.1.1", 0, "GET", prefix + "1", 200, 1, "curl/7.68.0"),
      make_entry("1.1.1.1", 1, "GET", prefix + "2", 200, 1, "curl/7.68.0"),
      make_entry("1.1.1.1", 2, "GET", "/q?id=%27b", 200, 1, "curl/7.68.0"),
  };

  auto endpoints = ThreatAnalyzer::rank_vulnerable_endpoints(entries);
  ASSERT_EQ(endpoints.size(), 1u);
  EXPECT_EQ(endpoints[0].sqli_hits, 3u);
  EXPECT_EQ(endpoints[0].unique_payloads, 2u);
  EXPECT_EQ(endpoints[0].score, 3u * 3 + 2);
}

TEST(ThreatAnalyzerTest, NonSqlAttacksDoNotRankEndpoints) {
  std::vector<LogEntry> entries = {
      make_entry("1.1.1.1", 0, "GET", "/dl?f=../../etc/passwd", 500, 1,
                 "curl/7.68.0"),
      make_entry("1.1.1.1", 1, "GET", "/s?q=%3Cscript%3E", 500, 1,
                 "curl/7.68.0"),
  };
  EXPECT_TRUE(ThreatAnalyzer::rank_vulnerable_endpoints(entries).empty());
}

TEST(ThreatAnalyzerTest, ScrapeSectionPrefersMoreIdentityHits) {
  std::vector<LogEntry> entries = {
      make_entry("1.1.1.1", 0, "GET", "/account/1", 200, 100, CHROME_UA),
      make_entry("2.2.2.2", 1, "GET", "/profile/1", 200, 100, CHROME_UA),
      make_entry("2.2.2.2", 2, "GET", "/profile/1", 404, 10, CHROME_UA),
      make_entry("2.2.2.2", 3, "GET", "/users/7", 200, 10, CHROME_UA),
  };
  auto groups = ThreatAnalyzer::group_by_address(entries);

  std::vector<AddressProfile> top(2);
  top[0].ip = "1.1.1.1";
  top[1].ip = "2.2.2.2";
  EXPECT_EQ(ThreatAnalyzer::infer_scrape_section(groups, top),
            std::optional<std::string>("/profile/1"));
}

TEST(ThreatAnalyzerTest, ScrapeSectionComparesSuccessThenBytes) {
  std::vector<LogEntry> entries = {
      make_entry("1.1.1.1", 0, "GET", "/account", 403, 5000, CHROME_UA),
      make_entry("2.2.2.2", 0, "GET", "/profile", 200, 10, CHROME_UA),
      make_entry("3.3.3.3", 0, "GET", "/members", 200, 20, CHROME_UA),
  };
  auto groups = ThreatAnalyzer::group_by_address(entries);

  std::vector<AddressProfile> top(3);
  top[0].ip = "1.1.1.1";
  top[1].ip = "2.2.2.2";
  top[2].ip = "3.3.3.3";
  EXPECT_EQ(ThreatAnalyzer::infer_scrape_section(groups, top),
            std::optional<std::string>("/members"));
}

TEST(ThreatAnalyzerTest, ScrapeSectionTieGoesToHigherRankedAddress) {
  std::vector<LogEntry> entries = {
      make_entry("1.1.1.1", 0, "GET", "/account", 200, 100, CHROME_UA),
      make_entry("2.2.2.2", 0, "GET", "/profile", 200, 100, CHROME_UA),
  };
  auto groups = ThreatAnalyzer::group_by_address(entries);

  std::vector<AddressProfile> top(2);
  top[0].ip = "2.2.2.2";
  top[1].ip = "1.1.1.1";
  EXPECT_EQ(ThreatAnalyzer::infer_scrape_section(groups, top),
            std::optional<std::string>("/profile"));

  std::swap(top[0], top[1]);
  EXPECT_EQ(ThreatAnalyzer::infer_scrape_section(groups, top),
            std::optional<std::string>("/account"));
}

TEST(ThreatAnalyzerTest, ScrapeSectionIgnoresUnrankedAddresses) {
  std::vector<LogEntry> entries = {
      make_entry("1.1.1.1", 0, "GET", "/index.html", 200, 100, CHROME_UA),
      make_entry("9.9.9.9", 0, "GET", "/account", 200, 100, CHROME_UA),
  };
  auto groups = ThreatAnalyzer::group_by_address(entries);

  std::vector<AddressProfile> top(1);
  top[0].ip = "1.1.1.1";
  EXPECT_FALSE(ThreatAnalyzer::infer_scrape_section(groups, top).has_value());
}

TEST(ThreatAnalyzerTest, EmptyInputGivesEmptyResult) {
  ThreatAnalyzer analyzer;
  AnalysisResult result = analyzer.analyze({}, 10);

  EXPECT_EQ(result.parsed_events, 0u);
  EXPECT_TRUE(result.top_suspicious_ips.empty());
  EXPECT_TRUE(result.tools_first_seen.empty());
  EXPECT_TRUE(result.vulnerable_endpoints.empty());
  EXPECT_FALSE(result.inferred_scrape_section.has_value());
  EXPECT_TRUE(result.all_events.empty());
}
