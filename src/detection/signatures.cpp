#include "signatures.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <regex>
#include <string>
#include <utility>
#include <vector>

namespace Signatures {

namespace {

constexpr auto REGEX_FLAGS = std::regex::ECMAScript | std::regex::icase |
                             std::regex::optimize;

// "head.*tail": the head is located first, then the tail is searched for in
// the rest of the same line.
struct SpanningPattern {
  std::regex head;
  std::regex tail;
};

struct AttackSignature {
  AttackCategory category;
  std::regex pattern;
  std::vector<SpanningPattern> spanning;
};

struct ToolSignature {
  const char *name;
  std::regex pattern;
};

const std::vector<AttackSignature> &attack_signatures() {
  static const std::vector<AttackSignature> signatures = {
      {AttackCategory::SQLI,
       std::regex(R"re(\bunion\b|\bselect\b|\binformation_schema\b|\bsleep\s*\(|\bbenchmark\s*\(|--|/\*|\*/|%27|'|\bor\s+1=1\b|\band\s+1=1\b)re",
                  REGEX_FLAGS)},
      {AttackCategory::TRAVERSAL,
       std::regex(R"re(\.\./|%2e%2e%2f|%2e%2e\\|/etc/passwd|win\.ini|\.\.\\|%5c%2e%2e)re",
                  REGEX_FLAGS)},
      {AttackCategory::XSS,
       std::regex(R"re(<script|%3cscript|onerror=|onload=|alert\s*\(|javascript:|<iframe|<img\s+src|eval\s*\(|<svg|onmouseover=)re",
                  REGEX_FLAGS)},
      {AttackCategory::SSRF,
       std::regex(R"re(https?://|%3a%2f%2f|169\.254\.169\.254|localhost|127\.0\.0\.1|0\.0\.0\.0|::1|\[::1\]|metadata\.google\.internal)re",
                  REGEX_FLAGS)},
      {AttackCategory::CMDI,
       std::regex(R"re(\bcat\b|\bwget\b|\bcurl\b|;|\|\||&&|\b/bin/sh\b|\bpowershell\b|\bexec\b|\bsystem\b|\$\(|`|<\(|>\()re",
                  REGEX_FLAGS)},
      {AttackCategory::RCE,
       std::regex(R"re(eval\(|exec\(|system\(|passthru\(|shell_exec\(|phpinfo\(|assert\(|create_function\()re",
                  REGEX_FLAGS),
       {{std::regex(R"re(preg_replace\s*\()re", REGEX_FLAGS),
         std::regex(R"re(/e["']?\s*,)re", REGEX_FLAGS)}}},
      {AttackCategory::XXE,
       std::regex(R"re(<!ENTITY\s+\w+\s+SYSTEM|SYSTEM\s+["']file:|SYSTEM\s+["']http)re",
                  REGEX_FLAGS),
       {{std::regex(R"re(<!DOCTYPE)re", REGEX_FLAGS),
         std::regex(R"re(ENTITY)re", REGEX_FLAGS)}}},
      {AttackCategory::LDAP_INJECTION,
       std::regex(R"re(\*\)|\(\||&\(|\|\()re", REGEX_FLAGS)},
      {AttackCategory::NOSQL_INJECTION,
       std::regex(R"re(\$ne|\$gt|\$lt|\$where|\$regex|\[\$)re", REGEX_FLAGS)},
  };
  return signatures;
}

// First match wins, so the order matters
const std::vector<ToolSignature> &tool_signatures() {
  static const std::vector<ToolSignature> signatures = {
      {"sqlmap", std::regex(R"(\bsqlmap\b)", REGEX_FLAGS)},
      {"curl", std::regex(R"(\bcurl/\d)", REGEX_FLAGS)},
      {"python-requests", std::regex(R"(\bpython-requests\b)", REGEX_FLAGS)},
      {"go-http-client", std::regex(R"(\bgo-http-client\b)", REGEX_FLAGS)},
      {"nikto", std::regex(R"(\bnikto\b)", REGEX_FLAGS)},
      {"acunetix", std::regex(R"(\bacunetix\b)", REGEX_FLAGS)},
      {"nmap", std::regex(R"(\bnmap\b)", REGEX_FLAGS)},
      {"masscan", std::regex(R"(\bmasscan\b)", REGEX_FLAGS)},
      {"wget", std::regex(R"(\bwget/\d)", REGEX_FLAGS)},
      {"gobuster", std::regex(R"(\bgobuster\b)", REGEX_FLAGS)},
      {"dirbuster", std::regex(R"(\bdirbuster\b)", REGEX_FLAGS)},
      {"burpsuite", std::regex(R"(\bburp\b)", REGEX_FLAGS)},
      {"zaproxy", std::regex(R"(\bzap\b)", REGEX_FLAGS)},
      {"wpscan", std::regex(R"(\bwpscan\b)", REGEX_FLAGS)},
      {"metasploit", std::regex(R"(\bmetasploit\b)", REGEX_FLAGS)},
      {"nuclei", std::regex(R"(\bnuclei\b)", REGEX_FLAGS)},
      {"sqlninja", std::regex(R"(\bsqlninja\b)", REGEX_FLAGS)},
      {"havij", std::regex(R"(\bhavij\b)", REGEX_FLAGS)},
      {"httperf", std::regex(R"(\bhttperf\b)", REGEX_FLAGS)},
      {"jmeter", std::regex(R"(\bjmeter\b)", REGEX_FLAGS)},
  };
  return signatures;
}

const std::regex &bot_pattern() {
  static const std::regex pattern(
      R"(bot|crawler|spider|scraper|slurp|googlebot|bingbot|yandexbot|baiduspider|facebookexternalhit|twitterbot)",
      REGEX_FLAGS);
  return pattern;
}

const std::regex &identity_pattern() {
  static const std::regex pattern(
      R"(whoami|profile|account|user|users|customer|customers|admin|member)",
      REGEX_FLAGS);
  return pattern;
}

const std::regex &login_pattern() {
  static const std::regex pattern(
      R"(login|signin|auth|token|session|oauth|sso|authenticate)",
      REGEX_FLAGS);
  return pattern;
}

const std::regex &email_pattern() {
  static const std::regex pattern(R"(email|mail|contact)", REGEX_FLAGS);
  return pattern;
}

const std::regex &api_pattern() {
  static const std::regex pattern(
      R"(/api/|/rest/|/graphql|/v\d+/|\.json|\.xml)", REGEX_FLAGS);
  return pattern;
}

const std::regex &sensitive_pattern() {
  static const std::regex pattern(
      R"(/export|/download|/backup|/dump|/database|/admin/users|/api/users|\.sql|\.db|\.bak)",
      REGEX_FLAGS);
  return pattern;
}

const std::regex &session_pattern() {
  static const std::regex pattern(
      R"(session|sessionid|sid|jsessionid|phpsessid)", REGEX_FLAGS);
  return pattern;
}

constexpr std::string_view BROWSER_MARKERS[] = {"Mozilla/", "Chrome/",
                                                "Safari/", "Firefox/"};

bool search(std::string_view text, const std::regex &pattern) {
  return std::regex_search(text.begin(), text.end(), pattern);
}

bool search_spanning(std::string_view text, const SpanningPattern &pattern) {
  for (std::string_view line : Utils::split_string_view(text, '\n')) {
    for (std::string_view segment : Utils::split_string_view(line, '\r')) {
      std::match_results<std::string_view::const_iterator> head;
      if (!std::regex_search(segment.begin(), segment.end(), head,
                             pattern.head))
        continue;
      // The leftmost head leaves the longest tail to search
      if (std::regex_search(head[0].second, segment.end(), pattern.tail))
        return true;
    }
  }
  return false;
}

bool matches(std::string_view text, const AttackSignature &signature) {
  if (search(text, signature.pattern))
    return true;
  for (const auto &spanning : signature.spanning)
    if (search_spanning(text, spanning))
      return true;
  return false;
}

} // namespace

const char *attack_category_label(AttackCategory category) {
  switch (category) {
  case AttackCategory::SQLI:
    return "SQLi";
  case AttackCategory::TRAVERSAL:
    return "Traversal/LFI";
  case AttackCategory::XSS:
    return "XSS";
  case AttackCategory::SSRF:
    return "SSRF";
  case AttackCategory::CMDI:
    return "CMDi/Shell";
  case AttackCategory::RCE:
    return "RCE";
  case AttackCategory::XXE:
    return "XXE";
  case AttackCategory::LDAP_INJECTION:
    return "LDAP Injection";
  case AttackCategory::NOSQL_INJECTION:
    return "NoSQL Injection";
  }
  return "Unknown";
}

std::vector<AttackCategory> detect_attacks(std::string_view raw_target) {
  std::string decoded = Utils::url_decode(raw_target);
  std::vector<AttackCategory> detected;

  // Every category is evaluated; a request may carry several tags
  for (const auto &signature : attack_signatures())
    if (matches(decoded, signature))
      detected.push_back(signature.category);

  if (!detected.empty())
    LOG(LogLevel::TRACE, LogComponent::DETECTION,
        detected.size() << " attack categories matched, first "
                        << attack_category_label(detected.front()) << ": "
                        << decoded);
  return detected;
}

std::optional<std::string> detect_tool(std::string_view user_agent) {
  if (user_agent.empty())
    return std::nullopt;

  for (const auto &signature : tool_signatures())
    if (search(user_agent, signature.pattern))
      return std::string(signature.name);

  for (std::string_view marker : BROWSER_MARKERS)
    if (user_agent.find(marker) != std::string_view::npos)
      return std::string("browser");

  if (is_bot_user_agent(user_agent))
    return std::string("bot");

  return std::nullopt;
}

bool is_bot_user_agent(std::string_view user_agent) {
  return search(user_agent, bot_pattern());
}

bool is_api_endpoint(std::string_view path) {
  return search(path, api_pattern());
}

bool is_sensitive_endpoint(std::string_view path) {
  return search(path, sensitive_pattern());
}

bool has_session_parameter(std::string_view url) {
  return search(url, session_pattern());
}

bool is_login_path(std::string_view path) {
  return search(path, login_pattern());
}

bool is_identity_path(std::string_view path) {
  return search(path, identity_pattern());
}

bool is_email_path(std::string_view path) {
  return search(path, email_pattern());
}

} // namespace Signatures
