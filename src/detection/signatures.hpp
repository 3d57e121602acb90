#ifndef SIGNATURES_HPP
#define SIGNATURES_HPP

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Signatures {

// Declaration order is the evaluation order, and therefore the order tags
// appear on an event.
enum class AttackCategory {
  SQLI,
  TRAVERSAL,
  XSS,
  SSRF,
  CMDI,
  RCE,
  XXE,
  LDAP_INJECTION,
  NOSQL_INJECTION
};

constexpr std::array<AttackCategory, 9> ALL_ATTACK_CATEGORIES = {
    AttackCategory::SQLI,           AttackCategory::TRAVERSAL,
    AttackCategory::XSS,            AttackCategory::SSRF,
    AttackCategory::CMDI,           AttackCategory::RCE,
    AttackCategory::XXE,            AttackCategory::LDAP_INJECTION,
    AttackCategory::NOSQL_INJECTION};

// Display label, e.g. "SQLi" or "Traversal/LFI"
const char *attack_category_label(AttackCategory category);

// Percent-decodes the raw request target and tests every category against
// it. A category contributes at most one tag.
std::vector<AttackCategory> detect_attacks(std::string_view raw_target);

// Known tool name, "browser", "bot", or nothing. Empty input is nothing.
std::optional<std::string> detect_tool(std::string_view user_agent);

bool is_bot_user_agent(std::string_view user_agent);
bool is_api_endpoint(std::string_view path);
bool is_sensitive_endpoint(std::string_view path);
bool has_session_parameter(std::string_view url);

// Path vocabularies used by the analyzer
bool is_login_path(std::string_view path);
bool is_identity_path(std::string_view path);
bool is_email_path(std::string_view path);

} // namespace Signatures

#endif // SIGNATURES_HPP
