#include "redact/detection_rule.hpp"

#include <format>
#include <stdexcept>

namespace logshield {

namespace {

constexpr auto kSyntax = std::regex::ECMAScript | std::regex::optimize;

// --password=hunter2 / --token abc / --secret=...
constexpr std::string_view kCliFlagPattern =
    R"(--(?:password|token|secret)[= ]\S+)";

// api_key: x, "token": "x", password='x', Client-Secret=x ...
// Compound keys come first so the alternation reports the longest key.
constexpr std::string_view kKeyValuePattern =
    R"((private[_-]?key|client[_-]?secret|access[_-]?token|api[_-]?key|token|secret|password|auth|bearer)['"]?\s*[:=]\s*['"]?([^'";\s]+))";

constexpr std::string_view kJwtPattern =
    R"(eyJ[A-Za-z0-9_-]+\.eyJ[A-Za-z0-9_-]+\.[A-Za-z0-9_-]+)";

constexpr std::string_view kUuidPattern =
    R"([0-9a-fA-F]{8}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{12})";

// POSIX user names never contain whitespace; stopping there keeps a match
// inside a single path token.
constexpr std::string_view kUsersHomePattern = R"(/Users/([^/\s]+)/)";
constexpr std::string_view kHomePattern      = R"(/home/([^/\s]+)/)";

// Windows profile names may contain spaces, so only separators end them.
constexpr std::string_view kWindowsProfilePattern = R"([A-Za-z]:\\Users\\([^\\\r\n]+)\\)";

constexpr std::string_view kBase64BlobPattern = R"([A-Za-z0-9+/]{20,}={0,2})";

} // anonymous namespace

DetectionRule::DetectionRule(const RuleSpec& spec)
    : name_(spec.name),
      pattern_(std::string(spec.pattern),
               spec.icase ? (kSyntax | std::regex::icase) : kSyntax),
      strategy_(spec.strategy) {
    if (strategy_ != RedactionStrategy::FULL && pattern_.mark_count() < 1) {
        throw std::invalid_argument(std::format(
            "Detection rule '{}' uses {} but captures no group",
            name_, strategy_to_string(strategy_)));
    }
}

const std::vector<RuleSpec>& default_rule_specs() {
    static const std::vector<RuleSpec> specs = {
        {"cli_flag",             kCliFlagPattern,        false, RedactionStrategy::FULL},
        {"key_value",            kKeyValuePattern,       true,  RedactionStrategy::KEY_VALUE},
        {"jwt",                  kJwtPattern,            false, RedactionStrategy::FULL},
        {"uuid",                 kUuidPattern,           false, RedactionStrategy::FULL},
        {"posix_users_home",     kUsersHomePattern,      false, RedactionStrategy::PATH_USER},
        {"posix_home",           kHomePattern,           false, RedactionStrategy::PATH_USER},
        {"windows_user_profile", kWindowsProfilePattern, true,  RedactionStrategy::PATH_USER},
        {"base64_blob",          kBase64BlobPattern,     false, RedactionStrategy::FULL},
    };
    return specs;
}

std::vector<DetectionRule> compile_rules(const std::vector<RuleSpec>& specs) {
    std::vector<DetectionRule> rules;
    rules.reserve(specs.size());
    for (const auto& spec : specs) {
        rules.emplace_back(spec);
    }
    return rules;
}

} // namespace logshield
