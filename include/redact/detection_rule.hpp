#pragma once

#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace logshield {

/**
 * @brief How a match of a rule is rewritten
 *
 * - KEY_VALUE: capture group 1 is the key; the match becomes "<key>=<REDACTED>"
 * - PATH_USER: capture group 1 is the username segment; only it becomes "<USER>"
 * - FULL:      the whole match becomes "<REDACTED>"
 */
enum class RedactionStrategy {
    KEY_VALUE,
    PATH_USER,
    FULL
};

inline const char* strategy_to_string(RedactionStrategy strategy) {
    switch (strategy) {
        case RedactionStrategy::KEY_VALUE: return "KEY_VALUE";
        case RedactionStrategy::PATH_USER: return "PATH_USER";
        case RedactionStrategy::FULL:      return "FULL";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Uncompiled description of a rule. The default rule set is a plain
 *        ordered list of these, so order can be inspected without matching.
 */
struct RuleSpec {
    std::string_view name;
    std::string_view pattern;
    bool icase = false;
    RedactionStrategy strategy = RedactionStrategy::FULL;
};

/**
 * @brief A compiled pattern plus its replacement strategy.
 *
 * Immutable after construction. Throws std::regex_error for a malformed
 * pattern and std::invalid_argument when a KEY_VALUE or PATH_USER pattern
 * has no capture group to preserve.
 */
class DetectionRule {
public:
    explicit DetectionRule(const RuleSpec& spec);

    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] const std::regex& pattern() const { return pattern_; }
    [[nodiscard]] RedactionStrategy strategy() const { return strategy_; }

private:
    std::string name_;
    std::regex pattern_;
    RedactionStrategy strategy_;
};

/**
 * @brief The built-in rules, in evaluation order.
 *
 * Order is a contract: flags before key/value (so "--password=x" is removed
 * whole), key/value before the generic blob rule (so the key survives),
 * JWT and UUID before the blob rule (so they are not fragmented), paths
 * before the blob rule ('/' is in the base64 alphabet).
 */
[[nodiscard]] const std::vector<RuleSpec>& default_rule_specs();

/**
 * @brief Compile a list of specs, preserving order.
 */
[[nodiscard]] std::vector<DetectionRule> compile_rules(const std::vector<RuleSpec>& specs);

} // namespace logshield
