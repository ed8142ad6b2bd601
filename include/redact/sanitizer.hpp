#pragma once

#include "redact/detection_rule.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace logshield {

/**
 * @brief Secret sanitizer - rewrites text so it is safe to log
 *
 * Applies an ordered list of DetectionRules as a fold: each rule sees the
 * output of the previous one. Holds no mutable state after construction,
 * so a single instance may be shared by any number of threads.
 *
 * Tokens emitted:
 * - "<REDACTED>"       whole span removed
 * - "<USER>"           username segment of a home-directory path
 * - "key=<REDACTED>"   credential assignment, key kept
 */
class Sanitizer {
public:
    static constexpr std::string_view kRedacted = "<REDACTED>";
    static constexpr std::string_view kUser = "<USER>";
    static constexpr std::string_view kTruncated = "...<TRUNCATED>";

    /**
     * Largest span handed to the regex engine in one piece. Longer text is
     * matched line by line; a single line past this size is cut and ends
     * with kTruncated.
     */
    static constexpr size_t kMaxInputBytes = 8 * 1024;

    /// Built-in rule set (default_rule_specs())
    Sanitizer();

    explicit Sanitizer(std::vector<DetectionRule> rules);

    virtual ~Sanitizer() = default;

    /**
     * @brief Redact every sensitive span of text.
     *
     * Never throws on matcher failure: if the regex engine gives up, the
     * whole text is replaced by "<REDACTED>".
     */
    [[nodiscard]] virtual std::string sanitize(std::string_view text) const;

    /**
     * @brief Sanitize a structured field value.
     *
     * Values under a sensitive key name (password, secret, token, value, ...)
     * are dropped entirely; others go through sanitize().
     */
    [[nodiscard]] virtual std::string sanitize_field(std::string_view key, std::string_view value) const;

    /// True when the field key names a credential-bearing argument
    [[nodiscard]] static bool is_sensitive_key(std::string_view key);

    [[nodiscard]] const std::vector<DetectionRule>& rules() const { return rules_; }
    [[nodiscard]] size_t rule_count() const { return rules_.size(); }

private:
    /// Rewrite every match of rule into out; false (out untouched) when nothing matched
    static bool apply_rule(const DetectionRule& rule, const std::string& text, std::string& out);

    /// Fold every rule over text; std::regex_error propagates after wiping
    [[nodiscard]] std::string apply_rules(std::string_view text) const;

    std::vector<DetectionRule> rules_;
};

} // namespace logshield
