#include "redact/sanitizer.hpp"
#include "core/secure_wipe.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <array>
#include <regex>

namespace logshield {

namespace {

// Field names whose values are credentials no matter what they look like
constexpr std::array<std::string_view, 14> kSensitiveKeys = {
    "value", "password", "passwd", "passphrase", "secret", "token",
    "api_key", "apikey", "private_key", "client_secret", "access_token",
    "auth", "authorization", "bearer",
};

// Any key containing one of these is treated as sensitive too
constexpr std::array<std::string_view, 3> kSensitiveKeyFragments = {
    "password", "secret", "token",
};

/**
 * @brief Cut text to at most max_bytes without splitting a UTF-8 sequence.
 */
std::string_view truncate_utf8(std::string_view text, size_t max_bytes) {
    if (text.size() <= max_bytes) return text;
    size_t end = max_bytes;
    while (end > 0 && (static_cast<unsigned char>(text[end]) & 0xC0) == 0x80) {
        --end;
    }
    return text.substr(0, end);
}

} // anonymous namespace

Sanitizer::Sanitizer()
    : rules_(compile_rules(default_rule_specs())) {}

Sanitizer::Sanitizer(std::vector<DetectionRule> rules)
    : rules_(std::move(rules)) {}

bool Sanitizer::apply_rule(const DetectionRule& rule, const std::string& text, std::string& out) {
    auto it = std::sregex_iterator(text.begin(), text.end(), rule.pattern());
    const auto end = std::sregex_iterator();
    if (it == end) return false;

    // Room for the placeholders, so partly rewritten text is not left behind
    // in a freed buffer by a reallocation
    out.clear();
    out.reserve(2 * text.size() + kRedacted.size());
    auto last = text.cbegin();

    for (; it != end; ++it) {
        const auto& m = *it;
        out.append(last, m[0].first);
        last = m[0].second;

        // An optional group 1 that did not take part leaves nothing to keep
        if (rule.strategy() != RedactionStrategy::FULL && !m[1].matched) {
            out += kRedacted;
            continue;
        }

        switch (rule.strategy()) {
            case RedactionStrategy::KEY_VALUE:
                out.append(m[1].first, m[1].second);
                out += '=';
                out += kRedacted;
                break;

            case RedactionStrategy::PATH_USER:
                // Only the username segment of this match is replaced
                out.append(m[0].first, m[1].first);
                out += kUser;
                out.append(m[1].second, m[0].second);
                break;

            case RedactionStrategy::FULL:
                out += kRedacted;
                break;
        }
    }
    out.append(last, text.cend());
    return true;
}

std::string Sanitizer::apply_rules(std::string_view text) const {
    std::string current(text);
    std::string next;
    try {
        for (const auto& rule : rules_) {
            if (apply_rule(rule, current, next)) {
                current.swap(next);
                secure_wipe(next);
            }
        }
    } catch (const std::regex_error&) {
        secure_wipe(current);
        secure_wipe(next);
        throw;
    }
    return current;
}

std::string Sanitizer::sanitize(std::string_view text) const {
    if (text.empty()) return {};

    std::string result;
    try {
        if (text.size() <= kMaxInputBytes) {
            return apply_rules(text);
        }

        // Long text: pack whole lines into chunks of at most kMaxInputBytes.
        // Only a single line longer than that is cut.
        result.reserve(text.size() + text.size() / 2);
        size_t pos = 0;
        while (pos < text.size()) {
            size_t end = pos;
            while (end < text.size()) {
                const size_t nl = text.find('\n', end);
                const size_t line_end = nl == std::string_view::npos ? text.size() : nl + 1;
                if (line_end - pos > kMaxInputBytes && end > pos) break;
                end = line_end;
            }

            const auto chunk = text.substr(pos, end - pos);
            pos = end;
            if (chunk.size() <= kMaxInputBytes) {
                result += apply_rules(chunk);
                continue;
            }

            const bool newline = chunk.back() == '\n';
            result += apply_rules(truncate_utf8(chunk, kMaxInputBytes));
            result += kTruncated;
            if (newline) result += '\n';
        }
    } catch (const std::regex_error&) {
        // Fail closed: the matcher gave up, so nothing of the text is trusted
        secure_wipe(result);
        return std::string(kRedacted);
    }
    return result;
}

bool Sanitizer::is_sensitive_key(std::string_view key) {
    std::string normalized = utils::to_lower(utils::trim(key));
    std::replace(normalized.begin(), normalized.end(), '-', '_');

    if (std::find(kSensitiveKeys.begin(), kSensitiveKeys.end(), normalized) != kSensitiveKeys.end()) {
        return true;
    }
    return std::any_of(kSensitiveKeyFragments.begin(), kSensitiveKeyFragments.end(),
                       [&](std::string_view fragment) {
                           return normalized.find(fragment) != std::string::npos;
                       });
}

std::string Sanitizer::sanitize_field(std::string_view key, std::string_view value) const {
    if (value.empty()) return {};
    if (is_sensitive_key(key)) {
        return std::string(kRedacted);
    }
    return sanitize(value);
}

} // namespace logshield
