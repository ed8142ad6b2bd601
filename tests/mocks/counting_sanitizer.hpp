#pragma once

#include "redact/sanitizer.hpp"

#include <atomic>
#include <cstdint>
#include <string>
#include <string_view>

namespace logshield::testing {

/**
 * @brief Default-rule sanitizer that counts every call made through it
 */
class CountingSanitizer : public Sanitizer {
public:
    [[nodiscard]] std::string sanitize(std::string_view text) const override {
        sanitize_calls_.fetch_add(1, std::memory_order_relaxed);
        return Sanitizer::sanitize(text);
    }

    [[nodiscard]] std::string sanitize_field(std::string_view key, std::string_view value) const override {
        field_calls_.fetch_add(1, std::memory_order_relaxed);
        return Sanitizer::sanitize_field(key, value);
    }

    [[nodiscard]] uint64_t sanitize_calls() const { return sanitize_calls_.load(); }
    [[nodiscard]] uint64_t field_calls() const { return field_calls_.load(); }

private:
    mutable std::atomic<uint64_t> sanitize_calls_{0};
    mutable std::atomic<uint64_t> field_calls_{0};
};

} // namespace logshield::testing
