#pragma once

#include "core/types.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace logshield {

enum class LogFormat {
    TEXT,   // 2026-01-02T10:11:12.345+0000 [INFO ] updater: message key=value
    JSON    // one JSON object per line
};

[[nodiscard]] std::optional<LogFormat> parse_log_format(std::string_view name);

inline const char* log_format_to_string(LogFormat format) {
    return format == LogFormat::JSON ? "json" : "text";
}

/**
 * @brief Render a (sanitized) record as one newline-terminated line
 */
[[nodiscard]] std::string format_record(
    const LogRecord& record,
    LogFormat format,
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now());

} // namespace logshield
