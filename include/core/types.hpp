#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace logshield {

// ============================================================================
// Severity
// ============================================================================

/**
 * @brief Severity of a single record. Lower value = more severe.
 */
enum class Level : uint8_t {
    ERROR = 1,
    WARN,
    INFO,
    DEBUG,
    TRACE
};

/**
 * @brief Verbosity threshold. A record passes when its Level <= the filter.
 */
enum class LevelFilter : uint8_t {
    OFF = 0,
    ERROR,
    WARN,
    INFO,
    DEBUG,
    TRACE
};

[[nodiscard]] inline constexpr bool level_passes(Level level, LevelFilter filter) noexcept {
    return static_cast<uint8_t>(level) <= static_cast<uint8_t>(filter);
}

[[nodiscard]] inline constexpr LevelFilter to_filter(Level level) noexcept {
    return static_cast<LevelFilter>(static_cast<uint8_t>(level));
}

// ============================================================================
// Records
// ============================================================================

struct LogMetadata {
    Level level = Level::INFO;
    std::string_view target;
};

/**
 * @brief Structured key/value context attached to a record
 */
struct LogField {
    std::string_view key;
    std::string_view value;
};

/**
 * @brief A single log record as seen by the facade and the sinks.
 *
 * All strings are borrowed: a record never owns (and therefore never copies)
 * the text it describes. A sink must finish with the record before write()
 * returns.
 */
struct LogRecord {
    LogMetadata metadata;
    std::string_view module_path;
    std::string_view file;
    uint32_t line = 0;
    std::string_view message;
    std::span<const LogField> fields;

    [[nodiscard]] Level level() const { return metadata.level; }
    [[nodiscard]] std::string_view target() const { return metadata.target; }
};

// ============================================================================
// Utility Functions
// ============================================================================

inline const char* level_to_string(Level level) {
    switch (level) {
        case Level::ERROR: return "ERROR";
        case Level::WARN:  return "WARN";
        case Level::INFO:  return "INFO";
        case Level::DEBUG: return "DEBUG";
        case Level::TRACE: return "TRACE";
        default: return "UNKNOWN";
    }
}

inline const char* level_filter_to_string(LevelFilter filter) {
    switch (filter) {
        case LevelFilter::OFF:   return "off";
        case LevelFilter::ERROR: return "error";
        case LevelFilter::WARN:  return "warn";
        case LevelFilter::INFO:  return "info";
        case LevelFilter::DEBUG: return "debug";
        case LevelFilter::TRACE: return "trace";
        default: return "unknown";
    }
}

/**
 * @brief Parse a level name ("off", "error", "warn"/"warning", "info", "debug",
 *        "trace"), case-insensitive.
 */
[[nodiscard]] std::optional<LevelFilter> parse_level_filter(std::string_view name);

} // namespace logshield
