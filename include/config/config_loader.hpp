#pragma once

#include "logging/log_filter.hpp"
#include "logging/log_format.hpp"

#include <toml.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace logshield {

// ============================================================================
// Logging Config (mirrors TOML hierarchy)
// ============================================================================

struct FileLogConfig {
    bool enabled = false;             // true when [logging.file] names a path
    std::string path;
    int64_t max_size_bytes = 10LL * 1024 * 1024;
    int max_files = 5;
    int rotation_hours = 24;
};

struct SyslogLogConfig {
    bool enabled = false;
    std::string ident = "logshield";
};

struct LoggingConfig {
    std::string level = "info";       // directive list, see LogFilter
    std::string format_name = "text";
    bool console = true;
    FileLogConfig file;
    SyslogLogConfig syslog;

    // Resolved from level / format_name by the loader
    LogFilter filter;
    LogFormat format = LogFormat::TEXT;
};

/// Environment variable that replaces logging.level when set and non-empty
inline constexpr const char* kLogEnvVar = "LOGSHIELD_LOG";

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

class ConfigLoader {
public:
    struct LoadResult {
        bool success = false;
        std::string error_message;
        LoggingConfig config;

        static LoadResult ok(LoggingConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load logging config from a TOML file
     * @param config_path Path to logshield.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load logging config from a TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /// Built-in defaults with the environment override applied
    [[nodiscard]] static LoadResult load_defaults();

private:
    static LoggingConfig extract_logging(const toml::table& root);
    static void apply_env_overrides(LoggingConfig& config);

    // Parses level/format and checks limits; fills config.filter / config.format
    static std::vector<std::string> resolve_and_validate(LoggingConfig& config);
    static LoadResult validate_and_return(LoggingConfig config);
};

} // namespace logshield
