#include "config/config_loader.hpp"

#include <cstdlib>
#include <format>
#include <stdexcept>

using namespace std::string_literals;

namespace logshield {

// Constexpr config keys
static constexpr std::string_view kLogging = "logging";
static constexpr std::string_view kFile    = "file";
static constexpr std::string_view kSyslog  = "syslog";

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 *
 * Unset variables expand to nothing; an unclosed "${" is an error.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

// The [logging] schema holds only strings, numbers, booleans and sub-tables
void expand_env_in_table(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (auto* str = val.as_string()) {
            if (str->get().find("${") != std::string::npos) {
                *str = expand_env_vars(str->get());
            }
        } else if (auto* sub = val.as_table()) {
            expand_env_in_table(*sub);
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_in_table(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_in_table(result);
    return result;
}

} // anonymous namespace

// ============================================================================
// Section Extraction
// ============================================================================

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root[kLogging].as_table();
    if (!logging) return cfg;
    const auto& l = *logging;

    cfg.level = l["level"].value_or("info"s);
    cfg.format_name = l["format"].value_or("text"s);
    cfg.console = l["console"].value_or(true);

    if (const auto* file = l[kFile].as_table()) {
        const auto& f = *file;
        cfg.file.path = f["path"].value_or(""s);
        cfg.file.enabled = f["enabled"].value_or(!cfg.file.path.empty());
        cfg.file.max_size_bytes = f["max_size_bytes"].value_or(cfg.file.max_size_bytes);
        cfg.file.max_files = f["max_files"].value_or(cfg.file.max_files);
        cfg.file.rotation_hours = f["rotation_hours"].value_or(cfg.file.rotation_hours);
    }

    if (const auto* syslog = l[kSyslog].as_table()) {
        const auto& s = *syslog;
        cfg.syslog.enabled = s["enabled"].value_or(false);
        cfg.syslog.ident = s["ident"].value_or(cfg.syslog.ident);
    }

    return cfg;
}

void ConfigLoader::apply_env_overrides(LoggingConfig& config) {
    const char* env_level = std::getenv(kLogEnvVar);
    if (env_level && *env_level != '\0') {
        config.level = env_level;
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::resolve_and_validate(LoggingConfig& config) {
    std::vector<std::string> errors;

    auto filter = LogFilter::parse(config.level);
    if (filter.is_ok()) {
        config.filter = filter.value();
    } else {
        errors.push_back(std::format("logging.level: {}", filter.error_message()));
    }

    if (const auto format = parse_log_format(config.format_name)) {
        config.format = *format;
    } else {
        errors.push_back(std::format(
            "logging.format must be \"text\" or \"json\", got \"{}\"", config.format_name));
    }

    if (config.file.enabled) {
        if (config.file.path.empty()) {
            errors.push_back("logging.file.path required when file logging is enabled");
        }
        if (config.file.max_size_bytes <= 0) {
            errors.push_back(std::format(
                "logging.file.max_size_bytes must be > 0, got {}", config.file.max_size_bytes));
        }
        if (config.file.max_files < 1) {
            errors.push_back(std::format(
                "logging.file.max_files must be >= 1, got {}", config.file.max_files));
        }
        if (config.file.rotation_hours < 0) {
            errors.push_back(std::format(
                "logging.file.rotation_hours must be >= 0, got {}", config.file.rotation_hours));
        }
    }

    if (config.syslog.enabled && config.syslog.ident.empty()) {
        errors.push_back("logging.syslog.ident must not be empty");
    }

    return errors;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(LoggingConfig config) {
    apply_env_overrides(config);
    const auto errors = resolve_and_validate(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return LoadResult::error(std::move(combined));
    }
    return LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_logging(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_logging(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_defaults() {
    return validate_and_return(LoggingConfig{});
}

} // namespace logshield
