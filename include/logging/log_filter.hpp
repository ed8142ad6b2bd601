#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace logshield {

/**
 * @brief Per-target level filter built from a directive list
 *
 * Syntax (comma separated, whitespace ignored):
 *   "info"                   default level
 *   "warn,updater=debug"     default warn, target "updater" at debug
 *   "ipc"                    target "ipc" at trace
 *   "ipc=off"                silence target "ipc"
 *
 * A directive applies to its target and to every sub-target separated by
 * "::", "." or "/" ("updater" covers "updater::download"). The longest
 * matching directive wins; otherwise the default level applies.
 */
class LogFilter {
public:
    struct Directive {
        std::string target;
        LevelFilter level;
    };

    LogFilter() = default;
    explicit LogFilter(LevelFilter default_level) : default_level_(default_level) {}

    /**
     * @brief Parse a directive list
     * @return The filter, or FILTER_ERROR naming the offending directive
     */
    [[nodiscard]] static Result<LogFilter> parse(std::string_view spec);

    [[nodiscard]] bool enabled(const LogMetadata& metadata) const;

    /// Level applied to a target after directive resolution
    [[nodiscard]] LevelFilter level_for(std::string_view target) const;

    /// Most verbose level any directive (or the default) allows
    [[nodiscard]] LevelFilter max_level() const;

    [[nodiscard]] LevelFilter default_level() const { return default_level_; }
    [[nodiscard]] const std::vector<Directive>& directives() const { return directives_; }

    /// Canonical directive string ("warn,updater=debug")
    [[nodiscard]] std::string to_string() const;

private:
    void add_directive(std::string target, LevelFilter level);

    LevelFilter default_level_ = LevelFilter::INFO;
    std::vector<Directive> directives_;  // longest target first
};

} // namespace logshield
