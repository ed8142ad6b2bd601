#include "core/types.hpp"
#include "core/utils.hpp"

#include <string>
#include <unordered_map>

namespace logshield {

std::optional<LevelFilter> parse_level_filter(std::string_view name) {
    static const std::unordered_map<std::string, LevelFilter> lookup = {
        {"off",     LevelFilter::OFF},
        {"error",   LevelFilter::ERROR},
        {"warn",    LevelFilter::WARN},
        {"warning", LevelFilter::WARN},
        {"info",    LevelFilter::INFO},
        {"debug",   LevelFilter::DEBUG},
        {"trace",   LevelFilter::TRACE},
    };

    const auto it = lookup.find(utils::to_lower(utils::trim(name)));
    return (it != lookup.end()) ? std::make_optional(it->second) : std::nullopt;
}

} // namespace logshield
