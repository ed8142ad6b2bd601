#include "logging/log_filter.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace logshield {

namespace {

bool target_matches(std::string_view target, std::string_view directive) {
    if (!target.starts_with(directive)) return false;
    if (target.size() == directive.size()) return true;
    const char next = target[directive.size()];
    return next == ':' || next == '.' || next == '/';
}

} // anonymous namespace

Result<LogFilter> LogFilter::parse(std::string_view spec) {
    LogFilter filter;

    for (const auto raw : utils::split(spec, ',')) {
        const auto entry = utils::trim(raw);
        if (entry.empty()) continue;

        const auto eq = entry.find('=');
        if (eq == std::string_view::npos) {
            // Bare word: a level name sets the default, anything else is a target at trace
            if (const auto level = parse_level_filter(entry)) {
                filter.default_level_ = *level;
            } else {
                filter.add_directive(std::string(entry), LevelFilter::TRACE);
            }
            continue;
        }

        const auto target = utils::trim(entry.substr(0, eq));
        const auto level_name = utils::trim(entry.substr(eq + 1));
        if (target.empty()) {
            return Result<LogFilter>::error(ErrorCategory::FILTER_ERROR,
                std::format("Log filter directive '{}' has no target", entry));
        }
        const auto level = parse_level_filter(level_name);
        if (!level) {
            return Result<LogFilter>::error(ErrorCategory::FILTER_ERROR,
                std::format("Log filter directive '{}' has unknown level '{}'", entry, level_name));
        }
        filter.add_directive(std::string(target), *level);
    }

    return Result<LogFilter>::ok(std::move(filter));
}

void LogFilter::add_directive(std::string target, LevelFilter level) {
    // Later directives for the same target win
    const auto existing = std::find_if(directives_.begin(), directives_.end(),
        [&](const Directive& d) { return d.target == target; });
    if (existing != directives_.end()) {
        existing->level = level;
        return;
    }

    directives_.push_back({std::move(target), level});
    std::stable_sort(directives_.begin(), directives_.end(),
        [](const Directive& a, const Directive& b) { return a.target.size() > b.target.size(); });
}

LevelFilter LogFilter::level_for(std::string_view target) const {
    for (const auto& d : directives_) {
        if (target_matches(target, d.target)) {
            return d.level;
        }
    }
    return default_level_;
}

bool LogFilter::enabled(const LogMetadata& metadata) const {
    return level_passes(metadata.level, level_for(metadata.target));
}

LevelFilter LogFilter::max_level() const {
    auto max = default_level_;
    for (const auto& d : directives_) {
        max = std::max(max, d.level);
    }
    return max;
}

std::string LogFilter::to_string() const {
    std::string out = level_filter_to_string(default_level_);
    // Shortest first reads the way people write these
    for (auto it = directives_.rbegin(); it != directives_.rend(); ++it) {
        out += std::format(",{}={}", it->target, level_filter_to_string(it->level));
    }
    return out;
}

} // namespace logshield
