#pragma once

#include "core/types.hpp"

#include <source_location>
#include <span>
#include <string_view>

namespace logshield::log {

/**
 * @brief Leveled call surface used throughout the process
 *
 * Routes through the facade installed by init_logging(). Before installation
 * records go to a fallback console logger (info and above, stderr) that
 * sanitizes the same way, so no call site ever prints unredacted text.
 *
 *   log::info("connected to agent");
 *   log::warn(std::format("retry {}", n), "updater");
 */
void write(Level level,
           std::string_view message,
           std::string_view target = {},
           std::span<const LogField> fields = {},
           const std::source_location& location = std::source_location::current());

/// Cheap pre-check for callers that build expensive messages
[[nodiscard]] bool enabled(Level level, std::string_view target = {});

void flush();

inline void error(std::string_view msg, std::string_view target = {},
                  const std::source_location& location = std::source_location::current()) {
    write(Level::ERROR, msg, target, {}, location);
}

inline void warn(std::string_view msg, std::string_view target = {},
                 const std::source_location& location = std::source_location::current()) {
    write(Level::WARN, msg, target, {}, location);
}

inline void info(std::string_view msg, std::string_view target = {},
                 const std::source_location& location = std::source_location::current()) {
    write(Level::INFO, msg, target, {}, location);
}

inline void debug(std::string_view msg, std::string_view target = {},
                  const std::source_location& location = std::source_location::current()) {
    write(Level::DEBUG, msg, target, {}, location);
}

inline void trace(std::string_view msg, std::string_view target = {},
                  const std::source_location& location = std::source_location::current()) {
    write(Level::TRACE, msg, target, {}, location);
}

} // namespace logshield::log
