#pragma once

#include "config/config_loader.hpp"
#include "core/error.hpp"
#include "logging/log_sink.hpp"

#include <memory>

namespace logshield {

/**
 * @brief Builds the sink tree described by a LoggingConfig
 *
 * Console, file and syslog backends are created in that order; a single
 * backend is returned as is, several are wrapped in a MultiSink. A config
 * that enables no backend falls back to the console so records are never
 * silently discarded.
 */
class SinkFactory {
public:
    [[nodiscard]] static Result<std::unique_ptr<ILogSink>> create(const LoggingConfig& config);
};

} // namespace logshield
