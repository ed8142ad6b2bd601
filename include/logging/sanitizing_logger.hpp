#pragma once

#include "core/types.hpp"
#include "logging/log_sink.hpp"
#include "redact/sanitizer.hpp"

#include <memory>

namespace logshield {

/**
 * @brief Logging facade - the single point between leveled log calls and
 *        the output sink
 *
 * log() runs inline on the caller's thread:
 *   1. ask the sink whether the level/target is enabled (no cost otherwise)
 *   2. sanitize the message and every field value
 *   3. forward a new record carrying the sanitized text and the incoming record's
 *      level/target/module/file/line
 *
 * The incoming record is never forwarded, stored or queued. The facade
 * itself holds no mutable state; any locking happens inside the sink.
 */
class SanitizingLogger {
public:
    SanitizingLogger(std::shared_ptr<const Sanitizer> sanitizer,
                     std::unique_ptr<ILogSink> sink);

    SanitizingLogger(const SanitizingLogger&) = delete;
    SanitizingLogger& operator=(const SanitizingLogger&) = delete;

    [[nodiscard]] bool enabled(const LogMetadata& metadata) const;

    void log(const LogRecord& record);

    void flush();

    /// Most verbose level the sink accepts; callers use it as a cheap pre-check
    [[nodiscard]] LevelFilter max_level() const { return max_level_; }

    [[nodiscard]] const Sanitizer& sanitizer() const { return *sanitizer_; }
    [[nodiscard]] const ILogSink& sink() const { return *sink_; }

private:
    std::shared_ptr<const Sanitizer> sanitizer_;
    std::unique_ptr<ILogSink> sink_;
    LevelFilter max_level_;
};

} // namespace logshield
