#pragma once

#include "core/types.hpp"

#include <string>

namespace logshield {

/**
 * @brief Abstract interface for log output destinations
 *
 * A sink only ever receives records the SanitizingLogger has already
 * rewritten. It is called synchronously from arbitrary application threads,
 * so implementations serialize their own I/O. The record's strings are
 * borrowed and must not be retained after write() returns.
 */
class ILogSink {
public:
    virtual ~ILogSink() = default;

    /// Level/target filter; the facade pays no sanitization cost when false.
    [[nodiscard]] virtual bool enabled(const LogMetadata& metadata) const = 0;

    /// Emit one record.
    virtual void write(const LogRecord& record) = 0;

    /// Flush any buffered data to the underlying storage.
    virtual void flush() = 0;

    /// Most verbose level this sink can ever accept.
    [[nodiscard]] virtual LevelFilter max_level() const = 0;

    /// Human-readable sink name for diagnostics (e.g. "file:/var/log/app.log")
    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace logshield
