#pragma once

#include "logging/log_filter.hpp"
#include "logging/log_sink.hpp"

#include <atomic>
#include <cstdint>
#include <string>

namespace logshield {

/**
 * @brief POSIX syslog log sink
 *
 * Writes records to the local syslog facility, mapping Level to the syslog
 * priority. Zero external dependencies (uses POSIX syslog(3)). openlog()
 * state is process-wide, so only one SyslogSink should exist at a time.
 */
class SyslogSink : public ILogSink {
public:
    struct Config {
        std::string ident = "logshield";
        int facility = 8;     // LOG_USER = (1 << 3) = 8
        LogFilter filter;
    };

    explicit SyslogSink(Config config);
    ~SyslogSink() override;

    [[nodiscard]] bool enabled(const LogMetadata& metadata) const override;
    void write(const LogRecord& record) override;
    void flush() override;
    [[nodiscard]] LevelFilter max_level() const override;
    [[nodiscard]] std::string name() const override;

    [[nodiscard]] uint64_t records_written() const { return records_written_.load(); }

    /// syslog(3) priority used for a level
    [[nodiscard]] static int priority_for(Level level);

private:
    Config config_;
    std::atomic<uint64_t> records_written_{0};
};

} // namespace logshield
