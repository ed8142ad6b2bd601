#pragma once

#include "logging/log_filter.hpp"
#include "logging/log_format.hpp"
#include "logging/log_sink.hpp"

#include <iostream>
#include <mutex>
#include <ostream>
#include <string>

namespace logshield {

/**
 * @brief Console sink - one line per record on a stream (stderr by default)
 *
 * Lines are formatted outside the lock and written under it, so concurrent
 * records never interleave.
 */
class ConsoleSink : public ILogSink {
public:
    struct Config {
        LogFilter filter;
        LogFormat format = LogFormat::TEXT;
    };

    explicit ConsoleSink(Config config, std::ostream& stream = std::cerr);

    [[nodiscard]] bool enabled(const LogMetadata& metadata) const override;
    void write(const LogRecord& record) override;
    void flush() override;
    [[nodiscard]] LevelFilter max_level() const override;
    [[nodiscard]] std::string name() const override;

private:
    Config config_;
    std::ostream& stream_;
    std::mutex mutex_;
};

} // namespace logshield
