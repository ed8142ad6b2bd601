#include "logging/sink_factory.hpp"
#include "logging/console_sink.hpp"
#include "logging/file_sink.hpp"
#include "logging/multi_sink.hpp"
#include "logging/syslog_sink.hpp"

#include <format>
#include <vector>

namespace logshield {

Result<std::unique_ptr<ILogSink>> SinkFactory::create(const LoggingConfig& config) {
    using SinkResult = Result<std::unique_ptr<ILogSink>>;

    std::vector<std::unique_ptr<ILogSink>> sinks;

    try {
        if (config.file.enabled) {
            FileSink::Config fc;
            fc.path = config.file.path;
            fc.max_file_size_bytes = static_cast<size_t>(config.file.max_size_bytes);
            fc.max_files = config.file.max_files;
            fc.rotation_interval = std::chrono::hours(config.file.rotation_hours);
            fc.time_based_rotation = config.file.rotation_hours > 0;
            fc.filter = config.filter;
            fc.format = config.format;
            sinks.push_back(std::make_unique<FileSink>(std::move(fc)));
        }

        if (config.syslog.enabled) {
            SyslogSink::Config sc;
            sc.ident = config.syslog.ident;
            sc.filter = config.filter;
            sinks.push_back(std::make_unique<SyslogSink>(std::move(sc)));
        }

        if (config.console || sinks.empty()) {
            ConsoleSink::Config cc;
            cc.filter = config.filter;
            cc.format = config.format;
            sinks.insert(sinks.begin(), std::make_unique<ConsoleSink>(std::move(cc)));
        }
    } catch (const std::exception& e) {
        return SinkResult::error(ErrorCategory::SINK_ERROR,
            std::format("Failed to create log sink: {}", e.what()));
    }

    if (sinks.size() == 1) {
        return SinkResult::ok(std::move(sinks.front()));
    }
    return SinkResult::ok(std::make_unique<MultiSink>(std::move(sinks)));
}

} // namespace logshield
