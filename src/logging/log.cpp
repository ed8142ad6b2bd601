#include "logging/log.hpp"
#include "logging/console_sink.hpp"
#include "logging/logging_guard.hpp"

namespace logshield::log {

namespace {

SanitizingLogger& fallback_logger() {
    // Never destroyed, like the global guard
    static SanitizingLogger* logger = new SanitizingLogger(
        std::make_shared<const Sanitizer>(),
        std::make_unique<ConsoleSink>(ConsoleSink::Config{LogFilter(LevelFilter::INFO), LogFormat::TEXT}));
    return *logger;
}

SanitizingLogger& active_logger() {
    if (auto* logger = LoggingGuard::global().get()) {
        return *logger;
    }
    return fallback_logger();
}

} // anonymous namespace

void write(Level level,
           std::string_view message,
           std::string_view target,
           std::span<const LogField> fields,
           const std::source_location& location) {
    auto& logger = active_logger();
    if (!level_passes(level, logger.max_level())) return;

    LogRecord record;
    record.metadata = {level, target};
    record.module_path = location.function_name();
    record.file = location.file_name();
    record.line = location.line();
    record.message = message;
    record.fields = fields;
    logger.log(record);
}

bool enabled(Level level, std::string_view target) {
    return active_logger().enabled({level, target});
}

void flush() {
    active_logger().flush();
}

} // namespace logshield::log
