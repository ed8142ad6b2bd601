#include "logging/logging_guard.hpp"
#include "logging/sink_factory.hpp"

#include <format>

namespace logshield {

LoggingGuard::~LoggingGuard() {
    delete slot_.load(std::memory_order_acquire);
}

SanitizingLogger& LoggingGuard::install(std::unique_ptr<SanitizingLogger> logger) {
    if (!logger) {
        throw InstallError("Cannot install a null logger");
    }
    if (claimed_.exchange(true, std::memory_order_acq_rel)) {
        throw InstallError("Logging already initialized");
    }
    return publish(std::move(logger));
}

SanitizingLogger& LoggingGuard::install_with(const LoggerFactory& make) {
    if (claimed_.exchange(true, std::memory_order_acq_rel)) {
        throw InstallError("Logging already initialized");
    }

    std::unique_ptr<SanitizingLogger> logger;
    try {
        logger = make();
    } catch (...) {
        claimed_.store(false, std::memory_order_release);
        throw;
    }
    if (!logger) {
        claimed_.store(false, std::memory_order_release);
        throw InstallError("Cannot install a null logger");
    }
    return publish(std::move(logger));
}

SanitizingLogger& LoggingGuard::publish(std::unique_ptr<SanitizingLogger> logger) {
    SanitizingLogger* raw = logger.release();
    slot_.store(raw, std::memory_order_release);
    return *raw;
}

LoggingGuard& LoggingGuard::global() {
    // Never destroyed
    static LoggingGuard* instance = new LoggingGuard();
    return *instance;
}

SanitizingLogger& init_logging(const LoggingConfig& config) {
    // Sinks are built only after the slot is claimed: a losing caller must not
    // open (and on destruction close) process-wide handles such as syslog
    return LoggingGuard::global().install_with([&config] {
        auto sink = SinkFactory::create(config);
        if (sink.is_error()) {
            throw InstallError(std::format("Cannot initialize logging: {}", sink.error_message()));
        }
        return std::make_unique<SanitizingLogger>(
            std::make_shared<const Sanitizer>(), std::move(sink.value()));
    });
}

} // namespace logshield
