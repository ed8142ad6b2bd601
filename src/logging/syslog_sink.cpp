#include "logging/syslog_sink.hpp"

#include <format>
#include <syslog.h>

namespace logshield {

SyslogSink::SyslogSink(Config config)
    : config_(std::move(config)) {
    // ident must outlive the openlog() registration; config_ owns it
    openlog(config_.ident.c_str(), LOG_NDELAY | LOG_PID, config_.facility);
}

SyslogSink::~SyslogSink() {
    closelog();
}

int SyslogSink::priority_for(Level level) {
    switch (level) {
        case Level::ERROR: return LOG_ERR;
        case Level::WARN:  return LOG_WARNING;
        case Level::INFO:  return LOG_INFO;
        case Level::DEBUG:
        case Level::TRACE: return LOG_DEBUG;
    }
    return LOG_INFO;
}

bool SyslogSink::enabled(const LogMetadata& metadata) const {
    return config_.filter.enabled(metadata);
}

void SyslogSink::write(const LogRecord& record) {
    // syslog adds its own timestamp, host and ident
    std::string msg;
    if (!record.target().empty()) {
        msg += record.target();
        msg += ": ";
    }
    msg += record.message;
    for (const auto& f : record.fields) {
        msg += std::format(" {}={}", f.key, f.value);
    }

    syslog(priority_for(record.level()), "%s", msg.c_str());
    ++records_written_;
}

void SyslogSink::flush() {
    // syslog is unbuffered
}

LevelFilter SyslogSink::max_level() const {
    return config_.filter.max_level();
}

std::string SyslogSink::name() const {
    return "syslog:" + config_.ident;
}

} // namespace logshield
