#include "logging/console_sink.hpp"

namespace logshield {

ConsoleSink::ConsoleSink(Config config, std::ostream& stream)
    : config_(std::move(config)), stream_(stream) {}

bool ConsoleSink::enabled(const LogMetadata& metadata) const {
    return config_.filter.enabled(metadata);
}

void ConsoleSink::write(const LogRecord& record) {
    const auto line = format_record(record, config_.format);

    std::lock_guard<std::mutex> lock(mutex_);
    stream_ << line;
}

void ConsoleSink::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    stream_.flush();
}

LevelFilter ConsoleSink::max_level() const {
    return config_.filter.max_level();
}

std::string ConsoleSink::name() const {
    return "console";
}

} // namespace logshield
