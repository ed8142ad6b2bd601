#include "logging/multi_sink.hpp"

#include <algorithm>

namespace logshield {

MultiSink::MultiSink(std::vector<std::unique_ptr<ILogSink>> sinks)
    : sinks_(std::move(sinks)) {
    std::erase(sinks_, nullptr);
}

bool MultiSink::enabled(const LogMetadata& metadata) const {
    return std::any_of(sinks_.begin(), sinks_.end(),
                       [&](const auto& sink) { return sink->enabled(metadata); });
}

void MultiSink::write(const LogRecord& record) {
    for (const auto& sink : sinks_) {
        if (sink->enabled(record.metadata)) {
            sink->write(record);
        }
    }
}

void MultiSink::flush() {
    for (const auto& sink : sinks_) {
        sink->flush();
    }
}

LevelFilter MultiSink::max_level() const {
    auto max = LevelFilter::OFF;
    for (const auto& sink : sinks_) {
        max = std::max(max, sink->max_level());
    }
    return max;
}

std::string MultiSink::name() const {
    std::string out = "multi[";
    for (size_t i = 0; i < sinks_.size(); ++i) {
        if (i > 0) out += ',';
        out += sinks_[i]->name();
    }
    out += ']';
    return out;
}

} // namespace logshield
