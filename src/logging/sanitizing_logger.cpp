#include "logging/sanitizing_logger.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace logshield {

SanitizingLogger::SanitizingLogger(std::shared_ptr<const Sanitizer> sanitizer,
                                   std::unique_ptr<ILogSink> sink)
    : sanitizer_(std::move(sanitizer)),
      sink_(std::move(sink)) {
    if (!sanitizer_ || !sink_) {
        throw std::invalid_argument("SanitizingLogger requires a sanitizer and a sink");
    }
    max_level_ = sink_->max_level();
}

bool SanitizingLogger::enabled(const LogMetadata& metadata) const {
    return sink_->enabled(metadata);
}

void SanitizingLogger::log(const LogRecord& record) {
    if (!enabled(record.metadata)) return;

    const std::string message = sanitizer_->sanitize(record.message);

    std::vector<std::string> values;
    std::vector<LogField> fields;
    if (!record.fields.empty()) {
        values.reserve(record.fields.size());
        fields.reserve(record.fields.size());
        for (const auto& f : record.fields) {
            values.push_back(sanitizer_->sanitize_field(f.key, f.value));
        }
        for (size_t i = 0; i < record.fields.size(); ++i) {
            fields.push_back({record.fields[i].key, values[i]});
        }
    }

    LogRecord sanitized;
    sanitized.metadata = record.metadata;
    sanitized.module_path = record.module_path;
    sanitized.file = record.file;
    sanitized.line = record.line;
    sanitized.message = message;
    sanitized.fields = fields;

    sink_->write(sanitized);
}

void SanitizingLogger::flush() {
    sink_->flush();
}

} // namespace logshield
