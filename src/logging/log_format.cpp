#include "logging/log_format.hpp"
#include "core/utils.hpp"

#include <format>

namespace logshield {

namespace {

const char* padded_tag(Level level) {
    switch (level) {
        case Level::ERROR: return "ERROR";
        case Level::WARN:  return "WARN ";
        case Level::INFO:  return "INFO ";
        case Level::DEBUG: return "DEBUG";
        case Level::TRACE: return "TRACE";
    }
    return "?????";
}

std::string format_text(const LogRecord& record, const std::string& ts) {
    std::string out;
    out.reserve(ts.size() + record.message.size() + 32);
    out += std::format("{} [{}] ", ts, padded_tag(record.level()));
    if (!record.target().empty()) {
        out += record.target();
        out += ": ";
    }
    out += record.message;
    for (const auto& f : record.fields) {
        out += std::format(" {}={}", f.key, f.value);
    }
    out += '\n';
    return out;
}

std::string format_json(const LogRecord& record, const std::string& ts) {
    std::string out;
    out.reserve(record.message.size() + 128);
    out += std::format("{{\"timestamp\":\"{}\",\"level\":\"{}\"", ts, level_to_string(record.level()));
    if (!record.target().empty()) {
        out += std::format(",\"target\":\"{}\"", utils::escape_json(record.target()));
    }
    if (!record.module_path.empty()) {
        out += std::format(",\"module\":\"{}\"", utils::escape_json(record.module_path));
    }
    if (!record.file.empty()) {
        out += std::format(",\"file\":\"{}\",\"line\":{}", utils::escape_json(record.file), record.line);
    }
    out += std::format(",\"message\":\"{}\"", utils::escape_json(record.message));
    if (!record.fields.empty()) {
        out += ",\"fields\":{";
        bool first = true;
        for (const auto& f : record.fields) {
            if (!first) out += ',';
            first = false;
            out += std::format("\"{}\":\"{}\"", utils::escape_json(f.key), utils::escape_json(f.value));
        }
        out += '}';
    }
    out += "}\n";
    return out;
}

} // anonymous namespace

std::optional<LogFormat> parse_log_format(std::string_view name) {
    const auto lower = utils::to_lower(utils::trim(name));
    if (lower == "text") return LogFormat::TEXT;
    if (lower == "json") return LogFormat::JSON;
    return std::nullopt;
}

std::string format_record(const LogRecord& record, LogFormat format,
                          std::chrono::system_clock::time_point timestamp) {
    const auto ts = utils::format_timestamp(timestamp);
    return format == LogFormat::JSON ? format_json(record, ts) : format_text(record, ts);
}

} // namespace logshield
