#pragma once

#include "logging/log_filter.hpp"
#include "logging/log_format.hpp"
#include "logging/log_sink.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>

namespace logshield {

/**
 * @brief File-based log sink with size and time-based rotation
 *
 * Appends one formatted line per record. Supports automatic rotation based
 * on file size and/or time interval. Rotated files are named with numeric
 * suffixes: app.log.1, app.log.2, etc. Oldest files beyond max_files are
 * deleted.
 *
 * Writes are serialized by an internal mutex. A failed write is counted and
 * dropped; the record is never kept for a retry.
 */
class FileSink : public ILogSink {
public:
    struct Config {
        std::string path = "logshield.log";
        size_t max_file_size_bytes = 10ULL * 1024 * 1024;  // 10MB
        int max_files = 5;
        std::chrono::hours rotation_interval{24};
        bool time_based_rotation = true;
        bool size_based_rotation = true;
        LogFilter filter;
        LogFormat format = LogFormat::TEXT;
    };

    /// Throws std::runtime_error when the file cannot be opened
    explicit FileSink(Config config);
    ~FileSink() override;

    [[nodiscard]] bool enabled(const LogMetadata& metadata) const override;
    void write(const LogRecord& record) override;
    void flush() override;
    [[nodiscard]] LevelFilter max_level() const override;
    [[nodiscard]] std::string name() const override;

    /// Close the file; later writes are counted as failures
    void shutdown();

    /// Number of rotations performed (for stats/testing)
    [[nodiscard]] size_t rotation_count() const;

    /// Current file size in bytes
    [[nodiscard]] size_t current_file_size() const;

    /// Records that could not be written
    [[nodiscard]] uint64_t write_failures() const;

private:
    [[nodiscard]] std::string rotated_path(int index) const;
    [[nodiscard]] bool rotation_due() const;

    /// Shift generations and reopen; false (failure counted) when the reopen fails
    bool rotate();

    Config config_;
    mutable std::mutex mutex_;
    std::ofstream file_stream_;
    size_t current_file_size_ = 0;
    size_t rotation_count_ = 0;
    uint64_t write_failures_ = 0;
    std::chrono::system_clock::time_point last_rotation_time_;
};

} // namespace logshield
