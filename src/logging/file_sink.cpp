#include "logging/file_sink.hpp"

#include <filesystem>
#include <format>
#include <stdexcept>

namespace logshield {

FileSink::FileSink(Config config)
    : config_(std::move(config)),
      last_rotation_time_(std::chrono::system_clock::now()) {
    std::error_code ec;
    const auto parent = std::filesystem::path(config_.path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
    }

    file_stream_.open(config_.path, std::ios::app);
    if (!file_stream_.is_open()) {
        throw std::runtime_error("Failed to open log file: " + config_.path);
    }

    // Determine current file size for size-based rotation
    auto file_size = std::filesystem::file_size(config_.path, ec);
    if (!ec) {
        current_file_size_ = static_cast<size_t>(file_size);
    }
}

FileSink::~FileSink() {
    shutdown();
}

bool FileSink::enabled(const LogMetadata& metadata) const {
    return config_.filter.enabled(metadata);
}

void FileSink::write(const LogRecord& record) {
    const auto line = format_record(record, config_.format);

    std::lock_guard<std::mutex> lock(mutex_);
    if (!file_stream_.is_open()) {
        ++write_failures_;
        return;
    }
    if (rotation_due() && !rotate()) {
        return;
    }
    file_stream_.write(line.data(), static_cast<std::streamsize>(line.size()));
    if (!file_stream_.good()) {
        ++write_failures_;
        file_stream_.clear();
        return;
    }
    current_file_size_ += line.size();
}

void FileSink::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    file_stream_.flush();
}

void FileSink::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_stream_.is_open()) {
        file_stream_.flush();
        file_stream_.close();
    }
}

LevelFilter FileSink::max_level() const {
    return config_.filter.max_level();
}

std::string FileSink::name() const {
    return "file:" + config_.path;
}

size_t FileSink::rotation_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rotation_count_;
}

size_t FileSink::current_file_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_file_size_;
}

uint64_t FileSink::write_failures() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return write_failures_;
}

std::string FileSink::rotated_path(int index) const {
    return std::format("{}.{}", config_.path, index);
}

bool FileSink::rotation_due() const {
    if (config_.size_based_rotation && current_file_size_ >= config_.max_file_size_bytes) {
        return true;
    }
    return config_.time_based_rotation &&
           std::chrono::system_clock::now() - last_rotation_time_ >= config_.rotation_interval;
}

bool FileSink::rotate() {
    file_stream_.flush();
    file_stream_.close();

    // path.(N-1) -> path.N ... path -> path.1; each rename replaces its target,
    // so the oldest generation falls off the end. Missing generations are skipped.
    std::error_code ec;
    for (int i = config_.max_files; i >= 1; --i) {
        const auto from = i == 1 ? config_.path : rotated_path(i - 1);
        std::filesystem::rename(from, rotated_path(i), ec);
    }

    ++rotation_count_;
    last_rotation_time_ = std::chrono::system_clock::now();
    current_file_size_ = 0;

    file_stream_.open(config_.path, std::ios::app);
    if (!file_stream_.is_open()) {
        // The pending record is lost; later writes count as failures too
        ++write_failures_;
        return false;
    }
    return true;
}

} // namespace logshield
