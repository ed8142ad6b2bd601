#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace logshield {

/**
 * @brief Error categories for recoverable construction paths
 */
enum class ErrorCategory {
    NONE,
    CONFIG_ERROR,
    FILTER_ERROR,
    SINK_ERROR,
    INTERNAL_ERROR
};

inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:           return "NONE";
        case ErrorCategory::CONFIG_ERROR:   return "CONFIG_ERROR";
        case ErrorCategory::FILTER_ERROR:   return "FILTER_ERROR";
        case ErrorCategory::SINK_ERROR:     return "SINK_ERROR";
        case ErrorCategory::INTERNAL_ERROR: return "INTERNAL_ERROR";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Result type for operations that can fail
 */
template<typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.success_ = true;
        r.value_ = std::move(value);
        return r;
    }

    static Result error(ErrorCategory category, std::string message) {
        Result r;
        r.success_ = false;
        r.error_category_ = category;
        r.error_message_ = std::move(message);
        return r;
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorCategory error_category() const { return error_category_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
};

/**
 * @brief Startup failure of the process-wide logging facade.
 *
 * Raised on a second installation or when the backend cannot be built.
 * Not meant to be recovered from: logging must not continue unsanitized.
 */
class InstallError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

} // namespace logshield
