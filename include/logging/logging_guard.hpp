#pragma once

#include "config/config_loader.hpp"
#include "logging/sanitizing_logger.hpp"

#include <atomic>
#include <functional>
#include <memory>

namespace logshield {

/**
 * @brief Exactly-once installation slot for the logging facade
 *
 * Uninstalled -> Installed, never back. The first install() publishes the
 * logger with release ordering; get() is a lock-free acquire load. A second
 * install() is a programmer error and throws InstallError.
 *
 * The process-wide instance (global()) is created on first use and never
 * destroyed, so log calls made during static destruction stay valid.
 * Local instances own and delete their logger.
 */
class LoggingGuard {
public:
    LoggingGuard() = default;
    ~LoggingGuard();

    LoggingGuard(const LoggingGuard&) = delete;
    LoggingGuard& operator=(const LoggingGuard&) = delete;

    /**
     * @brief Install the facade
     * @return The installed logger
     * @throws InstallError on a second call or a null logger
     */
    SanitizingLogger& install(std::unique_ptr<SanitizingLogger> logger);

    using LoggerFactory = std::function<std::unique_ptr<SanitizingLogger>()>;

    /**
     * @brief Claim the slot, then build the facade and install it
     *
     * make() runs only for the caller that wins the claim, so racing callers
     * never construct a second sink tree. If make() throws or returns null
     * the claim is released and the error propagates.
     * @throws InstallError when already claimed or make() returns null
     */
    SanitizingLogger& install_with(const LoggerFactory& make);

    /// Installed logger, or nullptr before installation
    [[nodiscard]] SanitizingLogger* get() const {
        return slot_.load(std::memory_order_acquire);
    }

    [[nodiscard]] bool installed() const { return get() != nullptr; }

    [[nodiscard]] static LoggingGuard& global();

private:
    SanitizingLogger& publish(std::unique_ptr<SanitizingLogger> logger);

    std::atomic<bool> claimed_{false};
    std::atomic<SanitizingLogger*> slot_{nullptr};
};

/**
 * @brief Build the rule set, sinks and facade from config and install it
 *        in LoggingGuard::global()
 *
 * Call once at program start.
 * @throws InstallError when already initialized or a sink cannot be created
 */
SanitizingLogger& init_logging(const LoggingConfig& config);

} // namespace logshield
