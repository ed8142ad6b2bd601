#pragma once

#include "logging/log_sink.hpp"

#include <memory>
#include <string>
#include <vector>

namespace logshield {

/**
 * @brief Fan-out sink: forwards each record to every child that accepts it
 *
 * The child list is fixed at construction.
 */
class MultiSink : public ILogSink {
public:
    explicit MultiSink(std::vector<std::unique_ptr<ILogSink>> sinks);

    /// True when at least one child accepts the metadata
    [[nodiscard]] bool enabled(const LogMetadata& metadata) const override;
    void write(const LogRecord& record) override;
    void flush() override;
    [[nodiscard]] LevelFilter max_level() const override;
    [[nodiscard]] std::string name() const override;

    [[nodiscard]] size_t size() const { return sinks_.size(); }

private:
    std::vector<std::unique_ptr<ILogSink>> sinks_;
};

} // namespace logshield
