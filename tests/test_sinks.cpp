#include <catch2/catch_test_macros.hpp>
#include "logging/console_sink.hpp"
#include "logging/multi_sink.hpp"
#include "logging/sink_factory.hpp"
#include "logging/syslog_sink.hpp"
#include "mocks/mock_log_sink.hpp"

#include <filesystem>
#include <sstream>
#include <syslog.h>

using namespace logshield;
using logshield::testing::MockLogSink;

namespace {

LogRecord make_record(Level level, std::string_view message, std::string_view target = "") {
    LogRecord record;
    record.metadata = {level, target};
    record.message = message;
    return record;
}

} // anonymous namespace

// ============================================================================
// ConsoleSink
// ============================================================================

TEST_CASE("ConsoleSink: writes formatted line to stream", "[sink][console]") {
    std::ostringstream out;
    ConsoleSink sink(ConsoleSink::Config{}, out);

    sink.write(make_record(Level::WARN, "agent restarted", "ipc"));
    sink.flush();

    CHECK(out.str().ends_with(" [WARN ] ipc: agent restarted\n"));
    CHECK(sink.name() == "console");
}

TEST_CASE("ConsoleSink: filter decides enabled", "[sink][console]") {
    std::ostringstream out;
    auto filter = LogFilter::parse("error,updater=debug");
    REQUIRE(filter.is_ok());
    ConsoleSink sink(ConsoleSink::Config{filter.value(), LogFormat::TEXT}, out);

    CHECK(sink.enabled({Level::ERROR, "tray"}));
    CHECK_FALSE(sink.enabled({Level::WARN, "tray"}));
    CHECK(sink.enabled({Level::DEBUG, "updater"}));
    CHECK(sink.max_level() == LevelFilter::DEBUG);
}

// ============================================================================
// MultiSink
// ============================================================================

TEST_CASE("MultiSink: forwards only to children that accept the level", "[sink][multi]") {
    auto quiet = std::make_unique<MockLogSink>(LevelFilter::WARN, "quiet");
    auto verbose = std::make_unique<MockLogSink>(LevelFilter::TRACE, "verbose");
    auto* quiet_ptr = quiet.get();
    auto* verbose_ptr = verbose.get();

    std::vector<std::unique_ptr<ILogSink>> children;
    children.push_back(std::move(quiet));
    children.push_back(std::move(verbose));
    MultiSink sink(std::move(children));

    CHECK(sink.size() == 2);
    CHECK(sink.name() == "multi[quiet,verbose]");
    CHECK(sink.max_level() == LevelFilter::TRACE);
    CHECK(sink.enabled({Level::DEBUG, ""}));

    sink.write(make_record(Level::DEBUG, "detail"));
    sink.write(make_record(Level::ERROR, "failure"));
    sink.flush();

    CHECK(quiet_ptr->write_calls() == 1);
    CHECK(verbose_ptr->write_calls() == 2);
    CHECK(quiet_ptr->flush_calls() == 1);
    CHECK(verbose_ptr->flush_calls() == 1);
}

TEST_CASE("MultiSink: null children are dropped", "[sink][multi]") {
    std::vector<std::unique_ptr<ILogSink>> children;
    children.push_back(nullptr);
    children.push_back(std::make_unique<MockLogSink>());
    MultiSink sink(std::move(children));

    CHECK(sink.size() == 1);
    CHECK_NOTHROW(sink.write(make_record(Level::INFO, "ok")));
}

TEST_CASE("MultiSink: empty sink accepts nothing", "[sink][multi]") {
    MultiSink sink({});
    CHECK_FALSE(sink.enabled({Level::ERROR, ""}));
    CHECK(sink.max_level() == LevelFilter::OFF);
}

// ============================================================================
// SyslogSink
// ============================================================================

TEST_CASE("SyslogSink: level to priority", "[sink][syslog]") {
    CHECK(SyslogSink::priority_for(Level::ERROR) == LOG_ERR);
    CHECK(SyslogSink::priority_for(Level::WARN) == LOG_WARNING);
    CHECK(SyslogSink::priority_for(Level::INFO) == LOG_INFO);
    CHECK(SyslogSink::priority_for(Level::DEBUG) == LOG_DEBUG);
    CHECK(SyslogSink::priority_for(Level::TRACE) == LOG_DEBUG);
}

TEST_CASE("SyslogSink: counts records", "[sink][syslog]") {
    SyslogSink::Config cfg;
    cfg.ident = "logshield-test";
    SyslogSink sink(cfg);

    CHECK(sink.name() == "syslog:logshield-test");
    sink.write(make_record(Level::INFO, "hello from tests", "test"));
    CHECK(sink.records_written() == 1);
}

// ============================================================================
// SinkFactory
// ============================================================================

TEST_CASE("SinkFactory: console by default", "[sink][factory]") {
    LoggingConfig config;
    auto result = SinkFactory::create(config);
    REQUIRE(result.is_ok());
    CHECK(result.value()->name() == "console");
}

TEST_CASE("SinkFactory: console and file become a multi sink", "[sink][factory]") {
    const std::string path = "/tmp/logshield_test_factory.log";
    std::filesystem::remove(path);

    LoggingConfig config;
    config.file.enabled = true;
    config.file.path = path;

    auto result = SinkFactory::create(config);
    REQUIRE(result.is_ok());
    CHECK(result.value()->name() == "multi[console,file:" + path + "]");

    result.value().reset();
    std::filesystem::remove(path);
}

TEST_CASE("SinkFactory: file only", "[sink][factory]") {
    const std::string path = "/tmp/logshield_test_factory_only.log";
    std::filesystem::remove(path);

    LoggingConfig config;
    config.console = false;
    config.file.enabled = true;
    config.file.path = path;
    config.filter = LogFilter(LevelFilter::DEBUG);

    auto result = SinkFactory::create(config);
    REQUIRE(result.is_ok());
    CHECK(result.value()->name() == "file:" + path);
    CHECK(result.value()->max_level() == LevelFilter::DEBUG);

    result.value().reset();
    std::filesystem::remove(path);
}

TEST_CASE("SinkFactory: no backend falls back to console", "[sink][factory]") {
    LoggingConfig config;
    config.console = false;

    auto result = SinkFactory::create(config);
    REQUIRE(result.is_ok());
    CHECK(result.value()->name() == "console");
}

TEST_CASE("SinkFactory: unopenable file is a sink error", "[sink][factory][error]") {
    LoggingConfig config;
    config.file.enabled = true;
    config.file.path = "/dev/null/not_a_dir/app.log";

    auto result = SinkFactory::create(config);
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::SINK_ERROR);
    CHECK(result.error_message().find("/dev/null/not_a_dir/app.log") != std::string::npos);
}
