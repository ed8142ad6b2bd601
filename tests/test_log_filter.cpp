#include <catch2/catch_test_macros.hpp>
#include "logging/log_filter.hpp"

using namespace logshield;

TEST_CASE("LogFilter: default is info", "[filter]") {
    LogFilter filter;
    CHECK(filter.default_level() == LevelFilter::INFO);
    CHECK(filter.enabled({Level::ERROR, ""}));
    CHECK(filter.enabled({Level::INFO, "anything"}));
    CHECK_FALSE(filter.enabled({Level::DEBUG, ""}));
    CHECK(filter.max_level() == LevelFilter::INFO);
}

TEST_CASE("LogFilter: level names", "[filter]") {
    CHECK(parse_level_filter("off") == LevelFilter::OFF);
    CHECK(parse_level_filter("ERROR") == LevelFilter::ERROR);
    CHECK(parse_level_filter("warning") == LevelFilter::WARN);
    CHECK(parse_level_filter(" Debug ") == LevelFilter::DEBUG);
    CHECK(parse_level_filter("trace") == LevelFilter::TRACE);
    CHECK_FALSE(parse_level_filter("verbose").has_value());
}

TEST_CASE("LogFilter: bare level sets default", "[filter]") {
    auto result = LogFilter::parse("warn");
    REQUIRE(result.is_ok());
    const auto& filter = result.value();
    CHECK(filter.default_level() == LevelFilter::WARN);
    CHECK(filter.directives().empty());
    CHECK_FALSE(filter.enabled({Level::INFO, ""}));
    CHECK(filter.enabled({Level::WARN, ""}));
}

TEST_CASE("LogFilter: per-target directives", "[filter]") {
    auto result = LogFilter::parse("warn, updater=debug, ipc=off");
    REQUIRE(result.is_ok());
    const auto& filter = result.value();

    CHECK(filter.level_for("updater") == LevelFilter::DEBUG);
    CHECK(filter.level_for("ipc") == LevelFilter::OFF);
    CHECK(filter.level_for("tray") == LevelFilter::WARN);

    CHECK(filter.enabled({Level::DEBUG, "updater"}));
    CHECK_FALSE(filter.enabled({Level::TRACE, "updater"}));
    CHECK_FALSE(filter.enabled({Level::ERROR, "ipc"}));
    CHECK(filter.max_level() == LevelFilter::DEBUG);
}

TEST_CASE("LogFilter: sub-targets inherit directive", "[filter]") {
    auto result = LogFilter::parse("info,updater=debug,updater::download=trace");
    REQUIRE(result.is_ok());
    const auto& filter = result.value();

    CHECK(filter.level_for("updater::verify") == LevelFilter::DEBUG);
    CHECK(filter.level_for("updater::download") == LevelFilter::TRACE);
    CHECK(filter.level_for("updater::download::chunk") == LevelFilter::TRACE);
    CHECK(filter.level_for("updater.http") == LevelFilter::DEBUG);
    CHECK(filter.level_for("updater/fs") == LevelFilter::DEBUG);
    // A shared prefix alone is not a sub-target
    CHECK(filter.level_for("updaterx") == LevelFilter::INFO);
}

TEST_CASE("LogFilter: bare target enables trace", "[filter]") {
    auto result = LogFilter::parse("ipc");
    REQUIRE(result.is_ok());
    CHECK(result.value().level_for("ipc") == LevelFilter::TRACE);
    CHECK(result.value().default_level() == LevelFilter::INFO);
}

TEST_CASE("LogFilter: later directive for a target wins", "[filter]") {
    auto result = LogFilter::parse("ipc=debug,ipc=error");
    REQUIRE(result.is_ok());
    CHECK(result.value().directives().size() == 1);
    CHECK(result.value().level_for("ipc") == LevelFilter::ERROR);
}

TEST_CASE("LogFilter: empty spec keeps defaults", "[filter]") {
    auto result = LogFilter::parse(" , ");
    REQUIRE(result.is_ok());
    CHECK(result.value().default_level() == LevelFilter::INFO);
    CHECK(result.value().directives().empty());
}

TEST_CASE("LogFilter: invalid directives", "[filter][error]") {
    auto unknown = LogFilter::parse("updater=loud");
    REQUIRE(unknown.is_error());
    CHECK(unknown.error_category() == ErrorCategory::FILTER_ERROR);
    CHECK(unknown.error_message().find("loud") != std::string::npos);

    auto no_target = LogFilter::parse("=debug");
    REQUIRE(no_target.is_error());
    CHECK(no_target.error_category() == ErrorCategory::FILTER_ERROR);
}

TEST_CASE("LogFilter: canonical string", "[filter]") {
    auto result = LogFilter::parse("WARN,updater=Debug");
    REQUIRE(result.is_ok());
    CHECK(result.value().to_string() == "warn,updater=debug");
    CHECK(LogFilter(LevelFilter::OFF).to_string() == "off");
}
