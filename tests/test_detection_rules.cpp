#include <catch2/catch_test_macros.hpp>
#include "redact/detection_rule.hpp"
#include "redact/sanitizer.hpp"

#include <algorithm>
#include <regex>
#include <stdexcept>
#include <string>
#include <vector>

using namespace logshield;

// ============================================================================
// Default Rule Set
// ============================================================================

TEST_CASE("DetectionRules: default order", "[rules]") {
    const auto& specs = default_rule_specs();

    std::vector<std::string> names;
    for (const auto& spec : specs) {
        names.emplace_back(spec.name);
    }

    const std::vector<std::string> expected = {
        "cli_flag",
        "key_value",
        "jwt",
        "uuid",
        "posix_users_home",
        "posix_home",
        "windows_user_profile",
        "base64_blob",
    };
    CHECK(names == expected);
}

TEST_CASE("DetectionRules: strategies are explicit per rule", "[rules]") {
    const auto& specs = default_rule_specs();
    REQUIRE(specs.size() == 8);

    CHECK(specs[0].strategy == RedactionStrategy::FULL);
    CHECK(specs[1].strategy == RedactionStrategy::KEY_VALUE);
    CHECK(specs[2].strategy == RedactionStrategy::FULL);
    CHECK(specs[3].strategy == RedactionStrategy::FULL);
    CHECK(specs[4].strategy == RedactionStrategy::PATH_USER);
    CHECK(specs[5].strategy == RedactionStrategy::PATH_USER);
    CHECK(specs[6].strategy == RedactionStrategy::PATH_USER);
    CHECK(specs[7].strategy == RedactionStrategy::FULL);
}

TEST_CASE("DetectionRules: key/value and windows paths ignore case", "[rules]") {
    const auto& specs = default_rule_specs();
    CHECK(specs[1].icase);
    CHECK(specs[6].icase);
    CHECK_FALSE(specs[0].icase);
    CHECK_FALSE(specs[7].icase);
}

TEST_CASE("DetectionRules: compile preserves order", "[rules]") {
    const auto rules = compile_rules(default_rule_specs());
    REQUIRE(rules.size() == default_rule_specs().size());
    for (size_t i = 0; i < rules.size(); ++i) {
        CHECK(rules[i].name() == default_rule_specs()[i].name);
        CHECK(rules[i].strategy() == default_rule_specs()[i].strategy);
    }
}

// ============================================================================
// Construction Errors
// ============================================================================

TEST_CASE("DetectionRules: malformed pattern throws regex_error", "[rules][error]") {
    const RuleSpec spec{"broken", "(unclosed", false, RedactionStrategy::FULL};
    CHECK_THROWS_AS(DetectionRule(spec), std::regex_error);
}

TEST_CASE("DetectionRules: KEY_VALUE without capture group is rejected", "[rules][error]") {
    const RuleSpec spec{"no_group", "token=\\S+", false, RedactionStrategy::KEY_VALUE};
    CHECK_THROWS_AS(DetectionRule(spec), std::invalid_argument);
}

TEST_CASE("DetectionRules: PATH_USER without capture group is rejected", "[rules][error]") {
    const RuleSpec spec{"no_group", "/home/[^/]+/", false, RedactionStrategy::PATH_USER};
    CHECK_THROWS_AS(DetectionRule(spec), std::invalid_argument);
}

TEST_CASE("DetectionRules: FULL needs no capture group", "[rules]") {
    const RuleSpec spec{"digits", "\\d{4,}", false, RedactionStrategy::FULL};
    CHECK_NOTHROW(DetectionRule(spec));
}

// ============================================================================
// Order Effects
// ============================================================================

TEST_CASE("DetectionRules: flags run before key/value", "[rules][order]") {
    Sanitizer sanitizer;
    // key/value alone would leave "--token=<REDACTED>"
    CHECK(sanitizer.sanitize("--token=abc123") == "<REDACTED>");
    CHECK(sanitizer.sanitize("login --secret hunter2 now") == "login <REDACTED> now");
}

TEST_CASE("DetectionRules: paths run before the blob rule", "[rules][order]") {
    Sanitizer sanitizer;
    // The whole path is base64 alphabet and long enough to be a blob
    CHECK(sanitizer.sanitize("/home/averyveryverylongusername/documents") ==
          "/home/<USER>/documents");
}

TEST_CASE("DetectionRules: reordered rules change the outcome", "[rules][order]") {
    // Blob first: the path is swallowed before the home rule sees it
    auto specs = default_rule_specs();
    std::rotate(specs.rbegin(), specs.rbegin() + 1, specs.rend());
    REQUIRE(specs.front().name == "base64_blob");

    Sanitizer reordered(compile_rules(specs));
    CHECK(reordered.sanitize("/home/averyveryverylongusername/documents") == "<REDACTED>");
}

TEST_CASE("DetectionRules: custom rule set", "[rules]") {
    const std::vector<RuleSpec> specs = {
        {"pin", R"(pin=(\d+))", false, RedactionStrategy::FULL},
        {"user", R"((user):\w+)", false, RedactionStrategy::KEY_VALUE},
    };
    Sanitizer sanitizer(compile_rules(specs));

    CHECK(sanitizer.rule_count() == 2);
    CHECK(sanitizer.sanitize("pin=1234 ok") == "<REDACTED> ok");
    CHECK(sanitizer.sanitize("user:alice logged in") == "user=<REDACTED> logged in");
}
