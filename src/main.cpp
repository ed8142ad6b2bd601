#include "config/config_loader.hpp"
#include "core/secure_wipe.hpp"
#include "logging/log.hpp"
#include "logging/logging_guard.hpp"

#include <cstdint>
#include <cstdlib>
#include <format>
#include <iostream>
#include <string>
#include <string_view>

using namespace logshield;

namespace {

void print_usage(const char* prog) {
    std::cerr << std::format(
        "Usage: {} [config.toml]\n"
        "Reads lines from stdin and writes them to stdout with secrets redacted.\n"
        "Diagnostics go to the configured log sinks ({} overrides the level).\n",
        prog, kLogEnvVar);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        if (argc > 2) {
            print_usage(argv[0]);
            return 1;
        }
        if (argc == 2) {
            const std::string_view arg = argv[1];
            if (arg == "-h" || arg == "--help") {
                print_usage(argv[0]);
                return 0;
            }
        }

        // Configuration
        auto config_result = argc == 2
            ? ConfigLoader::load_from_file(argv[1])
            : ConfigLoader::load_defaults();
        if (!config_result.success) {
            log::error(config_result.error_message, "config");
            return 1;
        }

        auto& logger = init_logging(config_result.config);
        log::info(std::format("logshield started: {} rules, level {}, sink {}",
                              logger.sanitizer().rule_count(),
                              config_result.config.filter.to_string(),
                              logger.sink().name()));

        std::string line;
        uint64_t lines = 0;
        while (std::getline(std::cin, line)) {
            std::cout << logger.sanitizer().sanitize(line) << '\n';
            ++lines;
        }
        secure_wipe(line);
        std::cout.flush();

        log::debug(std::format("processed {} lines", lines));
        logger.flush();
        return 0;

    } catch (const InstallError& e) {
        log::error(std::format("Logging setup failed: {}", e.what()));
        return 1;
    } catch (const std::exception& e) {
        log::error(std::format("Fatal error: {}", e.what()));
        return 1;
    }
}
