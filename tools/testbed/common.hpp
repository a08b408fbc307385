/**
 * testbed CLI - Common utilities and types
 */

#pragma once

#include <testbed/config.hpp>
#include <testbed/logging.hpp>
#include <testbed/report.hpp>
#include <testbed/result.hpp>

#include <nlohmann/json.hpp>
#include <iostream>
#include <optional>
#include <string>

namespace testbed::cli {

// Process exit codes
constexpr int kExitOk = 0;
constexpr int kExitTestsFailed = 1;
constexpr int kExitEnvironmentError = 2;

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string config;            // --config
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

/**
 * Output utilities.
 */
inline void print_error(const std::string& msg, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["success"] = false;
        j["error"] = msg;
        std::cout << dump_json(j) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void output_json(const nlohmann::json& j) {
    std::cout << dump_json(j) << std::endl;
}

/**
 * Load configuration and start logging. -v/-q win over the configured
 * level; TESTBED_LOG_LEVEL wins over both.
 */
inline std::optional<TestbedConfig> load_cli_config(const GlobalOptions& opts) {
    init_logging(opts.verbose ? "debug" : "warn");

    auto config = load_config(opts.config.empty() ? std::nullopt
                                                  : std::make_optional(opts.config));
    if (config.isErr()) {
        print_error(config.error().message(), opts.json);
        return std::nullopt;
    }

    std::string level = config.value().log_level;
    if (opts.verbose) {
        level = "debug";
    } else if (opts.quiet) {
        level = "error";
    }
    init_logging(level);
    return config.value();
}

} // namespace testbed::cli
