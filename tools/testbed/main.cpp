/**
 * testbed CLI - Entry Point
 *
 * Provision a disposable environment for a project, run its tests and
 * report one normalized result.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

// Forward declarations for commands
namespace testbed::cli::commands {
    void setup_test(CLI::App* app, GlobalOptions& opts);
    void setup_detect(CLI::App* app, GlobalOptions& opts);
    void setup_fetch(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace testbed::cli;

    CLI::App app{"testbed - run a project's tests in a disposable environment"};
    app.set_version_flag("-V,--version", TESTBED_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_option("--config", opts.config, "Configuration file");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Detailed progress");
    app.add_flag("-q,--quiet", opts.quiet, "Minimal output");

    // Commands
    auto* test_cmd = app.add_subcommand("test", "Provision a project and run its tests");
    commands::setup_test(test_cmd, opts);

    auto* detect_cmd = app.add_subcommand("detect", "Show the runtime and test frameworks of a project");
    commands::setup_detect(detect_cmd, opts);

    auto* fetch_cmd = app.add_subcommand("fetch", "Download and verify a runtime binary");
    commands::setup_fetch(fetch_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
