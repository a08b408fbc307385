/**
 * testbed CLI - test command
 *
 * Create an environment, run every detected framework, print the
 * Unified Result and clean up.
 */

#include "../common.hpp"
#include <testbed/environment.hpp>
#include <testbed/report.hpp>
#include <CLI/CLI.hpp>

namespace testbed::cli::commands {

namespace {

struct TestOptions {
    std::string source;
    std::string branch;
    bool coverage = false;
    bool keep = false;
};

int cmd_test(const GlobalOptions& opts, const TestOptions& test_opts) {
    auto config = load_cli_config(opts);
    if (!config) {
        return kExitEnvironmentError;
    }
    if (test_opts.coverage) {
        config->coverage = true;
    }

    EnvironmentStore store;
    EnvironmentManager manager(store, *config);

    auto created = manager.create(test_opts.source,
        test_opts.branch.empty() ? std::nullopt : std::make_optional(test_opts.branch));
    if (created.isErr()) {
        print_error(created.error().toString(), opts.json);
        return kExitEnvironmentError;
    }

    auto env = created.value();
    if (!opts.json && !opts.quiet) {
        std::cerr << "Environment " << env->id << " (" << env->runtime_config.name
                  << ") at " << env->sandbox.work_dir << std::endl;
    }

    auto result = manager.run_tests(*env);

    if (opts.json) {
        output_json(result_to_json(result));
    } else {
        std::cout << format_result_text(result, opts.verbose);
    }

    if (test_opts.keep) {
        // Leave the sandbox on disk for inspection
        store.remove(env->id);
        if (!opts.quiet) {
            std::cerr << "Kept " << env->sandbox.root << std::endl;
        }
    } else {
        auto removed = manager.cleanup(env->id);
        if (removed.isErr()) {
            std::cerr << "Warning: " << removed.error().message() << std::endl;
        }
    }

    return result.success ? kExitOk : kExitTestsFailed;
}

} // anonymous namespace

void setup_test(CLI::App* app, GlobalOptions& opts) {
    static TestOptions test_opts;

    app->add_option("source", test_opts.source,
                    "Local project directory or GitHub repository (owner/repo or URL)")->required();
    app->add_option("--branch", test_opts.branch, "Branch to clone");
    app->add_flag("--coverage", test_opts.coverage, "Collect coverage");
    app->add_flag("--keep", test_opts.keep, "Do not remove the environment afterwards");

    app->callback([&opts]() {
        std::exit(cmd_test(opts, test_opts));
    });
}

} // namespace testbed::cli::commands
