/**
 * testbed CLI - detect command
 *
 * Report the runtime, test directories and frameworks of a local project
 * without installing anything.
 */

#include "../common.hpp"
#include <testbed/frameworks.hpp>
#include <testbed/platform.hpp>
#include <testbed/runtime.hpp>
#include <CLI/CLI.hpp>

namespace testbed::cli::commands {

namespace {

struct DetectOptions {
    std::string path;
};

int cmd_detect(const GlobalOptions& opts, const DetectOptions& detect_opts) {
    if (!load_cli_config(opts)) {
        return kExitEnvironmentError;
    }

    auto runtime = detect_runtime(detect_opts.path);
    if (runtime.isErr()) {
        print_error(runtime.error().message(), opts.json);
        return kExitEnvironmentError;
    }

    const auto& rt = runtime.value();
    auto test_dirs = find_test_dirs(detect_opts.path, rt.runtime);
    auto frameworks = detect_frameworks(detect_opts.path, rt.runtime);

    if (opts.json) {
        nlohmann::json j;
        j["success"] = true;
        j["runtime"] = rt.name;
        j["package_manager"] = package_manager_name(rt.package_manager);
        j["test_dirs"] = test_dirs;
        j["frameworks"] = nlohmann::json::array();
        for (auto f : frameworks) {
            j["frameworks"].push_back(framework_name(f));
        }
        output_json(j);
        return kExitOk;
    }

    std::cout << "Runtime: " << rt.name << " (" << package_manager_name(rt.package_manager) << ")"
              << std::endl;
    std::cout << "Test directories:";
    if (test_dirs.empty()) std::cout << " (none)";
    std::cout << std::endl;
    for (const auto& dir : test_dirs) {
        std::cout << "  " << dir << std::endl;
    }
    std::cout << "Frameworks:";
    if (frameworks.empty()) std::cout << " (none)";
    for (auto f : frameworks) {
        std::cout << " " << framework_name(f);
    }
    std::cout << std::endl;
    return kExitOk;
}

} // anonymous namespace

void setup_detect(CLI::App* app, GlobalOptions& opts) {
    static DetectOptions detect_opts;

    app->add_option("path", detect_opts.path, "Project directory")->required();

    app->callback([&opts]() {
        std::exit(cmd_detect(opts, detect_opts));
    });
}

} // namespace testbed::cli::commands
