#include "testbed/coverage.hpp"
#include "testbed/environment.hpp"
#include "testbed/platform.hpp"
#include "testbed/process.hpp"
#include "testbed/runners.hpp"

#include <spdlog/spdlog.h>

namespace testbed {

TestRunResult VitestRunner::run(const RunConfig& config) {
    if (!locate(config, "vitest")) {
        return tool_missing("vitest");
    }

    const auto& sandbox = config.env.sandbox;
    std::string coverage_dir = scratch_path(config, "vitest-coverage", "");

    std::vector<std::string> args = {"vitest", "run", "--reporter=json", "--passWithNoTests"};
    if (config.collect_coverage) {
        args.push_back("--coverage.enabled=true");
        args.push_back("--coverage.reporter=json-summary");
        args.push_back("--coverage.reportsDirectory=" + coverage_dir);
    }
    // Positional arguments are path filters
    for (const auto& dir : config.test_dirs) {
        if (dir != ".") args.push_back(dir);
    }

    std::string command = shell_join(args);
    auto run = run_sandboxed_command(sandbox, command, {{"CI", "true"}}, config.timeout);
    if (run.isErr()) {
        return make_error_result(framework_name(framework()), run.error().message());
    }

    const auto& out = run.value();
    if (out.timed_out || !ran(out.exit_code)) {
        remove_directory(coverage_dir);
        return execution_failed(out, command);
    }

    TestRunResult result;
    auto json = extract_json_object(out.stdout_data);
    if (!json) {
        result.error = "Failed to parse test output: no JSON report on stdout";
    } else {
        auto parsed = parse_jest_report(*json, sandbox.work_dir);
        if (parsed.ok) {
            result.tests = std::move(parsed.tests);
        } else {
            result.error = "Failed to parse test output: " + parsed.error;
        }
    }

    if (config.collect_coverage) {
        if (auto summary = read_file(join_path(coverage_dir, "coverage-summary.json"))) {
            auto cov = parse_istanbul_summary(*summary, sandbox.work_dir);
            if (cov.ok) {
                result.coverage = cov.coverage;
            } else {
                spdlog::warn("ignoring vitest coverage: {}", cov.error);
            }
        }
        remove_directory(coverage_dir);
    }

    finalize(result, out.exit_code == 0);
    return result;
}

} // namespace testbed
