#include "testbed/aggregate.hpp"
#include "testbed/coverage.hpp"
#include "testbed/environment.hpp"
#include "testbed/platform.hpp"
#include "testbed/process.hpp"
#include "testbed/runners.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <cstdio>
#include <sstream>

namespace testbed {

namespace {

std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.is_object() && j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

// longrepr is a string, or a dict for some plugins
std::optional<std::string> longrepr(const nlohmann::json& stage) {
    if (!stage.is_object() || !stage.contains("longrepr")) return std::nullopt;
    const auto& l = stage["longrepr"];
    if (l.is_string()) return l.get<std::string>();
    if (!l.is_null()) return l.dump();
    return std::nullopt;
}

TestStatus map_outcome(const std::string& outcome) {
    if (outcome == "passed" || outcome == "xpassed") return TestStatus::Passed;
    if (outcome == "skipped" || outcome == "xfailed") return TestStatus::Skipped;
    if (outcome == "error") return TestStatus::Error;
    return TestStatus::Failed;
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream ss(text);
    std::string line;
    while (std::getline(ss, line)) lines.push_back(line);
    return lines;
}

} // namespace

ParsedTests parse_pytest_report(const std::string& json) {
    ParsedTests parsed;

    nlohmann::json report;
    try {
        report = nlohmann::json::parse(json);
    } catch (const nlohmann::json::parse_error& e) {
        parsed.error = std::string("invalid pytest report: ") + e.what();
        return parsed;
    }

    if (!report.is_object() || !report.contains("tests") || !report["tests"].is_array()) {
        parsed.error = "pytest report has no \"tests\" array";
        return parsed;
    }

    // Collection errors never reach "tests"
    if (report.contains("collectors") && report["collectors"].is_array()) {
        for (const auto& c : report["collectors"]) {
            if (get_string(c, "outcome").value_or("passed") != "failed") continue;
            TestCase tc;
            tc.name = get_string(c, "nodeid").value_or("<collection>");
            tc.status = TestStatus::Error;
            tc.failure_message = longrepr(c);
            parsed.tests.push_back(std::move(tc));
        }
    }

    for (const auto& t : report["tests"]) {
        if (!t.is_object()) continue;

        TestCase tc;
        tc.name = get_string(t, "nodeid").value_or("");
        tc.status = map_outcome(get_string(t, "outcome").value_or("failed"));

        double duration = 0.0;
        bool has_duration = false;
        for (const char* stage : {"setup", "call", "teardown"}) {
            if (!t.contains(stage) || !t[stage].is_object()) continue;
            const auto& s = t[stage];
            if (s.contains("duration") && s["duration"].is_number()) {
                duration += s["duration"].get<double>();
                has_duration = true;
            }
            if (!tc.failure_message && tc.status != TestStatus::Passed) {
                tc.failure_message = longrepr(s);
            }
            if (auto out = get_string(s, "stdout")) {
                for (auto& line : split_lines(*out)) tc.output.push_back(std::move(line));
            }
        }
        if (has_duration) tc.duration = duration;

        parsed.tests.push_back(std::move(tc));
    }

    parsed.no_tests = parsed.tests.empty();
    parsed.ok = true;
    return parsed;
}

TestRunResult PytestRunner::run(const RunConfig& config) {
    if (!locate(config, "pytest")) {
        return tool_missing("pytest");
    }

    std::vector<std::string> dirs = config.test_dirs;
    if (dirs.empty()) dirs.push_back(".");

    std::vector<TestRunResult> per_dir;
    for (const auto& dir : dirs) {
        std::string report_path = scratch_path(config, "pytest-report", ".json");
        std::string coverage_path = scratch_path(config, "pytest-coverage", ".json");

        std::vector<std::string> args = {
            "pytest", "-vv", "--no-header", "-p", "no:cacheprovider",
            "--json-report", "--json-report-file=" + report_path,
        };
        if (config.collect_coverage) {
            args.push_back("--cov=.");
            args.push_back("--cov-report=json:" + coverage_path);
        }
        args.push_back(dir);

        std::string command = shell_join(args);
        auto run = run_sandboxed_command(config.env.sandbox, command, {}, config.timeout);
        if (run.isErr()) {
            per_dir.push_back(make_error_result(framework_name(framework()),
                                                run.error().message()));
            continue;
        }

        const auto& out = run.value();
        if (out.timed_out || !ran(out.exit_code)) {
            per_dir.push_back(execution_failed(out, command));
            std::remove(report_path.c_str());
            std::remove(coverage_path.c_str());
            continue;
        }

        TestRunResult result;
        auto report = read_file(report_path);
        if (!report && out.exit_code == 5) {
            // Nothing collected and no report written
        } else if (!report) {
            result.error = "pytest did not write a JSON report for " + dir +
                           " (is pytest-json-report installed?)";
        } else {
            auto parsed = parse_pytest_report(*report);
            if (parsed.ok) {
                result.tests = std::move(parsed.tests);
            } else {
                result.error = "Failed to parse test output for " + dir + ": " + parsed.error;
            }
        }

        if (config.collect_coverage) {
            if (auto cov = read_file(coverage_path)) {
                auto parsed = parse_coverage_py(*cov);
                if (parsed.ok) {
                    result.coverage = parsed.coverage;
                } else {
                    spdlog::warn("ignoring coverage for {}: {}", dir, parsed.error);
                }
            }
        }

        std::remove(report_path.c_str());
        std::remove(coverage_path.c_str());

        finalize(result, out.exit_code == 0 || out.exit_code == 5);
        per_dir.push_back(std::move(result));
    }

    auto merged = aggregate_results(per_dir);
    merged.runner = framework_name(framework());
    return merged;
}

} // namespace testbed
