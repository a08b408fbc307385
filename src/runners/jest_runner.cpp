#include "testbed/coverage.hpp"
#include "testbed/environment.hpp"
#include "testbed/platform.hpp"
#include "testbed/process.hpp"
#include "testbed/runners.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

namespace testbed {

namespace {

std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.is_object() && j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

std::string relative_to(const std::string& path, const std::string& root) {
    if (root.empty() || path.rfind(root, 0) != 0) return path;
    std::string rel = path.substr(root.size());
    while (!rel.empty() && rel[0] == '/') rel.erase(0, 1);
    return rel.empty() ? path : rel;
}

TestStatus map_status(const std::string& status) {
    if (status == "passed") return TestStatus::Passed;
    if (status == "failed") return TestStatus::Failed;
    if (status == "pending" || status == "skipped" || status == "todo" ||
        status == "disabled" || status == "focused") {
        return TestStatus::Skipped;
    }
    return TestStatus::Error;
}

std::string full_name(const nlohmann::json& assertion) {
    if (auto full = get_string(assertion, "fullName")) return *full;

    std::string name;
    if (assertion.contains("ancestorTitles") && assertion["ancestorTitles"].is_array()) {
        for (const auto& a : assertion["ancestorTitles"]) {
            if (!a.is_string()) continue;
            name += a.get<std::string>() + " ";
        }
    }
    return name + get_string(assertion, "title").value_or("");
}

} // namespace

ParsedTests parse_jest_report(const std::string& json, const std::string& root) {
    ParsedTests parsed;

    nlohmann::json report;
    try {
        report = nlohmann::json::parse(json);
    } catch (const nlohmann::json::parse_error& e) {
        parsed.error = std::string("invalid JSON report: ") + e.what();
        return parsed;
    }

    if (!report.is_object() || !report.contains("testResults") ||
        !report["testResults"].is_array()) {
        parsed.error = "report has no \"testResults\" array";
        return parsed;
    }

    for (const auto& file : report["testResults"]) {
        if (!file.is_object()) continue;
        std::string file_name = relative_to(get_string(file, "name").value_or(""), root);

        bool has_assertions = file.contains("assertionResults") &&
                              file["assertionResults"].is_array() &&
                              !file["assertionResults"].empty();

        // A suite that failed to load reports no assertions, only a message
        if (!has_assertions) {
            auto message = get_string(file, "message").value_or("");
            if (get_string(file, "status").value_or("") == "failed" || !message.empty()) {
                TestCase tc;
                tc.name = file_name;
                tc.status = TestStatus::Error;
                if (!message.empty()) tc.failure_message = message;
                parsed.tests.push_back(std::move(tc));
            }
            continue;
        }

        for (const auto& a : file["assertionResults"]) {
            if (!a.is_object()) continue;

            TestCase tc;
            tc.name = file_name.empty() ? full_name(a) : file_name + "::" + full_name(a);
            tc.status = map_status(get_string(a, "status").value_or("failed"));

            if (a.contains("duration") && a["duration"].is_number()) {
                tc.duration = a["duration"].get<double>() / 1000.0;
            }

            if (a.contains("failureMessages") && a["failureMessages"].is_array()) {
                std::string message;
                for (const auto& m : a["failureMessages"]) {
                    if (!m.is_string()) continue;
                    if (!message.empty()) message += "\n";
                    message += m.get<std::string>();
                }
                if (!message.empty()) tc.failure_message = message;
            }

            parsed.tests.push_back(std::move(tc));
        }
    }

    parsed.no_tests = parsed.tests.empty();
    parsed.ok = true;
    return parsed;
}

TestRunResult JestRunner::run(const RunConfig& config) {
    if (!locate(config, "jest")) {
        return tool_missing("jest");
    }

    const auto& sandbox = config.env.sandbox;
    std::string coverage_dir = scratch_path(config, "jest-coverage", "");

    std::vector<std::string> args = {"jest", "--json", "--passWithNoTests", "--ci"};
    if (config.collect_coverage) {
        args.push_back("--coverage");
        args.push_back("--coverageReporters=json-summary");
        args.push_back("--coverageDirectory=" + coverage_dir);
    }
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
                spdlog::warn("ignoring jest coverage: {}", cov.error);
            }
        }
        remove_directory(coverage_dir);
    }

    finalize(result, out.exit_code == 0);
    return result;
}

} // namespace testbed
