#include "testbed/aggregate.hpp"
#include "testbed/environment.hpp"
#include "testbed/process.hpp"
#include "testbed/runners.hpp"

#include <spdlog/spdlog.h>

#include <map>
#include <sstream>

namespace testbed {

namespace {

const std::string kStatusSeparator = " ... ";

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.rfind(prefix, 0) == 0;
}

bool is_rule(const std::string& line, char c) {
    return line.size() >= 20 && line.find_first_not_of(c) == std::string::npos;
}

// "test_add (pkg.mod.TestMath)" or "test_add (pkg.mod.TestMath.test_add)"
// -> "pkg.mod.TestMath.test_add". Anything else is returned unchanged.
std::string qualified_name(const std::string& description) {
    auto open = description.find(" (");
    if (open == std::string::npos || description.back() != ')') return description;

    std::string method = description.substr(0, open);
    std::string scope = description.substr(open + 2, description.size() - open - 3);
    if (scope.size() > method.size() &&
        scope.compare(scope.size() - method.size() - 1, method.size() + 1, "." + method) == 0) {
        return scope;
    }
    return scope + "." + method;
}

bool looks_like_test_description(const std::string& s) {
    auto open = s.find(" (");
    return open != std::string::npos && open > 0 && !s.empty() && s.back() == ')' &&
           s.find(' ') == open;
}

std::optional<TestStatus> parse_status(const std::string& text) {
    if (text == "ok") return TestStatus::Passed;
    if (text == "FAIL") return TestStatus::Failed;
    if (text == "ERROR") return TestStatus::Error;
    if (starts_with(text, "skipped")) return TestStatus::Skipped;
    if (text == "expected failure") return TestStatus::Skipped;
    if (text == "unexpected success") return TestStatus::Failed;
    return std::nullopt;
}

} // namespace

ParsedTests parse_unittest_output(const std::string& output) {
    ParsedTests parsed;

    std::vector<std::string> lines;
    {
        std::istringstream ss(output);
        std::string line;
        while (std::getline(ss, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            lines.push_back(line);
        }
    }

    std::map<std::string, size_t> index;  // qualified name -> position in tests
    std::string previous;
    std::optional<std::string> pending;   // description awaiting its status line
    std::optional<int> ran_count;
    bool no_tests_ran = false;

    for (size_t i = 0; i < lines.size(); ++i) {
        const std::string& line = lines[i];

        // Failure detail blocks: "FAIL: name (scope)" / dashes / traceback
        if ((starts_with(line, "FAIL: ") || starts_with(line, "ERROR: ")) &&
            i + 1 < lines.size() && is_rule(lines[i + 1], '-')) {
            std::string description = line.substr(line.find(": ") + 2);
            std::string body;
            size_t j = i + 2;
            for (; j < lines.size(); ++j) {
                if (is_rule(lines[j], '=')) break;
                if (is_rule(lines[j], '-') && j + 1 < lines.size() &&
                    starts_with(lines[j + 1], "Ran ")) {
                    break;
                }
                if (!body.empty()) body += "\n";
                body += lines[j];
            }
            while (!body.empty() && body.back() == '\n') body.pop_back();

            auto it = index.find(qualified_name(description));
            if (it != index.end()) {
                parsed.tests[it->second].failure_message = body;
            }
            i = j - 1;
            continue;
        }

        if (starts_with(line, "Ran ") && line.find(" test") != std::string::npos) {
            try {
                ran_count = std::stoi(line.substr(4));
            } catch (const std::exception&) {
                ran_count = std::nullopt;
            }
            continue;
        }
        if (line == "NO TESTS RAN") {
            no_tests_ran = true;
            continue;
        }

        std::string description;
        std::string status_text;

        auto sep = line.rfind(kStatusSeparator);
        if (sep != std::string::npos) {
            description = line.substr(0, sep);
            status_text = line.substr(sep + kStatusSeparator.size());
            // A docstring line follows the description on its own line
            if (!looks_like_test_description(description) &&
                looks_like_test_description(previous)) {
                description = previous;
            }
        } else if (line.size() >= kStatusSeparator.size() - 1 &&
                   line.compare(line.size() - 4, 4, " ...") == 0) {
            // Status printed later, after the test's own output
            pending = line.substr(0, line.size() - 4);
            previous = line;
            continue;
        } else if (pending && parse_status(line)) {
            description = *pending;
            status_text = line;
        } else {
            previous = line;
            continue;
        }

        auto status = parse_status(status_text);
        if (!status || !looks_like_test_description(description)) {
            previous = line;
            continue;
        }
        pending.reset();

        TestCase tc;
        tc.name = qualified_name(description);
        tc.status = *status;
        if (*status == TestStatus::Skipped && starts_with(status_text, "skipped ")) {
            tc.failure_message = status_text.substr(8);
        }
        index[tc.name] = parsed.tests.size();
        parsed.tests.push_back(std::move(tc));
        previous = line;
    }

    if (!ran_count && !no_tests_ran) {
        parsed.error = "unrecognized unittest output (no \"Ran N tests\" line)";
        return parsed;
    }

    if (ran_count && *ran_count != static_cast<int>(parsed.tests.size())) {
        spdlog::debug("unittest reported {} tests, transcript listed {}", *ran_count,
                      parsed.tests.size());
    }

    parsed.no_tests = no_tests_ran || (ran_count && *ran_count == 0);
    parsed.ok = true;
    return parsed;
}

TestRunResult UnittestRunner::run(const RunConfig& config) {
    if (!locate(config, "python")) {
        return tool_missing("python");
    }

    std::vector<std::string> dirs = config.test_dirs;
    if (dirs.empty()) dirs.push_back(".");

    std::vector<TestRunResult> per_dir;
    for (const auto& dir : dirs) {
        std::string command =
            shell_join({"python", "-m", "unittest", "discover", "-v", "-s", dir});

        auto run = run_sandboxed_command(config.env.sandbox, command, {}, config.timeout);
        if (run.isErr()) {
            per_dir.push_back(make_error_result(framework_name(framework()),
                                                run.error().message()));
            continue;
        }

        const auto& out = run.value();
        if (out.timed_out || !ran(out.exit_code)) {
            per_dir.push_back(execution_failed(out, command));
            continue;
        }

        TestRunResult result;
        auto parsed = parse_unittest_output(out.stderr_data);
        if (parsed.ok) {
            result.tests = std::move(parsed.tests);
        } else {
            result.error = "Failed to parse test output for " + dir + ": " + parsed.error;
        }

        finalize(result, out.exit_code == 0 || out.exit_code == 5);
        per_dir.push_back(std::move(result));
    }

    auto merged = aggregate_results(per_dir);
    merged.runner = framework_name(framework());
    return merged;
}

} // namespace testbed
