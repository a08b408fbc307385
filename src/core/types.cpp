#include "testbed/types.hpp"

namespace testbed {

const char* runtime_name(Runtime runtime) {
    switch (runtime) {
        case Runtime::Python: return "python";
        case Runtime::Node: return "node";
        case Runtime::Bun: return "bun";
    }
    return "unknown";
}

const char* package_manager_name(PackageManager pm) {
    switch (pm) {
        case PackageManager::Uv: return "uv";
        case PackageManager::Npm: return "npm";
        case PackageManager::Bun: return "bun";
    }
    return "unknown";
}

const char* framework_name(Framework framework) {
    switch (framework) {
        case Framework::Pytest: return "pytest";
        case Framework::Unittest: return "unittest";
        case Framework::Jest: return "jest";
        case Framework::Vitest: return "vitest";
    }
    return "unknown";
}

bool framework_supports(Framework framework, Runtime runtime) {
    switch (framework) {
        case Framework::Pytest:
        case Framework::Unittest:
            return runtime == Runtime::Python;
        case Framework::Jest:
        case Framework::Vitest:
            return runtime == Runtime::Node || runtime == Runtime::Bun;
    }
    return false;
}

const char* test_status_name(TestStatus status) {
    switch (status) {
        case TestStatus::Passed: return "passed";
        case TestStatus::Failed: return "failed";
        case TestStatus::Skipped: return "skipped";
        case TestStatus::Error: return "error";
    }
    return "error";
}

std::optional<TestStatus> parse_test_status(const std::string& name) {
    if (name == "passed" || name == "pass" || name == "ok") return TestStatus::Passed;
    if (name == "failed" || name == "fail") return TestStatus::Failed;
    if (name == "skipped" || name == "skip" || name == "pending" || name == "todo" ||
        name == "disabled" || name == "xfailed") {
        return TestStatus::Skipped;
    }
    if (name == "error") return TestStatus::Error;
    return std::nullopt;
}

TestSummary summarize(const std::vector<TestCase>& tests) {
    TestSummary s;
    for (const auto& t : tests) {
        switch (t.status) {
            case TestStatus::Passed: s.passed++; break;
            case TestStatus::Skipped: s.skipped++; break;
            case TestStatus::Failed:
            case TestStatus::Error: s.failed++; break;
        }
    }
    s.total = s.passed + s.failed + s.skipped;
    return s;
}

TestRunResult make_error_result(const std::string& runner, const std::string& error) {
    TestRunResult r;
    r.runner = runner;
    r.success = false;
    r.error = error;
    return r;
}

} // namespace testbed
