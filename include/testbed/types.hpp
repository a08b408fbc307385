#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace testbed {

// ============================================================================
// Runtimes
// ============================================================================

enum class Runtime {
    Python,
    Node,
    Bun,
};

enum class PackageManager {
    Uv,
    Npm,
    Bun,
};

const char* runtime_name(Runtime runtime);
const char* package_manager_name(PackageManager pm);

/**
 * Static description of a supported runtime. One instance per runtime,
 * obtained from get_runtime_config() and never mutated.
 */
struct RuntimeConfig {
    Runtime runtime = Runtime::Python;
    std::string name;
    std::vector<std::string> config_files;  // markers, all required
    PackageManager package_manager = PackageManager::Uv;
    std::map<std::string, std::string> env_setup;
    std::string binary_name;
    std::string bin_path;  // project-local bin dir, relative to work
    std::vector<std::string> install_args;
};

// ============================================================================
// Test Frameworks
// ============================================================================

enum class Framework {
    Pytest,
    Unittest,
    Jest,
    Vitest,
};

const char* framework_name(Framework framework);

// Runtime family a framework runs under
bool framework_supports(Framework framework, Runtime runtime);

// ============================================================================
// Results
// ============================================================================

enum class TestStatus {
    Passed,
    Failed,
    Skipped,
    Error,
};

const char* test_status_name(TestStatus status);
std::optional<TestStatus> parse_test_status(const std::string& name);

/// Coverage percentages, each in [0, 100]
struct CoverageResult {
    double lines = 0.0;
    double statements = 0.0;
    double branches = 0.0;
    double functions = 0.0;
    std::map<std::string, double> files;  // path -> line percentage
};

struct TestCase {
    std::string name;
    TestStatus status = TestStatus::Passed;
    std::vector<std::string> output;
    std::optional<std::string> failure_message;
    std::optional<double> duration;  // seconds
    std::optional<CoverageResult> coverage;
};

struct TestSummary {
    int total = 0;
    int passed = 0;
    int failed = 0;   // failed + errored
    int skipped = 0;

    bool operator==(const TestSummary& o) const {
        return total == o.total && passed == o.passed &&
               failed == o.failed && skipped == o.skipped;
    }
};

/// The uniform result every adapter produces
struct TestRunResult {
    std::string runner;
    bool success = false;
    TestSummary summary;
    std::vector<TestCase> tests;
    std::optional<CoverageResult> coverage;
    std::optional<std::string> error;
};

// Recount a summary from a list of test cases
TestSummary summarize(const std::vector<TestCase>& tests);

// Build a failed result with an error and zeroed summary
TestRunResult make_error_result(const std::string& runner, const std::string& error);

} // namespace testbed
