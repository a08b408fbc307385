#pragma once

#include "testbed/sandbox.hpp"
#include "testbed/types.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace testbed {

struct Environment;

// ============================================================================
// Run Configuration
// ============================================================================

struct RunConfig {
    Framework framework;
    const Environment& env;
    std::vector<std::string> test_dirs;  // relative to the work directory
    bool collect_coverage = false;
    std::chrono::seconds timeout{0};
};

// ============================================================================
// Test Runner Interface
// ============================================================================

/**
 * Adapter for one test framework: builds the command line, runs it in
 * the environment's sandbox and normalizes the output.
 *
 * run() never throws for runner-side failures. A missing tool, an
 * unexpected exit code or unparseable output all come back as a result
 * with success=false and error set.
 */
class TestRunner {
public:
    virtual ~TestRunner() = default;

    virtual Framework framework() const = 0;
    virtual TestRunResult run(const RunConfig& config) = 0;

protected:
    // Find a tool on the sandbox PATH
    std::optional<std::string> locate(const RunConfig& config, const std::string& tool) const;

    TestRunResult tool_missing(const std::string& tool) const;
    TestRunResult execution_failed(const CommandResult& out, const std::string& command) const;

    // Unique path under the sandbox tmp directory
    std::string scratch_path(const RunConfig& config, const std::string& stem,
                             const std::string& ext) const;

    // Finish a result: recount the summary and derive success
    void finalize(TestRunResult& result, bool clean_exit) const;
};

std::unique_ptr<TestRunner> make_runner(Framework framework);

// ============================================================================
// Adapters
// ============================================================================

// pytest with the pytest-json-report plugin; once per test directory
class PytestRunner : public TestRunner {
public:
    Framework framework() const override { return Framework::Pytest; }
    TestRunResult run(const RunConfig& config) override;

    // 0 passed, 1 failures, 5 nothing collected
    static bool ran(int exit_code) { return exit_code == 0 || exit_code == 1 || exit_code == 5; }
};

// python -m unittest discover, parsed from the verbose transcript
class UnittestRunner : public TestRunner {
public:
    Framework framework() const override { return Framework::Unittest; }
    TestRunResult run(const RunConfig& config) override;

    // 5 is "NO TESTS RAN" on Python 3.12+
    static bool ran(int exit_code) { return exit_code == 0 || exit_code == 1 || exit_code == 5; }
};

class JestRunner : public TestRunner {
public:
    Framework framework() const override { return Framework::Jest; }
    TestRunResult run(const RunConfig& config) override;

    static bool ran(int exit_code) { return exit_code == 0 || exit_code == 1; }
};

class VitestRunner : public TestRunner {
public:
    Framework framework() const override { return Framework::Vitest; }
    TestRunResult run(const RunConfig& config) override;

    static bool ran(int exit_code) { return exit_code == 0 || exit_code == 1; }
};

// ============================================================================
// Output Parsers
// ============================================================================

struct ParsedTests {
    bool ok = false;
    std::string error;
    std::vector<TestCase> tests;
    bool no_tests = false;  // runner explicitly reported nothing collected
};

// pytest-json-report document
ParsedTests parse_pytest_report(const std::string& json);

// Verbose unittest transcript (stderr of "python -m unittest -v")
ParsedTests parse_unittest_output(const std::string& output);

// Jest --json output; vitest's json reporter writes the same shape.
// File paths under root are reported relative to it.
ParsedTests parse_jest_report(const std::string& json, const std::string& root = "");

// The outermost {...} in output that also carries log lines
std::optional<std::string> extract_json_object(const std::string& output);

} // namespace testbed
