#include "testbed/runners.hpp"
#include "testbed/environment.hpp"
#include "testbed/platform.hpp"

#include <spdlog/spdlog.h>

namespace testbed {

// ============================================================================
// TestRunner helpers
// ============================================================================

std::optional<std::string> TestRunner::locate(const RunConfig& config,
                                              const std::string& tool) const {
    return find_executable(tool, sandbox_path_dirs(config.env.sandbox));
}

TestRunResult TestRunner::tool_missing(const std::string& tool) const {
    spdlog::warn("{}: {} not found in environment", framework_name(framework()), tool);
    return make_error_result(framework_name(framework()), tool + " not found in environment");
}

TestRunResult TestRunner::execution_failed(const CommandResult& out,
                                           const std::string& command) const {
    std::string message;
    if (out.timed_out) {
        message = command + " timed out";
    } else {
        message = command + " exited with code " + std::to_string(out.exit_code);
    }

    // Keep the end of stderr, where runners print the actual failure
    constexpr size_t kTail = 2000;
    std::string detail = out.stderr_data.empty() ? out.stdout_data : out.stderr_data;
    if (detail.size() > kTail) {
        detail = "..." + detail.substr(detail.size() - kTail);
    }
    if (!detail.empty()) {
        message += ": " + detail;
    }

    spdlog::error("{} execution failed: {}", framework_name(framework()), message);
    return make_error_result(framework_name(framework()), message);
}

std::string TestRunner::scratch_path(const RunConfig& config, const std::string& stem,
                                     const std::string& ext) const {
    return join_path(config.env.sandbox.tmp_dir, stem + "-" + generate_short_id(8) + ext);
}

void TestRunner::finalize(TestRunResult& result, bool clean_exit) const {
    result.runner = framework_name(framework());
    result.summary = summarize(result.tests);
    result.success = clean_exit && result.summary.failed == 0 && !result.error;
}

std::unique_ptr<TestRunner> make_runner(Framework framework) {
    switch (framework) {
        case Framework::Pytest: return std::make_unique<PytestRunner>();
        case Framework::Unittest: return std::make_unique<UnittestRunner>();
        case Framework::Jest: return std::make_unique<JestRunner>();
        case Framework::Vitest: return std::make_unique<VitestRunner>();
    }
    return nullptr;
}

std::optional<std::string> extract_json_object(const std::string& output) {
    auto start = output.find('{');
    auto end = output.rfind('}');
    if (start == std::string::npos || end == std::string::npos || end < start) {
        return std::nullopt;
    }
    return output.substr(start, end - start + 1);
}

} // namespace testbed
