#include <doctest/doctest.h>
#include <testbed/process.hpp>

#include "test_helpers.hpp"

#include <chrono>

using namespace testbed;
using testbed_test::TempDir;

namespace {

ProcessSpec shell(const std::string& script) {
    ProcessSpec spec;
    spec.argv = {"/bin/sh", "-c", script};
    spec.env = {{"PATH", "/usr/bin:/bin"}};
    return spec;
}

} // namespace

TEST_CASE("run_process captures both streams and the exit code") {
    auto result = run_process(shell("echo out; echo err >&2; exit 3"));
    REQUIRE(result.ok);
    CHECK(result.exit_code == 3);
    CHECK(result.stdout_data == "out\n");
    CHECK(result.stderr_data == "err\n");
    CHECK_FALSE(result.timed_out);
}

TEST_CASE("run_process passes only the given environment") {
    auto spec = shell("printf '%s|%s' \"$TESTBED_MARKER\" \"${HOME:-unset}\"");
    spec.env["TESTBED_MARKER"] = "present";

    auto result = run_process(spec);
    REQUIRE(result.ok);
    CHECK(result.stdout_data == "present|unset");
}

TEST_CASE("run_process runs in the requested directory") {
    TempDir tmp;
    auto spec = shell("pwd");
    spec.cwd = tmp.path();

    auto result = run_process(spec);
    REQUIRE(result.ok);
    CHECK(result.stdout_data.find(get_filename(tmp.path())) != std::string::npos);
}

TEST_CASE("run_process kills the process group on timeout") {
    auto spec = shell("sleep 30");
    spec.timeout = std::chrono::seconds(1);

    auto start = std::chrono::steady_clock::now();
    auto result = run_process(spec);
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(result.ok);
    CHECK(result.timed_out);
    CHECK(result.exit_code != 0);
    CHECK(elapsed < std::chrono::seconds(10));
}

TEST_CASE("run_process reports an unknown executable as exit 127") {
    ProcessSpec spec;
    spec.argv = {"/nonexistent/testbed-tool"};
    auto result = run_process(spec);
    CHECK(result.exit_code == 127);
}

TEST_CASE("run_process untracks finished process groups") {
    ProcessTracker tracker;
    auto result = run_process(shell("exit 0"), &tracker);
    REQUIRE(result.ok);
    CHECK(tracker.size() == 0);
    CHECK(tracker.terminate_all() == 0);
}

TEST_CASE("shell_quote leaves safe words alone and quotes the rest") {
    CHECK(shell_quote("--json-report-file=/tmp/x.json") == "--json-report-file=/tmp/x.json");
    CHECK(shell_quote("") == "''");
    CHECK(shell_quote("a b") == "'a b'");
    CHECK(shell_quote("it's") == "'it'\\''s'");
}

TEST_CASE("shell_join round-trips through /bin/sh") {
    auto cmd = shell_join({"printf", "%s|", "a b", "it's", "$HOME"});
    auto result = run_process(shell(cmd));
    REQUIRE(result.ok);
    CHECK(result.stdout_data == "a b|it's|$HOME|");
}
