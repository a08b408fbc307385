#include <doctest/doctest.h>
#include <testbed/installer.hpp>
#include <testbed/runtime.hpp>

#include "test_helpers.hpp"

#include <filesystem>

namespace fs = std::filesystem;

using namespace testbed;
using testbed_test::ScopedPathPrepend;
using testbed_test::TempDir;
using testbed_test::write_script;

namespace {

Sandbox make_sandbox(const TempDir& base) {
    SandboxOptions options;
    options.borrowed_binaries = {"sh"};
    options.base_dir = base.path();
    auto created = create_sandbox("testbed-install-", options);
    REQUIRE(created.isOk());
    return created.value();
}

std::string link_target(const std::string& link) {
    std::error_code ec;
    return fs::read_symlink(link, ec).string();
}

} // namespace

TEST_CASE("runtime source names") {
    CHECK(std::string(runtime_source_name(RuntimeSource::Auto)) == "auto");
    CHECK(parse_runtime_source("system") == RuntimeSource::System);
    CHECK(parse_runtime_source("download") == RuntimeSource::Download);
    CHECK_FALSE(parse_runtime_source("docker").has_value());
}

TEST_CASE("ToolResolver prefers tools already in the sandbox") {
    TempDir base;
    TempDir tools;
    write_script(tools.file("uv"), "exit 0\n");
    Sandbox sandbox = make_sandbox(base);
    REQUIRE(link_executable(sandbox, tools.file("uv"), "uv").isOk());

    ToolResolver resolver(RuntimeSource::Download, nullptr);
    auto resolved = resolver.resolve(sandbox, "uv");
    REQUIRE(resolved.isOk());
    CHECK(resolved.value() == join_path(sandbox.bin_dir, "uv"));

    cleanup_sandbox(sandbox);
}

TEST_CASE("ToolResolver in download mode ignores the host PATH") {
    TempDir base;
    TempDir tools;
    write_script(tools.file("testbed-fake-tool"), "exit 0\n");
    ScopedPathPrepend path(tools.path());
    Sandbox sandbox = make_sandbox(base);

    ToolResolver system(RuntimeSource::System, nullptr);
    CHECK(system.resolve(sandbox, "testbed-fake-tool").isOk());

    ToolResolver download(RuntimeSource::Download, nullptr);
    auto missing = download.resolve(sandbox, "testbed-fake-tool");
    REQUIRE(missing.isErr());
    CHECK(missing.error().code() == ErrorCode::TOOL_NOT_FOUND);

    cleanup_sandbox(sandbox);
}

TEST_CASE("python install links uv and runs uv sync in the work directory") {
    TempDir base;
    TempDir tools;
    write_script(tools.file("uv"),
                 "[ \"$1\" = sync ] || exit 9\n"
                 "echo \"$VIRTUAL_ENV\" > synced.txt\n");
    ScopedPathPrepend path(tools.path());
    Sandbox sandbox = make_sandbox(base);

    ToolResolver resolver(RuntimeSource::System, nullptr);
    const auto& python = get_runtime_config(Runtime::Python);
    auto installed = install_dependencies(sandbox, python, resolver);
    REQUIRE(installed.isOk());

    CHECK(link_target(join_path(sandbox.bin_dir, "uv")) == tools.file("uv"));
    std::string venv = join_path(sandbox.work_dir, ".venv");
    CHECK(sandbox.env.at("VIRTUAL_ENV") == venv);
    CHECK(sandbox.env.at("PYTHONDONTWRITEBYTECODE") == "1");
    CHECK(sandbox_path_dirs(sandbox).front() == join_path(venv, "bin"));
    CHECK(read_file(join_path(sandbox.work_dir, "synced.txt")).value_or("") == venv + "\n");

    cleanup_sandbox(sandbox);
}

TEST_CASE("failed install reports the installer's stderr") {
    TempDir base;
    TempDir tools;
    write_script(tools.file("uv"), "echo \"No solution found\" >&2\nexit 1\n");
    ScopedPathPrepend path(tools.path());
    Sandbox sandbox = make_sandbox(base);

    ToolResolver resolver(RuntimeSource::System, nullptr);
    auto installed = install_dependencies(sandbox, get_runtime_config(Runtime::Python), resolver);
    REQUIRE(installed.isErr());
    CHECK(installed.error().code() == ErrorCode::INSTALL_FAILED);
    CHECK(installed.error().message() == "Failed to install dependencies: No solution found\n");

    cleanup_sandbox(sandbox);
}

TEST_CASE("missing package manager fails before running anything") {
    TempDir base;
    Sandbox sandbox = make_sandbox(base);

    ToolResolver resolver(RuntimeSource::Download, nullptr);
    auto installed = install_dependencies(sandbox, get_runtime_config(Runtime::Node), resolver);
    REQUIRE(installed.isErr());
    CHECK(installed.error().code() == ErrorCode::TOOL_NOT_FOUND);

    cleanup_sandbox(sandbox);
}

TEST_CASE("bun install also provides bunx and node") {
    TempDir base;
    TempDir tools;
    write_script(tools.file("bun"), "exit 0\n");
    ScopedPathPrepend path(tools.path());
    Sandbox sandbox = make_sandbox(base);

    ToolResolver resolver(RuntimeSource::System, nullptr);
    auto installed = install_dependencies(sandbox, get_runtime_config(Runtime::Bun), resolver);
    REQUIRE(installed.isOk());

    for (const char* name : {"bun", "bunx", "node"}) {
        CAPTURE(name);
        CHECK(link_target(join_path(sandbox.bin_dir, name)) == tools.file("bun"));
    }
    CHECK(sandbox_path_dirs(sandbox).front() == join_path(sandbox.work_dir, "node_modules/.bin"));

    cleanup_sandbox(sandbox);
}
