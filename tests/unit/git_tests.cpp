#include <doctest/doctest.h>
#include <testbed/git.hpp>

#include "test_helpers.hpp"

#include <filesystem>

namespace fs = std::filesystem;

using namespace testbed;
using testbed_test::TempDir;

TEST_CASE("normalize_github_url accepts common spellings") {
    struct Case {
        const char* input;
        const char* expected;
    };
    const Case cases[] = {
        {"https://github.com/octo/hello", "https://github.com/octo/hello"},
        {"https://github.com/octo/hello.git", "https://github.com/octo/hello"},
        {"https://github.com/octo/hello/", "https://github.com/octo/hello"},
        {"github.com/octo/hello", "https://github.com/octo/hello"},
        {"octo/hello", "https://github.com/octo/hello"},
        {"git@github.com:octo/hello.git", "https://github.com/octo/hello"},
        {"  https://github.com/octo/my_repo.js \n", "https://github.com/octo/my_repo.js"},
    };

    for (const auto& c : cases) {
        CAPTURE(c.input);
        auto result = normalize_github_url(c.input);
        REQUIRE(result.isOk());
        CHECK(result.value() == c.expected);
    }
}

TEST_CASE("normalize_github_url rejects other sources") {
    const char* rejected[] = {
        "",
        "http://github.com/octo/hello",
        "https://gitlab.com/octo/hello",
        "https://github.com.evil.test/octo/hello",
        "https://github.com/octo",
        "https://github.com/octo/hello/tree/main",
        "https://github.com/octo/hel lo",
        "https://github.com/octo/$(reboot)",
        "file:///etc",
    };

    for (const auto* input : rejected) {
        CAPTURE(input);
        auto result = normalize_github_url(input);
        REQUIRE(result.isErr());
        CHECK(result.error().code() == ErrorCode::INVALID_SOURCE);
    }
}

TEST_CASE("is_valid_branch_name") {
    CHECK(is_valid_branch_name("main"));
    CHECK(is_valid_branch_name("release/1.2"));
    CHECK(is_valid_branch_name("feature_x-y.z"));

    CHECK_FALSE(is_valid_branch_name(""));
    CHECK_FALSE(is_valid_branch_name("--upload-pack=evil"));
    CHECK_FALSE(is_valid_branch_name("a..b"));
    CHECK_FALSE(is_valid_branch_name("main;rm"));
    CHECK_FALSE(is_valid_branch_name("has space"));
}

TEST_CASE("clone_repository validates before running git") {
    TempDir base;
    SandboxOptions options;
    options.borrowed_binaries = {"sh"};
    options.base_dir = base.path();

    auto created = create_sandbox("testbed-git-", options);
    REQUIRE(created.isOk());
    Sandbox sandbox = created.value();

    auto bad_url = clone_repository(sandbox, "https://example.com/a/b", std::nullopt);
    REQUIRE(bad_url.isErr());
    CHECK(bad_url.error().code() == ErrorCode::INVALID_SOURCE);

    auto bad_branch = clone_repository(sandbox, "octo/hello", std::string("-x"));
    REQUIRE(bad_branch.isErr());
    CHECK(bad_branch.error().code() == ErrorCode::INVALID_SOURCE);

    CHECK(fs::is_empty(sandbox.work_dir));
    cleanup_sandbox(sandbox);
}

TEST_CASE("clone_repository reports git failures") {
    TempDir base;
    TempDir tools;
    testbed_test::write_script(tools.file("git"), "echo \"fatal: repository not found\" >&2\nexit 128\n");

    SandboxOptions options;
    options.borrowed_binaries = {"sh"};
    options.base_dir = base.path();

    auto created = create_sandbox("testbed-git-", options);
    REQUIRE(created.isOk());
    Sandbox sandbox = created.value();
    REQUIRE(link_executable(sandbox, tools.file("git"), "git").isOk());

    auto cloned = clone_repository(sandbox, "octo/missing", std::nullopt);
    REQUIRE(cloned.isErr());
    CHECK(cloned.error().code() == ErrorCode::CLONE_FAILED);
    CHECK(cloned.error().message().find("repository not found") != std::string::npos);

    cleanup_sandbox(sandbox);
}
