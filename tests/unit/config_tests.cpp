#include <doctest/doctest.h>
#include <testbed/config.hpp>
#include <testbed/logging.hpp>

#include "test_helpers.hpp"

#include <algorithm>

using namespace testbed;
using testbed_test::ScopedEnv;
using testbed_test::TempDir;
using testbed_test::write_file;

namespace {

bool has_warning(const ConfigParseResult& r, const std::string& text) {
    return std::any_of(r.warnings.begin(), r.warnings.end(),
                       [&](const std::string& w) { return w.find(text) != std::string::npos; });
}

} // namespace

// ============================================================================
// parse_config
// ============================================================================

TEST_CASE("parse_config reads a full document") {
    auto result = parse_config(R"({
        "$schema": "testbed.config.v1",
        "cache_dir": "/var/cache/testbed",
        "log_level": "debug",
        "runtime_source": "system",
        "borrowed_binaries": ["git", "sh"],
        "passthrough_env": ["LANG"],
        "timeouts": {"install": 60, "test": 0},
        "coverage": true
    })", "/etc/testbed.json");

    REQUIRE(result.ok);
    CHECK(result.warnings.empty());
    const auto& c = result.config;
    CHECK(c.source_path == "/etc/testbed.json");
    CHECK(c.cache_dir == "/var/cache/testbed");
    CHECK(c.log_level == "debug");
    CHECK(c.runtime_source == RuntimeSource::System);
    CHECK(c.sandbox.borrowed_binaries == std::vector<std::string>{"git", "sh"});
    CHECK(c.sandbox.passthrough_env == std::vector<std::string>{"LANG"});
    CHECK(c.timeouts.install == std::chrono::seconds(60));
    CHECK(c.timeouts.test == std::chrono::seconds(0));
    CHECK(c.timeouts.clone == std::chrono::seconds(300));
    CHECK(c.coverage);
}

TEST_CASE("parse_config applies defaults for a minimal document") {
    auto result = parse_config(R"({"$schema": "testbed.config.v1"})");
    REQUIRE(result.ok);
    const auto& c = result.config;
    CHECK(c.log_level == "info");
    CHECK(c.runtime_source == RuntimeSource::Auto);
    CHECK(c.timeouts.install == std::chrono::seconds(600));
    CHECK(c.timeouts.test == std::chrono::seconds(900));
    CHECK_FALSE(c.coverage);
    CHECK(c.catalogue.count("node") == 1);
    CHECK(c.sandbox.borrowed_binaries == SandboxOptions{}.borrowed_binaries);
}

TEST_CASE("parse_config requires the schema marker") {
    CHECK(parse_config("{}").error == "$schema missing");
    CHECK(parse_config(R"({"$schema": "testbed.config.v2"})").error ==
          "$schema mismatch: expected testbed.config.v1");
    CHECK_FALSE(parse_config("[]").ok);
    CHECK(parse_config("{").error.find("parse error") == 0);
}

TEST_CASE("parse_config warns about unknown keys and soft errors") {
    auto result = parse_config(R"({
        "$schema": "testbed.config.v1",
        "colour": "always",
        "log_level": "chatty",
        "coverage": "yes",
        "timeouts": {"install": 10, "lint": 5}
    })");
    REQUIRE(result.ok);
    CHECK(has_warning(result, "unknown key: colour"));
    CHECK(has_warning(result, "unknown key: timeouts.lint"));
    CHECK(has_warning(result, "invalid log_level: chatty"));
    CHECK(has_warning(result, "coverage must be a boolean"));
    CHECK(result.config.log_level == "info");
    CHECK_FALSE(result.config.coverage);
}

TEST_CASE("parse_config rejects unusable values") {
    CHECK(parse_config(R"({"$schema": "testbed.config.v1", "runtime_source": "docker"})").error ==
          "invalid runtime_source: docker");
    CHECK(parse_config(R"({"$schema": "testbed.config.v1", "timeouts": 30})").error ==
          "timeouts must be an object");
    CHECK(parse_config(R"({"$schema": "testbed.config.v1", "timeouts": {"test": -1}})").error ==
          "timeouts.test must be a non-negative integer");
    CHECK(parse_config(R"({"$schema": "testbed.config.v1", "timeouts": {"clone": "5m"}})").error ==
          "timeouts.clone must be a non-negative integer");
}

TEST_CASE("parse_config merges binary overrides over the catalogue") {
    auto result = parse_config(R"({
        "$schema": "testbed.config.v1",
        "binaries": {
            "node": {"version": "20.11.1", "archs": {"arm64": "arm64", "riscv": "rv"}},
            "deno": {"version": "1.40.0",
                     "url_template": "https://dl.example.test/deno-{platform}-{arch}.zip",
                     "checksum_template": "https://dl.example.test/SHASUMS256.txt",
                     "binary_path": "deno"},
            "half": {"version": "1.0.0"}
        }
    })");
    REQUIRE(result.ok);

    const auto& catalogue = result.config.catalogue;
    const auto& node = catalogue.at("node");
    CHECK(node.version == "20.11.1");
    CHECK(node.binary_path == "bin/node");
    CHECK(node.url_template == default_binary_catalogue().at("node").url_template);

    const auto& deno = catalogue.at("deno");
    CHECK(deno.platform_names.at(Platform::Linux) == "linux");
    CHECK(deno.arch_names.at(Architecture::X64) == "x64");

    CHECK(catalogue.count("half") == 0);
    CHECK(has_warning(result, "binaries.half: incomplete entry ignored"));
    CHECK(has_warning(result, "binaries.node.archs: ignoring riscv"));
}

// ============================================================================
// File Discovery
// ============================================================================

TEST_CASE("find_config_file search order") {
    TempDir xdg;
    TempDir home;
    ScopedEnv no_env_config("TESTBED_CONFIG", std::nullopt);
    ScopedEnv xdg_env("XDG_CONFIG_HOME", xdg.path());
    ScopedEnv home_env("HOME", home.path());

    SUBCASE("nothing found") {
        auto found = find_config_file();
        REQUIRE(found.isOk());
        CHECK_FALSE(found.value().has_value());
    }

    SUBCASE("home before nothing, xdg before home") {
        write_file(home.file(".config/testbed/config.json"), "{}");
        CHECK(find_config_file().value().value_or("") == home.file(".config/testbed/config.json"));

        write_file(xdg.file("testbed/config.json"), "{}");
        CHECK(find_config_file().value().value_or("") == xdg.file("testbed/config.json"));
    }

    SUBCASE("TESTBED_CONFIG must exist") {
        write_file(xdg.file("testbed/config.json"), "{}");
        ScopedEnv env_config("TESTBED_CONFIG", home.file("missing.json"));
        auto found = find_config_file();
        REQUIRE(found.isErr());
        CHECK(found.error().code() == ErrorCode::CONFIG_INVALID);
    }

    SUBCASE("explicit path wins") {
        write_file(home.file("explicit.json"), "{}");
        ScopedEnv env_config("TESTBED_CONFIG", home.file("missing.json"));
        CHECK(find_config_file(home.file("explicit.json")).value().value_or("") ==
              home.file("explicit.json"));
        CHECK(find_config_file(home.file("nope.json")).isErr());
    }
}

TEST_CASE("resolve_cache_dir precedence") {
    TempDir home;
    ScopedEnv cache_env("TESTBED_CACHE_DIR", std::nullopt);
    ScopedEnv xdg_env("XDG_CACHE_HOME", std::nullopt);
    ScopedEnv home_env("HOME", home.path());

    TestbedConfig config;
    CHECK(resolve_cache_dir(config) == join_path(home.path(), ".cache/testbed"));

    {
        ScopedEnv xdg("XDG_CACHE_HOME", std::string("/xdg/cache"));
        CHECK(resolve_cache_dir(config) == "/xdg/cache/testbed");

        ScopedEnv explicit_env("TESTBED_CACHE_DIR", std::string("/env/cache"));
        CHECK(resolve_cache_dir(config) == "/env/cache");

        config.cache_dir = "/configured";
        CHECK(resolve_cache_dir(config) == "/configured");
    }
}

TEST_CASE("load_config reads the located file and resolves the cache") {
    TempDir dir;
    ScopedEnv cache_env("TESTBED_CACHE_DIR", dir.file("cache"));
    write_file(dir.file("config.json"),
               R"({"$schema": "testbed.config.v1", "coverage": true})");

    auto loaded = load_config(dir.file("config.json"));
    REQUIRE(loaded.isOk());
    CHECK(loaded.value().coverage);
    CHECK(loaded.value().source_path == dir.file("config.json"));
    CHECK(loaded.value().cache_dir == dir.file("cache"));

    write_file(dir.file("bad.json"), R"({"$schema": "other"})");
    auto bad = load_config(dir.file("bad.json"));
    REQUIRE(bad.isErr());
    CHECK(bad.error().code() == ErrorCode::CONFIG_INVALID);
    CHECK(bad.error().message().find("$schema mismatch") != std::string::npos);
}

// ============================================================================
// Logging
// ============================================================================

TEST_CASE("log levels") {
    CHECK(is_valid_log_level("trace"));
    CHECK(is_valid_log_level("warn"));
    CHECK(is_valid_log_level("off"));
    CHECK_FALSE(is_valid_log_level("warning"));
    CHECK_FALSE(is_valid_log_level(""));
}

TEST_CASE("effective_log_level prefers a valid TESTBED_LOG_LEVEL") {
    {
        ScopedEnv env("TESTBED_LOG_LEVEL", std::nullopt);
        CHECK(effective_log_level("debug") == "debug");
        CHECK(effective_log_level("loud") == "info");
    }
    {
        ScopedEnv env("TESTBED_LOG_LEVEL", std::string("error"));
        CHECK(effective_log_level("debug") == "error");
    }
    {
        ScopedEnv env("TESTBED_LOG_LEVEL", std::string("nonsense"));
        CHECK(effective_log_level("warn") == "warn");
    }
}
