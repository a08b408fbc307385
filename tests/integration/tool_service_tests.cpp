#include <doctest/doctest.h>
#include <testbed/tool_service.hpp>

#include "fixtures.hpp"

#include <filesystem>

namespace fs = std::filesystem;

using namespace testbed;
using testbed_test::FakeToolchain;
using testbed_test::TempDir;

TEST_CASE("tool names") {
    CHECK(ToolService::tool_names() ==
          std::vector<std::string>{"create_environment", "run_tests", "cleanup"});
}

TEST_CASE("tool service create, run and cleanup cycle") {
    FakeToolchain tools;
    TempDir project;
    testbed_test::make_unittest_project(project, tools);

    EnvironmentStore store;
    EnvironmentManager manager(store, tools.config());
    ToolService service(manager);

    auto created = service.call("create_environment", {{"source", project.path()}});
    REQUIRE(created["success"] == true);
    CHECK(created["runtime"] == "python");
    REQUIRE(created["id"].is_string());
    CHECK(created["created_at"].get<std::string>().back() == 'Z');
    std::string id = created["id"].get<std::string>();
    CHECK(fs::is_directory(created["working_dir"].get<std::string>()));

    auto result = service.call("run_tests", {{"env_id", id}});
    CHECK(result["runner"] == "unittest");
    CHECK(result["success"] == true);
    CHECK(result["summary"]["total"] == 3);
    CHECK(result["tests"].size() == 3);

    auto cleaned = service.call("cleanup", {{"env_id", id}});
    CHECK(cleaned["success"] == true);
    CHECK_FALSE(cleaned.contains("error"));
    CHECK(tools.no_sandboxes_left());

    auto again = service.call("cleanup", {{"env_id", id}});
    CHECK(again["success"] == false);
    CHECK(again["error"] == "Unknown environment: " + id);
    CHECK(again["code"] == "environment_not_found");
}

TEST_CASE("tool service argument validation") {
    FakeToolchain tools;
    EnvironmentStore store;
    EnvironmentManager manager(store, tools.config());
    ToolService service(manager);

    auto no_source = service.create_environment(nlohmann::json::object());
    CHECK(no_source["success"] == false);
    CHECK(no_source["error"] == "\"source\" is required");

    auto bad_source = service.create_environment({{"source", "http://github.com/a/b"}});
    CHECK(bad_source["success"] == false);
    CHECK(bad_source["error"].get<std::string>().find("HTTPS") != std::string::npos);
    CHECK(bad_source["kind"] == "validation");

    auto latin1_source = service.create_environment({{"source", std::string("http://caf\xe9/x")}});
    CHECK(latin1_source["success"] == false);
    CHECK_NOTHROW(latin1_source.dump());

    auto no_env = service.run_tests(nlohmann::json::object());
    CHECK(no_env["success"] == false);
    CHECK(no_env["runner"] == "none");
    CHECK(no_env["error"] == "\"env_id\" is required");

    auto unknown_env = service.run_tests({{"env_id", "nope"}});
    CHECK(unknown_env["success"] == false);
    CHECK(unknown_env["summary"]["total"] == 0);
    CHECK(unknown_env["error"] == "Unknown environment: nope");

    auto no_cleanup_id = service.cleanup({{"env_id", 42}});
    CHECK(no_cleanup_id["success"] == false);

    auto unknown_tool = service.call("list_environments", nlohmann::json::object());
    CHECK(unknown_tool["success"] == false);
    CHECK(unknown_tool["error"] == "Unknown tool: list_environments");

    CHECK(tools.no_sandboxes_left());
}
