#include "testbed/tool_service.hpp"
#include "testbed/report.hpp"

#include <spdlog/spdlog.h>

#include <exception>

namespace testbed {

namespace {

nlohmann::json failure(const std::string& message) {
    return {{"success", false}, {"error", to_valid_utf8(message)}};
}

nlohmann::json failure(const Error& error) {
    auto j = failure(error.message());
    j["kind"] = error_category_name(error.kind());
    j["code"] = error_code_name(error.code());
    return j;
}

std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.is_object() && j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

} // namespace

const std::vector<std::string>& ToolService::tool_names() {
    static const std::vector<std::string> names = {"create_environment", "run_tests", "cleanup"};
    return names;
}

nlohmann::json ToolService::create_environment(const nlohmann::json& arguments) {
    try {
        auto source = get_string(arguments, "source");
        if (!source || source->empty()) {
            return failure("\"source\" is required");
        }
        auto branch = get_string(arguments, "branch");

        auto created = manager_.create(*source, branch);
        if (created.isErr()) {
            return failure(created.error());
        }

        const auto& env = *created.value();
        return {
            {"success", true},
            {"id", env.id},
            {"working_dir", to_valid_utf8(env.sandbox.work_dir)},
            {"runtime", env.runtime_config.name},
            {"created_at", env.created_at},
        };
    } catch (const std::exception& e) {
        spdlog::error("create_environment: {}", e.what());
        return failure(e.what());
    }
}

nlohmann::json ToolService::run_tests(const nlohmann::json& arguments) {
    try {
        auto id = get_string(arguments, "env_id");
        if (!id) {
            return result_to_json(make_error_result("none", "\"env_id\" is required"));
        }
        return result_to_json(manager_.run_tests(*id));
    } catch (const std::exception& e) {
        spdlog::error("run_tests: {}", e.what());
        return result_to_json(make_error_result("none", e.what()));
    }
}

nlohmann::json ToolService::cleanup(const nlohmann::json& arguments) {
    try {
        auto id = get_string(arguments, "env_id");
        if (!id) {
            return failure("\"env_id\" is required");
        }
        auto removed = manager_.cleanup(*id);
        if (removed.isErr()) {
            return failure(removed.error());
        }
        return {{"success", true}};
    } catch (const std::exception& e) {
        spdlog::error("cleanup: {}", e.what());
        return failure(e.what());
    }
}

nlohmann::json ToolService::call(const std::string& name, const nlohmann::json& arguments) {
    if (name == "create_environment") return create_environment(arguments);
    if (name == "run_tests") return run_tests(arguments);
    if (name == "cleanup") return cleanup(arguments);
    return failure("Unknown tool: " + name);
}

} // namespace testbed
