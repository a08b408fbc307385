#pragma once

#include "testbed/environment.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace testbed {

/**
 * JSON-in, JSON-out surface over an EnvironmentManager, for attaching a
 * tool transport. Every operation returns an object with at least a
 * "success" flag; failures carry "error". No exception escapes.
 *
 *   create_environment {"source": str, "branch"?: str}
 *     -> {"success": true, "id", "working_dir", "runtime", "created_at"}
 *   run_tests {"env_id": str} -> Unified Result
 *   cleanup   {"env_id": str} -> {"success": bool, "error"?: str}
 */
class ToolService {
public:
    explicit ToolService(EnvironmentManager& manager) : manager_(manager) {}

    nlohmann::json create_environment(const nlohmann::json& arguments);
    nlohmann::json run_tests(const nlohmann::json& arguments);
    nlohmann::json cleanup(const nlohmann::json& arguments);

    // Dispatch by tool name; unknown names produce a failure object
    nlohmann::json call(const std::string& name, const nlohmann::json& arguments);

    static const std::vector<std::string>& tool_names();

private:
    EnvironmentManager& manager_;
};

} // namespace testbed
