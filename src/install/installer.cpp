#include "testbed/installer.hpp"
#include "testbed/platform.hpp"
#include "testbed/process.hpp"

#include <spdlog/spdlog.h>

namespace testbed {

const char* runtime_source_name(RuntimeSource source) {
    switch (source) {
        case RuntimeSource::Auto: return "auto";
        case RuntimeSource::System: return "system";
        case RuntimeSource::Download: return "download";
    }
    return "auto";
}

std::optional<RuntimeSource> parse_runtime_source(const std::string& name) {
    if (name == "auto") return RuntimeSource::Auto;
    if (name == "system") return RuntimeSource::System;
    if (name == "download") return RuntimeSource::Download;
    return std::nullopt;
}

// ============================================================================
// ToolResolver
// ============================================================================

ToolResolver::ToolResolver(RuntimeSource source, BinaryProvisioner* provisioner)
    : source_(source), provisioner_(provisioner) {}

Result<std::string> ToolResolver::resolve(const Sandbox& sandbox, const std::string& name) {
    if (auto local = find_executable(name, {sandbox.bin_dir})) {
        return Result<std::string>::ok(*local);
    }

    if (source_ != RuntimeSource::Download) {
        if (auto host = find_host_executable(name)) {
            spdlog::debug("using host {} at {}", name, *host);
            return Result<std::string>::ok(*host);
        }
    }

    if (source_ != RuntimeSource::System && provisioner_ && provisioner_->knows(name)) {
        auto provisioned = provisioner_->ensure(name);
        if (provisioned.isOk()) {
            return provisioned;
        }
        return Result<std::string>::err(
            Error(ErrorCode::TOOL_NOT_FOUND, provisioned.error().toString())
                .withContext("Required tool not available: " + name));
    }

    return Result<std::string>::err(
        Error(ErrorCode::TOOL_NOT_FOUND, "Required tool not found: " + name));
}

// ============================================================================
// Installation
// ============================================================================

namespace {

// Link a resolved tool into bin unless it already lives there
Result<void> link_tool(Sandbox& sandbox, const std::string& path, const std::string& name) {
    if (get_parent_directory(path) == sandbox.bin_dir && get_filename(path) == name) {
        return Result<void>::ok();
    }
    return link_executable(sandbox, path, name);
}

Result<void> require_and_link(Sandbox& sandbox, ToolResolver& tools, const std::string& name) {
    auto path = tools.resolve(sandbox, name);
    if (path.isErr()) {
        return Result<void>::err(path.error());
    }
    return link_tool(sandbox, path.value(), name);
}

void link_optional(Sandbox& sandbox, ToolResolver& tools, const std::string& name,
                   const std::string& as) {
    if (find_executable(as, {sandbox.bin_dir})) return;
    auto path = tools.resolve(sandbox, name);
    if (path.isErr()) {
        spdlog::debug("optional tool {} unavailable: {}", name, path.error().message());
        return;
    }
    auto linked = link_tool(sandbox, path.value(), as);
    if (linked.isErr()) {
        spdlog::warn("could not link {}: {}", as, linked.error().message());
    }
}

Result<void> link_runtime_tools(Sandbox& sandbox, const RuntimeConfig& runtime,
                                ToolResolver& tools) {
    switch (runtime.runtime) {
        case Runtime::Python: {
            auto uv = require_and_link(sandbox, tools, "uv");
            if (uv.isErr()) return uv;
            link_optional(sandbox, tools, "python3", "python3");
            link_optional(sandbox, tools, "python3", "python");
            return Result<void>::ok();
        }
        case Runtime::Node: {
            auto node = require_and_link(sandbox, tools, "node");
            if (node.isErr()) return node;
            auto npm = require_and_link(sandbox, tools, "npm");
            if (npm.isErr()) return npm;
            link_optional(sandbox, tools, "npx", "npx");
            return Result<void>::ok();
        }
        case Runtime::Bun: {
            auto bun = tools.resolve(sandbox, "bun");
            if (bun.isErr()) return Result<void>::err(bun.error());
            auto linked = link_tool(sandbox, bun.value(), "bun");
            if (linked.isErr()) return linked;

            // bunx is bun invoked under another name
            if (!find_executable("bunx", {sandbox.bin_dir})) {
                auto bunx = link_executable(sandbox, bun.value(), "bunx");
                if (bunx.isErr()) return bunx;
            }
            // Scripts with a "node" shebang run on bun
            if (!find_executable("node", {sandbox.bin_dir})) {
                auto node = link_executable(sandbox, bun.value(), "node");
                if (node.isErr()) return node;
            }
            return Result<void>::ok();
        }
    }
    return Result<void>::ok();
}

} // namespace

std::map<std::string, std::string> runtime_environment(const Sandbox& sandbox,
                                                       const RuntimeConfig& runtime) {
    std::map<std::string, std::string> env = runtime.env_setup;
    if (runtime.runtime == Runtime::Python) {
        env["VIRTUAL_ENV"] = join_path(sandbox.work_dir, ".venv");
        env["UV_CACHE_DIR"] = join_path(sandbox.cache_dir, "uv");
    }
    return env;
}

Result<void> install_dependencies(Sandbox& sandbox, const RuntimeConfig& runtime,
                                  ToolResolver& tools, std::chrono::seconds timeout) {
    auto linked = link_runtime_tools(sandbox, runtime, tools);
    if (linked.isErr()) {
        spdlog::error("{} setup failed: {}", runtime.name, linked.error().message());
        return linked;
    }

    // Project-local tools must be reachable by the install scripts too
    add_package_manager_bin_path(sandbox, runtime);

    for (const auto& [key, value] : runtime_environment(sandbox, runtime)) {
        sandbox.env[key] = value;
    }

    std::string command = shell_join(runtime.install_args);
    spdlog::info("installing dependencies: {}", command);

    auto run = run_sandboxed_command(sandbox, command, {}, timeout);
    if (run.isErr()) {
        return Result<void>::err(Error(ErrorCode::INSTALL_FAILED, run.error().message()));
    }

    const auto& out = run.value();
    if (out.timed_out) {
        return Result<void>::err(Error(ErrorCode::INSTALL_FAILED,
                                       command + " timed out after " +
                                           std::to_string(timeout.count()) + "s"));
    }
    if (out.exit_code != 0) {
        spdlog::error("{} exited with {}", command, out.exit_code);
        return Result<void>::err(Error(ErrorCode::INSTALL_FAILED,
                                       "Failed to install dependencies: " + out.stderr_data));
    }

    return Result<void>::ok();
}

} // namespace testbed
