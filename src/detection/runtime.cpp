#include "testbed/runtime.hpp"
#include "testbed/platform.hpp"

#include <spdlog/spdlog.h>

namespace testbed {

namespace {

RuntimeConfig make_python() {
    RuntimeConfig c;
    c.runtime = Runtime::Python;
    c.name = runtime_name(Runtime::Python);
    c.config_files = {"pyproject.toml"};
    c.package_manager = PackageManager::Uv;
    c.env_setup = {
        {"PIP_NO_CACHE_DIR", "1"},
        {"PYTHONDONTWRITEBYTECODE", "1"},
        {"PYTHONUNBUFFERED", "1"},
    };
    c.binary_name = "python";
    c.bin_path = ".venv/bin";
    c.install_args = {"uv", "sync"};
    return c;
}

RuntimeConfig make_node() {
    RuntimeConfig c;
    c.runtime = Runtime::Node;
    c.name = runtime_name(Runtime::Node);
    c.config_files = {"package.json"};
    c.package_manager = PackageManager::Npm;
    c.env_setup = {
        {"NODE_NO_WARNINGS", "1"},
        {"NPM_CONFIG_UPDATE_NOTIFIER", "false"},
        {"NPM_CONFIG_FUND", "false"},
    };
    c.binary_name = "node";
    c.bin_path = "node_modules/.bin";
    c.install_args = {"npm", "install", "--no-audit", "--no-fund"};
    return c;
}

RuntimeConfig make_bun() {
    RuntimeConfig c;
    c.runtime = Runtime::Bun;
    c.name = runtime_name(Runtime::Bun);
    c.config_files = {"bun.lockb", "package.json"};
    c.package_manager = PackageManager::Bun;
    c.env_setup = {
        {"NO_INSTALL_HINTS", "1"},
        {"DO_NOT_TRACK", "1"},
    };
    c.binary_name = "bun";
    c.bin_path = "node_modules/.bin";
    c.install_args = {"bun", "install"};
    return c;
}

} // namespace

const RuntimeConfig& get_runtime_config(Runtime runtime) {
    static const RuntimeConfig python = make_python();
    static const RuntimeConfig node = make_node();
    static const RuntimeConfig bun = make_bun();

    switch (runtime) {
        case Runtime::Python: return python;
        case Runtime::Node: return node;
        case Runtime::Bun: return bun;
    }
    return python;
}

const std::vector<Runtime>& runtime_detection_order() {
    static const std::vector<Runtime> order = {Runtime::Bun, Runtime::Node, Runtime::Python};
    return order;
}

const std::vector<std::string>& ignored_project_dirs() {
    static const std::vector<std::string> dirs = {
        "node_modules", ".venv", "venv", ".git", "__pycache__", ".tox", ".pytest_cache",
    };
    return dirs;
}

bool path_matches_marker(const std::string& path, const std::string& marker) {
    if (path == marker) return true;
    return path.size() > marker.size() &&
           path.compare(path.size() - marker.size(), marker.size(), marker) == 0 &&
           path[path.size() - marker.size() - 1] == '/';
}

bool runtime_matches(const RuntimeConfig& config, const std::vector<std::string>& files) {
    for (const auto& marker : config.config_files) {
        bool present = false;
        for (const auto& f : files) {
            if (path_matches_marker(f, marker)) {
                present = true;
                break;
            }
        }
        if (!present) return false;
    }
    return !config.config_files.empty();
}

Result<RuntimeConfig> detect_runtime(const std::vector<std::string>& files) {
    for (Runtime runtime : runtime_detection_order()) {
        const auto& config = get_runtime_config(runtime);
        if (runtime_matches(config, files)) {
            spdlog::debug("detected runtime {}", config.name);
            return Result<RuntimeConfig>::ok(config);
        }
    }
    return Result<RuntimeConfig>::err(
        Error(ErrorCode::NO_RUNTIME_DETECTED, "No supported runtime detected"));
}

Result<RuntimeConfig> detect_runtime(const std::string& project_dir) {
    if (!is_directory(project_dir)) {
        return Result<RuntimeConfig>::err(
            Error(ErrorCode::INVALID_SOURCE, "not a directory: " + project_dir));
    }
    return detect_runtime(list_files_recursive(project_dir, ignored_project_dirs()));
}

} // namespace testbed
