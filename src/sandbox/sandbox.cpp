#include "testbed/sandbox.hpp"
#include "testbed/platform.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>

#include <unistd.h>

namespace fs = std::filesystem;

namespace testbed {

const std::vector<std::string>& scrubbed_env_vars() {
    static const std::vector<std::string> vars = {
        "LD_PRELOAD",
        "LD_LIBRARY_PATH",
        "PYTHONPATH",
        "NODE_PATH",
        "DYLD_INSERT_LIBRARIES",
        "DYLD_LIBRARY_PATH",
    };
    return vars;
}

namespace {

bool is_scrubbed(const std::string& name) {
    const auto& vars = scrubbed_env_vars();
    return std::find(vars.begin(), vars.end(), name) != vars.end();
}

std::map<std::string, std::string> build_sandbox_env(const Sandbox& sandbox,
                                                     const SandboxOptions& options) {
    std::map<std::string, std::string> env;

    for (const auto& name : options.passthrough_env) {
        if (is_scrubbed(name)) continue;
        if (auto value = get_env(name)) {
            env[name] = *value;
        }
    }

    env["PATH"] = sandbox.bin_dir;
    env["HOME"] = sandbox.work_dir;
    env["TMPDIR"] = sandbox.tmp_dir;
    env["XDG_RUNTIME_DIR"] = sandbox.tmp_dir;
    env["XDG_CACHE_HOME"] = sandbox.cache_dir;

    for (const auto& name : scrubbed_env_vars()) {
        env.erase(name);
    }
    return env;
}

Result<Sandbox> fail_creation(Sandbox& sandbox, const std::string& message) {
    spdlog::error("sandbox creation failed: {}", message);
    if (!sandbox.root.empty()) {
        cleanup_sandbox(sandbox);
    }
    return Result<Sandbox>::err(Error(ErrorCode::SANDBOX_CREATE_FAILED, message));
}

} // namespace

Result<Sandbox> create_sandbox(const std::string& prefix, const SandboxOptions& options) {
    Sandbox sandbox;

    std::error_code ec;
    std::string base = options.base_dir;
    if (base.empty()) {
        base = fs::temp_directory_path(ec).string();
        if (ec) {
            return fail_creation(sandbox, "no temporary directory: " + ec.message());
        }
    }

    std::string pattern = join_path(base, prefix + "XXXXXX");
    std::vector<char> buf(pattern.begin(), pattern.end());
    buf.push_back('\0');
    if (mkdtemp(buf.data()) == nullptr) {
        return fail_creation(sandbox, "mkdtemp failed for " + pattern + ": " + strerror(errno));
    }

    sandbox.root = buf.data();
    sandbox.bin_dir = join_path(sandbox.root, "bin");
    sandbox.tmp_dir = join_path(sandbox.root, "tmp");
    sandbox.work_dir = join_path(sandbox.root, "work");
    sandbox.cache_dir = join_path(sandbox.root, "cache");

    for (const auto* dir : {&sandbox.bin_dir, &sandbox.tmp_dir, &sandbox.work_dir,
                            &sandbox.cache_dir}) {
        if (!create_directories(*dir)) {
            return fail_creation(sandbox, "failed to create " + *dir);
        }
    }

    sandbox.env = build_sandbox_env(sandbox, options);

    for (const auto& name : options.borrowed_binaries) {
        auto host = find_host_executable(name);
        if (!host) {
            return fail_creation(sandbox, "required host executable not found: " + name);
        }
        auto linked = link_executable(sandbox, *host, name);
        if (linked.isErr()) {
            return fail_creation(sandbox, linked.error().message());
        }
    }

    auto hardened = harden_sandbox(sandbox);
    if (hardened.isErr()) {
        return fail_creation(sandbox, hardened.error().message());
    }

    spdlog::debug("created sandbox {}", sandbox.root);
    return Result<Sandbox>::ok(std::move(sandbox));
}

void cleanup_sandbox(Sandbox& sandbox) noexcept {
    if (sandbox.root.empty()) return;

    try {
        if (sandbox.processes) {
            size_t signalled = sandbox.processes->terminate_all();
            if (signalled > 0) {
                spdlog::warn("terminated {} running process group(s) in {}", signalled,
                             sandbox.root);
            }
        }

        std::error_code ec;
        if (!fs::exists(fs::symlink_status(sandbox.root, ec))) {
            return;
        }

        auto writable = make_owner_writable(sandbox.root);
        if (!writable.ok) {
            spdlog::debug("could not restore permissions under {}: {}", sandbox.root,
                          writable.error);
        }

        fs::remove_all(sandbox.root, ec);
        if (ec) {
            spdlog::warn("failed to remove sandbox {}: {}", sandbox.root, ec.message());
            return;
        }
        spdlog::debug("removed sandbox {}", sandbox.root);
    } catch (const std::exception& e) {
        spdlog::warn("sandbox cleanup of {} failed: {}", sandbox.root, e.what());
    }
}

Result<void> harden_sandbox(const Sandbox& sandbox) {
    auto restricted = restrict_to_owner(sandbox.root);
    if (!restricted.ok) {
        return Result<void>::err(Error(ErrorCode::PERMISSION_DENIED, restricted.error));
    }
    return Result<void>::ok();
}

Result<CommandResult> run_sandboxed_command(const Sandbox& sandbox,
                                            const std::string& command_line,
                                            const std::map<std::string, std::string>& extra_env,
                                            std::chrono::seconds timeout) {
    ProcessSpec spec;
    spec.argv = {"/bin/sh", "-c", command_line};
    spec.cwd = sandbox.work_dir;
    spec.env = sandbox.env;
    for (const auto& [key, value] : extra_env) {
        spec.env[key] = value;
    }
    for (const auto& name : scrubbed_env_vars()) {
        spec.env.erase(name);
    }
    spec.timeout = timeout;

    spdlog::debug("[{}] $ {}", get_filename(sandbox.root), command_line);

    auto proc = run_process(spec, sandbox.processes.get());
    if (!proc.ok) {
        return Result<CommandResult>::err(
            Error(ErrorCode::COMMAND_FAILED, proc.error).withContext(command_line));
    }

    CommandResult result;
    result.exit_code = proc.exit_code;
    result.stdout_data = std::move(proc.stdout_data);
    result.stderr_data = std::move(proc.stderr_data);
    result.timed_out = proc.timed_out;
    return Result<CommandResult>::ok(std::move(result));
}

Result<void> link_executable(Sandbox& sandbox, const std::string& target,
                             const std::string& name) {
    std::string link = join_path(sandbox.bin_dir, name);
    std::error_code ec;

    if (fs::exists(fs::symlink_status(link, ec))) {
        fs::remove(link, ec);
        if (ec) {
            return Result<void>::err(
                Error(ErrorCode::IO_ERROR, "cannot replace " + link + ": " + ec.message()));
        }
    }

    fs::create_symlink(target, link, ec);
    if (ec) {
        return Result<void>::err(Error(
            ErrorCode::IO_ERROR, "failed to link " + target + " as " + link + ": " + ec.message()));
    }
    return Result<void>::ok();
}

void prepend_path(Sandbox& sandbox, const std::string& dir) {
    auto dirs = sandbox_path_dirs(sandbox);
    if (!dirs.empty() && dirs.front() == dir) return;

    std::string path = dir;
    for (const auto& d : dirs) {
        if (d == dir) continue;
        path += get_path_list_separator();
        path += d;
    }
    sandbox.env["PATH"] = path;
}

void add_package_manager_bin_path(Sandbox& sandbox, const RuntimeConfig& runtime) {
    if (runtime.bin_path.empty()) return;
    auto dir = normalize_under_root(sandbox.work_dir, runtime.bin_path);
    if (!dir.ok) {
        spdlog::warn("ignoring bin path outside the work directory: {}", runtime.bin_path);
        return;
    }
    prepend_path(sandbox, dir.path);
}

std::vector<std::string> sandbox_path_dirs(const Sandbox& sandbox) {
    auto it = sandbox.env.find("PATH");
    if (it == sandbox.env.end()) return {};
    return split_path_list(it->second);
}

} // namespace testbed
