#pragma once

#include "testbed/process.hpp"
#include "testbed/result.hpp"
#include "testbed/types.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace testbed {

// ============================================================================
// Sandbox
// ============================================================================

/**
 * An isolated directory tree plus the environment map every command run
 * inside it receives. Layout: root/{bin,tmp,work,cache}. Nothing from
 * the host environment is inherited except the pass-through list.
 *
 * This is advisory isolation against accidental interference (stray env
 * vars, leftover files), not an OS-level sandbox.
 */
struct Sandbox {
    std::string root;
    std::string bin_dir;
    std::string work_dir;
    std::string tmp_dir;
    std::string cache_dir;
    std::map<std::string, std::string> env;
    std::shared_ptr<ProcessTracker> processes = std::make_shared<ProcessTracker>();
};

struct SandboxOptions {
    // Host executables symlinked into bin. Each must exist on the host PATH.
    std::vector<std::string> borrowed_binaries = {"git", "sed", "basename", "uname", "sh", "env"};

    // Host variables copied into the sandbox env when set
    std::vector<std::string> passthrough_env = {
        "LANG", "LC_ALL", "TERM", "TZ", "USER", "LOGNAME",
        "SSL_CERT_FILE", "SSL_CERT_DIR",
        "HTTP_PROXY", "HTTPS_PROXY", "NO_PROXY",
        "http_proxy", "https_proxy", "no_proxy",
    };

    // Parent directory for sandbox roots. Empty = host temp directory.
    std::string base_dir;
};

// Variables never present in a sandbox env, whatever the configuration
const std::vector<std::string>& scrubbed_env_vars();

/**
 * Create a sandbox under <base>/<prefix>XXXXXX.
 *
 * Fails with SANDBOX_CREATE_FAILED if directory creation, borrowing an
 * allow-listed executable or permission hardening fails. Anything
 * created before the failure is removed.
 */
Result<Sandbox> create_sandbox(const std::string& prefix,
                               const SandboxOptions& options = SandboxOptions{});

// Terminate tracked processes and remove the tree. Never throws; safe
// to call repeatedly or on a partially removed sandbox.
void cleanup_sandbox(Sandbox& sandbox) noexcept;

// Recursively restrict the sandbox root to its owner
Result<void> harden_sandbox(const Sandbox& sandbox);

struct CommandResult {
    int exit_code = -1;
    std::string stdout_data;
    std::string stderr_data;
    bool timed_out = false;
};

/**
 * Run "/bin/sh -c <command_line>" in the work directory.
 *
 * The child sees the sandbox env overlaid with extra_env; the sandbox
 * map itself is left untouched. Both streams are captured in full. A
 * non-zero exit code is reported in the result, not as an error; only a
 * failure to spawn is an error (COMMAND_FAILED).
 */
Result<CommandResult> run_sandboxed_command(
    const Sandbox& sandbox,
    const std::string& command_line,
    const std::map<std::string, std::string>& extra_env = {},
    std::chrono::seconds timeout = std::chrono::seconds(0));

// Symlink an executable into bin under the given name (replacing any link)
Result<void> link_executable(Sandbox& sandbox, const std::string& target,
                             const std::string& name);

// Prepend a directory to the sandbox PATH unless it is already first
void prepend_path(Sandbox& sandbox, const std::string& dir);

// Prepend <work>/<bin_path> of the runtime's package manager to PATH
void add_package_manager_bin_path(Sandbox& sandbox, const RuntimeConfig& runtime);

// Directories of the sandbox PATH, in order
std::vector<std::string> sandbox_path_dirs(const Sandbox& sandbox);

} // namespace testbed
