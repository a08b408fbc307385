#pragma once

#include "testbed/provisioner.hpp"
#include "testbed/result.hpp"
#include "testbed/sandbox.hpp"
#include "testbed/types.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace testbed {

// Where runtime and package-manager executables may come from
enum class RuntimeSource {
    Auto,      // host PATH first, then download
    System,    // host PATH only
    Download,  // provisioned binaries only
};

const char* runtime_source_name(RuntimeSource source);
std::optional<RuntimeSource> parse_runtime_source(const std::string& name);

/**
 * Finds executables for a sandbox: its own bin directory first, then the
 * host PATH and/or the binary provisioner depending on the source.
 */
class ToolResolver {
public:
    ToolResolver(RuntimeSource source, BinaryProvisioner* provisioner);

    // Fails with TOOL_NOT_FOUND when no source has the tool
    Result<std::string> resolve(const Sandbox& sandbox, const std::string& name);

    RuntimeSource source() const { return source_; }

private:
    RuntimeSource source_;
    BinaryProvisioner* provisioner_;
};

/**
 * Make a runtime usable inside a sandbox and install project dependencies.
 *
 * Links the runtime and package-manager executables into bin, prepends
 * the project-local bin directory to PATH, merges the runtime's
 * environment variables and runs the package manager's install command
 * in the work directory. A non-zero exit is INSTALL_FAILED carrying the
 * captured stderr.
 */
Result<void> install_dependencies(Sandbox& sandbox, const RuntimeConfig& runtime,
                                  ToolResolver& tools,
                                  std::chrono::seconds timeout = std::chrono::seconds(0));

// Runtime env vars that depend on the sandbox layout
std::map<std::string, std::string> runtime_environment(const Sandbox& sandbox,
                                                       const RuntimeConfig& runtime);

} // namespace testbed
