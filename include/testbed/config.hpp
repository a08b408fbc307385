#pragma once

#include "testbed/installer.hpp"
#include "testbed/provisioner.hpp"
#include "testbed/result.hpp"
#include "testbed/sandbox.hpp"

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace testbed {

// ============================================================================
// Configuration
// ============================================================================

// All in seconds; zero means no limit
struct Timeouts {
    std::chrono::seconds install{600};
    std::chrono::seconds test{900};
    std::chrono::seconds clone{300};
};

struct TestbedConfig {
    std::string schema = "testbed.config.v1";
    std::string cache_dir;  // empty until resolved
    std::string log_level = "info";
    RuntimeSource runtime_source = RuntimeSource::Auto;
    SandboxOptions sandbox;
    Timeouts timeouts;
    bool coverage = false;
    std::map<std::string, BinarySpec> catalogue = default_binary_catalogue();

    std::string source_path;  // config file it was read from, if any
};

struct ConfigParseResult {
    bool ok = false;
    std::string error;
    std::vector<std::string> warnings;
    TestbedConfig config;
};

/**
 * Parse a testbed.config.v1 document.
 *
 * {
 *   "$schema": "testbed.config.v1",
 *   "cache_dir": "/var/cache/testbed",
 *   "log_level": "debug",
 *   "runtime_source": "auto",
 *   "borrowed_binaries": ["git", "sh"],
 *   "passthrough_env": ["LANG"],
 *   "timeouts": {"install": 600, "test": 900, "clone": 300},
 *   "coverage": true,
 *   "binaries": {
 *     "node": {"version": "20.11.0", "url_template": "...",
 *              "checksum_template": "...", "binary_path": "bin/node",
 *              "platforms": {"linux": "linux"}, "archs": {"x64": "x64"}}
 *   }
 * }
 *
 * Entries under "binaries" are merged over the built-in catalogue. Unknown
 * keys and unusable values produce warnings, not errors.
 */
ConfigParseResult parse_config(const std::string& json_str,
                               const std::string& source_path = "");

// --config path > TESTBED_CONFIG > $XDG_CONFIG_HOME/testbed/config.json
// > ~/.config/testbed/config.json. Explicit paths must exist; the
// conventional locations are skipped when absent.
Result<std::optional<std::string>> find_config_file(
    const std::optional<std::string>& explicit_path = std::nullopt);

// Config value > TESTBED_CACHE_DIR > $XDG_CACHE_HOME/testbed > ~/.cache/testbed
std::string resolve_cache_dir(const TestbedConfig& config);

// Locate, read and parse the config, then resolve the cache directory.
// Without a config file the built-in defaults apply.
Result<TestbedConfig> load_config(const std::optional<std::string>& explicit_path = std::nullopt);

} // namespace testbed
