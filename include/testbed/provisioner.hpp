#pragma once

#include "testbed/materializer.hpp"
#include "testbed/platform.hpp"
#include "testbed/result.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace testbed {

// ============================================================================
// Binary Catalogue
// ============================================================================

/**
 * Where and how to obtain one runtime executable.
 *
 * Templates may reference {version}, {platform} and {arch}. The platform
 * and arch values come from the per-binary naming tables because every
 * project spells them differently (node "linux-x64", bun "linux-x64",
 * uv "x86_64-unknown-linux-gnu").
 */
struct BinarySpec {
    std::string name;
    std::string version;
    std::string url_template;
    std::string checksum_template;
    std::string binary_path;  // member suffix inside the archive
    std::map<Platform, std::string> platform_names;
    std::map<Architecture, std::string> arch_names;
};

// node, bun and uv at their pinned versions
std::map<std::string, BinarySpec> default_binary_catalogue();

// Replace {key} placeholders. Unknown placeholders are left untouched.
std::string expand_template(const std::string& tmpl,
                            const std::map<std::string, std::string>& vars);

// ============================================================================
// Binary Provisioner
// ============================================================================

struct ProvisionerOptions {
    std::string cache_dir;
    std::map<std::string, BinarySpec> catalogue = default_binary_catalogue();
    FetchFunction fetch = fetch_https;
    Platform platform = get_current_platform();
    Architecture arch = get_current_architecture();
};

/**
 * Resolves catalogue binaries to verified executables in a local cache.
 *
 * Cache layout: <cache_dir>/binaries/<name>/<version>/<binary> with a
 * <binary>.sha256 sidecar holding the verified archive digest. An
 * archive whose digest does not match the published manifest never
 * reaches the cache. Thread-safe.
 */
class BinaryProvisioner {
public:
    explicit BinaryProvisioner(ProvisionerOptions options);

    // Path to the executable, downloading and verifying it on a cache miss
    Result<std::string> ensure(const std::string& name);

    // Path to the cached executable without touching the network
    std::optional<std::string> cached(const std::string& name) const;

    bool knows(const std::string& name) const;
    const BinarySpec* spec(const std::string& name) const;

    // Directory holding one cached version of a binary
    std::string version_dir(const BinarySpec& spec) const;

    // Remove cached versions of spec.name older than spec.version.
    // Directory names that are not versions are removed too.
    size_t evict_stale(const BinarySpec& spec);

    const std::string& cache_dir() const { return options_.cache_dir; }

private:
    std::optional<std::string> cached_locked(const BinarySpec& spec) const;

    ProvisionerOptions options_;
    mutable std::mutex mutex_;
};

} // namespace testbed
