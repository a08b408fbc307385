#pragma once

#include "testbed/config.hpp"
#include "testbed/provisioner.hpp"
#include "testbed/result.hpp"
#include "testbed/sandbox.hpp"
#include "testbed/types.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace testbed {

/**
 * One provisioned project: its sandbox, detected runtime and identity.
 * Owned by the store through shared_ptr so a test run in progress keeps
 * it alive while a concurrent cleanup removes it from the store.
 */
struct Environment {
    std::string id;
    RuntimeConfig runtime_config;
    std::string created_at;  // RFC 3339, UTC
    Sandbox sandbox;
};

using EnvironmentPtr = std::shared_ptr<Environment>;

// Frameworks detected in the environment's work directory
std::vector<Framework> detect_frameworks(const Environment& env);

// ============================================================================
// EnvironmentStore
// ============================================================================

/// Registry of live environments, keyed by id. Thread-safe.
class EnvironmentStore {
public:
    // False when the id is already present
    bool insert(EnvironmentPtr env);
    EnvironmentPtr get(const std::string& id) const;
    // Removes and returns the environment, nullptr when unknown
    EnvironmentPtr remove(const std::string& id);
    std::vector<std::string> ids() const;
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, EnvironmentPtr> environments_;
};

// ============================================================================
// EnvironmentManager
// ============================================================================

/**
 * Drives the pipeline: sandbox creation, source copy or clone, runtime
 * detection, dependency installation, framework detection, test
 * execution and aggregation.
 *
 * An environment enters the store only after creation fully succeeds;
 * on any failure its sandbox is removed before the error is returned.
 * The destructor cleans up every environment still registered.
 */
class EnvironmentManager {
public:
    EnvironmentManager(EnvironmentStore& store, TestbedConfig config,
                       std::shared_ptr<BinaryProvisioner> provisioner = nullptr);
    ~EnvironmentManager();

    EnvironmentManager(const EnvironmentManager&) = delete;
    EnvironmentManager& operator=(const EnvironmentManager&) = delete;

    // Local directory when source exists on disk, GitHub reference otherwise
    Result<EnvironmentPtr> create(const std::string& source,
                                  const std::optional<std::string>& branch = std::nullopt);

    Result<EnvironmentPtr> create_from_path(const std::string& path);
    Result<EnvironmentPtr> create_from_github(const std::string& url,
                                              const std::optional<std::string>& branch);

    std::vector<Framework> detect_frameworks(const Environment& env) const;

    // Unknown ids produce a failed result, not an exception
    TestRunResult run_tests(const std::string& id);
    TestRunResult run_tests(const Environment& env);

    Result<void> cleanup(const std::string& id);
    void cleanup_all() noexcept;

    EnvironmentStore& store() { return store_; }
    const TestbedConfig& config() const { return config_; }

private:
    Result<EnvironmentPtr> fail_and_cleanup(Sandbox& sandbox, Error error);

    EnvironmentStore& store_;
    TestbedConfig config_;
    std::shared_ptr<BinaryProvisioner> provisioner_;
};

} // namespace testbed
