#include "testbed/environment.hpp"
#include "testbed/aggregate.hpp"
#include "testbed/frameworks.hpp"
#include "testbed/git.hpp"
#include "testbed/installer.hpp"
#include "testbed/platform.hpp"
#include "testbed/runners.hpp"
#include "testbed/runtime.hpp"

#include <spdlog/spdlog.h>

#include <exception>

namespace testbed {

std::vector<Framework> detect_frameworks(const Environment& env) {
    return detect_frameworks(env.sandbox.work_dir, env.runtime_config.runtime);
}

// ============================================================================
// EnvironmentStore
// ============================================================================

bool EnvironmentStore::insert(EnvironmentPtr env) {
    std::lock_guard<std::mutex> lock(mutex_);
    return environments_.emplace(env->id, std::move(env)).second;
}

EnvironmentPtr EnvironmentStore::get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = environments_.find(id);
    if (it == environments_.end()) return nullptr;
    return it->second;
}

EnvironmentPtr EnvironmentStore::remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = environments_.find(id);
    if (it == environments_.end()) return nullptr;
    EnvironmentPtr env = std::move(it->second);
    environments_.erase(it);
    return env;
}

std::vector<std::string> EnvironmentStore::ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(environments_.size());
    for (const auto& [id, env] : environments_) {
        result.push_back(id);
    }
    return result;
}

size_t EnvironmentStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return environments_.size();
}

// ============================================================================
// EnvironmentManager
// ============================================================================

EnvironmentManager::EnvironmentManager(EnvironmentStore& store, TestbedConfig config,
                                       std::shared_ptr<BinaryProvisioner> provisioner)
    : store_(store), config_(std::move(config)), provisioner_(std::move(provisioner)) {
    if (config_.cache_dir.empty()) {
        config_.cache_dir = resolve_cache_dir(config_);
    }
    if (!provisioner_ && config_.runtime_source != RuntimeSource::System) {
        ProvisionerOptions options;
        options.cache_dir = config_.cache_dir;
        options.catalogue = config_.catalogue;
        provisioner_ = std::make_shared<BinaryProvisioner>(std::move(options));
    }
}

EnvironmentManager::~EnvironmentManager() {
    cleanup_all();
}

Result<EnvironmentPtr> EnvironmentManager::fail_and_cleanup(Sandbox& sandbox, Error error) {
    spdlog::error("environment creation failed: {}", error.message());
    cleanup_sandbox(sandbox);
    return Result<EnvironmentPtr>::err(std::move(error));
}

Result<EnvironmentPtr> EnvironmentManager::create(const std::string& source,
                                                  const std::optional<std::string>& branch) {
    if (is_directory(source)) {
        if (branch) {
            spdlog::warn("ignoring branch '{}' for local source {}", *branch, source);
        }
        return create_from_path(source);
    }
    return create_from_github(source, branch);
}

Result<EnvironmentPtr> EnvironmentManager::create_from_path(const std::string& path) {
    if (!is_directory(path)) {
        return Result<EnvironmentPtr>::err(
            Error(ErrorCode::INVALID_SOURCE, "Source directory does not exist: " + path));
    }

    std::string id = generate_short_id(12);
    auto sandbox_result = create_sandbox("testbed-" + id + "-", config_.sandbox);
    if (sandbox_result.isErr()) {
        return Result<EnvironmentPtr>::err(sandbox_result.error());
    }
    Sandbox sandbox = std::move(sandbox_result.value());
    spdlog::info("creating environment {} from {}", id, path);

    auto copied = copy_tree(path, sandbox.work_dir);
    if (!copied.ok) {
        return fail_and_cleanup(sandbox, Error(ErrorCode::IO_ERROR,
                                               "Failed to copy project: " + copied.error));
    }
    if (is_directory_empty(sandbox.work_dir)) {
        return fail_and_cleanup(sandbox,
                                Error(ErrorCode::INVALID_SOURCE, "Project directory is empty: " + path));
    }

    auto hardened = harden_sandbox(sandbox);
    if (hardened.isErr()) {
        return fail_and_cleanup(sandbox, hardened.error());
    }

    auto runtime = detect_runtime(sandbox.work_dir);
    if (runtime.isErr()) {
        return fail_and_cleanup(sandbox, runtime.error());
    }
    spdlog::info("environment {}: detected runtime {}", id, runtime.value().name);

    ToolResolver tools(config_.runtime_source, provisioner_.get());
    auto installed = install_dependencies(sandbox, runtime.value(), tools, config_.timeouts.install);
    if (installed.isErr()) {
        return fail_and_cleanup(sandbox, installed.error());
    }

    auto env = std::make_shared<Environment>();
    env->id = id;
    env->runtime_config = runtime.value();
    env->created_at = get_current_timestamp();
    env->sandbox = std::move(sandbox);

    if (!store_.insert(env)) {
        return fail_and_cleanup(env->sandbox, Error(ErrorCode::SANDBOX_CREATE_FAILED,
                                                    "Duplicate environment id: " + id));
    }

    spdlog::info("environment {} ready at {}", id, env->sandbox.work_dir);
    return Result<EnvironmentPtr>::ok(env);
}

Result<EnvironmentPtr> EnvironmentManager::create_from_github(
    const std::string& url, const std::optional<std::string>& branch) {
    auto normalized = normalize_github_url(url);
    if (normalized.isErr()) {
        return Result<EnvironmentPtr>::err(normalized.error());
    }
    if (branch && !is_valid_branch_name(*branch)) {
        return Result<EnvironmentPtr>::err(
            Error(ErrorCode::INVALID_SOURCE, "Invalid branch name: " + *branch));
    }

    auto staging_result = create_sandbox("testbed-staging-", config_.sandbox);
    if (staging_result.isErr()) {
        return Result<EnvironmentPtr>::err(staging_result.error());
    }
    Sandbox staging = std::move(staging_result.value());

    spdlog::info("cloning {}{}", normalized.value(), branch ? " (branch " + *branch + ")" : "");
    auto cloned = clone_repository(staging, normalized.value(), branch, config_.timeouts.clone);
    if (cloned.isErr()) {
        cleanup_sandbox(staging);
        return Result<EnvironmentPtr>::err(cloned.error());
    }

    auto result = create_from_path(staging.work_dir);
    cleanup_sandbox(staging);
    return result;
}

std::vector<Framework> EnvironmentManager::detect_frameworks(const Environment& env) const {
    return testbed::detect_frameworks(env);
}

TestRunResult EnvironmentManager::run_tests(const std::string& id) {
    auto env = store_.get(id);
    if (!env) {
        return make_error_result("none", "Unknown environment: " + id);
    }
    return run_tests(*env);
}

TestRunResult EnvironmentManager::run_tests(const Environment& env) {
    auto frameworks = detect_frameworks(env);
    if (frameworks.empty()) {
        spdlog::warn("environment {}: no test frameworks detected", env.id);
        return aggregate_results({});
    }

    auto test_dirs = find_test_dirs(env.sandbox.work_dir, env.runtime_config.runtime);

    std::vector<TestRunResult> results;
    for (auto framework : frameworks) {
        auto runner = make_runner(framework);
        RunConfig run_config{framework, env, test_dirs, config_.coverage, config_.timeouts.test};

        spdlog::info("environment {}: running {}", env.id, framework_name(framework));
        try {
            results.push_back(runner->run(run_config));
        } catch (const std::exception& e) {
            spdlog::error("{} adapter failed: {}", framework_name(framework), e.what());
            results.push_back(make_error_result(framework_name(framework), e.what()));
        }

        const auto& last = results.back();
        spdlog::info("environment {}: {} finished, {} passed, {} failed, {} skipped",
                     env.id, last.runner, last.summary.passed, last.summary.failed,
                     last.summary.skipped);
    }

    return aggregate_results(results);
}

Result<void> EnvironmentManager::cleanup(const std::string& id) {
    auto env = store_.remove(id);
    if (!env) {
        return Result<void>::err(
            Error(ErrorCode::ENVIRONMENT_NOT_FOUND, "Unknown environment: " + id));
    }
    cleanup_sandbox(env->sandbox);
    spdlog::info("environment {} removed", id);
    return Result<void>::ok();
}

void EnvironmentManager::cleanup_all() noexcept {
    for (const auto& id : store_.ids()) {
        if (auto env = store_.remove(id)) {
            cleanup_sandbox(env->sandbox);
        }
    }
}

} // namespace testbed
