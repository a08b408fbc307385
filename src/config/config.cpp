#include "testbed/config.hpp"
#include "testbed/logging.hpp"
#include "testbed/platform.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <set>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace testbed {

namespace {

constexpr const char* kConfigSchema = "testbed.config.v1";

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

std::vector<std::string> get_string_array(const nlohmann::json& j, const std::string& key) {
    std::vector<std::string> result;
    if (j.contains(key) && j[key].is_array()) {
        for (const auto& elem : j[key]) {
            if (elem.is_string()) {
                result.push_back(elem.get<std::string>());
            }
        }
    }
    return result;
}

std::optional<Platform> platform_from_name(const std::string& name) {
    for (auto p : {Platform::Linux, Platform::macOS, Platform::Windows}) {
        if (name == platform_name(p)) return p;
    }
    return std::nullopt;
}

std::optional<Architecture> arch_from_name(const std::string& name) {
    for (auto a : {Architecture::X64, Architecture::Arm64}) {
        if (name == architecture_name(a)) return a;
    }
    return std::nullopt;
}

void warn_unknown_keys(const nlohmann::json& j, const std::set<std::string>& known,
                       const std::string& prefix, std::vector<std::string>& warnings) {
    for (auto& [key, val] : j.items()) {
        if (known.count(key) == 0) {
            warnings.push_back("unknown key: " + prefix + key);
        }
    }
}

// Returns false and sets error when the value is present but unusable
bool read_timeout(const nlohmann::json& timeouts, const std::string& key,
                  std::chrono::seconds& out, std::string& error) {
    if (!timeouts.contains(key)) return true;
    const auto& v = timeouts[key];
    if (!v.is_number_integer() || v.get<long long>() < 0) {
        error = "timeouts." + key + " must be a non-negative integer";
        return false;
    }
    out = std::chrono::seconds(v.get<long long>());
    return true;
}

void parse_binary_entry(const std::string& name, const nlohmann::json& entry,
                        std::map<std::string, BinarySpec>& catalogue,
                        std::vector<std::string>& warnings) {
    static const std::set<std::string> kKnown = {
        "version", "url_template", "checksum_template", "binary_path", "platforms", "archs",
    };
    warn_unknown_keys(entry, kKnown, "binaries." + name + ".", warnings);

    auto it = catalogue.find(name);
    BinarySpec spec;
    if (it != catalogue.end()) {
        spec = it->second;
    } else {
        spec.name = name;
        // New binaries default to the host's own platform spelling
        for (auto p : {Platform::Linux, Platform::macOS, Platform::Windows}) {
            spec.platform_names[p] = platform_name(p);
        }
        for (auto a : {Architecture::X64, Architecture::Arm64}) {
            spec.arch_names[a] = architecture_name(a);
        }
    }

    if (auto v = get_string(entry, "version")) spec.version = trim(*v);
    if (auto v = get_string(entry, "url_template")) spec.url_template = *v;
    if (auto v = get_string(entry, "checksum_template")) spec.checksum_template = *v;
    if (auto v = get_string(entry, "binary_path")) spec.binary_path = *v;

    if (entry.contains("platforms") && entry["platforms"].is_object()) {
        for (auto& [key, val] : entry["platforms"].items()) {
            auto platform = platform_from_name(key);
            if (!platform || !val.is_string()) {
                warnings.push_back("binaries." + name + ".platforms: ignoring " + key);
                continue;
            }
            spec.platform_names[*platform] = val.get<std::string>();
        }
    }
    if (entry.contains("archs") && entry["archs"].is_object()) {
        for (auto& [key, val] : entry["archs"].items()) {
            auto arch = arch_from_name(key);
            if (!arch || !val.is_string()) {
                warnings.push_back("binaries." + name + ".archs: ignoring " + key);
                continue;
            }
            spec.arch_names[*arch] = val.get<std::string>();
        }
    }

    if (spec.version.empty() || spec.url_template.empty() ||
        spec.checksum_template.empty() || spec.binary_path.empty()) {
        warnings.push_back("binaries." + name +
                           ": incomplete entry ignored (version, url_template, "
                           "checksum_template and binary_path are required)");
        return;
    }
    catalogue[name] = spec;
}

} // namespace

ConfigParseResult parse_config(const std::string& json_str, const std::string& source_path) {
    ConfigParseResult result;
    result.config.source_path = source_path;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }

        // $schema (REQUIRED)
        if (auto schema = get_string(j, "$schema")) {
            result.config.schema = trim(*schema);
        } else {
            result.error = "$schema missing";
            return result;
        }

        if (result.config.schema != kConfigSchema) {
            result.error = std::string("$schema mismatch: expected ") + kConfigSchema;
            return result;
        }

        static const std::set<std::string> kKnown = {
            "$schema", "cache_dir", "log_level", "runtime_source", "borrowed_binaries",
            "passthrough_env", "timeouts", "coverage", "binaries",
        };
        warn_unknown_keys(j, kKnown, "", result.warnings);

        if (auto dir = get_string(j, "cache_dir")) {
            result.config.cache_dir = trim(*dir);
        }

        if (auto level = get_string(j, "log_level")) {
            if (is_valid_log_level(*level)) {
                result.config.log_level = *level;
            } else {
                result.warnings.push_back("invalid log_level: " + *level);
            }
        }

        if (auto source = get_string(j, "runtime_source")) {
            auto parsed = parse_runtime_source(*source);
            if (!parsed) {
                result.error = "invalid runtime_source: " + *source;
                return result;
            }
            result.config.runtime_source = *parsed;
        }

        if (j.contains("borrowed_binaries")) {
            result.config.sandbox.borrowed_binaries = get_string_array(j, "borrowed_binaries");
        }
        if (j.contains("passthrough_env")) {
            result.config.sandbox.passthrough_env = get_string_array(j, "passthrough_env");
        }

        if (j.contains("timeouts")) {
            const auto& t = j["timeouts"];
            if (!t.is_object()) {
                result.error = "timeouts must be an object";
                return result;
            }
            warn_unknown_keys(t, {"install", "test", "clone"}, "timeouts.", result.warnings);
            auto& timeouts = result.config.timeouts;
            if (!read_timeout(t, "install", timeouts.install, result.error) ||
                !read_timeout(t, "test", timeouts.test, result.error) ||
                !read_timeout(t, "clone", timeouts.clone, result.error)) {
                return result;
            }
        }

        if (j.contains("coverage")) {
            if (j["coverage"].is_boolean()) {
                result.config.coverage = j["coverage"].get<bool>();
            } else {
                result.warnings.push_back("coverage must be a boolean");
            }
        }

        if (j.contains("binaries") && j["binaries"].is_object()) {
            for (auto& [name, entry] : j["binaries"].items()) {
                if (!entry.is_object()) {
                    result.warnings.push_back("binaries." + name + ": expected an object");
                    continue;
                }
                parse_binary_entry(name, entry, result.config.catalogue, result.warnings);
            }
        }

        result.ok = true;
        return result;

    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("parse error: ") + e.what();
        return result;
    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("JSON error: ") + e.what();
        return result;
    }
}

Result<std::optional<std::string>> find_config_file(const std::optional<std::string>& explicit_path) {
    using R = Result<std::optional<std::string>>;

    if (explicit_path) {
        if (!is_regular_file(*explicit_path)) {
            return R::err(Error(ErrorCode::CONFIG_INVALID,
                                "config file not found: " + *explicit_path));
        }
        return R::ok(*explicit_path);
    }

    if (auto env_path = get_env("TESTBED_CONFIG")) {
        if (!env_path->empty()) {
            if (!is_regular_file(*env_path)) {
                return R::err(Error(ErrorCode::CONFIG_INVALID,
                                    "TESTBED_CONFIG points to a missing file: " + *env_path));
            }
            return R::ok(*env_path);
        }
    }

    std::vector<std::string> candidates;
    if (auto xdg = get_env("XDG_CONFIG_HOME")) {
        if (!xdg->empty()) candidates.push_back(join_path(*xdg, "testbed/config.json"));
    }
    if (auto home = get_env("HOME")) {
        if (!home->empty()) candidates.push_back(join_path(*home, ".config/testbed/config.json"));
    }

    for (const auto& candidate : candidates) {
        if (is_regular_file(candidate)) {
            return R::ok(candidate);
        }
    }
    return R::ok(std::nullopt);
}

std::string resolve_cache_dir(const TestbedConfig& config) {
    if (!config.cache_dir.empty()) {
        return config.cache_dir;
    }
    if (auto dir = get_env("TESTBED_CACHE_DIR")) {
        if (!dir->empty()) return *dir;
    }
    if (auto xdg = get_env("XDG_CACHE_HOME")) {
        if (!xdg->empty()) return join_path(*xdg, "testbed");
    }
    if (auto home = get_env("HOME")) {
        if (!home->empty()) return join_path(*home, ".cache/testbed");
    }
    std::error_code ec;
    auto tmp = std::filesystem::temp_directory_path(ec);
    return join_path(ec ? "/tmp" : tmp.string(), "testbed-cache");
}

Result<TestbedConfig> load_config(const std::optional<std::string>& explicit_path) {
    auto located = find_config_file(explicit_path);
    if (located.isErr()) {
        return Result<TestbedConfig>::err(located.error());
    }

    TestbedConfig config;
    if (auto path = located.value()) {
        auto content = read_file(*path);
        if (!content) {
            return Result<TestbedConfig>::err(
                Error(ErrorCode::CONFIG_INVALID, "cannot read config file: " + *path));
        }

        auto parsed = parse_config(*content, *path);
        if (!parsed.ok) {
            return Result<TestbedConfig>::err(
                Error(ErrorCode::CONFIG_INVALID, *path + ": " + parsed.error));
        }
        for (const auto& w : parsed.warnings) {
            spdlog::warn("{}: {}", *path, w);
        }
        config = std::move(parsed.config);
        spdlog::debug("loaded config from {}", *path);
    }

    config.cache_dir = resolve_cache_dir(config);
    return Result<TestbedConfig>::ok(std::move(config));
}

} // namespace testbed
