#include "testbed/provisioner.hpp"
#include "testbed/archive.hpp"
#include "testbed/semver.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>

namespace fs = std::filesystem;

namespace testbed {

namespace {

std::string binary_filename(const BinarySpec& spec) {
    return get_filename(spec.binary_path);
}

std::string url_filename(const std::string& url) {
    auto end = url.find_first_of("?#");
    std::string path = url.substr(0, end);
    auto slash = path.rfind('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

} // namespace

// ============================================================================
// Catalogue
// ============================================================================

std::map<std::string, BinarySpec> default_binary_catalogue() {
    std::map<std::string, BinarySpec> catalogue;

    BinarySpec node;
    node.name = "node";
    node.version = "20.10.0";
    node.url_template =
        "https://nodejs.org/dist/v{version}/node-v{version}-{platform}-{arch}.tar.gz";
    node.checksum_template = "https://nodejs.org/dist/v{version}/SHASUMS256.txt";
    node.binary_path = "bin/node";
    node.platform_names = {{Platform::Linux, "linux"}, {Platform::macOS, "darwin"}};
    node.arch_names = {{Architecture::X64, "x64"}, {Architecture::Arm64, "arm64"}};
    catalogue[node.name] = node;

    BinarySpec bun;
    bun.name = "bun";
    bun.version = "1.0.21";
    bun.url_template =
        "https://github.com/oven-sh/bun/releases/download/bun-v{version}/bun-{platform}-{arch}.zip";
    bun.checksum_template =
        "https://github.com/oven-sh/bun/releases/download/bun-v{version}/SHASUMS256.txt";
    bun.binary_path = "bun";
    bun.platform_names = {{Platform::Linux, "linux"}, {Platform::macOS, "darwin"}};
    bun.arch_names = {{Architecture::X64, "x64"}, {Architecture::Arm64, "aarch64"}};
    catalogue[bun.name] = bun;

    BinarySpec uv;
    uv.name = "uv";
    uv.version = "0.1.13";
    uv.url_template =
        "https://github.com/astral-sh/uv/releases/download/{version}/uv-{arch}-{platform}.tar.gz";
    uv.checksum_template =
        "https://github.com/astral-sh/uv/releases/download/{version}/checksums.txt";
    uv.binary_path = "uv";
    uv.platform_names = {{Platform::Linux, "unknown-linux-gnu"},
                         {Platform::macOS, "apple-darwin"}};
    uv.arch_names = {{Architecture::X64, "x86_64"}, {Architecture::Arm64, "aarch64"}};
    catalogue[uv.name] = uv;

    return catalogue;
}

std::string expand_template(const std::string& tmpl,
                            const std::map<std::string, std::string>& vars) {
    std::string out;
    size_t i = 0;
    while (i < tmpl.size()) {
        if (tmpl[i] == '{') {
            auto close = tmpl.find('}', i + 1);
            if (close != std::string::npos) {
                auto it = vars.find(tmpl.substr(i + 1, close - i - 1));
                if (it != vars.end()) {
                    out += it->second;
                    i = close + 1;
                    continue;
                }
            }
        }
        out += tmpl[i++];
    }
    return out;
}

// ============================================================================
// BinaryProvisioner
// ============================================================================

BinaryProvisioner::BinaryProvisioner(ProvisionerOptions options)
    : options_(std::move(options)) {
    if (!options_.fetch) {
        options_.fetch = fetch_https;
    }
}

bool BinaryProvisioner::knows(const std::string& name) const {
    return options_.catalogue.count(name) > 0;
}

const BinarySpec* BinaryProvisioner::spec(const std::string& name) const {
    auto it = options_.catalogue.find(name);
    return it == options_.catalogue.end() ? nullptr : &it->second;
}

std::string BinaryProvisioner::version_dir(const BinarySpec& spec) const {
    return join_path(join_path(join_path(options_.cache_dir, "binaries"), spec.name),
                     spec.version);
}

std::optional<std::string> BinaryProvisioner::cached(const std::string& name) const {
    const BinarySpec* s = spec(name);
    if (!s) return std::nullopt;
    std::lock_guard<std::mutex> lock(mutex_);
    return cached_locked(*s);
}

std::optional<std::string> BinaryProvisioner::cached_locked(const BinarySpec& spec) const {
    std::string binary = join_path(version_dir(spec), binary_filename(spec));
    if (!is_executable(binary)) return std::nullopt;

    // Sidecar lists the archive digest, then the installed binary's
    auto sidecar = read_file(binary + ".sha256");
    if (!sidecar) return std::nullopt;
    auto expected = find_checksum(parse_checksum_manifest(*sidecar), binary_filename(spec));
    if (!expected) return std::nullopt;

    auto actual = compute_sha256_file(binary);
    if (!actual.ok || actual.hex_digest != *expected) {
        spdlog::warn("cached {} {} does not match its recorded digest", spec.name, spec.version);
        return std::nullopt;
    }
    return binary;
}

Result<std::string> BinaryProvisioner::ensure(const std::string& name) {
    const BinarySpec* found = spec(name);
    if (!found) {
        return Result<std::string>::err(Error(ErrorCode::UNKNOWN_BINARY,
                                              "unknown binary: " + name));
    }
    const BinarySpec& s = *found;

    std::lock_guard<std::mutex> lock(mutex_);

    if (auto hit = cached_locked(s)) {
        spdlog::debug("{} {} found in cache: {}", s.name, s.version, *hit);
        return Result<std::string>::ok(*hit);
    }

    auto platform = s.platform_names.find(options_.platform);
    auto arch = s.arch_names.find(options_.arch);
    if (platform == s.platform_names.end() || arch == s.arch_names.end()) {
        return Result<std::string>::err(Error(
            ErrorCode::UNSUPPORTED_PLATFORM,
            std::string("no ") + s.name + " build for " + platform_name(options_.platform) +
                "-" + architecture_name(options_.arch)));
    }

    std::map<std::string, std::string> vars = {
        {"version", s.version},
        {"platform", platform->second},
        {"arch", arch->second},
    };
    std::string archive_url = expand_template(s.url_template, vars);
    std::string checksum_url = expand_template(s.checksum_template, vars);
    std::string archive_name = url_filename(archive_url);

    spdlog::info("downloading {} {} from {}", s.name, s.version, archive_url);

    auto archive = options_.fetch(archive_url);
    if (!archive.ok) {
        return Result<std::string>::err(
            Error(ErrorCode::BINARY_FETCH_FAILED, archive.error).withContext(archive_url));
    }

    auto manifest = options_.fetch(checksum_url);
    if (!manifest.ok) {
        return Result<std::string>::err(
            Error(ErrorCode::BINARY_FETCH_FAILED, manifest.error).withContext(checksum_url));
    }

    auto entries = parse_checksum_manifest(
        std::string(manifest.data.begin(), manifest.data.end()));
    auto expected = find_checksum(entries, archive_name);
    if (!expected) {
        return Result<std::string>::err(Error(
            ErrorCode::CHECKSUM_NOT_FOUND,
            "no checksum for " + archive_name + " in " + checksum_url));
    }

    auto verified = verify_sha256(archive.data, *expected);
    if (!verified.ok) {
        spdlog::error("checksum verification failed for {}: {}", archive_name, verified.error);
        return Result<std::string>::err(
            Error(ErrorCode::CHECKSUM_MISMATCH, verified.error).withContext(archive_name));
    }

    auto member = extract_member(archive.data, s.binary_path);
    if (!member.ok) {
        return Result<std::string>::err(
            Error(ErrorCode::ARCHIVE_INVALID, member.error).withContext(archive_name));
    }

    std::string dir = version_dir(s);
    if (!create_directories(dir)) {
        return Result<std::string>::err(
            Error(ErrorCode::IO_ERROR, "failed to create cache directory: " + dir));
    }

    std::string binary = join_path(dir, binary_filename(s));
    auto written = atomic_write_file(binary, member.data);
    if (!written.ok) {
        return Result<std::string>::err(
            Error(ErrorCode::IO_ERROR, written.error).withContext(binary));
    }

    std::error_code ec;
    fs::permissions(binary,
                    fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                        fs::perms::others_read | fs::perms::others_exec,
                    fs::perm_options::replace, ec);
    if (ec) {
        return Result<std::string>::err(Error(
            ErrorCode::PERMISSION_DENIED, "failed to mark executable: " + ec.message()));
    }

    auto installed = compute_sha256(member.data);
    if (!installed.ok) {
        return Result<std::string>::err(Error(ErrorCode::IO_ERROR, installed.error));
    }
    auto sidecar = atomic_write_file(binary + ".sha256",
                                     verified.actual_digest + "  " + archive_name + "\n" +
                                         installed.hex_digest + "  " + binary_filename(s) + "\n");
    if (!sidecar.ok) {
        return Result<std::string>::err(
            Error(ErrorCode::IO_ERROR, sidecar.error).withContext(binary + ".sha256"));
    }

    size_t evicted = evict_stale(s);
    if (evicted > 0) {
        spdlog::info("evicted {} stale {} version(s)", evicted, s.name);
    }

    spdlog::info("{} {} installed at {}", s.name, s.version, binary);
    return Result<std::string>::ok(binary);
}

size_t BinaryProvisioner::evict_stale(const BinarySpec& spec) {
    std::string base = join_path(join_path(options_.cache_dir, "binaries"), spec.name);
    std::error_code ec;
    if (!fs::is_directory(base, ec)) return 0;

    std::vector<std::string> versions;
    for (const auto& entry : fs::directory_iterator(base, ec)) {
        if (!entry.is_directory(ec)) continue;
        std::string name = entry.path().filename().string();
        if (name != spec.version) versions.push_back(name);
    }

    // Oldest first; unparseable directories are leftovers and go too
    size_t removed = 0;
    for (const auto& name : sort_versions(versions)) {
        bool stale = !parse_version(name) || is_older_version(name, spec.version);
        if (!stale) continue;

        std::string path = join_path(base, name);
        spdlog::debug("evicting cached {} {}", spec.name, name);
        fs::remove_all(path, ec);
        if (!ec) {
            removed++;
        } else {
            spdlog::warn("failed to evict {}: {}", path, ec.message());
        }
    }

    return removed;
}

} // namespace testbed
