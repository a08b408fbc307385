#include "testbed/platform.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace testbed {

namespace fs = std::filesystem;

Platform get_current_platform() {
#if defined(__APPLE__)
    return Platform::macOS;
#elif defined(_WIN32)
    return Platform::Windows;
#elif defined(__linux__)
    return Platform::Linux;
#else
    return Platform::Unknown;
#endif
}

Architecture get_current_architecture() {
#if defined(__x86_64__) || defined(_M_X64)
    return Architecture::X64;
#elif defined(__aarch64__) || defined(_M_ARM64)
    return Architecture::Arm64;
#else
    return Architecture::Unknown;
#endif
}

const char* platform_name(Platform platform) {
    switch (platform) {
        case Platform::Linux: return "linux";
        case Platform::macOS: return "darwin";
        case Platform::Windows: return "windows";
        case Platform::Unknown: break;
    }
    return "unknown";
}

const char* architecture_name(Architecture arch) {
    switch (arch) {
        case Architecture::X64: return "x64";
        case Architecture::Arm64: return "arm64";
        case Architecture::Unknown: break;
    }
    return "unknown";
}

namespace {

bool fsync_fd(int fd) {
#ifdef __APPLE__
    return fcntl(fd, F_FULLFSYNC, 0) == 0;
#else
    return fsync(fd) == 0;
#endif
}

void fsync_directory(const std::string& dir_path) {
    int dir_fd = open(dir_path.c_str(), O_RDONLY);
    if (dir_fd < 0) return;
    fsync_fd(dir_fd);
    close(dir_fd);
}

std::string random_hex(size_t count) {
    static const char hex_chars[] = "0123456789abcdef";
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);
    std::string out;
    for (size_t i = 0; i < count; ++i) {
        out += hex_chars[static_cast<size_t>(dis(gen))];
    }
    return out;
}

} // namespace

FsResult atomic_write_file(const std::string& path, const std::string& content) {
    return atomic_write_file(path, std::vector<uint8_t>(content.begin(), content.end()));
}

FsResult atomic_write_file(const std::string& path, const std::vector<uint8_t>& content) {
    FsResult result;

    std::string dir_path = get_parent_directory(path);
    std::string temp_path = path + ".tmp." + random_hex(8);

    int fd = open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0600);
    if (fd < 0) {
        result.error = "failed to create temp file: " + std::string(strerror(errno));
        return result;
    }

    ssize_t written = write(fd, content.data(), content.size());
    if (written < 0 || static_cast<size_t>(written) != content.size()) {
        close(fd);
        unlink(temp_path.c_str());
        result.error = "failed to write content";
        return result;
    }

    if (!fsync_fd(fd)) {
        close(fd);
        unlink(temp_path.c_str());
        result.error = "failed to fsync temp file";
        return result;
    }

    close(fd);

    if (rename(temp_path.c_str(), path.c_str()) != 0) {
        unlink(temp_path.c_str());
        result.error = "failed to rename temp file: " + std::string(strerror(errno));
        return result;
    }

    if (!dir_path.empty()) {
        fsync_directory(dir_path);
    }

    result.ok = true;
    return result;
}

FsResult copy_tree(const std::string& src, const std::string& dst) {
    FsResult result;
    std::error_code ec;

    if (!fs::is_directory(src, ec)) {
        result.error = "source is not a directory: " + src;
        return result;
    }

    fs::create_directories(dst, ec);
    if (ec) {
        result.error = "failed to create " + dst + ": " + ec.message();
        return result;
    }

    fs::copy(src, dst,
             fs::copy_options::recursive | fs::copy_options::copy_symlinks |
                 fs::copy_options::overwrite_existing,
             ec);
    if (ec) {
        result.error = "failed to copy " + src + " to " + dst + ": " + ec.message();
        return result;
    }

    result.ok = true;
    return result;
}

FsResult restrict_to_owner(const std::string& root) {
    FsResult result;
    std::error_code ec;

    auto restrict_one = [&](const fs::path& p) -> bool {
        auto st = fs::symlink_status(p, ec);
        if (ec) return false;
        if (fs::is_symlink(st)) return true;
        if (fs::is_directory(st)) {
            fs::permissions(p, fs::perms::owner_all, fs::perm_options::replace, ec);
        } else {
            auto owner_bits = st.permissions() & fs::perms::owner_all;
            fs::permissions(p, owner_bits, fs::perm_options::replace, ec);
        }
        return !ec;
    };

    if (!restrict_one(root)) {
        result.error = "failed to restrict " + root + ": " + ec.message();
        return result;
    }

    for (auto it = fs::recursive_directory_iterator(root, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (!restrict_one(it->path())) {
            result.error = "failed to restrict " + it->path().string() + ": " + ec.message();
            return result;
        }
    }
    if (ec) {
        result.error = "failed to walk " + root + ": " + ec.message();
        return result;
    }

    result.ok = true;
    return result;
}

FsResult make_owner_writable(const std::string& root) {
    FsResult result;
    std::error_code ec;

    auto open_one = [&](const fs::path& p) {
        auto st = fs::symlink_status(p, ec);
        if (ec || fs::is_symlink(st)) return;
        auto bits = fs::is_directory(st) ? fs::perms::owner_all
                                         : (fs::perms::owner_read | fs::perms::owner_write);
        fs::permissions(p, bits, fs::perm_options::add, ec);
    };

    if (!fs::exists(fs::symlink_status(root, ec))) {
        result.ok = true;
        return result;
    }

    open_one(root);
    for (auto it = fs::recursive_directory_iterator(root, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        open_one(it->path());
    }

    result.ok = !ec;
    if (ec) result.error = ec.message();
    return result;
}

std::optional<std::string> read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    std::stringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

std::vector<std::string> list_files_recursive(const std::string& root,
                                              const std::vector<std::string>& skip_dirs) {
    std::vector<std::string> files;
    std::error_code ec;

    if (!fs::is_directory(root, ec)) return files;

    for (auto it = fs::recursive_directory_iterator(root, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        const auto& entry = *it;
        std::string name = entry.path().filename().string();

        if (entry.is_directory(ec)) {
            if (std::find(skip_dirs.begin(), skip_dirs.end(), name) != skip_dirs.end()) {
                it.disable_recursion_pending();
            }
            continue;
        }

        if (entry.is_regular_file(ec)) {
            files.push_back(to_portable_path(
                fs::relative(entry.path(), root, ec).string()));
        }
    }

    std::sort(files.begin(), files.end());
    return files;
}

std::string to_portable_path(const std::string& path) {
    std::string result = path;
    std::replace(result.begin(), result.end(), '\\', '/');
    return result;
}

std::string get_parent_directory(const std::string& path) {
    return fs::path(path).parent_path().string();
}

std::string get_filename(const std::string& path) {
    return fs::path(path).filename().string();
}

std::string join_path(const std::string& base, const std::string& rel) {
    fs::path p(base);
    p /= rel;
    return to_portable_path(p.string());
}

bool is_directory(const std::string& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

bool is_regular_file(const std::string& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

bool is_executable(const std::string& path) {
    return is_regular_file(path) && access(path.c_str(), X_OK) == 0;
}

bool is_directory_empty(const std::string& path) {
    std::error_code ec;
    return fs::is_empty(path, ec) || ec;
}

bool create_directories(const std::string& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    return !ec;
}

bool remove_directory(const std::string& path) {
    std::error_code ec;
    fs::remove_all(path, ec);
    return !ec;
}

bool is_path_within(const std::string& root, const std::string& child) {
    auto lex_root = fs::path(root).lexically_normal();
    auto lex_child = fs::path(child).lexically_normal();

    auto root_it = lex_root.begin();
    auto child_it = lex_child.begin();
    for (; root_it != lex_root.end() && child_it != lex_child.end(); ++root_it, ++child_it) {
        if (root_it->empty()) break;  // trailing separator
        if (*root_it != *child_it) return false;
    }
    return root_it == lex_root.end() || root_it->empty();
}

std::optional<std::string> get_env(const std::string& name) {
    const char* val = std::getenv(name.c_str());
    if (val) {
        return std::string(val);
    }
    return std::nullopt;
}

char get_path_list_separator() {
#ifdef _WIN32
    return ';';
#else
    return ':';
#endif
}

std::vector<std::string> split_path_list(const std::string& value) {
    std::vector<std::string> parts;
    std::string current;
    std::istringstream ss(value);
    while (std::getline(ss, current, get_path_list_separator())) {
        if (!current.empty()) parts.push_back(current);
    }
    return parts;
}

std::optional<std::string> find_executable(const std::string& name,
                                           const std::vector<std::string>& search_dirs) {
    if (name.empty()) return std::nullopt;

    if (name.find('/') != std::string::npos) {
        if (is_executable(name)) return name;
        return std::nullopt;
    }

    for (const auto& dir : search_dirs) {
        std::string candidate = join_path(dir, name);
        // is_regular_file follows symlinks, so borrowed links resolve too
        if (is_executable(candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

std::optional<std::string> find_host_executable(const std::string& name) {
    auto path = get_env("PATH");
    if (!path) return std::nullopt;
    return find_executable(name, split_path_list(*path));
}

std::string get_current_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

    std::tm tm_buf;
    gmtime_r(&time_t_now, &tm_buf);

    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_buf);
    return buf;
}

std::string generate_short_id(size_t length) {
    static const char alphabet[] =
        "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<size_t> dis(0, sizeof(alphabet) - 2);

    std::string id;
    id.reserve(length);
    for (size_t i = 0; i < length; ++i) {
        id.push_back(alphabet[dis(gen)]);
    }
    return id;
}

} // namespace testbed
