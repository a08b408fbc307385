#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace testbed {

// ============================================================================
// Platform Detection
// ============================================================================

enum class Platform {
    Linux,
    macOS,
    Windows,
    Unknown
};

enum class Architecture {
    X64,
    Arm64,
    Unknown
};

Platform get_current_platform();
Architecture get_current_architecture();

const char* platform_name(Platform platform);
const char* architecture_name(Architecture arch);

// ============================================================================
// Filesystem Operations
// ============================================================================

struct FsResult {
    bool ok = false;
    std::string error;
};

// Write content atomically using temp file + fsync + rename
FsResult atomic_write_file(const std::string& path, const std::string& content);
FsResult atomic_write_file(const std::string& path, const std::vector<uint8_t>& content);

// Recursively copy a directory tree. Symlinks are copied as symlinks.
FsResult copy_tree(const std::string& src, const std::string& dst);

// Recursively restrict permissions to the owner (directories 0700,
// files keep only their owner bits). Symlinks are not followed.
FsResult restrict_to_owner(const std::string& root);

// Recursively add owner rwx to directories and owner rw to files so a
// tree can be removed even if the project marked parts read-only.
FsResult make_owner_writable(const std::string& root);

std::optional<std::string> read_file(const std::string& path);

// List regular files under root as portable paths relative to root.
// Directories whose name appears in skip_dirs are not descended into.
std::vector<std::string> list_files_recursive(const std::string& root,
                                              const std::vector<std::string>& skip_dirs = {});

// ============================================================================
// Path Utilities
// ============================================================================

// Convert a path to use forward slashes
std::string to_portable_path(const std::string& path);

std::string get_parent_directory(const std::string& path);
std::string get_filename(const std::string& path);
std::string join_path(const std::string& base, const std::string& rel);

bool is_directory(const std::string& path);
bool is_regular_file(const std::string& path);
bool is_executable(const std::string& path);
bool is_directory_empty(const std::string& path);

bool create_directories(const std::string& path);
bool remove_directory(const std::string& path);

// True if child is root itself or lies lexically beneath it
bool is_path_within(const std::string& root, const std::string& child);

enum class PathError {
    None,
    ContainsNul,
    AbsoluteNotAllowed,
    EscapesRoot,
};

struct PathResult {
    bool ok;
    std::string path;  // normalized path under root when ok
    PathError error;
};

// Normalize a path relative to a root without following symlinks.
// - Rejects NUL bytes
// - Rejects absolute relative_path when allow_absolute is false
// - Collapses "." and ".." segments
// - Fails if resulting path would escape root
PathResult normalize_under_root(const std::string& root,
                                const std::string& relative_path,
                                bool allow_absolute = false);

// ============================================================================
// Environment
// ============================================================================

std::optional<std::string> get_env(const std::string& name);

char get_path_list_separator();

// Split a PATH-style list, dropping empty entries
std::vector<std::string> split_path_list(const std::string& value);

// Locate an executable by name in the given directories.
// Names containing a separator are checked as-is.
std::optional<std::string> find_executable(const std::string& name,
                                           const std::vector<std::string>& search_dirs);

// Locate an executable on the host process PATH
std::optional<std::string> find_host_executable(const std::string& name);

// Get current timestamp as RFC3339 string
std::string get_current_timestamp();

// Generate a short base58 identifier suitable for directory names
std::string generate_short_id(size_t length = 12);

} // namespace testbed
