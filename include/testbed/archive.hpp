#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace testbed {

// ============================================================================
// Release Archive Reading
// ============================================================================
//
// Runtime binaries ship inside .tar.gz (node, uv) or .zip (bun) release
// archives. Only reading is supported, and only the pieces needed to pull
// a single executable out of an archive held in memory.

enum class ArchiveFormat {
    TarGz,
    Zip,
    Unknown
};

// Detect the format from magic bytes
ArchiveFormat detect_archive_format(const std::vector<uint8_t>& data);

// Detect the format from a filename extension (.tar.gz, .tgz, .zip)
ArchiveFormat archive_format_from_name(const std::string& filename);

struct PathValidation {
    bool safe = false;
    std::string normalized_path;
    std::string error;
};

// Reject absolute entries and any ".." component
PathValidation validate_archive_path(const std::string& entry_path);

struct GunzipResult {
    bool ok = false;
    std::string error;
    std::vector<uint8_t> data;
};

GunzipResult gzip_decompress(const std::vector<uint8_t>& data);

struct ArchiveListing {
    bool ok = false;
    std::string error;
    std::vector<std::string> entries;  // regular files only
};

ArchiveListing list_archive(const std::vector<uint8_t>& archive);

struct MemberResult {
    bool ok = false;
    std::string error;
    std::string member_path;     // path of the matched entry
    uint32_t mode = 0;           // permission bits recorded in the archive
    std::vector<uint8_t> data;
};

/**
 * Extract one regular file from an archive.
 *
 * The member matches when its path equals member_suffix or ends with
 * "/" + member_suffix, so "bin/node" finds "node-v20-linux-x64/bin/node".
 * Every entry examined is path-validated; an unsafe entry fails the
 * whole extraction.
 */
MemberResult extract_member(const std::vector<uint8_t>& archive,
                            const std::string& member_suffix);

} // namespace testbed
