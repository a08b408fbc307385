#include "testbed/archive.hpp"

#include <algorithm>
#include <cstring>
#include <filesystem>
#include <functional>
#include <zlib.h>

namespace fs = std::filesystem;

namespace testbed {

// ============================================================================
// Tar Format Constants (POSIX ustar)
// ============================================================================

static constexpr size_t TAR_BLOCK_SIZE = 512;
static constexpr size_t TAR_NAME_SIZE = 100;
static constexpr size_t TAR_MODE_SIZE = 8;
static constexpr size_t TAR_SIZE_SIZE = 12;
static constexpr size_t TAR_PREFIX_SIZE = 155;

static constexpr char TAR_REGTYPE = '0';
static constexpr char TAR_AREGTYPE = '\0';
static constexpr char TAR_GNU_LONGNAME = 'L';
static constexpr char TAR_PAX_HEADER = 'x';

#pragma pack(push, 1)
struct TarHeader {
    char name[TAR_NAME_SIZE];       // 0
    char mode[TAR_MODE_SIZE];       // 100
    char uid[8];                    // 108
    char gid[8];                    // 116
    char size[TAR_SIZE_SIZE];       // 124
    char mtime[12];                 // 136
    char chksum[8];                 // 148
    char typeflag;                  // 156
    char linkname[100];             // 157
    char magic[6];                  // 257
    char version[2];                // 263
    char uname[32];                 // 265
    char gname[32];                 // 297
    char devmajor[8];               // 329
    char devminor[8];               // 337
    char prefix[TAR_PREFIX_SIZE];   // 345
    char padding[12];               // 500
};
#pragma pack(pop)

static_assert(sizeof(TarHeader) == TAR_BLOCK_SIZE, "TarHeader must be 512 bytes");

// ============================================================================
// Zip Format Constants
// ============================================================================

static constexpr uint32_t ZIP_LOCAL_SIG = 0x04034b50;
static constexpr uint32_t ZIP_CENTRAL_SIG = 0x02014b50;
static constexpr uint32_t ZIP_EOCD_SIG = 0x06054b50;
static constexpr size_t ZIP_EOCD_SIZE = 22;
static constexpr size_t ZIP_CENTRAL_SIZE = 46;
static constexpr size_t ZIP_LOCAL_SIZE = 30;
static constexpr uint16_t ZIP_STORED = 0;
static constexpr uint16_t ZIP_DEFLATED = 8;

// ============================================================================
// Helper Functions
// ============================================================================

namespace {

uint64_t parse_octal(const char* data, size_t size) {
    uint64_t result = 0;
    size_t i = 0;
    while (i < size && data[i] == ' ') ++i;
    for (; i < size && data[i] != '\0' && data[i] != ' '; ++i) {
        if (data[i] >= '0' && data[i] <= '7') {
            result = (result << 3) | static_cast<uint64_t>(data[i] - '0');
        }
    }
    return result;
}

uint16_t read_u16(const std::vector<uint8_t>& d, size_t off) {
    return static_cast<uint16_t>(d[off] | (d[off + 1] << 8));
}

uint32_t read_u32(const std::vector<uint8_t>& d, size_t off) {
    return static_cast<uint32_t>(d[off]) |
           (static_cast<uint32_t>(d[off + 1]) << 8) |
           (static_cast<uint32_t>(d[off + 2]) << 16) |
           (static_cast<uint32_t>(d[off + 3]) << 24);
}

bool matches_member(const std::string& path, const std::string& suffix) {
    if (path == suffix) return true;
    return path.size() > suffix.size() &&
           path.compare(path.size() - suffix.size(), suffix.size(), suffix) == 0 &&
           path[path.size() - suffix.size() - 1] == '/';
}

std::string clean_entry_path(std::string path) {
    while (!path.empty() && path.back() == '/') path.pop_back();
    while (path.rfind("./", 0) == 0) path = path.substr(2);
    return path;
}

// Called for every regular file. Return false to stop iterating.
using EntryVisitor = std::function<bool(const std::string& path, uint32_t mode,
                                        const uint8_t* data, size_t size)>;

bool walk_tar(const std::vector<uint8_t>& tar_data, const EntryVisitor& visit,
              std::string& error) {
    size_t offset = 0;
    std::string long_name;

    while (offset + TAR_BLOCK_SIZE <= tar_data.size()) {
        const TarHeader* header = reinterpret_cast<const TarHeader*>(tar_data.data() + offset);

        bool empty = std::all_of(tar_data.begin() + static_cast<std::ptrdiff_t>(offset),
                                 tar_data.begin() + static_cast<std::ptrdiff_t>(offset + TAR_BLOCK_SIZE),
                                 [](uint8_t b) { return b == 0; });
        if (empty) break;

        uint64_t size = parse_octal(header->size, TAR_SIZE_SIZE);
        size_t data_offset = offset + TAR_BLOCK_SIZE;
        if (data_offset + size > tar_data.size()) {
            error = "truncated tar archive";
            return false;
        }
        size_t next = data_offset + ((size + TAR_BLOCK_SIZE - 1) / TAR_BLOCK_SIZE) * TAR_BLOCK_SIZE;

        char typeflag = header->typeflag;

        if (typeflag == TAR_GNU_LONGNAME) {
            long_name.assign(reinterpret_cast<const char*>(tar_data.data() + data_offset),
                             strnlen(reinterpret_cast<const char*>(tar_data.data() + data_offset),
                                     static_cast<size_t>(size)));
            offset = next;
            continue;
        }
        if (typeflag == TAR_PAX_HEADER || typeflag == 'g') {
            offset = next;
            continue;
        }

        std::string path;
        if (!long_name.empty()) {
            path = long_name;
            long_name.clear();
        } else {
            if (header->prefix[0] != '\0') {
                path = std::string(header->prefix, strnlen(header->prefix, TAR_PREFIX_SIZE));
                path += '/';
            }
            path += std::string(header->name, strnlen(header->name, TAR_NAME_SIZE));
        }
        path = clean_entry_path(path);

        if (!path.empty()) {
            auto validation = validate_archive_path(path);
            if (!validation.safe) {
                error = validation.error;
                return false;
            }
            if (typeflag == TAR_REGTYPE || typeflag == TAR_AREGTYPE) {
                uint32_t mode = static_cast<uint32_t>(parse_octal(header->mode, TAR_MODE_SIZE) & 07777);
                if (!visit(validation.normalized_path, mode, tar_data.data() + data_offset,
                           static_cast<size_t>(size))) {
                    return true;
                }
            }
        }

        offset = next;
    }

    return true;
}

bool inflate_raw(const uint8_t* in, size_t in_size, size_t expected_size,
                 std::vector<uint8_t>& out) {
    z_stream strm;
    std::memset(&strm, 0, sizeof(strm));
    if (inflateInit2(&strm, -MAX_WBITS) != Z_OK) return false;

    out.resize(expected_size);
    strm.next_in = const_cast<Bytef*>(in);
    strm.avail_in = static_cast<uInt>(in_size);
    strm.next_out = out.data();
    strm.avail_out = static_cast<uInt>(out.size());

    int ret = inflate(&strm, Z_FINISH);
    bool ok = ret == Z_STREAM_END && strm.total_out == expected_size;
    inflateEnd(&strm);
    return ok;
}

bool walk_zip(const std::vector<uint8_t>& zip, const EntryVisitor& visit, std::string& error) {
    if (zip.size() < ZIP_EOCD_SIZE) {
        error = "zip archive too small";
        return false;
    }

    // End of central directory sits at the end, before an optional comment
    size_t eocd = std::string::npos;
    size_t min_pos = zip.size() > ZIP_EOCD_SIZE + 0xFFFF ? zip.size() - ZIP_EOCD_SIZE - 0xFFFF : 0;
    for (size_t pos = zip.size() - ZIP_EOCD_SIZE + 1; pos-- > min_pos;) {
        if (read_u32(zip, pos) == ZIP_EOCD_SIG) {
            eocd = pos;
            break;
        }
    }
    if (eocd == std::string::npos) {
        error = "zip end of central directory not found";
        return false;
    }

    uint16_t entry_count = read_u16(zip, eocd + 10);
    uint32_t cd_offset = read_u32(zip, eocd + 16);
    if (cd_offset == 0xFFFFFFFF || entry_count == 0xFFFF) {
        error = "zip64 archives are not supported";
        return false;
    }

    size_t pos = cd_offset;
    for (uint16_t i = 0; i < entry_count; ++i) {
        if (pos + ZIP_CENTRAL_SIZE > zip.size() || read_u32(zip, pos) != ZIP_CENTRAL_SIG) {
            error = "corrupt zip central directory";
            return false;
        }

        uint16_t made_by = read_u16(zip, pos + 4);
        uint16_t method = read_u16(zip, pos + 10);
        uint32_t crc = read_u32(zip, pos + 16);
        uint32_t comp_size = read_u32(zip, pos + 20);
        uint32_t uncomp_size = read_u32(zip, pos + 24);
        uint16_t name_len = read_u16(zip, pos + 28);
        uint16_t extra_len = read_u16(zip, pos + 30);
        uint16_t comment_len = read_u16(zip, pos + 32);
        uint32_t external_attrs = read_u32(zip, pos + 38);
        uint32_t local_offset = read_u32(zip, pos + 42);

        if (pos + ZIP_CENTRAL_SIZE + name_len > zip.size()) {
            error = "corrupt zip central directory";
            return false;
        }
        std::string raw_name(reinterpret_cast<const char*>(zip.data() + pos + ZIP_CENTRAL_SIZE),
                             name_len);
        pos += ZIP_CENTRAL_SIZE + name_len + extra_len + comment_len;

        bool is_dir = !raw_name.empty() && raw_name.back() == '/';
        std::string path = clean_entry_path(raw_name);
        if (path.empty()) continue;

        auto validation = validate_archive_path(path);
        if (!validation.safe) {
            error = validation.error;
            return false;
        }
        if (is_dir) continue;

        uint32_t mode = 0644;
        if ((made_by >> 8) == 3) {  // unix
            uint32_t unix_mode = external_attrs >> 16;
            if ((unix_mode & 0170000) == 0120000) continue;  // symlink
            if (unix_mode != 0) mode = unix_mode & 07777;
        }

        if (static_cast<size_t>(local_offset) + ZIP_LOCAL_SIZE > zip.size() ||
            read_u32(zip, local_offset) != ZIP_LOCAL_SIG) {
            error = "corrupt zip local header: " + path;
            return false;
        }
        size_t data_offset = local_offset + ZIP_LOCAL_SIZE +
                             read_u16(zip, local_offset + 26) +
                             read_u16(zip, local_offset + 28);
        if (data_offset + comp_size > zip.size()) {
            error = "truncated zip entry: " + path;
            return false;
        }

        std::vector<uint8_t> contents;
        if (method == ZIP_STORED) {
            contents.assign(zip.begin() + static_cast<std::ptrdiff_t>(data_offset),
                            zip.begin() + static_cast<std::ptrdiff_t>(data_offset + comp_size));
        } else if (method == ZIP_DEFLATED) {
            if (!inflate_raw(zip.data() + data_offset, comp_size, uncomp_size, contents)) {
                error = "failed to inflate zip entry: " + path;
                return false;
            }
        } else {
            error = "unsupported zip compression method " + std::to_string(method) + ": " + path;
            return false;
        }

        uLong actual_crc = crc32(0L, Z_NULL, 0);
        actual_crc = crc32(actual_crc, contents.data(), static_cast<uInt>(contents.size()));
        if (static_cast<uint32_t>(actual_crc) != crc) {
            error = "zip CRC mismatch: " + path;
            return false;
        }

        if (!visit(validation.normalized_path, mode, contents.data(), contents.size())) {
            return true;
        }
    }

    return true;
}

bool walk_archive(const std::vector<uint8_t>& archive, const EntryVisitor& visit,
                  std::string& error) {
    switch (detect_archive_format(archive)) {
        case ArchiveFormat::TarGz: {
            auto tar = gzip_decompress(archive);
            if (!tar.ok) {
                error = tar.error;
                return false;
            }
            return walk_tar(tar.data, visit, error);
        }
        case ArchiveFormat::Zip:
            return walk_zip(archive, visit, error);
        case ArchiveFormat::Unknown:
            break;
    }
    error = "unrecognized archive format";
    return false;
}

} // namespace

// ============================================================================
// Public API
// ============================================================================

ArchiveFormat detect_archive_format(const std::vector<uint8_t>& data) {
    if (data.size() >= 2 && data[0] == 0x1f && data[1] == 0x8b) {
        return ArchiveFormat::TarGz;
    }
    if (data.size() >= 4 && data[0] == 'P' && data[1] == 'K' &&
        ((data[2] == 3 && data[3] == 4) || (data[2] == 5 && data[3] == 6))) {
        return ArchiveFormat::Zip;
    }
    return ArchiveFormat::Unknown;
}

ArchiveFormat archive_format_from_name(const std::string& filename) {
    auto ends_with = [&](const std::string& ext) {
        return filename.size() >= ext.size() &&
               filename.compare(filename.size() - ext.size(), ext.size(), ext) == 0;
    };
    if (ends_with(".tar.gz") || ends_with(".tgz")) return ArchiveFormat::TarGz;
    if (ends_with(".zip")) return ArchiveFormat::Zip;
    return ArchiveFormat::Unknown;
}

PathValidation validate_archive_path(const std::string& entry_path) {
    PathValidation result;

    if (entry_path.find('\0') != std::string::npos) {
        result.error = "NUL byte in archive path";
        return result;
    }

    if (!entry_path.empty() && (entry_path[0] == '/' || entry_path[0] == '\\')) {
        result.error = "absolute path not allowed: " + entry_path;
        return result;
    }

    fs::path normalized;
    for (const auto& component : fs::path(entry_path)) {
        std::string comp = component.string();
        if (comp == "..") {
            result.error = "path traversal not allowed: " + entry_path;
            return result;
        }
        if (comp != "." && !comp.empty()) {
            normalized /= comp;
        }
    }

    result.safe = true;
    result.normalized_path = normalized.generic_string();
    return result;
}

GunzipResult gzip_decompress(const std::vector<uint8_t>& data) {
    GunzipResult result;

    if (data.size() < 18 || data[0] != 0x1f || data[1] != 0x8b) {
        result.error = "not a gzip stream";
        return result;
    }

    z_stream strm;
    std::memset(&strm, 0, sizeof(strm));

    // 16 + MAX_WBITS: expect and verify the gzip wrapper
    if (inflateInit2(&strm, 16 + MAX_WBITS) != Z_OK) {
        result.error = "inflateInit2 failed";
        return result;
    }

    strm.next_in = const_cast<Bytef*>(data.data());
    strm.avail_in = static_cast<uInt>(data.size());

    std::vector<uint8_t> chunk(64 * 1024);
    int ret = Z_OK;
    while (ret != Z_STREAM_END) {
        strm.next_out = chunk.data();
        strm.avail_out = static_cast<uInt>(chunk.size());
        ret = inflate(&strm, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            inflateEnd(&strm);
            result.error = std::string("gzip inflate failed: ") + (strm.msg ? strm.msg : "corrupt data");
            return result;
        }
        size_t produced = chunk.size() - strm.avail_out;
        result.data.insert(result.data.end(), chunk.begin(),
                           chunk.begin() + static_cast<std::ptrdiff_t>(produced));
        if (ret == Z_OK && strm.avail_in == 0 && produced == 0) {
            inflateEnd(&strm);
            result.error = "truncated gzip stream";
            return result;
        }
    }

    inflateEnd(&strm);
    result.ok = true;
    return result;
}

ArchiveListing list_archive(const std::vector<uint8_t>& archive) {
    ArchiveListing listing;
    bool ok = walk_archive(
        archive,
        [&](const std::string& path, uint32_t, const uint8_t*, size_t) {
            listing.entries.push_back(path);
            return true;
        },
        listing.error);
    listing.ok = ok;
    if (!ok) listing.entries.clear();
    return listing;
}

MemberResult extract_member(const std::vector<uint8_t>& archive,
                            const std::string& member_suffix) {
    MemberResult result;

    if (member_suffix.empty()) {
        result.error = "empty member name";
        return result;
    }

    bool found = false;
    bool ok = walk_archive(
        archive,
        [&](const std::string& path, uint32_t mode, const uint8_t* data, size_t size) {
            if (!matches_member(path, member_suffix)) return true;
            result.member_path = path;
            result.mode = mode;
            result.data.assign(data, data + size);
            found = true;
            return false;
        },
        result.error);

    if (!ok) return result;

    if (!found) {
        result.error = "member not found in archive: " + member_suffix;
        return result;
    }

    result.ok = true;
    return result;
}

} // namespace testbed
