#pragma once

#include <testbed/platform.hpp>

#include <zlib.h>

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace testbed_test {

namespace fs = std::filesystem;

// Helper to create temporary directory
class TempDir {
public:
    TempDir() {
        path_ = fs::temp_directory_path() / ("testbed_test_" + testbed::generate_short_id(16));
        fs::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        testbed::make_owner_writable(path_.string());
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::string path() const { return path_.string(); }
    std::string file(const std::string& rel) const { return (path_ / rel).string(); }

private:
    fs::path path_;
};

inline void write_file(const std::string& path, const std::string& content) {
    fs::create_directories(fs::path(path).parent_path());
    std::ofstream out(path, std::ios::binary);
    out << content;
}

// Write a /bin/sh script and mark it executable
inline void write_script(const std::string& path, const std::string& body) {
    write_file(path, "#!/bin/sh\n" + body);
    fs::permissions(path, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec,
                    fs::perm_options::replace);
}

// Set (or unset) an environment variable for the lifetime of the guard
class ScopedEnv {
public:
    ScopedEnv(const std::string& name, const std::optional<std::string>& value)
        : name_(name), previous_(testbed::get_env(name)) {
        if (value) {
            setenv(name_.c_str(), value->c_str(), 1);
        } else {
            unsetenv(name_.c_str());
        }
    }

    ~ScopedEnv() {
        if (previous_) {
            setenv(name_.c_str(), previous_->c_str(), 1);
        } else {
            unsetenv(name_.c_str());
        }
    }

    ScopedEnv(const ScopedEnv&) = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;

private:
    std::string name_;
    std::optional<std::string> previous_;
};

// Prepend a directory to the host PATH for the lifetime of the guard
class ScopedPathPrepend {
public:
    explicit ScopedPathPrepend(const std::string& dir)
        : guard_("PATH", dir + ":" + testbed::get_env("PATH").value_or("/usr/bin:/bin")) {}

private:
    ScopedEnv guard_;
};

inline std::vector<uint8_t> bytes(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

// ============================================================================
// Archive builders
// ============================================================================

struct ArchiveEntry {
    std::string name;
    std::string content;
    uint32_t mode = 0755;
};

inline std::vector<uint8_t> make_tar(const std::vector<ArchiveEntry>& entries) {
    std::vector<uint8_t> tar;

    for (const auto& e : entries) {
        char header[512];
        std::memset(header, 0, sizeof(header));
        std::strncpy(header, e.name.c_str(), 99);
        std::snprintf(header + 100, 8, "%07o", e.mode);
        std::snprintf(header + 108, 8, "%07o", 0);
        std::snprintf(header + 116, 8, "%07o", 0);
        std::snprintf(header + 124, 12, "%011o", static_cast<unsigned>(e.content.size()));
        std::snprintf(header + 136, 12, "%011o", 0);
        header[156] = '0';
        std::memcpy(header + 257, "ustar", 6);
        std::memcpy(header + 263, "00", 2);

        std::memset(header + 148, ' ', 8);
        unsigned sum = 0;
        for (unsigned char c : header) sum += c;
        std::snprintf(header + 148, 8, "%06o", sum);

        tar.insert(tar.end(), header, header + sizeof(header));
        tar.insert(tar.end(), e.content.begin(), e.content.end());
        size_t pad = (512 - e.content.size() % 512) % 512;
        tar.insert(tar.end(), pad, 0);
    }

    tar.insert(tar.end(), 1024, 0);
    return tar;
}

inline std::vector<uint8_t> gzip(const std::vector<uint8_t>& data) {
    z_stream strm;
    std::memset(&strm, 0, sizeof(strm));
    deflateInit2(&strm, Z_DEFAULT_COMPRESSION, Z_DEFLATED, 16 + MAX_WBITS, 8,
                 Z_DEFAULT_STRATEGY);

    std::vector<uint8_t> out(deflateBound(&strm, static_cast<uLong>(data.size())) + 64);
    strm.next_in = const_cast<Bytef*>(data.data());
    strm.avail_in = static_cast<uInt>(data.size());
    strm.next_out = out.data();
    strm.avail_out = static_cast<uInt>(out.size());
    deflate(&strm, Z_FINISH);
    out.resize(strm.total_out);
    deflateEnd(&strm);
    return out;
}

inline std::vector<uint8_t> raw_deflate(const std::string& data) {
    z_stream strm;
    std::memset(&strm, 0, sizeof(strm));
    deflateInit2(&strm, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY);

    std::vector<uint8_t> out(deflateBound(&strm, static_cast<uLong>(data.size())) + 64);
    strm.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    strm.avail_in = static_cast<uInt>(data.size());
    strm.next_out = out.data();
    strm.avail_out = static_cast<uInt>(out.size());
    deflate(&strm, Z_FINISH);
    out.resize(strm.total_out);
    deflateEnd(&strm);
    return out;
}

inline std::vector<uint8_t> make_tar_gz(const std::vector<ArchiveEntry>& entries) {
    return gzip(make_tar(entries));
}

inline void put_u16(std::vector<uint8_t>& v, uint16_t x) {
    v.push_back(static_cast<uint8_t>(x & 0xFF));
    v.push_back(static_cast<uint8_t>((x >> 8) & 0xFF));
}

inline void put_u32(std::vector<uint8_t>& v, uint32_t x) {
    for (int i = 0; i < 4; ++i) v.push_back(static_cast<uint8_t>((x >> (8 * i)) & 0xFF));
}

// Zip with unix modes; entries are deflated when deflate is set, stored otherwise
inline std::vector<uint8_t> make_zip(const std::vector<ArchiveEntry>& entries, bool deflate = false) {
    std::vector<uint8_t> zip;
    std::vector<uint8_t> central;

    for (const auto& e : entries) {
        uint32_t crc = static_cast<uint32_t>(
            crc32(crc32(0L, Z_NULL, 0), reinterpret_cast<const Bytef*>(e.content.data()),
                  static_cast<uInt>(e.content.size())));
        std::vector<uint8_t> payload = deflate ? raw_deflate(e.content) : bytes(e.content);
        uint16_t method = deflate ? 8 : 0;
        uint32_t offset = static_cast<uint32_t>(zip.size());

        put_u32(zip, 0x04034b50);
        put_u16(zip, 20);
        put_u16(zip, 0);
        put_u16(zip, method);
        put_u16(zip, 0);
        put_u16(zip, 0);
        put_u32(zip, crc);
        put_u32(zip, static_cast<uint32_t>(payload.size()));
        put_u32(zip, static_cast<uint32_t>(e.content.size()));
        put_u16(zip, static_cast<uint16_t>(e.name.size()));
        put_u16(zip, 0);
        zip.insert(zip.end(), e.name.begin(), e.name.end());
        zip.insert(zip.end(), payload.begin(), payload.end());

        put_u32(central, 0x02014b50);
        put_u16(central, (3 << 8) | 20);
        put_u16(central, 20);
        put_u16(central, 0);
        put_u16(central, method);
        put_u16(central, 0);
        put_u16(central, 0);
        put_u32(central, crc);
        put_u32(central, static_cast<uint32_t>(payload.size()));
        put_u32(central, static_cast<uint32_t>(e.content.size()));
        put_u16(central, static_cast<uint16_t>(e.name.size()));
        put_u16(central, 0);
        put_u16(central, 0);
        put_u16(central, 0);
        put_u16(central, 0);
        put_u32(central, (0100000u | e.mode) << 16);
        put_u32(central, offset);
        central.insert(central.end(), e.name.begin(), e.name.end());
    }

    uint32_t cd_offset = static_cast<uint32_t>(zip.size());
    zip.insert(zip.end(), central.begin(), central.end());

    put_u32(zip, 0x06054b50);
    put_u16(zip, 0);
    put_u16(zip, 0);
    put_u16(zip, static_cast<uint16_t>(entries.size()));
    put_u16(zip, static_cast<uint16_t>(entries.size()));
    put_u32(zip, static_cast<uint32_t>(central.size()));
    put_u32(zip, cd_offset);
    put_u16(zip, 0);
    return zip;
}

} // namespace testbed_test
