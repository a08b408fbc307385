#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace testbed {

// ============================================================================
// Download and Verification Utilities
// ============================================================================
//
// Used by the binary provisioner to fetch release archives and their
// published checksum manifests, and to verify archives before anything
// reaches the cache.

// ============================================================================
// SHA-256 Hashing
// ============================================================================

struct HashResult {
    bool ok = false;
    std::string error;
    std::string hex_digest;     // Lowercase hex string (64 chars)
};

HashResult compute_sha256(const std::vector<uint8_t>& data);
HashResult compute_sha256_file(const std::string& file_path);

struct Sha256VerifyResult {
    bool ok = false;
    std::string error;
    std::string actual_digest;
    std::string expected_digest;
};

// Verify data matches expected SHA-256 digest (case-insensitive)
Sha256VerifyResult verify_sha256(const std::vector<uint8_t>& data,
                                 const std::string& expected_hex);

// ============================================================================
// Checksum Manifests
// ============================================================================

// One line of a SHASUMS-style manifest: "<hex><whitespace>[*]<filename>"
struct ChecksumEntry {
    std::string digest;     // lowercased
    std::string filename;
};

// Parse a manifest. Blank, comment and malformed lines are skipped.
std::vector<ChecksumEntry> parse_checksum_manifest(const std::string& content);

// Find the digest for an archive filename. An entry matches when its
// filename equals the archive name or ends with "/<archive name>".
std::optional<std::string> find_checksum(const std::vector<ChecksumEntry>& entries,
                                         const std::string& archive_filename);

// ============================================================================
// HTTP Fetching
// ============================================================================

struct FetchResult {
    bool ok = false;
    std::string error;
    std::vector<uint8_t> data;
    long http_status = 0;
};

// Largest body fetch_https accepts
constexpr size_t kMaxDownloadBytes = size_t{512} * 1024 * 1024;

// Absolute https:// URL, scheme matched case-insensitively
bool is_https_url(const std::string& url);

/**
 * Response body with a hard size limit. append() refuses the chunk that
 * would take the body past the limit and marks it exceeded.
 */
class ResponseBody {
public:
    explicit ResponseBody(size_t limit = kMaxDownloadBytes) : limit_(limit) {}

    bool append(const char* data, size_t size);
    bool exceeded() const { return exceeded_; }
    size_t limit() const { return limit_; }
    std::vector<uint8_t>& data() { return data_; }

private:
    size_t limit_;
    bool exceeded_ = false;
    std::vector<uint8_t> data_;
};

// Fetch data from an HTTPS URL. Verifies TLS, follows redirects to
// https:// only and stops at kMaxDownloadBytes.
FetchResult fetch_https(const std::string& url);

// Injection point for tests and alternative transports
using FetchFunction = std::function<FetchResult(const std::string& url)>;

} // namespace testbed
