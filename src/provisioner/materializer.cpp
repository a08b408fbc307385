#include "testbed/materializer.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

#include <openssl/evp.h>
#include <curl/curl.h>

namespace testbed {

// ============================================================================
// Checksums
// ============================================================================

namespace {

// Owns one EVP_MD_CTX
class DigestContext {
public:
    DigestContext() : ctx_(EVP_MD_CTX_new()) {}
    ~DigestContext() { if (ctx_) EVP_MD_CTX_free(ctx_); }

    DigestContext(const DigestContext&) = delete;
    DigestContext& operator=(const DigestContext&) = delete;

    EVP_MD_CTX* get() { return ctx_; }
    explicit operator bool() const { return ctx_ != nullptr; }

private:
    EVP_MD_CTX* ctx_;
};

std::string to_hex_digest(const unsigned char* data, size_t len) {
    static const char digits[] = "0123456789abcdef";
    std::string result;
    result.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        result.push_back(digits[(data[i] >> 4) & 0x0F]);
        result.push_back(digits[data[i] & 0x0F]);
    }
    return result;
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool is_hex_digest(const std::string& s) {
    if (s.size() != 64) return false;
    return std::all_of(s.begin(), s.end(),
                       [](unsigned char c) { return std::isxdigit(c) != 0; });
}

// Feeds chunks into a SHA-256 context and produces the final digest
class Sha256Hasher {
public:
    bool init(std::string& error) {
        if (!ctx_) {
            error = "EVP_MD_CTX_new failed";
            return false;
        }
        if (EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
            error = "EVP_DigestInit_ex failed";
            return false;
        }
        return true;
    }

    bool update(const void* data, size_t len, std::string& error) {
        if (EVP_DigestUpdate(ctx_.get(), data, len) != 1) {
            error = "EVP_DigestUpdate failed";
            return false;
        }
        return true;
    }

    bool finish(std::string& hex, std::string& error) {
        unsigned char hash[EVP_MAX_MD_SIZE];
        unsigned int hash_len = 0;
        if (EVP_DigestFinal_ex(ctx_.get(), hash, &hash_len) != 1) {
            error = "EVP_DigestFinal_ex failed";
            return false;
        }
        hex = to_hex_digest(hash, hash_len);
        return true;
    }

private:
    DigestContext ctx_;
};

} // namespace

HashResult compute_sha256(const std::vector<uint8_t>& data) {
    HashResult result;
    Sha256Hasher hasher;
    if (!hasher.init(result.error) ||
        !hasher.update(data.data(), data.size(), result.error) ||
        !hasher.finish(result.hex_digest, result.error)) {
        return result;
    }
    result.ok = true;
    return result;
}

HashResult compute_sha256_file(const std::string& file_path) {
    HashResult result;

    std::ifstream file(file_path, std::ios::binary);
    if (!file) {
        result.error = "failed to open file: " + file_path;
        return result;
    }

    Sha256Hasher hasher;
    if (!hasher.init(result.error)) return result;

    char buffer[8192];
    while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
        if (!hasher.update(buffer, static_cast<size_t>(file.gcount()), result.error)) {
            return result;
        }
    }

    if (!hasher.finish(result.hex_digest, result.error)) return result;
    result.ok = true;
    return result;
}

Sha256VerifyResult verify_sha256(const std::vector<uint8_t>& data,
                                 const std::string& expected_hex) {
    Sha256VerifyResult result;
    result.expected_digest = to_lower(expected_hex);

    auto hash_result = compute_sha256(data);
    if (!hash_result.ok) {
        result.error = hash_result.error;
        return result;
    }

    result.actual_digest = hash_result.hex_digest;

    if (result.actual_digest != result.expected_digest) {
        result.error = "SHA-256 mismatch: expected " + result.expected_digest +
                       ", got " + result.actual_digest;
        return result;
    }

    result.ok = true;
    return result;
}

// ============================================================================
// Checksum Manifests
// ============================================================================

std::vector<ChecksumEntry> parse_checksum_manifest(const std::string& content) {
    std::vector<ChecksumEntry> entries;
    std::istringstream stream(content);
    std::string line;

    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();

        std::istringstream fields(line);
        std::string digest;
        std::string filename;
        if (!(fields >> digest >> filename)) continue;
        if (digest[0] == '#' || !is_hex_digest(digest)) continue;

        // sha256sum marks binary mode with a leading '*'
        if (filename[0] == '*') filename.erase(0, 1);
        if (filename.empty()) continue;

        entries.push_back({to_lower(digest), filename});
    }

    return entries;
}

std::optional<std::string> find_checksum(const std::vector<ChecksumEntry>& entries,
                                         const std::string& archive_filename) {
    if (archive_filename.empty()) return std::nullopt;

    for (const auto& entry : entries) {
        const auto& name = entry.filename;
        if (name == archive_filename) return entry.digest;
        if (name.size() > archive_filename.size() &&
            name.compare(name.size() - archive_filename.size(), archive_filename.size(),
                         archive_filename) == 0 &&
            name[name.size() - archive_filename.size() - 1] == '/') {
            return entry.digest;
        }
    }
    return std::nullopt;
}

// ============================================================================
// Release downloads
// ============================================================================

bool is_https_url(const std::string& url) {
    static const std::string scheme = "https://";
    if (url.size() <= scheme.size()) return false;
    for (size_t i = 0; i < scheme.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(url[i])) != scheme[i]) return false;
    }
    return true;
}

bool ResponseBody::append(const char* data, size_t size) {
    if (exceeded_ || size > limit_ - data_.size()) {
        exceeded_ = true;
        return false;
    }
    data_.insert(data_.end(), data, data + size);
    return true;
}

namespace {

// Returning less than the chunk size makes curl abort with CURLE_WRITE_ERROR
size_t append_response_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<ResponseBody*>(userdata);
    size_t total = size * nmemb;
    return body->append(ptr, total) ? total : 0;
}

// Owns one easy handle
class EasyHandle {
public:
    EasyHandle() : handle_(curl_easy_init()) {}
    ~EasyHandle() { if (handle_) curl_easy_cleanup(handle_); }

    EasyHandle(const EasyHandle&) = delete;
    EasyHandle& operator=(const EasyHandle&) = delete;

    CURL* get() { return handle_; }
    explicit operator bool() const { return handle_ != nullptr; }

private:
    CURL* handle_;
};

class CurlLibrary {
public:
    CurlLibrary() { curl_global_init(CURL_GLOBAL_DEFAULT); }
    ~CurlLibrary() { curl_global_cleanup(); }
};

CurlLibrary& ensure_curl_initialized() {
    static CurlLibrary init;
    return init;
}

} // namespace

FetchResult fetch_https(const std::string& url) {
    FetchResult result;

    if (!is_https_url(url)) {
        result.error = "only https:// URLs can be fetched: " + url;
        return result;
    }

    ensure_curl_initialized();

    EasyHandle curl;
    if (!curl) {
        result.error = "curl_easy_init failed";
        return result;
    }

    ResponseBody body;
    char error_buffer[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, append_response_body);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);

    // GitHub release assets redirect to a CDN
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, 10L);
    curl_easy_setopt(curl.get(), CURLOPT_PROTOCOLS_STR, "https");
    curl_easy_setopt(curl.get(), CURLOPT_REDIR_PROTOCOLS_STR, "https");

    // Servers that announce a larger Content-Length are refused up front
    curl_easy_setopt(curl.get(), CURLOPT_MAXFILESIZE_LARGE,
                     static_cast<curl_off_t>(body.limit()));

    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, 2L);

    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, 30L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, 600L);

    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "testbed-provisioner/1.0");

    CURLcode res = curl_easy_perform(curl.get());

    if (body.exceeded() || res == CURLE_FILESIZE_EXCEEDED) {
        result.error = "response from " + url + " exceeds " + std::to_string(body.limit()) +
                       " bytes";
        return result;
    }

    if (res != CURLE_OK) {
        result.error = std::string("HTTP request failed: ") +
                       (error_buffer[0] ? error_buffer : curl_easy_strerror(res));
        return result;
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &result.http_status);

    char* effective_url = nullptr;
    curl_easy_getinfo(curl.get(), CURLINFO_EFFECTIVE_URL, &effective_url);
    if (effective_url && !is_https_url(effective_url)) {
        result.error = std::string("redirected to a non-https URL: ") + effective_url;
        return result;
    }

    if (result.http_status < 200 || result.http_status >= 300) {
        result.error = "HTTP " + std::to_string(result.http_status) + " for " + url;
        return result;
    }

    result.data = std::move(body.data());
    result.ok = true;
    return result;
}

} // namespace testbed
