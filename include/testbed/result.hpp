#pragma once

/**
 * @file result.hpp
 * @brief Error handling types shared by the testbed API
 *
 * Fallible API calls return Result<T>. Low-level helpers (process,
 * materializer, archive) use plain result structs with ok/error fields
 * and are converted into Result<T> at the API boundary.
 *
 * @example
 * ```cpp
 * auto sandbox = testbed::create_sandbox("testbed-");
 * if (sandbox.isErr()) {
 *     std::cerr << sandbox.error().message() << "\n";
 * }
 * ```
 */

#include <optional>
#include <string>
#include <utility>

namespace testbed {

// ============================================================================
// Error Codes
// ============================================================================

enum class ErrorCode {
    // Provisioning
    SANDBOX_CREATE_FAILED,
    UNKNOWN_BINARY,
    UNSUPPORTED_PLATFORM,
    BINARY_FETCH_FAILED,
    CHECKSUM_NOT_FOUND,
    CHECKSUM_MISMATCH,
    ARCHIVE_INVALID,

    // Detection
    NO_RUNTIME_DETECTED,
    NO_FRAMEWORK_DETECTED,

    // Installation
    TOOL_NOT_FOUND,
    INSTALL_FAILED,

    // Execution
    COMMAND_FAILED,
    EXECUTION_FAILED,

    // Parse
    PARSE_FAILED,

    // Validation
    INVALID_SOURCE,
    CLONE_FAILED,
    ENVIRONMENT_NOT_FOUND,
    CONFIG_INVALID,

    // System / IO
    IO_ERROR,
    PERMISSION_DENIED,
};

/// Coarse error taxonomy used when reporting failures to callers
enum class ErrorCategory {
    Provisioning,
    Detection,
    Installation,
    Execution,
    Parse,
    Validation,
    Io,
};

ErrorCategory category(ErrorCode code);
const char* error_code_name(ErrorCode code);
const char* error_category_name(ErrorCategory category);

/**
 * @brief Error type with code and message
 */
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    Error& withContext(const std::string& context) {
        message_ = context + ": " + message_;
        return *this;
    }

    ErrorCode code() const { return code_; }
    ErrorCategory kind() const { return category(code_); }
    const std::string& message() const { return message_; }
    std::string toString() const {
        return std::string(error_code_name(code_)) + ": " + message_;
    }

private:
    ErrorCode code_;
    std::string message_;
};

// ============================================================================
// Result Type
// ============================================================================

/**
 * @brief Result type for fallible operations
 * @tparam T The success value type
 * @tparam E The error type (default: Error)
 *
 * value() on an error result throws std::bad_optional_access.
 */
template<typename T, typename E = Error>
class Result {
public:
    static Result ok(T value) { return Result(std::move(value)); }
    static Result err(E error) { return Result(std::move(error)); }

    bool isOk() const { return has_value_; }
    bool isErr() const { return !has_value_; }

    T& value() { return value_.value(); }
    const T& value() const { return value_.value(); }
    E& error() { return error_.value(); }
    const E& error() const { return error_.value(); }

private:
    explicit Result(T value) : has_value_(true), value_(std::move(value)) {}
    explicit Result(E error) : has_value_(false), error_(std::move(error)) {}

    bool has_value_;
    std::optional<T> value_;
    std::optional<E> error_;
};

template<typename E>
class Result<void, E> {
public:
    static Result ok() { return Result(true, std::nullopt); }
    static Result err(E error) { return Result(false, std::move(error)); }

    bool isOk() const { return has_value_; }
    bool isErr() const { return !has_value_; }

    void value() const {}
    E& error() { return error_.value(); }
    const E& error() const { return error_.value(); }

private:
    Result(bool hv, std::optional<E> err) : has_value_(hv), error_(std::move(err)) {}
    bool has_value_;
    std::optional<E> error_;
};

} // namespace testbed
