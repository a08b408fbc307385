#include "testbed/result.hpp"

namespace testbed {

ErrorCategory category(ErrorCode code) {
    switch (code) {
        case ErrorCode::SANDBOX_CREATE_FAILED:
        case ErrorCode::UNKNOWN_BINARY:
        case ErrorCode::UNSUPPORTED_PLATFORM:
        case ErrorCode::BINARY_FETCH_FAILED:
        case ErrorCode::CHECKSUM_NOT_FOUND:
        case ErrorCode::CHECKSUM_MISMATCH:
        case ErrorCode::ARCHIVE_INVALID:
            return ErrorCategory::Provisioning;
        case ErrorCode::NO_RUNTIME_DETECTED:
        case ErrorCode::NO_FRAMEWORK_DETECTED:
            return ErrorCategory::Detection;
        case ErrorCode::TOOL_NOT_FOUND:
        case ErrorCode::INSTALL_FAILED:
            return ErrorCategory::Installation;
        case ErrorCode::COMMAND_FAILED:
        case ErrorCode::EXECUTION_FAILED:
            return ErrorCategory::Execution;
        case ErrorCode::PARSE_FAILED:
            return ErrorCategory::Parse;
        case ErrorCode::INVALID_SOURCE:
        case ErrorCode::CLONE_FAILED:
        case ErrorCode::ENVIRONMENT_NOT_FOUND:
        case ErrorCode::CONFIG_INVALID:
            return ErrorCategory::Validation;
        case ErrorCode::IO_ERROR:
        case ErrorCode::PERMISSION_DENIED:
            return ErrorCategory::Io;
    }
    return ErrorCategory::Io;
}

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::SANDBOX_CREATE_FAILED: return "sandbox_create_failed";
        case ErrorCode::UNKNOWN_BINARY: return "unknown_binary";
        case ErrorCode::UNSUPPORTED_PLATFORM: return "unsupported_platform";
        case ErrorCode::BINARY_FETCH_FAILED: return "binary_fetch_failed";
        case ErrorCode::CHECKSUM_NOT_FOUND: return "checksum_not_found";
        case ErrorCode::CHECKSUM_MISMATCH: return "checksum_mismatch";
        case ErrorCode::ARCHIVE_INVALID: return "archive_invalid";
        case ErrorCode::NO_RUNTIME_DETECTED: return "no_runtime_detected";
        case ErrorCode::NO_FRAMEWORK_DETECTED: return "no_framework_detected";
        case ErrorCode::TOOL_NOT_FOUND: return "tool_not_found";
        case ErrorCode::INSTALL_FAILED: return "install_failed";
        case ErrorCode::COMMAND_FAILED: return "command_failed";
        case ErrorCode::EXECUTION_FAILED: return "execution_failed";
        case ErrorCode::PARSE_FAILED: return "parse_failed";
        case ErrorCode::INVALID_SOURCE: return "invalid_source";
        case ErrorCode::CLONE_FAILED: return "clone_failed";
        case ErrorCode::ENVIRONMENT_NOT_FOUND: return "environment_not_found";
        case ErrorCode::CONFIG_INVALID: return "config_invalid";
        case ErrorCode::IO_ERROR: return "io_error";
        case ErrorCode::PERMISSION_DENIED: return "permission_denied";
    }
    return "unknown";
}

const char* error_category_name(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::Provisioning: return "provisioning";
        case ErrorCategory::Detection: return "detection";
        case ErrorCategory::Installation: return "installation";
        case ErrorCategory::Execution: return "execution";
        case ErrorCategory::Parse: return "parse";
        case ErrorCategory::Validation: return "validation";
        case ErrorCategory::Io: return "io";
    }
    return "io";
}

} // namespace testbed
