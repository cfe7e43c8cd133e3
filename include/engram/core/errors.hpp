/*
 * Engram C++11 - Error codes
 */
#ifndef ENGRAM_CORE_ERRORS_HPP
#define ENGRAM_CORE_ERRORS_HPP

#include <string>

namespace engram {

enum class ErrorCode {
    NONE,
    VALIDATION_FAILURE,         // rejected synchronously, nothing written
    NOT_FOUND,
    TRANSIENT_EXTERNAL_FAILURE, // timeout / 5xx / transport; retried
    EXTERNAL_FAILURE,           // permanent provider error; not retried
    CONCURRENCY_CONFLICT,
    STORAGE_FAILURE
};

inline std::string error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE: return "none";
        case ErrorCode::VALIDATION_FAILURE: return "validation_failure";
        case ErrorCode::NOT_FOUND: return "not_found";
        case ErrorCode::TRANSIENT_EXTERNAL_FAILURE: return "transient_external_failure";
        case ErrorCode::EXTERNAL_FAILURE: return "external_failure";
        case ErrorCode::CONCURRENCY_CONFLICT: return "concurrency_conflict";
        case ErrorCode::STORAGE_FAILURE: return "storage_failure";
    }
    return "none";
}

inline bool is_retryable(ErrorCode code) {
    return code == ErrorCode::TRANSIENT_EXTERNAL_FAILURE;
}

} // namespace engram

#endif // ENGRAM_CORE_ERRORS_HPP
