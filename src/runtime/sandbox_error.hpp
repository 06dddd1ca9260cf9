#pragma once

#include <stdexcept>
#include <string>
#include <utility>

#include "runtime/runtime_types.hpp"

namespace kiln::runtime {

enum class ErrorCode {
    kProvisionFailure,
    kExecutionTimeout,
    kBusy,
    kPathViolation,
    kPackageNotAllowed,
    kStorageUploadFailure,
    kSessionNotFound,
    kTerminationFailure,
    kAlreadyStarted,
    kNotStarted,
    kNotFound,
    kUnsupportedLanguage,
    kBackendFailure
};

inline const char* ToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::kProvisionFailure: return "ProvisionFailure";
        case ErrorCode::kExecutionTimeout: return "ExecutionTimeout";
        case ErrorCode::kBusy: return "Busy";
        case ErrorCode::kPathViolation: return "PathViolation";
        case ErrorCode::kPackageNotAllowed: return "PackageNotAllowed";
        case ErrorCode::kStorageUploadFailure: return "StorageUploadFailure";
        case ErrorCode::kSessionNotFound: return "SessionNotFound";
        case ErrorCode::kTerminationFailure: return "TerminationFailure";
        case ErrorCode::kAlreadyStarted: return "AlreadyStarted";
        case ErrorCode::kNotStarted: return "NotStarted";
        case ErrorCode::kNotFound: return "NotFound";
        case ErrorCode::kUnsupportedLanguage: return "UnsupportedLanguage";
        case ErrorCode::kBackendFailure: return "BackendFailure";
    }
    return "BackendFailure";
}

class SandboxError : public std::runtime_error {
public:
    SandboxError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode Code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

// Carries whatever stdout/stderr was captured before the deadline.
class ExecutionTimeoutError : public SandboxError {
public:
    ExecutionTimeoutError(const std::string& message, ExecutionResult partial)
        : SandboxError(ErrorCode::kExecutionTimeout, message), partial_(std::move(partial)) {}

    const ExecutionResult& Partial() const noexcept { return partial_; }

private:
    ExecutionResult partial_;
};

}  // namespace kiln::runtime
