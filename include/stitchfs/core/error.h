#pragma once

#include <string>

namespace stitchfs::core {

/// @brief Canonical error codes used across modules and mapped to HTTP responses.
enum class ErrorCode {
    kOk = 0,
    // Caller input errors.
    kInvalidArgument,
    kInvalidSessionId,
    kInvalidChunkIndex,
    kMissingPayload,
    kInvalidChunkCount,
    kInvalidDestinationName,
    // Not-found errors.
    kNotFound,
    kSessionNotFound,
    kMissingChunk,
    // Infrastructure errors.
    kIoError,
    kStorageWriteFailed,
    kAssemblyFailed,
    kInternal,
};

/// @brief Coarse classification used to pick a response status.
enum class ErrorCategory {
    kNone,
    kCallerInput,
    kNotFound,
    kInfrastructure,
};

/// @brief Error payload describing a failure with a code and human-readable message.
///
/// `cause` holds the internal code behind a generic public error (for example the
/// kMissingChunk behind a kAssemblyFailed); it is for logs and in-process callers only.
struct Error {
    ErrorCode code{ErrorCode::kOk};
    std::string message;
    ErrorCode cause{ErrorCode::kOk};
};

/// @brief Short machine-readable kind string, e.g. "SESSION_NOT_FOUND".
const char* ErrorKind(ErrorCode code);
ErrorCategory ErrorCategoryOf(ErrorCode code);

}  // namespace stitchfs::core
