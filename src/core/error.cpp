#include "stitchfs/core/error.h"

namespace stitchfs::core {

const char* ErrorKind(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk:
            return "OK";
        case ErrorCode::kInvalidArgument:
            return "INVALID_ARGUMENT";
        case ErrorCode::kInvalidSessionId:
            return "INVALID_SESSION_ID";
        case ErrorCode::kInvalidChunkIndex:
            return "INVALID_CHUNK_INDEX";
        case ErrorCode::kMissingPayload:
            return "MISSING_PAYLOAD";
        case ErrorCode::kInvalidChunkCount:
            return "INVALID_CHUNK_COUNT";
        case ErrorCode::kInvalidDestinationName:
            return "INVALID_DESTINATION_NAME";
        case ErrorCode::kNotFound:
            return "NOT_FOUND";
        case ErrorCode::kSessionNotFound:
            return "SESSION_NOT_FOUND";
        case ErrorCode::kMissingChunk:
            return "MISSING_CHUNK";
        case ErrorCode::kIoError:
            return "IO_ERROR";
        case ErrorCode::kStorageWriteFailed:
            return "STORAGE_WRITE_FAILED";
        case ErrorCode::kAssemblyFailed:
            return "ASSEMBLY_FAILED";
        case ErrorCode::kInternal:
            return "INTERNAL";
    }
    return "INTERNAL";
}

ErrorCategory ErrorCategoryOf(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk:
            return ErrorCategory::kNone;
        case ErrorCode::kInvalidArgument:
        case ErrorCode::kInvalidSessionId:
        case ErrorCode::kInvalidChunkIndex:
        case ErrorCode::kMissingPayload:
        case ErrorCode::kInvalidChunkCount:
        case ErrorCode::kInvalidDestinationName:
            return ErrorCategory::kCallerInput;
        case ErrorCode::kNotFound:
        case ErrorCode::kSessionNotFound:
        case ErrorCode::kMissingChunk:
            return ErrorCategory::kNotFound;
        case ErrorCode::kIoError:
        case ErrorCode::kStorageWriteFailed:
        case ErrorCode::kAssemblyFailed:
        case ErrorCode::kInternal:
            return ErrorCategory::kInfrastructure;
    }
    return ErrorCategory::kInfrastructure;
}

}  // namespace stitchfs::core
