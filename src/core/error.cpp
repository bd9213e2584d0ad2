#include "flashdrop/core/error.h"

namespace flashdrop::core {

const char* ErrorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk:
            return "OK";
        case ErrorCode::kInvalidArgument:
            return "INVALID_ARGUMENT";
        case ErrorCode::kInvalidFileType:
            return "INVALID_FILE_TYPE";
        case ErrorCode::kSessionNotFound:
            return "SESSION_NOT_FOUND";
        case ErrorCode::kMissingChunks:
            return "MISSING_CHUNKS";
        case ErrorCode::kChunkWriteFailed:
            return "CHUNK_WRITE_FAILED";
        case ErrorCode::kFileTooLarge:
            return "FILE_TOO_LARGE";
        case ErrorCode::kAssemblyFailed:
            return "ASSEMBLY_FAILED";
        case ErrorCode::kNotFound:
            return "NOT_FOUND";
        case ErrorCode::kExpired:
            return "EXPIRED";
        case ErrorCode::kIoError:
            return "IO_ERROR";
        case ErrorCode::kPersistenceFailed:
            return "PERSISTENCE_FAILED";
        case ErrorCode::kIdentifierExhausted:
            return "IDENTIFIER_EXHAUSTED";
        case ErrorCode::kInternal:
            return "INTERNAL";
    }
    return "INTERNAL";
}

}  // namespace flashdrop::core
