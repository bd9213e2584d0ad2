#pragma once

#include <string>

namespace flashdrop::core {

/// @brief Canonical error codes used across modules and mapped to HTTP responses.
enum class ErrorCode {
    kOk = 0,
    kInvalidArgument,
    kInvalidFileType,
    kSessionNotFound,
    kMissingChunks,
    kChunkWriteFailed,
    kFileTooLarge,
    kAssemblyFailed,
    kNotFound,
    kExpired,
    kIoError,
    kPersistenceFailed,
    kIdentifierExhausted,
    kInternal,
};

/// @brief Error payload describing a failure with a code and human-readable message.
struct Error {
    ErrorCode code{ErrorCode::kOk};
    std::string message;
};

/// @brief Stable upper-case name for an error code, used in response envelopes.
const char* ErrorCodeName(ErrorCode code);

}  // namespace flashdrop::core
