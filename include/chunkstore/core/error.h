#pragma once

#include <string>

namespace chunkstore::core {

/// @brief Canonical error codes used across modules.
enum class ErrorCode {
    kOk = 0,
    kInvalidArgument,
    kNotFound,
    kIoError,
    kUploadFailed,
    kInternal,
};

/// @brief Error payload describing a failure with a code and human-readable message.
struct Error {
    ErrorCode code{ErrorCode::kOk};
    std::string message;
};

/// @brief Stable lowercase name of an error code, used in log lines and CLI output.
const char* ToString(ErrorCode code);

}  // namespace chunkstore::core
