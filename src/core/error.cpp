#include "chunkstore/core/error.h"

namespace chunkstore::core {

const char* ToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk:
            return "ok";
        case ErrorCode::kInvalidArgument:
            return "invalid_argument";
        case ErrorCode::kNotFound:
            return "not_found";
        case ErrorCode::kIoError:
            return "io_error";
        case ErrorCode::kUploadFailed:
            return "upload_failed";
        case ErrorCode::kInternal:
            return "internal";
    }
    return "unknown";
}

}  // namespace chunkstore::core
