#include "chunkfs/core/error.h"

namespace chunkfs::core {

const char* ErrorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk:
            return "OK";
        case ErrorCode::kInvalidArgument:
            return "INVALID_REQUEST";
        case ErrorCode::kNotFound:
            return "SESSION_NOT_FOUND";
        case ErrorCode::kConflict:
            return "CONFLICT";
        case ErrorCode::kIncompleteUpload:
            return "INCOMPLETE_UPLOAD";
        case ErrorCode::kChunkMissing:
            return "CHUNK_MISSING";
        case ErrorCode::kHashMismatch:
            return "HASH_MISMATCH";
        case ErrorCode::kIoError:
            return "IO_ERROR";
        case ErrorCode::kTransferFailed:
            return "TRANSFER_FAILED";
        case ErrorCode::kCancelled:
            return "CANCELLED";
        case ErrorCode::kInternal:
            return "INTERNAL";
    }
    return "INTERNAL";
}

ErrorCode ErrorCodeFromName(const std::string& name) {
    if (name == "INVALID_JSON") {
        return ErrorCode::kInvalidArgument;
    }
    for (auto code : {ErrorCode::kInvalidArgument, ErrorCode::kNotFound, ErrorCode::kConflict,
                      ErrorCode::kIncompleteUpload, ErrorCode::kChunkMissing,
                      ErrorCode::kHashMismatch, ErrorCode::kIoError, ErrorCode::kCancelled,
                      ErrorCode::kInternal}) {
        if (name == ErrorCodeName(code)) {
            return code;
        }
    }
    return ErrorCode::kTransferFailed;
}

}  // namespace chunkfs::core
