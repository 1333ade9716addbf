#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace chunkfs::core {

/// @brief Canonical error codes used across modules and mapped to HTTP responses.
enum class ErrorCode {
    kOk = 0,
    kInvalidArgument,
    kNotFound,
    kConflict,
    kIncompleteUpload,
    kChunkMissing,
    kHashMismatch,
    kIoError,
    kTransferFailed,
    kCancelled,
    kInternal,
};

/// @brief Error payload describing a failure with a code and human-readable message.
///
/// `chunks` carries the chunk indices involved for kIncompleteUpload (every missing
/// index, ascending) and kChunkMissing (the single index that vanished).
struct Error {
    ErrorCode code{ErrorCode::kOk};
    std::string message;
    std::vector<std::uint64_t> chunks;
};

/// @brief Stable upper-case name of an error code, used in JSON error envelopes.
const char* ErrorCodeName(ErrorCode code);
/// @brief Inverse of ErrorCodeName. INVALID_JSON folds into kInvalidArgument; names this
/// build does not know map to kTransferFailed.
ErrorCode ErrorCodeFromName(const std::string& name);

}  // namespace chunkfs::core
