#pragma once

#include <cstdint>
#include <functional>
#include <string>

#include "chunkfs/client/cancellation.h"
#include "chunkfs/core/result.h"
#include "chunkfs/upload/upload_types.h"

namespace chunkfs::client {

/// @brief One chunk ready to leave the client.
struct ChunkPayload {
    std::string session_id;
    std::uint64_t index{0};
    std::string content_hash;
    std::string bytes;
};

using InitHandler = std::function<void(core::Result<upload::InitOutcome>)>;
using ProgressHandler = std::function<void(core::Result<upload::ProgressReport>)>;
using ChunkHandler = std::function<void(core::Result<void>)>;
using MergeHandler = std::function<void(core::Result<upload::MergeOutcome>)>;

/// @brief Asynchronous client side of the upload protocol.
///
/// Every handler is invoked exactly once, on the io_context the transport was built with.
/// A transfer stopped through its CancellationToken completes with ErrorCode::kCancelled.
class UploadTransport {
public:
    virtual ~UploadTransport() = default;

    virtual void InitUpload(const upload::InitRequest& request, InitHandler handler) = 0;
    virtual void GetProgress(const std::string& session_id, ProgressHandler handler) = 0;
    virtual void SendChunk(ChunkPayload chunk, CancellationToken token,
                           ChunkHandler handler) = 0;
    virtual void MergeUpload(const std::string& session_id, const std::string& file_name,
                             const std::string& content_hash, MergeHandler handler) = 0;
};

}  // namespace chunkfs::client
