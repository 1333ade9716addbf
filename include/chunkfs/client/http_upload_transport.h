#pragma once

#include <chrono>
#include <string>

#include <boost/asio/io_context.hpp>

#include "chunkfs/client/upload_transport.h"
#include "chunkfs/core/config.h"

namespace chunkfs::client {

/// @brief UploadTransport over HTTP/1.1 with Beast, one connection per request.
///
/// Chunks go out as multipart/form-data to POST /upload/chunk. A non-zero chunk timeout
/// bounds each chunk exchange as a whole (resolve, connect, write, read).
class HttpUploadTransport : public UploadTransport {
public:
    HttpUploadTransport(boost::asio::io_context& ioc, std::string host, int port,
                        std::chrono::seconds chunk_timeout = std::chrono::seconds(0));
    HttpUploadTransport(boost::asio::io_context& ioc, const core::ClientConfig& config);

    void InitUpload(const upload::InitRequest& request, InitHandler handler) override;
    void GetProgress(const std::string& session_id, ProgressHandler handler) override;
    void SendChunk(ChunkPayload chunk, CancellationToken token, ChunkHandler handler) override;
    void MergeUpload(const std::string& session_id, const std::string& file_name,
                     const std::string& content_hash, MergeHandler handler) override;

private:
    boost::asio::io_context& ioc_;
    std::string host_;
    std::string port_;
    std::chrono::seconds chunk_timeout_;
};

/// @brief Build a multipart/form-data body carrying one chunk. Returns the body and sets
/// `content_type` to the matching header value including the boundary.
std::string BuildChunkForm(const ChunkPayload& chunk, std::string* content_type);

}  // namespace chunkfs::client
