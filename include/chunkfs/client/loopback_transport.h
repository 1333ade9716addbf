#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>

#include "chunkfs/client/upload_transport.h"
#include "chunkfs/upload/upload_coordinator.h"

namespace chunkfs::client {

/// @brief In-process UploadTransport wired straight to an UploadCoordinator.
///
/// Each chunk is delivered after `chunk_delay` on a steady_timer, which gives tests a window
/// in which transfers are genuinely in flight and can be cancelled. A cancelled chunk never
/// reaches the coordinator.
class LoopbackTransport : public UploadTransport {
public:
    LoopbackTransport(boost::asio::io_context& ioc,
                      std::shared_ptr<upload::UploadCoordinator> coordinator,
                      std::chrono::milliseconds chunk_delay = std::chrono::milliseconds(0));

    void InitUpload(const upload::InitRequest& request, InitHandler handler) override;
    void GetProgress(const std::string& session_id, ProgressHandler handler) override;
    void SendChunk(ChunkPayload chunk, CancellationToken token, ChunkHandler handler) override;
    void MergeUpload(const std::string& session_id, const std::string& file_name,
                     const std::string& content_hash, MergeHandler handler) override;

    /// @brief Fail the next transfer of `index` with kTransferFailed.
    void FailChunkOnce(std::uint64_t index) { failing_.insert(index); }

    /// Indices delivered to the coordinator, in delivery order.
    const std::vector<std::uint64_t>& delivered() const { return delivered_; }
    std::size_t cancelled_transfers() const { return cancelled_; }
    std::size_t max_in_flight() const { return max_in_flight_; }
    std::size_t init_calls() const { return init_calls_; }

private:
    boost::asio::io_context& ioc_;
    std::shared_ptr<upload::UploadCoordinator> coordinator_;
    std::chrono::milliseconds chunk_delay_;

    std::set<std::uint64_t> failing_;
    std::vector<std::uint64_t> delivered_;
    std::size_t cancelled_{0};
    std::size_t in_flight_{0};
    std::size_t max_in_flight_{0};
    std::size_t init_calls_{0};
};

}  // namespace chunkfs::client
