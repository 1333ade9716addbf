#include "chunkfs/client/loopback_transport.h"

#include <algorithm>
#include <utility>

#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>

namespace chunkfs::client {

namespace net = boost::asio;

// LoopbackTransport: exercises the scheduler against the real coordinator without sockets.
LoopbackTransport::LoopbackTransport(net::io_context& ioc,
                                     std::shared_ptr<upload::UploadCoordinator> coordinator,
                                     std::chrono::milliseconds chunk_delay)
    : ioc_(ioc), coordinator_(std::move(coordinator)), chunk_delay_(chunk_delay) {}

void LoopbackTransport::InitUpload(const upload::InitRequest& request, InitHandler handler) {
    ++init_calls_;
    net::post(ioc_, [this, request, handler]() { handler(coordinator_->InitUpload(request)); });
}

void LoopbackTransport::GetProgress(const std::string& session_id, ProgressHandler handler) {
    net::post(ioc_,
              [this, session_id, handler]() { handler(coordinator_->GetProgress(session_id)); });
}

void LoopbackTransport::SendChunk(ChunkPayload chunk, CancellationToken token,
                                  ChunkHandler handler) {
    ++in_flight_;
    max_in_flight_ = std::max(max_in_flight_, in_flight_);

    auto timer = std::make_shared<net::steady_timer>(ioc_, chunk_delay_);
    token.OnCancel([this, timer]() { net::post(ioc_, [timer]() { timer->cancel(); }); });
    timer->async_wait([this, timer, chunk = std::move(chunk), token,
                       handler](const boost::system::error_code& ec) {
        --in_flight_;
        if (ec || token.cancelled()) {
            ++cancelled_;
            return handler(core::Error{core::ErrorCode::kCancelled,
                                       "chunk " + std::to_string(chunk.index) + " cancelled"});
        }
        if (failing_.erase(chunk.index) > 0) {
            return handler(core::Error{core::ErrorCode::kTransferFailed,
                                       "chunk " + std::to_string(chunk.index) +
                                           " dropped by loopback"});
        }
        auto ack = coordinator_->ReceiveChunk(chunk.session_id, chunk.index, chunk.bytes);
        if (!ack.ok()) {
            return handler(ack.error());
        }
        delivered_.push_back(chunk.index);
        handler(core::Ok());
    });
}

void LoopbackTransport::MergeUpload(const std::string& session_id, const std::string& file_name,
                                    const std::string& content_hash, MergeHandler handler) {
    net::post(ioc_, [this, session_id, file_name, content_hash, handler]() {
        handler(coordinator_->MergeUpload(session_id, file_name, content_hash));
    });
}

}  // namespace chunkfs::client
