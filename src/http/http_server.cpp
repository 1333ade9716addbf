#include "chunkfs/http/http_server.h"

#include <array>
#include <chrono>
#include <exception>
#include <memory>
#include <optional>
#include <string>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "chunkfs/core/ids.h"
#include "chunkfs/core/logger.h"
#include "chunkfs/http/responses.h"
#include "chunkfs/http/route_registration.h"
#include "chunkfs/observability/metrics.h"

namespace chunkfs::http {

/// @brief Immutable state shared by the listener and every connection.
struct ServerState {
    Router router;
    core::Config config;
    std::shared_ptr<upload::UploadCoordinator> coordinator;
};

}  // namespace chunkfs::http

namespace {
namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;
using chunkfs::http::ServerState;

constexpr std::size_t kChunkBufferSize = 65536;
constexpr const char* kChunkPath = "/upload/chunk";

/// One HTTP/1.1 connection. Headers are read first; the parser is then converted either into
/// a string-body parser for routed requests or into a buffer-body parser that streams
/// `PUT /upload/chunk` bodies into the staging area.
class Session : public std::enable_shared_from_this<Session> {
public:
    Session(tcp::socket&& socket, std::shared_ptr<const ServerState> state)
        : stream_(std::move(socket)), state_(std::move(state)) {
    }

    void Start() { DoReadHeader(); }

private:
    std::uint64_t BodyLimit() const { return state_->config.server.limits.max_body_bytes; }

    void DoReadHeader() {
        header_parser_.emplace();
        header_parser_->body_limit(BodyLimit());
        http::async_read_header(stream_, buffer_, *header_parser_,
                                beast::bind_front_handler(&Session::OnReadHeader,
                                                          shared_from_this()));
    }

    void OnReadHeader(beast::error_code ec, std::size_t) {
        if (ec == http::error::end_of_stream) {
            return DoClose();
        }
        if (ec) {
            chunkfs::core::LogError("Read header failed: " + ec.message());
            return;
        }

        const auto& header = header_parser_->get();
        ctx_.request_id = chunkfs::core::GenerateRequestId();
        ctx_.started = std::chrono::steady_clock::now();
        ctx_.method = std::string(header.method_string());
        ctx_.target = std::string(header.target());
        ctx_.remote = GetRemoteAddress();
        version_ = header.version();
        keep_alive_ = header.keep_alive();

        if (header.method() == http::verb::put &&
            chunkfs::http::StripQuery(ctx_.target) == kChunkPath) {
            try {
                return StartChunkUpload();
            } catch (const std::exception& ex) {
                DiscardChunk();
                return SendAndClose(Internal(ex));
            }
        }

        request_parser_.emplace(std::move(*header_parser_));
        request_parser_->body_limit(BodyLimit());
        http::async_read(stream_, buffer_, *request_parser_,
                         beast::bind_front_handler(&Session::OnReadRequest, shared_from_this()));
    }

    void OnReadRequest(beast::error_code ec, std::size_t) {
        if (ec == http::error::body_limit) {
            return SendAndClose(TooLarge());
        }
        if (ec) {
            chunkfs::core::LogError("Read body failed: " + ec.message());
            return;
        }
        auto request = request_parser_->release();
        request_parser_.reset();

        // Nothing thrown by a handler may reach the io_context threads.
        std::optional<chunkfs::http::HttpResponse> response;
        try {
            auto result = state_->router.Route(ctx_, request);
            if (result.ok()) {
                response.emplace(std::move(result.value()));
            } else {
                response.emplace(
                    chunkfs::http::ErrorResponse(version_, result.error(), ctx_.request_id));
            }
        } catch (const std::exception& ex) {
            response.emplace(Internal(ex));
        }
        Send(std::move(*response));
    }

    void StartChunkUpload() {
        const auto upload_id = chunkfs::http::GetQueryParam(ctx_.target, "uploadId");
        const auto index_text = chunkfs::http::GetQueryParam(ctx_.target, "chunkIndex");
        if (!upload_id.ok() || !index_text.ok()) {
            const auto& error = upload_id.ok() ? index_text.error() : upload_id.error();
            return SendAndClose(chunkfs::http::ErrorResponse(version_, error, ctx_.request_id));
        }
        const auto index = chunkfs::http::ParseChunkIndex(index_text.value());
        if (upload_id.value().empty() || !index) {
            return SendAndClose(chunkfs::http::JsonError(
                version_, http::status::bad_request, "INVALID_REQUEST",
                "uploadId and chunkIndex are required", ctx_.request_id));
        }

        auto upload = state_->coordinator->BeginChunk(upload_id.value(), *index);
        if (!upload.ok()) {
            return SendAndClose(chunkfs::http::ErrorResponse(version_, upload.error(),
                                                             ctx_.request_id));
        }
        chunk_upload_ = std::move(upload.value());
        chunk_parser_.emplace(std::move(*header_parser_));
        chunk_parser_->body_limit(BodyLimit());
        if (chunk_parser_->is_done()) {
            return FinishChunkUpload();
        }
        DoReadUploadChunk();
    }

    void DoReadUploadChunk() {
        chunk_parser_->get().body().data = chunk_buffer_.data();
        chunk_parser_->get().body().size = chunk_buffer_.size();
        http::async_read(stream_, buffer_, *chunk_parser_,
                         beast::bind_front_handler(&Session::OnUploadChunk,
                                                   shared_from_this()));
    }

    void OnUploadChunk(beast::error_code ec, std::size_t) {
        if (ec == http::error::body_limit) {
            DiscardChunk();
            return SendAndClose(TooLarge());
        }
        if (ec && ec != http::error::need_buffer) {
            // Only this chunk's partial bytes are discarded; the session stays intact.
            chunkfs::core::LogWarning("Chunk " + std::to_string(chunk_upload_->index()) +
                                      " of " + chunk_upload_->session_id() +
                                      " interrupted: " + ec.message());
            DiscardChunk();
            return;
        }
        const auto bytes = chunk_buffer_.size() - chunk_parser_->get().body().size;
        if (bytes > 0) {
            auto written = chunk_upload_->Write(chunk_buffer_.data(), bytes);
            if (!written.ok()) {
                DiscardChunk();
                return SendAndClose(
                    chunkfs::http::ErrorResponse(version_, written.error(), ctx_.request_id));
            }
        }

        if (chunk_parser_->is_done()) {
            return FinishChunkUpload();
        }
        DoReadUploadChunk();
    }

    void FinishChunkUpload() {
        auto upload = std::move(chunk_upload_);
        chunk_parser_.reset();
        try {
            auto ack = state_->coordinator->CompleteChunk(*upload);
            if (!ack.ok()) {
                return Send(chunkfs::http::ErrorResponse(version_, ack.error(), ctx_.request_id));
            }
        } catch (const std::exception& ex) {
            upload->Abort();
            return Send(Internal(ex));
        }
        Send(chunkfs::http::JsonOk(version_, "{\"success\":true}"));
    }

    void DiscardChunk() {
        if (chunk_upload_) {
            chunk_upload_->Abort();
            chunk_upload_.reset();
        }
        chunk_parser_.reset();
    }

    chunkfs::http::HttpResponse Internal(const std::exception& ex) const {
        chunkfs::core::LogError("Unhandled exception in " + ctx_.method + " " + ctx_.target +
                                ": " + ex.what());
        return chunkfs::http::JsonError(version_, http::status::internal_server_error,
                                        "INTERNAL", "internal server error", ctx_.request_id);
    }

    chunkfs::http::HttpResponse TooLarge() const {
        return chunkfs::http::JsonError(version_, http::status::payload_too_large,
                                        "PAYLOAD_TOO_LARGE", "request body exceeds limit",
                                        ctx_.request_id);
    }

    // For responses sent before the body was consumed: the connection cannot be reused.
    void SendAndClose(chunkfs::http::HttpResponse&& response) {
        keep_alive_ = false;
        Send(std::move(response));
    }

    void Send(chunkfs::http::HttpResponse&& response) {
        response.set(http::field::server, "ChunkFS");
        response.set("X-Request-Id", ctx_.request_id);
        response.keep_alive(keep_alive_);
        const auto latency = ctx_.ElapsedMs();
        chunkfs::core::LogRequest(ctx_.request_id, ctx_.method, ctx_.target, ctx_.remote,
                                  response.result_int(), latency);
        chunkfs::observability::RecordRequest(response.result_int(), latency);

        auto sp = std::make_shared<chunkfs::http::HttpResponse>(std::move(response));
        http::async_write(stream_, *sp,
                          beast::bind_front_handler(&Session::OnWrite, shared_from_this(),
                                                    sp->need_eof(), sp));
    }

    void OnWrite(bool close, std::shared_ptr<chunkfs::http::HttpResponse>,
                 beast::error_code ec, std::size_t) {
        if (ec) {
            chunkfs::core::LogError("Write failed: " + ec.message());
            return;
        }
        if (close) {
            return DoClose();
        }
        DoReadHeader();
    }

    void DoClose() {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    }

    std::string GetRemoteAddress() const {
        beast::error_code ec;
        auto endpoint = stream_.socket().remote_endpoint(ec);
        if (ec) {
            return "unknown";
        }
        return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    std::shared_ptr<const ServerState> state_;

    std::optional<http::request_parser<http::empty_body>> header_parser_;
    std::optional<http::request_parser<http::string_body>> request_parser_;
    std::optional<http::request_parser<http::buffer_body>> chunk_parser_;
    std::array<char, kChunkBufferSize> chunk_buffer_{};
    std::unique_ptr<chunkfs::upload::ChunkUpload> chunk_upload_;

    chunkfs::http::RequestContext ctx_;
    unsigned version_{11};
    bool keep_alive_{true};
};

class Listener : public std::enable_shared_from_this<Listener> {
public:
    Listener(net::io_context& ioc, tcp::endpoint endpoint,
             std::shared_ptr<const ServerState> state)
        : ioc_(ioc), acceptor_(ioc), state_(std::move(state)) {
        beast::error_code ec;
        acceptor_.open(endpoint.protocol(), ec);
        if (!ec) {
            acceptor_.set_option(net::socket_base::reuse_address(true), ec);
        }
        if (!ec) {
            acceptor_.bind(endpoint, ec);
        }
        if (!ec) {
            acceptor_.listen(net::socket_base::max_listen_connections, ec);
        }
        if (ec) {
            chunkfs::core::LogError("Listen on " + endpoint.address().to_string() + ":" +
                                    std::to_string(endpoint.port()) + " failed: " +
                                    ec.message());
            acceptor_.close(ec);
        }
    }

    bool listening() const { return acceptor_.is_open(); }

    void Run() { DoAccept(); }

private:
    void DoAccept() {
        // Each connection gets its own strand so its handlers never run concurrently.
        acceptor_.async_accept(net::make_strand(ioc_),
                               beast::bind_front_handler(&Listener::OnAccept,
                                                         shared_from_this()));
    }

    void OnAccept(beast::error_code ec, tcp::socket socket) {
        if (ec) {
            chunkfs::core::LogError("Accept failed: " + ec.message());
        } else {
            std::make_shared<Session>(std::move(socket), state_)->Start();
        }
        DoAccept();
    }

    net::io_context& ioc_;
    tcp::acceptor acceptor_;
    std::shared_ptr<const ServerState> state_;
};

}  // namespace

namespace chunkfs::http {

HttpServer::HttpServer(boost::asio::io_context& ioc, const core::Config& config, Router router,
                       std::shared_ptr<upload::UploadCoordinator> coordinator)
    : ioc_(ioc),
      state_(std::make_shared<const ServerState>(
          ServerState{std::move(router), config, std::move(coordinator)})) {
}

HttpServer::~HttpServer() = default;

bool HttpServer::Run() {
    StartCleanupJob();

    beast::error_code ec;
    const auto address = net::ip::make_address(state_->config.server.host, ec);
    if (ec) {
        core::LogError("Invalid listen address " + state_->config.server.host + ": " +
                       ec.message());
        return false;
    }
    const tcp::endpoint endpoint{address,
                                 static_cast<unsigned short>(state_->config.server.port)};
    auto listener = std::make_shared<Listener>(ioc_, endpoint, state_);
    if (!listener->listening()) {
        return false;
    }
    listener->Run();
    return true;
}

void HttpServer::StartCleanupJob() {
    if (!state_->config.cleanup.enabled) {
        return;
    }
    // Anything left over from a previous process has no session any more.
    RunCleanupSweep();
    cleanup_timer_ = std::make_unique<net::steady_timer>(ioc_);
    ScheduleCleanupSweep();
}

void HttpServer::ScheduleCleanupSweep() {
    cleanup_timer_->expires_after(
        std::chrono::seconds(state_->config.cleanup.sweep_interval_seconds));
    cleanup_timer_->async_wait([this](const beast::error_code& ec) {
        if (ec) {
            return;
        }
        RunCleanupSweep();
        ScheduleCleanupSweep();
    });
}

void HttpServer::RunCleanupSweep() {
    const auto& config = state_->config;
    if (config.upload.session_idle_ttl_seconds > 0) {
        const auto expired = state_->coordinator->ExpireIdleSessions(
            std::chrono::seconds(config.upload.session_idle_ttl_seconds));
        if (expired > 0) {
            core::LogInfo("Cleanup sweep expired " + std::to_string(expired) +
                          " idle session(s)");
        }
    }

    auto swept = state_->coordinator->SweepOrphans();
    if (!swept.ok()) {
        core::LogError("Cleanup sweep failed to list staging areas: " + swept.error().message);
        return;
    }
    if (swept.value() > 0) {
        core::LogInfo("Cleanup sweep removed " + std::to_string(swept.value()) +
                      " orphaned staging area(s)");
    }
}

}  // namespace chunkfs::http
