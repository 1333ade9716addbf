#include "chunkfs/client/http_upload_transport.h"

#include <exception>
#include <memory>
#include <sstream>
#include <utility>

#include <Poco/JSON/Array.h>
#include <Poco/JSON/Object.h>
#include <Poco/JSON/Parser.h>
#include <Poco/URI.h>
#include <Poco/UUIDGenerator.h>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>


namespace chunkfs::client {
namespace {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

using Request = http::request<http::string_body>;
using Response = http::response<http::string_body>;
using ExchangeHandler = std::function<void(beast::error_code, Response)>;

/// One request/response round trip on a fresh connection.
class HttpExchange : public std::enable_shared_from_this<HttpExchange> {
public:
    HttpExchange(net::io_context& ioc, Request request, std::chrono::seconds timeout,
                 ExchangeHandler handler)
        : resolver_(ioc),
          stream_(ioc),
          request_(std::move(request)),
          timeout_(timeout),
          handler_(std::move(handler)) {
    }

    void Run(const std::string& host, const std::string& port) {
        resolver_.async_resolve(host, port,
                                beast::bind_front_handler(&HttpExchange::OnResolve,
                                                          shared_from_this()));
    }

    void Cancel() {
        net::post(stream_.get_executor(), [self = shared_from_this()]() {
            self->cancelled_ = true;
            self->resolver_.cancel();
            self->stream_.cancel();
        });
    }

private:
    void OnResolve(beast::error_code ec, tcp::resolver::results_type results) {
        if (ec || cancelled_) {
            return Finish(ec);
        }
        if (timeout_.count() > 0) {
            stream_.expires_after(timeout_);
        }
        stream_.async_connect(results, beast::bind_front_handler(&HttpExchange::OnConnect,
                                                                 shared_from_this()));
    }

    void OnConnect(beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
        if (ec || cancelled_) {
            return Finish(ec);
        }
        http::async_write(stream_, request_,
                          beast::bind_front_handler(&HttpExchange::OnWrite, shared_from_this()));
    }

    void OnWrite(beast::error_code ec, std::size_t) {
        if (ec || cancelled_) {
            return Finish(ec);
        }
        http::async_read(stream_, buffer_, response_,
                         beast::bind_front_handler(&HttpExchange::OnRead, shared_from_this()));
    }

    void OnRead(beast::error_code ec, std::size_t) {
        beast::error_code ignored;
        stream_.socket().shutdown(tcp::socket::shutdown_both, ignored);
        Finish(ec);
    }

    void Finish(beast::error_code ec) {
        if (cancelled_) {
            ec = net::error::operation_aborted;
        }
        auto handler = std::move(handler_);
        handler(ec, std::move(response_));
    }

    tcp::resolver resolver_;
    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    Request request_;
    Response response_;
    std::chrono::seconds timeout_;
    ExchangeHandler handler_;
    bool cancelled_{false};
};

Request MakeRequest(http::verb method, const std::string& host, const std::string& target) {
    Request request{method, target, 11};
    request.set(http::field::host, host);
    request.set(http::field::user_agent, "chunkfs-upload-client");
    return request;
}

Request JsonRequest(const std::string& host, const std::string& target,
                    const Poco::JSON::Object::Ptr& body) {
    auto request = MakeRequest(http::verb::post, host, target);
    request.set(http::field::content_type, "application/json");
    std::stringstream ss;
    body->stringify(ss);
    request.body() = ss.str();
    request.prepare_payload();
    return request;
}

std::vector<std::uint64_t> IndicesOf(const Poco::JSON::Array::Ptr& arr) {
    std::vector<std::uint64_t> indices;
    if (!arr) {
        return indices;
    }
    for (std::size_t i = 0; i < arr->size(); ++i) {
        indices.push_back(arr->getElement<Poco::UInt64>(static_cast<unsigned int>(i)));
    }
    return indices;
}

/// Turns the outcome of an exchange into either a parsed JSON object or a core::Error.
core::Result<Poco::JSON::Object::Ptr> Interpret(beast::error_code ec, const Response& response,
                                                const std::string& what) {
    if (ec == net::error::operation_aborted) {
        return core::Error{core::ErrorCode::kCancelled, what + " cancelled"};
    }
    if (ec) {
        return core::Error{core::ErrorCode::kTransferFailed, what + " failed: " + ec.message()};
    }

    Poco::JSON::Object::Ptr body;
    try {
        Poco::JSON::Parser parser;
        body = parser.parse(response.body()).extract<Poco::JSON::Object::Ptr>();
    } catch (const std::exception& ex) {
        return core::Error{core::ErrorCode::kTransferFailed,
                           what + " returned HTTP " + std::to_string(response.result_int()) +
                               " with an unreadable body: " + ex.what()};
    }

    if (response.result() == http::status::ok) {
        return body;
    }
    core::Error error{core::ErrorCode::kTransferFailed,
                      what + " returned HTTP " + std::to_string(response.result_int())};
    auto envelope = body->getObject("error");
    if (envelope) {
        error.code = core::ErrorCodeFromName(envelope->optValue<std::string>("code", ""));
        error.message = envelope->optValue<std::string>("message", error.message);
    }
    error.chunks = IndicesOf(body->getArray("missingChunks"));
    return error;
}

core::Error Malformed(const std::string& what, const std::exception& ex) {
    return core::Error{core::ErrorCode::kTransferFailed,
                       "malformed " + what + " response: " + ex.what()};
}

core::Result<upload::InitOutcome> ParseInit(const Poco::JSON::Object::Ptr& obj) {
    upload::InitOutcome outcome;
    try {
        if (obj->optValue<bool>("exists", false)) {
            outcome.existing_file = obj->getValue<std::string>("filePath");
        } else if (obj->has("uploadId") && !obj->isNull("uploadId")) {
            outcome.session_id = obj->getValue<std::string>("uploadId");
        } else {
            return core::Error{core::ErrorCode::kTransferFailed,
                               "init response carries neither uploadId nor filePath"};
        }
    } catch (const std::exception& ex) {
        return Malformed("init", ex);
    }
    return outcome;
}

core::Result<upload::ProgressReport> ParseProgress(const Poco::JSON::Object::Ptr& obj) {
    upload::ProgressReport report;
    try {
        report.percent = obj->getValue<int>("progress");
        report.total_chunks = obj->getValue<Poco::UInt64>("totalChunks");
        report.uploaded = IndicesOf(obj->getArray("uploadedChunks"));
        report.missing = IndicesOf(obj->getArray("missingChunks"));
    } catch (const std::exception& ex) {
        return Malformed("progress", ex);
    }
    return report;
}

core::Result<upload::MergeOutcome> ParseMerge(const Poco::JSON::Object::Ptr& obj) {
    upload::MergeOutcome outcome;
    try {
        outcome.file_path = obj->getValue<std::string>("filePath");
        outcome.size_bytes = obj->optValue<Poco::UInt64>("size", 0);
    } catch (const std::exception& ex) {
        return Malformed("merge", ex);
    }
    return outcome;
}

}  // namespace

std::string BuildChunkForm(const ChunkPayload& chunk, std::string* content_type) {
    const auto boundary = "chunkfs-" + Poco::UUIDGenerator().createRandom().toString();
    *content_type = "multipart/form-data; boundary=" + boundary;

    std::ostringstream body;
    auto field = [&](const std::string& name, const std::string& value) {
        body << "--" << boundary << "\r\n"
             << "Content-Disposition: form-data; name=\"" << name << "\"\r\n\r\n"
             << value << "\r\n";
    };
    field("uploadId", chunk.session_id);
    field("chunkIndex", std::to_string(chunk.index));
    field("fileHash", chunk.content_hash);
    body << "--" << boundary << "\r\n"
         << "Content-Disposition: form-data; name=\"file\"; filename=\"" << chunk.index
         << ".part\"\r\n"
         << "Content-Type: application/octet-stream\r\n\r\n";
    body.write(chunk.bytes.data(), static_cast<std::streamsize>(chunk.bytes.size()));
    body << "\r\n--" << boundary << "--\r\n";
    return body.str();
}

HttpUploadTransport::HttpUploadTransport(boost::asio::io_context& ioc, std::string host,
                                         int port, std::chrono::seconds chunk_timeout)
    : ioc_(ioc),
      host_(std::move(host)),
      port_(std::to_string(port)),
      chunk_timeout_(chunk_timeout) {
}

HttpUploadTransport::HttpUploadTransport(boost::asio::io_context& ioc,
                                         const core::ClientConfig& config)
    : HttpUploadTransport(ioc, config.host, config.port,
                          std::chrono::seconds(config.chunk_timeout_seconds)) {
}

void HttpUploadTransport::InitUpload(const upload::InitRequest& request, InitHandler handler) {
    Poco::JSON::Object::Ptr body = new Poco::JSON::Object();
    body->set("fileName", request.file_name);
    body->set("fileSize", static_cast<Poco::Int64>(request.declared_size));
    body->set("chunkSize", static_cast<Poco::Int64>(request.chunk_size));
    body->set("fileHash", request.content_hash);

    auto exchange = std::make_shared<HttpExchange>(
        ioc_, JsonRequest(host_, "/upload/init", body), std::chrono::seconds(0),
        [handler](beast::error_code ec, Response response) {
            auto parsed = Interpret(ec, response, "init");
            if (!parsed.ok()) {
                return handler(parsed.error());
            }
            handler(ParseInit(parsed.value()));
        });
    exchange->Run(host_, port_);
}

void HttpUploadTransport::GetProgress(const std::string& session_id, ProgressHandler handler) {
    std::string encoded_id;
    Poco::URI::encode(session_id, "&=?#+", encoded_id);
    auto exchange = std::make_shared<HttpExchange>(
        ioc_, MakeRequest(http::verb::get, host_, "/upload/progress?uploadId=" + encoded_id),
        std::chrono::seconds(0), [handler](beast::error_code ec, Response response) {
            auto parsed = Interpret(ec, response, "progress");
            if (!parsed.ok()) {
                return handler(parsed.error());
            }
            handler(ParseProgress(parsed.value()));
        });
    exchange->Run(host_, port_);
}

void HttpUploadTransport::SendChunk(ChunkPayload chunk, CancellationToken token,
                                    ChunkHandler handler) {
    auto request = MakeRequest(http::verb::post, host_, "/upload/chunk");
    std::string content_type;
    request.body() = BuildChunkForm(chunk, &content_type);
    request.set(http::field::content_type, content_type);
    request.prepare_payload();

    const auto index = chunk.index;
    auto exchange = std::make_shared<HttpExchange>(
        ioc_, std::move(request), chunk_timeout_,
        [handler, index](beast::error_code ec, Response response) {
            if (ec == beast::error::timeout) {
                return handler(core::Error{core::ErrorCode::kTransferFailed,
                                           "chunk " + std::to_string(index) + " timed out"});
            }
            auto parsed = Interpret(ec, response, "chunk " + std::to_string(index));
            if (!parsed.ok()) {
                return handler(parsed.error());
            }
            handler(core::Ok());
        });
    std::weak_ptr<HttpExchange> weak = exchange;
    token.OnCancel([weak]() {
        if (auto live = weak.lock()) {
            live->Cancel();
        }
    });
    exchange->Run(host_, port_);
}

void HttpUploadTransport::MergeUpload(const std::string& session_id,
                                      const std::string& file_name,
                                      const std::string& content_hash, MergeHandler handler) {
    Poco::JSON::Object::Ptr body = new Poco::JSON::Object();
    body->set("uploadId", session_id);
    body->set("fileName", file_name);
    body->set("fileHash", content_hash);

    auto exchange = std::make_shared<HttpExchange>(
        ioc_, JsonRequest(host_, "/upload/merge", body), std::chrono::seconds(0),
        [handler](beast::error_code ec, Response response) {
            auto parsed = Interpret(ec, response, "merge");
            if (!parsed.ok()) {
                return handler(parsed.error());
            }
            handler(ParseMerge(parsed.value()));
        });
    exchange->Run(host_, port_);
}

}  // namespace chunkfs::client
