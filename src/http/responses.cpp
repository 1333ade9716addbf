#include "chunkfs/http/responses.h"

#include <sstream>

#include <Poco/JSON/Array.h>

namespace chunkfs::http {

namespace http = boost::beast::http;

StringResponse JsonOk(int version, const std::string& body) {
    StringResponse response{http::status::ok, version};
    response.set(http::field::content_type, "application/json");
    response.body() = body;
    response.prepare_payload();
    return response;
}

StringResponse JsonOk(int version, const Poco::JSON::Object::Ptr& body) {
    std::stringstream ss;
    body->stringify(ss);
    return JsonOk(version, ss.str());
}

namespace {

Poco::JSON::Object::Ptr ErrorEnvelope(const std::string& code, const std::string& message,
                                      const std::string& request_id) {
    Poco::JSON::Object::Ptr error = new Poco::JSON::Object();
    error->set("code", code);
    error->set("message", message);
    error->set("request_id", request_id);
    Poco::JSON::Object::Ptr root = new Poco::JSON::Object();
    root->set("error", error);
    return root;
}

StringResponse WithStatus(http::status status, int version, const Poco::JSON::Object::Ptr& body) {
    auto response = JsonOk(version, body);
    response.result(status);
    return response;
}

}  // namespace

StringResponse JsonError(int version, http::status status, const std::string& code,
                         const std::string& message, const std::string& request_id) {
    return WithStatus(status, version, ErrorEnvelope(code, message, request_id));
}

StringResponse ErrorResponse(int version, const core::Error& error,
                             const std::string& request_id) {
    auto root = ErrorEnvelope(core::ErrorCodeName(error.code), error.message, request_id);
    if (error.code == core::ErrorCode::kIncompleteUpload) {
        Poco::JSON::Array::Ptr missing = new Poco::JSON::Array();
        for (auto index : error.chunks) {
            missing->add(static_cast<Poco::UInt64>(index));
        }
        root->set("missingChunks", missing);
    }
    return WithStatus(StatusFor(error.code), version, root);
}

http::status StatusFor(core::ErrorCode code) {
    switch (code) {
        case core::ErrorCode::kOk:
            return http::status::ok;
        case core::ErrorCode::kInvalidArgument:
        case core::ErrorCode::kIncompleteUpload:
            return http::status::bad_request;
        case core::ErrorCode::kNotFound:
            return http::status::not_found;
        case core::ErrorCode::kConflict:
            return http::status::conflict;
        case core::ErrorCode::kHashMismatch:
            return http::status::unprocessable_entity;
        case core::ErrorCode::kChunkMissing:
        case core::ErrorCode::kIoError:
        case core::ErrorCode::kTransferFailed:
        case core::ErrorCode::kCancelled:
        case core::ErrorCode::kInternal:
            return http::status::internal_server_error;
    }
    return http::status::internal_server_error;
}

}  // namespace chunkfs::http
