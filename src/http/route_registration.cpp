#include "chunkfs/http/route_registration.h"

#include <cctype>
#include <exception>
#include <string>

#include <Poco/Dynamic/Var.h>
#include <Poco/JSON/Array.h>
#include <Poco/JSON/Object.h>
#include <Poco/JSON/Parser.h>

#include "chunkfs/http/multipart_form.h"
#include "chunkfs/http/responses.h"
#include "chunkfs/observability/metrics.h"
#include "chunkfs/upload/upload_coordinator.h"

namespace chunkfs::http {
namespace {

namespace beast_http = boost::beast::http;

Poco::JSON::Object::Ptr ParseObject(const std::string& body) {
    Poco::JSON::Parser parser;
    auto result = parser.parse(body);
    return result.extract<Poco::JSON::Object::Ptr>();
}

std::string OptionalString(const Poco::JSON::Object::Ptr& obj, const std::string& key) {
    if (!obj->has(key) || obj->isNull(key)) {
        return "";
    }
    return obj->getValue<std::string>(key);
}

Poco::JSON::Array::Ptr ToArray(const std::vector<std::uint64_t>& indices) {
    Poco::JSON::Array::Ptr arr = new Poco::JSON::Array();
    for (auto index : indices) {
        arr->add(static_cast<Poco::UInt64>(index));
    }
    return arr;
}

HttpResponse Success(int version) {
    Poco::JSON::Object::Ptr root = new Poco::JSON::Object();
    root->set("success", true);
    return JsonOk(version, root);
}

HttpResponse InvalidJson(const RequestContext& ctx, const HttpRequest& req,
                         const std::string& message) {
    return JsonError(req.version(), beast_http::status::bad_request, "INVALID_JSON", message,
                     ctx.request_id);
}

}  // namespace

std::optional<std::uint64_t> ParseChunkIndex(const std::string& value) {
    if (value.empty() || value.size() > 19) {
        return std::nullopt;
    }
    std::uint64_t parsed = 0;
    for (char c : value) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        parsed = parsed * 10 + static_cast<std::uint64_t>(c - '0');
    }
    return parsed;
}

void RegisterDefaultRoutes(Router& router,
                           std::shared_ptr<upload::UploadCoordinator> coordinator) {
    router.Add(beast_http::verb::get, "/healthz",
               [](const RequestContext& ctx, const HttpRequest& req, const RouteParams&) {
                   return JsonOk(req.version(),
                                 "{\"status\":\"ok\",\"request_id\":\"" + ctx.request_id + "\"}");
               });

    router.Add(beast_http::verb::get, "/readyz",
               [](const RequestContext& ctx, const HttpRequest& req, const RouteParams&) {
                   return JsonOk(req.version(),
                                 "{\"status\":\"ready\",\"request_id\":\"" + ctx.request_id + "\"}");
               });

    router.Add(beast_http::verb::get, "/metrics",
               [](const RequestContext&, const HttpRequest& req, const RouteParams&) {
                   HttpResponse response{beast_http::status::ok, req.version()};
                   response.set(beast_http::field::content_type, "text/plain");
                   response.body() = observability::RenderMetrics();
                   response.prepare_payload();
                   return response;
               });

    router.Add(beast_http::verb::post, "/upload/init",
               [coordinator](const RequestContext& ctx, const HttpRequest& req,
                             const RouteParams&) {
                   upload::InitRequest request;
                   try {
                       auto obj = ParseObject(req.body());
                       request.file_name = obj->getValue<std::string>("fileName");
                       request.declared_size = obj->getValue<Poco::Int64>("fileSize");
                       request.chunk_size = obj->getValue<Poco::Int64>("chunkSize");
                       request.content_hash = obj->getValue<std::string>("fileHash");
                   } catch (const std::exception& ex) {
                       return InvalidJson(ctx, req, ex.what());
                   }

                   auto outcome = coordinator->InitUpload(request);
                   if (!outcome.ok()) {
                       return ErrorResponse(req.version(), outcome.error(), ctx.request_id);
                   }
                   Poco::JSON::Object::Ptr root = new Poco::JSON::Object();
                   if (outcome.value().deduplicated()) {
                       root->set("uploadId", Poco::Dynamic::Var());
                       root->set("filePath", *outcome.value().existing_file);
                       root->set("exists", true);
                       root->set("success", true);
                   } else {
                       root->set("uploadId", *outcome.value().session_id);
                   }
                   return JsonOk(req.version(), root);
               });

    router.Add(beast_http::verb::post, "/upload/chunk",
               [coordinator](const RequestContext& ctx, const HttpRequest& req,
                             const RouteParams&) {
                   auto form = ParseMultipartForm(
                       std::string(req[beast_http::field::content_type]), req.body());
                   if (!form.ok()) {
                       return ErrorResponse(req.version(), form.error(), ctx.request_id);
                   }
                   const auto upload_id = form.value().Field("uploadId");
                   const auto index = ParseChunkIndex(form.value().Field("chunkIndex"));
                   if (upload_id.empty() || !index) {
                       return JsonError(req.version(), beast_http::status::bad_request,
                                        "INVALID_REQUEST", "uploadId and chunkIndex are required",
                                        ctx.request_id);
                   }
                   if (!form.value().file) {
                       return JsonError(req.version(), beast_http::status::bad_request,
                                        "INVALID_REQUEST", "missing file part", ctx.request_id);
                   }

                   auto ack = coordinator->ReceiveChunk(upload_id, *index, *form.value().file);
                   if (!ack.ok()) {
                       return ErrorResponse(req.version(), ack.error(), ctx.request_id);
                   }
                   return Success(req.version());
               });

    router.Add(beast_http::verb::get, "/upload/progress",
               [coordinator](const RequestContext& ctx, const HttpRequest& req,
                             const RouteParams&) {
                   const auto upload_id = GetQueryParam(std::string(req.target()), "uploadId");
                   if (!upload_id.ok()) {
                       return ErrorResponse(req.version(), upload_id.error(), ctx.request_id);
                   }
                   auto report = coordinator->GetProgress(upload_id.value());
                   if (!report.ok()) {
                       return ErrorResponse(req.version(), report.error(), ctx.request_id);
                   }
                   Poco::JSON::Object::Ptr root = new Poco::JSON::Object();
                   root->set("progress", report.value().percent);
                   root->set("uploadedChunks", ToArray(report.value().uploaded));
                   root->set("totalChunks", static_cast<Poco::UInt64>(report.value().total_chunks));
                   root->set("missingChunks", ToArray(report.value().missing));
                   return JsonOk(req.version(), root);
               });

    router.Add(beast_http::verb::post, "/upload/merge",
               [coordinator](const RequestContext& ctx, const HttpRequest& req,
                             const RouteParams&) {
                   std::string upload_id;
                   std::string file_name;
                   std::string file_hash;
                   try {
                       auto obj = ParseObject(req.body());
                       upload_id = obj->getValue<std::string>("uploadId");
                       file_name = OptionalString(obj, "fileName");
                       file_hash = OptionalString(obj, "fileHash");
                   } catch (const std::exception& ex) {
                       return InvalidJson(ctx, req, ex.what());
                   }

                   auto merged = coordinator->MergeUpload(upload_id, file_name, file_hash);
                   if (!merged.ok()) {
                       return ErrorResponse(req.version(), merged.error(), ctx.request_id);
                   }
                   Poco::JSON::Object::Ptr root = new Poco::JSON::Object();
                   root->set("success", true);
                   root->set("filePath", merged.value().file_path);
                   root->set("size", static_cast<Poco::UInt64>(merged.value().size_bytes));
                   return JsonOk(req.version(), root);
               });

    router.Add(beast_http::verb::post, "/upload/cancel",
               [coordinator](const RequestContext& ctx, const HttpRequest& req,
                             const RouteParams&) {
                   std::string upload_id;
                   try {
                       upload_id = ParseObject(req.body())->getValue<std::string>("uploadId");
                   } catch (const std::exception& ex) {
                       return InvalidJson(ctx, req, ex.what());
                   }
                   auto cancelled = coordinator->CancelUpload(upload_id);
                   if (!cancelled.ok()) {
                       return ErrorResponse(req.version(), cancelled.error(), ctx.request_id);
                   }
                   return Success(req.version());
               });
}

}  // namespace chunkfs::http
