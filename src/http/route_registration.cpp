#include "flashdrop/http/route_registration.h"

#include <optional>
#include <sstream>
#include <string>

#include <Poco/Exception.h>
#include <Poco/JSON/Object.h>
#include <Poco/JSON/Parser.h>

#include "flashdrop/core/logger.h"
#include "flashdrop/core/time.h"
#include "flashdrop/http/multipart_form.h"
#include "flashdrop/http/responses.h"
#include "flashdrop/observability/metrics.h"
#include "flashdrop/upload/assembler.h"
#include "flashdrop/upload/chunk_session_tracker.h"

namespace flashdrop::http {
namespace {

std::optional<int> ParseInt(const std::string& value, int min_value) {
    if (value.empty()) {
        return std::nullopt;
    }
    try {
        size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        if (consumed != value.size() || parsed < min_value) {
            return std::nullopt;
        }
        return parsed;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string Stringify(const Poco::JSON::Object& obj) {
    std::stringstream ss;
    obj.stringify(ss);
    return ss.str();
}

HttpResponse BadRequest(const RequestContext& ctx, const HttpRequest& req,
                        const std::string& message) {
    return JsonError(req.version(), "INVALID_ARGUMENT", message, ctx.request_id,
                     boost::beast::http::status::bad_request);
}

struct CompleteRequest {
    std::string session_token;
    std::string file_name;
    int total_chunks{0};
};

core::Result<CompleteRequest> ParseCompleteRequest(const std::string& body) {
    try {
        Poco::JSON::Parser parser;
        auto result = parser.parse(body);
        auto obj = result.extract<Poco::JSON::Object::Ptr>();
        if (!obj || !obj->has("sessionId") || !obj->has("totalChunks")) {
            return core::Error{core::ErrorCode::kInvalidArgument,
                               "sessionId and totalChunks are required"};
        }
        CompleteRequest request;
        request.session_token = obj->getValue<std::string>("sessionId");
        request.file_name = obj->optValue<std::string>("fileName", "");
        request.total_chunks = obj->getValue<int>("totalChunks");
        if (request.session_token.empty() || request.total_chunks <= 0) {
            return core::Error{core::ErrorCode::kInvalidArgument,
                               "invalid sessionId or totalChunks"};
        }
        return request;
    } catch (const Poco::Exception& ex) {
        return core::Error{core::ErrorCode::kInvalidArgument,
                           "invalid JSON body: " + ex.displayText()};
    } catch (const std::exception& ex) {
        return core::Error{core::ErrorCode::kInvalidArgument,
                           std::string("invalid JSON body: ") + ex.what()};
    }
}

}  // namespace

void RegisterDefaultRoutes(Router& router, std::shared_ptr<upload::ChunkSessionTracker> tracker,
                           std::shared_ptr<upload::Assembler> assembler,
                           const core::Config& config) {
    router.Add("GET", "/health",
               [](const RequestContext&, const HttpRequest& req, const RouteParams&) {
                   Poco::JSON::Object body;
                   body.set("status", "healthy");
                   body.set("timestamp", core::NowIso8601());
                   return JsonOk(req.version(), Stringify(body));
               });

    router.Add("GET", "/healthz",
               [](const RequestContext& ctx, const HttpRequest& req, const RouteParams&) {
                   return JsonOk(req.version(),
                                 "{\"status\":\"ok\",\"request_id\":\"" + ctx.request_id + "\"}");
               });

    router.Add("GET", "/readyz",
               [tracker](const RequestContext& ctx, const HttpRequest& req, const RouteParams&) {
                   Poco::JSON::Object body;
                   body.set("status", "ready");
                   body.set("active_sessions", static_cast<Poco::UInt64>(tracker->Count()));
                   body.set("request_id", ctx.request_id);
                   return JsonOk(req.version(), Stringify(body));
               });

    router.Add("GET", "/metrics",
               [](const RequestContext&, const HttpRequest& req, const RouteParams&) {
                   HttpResponse response{boost::beast::http::status::ok, req.version()};
                   response.set(boost::beast::http::field::content_type, "text/plain");
                   response.body() = observability::RenderMetrics();
                   response.prepare_payload();
                   return response;
               });

    router.Add("POST", "/upload/chunk",
               [tracker](const RequestContext& ctx, const HttpRequest& req,
                         const RouteParams&) -> core::Result<HttpResponse> {
                   auto form = MultipartForm::Parse(
                       std::string(req[boost::beast::http::field::content_type]), req.body());
                   if (!form.ok()) {
                       return BadRequest(ctx, req, form.error().message);
                   }
                   const auto* chunk_part = form.value().Find("chunk");
                   const auto file_name = form.value().Field("fileName");
                   const auto index = ParseInt(form.value().Field("chunkIndex"), 0);
                   const auto total = ParseInt(form.value().Field("totalChunks"), 1);
                   if (!chunk_part || file_name.empty()) {
                       return BadRequest(ctx, req, "chunk and fileName parts are required");
                   }
                   if (!index || !total) {
                       return BadRequest(ctx, req, "invalid chunkIndex or totalChunks");
                   }

                   upload::ChunkUpload chunk;
                   chunk.session_token = form.value().Field("sessionId");
                   chunk.file_name = file_name;
                   chunk.chunk_index = *index;
                   chunk.total_chunks = *total;
                   chunk.data = chunk_part->body;

                   auto stored = tracker->PutChunk(chunk);
                   if (!stored.ok()) {
                       return JsonError(req.version(), stored.error(), ctx.request_id);
                   }
                   observability::RecordChunkReceived(stored.value().size_bytes);

                   Poco::JSON::Object body;
                   body.set("chunkId", stored.value().path.filename().string());
                   body.set("sessionId", stored.value().session_token);
                   body.set("chunkIndex", stored.value().chunk_index);
                   body.set("success", true);
                   return JsonOk(req.version(), Stringify(body));
               });

    router.Add("POST", "/upload/complete",
               [assembler](const RequestContext& ctx, const HttpRequest& req,
                           const RouteParams&) -> core::Result<HttpResponse> {
                   auto parsed = ParseCompleteRequest(req.body());
                   if (!parsed.ok()) {
                       return JsonError(req.version(), parsed.error(), ctx.request_id);
                   }
                   auto record = assembler->Complete(parsed.value().session_token,
                                                     parsed.value().total_chunks);
                   if (!record.ok()) {
                       return JsonError(req.version(), record.error(), ctx.request_id);
                   }

                   const auto& file = record.value();
                   Poco::JSON::Object body;
                   body.set("fileId", file.id);
                   body.set("shareLink", "/files/" + file.id + file.extension);
                   body.set("expiryTime", core::FormatIso8601(file.expiry_time));
                   return JsonOk(req.version(), Stringify(body));
               });

    core::LogDebug("Routes registered; max file size " +
                   std::to_string(config.storage.max_file_bytes) + " bytes");
}

}  // namespace flashdrop::http
