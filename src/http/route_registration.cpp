#include "stitchfs/http/route_registration.h"

#include <sstream>
#include <string>

#include <Poco/Dynamic/Var.h>
#include <Poco/JSON/Object.h>
#include <Poco/JSON/Parser.h>

#include "stitchfs/observability/metrics.h"
#include "stitchfs/upload/assembler.h"
#include "stitchfs/upload/chunk_receiver.h"

namespace stitchfs::http {
namespace {

HttpResponse JsonOk(int version, const std::string& body) {
    return JsonResponse(boost::beast::http::status::ok, version, body);
}

HttpResponse ErrorFor(const RequestContext& ctx, int version, const core::Error& error) {
    return ErrorResponse(StatusForError(error.code), version, core::ErrorKind(error.code),
                         error.message, ctx.request_id);
}

std::string Stringify(const Poco::JSON::Object& object) {
    std::stringstream ss;
    object.stringify(ss);
    return ss.str();
}

// Parsed finalize body; any field problem becomes INVALID_JSON except a non-integer count.
struct FinalizeBody {
    upload::FinalizeRequest request;
    bool count_is_integer{true};
};

core::Result<FinalizeBody> ParseFinalizeBody(const std::string& body) {
    try {
        Poco::JSON::Parser parser;
        auto result = parser.parse(body);
        auto obj = result.extract<Poco::JSON::Object::Ptr>();
        if (!obj || !obj->has("uploadId") || !obj->has("fileName") ||
            !obj->has("totalChunks")) {
            return core::MakeError(core::ErrorCode::kInvalidArgument,
                                   "uploadId, fileName and totalChunks are required");
        }

        FinalizeBody parsed;
        parsed.request.session_id = obj->getValue<std::string>("uploadId");
        parsed.request.destination_name = obj->getValue<std::string>("fileName");
        const Poco::Dynamic::Var count = obj->get("totalChunks");
        if (!count.isInteger()) {
            parsed.count_is_integer = false;
            return parsed;
        }
        try {
            parsed.request.total_chunks = count.convert<Poco::Int64>();
        } catch (const Poco::Exception&) {
            parsed.count_is_integer = false;
        }
        return parsed;
    } catch (const std::exception& ex) {
        return core::MakeError(core::ErrorCode::kInvalidArgument, ex.what());
    }
}

}  // namespace

boost::beast::http::status StatusForError(core::ErrorCode code) {
    switch (core::ErrorCategoryOf(code)) {
        case core::ErrorCategory::kCallerInput:
            return boost::beast::http::status::bad_request;
        case core::ErrorCategory::kNotFound:
            return boost::beast::http::status::not_found;
        case core::ErrorCategory::kNone:
        case core::ErrorCategory::kInfrastructure:
            break;
    }
    return boost::beast::http::status::internal_server_error;
}

void RegisterDefaultRoutes(Router& router, std::shared_ptr<upload::ChunkReceiver> receiver,
                           std::shared_ptr<upload::Assembler> assembler) {
    router.Add("GET", "/healthz",
               [](const RequestContext& ctx, const HttpRequest& req, const RouteParams&) {
                   return JsonOk(req.version(),
                                 "{\"status\":\"ok\",\"request_id\":\"" + ctx.request_id + "\"}");
               });

    router.Add("GET", "/readyz",
               [](const RequestContext& ctx, const HttpRequest& req, const RouteParams&) {
                   return JsonOk(req.version(),
                                 "{\"status\":\"ready\",\"request_id\":\"" + ctx.request_id + "\"}");
               });

    router.Add("GET", "/metrics",
               [](const RequestContext&, const HttpRequest& req, const RouteParams&) {
                   HttpResponse response{boost::beast::http::status::ok, req.version()};
                   response.set(boost::beast::http::field::content_type, "text/plain");
                   response.body() = observability::RenderMetrics();
                   response.prepare_payload();
                   return response;
               });

    router.Add("POST", "/api/upload-chunk",
               [receiver](const RequestContext& ctx, const HttpRequest& req, const RouteParams&) {
                   const auto target = std::string(req.target());
                   if (!Router::HasQueryParam(target, "uploadId") ||
                       !Router::HasQueryParam(target, "chunkIndex")) {
                       return ErrorResponse(boost::beast::http::status::bad_request,
                                            req.version(), "MISSING_FIELDS",
                                            "uploadId and chunkIndex are required",
                                            ctx.request_id);
                   }

                   auto received = receiver->Receive(Router::QueryParam(target, "uploadId"),
                                                     Router::QueryParam(target, "chunkIndex"),
                                                     req.body());
                   if (!received.ok()) {
                       return ErrorFor(ctx, req.version(), received.error());
                   }
                   return JsonOk(req.version(), "{\"success\":true}");
               });

    router.Add("POST", "/api/finalize-upload",
               [assembler](const RequestContext& ctx, const HttpRequest& req,
                           const RouteParams&) {
                   auto parsed = ParseFinalizeBody(req.body());
                   if (!parsed.ok()) {
                       return ErrorResponse(boost::beast::http::status::bad_request,
                                            req.version(), "INVALID_JSON",
                                            parsed.error().message, ctx.request_id);
                   }
                   if (!parsed.value().count_is_integer) {
                       return ErrorFor(ctx, req.version(),
                                       core::MakeError(core::ErrorCode::kInvalidChunkCount,
                                                       "totalChunks must be an integer"));
                   }

                   auto assembled = assembler->Finalize(parsed.value().request);
                   if (!assembled.ok()) {
                       return ErrorFor(ctx, req.version(), assembled.error());
                   }

                   Poco::JSON::Object root;
                   root.set("success", true);
                   root.set("path", assembled.value().path);
                   root.set("size", static_cast<Poco::UInt64>(assembled.value().size_bytes));
                   root.set("sha256", assembled.value().sha256);
                   return JsonOk(req.version(), Stringify(root));
               });
}

}  // namespace stitchfs::http
