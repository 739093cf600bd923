#include "stitchfs/http/router.h"

#include <sstream>

#include <Poco/JSON/Object.h>
#include <Poco/URI.h>

namespace stitchfs::http {

namespace {

// Returns the raw value and whether the key was present at all.
bool FindQueryValue(const std::string& target, const std::string& key, std::string* out) {
    auto pos = target.find('?');
    if (pos == std::string::npos) {
        return false;
    }
    std::stringstream ss(target.substr(pos + 1));
    std::string item;
    while (std::getline(ss, item, '&')) {
        auto eq = item.find('=');
        const auto name = item.substr(0, eq);
        if (name != key) {
            continue;
        }
        if (out) {
            *out = eq == std::string::npos ? "" : item.substr(eq + 1);
        }
        return true;
    }
    return false;
}

}  // namespace

void Router::Add(const std::string& method, const std::string& pattern, Handler handler) {
    routes_.push_back(RouteEntry{method, pattern, std::move(handler)});
}

core::Result<HttpResponse> Router::Route(const RequestContext& ctx,
                                        const HttpRequest& request) const {
    const auto path = StripQuery(std::string(request.target()));

    bool path_known = false;
    for (const auto& route : routes_) {
        RouteParams params;
        if (!Match(route.pattern, path, &params)) {
            continue;
        }
        path_known = true;
        if (route.method != request.method_string()) {
            continue;
        }
        return route.handler(ctx, request, params);
    }

    if (path_known) {
        return ErrorResponse(boost::beast::http::status::method_not_allowed, request.version(),
                             "METHOD_NOT_ALLOWED", "method not allowed", ctx.request_id);
    }
    return ErrorResponse(boost::beast::http::status::not_found, request.version(), "NOT_FOUND",
                         "route not found", ctx.request_id);
}

std::vector<std::string> Router::SplitPath(const std::string& path) {
    std::vector<std::string> parts;
    std::stringstream ss(path);
    std::string item;
    while (std::getline(ss, item, '/')) {
        if (!item.empty()) {
            parts.push_back(item);
        }
    }
    return parts;
}

bool Router::Match(const std::string& pattern, const std::string& path, RouteParams* out_params) {
    auto pattern_parts = SplitPath(pattern);
    auto path_parts = SplitPath(path);
    if (pattern_parts.size() != path_parts.size()) {
        return false;
    }

    for (size_t i = 0; i < pattern_parts.size(); ++i) {
        const auto& p = pattern_parts[i];
        const auto& v = path_parts[i];
        if (p.size() >= 2 && p.front() == '{' && p.back() == '}') {
            if (out_params) {
                std::string decoded;
                Poco::URI::decode(v, decoded);
                (*out_params)[p.substr(1, p.size() - 2)] = decoded;
            }
        } else if (p != v) {
            return false;
        }
    }
    return true;
}

std::string Router::StripQuery(const std::string& target) {
    auto pos = target.find('?');
    if (pos == std::string::npos) {
        return target;
    }
    return target.substr(0, pos);
}

std::string Router::QueryParam(const std::string& target, const std::string& key) {
    std::string raw;
    if (!FindQueryValue(target, key, &raw)) {
        return "";
    }
    std::string decoded;
    Poco::URI::decode(raw, decoded, true);
    return decoded;
}

bool Router::HasQueryParam(const std::string& target, const std::string& key) {
    return FindQueryValue(target, key, nullptr);
}

HttpResponse JsonResponse(boost::beast::http::status status, int version,
                          const std::string& body) {
    HttpResponse response{status, version};
    response.set(boost::beast::http::field::content_type, "application/json");
    response.body() = body;
    response.prepare_payload();
    return response;
}

HttpResponse ErrorResponse(boost::beast::http::status status, int version, const std::string& code,
                           const std::string& message, const std::string& request_id) {
    // Consistent error envelope for client troubleshooting.
    Poco::JSON::Object::Ptr error = new Poco::JSON::Object();
    error->set("code", code);
    error->set("message", message);
    error->set("request_id", request_id);
    Poco::JSON::Object root;
    root.set("error", error);
    std::stringstream ss;
    root.stringify(ss);
    return JsonResponse(status, version, ss.str());
}

}  // namespace stitchfs::http
