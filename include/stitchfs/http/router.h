#pragma once

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

#include <boost/beast/http.hpp>

#include "stitchfs/core/result.h"
#include "stitchfs/http/request_context.h"

namespace stitchfs::http {

using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;
using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;
using RouteParams = std::unordered_map<std::string, std::string>;
using Handler = std::function<core::Result<HttpResponse>(const RequestContext&, const HttpRequest&, const RouteParams&)>;

/// @brief Simple route table with path-template matching.
class Router {
public:
    void Add(const std::string& method, const std::string& pattern, Handler handler);
    core::Result<HttpResponse> Route(const RequestContext& ctx, const HttpRequest& request) const;

    static bool Match(const std::string& pattern, const std::string& path, RouteParams* out_params);
    static std::string StripQuery(const std::string& target);
    /// @brief Percent-decoded value of `key` in the query string, or "" when absent.
    static std::string QueryParam(const std::string& target, const std::string& key);
    static bool HasQueryParam(const std::string& target, const std::string& key);

private:
    struct RouteEntry {
        std::string method;
        std::string pattern;
        Handler handler;
    };

    static std::vector<std::string> SplitPath(const std::string& path);

    std::vector<RouteEntry> routes_;
};

/// @brief JSON response with the given status.
HttpResponse JsonResponse(boost::beast::http::status status, int version, const std::string& body);
/// @brief Error envelope: {"error":{"code","message","request_id"}}.
HttpResponse ErrorResponse(boost::beast::http::status status, int version, const std::string& code,
                           const std::string& message, const std::string& request_id);

}  // namespace stitchfs::http
