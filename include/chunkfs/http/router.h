#pragma once

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

#include <boost/beast/http.hpp>

#include "chunkfs/core/result.h"
#include "chunkfs/http/request_context.h"

namespace chunkfs::http {

using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;
using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;
using RouteParams = std::unordered_map<std::string, std::string>;
using Handler = std::function<core::Result<HttpResponse>(const RequestContext&,
                                                         const HttpRequest&,
                                                         const RouteParams&)>;

/// @brief Method + path-template route table. `{name}` segments bind into RouteParams;
/// the query string never takes part in matching.
///
/// Unknown paths answer 404; known paths requested with another method answer 405 with an
/// `Allow` header listing the registered methods.
class Router {
public:
    void Add(boost::beast::http::verb method, const std::string& pattern, Handler handler);
    core::Result<HttpResponse> Route(const RequestContext& ctx, const HttpRequest& request) const;

    /// @brief Registered methods for `path`, comma separated in registration order.
    std::string AllowedMethods(const std::string& path) const;

    static bool Match(const std::string& pattern, const std::string& path, RouteParams* out_params);

private:
    struct RouteEntry {
        boost::beast::http::verb method;
        std::vector<std::string> segments;
        Handler handler;
    };

    static std::vector<std::string> SplitPath(const std::string& path);
    static bool MatchSegments(const std::vector<std::string>& pattern,
                              const std::vector<std::string>& path, RouteParams* out_params);

    std::vector<RouteEntry> routes_;
};

/// @brief Request path without the query string.
std::string StripQuery(const std::string& target);
/// @brief Percent-decoded value of query parameter `key`, or empty when absent.
/// A malformed escape anywhere in the examined pairs is kInvalidArgument.
core::Result<std::string> GetQueryParam(const std::string& target, const std::string& key);

}  // namespace chunkfs::http
