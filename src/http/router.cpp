#include "chunkfs/http/router.h"

#include <algorithm>
#include <sstream>

#include <Poco/Exception.h>
#include <Poco/URI.h>

#include "chunkfs/http/responses.h"

namespace chunkfs::http {

namespace beast_http = boost::beast::http;

void Router::Add(beast_http::verb method, const std::string& pattern, Handler handler) {
    // Patterns are split once here rather than on every request.
    routes_.push_back(RouteEntry{method, SplitPath(pattern), std::move(handler)});
}

core::Result<HttpResponse> Router::Route(const RequestContext& ctx,
                                         const HttpRequest& request) const {
    const auto path = SplitPath(StripQuery(std::string(request.target())));

    bool path_known = false;
    for (const auto& route : routes_) {
        RouteParams params;
        if (!MatchSegments(route.segments, path, &params)) {
            continue;
        }
        path_known = true;
        if (route.method == request.method()) {
            return route.handler(ctx, request, params);
        }
    }

    if (path_known) {
        auto response = JsonError(request.version(), beast_http::status::method_not_allowed,
                                  "METHOD_NOT_ALLOWED", "method not allowed", ctx.request_id);
        response.set(beast_http::field::allow,
                     AllowedMethods(StripQuery(std::string(request.target()))));
        return response;
    }
    return JsonError(request.version(), beast_http::status::not_found, "NOT_FOUND",
                     "route not found", ctx.request_id);
}

std::string Router::AllowedMethods(const std::string& path) const {
    const auto segments = SplitPath(path);
    std::vector<beast_http::verb> methods;
    for (const auto& route : routes_) {
        if (MatchSegments(route.segments, segments, nullptr) &&
            std::find(methods.begin(), methods.end(), route.method) == methods.end()) {
            methods.push_back(route.method);
        }
    }
    std::string allowed;
    for (auto method : methods) {
        if (!allowed.empty()) {
            allowed += ", ";
        }
        allowed += std::string(beast_http::to_string(method));
    }
    return allowed;
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

bool Router::MatchSegments(const std::vector<std::string>& pattern,
                           const std::vector<std::string>& path, RouteParams* out_params) {
    if (pattern.size() != path.size()) {
        return false;
    }
    for (std::size_t i = 0; i < pattern.size(); ++i) {
        const auto& p = pattern[i];
        if (p.size() >= 2 && p.front() == '{' && p.back() == '}') {
            if (out_params) {
                (*out_params)[p.substr(1, p.size() - 2)] = path[i];
            }
        } else if (p != path[i]) {
            return false;
        }
    }
    return true;
}

bool Router::Match(const std::string& pattern, const std::string& path, RouteParams* out_params) {
    return MatchSegments(SplitPath(pattern), SplitPath(path), out_params);
}

std::string StripQuery(const std::string& target) {
    return target.substr(0, target.find('?'));
}

core::Result<std::string> GetQueryParam(const std::string& target, const std::string& key) {
    const auto pos = target.find('?');
    if (pos == std::string::npos) {
        return std::string();
    }
    std::string query = target.substr(pos + 1);
    const auto fragment = query.find('#');
    if (fragment != std::string::npos) {
        query.resize(fragment);
    }

    std::stringstream ss(query);
    std::string item;
    try {
        while (std::getline(ss, item, '&')) {
            const auto eq = item.find('=');
            std::string name;
            Poco::URI::decode(item.substr(0, eq), name, true);
            if (name != key) {
                continue;
            }
            if (eq == std::string::npos) {
                return std::string();
            }
            std::string decoded;
            Poco::URI::decode(item.substr(eq + 1), decoded, true);
            return decoded;
        }
    } catch (const Poco::SyntaxException& ex) {
        return core::Error{core::ErrorCode::kInvalidArgument,
                           "malformed query parameter: " + ex.displayText()};
    }
    return std::string();
}

}  // namespace chunkfs::http
