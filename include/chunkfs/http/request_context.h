#pragma once

#include <chrono>
#include <string>

namespace chunkfs::http {

/// @brief What the connection knows about the request in flight; handlers use the id for
/// error envelopes and the server uses the rest for the access log.
struct RequestContext {
    std::string request_id;
    std::string method;
    std::string target;
    std::string remote;
    std::chrono::steady_clock::time_point started{};

    long long ElapsedMs() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::steady_clock::now() - started)
            .count();
    }
};

}  // namespace chunkfs::http
