#pragma once

#include <string>

#include <boost/beast/http.hpp>
#include <Poco/JSON/Object.h>

#include "chunkfs/core/error.h"

namespace chunkfs::http {

using StringResponse = boost::beast::http::response<boost::beast::http::string_body>;

StringResponse JsonOk(int version, const std::string& body);
StringResponse JsonOk(int version, const Poco::JSON::Object::Ptr& body);

/// @brief Consistent error envelope: {"error":{"code","message","request_id"}}.
StringResponse JsonError(int version, boost::beast::http::status status, const std::string& code,
                         const std::string& message, const std::string& request_id);

/// @brief Map a core error to its HTTP status and envelope. Incomplete uploads also carry
/// a top-level `missingChunks` array so clients can resend exactly those chunks.
StringResponse ErrorResponse(int version, const core::Error& error,
                             const std::string& request_id);

boost::beast::http::status StatusFor(core::ErrorCode code);

}  // namespace chunkfs::http
