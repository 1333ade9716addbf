#pragma once

#include <string>

namespace chunkfs::core {

/// @brief Time-based UUID attached to every HTTP exchange as X-Request-Id.
std::string GenerateRequestId();
/// @brief Generate an opaque upload session identifier.
std::string GenerateSessionId();

}  // namespace chunkfs::core
