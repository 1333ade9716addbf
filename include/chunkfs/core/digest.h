#pragma once

#include <string>

#include "chunkfs/core/result.h"

namespace chunkfs::core {

/// @brief Stream a file through SHA-256 and return the lowercase hex digest.
Result<std::string> Sha256File(const std::string& path);

/// @brief SHA-256 of an in-memory buffer, lowercase hex.
std::string Sha256Hex(const std::string& data);

/// @brief True for a non-empty string of hex digits no longer than 128 characters.
bool IsHexDigest(const std::string& value);

/// @brief Canonical (lowercase) spelling of a hex digest; archive names use it.
std::string NormalizeDigest(const std::string& value);

/// @brief Case-insensitive comparison of two hex digests.
bool DigestEquals(const std::string& lhs, const std::string& rhs);

}  // namespace chunkfs::core
