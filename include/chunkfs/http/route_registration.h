#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "chunkfs/http/router.h"

namespace chunkfs::upload {
class UploadCoordinator;
}

namespace chunkfs::http {

/// Registers health, metrics and the upload protocol routes into the provided router.
void RegisterDefaultRoutes(Router& router,
                           std::shared_ptr<upload::UploadCoordinator> coordinator);

/// @brief Parse a decimal chunk index; rejects signs, blanks and trailing garbage.
std::optional<std::uint64_t> ParseChunkIndex(const std::string& value);

}  // namespace chunkfs::http
