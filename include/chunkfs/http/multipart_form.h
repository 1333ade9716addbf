#pragma once

#include <optional>
#include <string>
#include <unordered_map>

#include "chunkfs/core/result.h"

namespace chunkfs::http {

/// @brief Decoded multipart/form-data body: plain fields plus the uploaded file part.
struct MultipartForm {
    std::unordered_map<std::string, std::string> fields;
    std::optional<std::string> file;
    std::string file_name;

    std::string Field(const std::string& name) const;
};

/// @brief Decode a multipart/form-data body. The file is the part named `file_field`, or
/// failing that the first part that declares a filename.
core::Result<MultipartForm> ParseMultipartForm(const std::string& content_type,
                                               const std::string& body,
                                               const std::string& file_field = "file");

}  // namespace chunkfs::http
