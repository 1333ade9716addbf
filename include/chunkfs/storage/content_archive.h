#pragma once

#include <optional>
#include <string>

#include "chunkfs/core/result.h"

namespace chunkfs::storage {

/// @brief Final-file storage keyed by content hash: one `<hash><ext>` file per unique content.
class ContentArchive {
public:
    explicit ContentArchive(std::string root);

    /// @brief Dedup lookup. Prefers the exact `<hash><ext>` name, then any archived file whose
    /// name is `<hash>` or `<hash>.<something>`. Returns the archived file name.
    std::optional<std::string> Find(const std::string& content_hash,
                                    const std::string& extension) const;

    /// @brief Absolute location of an archived file name.
    std::string PathFor(const std::string& archived_name) const;
    const std::string& root() const { return root_; }

    /// @brief Deterministic archive name: `content_hash + ExtensionOf(file_name)`.
    static std::string FinalName(const std::string& content_hash, const std::string& file_name);
    /// @brief Last extension of `file_name` including the dot, or empty when it has none or
    /// contains characters that are unsafe in a file name.
    static std::string ExtensionOf(const std::string& file_name);

private:
    std::string root_;
};

}  // namespace chunkfs::storage
