#pragma once

#include <cstdint>
#include <istream>
#include <memory>
#include <string>
#include <vector>

#include "chunkfs/core/result.h"
#include "chunkfs/storage/atomic_file.h"

namespace chunkfs::storage {

/// @brief Staging area for chunk blobs: one directory per session, one `<index>.part` file
/// per chunk.
///
/// Writes go through AtomicFileWriter, so concurrent writes to distinct indices never
/// conflict and a repeated write to the same index replaces the previous copy whole.
class ChunkStore {
public:
    explicit ChunkStore(std::string root);

    core::Result<void> CreateArea(const std::string& session_id);
    bool HasArea(const std::string& session_id) const;
    /// @brief Remove a staging area and everything in it. Absent areas are not an error.
    core::Result<void> RemoveArea(const std::string& session_id);
    /// @brief Names of every directory under the staging root.
    core::Result<std::vector<std::string>> ListAreas() const;

    /// @brief Start streaming chunk `index`; nothing is visible until the writer commits.
    core::Result<std::unique_ptr<AtomicFileWriter>> OpenChunk(const std::string& session_id,
                                                              std::uint64_t index);
    core::Result<StoredFile> WriteChunk(const std::string& session_id, std::uint64_t index,
                                        std::istream& data);

    bool HasChunk(const std::string& session_id, std::uint64_t index) const;
    /// @brief Indices in [0, total_chunks) with no committed chunk file, ascending.
    std::vector<std::uint64_t> MissingChunks(const std::string& session_id,
                                             std::uint64_t total_chunks) const;

    std::string AreaPath(const std::string& session_id) const;
    std::string ChunkPath(const std::string& session_id, std::uint64_t index) const;
    const std::string& root() const { return root_; }

    static bool IsSafeName(const std::string& name);
    static std::string ChunkFileName(std::uint64_t index);

private:
    std::string root_;
};

}  // namespace chunkfs::storage
