#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "chunkfs/core/result.h"
#include "chunkfs/storage/atomic_file.h"
#include "chunkfs/storage/chunk_store.h"
#include "chunkfs/storage/content_archive.h"

namespace chunkfs::storage {

/// @brief Result of a successful merge: the archived name plus what was written.
struct MergedFile {
    std::string name;
    std::string path;
    std::string sha256;
    std::uint64_t size_bytes{0};
};

/// @brief Streams staged chunks 0..N-1, strictly in order, into one archived file.
///
/// Memory use is one copy buffer regardless of file size. The output only appears under
/// its archive name after every chunk has been drained into it and it has been synced;
/// on any failure the partial output is removed and the staged chunks are left alone.
class MergeEngine {
public:
    MergeEngine(std::shared_ptr<ChunkStore> chunks, std::shared_ptr<ContentArchive> archive);

    /// @brief Merge `total_chunks` chunks of `session_id` into `archive_name`.
    ///
    /// Fails with kChunkMissing(index) if a chunk file is absent at read time, kIoError on
    /// read/write failures, and kHashMismatch when `expected_sha256` is non-empty and does
    /// not match the merged bytes.
    core::Result<MergedFile> Merge(const std::string& session_id, std::uint64_t total_chunks,
                                   const std::string& archive_name,
                                   const std::string& expected_sha256) const;

private:
    core::Result<void> DrainChunk(const std::string& session_id, std::uint64_t index,
                                  AtomicFileWriter& out) const;

    std::shared_ptr<ChunkStore> chunks_;
    std::shared_ptr<ContentArchive> archive_;
};

}  // namespace chunkfs::storage
