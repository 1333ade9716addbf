#pragma once

#include <chrono>
#include <cstdint>
#include <istream>
#include <memory>
#include <string>
#include <vector>

#include "chunkfs/core/config.h"
#include "chunkfs/core/result.h"
#include "chunkfs/storage/atomic_file.h"
#include "chunkfs/storage/chunk_store.h"
#include "chunkfs/storage/content_archive.h"
#include "chunkfs/storage/merge_engine.h"
#include "chunkfs/upload/session_registry.h"
#include "chunkfs/upload/upload_types.h"

namespace chunkfs::upload {

/// @brief A chunk being streamed into the staging area.
///
/// Bytes written here are invisible until UploadCoordinator::CompleteChunk. Dropping the
/// object without completing it (for example when the connection goes away mid-body)
/// discards only this chunk's partial data.
class ChunkUpload {
public:
    ChunkUpload(std::string session_id, std::uint64_t index,
                std::unique_ptr<storage::AtomicFileWriter> writer);

    core::Result<void> Write(const char* data, std::size_t size);
    void Abort();

    const std::string& session_id() const { return session_id_; }
    std::uint64_t index() const { return index_; }
    std::uint64_t bytes_written() const { return writer_->bytes_written(); }

private:
    friend class UploadCoordinator;

    std::string session_id_;
    std::uint64_t index_{0};
    std::unique_ptr<storage::AtomicFileWriter> writer_;
};

/// @brief Server half of the upload protocol: session lifecycle, chunk intake, progress,
/// merge, cancellation and staging-area reconciliation.
class UploadCoordinator {
public:
    UploadCoordinator(std::shared_ptr<SessionRegistry> registry,
                      std::shared_ptr<storage::ChunkStore> chunks,
                      std::shared_ptr<storage::ContentArchive> archive,
                      core::UploadConfig config);

    /// @brief Dedup lookup, then session + staging area creation.
    core::Result<InitOutcome> InitUpload(const InitRequest& request);

    /// @brief Stage chunk `index` from `data` and record it. Re-sending an index is a no-op
    /// for the session's progress and replaces the staged copy.
    core::Result<ChunkAck> ReceiveChunk(const std::string& session_id, std::uint64_t index,
                                        std::istream& data);
    core::Result<ChunkAck> ReceiveChunk(const std::string& session_id, std::uint64_t index,
                                        const std::string& bytes);

    /// @brief Streaming form of ReceiveChunk: validate, then hand back a writer.
    core::Result<std::unique_ptr<ChunkUpload>> BeginChunk(const std::string& session_id,
                                                          std::uint64_t index);
    /// @brief Commit a streamed chunk and record its index.
    core::Result<ChunkAck> CompleteChunk(ChunkUpload& upload);

    core::Result<ProgressReport> GetProgress(const std::string& session_id) const;

    /// @brief Verify every chunk is staged on disk, merge, archive as `<hash><ext>` and tear
    /// the session down. Empty `file_name`/`content_hash` fall back to the session's values.
    core::Result<MergeOutcome> MergeUpload(const std::string& session_id,
                                           const std::string& file_name,
                                           const std::string& content_hash);

    /// @brief Remove the session and its staging area. Unknown ids succeed.
    core::Result<void> CancelUpload(const std::string& session_id);

    /// @brief Remove staging areas that belong to no registered session. Returns how many.
    core::Result<std::size_t> SweepOrphans();

    /// @brief Cancel sessions with no activity for `max_idle`. Returns how many.
    std::size_t ExpireIdleSessions(std::chrono::seconds max_idle);

    const core::UploadConfig& config() const { return config_; }

private:
    core::Result<ChunkAck> RecordChunk(const std::string& session_id, std::uint64_t index,
                                       std::uint64_t size_bytes);
    core::Result<UploadSession> WritableSession(const std::string& session_id,
                                                std::uint64_t index) const;
    void ForgetLostChunks(const std::string& session_id,
                          const std::vector<std::uint64_t>& indices);

    std::shared_ptr<SessionRegistry> registry_;
    std::shared_ptr<storage::ChunkStore> chunks_;
    std::shared_ptr<storage::ContentArchive> archive_;
    storage::MergeEngine merge_engine_;
    core::UploadConfig config_;
};

}  // namespace chunkfs::upload
