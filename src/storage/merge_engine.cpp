#include "chunkfs/storage/merge_engine.h"

#include <array>
#include <fstream>

#include "chunkfs/core/logger.h"

namespace chunkfs::storage {

namespace {
constexpr std::size_t kCopyBufferSize = 65536;
}  // namespace

MergeEngine::MergeEngine(std::shared_ptr<ChunkStore> chunks,
                         std::shared_ptr<ContentArchive> archive)
    : chunks_(std::move(chunks)), archive_(std::move(archive)) {}

core::Result<MergedFile> MergeEngine::Merge(const std::string& session_id,
                                            std::uint64_t total_chunks,
                                            const std::string& archive_name,
                                            const std::string& expected_sha256) const {
    auto opened = AtomicFileWriter::Open(archive_->PathFor(archive_name));
    if (!opened.ok()) {
        return opened.error();
    }
    auto& out = *opened.value();

    for (std::uint64_t index = 0; index < total_chunks; ++index) {
        auto drained = DrainChunk(session_id, index, out);
        if (!drained.ok()) {
            out.Abort();
            return drained.error();
        }
    }

    auto stored = out.Commit(expected_sha256);
    if (!stored.ok()) {
        return stored.error();
    }

    core::LogDebug("merged " + std::to_string(total_chunks) + " chunks of " + session_id +
                   " into " + archive_name);
    MergedFile merged;
    merged.name = archive_name;
    merged.path = stored.value().path;
    merged.sha256 = stored.value().sha256;
    merged.size_bytes = stored.value().size_bytes;
    return merged;
}

core::Result<void> MergeEngine::DrainChunk(const std::string& session_id, std::uint64_t index,
                                           AtomicFileWriter& out) const {
    if (!chunks_->HasChunk(session_id, index)) {
        core::Error error{core::ErrorCode::kChunkMissing,
                          "chunk " + std::to_string(index) + " disappeared before merge"};
        error.chunks.push_back(index);
        return error;
    }
    std::ifstream in(chunks_->ChunkPath(session_id, index), std::ios::binary);
    if (!in.is_open()) {
        core::Error error{core::ErrorCode::kChunkMissing,
                          "chunk " + std::to_string(index) + " could not be opened"};
        error.chunks.push_back(index);
        return error;
    }

    std::array<char, kCopyBufferSize> buffer{};
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const auto bytes = in.gcount();
        if (bytes <= 0) {
            break;
        }
        auto written = out.Write(buffer.data(), static_cast<std::size_t>(bytes));
        if (!written.ok()) {
            return written;
        }
    }
    if (in.bad()) {
        return core::Error{core::ErrorCode::kIoError,
                           "failed to read chunk " + std::to_string(index)};
    }
    return core::Ok();
}

}  // namespace chunkfs::storage
