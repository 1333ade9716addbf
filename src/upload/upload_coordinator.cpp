#include "chunkfs/upload/upload_coordinator.h"

#include <filesystem>
#include <sstream>
#include <system_error>

#include <Poco/Timespan.h>
#include <Poco/Timestamp.h>

#include "chunkfs/core/chunking.h"
#include "chunkfs/core/digest.h"
#include "chunkfs/core/ids.h"
#include "chunkfs/core/logger.h"
#include "chunkfs/observability/metrics.h"

namespace chunkfs::upload {

namespace {

core::Error InvalidRequest(const std::string& message) {
    return core::Error{core::ErrorCode::kInvalidArgument, message};
}

core::Result<void> ValidateInit(const InitRequest& request, const core::UploadConfig& config) {
    if (request.file_name.empty()) {
        return InvalidRequest("fileName is required");
    }
    if (!core::IsHexDigest(request.content_hash)) {
        return InvalidRequest("fileHash must be a hex digest");
    }
    if (request.chunk_size <= 0) {
        return InvalidRequest("chunkSize must be positive");
    }
    if (request.declared_size < 0) {
        return InvalidRequest("fileSize must not be negative");
    }
    const auto total = core::TotalChunks(static_cast<std::uint64_t>(request.declared_size),
                                         static_cast<std::uint64_t>(request.chunk_size));
    if (total > config.max_chunks_per_session) {
        return InvalidRequest("upload would need " + std::to_string(total) +
                              " chunks; the limit is " +
                              std::to_string(config.max_chunks_per_session));
    }
    return core::Ok();
}

std::string JoinIndices(const std::vector<std::uint64_t>& indices) {
    std::ostringstream out;
    for (std::size_t i = 0; i < indices.size(); ++i) {
        if (i != 0) {
            out << ',';
        }
        out << indices[i];
    }
    return out.str();
}

}  // namespace

ChunkUpload::ChunkUpload(std::string session_id, std::uint64_t index,
                         std::unique_ptr<storage::AtomicFileWriter> writer)
    : session_id_(std::move(session_id)), index_(index), writer_(std::move(writer)) {}

core::Result<void> ChunkUpload::Write(const char* data, std::size_t size) {
    return writer_->Write(data, size);
}

void ChunkUpload::Abort() { writer_->Abort(); }

UploadCoordinator::UploadCoordinator(std::shared_ptr<SessionRegistry> registry,
                                     std::shared_ptr<storage::ChunkStore> chunks,
                                     std::shared_ptr<storage::ContentArchive> archive,
                                     core::UploadConfig config)
    : registry_(std::move(registry)),
      chunks_(std::move(chunks)),
      archive_(std::move(archive)),
      merge_engine_(chunks_, archive_),
      config_(config) {}

core::Result<InitOutcome> UploadCoordinator::InitUpload(const InitRequest& request) {
    auto valid = ValidateInit(request, config_);
    if (!valid.ok()) {
        return valid.error();
    }
    const auto content_hash = core::NormalizeDigest(request.content_hash);

    const auto extension = storage::ContentArchive::ExtensionOf(request.file_name);
    if (auto existing = archive_->Find(content_hash, extension)) {
        observability::RecordDedupHit();
        core::LogSessionEvent("dedup_hit", "", *existing);
        InitOutcome outcome;
        outcome.existing_file = *existing;
        return outcome;
    }

    UploadSession session;
    session.session_id = core::GenerateSessionId();
    session.file_name = request.file_name;
    session.declared_size = static_cast<std::uint64_t>(request.declared_size);
    session.chunk_size = static_cast<std::uint64_t>(request.chunk_size);
    session.content_hash = content_hash;
    session.total_chunks = core::TotalChunks(session.declared_size, session.chunk_size);
    const auto session_id = session.session_id;
    const auto total_chunks = session.total_chunks;

    // Register before provisioning so the orphan sweep never sees an unowned staging area.
    auto inserted = registry_->Insert(std::move(session));
    if (!inserted.ok()) {
        return inserted.error();
    }
    auto area = chunks_->CreateArea(session_id);
    if (!area.ok()) {
        (void)registry_->Remove(session_id);
        core::LogError("failed to provision staging area for " + session_id + ": " +
                       area.error().message);
        return area.error();
    }

    observability::RecordSessionCreated();
    core::LogSessionEvent("created", session_id,
                          request.file_name + " chunks=" + std::to_string(total_chunks));
    InitOutcome outcome;
    outcome.session_id = session_id;
    return outcome;
}

core::Result<UploadSession> UploadCoordinator::WritableSession(const std::string& session_id,
                                                               std::uint64_t index) const {
    auto session = registry_->Get(session_id);
    if (!session.ok()) {
        return session.error();
    }
    if (index >= session.value().total_chunks) {
        return InvalidRequest("chunkIndex " + std::to_string(index) + " out of range");
    }
    if (session.value().merging) {
        return core::Error{core::ErrorCode::kConflict, "session is being merged"};
    }
    return session;
}

core::Result<ChunkAck> UploadCoordinator::ReceiveChunk(const std::string& session_id,
                                                       std::uint64_t index,
                                                       std::istream& data) {
    auto session = WritableSession(session_id, index);
    if (!session.ok()) {
        return session.error();
    }
    auto stored = chunks_->WriteChunk(session_id, index, data);
    if (!stored.ok()) {
        core::LogError("failed to stage chunk " + std::to_string(index) + " of " + session_id +
                       ": " + stored.error().message);
        return stored.error();
    }
    return RecordChunk(session_id, index, stored.value().size_bytes);
}

core::Result<ChunkAck> UploadCoordinator::ReceiveChunk(const std::string& session_id,
                                                       std::uint64_t index,
                                                       const std::string& bytes) {
    std::istringstream data(bytes);
    return ReceiveChunk(session_id, index, data);
}

core::Result<std::unique_ptr<ChunkUpload>> UploadCoordinator::BeginChunk(
    const std::string& session_id, std::uint64_t index) {
    auto session = WritableSession(session_id, index);
    if (!session.ok()) {
        return session.error();
    }
    auto writer = chunks_->OpenChunk(session_id, index);
    if (!writer.ok()) {
        return writer.error();
    }
    return std::make_unique<ChunkUpload>(session_id, index, std::move(writer.value()));
}

core::Result<ChunkAck> UploadCoordinator::CompleteChunk(ChunkUpload& upload) {
    auto stored = upload.writer_->Commit();
    if (!stored.ok()) {
        core::LogError("failed to commit chunk " + std::to_string(upload.index()) + " of " +
                       upload.session_id() + ": " + stored.error().message);
        return stored.error();
    }
    return RecordChunk(upload.session_id(), upload.index(), stored.value().size_bytes);
}

core::Result<ChunkAck> UploadCoordinator::RecordChunk(const std::string& session_id,
                                                      std::uint64_t index,
                                                      std::uint64_t size_bytes) {
    auto marked = registry_->MarkChunk(session_id, index);
    if (!marked.ok()) {
        return marked.error();
    }
    observability::RecordChunkReceived(size_bytes);
    core::LogDebug("staged chunk " + std::to_string(index) + " of " + session_id + " (" +
                   std::to_string(size_bytes) + " bytes)");

    ChunkAck ack;
    ack.index = index;
    ack.size_bytes = size_bytes;
    ack.duplicate = !marked.value();
    return ack;
}

core::Result<ProgressReport> UploadCoordinator::GetProgress(const std::string& session_id) const {
    auto session = registry_->Get(session_id);
    if (!session.ok()) {
        return session.error();
    }
    const auto& snapshot = session.value();

    ProgressReport report;
    report.total_chunks = snapshot.total_chunks;
    report.uploaded.assign(snapshot.uploaded_chunks.begin(), snapshot.uploaded_chunks.end());
    for (std::uint64_t i = 0; i < snapshot.total_chunks; ++i) {
        if (snapshot.uploaded_chunks.count(i) == 0) {
            report.missing.push_back(i);
        }
    }
    report.percent = core::PercentComplete(report.uploaded.size(), report.total_chunks);
    return report;
}

core::Result<MergeOutcome> UploadCoordinator::MergeUpload(const std::string& session_id,
                                                          const std::string& file_name,
                                                          const std::string& content_hash) {
    auto claimed = registry_->BeginMerge(session_id);
    if (!claimed.ok()) {
        return claimed.error();
    }
    const auto& session = claimed.value();
    const auto name = file_name.empty() ? session.file_name : file_name;
    const auto hash =
        core::NormalizeDigest(content_hash.empty() ? session.content_hash : content_hash);
    if (!core::IsHexDigest(hash)) {
        registry_->AbortMerge(session_id);
        return InvalidRequest("fileHash must be a hex digest");
    }

    // The staging area on disk is the authority here, not the in-memory index set.
    auto missing = chunks_->MissingChunks(session_id, session.total_chunks);
    if (!missing.empty()) {
        ForgetLostChunks(session_id, missing);
        registry_->AbortMerge(session_id);
        core::Error error{core::ErrorCode::kIncompleteUpload,
                          std::to_string(missing.size()) + " chunk(s) missing: " +
                              JoinIndices(missing)};
        error.chunks = std::move(missing);
        return error;
    }

    const auto archive_name = storage::ContentArchive::FinalName(hash, name);
    std::uint64_t size_bytes = 0;
    std::error_code ec;
    const auto existing_size = std::filesystem::file_size(archive_->PathFor(archive_name), ec);
    if (!ec) {
        // Another session with the same content converged first.
        size_bytes = static_cast<std::uint64_t>(existing_size);
        core::LogInfo("archive already holds " + archive_name + ", skipping merge of " +
                      session_id);
    } else {
        auto merged = merge_engine_.Merge(session_id, session.total_chunks, archive_name,
                                          config_.verify_content_hash ? hash : std::string());
        if (!merged.ok()) {
            if (merged.error().code == core::ErrorCode::kHashMismatch) {
                // No way to tell which chunk is bad, so every one has to be sent again.
                ForgetLostChunks(session_id, std::vector<std::uint64_t>(
                                                 session.uploaded_chunks.begin(),
                                                 session.uploaded_chunks.end()));
            } else if (merged.error().code == core::ErrorCode::kChunkMissing) {
                ForgetLostChunks(session_id, merged.error().chunks);
            }
            registry_->AbortMerge(session_id);
            observability::RecordMerge(false);
            core::LogError("merge of " + session_id + " failed: " + merged.error().message);
            return merged.error();
        }
        size_bytes = merged.value().size_bytes;
    }

    registry_->CompleteMerge(session_id);
    auto removed = chunks_->RemoveArea(session_id);
    if (!removed.ok()) {
        // The session is gone from the registry, so the next sweep reclaims the directory.
        core::LogError("failed to remove staging area of " + session_id + ": " +
                       removed.error().message);
    }

    observability::RecordMerge(true);
    core::LogSessionEvent("merged", session_id,
                          archive_name + " size=" + std::to_string(size_bytes));
    MergeOutcome outcome;
    outcome.file_path = archive_name;
    outcome.size_bytes = size_bytes;
    return outcome;
}

void UploadCoordinator::ForgetLostChunks(const std::string& session_id,
                                         const std::vector<std::uint64_t>& indices) {
    auto forgotten = registry_->ForgetChunks(session_id, indices);
    if (!forgotten.ok()) {
        core::LogError("failed to reset chunk state of " + session_id + ": " +
                       forgotten.error().message);
        return;
    }
    if (forgotten.value() > 0) {
        core::LogWarning("session " + session_id + " must resend " +
                      std::to_string(forgotten.value()) + " chunk(s)");
    }
}

core::Result<void> UploadCoordinator::CancelUpload(const std::string& session_id) {
    auto removed = registry_->Remove(session_id);
    if (!removed.ok()) {
        return removed.error();
    }
    auto area = chunks_->RemoveArea(session_id);
    if (!area.ok()) {
        return area.error();
    }
    if (removed.value()) {
        observability::RecordSessionCancelled();
        core::LogSessionEvent("cancelled", session_id, "");
    }
    return core::Ok();
}

core::Result<std::size_t> UploadCoordinator::SweepOrphans() {
    auto areas = chunks_->ListAreas();
    if (!areas.ok()) {
        return areas.error();
    }
    std::size_t swept = 0;
    for (const auto& area : areas.value()) {
        if (registry_->Contains(area)) {
            continue;
        }
        auto removed = chunks_->RemoveArea(area);
        if (!removed.ok()) {
            core::LogError("failed to sweep staging area " + area + ": " +
                           removed.error().message);
            continue;
        }
        ++swept;
        core::LogSessionEvent("orphan_swept", area, "");
    }
    observability::RecordOrphansSwept(swept);
    return swept;
}

std::size_t UploadCoordinator::ExpireIdleSessions(std::chrono::seconds max_idle) {
    Poco::Timestamp cutoff;
    cutoff += Poco::Timespan(-static_cast<long>(max_idle.count()), 0);

    std::size_t expired = 0;
    for (const auto& session_id : registry_->ListIdleSince(cutoff)) {
        if (!registry_->RemoveIfIdle(session_id, cutoff)) {
            continue;
        }
        auto removed = chunks_->RemoveArea(session_id);
        if (!removed.ok()) {
            core::LogError("failed to remove staging area of expired session " + session_id +
                           ": " + removed.error().message);
        }
        ++expired;
        core::LogSessionEvent("expired", session_id, "");
    }
    observability::RecordSessionsExpired(expired);
    return expired;
}

}  // namespace chunkfs::upload
