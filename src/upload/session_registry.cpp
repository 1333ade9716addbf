#include "chunkfs/upload/session_registry.h"

namespace chunkfs::upload {

namespace {
core::Error NotFound(const std::string& session_id) {
    return core::Error{core::ErrorCode::kNotFound, "upload session not found: " + session_id};
}
}  // namespace

core::Result<void> InMemorySessionRegistry::Insert(UploadSession session) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sessions_.count(session.session_id) != 0) {
        return core::Error{core::ErrorCode::kConflict, "session id already registered"};
    }
    session.last_activity.update();
    auto id = session.session_id;
    sessions_.emplace(std::move(id), std::move(session));
    return core::Ok();
}

core::Result<UploadSession> InMemorySessionRegistry::Get(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return NotFound(session_id);
    }
    return it->second;
}

bool InMemorySessionRegistry::Contains(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.count(session_id) != 0;
}

std::size_t InMemorySessionRegistry::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

core::Result<bool> InMemorySessionRegistry::MarkChunk(const std::string& session_id,
                                                      std::uint64_t index) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return NotFound(session_id);
    }
    auto& session = it->second;
    if (index >= session.total_chunks) {
        return core::Error{core::ErrorCode::kInvalidArgument, "chunk index out of range"};
    }
    if (session.merging) {
        return core::Error{core::ErrorCode::kConflict, "session is being merged"};
    }
    session.last_activity.update();
    return session.uploaded_chunks.insert(index).second;
}

core::Result<std::size_t> InMemorySessionRegistry::ForgetChunks(
    const std::string& session_id, const std::vector<std::uint64_t>& indices) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return NotFound(session_id);
    }
    std::size_t forgotten = 0;
    for (const auto index : indices) {
        forgotten += it->second.uploaded_chunks.erase(index);
    }
    return forgotten;
}

core::Result<UploadSession> InMemorySessionRegistry::BeginMerge(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return NotFound(session_id);
    }
    if (it->second.merging) {
        return core::Error{core::ErrorCode::kConflict, "merge already in progress"};
    }
    it->second.merging = true;
    it->second.last_activity.update();
    return it->second;
}

void InMemorySessionRegistry::AbortMerge(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it != sessions_.end()) {
        it->second.merging = false;
        it->second.last_activity.update();
    }
}

void InMemorySessionRegistry::CompleteMerge(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_.erase(session_id);
}

core::Result<bool> InMemorySessionRegistry::Remove(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return false;
    }
    if (it->second.merging) {
        return core::Error{core::ErrorCode::kConflict, "session is being merged"};
    }
    sessions_.erase(it);
    return true;
}

bool InMemorySessionRegistry::RemoveIfIdle(const std::string& session_id,
                                           const Poco::Timestamp& cutoff) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end() || it->second.merging || !(it->second.last_activity < cutoff)) {
        return false;
    }
    sessions_.erase(it);
    return true;
}

std::vector<std::string> InMemorySessionRegistry::ListIdleSince(
    const Poco::Timestamp& cutoff) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    for (const auto& entry : sessions_) {
        if (!entry.second.merging && entry.second.last_activity < cutoff) {
            ids.push_back(entry.first);
        }
    }
    return ids;
}

}  // namespace chunkfs::upload
