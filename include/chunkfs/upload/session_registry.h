#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <Poco/Timestamp.h>

#include "chunkfs/core/result.h"
#include "chunkfs/upload/upload_session.h"

namespace chunkfs::upload {

/// @brief Store of live upload sessions keyed by session id.
///
/// Every operation is atomic with respect to every other, so one session can receive
/// many chunk updates in parallel. Lookups of unknown ids fail with kNotFound.
class SessionRegistry {
public:
    virtual ~SessionRegistry() = default;

    /// @brief Add a new session; kConflict if the id is already registered.
    virtual core::Result<void> Insert(UploadSession session) = 0;
    /// @brief Consistent copy of a session.
    virtual core::Result<UploadSession> Get(const std::string& session_id) const = 0;
    virtual bool Contains(const std::string& session_id) const = 0;
    virtual std::size_t Size() const = 0;

    /// @brief Record chunk `index` as uploaded and refresh the activity time.
    /// Returns true if the index was new. kInvalidArgument when out of range, kConflict
    /// while the session is being merged.
    virtual core::Result<bool> MarkChunk(const std::string& session_id, std::uint64_t index) = 0;
    /// @brief Drop `indices` from the uploaded set so progress reports them as missing again.
    /// Returns how many were recorded. Allowed while merging.
    virtual core::Result<std::size_t> ForgetChunks(const std::string& session_id,
                                                   const std::vector<std::uint64_t>& indices) = 0;

    /// @brief Claim the session for its one-shot merge; kConflict if already claimed.
    virtual core::Result<UploadSession> BeginMerge(const std::string& session_id) = 0;
    /// @brief Release a merge claim after a failed attempt so the merge can be retried.
    virtual void AbortMerge(const std::string& session_id) = 0;
    /// @brief Drop a session whose merge succeeded.
    virtual void CompleteMerge(const std::string& session_id) = 0;

    /// @brief Drop a session. Returns false if it was not registered; kConflict while merging.
    virtual core::Result<bool> Remove(const std::string& session_id) = 0;
    /// @brief Drop a session if it has been idle since before `cutoff` and is not merging.
    virtual bool RemoveIfIdle(const std::string& session_id, const Poco::Timestamp& cutoff) = 0;
    /// @brief Ids of sessions idle since before `cutoff`, excluding those being merged.
    virtual std::vector<std::string> ListIdleSince(const Poco::Timestamp& cutoff) const = 0;
};

/// @brief Process-local, mutex-guarded SessionRegistry. Contents do not survive restarts.
class InMemorySessionRegistry : public SessionRegistry {
public:
    core::Result<void> Insert(UploadSession session) override;
    core::Result<UploadSession> Get(const std::string& session_id) const override;
    bool Contains(const std::string& session_id) const override;
    std::size_t Size() const override;

    core::Result<bool> MarkChunk(const std::string& session_id, std::uint64_t index) override;
    core::Result<std::size_t> ForgetChunks(const std::string& session_id,
                                           const std::vector<std::uint64_t>& indices) override;

    core::Result<UploadSession> BeginMerge(const std::string& session_id) override;
    void AbortMerge(const std::string& session_id) override;
    void CompleteMerge(const std::string& session_id) override;

    core::Result<bool> Remove(const std::string& session_id) override;
    bool RemoveIfIdle(const std::string& session_id, const Poco::Timestamp& cutoff) override;
    std::vector<std::string> ListIdleSince(const Poco::Timestamp& cutoff) const override;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, UploadSession> sessions_;
};

}  // namespace chunkfs::upload
