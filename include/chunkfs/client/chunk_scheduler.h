#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/thread_pool.hpp>

#include "chunkfs/client/cancellation.h"
#include "chunkfs/client/upload_transport.h"
#include "chunkfs/core/config.h"
#include "chunkfs/core/error.h"
#include "chunkfs/core/result.h"

namespace chunkfs::client {

enum class SchedulerState {
    kIdle,
    kHashing,
    kInit,
    kUploading,
    kPaused,
    kMerging,
    kDone,
    kError,
};

const char* SchedulerStateName(SchedulerState state);

struct SchedulerOptions {
    std::uint64_t chunk_size{5 * 1024 * 1024};
    int concurrency{3};
};

SchedulerOptions OptionsFromConfig(const core::ClientConfig& config);

/// @brief Observer hooks; all of them run on the scheduler's io_context.
struct SchedulerCallbacks {
    std::function<void(int percent)> on_progress;
    std::function<void(const std::string& file_path)> on_success;
    std::function<void(const core::Error& error)> on_error;
};

/// @brief Client-side driver of one file upload.
///
/// Lifecycle: IDLE -> HASHING -> INIT -> UPLOADING <-> PAUSED -> MERGING -> DONE, with
/// ERROR reachable from every non-terminal state. Start, Pause and Resume may be called
/// from any thread; they are dispatched onto the io_context, which is the only thread that
/// touches scheduling state. At most `concurrency` chunk transfers are in flight and a
/// chunk the server has confirmed is never sent again by this scheduler.
class ChunkScheduler : public std::enable_shared_from_this<ChunkScheduler> {
public:
    static std::shared_ptr<ChunkScheduler> Create(boost::asio::io_context& ioc,
                                                  std::shared_ptr<UploadTransport> transport,
                                                  std::string file_path,
                                                  SchedulerOptions options,
                                                  SchedulerCallbacks callbacks);
    ~ChunkScheduler();

    ChunkScheduler(const ChunkScheduler&) = delete;
    ChunkScheduler& operator=(const ChunkScheduler&) = delete;

    /// @brief Begin (or, from PAUSED or ERROR with a live session, continue) the upload.
    void Start();
    /// @brief Stop scheduling and cancel in-flight transfers. Only acts while UPLOADING.
    void Pause();
    /// @brief Re-sync with the server's progress and continue. Only acts while PAUSED.
    void Resume();

    SchedulerState state() const { return state_.load(); }

    // The accessors below are meant for the io_context thread, or for when it is idle.
    const std::string& session_id() const { return session_id_; }
    const std::string& content_hash() const { return content_hash_; }
    std::uint64_t total_chunks() const { return total_chunks_; }
    const std::set<std::uint64_t>& uploaded() const { return uploaded_; }

private:
    ChunkScheduler(boost::asio::io_context& ioc, std::shared_ptr<UploadTransport> transport,
                   std::string file_path, SchedulerOptions options,
                   SchedulerCallbacks callbacks);

    struct HashOutcome {
        std::string digest;
        std::uint64_t size_bytes{0};
    };

    void DoStart();
    void DoPause();
    void DoResume();

    void BeginHashing();
    void OnHashed(core::Result<HashOutcome> outcome);
    void OnInit(core::Result<upload::InitOutcome> outcome);
    void RecoverProgress();
    void OnProgressRecovered(core::Result<upload::ProgressReport> report);
    void Pump();
    void Launch(std::uint64_t index);
    void OnChunkRead(std::uint64_t index, const CancellationToken& token,
                     core::Result<std::string> bytes);
    void OnChunkDone(std::uint64_t index, core::Result<void> result);
    void BeginMerge();
    void OnMerged(core::Result<upload::MergeOutcome> outcome);

    void Finish(const std::string& file_path);
    void Fail(const core::Error& error);

    boost::asio::io_context& ioc_;
    std::shared_ptr<UploadTransport> transport_;
    std::string file_path_;
    std::string file_name_;
    SchedulerOptions options_;
    SchedulerCallbacks callbacks_;
    // Hashing and chunk reads; file I/O never runs on the io_context.
    boost::asio::thread_pool file_pool_{1};

    std::atomic<SchedulerState> state_{SchedulerState::kIdle};
    std::string content_hash_;
    std::uint64_t file_size_{0};
    std::uint64_t total_chunks_{0};
    std::string session_id_;
    std::set<std::uint64_t> uploaded_;
    std::map<std::uint64_t, CancellationToken> in_flight_;
};

}  // namespace chunkfs::client
