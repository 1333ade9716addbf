#include "chunkfs/client/chunk_scheduler.h"

#include <filesystem>
#include <fstream>
#include <utility>

#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>

#include "chunkfs/core/chunking.h"
#include "chunkfs/core/digest.h"
#include "chunkfs/core/logger.h"

namespace chunkfs::client {

namespace net = boost::asio;

namespace {

core::Result<std::string> ReadChunk(const std::string& path, std::uint64_t index,
                                    core::ChunkRange range) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return core::Error{core::ErrorCode::kIoError, "cannot open " + path};
    }
    std::string bytes(static_cast<std::size_t>(range.length), '\0');
    in.seekg(static_cast<std::streamoff>(range.offset));
    in.read(&bytes[0], static_cast<std::streamsize>(range.length));
    if (static_cast<std::uint64_t>(in.gcount()) != range.length) {
        return core::Error{core::ErrorCode::kIoError,
                           "short read of chunk " + std::to_string(index) + " from " + path};
    }
    return bytes;
}

}  // namespace

const char* SchedulerStateName(SchedulerState state) {
    switch (state) {
        case SchedulerState::kIdle:
            return "IDLE";
        case SchedulerState::kHashing:
            return "HASHING";
        case SchedulerState::kInit:
            return "INIT";
        case SchedulerState::kUploading:
            return "UPLOADING";
        case SchedulerState::kPaused:
            return "PAUSED";
        case SchedulerState::kMerging:
            return "MERGING";
        case SchedulerState::kDone:
            return "DONE";
        case SchedulerState::kError:
            return "ERROR";
    }
    return "UNKNOWN";
}

SchedulerOptions OptionsFromConfig(const core::ClientConfig& config) {
    SchedulerOptions options;
    options.chunk_size = config.chunk_size;
    options.concurrency = config.concurrency;
    return options;
}

std::shared_ptr<ChunkScheduler> ChunkScheduler::Create(net::io_context& ioc,
                                                       std::shared_ptr<UploadTransport> transport,
                                                       std::string file_path,
                                                       SchedulerOptions options,
                                                       SchedulerCallbacks callbacks) {
    return std::shared_ptr<ChunkScheduler>(new ChunkScheduler(
        ioc, std::move(transport), std::move(file_path), options, std::move(callbacks)));
}

ChunkScheduler::ChunkScheduler(net::io_context& ioc, std::shared_ptr<UploadTransport> transport,
                               std::string file_path, SchedulerOptions options,
                               SchedulerCallbacks callbacks)
    : ioc_(ioc),
      transport_(std::move(transport)),
      file_path_(std::move(file_path)),
      file_name_(std::filesystem::path(file_path_).filename().string()),
      options_(options),
      callbacks_(std::move(callbacks)) {
    if (options_.concurrency < 1) {
        options_.concurrency = 1;
    }
}

ChunkScheduler::~ChunkScheduler() { file_pool_.join(); }

void ChunkScheduler::Start() {
    net::dispatch(ioc_, [self = shared_from_this()]() { self->DoStart(); });
}

void ChunkScheduler::Pause() {
    net::dispatch(ioc_, [self = shared_from_this()]() { self->DoPause(); });
}

void ChunkScheduler::Resume() {
    net::dispatch(ioc_, [self = shared_from_this()]() { self->DoResume(); });
}

void ChunkScheduler::DoStart() {
    switch (state_.load()) {
        case SchedulerState::kIdle:
            return BeginHashing();
        case SchedulerState::kPaused:
            return DoResume();
        case SchedulerState::kError:
            // Retry path: keep the session when there is one, otherwise start over.
            if (!session_id_.empty()) {
                return RecoverProgress();
            }
            return BeginHashing();
        default:
            core::LogDebug(std::string("start ignored in state ") +
                           SchedulerStateName(state_.load()));
            return;
    }
}

void ChunkScheduler::DoPause() {
    if (state_.load() != SchedulerState::kUploading) {
        return;
    }
    state_ = SchedulerState::kPaused;
    // Cancel a snapshot: a handler may erase from in_flight_ while we iterate.
    auto in_flight = in_flight_;
    for (auto& entry : in_flight) {
        entry.second.Cancel();
    }
    core::LogInfo("upload " + session_id_ + " paused with " + std::to_string(uploaded_.size()) +
                  "/" + std::to_string(total_chunks_) + " chunks confirmed");
}

void ChunkScheduler::DoResume() {
    if (state_.load() != SchedulerState::kPaused || session_id_.empty()) {
        return;
    }
    RecoverProgress();
}

void ChunkScheduler::BeginHashing() {
    if (options_.chunk_size == 0) {
        return Fail(core::Error{core::ErrorCode::kInvalidArgument, "chunk size must be positive"});
    }
    state_ = SchedulerState::kHashing;
    session_id_.clear();
    uploaded_.clear();

    std::weak_ptr<ChunkScheduler> weak = shared_from_this();
    auto* ioc = &ioc_;
    const auto path = file_path_;
    net::post(file_pool_, [weak, ioc, path]() {
        core::Result<HashOutcome> outcome = core::Error{core::ErrorCode::kInternal, ""};
        std::error_code ec;
        const auto size = std::filesystem::file_size(path, ec);
        if (ec) {
            outcome = core::Error{core::ErrorCode::kIoError,
                                  "cannot stat " + path + ": " + ec.message()};
        } else {
            auto digest = core::Sha256File(path);
            if (digest.ok()) {
                outcome = HashOutcome{digest.value(), static_cast<std::uint64_t>(size)};
            } else {
                outcome = digest.error();
            }
        }
        net::post(*ioc, [weak, outcome]() {
            if (auto self = weak.lock()) {
                self->OnHashed(outcome);
            }
        });
    });
}

void ChunkScheduler::OnHashed(core::Result<HashOutcome> outcome) {
    if (state_.load() != SchedulerState::kHashing) {
        return;
    }
    if (!outcome.ok()) {
        return Fail(outcome.error());
    }
    content_hash_ = outcome.value().digest;
    file_size_ = outcome.value().size_bytes;
    total_chunks_ = core::TotalChunks(file_size_, options_.chunk_size);
    state_ = SchedulerState::kInit;

    upload::InitRequest request;
    request.file_name = file_name_;
    request.declared_size = static_cast<std::int64_t>(file_size_);
    request.chunk_size = static_cast<std::int64_t>(options_.chunk_size);
    request.content_hash = content_hash_;
    transport_->InitUpload(request, [self = shared_from_this()](
                                        core::Result<upload::InitOutcome> result) {
        self->OnInit(std::move(result));
    });
}

void ChunkScheduler::OnInit(core::Result<upload::InitOutcome> outcome) {
    if (state_.load() != SchedulerState::kInit) {
        return;
    }
    if (!outcome.ok()) {
        return Fail(outcome.error());
    }
    if (outcome.value().deduplicated()) {
        core::LogInfo(file_name_ + " already stored as " + *outcome.value().existing_file);
        return Finish(*outcome.value().existing_file);
    }
    session_id_ = *outcome.value().session_id;
    RecoverProgress();
}

void ChunkScheduler::RecoverProgress() {
    state_ = SchedulerState::kInit;
    transport_->GetProgress(session_id_, [self = shared_from_this()](
                                             core::Result<upload::ProgressReport> report) {
        self->OnProgressRecovered(std::move(report));
    });
}

void ChunkScheduler::OnProgressRecovered(core::Result<upload::ProgressReport> report) {
    if (state_.load() != SchedulerState::kInit) {
        return;
    }
    if (!report.ok()) {
        if (report.error().code == core::ErrorCode::kNotFound) {
            // The server forgot the session; the next Start re-initialises.
            session_id_.clear();
            uploaded_.clear();
        }
        return Fail(report.error());
    }
    // The server's list replaces ours: it may have dropped chunks that failed a merge.
    uploaded_.clear();
    for (auto index : report.value().uploaded) {
        if (index < total_chunks_) {
            uploaded_.insert(index);
        }
    }
    state_ = SchedulerState::kUploading;
    if (!uploaded_.empty() && callbacks_.on_progress) {
        callbacks_.on_progress(core::PercentComplete(uploaded_.size(), total_chunks_));
    }
    Pump();
}

void ChunkScheduler::Pump() {
    if (state_.load() != SchedulerState::kUploading) {
        return;
    }
    if (uploaded_.size() >= total_chunks_) {
        if (in_flight_.empty()) {
            BeginMerge();
        }
        return;
    }
    const auto limit = static_cast<std::size_t>(options_.concurrency);
    for (std::uint64_t index = 0; index < total_chunks_ && in_flight_.size() < limit; ++index) {
        if (uploaded_.count(index) != 0 || in_flight_.count(index) != 0) {
            continue;
        }
        Launch(index);
        if (state_.load() != SchedulerState::kUploading) {
            return;
        }
    }
}

void ChunkScheduler::Launch(std::uint64_t index) {
    // The slot is taken before the read so Pump and Pause see the chunk as in flight.
    CancellationToken token;
    in_flight_.emplace(index, token);

    std::weak_ptr<ChunkScheduler> weak = shared_from_this();
    auto* ioc = &ioc_;
    const auto path = file_path_;
    const auto range = core::RangeOf(index, file_size_, options_.chunk_size);
    net::post(file_pool_, [weak, ioc, path, index, range, token]() {
        auto bytes = ReadChunk(path, index, range);
        net::post(*ioc, [weak, index, token, bytes = std::move(bytes)]() mutable {
            if (auto self = weak.lock()) {
                self->OnChunkRead(index, token, std::move(bytes));
            }
        });
    });
}

void ChunkScheduler::OnChunkRead(std::uint64_t index, const CancellationToken& token,
                                 core::Result<std::string> bytes) {
    if (token.cancelled() || state_.load() != SchedulerState::kUploading) {
        return OnChunkDone(index, core::Error{core::ErrorCode::kCancelled,
                                              "chunk " + std::to_string(index) + " cancelled"});
    }
    if (!bytes.ok()) {
        return OnChunkDone(index, bytes.error());
    }

    ChunkPayload payload;
    payload.session_id = session_id_;
    payload.index = index;
    payload.content_hash = content_hash_;
    payload.bytes = std::move(bytes.value());
    transport_->SendChunk(std::move(payload), token,
                          [self = shared_from_this(), index](core::Result<void> result) {
                              self->OnChunkDone(index, std::move(result));
                          });
}

void ChunkScheduler::OnChunkDone(std::uint64_t index, core::Result<void> result) {
    in_flight_.erase(index);
    if (result.ok()) {
        // Recorded even when paused: the server holds the chunk either way.
        if (uploaded_.insert(index).second && callbacks_.on_progress) {
            callbacks_.on_progress(core::PercentComplete(uploaded_.size(), total_chunks_));
        }
        return Pump();
    }
    if (result.error().code == core::ErrorCode::kCancelled) {
        return Pump();
    }
    if (state_.load() == SchedulerState::kUploading) {
        Fail(result.error());
    }
}

void ChunkScheduler::BeginMerge() {
    state_ = SchedulerState::kMerging;
    transport_->MergeUpload(session_id_, file_name_, content_hash_,
                            [self = shared_from_this()](core::Result<upload::MergeOutcome> merged) {
                                self->OnMerged(std::move(merged));
                            });
}

void ChunkScheduler::OnMerged(core::Result<upload::MergeOutcome> outcome) {
    if (state_.load() != SchedulerState::kMerging) {
        return;
    }
    if (!outcome.ok()) {
        const auto& error = outcome.error();
        if (error.code == core::ErrorCode::kHashMismatch) {
            uploaded_.clear();
        }
        for (auto index : error.chunks) {
            uploaded_.erase(index);
        }
        return Fail(error);
    }
    session_id_.clear();
    Finish(outcome.value().file_path);
}

void ChunkScheduler::Finish(const std::string& file_path) {
    state_ = SchedulerState::kDone;
    if (callbacks_.on_success) {
        callbacks_.on_success(file_path);
    }
}

void ChunkScheduler::Fail(const core::Error& error) {
    state_ = SchedulerState::kError;
    core::LogError("upload of " + file_name_ + " failed: " + error.message);
    if (callbacks_.on_error) {
        callbacks_.on_error(error);
    }
}

}  // namespace chunkfs::client
