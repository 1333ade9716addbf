#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <Poco/UUIDGenerator.h>

#include "chunkfs/client/chunk_scheduler.h"
#include "chunkfs/client/loopback_transport.h"
#include "chunkfs/core/digest.h"
#include "chunkfs/storage/chunk_store.h"
#include "chunkfs/storage/content_archive.h"
#include "chunkfs/upload/session_registry.h"
#include "chunkfs/upload/upload_coordinator.h"

namespace {

using chunkfs::client::ChunkScheduler;
using chunkfs::client::LoopbackTransport;
using chunkfs::client::SchedulerState;
using chunkfs::core::ErrorCode;

constexpr std::uint64_t kMiB = 1024 * 1024;

using WorkGuard = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;

class ChunkSchedulerTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               ("chunkfs_sched_" + Poco::UUIDGenerator().createOne().toString());
        std::filesystem::create_directories(dir_ / "local");
        registry_ = std::make_shared<chunkfs::upload::InMemorySessionRegistry>();
        archive_ = std::make_shared<chunkfs::storage::ContentArchive>((dir_ / "archive").string());
        coordinator_ = std::make_shared<chunkfs::upload::UploadCoordinator>(
            registry_,
            std::make_shared<chunkfs::storage::ChunkStore>((dir_ / "staging").string()),
            archive_, chunkfs::core::UploadConfig{});
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::string WriteLocalFile(const std::string& name, std::uint64_t size) {
        const auto path = (dir_ / "local" / name).string();
        std::string content(static_cast<std::size_t>(size), '\0');
        for (std::uint64_t i = 0; i < size; ++i) {
            content[static_cast<std::size_t>(i)] = static_cast<char>((i * 31 + i / 4096) & 0xff);
        }
        std::ofstream out(path, std::ios::binary);
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        content_hash_ = chunkfs::core::Sha256Hex(content);
        return path;
    }

    std::shared_ptr<LoopbackTransport> Transport(std::chrono::milliseconds delay) {
        return std::make_shared<LoopbackTransport>(ioc_, coordinator_, delay);
    }

    // Callbacks that record the outcome and release the io_context once a terminal state
    // is reported.
    chunkfs::client::SchedulerCallbacks Recording() {
        chunkfs::client::SchedulerCallbacks callbacks;
        callbacks.on_progress = [this](int percent) { progress_.push_back(percent); };
        callbacks.on_success = [this](const std::string& path) {
            success_path_ = path;
            guard_.reset();
        };
        callbacks.on_error = [this](const chunkfs::core::Error& error) {
            error_ = error;
            guard_.reset();
        };
        return callbacks;
    }

    void Run() {
        ioc_.restart();
        guard_.emplace(ioc_.get_executor());
        ioc_.run();
    }

    std::filesystem::path dir_;
    std::shared_ptr<chunkfs::upload::InMemorySessionRegistry> registry_;
    std::shared_ptr<chunkfs::storage::ContentArchive> archive_;
    std::shared_ptr<chunkfs::upload::UploadCoordinator> coordinator_;
    boost::asio::io_context ioc_;
    std::optional<WorkGuard> guard_;

    std::string content_hash_;
    std::vector<int> progress_;
    std::optional<std::string> success_path_;
    std::optional<chunkfs::core::Error> error_;
};

std::vector<std::uint64_t> Sorted(std::vector<std::uint64_t> values) {
    std::sort(values.begin(), values.end());
    return values;
}

}  // namespace

TEST(SchedulerStates, NamesEveryState) {
    EXPECT_STREQ(chunkfs::client::SchedulerStateName(SchedulerState::kIdle), "IDLE");
    EXPECT_STREQ(chunkfs::client::SchedulerStateName(SchedulerState::kPaused), "PAUSED");
    EXPECT_STREQ(chunkfs::client::SchedulerStateName(SchedulerState::kDone), "DONE");
    EXPECT_STREQ(chunkfs::client::SchedulerStateName(SchedulerState::kError), "ERROR");
}

TEST(SchedulerOptionsTest, ComeFromClientConfig) {
    chunkfs::core::ClientConfig config;
    config.chunk_size = 2 * kMiB;
    config.concurrency = 5;
    auto options = chunkfs::client::OptionsFromConfig(config);
    EXPECT_EQ(options.chunk_size, 2 * kMiB);
    EXPECT_EQ(options.concurrency, 5);
}

TEST_F(ChunkSchedulerTest, UploadsEveryChunkAndMerges) {
    const auto path = WriteLocalFile("report.bin", 7 * kMiB + 123);
    auto transport = Transport(std::chrono::milliseconds(0));
    auto scheduler = ChunkScheduler::Create(ioc_, transport, path, {kMiB, 3}, Recording());

    scheduler->Start();
    Run();

    ASSERT_FALSE(error_.has_value()) << error_->message;
    EXPECT_EQ(scheduler->state(), SchedulerState::kDone);
    ASSERT_TRUE(success_path_.has_value());
    EXPECT_EQ(*success_path_, content_hash_ + ".bin");
    EXPECT_TRUE(std::filesystem::exists(archive_->PathFor(*success_path_)));
    EXPECT_EQ(std::filesystem::file_size(archive_->PathFor(*success_path_)), 7 * kMiB + 123);

    EXPECT_EQ(Sorted(transport->delivered()),
              (std::vector<std::uint64_t>{0, 1, 2, 3, 4, 5, 6, 7}));
    EXPECT_EQ(transport->max_in_flight(), 3u);
    EXPECT_EQ(transport->init_calls(), 1u);
    EXPECT_EQ(progress_.back(), 100);
    EXPECT_TRUE(std::is_sorted(progress_.begin(), progress_.end()));
    EXPECT_EQ(registry_->Size(), 0u);
}

TEST_F(ChunkSchedulerTest, ConcurrencyBelowOneIsClampedToOne) {
    const auto path = WriteLocalFile("serial.bin", 4 * kMiB);
    auto transport = Transport(std::chrono::milliseconds(1));
    auto scheduler = ChunkScheduler::Create(ioc_, transport, path, {kMiB, 0}, Recording());

    scheduler->Start();
    Run();

    EXPECT_EQ(scheduler->state(), SchedulerState::kDone);
    EXPECT_EQ(transport->max_in_flight(), 1u);
    EXPECT_EQ(transport->delivered(), (std::vector<std::uint64_t>{0, 1, 2, 3}));
}

TEST_F(ChunkSchedulerTest, PauseCancelsInFlightAndResumeSendsOnlyTheRest) {
    const auto path = WriteLocalFile("movie.bin", 10 * kMiB);
    auto transport = Transport(std::chrono::milliseconds(20));

    std::shared_ptr<ChunkScheduler> scheduler;
    bool paused_once = false;
    auto callbacks = Recording();
    callbacks.on_progress = [&](int percent) {
        progress_.push_back(percent);
        if (percent == 60 && !paused_once) {
            paused_once = true;
            scheduler->Pause();
            guard_.reset();
        }
    };
    scheduler = ChunkScheduler::Create(ioc_, transport, path, {2 * kMiB, 2}, callbacks);

    scheduler->Start();
    Run();

    ASSERT_TRUE(paused_once);
    EXPECT_EQ(scheduler->state(), SchedulerState::kPaused);
    EXPECT_EQ(scheduler->uploaded().size(), 3u);
    EXPECT_EQ(transport->delivered().size(), 3u);
    EXPECT_EQ(transport->cancelled_transfers(), 1u);
    EXPECT_FALSE(success_path_.has_value());
    const auto session = scheduler->session_id();
    EXPECT_EQ(coordinator_->GetProgress(session).value().percent, 60);

    scheduler->Resume();
    Run();

    ASSERT_FALSE(error_.has_value()) << error_->message;
    EXPECT_EQ(scheduler->state(), SchedulerState::kDone);
    EXPECT_EQ(Sorted(transport->delivered()), (std::vector<std::uint64_t>{0, 1, 2, 3, 4}));
    EXPECT_EQ(transport->init_calls(), 1u);
    EXPECT_LE(transport->max_in_flight(), 2u);
    ASSERT_TRUE(success_path_.has_value());
    EXPECT_EQ(*success_path_, content_hash_ + ".bin");
    EXPECT_EQ(progress_.back(), 100);
}

TEST_F(ChunkSchedulerTest, PauseAndResumeAreIgnoredOutsideTheirStates) {
    const auto path = WriteLocalFile("idle.bin", kMiB);
    auto transport = Transport(std::chrono::milliseconds(0));
    auto scheduler = ChunkScheduler::Create(ioc_, transport, path, {kMiB, 1}, Recording());

    scheduler->Pause();
    scheduler->Resume();
    ioc_.run();
    EXPECT_EQ(scheduler->state(), SchedulerState::kIdle);

    scheduler->Start();
    Run();
    EXPECT_EQ(scheduler->state(), SchedulerState::kDone);

    scheduler->Pause();
    ioc_.restart();
    ioc_.run();
    EXPECT_EQ(scheduler->state(), SchedulerState::kDone);
}

TEST_F(ChunkSchedulerTest, KnownContentShortCircuitsWithoutSendingChunks) {
    const auto path = WriteLocalFile("photo.jpg", 3 * kMiB);
    auto first = Transport(std::chrono::milliseconds(0));
    auto uploader = ChunkScheduler::Create(ioc_, first, path, {kMiB, 2}, Recording());
    uploader->Start();
    Run();
    ASSERT_EQ(uploader->state(), SchedulerState::kDone);
    const auto stored = *success_path_;

    success_path_.reset();
    auto second = Transport(std::chrono::milliseconds(0));
    auto again = ChunkScheduler::Create(ioc_, second, path, {kMiB, 2}, Recording());
    again->Start();
    Run();

    EXPECT_EQ(again->state(), SchedulerState::kDone);
    ASSERT_TRUE(success_path_.has_value());
    EXPECT_EQ(*success_path_, stored);
    EXPECT_TRUE(second->delivered().empty());
    EXPECT_EQ(registry_->Size(), 0u);
}

TEST_F(ChunkSchedulerTest, FailedChunkStopsAndStartRetriesTheSameSession) {
    const auto path = WriteLocalFile("flaky.bin", 4 * kMiB);
    auto transport = Transport(std::chrono::milliseconds(0));
    transport->FailChunkOnce(1);
    auto scheduler = ChunkScheduler::Create(ioc_, transport, path, {kMiB, 1}, Recording());

    scheduler->Start();
    Run();

    ASSERT_TRUE(error_.has_value());
    EXPECT_EQ(error_->code, ErrorCode::kTransferFailed);
    EXPECT_EQ(scheduler->state(), SchedulerState::kError);
    EXPECT_EQ(transport->delivered(), (std::vector<std::uint64_t>{0}));
    const auto session = scheduler->session_id();
    EXPECT_FALSE(session.empty());

    error_.reset();
    scheduler->Start();
    Run();

    ASSERT_FALSE(error_.has_value()) << error_->message;
    EXPECT_EQ(scheduler->state(), SchedulerState::kDone);
    EXPECT_EQ(transport->delivered(), (std::vector<std::uint64_t>{0, 1, 2, 3}));
    EXPECT_EQ(transport->init_calls(), 1u);
}

TEST_F(ChunkSchedulerTest, ChunkLostBeforeMergeIsResentOnRetry) {
    const auto path = WriteLocalFile("archive.tar", 4 * kMiB);
    auto transport = Transport(std::chrono::milliseconds(0));
    const chunkfs::storage::ChunkStore staging((dir_ / "staging").string());

    std::shared_ptr<ChunkScheduler> scheduler;
    bool removed = false;
    auto callbacks = Recording();
    callbacks.on_progress = [&](int percent) {
        progress_.push_back(percent);
        if (percent == 100 && !removed) {
            removed = true;
            std::filesystem::remove(staging.ChunkPath(scheduler->session_id(), 1));
        }
    };
    scheduler = ChunkScheduler::Create(ioc_, transport, path, {kMiB, 2}, callbacks);

    scheduler->Start();
    Run();

    ASSERT_TRUE(removed);
    ASSERT_TRUE(error_.has_value());
    EXPECT_EQ(error_->code, ErrorCode::kIncompleteUpload);
    EXPECT_EQ(error_->chunks, (std::vector<std::uint64_t>{1}));
    EXPECT_EQ(scheduler->state(), SchedulerState::kError);
    EXPECT_EQ(scheduler->uploaded(), (std::set<std::uint64_t>{0, 2, 3}));

    error_.reset();
    scheduler->Start();
    Run();

    ASSERT_FALSE(error_.has_value()) << error_->message;
    EXPECT_EQ(scheduler->state(), SchedulerState::kDone);
    EXPECT_EQ(Sorted(transport->delivered()), (std::vector<std::uint64_t>{0, 1, 1, 2, 3}));
    EXPECT_EQ(transport->init_calls(), 1u);
    ASSERT_TRUE(success_path_.has_value());
    EXPECT_EQ(std::filesystem::file_size(archive_->PathFor(*success_path_)), 4 * kMiB);
}

TEST_F(ChunkSchedulerTest, FileTruncatedMidUploadFailsWithReadError) {
    const auto path = WriteLocalFile("shrinking.bin", 3 * kMiB);
    auto transport = Transport(std::chrono::milliseconds(0));

    bool truncated = false;
    auto callbacks = Recording();
    callbacks.on_progress = [&](int percent) {
        progress_.push_back(percent);
        if (!truncated) {
            truncated = true;
            std::filesystem::resize_file(path, kMiB / 2);
        }
    };
    auto scheduler = ChunkScheduler::Create(ioc_, transport, path, {kMiB, 1}, callbacks);

    scheduler->Start();
    Run();

    ASSERT_TRUE(truncated);
    ASSERT_TRUE(error_.has_value());
    EXPECT_EQ(error_->code, ErrorCode::kIoError);
    EXPECT_EQ(scheduler->state(), SchedulerState::kError);
    EXPECT_EQ(transport->delivered(), (std::vector<std::uint64_t>{0}));
}

TEST_F(ChunkSchedulerTest, ForgottenSessionFailsThenStartsOver) {
    const auto path = WriteLocalFile("lost.bin", 4 * kMiB);
    auto transport = Transport(std::chrono::milliseconds(5));

    std::shared_ptr<ChunkScheduler> scheduler;
    bool paused_once = false;
    auto callbacks = Recording();
    callbacks.on_progress = [&](int percent) {
        progress_.push_back(percent);
        if (!paused_once) {
            paused_once = true;
            scheduler->Pause();
            guard_.reset();
        }
    };
    scheduler = ChunkScheduler::Create(ioc_, transport, path, {kMiB, 1}, callbacks);
    scheduler->Start();
    Run();
    ASSERT_EQ(scheduler->state(), SchedulerState::kPaused);

    // Server side drops the session while the client is paused.
    ASSERT_TRUE(coordinator_->CancelUpload(scheduler->session_id()).ok());
    scheduler->Resume();
    Run();

    ASSERT_TRUE(error_.has_value());
    EXPECT_EQ(error_->code, ErrorCode::kNotFound);
    EXPECT_EQ(scheduler->state(), SchedulerState::kError);
    EXPECT_TRUE(scheduler->session_id().empty());
    EXPECT_TRUE(scheduler->uploaded().empty());

    error_.reset();
    scheduler->Start();
    Run();

    EXPECT_EQ(scheduler->state(), SchedulerState::kDone);
    EXPECT_EQ(transport->init_calls(), 2u);
    ASSERT_TRUE(success_path_.has_value());
    EXPECT_EQ(*success_path_, content_hash_ + ".bin");
}

TEST_F(ChunkSchedulerTest, EmptyFileMergesImmediately) {
    const auto path = WriteLocalFile("empty.txt", 0);
    auto transport = Transport(std::chrono::milliseconds(0));
    auto scheduler = ChunkScheduler::Create(ioc_, transport, path, {kMiB, 3}, Recording());

    scheduler->Start();
    Run();

    EXPECT_EQ(scheduler->state(), SchedulerState::kDone);
    EXPECT_EQ(scheduler->total_chunks(), 0u);
    EXPECT_TRUE(transport->delivered().empty());
    ASSERT_TRUE(success_path_.has_value());
    EXPECT_EQ(*success_path_, content_hash_ + ".txt");
}

TEST_F(ChunkSchedulerTest, MissingFileFailsWhileHashing) {
    auto transport = Transport(std::chrono::milliseconds(0));
    auto scheduler = ChunkScheduler::Create(ioc_, transport, (dir_ / "nope.bin").string(),
                                            {kMiB, 3}, Recording());

    scheduler->Start();
    Run();

    ASSERT_TRUE(error_.has_value());
    EXPECT_EQ(error_->code, ErrorCode::kIoError);
    EXPECT_EQ(scheduler->state(), SchedulerState::kError);
    EXPECT_EQ(transport->init_calls(), 0u);
}

TEST_F(ChunkSchedulerTest, ZeroChunkSizeIsRejected) {
    const auto path = WriteLocalFile("any.bin", 16);
    auto transport = Transport(std::chrono::milliseconds(0));
    auto scheduler = ChunkScheduler::Create(ioc_, transport, path, {0, 3}, Recording());

    scheduler->Start();
    Run();

    ASSERT_TRUE(error_.has_value());
    EXPECT_EQ(error_->code, ErrorCode::kInvalidArgument);
    EXPECT_EQ(scheduler->state(), SchedulerState::kError);
}
