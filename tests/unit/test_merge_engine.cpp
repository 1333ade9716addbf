#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>

#include <gtest/gtest.h>
#include <Poco/UUIDGenerator.h>

#include "chunkfs/core/digest.h"
#include "chunkfs/storage/chunk_store.h"
#include "chunkfs/storage/content_archive.h"
#include "chunkfs/storage/merge_engine.h"

namespace {

struct MergeFixture {
    MergeFixture()
        : dir(std::filesystem::temp_directory_path() /
              ("chunkfs_merge_" + Poco::UUIDGenerator().createOne().toString())),
          chunks(std::make_shared<chunkfs::storage::ChunkStore>((dir / "staging").string())),
          archive(std::make_shared<chunkfs::storage::ContentArchive>((dir / "archive").string())),
          engine(chunks, archive) {}

    ~MergeFixture() {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }

    void Stage(const std::string& session, std::uint64_t index, const std::string& bytes) {
        std::istringstream in(bytes);
        ASSERT_TRUE(chunks->WriteChunk(session, index, in).ok());
    }

    std::filesystem::path dir;
    std::shared_ptr<chunkfs::storage::ChunkStore> chunks;
    std::shared_ptr<chunkfs::storage::ContentArchive> archive;
    chunkfs::storage::MergeEngine engine;
};

std::string ReadAll(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

}  // namespace

TEST(MergeEngine, ConcatenatesInIndexOrderRegardlessOfArrival) {
    MergeFixture f;
    ASSERT_TRUE(f.chunks->CreateArea("s").ok());
    f.Stage("s", 2, "cc");
    f.Stage("s", 0, "aaaa");
    f.Stage("s", 1, "bbbb");

    const std::string expected = "aaaabbbbcc";
    const auto hash = chunkfs::core::Sha256Hex(expected);
    auto merged = f.engine.Merge("s", 3, hash + ".txt", hash);
    ASSERT_TRUE(merged.ok()) << merged.error().message;
    EXPECT_EQ(merged.value().name, hash + ".txt");
    EXPECT_EQ(merged.value().size_bytes, expected.size());
    EXPECT_EQ(merged.value().sha256, hash);
    EXPECT_EQ(ReadAll(f.archive->PathFor(hash + ".txt")), expected);
    // Staged chunks are the caller's to remove.
    EXPECT_TRUE(f.chunks->HasChunk("s", 0));
}

TEST(MergeEngine, MissingChunkIsReportedWithItsIndex) {
    MergeFixture f;
    ASSERT_TRUE(f.chunks->CreateArea("s").ok());
    f.Stage("s", 0, "aaaa");
    f.Stage("s", 2, "cc");

    auto merged = f.engine.Merge("s", 3, "out.bin", "");
    ASSERT_FALSE(merged.ok());
    EXPECT_EQ(merged.error().code, chunkfs::core::ErrorCode::kChunkMissing);
    EXPECT_EQ(merged.error().chunks, (std::vector<std::uint64_t>{1}));
    EXPECT_FALSE(std::filesystem::exists(f.archive->PathFor("out.bin")));
    EXPECT_TRUE(std::filesystem::is_empty(f.archive->root()));
}

TEST(MergeEngine, HashMismatchLeavesNoArchivedFile) {
    MergeFixture f;
    ASSERT_TRUE(f.chunks->CreateArea("s").ok());
    f.Stage("s", 0, "payload");

    const auto wrong = chunkfs::core::Sha256Hex("something else");
    auto merged = f.engine.Merge("s", 1, wrong + ".bin", wrong);
    ASSERT_FALSE(merged.ok());
    EXPECT_EQ(merged.error().code, chunkfs::core::ErrorCode::kHashMismatch);
    EXPECT_TRUE(std::filesystem::is_empty(f.archive->root()));
    EXPECT_TRUE(f.chunks->HasChunk("s", 0));
}

TEST(MergeEngine, ZeroChunksProducesAnEmptyFile) {
    MergeFixture f;
    ASSERT_TRUE(f.chunks->CreateArea("s").ok());

    const auto hash = chunkfs::core::Sha256Hex("");
    auto merged = f.engine.Merge("s", 0, hash, hash);
    ASSERT_TRUE(merged.ok());
    EXPECT_EQ(merged.value().size_bytes, 0u);
    EXPECT_TRUE(std::filesystem::exists(f.archive->PathFor(hash)));
}
