#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include <gtest/gtest.h>
#include <Poco/UUIDGenerator.h>

#include "chunkfs/storage/atomic_file.h"
#include "chunkfs/storage/chunk_store.h"
#include "chunkfs/storage/content_archive.h"

namespace {

std::filesystem::path MakeTempDir() {
    auto dir = std::filesystem::temp_directory_path() /
               ("chunkfs_store_" + Poco::UUIDGenerator().createOne().toString());
    std::filesystem::create_directories(dir);
    return dir;
}

std::string ReadAll(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

std::size_t CountEntries(const std::string& dir) {
    std::size_t count = 0;
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        (void)entry;
        ++count;
    }
    return count;
}

}  // namespace

TEST(PathSafety, AcceptsSessionIds) {
    EXPECT_TRUE(chunkfs::storage::ChunkStore::IsSafeName("6f1c2a9e-8d0b-4a55-9f3e-1b2c3d4e5f60"));
    EXPECT_TRUE(chunkfs::storage::ChunkStore::IsSafeName("session_1"));
}

TEST(PathSafety, RejectsTraversalAndHiddenNames) {
    EXPECT_FALSE(chunkfs::storage::ChunkStore::IsSafeName("../secret"));
    EXPECT_FALSE(chunkfs::storage::ChunkStore::IsSafeName(".."));
    EXPECT_FALSE(chunkfs::storage::ChunkStore::IsSafeName("a/b"));
    EXPECT_FALSE(chunkfs::storage::ChunkStore::IsSafeName(".tmp-123"));
    EXPECT_FALSE(chunkfs::storage::ChunkStore::IsSafeName(""));
}

TEST(ChunkStore, WritesChunksIntoTheSessionArea) {
    const auto dir = MakeTempDir();
    chunkfs::storage::ChunkStore store((dir / "staging").string());
    ASSERT_TRUE(store.CreateArea("s1").ok());

    std::istringstream data("chunk-bytes");
    auto stored = store.WriteChunk("s1", 3, data);
    ASSERT_TRUE(stored.ok());
    EXPECT_EQ(stored.value().size_bytes, 11u);
    EXPECT_TRUE(store.HasChunk("s1", 3));
    EXPECT_EQ(ReadAll(store.ChunkPath("s1", 3)), "chunk-bytes");
    EXPECT_EQ(std::filesystem::path(store.ChunkPath("s1", 3)).filename().string(), "3.part");

    auto missing = store.MissingChunks("s1", 5);
    EXPECT_EQ(missing, (std::vector<std::uint64_t>{0, 1, 2, 4}));

    std::filesystem::remove_all(dir);
}

TEST(ChunkStore, RewritingAnIndexReplacesTheChunkWhole) {
    const auto dir = MakeTempDir();
    chunkfs::storage::ChunkStore store((dir / "staging").string());
    ASSERT_TRUE(store.CreateArea("s1").ok());

    std::istringstream first("a much longer first copy");
    ASSERT_TRUE(store.WriteChunk("s1", 0, first).ok());
    std::istringstream second("short");
    ASSERT_TRUE(store.WriteChunk("s1", 0, second).ok());

    EXPECT_EQ(ReadAll(store.ChunkPath("s1", 0)), "short");
    EXPECT_EQ(CountEntries(store.AreaPath("s1")), 1u);

    std::filesystem::remove_all(dir);
}

TEST(ChunkStore, AbortedChunkLeavesOnlyCommittedChunks) {
    const auto dir = MakeTempDir();
    chunkfs::storage::ChunkStore store((dir / "staging").string());
    ASSERT_TRUE(store.CreateArea("s1").ok());
    std::istringstream done("kept");
    ASSERT_TRUE(store.WriteChunk("s1", 0, done).ok());

    auto writer = store.OpenChunk("s1", 1);
    ASSERT_TRUE(writer.ok());
    ASSERT_TRUE(writer.value()->Write("partial", 7).ok());
    EXPECT_TRUE(std::filesystem::exists(writer.value()->temp_path()));
    EXPECT_FALSE(store.HasChunk("s1", 1));

    writer.value()->Abort();
    EXPECT_FALSE(std::filesystem::exists(writer.value()->temp_path()));
    EXPECT_FALSE(store.HasChunk("s1", 1));
    EXPECT_TRUE(store.HasChunk("s1", 0));
    EXPECT_EQ(CountEntries(store.AreaPath("s1")), 1u);

    std::filesystem::remove_all(dir);
}

TEST(ChunkStore, DroppedWriterCleansUpItsTempFile) {
    const auto dir = MakeTempDir();
    chunkfs::storage::ChunkStore store((dir / "staging").string());
    ASSERT_TRUE(store.CreateArea("s1").ok());

    std::string temp_path;
    {
        auto writer = store.OpenChunk("s1", 0);
        ASSERT_TRUE(writer.ok());
        temp_path = writer.value()->temp_path();
        ASSERT_TRUE(writer.value()->Write("xyz", 3).ok());
    }
    EXPECT_FALSE(std::filesystem::exists(temp_path));
    EXPECT_EQ(CountEntries(store.AreaPath("s1")), 0u);

    std::filesystem::remove_all(dir);
}

TEST(ChunkStore, OpenChunkRequiresAnArea) {
    const auto dir = MakeTempDir();
    chunkfs::storage::ChunkStore store((dir / "staging").string());

    auto writer = store.OpenChunk("gone", 0);
    ASSERT_FALSE(writer.ok());
    EXPECT_EQ(writer.error().code, chunkfs::core::ErrorCode::kIoError);

    std::filesystem::remove_all(dir);
}

TEST(ChunkStore, RemoveAreaIsIdempotentAndListsOnlyDirectories) {
    const auto dir = MakeTempDir();
    chunkfs::storage::ChunkStore store((dir / "staging").string());
    ASSERT_TRUE(store.CreateArea("s1").ok());
    ASSERT_TRUE(store.CreateArea("s2").ok());
    std::ofstream((dir / "staging" / "stray.txt").string()) << "x";

    auto areas = store.ListAreas();
    ASSERT_TRUE(areas.ok());
    EXPECT_EQ(areas.value().size(), 2u);

    EXPECT_TRUE(store.RemoveArea("s1").ok());
    EXPECT_TRUE(store.RemoveArea("s1").ok());
    EXPECT_FALSE(store.HasArea("s1"));
    EXPECT_TRUE(store.HasArea("s2"));

    std::filesystem::remove_all(dir);
}

TEST(AtomicFile, HashMismatchKeepsTheExistingDestination) {
    const auto dir = MakeTempDir();
    const auto target = (dir / "target.bin").string();
    std::ofstream(target) << "original";

    auto writer = chunkfs::storage::AtomicFileWriter::Open(target);
    ASSERT_TRUE(writer.ok());
    ASSERT_TRUE(writer.value()->Write("replacement", 11).ok());
    auto committed = writer.value()->Commit(std::string(64, '0'));
    ASSERT_FALSE(committed.ok());
    EXPECT_EQ(committed.error().code, chunkfs::core::ErrorCode::kHashMismatch);
    EXPECT_EQ(ReadAll(target), "original");
    EXPECT_EQ(CountEntries(dir.string()), 1u);

    std::filesystem::remove_all(dir);
}

TEST(ContentArchive, ExtensionRules) {
    using chunkfs::storage::ContentArchive;
    EXPECT_EQ(ContentArchive::ExtensionOf("video.bin"), ".bin");
    EXPECT_EQ(ContentArchive::ExtensionOf("archive.tar.gz"), ".gz");
    EXPECT_EQ(ContentArchive::ExtensionOf("README"), "");
    EXPECT_EQ(ContentArchive::ExtensionOf("dir.d/name"), "");
    EXPECT_EQ(ContentArchive::ExtensionOf("C:\\docs\\report.pdf"), ".pdf");
    EXPECT_EQ(ContentArchive::ExtensionOf("weird.a b"), "");
    EXPECT_EQ(ContentArchive::FinalName("abc123", "photo.jpg"), "abc123.jpg");
}

TEST(ContentArchive, FindPrefersExactNameThenStemMatch) {
    const auto dir = MakeTempDir();
    chunkfs::storage::ContentArchive archive(dir.string());
    const std::string hash = "aa11bb22";

    EXPECT_FALSE(archive.Find(hash, ".bin").has_value());

    std::ofstream(archive.PathFor(hash + ".dat")) << "x";
    std::ofstream(archive.PathFor(hash + "ff.bin")) << "other content";
    std::ofstream(archive.PathFor("." + hash + ".bin.tmp-1")) << "partial";

    auto stem = archive.Find(hash, ".bin");
    ASSERT_TRUE(stem.has_value());
    EXPECT_EQ(*stem, hash + ".dat");

    std::ofstream(archive.PathFor(hash + ".bin")) << "x";
    auto exact = archive.Find(hash, ".bin");
    ASSERT_TRUE(exact.has_value());
    EXPECT_EQ(*exact, hash + ".bin");

    std::filesystem::remove_all(dir);
}
