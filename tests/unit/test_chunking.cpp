#include <cstdint>

#include <gtest/gtest.h>

#include "chunkfs/core/chunking.h"
#include "chunkfs/core/digest.h"

TEST(Chunking, RangesTileTheFileWithoutGaps) {
    const std::uint64_t sizes[] = {1, 4095, 4096, 4097, 10 * 1024 * 1024, 10 * 1024 * 1024 + 7};
    const std::uint64_t chunk_sizes[] = {1, 1000, 4096, 2 * 1024 * 1024};
    for (auto size : sizes) {
        for (auto chunk : chunk_sizes) {
            auto plan = chunkfs::core::PlanChunks(size, chunk);
            ASSERT_EQ(plan.size(), (size + chunk - 1) / chunk) << size << "/" << chunk;
            std::uint64_t next_offset = 0;
            for (std::size_t i = 0; i < plan.size(); ++i) {
                EXPECT_EQ(plan[i].index, i);
                EXPECT_EQ(plan[i].offset, next_offset);
                EXPECT_GT(plan[i].length, 0u);
                EXPECT_LE(plan[i].length, chunk);
                next_offset += plan[i].length;
            }
            EXPECT_EQ(next_offset, size);
        }
    }
}

TEST(Chunking, EmptyFileHasNoChunks) {
    EXPECT_EQ(chunkfs::core::TotalChunks(0, 4096), 0u);
    EXPECT_TRUE(chunkfs::core::PlanChunks(0, 4096).empty());
}

TEST(Chunking, LastChunkCarriesTheRemainder) {
    auto last = chunkfs::core::RangeOf(4, 10 * 1024 * 1024 + 100, 2 * 1024 * 1024);
    EXPECT_EQ(last.offset, 8u * 1024u * 1024u);
    EXPECT_EQ(last.length, 2u * 1024u * 1024u);
    auto tail = chunkfs::core::RangeOf(5, 10 * 1024 * 1024 + 100, 2 * 1024 * 1024);
    EXPECT_EQ(tail.length, 100u);
}

TEST(Chunking, PercentRoundsAndClamps) {
    EXPECT_EQ(chunkfs::core::PercentComplete(0, 5), 0);
    EXPECT_EQ(chunkfs::core::PercentComplete(3, 5), 60);
    EXPECT_EQ(chunkfs::core::PercentComplete(1, 3), 33);
    EXPECT_EQ(chunkfs::core::PercentComplete(2, 3), 67);
    EXPECT_EQ(chunkfs::core::PercentComplete(1, 8), 13);
    EXPECT_EQ(chunkfs::core::PercentComplete(5, 5), 100);
    EXPECT_EQ(chunkfs::core::PercentComplete(7, 5), 100);
    EXPECT_EQ(chunkfs::core::PercentComplete(0, 0), 100);
}

TEST(Digest, KnownVectorsAndHexChecks) {
    EXPECT_EQ(chunkfs::core::Sha256Hex(""),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(chunkfs::core::Sha256Hex("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_TRUE(chunkfs::core::IsHexDigest("00ffAA"));
    EXPECT_FALSE(chunkfs::core::IsHexDigest(""));
    EXPECT_FALSE(chunkfs::core::IsHexDigest("../etc"));
    EXPECT_TRUE(chunkfs::core::DigestEquals("ABCDEF", "abcdef"));
    EXPECT_FALSE(chunkfs::core::DigestEquals("abcdef", "abcde0"));
}
