#pragma once

#include <cstdint>
#include <vector>

namespace chunkfs::core {

/// @brief Byte range [offset, offset + length) of one chunk inside the source file.
struct ChunkRange {
    std::uint64_t index{0};
    std::uint64_t offset{0};
    std::uint64_t length{0};
};

/// @brief ceil(declared_size / chunk_size); zero for an empty file.
std::uint64_t TotalChunks(std::uint64_t declared_size, std::uint64_t chunk_size);

/// @brief Range covered by chunk `index`; the last chunk may be shorter than chunk_size.
ChunkRange RangeOf(std::uint64_t index, std::uint64_t declared_size, std::uint64_t chunk_size);

/// @brief All chunk ranges of a file, in index order. Together they tile [0, declared_size).
std::vector<ChunkRange> PlanChunks(std::uint64_t declared_size, std::uint64_t chunk_size);

/// @brief round(100 * done / total), clamped to [0, 100]. An empty plan counts as complete.
int PercentComplete(std::uint64_t done, std::uint64_t total);

}  // namespace chunkfs::core
