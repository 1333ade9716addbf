#include "chunkfs/core/chunking.h"

#include <algorithm>

namespace chunkfs::core {

std::uint64_t TotalChunks(std::uint64_t declared_size, std::uint64_t chunk_size) {
    if (chunk_size == 0) {
        return 0;
    }
    return declared_size / chunk_size + (declared_size % chunk_size == 0 ? 0 : 1);
}

ChunkRange RangeOf(std::uint64_t index, std::uint64_t declared_size, std::uint64_t chunk_size) {
    ChunkRange range;
    range.index = index;
    range.offset = std::min(index * chunk_size, declared_size);
    range.length = std::min(chunk_size, declared_size - range.offset);
    return range;
}

std::vector<ChunkRange> PlanChunks(std::uint64_t declared_size, std::uint64_t chunk_size) {
    const auto total = TotalChunks(declared_size, chunk_size);
    std::vector<ChunkRange> ranges;
    ranges.reserve(static_cast<std::size_t>(total));
    for (std::uint64_t i = 0; i < total; ++i) {
        ranges.push_back(RangeOf(i, declared_size, chunk_size));
    }
    return ranges;
}

int PercentComplete(std::uint64_t done, std::uint64_t total) {
    if (total == 0) {
        return 100;
    }
    // Rounds half up without going through floating point.
    const auto percent = static_cast<int>((200 * done + total) / (2 * total));
    return std::clamp(percent, 0, 100);
}

}  // namespace chunkfs::core
