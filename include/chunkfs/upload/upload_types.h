#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace chunkfs::upload {

/// @brief Parameters of InitUpload as supplied by the client.
struct InitRequest {
    std::string file_name;
    std::int64_t declared_size{0};
    std::int64_t chunk_size{0};
    std::string content_hash;
};

/// @brief InitUpload answer: a fresh session id, or the archived file on a dedup hit.
struct InitOutcome {
    std::optional<std::string> session_id;
    std::optional<std::string> existing_file;

    bool deduplicated() const { return existing_file.has_value(); }
};

/// @brief Acknowledgement of a durably staged chunk.
struct ChunkAck {
    std::uint64_t index{0};
    std::uint64_t size_bytes{0};
    // True when the index had already been recorded for the session.
    bool duplicate{false};
};

/// @brief Snapshot of a session's progress; both index lists are ascending.
struct ProgressReport {
    int percent{0};
    std::uint64_t total_chunks{0};
    std::vector<std::uint64_t> uploaded;
    std::vector<std::uint64_t> missing;
};

/// @brief Successful merge: the archive file name (`<hash><ext>`) and its size.
struct MergeOutcome {
    std::string file_path;
    std::uint64_t size_bytes{0};
};

}  // namespace chunkfs::upload
