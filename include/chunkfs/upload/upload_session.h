#pragma once

#include <cstdint>
#include <set>
#include <string>

#include <Poco/Timestamp.h>

namespace chunkfs::upload {

/// @brief Server-side record of one in-progress upload.
///
/// Everything except `uploaded_chunks`, `last_activity` and `merging` is fixed at init.
/// `uploaded_chunks` only ever holds indices in [0, total_chunks).
struct UploadSession {
    std::string session_id;
    std::string file_name;
    std::uint64_t declared_size{0};
    std::uint64_t chunk_size{0};
    std::string content_hash;
    std::uint64_t total_chunks{0};
    std::set<std::uint64_t> uploaded_chunks;
    Poco::Timestamp last_activity;
    bool merging{false};
};

}  // namespace chunkfs::upload
