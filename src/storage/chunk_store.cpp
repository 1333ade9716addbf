#include "chunkfs/storage/chunk_store.h"

#include <cctype>
#include <filesystem>
#include <system_error>

namespace chunkfs::storage {

namespace {
constexpr const char* kChunkSuffix = ".part";
}  // namespace

ChunkStore::ChunkStore(std::string root) : root_(std::move(root)) {
    std::filesystem::create_directories(root_);
}

core::Result<void> ChunkStore::CreateArea(const std::string& session_id) {
    if (!IsSafeName(session_id)) {
        return core::Error{core::ErrorCode::kInvalidArgument, "invalid session id"};
    }
    std::error_code ec;
    std::filesystem::create_directories(AreaPath(session_id), ec);
    if (ec) {
        return core::Error{core::ErrorCode::kIoError,
                           "failed to create staging area: " + ec.message()};
    }
    return core::Ok();
}

bool ChunkStore::HasArea(const std::string& session_id) const {
    if (!IsSafeName(session_id)) {
        return false;
    }
    std::error_code ec;
    return std::filesystem::is_directory(AreaPath(session_id), ec);
}

core::Result<void> ChunkStore::RemoveArea(const std::string& session_id) {
    if (!IsSafeName(session_id)) {
        return core::Error{core::ErrorCode::kInvalidArgument, "invalid session id"};
    }
    std::error_code ec;
    std::filesystem::remove_all(AreaPath(session_id), ec);
    if (ec) {
        return core::Error{core::ErrorCode::kIoError,
                           "failed to remove staging area: " + ec.message()};
    }
    return core::Ok();
}

core::Result<std::vector<std::string>> ChunkStore::ListAreas() const {
    std::vector<std::string> areas;
    std::error_code ec;
    std::filesystem::directory_iterator it(root_, ec);
    if (ec) {
        return core::Error{core::ErrorCode::kIoError,
                           "failed to list staging root: " + ec.message()};
    }
    for (const auto& entry : it) {
        std::error_code type_ec;
        if (entry.is_directory(type_ec)) {
            areas.push_back(entry.path().filename().string());
        }
    }
    return areas;
}

core::Result<std::unique_ptr<AtomicFileWriter>> ChunkStore::OpenChunk(
    const std::string& session_id, std::uint64_t index) {
    if (!IsSafeName(session_id)) {
        return core::Error{core::ErrorCode::kInvalidArgument, "invalid session id"};
    }
    // The area is provisioned at init; a missing directory means the session was torn down.
    if (!HasArea(session_id)) {
        return core::Error{core::ErrorCode::kIoError, "staging area does not exist"};
    }
    return AtomicFileWriter::Open(ChunkPath(session_id, index));
}

core::Result<StoredFile> ChunkStore::WriteChunk(const std::string& session_id,
                                                std::uint64_t index, std::istream& data) {
    auto opened = OpenChunk(session_id, index);
    if (!opened.ok()) {
        return opened.error();
    }
    auto& writer = opened.value();
    auto written = writer->WriteFrom(data);
    if (!written.ok()) {
        writer->Abort();
        return written.error();
    }
    return writer->Commit();
}

bool ChunkStore::HasChunk(const std::string& session_id, std::uint64_t index) const {
    std::error_code ec;
    return std::filesystem::is_regular_file(ChunkPath(session_id, index), ec);
}

std::vector<std::uint64_t> ChunkStore::MissingChunks(const std::string& session_id,
                                                     std::uint64_t total_chunks) const {
    std::vector<std::uint64_t> missing;
    for (std::uint64_t i = 0; i < total_chunks; ++i) {
        if (!HasChunk(session_id, i)) {
            missing.push_back(i);
        }
    }
    return missing;
}

std::string ChunkStore::AreaPath(const std::string& session_id) const {
    return (std::filesystem::path(root_) / session_id).string();
}

std::string ChunkStore::ChunkPath(const std::string& session_id, std::uint64_t index) const {
    return (std::filesystem::path(root_) / session_id / ChunkFileName(index)).string();
}

std::string ChunkStore::ChunkFileName(std::uint64_t index) {
    return std::to_string(index) + kChunkSuffix;
}

bool ChunkStore::IsSafeName(const std::string& name) {
    if (name.empty() || name.size() > 255) {
        return false;
    }
    for (char c : name) {
        if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.')) {
            return false;
        }
    }
    if (name == "." || name == ".." || name.front() == '.') {
        return false;
    }
    return true;
}

}  // namespace chunkfs::storage
