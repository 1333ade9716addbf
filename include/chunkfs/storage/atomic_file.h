#pragma once

#include <cstdint>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#ifdef _WIN32
#include <fstream>
#endif

#include <Poco/SHA2Engine.h>

#include "chunkfs/core/result.h"

namespace chunkfs::storage {

/// @brief Attributes of a file that was committed under its final name.
struct StoredFile {
    std::string path;
    std::string sha256;
    std::uint64_t size_bytes{0};
};

/// @brief Writes a file under a hidden temporary name beside its destination and renames it
/// into place on Commit(), so readers never observe a partially written file.
///
/// An uncommitted writer removes its temporary file on Abort() or destruction.
class AtomicFileWriter {
public:
    ~AtomicFileWriter();

    AtomicFileWriter(const AtomicFileWriter&) = delete;
    AtomicFileWriter& operator=(const AtomicFileWriter&) = delete;

    /// @brief Create the temporary file; the destination directory must already exist.
    static core::Result<std::unique_ptr<AtomicFileWriter>> Open(const std::string& final_path);

    core::Result<void> Write(const char* data, std::size_t size);
    /// @brief Drain `data` into the file until end of stream.
    core::Result<void> WriteFrom(std::istream& data);
    /// @brief Flush, sync and rename over the destination (replacing any previous file).
    ///
    /// When `expected_sha256` is non-empty the digest of the written bytes must match it,
    /// otherwise the temporary file is discarded with kHashMismatch and the destination is
    /// left untouched.
    core::Result<StoredFile> Commit(const std::string& expected_sha256 = "");
    void Abort();

    const std::string& final_path() const { return final_path_; }
    const std::string& temp_path() const { return temp_path_; }
    std::uint64_t bytes_written() const { return total_; }

private:
    AtomicFileWriter(std::string final_path, std::string temp_path);

    void CloseHandle();

    std::string final_path_;
    std::string temp_path_;
    Poco::SHA2Engine256 sha256_;
    std::uint64_t total_{0};
    bool open_{false};
    bool finished_{false};
#ifdef _WIN32
    std::unique_ptr<std::ofstream> out_;
#else
    int fd_{-1};
#endif
};

}  // namespace chunkfs::storage
