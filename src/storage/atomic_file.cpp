#include "chunkfs/storage/atomic_file.h"

#include <array>
#include <filesystem>
#include <fstream>
#include <system_error>

#include <Poco/DigestEngine.h>
#include <Poco/UUIDGenerator.h>

#include "chunkfs/core/digest.h"

#ifdef _WIN32
#include <windows.h>
#else
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>
#endif

namespace chunkfs::storage {

namespace {

std::string TempPathFor(const std::string& final_path) {
    const std::filesystem::path final_fs(final_path);
    // Leading dot keeps temporaries out of name-based lookups in the same directory.
    const auto name = "." + final_fs.filename().string() + ".tmp-" +
                      Poco::UUIDGenerator().createOne().toString();
    return (final_fs.parent_path() / name).string();
}

}  // namespace

AtomicFileWriter::AtomicFileWriter(std::string final_path, std::string temp_path)
    : final_path_(std::move(final_path)), temp_path_(std::move(temp_path)) {}

AtomicFileWriter::~AtomicFileWriter() { Abort(); }

core::Result<std::unique_ptr<AtomicFileWriter>> AtomicFileWriter::Open(
    const std::string& final_path) {
    std::unique_ptr<AtomicFileWriter> writer(
        new AtomicFileWriter(final_path, TempPathFor(final_path)));

#ifdef _WIN32
    writer->out_ = std::make_unique<std::ofstream>(writer->temp_path_,
                                                   std::ios::binary | std::ios::trunc);
    if (!writer->out_->is_open()) {
        writer->finished_ = true;
        return core::Error{core::ErrorCode::kIoError, "failed to open temp file"};
    }
#else
    writer->fd_ = ::open(writer->temp_path_.c_str(), O_CREAT | O_WRONLY | O_TRUNC, 0644);
    if (writer->fd_ < 0) {
        writer->finished_ = true;
        return core::Error{core::ErrorCode::kIoError,
                           "failed to open temp file: " + std::string(std::strerror(errno))};
    }
#endif
    writer->open_ = true;
    return writer;
}

core::Result<void> AtomicFileWriter::Write(const char* data, std::size_t size) {
    if (!open_) {
        return core::Error{core::ErrorCode::kIoError, "writer is closed"};
    }
#ifdef _WIN32
    out_->write(data, static_cast<std::streamsize>(size));
    if (!*out_) {
        return core::Error{core::ErrorCode::kIoError, "failed to write temp file"};
    }
#else
    std::size_t offset = 0;
    while (offset < size) {
        const ssize_t written = ::write(fd_, data + offset, size - offset);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            return core::Error{core::ErrorCode::kIoError,
                               "failed to write temp file: " + std::string(std::strerror(errno))};
        }
        offset += static_cast<std::size_t>(written);
    }
#endif
    sha256_.update(data, static_cast<unsigned int>(size));
    total_ += static_cast<std::uint64_t>(size);
    return core::Ok();
}

core::Result<void> AtomicFileWriter::WriteFrom(std::istream& data) {
    std::array<char, 8192> buffer{};
    while (data) {
        data.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const std::streamsize bytes = data.gcount();
        if (bytes <= 0) {
            break;
        }
        auto written = Write(buffer.data(), static_cast<std::size_t>(bytes));
        if (!written.ok()) {
            return written;
        }
    }
    if (data.bad()) {
        return core::Error{core::ErrorCode::kIoError, "failed to read input stream"};
    }
    return core::Ok();
}

core::Result<StoredFile> AtomicFileWriter::Commit(const std::string& expected_sha256) {
    if (!open_) {
        return core::Error{core::ErrorCode::kIoError, "writer is closed"};
    }
#ifdef _WIN32
    out_->flush();
    const bool flushed = static_cast<bool>(*out_);
#else
    const bool flushed = ::fsync(fd_) == 0;
#endif
    CloseHandle();
    if (!flushed) {
        Abort();
        return core::Error{core::ErrorCode::kIoError, "failed to flush temp file"};
    }

    const auto digest = Poco::DigestEngine::digestToHex(sha256_.digest());
    if (!expected_sha256.empty() && !core::DigestEquals(digest, expected_sha256)) {
        Abort();
        return core::Error{core::ErrorCode::kHashMismatch,
                           "content hash " + digest + " does not match expected " +
                               expected_sha256};
    }

    std::error_code ec;
    std::filesystem::rename(temp_path_, final_path_, ec);
    if (ec) {
        Abort();
        return core::Error{core::ErrorCode::kIoError, "failed to rename into place: " + ec.message()};
    }
    finished_ = true;

    StoredFile stored;
    stored.path = final_path_;
    stored.size_bytes = total_;
    stored.sha256 = digest;
    return stored;
}

void AtomicFileWriter::Abort() {
    if (finished_) {
        return;
    }
    CloseHandle();
    std::error_code ec;
    std::filesystem::remove(temp_path_, ec);
    finished_ = true;
}

void AtomicFileWriter::CloseHandle() {
    if (!open_) {
        return;
    }
#ifdef _WIN32
    out_->close();
#else
    ::close(fd_);
    fd_ = -1;
#endif
    open_ = false;
}

}  // namespace chunkfs::storage
