#include "chunkfs/core/digest.h"

#include <array>
#include <cctype>
#include <fstream>

#include <Poco/DigestEngine.h>
#include <Poco/SHA2Engine.h>
#include <Poco/String.h>

namespace chunkfs::core {

Result<std::string> Sha256File(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return Error{ErrorCode::kIoError, "failed to open " + path};
    }

    Poco::SHA2Engine256 sha256;
    std::array<char, 65536> buffer{};
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const auto bytes = in.gcount();
        if (bytes <= 0) {
            break;
        }
        sha256.update(buffer.data(), static_cast<unsigned int>(bytes));
    }
    if (in.bad()) {
        return Error{ErrorCode::kIoError, "failed to read " + path};
    }
    return Poco::DigestEngine::digestToHex(sha256.digest());
}

std::string Sha256Hex(const std::string& data) {
    Poco::SHA2Engine256 sha256;
    sha256.update(data);
    return Poco::DigestEngine::digestToHex(sha256.digest());
}

bool IsHexDigest(const std::string& value) {
    if (value.empty() || value.size() > 128) {
        return false;
    }
    for (char c : value) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

std::string NormalizeDigest(const std::string& value) { return Poco::toLower(value); }

bool DigestEquals(const std::string& lhs, const std::string& rhs) {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (std::size_t i = 0; i < lhs.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(lhs[i])) !=
            std::tolower(static_cast<unsigned char>(rhs[i]))) {
            return false;
        }
    }
    return true;
}

}  // namespace chunkfs::core
