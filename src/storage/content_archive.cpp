#include "chunkfs/storage/content_archive.h"

#include <cctype>
#include <filesystem>
#include <system_error>

namespace chunkfs::storage {

ContentArchive::ContentArchive(std::string root) : root_(std::move(root)) {
    std::filesystem::create_directories(root_);
}

std::optional<std::string> ContentArchive::Find(const std::string& content_hash,
                                                const std::string& extension) const {
    if (content_hash.empty()) {
        return std::nullopt;
    }
    std::error_code ec;
    const auto exact = content_hash + extension;
    if (std::filesystem::is_regular_file(PathFor(exact), ec)) {
        return exact;
    }

    std::filesystem::directory_iterator it(root_, ec);
    if (ec) {
        return std::nullopt;
    }
    for (const auto& entry : it) {
        std::error_code type_ec;
        if (!entry.is_regular_file(type_ec)) {
            continue;
        }
        const auto name = entry.path().filename().string();
        if (name.compare(0, content_hash.size(), content_hash) != 0) {
            continue;
        }
        if (name.size() == content_hash.size() || name[content_hash.size()] == '.') {
            return name;
        }
    }
    return std::nullopt;
}

std::string ContentArchive::PathFor(const std::string& archived_name) const {
    return (std::filesystem::path(root_) / archived_name).string();
}

std::string ContentArchive::FinalName(const std::string& content_hash,
                                      const std::string& file_name) {
    return content_hash + ExtensionOf(file_name);
}

std::string ContentArchive::ExtensionOf(const std::string& file_name) {
    // Strip any client-side directory components before looking at the extension.
    const auto slash = file_name.find_last_of("/\\");
    const auto base = slash == std::string::npos ? file_name : file_name.substr(slash + 1);
    const auto extension = std::filesystem::path(base).extension().string();
    if (extension.size() <= 1 || extension.size() > 32) {
        return "";
    }
    for (std::size_t i = 1; i < extension.size(); ++i) {
        const auto c = static_cast<unsigned char>(extension[i]);
        if (!(std::isalnum(c) || c == '-' || c == '_')) {
            return "";
        }
    }
    return extension;
}

}  // namespace chunkfs::storage
