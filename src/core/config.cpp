#include "chunkfs/core/config.h"

#include <cctype>
#include <stdexcept>

#include <Poco/AutoPtr.h>
#include <Poco/Util/JSONConfiguration.h>

namespace chunkfs::core {

namespace {

bool IsBlank(const std::string& value) {
    for (char c : value) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

}  // namespace

Config LoadConfig(const std::string& path) {
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg(
        new Poco::Util::JSONConfiguration(path));

    Config config;
    config.server.host = cfg->getString("server.host", "0.0.0.0");
    config.server.port = cfg->getInt("server.port", 8080);
    config.server.threads = cfg->getInt("server.threads", 4);
    config.server.limits.max_body_bytes =
        static_cast<std::uint64_t>(cfg->getInt64("server.limits.max_body_bytes", 268435456));

    config.storage.staging_path = cfg->getString("storage.staging_path", "data/staging");
    config.storage.archive_path = cfg->getString("storage.archive_path", "data/uploads");

    config.upload.verify_content_hash = cfg->getBool("upload.verify_content_hash", true);
    config.upload.session_idle_ttl_seconds = cfg->getInt("upload.session_idle_ttl_seconds", 0);
    const auto max_chunks = cfg->getInt64("upload.max_chunks_per_session", 1048576);

    config.cleanup.enabled = cfg->getBool("cleanup.enabled", true);
    config.cleanup.sweep_interval_seconds = cfg->getInt("cleanup.sweep_interval_seconds", 1800);

    config.observability.log_level = cfg->getString("observability.log_level", "information");

    if (config.server.threads <= 0) {
        throw std::invalid_argument("server.threads must be positive");
    }
    if (IsBlank(config.storage.staging_path) || IsBlank(config.storage.archive_path)) {
        throw std::invalid_argument("storage.staging_path and storage.archive_path are required");
    }
    // Each root is listed by name, so the two cannot share a directory.
    if (config.storage.staging_path == config.storage.archive_path) {
        throw std::invalid_argument("storage.staging_path must differ from storage.archive_path");
    }
    if (config.upload.session_idle_ttl_seconds < 0) {
        throw std::invalid_argument("upload.session_idle_ttl_seconds must not be negative");
    }
    if (config.cleanup.sweep_interval_seconds <= 0) {
        throw std::invalid_argument("cleanup.sweep_interval_seconds must be positive");
    }
    if (max_chunks <= 0) {
        throw std::invalid_argument("upload.max_chunks_per_session must be positive");
    }
    config.upload.max_chunks_per_session = static_cast<std::uint64_t>(max_chunks);
    return config;
}

ClientConfig LoadClientConfig(const std::string& path) {
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg(
        new Poco::Util::JSONConfiguration(path));

    ClientConfig config;
    config.host = cfg->getString("client.host", "127.0.0.1");
    config.port = cfg->getInt("client.port", 8080);
    const auto chunk_size = cfg->getInt64("client.chunk_size", 5 * 1024 * 1024);
    config.concurrency = cfg->getInt("client.concurrency", 3);
    config.chunk_timeout_seconds = cfg->getInt("client.chunk_timeout_seconds", 0);

    if (IsBlank(config.host)) {
        throw std::invalid_argument("client.host is required");
    }
    if (chunk_size <= 0) {
        throw std::invalid_argument("client.chunk_size must be positive");
    }
    if (config.concurrency <= 0) {
        throw std::invalid_argument("client.concurrency must be positive");
    }
    if (config.chunk_timeout_seconds < 0) {
        throw std::invalid_argument("client.chunk_timeout_seconds must not be negative");
    }
    config.chunk_size = static_cast<std::uint64_t>(chunk_size);
    return config;
}

}  // namespace chunkfs::core
