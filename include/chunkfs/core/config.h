#pragma once

#include <cstdint>
#include <string>

namespace chunkfs::core {

/// @brief Request/connection limits for the HTTP server.
struct LimitsConfig {
    std::uint64_t max_body_bytes{268435456};
};

/// @brief HTTP server configuration (bind address, worker threads, limits).
struct ServerConfig {
    std::string host{"0.0.0.0"};
    int port{8080};
    int threads{4};
    LimitsConfig limits;
};

/// @brief Filesystem roots: per-session staging directories and the content-addressed archive.
struct StorageConfig {
    std::string staging_path{"data/staging"};
    std::string archive_path{"data/uploads"};
};

/// @brief Upload session behaviour.
struct UploadConfig {
    // Compare the SHA-256 of the merged file with the declared content hash.
    bool verify_content_hash{true};
    // Sessions idle for longer than this are cancelled by the cleanup job; 0 disables.
    int session_idle_ttl_seconds{0};
    // Upper bound on ceil(fileSize / chunkSize) accepted at init.
    std::uint64_t max_chunks_per_session{1048576};
};

/// @brief Background reconciliation of staging directories against live sessions.
struct CleanupConfig {
    bool enabled{true};
    int sweep_interval_seconds{1800};
};

/// @brief Observability settings (logging).
struct ObservabilityConfig {
    std::string log_level{"information"};
};

/// @brief Top-level server configuration.
struct Config {
    ServerConfig server;
    StorageConfig storage;
    UploadConfig upload;
    CleanupConfig cleanup;
    ObservabilityConfig observability;
};

/// @brief Settings for the chunked upload client.
struct ClientConfig {
    std::string host{"127.0.0.1"};
    int port{8080};
    std::uint64_t chunk_size{5 * 1024 * 1024};
    int concurrency{3};
    // Per-chunk transfer timeout; 0 means no timeout.
    int chunk_timeout_seconds{0};
};

/// @brief Load server configuration from a JSON file.
Config LoadConfig(const std::string& path);
/// @brief Load client configuration from a JSON file.
ClientConfig LoadClientConfig(const std::string& path);

}  // namespace chunkfs::core
