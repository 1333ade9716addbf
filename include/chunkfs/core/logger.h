#pragma once

#include <string>

namespace chunkfs::core {

/// @brief Poco priority for a level name ("debug", "information", "warning", ...).
/// Unknown names fall back to information.
int ParseLogLevel(const std::string& level);

/// @brief Route the `chunkfs` logger hierarchy to the console at `level`.
void InitLogging(const std::string& level);
void LogInfo(const std::string& message);
void LogWarning(const std::string& message);
void LogError(const std::string& message);
void LogDebug(const std::string& message);

/// @brief One JSON line per HTTP exchange on `chunkfs.http`; 5xx responses log as errors.
void LogRequest(const std::string& request_id,
                const std::string& method,
                const std::string& target,
                const std::string& remote,
                int status,
                long long latency_ms);

/// @brief One JSON line per session lifecycle event on `chunkfs.upload`
/// (created, dedup_hit, merged, cancelled, expired, orphan_swept).
void LogSessionEvent(const std::string& event,
                     const std::string& session_id,
                     const std::string& detail);

}  // namespace chunkfs::core
