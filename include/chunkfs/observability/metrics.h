#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace chunkfs::observability {

/// @brief Render Prometheus-style metrics for a minimal `/metrics` endpoint.
std::string RenderMetrics();
/// @brief Record a completed HTTP request for metrics.
void RecordRequest(int status_code, long long latency_ms);

void RecordSessionCreated();
void RecordDedupHit();
void RecordChunkReceived(std::uint64_t size_bytes);
void RecordMerge(bool succeeded);
void RecordSessionCancelled();
void RecordOrphansSwept(std::size_t count);
void RecordSessionsExpired(std::size_t count);

}  // namespace chunkfs::observability
