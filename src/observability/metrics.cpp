#include "chunkfs/observability/metrics.h"

#include <atomic>

namespace chunkfs::observability {
namespace {
std::atomic<std::uint64_t> g_total_requests{0};
std::atomic<std::uint64_t> g_requests_2xx{0};
std::atomic<std::uint64_t> g_requests_4xx{0};
std::atomic<std::uint64_t> g_requests_5xx{0};
std::atomic<std::uint64_t> g_latency_ms_total{0};

std::atomic<std::uint64_t> g_sessions_created{0};
std::atomic<std::uint64_t> g_dedup_hits{0};
std::atomic<std::uint64_t> g_chunks_received{0};
std::atomic<std::uint64_t> g_chunk_bytes_received{0};
std::atomic<std::uint64_t> g_merges_succeeded{0};
std::atomic<std::uint64_t> g_merges_failed{0};
std::atomic<std::uint64_t> g_sessions_cancelled{0};
std::atomic<std::uint64_t> g_orphans_swept{0};
std::atomic<std::uint64_t> g_sessions_expired{0};

std::string Counter(const std::string& name, const std::string& help,
                    const std::atomic<std::uint64_t>& value) {
    return "# HELP " + name + " " + help + "\n"
           "# TYPE " + name + " counter\n" +
           name + " " + std::to_string(value.load(std::memory_order_relaxed)) + "\n";
}
}  // namespace

void RecordRequest(int status_code, long long latency_ms) {
    g_total_requests.fetch_add(1, std::memory_order_relaxed);
    g_latency_ms_total.fetch_add(static_cast<std::uint64_t>(latency_ms),
                                 std::memory_order_relaxed);
    if (status_code >= 200 && status_code < 300) {
        g_requests_2xx.fetch_add(1, std::memory_order_relaxed);
    } else if (status_code >= 400 && status_code < 500) {
        g_requests_4xx.fetch_add(1, std::memory_order_relaxed);
    } else if (status_code >= 500) {
        g_requests_5xx.fetch_add(1, std::memory_order_relaxed);
    }
}

void RecordSessionCreated() { g_sessions_created.fetch_add(1, std::memory_order_relaxed); }
void RecordDedupHit() { g_dedup_hits.fetch_add(1, std::memory_order_relaxed); }

void RecordChunkReceived(std::uint64_t size_bytes) {
    g_chunks_received.fetch_add(1, std::memory_order_relaxed);
    g_chunk_bytes_received.fetch_add(size_bytes, std::memory_order_relaxed);
}

void RecordMerge(bool succeeded) {
    if (succeeded) {
        g_merges_succeeded.fetch_add(1, std::memory_order_relaxed);
    } else {
        g_merges_failed.fetch_add(1, std::memory_order_relaxed);
    }
}

void RecordSessionCancelled() { g_sessions_cancelled.fetch_add(1, std::memory_order_relaxed); }

void RecordOrphansSwept(std::size_t count) {
    g_orphans_swept.fetch_add(static_cast<std::uint64_t>(count), std::memory_order_relaxed);
}

void RecordSessionsExpired(std::size_t count) {
    g_sessions_expired.fetch_add(static_cast<std::uint64_t>(count), std::memory_order_relaxed);
}

std::string RenderMetrics() {
    return "# HELP chunkfs_up 1 if server is up\n"
           "# TYPE chunkfs_up gauge\n"
           "chunkfs_up 1\n" +
           Counter("chunkfs_http_requests_total", "Total HTTP requests processed",
                   g_total_requests) +
           Counter("chunkfs_http_requests_2xx", "Total 2xx responses", g_requests_2xx) +
           Counter("chunkfs_http_requests_4xx", "Total 4xx responses", g_requests_4xx) +
           Counter("chunkfs_http_requests_5xx", "Total 5xx responses", g_requests_5xx) +
           Counter("chunkfs_http_request_latency_ms_sum", "Sum of request latencies in ms",
                   g_latency_ms_total) +
           Counter("chunkfs_upload_sessions_created_total", "Upload sessions created",
                   g_sessions_created) +
           Counter("chunkfs_upload_dedup_hits_total", "Init requests answered from the archive",
                   g_dedup_hits) +
           Counter("chunkfs_upload_chunks_received_total", "Chunks durably staged",
                   g_chunks_received) +
           Counter("chunkfs_upload_chunk_bytes_received_total", "Bytes of staged chunks",
                   g_chunk_bytes_received) +
           Counter("chunkfs_upload_merges_succeeded_total", "Merges archived",
                   g_merges_succeeded) +
           Counter("chunkfs_upload_merges_failed_total", "Merge attempts that failed",
                   g_merges_failed) +
           Counter("chunkfs_upload_sessions_cancelled_total", "Sessions cancelled",
                   g_sessions_cancelled) +
           Counter("chunkfs_upload_sessions_expired_total", "Idle sessions expired",
                   g_sessions_expired) +
           Counter("chunkfs_staging_orphans_swept_total", "Orphan staging areas removed",
                   g_orphans_swept);
}

}  // namespace chunkfs::observability
