#include "stitchfs/observability/metrics.h"

#include <atomic>

namespace stitchfs::observability {
namespace {
std::atomic<std::uint64_t> g_total_requests{0};
std::atomic<std::uint64_t> g_requests_2xx{0};
std::atomic<std::uint64_t> g_requests_4xx{0};
std::atomic<std::uint64_t> g_requests_5xx{0};
std::atomic<std::uint64_t> g_latency_ms_total{0};
std::atomic<std::uint64_t> g_chunks_received{0};
std::atomic<std::uint64_t> g_chunk_bytes_received{0};
std::atomic<std::uint64_t> g_finalize_succeeded{0};
std::atomic<std::uint64_t> g_finalize_failed{0};
std::atomic<std::uint64_t> g_cleanup_warnings{0};
std::atomic<std::uint64_t> g_sessions_reaped{0};

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

void RecordChunkReceived(std::uint64_t bytes) {
    g_chunks_received.fetch_add(1, std::memory_order_relaxed);
    g_chunk_bytes_received.fetch_add(bytes, std::memory_order_relaxed);
}

void RecordFinalize(bool succeeded) {
    if (succeeded) {
        g_finalize_succeeded.fetch_add(1, std::memory_order_relaxed);
    } else {
        g_finalize_failed.fetch_add(1, std::memory_order_relaxed);
    }
}

void RecordCleanupWarning() { g_cleanup_warnings.fetch_add(1, std::memory_order_relaxed); }

void RecordSessionsReaped(std::uint64_t count) {
    g_sessions_reaped.fetch_add(count, std::memory_order_relaxed);
}

std::string RenderMetrics() {
    return "# HELP stitchfs_up 1 if server is up\n"
           "# TYPE stitchfs_up gauge\n"
           "stitchfs_up 1\n" +
           Counter("stitchfs_http_requests_total", "Total HTTP requests processed",
                   g_total_requests) +
           Counter("stitchfs_http_requests_2xx", "Total 2xx responses", g_requests_2xx) +
           Counter("stitchfs_http_requests_4xx", "Total 4xx responses", g_requests_4xx) +
           Counter("stitchfs_http_requests_5xx", "Total 5xx responses", g_requests_5xx) +
           Counter("stitchfs_http_request_latency_ms_sum", "Sum of request latencies in ms",
                   g_latency_ms_total) +
           Counter("stitchfs_chunks_received_total", "Chunks accepted into staging",
                   g_chunks_received) +
           Counter("stitchfs_chunk_bytes_received_total", "Chunk payload bytes accepted",
                   g_chunk_bytes_received) +
           Counter("stitchfs_finalize_succeeded_total", "Sessions assembled successfully",
                   g_finalize_succeeded) +
           Counter("stitchfs_finalize_failed_total", "Assemblies that failed after starting",
                   g_finalize_failed) +
           Counter("stitchfs_cleanup_warnings_total",
                   "Staging directories that could not be removed", g_cleanup_warnings) +
           Counter("stitchfs_sessions_reaped_total", "Abandoned sessions removed by the janitor",
                   g_sessions_reaped);
}

}  // namespace stitchfs::observability
