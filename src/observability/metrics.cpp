#include "flashdrop/observability/metrics.h"

#include <atomic>

namespace flashdrop::observability {
namespace {
std::atomic<std::uint64_t> g_total_requests{0};
std::atomic<std::uint64_t> g_requests_2xx{0};
std::atomic<std::uint64_t> g_requests_4xx{0};
std::atomic<std::uint64_t> g_requests_5xx{0};
std::atomic<std::uint64_t> g_latency_ms_total{0};
std::atomic<std::uint64_t> g_chunks_received{0};
std::atomic<std::uint64_t> g_chunk_bytes_received{0};
std::atomic<std::uint64_t> g_uploads_completed{0};
std::atomic<std::uint64_t> g_bytes_stored{0};
std::atomic<std::uint64_t> g_reaper_cycles{0};
std::atomic<std::uint64_t> g_reaper_failures{0};
std::atomic<std::uint64_t> g_files_reclaimed{0};
std::atomic<std::uint64_t> g_orphan_chunks_removed{0};
std::atomic<std::uint64_t> g_sessions_dropped{0};

std::string Counter(const char* name, const char* help, const std::atomic<std::uint64_t>& value) {
    return std::string("# HELP ") + name + " " + help + "\n# TYPE " + name + " counter\n" + name +
           " " + std::to_string(value.load(std::memory_order_relaxed)) + "\n";
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

void RecordUploadCompleted(std::uint64_t bytes) {
    g_uploads_completed.fetch_add(1, std::memory_order_relaxed);
    g_bytes_stored.fetch_add(bytes, std::memory_order_relaxed);
}

void RecordReaperCycle(std::size_t files_reclaimed, std::size_t chunks_removed,
                       std::size_t sessions_dropped, bool failed) {
    g_reaper_cycles.fetch_add(1, std::memory_order_relaxed);
    if (failed) {
        g_reaper_failures.fetch_add(1, std::memory_order_relaxed);
    }
    g_files_reclaimed.fetch_add(files_reclaimed, std::memory_order_relaxed);
    g_orphan_chunks_removed.fetch_add(chunks_removed, std::memory_order_relaxed);
    g_sessions_dropped.fetch_add(sessions_dropped, std::memory_order_relaxed);
}

std::string RenderMetrics() {
    return "# HELP flashdrop_up 1 if server is up\n"
           "# TYPE flashdrop_up gauge\n"
           "flashdrop_up 1\n" +
           Counter("flashdrop_http_requests_total", "Total HTTP requests processed",
                   g_total_requests) +
           Counter("flashdrop_http_requests_2xx", "Total 2xx responses", g_requests_2xx) +
           Counter("flashdrop_http_requests_4xx", "Total 4xx responses", g_requests_4xx) +
           Counter("flashdrop_http_requests_5xx", "Total 5xx responses", g_requests_5xx) +
           Counter("flashdrop_http_request_latency_ms_sum", "Sum of request latencies in ms",
                   g_latency_ms_total) +
           Counter("flashdrop_chunks_received_total", "Chunks accepted", g_chunks_received) +
           Counter("flashdrop_chunk_bytes_received_total", "Chunk bytes accepted",
                   g_chunk_bytes_received) +
           Counter("flashdrop_uploads_completed_total", "Uploads assembled", g_uploads_completed) +
           Counter("flashdrop_bytes_stored_total", "Bytes of assembled objects", g_bytes_stored) +
           Counter("flashdrop_reaper_cycles_total", "Reaper sweeps run", g_reaper_cycles) +
           Counter("flashdrop_reaper_cycle_failures_total", "Reaper sweeps that threw",
                   g_reaper_failures) +
           Counter("flashdrop_files_reclaimed_total", "Expired files deleted", g_files_reclaimed) +
           Counter("flashdrop_orphan_chunks_removed_total", "Stale chunk files deleted",
                   g_orphan_chunks_removed) +
           Counter("flashdrop_sessions_dropped_total", "Abandoned upload sessions dropped",
                   g_sessions_dropped);
}

}  // namespace flashdrop::observability
