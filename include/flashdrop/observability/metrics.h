#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace flashdrop::observability {

/// @brief Render Prometheus-style metrics for a minimal `/metrics` endpoint.
std::string RenderMetrics();
/// @brief Record a completed HTTP request for metrics.
void RecordRequest(int status_code, long long latency_ms);
void RecordChunkReceived(std::uint64_t bytes);
void RecordUploadCompleted(std::uint64_t bytes);
/// @brief Record the outcome of one reaper sweep.
void RecordReaperCycle(std::size_t files_reclaimed, std::size_t chunks_removed,
                       std::size_t sessions_dropped, bool failed);

}  // namespace flashdrop::observability
