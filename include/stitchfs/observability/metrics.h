#pragma once

#include <cstdint>
#include <string>

namespace stitchfs::observability {

/// @brief Render Prometheus-style metrics for a minimal `/metrics` endpoint.
std::string RenderMetrics();
/// @brief Record a completed HTTP request for metrics.
void RecordRequest(int status_code, long long latency_ms);
void RecordChunkReceived(std::uint64_t bytes);
void RecordFinalize(bool succeeded);
/// @brief A staging directory could not be removed and needs operator attention.
void RecordCleanupWarning();
void RecordSessionsReaped(std::uint64_t count);

}  // namespace stitchfs::observability
