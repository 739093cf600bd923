#pragma once

#include <string>

namespace stitchfs::core {

/// @brief Maps a config level name ("trace" ... "fatal") to a Poco priority.
/// @throws std::invalid_argument for unknown names.
int ParseLogLevel(const std::string& level);
/// @brief Routes the "stitchfs" logger to the console at the given level.
void InitLogging(const std::string& level);

void LogInfo(const std::string& message);
/// @brief Operator-attention events that did not fail the request (e.g. orphaned staging data).
void LogWarning(const std::string& message);
void LogError(const std::string& message);
void LogDebug(const std::string& message);
/// @brief One JSON line per HTTP request.
void LogRequest(const std::string& request_id,
                const std::string& method,
                const std::string& target,
                const std::string& remote,
                int status,
                long long latency_ms);

}  // namespace stitchfs::core
