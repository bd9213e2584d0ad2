#pragma once

#include <string>

namespace flashdrop::core {

/// @brief Poco priority for a level name ("debug", "information", "warning", ...).
/// @throws std::invalid_argument for names Poco does not know.
int ParseLogLevel(const std::string& level);
void InitLogging(const std::string& level);
void LogInfo(const std::string& message);
void LogWarning(const std::string& message);
void LogError(const std::string& message);
void LogDebug(const std::string& message);
/// @brief Log a structured JSON line for HTTP requests.
void LogRequest(const std::string& request_id,
                const std::string& method,
                const std::string& target,
                const std::string& remote,
                int status,
                long long latency_ms);

}  // namespace flashdrop::core
