#pragma once

#include <cstddef>
#include <string>

namespace chunkstore::core {

void InitLogging(const std::string& level);
void LogInfo(const std::string& message);
void LogError(const std::string& message);
void LogDebug(const std::string& message);
/// @brief Log a structured JSON line for a finished upload.
void LogUpload(const std::string& bucket,
               const std::string& destination,
               std::size_t parts,
               bool composed,
               const std::string& status,
               long long latency_ms);

}  // namespace chunkstore::core
