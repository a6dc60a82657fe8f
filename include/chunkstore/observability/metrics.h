#pragma once

#include <cstdint>
#include <string>

namespace chunkstore::observability {

/// @brief How a finished upload ended.
enum class UploadOutcome {
    kSinglePart,
    kComposed,
    kFailed,
};

/// @brief Render Prometheus-style metrics for the uploader counters.
std::string RenderMetrics();
/// @brief Record a finished upload and the number of parts it committed.
void RecordUpload(UploadOutcome outcome, std::uint64_t parts);
/// @brief Record an upload that was forced into the unbounded final part.
void RecordComposeLimitHit();
/// @brief Record the result of one deferred part deletion.
void RecordCleanupDeletion(bool ok);

}  // namespace chunkstore::observability
