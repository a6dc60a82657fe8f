#include "chunkstore/observability/metrics.h"

#include <atomic>

namespace chunkstore::observability {
namespace {
std::atomic<std::uint64_t> g_uploads_single{0};
std::atomic<std::uint64_t> g_uploads_composed{0};
std::atomic<std::uint64_t> g_uploads_failed{0};
std::atomic<std::uint64_t> g_parts_total{0};
std::atomic<std::uint64_t> g_compose_limit_hits{0};
std::atomic<std::uint64_t> g_cleanup_deleted{0};
std::atomic<std::uint64_t> g_cleanup_failed{0};

std::string Counter(const std::string& name, const std::string& help, std::uint64_t value) {
    return "# HELP " + name + " " + help + "\n" +
           "# TYPE " + name + " counter\n" +
           name + " " + std::to_string(value) + "\n";
}
}  // namespace

void RecordUpload(UploadOutcome outcome, std::uint64_t parts) {
    g_parts_total.fetch_add(parts, std::memory_order_relaxed);
    switch (outcome) {
        case UploadOutcome::kSinglePart:
            g_uploads_single.fetch_add(1, std::memory_order_relaxed);
            break;
        case UploadOutcome::kComposed:
            g_uploads_composed.fetch_add(1, std::memory_order_relaxed);
            break;
        case UploadOutcome::kFailed:
            g_uploads_failed.fetch_add(1, std::memory_order_relaxed);
            break;
    }
}

void RecordComposeLimitHit() {
    g_compose_limit_hits.fetch_add(1, std::memory_order_relaxed);
}

void RecordCleanupDeletion(bool ok) {
    if (ok) {
        g_cleanup_deleted.fetch_add(1, std::memory_order_relaxed);
    } else {
        g_cleanup_failed.fetch_add(1, std::memory_order_relaxed);
    }
}

std::string RenderMetrics() {
    return Counter("chunkstore_uploads_single_part_total",
                   "Uploads stored as a single part without compose",
                   g_uploads_single.load(std::memory_order_relaxed)) +
           Counter("chunkstore_uploads_composed_total",
                   "Uploads finalized with a compose request",
                   g_uploads_composed.load(std::memory_order_relaxed)) +
           Counter("chunkstore_uploads_failed_total", "Uploads that failed",
                   g_uploads_failed.load(std::memory_order_relaxed)) +
           Counter("chunkstore_upload_parts_total", "Parts committed to the object store",
                   g_parts_total.load(std::memory_order_relaxed)) +
           Counter("chunkstore_compose_limit_hits_total",
                   "Uploads that reached the compose source limit",
                   g_compose_limit_hits.load(std::memory_order_relaxed)) +
           Counter("chunkstore_cleanup_deleted_total", "Intermediate parts deleted",
                   g_cleanup_deleted.load(std::memory_order_relaxed)) +
           Counter("chunkstore_cleanup_failed_total", "Intermediate part deletions that failed",
                   g_cleanup_failed.load(std::memory_order_relaxed));
}

}  // namespace chunkstore::observability
