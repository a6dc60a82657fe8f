#include "chunkstore/upload/cleanup_scheduler.h"

#include <exception>
#include <future>
#include <utility>

#include <boost/asio/post.hpp>

#include "chunkstore/core/logger.h"
#include "chunkstore/observability/metrics.h"
#include "chunkstore/upload/chunk_namer.h"

namespace chunkstore::upload {

CleanupScheduler::CleanupScheduler() = default;

CleanupScheduler::~CleanupScheduler() { Shutdown(); }

void CleanupScheduler::Submit(std::shared_ptr<storage::ObjectStore> store, std::string bucket,
                              std::string destination, std::vector<std::string> part_names) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopped_) {
        core::LogError("Cleanup scheduler stopped; dropping " +
                       std::to_string(part_names.size()) + " part(s) in bucket " + bucket);
        return;
    }
    if (!store) {
        core::LogError("Cleanup submitted without an object store for bucket " + bucket);
        return;
    }
    boost::asio::post(pool_, [this, store = std::move(store), bucket = std::move(bucket),
                              destination = std::move(destination),
                              part_names = std::move(part_names)]() {
        RunBatch(*store, bucket, destination, part_names);
    });
}

void CleanupScheduler::Flush() {
    std::future<void> done;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) {
            return;
        }
        auto barrier = std::make_shared<std::promise<void>>();
        done = barrier->get_future();
        boost::asio::post(pool_, [barrier]() { barrier->set_value(); });
    }
    done.wait();
}

void CleanupScheduler::Shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) {
            return;
        }
        stopped_ = true;
    }
    // No new work can be posted now; join returns once the queue is drained.
    pool_.join();
}

void CleanupScheduler::RunBatch(storage::ObjectStore& store, const std::string& bucket,
                                const std::string& destination,
                                const std::vector<std::string>& part_names) {
    for (const auto& name : part_names) {
        if (!IsChunkPartName(destination, name)) {
            continue;
        }
        bool deleted = false;
        try {
            auto result = store.Delete(bucket, name);
            if (result.ok()) {
                deleted = true;
            } else {
                core::LogError("Failed to delete chunk " + name + " in bucket " + bucket + ": " +
                               result.error().message);
            }
        } catch (const std::exception& ex) {
            core::LogError("Failed to delete chunk " + name + " in bucket " + bucket + ": " +
                           ex.what());
        }
        if (deleted) {
            deleted_.fetch_add(1);
            core::LogDebug("Deleted chunk " + name + " in bucket " + bucket);
        } else {
            failed_.fetch_add(1);
        }
        observability::RecordCleanupDeletion(deleted);
    }
}

}  // namespace chunkstore::upload
