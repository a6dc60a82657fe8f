#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <boost/asio/thread_pool.hpp>

#include "chunkstore/storage/object_store.h"

namespace chunkstore::upload {

/// @brief Deletes intermediate part objects off-thread.
///
/// A single worker drains submitted batches in submission order. Only intermediate part names of
/// the batch's destination are deleted, so the part stored under the destination is never touched.
/// Deletion is best-effort: failures are logged and counted, never retried or reported back.
class CleanupScheduler {
public:
    CleanupScheduler();
    ~CleanupScheduler();

    CleanupScheduler(const CleanupScheduler&) = delete;
    CleanupScheduler& operator=(const CleanupScheduler&) = delete;

    /// @brief Queue deletion of the intermediate parts of `destination` among `part_names`;
    /// never blocks.
    void Submit(std::shared_ptr<storage::ObjectStore> store, std::string bucket,
                std::string destination, std::vector<std::string> part_names);
    /// @brief Block until every batch submitted before this call has been processed.
    void Flush();
    /// @brief Drain pending batches and stop the worker. Later submissions are dropped.
    void Shutdown();

    std::uint64_t deleted_count() const { return deleted_.load(); }
    std::uint64_t failed_count() const { return failed_.load(); }

private:
    void RunBatch(storage::ObjectStore& store, const std::string& bucket,
                  const std::string& destination, const std::vector<std::string>& part_names);

    boost::asio::thread_pool pool_{1};
    std::mutex mutex_;
    bool stopped_{false};
    std::atomic<std::uint64_t> deleted_{0};
    std::atomic<std::uint64_t> failed_{0};
};

}  // namespace chunkstore::upload
