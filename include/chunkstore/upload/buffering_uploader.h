#pragma once

#include <atomic>
#include <cstdint>
#include <istream>
#include <memory>
#include <string>
#include <vector>

#include "chunkstore/core/config.h"
#include "chunkstore/core/result.h"
#include "chunkstore/storage/object_store.h"
#include "chunkstore/upload/cleanup_scheduler.h"

namespace chunkstore::upload {

/// @brief Buffered, chunked upload of streams whose length is not known in advance.
///
/// The stream is cut into parts of ChunkSize() bytes, each stored as its own object, and the
/// parts are composed into the destination at the end. Part 1 is written directly under the
/// destination name, so an upload that fits in one part needs no compose request.
///
/// A compose request accepts at most storage::kComposeRequestLimit sources. When a stream still
/// has data after limit - 1 parts, everything left is written as one final part of unbounded
/// size and NumberOfTimesComposeLimitHit() is incremented; a growing count means the configured
/// chunk size is too small for the objects being stored.
///
/// Parts are uploaded sequentially on the calling thread. Intermediate parts are deleted by a
/// background worker after every upload, successful or not. Upload() may be called from several
/// threads at once.
class BufferingUploader {
public:
    /// @throws std::invalid_argument if chunk_size is zero.
    explicit BufferingUploader(std::uint64_t chunk_size = core::kDefaultChunkSizeBytes);

    /// @brief Upload `contents` to `destination` in `bucket`.
    ///
    /// Takes ownership of `contents` and releases it before returning. Any read, create or
    /// compose failure aborts the upload and is reported as kUploadFailed wrapping the cause.
    core::Result<storage::StoredObject> Upload(std::shared_ptr<storage::ObjectStore> store,
                                               const std::string& bucket,
                                               const std::string& destination,
                                               std::unique_ptr<std::istream> contents);

    std::uint64_t ChunkSize() const { return chunk_size_; }
    /// @brief Number of uploads that had to fall back to an unbounded final part.
    std::uint64_t NumberOfTimesComposeLimitHit() const { return compose_limit_hit_.load(); }
    /// @brief Block until cleanup queued by finished uploads has run.
    void WaitForCleanup() { cleanup_.Flush(); }

private:
    core::Result<storage::StoredObject> WriteParts(storage::ObjectStore& store,
                                                   const std::string& bucket,
                                                   const std::string& destination,
                                                   std::istream& input,
                                                   std::vector<std::string>& chunk_names);

    const std::uint64_t chunk_size_;
    std::atomic<std::uint64_t> compose_limit_hit_{0};
    CleanupScheduler cleanup_;
};

}  // namespace chunkstore::upload
