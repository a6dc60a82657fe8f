#include "chunkstore/upload/buffering_uploader.h"

#include <chrono>
#include <exception>
#include <limits>
#include <stdexcept>
#include <utility>
#include <variant>

#include "chunkstore/core/logger.h"
#include "chunkstore/observability/metrics.h"
#include "chunkstore/upload/chunk_namer.h"
#include "chunkstore/upload/chunk_reader.h"

namespace chunkstore::upload {

namespace {

// What has been committed so far decides how the upload is finalized.
struct NoPart {};
struct SinglePart {
    storage::StoredObject object;
};
struct MultipleParts {};
using PartState = std::variant<NoPart, SinglePart, MultipleParts>;

/// Hands the committed part names to the cleanup worker when the upload scope ends.
class ScopedCleanup {
public:
    ScopedCleanup(CleanupScheduler& scheduler, std::shared_ptr<storage::ObjectStore> store,
                  const std::string& bucket, const std::string& destination,
                  const std::vector<std::string>& chunk_names)
        : scheduler_(scheduler), store_(std::move(store)), bucket_(bucket),
          destination_(destination), chunk_names_(chunk_names) {}

    ~ScopedCleanup() {
        try {
            scheduler_.Submit(store_, bucket_, destination_, chunk_names_);
        } catch (const std::exception& ex) {
            core::LogError("Failed to schedule chunk cleanup for bucket " + bucket_ + ": " +
                           ex.what());
        }
    }

    ScopedCleanup(const ScopedCleanup&) = delete;
    ScopedCleanup& operator=(const ScopedCleanup&) = delete;

private:
    CleanupScheduler& scheduler_;
    std::shared_ptr<storage::ObjectStore> store_;
    const std::string& bucket_;
    const std::string& destination_;
    const std::vector<std::string>& chunk_names_;
};

core::Error UploadFailure(const std::string& cause) {
    return core::Error{core::ErrorCode::kUploadFailed, "Error uploading blob: " + cause};
}

std::uint64_t ValidateChunkSize(std::uint64_t chunk_size) {
    if (chunk_size == 0) {
        throw std::invalid_argument(std::string(core::kChunkSizeProperty) + " must be positive");
    }
    if (chunk_size > std::numeric_limits<std::size_t>::max()) {
        throw std::invalid_argument(std::string(core::kChunkSizeProperty) +
                                    " does not fit in memory: " + std::to_string(chunk_size));
    }
    return chunk_size;
}

}  // namespace

BufferingUploader::BufferingUploader(std::uint64_t chunk_size)
    : chunk_size_(ValidateChunkSize(chunk_size)) {}

core::Result<storage::StoredObject> BufferingUploader::Upload(
    std::shared_ptr<storage::ObjectStore> store, const std::string& bucket,
    const std::string& destination, std::unique_ptr<std::istream> contents) {
    if (!store) {
        return core::Error{core::ErrorCode::kInvalidArgument, "object store is required"};
    }
    if (!contents) {
        return core::Error{core::ErrorCode::kInvalidArgument, "content stream is required"};
    }

    const auto started = std::chrono::steady_clock::now();
    core::LogDebug("Starting multipart upload for destination " + destination + " in bucket " +
                   bucket);

    // Bucket-relative names of the committed parts, in order of composition.
    std::vector<std::string> chunk_names;
    core::Result<storage::StoredObject> outcome =
        core::Error{core::ErrorCode::kInternal, "upload did not run"};
    {
        ScopedCleanup cleanup(cleanup_, store, bucket, destination, chunk_names);
        try {
            outcome = WriteParts(*store, bucket, destination, *contents, chunk_names);
        } catch (const std::exception& ex) {
            outcome = core::Error{core::ErrorCode::kInternal, ex.what()};
        }
        contents.reset();
    }

    const auto latency_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                                std::chrono::steady_clock::now() - started)
                                .count();
    const bool composed = chunk_names.size() > 1;
    if (!outcome.ok()) {
        core::LogError("Upload of " + destination + " in bucket " + bucket + " failed after " +
                       std::to_string(chunk_names.size()) + " part(s): " +
                       outcome.error().message);
        observability::RecordUpload(observability::UploadOutcome::kFailed, chunk_names.size());
        core::LogUpload(bucket, destination, chunk_names.size(), composed, "failed", latency_ms);
        return UploadFailure(outcome.error().message);
    }

    observability::RecordUpload(composed ? observability::UploadOutcome::kComposed
                                         : observability::UploadOutcome::kSinglePart,
                                chunk_names.size());
    core::LogUpload(bucket, destination, chunk_names.size(), composed, "ok", latency_ms);
    return outcome;
}

core::Result<storage::StoredObject> BufferingUploader::WriteParts(
    storage::ObjectStore& store, const std::string& bucket, const std::string& destination,
    std::istream& input, std::vector<std::string>& chunk_names) {
    // One buffer serves every bounded part; the unbounded final part streams directly.
    std::vector<char> buffer(static_cast<std::size_t>(chunk_size_));
    storage::CreateOptions options;
    options.disable_gzip_content = true;
    PartState state = NoPart{};

    // Part 1 always exists, even for an empty stream, and lands directly on the destination.
    for (int part_number = 1; part_number < storage::kComposeRequestLimit; ++part_number) {
        auto length = ReadChunk(input, buffer.data(), buffer.size());
        if (!length.ok()) {
            return length.error();
        }
        if (part_number > 1 && length.value() == 0) {
            break;
        }

        const auto chunk_name = ChunkName(destination, part_number);
        core::LogDebug("Uploading chunk " + std::to_string(part_number) + " for " + destination +
                       " of " + std::to_string(length.value()) + " bytes");
        auto created =
            store.Create(bucket, chunk_name, buffer.data(), 0, length.value(), options);
        if (!created.ok()) {
            return created.error();
        }
        chunk_names.push_back(chunk_name);
        if (part_number == 1) {
            state = SinglePart{std::move(created.value())};
        } else {
            state = MultipleParts{};
        }

        if (part_number == storage::kComposeRequestLimit - 1) {
            auto remaining = HasRemaining(input);
            if (!remaining.ok()) {
                return remaining.error();
            }
            if (!remaining.value()) {
                break;
            }

            core::LogDebug("Upload for " + destination +
                           " has hit multipart-compose limits; consider increasing '" +
                           core::kChunkSizeProperty + "' beyond current value of " +
                           std::to_string(chunk_size_));
            compose_limit_hit_.fetch_add(1);
            observability::RecordComposeLimitHit();

            const auto final_chunk_name =
                ChunkName(destination, storage::kComposeRequestLimit);
            core::LogDebug("Uploading final chunk " +
                           std::to_string(storage::kComposeRequestLimit) + " for " + destination +
                           " of unknown remaining bytes");
            // The remaining length is unknown, so this part cannot be bounded by the chunk size.
            auto last = store.CreateFromStream(bucket, final_chunk_name, input);
            if (!last.ok()) {
                return last.error();
            }
            chunk_names.push_back(final_chunk_name);
            state = MultipleParts{};
        }
    }

    if (auto* single = std::get_if<SinglePart>(&state)) {
        return single->object;
    }
    if (std::holds_alternative<NoPart>(state)) {
        return core::Error{core::ErrorCode::kInternal, "no part was written for " + destination};
    }

    auto composed = store.Compose(bucket, chunk_names, destination);
    if (!composed.ok()) {
        return composed.error();
    }
    core::LogDebug("Multipart upload of " + destination + " complete");
    return composed;
}

}  // namespace chunkstore::upload
