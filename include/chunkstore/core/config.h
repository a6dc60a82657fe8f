#pragma once

#include <cstdint>
#include <string>

namespace chunkstore::core {

/// @brief Default size of each uploaded part (5 MiB).
constexpr std::uint64_t kDefaultChunkSizeBytes = 5242880;

/// @brief Config key controlling the size of each uploaded part.
constexpr const char* kChunkSizeProperty = "upload.chunk_size_bytes";

/// @brief Chunked upload tuning.
struct UploadConfig {
    std::uint64_t chunk_size_bytes{kDefaultChunkSizeBytes};
};

/// @brief Storage configuration for the local filesystem object store.
struct StorageConfig {
    std::string base_path{"data"};
    std::string temp_path{"data/tmp"};
};

/// @brief Observability settings (logging).
struct ObservabilityConfig {
    std::string log_level{"information"};
};

/// @brief Top-level configuration for chunkstore.
struct Config {
    UploadConfig upload;
    StorageConfig storage;
    ObservabilityConfig observability;
};

/// @brief Load uploader configuration from a JSON file.
Config LoadConfig(const std::string& path);

}  // namespace chunkstore::core
