#pragma once

#include <string>

namespace chunkstore::upload {

/// @brief Marker separating a destination key from a part index, e.g. 'dir/blob.bytes.chunk2'.
constexpr const char* kChunkNamePart = ".chunk";

/// @brief Name under which part `index` (1-based) of `destination` is stored.
///
/// Part 1 is stored directly under `destination`, so a single-part upload needs no rename or
/// copy. Every later part gets `destination` + ".chunk" + index.
/// @throws std::invalid_argument if index < 1.
std::string ChunkName(const std::string& destination, int index);

/// @brief True if `name` is an intermediate part of `destination`, i.e. ChunkName(destination, i)
/// for some i >= 2. The destination itself never qualifies, even when it contains the marker.
bool IsChunkPartName(const std::string& destination, const std::string& name);

}  // namespace chunkstore::upload
