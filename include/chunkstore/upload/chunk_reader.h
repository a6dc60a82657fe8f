#pragma once

#include <cstddef>
#include <istream>

#include "chunkstore/core/error.h"
#include "chunkstore/core/result.h"

namespace chunkstore::upload {

/// @brief Fill `buffer` with up to `capacity` bytes from `input`.
///
/// Keeps reading across short reads until `capacity` bytes are collected or the stream reaches
/// end-of-stream. Returns the number of bytes obtained; 0 only when the stream was already
/// exhausted. A failing stream yields kIoError instead of a short count.
core::Result<std::size_t> ReadChunk(std::istream& input, char* buffer, std::size_t capacity);

/// @brief True if at least one more byte can be read from `input`; kIoError if the peek fails.
core::Result<bool> HasRemaining(std::istream& input);

}  // namespace chunkstore::upload
