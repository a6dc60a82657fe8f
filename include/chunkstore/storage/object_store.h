#pragma once

#include <cstddef>
#include <cstdint>
#include <istream>
#include <string>
#include <vector>

#include "chunkstore/core/error.h"
#include "chunkstore/core/result.h"

namespace chunkstore::storage {

/// @brief Hard limit on the number of source objects a single compose request may reference.
constexpr int kComposeRequestLimit = 32;

/// @brief Handle to an object committed to the store.
struct StoredObject {
    std::string bucket;
    std::string name;
    std::string path;
    std::string etag;
    std::uint64_t size_bytes{0};
};

/// @brief Per-request options for bounded creates.
struct CreateOptions {
    /// Keep the payload byte-exact on the wire (no transport-level gzip).
    bool disable_gzip_content{false};
};

/// @brief Abstract object store client: create, compose and delete primitives.
class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    /// @brief Store exactly `length` bytes of `data` starting at `offset` under `key`.
    virtual core::Result<StoredObject> Create(const std::string& bucket, const std::string& key,
                                              const char* data, std::size_t offset,
                                              std::size_t length,
                                              const CreateOptions& options) = 0;
    /// @brief Store the entire remaining content of `data`, length unknown in advance.
    virtual core::Result<StoredObject> CreateFromStream(const std::string& bucket,
                                                        const std::string& key,
                                                        std::istream& data) = 0;
    /// @brief Concatenate `sources`, in order, into a single object at `destination`.
    virtual core::Result<StoredObject> Compose(const std::string& bucket,
                                               const std::vector<std::string>& sources,
                                               const std::string& destination) = 0;
    /// @brief Remove `key`. Removing an absent key succeeds.
    virtual core::Result<void> Delete(const std::string& bucket, const std::string& key) = 0;
};

}  // namespace chunkstore::storage
