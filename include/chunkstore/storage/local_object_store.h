#pragma once

#include <string>
#include <vector>

#include "chunkstore/storage/object_store.h"

namespace chunkstore::storage {

/// @brief Local filesystem object store with atomic writes and server-side compose.
class LocalObjectStore : public ObjectStore {
public:
    LocalObjectStore(std::string base_path, std::string temp_path);

    core::Result<StoredObject> Create(const std::string& bucket, const std::string& key,
                                      const char* data, std::size_t offset, std::size_t length,
                                      const CreateOptions& options) override;
    core::Result<StoredObject> CreateFromStream(const std::string& bucket,
                                                const std::string& key,
                                                std::istream& data) override;
    core::Result<StoredObject> Compose(const std::string& bucket,
                                       const std::vector<std::string>& sources,
                                       const std::string& destination) override;
    core::Result<void> Delete(const std::string& bucket, const std::string& key) override;

    core::Result<StoredObject> Stat(const std::string& bucket, const std::string& key) const;

    const std::string& base_path() const { return base_path_; }
    const std::string& temp_path() const { return temp_path_; }

    static bool IsSafeName(const std::string& name);
    /// @brief A key is one or more safe names joined by '/'.
    static bool IsSafeKey(const std::string& key);
    static std::string BuildObjectPath(const std::string& base_path, const std::string& bucket,
                                       const std::string& key);

private:
    class TempObject;

    core::Result<StoredObject> Commit(TempObject& temp, const std::string& bucket,
                                      const std::string& key);

    std::string base_path_;
    std::string temp_path_;
};

}  // namespace chunkstore::storage
