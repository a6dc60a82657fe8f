#include "chunkstore/core/config.h"

#include <cctype>
#include <stdexcept>

#include <Poco/AutoPtr.h>
#include <Poco/Util/JSONConfiguration.h>

namespace chunkstore::core {

namespace {

bool IsBlank(const std::string& value) {
    for (char c : value) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

}  // namespace

Config LoadConfig(const std::string& path) {
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg(
        new Poco::Util::JSONConfiguration(path));

    Config config;
    const auto chunk_size = cfg->getInt64(
        kChunkSizeProperty, static_cast<Poco::Int64>(kDefaultChunkSizeBytes));
    if (chunk_size <= 0) {
        throw std::invalid_argument(std::string(kChunkSizeProperty) + " must be positive");
    }
    config.upload.chunk_size_bytes = static_cast<std::uint64_t>(chunk_size);

    config.storage.base_path = cfg->getString("storage.base_path", "data");
    config.storage.temp_path = cfg->getString("storage.temp_path", "data/tmp");
    if (IsBlank(config.storage.base_path)) {
        throw std::invalid_argument("storage.base_path must not be empty");
    }
    if (IsBlank(config.storage.temp_path)) {
        throw std::invalid_argument("storage.temp_path must not be empty");
    }

    config.observability.log_level = cfg->getString("observability.log_level", "information");
    return config;
}

}  // namespace chunkstore::core
