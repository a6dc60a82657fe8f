#include <exception>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include <Poco/JSON/Object.h>

#include "chunkstore/core/config.h"
#include "chunkstore/core/logger.h"
#include "chunkstore/observability/metrics.h"
#include "chunkstore/storage/local_object_store.h"
#include "chunkstore/upload/buffering_uploader.h"

namespace {

constexpr int kExitUploadFailed = 1;
constexpr int kExitUsage = 2;

std::string GetArgValue(int argc, char** argv, const std::string& key,
                        const std::string& default_value) {
    for (int i = 1; i < argc - 1; ++i) {
        if (argv[i] == key) {
            return argv[i + 1];
        }
    }
    return default_value;
}

bool HasFlag(int argc, char** argv, const std::string& flag) {
    for (int i = 1; i < argc; ++i) {
        if (argv[i] == flag) {
            return true;
        }
    }
    return false;
}

void PrintUsage() {
    std::cerr << "usage: chunkstore_upload --bucket <bucket> --key <key> "
                 "[--config <path>] [--file <path>|-] [--metrics]\n";
}

std::unique_ptr<std::istream> OpenInput(const std::string& file) {
    if (file.empty() || file == "-") {
        // Hand stdin's buffer to a stream the uploader can own without closing std::cin.
        return std::make_unique<std::istream>(std::cin.rdbuf());
    }
    auto in = std::make_unique<std::ifstream>(file, std::ios::binary);
    if (!in->is_open()) {
        return nullptr;
    }
    return in;
}

}  // namespace

int main(int argc, char** argv) {
    const std::string config_path = GetArgValue(argc, argv, "--config", "config/uploader.json");
    const std::string bucket = GetArgValue(argc, argv, "--bucket", "");
    const std::string key = GetArgValue(argc, argv, "--key", "");
    const std::string file = GetArgValue(argc, argv, "--file", "-");
    if (bucket.empty() || key.empty()) {
        PrintUsage();
        return kExitUsage;
    }

    chunkstore::core::Config config;
    try {
        config = chunkstore::core::LoadConfig(config_path);
    } catch (const std::exception& ex) {
        std::cerr << "failed to load config " << config_path << ": " << ex.what() << "\n";
        return kExitUsage;
    }
    chunkstore::core::InitLogging(config.observability.log_level);

    auto input = OpenInput(file);
    if (!input) {
        chunkstore::core::LogError("Cannot open input file " + file);
        return kExitUsage;
    }

    auto store = std::make_shared<chunkstore::storage::LocalObjectStore>(
        config.storage.base_path, config.storage.temp_path);
    chunkstore::upload::BufferingUploader uploader(config.upload.chunk_size_bytes);

    auto result = uploader.Upload(store, bucket, key, std::move(input));
    uploader.WaitForCleanup();
    if (!result.ok()) {
        chunkstore::core::LogError(std::string(chunkstore::core::ToString(result.error().code)) +
                                   ": " + result.error().message);
        return kExitUploadFailed;
    }

    const auto& stored = result.value();
    Poco::JSON::Object::Ptr root = new Poco::JSON::Object();
    root->set("bucket", stored.bucket);
    root->set("name", stored.name);
    root->set("size", static_cast<Poco::UInt64>(stored.size_bytes));
    root->set("etag", stored.etag);
    root->set("compose_limit_hits",
              static_cast<Poco::UInt64>(uploader.NumberOfTimesComposeLimitHit()));
    std::stringstream ss;
    root->stringify(ss);
    std::cout << ss.str() << "\n";

    if (HasFlag(argc, argv, "--metrics")) {
        std::cout << chunkstore::observability::RenderMetrics();
    }
    return 0;
}
