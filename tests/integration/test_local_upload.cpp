#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <sstream>
#include <string>

#include <gtest/gtest.h>
#include <Poco/UUIDGenerator.h>

#include "chunkstore/storage/local_object_store.h"
#include "chunkstore/upload/buffering_uploader.h"

namespace {

std::string Payload(std::size_t length) {
    std::string payload(length, '\0');
    for (std::size_t i = 0; i < length; ++i) {
        payload[i] = static_cast<char>(i * 31 % 251);
    }
    return payload;
}

class LocalUploadTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = std::filesystem::temp_directory_path() /
                ("chunkstore_upload_" + Poco::UUIDGenerator().createOne().toString());
        store_ = std::make_shared<chunkstore::storage::LocalObjectStore>(
            (root_ / "data").string(), (root_ / "tmp").string());
    }

    void TearDown() override { std::filesystem::remove_all(root_); }

    std::filesystem::path ObjectPath(const std::string& key) const {
        return chunkstore::storage::LocalObjectStore::BuildObjectPath(store_->base_path(),
                                                                      "bucket", key);
    }

    std::string ReadObject(const std::string& key) const {
        std::ifstream in(ObjectPath(key), std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    std::filesystem::path root_;
    std::shared_ptr<chunkstore::storage::LocalObjectStore> store_;
};

}  // namespace

TEST_F(LocalUploadTest, ComposesPartsOnDiskAndRemovesThem) {
    chunkstore::upload::BufferingUploader uploader(1024);
    const auto payload = Payload(4000);
    const std::string key = "content/vol-01/blob.bytes";

    auto result = uploader.Upload(store_, "bucket", key,
                                  std::make_unique<std::istringstream>(payload));
    ASSERT_TRUE(result.ok()) << result.error().message;
    uploader.WaitForCleanup();

    EXPECT_EQ(result.value().size_bytes, payload.size());
    EXPECT_EQ(ReadObject(key), payload);
    for (int index = 2; index <= 4; ++index) {
        EXPECT_FALSE(std::filesystem::exists(ObjectPath(key + ".chunk" + std::to_string(index))))
            << index;
    }
    EXPECT_TRUE(std::filesystem::is_empty(store_->temp_path()));
}

TEST_F(LocalUploadTest, OverflowTailIsComposedIntoDestination) {
    chunkstore::upload::BufferingUploader uploader(16);
    const auto payload = Payload(16 * 31 + 700);

    auto result = uploader.Upload(store_, "bucket", "big.bin",
                                  std::make_unique<std::istringstream>(payload));
    ASSERT_TRUE(result.ok()) << result.error().message;
    uploader.WaitForCleanup();

    EXPECT_EQ(uploader.NumberOfTimesComposeLimitHit(), 1u);
    EXPECT_EQ(ReadObject("big.bin"), payload);
    EXPECT_FALSE(std::filesystem::exists(ObjectPath("big.bin.chunk32")));
}

TEST_F(LocalUploadTest, InvalidDestinationFailsWithoutLeavingParts) {
    chunkstore::upload::BufferingUploader uploader(8);

    auto result = uploader.Upload(store_, "bucket", "../escape",
                                  std::make_unique<std::istringstream>(Payload(40)));
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().code, chunkstore::core::ErrorCode::kUploadFailed);
    uploader.WaitForCleanup();
    EXPECT_TRUE(std::filesystem::is_empty(store_->temp_path()));
}
