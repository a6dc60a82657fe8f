#include <gtest/gtest.h>

#include "chunkstore/storage/local_object_store.h"

using chunkstore::storage::LocalObjectStore;

TEST(PathSafety, AcceptsSimpleNames) {
    EXPECT_TRUE(LocalObjectStore::IsSafeName("bucket1"));
    EXPECT_TRUE(LocalObjectStore::IsSafeName("obj-1.txt"));
}

TEST(PathSafety, RejectsTraversal) {
    EXPECT_FALSE(LocalObjectStore::IsSafeName("../secret"));
    EXPECT_FALSE(LocalObjectStore::IsSafeName(".."));
    EXPECT_FALSE(LocalObjectStore::IsSafeName("a/b"));
}

TEST(PathSafety, AcceptsNestedKeys) {
    EXPECT_TRUE(LocalObjectStore::IsSafeKey("content/vol-01/chap-01/blob.bytes"));
    EXPECT_TRUE(LocalObjectStore::IsSafeKey("content/vol-01/chap-01/blob.bytes.chunk7"));
}

TEST(PathSafety, RejectsMalformedKeys) {
    EXPECT_FALSE(LocalObjectStore::IsSafeKey(""));
    EXPECT_FALSE(LocalObjectStore::IsSafeKey("/absolute"));
    EXPECT_FALSE(LocalObjectStore::IsSafeKey("trailing/"));
    EXPECT_FALSE(LocalObjectStore::IsSafeKey("a//b"));
    EXPECT_FALSE(LocalObjectStore::IsSafeKey("content/../secret"));
}
