#include <stdexcept>

#include <gtest/gtest.h>

#include "chunkstore/upload/chunk_namer.h"

using chunkstore::upload::ChunkName;
using chunkstore::upload::IsChunkPartName;

TEST(ChunkNamer, FirstPartKeepsDestination) {
    EXPECT_EQ(ChunkName("content/vol-01/chap-01/blob.bytes", 1),
              "content/vol-01/chap-01/blob.bytes");
}

TEST(ChunkNamer, LaterPartsCarryMarkerAndIndex) {
    EXPECT_EQ(ChunkName("content/blob.bytes", 2), "content/blob.bytes.chunk2");
    EXPECT_EQ(ChunkName("content/blob.bytes", 32), "content/blob.bytes.chunk32");
}

TEST(ChunkNamer, RejectsIndexBelowOne) {
    EXPECT_THROW((void)ChunkName("blob", 0), std::invalid_argument);
    EXPECT_THROW((void)ChunkName("blob", -3), std::invalid_argument);
}

TEST(ChunkNamer, OnlyIntermediatePartsAreMarked) {
    EXPECT_FALSE(IsChunkPartName("blob.bytes", ChunkName("blob.bytes", 1)));
    for (int index = 2; index <= 32; ++index) {
        EXPECT_TRUE(IsChunkPartName("blob.bytes", ChunkName("blob.bytes", index))) << index;
    }
}

TEST(ChunkNamer, DestinationContainingMarkerIsNotAPart) {
    EXPECT_FALSE(IsChunkPartName("backups/db.chunky", "backups/db.chunky"));
    EXPECT_FALSE(IsChunkPartName("x.chunk", "x.chunk"));
    EXPECT_FALSE(IsChunkPartName("x.chunk2", "x.chunk2"));
    EXPECT_TRUE(IsChunkPartName("x.chunk", ChunkName("x.chunk", 2)));
}

TEST(ChunkNamer, NamesOfOtherObjectsAreNotParts) {
    EXPECT_FALSE(IsChunkPartName("blob", "other.chunk2"));
    EXPECT_FALSE(IsChunkPartName("blob", "blob.chunk"));
    EXPECT_FALSE(IsChunkPartName("blob", "blob.chunk1"));
    EXPECT_FALSE(IsChunkPartName("blob", "blob.chunk02"));
    EXPECT_FALSE(IsChunkPartName("blob", "blob.chunk2x"));
}
