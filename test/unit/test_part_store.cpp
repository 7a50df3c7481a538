#include <atomic>
#include <gtest/gtest.h>
#include <sqlite3.h>
#include <stdexcept>
#include <thread>
#include <vector>

#include "core/chunk_error.hpp"
#include "erasure/chunk_codec.hpp"
#include "storage/part_store.hpp"
#include "test_helpers.hpp"

namespace {

using shardavail::core::ChunkError;
using shardavail::core::ChunkErrorKind;
using shardavail::core::EncodedChunk;
using shardavail::erasure::ChunkCodec;
using shardavail::storage::PartStore;
using shardavail::test::TempDbFile;
using shardavail::test::makePayload;

EncodedChunk sampleChunk(uint32_t seed = 1)
{
    return ChunkCodec::encode(makePayload(2000, seed), 3, 7, 10, 0);
}

TEST(PartStoreTest, PutThenGet) {
    TempDbFile db("store_put_get");
    PartStore store(db.path());
    auto chunk = sampleChunk();
    auto hash = chunk.header.chunkHash();

    EXPECT_FALSE(store.get(hash, 0).has_value());
    EXPECT_EQ(store.put(hash, 0, chunk.parts[0]), PartStore::PutResult::Inserted);

    auto got = store.get(hash, 0);
    ASSERT_TRUE(got.has_value());
    EXPECT_TRUE(got->sameContent(chunk.parts[0]));
    EXPECT_FALSE(store.get(hash, 1).has_value());
}

TEST(PartStoreTest, SurvivesRestart) {
    TempDbFile db("store_restart");
    auto chunk = sampleChunk();
    auto hash = chunk.header.chunkHash();
    {
        PartStore store(db.path());
        store.putHeader(chunk.header);
        for (const auto &p : chunk.parts) {
            store.put(hash, p.partOrd, p);
        }
    }

    PartStore reopened(db.path());
    auto header = reopened.getHeader(hash);
    ASSERT_TRUE(header.has_value());
    EXPECT_EQ(*header, chunk.header);
    for (const auto &p : chunk.parts) {
        auto got = reopened.get(hash, p.partOrd);
        ASSERT_TRUE(got.has_value());
        EXPECT_EQ(got->bytes, p.bytes);
        EXPECT_EQ(got->merkleProof, p.merkleProof);
    }
    EXPECT_TRUE(reopened.hasChunk(hash));
}

TEST(PartStoreTest, IdenticalRePutIsNoOp) {
    TempDbFile db("store_identical");
    PartStore store(db.path());
    auto chunk = sampleChunk();
    auto hash = chunk.header.chunkHash();

    EXPECT_EQ(store.put(hash, 2, chunk.parts[2]), PartStore::PutResult::Inserted);
    EXPECT_EQ(store.put(hash, 2, chunk.parts[2]), PartStore::PutResult::AlreadyPresent);
    EXPECT_EQ(store.partCount(hash), 1u);
    EXPECT_EQ(store.putHeader(chunk.header), PartStore::PutResult::Inserted);
    EXPECT_EQ(store.putHeader(chunk.header), PartStore::PutResult::AlreadyPresent);
}

TEST(PartStoreTest, ConflictingPutRejectedAndOriginalKept) {
    TempDbFile db("store_conflict");
    PartStore store(db.path());
    auto chunk = sampleChunk();
    auto hash = chunk.header.chunkHash();
    store.put(hash, 1, chunk.parts[1]);

    auto altered = chunk.parts[1];
    altered.bytes[10] ^= 0x5A;
    try {
        store.put(hash, 1, altered);
        FAIL() << "expected ConflictingPart";
    } catch (const ChunkError &e) {
        EXPECT_EQ(e.kind(), ChunkErrorKind::ConflictingPart);
    }

    auto got = store.get(hash, 1);
    ASSERT_TRUE(got.has_value());
    EXPECT_TRUE(got->sameContent(chunk.parts[1]));
}

TEST(PartStoreTest, KeyMismatchRejected) {
    TempDbFile db("store_key_mismatch");
    PartStore store(db.path());
    auto chunk = sampleChunk();
    auto hash = chunk.header.chunkHash();
    EXPECT_THROW(store.put(hash, 4, chunk.parts[3]), std::invalid_argument);
    EXPECT_THROW(store.put(sampleChunk(2).header.chunkHash(), 3, chunk.parts[3]), std::invalid_argument);
}

TEST(PartStoreTest, HasChunkNeedsHeaderAndDataParts) {
    TempDbFile db("store_has_chunk");
    PartStore store(db.path());
    auto chunk = sampleChunk();
    auto hash = chunk.header.chunkHash();

    store.put(hash, 6, chunk.parts[6]);
    store.put(hash, 0, chunk.parts[0]);
    store.put(hash, 3, chunk.parts[3]);
    EXPECT_FALSE(store.hasChunk(hash)); // no header yet

    store.putHeader(chunk.header);
    EXPECT_TRUE(store.hasChunk(hash));
    EXPECT_EQ(store.partOrds(hash), (std::vector<uint32_t>{0, 3, 6}));

    auto parts = store.getParts(hash);
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(ChunkCodec::decode(chunk.header, parts), makePayload(2000, 1));
}

TEST(PartStoreTest, ConcurrentPutsOfSameKeyInsertOnce) {
    TempDbFile db("store_concurrent");
    PartStore store(db.path());
    auto chunk = sampleChunk();
    auto hash = chunk.header.chunkHash();

    std::atomic<int> inserted{0};
    std::atomic<int> present{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&] {
            auto r = store.put(hash, 5, chunk.parts[5]);
            if (r == PartStore::PutResult::Inserted) {
                ++inserted;
            } else {
                ++present;
            }
        });
    }
    for (auto &t : threads) {
        t.join();
    }
    EXPECT_EQ(inserted.load(), 1);
    EXPECT_EQ(present.load(), 7);
}

TEST(PartStoreTest, CorruptedRowIsNotServed) {
    TempDbFile db("store_crc");
    auto chunk = sampleChunk();
    auto hash = chunk.header.chunkHash();
    {
        PartStore store(db.path());
        store.put(hash, 0, chunk.parts[0]);
    }

    sqlite3 *raw = nullptr;
    ASSERT_EQ(sqlite3_open(db.path().c_str(), &raw), SQLITE_OK);
    ASSERT_EQ(sqlite3_exec(raw, "UPDATE chunk_parts SET crc = crc + 1;", nullptr, nullptr, nullptr),
              SQLITE_OK);
    sqlite3_close(raw);

    PartStore store(db.path());
    EXPECT_THROW(store.get(hash, 0), std::runtime_error);
}

TEST(PartStoreTest, ClosedStoreThrows) {
    TempDbFile db("store_closed");
    PartStore store(db.path());
    EXPECT_TRUE(store.isOpen());
    store.close();
    EXPECT_FALSE(store.isOpen());
    auto chunk = sampleChunk();
    EXPECT_THROW(store.get(chunk.header.chunkHash(), 0), std::runtime_error);
}

} // anonymous namespace
