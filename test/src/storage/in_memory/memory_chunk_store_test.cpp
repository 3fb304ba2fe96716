#include "storage/in_memory/memory_chunk_store.hpp"

#include <gtest/gtest.h>

#include "network/stream/stream_error.hpp"
#include "storage/chunk_address.hpp"
#include "storage/chunk_store_error.hpp"
#include "testutil/literals.hpp"
#include "testutil/outcome.hpp"

using csync::base::Hash256;
using csync::network::stream::StreamError;
using csync::storage::ChunkStoreError;
using csync::storage::chunkAddress;
using csync::storage::MemoryChunkStore;

/**
 * @given the bytes "abc"
 * @when computing the chunk address
 * @then it is their SHA-256
 */
TEST(ChunkAddressTest, Sha256) {
  EXPECT_EQ(
      chunkAddress("abc"_v).toHex(),
      "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

class MemoryChunkStoreTest : public ::testing::Test {
 protected:
  MemoryChunkStore store_;
};

/**
 * @given an empty store
 * @when putting chunks
 * @then they are readable by address and appended to the sequence once
 */
TEST_F(MemoryChunkStoreTest, PutGet) {
  auto first = store_.put("first"_v);
  auto second = store_.put("second"_v);
  EXPECT_EQ(store_.put("first"_v), first);

  EXPECT_OUTCOME_TRUE(data, store_.get(first));
  EXPECT_EQ(data, "first"_v);
  EXPECT_TRUE(store_.contains(second));
  EXPECT_EQ(store_.size(), 2);

  EXPECT_OUTCOME_TRUE(sequence, store_.sequence(1, 2));
  EXPECT_EQ(sequence, (std::vector<Hash256>{first, second}));
}

TEST_F(MemoryChunkStoreTest, GetMissing) {
  EXPECT_OUTCOME_ERROR(
      res, store_.get("absent"_hash256), ChunkStoreError::NOT_FOUND);
  EXPECT_FALSE(store_.contains("absent"_hash256));
}

/**
 * @given a store of two chunks
 * @when reading sequence ranges
 * @then empty, zero based or too long ranges give INVALID_RANGE
 */
TEST_F(MemoryChunkStoreTest, SequenceBounds) {
  store_.put("first"_v);
  store_.put("second"_v);

  EXPECT_OUTCOME_TRUE(single, store_.sequence(2, 2));
  EXPECT_EQ(single.size(), 1);
  EXPECT_OUTCOME_ERROR(
      zero, store_.sequence(0, 1), ChunkStoreError::INVALID_RANGE);
  EXPECT_OUTCOME_ERROR(
      reversed, store_.sequence(2, 1), ChunkStoreError::INVALID_RANGE);
  EXPECT_OUTCOME_ERROR(
      beyond, store_.sequence(1, 3), ChunkStoreError::INVALID_RANGE);
}

/**
 * @given two requests for the same missing chunk
 * @when the chunk is delivered under its address
 * @then both share one handle which resolves with success
 */
TEST_F(MemoryChunkStoreTest, NeedDataResolvedByDelivery) {
  auto hash = chunkAddress("payload"_v);
  auto handle = store_.needData(hash);
  ASSERT_TRUE(handle);
  EXPECT_EQ(store_.needData(hash), handle);
  EXPECT_EQ(store_.pendingFetches(), 1);

  EXPECT_OUTCOME_TRUE_1(store_.put(hash, "payload"_v));
  EXPECT_TRUE(handle->IsResolved());
  EXPECT_OUTCOME_TRUE_1(handle->Wait());
  EXPECT_EQ(store_.pendingFetches(), 0);
  EXPECT_FALSE(store_.needData(hash));
}

/**
 * @given a pending fetch
 * @when bytes that do not hash to the address are delivered
 * @then the delivery and the fetch fail with INVALID_CHUNK and nothing is
 * stored
 */
TEST_F(MemoryChunkStoreTest, InvalidDelivery) {
  auto hash = chunkAddress("payload"_v);
  auto handle = store_.needData(hash);

  EXPECT_OUTCOME_ERROR(
      res, store_.put(hash, "forged"_v), ChunkStoreError::INVALID_CHUNK);
  EXPECT_OUTCOME_ERROR(
      fetched, handle->Wait(), ChunkStoreError::INVALID_CHUNK);
  EXPECT_FALSE(store_.contains(hash));
  EXPECT_EQ(store_.size(), 0);
}

/**
 * @given a pending fetch
 * @when the chunk is put locally
 * @then the fetch resolves
 */
TEST_F(MemoryChunkStoreTest, LocalPutResolves) {
  auto handle = store_.needData(chunkAddress("local"_v));
  store_.put("local"_v);
  EXPECT_TRUE(handle->IsResolved());
}

TEST_F(MemoryChunkStoreTest, AbortFetches) {
  auto handle = store_.needData("missing"_hash256);
  store_.abortFetches();
  EXPECT_OUTCOME_ERROR(res, handle->Wait(), StreamError::FETCH_ABORTED);
  EXPECT_EQ(store_.pendingFetches(), 0);
}
