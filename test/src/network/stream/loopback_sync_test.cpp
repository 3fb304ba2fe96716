#include <gtest/gtest.h>

#include "network/stream/impl/loopback_connection.hpp"
#include "network/stream/streamer.hpp"
#include "storage/in_memory/memory_stream_client.hpp"
#include "storage/in_memory/memory_stream_server.hpp"
#include "testutil/literals.hpp"
#include "testutil/outcome.hpp"
#include "testutil/wait_condition.hpp"

using namespace csync::network::stream;
using csync::storage::MemoryChunkStore;
using csync::storage::MemoryStreamClient;
using csync::storage::MemoryStreamServer;
using csync::test::waitForCondition;
using libp2p::peer::PeerId;

namespace {
  const auto kTimeout = std::chrono::milliseconds(5000);
  constexpr size_t kBatchSize = 8;

  struct Node {
    std::shared_ptr<MemoryChunkStore> store;
    std::shared_ptr<Streamer> streamer;
  };

  Node makeNode(const StreamOptions &options) {
    Node node;
    node.store = std::make_shared<MemoryChunkStore>();
    auto store = node.store;

    auto registry = std::make_shared<CapabilityRegistry>();
    EXPECT_TRUE(registry->RegisterClientFunc(
        "SYNC",
        [store](const PeerId &, const ByteArray &, bool)
            -> outcome::result<std::shared_ptr<Client>> {
          return std::make_shared<MemoryStreamClient>(store);
        }));
    EXPECT_TRUE(registry->RegisterServerFunc(
        "SYNC",
        [store](const PeerId &, const ByteArray &, bool)
            -> outcome::result<std::shared_ptr<Server>> {
          return std::make_shared<MemoryStreamServer>(store, kBatchSize);
        }));

    node.streamer = std::make_shared<Streamer>(registry, options);
    node.streamer->SetChunkDeliveryHandler(
        [store](const PeerId &, const ChunkDeliveryMsg &delivery) {
          EXPECT_TRUE(store->put(delivery.hash, delivery.data));
        });
    return node;
  }

  void seed(MemoryChunkStore &store, size_t first, size_t count) {
    for (auto i = first; i < first + count; ++i) {
      auto text = "chunk " + std::to_string(i);
      store.put(ByteArray(text.begin(), text.end()));
    }
  }
}  // namespace

class LoopbackSyncTest : public ::testing::Test {
 protected:
  void SetUp() override {
    StreamOptions options;
    options.empty_batch_retry = std::chrono::milliseconds(10);
    upstream_ = makeNode(options);
    downstream_ = makeNode(options);

    ASSERT_TRUE(upstream_.streamer->AddPeer(
        downstream_id_,
        std::make_shared<LoopbackConnection>(upstream_id_,
                                             downstream_.streamer)));
    ASSERT_TRUE(downstream_.streamer->AddPeer(
        upstream_id_,
        std::make_shared<LoopbackConnection>(downstream_id_,
                                             upstream_.streamer)));
  }

  void TearDown() override {
    downstream_.streamer->Stop();
    upstream_.streamer->Stop();
  }

  bool synced() const {
    return downstream_.store->size() == upstream_.store->size();
  }

  Node upstream_;
  Node downstream_;
  PeerId upstream_id_ = "upstream"_peerid;
  PeerId downstream_id_ = "downstream"_peerid;
};

/**
 * @given an upstream store of 50 chunks
 * @when the downstream node subscribes to the whole history
 * @then every chunk arrives and the upstream drops the finished history
 */
TEST_F(LoopbackSyncTest, HistoricalSync) {
  seed(*upstream_.store, 0, 50);
  StreamID stream("SYNC", {}, false);

  EXPECT_OUTCOME_TRUE_1(downstream_.streamer->Subscribe(
      upstream_id_, stream, Range{0, upstream_.store->size()}, Priority::Mid));

  ASSERT_TRUE(waitForCondition([this] { return synced(); }, kTimeout));
  ASSERT_TRUE(waitForCondition(
      [&] {
        return !upstream_.streamer->HasServerSubscription(downstream_id_,
                                                          stream);
      },
      kTimeout));
  EXPECT_EQ(downstream_.store->pendingFetches(), 0);

  EXPECT_OUTCOME_TRUE_1(
      downstream_.streamer->Unsubscribe(upstream_id_, stream));
  EXPECT_FALSE(
      downstream_.streamer->HasClientSubscription(upstream_id_, stream));
}

/**
 * @given a live subscription to a store of 20 chunks
 * @when 10 more chunks are added upstream
 * @then the live tail delivers them and takeover proofs reach the upstream
 */
TEST_F(LoopbackSyncTest, LiveTail) {
  seed(*upstream_.store, 0, 20);
  StreamID stream("SYNC", {}, true);

  EXPECT_OUTCOME_TRUE_1(downstream_.streamer->Subscribe(
      upstream_id_, stream, boost::none, Priority::High));
  ASSERT_TRUE(waitForCondition([this] { return synced(); }, kTimeout));

  seed(*upstream_.store, 20, 10);
  ASSERT_TRUE(waitForCondition([this] { return synced(); }, kTimeout));
  EXPECT_EQ(downstream_.store->size(), 30);

  EXPECT_TRUE(waitForCondition(
      [&] {
        return upstream_.streamer->LastTakeoverProof(downstream_id_, stream)
            .has_value();
      },
      kTimeout));
}

/**
 * @given a downstream node that already holds part of the chunks
 * @when it subscribes to the history
 * @then only the missing chunks are fetched and the stores end up equal
 */
TEST_F(LoopbackSyncTest, SkipsPresentChunks) {
  seed(*upstream_.store, 0, 16);
  seed(*downstream_.store, 0, 4);
  StreamID stream("SYNC", {}, false);

  EXPECT_OUTCOME_TRUE_1(downstream_.streamer->Subscribe(
      upstream_id_, stream, Range{0, 16}, Priority::Low));
  ASSERT_TRUE(waitForCondition([this] { return synced(); }, kTimeout));
  EXPECT_EQ(downstream_.store->size(), 16);
}

/**
 * @given a live subscription with history
 * @when both the history and the live tail are served
 * @then the stores end up equal and unsubscribing removes both entries
 */
TEST_F(LoopbackSyncTest, LiveWithHistory) {
  seed(*upstream_.store, 0, 12);
  StreamID stream("SYNC", {}, true);

  EXPECT_OUTCOME_TRUE_1(downstream_.streamer->Subscribe(
      upstream_id_, stream, Range{0, 12}, Priority::Top));
  ASSERT_TRUE(waitForCondition([this] { return synced(); }, kTimeout));

  EXPECT_OUTCOME_TRUE_1(
      downstream_.streamer->Unsubscribe(upstream_id_, stream));
  EXPECT_FALSE(
      downstream_.streamer->HasClientSubscription(upstream_id_, stream));
  EXPECT_FALSE(downstream_.streamer->HasClientSubscription(
      upstream_id_, stream.Historical()));
  EXPECT_TRUE(waitForCondition(
      [&] {
        return !upstream_.streamer->HasServerSubscription(downstream_id_,
                                                          stream);
      },
      kTimeout));
}
