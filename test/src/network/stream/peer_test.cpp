#include "network/stream/peer.hpp"

#include <atomic>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "mock/src/network/stream/peer_connection_mock.hpp"
#include "network/stream/stream_error.hpp"
#include "testutil/literals.hpp"
#include "testutil/outcome.hpp"
#include "testutil/wait_condition.hpp"

using namespace csync::network::stream;
using csync::test::waitForCondition;
using testing::_;
using testing::Invoke;
using testing::Return;

class PeerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    connection_ = std::make_shared<testing::NiceMock<PeerConnectionMock>>();
    peer_ = std::make_shared<Peer>("peer"_peerid, connection_, 4);
  }

  void TearDown() override {
    peer_->Stop();
  }

  std::shared_ptr<testing::NiceMock<PeerConnectionMock>> connection_;
  std::shared_ptr<Peer> peer_;
  StreamID stream_{"foo", {}, true};
};

/**
 * @given a started session
 * @when a message is sent
 * @then the writer hands its encoded frame to the connection
 */
TEST_F(PeerTest, WriterDrainsQueue) {
  std::atomic<int> written{0};
  EXPECT_OUTCOME_TRUE(expected, EncodeMessage(UnsubscribeMsg{stream_}));
  EXPECT_CALL(*connection_, Write(MessageCode::Unsubscribe, expected.payload))
      .WillOnce(Invoke([&](MessageCode, const ByteArray &) {
        ++written;
        return outcome::success();
      }));

  peer_->Start();
  EXPECT_OUTCOME_TRUE_1(peer_->Send(UnsubscribeMsg{stream_}, Priority::Top));
  EXPECT_TRUE(waitForCondition([&] { return written.load() == 1; },
                               std::chrono::milliseconds(2000)));
}

/**
 * @given a session whose writer is not started
 * @when more frames than the capacity are sent on one priority
 * @then QUEUE_FULL is returned and the frames stay queued
 */
TEST_F(PeerTest, QueueCapacity) {
  for (auto i = 0; i < 4; ++i) {
    EXPECT_OUTCOME_TRUE_1(peer_->Send(UnsubscribeMsg{stream_}, Priority::Low));
  }
  EXPECT_OUTCOME_ERROR(full,
                       peer_->Send(UnsubscribeMsg{stream_}, Priority::Low),
                       StreamError::QUEUE_FULL);
  EXPECT_EQ(peer_->QueuedFrames(Priority::Low), 4);
  EXPECT_EQ(peer_->QueuedFrames(Priority::Top), 0);
}

/**
 * @given a stopped session
 * @when sending
 * @then PEER_CLOSED is returned
 */
TEST_F(PeerTest, SendAfterStop) {
  peer_->Start();
  peer_->Stop();
  EXPECT_OUTCOME_ERROR(closed,
                       peer_->Send(UnsubscribeMsg{stream_}, Priority::Top),
                       StreamError::PEER_CLOSED);
}

/**
 * @given a connection failing to write
 * @when frames are sent
 * @then the writer keeps draining the queue
 */
TEST_F(PeerTest, WriteErrorsDoNotStopWriter) {
  std::atomic<int> attempts{0};
  ON_CALL(*connection_, Write(_, _))
      .WillByDefault(Invoke([&](MessageCode, const ByteArray &) {
        ++attempts;
        return outcome::result<void>(
            make_error_code(StreamError::PEER_CLOSED));
      }));

  peer_->Start();
  EXPECT_OUTCOME_TRUE_1(peer_->Send(UnsubscribeMsg{stream_}, Priority::Top));
  EXPECT_OUTCOME_TRUE_1(peer_->Send(UnsubscribeMsg{stream_}, Priority::Mid));
  EXPECT_TRUE(waitForCondition([&] { return attempts.load() == 2; },
                               std::chrono::milliseconds(2000)));
}

/**
 * @given a client entry
 * @when adding it again, removing it and taking all entries
 * @then duplicates are refused and removal returns the entry once
 */
TEST_F(PeerTest, ClientEntries) {
  SubscribeRequest request{Range{1, 2}, Priority::High};
  EXPECT_OUTCOME_TRUE_1(peer_->AddClient(stream_, request));
  EXPECT_OUTCOME_ERROR(dup,
                       peer_->AddClient(stream_, request),
                       StreamError::ALREADY_SUBSCRIBED);

  auto found = peer_->FindClient(stream_);
  ASSERT_TRUE(found);
  EXPECT_EQ(found->request.history, (boost::optional<Range>(Range{1, 2})));
  EXPECT_FALSE(found->fetcher);

  EXPECT_TRUE(peer_->RemoveClient(stream_));
  EXPECT_FALSE(peer_->RemoveClient(stream_));

  EXPECT_OUTCOME_TRUE_1(peer_->AddClient(stream_.Historical(), request));
  std::vector<ClientSubscription> clients;
  std::vector<std::shared_ptr<ServerNegotiator>> servers;
  peer_->TakeAll(clients, servers);
  EXPECT_EQ(clients.size(), 1);
  EXPECT_TRUE(servers.empty());
  EXPECT_FALSE(peer_->FindClient(stream_.Historical()));
}
