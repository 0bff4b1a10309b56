/**
 * @file test_broadcast.cpp
 * @brief Unit tests for BroadcastEngine
 */

#include <clipsync/broadcast.h>
#include <gtest/gtest.h>

#include "mocks/fake_transport.h"

using namespace clipsync;
using clipsync::fakes::FakeConnection;

class BroadcastTest : public ::testing::Test {
protected:
  std::shared_ptr<FakeConnection> add_peer() {
    PeerId id = PeerId::generate();
    auto connection = std::make_shared<FakeConnection>(id);
    registry.insert(id, PeerSession::create(connection));
    return connection;
  }

  PeerSessionRegistry registry;
  BroadcastEngine engine{registry, "desk"};
};

TEST_F(BroadcastTest, NoPeersIsNotAnError) {
  auto report = engine.broadcast(ClipboardContent::text("hello"));

  ASSERT_TRUE(report.is_ok());
  EXPECT_EQ(report.value().attempted, 0u);
  EXPECT_EQ(report.value().delivered, 0u);
}

TEST_F(BroadcastTest, DeliversOneStreamPerPeer) {
  auto a = add_peer();
  auto b = add_peer();

  auto report = engine.broadcast(ClipboardContent::text("hello"));
  ASSERT_TRUE(report.is_ok());
  EXPECT_EQ(report.value().attempted, 2u);
  EXPECT_EQ(report.value().delivered, 2u);
  EXPECT_TRUE(report.value().failed.empty());

  for (const auto &connection : {a, b}) {
    ASSERT_EQ(connection->delivered.size(), 1u);
    auto msg = decode_message(connection->delivered[0]);
    ASSERT_TRUE(msg.is_ok());
    EXPECT_EQ(msg.value().content, ClipboardContent::text("hello"));
    EXPECT_EQ(msg.value().sender_id, "desk");
  }
}

TEST_F(BroadcastTest, FreshStreamForEveryBroadcast) {
  auto a = add_peer();

  ASSERT_TRUE(engine.broadcast(ClipboardContent::text("one")).is_ok());
  ASSERT_TRUE(engine.broadcast(ClipboardContent::text("two")).is_ok());

  EXPECT_EQ(a->opened, 2u);
  ASSERT_EQ(a->delivered.size(), 2u);
  EXPECT_EQ(decode_message(a->delivered[1]).value().content.as_text(), "two");
}

TEST_F(BroadcastTest, FailingPeerIsRemovedOthersStillDelivered) {
  auto a = add_peer();
  auto b = add_peer();
  auto c = add_peer();
  b->failure = FakeConnection::Failure::Write;

  auto report = engine.broadcast(ClipboardContent::text("fan out"));
  ASSERT_TRUE(report.is_ok());
  EXPECT_EQ(report.value().attempted, 3u);
  EXPECT_EQ(report.value().delivered, 2u);
  ASSERT_EQ(report.value().failed.size(), 1u);
  EXPECT_EQ(report.value().failed[0], b->peer_id());

  EXPECT_EQ(a->delivered.size(), 1u);
  EXPECT_EQ(c->delivered.size(), 1u);
  EXPECT_TRUE(b->delivered.empty());

  EXPECT_FALSE(registry.contains(b->peer_id()));
  EXPECT_TRUE(b->closed);
  EXPECT_TRUE(registry.contains(a->peer_id()));
  EXPECT_TRUE(registry.contains(c->peer_id()));
}

TEST_F(BroadcastTest, OpenAndFinishFailuresCountAsFailed) {
  auto a = add_peer();
  auto b = add_peer();
  a->failure = FakeConnection::Failure::Open;
  b->failure = FakeConnection::Failure::Finish;

  auto report = engine.broadcast(ClipboardContent::text("x"));
  ASSERT_TRUE(report.is_ok());
  EXPECT_EQ(report.value().delivered, 0u);
  EXPECT_EQ(report.value().failed.size(), 2u);
  EXPECT_EQ(registry.size(), 0u);
}

TEST_F(BroadcastTest, EncodingFailureTouchesNoPeer) {
  auto a = add_peer();
  BroadcastEngine bad_sender(registry, std::string(70000, 'x'));

  auto report = bad_sender.broadcast(ClipboardContent::text("x"));
  ASSERT_TRUE(report.is_error());
  EXPECT_EQ(report.error().code, ErrorCode::EncodingError);
  EXPECT_EQ(a->opened, 0u);
  EXPECT_TRUE(registry.contains(a->peer_id()));
}

TEST_F(BroadcastTest, ImageContent) {
  auto a = add_peer();

  auto report = engine.broadcast(ClipboardContent::image(4, 4, Bytes(64, 7)));
  ASSERT_TRUE(report.is_ok());

  ASSERT_EQ(a->delivered.size(), 1u);
  auto msg = decode_message(a->delivered[0]);
  ASSERT_TRUE(msg.is_ok());
  ASSERT_TRUE(msg.value().content.is_image());
  EXPECT_EQ(msg.value().content.as_image().data, Bytes(64, 7));
}

namespace {

/// Connection that is replaced by a reconnect while its send is failing
class ReconnectingConnection : public FakeConnection {
public:
  ReconnectingConnection(const PeerId &peer_id, PeerSessionRegistry &registry,
                         std::shared_ptr<FakeConnection> replacement)
      : FakeConnection(peer_id), registry_(registry),
        replacement_(std::move(replacement)) {}

  Result<std::unique_ptr<SendStream>> open_stream() override {
    registry_.insert(peer_id(), PeerSession::create(replacement_));
    return Error(ErrorCode::StreamOpenFailed, "Peer went away");
  }

private:
  PeerSessionRegistry &registry_;
  std::shared_ptr<FakeConnection> replacement_;
};

} // anonymous namespace

TEST_F(BroadcastTest, PeerReconnectedDuringPassKeepsNewSession) {
  auto a = add_peer();
  PeerId b = PeerId::generate();
  auto fresh = std::make_shared<FakeConnection>(b);
  auto stale = std::make_shared<ReconnectingConnection>(b, registry, fresh);
  registry.insert(b, PeerSession::create(stale));

  auto report = engine.broadcast(ClipboardContent::text("x"));
  ASSERT_TRUE(report.is_ok());
  EXPECT_EQ(report.value().delivered, 1u);
  ASSERT_EQ(report.value().failed.size(), 1u);
  EXPECT_EQ(report.value().failed[0], b);

  EXPECT_TRUE(registry.contains(b));
  EXPECT_FALSE(fresh->closed);
  EXPECT_EQ(registry.size(), 2u);
  EXPECT_EQ(a->delivered.size(), 1u);

  // The new session receives the next update
  ASSERT_TRUE(engine.broadcast(ClipboardContent::text("y")).is_ok());
  ASSERT_EQ(fresh->delivered.size(), 1u);
  EXPECT_EQ(decode_message(fresh->delivered[0]).value().content.as_text(), "y");
}
