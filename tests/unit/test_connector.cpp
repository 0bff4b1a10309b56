/**
 * @file test_connector.cpp
 * @brief Unit tests for DiscoveryConnector
 */

#include <clipsync/connector.h>
#include <gtest/gtest.h>

#include "mocks/fake_transport.h"

#include <thread>

using namespace clipsync;
using clipsync::fakes::FakeTransport;

class ConnectorTest : public ::testing::Test {
protected:
  DiscoveredPeer discovered(const PeerId &id) {
    DiscoveredPeer peer;
    peer.peer_id = id;
    peer.addresses = {SocketAddress{"192.168.1.20", 17530}};
    peer.device_name = "other";
    return peer;
  }

  PeerId local = PeerId::generate();
  FakeTransport transport{local};
  PeerSessionRegistry registry;
  DiscoveryConnector connector{transport, registry};
};

TEST_F(ConnectorTest, SkipsSelf) {
  EXPECT_EQ(connector.handle(discovered(local)), ConnectOutcome::SkippedSelf);
  EXPECT_EQ(transport.connect_calls, 0u);
  EXPECT_EQ(registry.size(), 0u);
}

TEST_F(ConnectorTest, ConnectsAndRegistersNewPeer) {
  PeerId remote = PeerId::generate();
  transport.reachable.insert(remote);

  EXPECT_EQ(connector.handle(discovered(remote)), ConnectOutcome::Connected);
  EXPECT_TRUE(registry.contains(remote));
  EXPECT_EQ(connector.connected(), 1u);
  ASSERT_EQ(transport.last_addresses.size(), 1u);
  EXPECT_EQ(transport.last_addresses[0].host, "192.168.1.20");
}

TEST_F(ConnectorTest, SkipsAlreadyConnectedPeer) {
  PeerId remote = PeerId::generate();
  transport.reachable.insert(remote);
  ASSERT_EQ(connector.handle(discovered(remote)), ConnectOutcome::Connected);

  EXPECT_EQ(connector.handle(discovered(remote)),
            ConnectOutcome::SkippedConnected);
  EXPECT_EQ(transport.connect_calls, 1u);
}

TEST_F(ConnectorTest, FailedAttemptLeavesRegistryUntouched) {
  PeerId remote = PeerId::generate();

  EXPECT_EQ(connector.handle(discovered(remote)),
            ConnectOutcome::AttemptFailed);
  EXPECT_FALSE(registry.contains(remote));
  EXPECT_EQ(connector.failed(), 1u);
}

TEST_F(ConnectorTest, NextBeaconRetriesFailedPeer) {
  PeerId remote = PeerId::generate();

  ASSERT_EQ(connector.handle(discovered(remote)),
            ConnectOutcome::AttemptFailed);

  transport.reachable.insert(remote);
  EXPECT_EQ(connector.handle(discovered(remote)), ConnectOutcome::Connected);
  EXPECT_EQ(transport.connect_calls, 2u);
}

TEST_F(ConnectorTest, RunDrainsQueueUntilClosed) {
  PeerId a = PeerId::generate();
  PeerId b = PeerId::generate();
  transport.reachable.insert(a);
  transport.reachable.insert(b);

  DiscoveryQueue events;
  events.push(discovered(a));
  events.push(discovered(local));
  events.push(discovered(a));
  events.push(discovered(b));
  events.close();

  CancellationToken cancel;
  connector.run(events, cancel, std::chrono::milliseconds(10));

  EXPECT_EQ(connector.connected(), 2u);
  EXPECT_TRUE(registry.contains(a));
  EXPECT_TRUE(registry.contains(b));
}

TEST_F(ConnectorTest, RunStopsOnCancel) {
  DiscoveryQueue events;
  CancellationToken cancel;

  std::thread worker(
      [&] { connector.run(events, cancel, std::chrono::milliseconds(10)); });
  cancel.cancel();
  worker.join();

  EXPECT_EQ(transport.connect_calls, 0u);
}

TEST(ConnectOutcomeTest, Names) {
  EXPECT_STREQ(connect_outcome_name(ConnectOutcome::Connected), "Connected");
  EXPECT_STREQ(connect_outcome_name(ConnectOutcome::SkippedSelf),
               "SkippedSelf");
}
