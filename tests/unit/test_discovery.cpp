/**
 * @file test_discovery.cpp
 * @brief Unit tests for discovery beacons
 */

#include <clipsync/discovery.h>
#include <clipsync/security.h>
#include <gtest/gtest.h>

using namespace clipsync;

class DiscoveryTest : public ::testing::Test {
protected:
  void SetUp() override {
    ASSERT_TRUE(security_init().is_ok());
    beacon.peer_id = PeerId::generate();
    beacon.tcp_port = 17530;
    beacon.device_name = "kitchen-laptop";
  }

  Beacon beacon;
};

TEST_F(DiscoveryTest, BeaconRoundtrip) {
  Bytes datagram = encode_beacon(beacon);

  auto decoded = decode_beacon(datagram.data(), datagram.size());
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->peer_id, beacon.peer_id);
  EXPECT_EQ(decoded->tcp_port, 17530);
  EXPECT_EQ(decoded->device_name, "kitchen-laptop");
}

TEST_F(DiscoveryTest, BeaconStartsWithMagic) {
  Bytes datagram = encode_beacon(beacon);
  ASSERT_GE(datagram.size(), 5u);
  EXPECT_EQ(datagram[0], 'C');
  EXPECT_EQ(datagram[1], 'S');
  EXPECT_EQ(datagram[2], 'Y');
  EXPECT_EQ(datagram[3], 'D');
  EXPECT_EQ(datagram[4], BEACON_VERSION);
}

TEST_F(DiscoveryTest, LongNameIsClipped) {
  beacon.device_name = std::string(200, 'n');
  Bytes datagram = encode_beacon(beacon);

  auto decoded = decode_beacon(datagram.data(), datagram.size());
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->device_name.size(), MAX_BEACON_NAME);
}

TEST_F(DiscoveryTest, RejectsForeignDatagram) {
  Bytes datagram = encode_beacon(beacon);
  datagram[0] = 'X';
  EXPECT_FALSE(decode_beacon(datagram.data(), datagram.size()).has_value());
}

TEST_F(DiscoveryTest, RejectsOtherVersion) {
  Bytes datagram = encode_beacon(beacon);
  datagram[4] = BEACON_VERSION + 1;
  EXPECT_FALSE(decode_beacon(datagram.data(), datagram.size()).has_value());
}

TEST_F(DiscoveryTest, RejectsTruncatedAndPadded) {
  Bytes datagram = encode_beacon(beacon);

  EXPECT_FALSE(decode_beacon(datagram.data(), datagram.size() - 1).has_value());

  datagram.push_back(0);
  EXPECT_FALSE(decode_beacon(datagram.data(), datagram.size()).has_value());
}

TEST_F(DiscoveryTest, RejectsZeroIdOrPort) {
  Beacon zero_id = beacon;
  zero_id.peer_id = PeerId();
  Bytes a = encode_beacon(zero_id);
  EXPECT_FALSE(decode_beacon(a.data(), a.size()).has_value());

  Beacon zero_port = beacon;
  zero_port.tcp_port = 0;
  Bytes b = encode_beacon(zero_port);
  EXPECT_FALSE(decode_beacon(b.data(), b.size()).has_value());
}

TEST_F(DiscoveryTest, ServiceRefusesDoubleStart) {
  DiscoveryOptions options;
  options.local_id = beacon.peer_id;
  options.device_name = "test";
  options.tcp_port = 17530;
  options.discovery_port = 0; // Any free UDP port

  DiscoveryService service;
  auto started = service.start(options, nullptr);
  ASSERT_TRUE(started.is_ok()) << started.error().to_string();
  EXPECT_TRUE(service.is_running());

  auto again = service.start(options, nullptr);
  ASSERT_TRUE(again.is_error());
  EXPECT_EQ(again.error().code, ErrorCode::InvalidState);

  service.stop();
  EXPECT_FALSE(service.is_running());
  EXPECT_TRUE(service.events().is_closed());
}
