/**
 * @file test_protocol.cpp
 * @brief Unit tests for clipsync wire protocol
 */

#include <clipsync/protocol.h>
#include <gtest/gtest.h>

using namespace clipsync;

// ============================================================================
// Packet Header Tests
// ============================================================================

TEST(ProtocolTest, PacketHeaderCreate) {
  auto header = PacketHeader::create(MessageType::Hello, 100);

  EXPECT_EQ(header.magic, PROTOCOL_MAGIC);
  EXPECT_EQ(header.version, PROTOCOL_VERSION);
  EXPECT_EQ(header.type, static_cast<uint8_t>(MessageType::Hello));
  EXPECT_EQ(header.payload_size, 100u);
  EXPECT_TRUE(header.is_valid());
}

TEST(ProtocolTest, PacketHeaderIsLittleEndianCsyn) {
  Bytes serialized =
      serialize_header(PacketHeader::create(MessageType::ClipboardPush, 0x0102));

  ASSERT_EQ(serialized.size(), PACKET_HEADER_SIZE);
  EXPECT_EQ(serialized[0], 'C');
  EXPECT_EQ(serialized[1], 'S');
  EXPECT_EQ(serialized[2], 'Y');
  EXPECT_EQ(serialized[3], 'N');
  EXPECT_EQ(serialized[4], PROTOCOL_VERSION);
  EXPECT_EQ(serialized[5], 0x50);
  EXPECT_EQ(serialized[8], 0x02);
  EXPECT_EQ(serialized[9], 0x01);
}

TEST(ProtocolTest, PacketHeaderSerializeRoundtrip) {
  auto original = PacketHeader::create(MessageType::ClipboardPush, 1024);

  auto result = deserialize_header(serialize_header(original));
  ASSERT_TRUE(result.is_ok());

  auto deserialized = result.value();
  EXPECT_EQ(deserialized.magic, original.magic);
  EXPECT_EQ(deserialized.version, original.version);
  EXPECT_EQ(deserialized.type, original.type);
  EXPECT_EQ(deserialized.payload_size, original.payload_size);
}

TEST(ProtocolTest, PacketHeaderInvalidMagic) {
  Bytes data = {0x00,
                0x00,
                0x00,
                0x00, // Invalid magic
                PROTOCOL_VERSION,
                0x50,
                0x00,
                0x00,
                0x00,
                0x00,
                0x00,
                0x00};

  auto result = deserialize_header(data);
  EXPECT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::DecodingError);
}

TEST(ProtocolTest, PacketHeaderWrongVersion) {
  Bytes data = serialize_header(PacketHeader::create(MessageType::Hello, 0));
  data[4] = PROTOCOL_VERSION + 1;

  auto result = deserialize_header(data);
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::VersionMismatch);
}

TEST(ProtocolTest, PacketHeaderPayloadTooLarge) {
  Bytes data = serialize_header(
      PacketHeader::create(MessageType::ClipboardPush, MAX_PAYLOAD_SIZE + 1));

  auto result = deserialize_header(data);
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::PayloadTooLarge);
}

TEST(ProtocolTest, PacketHeaderTooShort) {
  Bytes data = {0x43, 0x53, 0x59, 0x4E}; // Only 4 bytes

  auto result = deserialize_header(data);
  EXPECT_TRUE(result.is_error());
}

TEST(ProtocolTest, MessageTypeNames) {
  EXPECT_STREQ(message_type_name(MessageType::Hello), "Hello");
  EXPECT_STREQ(message_type_name(MessageType::HelloAck), "HelloAck");
  EXPECT_STREQ(message_type_name(MessageType::ClipboardPush), "ClipboardPush");
}

// ============================================================================
// Hello Message Tests
// ============================================================================

TEST(ProtocolTest, HelloMessageSerializeRoundtrip) {
  HelloMessage original;
  original.peer_id = PeerId::generate();
  original.device_name = "Test Device";
  original.listen_port = 17530;
  original.capabilities = HelloMessage::CAP_TEXT | HelloMessage::CAP_IMAGE;

  auto result = deserialize_hello(serialize_hello(original));
  ASSERT_TRUE(result.is_ok());

  auto &deserialized = result.value();
  EXPECT_EQ(deserialized.peer_id, original.peer_id);
  EXPECT_EQ(deserialized.device_name, original.device_name);
  EXPECT_EQ(deserialized.listen_port, original.listen_port);
  EXPECT_EQ(deserialized.capabilities, original.capabilities);
}

TEST(ProtocolTest, HelloMessageTruncated) {
  HelloMessage hello;
  hello.peer_id = PeerId::generate();
  hello.device_name = "Laptop";
  Bytes data = serialize_hello(hello);
  data.resize(data.size() - 3);

  auto result = deserialize_hello(data);
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::DecodingError);
}

TEST(ProtocolTest, HelloMessageTrailingBytes) {
  HelloMessage hello;
  hello.peer_id = PeerId::generate();
  Bytes data = serialize_hello(hello);
  data.push_back(0xFF);

  EXPECT_TRUE(deserialize_hello(data).is_error());
}

// ============================================================================
// Wire Reader Tests
// ============================================================================

TEST(ProtocolTest, ReaderStopsAtEnd) {
  Bytes data;
  wire::write_u16(data, 0xBEEF);
  wire::write_string(data, "abc");

  wire::Reader reader(data);
  uint16_t value = 0;
  std::string text;
  uint32_t extra = 0;

  ASSERT_TRUE(reader.read_u16(value));
  ASSERT_TRUE(reader.read_string(text));
  EXPECT_EQ(value, 0xBEEF);
  EXPECT_EQ(text, "abc");
  EXPECT_TRUE(reader.at_end());
  EXPECT_FALSE(reader.read_u32(extra));
}

TEST(ProtocolTest, ReaderRejectsOverlongStringLength) {
  Bytes data;
  wire::write_u16(data, 10); // Claims 10 bytes
  data.push_back('x');

  wire::Reader reader(data);
  std::string text;
  EXPECT_FALSE(reader.read_string(text));
}

TEST(ProtocolTest, WriteStringRejectsOversized) {
  Bytes data;
  EXPECT_FALSE(wire::write_string(data, std::string(MAX_SHORT_STRING + 1, 'a')));
}

// ============================================================================
// Packet Parser Tests
// ============================================================================

TEST(ProtocolTest, PacketParserSingle) {
  Bytes payload = {1, 2, 3, 4, 5};
  Bytes packet = build_packet(MessageType::ClipboardPush, payload);

  PacketParser parser;
  parser.feed(packet);

  EXPECT_TRUE(parser.has_packet());

  auto result = parser.next_packet();
  ASSERT_TRUE(result.is_ok());

  auto &[header, data] = result.value();
  EXPECT_EQ(header.type, static_cast<uint8_t>(MessageType::ClipboardPush));
  EXPECT_EQ(data, payload);
  EXPECT_FALSE(parser.has_packet());
  EXPECT_EQ(parser.buffered_size(), 0u);
}

TEST(ProtocolTest, PacketParserAcrossSplitChunks) {
  Bytes payload(300, 0xAB);
  Bytes packet = build_packet(MessageType::ClipboardPush, payload);

  PacketParser parser;
  size_t offset = 0;
  // Feed in uneven pieces, including one that splits the header
  for (size_t chunk : {5u, 4u, 100u, 191u, 12u}) {
    EXPECT_FALSE(parser.has_packet());
    parser.feed(packet.data() + offset, chunk);
    offset += chunk;
  }
  ASSERT_EQ(offset, packet.size());

  ASSERT_TRUE(parser.has_packet());
  auto result = parser.next_packet();
  ASSERT_TRUE(result.is_ok());
  EXPECT_EQ(result.value().second, payload);
}

TEST(ProtocolTest, PacketParserMultiple) {
  Bytes packet1 = build_packet(MessageType::Hello, {1, 2, 3});
  Bytes packet2 = build_packet(MessageType::HelloAck, {4, 5, 6, 7});

  PacketParser parser;
  Bytes combined = packet1;
  combined.insert(combined.end(), packet2.begin(), packet2.end());
  parser.feed(combined);

  auto first = parser.next_packet();
  ASSERT_TRUE(first.is_ok());
  EXPECT_EQ(first.value().first.type, static_cast<uint8_t>(MessageType::Hello));

  auto second = parser.next_packet();
  ASSERT_TRUE(second.is_ok());
  EXPECT_EQ(second.value().first.type,
            static_cast<uint8_t>(MessageType::HelloAck));

  EXPECT_FALSE(parser.has_packet());
}

TEST(ProtocolTest, PacketParserBadHeaderDropsBuffer) {
  Bytes garbage(20, 0x00);

  PacketParser parser;
  parser.feed(garbage);

  ASSERT_TRUE(parser.has_packet());
  auto result = parser.next_packet();
  EXPECT_TRUE(result.is_error());
  EXPECT_EQ(parser.buffered_size(), 0u);
  EXPECT_FALSE(parser.has_packet());
}

TEST(ProtocolTest, PacketParserNoPacketIsInvalidState) {
  PacketParser parser;
  auto result = parser.next_packet();
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::InvalidState);
}
