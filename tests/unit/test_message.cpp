/**
 * @file test_message.cpp
 * @brief Unit tests for clipboard content and the ClipboardPush codec
 */

#include <clipsync/message.h>
#include <clipsync/protocol.h>
#include <gtest/gtest.h>

using namespace clipsync;

namespace {

ClipboardMessage make_text_message(const std::string &text) {
  ClipboardMessage msg;
  msg.content = ClipboardContent::text(text);
  msg.timestamp = 1700000000;
  msg.sender_id = "laptop";
  return msg;
}

} // anonymous namespace

// ============================================================================
// Content
// ============================================================================

TEST(MessageTest, ContentKinds) {
  auto text = ClipboardContent::text("hello");
  EXPECT_TRUE(text.is_text());
  EXPECT_FALSE(text.is_image());
  EXPECT_EQ(text.kind(), ContentKind::Text);
  EXPECT_EQ(text.as_text(), "hello");

  auto image = ClipboardContent::image(2, 3, Bytes{0x89, 0x50});
  EXPECT_TRUE(image.is_image());
  EXPECT_EQ(image.kind(), ContentKind::Image);
  EXPECT_EQ(image.as_image().width, 2u);
  EXPECT_EQ(image.as_image().height, 3u);

  EXPECT_NE(text, image);
  EXPECT_EQ(text, ClipboardContent::text("hello"));
}

TEST(MessageTest, CreateStampsCurrentTime) {
  uint64_t before = unix_timestamp_now();
  auto msg = ClipboardMessage::create(ClipboardContent::text("x"), "desk");
  uint64_t after = unix_timestamp_now();

  EXPECT_GE(msg.timestamp, before);
  EXPECT_LE(msg.timestamp, after);
  EXPECT_EQ(msg.sender_id, "desk");
}

// ============================================================================
// Preview
// ============================================================================

TEST(MessageTest, PreviewShortTextUnchanged) {
  EXPECT_EQ(preview(ClipboardContent::text("short"), 50), "short");
  EXPECT_EQ(preview(ClipboardContent::text("12345"), 5), "12345");
}

TEST(MessageTest, PreviewCutsLongText) {
  EXPECT_EQ(preview(ClipboardContent::text("abcdefgh"), 3), "abc...");
}

TEST(MessageTest, PreviewCountsCodePoints) {
  // Four two-byte characters
  std::string text = "\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9";
  EXPECT_EQ(preview(ClipboardContent::text(text), 2), "\xC3\xA9\xC3\xA9...");
  EXPECT_EQ(preview(ClipboardContent::text(text), 4), text);
}

TEST(MessageTest, PreviewImage) {
  EXPECT_EQ(preview(ClipboardContent::image(640, 480, Bytes{1}), 50),
            "Image 640x480");
}

// ============================================================================
// Codec
// ============================================================================

TEST(MessageTest, TextRoundtrip) {
  auto original = make_text_message("Hello from the other desk \xE2\x9C\x93");

  auto encoded = encode_message(original);
  ASSERT_TRUE(encoded.is_ok());

  auto decoded = decode_message(encoded.value());
  ASSERT_TRUE(decoded.is_ok());
  EXPECT_EQ(decoded.value().content, original.content);
  EXPECT_EQ(decoded.value().timestamp, original.timestamp);
  EXPECT_EQ(decoded.value().sender_id, original.sender_id);
}

TEST(MessageTest, ImageRoundtrip) {
  ClipboardMessage original;
  original.content = ClipboardContent::image(16, 9, Bytes(500, 0x42));
  original.timestamp = 42;
  original.sender_id = "phone";

  auto encoded = encode_message(original);
  ASSERT_TRUE(encoded.is_ok());

  auto decoded = decode_message(encoded.value());
  ASSERT_TRUE(decoded.is_ok());
  EXPECT_EQ(decoded.value().content.as_image(), original.content.as_image());
}

TEST(MessageTest, EncodingIsDeterministic) {
  auto msg = make_text_message("same");
  auto first = encode_message(msg);
  auto second = encode_message(msg);
  ASSERT_TRUE(first.is_ok());
  ASSERT_TRUE(second.is_ok());
  EXPECT_EQ(first.value(), second.value());
}

TEST(MessageTest, EncodedPacketHasClipboardPushHeader) {
  auto encoded = encode_message(make_text_message("abc"));
  ASSERT_TRUE(encoded.is_ok());

  auto header = deserialize_header(encoded.value());
  ASSERT_TRUE(header.is_ok());
  EXPECT_EQ(header.value().type,
            static_cast<uint8_t>(MessageType::ClipboardPush));
  EXPECT_EQ(header.value().payload_size + PACKET_HEADER_SIZE,
            encoded.value().size());
}

TEST(MessageTest, OversizedSenderIdFailsToEncode) {
  auto msg = make_text_message("abc");
  msg.sender_id = std::string(70000, 's');

  auto encoded = encode_message(msg);
  ASSERT_TRUE(encoded.is_error());
  EXPECT_EQ(encoded.error().code, ErrorCode::EncodingError);
}

TEST(MessageTest, DecodeRejectsTruncatedPacket) {
  auto encoded = encode_message(make_text_message("truncate me"));
  ASSERT_TRUE(encoded.is_ok());

  Bytes packet = encoded.value();
  packet.pop_back();

  auto decoded = decode_message(packet);
  ASSERT_TRUE(decoded.is_error());
  EXPECT_EQ(decoded.error().code, ErrorCode::DecodingError);
}

TEST(MessageTest, DecodeRejectsWrongPacketType) {
  Bytes packet = build_packet(MessageType::Hello, Bytes{1, 2, 3});

  auto decoded = decode_message(packet);
  ASSERT_TRUE(decoded.is_error());
  EXPECT_EQ(decoded.error().code, ErrorCode::DecodingError);
}

TEST(MessageTest, DecodeRejectsUnknownContentKind) {
  auto payload = encode_payload(make_text_message("x"));
  ASSERT_TRUE(payload.is_ok());

  // Kind byte follows the u64 timestamp and the length-prefixed sender id
  Bytes bytes = payload.value();
  bytes[8 + 2 + 6] = 0x7F;

  auto decoded = decode_payload(bytes);
  ASSERT_TRUE(decoded.is_error());
  EXPECT_EQ(decoded.error().code, ErrorCode::DecodingError);
}

TEST(MessageTest, DecodeRejectsTrailingBytes) {
  auto payload = encode_payload(make_text_message("x"));
  ASSERT_TRUE(payload.is_ok());

  Bytes bytes = payload.value();
  bytes.push_back(0);

  EXPECT_TRUE(decode_payload(bytes).is_error());
}
