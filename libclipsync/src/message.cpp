/**
 * @file message.cpp
 * @brief ClipboardPush codec and content helpers
 */

#include "clipsync/message.h"
#include "clipsync/protocol.h"
#include <chrono>

namespace clipsync {

// ============================================================================
// ClipboardContent
// ============================================================================

ClipboardContent ClipboardContent::text(std::string value) {
  ClipboardContent c;
  c.value_ = std::move(value);
  return c;
}

ClipboardContent ClipboardContent::image(ImageData value) {
  ClipboardContent c;
  c.value_ = std::move(value);
  return c;
}

ClipboardContent ClipboardContent::image(uint32_t width, uint32_t height,
                                         Bytes png) {
  ImageData img;
  img.width = width;
  img.height = height;
  img.data = std::move(png);
  return image(std::move(img));
}

// ============================================================================
// Preview
// ============================================================================

namespace {

// Byte offset just past the first max_chars code points, or npos if the text
// has no more than max_chars code points
size_t utf8_cut_point(const std::string &text, size_t max_chars) {
  size_t chars = 0;
  for (size_t i = 0; i < text.size(); ++i) {
    auto c = static_cast<unsigned char>(text[i]);
    if ((c & 0xC0) != 0x80) {
      if (chars == max_chars) {
        return i;
      }
      ++chars;
    }
  }
  return std::string::npos;
}

} // anonymous namespace

std::string preview(const ClipboardContent &content, size_t max_length) {
  if (content.is_image()) {
    const ImageData &img = content.as_image();
    return "Image " + std::to_string(img.width) + "x" +
           std::to_string(img.height);
  }

  const std::string &text = content.as_text();
  size_t cut = utf8_cut_point(text, max_length);
  if (cut == std::string::npos) {
    return text;
  }
  return text.substr(0, cut) + "...";
}

// ============================================================================
// ClipboardMessage
// ============================================================================

uint64_t unix_timestamp_now() {
  auto now = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::seconds>(now).count());
}

ClipboardMessage ClipboardMessage::create(ClipboardContent content,
                                          std::string sender_id) {
  ClipboardMessage msg;
  msg.content = std::move(content);
  msg.timestamp = unix_timestamp_now();
  msg.sender_id = std::move(sender_id);
  return msg;
}

// ============================================================================
// Codec
// ============================================================================

Result<Bytes> encode_payload(const ClipboardMessage &msg) {
  Bytes buf;
  wire::write_u64(buf, msg.timestamp);
  if (!wire::write_string(buf, msg.sender_id)) {
    return Error(ErrorCode::EncodingError, "Sender id too long",
                 std::to_string(msg.sender_id.size()) + " bytes");
  }

  buf.push_back(static_cast<Byte>(msg.content.kind()));

  if (msg.content.is_text()) {
    const std::string &text = msg.content.as_text();
    if (text.size() > MAX_PAYLOAD_SIZE) {
      return Error(ErrorCode::EncodingError, "Text too large");
    }
    wire::write_u32(buf, static_cast<uint32_t>(text.size()));
    buf.insert(buf.end(), text.begin(), text.end());
  } else {
    const ImageData &img = msg.content.as_image();
    if (img.data.size() > MAX_PAYLOAD_SIZE) {
      return Error(ErrorCode::EncodingError, "Image too large");
    }
    wire::write_u32(buf, img.width);
    wire::write_u32(buf, img.height);
    wire::write_u32(buf, static_cast<uint32_t>(img.data.size()));
    buf.insert(buf.end(), img.data.begin(), img.data.end());
  }

  if (buf.size() > MAX_PAYLOAD_SIZE) {
    return Error(ErrorCode::EncodingError, "Payload too large",
                 std::to_string(buf.size()) + " bytes");
  }
  return buf;
}

Result<Bytes> encode_message(const ClipboardMessage &msg) {
  auto payload = encode_payload(msg);
  if (payload.is_error()) {
    return payload.error();
  }
  return build_packet(MessageType::ClipboardPush, payload.value());
}

Result<ClipboardMessage> decode_payload(const Bytes &payload) {
  ClipboardMessage msg;
  wire::Reader reader(payload);

  uint8_t kind = 0;
  if (!reader.read_u64(msg.timestamp) || !reader.read_string(msg.sender_id) ||
      !reader.read_u8(kind)) {
    return Error(ErrorCode::DecodingError, "Clipboard message truncated");
  }

  switch (static_cast<ContentKind>(kind)) {
  case ContentKind::Text: {
    uint32_t len = 0;
    Bytes raw;
    if (!reader.read_u32(len) || !reader.read_bytes(len, raw)) {
      return Error(ErrorCode::DecodingError, "Text content truncated");
    }
    msg.content = ClipboardContent::text(std::string(raw.begin(), raw.end()));
    break;
  }
  case ContentKind::Image: {
    ImageData img;
    uint32_t len = 0;
    if (!reader.read_u32(img.width) || !reader.read_u32(img.height) ||
        !reader.read_u32(len) || !reader.read_bytes(len, img.data)) {
      return Error(ErrorCode::DecodingError, "Image content truncated");
    }
    msg.content = ClipboardContent::image(std::move(img));
    break;
  }
  default:
    return Error(ErrorCode::DecodingError, "Unknown content kind",
                 std::to_string(kind));
  }

  if (!reader.at_end()) {
    return Error(ErrorCode::DecodingError, "Trailing bytes in message",
                 std::to_string(reader.remaining()) + " bytes");
  }
  return msg;
}

Result<ClipboardMessage> decode_message(const Bytes &packet) {
  auto header = deserialize_header(packet);
  if (header.is_error()) {
    return header.error();
  }
  if (header.value().type != static_cast<uint8_t>(MessageType::ClipboardPush)) {
    return Error(ErrorCode::DecodingError, "Unexpected packet type",
                 message_type_name(
                     static_cast<MessageType>(header.value().type)));
  }
  if (packet.size() != PACKET_HEADER_SIZE + header.value().payload_size) {
    return Error(ErrorCode::DecodingError, "Packet length mismatch");
  }

  Bytes payload(packet.begin() + PACKET_HEADER_SIZE, packet.end());
  return decode_payload(payload);
}

} // namespace clipsync
