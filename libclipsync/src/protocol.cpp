/**
 * @file protocol.cpp
 * @brief clipsync wire protocol implementation
 */

#include "clipsync/protocol.h"
#include <algorithm>

namespace clipsync {

// ============================================================================
// Message Type Names
// ============================================================================

const char *message_type_name(MessageType type) {
  switch (type) {
  case MessageType::Hello:
    return "Hello";
  case MessageType::HelloAck:
    return "HelloAck";
  case MessageType::ClipboardPush:
    return "ClipboardPush";
  default:
    return "Unknown";
  }
}

// ============================================================================
// Helper Functions
// ============================================================================

namespace wire {

// Write little-endian uint16
void write_u16(Bytes &buf, uint16_t val) {
  buf.push_back(static_cast<Byte>(val & 0xFF));
  buf.push_back(static_cast<Byte>((val >> 8) & 0xFF));
}

// Write little-endian uint32
void write_u32(Bytes &buf, uint32_t val) {
  buf.push_back(static_cast<Byte>(val & 0xFF));
  buf.push_back(static_cast<Byte>((val >> 8) & 0xFF));
  buf.push_back(static_cast<Byte>((val >> 16) & 0xFF));
  buf.push_back(static_cast<Byte>((val >> 24) & 0xFF));
}

// Write little-endian uint64
void write_u64(Bytes &buf, uint64_t val) {
  for (int i = 0; i < 8; ++i) {
    buf.push_back(static_cast<Byte>((val >> (i * 8)) & 0xFF));
  }
}

bool write_string(Bytes &buf, const std::string &str) {
  if (str.size() > MAX_SHORT_STRING) {
    return false;
  }
  write_u16(buf, static_cast<uint16_t>(str.size()));
  buf.insert(buf.end(), str.begin(), str.end());
  return true;
}

bool Reader::read_u8(uint8_t &out) {
  if (remaining() < 1) {
    return false;
  }
  out = data_[offset_++];
  return true;
}

bool Reader::read_u16(uint16_t &out) {
  if (remaining() < 2) {
    return false;
  }
  const Byte *d = data_ + offset_;
  out = static_cast<uint16_t>(d[0]) | (static_cast<uint16_t>(d[1]) << 8);
  offset_ += 2;
  return true;
}

bool Reader::read_u32(uint32_t &out) {
  if (remaining() < 4) {
    return false;
  }
  const Byte *d = data_ + offset_;
  out = static_cast<uint32_t>(d[0]) | (static_cast<uint32_t>(d[1]) << 8) |
        (static_cast<uint32_t>(d[2]) << 16) |
        (static_cast<uint32_t>(d[3]) << 24);
  offset_ += 4;
  return true;
}

bool Reader::read_u64(uint64_t &out) {
  if (remaining() < 8) {
    return false;
  }
  out = 0;
  for (int i = 0; i < 8; ++i) {
    out |= static_cast<uint64_t>(data_[offset_ + i]) << (i * 8);
  }
  offset_ += 8;
  return true;
}

bool Reader::read_string(std::string &out) {
  uint16_t len = 0;
  if (!read_u16(len) || remaining() < len) {
    return false;
  }
  out.assign(reinterpret_cast<const char *>(data_ + offset_), len);
  offset_ += len;
  return true;
}

bool Reader::read_bytes(size_t count, Bytes &out) {
  if (remaining() < count) {
    return false;
  }
  out.assign(data_ + offset_, data_ + offset_ + count);
  offset_ += count;
  return true;
}

} // namespace wire

namespace {

uint32_t peek_u32(const Byte *d) {
  return static_cast<uint32_t>(d[0]) | (static_cast<uint32_t>(d[1]) << 8) |
         (static_cast<uint32_t>(d[2]) << 16) |
         (static_cast<uint32_t>(d[3]) << 24);
}

} // anonymous namespace

// ============================================================================
// PacketHeader
// ============================================================================

PacketHeader PacketHeader::create(MessageType msg_type, uint32_t payload_len) {
  PacketHeader header;
  header.magic = PROTOCOL_MAGIC;
  header.version = PROTOCOL_VERSION;
  header.type = static_cast<uint8_t>(msg_type);
  header.flags = 0;
  header.payload_size = payload_len;
  return header;
}

bool PacketHeader::is_valid() const {
  return magic == PROTOCOL_MAGIC && version == PROTOCOL_VERSION &&
         payload_size <= MAX_PAYLOAD_SIZE;
}

// ============================================================================
// Header Serialization
// ============================================================================

Bytes serialize_header(const PacketHeader &header) {
  Bytes buf;
  buf.reserve(PACKET_HEADER_SIZE);
  wire::write_u32(buf, header.magic);
  buf.push_back(header.version);
  buf.push_back(header.type);
  wire::write_u16(buf, header.flags);
  wire::write_u32(buf, header.payload_size);
  return buf;
}

Result<PacketHeader> deserialize_header(const Bytes &buf) {
  if (buf.size() < PACKET_HEADER_SIZE) {
    return Error(ErrorCode::DecodingError, "Header too short");
  }

  PacketHeader header;
  wire::Reader reader(buf.data(), PACKET_HEADER_SIZE);
  reader.read_u32(header.magic);
  reader.read_u8(header.version);
  reader.read_u8(header.type);
  reader.read_u16(header.flags);
  reader.read_u32(header.payload_size);

  if (!header.is_valid()) {
    if (header.magic != PROTOCOL_MAGIC) {
      return Error(ErrorCode::DecodingError, "Invalid magic number");
    }
    if (header.version != PROTOCOL_VERSION) {
      return Error(ErrorCode::VersionMismatch, "Protocol version mismatch",
                   "got version " + std::to_string(header.version));
    }
    return Error(ErrorCode::PayloadTooLarge, "Payload too large",
                 std::to_string(header.payload_size) + " bytes");
  }

  return header;
}

// ============================================================================
// Hello Message
// ============================================================================

Bytes serialize_hello(const HelloMessage &msg) {
  Bytes buf;
  buf.reserve(64 + msg.device_name.size());
  wire::write_array(buf, msg.peer_id.data);
  // Device names are user-supplied; clip rather than fail the handshake
  wire::write_string(buf, msg.device_name.substr(0, MAX_SHORT_STRING));
  wire::write_u16(buf, msg.listen_port);
  wire::write_u32(buf, msg.capabilities);
  return buf;
}

Result<HelloMessage> deserialize_hello(const Bytes &buf) {
  HelloMessage msg;
  wire::Reader reader(buf);

  if (!reader.read_array(msg.peer_id.data) ||
      !reader.read_string(msg.device_name) ||
      !reader.read_u16(msg.listen_port) ||
      !reader.read_u32(msg.capabilities)) {
    return Error(ErrorCode::DecodingError, "Hello message truncated");
  }
  if (!reader.at_end()) {
    return Error(ErrorCode::DecodingError, "Trailing bytes in hello message");
  }
  return msg;
}

// ============================================================================
// Packet Builder
// ============================================================================

Bytes build_packet(MessageType type, const Bytes &payload) {
  PacketHeader header =
      PacketHeader::create(type, static_cast<uint32_t>(payload.size()));
  Bytes packet = serialize_header(header);
  packet.reserve(PACKET_HEADER_SIZE + payload.size());
  packet.insert(packet.end(), payload.begin(), payload.end());
  return packet;
}

// ============================================================================
// PacketParser
// ============================================================================

void PacketParser::feed(const Bytes &data) {
  buffer_.insert(buffer_.end(), data.begin(), data.end());
}

void PacketParser::feed(const Byte *data, size_t size) {
  buffer_.insert(buffer_.end(), data, data + size);
}

bool PacketParser::has_packet() const {
  if (buffer_.size() < PACKET_HEADER_SIZE) {
    return false;
  }
  uint32_t magic = peek_u32(buffer_.data());
  uint32_t payload_size = peek_u32(buffer_.data() + 8);
  if (magic != PROTOCOL_MAGIC || buffer_[4] != PROTOCOL_VERSION ||
      payload_size > MAX_PAYLOAD_SIZE) {
    // Surface the bad header immediately
    return true;
  }
  return buffer_.size() >= PACKET_HEADER_SIZE + payload_size;
}

Result<std::pair<PacketHeader, Bytes>> PacketParser::next_packet() {
  if (!has_packet()) {
    return Error(ErrorCode::InvalidState, "No complete packet available");
  }

  Bytes header_bytes(buffer_.begin(), buffer_.begin() + PACKET_HEADER_SIZE);
  auto header_result = deserialize_header(header_bytes);
  if (header_result.is_error()) {
    // No way to resynchronize; drop what we have
    buffer_.clear();
    return header_result.error();
  }

  PacketHeader header = header_result.value();
  Bytes payload(buffer_.begin() + PACKET_HEADER_SIZE,
                buffer_.begin() + PACKET_HEADER_SIZE + header.payload_size);

  buffer_.erase(buffer_.begin(),
                buffer_.begin() + PACKET_HEADER_SIZE + header.payload_size);

  return std::make_pair(header, std::move(payload));
}

void PacketParser::reset() { buffer_.clear(); }

size_t PacketParser::buffered_size() const { return buffer_.size(); }

} // namespace clipsync
