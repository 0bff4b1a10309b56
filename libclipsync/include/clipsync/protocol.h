/**
 * @file protocol.h
 * @brief clipsync wire protocol definitions
 *
 * Defines the packet framing shared by the handshake and clipboard streams.
 * All multi-byte values are little-endian.
 */

#ifndef CLIPSYNC_PROTOCOL_H
#define CLIPSYNC_PROTOCOL_H

#include "clipsync/error.h"
#include "clipsync/types.h"
#include <algorithm>
#include <array>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace clipsync {

// ============================================================================
// Protocol Constants
// ============================================================================

/// Protocol magic number: "CSYN" in little-endian
constexpr uint32_t PROTOCOL_MAGIC = 0x4E595343;

/// Current protocol version
constexpr uint8_t PROTOCOL_VERSION = 1;

/// Maximum payload size (64 MB, enough for a full-screen PNG)
constexpr uint32_t MAX_PAYLOAD_SIZE = 64 * 1024 * 1024;

/// Header size in bytes
constexpr size_t PACKET_HEADER_SIZE = 12;

/// Maximum length of a u16-prefixed string
constexpr size_t MAX_SHORT_STRING = 65535;

// ============================================================================
// Message Types
// ============================================================================

/**
 * @brief Protocol message type identifiers
 */
enum class MessageType : uint8_t {
  // ---- Handshake (0x01-0x0F) ----
  /// Initial connection hello
  Hello = 0x01,
  /// Hello acknowledgment with the responder's identity
  HelloAck = 0x02,

  // ---- Clipboard (0x50-0x5F) ----
  /// Clipboard content push
  ClipboardPush = 0x50
};

/**
 * @brief Get human-readable name for message type
 */
CLIPSYNC_API const char *message_type_name(MessageType type);

// ============================================================================
// Packet Header
// ============================================================================

/**
 * @brief Wire format packet header (12 bytes)
 *
 * Layout:
 *   Offset  Size  Field
 *   0       4     magic (0x4E595343 = "CSYN")
 *   4       1     version
 *   5       1     type (MessageType)
 *   6       2     flags (reserved)
 *   8       4     payload_size
 */
struct PacketHeader {
  uint32_t magic = PROTOCOL_MAGIC;
  uint8_t version = PROTOCOL_VERSION;
  uint8_t type = 0;
  uint16_t flags = 0;
  uint32_t payload_size = 0;

  /// Create header for a message type
  static PacketHeader create(MessageType msg_type, uint32_t payload_len);

  /// Validate header fields
  bool is_valid() const;
};

// ============================================================================
// Handshake Payload
// ============================================================================

/**
 * @brief Hello / HelloAck payload
 *
 * Layout: peer_id[32] | device_name (u16 len) | listen_port u16 |
 * capabilities u32
 */
struct HelloMessage {
  PeerId peer_id;
  std::string device_name;
  uint16_t listen_port = 0;
  uint32_t capabilities = 0; // Bitmask of supported content

  enum Capability : uint32_t { CAP_TEXT = 1 << 0, CAP_IMAGE = 1 << 1 };
};

// ============================================================================
// Byte Helpers
// ============================================================================

namespace wire {

void write_u16(Bytes &buf, uint16_t val);
void write_u32(Bytes &buf, uint32_t val);
void write_u64(Bytes &buf, uint64_t val);

/// Write u16 length-prefixed string; fails if longer than MAX_SHORT_STRING
bool write_string(Bytes &buf, const std::string &str);

template <size_t N>
void write_array(Bytes &buf, const std::array<Byte, N> &arr) {
  buf.insert(buf.end(), arr.begin(), arr.end());
}

/**
 * @brief Bounds-checked little-endian reader over a byte range
 *
 * Every read returns false once the input is exhausted; the reader never
 * reads past the end.
 */
class Reader {
public:
  Reader(const Byte *data, size_t size) : data_(data), size_(size) {}
  explicit Reader(const Bytes &buf) : Reader(buf.data(), buf.size()) {}

  bool read_u8(uint8_t &out);
  bool read_u16(uint16_t &out);
  bool read_u32(uint32_t &out);
  bool read_u64(uint64_t &out);
  bool read_string(std::string &out);
  bool read_bytes(size_t count, Bytes &out);

  template <size_t N> bool read_array(std::array<Byte, N> &out) {
    if (remaining() < N) {
      return false;
    }
    std::copy(data_ + offset_, data_ + offset_ + N, out.begin());
    offset_ += N;
    return true;
  }

  size_t remaining() const { return size_ - offset_; }
  bool at_end() const { return offset_ == size_; }

private:
  const Byte *data_;
  size_t size_;
  size_t offset_ = 0;
};

} // namespace wire

// ============================================================================
// Serialization
// ============================================================================

/**
 * @brief Serialize packet header to bytes
 */
CLIPSYNC_API Bytes serialize_header(const PacketHeader &header);

/**
 * @brief Deserialize packet header from bytes
 */
CLIPSYNC_API Result<PacketHeader> deserialize_header(const Bytes &data);

/**
 * @brief Serialize hello message
 */
CLIPSYNC_API Bytes serialize_hello(const HelloMessage &msg);

/**
 * @brief Deserialize hello message
 */
CLIPSYNC_API Result<HelloMessage> deserialize_hello(const Bytes &data);

// ============================================================================
// Packet Builder
// ============================================================================

/**
 * @brief Build a complete packet (header + payload)
 */
CLIPSYNC_API Bytes build_packet(MessageType type, const Bytes &payload);

/**
 * @brief Parse incoming data stream for complete packets
 *
 * A header that fails validation makes the buffered bytes unusable: the
 * parser reports it once through next_packet() and drops everything it
 * holds, so a corrupt stream cannot grow the buffer without bound.
 */
class CLIPSYNC_API PacketParser {
public:
  PacketParser() = default;

  /**
   * @brief Feed data into parser
   * @param data Incoming bytes
   */
  void feed(const Bytes &data);
  void feed(const Byte *data, size_t size);

  /**
   * @brief Check if a complete packet (or a bad header) is available
   */
  bool has_packet() const;

  /**
   * @brief Get next complete packet
   * @return Pair of (header, payload) or error
   */
  Result<std::pair<PacketHeader, Bytes>> next_packet();

  /**
   * @brief Reset parser state
   */
  void reset();

  /**
   * @brief Get buffered data size
   */
  size_t buffered_size() const;

private:
  Bytes buffer_;
};

} // namespace clipsync

#endif // CLIPSYNC_PROTOCOL_H
