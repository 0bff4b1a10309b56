/**
 * @file message.h
 * @brief Clipboard content and the ClipboardPush message codec
 */

#ifndef CLIPSYNC_MESSAGE_H
#define CLIPSYNC_MESSAGE_H

#include "clipsync/error.h"
#include "clipsync/types.h"
#include <cstdint>
#include <string>
#include <variant>

namespace clipsync {

// ============================================================================
// Clipboard Content
// ============================================================================

/**
 * @brief Raster image held on the clipboard (PNG-encoded)
 */
struct ImageData {
  uint32_t width = 0;
  uint32_t height = 0;
  Bytes data; // PNG bytes

  bool operator==(const ImageData &other) const {
    return width == other.width && height == other.height &&
           data == other.data;
  }
};

/// Wire tag of the content variant
enum class ContentKind : uint8_t { Text = 1, Image = 2 };

/**
 * @brief Tagged clipboard payload: text or image, never both
 */
class CLIPSYNC_API ClipboardContent {
public:
  ClipboardContent() : value_(std::string()) {}

  static ClipboardContent text(std::string value);
  static ClipboardContent image(ImageData value);
  static ClipboardContent image(uint32_t width, uint32_t height, Bytes png);

  ContentKind kind() const {
    return is_text() ? ContentKind::Text : ContentKind::Image;
  }
  bool is_text() const { return std::holds_alternative<std::string>(value_); }
  bool is_image() const { return std::holds_alternative<ImageData>(value_); }

  /// Undefined behavior if the content is not text
  const std::string &as_text() const { return std::get<std::string>(value_); }
  /// Undefined behavior if the content is not an image
  const ImageData &as_image() const { return std::get<ImageData>(value_); }

  bool operator==(const ClipboardContent &other) const {
    return value_ == other.value_;
  }
  bool operator!=(const ClipboardContent &other) const {
    return !(*this == other);
  }

private:
  std::variant<std::string, ImageData> value_;
};

/**
 * @brief Short human-facing summary of clipboard content
 *
 * Text is cut to @p max_length Unicode code points with "..." appended when
 * cut; images render as "Image WxH".
 */
CLIPSYNC_API std::string preview(const ClipboardContent &content,
                                 size_t max_length);

// ============================================================================
// Clipboard Message
// ============================================================================

/**
 * @brief One clipboard change travelling between peers
 */
struct ClipboardMessage {
  ClipboardContent content;
  uint64_t timestamp = 0; // Seconds since the Unix epoch
  std::string sender_id;  // Sender's device name

  /// Stamp content with the current time
  static ClipboardMessage create(ClipboardContent content,
                                 std::string sender_id);
};

/// Current time in seconds since the Unix epoch
CLIPSYNC_API uint64_t unix_timestamp_now();

// ============================================================================
// Codec
// ============================================================================

/**
 * @brief Encode a message as one framed ClipboardPush packet
 *
 * Deterministic. Fails with EncodingError only when the sender id exceeds
 * 65535 bytes or the payload exceeds MAX_PAYLOAD_SIZE.
 */
CLIPSYNC_API Result<Bytes> encode_message(const ClipboardMessage &msg);

/**
 * @brief Encode only the ClipboardPush payload (no packet header)
 */
CLIPSYNC_API Result<Bytes> encode_payload(const ClipboardMessage &msg);

/**
 * @brief Decode one framed ClipboardPush packet
 *
 * Fails with DecodingError (or VersionMismatch / PayloadTooLarge from the
 * header check) on malformed input, including trailing bytes.
 */
CLIPSYNC_API Result<ClipboardMessage> decode_message(const Bytes &packet);

/**
 * @brief Decode a ClipboardPush payload whose header was already consumed
 */
CLIPSYNC_API Result<ClipboardMessage> decode_payload(const Bytes &payload);

} // namespace clipsync

#endif // CLIPSYNC_MESSAGE_H
