/**
 * @file clipboard.cpp
 * @brief Platform-independent clipboard helpers
 */

#include "clipsync/clipboard.h"
#include "platform/linux/clipboard_linux.h"
#include <cstring>

namespace clipsync {

const char *content_type_name(ClipboardContentType type) {
  switch (type) {
  case ClipboardContentType::Empty:
    return "Empty";
  case ClipboardContentType::Text:
    return "Text";
  case ClipboardContentType::Image:
    return "Image";
  default:
    return "Unknown";
  }
}

// ============================================================================
// PNG Header
// ============================================================================

namespace {

const Byte PNG_SIGNATURE[8] = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'};

uint32_t read_be32(const Byte *d) {
  return (static_cast<uint32_t>(d[0]) << 24) |
         (static_cast<uint32_t>(d[1]) << 16) |
         (static_cast<uint32_t>(d[2]) << 8) | static_cast<uint32_t>(d[3]);
}

} // anonymous namespace

Result<std::pair<uint32_t, uint32_t>> png_dimensions(const Bytes &png) {
  // signature(8) | length(4) | "IHDR"(4) | width(4) | height(4)
  if (png.size() < 24) {
    return Error(ErrorCode::DecodingError, "PNG data too short");
  }
  if (std::memcmp(png.data(), PNG_SIGNATURE, sizeof(PNG_SIGNATURE)) != 0) {
    return Error(ErrorCode::DecodingError, "Missing PNG signature");
  }
  if (std::memcmp(png.data() + 12, "IHDR", 4) != 0) {
    return Error(ErrorCode::DecodingError, "First PNG chunk is not IHDR");
  }

  uint32_t width = read_be32(png.data() + 16);
  uint32_t height = read_be32(png.data() + 20);
  if (width == 0 || height == 0) {
    return Error(ErrorCode::DecodingError, "PNG has zero dimension");
  }
  return std::make_pair(width, height);
}

// ============================================================================
// Factory
// ============================================================================

Result<std::unique_ptr<ClipboardBackend>> create_system_clipboard() {
  auto clipboard = platform::SystemClipboard::create();
  if (clipboard.is_error()) {
    return clipboard.error();
  }
  return std::unique_ptr<ClipboardBackend>(std::move(clipboard).value());
}

} // namespace clipsync
