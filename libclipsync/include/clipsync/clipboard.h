/**
 * @file clipboard.h
 * @brief Local clipboard access
 *
 * The sync engine reads and writes the clipboard only through
 * ClipboardBackend, so tests can substitute an in-memory clipboard.
 */

#ifndef CLIPSYNC_CLIPBOARD_H
#define CLIPSYNC_CLIPBOARD_H

#include "clipsync/error.h"
#include "clipsync/message.h"
#include "clipsync/types.h"
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace clipsync {

// ============================================================================
// Content Classification
// ============================================================================

/**
 * @brief What the clipboard currently offers
 */
enum class ClipboardContentType { Empty, Text, Image };

/**
 * @brief Get human-readable name for a content type
 */
CLIPSYNC_API const char *content_type_name(ClipboardContentType type);

// ============================================================================
// Backend Interface
// ============================================================================

/**
 * @brief Clipboard collaborator
 *
 * Implementations may be called from the detector and the applier threads
 * concurrently and must tolerate that.
 */
class ClipboardBackend {
public:
  virtual ~ClipboardBackend() = default;

  /// Classify the current clipboard content without reading it in full
  virtual Result<ClipboardContentType> classify() = 0;

  virtual Result<std::string> read_text() = 0;
  virtual Result<void> write_text(const std::string &text) = 0;

  /// Current image, or std::nullopt if the clipboard holds no image
  virtual Result<std::optional<ImageData>> read_image() = 0;
  virtual Result<void> write_image(const ImageData &image) = 0;
};

// ============================================================================
// Helpers
// ============================================================================

/**
 * @brief Read width and height from a PNG's IHDR chunk
 * @return (width, height) or DecodingError if @p png is not a PNG
 */
CLIPSYNC_API Result<std::pair<uint32_t, uint32_t>>
png_dimensions(const Bytes &png);

/**
 * @brief Create the clipboard backend for this desktop session
 *
 * Wayland uses wl-clipboard; X11 uses xclip (xsel for text as fallback).
 * Fails with NotSupported when no display server is reachable and with
 * ClipboardToolMissing when the required tools are not installed.
 */
CLIPSYNC_API Result<std::unique_ptr<ClipboardBackend>> create_system_clipboard();

} // namespace clipsync

#endif // CLIPSYNC_CLIPBOARD_H
