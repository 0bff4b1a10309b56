/**
 * @file fake_clipboard.h
 * @brief In-memory ClipboardBackend for tests
 */

#ifndef CLIPSYNC_TESTS_FAKE_CLIPBOARD_H
#define CLIPSYNC_TESTS_FAKE_CLIPBOARD_H

#include <clipsync/clipboard.h>
#include <mutex>
#include <optional>
#include <string>

namespace clipsync {
namespace fakes {

/**
 * @brief Clipboard holding text, an image, or nothing
 *
 * Safe to share between a test thread and the service threads.
 */
class FakeClipboard : public ClipboardBackend {
public:
  // ========================================================================
  // Scripting
  // ========================================================================

  void set_text(const std::string &text) {
    std::lock_guard<std::mutex> lock(mutex_);
    text_ = text;
    image_.reset();
  }

  void set_image(const ImageData &image) {
    std::lock_guard<std::mutex> lock(mutex_);
    image_ = image;
    text_.reset();
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    text_.reset();
    image_.reset();
  }

  /// Make every read fail until switched back
  void set_read_failure(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_reads_ = fail;
  }

  void set_write_failure(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_writes_ = fail;
  }

  std::optional<std::string> current_text() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return text_;
  }

  std::optional<ImageData> current_image() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return image_;
  }

  size_t writes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return writes_;
  }

  // ========================================================================
  // ClipboardBackend
  // ========================================================================

  Result<ClipboardContentType> classify() override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fail_reads_) {
      return Error(ErrorCode::ClipboardAccessError, "Scripted failure");
    }
    if (text_) {
      return ClipboardContentType::Text;
    }
    if (image_) {
      return ClipboardContentType::Image;
    }
    return ClipboardContentType::Empty;
  }

  Result<std::string> read_text() override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fail_reads_) {
      return Error(ErrorCode::ClipboardAccessError, "Scripted failure");
    }
    if (!text_) {
      return Error(ErrorCode::ClipboardEmpty, "No text");
    }
    return *text_;
  }

  Result<void> write_text(const std::string &text) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fail_writes_) {
      return Error(ErrorCode::ClipboardAccessError, "Scripted failure");
    }
    text_ = text;
    image_.reset();
    ++writes_;
    return Result<void>::ok();
  }

  Result<std::optional<ImageData>> read_image() override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fail_reads_) {
      return Error(ErrorCode::ClipboardAccessError, "Scripted failure");
    }
    return image_;
  }

  Result<void> write_image(const ImageData &image) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fail_writes_) {
      return Error(ErrorCode::ClipboardAccessError, "Scripted failure");
    }
    image_ = image;
    text_.reset();
    ++writes_;
    return Result<void>::ok();
  }

private:
  mutable std::mutex mutex_;
  std::optional<std::string> text_;
  std::optional<ImageData> image_;
  bool fail_reads_ = false;
  bool fail_writes_ = false;
  size_t writes_ = 0;
};

} // namespace fakes
} // namespace clipsync

#endif // CLIPSYNC_TESTS_FAKE_CLIPBOARD_H
