/**
 * @file detector.cpp
 * @brief ClipboardChangeDetector implementation
 */

#include "clipsync/detector.h"
#include <spdlog/spdlog.h>

namespace clipsync {

const char *tick_outcome_name(TickOutcome outcome) {
  switch (outcome) {
  case TickOutcome::Unchanged:
    return "Unchanged";
  case TickOutcome::BroadcastText:
    return "BroadcastText";
  case TickOutcome::BroadcastImage:
    return "BroadcastImage";
  case TickOutcome::Cleared:
    return "Cleared";
  case TickOutcome::Skipped:
    return "Skipped";
  case TickOutcome::ReadFailed:
    return "ReadFailed";
  default:
    return "Unknown";
  }
}

ClipboardChangeDetector::ClipboardChangeDetector(ClipboardBackend &clipboard,
                                                 BroadcastSink sink,
                                                 DetectorOptions options)
    : clipboard_(clipboard), sink_(std::move(sink)), options_(options) {}

// ============================================================================
// Remote Write Hand-off
// ============================================================================

void ClipboardChangeDetector::expect_remote_write(
    const ClipboardContent &content) {
  std::lock_guard<std::mutex> lock(pending_mutex_);
  pending_remote_ = PendingWrite{
      content, std::chrono::steady_clock::now() + options_.remote_write_grace};
}

void ClipboardChangeDetector::cancel_remote_write(
    const ClipboardContent &content) {
  std::lock_guard<std::mutex> lock(pending_mutex_);
  if (pending_remote_ && pending_remote_->content == content) {
    pending_remote_.reset();
  }
}

std::optional<ClipboardChangeDetector::PendingWrite>
ClipboardChangeDetector::take_pending() {
  std::lock_guard<std::mutex> lock(pending_mutex_);
  if (!pending_remote_) {
    return std::nullopt;
  }
  if (std::chrono::steady_clock::now() >= pending_remote_->expires) {
    spdlog::debug("Announced remote write never appeared, resuming polling");
    pending_remote_.reset();
    return std::nullopt;
  }
  std::optional<PendingWrite> pending = std::move(pending_remote_);
  pending_remote_.reset();
  return pending;
}

void ClipboardChangeDetector::put_back_pending(PendingWrite pending) {
  std::lock_guard<std::mutex> lock(pending_mutex_);
  // A newer announcement wins
  if (!pending_remote_) {
    pending_remote_ = std::move(pending);
  }
}

// ============================================================================
// State
// ============================================================================

ClipboardState ClipboardChangeDetector::state() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return state_;
}

void ClipboardChangeDetector::update_state(const std::string *text,
                                           ClipboardContentType type) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  if (text) {
    state_.last_text = *text;
  }
  state_.last_content_type = type;
}

// ============================================================================
// Polling
// ============================================================================

TickOutcome ClipboardChangeDetector::tick() {
  auto type = clipboard_.classify();
  if (type.is_error()) {
    spdlog::warn("Clipboard classification failed: {}",
                 type.error().to_string());
    return TickOutcome::ReadFailed;
  }

  auto pending = take_pending();

  // Only the polling thread writes state_, so reading it unlocked is safe
  switch (type.value()) {
  case ClipboardContentType::Text: {
    auto text = clipboard_.read_text();
    if (text.is_error()) {
      if (pending) {
        put_back_pending(std::move(*pending));
      }
      spdlog::warn("Clipboard read failed: {}", text.error().to_string());
      return TickOutcome::ReadFailed;
    }
    const std::string &current = text.value();

    if (pending) {
      if (pending->content.is_text() && pending->content.as_text() == current) {
        update_state(&current, ClipboardContentType::Text);
        spdlog::debug("Adopted remote text as clipboard state");
      } else {
        put_back_pending(std::move(*pending));
      }
      return TickOutcome::Unchanged;
    }

    if (current.empty() || current == state_.last_text) {
      return TickOutcome::Unchanged;
    }

    update_state(&current, ClipboardContentType::Text);
    if (!options_.share_text) {
      spdlog::debug("Text sharing disabled, not broadcasting");
      return TickOutcome::Skipped;
    }

    spdlog::info("Clipboard text changed: {}",
                 preview(ClipboardContent::text(current), 50));
    sink_(ClipboardContent::text(current));
    return TickOutcome::BroadcastText;
  }

  case ClipboardContentType::Image: {
    if (pending) {
      if (pending->content.is_image()) {
        update_state(nullptr, ClipboardContentType::Image);
        spdlog::debug("Adopted remote image as clipboard state");
      } else {
        put_back_pending(std::move(*pending));
      }
      return TickOutcome::Unchanged;
    }

    if (state_.last_content_type == ClipboardContentType::Image) {
      return TickOutcome::Unchanged;
    }

    if (!options_.share_images) {
      update_state(nullptr, ClipboardContentType::Image);
      spdlog::debug("Image sharing disabled, not broadcasting");
      return TickOutcome::Skipped;
    }

    auto image = clipboard_.read_image();
    if (image.is_error()) {
      spdlog::warn("Clipboard image read failed: {}",
                   image.error().to_string());
      return TickOutcome::ReadFailed;
    }
    if (!image.value()) {
      // Image vanished between classify and read; look again next tick
      return TickOutcome::Unchanged;
    }

    const ImageData &img = *image.value();
    update_state(nullptr, ClipboardContentType::Image);
    if (img.data.size() > options_.max_image_size) {
      spdlog::warn("Clipboard image {}x{} is {} bytes, over the {} byte "
                   "limit; not sharing",
                   img.width, img.height, img.data.size(),
                   options_.max_image_size);
      return TickOutcome::Skipped;
    }

    spdlog::info("Clipboard image changed: {}x{} ({} bytes)", img.width,
                 img.height, img.data.size());
    sink_(ClipboardContent::image(img));
    return TickOutcome::BroadcastImage;
  }

  case ClipboardContentType::Empty:
  default:
    if (pending) {
      // The write has not landed yet
      put_back_pending(std::move(*pending));
      return TickOutcome::Unchanged;
    }
    if (state_.last_content_type != ClipboardContentType::Empty) {
      std::string cleared;
      update_state(&cleared, ClipboardContentType::Empty);
      spdlog::debug("Clipboard cleared");
      return TickOutcome::Cleared;
    }
    return TickOutcome::Unchanged;
  }
}

void ClipboardChangeDetector::run(CancellationToken &cancel) {
  spdlog::info("Watching clipboard every {} ms",
               options_.poll_interval.count());

  while (!cancel.is_cancelled()) {
    tick();
    if (cancel.wait_for(options_.poll_interval)) {
      break;
    }
  }

  spdlog::debug("Clipboard watcher stopped");
}

} // namespace clipsync
