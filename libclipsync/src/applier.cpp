/**
 * @file applier.cpp
 * @brief RemoteApplier implementation
 */

#include "clipsync/applier.h"
#include <spdlog/spdlog.h>

namespace clipsync {

RemoteApplier::RemoteApplier(MessageQueue &queue, ClipboardBackend &clipboard,
                             Notifier *notifier, ApplierOptions options)
    : queue_(queue), clipboard_(clipboard), notifier_(notifier),
      options_(options) {}

bool RemoteApplier::apply(const ClipboardMessage &msg) {
  if (write_hook_) {
    write_hook_(msg.content);
  }

  Result<void> written = msg.content.is_text()
                             ? clipboard_.write_text(msg.content.as_text())
                             : clipboard_.write_image(msg.content.as_image());
  if (written.is_error()) {
    if (write_failed_hook_) {
      write_failed_hook_(msg.content);
    }
    spdlog::warn("Failed to apply clipboard from {}: {}", msg.sender_id,
                 written.error().to_string());
    return false;
  }

  ++applied_;
  std::string summary = preview(msg.content, options_.preview_length);
  spdlog::info("Clipboard updated from {}: {}", msg.sender_id, summary);

  if (options_.notify && notifier_) {
    auto shown = notifier_->notify("Clipboard synced", summary);
    if (shown.is_error()) {
      spdlog::debug("Notification failed: {}", shown.error().to_string());
    }
  }
  return true;
}

void RemoteApplier::run(CancellationToken &cancel) {
  while (!cancel.is_cancelled()) {
    auto msg = queue_.pop_for(options_.pop_timeout);
    if (msg) {
      apply(*msg);
    } else if (queue_.is_closed()) {
      break;
    }
  }
  spdlog::debug("Remote applier stopped after {} update(s)", applied_);
}

} // namespace clipsync
