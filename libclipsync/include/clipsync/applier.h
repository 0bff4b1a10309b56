/**
 * @file applier.h
 * @brief Writes messages received from peers into the local clipboard
 */

#ifndef CLIPSYNC_APPLIER_H
#define CLIPSYNC_APPLIER_H

#include "clipsync/cancellation.h"
#include "clipsync/clipboard.h"
#include "clipsync/inbound.h"
#include "clipsync/notification.h"
#include <chrono>
#include <functional>

namespace clipsync {

/**
 * @brief Applier tuning
 */
struct ApplierOptions {
  bool notify = true;
  size_t preview_length = 50;
  std::chrono::milliseconds pop_timeout{200};
};

/**
 * @brief Consumer end of the MessageQueue
 *
 * Messages are applied strictly in queue order. Clipboard write failures
 * are logged and the next message is processed; notification failures are
 * logged at debug level and otherwise ignored.
 */
class CLIPSYNC_API RemoteApplier {
public:
  /// Called with content right before it is written to the clipboard
  using WriteHook = std::function<void(const ClipboardContent &)>;

  RemoteApplier(MessageQueue &queue, ClipboardBackend &clipboard,
                Notifier *notifier, ApplierOptions options = ApplierOptions());

  /// Install the echo-suppression hook (ClipboardChangeDetector)
  void set_write_hook(WriteHook hook) { write_hook_ = std::move(hook); }

  /// Called with content whose clipboard write failed after the write hook
  void set_write_failed_hook(WriteHook hook) {
    write_failed_hook_ = std::move(hook);
  }

  /// Write one message to the clipboard; true on success
  bool apply(const ClipboardMessage &msg);

  /// Drain the queue until @p cancel fires or the queue is closed
  void run(CancellationToken &cancel);

  size_t applied() const { return applied_; }

private:
  MessageQueue &queue_;
  ClipboardBackend &clipboard_;
  Notifier *notifier_;
  ApplierOptions options_;
  WriteHook write_hook_;
  WriteHook write_failed_hook_;
  size_t applied_ = 0;
};

} // namespace clipsync

#endif // CLIPSYNC_APPLIER_H
