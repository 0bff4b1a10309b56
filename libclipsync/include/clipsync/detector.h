/**
 * @file detector.h
 * @brief Polling loop that turns local clipboard changes into broadcasts
 */

#ifndef CLIPSYNC_DETECTOR_H
#define CLIPSYNC_DETECTOR_H

#include "clipsync/cancellation.h"
#include "clipsync/clipboard.h"
#include "clipsync/message.h"
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace clipsync {

/**
 * @brief Detector-private memory of what was last seen
 */
struct ClipboardState {
  std::string last_text;
  ClipboardContentType last_content_type = ClipboardContentType::Empty;
};

/**
 * @brief Result of one polling tick
 */
enum class TickOutcome {
  Unchanged,      // Nothing new
  BroadcastText,  // New text handed to the sink
  BroadcastImage, // New image handed to the sink
  Cleared,        // Clipboard became empty
  Skipped,        // New content filtered out by configuration
  ReadFailed      // Clipboard could not be read; retried next tick
};

const char *tick_outcome_name(TickOutcome outcome);

/**
 * @brief Detector tuning
 */
struct DetectorOptions {
  std::chrono::milliseconds poll_interval{500};
  bool share_text = true;
  bool share_images = true;
  size_t max_image_size = 16 * 1024 * 1024; // bytes of PNG data
  /// How long an announced remote write may take to show up locally
  std::chrono::milliseconds remote_write_grace{2000};
};

/**
 * @brief Fixed-interval clipboard poller
 *
 * Broadcasts text once per distinct non-empty value. Images are broadcast
 * only on a transition into the Image type, so replacing one image with
 * another goes unnoticed until the clipboard holds something else in
 * between.
 *
 * Content about to be written on behalf of a peer is announced through
 * expect_remote_write() before the write. While the announcement is
 * pending, ticks do not broadcast; once the clipboard shows the announced
 * content it is adopted as current state instead of being sent back out.
 * An announcement that never shows up expires after remote_write_grace.
 */
class CLIPSYNC_API ClipboardChangeDetector {
public:
  /// Receives content that should be broadcast
  using BroadcastSink = std::function<void(const ClipboardContent &)>;

  ClipboardChangeDetector(ClipboardBackend &clipboard, BroadcastSink sink,
                          DetectorOptions options = DetectorOptions());

  /// Run one poll; called by run() and directly by tests
  TickOutcome tick();

  /// Poll every interval until @p cancel fires
  void run(CancellationToken &cancel);

  /// Announce content about to be written locally on behalf of a peer
  void expect_remote_write(const ClipboardContent &content);

  /// Withdraw an announcement whose write failed; no-op if it was replaced
  void cancel_remote_write(const ClipboardContent &content);

  /// Copy of the detector's state (for diagnostics and tests)
  ClipboardState state() const;

private:
  struct PendingWrite {
    ClipboardContent content;
    std::chrono::steady_clock::time_point expires;
  };

  /// Pending remote write, dropped once expired
  std::optional<PendingWrite> take_pending();
  void put_back_pending(PendingWrite pending);

  void update_state(const std::string *text, ClipboardContentType type);

  ClipboardBackend &clipboard_;
  BroadcastSink sink_;
  DetectorOptions options_;

  mutable std::mutex state_mutex_;
  ClipboardState state_;

  std::mutex pending_mutex_;
  std::optional<PendingWrite> pending_remote_;
};

} // namespace clipsync

#endif // CLIPSYNC_DETECTOR_H
