/**
 * @file cancellation.h
 * @brief Process-wide cancellation flag shared by every loop
 */

#ifndef CLIPSYNC_CANCELLATION_H
#define CLIPSYNC_CANCELLATION_H

#include "clipsync/platform.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace clipsync {

/**
 * @brief One-shot cancellation signal
 *
 * Loops call wait_for() instead of sleeping so cancel() wakes them at once.
 * cancel() is async-signal-unsafe; signal handlers set a flag that the main
 * thread turns into cancel().
 */
class CLIPSYNC_API CancellationToken {
public:
  CancellationToken() = default;

  // Non-copyable
  CancellationToken(const CancellationToken &) = delete;
  CancellationToken &operator=(const CancellationToken &) = delete;

  /// Request cancellation and wake all waiters (idempotent)
  void cancel();

  bool is_cancelled() const { return cancelled_.load(); }

  /**
   * @brief Sleep for up to @p timeout
   * @return true if cancelled before or during the wait
   */
  bool wait_for(std::chrono::milliseconds timeout);

private:
  std::atomic<bool> cancelled_{false};
  std::mutex mutex_;
  std::condition_variable cv_;
};

} // namespace clipsync

#endif // CLIPSYNC_CANCELLATION_H
