/**
 * @file cancellation.cpp
 * @brief CancellationToken implementation
 */

#include "clipsync/cancellation.h"

namespace clipsync {

void CancellationToken::cancel() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_.store(true);
  }
  cv_.notify_all();
}

bool CancellationToken::wait_for(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  return cv_.wait_for(lock, timeout, [this] { return cancelled_.load(); });
}

} // namespace clipsync
