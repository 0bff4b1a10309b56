/**
 * @file event_queue.h
 * @brief Unbounded multi-producer blocking queue
 */

#ifndef CLIPSYNC_EVENT_QUEUE_H
#define CLIPSYNC_EVENT_QUEUE_H

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace clipsync {

/**
 * @brief FIFO handing events from I/O threads to a consumer loop
 *
 * Once closed, push() is a no-op and pops drain what is left, then return
 * std::nullopt immediately.
 */
template <typename T> class BlockingQueue {
public:
  BlockingQueue() = default;

  BlockingQueue(const BlockingQueue &) = delete;
  BlockingQueue &operator=(const BlockingQueue &) = delete;

  /// Enqueue an item; returns false if the queue is closed
  bool push(T item) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (closed_) {
        return false;
      }
      items_.push_back(std::move(item));
    }
    cv_.notify_one();
    return true;
  }

  /// Wait up to @p timeout for an item
  std::optional<T> pop_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return closed_ || !items_.empty(); });
    return take_locked();
  }

  /// Non-blocking pop
  std::optional<T> try_pop() {
    std::lock_guard<std::mutex> lock(mutex_);
    return take_locked();
  }

  /// Stop accepting items and wake every waiter
  void close() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
    }
    cv_.notify_all();
  }

  bool is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
  }

private:
  std::optional<T> take_locked() {
    if (items_.empty()) {
      return std::nullopt;
    }
    T item = std::move(items_.front());
    items_.pop_front();
    return item;
  }

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<T> items_;
  bool closed_ = false;
};

} // namespace clipsync

#endif // CLIPSYNC_EVENT_QUEUE_H
