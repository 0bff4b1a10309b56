/**
 * @file fake_notifier.h
 * @brief Notifier that records what it was asked to show
 */

#ifndef CLIPSYNC_TESTS_FAKE_NOTIFIER_H
#define CLIPSYNC_TESTS_FAKE_NOTIFIER_H

#include <clipsync/notification.h>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace clipsync {
namespace fakes {

class FakeNotifier : public Notifier {
public:
  Result<void> notify(const std::string &title,
                      const std::string &body) override {
    std::lock_guard<std::mutex> lock(mutex_);
    shown_.emplace_back(title, body);
    if (fail_) {
      return Error(ErrorCode::NotificationError, "Scripted failure");
    }
    return Result<void>::ok();
  }

  void set_failure(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_ = fail;
  }

  std::vector<std::pair<std::string, std::string>> shown() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return shown_;
  }

private:
  mutable std::mutex mutex_;
  std::vector<std::pair<std::string, std::string>> shown_;
  bool fail_ = false;
};

} // namespace fakes
} // namespace clipsync

#endif // CLIPSYNC_TESTS_FAKE_NOTIFIER_H
