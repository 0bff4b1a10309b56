/**
 * @file test_applier.cpp
 * @brief Unit tests for RemoteApplier
 */

#include <clipsync/applier.h>
#include <clipsync/detector.h>
#include <gtest/gtest.h>

#include "mocks/fake_clipboard.h"
#include "mocks/fake_notifier.h"

#include <thread>

using namespace clipsync;
using clipsync::fakes::FakeClipboard;
using clipsync::fakes::FakeNotifier;

namespace {

ClipboardMessage remote_text(const std::string &text) {
  return ClipboardMessage::create(ClipboardContent::text(text), "phone");
}

} // anonymous namespace

class ApplierTest : public ::testing::Test {
protected:
  MessageQueue queue;
  FakeClipboard clipboard;
  FakeNotifier notifier;
};

TEST_F(ApplierTest, WritesTextAndNotifies) {
  RemoteApplier applier(queue, clipboard, &notifier);

  EXPECT_TRUE(applier.apply(remote_text("copied on phone")));

  EXPECT_EQ(clipboard.current_text(), std::optional<std::string>("copied on phone"));
  EXPECT_EQ(applier.applied(), 1u);
  ASSERT_EQ(notifier.shown().size(), 1u);
  EXPECT_EQ(notifier.shown()[0].second, "copied on phone");
}

TEST_F(ApplierTest, WritesImage) {
  RemoteApplier applier(queue, clipboard, &notifier);

  auto msg = ClipboardMessage::create(
      ClipboardContent::image(3, 5, Bytes(10, 1)), "phone");
  EXPECT_TRUE(applier.apply(msg));

  auto image = clipboard.current_image();
  ASSERT_TRUE(image.has_value());
  EXPECT_EQ(image->width, 3u);
  EXPECT_EQ(notifier.shown()[0].second, "Image 3x5");
}

TEST_F(ApplierTest, HookRunsBeforeWrite) {
  RemoteApplier applier(queue, clipboard, nullptr);

  size_t writes_seen_by_hook = 99;
  applier.set_write_hook([&](const ClipboardContent &content) {
    EXPECT_EQ(content.as_text(), "hooked");
    writes_seen_by_hook = clipboard.writes();
  });

  EXPECT_TRUE(applier.apply(remote_text("hooked")));
  EXPECT_EQ(writes_seen_by_hook, 0u);
  EXPECT_EQ(clipboard.writes(), 1u);
}

TEST_F(ApplierTest, WriteFailureIsReported) {
  RemoteApplier applier(queue, clipboard, &notifier);
  clipboard.set_write_failure(true);

  EXPECT_FALSE(applier.apply(remote_text("lost")));
  EXPECT_EQ(applier.applied(), 0u);
  EXPECT_TRUE(notifier.shown().empty());
}

TEST_F(ApplierTest, FailedWriteWithdrawsAnnouncement) {
  RemoteApplier applier(queue, clipboard, nullptr);
  ClipboardChangeDetector detector(clipboard, [](const ClipboardContent &) {});
  applier.set_write_hook([&](const ClipboardContent &content) {
    detector.expect_remote_write(content);
  });
  applier.set_write_failed_hook([&](const ClipboardContent &content) {
    detector.cancel_remote_write(content);
  });
  clipboard.set_write_failure(true);

  EXPECT_FALSE(applier.apply(remote_text("never lands")));

  // Local copies are broadcast immediately, not held back by the grace period
  clipboard.set_text("typed locally");
  EXPECT_EQ(detector.tick(), TickOutcome::BroadcastText);
}

TEST_F(ApplierTest, WriteFailedHookNotCalledOnSuccess) {
  RemoteApplier applier(queue, clipboard, nullptr);
  bool withdrawn = false;
  applier.set_write_failed_hook(
      [&](const ClipboardContent &) { withdrawn = true; });

  EXPECT_TRUE(applier.apply(remote_text("lands")));
  EXPECT_FALSE(withdrawn);
}

TEST_F(ApplierTest, NotificationsCanBeDisabled) {
  ApplierOptions options;
  options.notify = false;
  RemoteApplier applier(queue, clipboard, &notifier, options);

  EXPECT_TRUE(applier.apply(remote_text("quiet")));
  EXPECT_TRUE(notifier.shown().empty());
}

TEST_F(ApplierTest, NotifierFailureDoesNotFailApply) {
  RemoteApplier applier(queue, clipboard, &notifier);
  notifier.set_failure(true);

  EXPECT_TRUE(applier.apply(remote_text("still applied")));
  EXPECT_EQ(applier.applied(), 1u);
}

TEST_F(ApplierTest, PreviewIsTruncated) {
  ApplierOptions options;
  options.preview_length = 4;
  RemoteApplier applier(queue, clipboard, &notifier, options);

  EXPECT_TRUE(applier.apply(remote_text("abcdefgh")));
  EXPECT_EQ(notifier.shown()[0].second, "abcd...");
}

TEST_F(ApplierTest, RunAppliesQueueInOrder) {
  ApplierOptions options;
  options.pop_timeout = std::chrono::milliseconds(10);
  RemoteApplier applier(queue, clipboard, nullptr, options);

  queue.push(remote_text("one"));
  queue.push(remote_text("two"));
  queue.close();

  CancellationToken cancel;
  applier.run(cancel);

  EXPECT_EQ(applier.applied(), 2u);
  EXPECT_EQ(clipboard.current_text(), std::optional<std::string>("two"));
}
