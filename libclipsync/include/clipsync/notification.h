/**
 * @file notification.h
 * @brief Desktop notifications for received clipboard content
 */

#ifndef CLIPSYNC_NOTIFICATION_H
#define CLIPSYNC_NOTIFICATION_H

#include "clipsync/error.h"
#include "clipsync/platform.h"
#include <memory>
#include <string>

namespace clipsync {

/**
 * @brief Fire-and-forget notification sink
 */
class Notifier {
public:
  virtual ~Notifier() = default;

  virtual Result<void> notify(const std::string &title,
                              const std::string &body) = 0;
};

/**
 * @brief Notifier posting to org.freedesktop.Notifications on the session bus
 *
 * The bus is connected lazily on first use and reconnected after a failure,
 * so a missing notification daemon never prevents startup.
 */
CLIPSYNC_API std::unique_ptr<Notifier> create_desktop_notifier();

} // namespace clipsync

#endif // CLIPSYNC_NOTIFICATION_H
