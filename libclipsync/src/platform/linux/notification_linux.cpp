/**
 * @file notification_linux.cpp
 * @brief Desktop notifications over the freedesktop D-Bus interface
 */

#include "clipsync/notification.h"
#include "dbus_helpers.h"
#include <mutex>

namespace clipsync {
namespace platform {

namespace {

constexpr const char *NOTIFY_SERVICE = "org.freedesktop.Notifications";
constexpr const char *NOTIFY_PATH = "/org/freedesktop/Notifications";
constexpr const char *NOTIFY_IFACE = "org.freedesktop.Notifications";
constexpr const char *APP_NAME = "clipsync";
constexpr const char *APP_ICON = "edit-paste";

constexpr int NOTIFY_EXPIRE_MS = 3000;
constexpr int CALL_TIMEOUT_MS = 1000;

} // namespace

/**
 * @brief Notifier backed by the session bus
 */
class DesktopNotifier : public Notifier {
public:
  Result<void> notify(const std::string &title,
                      const std::string &body) override {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!bus_) {
      auto bus = get_session_bus();
      if (bus.is_error()) {
        return bus.error();
      }
      bus_ = std::move(bus.value());
    }

    DBusMessageWrapper msg(dbus_message_new_method_call(
        NOTIFY_SERVICE, NOTIFY_PATH, NOTIFY_IFACE, "Notify"));
    if (!msg) {
      return Error(ErrorCode::NotificationError,
                   "Failed to create D-Bus message");
    }

    // Notify(s app_name, u replaces_id, s icon, s summary, s body,
    //        as actions, a{sv} hints, i expire_timeout)
    const char *app_name = APP_NAME;
    const char *icon = APP_ICON;
    const char *summary = title.c_str();
    const char *text = body.c_str();
    dbus_uint32_t replaces_id = 0;
    dbus_int32_t expire = NOTIFY_EXPIRE_MS;

    DBusMessageIter iter, array_iter;
    dbus_message_iter_init_append(msg.get(), &iter);

    bool ok =
        dbus_message_iter_append_basic(&iter, DBUS_TYPE_STRING, &app_name) &&
        dbus_message_iter_append_basic(&iter, DBUS_TYPE_UINT32,
                                       &replaces_id) &&
        dbus_message_iter_append_basic(&iter, DBUS_TYPE_STRING, &icon) &&
        dbus_message_iter_append_basic(&iter, DBUS_TYPE_STRING, &summary) &&
        dbus_message_iter_append_basic(&iter, DBUS_TYPE_STRING, &text);

    // Empty actions
    ok = ok &&
         dbus_message_iter_open_container(&iter, DBUS_TYPE_ARRAY,
                                          DBUS_TYPE_STRING_AS_STRING,
                                          &array_iter) &&
         dbus_message_iter_close_container(&iter, &array_iter);

    // Empty hints
    ok = ok &&
         dbus_message_iter_open_container(&iter, DBUS_TYPE_ARRAY, "{sv}",
                                          &array_iter) &&
         dbus_message_iter_close_container(&iter, &array_iter);

    ok = ok && dbus_message_iter_append_basic(&iter, DBUS_TYPE_INT32, &expire);

    if (!ok) {
      return Error(ErrorCode::NotificationError,
                   "Out of memory building notification");
    }

    auto reply = send_with_reply(bus_.get(), msg, CALL_TIMEOUT_MS);
    if (reply.is_error()) {
      if (!dbus_connection_get_is_connected(bus_.get())) {
        // Reconnect next time
        bus_ = DBusConnectionWrapper();
      }
      Error err = reply.error();
      err.code = ErrorCode::NotificationError;
      return err;
    }

    return Result<void>::ok();
  }

private:
  std::mutex mutex_;
  DBusConnectionWrapper bus_;
};

} // namespace platform

std::unique_ptr<Notifier> create_desktop_notifier() {
  return std::unique_ptr<Notifier>(new platform::DesktopNotifier());
}

} // namespace clipsync
