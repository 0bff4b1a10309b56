/**
 * @file dbus_helpers.h
 * @brief D-Bus utility functions for Linux platform layer
 *
 * RAII wrappers over libdbus handles, used by the desktop notifier.
 */

#ifndef CLIPSYNC_PLATFORM_LINUX_DBUS_HELPERS_H
#define CLIPSYNC_PLATFORM_LINUX_DBUS_HELPERS_H

#include "clipsync/error.h"
#include <dbus/dbus.h>
#include <memory>
#include <string>

namespace clipsync {
namespace platform {

// ============================================================================
// D-Bus Connection RAII Wrapper
// ============================================================================

/**
 * @brief RAII wrapper for DBusConnection
 */
class DBusConnectionWrapper {
public:
  DBusConnectionWrapper() = default;

  explicit DBusConnectionWrapper(DBusConnection *conn, bool add_ref = false)
      : conn_(conn) {
    if (conn_ && add_ref) {
      dbus_connection_ref(conn_);
    }
  }

  ~DBusConnectionWrapper() {
    if (conn_) {
      dbus_connection_unref(conn_);
    }
  }

  // Move-only
  DBusConnectionWrapper(DBusConnectionWrapper &&other) noexcept
      : conn_(other.conn_) {
    other.conn_ = nullptr;
  }

  DBusConnectionWrapper &operator=(DBusConnectionWrapper &&other) noexcept {
    if (this != &other) {
      if (conn_) {
        dbus_connection_unref(conn_);
      }
      conn_ = other.conn_;
      other.conn_ = nullptr;
    }
    return *this;
  }

  DBusConnectionWrapper(const DBusConnectionWrapper &) = delete;
  DBusConnectionWrapper &operator=(const DBusConnectionWrapper &) = delete;

  DBusConnection *get() const { return conn_; }
  operator bool() const { return conn_ != nullptr; }

private:
  DBusConnection *conn_ = nullptr;
};

// ============================================================================
// D-Bus Message RAII Wrapper
// ============================================================================

/**
 * @brief RAII wrapper for DBusMessage
 */
class DBusMessageWrapper {
public:
  DBusMessageWrapper() = default;

  explicit DBusMessageWrapper(DBusMessage *msg) : msg_(msg) {}

  ~DBusMessageWrapper() {
    if (msg_) {
      dbus_message_unref(msg_);
    }
  }

  // Move-only
  DBusMessageWrapper(DBusMessageWrapper &&other) noexcept : msg_(other.msg_) {
    other.msg_ = nullptr;
  }

  DBusMessageWrapper &operator=(DBusMessageWrapper &&other) noexcept {
    if (this != &other) {
      if (msg_) {
        dbus_message_unref(msg_);
      }
      msg_ = other.msg_;
      other.msg_ = nullptr;
    }
    return *this;
  }

  DBusMessageWrapper(const DBusMessageWrapper &) = delete;
  DBusMessageWrapper &operator=(const DBusMessageWrapper &) = delete;

  DBusMessage *get() const { return msg_; }
  DBusMessage *release() {
    DBusMessage *tmp = msg_;
    msg_ = nullptr;
    return tmp;
  }
  operator bool() const { return msg_ != nullptr; }

private:
  DBusMessage *msg_ = nullptr;
};

// ============================================================================
// D-Bus Error Helper
// ============================================================================

/**
 * @brief Convert DBusError to clipsync Error
 */
inline Error
dbus_error_to_error(const DBusError &err,
                    ErrorCode code = ErrorCode::ServiceUnavailable) {
  if (!dbus_error_is_set(&err)) {
    return Error();
  }

  std::string message = err.name ? std::string(err.name) : "D-Bus error";
  if (err.message) {
    message += ": ";
    message += err.message;
  }

  return Error(code, message);
}

/**
 * @brief RAII wrapper for DBusError
 */
class DBusErrorWrapper {
public:
  DBusErrorWrapper() { dbus_error_init(&err_); }
  ~DBusErrorWrapper() { dbus_error_free(&err_); }

  DBusError *get() { return &err_; }
  bool is_set() const { return dbus_error_is_set(&err_); }
  Error to_error(ErrorCode code = ErrorCode::ServiceUnavailable) const {
    return dbus_error_to_error(err_, code);
  }

  const char *name() const { return err_.name; }
  const char *message() const { return err_.message; }

private:
  DBusError err_;
};

// ============================================================================
// D-Bus Helper Functions
// ============================================================================

/**
 * @brief Get the shared session D-Bus connection
 *
 * libdbus would otherwise call _exit() when the bus goes away.
 *
 * @return Connection wrapper or error
 */
inline Result<DBusConnectionWrapper> get_session_bus() {
  DBusErrorWrapper error;
  DBusConnection *conn = dbus_bus_get(DBUS_BUS_SESSION, error.get());

  if (!conn || error.is_set()) {
    if (conn) {
      dbus_connection_unref(conn);
    }
    return error.is_set()
               ? error.to_error()
               : Error(ErrorCode::ServiceUnavailable, "No session bus");
  }

  dbus_connection_set_exit_on_disconnect(conn, FALSE);
  return DBusConnectionWrapper(conn);
}

/**
 * @brief Send a prepared method call and wait for the reply
 * @param conn D-Bus connection
 * @param msg Method call built by the caller
 * @param timeout_ms Timeout in milliseconds (-1 for default)
 * @return Reply message or error
 */
inline Result<DBusMessageWrapper>
send_with_reply(DBusConnection *conn, const DBusMessageWrapper &msg,
                int timeout_ms = -1) {
  DBusErrorWrapper error;
  DBusMessage *reply = dbus_connection_send_with_reply_and_block(
      conn, msg.get(), timeout_ms, error.get());

  if (!reply || error.is_set()) {
    if (reply) {
      dbus_message_unref(reply);
    }
    return error.is_set() ? error.to_error()
                          : Error(ErrorCode::ServiceUnavailable,
                                  "No reply from D-Bus service");
  }

  return DBusMessageWrapper(reply);
}

} // namespace platform
} // namespace clipsync

#endif // CLIPSYNC_PLATFORM_LINUX_DBUS_HELPERS_H
