/**
 * @file error.h
 * @brief Error codes and result types for clipsync
 *
 * clipsync uses a Result type pattern for error handling. Exceptions
 * raised by third-party libraries are converted to Error values at the
 * boundary where they occur and never cross the library API.
 */

#ifndef CLIPSYNC_ERROR_H
#define CLIPSYNC_ERROR_H

#include "platform.h"
#include <optional>
#include <string>
#include <variant>

namespace clipsync {

// ============================================================================
// Error Codes
// ============================================================================

enum class ErrorCode : int {
  // Success (0)
  Success = 0,

  // General errors (1-99)
  Unknown = 1,
  InvalidArgument = 2,
  InvalidState = 3,
  NotInitialized = 4,
  AlreadyInitialized = 5,
  NotSupported = 6,
  Timeout = 7,
  Cancelled = 8,

  // Transport errors (100-199)
  TransportError = 100,
  BindFailed = 101,
  ConnectionFailed = 102,
  ConnectionRefused = 103,
  ConnectionTimeout = 104,
  ConnectionLost = 105,
  StreamOpenFailed = 106,
  StreamWriteFailed = 107,
  PeerNotFound = 108,
  DiscoveryFailed = 109,

  // Protocol errors (200-299)
  EncodingError = 200,
  DecodingError = 201,
  InvalidTicket = 202,
  VersionMismatch = 203,
  PayloadTooLarge = 204,

  // Clipboard errors (300-399)
  ClipboardAccessError = 300,
  ClipboardEmpty = 301,
  ClipboardToolMissing = 302,

  // Notification errors (400-499)
  NotificationError = 400,

  // Platform errors (500-599)
  PlatformError = 500,
  PermissionDenied = 501,
  ServiceUnavailable = 502,

  // Configuration errors (600-699)
  ConfigError = 600,
  ConfigParseError = 601
};

// ============================================================================
// Error Information
// ============================================================================

/**
 * @brief Detailed error information
 */
struct Error {
  ErrorCode code = ErrorCode::Success;
  std::string message;
  std::string details;  // Additional context
  std::string location; // Function/file where error occurred

  Error() = default;

  explicit Error(ErrorCode c, std::string msg = "", std::string det = "")
      : code(c), message(std::move(msg)), details(std::move(det)) {}

  /// Check if this represents an error
  bool is_error() const { return code != ErrorCode::Success; }

  /// Check if this represents success
  bool is_ok() const { return code == ErrorCode::Success; }

  /// Get human-readable error string
  std::string to_string() const;

  /// Create success result
  static Error ok() { return Error(ErrorCode::Success); }
};

// ============================================================================
// Result Type
// ============================================================================

/**
 * @brief Result type that holds either a value or an error
 *
 * Usage:
 *   Result<PeerId> result = PeerId::from_hex(text);
 *   if (result) {
 *       PeerId id = result.value();
 *   } else {
 *       spdlog::warn("{}", result.error().to_string());
 *   }
 */
template <typename T> class Result {
public:
  /// Construct with success value
  Result(T value) : data_(std::move(value)) {}

  /// Construct with error
  Result(Error error) : data_(std::move(error)) {}

  /// Construct with error code
  Result(ErrorCode code, std::string message = "")
      : data_(Error(code, std::move(message))) {}

  /// Check if result is success
  bool is_ok() const { return std::holds_alternative<T>(data_); }

  /// Check if result is error
  bool is_error() const { return std::holds_alternative<Error>(data_); }

  /// Boolean conversion (true = success)
  explicit operator bool() const { return is_ok(); }

  /// Get the value (undefined behavior if error)
  T &value() & { return std::get<T>(data_); }
  const T &value() const & { return std::get<T>(data_); }
  T &&value() && { return std::get<T>(std::move(data_)); }

  /// Get the error (undefined behavior if success)
  Error &error() & { return std::get<Error>(data_); }
  const Error &error() const & { return std::get<Error>(data_); }

  /// Get value or default
  T value_or(T default_value) const {
    return is_ok() ? std::get<T>(data_) : std::move(default_value);
  }

  /// Get optional value
  std::optional<T> to_optional() const {
    return is_ok() ? std::optional<T>(std::get<T>(data_)) : std::nullopt;
  }

private:
  std::variant<T, Error> data_;
};

/**
 * @brief Specialization for void result (success or error, no value)
 */
template <> class Result<void> {
public:
  /// Construct success
  Result() : error_(std::nullopt) {}

  /// Construct with error
  Result(Error error) : error_(std::move(error)) {}

  /// Construct with error code
  Result(ErrorCode code, std::string message = "")
      : error_(Error(code, std::move(message))) {}

  /// Check if result is success
  bool is_ok() const { return !error_.has_value(); }

  /// Check if result is error
  bool is_error() const { return error_.has_value(); }

  /// Boolean conversion (true = success)
  explicit operator bool() const { return is_ok(); }

  /// Get the error
  Error &error() { return error_.value(); }
  const Error &error() const { return error_.value(); }

  /// Create success result
  static Result ok() { return Result(); }

private:
  std::optional<Error> error_;
};

// ============================================================================
// Convenience Macros
// ============================================================================

/// Return early if result is error
#define CLIPSYNC_TRY(result)                                                   \
  do {                                                                         \
    auto &&_result = (result);                                                 \
    if (_result.is_error()) {                                                  \
      return _result.error();                                                  \
    }                                                                          \
  } while (0)

/// Return early with error if condition is false
#define CLIPSYNC_REQUIRE(condition, error_code, message)                       \
  do {                                                                         \
    if (!(condition)) {                                                        \
      return ::clipsync::Error(error_code, message);                           \
    }                                                                          \
  } while (0)

// ============================================================================
// Error Code Helpers
// ============================================================================

/// Get human-readable name for error code
CLIPSYNC_API const char *error_code_name(ErrorCode code);

/// Get description for error code
CLIPSYNC_API const char *error_code_description(ErrorCode code);

/// Check if error code is recoverable (the process may keep running)
CLIPSYNC_API bool is_recoverable(ErrorCode code);

} // namespace clipsync

#endif // CLIPSYNC_ERROR_H
