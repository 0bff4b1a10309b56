/**
 * @file error.cpp
 * @brief Error handling implementation
 */

#include "clipsync/error.h"
#include <sstream>

namespace clipsync {

// ============================================================================
// Error Code Names
// ============================================================================

const char *error_code_name(ErrorCode code) {
  switch (code) {
  case ErrorCode::Success:
    return "Success";
  case ErrorCode::Unknown:
    return "Unknown";
  case ErrorCode::InvalidArgument:
    return "InvalidArgument";
  case ErrorCode::InvalidState:
    return "InvalidState";
  case ErrorCode::NotInitialized:
    return "NotInitialized";
  case ErrorCode::AlreadyInitialized:
    return "AlreadyInitialized";
  case ErrorCode::NotSupported:
    return "NotSupported";
  case ErrorCode::Timeout:
    return "Timeout";
  case ErrorCode::Cancelled:
    return "Cancelled";

  case ErrorCode::TransportError:
    return "TransportError";
  case ErrorCode::BindFailed:
    return "BindFailed";
  case ErrorCode::ConnectionFailed:
    return "ConnectionFailed";
  case ErrorCode::ConnectionRefused:
    return "ConnectionRefused";
  case ErrorCode::ConnectionTimeout:
    return "ConnectionTimeout";
  case ErrorCode::ConnectionLost:
    return "ConnectionLost";
  case ErrorCode::StreamOpenFailed:
    return "StreamOpenFailed";
  case ErrorCode::StreamWriteFailed:
    return "StreamWriteFailed";
  case ErrorCode::PeerNotFound:
    return "PeerNotFound";
  case ErrorCode::DiscoveryFailed:
    return "DiscoveryFailed";

  case ErrorCode::EncodingError:
    return "EncodingError";
  case ErrorCode::DecodingError:
    return "DecodingError";
  case ErrorCode::InvalidTicket:
    return "InvalidTicket";
  case ErrorCode::VersionMismatch:
    return "VersionMismatch";
  case ErrorCode::PayloadTooLarge:
    return "PayloadTooLarge";

  case ErrorCode::ClipboardAccessError:
    return "ClipboardAccessError";
  case ErrorCode::ClipboardEmpty:
    return "ClipboardEmpty";
  case ErrorCode::ClipboardToolMissing:
    return "ClipboardToolMissing";

  case ErrorCode::NotificationError:
    return "NotificationError";

  case ErrorCode::PlatformError:
    return "PlatformError";
  case ErrorCode::PermissionDenied:
    return "PermissionDenied";
  case ErrorCode::ServiceUnavailable:
    return "ServiceUnavailable";

  case ErrorCode::ConfigError:
    return "ConfigError";
  case ErrorCode::ConfigParseError:
    return "ConfigParseError";

  default:
    return "UnknownError";
  }
}

// ============================================================================
// Error Code Descriptions
// ============================================================================

const char *error_code_description(ErrorCode code) {
  switch (code) {
  case ErrorCode::Success:
    return "Operation completed successfully";
  case ErrorCode::Unknown:
    return "An unknown error occurred";
  case ErrorCode::InvalidArgument:
    return "Invalid argument provided";
  case ErrorCode::InvalidState:
    return "Operation not valid in current state";
  case ErrorCode::NotInitialized:
    return "Component not initialized";
  case ErrorCode::AlreadyInitialized:
    return "Component already initialized";
  case ErrorCode::NotSupported:
    return "Operation not supported on this system";
  case ErrorCode::Timeout:
    return "Operation timed out";
  case ErrorCode::Cancelled:
    return "Operation was cancelled";

  case ErrorCode::TransportError:
    return "Network transport error";
  case ErrorCode::BindFailed:
    return "Failed to bind the network listener";
  case ErrorCode::ConnectionFailed:
    return "Failed to connect to peer";
  case ErrorCode::ConnectionRefused:
    return "Peer refused the connection";
  case ErrorCode::ConnectionTimeout:
    return "Connection attempt timed out";
  case ErrorCode::ConnectionLost:
    return "Connection to peer was lost";
  case ErrorCode::StreamOpenFailed:
    return "Failed to open a stream to peer";
  case ErrorCode::StreamWriteFailed:
    return "Failed to write to peer stream";
  case ErrorCode::PeerNotFound:
    return "No known address for peer";
  case ErrorCode::DiscoveryFailed:
    return "Local network discovery failed";

  case ErrorCode::EncodingError:
    return "Failed to encode message";
  case ErrorCode::DecodingError:
    return "Failed to decode message";
  case ErrorCode::InvalidTicket:
    return "Connection ticket is invalid";
  case ErrorCode::VersionMismatch:
    return "Protocol version mismatch";
  case ErrorCode::PayloadTooLarge:
    return "Message payload is too large";

  case ErrorCode::ClipboardAccessError:
    return "Clipboard is not accessible";
  case ErrorCode::ClipboardEmpty:
    return "Clipboard holds no usable content";
  case ErrorCode::ClipboardToolMissing:
    return "Required clipboard tool is not installed";

  case ErrorCode::NotificationError:
    return "Desktop notification failed";

  case ErrorCode::PlatformError:
    return "Platform-specific error occurred";
  case ErrorCode::PermissionDenied:
    return "Permission denied";
  case ErrorCode::ServiceUnavailable:
    return "Required service unavailable";

  case ErrorCode::ConfigError:
    return "Invalid configuration";
  case ErrorCode::ConfigParseError:
    return "Configuration file could not be parsed";

  default:
    return "Unknown error occurred";
  }
}

// ============================================================================
// Recoverability
// ============================================================================

bool is_recoverable(ErrorCode code) {
  switch (code) {
  // Startup failures end the process
  case ErrorCode::BindFailed:
  case ErrorCode::NotSupported:
  case ErrorCode::ConfigParseError:
    return false;

  // Everything else is isolated to one peer, message or tick
  default:
    return true;
  }
}

// ============================================================================
// Error::to_string
// ============================================================================

std::string Error::to_string() const {
  std::ostringstream oss;

  oss << error_code_name(code);

  if (!message.empty()) {
    oss << ": " << message;
  }

  if (!details.empty()) {
    oss << " (" << details << ")";
  }

  if (!location.empty()) {
    oss << " [" << location << "]";
  }

  return oss.str();
}

} // namespace clipsync
