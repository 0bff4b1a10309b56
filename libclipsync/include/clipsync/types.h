/**
 * @file types.h
 * @brief Core type definitions for clipsync
 */

#ifndef CLIPSYNC_TYPES_H
#define CLIPSYNC_TYPES_H

#include "error.h"
#include "platform.h"
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace clipsync {

// ============================================================================
// Basic Types
// ============================================================================

using Byte = uint8_t;
using Bytes = std::vector<Byte>;

// ============================================================================
// Identifiers
// ============================================================================

/**
 * @brief Peer identity (32 random bytes, assigned when the transport binds)
 *
 * Rendered as 64 lowercase hex characters in logs, tickets and beacons.
 */
struct PeerId {
  static constexpr size_t SIZE = 32;
  std::array<Byte, SIZE> data{};

  bool operator==(const PeerId &other) const { return data == other.data; }
  bool operator!=(const PeerId &other) const { return data != other.data; }
  bool operator<(const PeerId &other) const { return data < other.data; }

  std::string to_hex() const;
  static std::optional<PeerId> from_hex(const std::string &hex);

  /// First 8 hex characters, for log lines
  std::string short_hex() const;

  bool is_zero() const;

  /// Generate a fresh random identity (libsodium CSPRNG)
  static PeerId generate();
};

// ============================================================================
// Addresses
// ============================================================================

/**
 * @brief Host/port pair of a peer endpoint
 *
 * Textual form is "host:port"; IPv6 hosts are bracketed ("[::1]:4000").
 */
struct SocketAddress {
  std::string host;
  uint16_t port = 0;

  bool operator==(const SocketAddress &other) const {
    return host == other.host && port == other.port;
  }
  bool operator!=(const SocketAddress &other) const {
    return !(*this == other);
  }

  std::string to_string() const;
  static Result<SocketAddress> parse(const std::string &text);
};

} // namespace clipsync

#endif // CLIPSYNC_TYPES_H
