/**
 * @file types.cpp
 * @brief Core type implementations
 */

#include "clipsync/types.h"
#include "clipsync/security.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace clipsync {

// ============================================================================
// PeerId
// ============================================================================

std::string PeerId::to_hex() const {
  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  for (size_t i = 0; i < SIZE; ++i) {
    oss << std::setw(2) << static_cast<int>(data[i]);
  }
  return oss.str();
}

std::optional<PeerId> PeerId::from_hex(const std::string &hex) {
  if (hex.length() != SIZE * 2) {
    return std::nullopt;
  }

  // strtoul alone would accept whitespace and signs
  if (!std::all_of(hex.begin(), hex.end(), [](char c) {
        return std::isxdigit(static_cast<unsigned char>(c)) != 0;
      })) {
    return std::nullopt;
  }

  PeerId id;
  for (size_t i = 0; i < SIZE; ++i) {
    std::string byte_str = hex.substr(i * 2, 2);
    char *end;
    unsigned long val = std::strtoul(byte_str.c_str(), &end, 16);
    if (end != byte_str.c_str() + 2 || val > 255) {
      return std::nullopt;
    }
    id.data[i] = static_cast<Byte>(val);
  }

  return id;
}

std::string PeerId::short_hex() const { return to_hex().substr(0, 8); }

bool PeerId::is_zero() const {
  for (size_t i = 0; i < SIZE; ++i) {
    if (data[i] != 0)
      return false;
  }
  return true;
}

PeerId PeerId::generate() {
  PeerId id;
  Bytes random = random_bytes(SIZE);
  std::copy(random.begin(), random.end(), id.data.begin());
  return id;
}

// ============================================================================
// SocketAddress
// ============================================================================

std::string SocketAddress::to_string() const {
  if (host.find(':') != std::string::npos) {
    return "[" + host + "]:" + std::to_string(port);
  }
  return host + ":" + std::to_string(port);
}

Result<SocketAddress> SocketAddress::parse(const std::string &text) {
  SocketAddress addr;
  std::string port_str;

  if (!text.empty() && text.front() == '[') {
    auto close = text.find(']');
    if (close == std::string::npos || close + 1 >= text.size() ||
        text[close + 1] != ':') {
      return Error(ErrorCode::InvalidArgument,
                   "Malformed IPv6 address: " + text);
    }
    addr.host = text.substr(1, close - 1);
    port_str = text.substr(close + 2);
  } else {
    auto colon = text.rfind(':');
    if (colon == std::string::npos) {
      return Error(ErrorCode::InvalidArgument, "Missing port: " + text);
    }
    addr.host = text.substr(0, colon);
    port_str = text.substr(colon + 1);
  }

  if (addr.host.empty() || port_str.empty() || port_str.size() > 5 ||
      !std::all_of(port_str.begin(), port_str.end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
      })) {
    return Error(ErrorCode::InvalidArgument, "Malformed address: " + text);
  }

  char *end;
  unsigned long port = std::strtoul(port_str.c_str(), &end, 10);
  if (*end != '\0' || port == 0 || port > 65535) {
    return Error(ErrorCode::InvalidArgument, "Invalid port: " + text);
  }
  addr.port = static_cast<uint16_t>(port);

  return addr;
}

} // namespace clipsync
