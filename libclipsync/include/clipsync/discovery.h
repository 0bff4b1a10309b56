/**
 * @file discovery.h
 * @brief LAN peer discovery over UDP broadcast
 *
 * Every node periodically broadcasts a small beacon announcing its identity
 * and TCP listen port, and listens for the beacons of others.
 *
 * Beacon layout (little-endian):
 *   "CSYD" magic (u32) | version u8 | peer_id[32] | tcp_port u16 |
 *   device_name (u16 len + bytes)
 *
 * Each received beacon becomes a DiscoveredPeer on the events() queue. The
 * sequence has no end of its own; it stops when the service is stopped and
 * cannot be restarted.
 */

#ifndef CLIPSYNC_DISCOVERY_H
#define CLIPSYNC_DISCOVERY_H

#include "clipsync/error.h"
#include "clipsync/event_queue.h"
#include "clipsync/platform.h"
#include "clipsync/types.h"
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace clipsync {

/// "CSYD" in little-endian
constexpr uint32_t BEACON_MAGIC = 0x44595343;

constexpr uint8_t BEACON_VERSION = 1;

/// Device names are clipped to this many bytes inside a beacon
constexpr size_t MAX_BEACON_NAME = 64;

// ============================================================================
// Beacon
// ============================================================================

/**
 * @brief Contents of one discovery datagram
 */
struct Beacon {
  PeerId peer_id;
  uint16_t tcp_port = 0;
  std::string device_name;
};

CLIPSYNC_API Bytes encode_beacon(const Beacon &beacon);

/// Parse a datagram; std::nullopt for anything that is not a valid beacon
CLIPSYNC_API std::optional<Beacon> decode_beacon(const Byte *data,
                                                 size_t size);

// ============================================================================
// Discovered Peer
// ============================================================================

/**
 * @brief A peer announced on the local network
 */
struct DiscoveredPeer {
  PeerId peer_id;
  std::vector<SocketAddress> addresses; // sender IP + advertised TCP port
  std::string device_name;
};

using DiscoveryQueue = BlockingQueue<DiscoveredPeer>;

/// Invoked on the discovery thread for every accepted beacon
using PeerDiscoveredCallback = std::function<void(const DiscoveredPeer &)>;

// ============================================================================
// Discovery Service
// ============================================================================

struct DiscoveryOptions {
  PeerId local_id;
  std::string device_name;

  /// TCP port advertised in our beacons
  uint16_t tcp_port = 0;

  /// UDP port beacons are sent to and received on
  uint16_t discovery_port = 0;

  std::chrono::milliseconds beacon_interval{2000};

  std::string broadcast_address = "255.255.255.255";
};

/**
 * @brief Beacon announcer and listener with its own I/O thread
 */
class CLIPSYNC_API DiscoveryService {
public:
  DiscoveryService();
  ~DiscoveryService();

  // Non-copyable
  DiscoveryService(const DiscoveryService &) = delete;
  DiscoveryService &operator=(const DiscoveryService &) = delete;

  /**
   * @brief Bind the UDP socket and start beaconing
   *
   * @param options Identity, ports and beacon interval
   * @param on_peer Optional hook for every discovered peer (e.g. to feed a
   *        transport's address book); called before the event is queued
   * @return Success, DiscoveryFailed if the socket cannot be set up, or
   *         InvalidState if already started
   */
  Result<void> start(const DiscoveryOptions &options,
                     PeerDiscoveredCallback on_peer = {});

  /// Stop beaconing, close the socket and the events() queue
  void stop();

  bool is_running() const;

  /// Discovered peers, in arrival order; own beacons are filtered out
  DiscoveryQueue &events();

  /// Number of beacons rejected as malformed
  size_t rejected() const;

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace clipsync

#endif // CLIPSYNC_DISCOVERY_H
