/**
 * @file clipsync.h
 * @brief Main clipsync API Header
 *
 * clipsync - peer-to-peer clipboard sync for the local network
 *
 * This is the main header file for the clipsync library. SyncService wires
 * together:
 * - the TCP transport and the peer session registry
 * - clipboard polling and broadcast of local changes
 * - application of remote changes (with desktop notifications)
 * - optional LAN discovery with automatic connection
 *
 * Quick Start:
 * @code
 *   #include <clipsync/clipsync.h>
 *
 *   clipsync::SyncService service;
 *   auto started = service.start(options);
 *   if (!started) { ... }
 *
 *   std::cout << service.ticket().encode() << std::endl;
 *   service.run_until_cancelled(token);
 * @endcode
 */

#ifndef CLIPSYNC_CLIPSYNC_H
#define CLIPSYNC_CLIPSYNC_H

// Core headers (in dependency order)
#include "error.h"
#include "platform.h"
#include "types.h"

// Feature modules
#include "applier.h"
#include "broadcast.h"
#include "cancellation.h"
#include "clipboard.h"
#include "config.h"
#include "connector.h"
#include "detector.h"
#include "discovery.h"
#include "inbound.h"
#include "message.h"
#include "protocol.h"
#include "notification.h"
#include "session_registry.h"
#include "tcp_transport.h"
#include "ticket.h"

#include <chrono>
#include <memory>
#include <string>

namespace clipsync {

// ============================================================================
// Version Information
// ============================================================================

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 2;
constexpr int VERSION_PATCH = 0;

constexpr const char *VERSION_STRING = "0.2.0";

/**
 * @brief Get version information
 */
struct VersionInfo {
  int major = VERSION_MAJOR;
  int minor = VERSION_MINOR;
  int patch = VERSION_PATCH;
  const char *version_string = VERSION_STRING;
  int protocol_version = PROTOCOL_VERSION;
};

CLIPSYNC_API VersionInfo get_version();

// ============================================================================
// Sync Options
// ============================================================================

/**
 * @brief Everything SyncService::start() needs
 */
struct SyncOptions {
  /// Identity announced to peers; generated when zero
  PeerId peer_id;

  /// Sender id stamped on outgoing messages and sent in handshakes
  std::string device_name;

  std::string bind_address = "0.0.0.0";
  uint16_t listen_port = DEFAULT_LISTEN_PORT;
  uint16_t discovery_port = DEFAULT_DISCOVERY_PORT;
  std::chrono::milliseconds beacon_interval{2000};
  std::chrono::milliseconds connect_timeout{3000};
  std::chrono::milliseconds io_timeout{5000};

  DetectorOptions detector;
  ApplierOptions applier;

  /// Options matching a loaded configuration
  static SyncOptions from_config(const ClipSyncConfig &config,
                                 const PeerId &peer_id);
};

// ============================================================================
// Sync Service
// ============================================================================

/**
 * @brief One running clipsync node
 *
 * start() binds the transport and launches the detector and applier
 * threads. Peers are added by connect_ticket(), by dialing us, or by
 * discovery once enable_auto_discovery() has been called. shutdown() (also
 * run by the destructor) cancels every loop, stops the network and joins
 * every thread.
 *
 * Example:
 * @code
 *   clipsync::SyncService service;
 *   service.start(SyncOptions::from_config(config, id));
 *
 *   auto ticket = ConnectionTicket::decode(text);
 *   if (ticket) {
 *       service.connect_ticket(ticket.value());
 *   }
 * @endcode
 */
class CLIPSYNC_API SyncService {
public:
  SyncService();
  ~SyncService();

  // Non-copyable
  SyncService(const SyncService &) = delete;
  SyncService &operator=(const SyncService &) = delete;

  // ========================================================================
  // Lifecycle
  // ========================================================================

  /**
   * @brief Bind the transport and start syncing
   *
   * @param options Identity, ports and tuning
   * @param clipboard Clipboard to sync; the system clipboard when null
   * @param notifier Notification sink; the desktop notifier when null and
   *        notifications are enabled
   * @return Success, BindFailed, ClipboardToolMissing, or
   *         AlreadyInitialized
   */
  Result<void> start(const SyncOptions &options,
                     std::unique_ptr<ClipboardBackend> clipboard = nullptr,
                     std::unique_ptr<Notifier> notifier = nullptr);

  /// Stop every task and release the network (idempotent)
  void shutdown();

  bool is_running() const;

  /// Block until @p cancel fires, then shut down
  void run_until_cancelled(CancellationToken &cancel);

  // ========================================================================
  // Peers
  // ========================================================================

  /**
   * @brief Dial the peer named by a ticket and register the session
   * @return The peer's id, or the transport's error
   */
  Result<PeerId> connect_ticket(const ConnectionTicket &ticket);

  /**
   * @brief Start LAN discovery and connect to every peer it announces
   * @return Success, DiscoveryFailed, or InvalidState if not started
   */
  Result<void> enable_auto_discovery();

  /// Ticket other nodes can use to reach this one
  ConnectionTicket ticket() const;

  PeerId local_id() const;

  /// Port the transport actually bound
  uint16_t listen_port() const;

  size_t peer_count() const;

  PeerSessionRegistry &registry();

  // ========================================================================
  // Direct Operations
  // ========================================================================

  /// Send content to every peer now, bypassing the detector
  Result<BroadcastReport> broadcast(const ClipboardContent &content);

  /// Show a notification if notifications are enabled; failures are logged
  void notify(const std::string &title, const std::string &body);

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace clipsync

#endif // CLIPSYNC_CLIPSYNC_H
