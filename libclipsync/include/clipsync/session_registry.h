/**
 * @file session_registry.h
 * @brief Thread-safe set of live peer sessions
 */

#ifndef CLIPSYNC_SESSION_REGISTRY_H
#define CLIPSYNC_SESSION_REGISTRY_H

#include "clipsync/transport.h"
#include "clipsync/types.h"
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace clipsync {

/**
 * @brief One reachable peer and the connection used to send to it
 */
struct PeerSession {
  PeerId peer_id;
  std::shared_ptr<Connection> connection;
  std::chrono::system_clock::time_point established_at;

  /// Session for a freshly established connection
  static PeerSession create(std::shared_ptr<Connection> connection);
};

/**
 * @brief Map of PeerId to PeerSession shared by every task
 *
 * One mutex guards the map; it is held only for bookkeeping and never while
 * a connection does I/O. Callers iterate over snapshot() copies.
 */
class CLIPSYNC_API PeerSessionRegistry {
public:
  PeerSessionRegistry() = default;

  PeerSessionRegistry(const PeerSessionRegistry &) = delete;
  PeerSessionRegistry &operator=(const PeerSessionRegistry &) = delete;

  /// Add or replace the session for @p peer_id (last writer wins)
  void insert(const PeerId &peer_id, PeerSession session);

  /// Remove and close a session; no-op if absent. Returns true if removed.
  bool remove(const PeerId &peer_id);

  /// Remove several sessions under a single lock acquisition
  size_t remove_all(const std::vector<PeerId> &peer_ids);

  /**
   * @brief Remove sessions that still hold the given connections
   *
   * An entry whose connection was replaced since @p stale was taken (the
   * peer reconnected) is kept.
   */
  size_t remove_stale(const std::vector<PeerSession> &stale);

  bool contains(const PeerId &peer_id) const;

  /// Copy of every (peer_id, session) pair at this instant
  std::vector<std::pair<PeerId, PeerSession>> snapshot() const;

  size_t size() const;
  std::vector<PeerId> peer_ids() const;

  /// Remove and close every session (shutdown)
  void clear();

private:
  mutable std::mutex mutex_;
  std::map<PeerId, PeerSession> sessions_;
};

} // namespace clipsync

#endif // CLIPSYNC_SESSION_REGISTRY_H
