/**
 * @file broadcast.h
 * @brief Fan-out of local clipboard changes to every registered peer
 */

#ifndef CLIPSYNC_BROADCAST_H
#define CLIPSYNC_BROADCAST_H

#include "clipsync/message.h"
#include "clipsync/session_registry.h"
#include <string>
#include <vector>

namespace clipsync {

/**
 * @brief Outcome of one broadcast call
 */
struct BroadcastReport {
  size_t attempted = 0;
  size_t delivered = 0;
  std::vector<PeerId> failed; // Pruned unless the peer reconnected meanwhile
};

/**
 * @brief Best-effort, at-most-once delivery to all live sessions
 *
 * Each call encodes once, snapshots the registry and opens one fresh stream
 * per peer. A failing peer never stops delivery to the others; failed peers
 * are removed from the registry in one batch after the pass. There is no
 * acknowledgment and no retry.
 */
class CLIPSYNC_API BroadcastEngine {
public:
  BroadcastEngine(PeerSessionRegistry &registry, std::string sender_id);

  /// Stamp @p content with the local sender id and now, then fan it out
  Result<BroadcastReport> broadcast(const ClipboardContent &content);

  /// Fan out an already-built message
  Result<BroadcastReport> broadcast_message(const ClipboardMessage &msg);

  const std::string &sender_id() const { return sender_id_; }

private:
  PeerSessionRegistry &registry_;
  std::string sender_id_;
};

} // namespace clipsync

#endif // CLIPSYNC_BROADCAST_H
