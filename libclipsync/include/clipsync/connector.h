/**
 * @file connector.h
 * @brief Opens sessions to peers announced by discovery
 */

#ifndef CLIPSYNC_CONNECTOR_H
#define CLIPSYNC_CONNECTOR_H

#include "clipsync/cancellation.h"
#include "clipsync/discovery.h"
#include "clipsync/session_registry.h"
#include "clipsync/transport.h"
#include <atomic>
#include <chrono>

namespace clipsync {

/**
 * @brief What handle() did with one discovery event
 */
enum class ConnectOutcome : uint8_t {
  SkippedSelf = 0,
  SkippedConnected = 1,
  Connected = 2,
  AttemptFailed = 3
};

CLIPSYNC_API const char *connect_outcome_name(ConnectOutcome outcome);

/**
 * @brief Turns discovery events into registry sessions
 *
 * Every event is decided from scratch: self and already-connected peers are
 * skipped, anyone else is dialed once. A failed attempt is logged and
 * forgotten; the next beacon from that peer tries again.
 */
class CLIPSYNC_API DiscoveryConnector {
public:
  DiscoveryConnector(Transport &transport, PeerSessionRegistry &registry);

  ConnectOutcome handle(const DiscoveredPeer &peer);

  /// Consume @p events until cancelled or the queue is closed and drained
  void run(DiscoveryQueue &events, CancellationToken &cancel,
           std::chrono::milliseconds poll = std::chrono::milliseconds(200));

  size_t connected() const { return connected_.load(); }
  size_t failed() const { return failed_.load(); }

private:
  Transport &transport_;
  PeerSessionRegistry &registry_;
  std::atomic<size_t> connected_{0};
  std::atomic<size_t> failed_{0};
};

} // namespace clipsync

#endif // CLIPSYNC_CONNECTOR_H
