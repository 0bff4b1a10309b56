/**
 * @file connector.cpp
 * @brief DiscoveryConnector implementation
 */

#include "clipsync/connector.h"
#include <spdlog/spdlog.h>

namespace clipsync {

const char *connect_outcome_name(ConnectOutcome outcome) {
  switch (outcome) {
  case ConnectOutcome::SkippedSelf:
    return "SkippedSelf";
  case ConnectOutcome::SkippedConnected:
    return "SkippedConnected";
  case ConnectOutcome::Connected:
    return "Connected";
  case ConnectOutcome::AttemptFailed:
    return "AttemptFailed";
  default:
    return "Unknown";
  }
}

DiscoveryConnector::DiscoveryConnector(Transport &transport,
                                       PeerSessionRegistry &registry)
    : transport_(transport), registry_(registry) {}

ConnectOutcome DiscoveryConnector::handle(const DiscoveredPeer &peer) {
  if (peer.peer_id == transport_.local_id()) {
    return ConnectOutcome::SkippedSelf;
  }
  if (registry_.contains(peer.peer_id)) {
    return ConnectOutcome::SkippedConnected;
  }

  spdlog::debug("Connecting to discovered peer {} ({})", peer.device_name,
                peer.peer_id.short_hex());

  auto connection = transport_.connect(peer.peer_id, peer.addresses);
  if (connection.is_error()) {
    ++failed_;
    spdlog::debug("Discovered peer {} not reachable: {}",
                  peer.peer_id.short_hex(), connection.error().to_string());
    return ConnectOutcome::AttemptFailed;
  }

  registry_.insert(peer.peer_id, PeerSession::create(connection.value()));
  ++connected_;
  spdlog::info("Auto-connected to {} ({})", peer.device_name,
               peer.peer_id.short_hex());
  return ConnectOutcome::Connected;
}

void DiscoveryConnector::run(DiscoveryQueue &events, CancellationToken &cancel,
                             std::chrono::milliseconds poll) {
  while (!cancel.is_cancelled()) {
    auto peer = events.pop_for(poll);
    if (peer) {
      handle(*peer);
    } else if (events.is_closed()) {
      break;
    }
  }
  spdlog::debug("Discovery connector stopped ({} connected, {} failed)",
                connected_.load(), failed_.load());
}

} // namespace clipsync
