/**
 * @file broadcast.cpp
 * @brief BroadcastEngine implementation
 */

#include "clipsync/broadcast.h"
#include <spdlog/spdlog.h>

namespace clipsync {

namespace {

Result<void> send_to(Connection &connection, const Bytes &packet) {
  auto stream = connection.open_stream();
  if (stream.is_error()) {
    return stream.error();
  }
  CLIPSYNC_TRY(stream.value()->write_all(packet));
  return stream.value()->finish();
}

} // anonymous namespace

BroadcastEngine::BroadcastEngine(PeerSessionRegistry &registry,
                                 std::string sender_id)
    : registry_(registry), sender_id_(std::move(sender_id)) {}

Result<BroadcastReport>
BroadcastEngine::broadcast(const ClipboardContent &content) {
  return broadcast_message(ClipboardMessage::create(content, sender_id_));
}

Result<BroadcastReport>
BroadcastEngine::broadcast_message(const ClipboardMessage &msg) {
  auto encoded = encode_message(msg);
  if (encoded.is_error()) {
    spdlog::error("Cannot encode clipboard message: {}",
                  encoded.error().to_string());
    return encoded.error();
  }
  const Bytes &packet = encoded.value();

  BroadcastReport report;
  std::vector<PeerSession> failed_sessions;
  auto sessions = registry_.snapshot();
  if (sessions.empty()) {
    spdlog::debug("No connected peers, nothing to broadcast");
    return report;
  }

  for (const auto &entry : sessions) {
    const PeerId &peer_id = entry.first;
    const PeerSession &session = entry.second;
    ++report.attempted;

    auto sent = session.connection
                    ? send_to(*session.connection, packet)
                    : Result<void>(ErrorCode::ConnectionLost, "No connection");
    std::string label = session.connection ? session.connection->remote_label()
                                           : peer_id.short_hex();
    if (sent.is_ok()) {
      ++report.delivered;
      spdlog::info("Sent clipboard update to {} ({} bytes)", label,
                   packet.size());
    } else {
      report.failed.push_back(peer_id);
      failed_sessions.push_back(session);
      spdlog::warn("Failed to send clipboard update to {}: {}", label,
                   sent.error().to_string());
    }
  }

  if (!failed_sessions.empty()) {
    // A peer that reconnected during the pass keeps its new session
    size_t removed = registry_.remove_stale(failed_sessions);
    spdlog::info("Removed {} unreachable peer(s), {} remaining", removed,
                 registry_.size());
  }

  return report;
}

} // namespace clipsync
