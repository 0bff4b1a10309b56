/**
 * @file session_registry.cpp
 * @brief PeerSessionRegistry implementation
 */

#include "clipsync/session_registry.h"
#include <spdlog/spdlog.h>

namespace clipsync {

namespace {

// Connections are closed after the lock is released
void close_all(std::vector<PeerSession> &removed) {
  auto now = std::chrono::system_clock::now();
  for (auto &session : removed) {
    if (session.connection) {
      session.connection->close();
    }
    spdlog::debug("Closed session with {} after {} s",
                  session.peer_id.short_hex(),
                  std::chrono::duration_cast<std::chrono::seconds>(
                      now - session.established_at)
                      .count());
  }
}

} // anonymous namespace

PeerSession PeerSession::create(std::shared_ptr<Connection> connection) {
  PeerSession session;
  session.peer_id = connection->peer_id();
  session.connection = std::move(connection);
  session.established_at = std::chrono::system_clock::now();
  return session;
}

void PeerSessionRegistry::insert(const PeerId &peer_id, PeerSession session) {
  size_t count;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_[peer_id] = std::move(session);
    count = sessions_.size();
  }
  spdlog::debug("Session registered for {} ({} active)", peer_id.short_hex(),
                count);
}

bool PeerSessionRegistry::remove(const PeerId &peer_id) {
  std::vector<PeerSession> removed;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(peer_id);
    if (it == sessions_.end()) {
      return false;
    }
    removed.push_back(std::move(it->second));
    sessions_.erase(it);
  }
  close_all(removed);
  return true;
}

size_t PeerSessionRegistry::remove_all(const std::vector<PeerId> &peer_ids) {
  std::vector<PeerSession> removed;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &id : peer_ids) {
      auto it = sessions_.find(id);
      if (it != sessions_.end()) {
        removed.push_back(std::move(it->second));
        sessions_.erase(it);
      }
    }
  }
  close_all(removed);
  return removed.size();
}

size_t PeerSessionRegistry::remove_stale(const std::vector<PeerSession> &stale) {
  std::vector<PeerSession> removed;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &session : stale) {
      auto it = sessions_.find(session.peer_id);
      if (it == sessions_.end()) {
        continue;
      }
      if (it->second.connection != session.connection) {
        spdlog::debug("Keeping newer session for {}",
                      session.peer_id.short_hex());
        continue;
      }
      removed.push_back(std::move(it->second));
      sessions_.erase(it);
    }
  }
  close_all(removed);
  return removed.size();
}

bool PeerSessionRegistry::contains(const PeerId &peer_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.count(peer_id) > 0;
}

std::vector<std::pair<PeerId, PeerSession>>
PeerSessionRegistry::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::vector<std::pair<PeerId, PeerSession>>(sessions_.begin(),
                                                     sessions_.end());
}

size_t PeerSessionRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.size();
}

std::vector<PeerId> PeerSessionRegistry::peer_ids() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<PeerId> ids;
  ids.reserve(sessions_.size());
  for (const auto &entry : sessions_) {
    ids.push_back(entry.first);
  }
  return ids;
}

void PeerSessionRegistry::clear() {
  std::vector<PeerSession> removed;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto &entry : sessions_) {
      removed.push_back(std::move(entry.second));
    }
    sessions_.clear();
  }
  close_all(removed);
}

} // namespace clipsync
