/**
 * @file ticket.h
 * @brief Connection tickets: shareable text naming a peer and its addresses
 */

#ifndef CLIPSYNC_TICKET_H
#define CLIPSYNC_TICKET_H

#include "clipsync/error.h"
#include "clipsync/types.h"
#include <string>
#include <vector>

namespace clipsync {

/**
 * @brief Everything needed to dial a peer
 *
 * Text form is base64 of {"node_id": "<64 hex>", "addresses": ["host:port"]}.
 * The address list may be empty when the peer is reachable via discovery.
 */
struct ConnectionTicket {
  PeerId peer_id;
  std::vector<SocketAddress> addresses;

  bool operator==(const ConnectionTicket &other) const {
    return peer_id == other.peer_id && addresses == other.addresses;
  }

  /// Serialize to the shareable text form
  std::string encode() const;

  /**
   * @brief Parse the shareable text form
   *
   * Surrounding whitespace is ignored. Any malformation yields InvalidTicket.
   */
  static Result<ConnectionTicket> decode(const std::string &text);
};

} // namespace clipsync

#endif // CLIPSYNC_TICKET_H
