/**
 * @file transport.h
 * @brief Abstract peer transport used by the sync engine
 *
 * The engine never touches sockets directly. It sees:
 * - Transport: the local endpoint, able to dial peers
 * - Connection: an authenticated handle to one peer
 * - SendStream: one outbound unidirectional stream (one message)
 * - StreamHandler: receives the bytes of one inbound stream
 */

#ifndef CLIPSYNC_TRANSPORT_H
#define CLIPSYNC_TRANSPORT_H

#include "clipsync/error.h"
#include "clipsync/types.h"
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace clipsync {

// ============================================================================
// Streams
// ============================================================================

/**
 * @brief Outbound stream; finish() marks the end of the message
 */
class SendStream {
public:
  virtual ~SendStream() = default;

  virtual Result<void> write_all(const Bytes &data) = 0;
  virtual Result<void> finish() = 0;
};

/**
 * @brief Receiver side of one inbound stream
 *
 * Called from the transport's I/O thread. Exactly one of on_end() or
 * on_error() is the last call.
 */
class StreamHandler {
public:
  virtual ~StreamHandler() = default;

  virtual void on_data(const Byte *data, size_t size) = 0;
  virtual void on_end() = 0;
  virtual void on_error(const Error &error) = 0;
};

// ============================================================================
// Connection
// ============================================================================

/**
 * @brief Send-capable handle to a peer whose identity has been verified
 */
class Connection {
public:
  virtual ~Connection() = default;

  virtual PeerId peer_id() const = 0;

  /// Address or name used in log lines
  virtual std::string remote_label() const = 0;

  /// Open a fresh unidirectional stream to the peer
  virtual Result<std::unique_ptr<SendStream>> open_stream() = 0;

  virtual void close() = 0;
};

// ============================================================================
// Transport
// ============================================================================

/// Creates the handler for a newly accepted inbound stream
using StreamHandlerFactory =
    std::function<std::unique_ptr<StreamHandler>(const std::string &remote)>;

/// Reports a peer that completed the handshake towards us
using PeerAcceptedCallback =
    std::function<void(std::shared_ptr<Connection> connection)>;

/**
 * @brief Local endpoint of the peer network
 */
class Transport {
public:
  virtual ~Transport() = default;

  virtual PeerId local_id() const = 0;
  virtual std::vector<SocketAddress> local_addresses() const = 0;

  /**
   * @brief Dial a peer and verify its identity
   *
   * @param peer_id Identity the remote must prove
   * @param addresses Candidate addresses, tried in order; may be empty when
   *        the transport knows the peer from discovery
   */
  virtual Result<std::shared_ptr<Connection>>
  connect(const PeerId &peer_id, const std::vector<SocketAddress> &addresses) = 0;

  /// Stop accepting and release sockets (idempotent)
  virtual void shutdown() = 0;
};

} // namespace clipsync

#endif // CLIPSYNC_TRANSPORT_H
