/**
 * @file tcp_transport.h
 * @brief Transport over plain TCP (Boost.Asio)
 *
 * Connection setup:
 *   dialer --Hello{id, name, listen_port}--> listener
 *   dialer <--HelloAck{id, name, port}------ listener
 * The dialer checks the acknowledged id against the id it expected; the
 * listener reports the dialer as a new Connection (remote IP + advertised
 * port). Every clipboard message then travels on its own short-lived TCP
 * stream that starts with a ClipboardPush packet.
 */

#ifndef CLIPSYNC_TCP_TRANSPORT_H
#define CLIPSYNC_TCP_TRANSPORT_H

#include "clipsync/transport.h"
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace clipsync {

/**
 * @brief TcpTransport settings
 */
struct TcpTransportOptions {
  /// Identity to announce; generated when zero
  PeerId local_id;

  /// Name sent in the handshake
  std::string device_name;

  /// Interface to listen on
  std::string bind_address = "0.0.0.0";

  /// Port to listen on (0 = ephemeral)
  uint16_t listen_port = 0;

  std::chrono::milliseconds connect_timeout{3000};
  std::chrono::milliseconds io_timeout{5000};
};

/**
 * @brief Transport implementation with its own I/O thread for inbound work
 *
 * Inbound streams and handshakes are served on the I/O thread; outbound
 * operations block the calling thread, each bounded by connect_timeout or
 * io_timeout.
 */
class CLIPSYNC_API TcpTransport : public Transport {
public:
  /**
   * @brief Bind the listener and start the I/O thread
   *
   * @param options Transport settings
   * @param stream_factory Creates one handler per inbound message stream
   * @param on_peer_accepted Receives peers that dialed us (may be empty)
   * @return Running transport, or BindFailed
   */
  static Result<std::unique_ptr<TcpTransport>>
  bind(TcpTransportOptions options, StreamHandlerFactory stream_factory,
       PeerAcceptedCallback on_peer_accepted);

  ~TcpTransport() override;

  TcpTransport(const TcpTransport &) = delete;
  TcpTransport &operator=(const TcpTransport &) = delete;

  PeerId local_id() const override;
  std::vector<SocketAddress> local_addresses() const override;

  Result<std::shared_ptr<Connection>>
  connect(const PeerId &peer_id,
          const std::vector<SocketAddress> &addresses) override;

  void shutdown() override;

  /// Port actually bound (resolves an ephemeral request)
  uint16_t listen_port() const;

  /// Remember where a peer can be reached (fed by discovery)
  void add_known_addresses(const PeerId &peer_id,
                           const std::vector<SocketAddress> &addresses);

private:
  TcpTransport();

  class Impl;
  std::unique_ptr<Impl> impl_;
};

/**
 * @brief Addresses under which this host can be reached on @p port
 *
 * Non-loopback IPv4 addresses of interfaces that are up, followed by
 * 127.0.0.1.
 */
CLIPSYNC_API std::vector<SocketAddress> enumerate_local_addresses(uint16_t port);

} // namespace clipsync

#endif // CLIPSYNC_TCP_TRANSPORT_H
