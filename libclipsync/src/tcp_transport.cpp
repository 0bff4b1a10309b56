/**
 * @file tcp_transport.cpp
 * @brief TcpTransport implementation
 *
 * Inbound sockets are served asynchronously on the transport's I/O thread.
 * Outbound operations run on a private io_context per call and are bounded
 * with run_for(), closing the socket when the deadline passes.
 */

#include "clipsync/tcp_transport.h"
#include "clipsync/protocol.h"
#include <array>
#include <atomic>
#include <map>
#include <mutex>
#include <thread>

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>

#include <boost/asio.hpp>
#include <spdlog/spdlog.h>

namespace clipsync {

namespace asio = boost::asio;
using asio::ip::tcp;
using boost::system::error_code;

namespace {

constexpr uint32_t HELLO_CAPABILITIES =
    HelloMessage::CAP_TEXT | HelloMessage::CAP_IMAGE;

/// Largest well-formed Hello payload
constexpr uint32_t MAX_HELLO_PAYLOAD =
    PeerId::SIZE + 2 + MAX_SHORT_STRING + 2 + 4;

constexpr size_t READ_CHUNK_SIZE = 64 * 1024;

std::string endpoint_label(const tcp::socket &socket) {
  error_code ec;
  auto ep = socket.remote_endpoint(ec);
  if (ec) {
    return "unknown";
  }
  return SocketAddress{ep.address().to_string(), ep.port()}.to_string();
}

// ============================================================================
// Blocking Client
// ============================================================================

/**
 * @brief One outbound TCP socket whose every operation has a deadline
 */
class BlockingClient {
public:
  BlockingClient(std::chrono::milliseconds connect_timeout,
                 std::chrono::milliseconds io_timeout)
      : connect_timeout_(connect_timeout), io_timeout_(io_timeout) {}

  Result<void> connect(const SocketAddress &address) {
    error_code ec;
    std::vector<tcp::endpoint> endpoints;

    auto ip = asio::ip::make_address(address.host, ec);
    if (!ec) {
      endpoints.emplace_back(ip, address.port);
    } else {
      // Host names are rare in tickets; resolution is not deadline-bound
      tcp::resolver resolver(io_);
      auto results = resolver.resolve(address.host,
                                      std::to_string(address.port), ec);
      if (ec) {
        return Error(ErrorCode::ConnectionFailed,
                     "Cannot resolve " + address.to_string(), ec.message());
      }
      for (const auto &entry : results) {
        endpoints.push_back(entry.endpoint());
      }
    }

    asio::async_connect(
        socket_, endpoints,
        [&ec](const error_code &result, const tcp::endpoint &) {
          ec = result;
        });

    if (!run(connect_timeout_)) {
      return Error(ErrorCode::ConnectionTimeout,
                   "Timed out connecting to " + address.to_string());
    }
    if (ec) {
      return Error(ec == asio::error::connection_refused
                       ? ErrorCode::ConnectionRefused
                       : ErrorCode::ConnectionFailed,
                   "Cannot connect to " + address.to_string(), ec.message());
    }

    socket_.set_option(tcp::no_delay(true), ec);
    return Result<void>::ok();
  }

  Result<void> write(const Bytes &data) {
    error_code ec;
    asio::async_write(socket_, asio::buffer(data),
                      [&ec](const error_code &result, size_t) { ec = result; });

    if (!run(io_timeout_)) {
      return Error(ErrorCode::Timeout, "Write timed out");
    }
    if (ec) {
      return Error(ErrorCode::StreamWriteFailed, "Write failed", ec.message());
    }
    return Result<void>::ok();
  }

  Result<Bytes> read_exact(size_t count) {
    Bytes buf(count);
    error_code ec;
    asio::async_read(socket_, asio::buffer(buf),
                     [&ec](const error_code &result, size_t) { ec = result; });

    if (!run(io_timeout_)) {
      return Error(ErrorCode::Timeout, "Read timed out");
    }
    if (ec) {
      return Error(ErrorCode::ConnectionLost, "Read failed", ec.message());
    }
    return buf;
  }

  /// Half-close and wait for the peer to close its side
  Result<void> finish() {
    error_code ec;
    socket_.shutdown(tcp::socket::shutdown_send, ec);
    if (ec) {
      return Error(ErrorCode::StreamWriteFailed, "Shutdown failed",
                   ec.message());
    }

    Byte dummy;
    asio::async_read(socket_, asio::buffer(&dummy, 1),
                     [&ec](const error_code &result, size_t) { ec = result; });

    if (!run(io_timeout_)) {
      return Error(ErrorCode::Timeout, "Peer did not confirm end of stream");
    }
    if (ec && ec != asio::error::eof) {
      return Error(ErrorCode::StreamWriteFailed, "Stream not confirmed",
                   ec.message());
    }
    close();
    return Result<void>::ok();
  }

  void close() {
    error_code ignored;
    socket_.close(ignored);
  }

private:
  /// Run the pending operation; false if the deadline expired
  bool run(std::chrono::milliseconds timeout) {
    io_.restart();
    io_.run_for(timeout);

    if (!io_.stopped()) {
      // Deadline hit: cancel the operation and let its handler complete
      close();
      io_.run();
      return false;
    }
    return true;
  }

  std::chrono::milliseconds connect_timeout_;
  std::chrono::milliseconds io_timeout_;
  asio::io_context io_;
  tcp::socket socket_{io_};
};

// ============================================================================
// Outbound Stream / Connection
// ============================================================================

class TcpSendStream : public SendStream {
public:
  explicit TcpSendStream(std::unique_ptr<BlockingClient> client)
      : client_(std::move(client)) {}

  Result<void> write_all(const Bytes &data) override {
    return client_->write(data);
  }

  Result<void> finish() override { return client_->finish(); }

private:
  std::unique_ptr<BlockingClient> client_;
};

class TcpConnection : public Connection {
public:
  TcpConnection(const PeerId &peer_id, SocketAddress address,
                std::chrono::milliseconds connect_timeout,
                std::chrono::milliseconds io_timeout)
      : peer_id_(peer_id), address_(std::move(address)),
        connect_timeout_(connect_timeout), io_timeout_(io_timeout) {}

  PeerId peer_id() const override { return peer_id_; }

  std::string remote_label() const override {
    return peer_id_.short_hex() + "@" + address_.to_string();
  }

  Result<std::unique_ptr<SendStream>> open_stream() override {
    if (closed_.load()) {
      return Error(ErrorCode::ConnectionLost, "Connection closed");
    }

    auto client =
        std::make_unique<BlockingClient>(connect_timeout_, io_timeout_);
    auto connected = client->connect(address_);
    if (connected.is_error()) {
      return Error(ErrorCode::StreamOpenFailed, "Cannot open stream",
                   connected.error().to_string());
    }
    return std::unique_ptr<SendStream>(new TcpSendStream(std::move(client)));
  }

  void close() override { closed_.store(true); }

private:
  PeerId peer_id_;
  SocketAddress address_;
  std::chrono::milliseconds connect_timeout_;
  std::chrono::milliseconds io_timeout_;
  std::atomic<bool> closed_{false};
};

// ============================================================================
// Shared Transport State
// ============================================================================

/**
 * @brief State the I/O thread shares with the API side of TcpTransport
 */
struct TransportState {
  TcpTransportOptions options;
  StreamHandlerFactory stream_factory;
  PeerAcceptedCallback on_peer_accepted;
  uint16_t bound_port = 0;

  std::mutex book_mutex;
  std::map<PeerId, std::vector<SocketAddress>> address_book;

  HelloMessage make_hello() const {
    HelloMessage hello;
    hello.peer_id = options.local_id;
    hello.device_name = options.device_name;
    hello.listen_port = bound_port;
    hello.capabilities = HELLO_CAPABILITIES;
    return hello;
  }

  std::shared_ptr<Connection> make_connection(const PeerId &peer_id,
                                              const SocketAddress &address) {
    return std::make_shared<TcpConnection>(peer_id, address,
                                           options.connect_timeout,
                                           options.io_timeout);
  }
};

// ============================================================================
// Inbound Session
// ============================================================================

/**
 * @brief One accepted socket: either a handshake or a message stream
 */
class InboundSession : public std::enable_shared_from_this<InboundSession> {
public:
  InboundSession(tcp::socket socket, TransportState &owner)
      : socket_(std::move(socket)), deadline_(socket_.get_executor()),
        owner_(owner) {}

  void start() {
    remote_ = endpoint_label(socket_);
    arm_deadline();
    read_header();
  }

private:
  void arm_deadline() {
    auto self = shared_from_this();
    deadline_.expires_after(owner_.options.io_timeout);
    deadline_.async_wait([this, self](const error_code &ec) {
      if (ec != asio::error::operation_aborted) {
        timed_out_ = true;
        error_code ignored;
        socket_.close(ignored);
      }
    });
  }

  void close() {
    deadline_.cancel();
    error_code ignored;
    socket_.close(ignored);
  }

  void read_header() {
    auto self = shared_from_this();
    asio::async_read(socket_, asio::buffer(header_),
                     [this, self](const error_code &ec, size_t) {
                       if (ec) {
                         spdlog::debug("Inbound connection from {} closed "
                                       "before a header arrived: {}",
                                       remote_, ec.message());
                         close();
                         return;
                       }
                       on_header();
                     });
  }

  void on_header() {
    auto header = deserialize_header(Bytes(header_.begin(), header_.end()));
    if (header.is_error()) {
      spdlog::warn("Rejecting connection from {}: {}", remote_,
                   header.error().to_string());
      close();
      return;
    }

    switch (static_cast<MessageType>(header.value().type)) {
    case MessageType::Hello:
      read_hello(header.value().payload_size);
      break;

    case MessageType::ClipboardPush:
      handler_ = owner_.stream_factory ? owner_.stream_factory(remote_)
                                       : nullptr;
      if (!handler_) {
        close();
        return;
      }
      handler_->on_data(header_.data(), header_.size());
      chunk_.resize(READ_CHUNK_SIZE);
      arm_deadline();
      read_stream();
      break;

    default:
      spdlog::warn("Unexpected {} packet opening connection from {}",
                   message_type_name(
                       static_cast<MessageType>(header.value().type)),
                   remote_);
      close();
      break;
    }
  }

  void read_hello(uint32_t size) {
    if (size > MAX_HELLO_PAYLOAD) {
      spdlog::warn("Oversized hello from {}", remote_);
      close();
      return;
    }
    payload_.resize(size);

    auto self = shared_from_this();
    asio::async_read(socket_, asio::buffer(payload_),
                     [this, self](const error_code &ec, size_t) {
                       if (ec) {
                         spdlog::debug("Handshake from {} aborted: {}",
                                       remote_, ec.message());
                         close();
                         return;
                       }
                       on_hello();
                     });
  }

  void on_hello() {
    auto hello = deserialize_hello(payload_);
    if (hello.is_error()) {
      spdlog::warn("Bad hello from {}: {}", remote_,
                   hello.error().to_string());
      close();
      return;
    }
    if (hello.value().peer_id == owner_.options.local_id) {
      spdlog::debug("Ignoring hello from our own identity");
      close();
      return;
    }
    peer_ = hello.value();

    out_ = build_packet(MessageType::HelloAck, serialize_hello(owner_.make_hello()));
    auto self = shared_from_this();
    asio::async_write(socket_, asio::buffer(out_),
                      [this, self](const error_code &ec, size_t) {
                        if (ec) {
                          spdlog::debug("Could not acknowledge {}: {}",
                                        remote_, ec.message());
                          close();
                          return;
                        }
                        report_peer();
                        close();
                      });
  }

  void report_peer() {
    error_code ec;
    auto ep = socket_.remote_endpoint(ec);
    if (ec || peer_.listen_port == 0) {
      spdlog::debug("Peer {} cannot be dialed back", peer_.peer_id.short_hex());
      return;
    }

    SocketAddress address{ep.address().to_string(), peer_.listen_port};
    {
      std::lock_guard<std::mutex> lock(owner_.book_mutex);
      owner_.address_book[peer_.peer_id] = {address};
    }

    spdlog::info("Peer {} ({}) connected from {}", peer_.device_name,
                 peer_.peer_id.short_hex(), address.to_string());
    if (owner_.on_peer_accepted) {
      owner_.on_peer_accepted(owner_.make_connection(peer_.peer_id, address));
    }
  }

  void read_stream() {
    auto self = shared_from_this();
    socket_.async_read_some(
        asio::buffer(chunk_), [this, self](const error_code &ec, size_t n) {
          if (n > 0) {
            handler_->on_data(chunk_.data(), n);
          }
          if (ec == asio::error::eof) {
            handler_->on_end();
            close();
            return;
          }
          if (ec) {
            handler_->on_error(
                timed_out_
                    ? Error(ErrorCode::Timeout, "Inbound stream stalled")
                    : Error(ErrorCode::ConnectionLost, "Inbound stream failed",
                            ec.message()));
            close();
            return;
          }
          arm_deadline();
          read_stream();
        });
  }

  tcp::socket socket_;
  asio::steady_timer deadline_;
  TransportState &owner_;
  std::string remote_;
  bool timed_out_ = false;

  std::array<Byte, PACKET_HEADER_SIZE> header_{};
  Bytes payload_;
  Bytes out_;
  Bytes chunk_;
  HelloMessage peer_;
  std::unique_ptr<StreamHandler> handler_;
};

} // anonymous namespace

// ============================================================================
// TcpTransport::Impl
// ============================================================================

class TcpTransport::Impl : public TransportState {
public:
  asio::io_context io;
  tcp::acceptor acceptor{io};
  std::thread io_thread;
  std::atomic<bool> stopped{false};

  void do_accept();

  Result<std::shared_ptr<Connection>> dial(const PeerId &peer_id,
                                           const SocketAddress &address);
};

void TcpTransport::Impl::do_accept() {
  acceptor.async_accept([this](const error_code &ec, tcp::socket socket) {
    if (ec) {
      if (ec == asio::error::operation_aborted || stopped.load()) {
        return;
      }
      spdlog::warn("Accept failed: {}", ec.message());
    } else {
      std::make_shared<InboundSession>(std::move(socket), *this)->start();
    }
    do_accept();
  });
}

Result<std::shared_ptr<Connection>>
TcpTransport::Impl::dial(const PeerId &peer_id, const SocketAddress &address) {
  BlockingClient client(options.connect_timeout, options.io_timeout);
  CLIPSYNC_TRY(client.connect(address));
  CLIPSYNC_TRY(client.write(
      build_packet(MessageType::Hello, serialize_hello(make_hello()))));

  auto header_bytes = client.read_exact(PACKET_HEADER_SIZE);
  if (header_bytes.is_error()) {
    return header_bytes.error();
  }
  auto header = deserialize_header(header_bytes.value());
  if (header.is_error()) {
    return header.error();
  }
  if (header.value().type != static_cast<uint8_t>(MessageType::HelloAck) ||
      header.value().payload_size > MAX_HELLO_PAYLOAD) {
    return Error(ErrorCode::ConnectionRefused, "Unexpected handshake reply",
                 address.to_string());
  }

  auto payload = client.read_exact(header.value().payload_size);
  if (payload.is_error()) {
    return payload.error();
  }
  auto ack = deserialize_hello(payload.value());
  if (ack.is_error()) {
    return ack.error();
  }
  client.close();

  if (ack.value().peer_id != peer_id) {
    return Error(ErrorCode::ConnectionRefused, "Peer identity mismatch",
                 "expected " + peer_id.short_hex() + ", got " +
                     ack.value().peer_id.short_hex());
  }

  spdlog::info("Connected to {} ({}) at {}", ack.value().device_name,
               peer_id.short_hex(), address.to_string());
  return make_connection(peer_id, address);
}

// ============================================================================
// TcpTransport
// ============================================================================

TcpTransport::TcpTransport() : impl_(std::make_unique<Impl>()) {}

TcpTransport::~TcpTransport() { shutdown(); }

Result<std::unique_ptr<TcpTransport>>
TcpTransport::bind(TcpTransportOptions options,
                   StreamHandlerFactory stream_factory,
                   PeerAcceptedCallback on_peer_accepted) {
  std::unique_ptr<TcpTransport> transport(new TcpTransport());
  Impl &impl = *transport->impl_;

  if (options.local_id.is_zero()) {
    options.local_id = PeerId::generate();
  }
  impl.options = std::move(options);
  impl.stream_factory = std::move(stream_factory);
  impl.on_peer_accepted = std::move(on_peer_accepted);

  error_code ec;
  auto address = asio::ip::make_address(impl.options.bind_address, ec);
  if (ec) {
    return Error(ErrorCode::BindFailed,
                 "Invalid bind address: " + impl.options.bind_address);
  }
  tcp::endpoint endpoint(address, impl.options.listen_port);
  std::string where = SocketAddress{impl.options.bind_address,
                                    impl.options.listen_port}
                          .to_string();

  impl.acceptor.open(endpoint.protocol(), ec);
  if (!ec) {
    impl.acceptor.set_option(tcp::acceptor::reuse_address(true), ec);
  }
  if (!ec) {
    impl.acceptor.bind(endpoint, ec);
  }
  if (!ec) {
    impl.acceptor.listen(asio::socket_base::max_listen_connections, ec);
  }
  if (ec) {
    return Error(ErrorCode::BindFailed, "Cannot listen on " + where,
                 ec.message());
  }

  impl.bound_port = impl.acceptor.local_endpoint(ec).port();
  if (ec) {
    return Error(ErrorCode::BindFailed, "Cannot query bound port",
                 ec.message());
  }

  impl.do_accept();
  impl.io_thread = std::thread([&impl] { impl.io.run(); });

  spdlog::info("Listening on port {} as {}", impl.bound_port,
               impl.options.local_id.to_hex());
  return std::move(transport);
}

PeerId TcpTransport::local_id() const { return impl_->options.local_id; }

uint16_t TcpTransport::listen_port() const { return impl_->bound_port; }

std::vector<SocketAddress> TcpTransport::local_addresses() const {
  const std::string &bind_address = impl_->options.bind_address;
  if (bind_address == "0.0.0.0") {
    return enumerate_local_addresses(impl_->bound_port);
  }
  return {SocketAddress{bind_address, impl_->bound_port}};
}

Result<std::shared_ptr<Connection>>
TcpTransport::connect(const PeerId &peer_id,
                      const std::vector<SocketAddress> &addresses) {
  if (impl_->stopped.load()) {
    return Error(ErrorCode::InvalidState, "Transport is shut down");
  }
  if (peer_id == impl_->options.local_id) {
    return Error(ErrorCode::InvalidArgument, "Refusing to connect to self");
  }

  std::vector<SocketAddress> candidates = addresses;
  if (candidates.empty()) {
    std::lock_guard<std::mutex> lock(impl_->book_mutex);
    auto it = impl_->address_book.find(peer_id);
    if (it != impl_->address_book.end()) {
      candidates = it->second;
    }
  }
  if (candidates.empty()) {
    return Error(ErrorCode::PeerNotFound, "No known address for peer",
                 peer_id.short_hex());
  }

  Error last_error(ErrorCode::ConnectionFailed, "No address reachable");
  for (const auto &address : candidates) {
    auto connection = impl_->dial(peer_id, address);
    if (connection.is_ok()) {
      add_known_addresses(peer_id, {address});
      return connection;
    }
    spdlog::debug("Handshake with {} at {} failed: {}", peer_id.short_hex(),
                  address.to_string(), connection.error().to_string());
    last_error = connection.error();
  }
  return last_error;
}

void TcpTransport::add_known_addresses(
    const PeerId &peer_id, const std::vector<SocketAddress> &addresses) {
  if (addresses.empty()) {
    return;
  }
  std::lock_guard<std::mutex> lock(impl_->book_mutex);
  impl_->address_book[peer_id] = addresses;
}

void TcpTransport::shutdown() {
  if (impl_->stopped.exchange(true)) {
    return;
  }

  impl_->io.stop();
  if (impl_->io_thread.joinable()) {
    impl_->io_thread.join();
  }

  error_code ignored;
  impl_->acceptor.close(ignored);
  spdlog::debug("Transport stopped");
}

// ============================================================================
// Local Addresses
// ============================================================================

std::vector<SocketAddress> enumerate_local_addresses(uint16_t port) {
  std::vector<SocketAddress> result;

  struct ifaddrs *interfaces = nullptr;
  if (getifaddrs(&interfaces) == 0) {
    for (auto *it = interfaces; it != nullptr; it = it->ifa_next) {
      if (!it->ifa_addr || it->ifa_addr->sa_family != AF_INET) {
        continue;
      }
      if (!(it->ifa_flags & IFF_UP) || (it->ifa_flags & IFF_LOOPBACK)) {
        continue;
      }

      char buf[INET_ADDRSTRLEN];
      auto *sin = reinterpret_cast<struct sockaddr_in *>(it->ifa_addr);
      if (inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf)) == nullptr) {
        continue;
      }

      SocketAddress address{buf, port};
      bool seen = false;
      for (const auto &existing : result) {
        seen = seen || existing == address;
      }
      if (!seen) {
        result.push_back(address);
      }
    }
    freeifaddrs(interfaces);
  }

  result.push_back(SocketAddress{"127.0.0.1", port});
  return result;
}

} // namespace clipsync
