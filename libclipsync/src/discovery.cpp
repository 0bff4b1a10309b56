/**
 * @file discovery.cpp
 * @brief UDP beacon discovery implementation
 */

#include "clipsync/discovery.h"
#include "clipsync/protocol.h"
#include <array>
#include <atomic>
#include <thread>

#include <boost/asio.hpp>
#include <spdlog/spdlog.h>

namespace clipsync {

namespace asio = boost::asio;
using asio::ip::udp;
using boost::system::error_code;

// ============================================================================
// Beacon Encoding
// ============================================================================

Bytes encode_beacon(const Beacon &beacon) {
  Bytes buf;
  buf.reserve(4 + 1 + PeerId::SIZE + 2 + 2 + MAX_BEACON_NAME);
  wire::write_u32(buf, BEACON_MAGIC);
  buf.push_back(BEACON_VERSION);
  wire::write_array(buf, beacon.peer_id.data);
  wire::write_u16(buf, beacon.tcp_port);
  wire::write_string(buf, beacon.device_name.substr(0, MAX_BEACON_NAME));
  return buf;
}

std::optional<Beacon> decode_beacon(const Byte *data, size_t size) {
  wire::Reader reader(data, size);
  uint32_t magic = 0;
  uint8_t version = 0;
  Beacon beacon;

  if (!reader.read_u32(magic) || magic != BEACON_MAGIC) {
    return std::nullopt;
  }
  if (!reader.read_u8(version) || version != BEACON_VERSION) {
    return std::nullopt;
  }
  if (!reader.read_array(beacon.peer_id.data) ||
      !reader.read_u16(beacon.tcp_port) ||
      !reader.read_string(beacon.device_name) || !reader.at_end()) {
    return std::nullopt;
  }
  if (beacon.peer_id.is_zero() || beacon.tcp_port == 0) {
    return std::nullopt;
  }
  return beacon;
}

// ============================================================================
// DiscoveryService::Impl
// ============================================================================

class DiscoveryService::Impl {
public:
  asio::io_context io;
  udp::socket socket{io};
  asio::steady_timer beacon_timer{io};
  std::thread io_thread;

  DiscoveryOptions options;
  PeerDiscoveredCallback on_peer;
  DiscoveryQueue queue;

  std::atomic<bool> running{false};
  bool started = false;
  std::atomic<size_t> rejected{0};

  Bytes beacon;
  udp::endpoint broadcast_endpoint;
  std::array<Byte, 2048> recv_buffer{};
  udp::endpoint sender;

  void send_beacon();
  void do_receive();
  void on_datagram(size_t size);
};

void DiscoveryService::Impl::send_beacon() {
  socket.async_send_to(
      asio::buffer(beacon), broadcast_endpoint,
      [this](const error_code &ec, size_t) {
        if (ec && ec != asio::error::operation_aborted) {
          spdlog::debug("Beacon send failed: {}", ec.message());
        }
      });

  beacon_timer.expires_after(options.beacon_interval);
  beacon_timer.async_wait([this](const error_code &ec) {
    if (!ec) {
      send_beacon();
    }
  });
}

void DiscoveryService::Impl::do_receive() {
  socket.async_receive_from(
      asio::buffer(recv_buffer), sender, [this](const error_code &ec, size_t n) {
        if (ec == asio::error::operation_aborted || !running.load()) {
          return;
        }
        if (ec) {
          spdlog::debug("Discovery receive failed: {}", ec.message());
        } else {
          on_datagram(n);
        }
        do_receive();
      });
}

void DiscoveryService::Impl::on_datagram(size_t size) {
  auto parsed = decode_beacon(recv_buffer.data(), size);
  if (!parsed) {
    ++rejected;
    spdlog::debug("Ignoring malformed beacon from {}",
                  sender.address().to_string());
    return;
  }
  if (parsed->peer_id == options.local_id) {
    return;
  }

  DiscoveredPeer peer;
  peer.peer_id = parsed->peer_id;
  peer.device_name = parsed->device_name;
  peer.addresses.push_back(
      SocketAddress{sender.address().to_string(), parsed->tcp_port});

  spdlog::debug("Beacon from {} ({}) at {}", peer.device_name,
                peer.peer_id.short_hex(), peer.addresses.front().to_string());

  if (on_peer) {
    on_peer(peer);
  }
  queue.push(std::move(peer));
}

// ============================================================================
// DiscoveryService
// ============================================================================

DiscoveryService::DiscoveryService() : impl_(std::make_unique<Impl>()) {}

DiscoveryService::~DiscoveryService() { stop(); }

Result<void> DiscoveryService::start(const DiscoveryOptions &options,
                                     PeerDiscoveredCallback on_peer) {
  if (impl_->started) {
    return Error(ErrorCode::InvalidState, "Discovery already started");
  }
  impl_->started = true;
  impl_->options = options;
  impl_->on_peer = std::move(on_peer);

  error_code ec;
  auto broadcast = asio::ip::make_address_v4(options.broadcast_address, ec);
  if (ec) {
    return Error(ErrorCode::DiscoveryFailed,
                 "Invalid broadcast address: " + options.broadcast_address);
  }
  impl_->broadcast_endpoint = udp::endpoint(broadcast, options.discovery_port);

  udp::socket &socket = impl_->socket;
  socket.open(udp::v4(), ec);
  if (!ec) {
    socket.set_option(udp::socket::reuse_address(true), ec);
  }
  if (!ec) {
    socket.set_option(asio::socket_base::broadcast(true), ec);
  }
  if (!ec) {
    socket.bind(udp::endpoint(asio::ip::address_v4::any(),
                              options.discovery_port),
                ec);
  }
  if (ec) {
    error_code ignored;
    socket.close(ignored);
    return Error(ErrorCode::DiscoveryFailed,
                 "Cannot open discovery socket on UDP port " +
                     std::to_string(options.discovery_port),
                 ec.message());
  }

  Beacon own;
  own.peer_id = options.local_id;
  own.tcp_port = options.tcp_port;
  own.device_name = options.device_name;
  impl_->beacon = encode_beacon(own);

  impl_->running = true;
  impl_->do_receive();
  impl_->send_beacon();
  impl_->io_thread = std::thread([this] { impl_->io.run(); });

  spdlog::info("Discovery active on UDP port {}", options.discovery_port);
  return Result<void>::ok();
}

void DiscoveryService::stop() {
  if (!impl_->running.exchange(false)) {
    impl_->queue.close();
    return;
  }

  impl_->io.stop();
  if (impl_->io_thread.joinable()) {
    impl_->io_thread.join();
  }

  error_code ignored;
  impl_->beacon_timer.cancel();
  impl_->socket.close(ignored);
  impl_->queue.close();
  spdlog::debug("Discovery stopped");
}

bool DiscoveryService::is_running() const { return impl_->running.load(); }

DiscoveryQueue &DiscoveryService::events() { return impl_->queue; }

size_t DiscoveryService::rejected() const { return impl_->rejected.load(); }

} // namespace clipsync
