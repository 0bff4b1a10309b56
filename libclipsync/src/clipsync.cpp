/**
 * @file clipsync.cpp
 * @brief SyncService implementation
 */

#include "clipsync/clipsync.h"
#include "clipsync/security.h"
#include <atomic>
#include <mutex>
#include <thread>

#include <spdlog/spdlog.h>

namespace clipsync {

// ============================================================================
// Version Information
// ============================================================================

VersionInfo get_version() { return VersionInfo{}; }

// ============================================================================
// SyncOptions
// ============================================================================

SyncOptions SyncOptions::from_config(const ClipSyncConfig &config,
                                     const PeerId &peer_id) {
  SyncOptions options;
  options.peer_id = peer_id;
  options.device_name = config.effective_device_name();
  options.listen_port = config.listen_port;
  options.discovery_port = config.discovery_port;
  options.beacon_interval = std::chrono::milliseconds(config.beacon_interval_ms);
  options.connect_timeout = std::chrono::milliseconds(config.connect_timeout_ms);
  options.io_timeout = std::chrono::milliseconds(config.io_timeout_ms);

  options.detector.poll_interval =
      std::chrono::milliseconds(config.poll_interval_ms);
  options.detector.share_text = config.share_text;
  options.detector.share_images = config.share_images;
  options.detector.max_image_size = static_cast<size_t>(config.max_image_size);

  options.applier.notify = config.enable_notifications;
  options.applier.preview_length = config.preview_length;
  return options;
}

// ============================================================================
// SyncService Implementation
// ============================================================================

class SyncService::Impl {
public:
  SyncOptions options;
  std::mutex mutex;
  std::atomic<bool> running{false};
  bool started = false;

  // Collaborators
  std::unique_ptr<ClipboardBackend> clipboard;
  std::unique_ptr<Notifier> notifier;

  // Shared core; declared before the transport so inbound streams never
  // outlive the queue they feed
  PeerSessionRegistry registry;
  MessageQueue queue;
  std::unique_ptr<TcpTransport> transport;

  // Tasks
  std::unique_ptr<BroadcastEngine> broadcaster;
  std::unique_ptr<ClipboardChangeDetector> detector;
  std::unique_ptr<RemoteApplier> applier;
  std::unique_ptr<DiscoveryService> discovery;
  std::unique_ptr<DiscoveryConnector> connector;

  CancellationToken cancel;
  std::thread detector_thread;
  std::thread applier_thread;
  std::thread connector_thread;

  void on_local_change(const ClipboardContent &content) {
    auto report = broadcaster->broadcast(content);
    if (report.is_error()) {
      spdlog::warn("Broadcast failed: {}", report.error().to_string());
    }
  }

  void on_peer_accepted(std::shared_ptr<Connection> connection) {
    PeerId peer_id = connection->peer_id();
    registry.insert(peer_id, PeerSession::create(std::move(connection)));
  }
};

SyncService::SyncService() : impl_(std::make_unique<Impl>()) {}
SyncService::~SyncService() { shutdown(); }

Result<void> SyncService::start(const SyncOptions &options,
                                std::unique_ptr<ClipboardBackend> clipboard,
                                std::unique_ptr<Notifier> notifier) {
  std::lock_guard<std::mutex> lock(impl_->mutex);

  if (impl_->started) {
    return Error(ErrorCode::AlreadyInitialized, "SyncService already started");
  }

  CLIPSYNC_TRY(security_init());

  if (!clipboard) {
    auto system = create_system_clipboard();
    if (system.is_error()) {
      return system.error();
    }
    clipboard = std::move(system).value();
  }
  if (!notifier && options.applier.notify) {
    notifier = create_desktop_notifier();
  }

  impl_->options = options;
  impl_->clipboard = std::move(clipboard);
  impl_->notifier = std::move(notifier);

  // Network first: a bind failure must leave nothing running
  TcpTransportOptions transport_options;
  transport_options.local_id = options.peer_id;
  transport_options.device_name = options.device_name;
  transport_options.bind_address = options.bind_address;
  transport_options.listen_port = options.listen_port;
  transport_options.connect_timeout = options.connect_timeout;
  transport_options.io_timeout = options.io_timeout;

  Impl *impl = impl_.get();
  auto transport = TcpTransport::bind(
      transport_options,
      [impl](const std::string &remote) -> std::unique_ptr<StreamHandler> {
        return std::make_unique<InboundDispatcher>(impl->queue, remote);
      },
      [impl](std::shared_ptr<Connection> connection) {
        impl->on_peer_accepted(std::move(connection));
      });
  if (transport.is_error()) {
    return transport.error();
  }
  impl_->transport = std::move(transport).value();
  impl_->options.peer_id = impl_->transport->local_id();
  impl_->started = true;

  impl_->broadcaster =
      std::make_unique<BroadcastEngine>(impl_->registry, options.device_name);
  impl_->detector = std::make_unique<ClipboardChangeDetector>(
      *impl_->clipboard,
      [impl](const ClipboardContent &content) {
        impl->on_local_change(content);
      },
      options.detector);
  impl_->applier = std::make_unique<RemoteApplier>(
      impl_->queue, *impl_->clipboard, impl_->notifier.get(), options.applier);

  ClipboardChangeDetector *detector = impl_->detector.get();
  impl_->applier->set_write_hook([detector](const ClipboardContent &content) {
    detector->expect_remote_write(content);
  });
  impl_->applier->set_write_failed_hook(
      [detector](const ClipboardContent &content) {
        detector->cancel_remote_write(content);
      });

  impl_->detector_thread =
      std::thread([impl] { impl->detector->run(impl->cancel); });
  impl_->applier_thread =
      std::thread([impl] { impl->applier->run(impl->cancel); });

  impl_->running = true;
  spdlog::info("clipsync {} started as {} ({})", VERSION_STRING,
               options.device_name, impl_->options.peer_id.short_hex());
  return Result<void>::ok();
}

void SyncService::shutdown() {
  std::lock_guard<std::mutex> lock(impl_->mutex);

  if (!impl_->running.exchange(false)) {
    return;
  }

  spdlog::info("Shutting down");
  impl_->cancel.cancel();
  impl_->queue.close();

  if (impl_->discovery) {
    impl_->discovery->stop();
  }
  for (std::thread *t : {&impl_->detector_thread, &impl_->applier_thread,
                         &impl_->connector_thread}) {
    if (t->joinable()) {
      t->join();
    }
  }

  impl_->transport->shutdown();
  impl_->registry.clear();
}

bool SyncService::is_running() const { return impl_->running.load(); }

void SyncService::run_until_cancelled(CancellationToken &cancel) {
  while (is_running() && !cancel.wait_for(std::chrono::milliseconds(500))) {
  }
  shutdown();
}

Result<PeerId> SyncService::connect_ticket(const ConnectionTicket &ticket) {
  CLIPSYNC_REQUIRE(is_running(), ErrorCode::InvalidState,
                   "SyncService not running");

  spdlog::info("Connecting to {}", ticket.peer_id.short_hex());
  auto connection = impl_->transport->connect(ticket.peer_id, ticket.addresses);
  if (connection.is_error()) {
    return connection.error();
  }

  impl_->registry.insert(ticket.peer_id,
                         PeerSession::create(connection.value()));
  return ticket.peer_id;
}

Result<void> SyncService::enable_auto_discovery() {
  std::lock_guard<std::mutex> lock(impl_->mutex);

  if (!impl_->running.load()) {
    return Error(ErrorCode::InvalidState, "SyncService not running");
  }
  if (impl_->discovery) {
    return Result<void>::ok();
  }

  DiscoveryOptions options;
  options.local_id = impl_->options.peer_id;
  options.device_name = impl_->options.device_name;
  options.tcp_port = impl_->transport->listen_port();
  options.discovery_port = impl_->options.discovery_port;
  options.beacon_interval = impl_->options.beacon_interval;

  auto discovery = std::make_unique<DiscoveryService>();
  TcpTransport *transport = impl_->transport.get();
  CLIPSYNC_TRY(discovery->start(options, [transport](const DiscoveredPeer &peer) {
    transport->add_known_addresses(peer.peer_id, peer.addresses);
  }));

  impl_->discovery = std::move(discovery);
  impl_->connector = std::make_unique<DiscoveryConnector>(*impl_->transport,
                                                          impl_->registry);

  Impl *impl = impl_.get();
  impl_->connector_thread = std::thread([impl] {
    impl->connector->run(impl->discovery->events(), impl->cancel);
  });
  return Result<void>::ok();
}

ConnectionTicket SyncService::ticket() const {
  ConnectionTicket ticket;
  ticket.peer_id = local_id();
  if (impl_->transport) {
    ticket.addresses = impl_->transport->local_addresses();
  }
  return ticket;
}

PeerId SyncService::local_id() const {
  return impl_->transport ? impl_->transport->local_id()
                          : impl_->options.peer_id;
}

uint16_t SyncService::listen_port() const {
  return impl_->transport ? impl_->transport->listen_port() : 0;
}

size_t SyncService::peer_count() const { return impl_->registry.size(); }

PeerSessionRegistry &SyncService::registry() { return impl_->registry; }

Result<BroadcastReport>
SyncService::broadcast(const ClipboardContent &content) {
  CLIPSYNC_REQUIRE(is_running(), ErrorCode::InvalidState,
                   "SyncService not running");
  return impl_->broadcaster->broadcast(content);
}

void SyncService::notify(const std::string &title, const std::string &body) {
  if (!impl_->options.applier.notify || !impl_->notifier) {
    return;
  }
  auto shown = impl_->notifier->notify(title, body);
  if (shown.is_error()) {
    spdlog::debug("Notification failed: {}", shown.error().to_string());
  }
}

} // namespace clipsync
