/**
 * @file main.cpp
 * @brief clipsync command line entry point
 */

#include <clipsync/clipsync.h>
#include <clipsync/log.h>
#include <clipsync/security.h>

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

#include <getopt.h>
#include <spdlog/spdlog.h>

using namespace clipsync;

namespace {

constexpr int EXIT_USAGE = 2;

volatile std::sig_atomic_t g_stop_requested = 0;

void handle_signal(int) { g_stop_requested = 1; }

void install_signal_handlers() {
  struct sigaction action {};
  action.sa_handler = handle_signal;
  sigemptyset(&action.sa_mask);
  sigaction(SIGINT, &action, nullptr);
  sigaction(SIGTERM, &action, nullptr);

  // A peer closing mid-write must surface as an error, not kill us
  std::signal(SIGPIPE, SIG_IGN);
}

// ============================================================================
// Options
// ============================================================================

struct CliOptions {
  std::string name;
  int port = -1;
  std::string config_path;
  bool verbose = false;
  bool no_notify = false;
  std::string command;
  std::string argument;
};

void print_usage(std::ostream &out) {
  out << "Usage: clipsync [options] <command>\n"
         "\n"
         "Commands:\n"
         "  start             Start syncing and print a connection ticket\n"
         "  connect <ticket>  Connect to a peer and start syncing\n"
         "  ticket            Print this device's connection ticket\n"
         "  auto              Find peers on the local network automatically\n"
         "  test              Check that the clipboard can be read and written\n"
         "\n"
         "Options:\n"
         "  -n, --name <name>    Device name shown to peers\n"
         "  -p, --port <port>    TCP listen port (0 = any free port)\n"
         "  -c, --config <path>  Config file (default: "
      << (ClipSyncConfig::get_default_config_dir() / "config.json").string()
      << ")\n"
         "  -v, --verbose        Debug logging\n"
         "      --no-notify      Disable desktop notifications\n"
         "  -h, --help           Show this help\n"
         "      --version        Show version\n";
}

/// Returns -1 to continue, otherwise the exit code
int parse_args(int argc, char **argv, CliOptions &options) {
  enum { OPT_NO_NOTIFY = 1000, OPT_VERSION };
  static const struct option long_options[] = {
      {"name", required_argument, nullptr, 'n'},
      {"port", required_argument, nullptr, 'p'},
      {"config", required_argument, nullptr, 'c'},
      {"verbose", no_argument, nullptr, 'v'},
      {"no-notify", no_argument, nullptr, OPT_NO_NOTIFY},
      {"help", no_argument, nullptr, 'h'},
      {"version", no_argument, nullptr, OPT_VERSION},
      {nullptr, 0, nullptr, 0}};

  int opt;
  while ((opt = getopt_long(argc, argv, "n:p:c:vh", long_options, nullptr)) !=
         -1) {
    switch (opt) {
    case 'n':
      options.name = optarg;
      break;
    case 'p': {
      char *end = nullptr;
      long port = std::strtol(optarg, &end, 10);
      if (end == optarg || *end != '\0' || port < 0 || port > 65535) {
        std::cerr << "clipsync: invalid port '" << optarg << "'\n";
        return EXIT_USAGE;
      }
      options.port = static_cast<int>(port);
      break;
    }
    case 'c':
      options.config_path = optarg;
      break;
    case 'v':
      options.verbose = true;
      break;
    case OPT_NO_NOTIFY:
      options.no_notify = true;
      break;
    case 'h':
      print_usage(std::cout);
      return EXIT_SUCCESS;
    case OPT_VERSION: {
      VersionInfo version = get_version();
      std::cout << "clipsync " << version.version_string << " (protocol "
                << version.protocol_version << ")\n";
      return EXIT_SUCCESS;
    }
    default:
      print_usage(std::cerr);
      return EXIT_USAGE;
    }
  }

  if (optind >= argc) {
    print_usage(std::cerr);
    return EXIT_USAGE;
  }
  options.command = argv[optind++];

  if (options.command == "connect") {
    if (optind >= argc) {
      std::cerr << "clipsync: connect needs a ticket\n";
      return EXIT_USAGE;
    }
    options.argument = argv[optind++];
  }
  if (optind < argc) {
    std::cerr << "clipsync: unexpected argument '" << argv[optind] << "'\n";
    return EXIT_USAGE;
  }
  return -1;
}

// ============================================================================
// Setup
// ============================================================================

/**
 * @brief Load the config file, settle the peer identity, then apply command
 * line overrides
 *
 * The identity is persisted before the overrides so they never reach the
 * file.
 */
Result<ClipSyncConfig> load_config(ConfigManager &manager,
                                   const CliOptions &options, PeerId &id) {
  CLIPSYNC_TRY(manager.init(options.config_path));

  auto stored = manager.ensure_peer_id();
  if (stored.is_error()) {
    return stored.error();
  }
  id = stored.value();

  ClipSyncConfig config = manager.get();
  if (!options.name.empty()) {
    config.device_name = options.name;
  }
  if (options.port >= 0) {
    config.listen_port = static_cast<uint16_t>(options.port);
  }
  if (options.no_notify) {
    config.enable_notifications = false;
  }
  if (options.verbose) {
    config.log_level = "debug";
  }
  CLIPSYNC_TRY(config.validate());
  return config;
}

int fail(const Error &error) {
  std::cerr << "clipsync: " << error.to_string() << "\n";
  return EXIT_FAILURE;
}

void print_connect_hint(const std::string &ticket) {
  std::cout << "\nOn the other device, run:\n"
            << "  clipsync connect " << ticket << "\n";
}

void wait_for_signal(SyncService &service) {
  std::cout << "Press Ctrl+C to stop" << std::endl;

  CancellationToken stop;
  // The handler only sets a flag; cancel() happens on this watcher
  std::thread watcher([&stop] {
    while (!g_stop_requested &&
           !stop.wait_for(std::chrono::milliseconds(200))) {
    }
    stop.cancel();
  });

  service.run_until_cancelled(stop);
  stop.cancel();
  watcher.join();
}

// ============================================================================
// Commands
// ============================================================================

int cmd_test() {
  auto clipboard = create_system_clipboard();
  if (clipboard.is_error()) {
    return fail(clipboard.error());
  }
  ClipboardBackend &backend = *clipboard.value();

  std::cout << "Testing clipboard access..." << std::endl;

  auto type = backend.classify();
  if (type.is_ok()) {
    std::cout << "Current content: " << content_type_name(type.value())
              << std::endl;
  }
  if (type.is_ok() && type.value() == ClipboardContentType::Text) {
    auto current = backend.read_text();
    if (current.is_ok()) {
      std::cout << "Current text: "
                << preview(ClipboardContent::text(current.value()), 80)
                << std::endl;
    }
  }

  const std::string sample = "clipsync clipboard test";
  auto written = backend.write_text(sample);
  if (written.is_error()) {
    return fail(written.error());
  }
  std::cout << "Wrote test text to the clipboard" << std::endl;

  auto read_back = backend.read_text();
  if (read_back.is_error()) {
    return fail(read_back.error());
  }
  std::cout << "Read back: " << read_back.value() << std::endl;

  if (read_back.value() != sample) {
    std::cerr << "clipsync: clipboard returned different text\n";
    return EXIT_FAILURE;
  }
  std::cout << "Clipboard test passed" << std::endl;
  return EXIT_SUCCESS;
}

int cmd_ticket(const ClipSyncConfig &config, const PeerId &id) {
  if (config.listen_port == 0) {
    std::cerr << "clipsync: a ticket needs a fixed listen port (use -p)\n";
    return EXIT_USAGE;
  }

  ConnectionTicket ticket;
  ticket.peer_id = id;
  ticket.addresses = enumerate_local_addresses(config.listen_port);
  std::string encoded = ticket.encode();

  std::cout << "Connection ticket:\n" << encoded << "\n";
  print_connect_hint(encoded);
  return EXIT_SUCCESS;
}

int cmd_run(const CliOptions &options, const ClipSyncConfig &config,
            const PeerId &id) {
  // Validate user input before touching the network
  ConnectionTicket target;
  if (options.command == "connect") {
    auto decoded = ConnectionTicket::decode(options.argument);
    if (decoded.is_error()) {
      return fail(decoded.error());
    }
    target = decoded.value();
  }

  SyncService service;
  auto started = service.start(SyncOptions::from_config(config, id));
  if (started.is_error()) {
    return fail(started.error());
  }

  if (options.command == "start") {
    std::string encoded = service.ticket().encode();
    std::cout << "Node id: " << service.local_id().to_hex() << "\n"
              << "Ticket:  " << encoded << "\n";
    print_connect_hint(encoded);
    std::cout << "\nListening for peers and clipboard changes" << std::endl;
    service.notify("clipsync", "Sync service started");
  } else if (options.command == "connect") {
    std::cout << "Connecting to " << target.peer_id.short_hex() << "..."
              << std::endl;
    auto connected = service.connect_ticket(target);
    if (connected.is_error()) {
      service.shutdown();
      return fail(connected.error());
    }
    std::cout << "Connected, syncing clipboard" << std::endl;
    service.notify("clipsync", "Connected to " + target.peer_id.short_hex());
  } else {
    auto discovery = service.enable_auto_discovery();
    if (discovery.is_error()) {
      service.shutdown();
      return fail(discovery.error());
    }
    std::cout << "Searching the local network for other devices" << std::endl;
    service.notify("clipsync", "Searching for other devices");
  }

  wait_for_signal(service);
  std::cout << "Stopped" << std::endl;
  return EXIT_SUCCESS;
}

} // anonymous namespace

// ============================================================================
// Main
// ============================================================================

int main(int argc, char **argv) {
  CliOptions options;
  int parsed = parse_args(argc, argv, options);
  if (parsed >= 0) {
    return parsed;
  }

  const std::string &command = options.command;
  if (command != "start" && command != "connect" && command != "ticket" &&
      command != "auto" && command != "test") {
    std::cerr << "clipsync: unknown command '" << command << "'\n";
    print_usage(std::cerr);
    return EXIT_USAGE;
  }

  install_signal_handlers();

  LogConfig bootstrap;
  bootstrap.level = options.verbose ? "debug" : "info";
  auto logging = init_logging(bootstrap);
  if (logging.is_error()) {
    return fail(logging.error());
  }

  auto sec = security_init();
  if (sec.is_error()) {
    return fail(sec.error());
  }

  if (command == "test") {
    return cmd_test();
  }

  ConfigManager manager;
  PeerId id;
  auto config = load_config(manager, options, id);
  if (config.is_error()) {
    return fail(config.error());
  }

  LogConfig log_config;
  log_config.level = config.value().log_level;
  log_config.file = config.value().log_file;
  logging = init_logging(log_config);
  if (logging.is_error()) {
    return fail(logging.error());
  }

  if (command == "ticket") {
    return cmd_ticket(config.value(), id);
  }
  return cmd_run(options, config.value(), id);
}
