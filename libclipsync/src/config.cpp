/**
 * @file config.cpp
 * @brief Configuration management implementation
 */

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <mutex>
#include <sstream>
#include <string>

#include <pwd.h>
#include <unistd.h>

#include "clipsync/config.h"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace fs = ::std::filesystem;

namespace clipsync {

// ============================================================================
// JSON Field Helpers
// ============================================================================

namespace {

using json = nlohmann::json;

Error parse_error(const std::string &key, const std::string &why) {
  return Error(ErrorCode::ConfigParseError, "Invalid value for '" + key + "'",
               why);
}

template <typename T>
Result<void> read_unsigned(const json &j, const char *key, T &out) {
  if (!j.contains(key)) {
    return Result<void>::ok();
  }
  const json &v = j[key];
  if (!v.is_number_integer() && !v.is_number_unsigned()) {
    return parse_error(key, "expected an integer");
  }
  if (v.is_number_integer() && !v.is_number_unsigned() &&
      v.get<int64_t>() < 0) {
    return parse_error(key, "must not be negative");
  }
  uint64_t value = v.get<uint64_t>();
  if (value > std::numeric_limits<T>::max()) {
    return parse_error(key, "out of range");
  }
  out = static_cast<T>(value);
  return Result<void>::ok();
}

Result<void> read_bool(const json &j, const char *key, bool &out) {
  if (!j.contains(key)) {
    return Result<void>::ok();
  }
  if (!j[key].is_boolean()) {
    return parse_error(key, "expected true or false");
  }
  out = j[key].get<bool>();
  return Result<void>::ok();
}

Result<void> read_string(const json &j, const char *key, std::string &out) {
  if (!j.contains(key)) {
    return Result<void>::ok();
  }
  if (!j[key].is_string()) {
    return parse_error(key, "expected a string");
  }
  out = j[key].get<std::string>();
  return Result<void>::ok();
}

bool is_valid_log_level(const std::string &level) {
  return level == "trace" || level == "debug" || level == "info" ||
         level == "warn" || level == "error" || level == "off";
}

} // anonymous namespace

// ============================================================================
// ClipSyncConfig Methods
// ============================================================================

void ClipSyncConfig::load_defaults() { *this = ClipSyncConfig(); }

Result<void> ClipSyncConfig::validate() const {
  if (device_name.length() > 64) {
    return Error(ErrorCode::ConfigError, "Device name too long (max 64 chars)");
  }

  if (!peer_id.empty() && !PeerId::from_hex(peer_id)) {
    return Error(ErrorCode::ConfigError,
                 "peer_id must be 64 hexadecimal characters");
  }

  if (listen_port > 0 && listen_port < 1024) {
    return Error(ErrorCode::ConfigError,
                 "Listen port must be >= 1024 or 0 for auto");
  }

  if (discovery_port < 1024) {
    return Error(ErrorCode::ConfigError, "Discovery port must be >= 1024");
  }

  if (poll_interval_ms == 0 || beacon_interval_ms == 0 ||
      connect_timeout_ms == 0 || io_timeout_ms == 0) {
    return Error(ErrorCode::ConfigError, "Intervals and timeouts must be > 0");
  }

  if (preview_length == 0) {
    return Error(ErrorCode::ConfigError, "Preview length must be > 0");
  }

  if (!is_valid_log_level(log_level)) {
    return Error(ErrorCode::ConfigError, "Unknown log level: " + log_level);
  }

  return Result<void>::ok();
}

std::string ClipSyncConfig::effective_device_name() const {
  return device_name.empty() ? get_default_device_name() : device_name;
}

std::string ClipSyncConfig::to_json_string() const {
  json j;
  j["device_name"] = device_name;
  j["peer_id"] = peer_id;
  j["listen_port"] = listen_port;
  j["discovery_port"] = discovery_port;
  j["beacon_interval_ms"] = beacon_interval_ms;
  j["connect_timeout_ms"] = connect_timeout_ms;
  j["io_timeout_ms"] = io_timeout_ms;
  j["poll_interval_ms"] = poll_interval_ms;
  j["share_text"] = share_text;
  j["share_images"] = share_images;
  j["max_image_size"] = max_image_size;
  j["enable_notifications"] = enable_notifications;
  j["preview_length"] = preview_length;
  j["log_level"] = log_level;
  j["log_file"] = log_file;
  return j.dump(2);
}

Result<ClipSyncConfig>
ClipSyncConfig::from_json_string(const std::string &text) {
  json j = json::parse(text, nullptr, false);
  if (j.is_discarded()) {
    return Error(ErrorCode::ConfigParseError, "Config file is not valid JSON");
  }
  if (!j.is_object()) {
    return Error(ErrorCode::ConfigParseError,
                 "Config file must hold a JSON object");
  }

  ClipSyncConfig config;
  CLIPSYNC_TRY(read_string(j, "device_name", config.device_name));
  CLIPSYNC_TRY(read_string(j, "peer_id", config.peer_id));
  CLIPSYNC_TRY(read_unsigned(j, "listen_port", config.listen_port));
  CLIPSYNC_TRY(read_unsigned(j, "discovery_port", config.discovery_port));
  CLIPSYNC_TRY(
      read_unsigned(j, "beacon_interval_ms", config.beacon_interval_ms));
  CLIPSYNC_TRY(
      read_unsigned(j, "connect_timeout_ms", config.connect_timeout_ms));
  CLIPSYNC_TRY(read_unsigned(j, "io_timeout_ms", config.io_timeout_ms));
  CLIPSYNC_TRY(read_unsigned(j, "poll_interval_ms", config.poll_interval_ms));
  CLIPSYNC_TRY(read_bool(j, "share_text", config.share_text));
  CLIPSYNC_TRY(read_bool(j, "share_images", config.share_images));
  CLIPSYNC_TRY(read_unsigned(j, "max_image_size", config.max_image_size));
  CLIPSYNC_TRY(
      read_bool(j, "enable_notifications", config.enable_notifications));
  CLIPSYNC_TRY(read_unsigned(j, "preview_length", config.preview_length));
  CLIPSYNC_TRY(read_string(j, "log_level", config.log_level));
  CLIPSYNC_TRY(read_string(j, "log_file", config.log_file));
  return config;
}

fs::path ClipSyncConfig::get_default_config_dir() {
  // Linux: Use XDG_CONFIG_HOME or ~/.config
  const char *xdg_config = std::getenv("XDG_CONFIG_HOME");
  if (xdg_config && xdg_config[0] != '\0') {
    return fs::path(xdg_config) / "clipsync";
  }

  const char *home = std::getenv("HOME");
  if (!home) {
    struct passwd *pw = getpwuid(getuid());
    if (pw) {
      home = pw->pw_dir;
    }
  }
  if (home) {
    return fs::path(home) / ".config" / "clipsync";
  }

  return fs::path("/tmp/clipsync");
}

std::string ClipSyncConfig::get_default_device_name() {
  char host[256] = {};
  if (gethostname(host, sizeof(host) - 1) == 0 && host[0] != '\0') {
    return std::string(host);
  }
  return "clipsync-device";
}

// ============================================================================
// ConfigManager Implementation
// ============================================================================

class ConfigManager::Impl {
public:
  ClipSyncConfig config;
  fs::path config_path;
  mutable std::mutex mutex;
  bool initialized = false;

  Result<void> load_locked();
  Result<void> save_locked();
};

Result<void> ConfigManager::Impl::load_locked() {
  std::ifstream in(config_path);
  if (!in) {
    return Error(ErrorCode::ConfigError, "Cannot open config file",
                 config_path.string());
  }
  std::stringstream buffer;
  buffer << in.rdbuf();

  auto parsed = ClipSyncConfig::from_json_string(buffer.str());
  if (parsed.is_error()) {
    Error err = parsed.error();
    err.details = config_path.string() +
                  (err.details.empty() ? "" : ": " + err.details);
    return err;
  }

  auto validation = parsed.value().validate();
  if (validation.is_error()) {
    return validation;
  }

  config = parsed.value();
  return Result<void>::ok();
}

Result<void> ConfigManager::Impl::save_locked() {
  std::error_code ec;
  auto dir = config_path.parent_path();
  if (!dir.empty()) {
    fs::create_directories(dir, ec);
    if (ec) {
      return Error(ErrorCode::ConfigError, "Cannot create config directory",
                   dir.string() + ": " + ec.message());
    }
  }

  std::ofstream out(config_path, std::ios::trunc);
  if (!out) {
    return Error(ErrorCode::ConfigError, "Cannot write config file",
                 config_path.string());
  }
  out << config.to_json_string() << '\n';
  if (!out) {
    return Error(ErrorCode::ConfigError, "Failed writing config file",
                 config_path.string());
  }
  return Result<void>::ok();
}

ConfigManager::ConfigManager() : impl_(std::make_unique<Impl>()) {
  impl_->config.load_defaults();
}

ConfigManager::~ConfigManager() = default;

Result<void> ConfigManager::init(const fs::path &config_path) {
  std::lock_guard<std::mutex> lock(impl_->mutex);

  if (config_path.empty()) {
    impl_->config_path =
        ClipSyncConfig::get_default_config_dir() / "config.json";
  } else {
    impl_->config_path = config_path;
  }

  std::error_code ec;
  if (fs::exists(impl_->config_path, ec)) {
    CLIPSYNC_TRY(impl_->load_locked());
    spdlog::debug("Loaded configuration from {}", impl_->config_path.string());
  } else {
    spdlog::debug("No configuration at {}, using defaults",
                  impl_->config_path.string());
  }

  impl_->initialized = true;
  return Result<void>::ok();
}

const ClipSyncConfig &ConfigManager::get() const { return impl_->config; }

ClipSyncConfig &ConfigManager::get_mutable() { return impl_->config; }

Result<void> ConfigManager::set(const ClipSyncConfig &config) {
  auto validation = config.validate();
  if (validation.is_error()) {
    return validation;
  }

  std::lock_guard<std::mutex> lock(impl_->mutex);
  impl_->config = config;
  return Result<void>::ok();
}

fs::path ConfigManager::config_path() const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->config_path;
}

Result<void> ConfigManager::load() {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->load_locked();
}

Result<void> ConfigManager::save() {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  if (!impl_->initialized) {
    return Error(ErrorCode::NotInitialized, "ConfigManager::init not called");
  }
  return impl_->save_locked();
}

void ConfigManager::reset_defaults() {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  impl_->config.load_defaults();
}

Result<void> ConfigManager::set_device_name(const std::string &name) {
  if (name.empty() || name.length() > 64) {
    return Error(ErrorCode::InvalidArgument, "Invalid device name");
  }

  std::lock_guard<std::mutex> lock(impl_->mutex);
  impl_->config.device_name = name;
  if (!impl_->initialized) {
    return Result<void>::ok();
  }
  return impl_->save_locked();
}

Result<PeerId> ConfigManager::ensure_peer_id() {
  std::lock_guard<std::mutex> lock(impl_->mutex);

  if (!impl_->config.peer_id.empty()) {
    auto id = PeerId::from_hex(impl_->config.peer_id);
    if (!id) {
      return Error(ErrorCode::ConfigError, "Stored peer_id is malformed");
    }
    return *id;
  }

  PeerId id = PeerId::generate();
  impl_->config.peer_id = id.to_hex();
  if (impl_->initialized) {
    auto saved = impl_->save_locked();
    if (saved.is_error()) {
      // The identity still works for this run
      spdlog::warn("Could not persist peer identity: {}",
                   saved.error().to_string());
    }
  }
  return id;
}

} // namespace clipsync
