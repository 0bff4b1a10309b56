/**
 * @file config.h
 * @brief User configuration and settings for clipsync
 */

#ifndef CLIPSYNC_CONFIG_H
#define CLIPSYNC_CONFIG_H

#include "error.h"
#include "platform.h"
#include "types.h"
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

namespace clipsync {

/// Default TCP port for peer connections
constexpr uint16_t DEFAULT_LISTEN_PORT = 17530;

/// Default UDP port for discovery beacons
constexpr uint16_t DEFAULT_DISCOVERY_PORT = 17531;

// ============================================================================
// User Configuration
// ============================================================================

/**
 * @brief Complete user configuration for clipsync
 *
 * Persisted as config.json; unknown keys are ignored and missing keys keep
 * their defaults.
 */
struct ClipSyncConfig {
  // ========================================================================
  // Identity
  // ========================================================================

  /// Device display name (sent as the sender id); empty = host name
  std::string device_name;

  /// Peer identity as 64 hex chars; generated on first run when empty
  std::string peer_id;

  // ========================================================================
  // Network
  // ========================================================================

  /// TCP port for peer connections (0 = ephemeral)
  uint16_t listen_port = DEFAULT_LISTEN_PORT;

  /// UDP port for discovery beacons
  uint16_t discovery_port = DEFAULT_DISCOVERY_PORT;

  /// Interval between discovery beacons
  uint32_t beacon_interval_ms = 2000;

  /// Deadline for establishing an outbound connection
  uint32_t connect_timeout_ms = 3000;

  /// Deadline for each outbound read/write
  uint32_t io_timeout_ms = 5000;

  // ========================================================================
  // Clipboard
  // ========================================================================

  /// Clipboard polling interval
  uint32_t poll_interval_ms = 500;

  /// Share text changes
  bool share_text = true;

  /// Share image changes
  bool share_images = true;

  /// Largest PNG to share, in bytes
  uint64_t max_image_size = 16 * 1024 * 1024;

  // ========================================================================
  // Notifications
  // ========================================================================

  /// Show a desktop notification for received content
  bool enable_notifications = true;

  /// Characters of text shown in notifications
  uint32_t preview_length = 50;

  // ========================================================================
  // Logging
  // ========================================================================

  /// trace, debug, info, warn, error or off
  std::string log_level = "info";

  /// Optional log file (empty = stderr only)
  std::string log_file;

  // ========================================================================
  // Methods
  // ========================================================================

  /// Load defaults
  void load_defaults();

  /// Validate configuration
  Result<void> validate() const;

  /// Device name to announce: device_name, or the host name if unset
  std::string effective_device_name() const;

  /// Serialize to pretty-printed JSON
  std::string to_json_string() const;

  /**
   * @brief Parse JSON on top of defaults
   * @return Config, or ConfigParseError on malformed JSON or wrong types
   */
  static Result<ClipSyncConfig> from_json_string(const std::string &text);

  /// Get default config directory ($XDG_CONFIG_HOME/clipsync)
  static std::filesystem::path get_default_config_dir();

  /// Get the machine's host name, or a fixed fallback
  static std::string get_default_device_name();
};

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * @brief Manages loading, saving, and validating configuration
 */
class CLIPSYNC_API ConfigManager {
public:
  ConfigManager();
  ~ConfigManager();

  // Non-copyable
  ConfigManager(const ConfigManager &) = delete;
  ConfigManager &operator=(const ConfigManager &) = delete;

  // ========================================================================
  // Initialization
  // ========================================================================

  /**
   * @brief Initialize with config file path
   *
   * Loads the file when it exists. A file that cannot be parsed is an error;
   * a missing file leaves the defaults in place.
   *
   * @param config_path Path to config file (default location if empty)
   * @return Success or error
   */
  Result<void> init(const std::filesystem::path &config_path = {});

  // ========================================================================
  // Configuration Access
  // ========================================================================

  /**
   * @brief Get current configuration
   */
  const ClipSyncConfig &get() const;

  /**
   * @brief Get mutable configuration reference
   *
   * After modifying, call save() to persist changes.
   */
  ClipSyncConfig &get_mutable();

  /**
   * @brief Set entire configuration
   */
  Result<void> set(const ClipSyncConfig &config);

  /// Path of the backing file
  std::filesystem::path config_path() const;

  // ========================================================================
  // Persistence
  // ========================================================================

  /**
   * @brief Load configuration from file
   */
  Result<void> load();

  /**
   * @brief Save configuration to file
   */
  Result<void> save();

  /**
   * @brief Reset to defaults
   */
  void reset_defaults();

  // ========================================================================
  // Individual Settings
  // ========================================================================

  /// Set device name
  Result<void> set_device_name(const std::string &name);

  /**
   * @brief Return the stored peer identity, generating and saving one first
   * if the configuration has none
   */
  Result<PeerId> ensure_peer_id();

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace clipsync

#endif // CLIPSYNC_CONFIG_H
