/**
 * @file log.h
 * @brief Logger setup
 *
 * Library code logs through spdlog's default logger; init_logging()
 * replaces it with one named "clipsync" writing to stderr and, optionally,
 * a rotating file.
 */

#ifndef CLIPSYNC_LOG_H
#define CLIPSYNC_LOG_H

#include "clipsync/error.h"
#include "clipsync/platform.h"
#include <cstddef>
#include <string>

namespace clipsync {

/**
 * @brief Logger settings
 */
struct LogConfig {
  std::string level = "info"; // trace|debug|info|warn|error|off
  std::string file;           // Empty = no file sink
  size_t max_file_size = 5 * 1024 * 1024;
  size_t max_files = 3;
};

/**
 * @brief Install the clipsync logger as spdlog's default
 * @return ConfigError for an unknown level or an unwritable log file
 */
CLIPSYNC_API Result<void> init_logging(const LogConfig &config);

} // namespace clipsync

#endif // CLIPSYNC_LOG_H
