/**
 * @file log.cpp
 * @brief spdlog setup
 */

#include "clipsync/log.h"
#include <memory>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <vector>

namespace clipsync {

namespace {

constexpr const char *LOG_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

} // anonymous namespace

Result<void> init_logging(const LogConfig &config) {
  auto level = spdlog::level::from_str(config.level);
  // from_str maps unknown names to off
  if (level == spdlog::level::off && config.level != "off") {
    return Error(ErrorCode::ConfigError, "Unknown log level: " + config.level);
  }

  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

  if (!config.file.empty()) {
    try {
      sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          config.file, config.max_file_size, config.max_files));
    } catch (const spdlog::spdlog_ex &e) {
      return Error(ErrorCode::ConfigError, "Cannot open log file", e.what());
    }
  }

  auto logger =
      std::make_shared<spdlog::logger>("clipsync", sinks.begin(), sinks.end());
  logger->set_level(level);
  logger->set_pattern(LOG_PATTERN);
  logger->flush_on(spdlog::level::warn);

  spdlog::set_default_logger(logger);
  return Result<void>::ok();
}

} // namespace clipsync
