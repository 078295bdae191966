// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace kernelshim {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * Provides centralized logging configuration and easy access
 * to component loggers throughout the shim.
 *
 * All component loggers share one sink: colorized stderr by default (stdout
 * belongs to the Jupyter client), or an append-mode file.
 */
class LogManager {
public:
  /**
   * Initialize logging system
   * @param log_level Minimum log level (trace, debug, info, warn, error,
   * critical)
   * @param log_to_file If true, log to file instead of stderr
   * @param log_file_path Path to log file (if log_to_file is true)
   *
   * Only the first call performs initialization.
   */
  static void Initialize(const std::string &log_level = "info",
                         bool log_to_file = false,
                         const std::string &log_file_path = "kernelshim.log");

  /**
   * Shutdown logging system (flushes buffers)
   *
   * Subsequent logging calls after shutdown will auto-reinitialize.
   */
  static void Shutdown();

  /**
   * Get logger for specific component
   * @param name Component name (e.g., "network", "relay", "discovery")
   *
   * Auto-initializes if not initialized. Unknown names get the default logger.
   */
  static std::shared_ptr<spdlog::logger>
  GetLogger(const std::string &name = "default");

  /**
   * Set log level at runtime (all components)
   */
  static void SetLogLevel(const std::string &level);

  /**
   * Set log level for a specific component
   * @param component Component name (network, relay, discovery, app, default)
   * @param level Log level (trace, debug, info, warn, error, critical)
   */
  static void SetComponentLevel(const std::string &component,
                                const std::string &level);

  /**
   * Apply a Jupyter-style verbosity count (0-4)
   *
   * 0: warnings only
   * 1: info (config, discovery result, EOF notices)
   * 2: + discovery requests and retries
   * 3: + connection lifecycle
   * 4: + per-chunk payload dumps
   */
  static void ApplyVerbosity(int verbosity);
};

} // namespace util
} // namespace kernelshim

// Convenience macros for logging
#define LOG_TRACE(...)                                                         \
  kernelshim::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)                                                         \
  kernelshim::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)                                                          \
  kernelshim::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)                                                          \
  kernelshim::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)                                                         \
  kernelshim::util::LogManager::GetLogger()->error(__VA_ARGS__)
#define LOG_CRITICAL(...)                                                      \
  kernelshim::util::LogManager::GetLogger()->critical(__VA_ARGS__)

// Component-specific logging
#define LOG_NET_TRACE(...)                                                     \
  kernelshim::util::LogManager::GetLogger("network")->trace(__VA_ARGS__)
#define LOG_NET_DEBUG(...)                                                     \
  kernelshim::util::LogManager::GetLogger("network")->debug(__VA_ARGS__)
#define LOG_NET_INFO(...)                                                      \
  kernelshim::util::LogManager::GetLogger("network")->info(__VA_ARGS__)
#define LOG_NET_WARN(...)                                                      \
  kernelshim::util::LogManager::GetLogger("network")->warn(__VA_ARGS__)
#define LOG_NET_ERROR(...)                                                     \
  kernelshim::util::LogManager::GetLogger("network")->error(__VA_ARGS__)

#define LOG_RELAY_TRACE(...)                                                   \
  kernelshim::util::LogManager::GetLogger("relay")->trace(__VA_ARGS__)
#define LOG_RELAY_DEBUG(...)                                                   \
  kernelshim::util::LogManager::GetLogger("relay")->debug(__VA_ARGS__)
#define LOG_RELAY_INFO(...)                                                    \
  kernelshim::util::LogManager::GetLogger("relay")->info(__VA_ARGS__)
#define LOG_RELAY_WARN(...)                                                    \
  kernelshim::util::LogManager::GetLogger("relay")->warn(__VA_ARGS__)
#define LOG_RELAY_ERROR(...)                                                   \
  kernelshim::util::LogManager::GetLogger("relay")->error(__VA_ARGS__)

#define LOG_DISC_TRACE(...)                                                    \
  kernelshim::util::LogManager::GetLogger("discovery")->trace(__VA_ARGS__)
#define LOG_DISC_DEBUG(...)                                                    \
  kernelshim::util::LogManager::GetLogger("discovery")->debug(__VA_ARGS__)
#define LOG_DISC_INFO(...)                                                     \
  kernelshim::util::LogManager::GetLogger("discovery")->info(__VA_ARGS__)
#define LOG_DISC_WARN(...)                                                     \
  kernelshim::util::LogManager::GetLogger("discovery")->warn(__VA_ARGS__)
#define LOG_DISC_ERROR(...)                                                    \
  kernelshim::util::LogManager::GetLogger("discovery")->error(__VA_ARGS__)

#define LOG_APP_DEBUG(...)                                                     \
  kernelshim::util::LogManager::GetLogger("app")->debug(__VA_ARGS__)
#define LOG_APP_INFO(...)                                                      \
  kernelshim::util::LogManager::GetLogger("app")->info(__VA_ARGS__)
#define LOG_APP_WARN(...)                                                      \
  kernelshim::util::LogManager::GetLogger("app")->warn(__VA_ARGS__)
#define LOG_APP_ERROR(...)                                                     \
  kernelshim::util::LogManager::GetLogger("app")->error(__VA_ARGS__)
