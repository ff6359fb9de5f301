// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace peerlink {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * One logger per component ("default", "network", "metrics", "app"), all
 * sharing the same sinks. Components are looked up by name; unknown names
 * fall back to the default logger.
 *
 * Thread-safety: all methods are thread-safe. Initialization runs exactly
 * once through std::call_once; logger access is protected by a mutex.
 */
class LogManager {
public:
  /**
   * Initialize logging system
   * @param log_level Minimum log level (trace, debug, info, warn, error,
   * critical, off)
   * @param log_to_file If true, log to a rotating file instead of stdout
   * @param log_file_path Path to log file (if log_to_file is true)
   *
   * Only the first call performs initialization.
   */
  static void Initialize(const std::string &log_level = "info",
                         bool log_to_file = false,
                         const std::string &log_file_path = "peerlink.log");

  /**
   * Flush and drop all loggers
   * Logging after shutdown installs a silent console logger.
   */
  static void Shutdown();

  /**
   * Get logger for a component, auto-initializing with defaults
   */
  static std::shared_ptr<spdlog::logger>
  GetLogger(const std::string &name = "default");

  /**
   * Set log level at runtime (all components)
   */
  static void SetLogLevel(const std::string &level);

  /**
   * Set log level for a specific component
   */
  static void SetComponentLevel(const std::string &component, const std::string &level);
};

} // namespace util
} // namespace peerlink

#define LOG_WARN(...)                                                          \
  peerlink::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)                                                         \
  peerlink::util::LogManager::GetLogger()->error(__VA_ARGS__)

#define LOG_NET_TRACE(...)                                                     \
  peerlink::util::LogManager::GetLogger("network")->trace(__VA_ARGS__)
#define LOG_NET_DEBUG(...)                                                     \
  peerlink::util::LogManager::GetLogger("network")->debug(__VA_ARGS__)
#define LOG_NET_INFO(...)                                                      \
  peerlink::util::LogManager::GetLogger("network")->info(__VA_ARGS__)
#define LOG_NET_WARN(...)                                                      \
  peerlink::util::LogManager::GetLogger("network")->warn(__VA_ARGS__)
#define LOG_NET_ERROR(...)                                                     \
  peerlink::util::LogManager::GetLogger("network")->error(__VA_ARGS__)

#define LOG_METRICS_TRACE(...)                                                 \
  peerlink::util::LogManager::GetLogger("metrics")->trace(__VA_ARGS__)
#define LOG_METRICS_WARN(...)                                                  \
  peerlink::util::LogManager::GetLogger("metrics")->warn(__VA_ARGS__)
