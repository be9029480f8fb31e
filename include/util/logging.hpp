// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace swaprelay {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * One named logger per relay component, all sharing the same sinks:
 *   default - process lifecycle
 *   bridge  - swap orchestration and unified events
 *   swap    - per-direction active swap trackers
 *   chain   - chain adapters
 *   app     - application shell
 *
 * Thread-safety: All methods are thread-safe. Initialization is
 * performed exactly once using std::call_once.
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
                         const std::string &log_file_path = "relay.log");

  /**
   * Shutdown logging system (flushes buffers)
   */
  static void Shutdown();

  /**
   * Get logger for specific component
   * Auto-initializes with defaults. Unknown names map to "default".
   */
  static std::shared_ptr<spdlog::logger>
  GetLogger(const std::string &name = "default");

  /**
   * Set log level at runtime (all components)
   */
  static void SetLogLevel(const std::string &level);

  /**
   * Set log level for a specific component
   * @return false if the component is unknown
   */
  static bool SetComponentLevel(const std::string &component, const std::string &level);

  /**
   * Names of all component loggers
   */
  static const std::vector<std::string> &Components();
};

} // namespace util
} // namespace swaprelay

// Convenience macros for logging
#define LOG_TRACE(...)                                                         \
  swaprelay::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)                                                         \
  swaprelay::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)                                                          \
  swaprelay::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)                                                          \
  swaprelay::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)                                                         \
  swaprelay::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_BRIDGE_TRACE(...)                                                  \
  swaprelay::util::LogManager::GetLogger("bridge")->trace(__VA_ARGS__)
#define LOG_BRIDGE_DEBUG(...)                                                  \
  swaprelay::util::LogManager::GetLogger("bridge")->debug(__VA_ARGS__)
#define LOG_BRIDGE_INFO(...)                                                   \
  swaprelay::util::LogManager::GetLogger("bridge")->info(__VA_ARGS__)
#define LOG_BRIDGE_WARN(...)                                                   \
  swaprelay::util::LogManager::GetLogger("bridge")->warn(__VA_ARGS__)
#define LOG_BRIDGE_ERROR(...)                                                  \
  swaprelay::util::LogManager::GetLogger("bridge")->error(__VA_ARGS__)
#define LOG_BRIDGE_CRITICAL(...)                                               \
  swaprelay::util::LogManager::GetLogger("bridge")->critical(__VA_ARGS__)

#define LOG_SWAP_TRACE(...)                                                    \
  swaprelay::util::LogManager::GetLogger("swap")->trace(__VA_ARGS__)
#define LOG_SWAP_DEBUG(...)                                                    \
  swaprelay::util::LogManager::GetLogger("swap")->debug(__VA_ARGS__)
#define LOG_SWAP_INFO(...)                                                     \
  swaprelay::util::LogManager::GetLogger("swap")->info(__VA_ARGS__)
#define LOG_SWAP_WARN(...)                                                     \
  swaprelay::util::LogManager::GetLogger("swap")->warn(__VA_ARGS__)
#define LOG_SWAP_ERROR(...)                                                    \
  swaprelay::util::LogManager::GetLogger("swap")->error(__VA_ARGS__)

#define LOG_CHAIN_TRACE(...)                                                   \
  swaprelay::util::LogManager::GetLogger("chain")->trace(__VA_ARGS__)
#define LOG_CHAIN_DEBUG(...)                                                   \
  swaprelay::util::LogManager::GetLogger("chain")->debug(__VA_ARGS__)
#define LOG_CHAIN_INFO(...)                                                    \
  swaprelay::util::LogManager::GetLogger("chain")->info(__VA_ARGS__)
#define LOG_CHAIN_WARN(...)                                                    \
  swaprelay::util::LogManager::GetLogger("chain")->warn(__VA_ARGS__)
#define LOG_CHAIN_ERROR(...)                                                   \
  swaprelay::util::LogManager::GetLogger("chain")->error(__VA_ARGS__)

#define LOG_APP_INFO(...)                                                      \
  swaprelay::util::LogManager::GetLogger("app")->info(__VA_ARGS__)
#define LOG_APP_WARN(...)                                                      \
  swaprelay::util::LogManager::GetLogger("app")->warn(__VA_ARGS__)
#define LOG_APP_ERROR(...)                                                     \
  swaprelay::util::LogManager::GetLogger("app")->error(__VA_ARGS__)
