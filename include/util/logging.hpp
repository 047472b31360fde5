// Copyright (c) 2025 The ISDS Developers
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace isds {
namespace util {

/**
 * LogManager - process-wide spdlog setup with one logger per component
 *
 * Components: default, sim, topology, protocol, consensus, app. All share one
 * sink (console, or a rotating file). Log lines carry wall-clock time; the
 * simulation clock goes into the message text where it matters.
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
                         const std::string &log_file_path = "isds.log");

  // Flush and drop all loggers. Later GetLogger calls get a muted logger.
  static void Shutdown();

  // Logger for a component; unknown names get the default logger
  static std::shared_ptr<spdlog::logger>
  GetLogger(const std::string &name = "default");

  static const std::vector<std::string> &Components();
  static bool IsComponent(const std::string &component);
  static bool IsValidLevel(const std::string &level);

  // Set log level at runtime (all components)
  static void SetLogLevel(const std::string &level);

  // Returns false if the component is unknown or logging is not up
  static bool SetComponentLevel(const std::string &component, const std::string &level);
};

} // namespace util
} // namespace isds

// Convenience macros for logging
#define LOG_TRACE(...)                                                         \
  isds::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)                                                         \
  isds::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)                                                          \
  isds::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)                                                          \
  isds::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)                                                         \
  isds::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_SIM_TRACE(...)                                                     \
  isds::util::LogManager::GetLogger("sim")->trace(__VA_ARGS__)
#define LOG_SIM_DEBUG(...)                                                     \
  isds::util::LogManager::GetLogger("sim")->debug(__VA_ARGS__)
#define LOG_SIM_INFO(...)                                                      \
  isds::util::LogManager::GetLogger("sim")->info(__VA_ARGS__)
#define LOG_SIM_WARN(...)                                                      \
  isds::util::LogManager::GetLogger("sim")->warn(__VA_ARGS__)
#define LOG_SIM_ERROR(...)                                                     \
  isds::util::LogManager::GetLogger("sim")->error(__VA_ARGS__)

#define LOG_TOPO_TRACE(...)                                                    \
  isds::util::LogManager::GetLogger("topology")->trace(__VA_ARGS__)
#define LOG_TOPO_DEBUG(...)                                                    \
  isds::util::LogManager::GetLogger("topology")->debug(__VA_ARGS__)
#define LOG_TOPO_INFO(...)                                                     \
  isds::util::LogManager::GetLogger("topology")->info(__VA_ARGS__)
#define LOG_TOPO_WARN(...)                                                     \
  isds::util::LogManager::GetLogger("topology")->warn(__VA_ARGS__)
#define LOG_TOPO_ERROR(...)                                                    \
  isds::util::LogManager::GetLogger("topology")->error(__VA_ARGS__)

#define LOG_PROTO_TRACE(...)                                                   \
  isds::util::LogManager::GetLogger("protocol")->trace(__VA_ARGS__)
#define LOG_PROTO_DEBUG(...)                                                   \
  isds::util::LogManager::GetLogger("protocol")->debug(__VA_ARGS__)
#define LOG_PROTO_INFO(...)                                                    \
  isds::util::LogManager::GetLogger("protocol")->info(__VA_ARGS__)
#define LOG_PROTO_WARN(...)                                                    \
  isds::util::LogManager::GetLogger("protocol")->warn(__VA_ARGS__)
#define LOG_PROTO_ERROR(...)                                                   \
  isds::util::LogManager::GetLogger("protocol")->error(__VA_ARGS__)

#define LOG_CONSENSUS_TRACE(...)                                               \
  isds::util::LogManager::GetLogger("consensus")->trace(__VA_ARGS__)
#define LOG_CONSENSUS_DEBUG(...)                                               \
  isds::util::LogManager::GetLogger("consensus")->debug(__VA_ARGS__)
#define LOG_CONSENSUS_INFO(...)                                                \
  isds::util::LogManager::GetLogger("consensus")->info(__VA_ARGS__)
#define LOG_CONSENSUS_WARN(...)                                                \
  isds::util::LogManager::GetLogger("consensus")->warn(__VA_ARGS__)

#define LOG_APP_INFO(...)                                                      \
  isds::util::LogManager::GetLogger("app")->info(__VA_ARGS__)
#define LOG_APP_WARN(...)                                                      \
  isds::util::LogManager::GetLogger("app")->warn(__VA_ARGS__)
#define LOG_APP_ERROR(...)                                                     \
  isds::util::LogManager::GetLogger("app")->error(__VA_ARGS__)
