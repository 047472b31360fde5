// Copyright (c) 2025 The ISDS Developers
// Distributed under the MIT software license

#include "util/logging.hpp"
#include <algorithm>
#include <filesystem>
#include <iostream>
#include <map>
#include <mutex>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace isds {
namespace util {

namespace {

std::once_flag g_init_once;

// Guards g_loggers
std::mutex g_loggers_mutex;
std::map<std::string, std::shared_ptr<spdlog::logger>> g_loggers;

constexpr const char *kPattern = "[%H:%M:%S.%e] [%n] [%l] %v";
constexpr size_t kMaxFileBytes = 10 * 1024 * 1024;
constexpr size_t kMaxFiles = 3;

spdlog::sink_ptr MakeConsoleSink() {
  auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  sink->set_pattern(kPattern);
  return sink;
}

// Rotating file sink, or the console if the file cannot be opened
spdlog::sink_ptr MakeFileSink(const std::string &path) {
  namespace fs = std::filesystem;
  const fs::path file = path.empty() ? fs::path("isds.log") : fs::path(path);
  if (file.has_parent_path()) {
    std::error_code ec;
    fs::create_directories(file.parent_path(), ec);
  }

  try {
    auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        file.string(), kMaxFileBytes, kMaxFiles);
    sink->set_pattern(kPattern);
    return sink;
  } catch (const spdlog::spdlog_ex &ex) {
    std::cerr << "Cannot open log file " << file.string() << " (" << ex.what()
              << "), logging to console\n";
    return MakeConsoleSink();
  }
}

void InitializeOnce(const std::string &log_level, bool log_to_file,
                    const std::string &log_file_path) {
  const spdlog::sink_ptr sink =
      log_to_file ? MakeFileSink(log_file_path) : MakeConsoleSink();
  const spdlog::level::level_enum level = spdlog::level::from_str(log_level);

  std::lock_guard<std::mutex> lock(g_loggers_mutex);
  try {
    for (const std::string &component : LogManager::Components()) {
      auto logger = std::make_shared<spdlog::logger>(component, sink);
      logger->set_level(level);
      logger->flush_on(spdlog::level::warn);
      spdlog::register_logger(logger);
      g_loggers[component] = logger;
    }
  } catch (const spdlog::spdlog_ex &ex) {
    std::cerr << "Log initialization failed: " << ex.what() << std::endl;
    return;
  }

  spdlog::set_default_logger(g_loggers["default"]);
  // Straight to the logger: LOG_DEBUG would take g_loggers_mutex again
  g_loggers["default"]->debug("Logging initialized at level {}", log_level);
}

} // namespace

const std::vector<std::string> &LogManager::Components() {
  static const std::vector<std::string> components = {
      "default", "sim", "topology", "protocol", "consensus", "app"};
  return components;
}

bool LogManager::IsValidLevel(const std::string &level) {
  // from_str maps anything unknown to "off"
  return level == "off" || spdlog::level::from_str(level) != spdlog::level::off;
}

bool LogManager::IsComponent(const std::string &component) {
  const auto &all = Components();
  return std::find(all.begin(), all.end(), component) != all.end();
}

void LogManager::Initialize(const std::string &log_level, bool log_to_file,
                            const std::string &log_file_path) {
  std::call_once(g_init_once, InitializeOnce, log_level, log_to_file, log_file_path);
}

void LogManager::Shutdown() {
  std::lock_guard<std::mutex> lock(g_loggers_mutex);
  spdlog::shutdown();
  g_loggers.clear();
}

std::shared_ptr<spdlog::logger> LogManager::GetLogger(const std::string &name) {
  Initialize();

  std::lock_guard<std::mutex> lock(g_loggers_mutex);
  if (auto it = g_loggers.find(name); it != g_loggers.end()) {
    return it->second;
  }

  // Shut down or never came up: hand out a muted logger instead of null
  if (g_loggers.empty()) {
    auto muted = std::make_shared<spdlog::logger>("default", MakeConsoleSink());
    muted->set_level(spdlog::level::off);
    g_loggers["default"] = muted;
    return muted;
  }
  return g_loggers["default"];
}

void LogManager::SetLogLevel(const std::string &level) {
  const spdlog::level::level_enum parsed = spdlog::level::from_str(level);
  std::lock_guard<std::mutex> lock(g_loggers_mutex);
  for (auto &[name, logger] : g_loggers) {
    logger->set_level(parsed);
  }
}

bool LogManager::SetComponentLevel(const std::string &component, const std::string &level) {
  std::lock_guard<std::mutex> lock(g_loggers_mutex);
  auto it = g_loggers.find(component);
  if (it == g_loggers.end()) {
    return false;
  }
  it->second->set_level(spdlog::level::from_str(level));
  return true;
}

} // namespace util
} // namespace isds
