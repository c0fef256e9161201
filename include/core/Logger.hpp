/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <atomic> // IWYU pragma: keep - Required for std::atomic<bool> quiet mode flag
#include <cstdint> // IWYU pragma: keep - Required for uint8_t type
#include <cstdio> // IWYU pragma: keep - Required for printf() and fflush() functions
#include <mutex> // IWYU pragma: keep - Required for thread-safe logging
#include <string> // IWYU pragma: keep - Required for std::string() conversions in macros
#include <ctime>

namespace GridAgents {
enum class LogLevel : uint8_t {
  CRITICAL = 0,     // Always logs (even in release)
  ERROR_LEVEL = 1,  // Renamed to avoid macro conflicts
  WARNING = 2,      // Debug only
  INFO = 3,         // Debug only
  DEBUG_LEVEL = 4   // Debug only (renamed to avoid macro conflicts)
};

#ifdef DEBUG
// Full logging system in debug builds
class Logger {
private:
  static std::atomic<bool> s_quietMode;
  static std::mutex s_logMutex;

public:
  static void SetQuietMode(bool enabled) {
    s_quietMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsQuietMode() {
    return s_quietMode.load(std::memory_order_relaxed);
  }

  // Names the run being logged after the config file or layout it came
  // from; release builds use it for the log file name
  static void SetSession(const std::string &source);
  static std::string SessionName();
  static std::string LogFileName(const std::string &session, std::time_t started);

  static void Log(LogLevel level, const char *system,
                  const std::string &message) {
    Log(level, system, message.c_str());
  }

  static void Log(LogLevel level, const char *system, const char *message) {
    if (s_quietMode.load(std::memory_order_relaxed)) {
      return;
    }

    std::lock_guard<std::mutex> lock(s_logMutex);
    printf("GridAgents - [%s] %s: %s\n", system, getLevelString(level),
           message);
    fflush(stdout);
  }

private:
  static const char *getLevelString(LogLevel level) {
    switch (level) {
    case LogLevel::CRITICAL:
      return "CRITICAL";
    case LogLevel::ERROR_LEVEL:
      return "ERROR";
    case LogLevel::WARNING:
      return "WARNING";
    case LogLevel::INFO:
      return "INFO";
    case LogLevel::DEBUG_LEVEL:
      return "DEBUG";
    default:
      return "UNKNOWN";
    }
  }
};

#define GRIDAGENTS_CRITICAL(system, msg)                                       \
  GridAgents::Logger::Log(GridAgents::LogLevel::CRITICAL, system, msg)
#define GRIDAGENTS_ERROR(system, msg)                                          \
  GridAgents::Logger::Log(GridAgents::LogLevel::ERROR_LEVEL, system, msg)
#define GRIDAGENTS_WARN(system, msg)                                           \
  GridAgents::Logger::Log(GridAgents::LogLevel::WARNING, system, msg)
#define GRIDAGENTS_INFO(system, msg)                                           \
  GridAgents::Logger::Log(GridAgents::LogLevel::INFO, system, msg)
#define GRIDAGENTS_DEBUG(system, msg)                                          \
  GridAgents::Logger::Log(GridAgents::LogLevel::DEBUG_LEVEL, system, msg)

#else
// Release builds - CRITICAL and ERROR go to the log file, the rest compile out
class Logger {
private:
  static std::atomic<bool> s_quietMode;

public:
  static std::mutex s_logMutex; // Public for macro access

  static void SetQuietMode(bool enabled) {
    s_quietMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsQuietMode() {
    return s_quietMode.load(std::memory_order_relaxed);
  }

  // Names the run being logged after the config file or layout it came
  // from; release builds use it for the log file name
  static void SetSession(const std::string &source);
  static std::string SessionName();
  static std::string LogFileName(const std::string &session, std::time_t started);

  // Defined in Logger.cpp (file sink)
  static void Log(const char *level, const char *system,
                  const std::string &message);
  static void Log(const char *level, const char *system, const char *message);
};

#define GRIDAGENTS_CRITICAL(system, msg)                                       \
  GridAgents::Logger::Log("CRITICAL", system, msg)

#define GRIDAGENTS_ERROR(system, msg)                                          \
  GridAgents::Logger::Log("ERROR", system, msg)

#define GRIDAGENTS_WARN(system, msg) ((void)0)  // Zero overhead
#define GRIDAGENTS_INFO(system, msg) ((void)0)  // Zero overhead
#define GRIDAGENTS_DEBUG(system, msg) ((void)0) // Zero overhead
#endif

// Static member definitions - shared by both DEBUG and RELEASE builds
inline std::atomic<bool> Logger::s_quietMode{false};
inline std::mutex Logger::s_logMutex{};

// Convenience macros for each subsystem

// Topology
#define GRID_CRITICAL(msg) GRIDAGENTS_CRITICAL("Grid", msg)
#define GRID_ERROR(msg) GRIDAGENTS_ERROR("Grid", msg)
#define GRID_WARN(msg) GRIDAGENTS_WARN("Grid", msg)
#define GRID_INFO(msg) GRIDAGENTS_INFO("Grid", msg)
#define GRID_DEBUG(msg) GRIDAGENTS_DEBUG("Grid", msg)

#define WORLD_CRITICAL(msg) GRIDAGENTS_CRITICAL("World", msg)
#define WORLD_ERROR(msg) GRIDAGENTS_ERROR("World", msg)
#define WORLD_WARN(msg) GRIDAGENTS_WARN("World", msg)
#define WORLD_INFO(msg) GRIDAGENTS_INFO("World", msg)
#define WORLD_DEBUG(msg) GRIDAGENTS_DEBUG("World", msg)

// Agents
#define AGENT_CRITICAL(msg) GRIDAGENTS_CRITICAL("GridAgent", msg)
#define AGENT_ERROR(msg) GRIDAGENTS_ERROR("GridAgent", msg)
#define AGENT_WARN(msg) GRIDAGENTS_WARN("GridAgent", msg)
#define AGENT_INFO(msg) GRIDAGENTS_INFO("GridAgent", msg)
#define AGENT_DEBUG(msg) GRIDAGENTS_DEBUG("GridAgent", msg)

// Driver and configuration
#define RUNNER_CRITICAL(msg) GRIDAGENTS_CRITICAL("SimulationRunner", msg)
#define RUNNER_ERROR(msg) GRIDAGENTS_ERROR("SimulationRunner", msg)
#define RUNNER_WARN(msg) GRIDAGENTS_WARN("SimulationRunner", msg)
#define RUNNER_INFO(msg) GRIDAGENTS_INFO("SimulationRunner", msg)
#define RUNNER_DEBUG(msg) GRIDAGENTS_DEBUG("SimulationRunner", msg)

#define CONFIG_CRITICAL(msg) GRIDAGENTS_CRITICAL("SimulationConfig", msg)
#define CONFIG_ERROR(msg) GRIDAGENTS_ERROR("SimulationConfig", msg)
#define CONFIG_WARN(msg) GRIDAGENTS_WARN("SimulationConfig", msg)
#define CONFIG_INFO(msg) GRIDAGENTS_INFO("SimulationConfig", msg)
#define CONFIG_DEBUG(msg) GRIDAGENTS_DEBUG("SimulationConfig", msg)

// Application layer
#define VIEWER_CRITICAL(msg) GRIDAGENTS_CRITICAL("GridViewer", msg)
#define VIEWER_ERROR(msg) GRIDAGENTS_ERROR("GridViewer", msg)
#define VIEWER_WARN(msg) GRIDAGENTS_WARN("GridViewer", msg)
#define VIEWER_INFO(msg) GRIDAGENTS_INFO("GridViewer", msg)
#define VIEWER_DEBUG(msg) GRIDAGENTS_DEBUG("GridViewer", msg)

#define APP_CRITICAL(msg) GRIDAGENTS_CRITICAL("GridAgentsApp", msg)
#define APP_ERROR(msg) GRIDAGENTS_ERROR("GridAgentsApp", msg)
#define APP_WARN(msg) GRIDAGENTS_WARN("GridAgentsApp", msg)
#define APP_INFO(msg) GRIDAGENTS_INFO("GridAgentsApp", msg)
#define APP_DEBUG(msg) GRIDAGENTS_DEBUG("GridAgentsApp", msg)

// Quiet mode convenience macros
#define GRIDAGENTS_ENABLE_QUIET_MODE()                                         \
  GridAgents::Logger::SetQuietMode(true)
#define GRIDAGENTS_DISABLE_QUIET_MODE()                                        \
  GridAgents::Logger::SetQuietMode(false)

} // namespace GridAgents

#endif // LOGGER_HPP
