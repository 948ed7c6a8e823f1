/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

// Required includes for logging system:
// - string: Used in macro expansions for std::string() conversions
// - cstdio: Required for printf() and fflush() functions
// - cstdint: Required for uint8_t type
// - mutex: Required for thread-safe logging
// - atomic: Required for std::atomic<bool> quiet/verbose flags
#include <atomic> // IWYU pragma: keep - Required for std::atomic<bool> flags
#include <cstdint> // IWYU pragma: keep - Required for uint8_t type
#include <cstdio> // IWYU pragma: keep - Required for printf() and fflush() functions
#include <mutex> // IWYU pragma: keep - Required for thread-safe logging
#include <string> // IWYU pragma: keep - Required for std::string() conversions in macros

namespace Lifeline {
enum class LogLevel : uint8_t {
  CRITICAL = 0,     // Always logs
  ERROR_LEVEL = 1,  // Always logs (renamed to avoid macro conflicts)
  WARNING = 2,      // Always logs - fallbacks and migrations must reach operators
  INFO = 3,         // Debug only
  DEBUG_LEVEL = 4   // Debug only, gated by SetVerbose (renamed to avoid macro conflicts)
};

#ifdef DEBUG
// Full logging system in debug builds
class Logger {
private:
  static std::atomic<bool> s_quietMode;
  static std::atomic<bool> s_verbose;
  static std::mutex s_logMutex;

public:
  static void SetQuietMode(bool enabled) {
    s_quietMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsQuietMode() {
    return s_quietMode.load(std::memory_order_relaxed);
  }

  static void SetVerbose(bool enabled) {
    s_verbose.store(enabled, std::memory_order_relaxed);
  }

  // Console only in debug builds
  static void SetLogDirectory(const std::string & /*directory*/) {}

  static void Log(LogLevel level, const char *system,
                  const std::string &message) {
    Log(level, system, message.c_str());
  }

  static void Log(LogLevel level, const char *system, const char *message) {
    if (s_quietMode.load(std::memory_order_relaxed)) {
      return;
    }
    if (level == LogLevel::DEBUG_LEVEL &&
        !s_verbose.load(std::memory_order_relaxed)) {
      return;
    }

    // Thread-safe logging with mutex protection
    std::lock_guard<std::mutex> lock(s_logMutex);
    printf("Lifeline - [%s] %s: %s\n", system, getLevelString(level), message);
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

// Debug build macros - full functionality
#define LIFELINE_CRITICAL(system, msg)                                         \
  Lifeline::Logger::Log(Lifeline::LogLevel::CRITICAL, system, msg)
#define LIFELINE_ERROR(system, msg)                                            \
  Lifeline::Logger::Log(Lifeline::LogLevel::ERROR_LEVEL, system, msg)
#define LIFELINE_WARN(system, msg)                                             \
  Lifeline::Logger::Log(Lifeline::LogLevel::WARNING, system, msg)
#define LIFELINE_INFO(system, msg)                                             \
  Lifeline::Logger::Log(Lifeline::LogLevel::INFO, system, msg)
#define LIFELINE_DEBUG(system, msg)                                            \
  Lifeline::Logger::Log(Lifeline::LogLevel::DEBUG_LEVEL, system, msg)

#else
// Release builds - file logging for CRITICAL/ERROR/WARNING, the rest compiled out
class Logger {
private:
  static std::atomic<bool> s_quietMode;
  static std::atomic<bool> s_verbose;

public:
  static std::mutex s_logMutex; // Public for macro access

  static void SetQuietMode(bool enabled) {
    s_quietMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsQuietMode() {
    return s_quietMode.load(std::memory_order_relaxed);
  }

  static void SetVerbose(bool enabled) {
    s_verbose.store(enabled, std::memory_order_relaxed);
  }

  // Where session logs go; falls back to SDL_GetPrefPath()/logs when unset
  static void SetLogDirectory(const std::string &directory);

  static void Log(const char *level, const char *system,
                  const std::string &message);
  static void Log(const char *level, const char *system, const char *message);
};

#define LIFELINE_CRITICAL(system, msg)                                         \
  Lifeline::Logger::Log("CRITICAL", system, msg)

#define LIFELINE_ERROR(system, msg)                                            \
  Lifeline::Logger::Log("ERROR", system, msg)

#define LIFELINE_WARN(system, msg)                                             \
  Lifeline::Logger::Log("WARNING", system, msg)

#define LIFELINE_INFO(system, msg) ((void)0)  // Zero overhead
#define LIFELINE_DEBUG(system, msg) ((void)0) // Zero overhead
#endif

// Static member definitions - shared by both DEBUG and RELEASE builds
inline std::atomic<bool> Logger::s_quietMode{false};
inline std::atomic<bool> Logger::s_verbose{false};
inline std::mutex Logger::s_logMutex{};

// Convenience macros for each core system

// Core Systems
#define CORE_CRITICAL(msg) LIFELINE_CRITICAL("AppContext", msg)
#define CORE_ERROR(msg) LIFELINE_ERROR("AppContext", msg)
#define CORE_WARN(msg) LIFELINE_WARN("AppContext", msg)
#define CORE_INFO(msg) LIFELINE_INFO("AppContext", msg)
#define CORE_DEBUG(msg) LIFELINE_DEBUG("AppContext", msg)

#define THREADSYSTEM_CRITICAL(msg) LIFELINE_CRITICAL("ThreadSystem", msg)
#define THREADSYSTEM_ERROR(msg) LIFELINE_ERROR("ThreadSystem", msg)
#define THREADSYSTEM_WARN(msg) LIFELINE_WARN("ThreadSystem", msg)
#define THREADSYSTEM_INFO(msg) LIFELINE_INFO("ThreadSystem", msg)
#define THREADSYSTEM_DEBUG(msg) LIFELINE_DEBUG("ThreadSystem", msg)

#define SCHEDULER_CRITICAL(msg) LIFELINE_CRITICAL("TickScheduler", msg)
#define SCHEDULER_ERROR(msg) LIFELINE_ERROR("TickScheduler", msg)
#define SCHEDULER_WARN(msg) LIFELINE_WARN("TickScheduler", msg)
#define SCHEDULER_INFO(msg) LIFELINE_INFO("TickScheduler", msg)
#define SCHEDULER_DEBUG(msg) LIFELINE_DEBUG("TickScheduler", msg)

#define MODULE_CRITICAL(msg) LIFELINE_CRITICAL("ModuleManager", msg)
#define MODULE_ERROR(msg) LIFELINE_ERROR("ModuleManager", msg)
#define MODULE_WARN(msg) LIFELINE_WARN("ModuleManager", msg)
#define MODULE_INFO(msg) LIFELINE_INFO("ModuleManager", msg)
#define MODULE_DEBUG(msg) LIFELINE_DEBUG("ModuleManager", msg)

// Persistence Systems
#define CONFIG_CRITICAL(msg) LIFELINE_CRITICAL("ConfigStore", msg)
#define CONFIG_ERROR(msg) LIFELINE_ERROR("ConfigStore", msg)
#define CONFIG_WARN(msg) LIFELINE_WARN("ConfigStore", msg)
#define CONFIG_INFO(msg) LIFELINE_INFO("ConfigStore", msg)
#define CONFIG_DEBUG(msg) LIFELINE_DEBUG("ConfigStore", msg)

#define STORAGE_CRITICAL(msg) LIFELINE_CRITICAL("WorldStorage", msg)
#define STORAGE_ERROR(msg) LIFELINE_ERROR("WorldStorage", msg)
#define STORAGE_WARN(msg) LIFELINE_WARN("WorldStorage", msg)
#define STORAGE_INFO(msg) LIFELINE_INFO("WorldStorage", msg)
#define STORAGE_DEBUG(msg) LIFELINE_DEBUG("WorldStorage", msg)

// World Systems
#define WORLD_CRITICAL(msg) LIFELINE_CRITICAL("WorldRegistry", msg)
#define WORLD_ERROR(msg) LIFELINE_ERROR("WorldRegistry", msg)
#define WORLD_WARN(msg) LIFELINE_WARN("WorldRegistry", msg)
#define WORLD_INFO(msg) LIFELINE_INFO("WorldRegistry", msg)
#define WORLD_DEBUG(msg) LIFELINE_DEBUG("WorldRegistry", msg)

// Simulation Systems
#define METABOLISM_CRITICAL(msg) LIFELINE_CRITICAL("MetabolismEngine", msg)
#define METABOLISM_ERROR(msg) LIFELINE_ERROR("MetabolismEngine", msg)
#define METABOLISM_WARN(msg) LIFELINE_WARN("MetabolismEngine", msg)
#define METABOLISM_INFO(msg) LIFELINE_INFO("MetabolismEngine", msg)
#define METABOLISM_DEBUG(msg) LIFELINE_DEBUG("MetabolismEngine", msg)

// Quiet mode convenience macros
#define LIFELINE_ENABLE_QUIET_MODE() Lifeline::Logger::SetQuietMode(true)
#define LIFELINE_DISABLE_QUIET_MODE() Lifeline::Logger::SetQuietMode(false)

} // namespace Lifeline

#endif // LOGGER_HPP
