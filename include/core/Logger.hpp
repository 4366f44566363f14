/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <atomic> // IWYU pragma: keep - Required for std::atomic<bool> benchmark mode flag
#include <cstdint> // IWYU pragma: keep - Required for uint8_t type
#include <cstdio> // IWYU pragma: keep - Required for printf() and fflush() functions
#include <mutex> // IWYU pragma: keep - Required for thread-safe logging
#include <string> // IWYU pragma: keep - Required for std::string() conversions in macros

namespace PolyForge {
enum class LogLevel : uint8_t {
  CRITICAL = 0,     // Always logs (even in release for crashes)
  ERROR_LEVEL = 1,  // Renamed to avoid macro conflicts
  WARNING = 2,      // Debug only
  INFO = 3,         // Debug only
  DEBUG_LEVEL = 4   // Debug only (renamed to avoid macro conflicts)
};

#ifdef DEBUG
// Console logging in debug builds
class Logger {
private:
  static std::atomic<bool> s_benchmarkMode;
  static std::mutex s_logMutex;

public:
  static void SetBenchmarkMode(bool enabled) {
    s_benchmarkMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsBenchmarkMode() {
    return s_benchmarkMode.load(std::memory_order_relaxed);
  }

  static void Log(LogLevel level, const char *system,
                  const std::string &message) {
    Log(level, system, message.c_str());
  }

  static void Log(LogLevel level, const char *system, const char *message) {
    if (s_benchmarkMode.load(std::memory_order_relaxed)) {
      return;
    }

    std::lock_guard<std::mutex> lock(s_logMutex);
    printf("PolyForge Engine - [%s] %s: %s\n", system, getLevelString(level),
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

#define POLYFORGE_CRITICAL(system, msg)                                        \
  PolyForge::Logger::Log(PolyForge::LogLevel::CRITICAL, system, msg)
#define POLYFORGE_ERROR(system, msg)                                           \
  PolyForge::Logger::Log(PolyForge::LogLevel::ERROR_LEVEL, system, msg)
#define POLYFORGE_WARN(system, msg)                                            \
  PolyForge::Logger::Log(PolyForge::LogLevel::WARNING, system, msg)
#define POLYFORGE_INFO(system, msg)                                            \
  PolyForge::Logger::Log(PolyForge::LogLevel::INFO, system, msg)
#define POLYFORGE_DEBUG(system, msg)                                           \
  PolyForge::Logger::Log(PolyForge::LogLevel::DEBUG_LEVEL, system, msg)

#else
// Release builds - CRITICAL and ERROR go to a log file (see Logger.cpp)
class Logger {
private:
  static std::atomic<bool> s_benchmarkMode;

public:
  static std::mutex s_logMutex; // Public for macro access

  static void SetBenchmarkMode(bool enabled) {
    s_benchmarkMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsBenchmarkMode() {
    return s_benchmarkMode.load(std::memory_order_relaxed);
  }

  static void Log(const char *level, const char *system,
                  const std::string &message);
  static void Log(const char *level, const char *system, const char *message);
};

#define POLYFORGE_CRITICAL(system, msg)                                        \
  PolyForge::Logger::Log("CRITICAL", system, msg)

#define POLYFORGE_ERROR(system, msg)                                           \
  PolyForge::Logger::Log("ERROR", system, msg)

#define POLYFORGE_WARN(system, msg) ((void)0)  // Zero overhead
#define POLYFORGE_INFO(system, msg) ((void)0)  // Zero overhead
#define POLYFORGE_DEBUG(system, msg) ((void)0) // Zero overhead
#endif

// Static member definitions - shared by both DEBUG and RELEASE builds
inline std::atomic<bool> Logger::s_benchmarkMode{false};
inline std::mutex Logger::s_logMutex{};

// Convenience macros for each core system

#define ENGINE_CRITICAL(msg) POLYFORGE_CRITICAL("EngineContext", msg)
#define ENGINE_ERROR(msg) POLYFORGE_ERROR("EngineContext", msg)
#define ENGINE_WARN(msg) POLYFORGE_WARN("EngineContext", msg)
#define ENGINE_INFO(msg) POLYFORGE_INFO("EngineContext", msg)
#define ENGINE_DEBUG(msg) POLYFORGE_DEBUG("EngineContext", msg)

#define THREADSYSTEM_CRITICAL(msg) POLYFORGE_CRITICAL("ThreadSystem", msg)
#define THREADSYSTEM_ERROR(msg) POLYFORGE_ERROR("ThreadSystem", msg)
#define THREADSYSTEM_WARN(msg) POLYFORGE_WARN("ThreadSystem", msg)
#define THREADSYSTEM_INFO(msg) POLYFORGE_INFO("ThreadSystem", msg)
#define THREADSYSTEM_DEBUG(msg) POLYFORGE_DEBUG("ThreadSystem", msg)

#define DRAWABLE_CRITICAL(msg) POLYFORGE_CRITICAL("Drawable", msg)
#define DRAWABLE_ERROR(msg) POLYFORGE_ERROR("Drawable", msg)
#define DRAWABLE_WARN(msg) POLYFORGE_WARN("Drawable", msg)
#define DRAWABLE_INFO(msg) POLYFORGE_INFO("Drawable", msg)
#define DRAWABLE_DEBUG(msg) POLYFORGE_DEBUG("Drawable", msg)

#define COLLISION_CRITICAL(msg) POLYFORGE_CRITICAL("Collision", msg)
#define COLLISION_ERROR(msg) POLYFORGE_ERROR("Collision", msg)
#define COLLISION_WARN(msg) POLYFORGE_WARN("Collision", msg)
#define COLLISION_INFO(msg) POLYFORGE_INFO("Collision", msg)
#define COLLISION_DEBUG(msg) POLYFORGE_DEBUG("Collision", msg)

#define BEHAVIOR_CRITICAL(msg) POLYFORGE_CRITICAL("Behavior", msg)
#define BEHAVIOR_ERROR(msg) POLYFORGE_ERROR("Behavior", msg)
#define BEHAVIOR_WARN(msg) POLYFORGE_WARN("Behavior", msg)
#define BEHAVIOR_INFO(msg) POLYFORGE_INFO("Behavior", msg)
#define BEHAVIOR_DEBUG(msg) POLYFORGE_DEBUG("Behavior", msg)

#define TAG_CRITICAL(msg) POLYFORGE_CRITICAL("TagManager", msg)
#define TAG_ERROR(msg) POLYFORGE_ERROR("TagManager", msg)
#define TAG_WARN(msg) POLYFORGE_WARN("TagManager", msg)
#define TAG_INFO(msg) POLYFORGE_INFO("TagManager", msg)
#define TAG_DEBUG(msg) POLYFORGE_DEBUG("TagManager", msg)

#define SCENE_CRITICAL(msg) POLYFORGE_CRITICAL("SceneManager", msg)
#define SCENE_ERROR(msg) POLYFORGE_ERROR("SceneManager", msg)
#define SCENE_WARN(msg) POLYFORGE_WARN("SceneManager", msg)
#define SCENE_INFO(msg) POLYFORGE_INFO("SceneManager", msg)
#define SCENE_DEBUG(msg) POLYFORGE_DEBUG("SceneManager", msg)

#define SETTINGS_CRITICAL(msg) POLYFORGE_CRITICAL("SettingsManager", msg)
#define SETTINGS_ERROR(msg) POLYFORGE_ERROR("SettingsManager", msg)
#define SETTINGS_WARN(msg) POLYFORGE_WARN("SettingsManager", msg)
#define SETTINGS_INFO(msg) POLYFORGE_INFO("SettingsManager", msg)
#define SETTINGS_DEBUG(msg) POLYFORGE_DEBUG("SettingsManager", msg)

} // namespace PolyForge

#endif // LOGGER_HPP
