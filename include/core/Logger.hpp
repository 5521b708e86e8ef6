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
// - mutex: Required for serialized console output
// - atomic: Required for std::atomic<bool> benchmark mode flag
#include <atomic> // IWYU pragma: keep - Required for std::atomic<bool> benchmark mode flag
#include <cstdint> // IWYU pragma: keep - Required for uint8_t type
#include <cstdio> // IWYU pragma: keep - Required for printf() and fflush() functions
#include <filesystem>
#include <fstream>
#include <mutex> // IWYU pragma: keep - Required for serialized console output
#include <string> // IWYU pragma: keep - Required for std::string() conversions in macros

namespace Realmforge {

/**
 * @brief Append-only log file with rotation of older files
 *
 * open() creates <directory>/<prefix>_YYYYMMDD_HHMMSS.log and prunes the
 * directory down to keepFiles logs with that prefix, oldest first. Lines are
 * flushed every flushInterval writes and immediately for CRITICAL.
 * Release builds route Logger output through one of these; it is usable in
 * any build.
 */
class LogFileSink {
public:
  LogFileSink(std::filesystem::path directory, std::string prefix,
              size_t keepFiles = 5, size_t flushInterval = 50);
  ~LogFileSink();

  LogFileSink(const LogFileSink &) = delete;
  LogFileSink &operator=(const LogFileSink &) = delete;

  // false if the directory or file cannot be created
  bool open();
  bool isOpen() const { return m_stream.is_open(); }

  // Format: YYYY-MM-DD HH:MM:SS.mmm [LEVEL] [System] message
  void write(const char *level, const char *system, const char *message);

  const std::filesystem::path &getPath() const { return m_path; }
  size_t getPendingLines() const { return m_pending; }

  // Removes the oldest <prefix>_*.log files beyond keep, returns the count
  static size_t pruneOldLogs(const std::filesystem::path &directory,
                             const std::string &prefix, size_t keep);

private:
  std::filesystem::path m_directory;
  std::string m_prefix;
  size_t m_keepFiles;
  size_t m_flushInterval;
  std::filesystem::path m_path;
  std::ofstream m_stream;
  size_t m_pending{0};
  std::mutex m_mutex;
};

enum class LogLevel : uint8_t {
  CRITICAL = 0,     // Always logs (even in release for crashes)
  ERROR_LEVEL = 1,  // Renamed to avoid macro conflicts
  WARNING = 2,      // Debug only
  INFO = 3,         // Debug only
  DEBUG_LEVEL = 4   // Debug only (renamed to avoid macro conflicts)
};

#ifdef DEBUG
// Full console logging in debug builds
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
    printf("Realmforge - [%s] %s: %s\n", system, getLevelString(level),
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

#define REALM_CRITICAL(system, msg)                                            \
  Realmforge::Logger::Log(Realmforge::LogLevel::CRITICAL, system, msg)
#define REALM_ERROR(system, msg)                                               \
  Realmforge::Logger::Log(Realmforge::LogLevel::ERROR_LEVEL, system, msg)
#define REALM_WARN(system, msg)                                                \
  Realmforge::Logger::Log(Realmforge::LogLevel::WARNING, system, msg)
#define REALM_INFO(system, msg)                                                \
  Realmforge::Logger::Log(Realmforge::LogLevel::INFO, system, msg)
#define REALM_DEBUG(system, msg)                                               \
  Realmforge::Logger::Log(Realmforge::LogLevel::DEBUG_LEVEL, system, msg)

#else
// Release builds write CRITICAL and ERROR to a rotating log file (Logger.cpp)
class Logger {
private:
  static std::atomic<bool> s_benchmarkMode;

public:
  static std::mutex s_logMutex;

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

#define REALM_CRITICAL(system, msg)                                            \
  Realmforge::Logger::Log("CRITICAL", system, msg)

#define REALM_ERROR(system, msg) Realmforge::Logger::Log("ERROR", system, msg)

#define REALM_WARN(system, msg) ((void)0)  // Zero overhead
#define REALM_INFO(system, msg) ((void)0)  // Zero overhead
#define REALM_DEBUG(system, msg) ((void)0) // Zero overhead
#endif

inline std::atomic<bool> Logger::s_benchmarkMode{false};
inline std::mutex Logger::s_logMutex{};

// Convenience macros for each subsystem

// Generation
#define GENERATOR_CRITICAL(msg) REALM_CRITICAL("ContentGenerator", msg)
#define GENERATOR_ERROR(msg) REALM_ERROR("ContentGenerator", msg)
#define GENERATOR_WARN(msg) REALM_WARN("ContentGenerator", msg)
#define GENERATOR_INFO(msg) REALM_INFO("ContentGenerator", msg)
#define GENERATOR_DEBUG(msg) REALM_DEBUG("ContentGenerator", msg)

#define TEMPLATE_CRITICAL(msg) REALM_CRITICAL("TemplateManager", msg)
#define TEMPLATE_ERROR(msg) REALM_ERROR("TemplateManager", msg)
#define TEMPLATE_WARN(msg) REALM_WARN("TemplateManager", msg)
#define TEMPLATE_INFO(msg) REALM_INFO("TemplateManager", msg)
#define TEMPLATE_DEBUG(msg) REALM_DEBUG("TemplateManager", msg)

// Simulation core
#define TIME_CRITICAL(msg) REALM_CRITICAL("TimeManager", msg)
#define TIME_ERROR(msg) REALM_ERROR("TimeManager", msg)
#define TIME_WARN(msg) REALM_WARN("TimeManager", msg)
#define TIME_INFO(msg) REALM_INFO("TimeManager", msg)
#define TIME_DEBUG(msg) REALM_DEBUG("TimeManager", msg)

#define EVENT_CRITICAL(msg) REALM_CRITICAL("EventManager", msg)
#define EVENT_ERROR(msg) REALM_ERROR("EventManager", msg)
#define EVENT_WARN(msg) REALM_WARN("EventManager", msg)
#define EVENT_INFO(msg) REALM_INFO("EventManager", msg)
#define EVENT_DEBUG(msg) REALM_DEBUG("EventManager", msg)

#define WORLD_CRITICAL(msg) REALM_CRITICAL("World", msg)
#define WORLD_ERROR(msg) REALM_ERROR("World", msg)
#define WORLD_WARN(msg) REALM_WARN("World", msg)
#define WORLD_INFO(msg) REALM_INFO("World", msg)
#define WORLD_DEBUG(msg) REALM_DEBUG("World", msg)

// Entities
#define ENTITY_CRITICAL(msg) REALM_CRITICAL("Entity", msg)
#define ENTITY_ERROR(msg) REALM_ERROR("Entity", msg)
#define ENTITY_WARN(msg) REALM_WARN("Entity", msg)
#define ENTITY_INFO(msg) REALM_INFO("Entity", msg)
#define ENTITY_DEBUG(msg) REALM_DEBUG("Entity", msg)

#define NPC_CRITICAL(msg) REALM_CRITICAL("NPC", msg)
#define NPC_ERROR(msg) REALM_ERROR("NPC", msg)
#define NPC_WARN(msg) REALM_WARN("NPC", msg)
#define NPC_INFO(msg) REALM_INFO("NPC", msg)
#define NPC_DEBUG(msg) REALM_DEBUG("NPC", msg)

#define LOCATION_CRITICAL(msg) REALM_CRITICAL("Location", msg)
#define LOCATION_ERROR(msg) REALM_ERROR("Location", msg)
#define LOCATION_WARN(msg) REALM_WARN("Location", msg)
#define LOCATION_INFO(msg) REALM_INFO("Location", msg)
#define LOCATION_DEBUG(msg) REALM_DEBUG("Location", msg)

// Persistence and configuration
#define SAVEGAME_CRITICAL(msg) REALM_CRITICAL("SaveGameManager", msg)
#define SAVEGAME_ERROR(msg) REALM_ERROR("SaveGameManager", msg)
#define SAVEGAME_WARN(msg) REALM_WARN("SaveGameManager", msg)
#define SAVEGAME_INFO(msg) REALM_INFO("SaveGameManager", msg)
#define SAVEGAME_DEBUG(msg) REALM_DEBUG("SaveGameManager", msg)

#define SETTINGS_CRITICAL(msg) REALM_CRITICAL("SettingsManager", msg)
#define SETTINGS_ERROR(msg) REALM_ERROR("SettingsManager", msg)
#define SETTINGS_WARNING(msg) REALM_WARN("SettingsManager", msg)
#define SETTINGS_INFO(msg) REALM_INFO("SettingsManager", msg)
#define SETTINGS_DEBUG(msg) REALM_DEBUG("SettingsManager", msg)

// Benchmark mode convenience macros
#define REALM_ENABLE_BENCHMARK_MODE()                                          \
  Realmforge::Logger::SetBenchmarkMode(true)
#define REALM_DISABLE_BENCHMARK_MODE()                                         \
  Realmforge::Logger::SetBenchmarkMode(false)

} // namespace Realmforge

#endif // LOGGER_HPP
