/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/Logger.hpp"

#include <algorithm>
#include <chrono>
#include <cstring>
#include <ctime>
#include <format>
#include <memory>
#include <vector>

#ifndef DEBUG
#include <SDL3/SDL.h>
#endif

namespace Realmforge {

namespace fs = std::filesystem;

namespace {

std::tm localTime(std::time_t when) {
  std::tm result{};
#ifdef _WIN32
  localtime_s(&result, &when);
#else
  localtime_r(&when, &result);
#endif
  return result;
}

bool isRotatedLog(const fs::path &file, const std::string &prefix) {
  return file.extension() == ".log" &&
         file.filename().string().starts_with(prefix + "_");
}

} // namespace

LogFileSink::LogFileSink(fs::path directory, std::string prefix,
                         size_t keepFiles, size_t flushInterval)
    : m_directory(std::move(directory)), m_prefix(std::move(prefix)),
      m_keepFiles(std::max<size_t>(keepFiles, 1)),
      m_flushInterval(std::max<size_t>(flushInterval, 1)) {}

LogFileSink::~LogFileSink() {
  if (m_stream.is_open()) {
    m_stream.flush();
  }
}

bool LogFileSink::open() {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_stream.is_open()) {
    return true;
  }

  std::error_code ec;
  fs::create_directories(m_directory, ec);
  if (ec) {
    return false;
  }

  // Leave room for the file about to be created
  pruneOldLogs(m_directory, m_prefix, m_keepFiles - 1);

  char stamp[32];
  const std::tm now = localTime(std::time(nullptr));
  std::strftime(stamp, sizeof(stamp), "%Y%m%d_%H%M%S", &now);

  m_path = m_directory / std::format("{}_{}.log", m_prefix, stamp);
  for (int n = 1; fs::exists(m_path, ec); ++n) {
    m_path = m_directory / std::format("{}_{}_{}.log", m_prefix, stamp, n);
  }

  m_stream.open(m_path, std::ios::out | std::ios::app);
  if (!m_stream.is_open()) {
    return false;
  }

  char started[32];
  std::strftime(started, sizeof(started), "%Y-%m-%d %H:%M:%S", &now);
  m_stream << std::format("=== {} log, started {} ===\n", m_prefix, started);
  m_stream.flush();
  return true;
}

void LogFileSink::write(const char *level, const char *system,
                        const char *message) {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (!m_stream.is_open()) {
    return;
  }

  const auto now = std::chrono::system_clock::now();
  const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                          now.time_since_epoch())
                          .count() %
                      1000;
  const std::tm local = localTime(std::chrono::system_clock::to_time_t(now));
  char wallClock[32];
  std::strftime(wallClock, sizeof(wallClock), "%Y-%m-%d %H:%M:%S", &local);

  m_stream << std::format("{}.{:03} [{}] [{}] {}\n", wallClock, millis, level,
                          system, message);

  if (++m_pending >= m_flushInterval || std::strcmp(level, "CRITICAL") == 0) {
    m_stream.flush();
    m_pending = 0;
  }
}

size_t LogFileSink::pruneOldLogs(const fs::path &directory,
                                 const std::string &prefix, size_t keep) {
  std::vector<fs::path> logs;
  std::error_code ec;
  for (const auto &entry : fs::directory_iterator(directory, ec)) {
    if (entry.is_regular_file(ec) && isRotatedLog(entry.path(), prefix)) {
      logs.push_back(entry.path());
    }
  }
  if (logs.size() <= keep) {
    return 0;
  }

  // Names embed the creation time, so name order is age order
  std::sort(logs.begin(), logs.end());

  size_t removed = 0;
  for (size_t i = 0; i < logs.size() - keep; ++i) {
    if (fs::remove(logs[i], ec)) {
      ++removed;
    }
  }
  return removed;
}

#ifndef DEBUG

namespace {

// Opened on first use under the per-user pref path; nullptr if unavailable
LogFileSink *releaseSink() {
  static std::unique_ptr<LogFileSink> sink = [] {
    std::unique_ptr<LogFileSink> created;
    char *prefPath = SDL_GetPrefPath("HammerForged", REALMFORGE_APP_NAME);
    if (prefPath == nullptr) {
      return created;
    }
    created = std::make_unique<LogFileSink>(fs::path(prefPath) / "logs",
                                            "realmforge");
    SDL_free(prefPath);
    if (!created->open()) {
      created.reset();
    }
    return created;
  }();
  return sink.get();
}

} // namespace

void Logger::Log(const char *level, const char *system,
                 const std::string &message) {
  Log(level, system, message.c_str());
}

void Logger::Log(const char *level, const char *system, const char *message) {
  if (s_benchmarkMode.load(std::memory_order_relaxed)) {
    return;
  }
  if (LogFileSink *sink = releaseSink()) {
    sink->write(level, system, message);
  }
}

#endif // DEBUG

} // namespace Realmforge
