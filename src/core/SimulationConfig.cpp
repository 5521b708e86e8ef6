/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/SimulationConfig.hpp"
#include "core/Logger.hpp"
#include "managers/SettingsManager.hpp"

#include <format>

namespace Realmforge {

namespace {
int readBounded(const SettingsManager &settings, const std::string &category,
                const std::string &key, int fallback, int min, int max) {
  int value = settings.get<int>(category, key, fallback);
  if (value < min || value > max) {
    SETTINGS_WARNING(std::format("{}.{} = {} out of range [{}, {}], using {}",
                                 category, key, value, min, max, fallback));
    return fallback;
  }
  return value;
}
} // namespace

SimulationConfig SimulationConfig::fromSettings(const SettingsManager &settings) {
  SimulationConfig config;

  config.dataDirectory =
      settings.get<std::string>("data", "directory", config.dataDirectory);
  config.saveDirectory =
      settings.get<std::string>("save", "directory", config.saveDirectory);

  config.maxEventHistory = static_cast<size_t>(
      readBounded(settings, "events", "max_history",
                  static_cast<int>(config.maxEventHistory), 1, 10000000));
  config.maxEventQueue = static_cast<size_t>(
      readBounded(settings, "events", "max_queue",
                  static_cast<int>(config.maxEventQueue), 1, 10000000));

  config.startYear =
      readBounded(settings, "time", "start_year", config.startYear, 1, 1000000);
  config.startDay =
      readBounded(settings, "time", "start_day", config.startDay, 1, 360);
  config.startHour =
      readBounded(settings, "time", "start_hour", config.startHour, 0, 23);
  config.fireMissedCallbacks = settings.get<bool>(
      "time", "fire_missed_callbacks", config.fireMissedCallbacks);

  config.autosaveIntervalMinutes =
      readBounded(settings, "save", "autosave_interval_minutes",
                  config.autosaveIntervalMinutes, 0, 1000000000);
  config.autosaveKeep = static_cast<size_t>(
      readBounded(settings, "save", "autosave_keep",
                  static_cast<int>(config.autosaveKeep), 1, 1000));

  config.defaultLocationCount =
      readBounded(settings, "world", "default_locations",
                  config.defaultLocationCount, 1, 10000);

  return config;
}

} // namespace Realmforge
