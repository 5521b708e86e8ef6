/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SIMULATION_CONFIG_HPP
#define SIMULATION_CONFIG_HPP

#include <cstddef>
#include <string>

namespace Realmforge {

class SettingsManager;

/**
 * @brief Typed view of the settings a World needs at construction
 *
 * Defaults match an empty settings file.
 */
struct SimulationConfig {
  std::string dataDirectory{"res/data"};
  std::string saveDirectory{"saves"};

  size_t maxEventHistory{1000};
  size_t maxEventQueue{8192};

  int startYear{1};
  int startDay{1};
  int startHour{8};
  bool fireMissedCallbacks{false};

  int autosaveIntervalMinutes{0}; // 0 disables autosave
  size_t autosaveKeep{5};

  int defaultLocationCount{10};

  /**
   * @brief Reads every field from its category/key, keeping defaults for
   * missing or out-of-range values
   *
   * Keys: data.directory, save.directory, events.max_history,
   * events.max_queue, time.start_year, time.start_day, time.start_hour,
   * time.fire_missed_callbacks, save.autosave_interval_minutes,
   * save.autosave_keep, world.default_locations
   */
  static SimulationConfig fromSettings(const SettingsManager &settings);
};

} // namespace Realmforge

#endif // SIMULATION_CONFIG_HPP
