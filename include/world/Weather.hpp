/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef WEATHER_HPP
#define WEATHER_HPP

#include "core/TimeManager.hpp"

#include <array>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>

namespace Realmforge {

class JsonValue;

enum class WeatherType : uint8_t {
  Clear = 0,
  Cloudy = 1,
  Rainy = 2,
  Stormy = 3,
  Foggy = 4,
  Snowy = 5,
  Windy = 6
};

constexpr size_t WEATHER_TYPE_COUNT = 7;

// Lowercase wire name ("clear", "rainy", ...)
const char *weatherTypeName(WeatherType type);
std::optional<WeatherType> weatherTypeFromName(const std::string &name);

inline std::ostream &operator<<(std::ostream &os, WeatherType type) {
  return os << weatherTypeName(type);
}

/**
 * @brief Per-season temperature band and weather odds
 *
 * Probabilities are indexed by WeatherType.
 */
struct SeasonConfig {
  double minTemperature{50.0};
  double maxTemperature{80.0};
  std::array<double, WEATHER_TYPE_COUNT> weatherProbs{};

  static SeasonConfig getDefault(Season season);
};

struct WeatherSnapshot {
  WeatherType condition{WeatherType::Clear};
  double temperature{0.0};
  std::string season;
  std::string timeOfDay;
  std::string biome;

  JsonValue toJson() const;
  static std::optional<WeatherSnapshot> fromJson(const JsonValue &json);

  bool operator==(const WeatherSnapshot &other) const = default;
};

std::ostream &operator<<(std::ostream &os, const WeatherSnapshot &weather);

} // namespace Realmforge

#endif // WEATHER_HPP
