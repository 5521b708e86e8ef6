/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/Weather.hpp"
#include "utils/JsonReader.hpp"

#include <format>

namespace Realmforge {

namespace {
constexpr std::array<const char *, WEATHER_TYPE_COUNT> kWeatherNames = {
    "clear", "cloudy", "rainy", "stormy", "foggy", "snowy", "windy"};
} // namespace

const char *weatherTypeName(WeatherType type) {
  const auto index = static_cast<size_t>(type);
  return index < kWeatherNames.size() ? kWeatherNames[index] : "unknown";
}

std::optional<WeatherType> weatherTypeFromName(const std::string &name) {
  for (size_t i = 0; i < kWeatherNames.size(); ++i) {
    if (name == kWeatherNames[i]) {
      return static_cast<WeatherType>(i);
    }
  }
  return std::nullopt;
}

SeasonConfig SeasonConfig::getDefault(Season season) {
  SeasonConfig config;

  // clear, cloudy, rainy, stormy, foggy, snowy, windy
  switch (season) {
  case Season::Spring:
    config.minTemperature = 45.0;
    config.maxTemperature = 70.0;
    config.weatherProbs = {0.35, 0.25, 0.25, 0.05, 0.05, 0.00, 0.05};
    break;

  case Season::Summer:
    config.minTemperature = 70.0;
    config.maxTemperature = 95.0;
    config.weatherProbs = {0.50, 0.20, 0.15, 0.10, 0.00, 0.00, 0.05};
    break;

  case Season::Fall:
    config.minTemperature = 40.0;
    config.maxTemperature = 65.0;
    config.weatherProbs = {0.30, 0.30, 0.20, 0.05, 0.10, 0.00, 0.05};
    break;

  case Season::Winter:
    config.minTemperature = 20.0;
    config.maxTemperature = 45.0;
    config.weatherProbs = {0.25, 0.25, 0.10, 0.05, 0.05, 0.25, 0.05};
    break;
  }

  return config;
}

JsonValue WeatherSnapshot::toJson() const {
  JsonObject obj;
  obj["condition"] = JsonValue(weatherTypeName(condition));
  obj["temperature"] = JsonValue(temperature);
  obj["season"] = JsonValue(season);
  obj["time_of_day"] = JsonValue(timeOfDay);
  obj["biome"] = JsonValue(biome);
  return JsonValue(std::move(obj));
}

std::optional<WeatherSnapshot> WeatherSnapshot::fromJson(const JsonValue &json) {
  if (!json.isObject()) {
    return std::nullopt;
  }
  auto condition = weatherTypeFromName(json["condition"].tryAsString().value_or(""));
  if (!condition) {
    return std::nullopt;
  }

  WeatherSnapshot weather;
  weather.condition = *condition;
  weather.temperature = json["temperature"].tryAsNumber().value_or(0.0);
  weather.season = json["season"].tryAsString().value_or("");
  weather.timeOfDay = json["time_of_day"].tryAsString().value_or("");
  weather.biome = json["biome"].tryAsString().value_or("");
  return weather;
}

std::ostream &operator<<(std::ostream &os, const WeatherSnapshot &weather) {
  return os << std::format("{} {:.1f}F ({}, {}, {})",
                           weatherTypeName(weather.condition),
                           weather.temperature, weather.season,
                           weather.timeOfDay, weather.biome);
}

} // namespace Realmforge
