/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/LivingLocation.hpp"
#include "core/Logger.hpp"
#include "managers/EventManager.hpp"
#include "utils/JsonReader.hpp"
#include "world/World.hpp"

#include <cmath>
#include <format>

namespace Realmforge {

const char *entityKindName(EntityKind kind) {
  switch (kind) {
  case EntityKind::Location:
    return "location";
  case EntityKind::NPC:
    return "npc";
  }
  return "unknown";
}

namespace {

JsonValue idArray(const LivingLocation::IdSet &ids) {
  JsonArray array;
  array.reserve(ids.size());
  for (const auto &id : ids) {
    array.emplace_back(id);
  }
  return JsonValue(std::move(array));
}

bool readIdArray(const JsonValue &json, LivingLocation::IdSet &out) {
  const JsonArray *array = json.tryAsArray();
  if (!array) {
    return false;
  }
  out.clear();
  for (const auto &entry : *array) {
    auto id = entry.tryAsString();
    if (!id) {
      return false;
    }
    out.insert(*id);
  }
  return true;
}

} // namespace

LivingLocation::LivingLocation(LocationRecord record)
    : Entity(record.id, EntityKind::Location), m_record(std::move(record)) {}

bool LivingLocation::hasMarket() const {
  return m_record.type == "building" || m_record.type == "market";
}

void LivingLocation::update(double deltaMinutes, World &world) {
  if (!m_active) {
    return;
  }
  m_lastUpdate += deltaMinutes;
  updateWeather(deltaMinutes, world);
  updateMarket(world);
}

void LivingLocation::updateWeather(double deltaMinutes, World &world) {
  // Resample once per simulated hour
  if (m_weather && std::fmod(m_lastUpdate, 60.0) >= deltaMinutes) {
    return;
  }

  const TimeManager &time = world.getTime();
  std::optional<WeatherType> previous;
  if (m_weather) {
    previous = m_weather->condition;
  }

  m_weather = world.getGenerator().generateWeather(
      m_record.biome, time.getSeason(), time.getTimeOfDay());

  if (previous && *previous != m_weather->condition) {
    JsonObject data;
    data["location_name"] = JsonValue(m_record.name);
    data["weather"] = JsonValue(weatherTypeName(m_weather->condition));
    data["previous"] = JsonValue(weatherTypeName(*previous));
    data["temperature"] = JsonValue(m_weather->temperature);
    world.getEvents().publishEvent(EventTypeId::WeatherChanged, std::move(data),
                                   std::nullopt, std::nullopt, getId());
  }
}

void LivingLocation::updateMarket(World &world) {
  if (!hasMarket()) {
    return;
  }
  const bool open = world.getTime().isWorkingHours();
  if (open == m_marketOpen) {
    return;
  }
  m_marketOpen = open;

  JsonObject data;
  data["location_name"] = JsonValue(m_record.name);
  world.getEvents().publishEvent(open ? EventTypeId::MarketOpened
                                      : EventTypeId::MarketClosed,
                                 std::move(data), std::nullopt, std::nullopt,
                                 getId());
  LOCATION_DEBUG(std::format("Market at {} {}", m_record.name,
                             open ? "opened" : "closed"));
}

void LivingLocation::addNpc(const std::string &npcId, EventManager &events) {
  m_npcIds.insert(npcId);

  JsonObject data;
  data["location_name"] = JsonValue(m_record.name);
  events.publishEvent(EventTypeId::NpcEnteredLocation, std::move(data), npcId,
                      std::nullopt, getId());
}

bool LivingLocation::removeNpc(const std::string &npcId, EventManager &events) {
  if (m_npcIds.erase(npcId) == 0) {
    return false;
  }

  JsonObject data;
  data["location_name"] = JsonValue(m_record.name);
  events.publishEvent(EventTypeId::NpcExitedLocation, std::move(data), npcId,
                      std::nullopt, getId());
  return true;
}

JsonValue LivingLocation::serialize() const {
  JsonObject obj;
  obj["id"] = JsonValue(getId());
  obj["kind"] = JsonValue(entityKindName(getKind()));
  obj["data"] = m_record.toJson();
  obj["npc_ids"] = idArray(m_npcIds);
  obj["item_ids"] = idArray(m_itemIds);
  obj["current_weather"] = m_weather ? m_weather->toJson() : JsonValue();
  obj["market_open"] = JsonValue(m_marketOpen);
  obj["last_spawn_check"] = JsonValue(m_lastSpawnCheck);
  obj["last_update"] = JsonValue(m_lastUpdate);
  obj["active"] = JsonValue(m_active);
  return JsonValue(std::move(obj));
}

bool LivingLocation::deserialize(const JsonValue &json) {
  if (!json.isObject()) {
    LOCATION_ERROR("Location state is not an object");
    return false;
  }
  if (auto id = json["id"].tryAsString(); id && *id != getId()) {
    LOCATION_ERROR(std::format("State for {} applied to {}", *id, getId()));
    return false;
  }

  if (!readIdArray(json["npc_ids"], m_npcIds) ||
      !readIdArray(json["item_ids"], m_itemIds)) {
    LOCATION_ERROR(std::format("Malformed id lists in state of {}", getId()));
    return false;
  }

  const JsonValue &weather = json["current_weather"];
  if (weather.isNull()) {
    m_weather.reset();
  } else {
    m_weather = WeatherSnapshot::fromJson(weather);
    if (!m_weather) {
      LOCATION_ERROR(std::format("Malformed weather in state of {}", getId()));
      return false;
    }
  }

  m_marketOpen = json["market_open"].tryAsBool().value_or(false);
  m_lastSpawnCheck = json["last_spawn_check"].tryAsNumber().value_or(0.0);
  m_lastUpdate = json["last_update"].tryAsNumber().value_or(0.0);
  m_active = json["active"].tryAsBool().value_or(true);
  return true;
}

} // namespace Realmforge
