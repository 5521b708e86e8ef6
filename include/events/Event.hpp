/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef EVENT_HPP
#define EVENT_HPP

/**
 * @file Event.hpp
 * @brief Value type carried by the EventManager
 *
 * Events describe something that happened in the simulation:
 * - NPC activity (spawned, traveling, arrived, crafted an item)
 * - Location state (weather, market hours)
 * - Calendar boundaries (hour, day, season, year)
 *
 * The id is assigned at publish time; timestamp and sequence are assigned
 * when the event is dispatched.
 */

#include "events/EventTypeId.hpp"
#include "utils/JsonReader.hpp"

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>

namespace Realmforge {

struct Event {
  std::string id;
  EventTypeId type{EventTypeId::Custom};
  // Name of a Custom event; empty for built-in types
  std::string customType;
  JsonObject data;
  std::optional<std::string> sourceId;
  std::optional<std::string> targetId;
  std::optional<std::string> locationId;
  // Simulation total-minutes at dispatch
  std::optional<int64_t> timestamp;
  uint64_t sequence{0};

  Event() = default;
  explicit Event(EventTypeId eventType, JsonObject payload = {})
      : type(eventType), data(std::move(payload)) {}

  static Event custom(std::string name, JsonObject payload = {});

  // Wire name: the custom name for Custom events, otherwise eventTypeName()
  std::string getTypeName() const;

  Event &from(std::string id) {
    sourceId = std::move(id);
    return *this;
  }
  Event &to(std::string id) {
    targetId = std::move(id);
    return *this;
  }
  Event &at(std::string id) {
    locationId = std::move(id);
    return *this;
  }

  JsonValue toJson() const;
  static std::optional<Event> fromJson(const JsonValue &json);
};

std::ostream &operator<<(std::ostream &os, const Event &event);

} // namespace Realmforge

#endif // EVENT_HPP
