/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "events/Event.hpp"

#include <array>

namespace Realmforge {

namespace {

constexpr std::array<const char *, EVENT_TYPE_COUNT> kEventTypeNames = {
    "entity_spawned",
    "entity_destroyed",
    "entity_moved",
    "npc_spawned",
    "npc_died",
    "npc_moved",
    "npc_conversation",
    "npc_traded",
    "npc_relationship_changed",
    "npc_started_traveling",
    "npc_arrived",
    "npc_started_working",
    "npc_entered_location",
    "npc_exited_location",
    "item_created",
    "item_destroyed",
    "item_traded",
    "item_equipped",
    "item_dropped",
    "item_crafted",
    "location_created",
    "location_entered",
    "location_exited",
    "quest_started",
    "quest_completed",
    "quest_failed",
    "market_opened",
    "market_closed",
    "price_changed",
    "trade_completed",
    "combat_started",
    "combat_ended",
    "damage_dealt",
    "weather_changed",
    "season_changed",
    "hour_passed",
    "day_passed",
    "year_passed",
    "custom",
};

JsonValue optionalId(const std::optional<std::string> &id) {
  return id ? JsonValue(*id) : JsonValue();
}

} // namespace

const char *eventTypeName(EventTypeId type) {
  const auto index = static_cast<size_t>(type);
  return index < kEventTypeNames.size() ? kEventTypeNames[index] : "unknown";
}

std::optional<EventTypeId> eventTypeFromName(const std::string &name) {
  for (size_t i = 0; i < kEventTypeNames.size(); ++i) {
    if (name == kEventTypeNames[i]) {
      return static_cast<EventTypeId>(i);
    }
  }
  return std::nullopt;
}

Event Event::custom(std::string name, JsonObject payload) {
  Event event(EventTypeId::Custom, std::move(payload));
  event.customType = std::move(name);
  return event;
}

std::string Event::getTypeName() const {
  if (type == EventTypeId::Custom && !customType.empty()) {
    return customType;
  }
  return eventTypeName(type);
}

JsonValue Event::toJson() const {
  JsonObject obj;
  obj["id"] = JsonValue(id);
  obj["type"] = JsonValue(getTypeName());
  obj["source"] = optionalId(sourceId);
  obj["target"] = optionalId(targetId);
  obj["location"] = optionalId(locationId);
  obj["data"] = JsonValue(data);
  obj["timestamp"] = timestamp ? JsonValue(*timestamp) : JsonValue();
  return JsonValue(std::move(obj));
}

std::optional<Event> Event::fromJson(const JsonValue &json) {
  auto typeName = json["type"].tryAsString();
  if (!typeName) {
    return std::nullopt;
  }

  Event event;
  if (auto type = eventTypeFromName(*typeName)) {
    event.type = *type;
  } else {
    event.type = EventTypeId::Custom;
    event.customType = *typeName;
  }
  event.id = json["id"].tryAsString().value_or("");
  event.sourceId = json["source"].tryAsString();
  event.targetId = json["target"].tryAsString();
  event.locationId = json["location"].tryAsString();
  if (const JsonObject *payload = json["data"].tryAsObject()) {
    event.data = *payload;
  }
  if (auto timestamp = json["timestamp"].tryAsInt64()) {
    event.timestamp = *timestamp;
  }
  return event;
}

std::ostream &operator<<(std::ostream &os, const Event &event) {
  os << "Event(" << event.getTypeName();
  if (event.sourceId) {
    os << ", source=" << *event.sourceId;
  }
  if (event.targetId) {
    os << ", target=" << *event.targetId;
  }
  if (event.locationId) {
    os << ", location=" << *event.locationId;
  }
  return os << ")";
}

} // namespace Realmforge
