/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef EVENT_TYPE_ID_HPP
#define EVENT_TYPE_ID_HPP

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>

namespace Realmforge {

// Strongly typed event type enumeration for fast lookups
enum class EventTypeId : uint8_t {
  // Entity
  EntitySpawned = 0,
  EntityDestroyed,
  EntityMoved,
  // NPC
  NpcSpawned,
  NpcDied,
  NpcMoved,
  NpcConversation,
  NpcTraded,
  NpcRelationshipChanged,
  NpcStartedTraveling,
  NpcArrived,
  NpcStartedWorking,
  NpcEnteredLocation,
  NpcExitedLocation,
  // Item
  ItemCreated,
  ItemDestroyed,
  ItemTraded,
  ItemEquipped,
  ItemDropped,
  ItemCrafted,
  // Location
  LocationCreated,
  LocationEntered,
  LocationExited,
  // Quest
  QuestStarted,
  QuestCompleted,
  QuestFailed,
  // Economy
  MarketOpened,
  MarketClosed,
  PriceChanged,
  TradeCompleted,
  // Combat
  CombatStarted,
  CombatEnded,
  DamageDealt,
  // Weather and calendar
  WeatherChanged,
  SeasonChanged,
  HourPassed,
  DayPassed,
  YearPassed,
  Custom,
  COUNT
};

constexpr size_t EVENT_TYPE_COUNT = static_cast<size_t>(EventTypeId::COUNT);

// snake_case wire name ("npc_arrived", "hour_passed", ...)
const char *eventTypeName(EventTypeId type);
std::optional<EventTypeId> eventTypeFromName(const std::string &name);

inline std::ostream &operator<<(std::ostream &os, EventTypeId type) {
  return os << eventTypeName(type);
}

} // namespace Realmforge

#endif // EVENT_TYPE_ID_HPP
