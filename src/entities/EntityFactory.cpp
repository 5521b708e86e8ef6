/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/EntityFactory.hpp"
#include "core/Logger.hpp"
#include "core/Random.hpp"
#include "utils/JsonReader.hpp"
#include "world/GeneratedContent.hpp"
#include "world/World.hpp"

#include <format>

namespace Realmforge::EntityFactory {

std::unique_ptr<LivingLocation> createLocation(LocationRecord record) {
  return std::make_unique<LivingLocation>(std::move(record));
}

std::unique_ptr<LivingNPC> createNpc(std::string id, NpcRecord record,
                                     std::optional<std::string> locationId,
                                     Random &random) {
  const int gold = random.uniformInt(MIN_STARTING_GOLD, MAX_STARTING_GOLD);
  return std::make_unique<LivingNPC>(std::move(id), std::move(record),
                                     std::move(locationId), gold);
}

size_t populateWorld(const GeneratedWorld &generated, World &world) {
  size_t npcCount = 0;
  Random &random = world.getGenerator().getRandom();

  for (const auto &record : generated.locations) {
    LivingLocation &location = world.addLocation(createLocation(record));

    for (const auto &npcRecord : record.npcs) {
      auto npc = createNpc(world.allocateNpcId(), npcRecord, record.id, random);
      const std::string npcId = npc->getId();
      world.addNpc(std::move(npc));
      location.addNpc(npcId, world.getEvents());
      ++npcCount;
    }

    for (size_t i = 0; i < record.items.size(); ++i) {
      location.addItem(std::format("{}:item_{}", record.id, i));
    }
  }

  ENTITY_INFO(std::format("Created {} locations and {} NPCs",
                          generated.locations.size(), npcCount));
  return npcCount;
}

std::unique_ptr<LivingLocation> locationFromJson(const JsonValue &json) {
  auto record = LocationRecord::fromJson(json["data"]);
  if (!record) {
    ENTITY_ERROR("Location state has no valid record");
    return nullptr;
  }
  auto location = createLocation(std::move(*record));
  if (!location->deserialize(json)) {
    return nullptr;
  }
  return location;
}

std::unique_ptr<LivingNPC> npcFromJson(const JsonValue &json) {
  auto id = json["id"].tryAsString();
  auto record = NpcRecord::fromJson(json["data"]);
  if (!id || !record) {
    ENTITY_ERROR("NPC state has no id or no valid record");
    return nullptr;
  }
  auto npc = std::make_unique<LivingNPC>(
      *id, std::move(*record), json["current_location_id"].tryAsString(),
      json["gold"].tryAsInt().value_or(MIN_STARTING_GOLD));
  if (!npc->deserialize(json)) {
    return nullptr;
  }
  return npc;
}

EntityPtr fromJson(const JsonValue &json) {
  const std::string kind = json["kind"].tryAsString().value_or("");
  if (kind == entityKindName(EntityKind::Location)) {
    return locationFromJson(json);
  }
  if (kind == entityKindName(EntityKind::NPC)) {
    return npcFromJson(json);
  }
  ENTITY_ERROR(std::format("Unknown entity kind '{}'", kind));
  return nullptr;
}

} // namespace Realmforge::EntityFactory
