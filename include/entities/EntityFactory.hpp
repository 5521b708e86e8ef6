/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ENTITY_FACTORY_HPP
#define ENTITY_FACTORY_HPP

#include "entities/Entity.hpp"
#include "entities/LivingLocation.hpp"
#include "entities/LivingNPC.hpp"

#include <memory>
#include <optional>
#include <string>

namespace Realmforge {

class JsonValue;
class Random;
class World;
struct GeneratedWorld;

/**
 * @brief Turns generated records and snapshot JSON into living entities
 */
namespace EntityFactory {

constexpr int MIN_STARTING_GOLD = 10;
constexpr int MAX_STARTING_GOLD = 500;

std::unique_ptr<LivingLocation> createLocation(LocationRecord record);

// Starting gold is drawn from random in [10, 500]
std::unique_ptr<LivingNPC> createNpc(std::string id, NpcRecord record,
                                     std::optional<std::string> locationId,
                                     Random &random);

/**
 * @brief Registers every generated location and its embedded NPCs and items
 *
 * NPCs receive fresh ids from the world and are placed in the location
 * that embedded them; items are tracked as "<location id>:item_<n>".
 *
 * @return Number of NPCs created
 */
size_t populateWorld(const GeneratedWorld &generated, World &world);

/**
 * @brief Rebuilds an entity from LivingLocation/LivingNPC::serialize output
 *
 * Dispatches on the "kind" field.
 *
 * @return nullptr for an unknown kind or malformed state
 */
EntityPtr fromJson(const JsonValue &json);

std::unique_ptr<LivingLocation> locationFromJson(const JsonValue &json);
std::unique_ptr<LivingNPC> npcFromJson(const JsonValue &json);

} // namespace EntityFactory

} // namespace Realmforge

#endif // ENTITY_FACTORY_HPP
