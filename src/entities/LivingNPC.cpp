/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/LivingNPC.hpp"
#include "core/Logger.hpp"
#include "core/Random.hpp"
#include "managers/EventManager.hpp"
#include "managers/TemplateManager.hpp"
#include "utils/JsonReader.hpp"
#include "world/World.hpp"

#include <algorithm>
#include <array>
#include <format>

namespace Realmforge {

namespace {

constexpr std::array<const char *, 6> kActivityNames = {
    "idle", "working", "traveling", "eating", "sleeping", "socializing"};

constexpr std::array<const char *, 8> kWorkProfessions = {
    "blacksmith", "merchant", "guard",   "innkeeper",
    "alchemist",  "enchanter", "farmer", "miner"};

constexpr std::array<const char *, 4> kCraftProfessions = {
    "blacksmith", "alchemist", "enchanter", "jeweler"};

// Need drift per simulated minute
constexpr double ENERGY_WORK_DRAIN = 0.15;
constexpr double ENERGY_SLEEP_GAIN = 0.5;
constexpr double ENERGY_IDLE_DRAIN = 0.05;
constexpr double HUNGER_GAIN = 0.1;
constexpr double EATING_HUNGER_LOSS = 1.0;
constexpr double EATING_ENERGY_GAIN = 0.2;
constexpr double MOOD_LOSS = 0.1;
constexpr double MOOD_GAIN = 0.05;

constexpr double CRAFT_CHANCE_PER_MINUTE = 0.01;
constexpr double TRAVEL_MINUTES = 60.0;
constexpr double SOCIALIZE_MINUTES = 10.0;
constexpr double SOCIALIZE_MOOD_BONUS = 5.0;

template <size_t N>
bool anyOf(const std::vector<std::string> &professions,
           const std::array<const char *, N> &set) {
  return std::any_of(professions.begin(), professions.end(),
                     [&set](const std::string &profession) {
                       return std::find(set.begin(), set.end(), profession) !=
                              set.end();
                     });
}

bool hasProfession(const std::vector<std::string> &professions,
                   const char *name) {
  return std::find(professions.begin(), professions.end(), name) !=
         professions.end();
}

double clampNeed(double value) {
  return std::clamp(value, 0.0, LivingNPC::MAX_NEED);
}

JsonValue optionalString(const std::optional<std::string> &value) {
  return value ? JsonValue(*value) : JsonValue();
}

} // namespace

const char *npcActivityName(NpcActivity activity) {
  const auto index = static_cast<size_t>(activity);
  return index < kActivityNames.size() ? kActivityNames[index] : "unknown";
}

std::optional<NpcActivity> npcActivityFromName(const std::string &name) {
  for (size_t i = 0; i < kActivityNames.size(); ++i) {
    if (name == kActivityNames[i]) {
      return static_cast<NpcActivity>(i);
    }
  }
  return std::nullopt;
}

LivingNPC::LivingNPC(std::string id, NpcRecord record,
                     std::optional<std::string> locationId, int gold)
    : Entity(std::move(id), EntityKind::NPC), m_record(std::move(record)),
      m_locationId(std::move(locationId)), m_gold(gold) {
  m_inventory = m_record.inventory;
  m_workLocationId = m_locationId;
}

void LivingNPC::update(double deltaMinutes, World &world) {
  if (!m_active) {
    return;
  }
  m_lastUpdate += deltaMinutes;
  m_activityMinutes += deltaMinutes;

  updateNeeds(deltaMinutes);
  if (handleUrgentNeeds()) {
    return;
  }

  switch (m_activity) {
  case NpcActivity::Traveling:
    updateTraveling(deltaMinutes, world);
    break;
  case NpcActivity::Working:
    updateWorking(deltaMinutes, world);
    break;
  case NpcActivity::Eating:
    updateEating();
    break;
  case NpcActivity::Sleeping:
    updateSleeping(world);
    break;
  case NpcActivity::Socializing:
    updateSocializing();
    break;
  case NpcActivity::Idle:
    updateIdle(world);
    break;
  }
}

void LivingNPC::updateNeeds(double deltaMinutes) {
  switch (m_activity) {
  case NpcActivity::Working:
    m_energy -= deltaMinutes * ENERGY_WORK_DRAIN;
    break;
  case NpcActivity::Sleeping:
    m_energy += deltaMinutes * ENERGY_SLEEP_GAIN;
    break;
  default:
    m_energy -= deltaMinutes * ENERGY_IDLE_DRAIN;
    break;
  }

  m_hunger += deltaMinutes * HUNGER_GAIN;
  if (m_activity == NpcActivity::Eating) {
    m_hunger -= deltaMinutes * EATING_HUNGER_LOSS;
    m_energy += deltaMinutes * EATING_ENERGY_GAIN;
  }

  m_energy = clampNeed(m_energy);
  m_hunger = clampNeed(m_hunger);

  if (m_energy < 30.0 || m_hunger > 70.0) {
    m_mood -= deltaMinutes * MOOD_LOSS;
  } else {
    m_mood += deltaMinutes * MOOD_GAIN;
  }
  m_mood = clampNeed(m_mood);
}

bool LivingNPC::handleUrgentNeeds() {
  if (m_energy < 20.0 && m_activity != NpcActivity::Sleeping) {
    startSleeping();
    return true;
  }
  if (m_hunger > 80.0 && m_activity != NpcActivity::Eating) {
    startEating();
    return true;
  }
  return false;
}

void LivingNPC::updateIdle(World &world) {
  const TimeManager &time = world.getTime();

  if (!time.isDaytime() && m_energy < 60.0) {
    startSleeping();
    return;
  }
  if (isWorkHour(time.getHour()) && shouldWork()) {
    startWorking(world.getEvents());
    return;
  }
  if (m_hunger > 50.0) {
    startEating();
    return;
  }
  if (world.getGenerator().getRandom().chance(0.1)) {
    startSocializing();
  }
}

void LivingNPC::updateWorking(double deltaMinutes, World &world) {
  if (!isWorkHour(world.getTime().getHour()) || m_energy < 30.0) {
    setActivity(NpcActivity::Idle);
  }

  // The shift's last tick still gets its crafting roll
  if (canCraft()) {
    tryCraft(deltaMinutes, world);
  }
}

void LivingNPC::tryCraft(double deltaMinutes, World &world) {
  Random &random = world.getGenerator().getRandom();
  if (!random.chance(deltaMinutes * CRAFT_CHANCE_PER_MINUTE)) {
    return;
  }

  const auto &professions = m_record.professions;
  std::string templateName;
  if (hasProfession(professions, "blacksmith")) {
    templateName = random.chance(0.5) ? "weapon_melee" : "armor";
  } else if (hasProfession(professions, "alchemist")) {
    templateName = "consumable";
  } else if (hasProfession(professions, "enchanter")) {
    templateName = random.chance(0.5) ? "scroll" : "jewelry";
  } else if (hasProfession(professions, "jeweler")) {
    templateName = "jewelry";
  }

  if (templateName.empty() ||
      !world.getTemplates().hasItemTemplate(templateName)) {
    NPC_DEBUG(std::format("{} has nothing to craft from '{}'", m_record.name,
                          templateName));
    return;
  }

  Item item = world.getGenerator().generateItem(templateName);

  JsonObject data;
  data["item"] = item.toJson();
  data["crafter"] = JsonValue(m_record.name);
  m_inventory.push_back(std::move(item));

  world.getEvents().publishEvent(EventTypeId::ItemCrafted, std::move(data),
                                 getId(), std::nullopt, m_locationId);
}

void LivingNPC::updateTraveling(double deltaMinutes, World &world) {
  m_travelProgress += deltaMinutes / TRAVEL_MINUTES;
  if (m_travelProgress < 1.0) {
    return;
  }

  const std::optional<std::string> previous = m_locationId;
  EventManager &events = world.getEvents();

  if (previous) {
    if (LivingLocation *from = world.getLocation(*previous)) {
      from->removeNpc(getId(), events);
    }
  }
  m_locationId = m_destinationId;
  if (m_locationId) {
    if (LivingLocation *to = world.getLocation(*m_locationId)) {
      to->addNpc(getId(), events);
    } else {
      NPC_WARN(std::format("{} arrived at unknown location {}", getId(),
                           *m_locationId));
    }
  }
  m_destinationId.reset();
  m_travelProgress = 0.0;
  setActivity(NpcActivity::Idle);

  JsonObject data;
  data["npc_name"] = JsonValue(m_record.name);
  data["from_location"] = optionalString(previous);
  events.publishEvent(EventTypeId::NpcArrived, std::move(data), getId(),
                      std::nullopt, m_locationId);
}

void LivingNPC::updateEating() {
  if (m_hunger < 20.0) {
    setActivity(NpcActivity::Idle);
  }
}

void LivingNPC::updateSleeping(World &world) {
  if (m_energy > 90.0 ||
      (m_energy > 50.0 && world.getTime().isWorkingHours())) {
    setActivity(NpcActivity::Idle);
  }
}

void LivingNPC::updateSocializing() {
  if (m_activityMinutes > SOCIALIZE_MINUTES) {
    setActivity(NpcActivity::Idle);
  }
}

void LivingNPC::moveToLocation(const std::string &locationId,
                               EventManager &events) {
  if (m_locationId && *m_locationId == locationId) {
    return;
  }

  setActivity(NpcActivity::Traveling);
  m_destinationId = locationId;
  m_travelProgress = 0.0;

  JsonObject data;
  data["npc_name"] = JsonValue(m_record.name);
  data["destination"] = JsonValue(locationId);
  events.publishEvent(EventTypeId::NpcStartedTraveling, std::move(data),
                      getId(), std::nullopt, m_locationId);
}

void LivingNPC::startWorking(EventManager &events) {
  setActivity(NpcActivity::Working);

  JsonObject data;
  data["npc_name"] = JsonValue(m_record.name);
  events.publishEvent(EventTypeId::NpcStartedWorking, std::move(data), getId(),
                      std::nullopt, m_locationId);
}

void LivingNPC::startSocializing() {
  setActivity(NpcActivity::Socializing);
  m_mood = clampNeed(m_mood + SOCIALIZE_MOOD_BONUS);
}

void LivingNPC::setActivity(NpcActivity activity) {
  if (activity != m_activity) {
    m_activityMinutes = 0.0;
  }
  m_activity = activity;
}

void LivingNPC::setEnergy(double energy) { m_energy = clampNeed(energy); }
void LivingNPC::setHunger(double hunger) { m_hunger = clampNeed(hunger); }
void LivingNPC::setMood(double mood) { m_mood = clampNeed(mood); }

void LivingNPC::addMemory(std::string memory) {
  m_memory.push_back(std::move(memory));
}

std::string LivingNPC::getProfession() const {
  return m_record.professions.empty() ? "wanderer"
                                      : m_record.professions.front();
}

bool LivingNPC::shouldWork() const {
  return anyOf(m_record.professions, kWorkProfessions);
}

bool LivingNPC::canCraft() const {
  return anyOf(m_record.professions, kCraftProfessions);
}

JsonValue LivingNPC::serialize() const {
  JsonObject obj;
  obj["id"] = JsonValue(getId());
  obj["kind"] = JsonValue(entityKindName(getKind()));
  obj["data"] = m_record.toJson();
  obj["current_location_id"] = optionalString(m_locationId);
  obj["current_activity"] = JsonValue(npcActivityName(m_activity));
  obj["destination_location_id"] = optionalString(m_destinationId);
  obj["travel_progress"] = JsonValue(m_travelProgress);
  obj["energy"] = JsonValue(m_energy);
  obj["hunger"] = JsonValue(m_hunger);
  obj["mood"] = JsonValue(m_mood);
  obj["gold"] = JsonValue(m_gold);

  JsonArray inventory;
  for (const auto &item : m_inventory) {
    inventory.push_back(item.toJson());
  }
  obj["inventory"] = JsonValue(std::move(inventory));

  JsonArray memory;
  for (const auto &entry : m_memory) {
    memory.emplace_back(entry);
  }
  obj["memory"] = JsonValue(std::move(memory));

  obj["work_start_hour"] = JsonValue(m_workStartHour);
  obj["work_end_hour"] = JsonValue(m_workEndHour);
  obj["work_location_id"] = optionalString(m_workLocationId);
  obj["activity_minutes"] = JsonValue(m_activityMinutes);
  obj["last_update"] = JsonValue(m_lastUpdate);
  obj["active"] = JsonValue(m_active);
  return JsonValue(std::move(obj));
}

bool LivingNPC::deserialize(const JsonValue &json) {
  if (!json.isObject()) {
    NPC_ERROR("NPC state is not an object");
    return false;
  }

  const std::string activityName =
      json["current_activity"].tryAsString().value_or("idle");
  auto activity = npcActivityFromName(activityName);
  if (!activity) {
    NPC_ERROR(std::format("Unknown activity '{}' for {}", activityName, getId()));
    return false;
  }

  std::vector<Item> inventory;
  if (const JsonArray *items = json["inventory"].tryAsArray()) {
    for (const auto &entry : *items) {
      auto item = Item::fromJson(entry);
      if (!item) {
        NPC_ERROR(std::format("Malformed inventory item for {}", getId()));
        return false;
      }
      inventory.push_back(std::move(*item));
    }
  } else {
    inventory = m_record.inventory;
  }

  m_memory.clear();
  if (const JsonArray *memory = json["memory"].tryAsArray()) {
    for (const auto &entry : *memory) {
      if (auto text = entry.tryAsString()) {
        m_memory.push_back(*text);
      }
    }
  }

  m_inventory = std::move(inventory);
  m_activity = *activity;
  m_locationId = json["current_location_id"].tryAsString();
  m_destinationId = json["destination_location_id"].tryAsString();
  m_travelProgress = json["travel_progress"].tryAsNumber().value_or(0.0);
  m_energy = clampNeed(json["energy"].tryAsNumber().value_or(MAX_NEED));
  m_hunger = clampNeed(json["hunger"].tryAsNumber().value_or(0.0));
  m_mood = clampNeed(json["mood"].tryAsNumber().value_or(50.0));
  m_gold = json["gold"].tryAsInt().value_or(m_gold);
  m_workStartHour = json["work_start_hour"].tryAsInt().value_or(8);
  m_workEndHour = json["work_end_hour"].tryAsInt().value_or(17);
  m_workLocationId = json["work_location_id"].tryAsString();
  m_activityMinutes = json["activity_minutes"].tryAsNumber().value_or(0.0);
  m_lastUpdate = json["last_update"].tryAsNumber().value_or(0.0);
  m_active = json["active"].tryAsBool().value_or(true);
  return true;
}

} // namespace Realmforge
