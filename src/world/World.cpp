/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/World.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "entities/EntityFactory.hpp"
#include "managers/TemplateManager.hpp"
#include "utils/JsonReader.hpp"

#include <algorithm>
#include <charconv>
#include <format>
#include <stdexcept>

namespace Realmforge {

namespace {

MissedCallbackPolicy policyFor(const SimulationConfig &config) {
  return config.fireMissedCallbacks ? MissedCallbackPolicy::FireOnOrAfter
                                    : MissedCallbackPolicy::ExactTickOnly;
}

template <typename T>
void eraseById(std::vector<std::unique_ptr<T>> &entities,
               std::unordered_map<std::string, size_t> &index,
               const std::string &id) {
  auto it = index.find(id);
  if (it == index.end()) {
    return;
  }
  entities.erase(entities.begin() + static_cast<std::ptrdiff_t>(it->second));
  index.clear();
  for (size_t i = 0; i < entities.size(); ++i) {
    index.emplace(entities[i]->getId(), i);
  }
}

} // namespace

JsonValue WorldSummary::toJson() const {
  JsonObject obj;
  obj["name"] = JsonValue(name);
  obj["time"] = JsonValue(dateTime);
  obj["total_simulation_time"] = JsonValue(totalSimulationTime);
  obj["locations"] = JsonValue(locationCount);
  obj["npcs"] = JsonValue(npcCount);
  obj["active_npcs"] = JsonValue(activeNpcCount);
  obj["events_in_queue"] = JsonValue(eventsInQueue);

  JsonArray recent;
  for (const auto &entry : recentEvents) {
    recent.emplace_back(entry);
  }
  obj["recent_events"] = JsonValue(std::move(recent));
  return JsonValue(std::move(obj));
}

World::World(std::shared_ptr<const TemplateManager> templates, uint64_t seed,
             SimulationConfig config)
    : m_templates(templates), m_config(std::move(config)), m_seed(seed),
      m_time(m_config.startYear, m_config.startDay, m_config.startHour,
             policyFor(m_config)),
      m_events(m_config.maxEventHistory, m_config.maxEventQueue),
      m_generator(templates, seed), m_saves(m_config.saveDirectory) {
  m_events.setClock([this]() { return m_time.getTotalMinutes(); });
  m_events.addGlobalListener([this](const Event &event) { recordMemory(event); });
  cacheCalendar();

  if (m_config.autosaveIntervalMinutes > 0) {
    enableAutosave(m_config.autosaveIntervalMinutes, m_config.autosaveKeep);
  }
  WORLD_DEBUG(std::format("World created with seed {}", seed));
}

World::~World() = default;

std::unique_ptr<World>
World::createNew(std::shared_ptr<const TemplateManager> templates,
                 int numLocations, uint64_t seed, std::string name,
                 SimulationConfig config) {
  auto world = std::make_unique<World>(std::move(templates), seed,
                                       std::move(config));
  world->m_name = std::move(name);
  world->m_description =
      std::format("A procedurally generated world (seed {})", seed);

  const GeneratedWorld generated = world->m_generator.generateWorld(numLocations);
  const size_t npcCount = EntityFactory::populateWorld(generated, *world);

  JsonObject data;
  data["world_name"] = JsonValue(world->m_name);
  data["num_locations"] = JsonValue(world->m_locations.size());
  data["num_npcs"] = JsonValue(npcCount);
  world->m_events.publishEvent(EventTypeId::LocationCreated, std::move(data));

  WORLD_INFO(std::format("Created world '{}' with {} locations and {} NPCs",
                         world->m_name, world->m_locations.size(), npcCount));
  return world;
}

TickReport World::update(double deltaMinutes) {
  if (deltaMinutes < 0.0) {
    throw std::invalid_argument(
        std::format("World::update - negative delta {}", deltaMinutes));
  }

  TickReport report;
  m_inTick = true;

  TimeManager::AdvanceResult advance =
      m_time.advanceMinutes(static_cast<int64_t>(deltaMinutes));
  report.minutesAdvanced = advance.minutesAdvanced;
  for (auto &failure : advance.failures) {
    report.failures.push_back(TickFailure{
        "callback",
        failure.label.empty() ? std::to_string(failure.callbackId)
                              : failure.label,
        std::move(failure.message)});
  }
  m_totalSimulationTime += deltaMinutes;

  for (size_t i = 0; i < m_locations.size(); ++i) {
    LivingLocation &location = *m_locations[i];
    if (!location.isActive()) {
      continue;
    }
    try {
      location.update(deltaMinutes, *this);
    } catch (const std::exception &e) {
      WORLD_ERROR(std::format("Location {} update failed: {}", location.getId(),
                              e.what()));
      report.failures.push_back(TickFailure{"location", location.getId(), e.what()});
    }
  }

  // NPCs spawned by handlers during this loop wait for the next tick
  const size_t npcCount = m_npcs.size();
  for (size_t i = 0; i < npcCount && i < m_npcs.size(); ++i) {
    LivingNPC &npc = *m_npcs[i];
    if (!npc.isActive()) {
      continue;
    }
    try {
      npc.update(deltaMinutes, *this);
    } catch (const std::exception &e) {
      WORLD_ERROR(std::format("NPC {} update failed: {}", npc.getId(), e.what()));
      report.failures.push_back(TickFailure{"npc", npc.getId(), e.what()});
    }
  }

  EventManager::DispatchReport dispatch = m_events.processEvents();
  report.eventsProcessed = dispatch.processed;
  for (auto &failure : dispatch.failures) {
    report.failures.push_back(
        TickFailure{"event", failure.eventId, std::move(failure.message)});
  }

  publishBoundaryEvents();

  m_inTick = false;
  purgeRemoved();
  runAutosave();
  return report;
}

void World::cacheCalendar() {
  m_lastHour = m_time.getHour();
  m_lastDay = m_time.getDay();
  m_lastSeason = m_time.getSeason();
  m_lastYear = m_time.getYear();
}

void World::publishBoundaryEvents() {
  const int hour = m_time.getHour();
  const int day = m_time.getDay();
  const int year = m_time.getYear();
  const Season season = m_time.getSeason();

  if (hour != m_lastHour) {
    JsonObject data;
    data["hour"] = JsonValue(hour);
    data["day"] = JsonValue(day);
    data["year"] = JsonValue(year);
    m_events.publishEvent(EventTypeId::HourPassed, std::move(data));
  }
  if (day != m_lastDay || year != m_lastYear) {
    JsonObject data;
    data["day"] = JsonValue(day);
    data["year"] = JsonValue(year);
    m_events.publishEvent(EventTypeId::DayPassed, std::move(data));
  }
  if (season != m_lastSeason) {
    JsonObject data;
    data["season"] = JsonValue(seasonName(season));
    data["previous"] = JsonValue(seasonName(m_lastSeason));
    m_events.publishEvent(EventTypeId::SeasonChanged, std::move(data));
  }
  if (year != m_lastYear) {
    JsonObject data;
    data["year"] = JsonValue(year);
    m_events.publishEvent(EventTypeId::YearPassed, std::move(data));
  }
  cacheCalendar();
}

void World::recordMemory(const Event &event) {
  const std::string memory = std::format("{} {} {}", m_time.formatDate(),
                                         m_time.formatTime(), event.getTypeName());
  if (event.sourceId) {
    if (LivingNPC *npc = getNpc(*event.sourceId)) {
      npc->addMemory(memory);
    }
  }
  if (event.targetId && event.targetId != event.sourceId) {
    if (LivingNPC *npc = getNpc(*event.targetId)) {
      npc->addMemory(memory);
    }
  }
}

LivingLocation &World::addLocation(std::unique_ptr<LivingLocation> location) {
  const std::string id = location->getId();
  auto it = m_locationIndex.find(id);
  if (it != m_locationIndex.end()) {
    WORLD_WARN("Replacing location " + id);
    m_locations[it->second] = std::move(location);
    return *m_locations[it->second];
  }
  m_locationIndex.emplace(id, m_locations.size());
  m_locations.push_back(std::move(location));
  return *m_locations.back();
}

LivingNPC &World::addNpc(std::unique_ptr<LivingNPC> npc) {
  const std::string id = npc->getId();
  auto it = m_npcIndex.find(id);
  if (it != m_npcIndex.end()) {
    WORLD_WARN("Replacing NPC " + id);
    m_npcs[it->second] = std::move(npc);
    return *m_npcs[it->second];
  }
  m_npcIndex.emplace(id, m_npcs.size());
  m_npcs.push_back(std::move(npc));
  return *m_npcs.back();
}

std::string World::allocateNpcId() {
  std::string id;
  do {
    id = std::format("npc_{}", m_nextNpcSerial++);
  } while (m_npcIndex.count(id) > 0);
  return id;
}

LivingNPC &World::spawnNpc(const std::string &locationId,
                           const std::vector<std::string> &professions,
                           const std::optional<std::string> &race) {
  LivingLocation *location = getLocation(locationId);
  if (!location) {
    throw LookupError("location", locationId);
  }

  NpcRecord record = m_generator.generateNpc(professions, race);
  LivingNPC &npc = addNpc(EntityFactory::createNpc(
      allocateNpcId(), std::move(record), locationId, m_generator.getRandom()));
  location->addNpc(npc.getId(), m_events);

  JsonObject data;
  data["npc_name"] = JsonValue(npc.getName());
  data["profession"] = JsonValue(npc.getProfession());
  m_events.publishEvent(EventTypeId::NpcSpawned, std::move(data), npc.getId(),
                        std::nullopt, locationId);

  WORLD_DEBUG(std::format("Spawned {} ({}) at {}", npc.getName(), npc.getId(),
                          locationId));
  return npc;
}

bool World::removeNpc(const std::string &npcId) {
  LivingNPC *npc = getNpc(npcId);
  if (!npc || std::find(m_pendingRemoval.begin(), m_pendingRemoval.end(),
                        npcId) != m_pendingRemoval.end()) {
    return false;
  }

  npc->destroy();
  if (const auto &locationId = npc->getLocationId()) {
    if (LivingLocation *location = getLocation(*locationId)) {
      location->removeNpc(npcId, m_events);
    }
  }

  JsonObject data;
  data["npc_name"] = JsonValue(npc->getName());
  m_events.publishEvent(EventTypeId::NpcDied, std::move(data), npcId);

  if (m_inTick) {
    m_pendingRemoval.push_back(npcId);
  } else {
    eraseById(m_npcs, m_npcIndex, npcId);
  }
  return true;
}

void World::purgeRemoved() {
  for (const auto &id : m_pendingRemoval) {
    eraseById(m_npcs, m_npcIndex, id);
  }
  m_pendingRemoval.clear();
}

bool World::moveNpc(const std::string &npcId, const std::string &locationId) {
  LivingNPC *npc = getNpc(npcId);
  if (!npc) {
    WORLD_WARN("moveNpc: unknown NPC " + npcId);
    return false;
  }
  if (!getLocation(locationId)) {
    throw LookupError("location", locationId);
  }
  npc->moveToLocation(locationId, m_events);
  return true;
}

LivingLocation *World::getLocation(const std::string &locationId) {
  auto it = m_locationIndex.find(locationId);
  return it == m_locationIndex.end() ? nullptr : m_locations[it->second].get();
}

const LivingLocation *World::getLocation(const std::string &locationId) const {
  auto it = m_locationIndex.find(locationId);
  return it == m_locationIndex.end() ? nullptr : m_locations[it->second].get();
}

LivingNPC *World::getNpc(const std::string &npcId) {
  auto it = m_npcIndex.find(npcId);
  return it == m_npcIndex.end() ? nullptr : m_npcs[it->second].get();
}

const LivingNPC *World::getNpc(const std::string &npcId) const {
  auto it = m_npcIndex.find(npcId);
  return it == m_npcIndex.end() ? nullptr : m_npcs[it->second].get();
}

std::vector<LivingNPC *> World::getNpcsAtLocation(const std::string &locationId) {
  std::vector<LivingNPC *> result;
  for (auto &npc : m_npcs) {
    if (npc->getLocationId() == locationId) {
      result.push_back(npc.get());
    }
  }
  return result;
}

std::vector<LivingNPC *> World::getActiveNpcs() {
  std::vector<LivingNPC *> result;
  for (auto &npc : m_npcs) {
    if (npc->isActive()) {
      result.push_back(npc.get());
    }
  }
  return result;
}

std::vector<LivingLocation *> World::getLocations() {
  std::vector<LivingLocation *> result;
  result.reserve(m_locations.size());
  for (auto &location : m_locations) {
    result.push_back(location.get());
  }
  return result;
}

std::vector<LivingNPC *> World::getNpcs() {
  std::vector<LivingNPC *> result;
  result.reserve(m_npcs.size());
  for (auto &npc : m_npcs) {
    result.push_back(npc.get());
  }
  return result;
}

WorldSummary World::getSummary() const {
  WorldSummary summary;
  summary.name = m_name;
  summary.dateTime = m_time.formatDateTime();
  summary.totalSimulationTime = m_totalSimulationTime;
  summary.locationCount = m_locations.size();
  summary.npcCount = m_npcs.size();
  summary.activeNpcCount = static_cast<size_t>(
      std::count_if(m_npcs.begin(), m_npcs.end(),
                    [](const auto &npc) { return npc->isActive(); }));
  summary.eventsInQueue = m_events.getQueueSize();
  for (const auto &event : m_events.getRecentEvents()) {
    summary.recentEvents.push_back(event.getTypeName());
  }
  return summary;
}

JsonValue World::toJson() const {
  JsonObject state;
  state["name"] = JsonValue(m_name);
  state["description"] = JsonValue(m_description);
  // Decimal string: a JSON number cannot hold every uint64_t exactly
  state["seed"] = JsonValue(std::to_string(m_seed));
  state["total_simulation_time"] = JsonValue(m_totalSimulationTime);
  state["next_npc_serial"] = JsonValue(static_cast<int64_t>(m_nextNpcSerial));
  state["time"] = m_time.toJson();
  state["events"] = m_events.toJson(m_events.getMaxHistory());

  JsonObject locations;
  for (const auto &location : m_locations) {
    locations[location->getId()] = location->serialize();
  }
  state["locations"] = JsonValue(std::move(locations));

  JsonObject npcs;
  for (const auto &npc : m_npcs) {
    npcs[npc->getId()] = npc->serialize();
  }
  state["npcs"] = JsonValue(std::move(npcs));
  return JsonValue(std::move(state));
}

std::optional<uint64_t> World::readSeed(const JsonValue &value) {
  if (const auto text = value.tryAsString()) {
    uint64_t seed = 0;
    const char *end = text->data() + text->size();
    auto [ptr, ec] = std::from_chars(text->data(), end, seed);
    if (ec != std::errc() || ptr != end || text->empty()) {
      return std::nullopt;
    }
    return seed;
  }
  // Plain numbers are accepted when they are exact non-negative integers
  if (auto number = value.tryAsInt64(); number && *number >= 0 &&
                                        *number <= (int64_t{1} << 53)) {
    return static_cast<uint64_t>(*number);
  }
  return std::nullopt;
}

std::unique_ptr<World>
World::fromJson(std::shared_ptr<const TemplateManager> templates,
                const JsonValue &worldState, SimulationConfig config) {
  if (!worldState.isObject()) {
    WORLD_ERROR("World state is not an object");
    return nullptr;
  }
  auto seed = readSeed(worldState["seed"]);
  const JsonObject *locations = worldState["locations"].tryAsObject();
  const JsonObject *npcs = worldState["npcs"].tryAsObject();
  if (!seed || !locations || !npcs) {
    WORLD_ERROR("World state lacks seed, locations or npcs");
    return nullptr;
  }

  auto world = std::make_unique<World>(std::move(templates),
                                       *seed,
                                       std::move(config));
  world->m_name = worldState["name"].tryAsString().value_or("New World");
  world->m_description = worldState["description"].tryAsString().value_or("");
  world->m_totalSimulationTime =
      worldState["total_simulation_time"].tryAsNumber().value_or(0.0);

  if (!world->m_time.loadFromJson(worldState["time"])) {
    WORLD_ERROR("World state has an invalid time block");
    return nullptr;
  }

  for (const auto &[id, state] : *locations) {
    auto location = EntityFactory::locationFromJson(state);
    if (!location) {
      WORLD_ERROR("Could not restore location " + id);
      return nullptr;
    }
    world->addLocation(std::move(location));
  }
  for (const auto &[id, state] : *npcs) {
    auto npc = EntityFactory::npcFromJson(state);
    if (!npc) {
      WORLD_ERROR("Could not restore NPC " + id);
      return nullptr;
    }
    world->addNpc(std::move(npc));
  }

  if (auto serial = worldState["next_npc_serial"].tryAsInt64();
      serial && *serial > 0) {
    world->m_nextNpcSerial = static_cast<uint64_t>(*serial);
  }

  const JsonValue &events = worldState["events"];
  if (!events.isNull() && !world->m_events.restoreHistory(events)) {
    WORLD_WARN("Event history could not be restored; starting empty");
  }

  world->m_generator.reseed(
      reloadSeed(world->m_seed, world->m_time.getTotalMinutes()));
  world->cacheCalendar();
  world->m_lastAutosave = world->m_time.getTotalMinutes();
  return world;
}

uint64_t World::reloadSeed(uint64_t seed, int64_t totalMinutes) {
  // splitmix64 finalizer over the seed and the clock
  uint64_t z = seed + 0x9E3779B97F4A7C15ULL * (static_cast<uint64_t>(totalMinutes) + 1);
  z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
  z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
  return z ^ (z >> 31);
}

std::optional<std::string> World::save(const std::string &name, SaveFormat format,
                                       bool compressed) {
  return m_saves.save(toJson(), name, format, compressed);
}

std::unique_ptr<World> World::load(std::shared_ptr<const TemplateManager> templates,
                                   const std::string &name, SaveFormat format,
                                   SimulationConfig config) {
  SaveGameManager saves(config.saveDirectory);
  auto snapshot = saves.load(name, format);
  if (!snapshot) {
    return nullptr;
  }
  return fromJson(std::move(templates), snapshot->worldState, std::move(config));
}

void World::enableAutosave(int64_t intervalMinutes, size_t keep) {
  m_autosaveInterval = std::max<int64_t>(0, intervalMinutes);
  m_autosaveKeep = keep;
  m_lastAutosave = m_time.getTotalMinutes();
}

void World::runAutosave() {
  if (m_autosaveInterval <= 0) {
    return;
  }
  const int64_t now = m_time.getTotalMinutes();
  if (now - m_lastAutosave < m_autosaveInterval) {
    return;
  }
  if (!m_saves.autosave(toJson(), now, m_autosaveKeep)) {
    WORLD_ERROR(std::format("Autosave at minute {} failed", now));
  }
  m_lastAutosave = now;
}

} // namespace Realmforge
