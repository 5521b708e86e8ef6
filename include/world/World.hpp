/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef WORLD_HPP
#define WORLD_HPP

/**
 * @file World.hpp
 * @brief Owner of the living simulation and its tick
 *
 * One tick (update/step) runs these stages in order:
 * 1. advance the TimeManager (scheduled callbacks fire here)
 * 2. update every active location (weather, market hours)
 * 3. update every active NPC (needs, activity state machine)
 * 4. drain the event queue
 * 5. publish hour_passed / day_passed / season_changed / year_passed for
 *    calendar boundaries crossed this tick (deferred to the next drain)
 * 6. erase NPCs removed during the tick
 * 7. autosave when enabled and due
 *
 * Failures from callbacks, entity updates and event handlers are collected
 * in the returned TickReport; none of them stops the tick.
 */

#include "core/SimulationConfig.hpp"
#include "core/TimeManager.hpp"
#include "entities/LivingLocation.hpp"
#include "entities/LivingNPC.hpp"
#include "managers/EventManager.hpp"
#include "managers/SaveGameManager.hpp"
#include "world/ContentGenerator.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace Realmforge {

class JsonValue;
class TemplateManager;

struct TickFailure {
  std::string source; // "callback", "location", "npc" or "event"
  std::string id;
  std::string message;
};

struct TickReport {
  int64_t minutesAdvanced{0};
  size_t eventsProcessed{0};
  std::vector<TickFailure> failures;

  bool ok() const { return failures.empty(); }
};

struct WorldSummary {
  std::string name;
  std::string dateTime;
  double totalSimulationTime{0.0};
  size_t locationCount{0};
  size_t npcCount{0};
  size_t activeNpcCount{0};
  size_t eventsInQueue{0};
  std::vector<std::string> recentEvents;

  JsonValue toJson() const;
};

class World {
public:
  World(std::shared_ptr<const TemplateManager> templates, uint64_t seed,
        SimulationConfig config = {});
  ~World();

  World(const World &) = delete;
  World &operator=(const World &) = delete;

  /**
   * @brief Generates a world of numLocations roots and populates it
   *
   * Publishes location_created once the entities are registered.
   */
  static std::unique_ptr<World>
  createNew(std::shared_ptr<const TemplateManager> templates, int numLocations,
            uint64_t seed, std::string name = "New World",
            SimulationConfig config = {});

  /**
   * @brief Runs one tick of deltaMinutes
   * @throws std::invalid_argument on a negative delta
   */
  TickReport update(double deltaMinutes);
  TickReport step(int minutes = 1) { return update(static_cast<double>(minutes)); }
  TickReport simulateHours(int hours) { return update(hours * 60.0); }
  TickReport simulateDays(int days) { return update(days * 24.0 * 60.0); }

  // Registration used by EntityFactory and snapshot loading
  LivingLocation &addLocation(std::unique_ptr<LivingLocation> location);
  LivingNPC &addNpc(std::unique_ptr<LivingNPC> npc);

  /**
   * @brief Generates an NPC and places it at a location
   * @throws LookupError for an unknown location, profession or race
   */
  LivingNPC &spawnNpc(const std::string &locationId,
                      const std::vector<std::string> &professions = {},
                      const std::optional<std::string> &race = std::nullopt);

  /**
   * @brief Marks an NPC dead, detaches it and publishes npc_died
   *
   * During a tick the NPC is erased once the tick's updates are done;
   * outside a tick it is erased immediately.
   *
   * @return false for an unknown id
   */
  bool removeNpc(const std::string &npcId);

  /**
   * @brief Sends an NPC travelling towards a location
   * @return false for an unknown NPC
   * @throws LookupError for an unknown location
   */
  bool moveNpc(const std::string &npcId, const std::string &locationId);

  LivingLocation *getLocation(const std::string &locationId);
  const LivingLocation *getLocation(const std::string &locationId) const;
  LivingNPC *getNpc(const std::string &npcId);
  const LivingNPC *getNpc(const std::string &npcId) const;

  std::vector<LivingNPC *> getNpcsAtLocation(const std::string &locationId);
  std::vector<LivingNPC *> getActiveNpcs();
  std::vector<LivingLocation *> getLocations();
  std::vector<LivingNPC *> getNpcs();

  size_t getLocationCount() const { return m_locations.size(); }
  size_t getNpcCount() const { return m_npcs.size(); }

  // Next free "npc_<n>" id
  std::string allocateNpcId();

  TimeManager &getTime() { return m_time; }
  const TimeManager &getTime() const { return m_time; }
  EventManager &getEvents() { return m_events; }
  const EventManager &getEvents() const { return m_events; }
  ContentGenerator &getGenerator() { return m_generator; }
  const TemplateManager &getTemplates() const { return *m_templates; }
  SaveGameManager &getSaveManager() { return m_saves; }

  const std::string &getName() const { return m_name; }
  void setName(std::string name) { m_name = std::move(name); }
  const std::string &getDescription() const { return m_description; }
  void setDescription(std::string description) {
    m_description = std::move(description);
  }
  uint64_t getSeed() const { return m_seed; }
  double getTotalSimulationTime() const { return m_totalSimulationTime; }
  bool isInTick() const { return m_inTick; }

  WorldSummary getSummary() const;

  /**
   * @brief Snapshot of the whole world (the world_state of a save)
   *
   * Keys: name, description, seed, total_simulation_time, next_npc_serial,
   * time, events, locations {id: state}, npcs {id: state}.
   */
  JsonValue toJson() const;

  /**
   * @brief Rebuilds a world from toJson() output
   *
   * The generator is reseeded from the stored seed mixed with the stored
   * total minutes; the RNG stream position itself is not part of the
   * snapshot.
   *
   * @return nullptr if the document is malformed
   */
  static std::unique_ptr<World>
  fromJson(std::shared_ptr<const TemplateManager> templates,
           const JsonValue &worldState, SimulationConfig config = {});

  // Path of the written file, nullopt on failure
  std::optional<std::string> save(const std::string &name,
                                  SaveFormat format = SaveFormat::Json,
                                  bool compressed = true);

  static std::unique_ptr<World>
  load(std::shared_ptr<const TemplateManager> templates, const std::string &name,
       SaveFormat format = SaveFormat::Json, SimulationConfig config = {});

  void enableAutosave(int64_t intervalMinutes, size_t keep);
  void disableAutosave() { m_autosaveInterval = 0; }
  bool isAutosaveEnabled() const { return m_autosaveInterval > 0; }

  static uint64_t reloadSeed(uint64_t seed, int64_t totalMinutes);

  /**
   * @brief Parses the snapshot seed
   *
   * Accepts the decimal string toJson() writes, or a non-negative integral
   * number up to 2^53. nullopt for anything else.
   */
  static std::optional<uint64_t> readSeed(const JsonValue &value);

private:
  void recordMemory(const Event &event);
  void cacheCalendar();
  void publishBoundaryEvents();
  void purgeRemoved();
  void runAutosave();

  std::shared_ptr<const TemplateManager> m_templates;
  SimulationConfig m_config;
  uint64_t m_seed;
  std::string m_name{"New World"};
  std::string m_description;

  TimeManager m_time;
  EventManager m_events;
  ContentGenerator m_generator;
  SaveGameManager m_saves;

  // Insertion order is update order
  std::vector<std::unique_ptr<LivingLocation>> m_locations;
  std::unordered_map<std::string, size_t> m_locationIndex;
  std::vector<std::unique_ptr<LivingNPC>> m_npcs;
  std::unordered_map<std::string, size_t> m_npcIndex;
  uint64_t m_nextNpcSerial{1};

  double m_totalSimulationTime{0.0};
  bool m_inTick{false};
  std::vector<std::string> m_pendingRemoval;

  int m_lastHour{0};
  int m_lastDay{0};
  Season m_lastSeason{Season::Spring};
  int m_lastYear{0};

  int64_t m_autosaveInterval{0};
  size_t m_autosaveKeep{5};
  int64_t m_lastAutosave{0};
};

} // namespace Realmforge

#endif // WORLD_HPP
