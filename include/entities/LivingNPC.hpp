/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LIVING_NPC_HPP
#define LIVING_NPC_HPP

#include "entities/Entity.hpp"
#include "world/GeneratedContent.hpp"

#include <boost/circular_buffer.hpp>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace Realmforge {

class EventManager;

enum class NpcActivity : uint8_t {
  Idle = 0,
  Working = 1,
  Traveling = 2,
  Eating = 3,
  Sleeping = 4,
  Socializing = 5
};

const char *npcActivityName(NpcActivity activity);
std::optional<NpcActivity> npcActivityFromName(const std::string &name);

inline std::ostream &operator<<(std::ostream &os, NpcActivity activity) {
  return os << npcActivityName(activity);
}

/**
 * @brief NPC entity with needs and a daily routine
 *
 * Every update first applies need drift (energy, hunger, mood), then lets
 * urgent needs preempt the current activity (exhaustion forces sleep,
 * starvation forces eating). Only when nothing is urgent does the current
 * activity run its own transition rules.
 */
class LivingNPC : public Entity {
public:
  static constexpr size_t MEMORY_CAPACITY = 20;
  static constexpr double MAX_NEED = 100.0;

  LivingNPC(std::string id, NpcRecord record,
            std::optional<std::string> locationId, int gold);

  void update(double deltaMinutes, World &world) override;

  JsonValue serialize() const override;
  bool deserialize(const JsonValue &json) override;

  /**
   * @brief Starts travelling towards a location
   *
   * No-op when already there. Publishes npc_started_traveling.
   */
  void moveToLocation(const std::string &locationId, EventManager &events);

  // Publishes npc_started_working
  void startWorking(EventManager &events);
  void startSleeping() { setActivity(NpcActivity::Sleeping); }
  void startEating() { setActivity(NpcActivity::Eating); }
  // Mood +5
  void startSocializing();

  void addMemory(std::string memory);
  std::vector<std::string> getMemories() const {
    return std::vector<std::string>(m_memory.begin(), m_memory.end());
  }

  // First profession, or "wanderer" without one
  std::string getProfession() const;
  bool shouldWork() const;
  bool canCraft() const;

  const NpcRecord &getRecord() const { return m_record; }
  const std::string &getName() const { return m_record.name; }

  const std::optional<std::string> &getLocationId() const { return m_locationId; }
  void setLocationId(std::optional<std::string> id) { m_locationId = std::move(id); }
  const std::optional<std::string> &getDestinationId() const { return m_destinationId; }
  double getTravelProgress() const { return m_travelProgress; }

  NpcActivity getActivity() const { return m_activity; }
  void setActivity(NpcActivity activity);
  double getActivityMinutes() const { return m_activityMinutes; }

  double getEnergy() const { return m_energy; }
  double getHunger() const { return m_hunger; }
  double getMood() const { return m_mood; }
  void setEnergy(double energy);
  void setHunger(double hunger);
  void setMood(double mood);

  int getGold() const { return m_gold; }
  void setGold(int gold) { m_gold = gold; }

  const std::vector<Item> &getInventory() const { return m_inventory; }
  void addItem(Item item) { m_inventory.push_back(std::move(item)); }

  int getWorkStartHour() const { return m_workStartHour; }
  int getWorkEndHour() const { return m_workEndHour; }
  const std::optional<std::string> &getWorkLocationId() const {
    return m_workLocationId;
  }

private:
  void updateNeeds(double deltaMinutes);
  // True when an urgent need replaced the activity this tick
  bool handleUrgentNeeds();

  void updateIdle(World &world);
  void updateWorking(double deltaMinutes, World &world);
  void updateTraveling(double deltaMinutes, World &world);
  void updateEating();
  void updateSleeping(World &world);
  void updateSocializing();

  bool isWorkHour(int hour) const {
    return hour >= m_workStartHour && hour < m_workEndHour;
  }
  void tryCraft(double deltaMinutes, World &world);

  NpcRecord m_record;

  std::optional<std::string> m_locationId;
  std::optional<std::string> m_destinationId;
  double m_travelProgress{0.0};

  NpcActivity m_activity{NpcActivity::Idle};
  double m_activityMinutes{0.0};

  double m_energy{MAX_NEED};
  double m_hunger{0.0};
  double m_mood{50.0};
  int m_gold{0};

  std::vector<Item> m_inventory;
  boost::circular_buffer<std::string> m_memory{MEMORY_CAPACITY};

  int m_workStartHour{8};
  int m_workEndHour{17};
  std::optional<std::string> m_workLocationId;
};

} // namespace Realmforge

#endif // LIVING_NPC_HPP
