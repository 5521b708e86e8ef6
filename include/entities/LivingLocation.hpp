/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LIVING_LOCATION_HPP
#define LIVING_LOCATION_HPP

#include "entities/Entity.hpp"
#include "world/GeneratedContent.hpp"
#include "world/Weather.hpp"

#include <boost/container/flat_set.hpp>
#include <optional>
#include <string>

namespace Realmforge {

class EventManager;

/**
 * @brief Location entity tracking who and what is present
 *
 * Weather and the market flag are caches recomputed from World time; the
 * wrapped LocationRecord is never modified.
 */
class LivingLocation : public Entity {
public:
  using IdSet = boost::container::flat_set<std::string>;

  explicit LivingLocation(LocationRecord record);

  /**
   * @brief Resamples weather on the hour and refreshes market hours
   *
   * Weather is rolled when none is set yet or when the accumulated update
   * time crosses an hour mark. weather_changed fires only when the condition
   * differs from the previous one; market_opened and market_closed fire only
   * on a change, and only for building and market locations.
   */
  void update(double deltaMinutes, World &world) override;

  JsonValue serialize() const override;
  bool deserialize(const JsonValue &json) override;

  // Publishes npc_entered_location (deferred)
  void addNpc(const std::string &npcId, EventManager &events);
  // Publishes npc_exited_location (deferred); false if the NPC was not here
  bool removeNpc(const std::string &npcId, EventManager &events);
  bool hasNpc(const std::string &npcId) const { return m_npcIds.count(npcId) > 0; }

  void addItem(const std::string &itemId) { m_itemIds.insert(itemId); }
  bool removeItem(const std::string &itemId) { return m_itemIds.erase(itemId) > 0; }

  const IdSet &getNpcIds() const { return m_npcIds; }
  const IdSet &getItemIds() const { return m_itemIds; }
  size_t getNpcCount() const { return m_npcIds.size(); }

  const LocationRecord &getRecord() const { return m_record; }
  const std::string &getName() const { return m_record.name; }
  const std::string &getType() const { return m_record.type; }
  const std::string &getBiome() const { return m_record.biome; }
  const std::map<std::string, std::string> &getConnections() const {
    return m_record.connections;
  }

  const std::optional<WeatherSnapshot> &getWeather() const { return m_weather; }
  bool isMarketOpen() const { return m_marketOpen; }
  bool hasMarket() const;
  double getLastSpawnCheck() const { return m_lastSpawnCheck; }

private:
  void updateWeather(double deltaMinutes, World &world);
  void updateMarket(World &world);

  LocationRecord m_record;
  IdSet m_npcIds;
  IdSet m_itemIds;
  std::optional<WeatherSnapshot> m_weather;
  bool m_marketOpen{false};
  double m_lastSpawnCheck{0.0};
};

} // namespace Realmforge

#endif // LIVING_LOCATION_HPP
