/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef TEMPLATE_MANAGER_HPP
#define TEMPLATE_MANAGER_HPP

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace Realmforge {

class JsonValue;

struct IntRange {
  int min{0};
  int max{0};
};

/**
 * @brief Ordered, weighted tier (quality or rarity)
 *
 * Position in its pool defines rank for constraint comparisons; the
 * multiplier only scales item value.
 */
struct Tier {
  std::string name;
  double weight{1.0};
  double multiplier{1.0};
};

struct StatRange {
  std::string name;
  int min{0};
  int max{0};
};

struct AttributePools {
  std::vector<Tier> qualities;
  std::vector<Tier> rarities;
  std::vector<std::string> materials;
  std::vector<StatRange> stats;
  std::vector<std::string> damageTypes;
  std::vector<std::string> tactileAdjectives;
  std::vector<std::string> visualAdjectives;
  std::vector<std::string> npcTraits;
  std::vector<std::string> environmentTags;
};

struct ItemTemplate {
  std::string name;
  double weight{1.0};
  std::string type;
  std::string subtype;
  std::vector<std::string> baseNames;
  bool hasQuality{false};
  bool hasRarity{false};
  bool hasMaterial{false};
  IntRange statCount;
  IntRange valueRange;
  std::optional<IntRange> damageTypeCount;
  std::vector<std::string> descriptionTemplates;
  bool consumable{false};
  bool singleUse{false};
  bool providesDefense{false};
};

struct ItemSet {
  std::string name;
  std::vector<std::string> templates;
};

struct Profession {
  std::string name;
  double weight{1.0};
  std::string title;
  std::map<std::string, int> baseStats;
  std::vector<std::string> skills;
  std::vector<std::string> dialogue;
  std::vector<std::string> races;
  std::vector<std::string> factions;
  std::optional<std::string> itemSet;
  std::vector<std::string> descriptionTemplates;
};

// Profile used for NPCs generated without any profession
struct GenericNpcProfile {
  std::string title{"Commoner"};
  std::map<std::string, int> baseStats;
  std::vector<std::string> skills;
  std::vector<std::string> dialogue;
  std::vector<std::string> descriptionTemplates;
};

struct Race {
  std::string name;
  double weight{1.0};
  std::map<std::string, int> statModifiers;
  std::vector<std::string> firstNames;
  std::vector<std::string> lastNames;
};

struct Faction {
  std::string name;
  double weight{1.0};
  std::string displayName;
};

struct LocationTemplate {
  std::string name;
  double weight{1.0};
  std::string displayName;
  std::string type;
  std::vector<std::string> suitableBiomes;
  std::vector<std::string> baseEnvironmentTags;
  IntRange additionalTagCount;
  std::vector<std::string> descriptionTemplates;
  IntRange npcSpawnCount;
  std::vector<std::string> spawnableProfessions;
  IntRange itemSpawnCount;
  std::vector<std::string> spawnableItems;
  std::vector<std::string> canConnectTo;
};

struct Biome {
  std::string name;
  double weight{1.0};
  std::string displayName;
  double temperatureOffset{0.0};
  // Multipliers applied to the season's weather probabilities, by weather name
  std::map<std::string, double> weatherWeights;
};

/**
 * @brief Read-only store of every generation table
 *
 * Tables are loaded from JSON (see res/data) into typed templates that keep
 * the declared order of each table. Every load function returns false and
 * logs through TEMPLATE_ERROR on malformed input, leaving previously loaded
 * tables of that category untouched. Lookups by name throw LookupError.
 */
class TemplateManager {
public:
  TemplateManager() = default;

  /**
   * @brief Loads attributes, items, professions, races, factions, locations
   * and biomes from <directory>/<category>.json
   * @return true only if every file loaded
   */
  bool loadFromDirectory(const std::string &directory);

  bool loadAttributesFromJsonString(const std::string &json);
  bool loadItemsFromJsonString(const std::string &json);
  bool loadProfessionsFromJsonString(const std::string &json);
  bool loadRacesFromJsonString(const std::string &json);
  bool loadFactionsFromJsonString(const std::string &json);
  bool loadLocationsFromJsonString(const std::string &json);
  bool loadBiomesFromJsonString(const std::string &json);

  // True once every category has at least its mandatory entries
  bool isComplete() const;

  const AttributePools &getAttributes() const { return m_attributes; }

  const std::vector<ItemTemplate> &getItemTemplates() const {
    return m_itemTemplates;
  }
  const ItemTemplate &getItemTemplate(const std::string &name) const;
  bool hasItemTemplate(const std::string &name) const;

  const ItemSet &getItemSet(const std::string &name) const;
  bool hasItemSet(const std::string &name) const;

  const std::vector<Profession> &getProfessions() const {
    return m_professions;
  }
  const Profession &getProfession(const std::string &name) const;
  bool hasProfession(const std::string &name) const;
  const GenericNpcProfile &getGenericProfile() const { return m_generic; }

  const std::vector<Race> &getRaces() const { return m_races; }
  const Race &getRace(const std::string &name) const;
  bool hasRace(const std::string &name) const;

  const std::vector<Faction> &getFactions() const { return m_factions; }
  const Faction &getFaction(const std::string &name) const;
  bool hasFaction(const std::string &name) const;

  const std::vector<LocationTemplate> &getLocationTemplates() const {
    return m_locationTemplates;
  }
  const LocationTemplate &getLocationTemplate(const std::string &name) const;
  bool hasLocationTemplate(const std::string &name) const;

  const std::vector<Biome> &getBiomes() const { return m_biomes; }
  const Biome &getBiome(const std::string &name) const;
  bool hasBiome(const std::string &name) const;

  // Ordinal position of a tier in its pool; throws LookupError
  size_t qualityRank(const std::string &name) const;
  size_t rarityRank(const std::string &name) const;
  const Tier &getQuality(const std::string &name) const;
  const Tier &getRarity(const std::string &name) const;
  const StatRange &getStat(const std::string &name) const;

private:
  bool parseRoot(const std::string &json, const char *category,
                 JsonValue &root) const;

  AttributePools m_attributes;
  std::vector<ItemTemplate> m_itemTemplates;
  std::unordered_map<std::string, size_t> m_itemTemplateIndex;
  std::vector<ItemSet> m_itemSets;
  std::unordered_map<std::string, size_t> m_itemSetIndex;
  std::vector<Profession> m_professions;
  std::unordered_map<std::string, size_t> m_professionIndex;
  GenericNpcProfile m_generic;
  std::vector<Race> m_races;
  std::unordered_map<std::string, size_t> m_raceIndex;
  std::vector<Faction> m_factions;
  std::unordered_map<std::string, size_t> m_factionIndex;
  std::vector<LocationTemplate> m_locationTemplates;
  std::unordered_map<std::string, size_t> m_locationTemplateIndex;
  std::vector<Biome> m_biomes;
  std::unordered_map<std::string, size_t> m_biomeIndex;
};

} // namespace Realmforge

#endif // TEMPLATE_MANAGER_HPP
