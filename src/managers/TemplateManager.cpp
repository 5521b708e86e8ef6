/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/TemplateManager.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"

#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace Realmforge {

namespace {

// Parse failures inside one table are thrown as TableError and turned into a
// logged false return by the public load function.
class TableError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

const JsonObject &requireObject(const JsonValue &value,
                                const std::string &what) {
  if (!value.isObject()) {
    throw TableError(std::format("'{}' must be an object", what));
  }
  return value.asObject();
}

std::vector<std::string> readStringList(const JsonValue &value,
                                        const std::string &what) {
  std::vector<std::string> result;
  if (value.isNull()) {
    return result;
  }
  if (!value.isArray()) {
    throw TableError(std::format("'{}' must be an array of strings", what));
  }
  for (const auto &element : value.asArray()) {
    if (!element.isString()) {
      throw TableError(std::format("'{}' contains a non-string entry", what));
    }
    result.push_back(element.asString());
  }
  return result;
}

double readWeight(const JsonValue &owner, const std::string &what) {
  const JsonValue &weight = owner["weight"];
  if (weight.isNull()) {
    return 1.0;
  }
  if (!weight.isNumber() || weight.asNumber() < 0.0) {
    throw TableError(std::format("'{}' weight must be a non-negative number",
                                 what));
  }
  return weight.asNumber();
}

IntRange readRange(const JsonValue &value, const std::string &what,
                   IntRange fallback) {
  if (value.isNull()) {
    return fallback;
  }
  if (value.isNumber()) {
    const auto single = value.tryAsInt();
    if (!single) {
      throw TableError(std::format("'{}' is out of integer range", what));
    }
    return IntRange{*single, *single};
  }
  requireObject(value, what);
  const auto min = value["min"].tryAsInt();
  const auto max = value["max"].tryAsInt();
  if (!min || !max) {
    throw TableError(std::format("'{}' needs integral min and max", what));
  }
  IntRange range{*min, *max};
  if (range.max < range.min) {
    throw TableError(std::format("'{}' has max < min", what));
  }
  return range;
}

std::map<std::string, int> readIntMap(const JsonValue &value,
                                      const std::string &what) {
  std::map<std::string, int> result;
  if (value.isNull()) {
    return result;
  }
  for (const auto &[key, entry] : requireObject(value, what)) {
    const auto number = entry.tryAsInt();
    if (!number) {
      throw TableError(std::format("'{}.{}' must be an integer", what, key));
    }
    result[key] = *number;
  }
  return result;
}

std::string readString(const JsonValue &owner, const std::string &key,
                       const std::string &fallback) {
  const JsonValue &value = owner[key];
  if (value.isNull()) {
    return fallback;
  }
  if (!value.isString()) {
    throw TableError(std::format("'{}' must be a string", key));
  }
  return value.asString();
}

bool readBool(const JsonValue &owner, const std::string &key) {
  const JsonValue &value = owner[key];
  return value.isBool() && value.asBool();
}

// Accepts {"Name": {"weight": w, "multiplier": m}} or ["Name", ...]
std::vector<Tier> readTiers(const JsonValue &value, const std::string &what) {
  std::vector<Tier> tiers;
  if (value.isArray()) {
    for (const auto &name : readStringList(value, what)) {
      tiers.push_back(Tier{name, 1.0, 1.0});
    }
  } else {
    for (const auto &[name, entry] : requireObject(value, what)) {
      Tier tier;
      tier.name = name;
      tier.weight = readWeight(entry, what + "." + name);
      const JsonValue &multiplier = entry["multiplier"];
      if (!multiplier.isNull()) {
        if (!multiplier.isNumber()) {
          throw TableError(std::format("'{}.{}' multiplier must be a number",
                                       what, name));
        }
        tier.multiplier = multiplier.asNumber();
      }
      tiers.push_back(std::move(tier));
    }
  }
  if (tiers.empty()) {
    throw TableError(std::format("'{}' must not be empty", what));
  }
  return tiers;
}

template <typename T>
const T &lookup(const std::vector<T> &items,
                const std::unordered_map<std::string, size_t> &index,
                const char *kind, const std::string &name) {
  auto it = index.find(name);
  if (it == index.end()) {
    throw LookupError(kind, name);
  }
  return items[it->second];
}

template <typename T>
std::unordered_map<std::string, size_t> buildIndex(const std::vector<T> &items) {
  std::unordered_map<std::string, size_t> index;
  for (size_t i = 0; i < items.size(); ++i) {
    index[items[i].name] = i;
  }
  return index;
}

std::optional<std::string> readFile(const std::filesystem::path &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return std::nullopt;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

} // namespace

bool TemplateManager::parseRoot(const std::string &json, const char *category,
                                JsonValue &root) const {
  JsonReader reader;
  if (!reader.parse(json)) {
    TEMPLATE_ERROR(std::format(
        "TemplateManager::load{} - Failed to parse JSON: {}", category,
        reader.getLastError()));
    return false;
  }
  if (!reader.getRoot().isObject()) {
    TEMPLATE_ERROR(std::format(
        "TemplateManager::load{} - Root JSON is not an object", category));
    return false;
  }
  root = reader.getRoot();
  return true;
}

bool TemplateManager::loadFromDirectory(const std::string &directory) {
  namespace fs = std::filesystem;

  struct Category {
    const char *file;
    bool (TemplateManager::*load)(const std::string &);
  };
  const Category categories[] = {
      {"attributes.json", &TemplateManager::loadAttributesFromJsonString},
      {"items.json", &TemplateManager::loadItemsFromJsonString},
      {"professions.json", &TemplateManager::loadProfessionsFromJsonString},
      {"races.json", &TemplateManager::loadRacesFromJsonString},
      {"factions.json", &TemplateManager::loadFactionsFromJsonString},
      {"locations.json", &TemplateManager::loadLocationsFromJsonString},
      {"biomes.json", &TemplateManager::loadBiomesFromJsonString},
  };

  bool allLoaded = true;
  for (const auto &category : categories) {
    const fs::path path = fs::path(directory) / category.file;
    auto contents = readFile(path);
    if (!contents) {
      TEMPLATE_ERROR("TemplateManager::loadFromDirectory - Could not open " +
                     path.string());
      allLoaded = false;
      continue;
    }
    if (!(this->*category.load)(*contents)) {
      TEMPLATE_ERROR("TemplateManager::loadFromDirectory - Invalid table in " +
                     path.string());
      allLoaded = false;
    }
  }

  if (allLoaded) {
    TEMPLATE_INFO(std::format(
        "Loaded {} item templates, {} professions, {} races, {} location "
        "templates, {} biomes from {}",
        m_itemTemplates.size(), m_professions.size(), m_races.size(),
        m_locationTemplates.size(), m_biomes.size(), directory));
  }
  return allLoaded;
}

bool TemplateManager::loadAttributesFromJsonString(const std::string &json) {
  JsonValue root;
  if (!parseRoot(json, "AttributesFromJsonString", root)) {
    return false;
  }

  try {
    AttributePools pools;
    pools.qualities = readTiers(root["quality"], "quality");
    pools.rarities = readTiers(root["rarity"], "rarity");
    pools.materials = readStringList(root["materials"], "materials");
    for (const auto &[name, range] : requireObject(root["stats"], "stats")) {
      IntRange r = readRange(range, "stats." + name, IntRange{});
      pools.stats.push_back(StatRange{name, r.min, r.max});
    }
    pools.damageTypes = readStringList(root["damage_types"], "damage_types");
    pools.tactileAdjectives =
        readStringList(root["tactile_adjectives"], "tactile_adjectives");
    pools.visualAdjectives =
        readStringList(root["visual_adjectives"], "visual_adjectives");
    pools.npcTraits = readStringList(root["npc_traits"], "npc_traits");
    pools.environmentTags =
        readStringList(root["environment_tags"], "environment_tags");

    m_attributes = std::move(pools);
  } catch (const TableError &e) {
    TEMPLATE_ERROR(std::string("TemplateManager::loadAttributesFromJsonString - ") +
                   e.what());
    return false;
  }

  TEMPLATE_DEBUG(std::format("Loaded {} quality tiers, {} rarity tiers, {} stats",
                             m_attributes.qualities.size(),
                             m_attributes.rarities.size(),
                             m_attributes.stats.size()));
  return true;
}

bool TemplateManager::loadItemsFromJsonString(const std::string &json) {
  JsonValue root;
  if (!parseRoot(json, "ItemsFromJsonString", root)) {
    return false;
  }

  try {
    std::vector<ItemTemplate> templates;
    for (const auto &[name, entry] :
         requireObject(root["templates"], "templates")) {
      ItemTemplate tpl;
      tpl.name = name;
      tpl.weight = readWeight(entry, name);
      tpl.type = readString(entry, "type", "misc");
      tpl.subtype = readString(entry, "subtype", tpl.type);
      tpl.baseNames = readStringList(entry["base_names"], name + ".base_names");
      if (tpl.baseNames.empty()) {
        throw TableError(std::format("item template '{}' has no base_names",
                                     name));
      }
      tpl.hasQuality = readBool(entry, "has_quality");
      tpl.hasRarity = readBool(entry, "has_rarity");
      tpl.hasMaterial = readBool(entry, "has_material");
      tpl.statCount = readRange(entry["stat_count"], name + ".stat_count",
                                IntRange{0, 0});
      tpl.valueRange = readRange(entry["value_range"], name + ".value_range",
                                 IntRange{1, 1});
      if (tpl.valueRange.min < 0) {
        throw TableError(std::format("item template '{}' has a negative value",
                                     name));
      }
      if (!entry["damage_type_count"].isNull()) {
        tpl.damageTypeCount = readRange(entry["damage_type_count"],
                                        name + ".damage_type_count", {});
      }
      tpl.descriptionTemplates = readStringList(
          entry["description_templates"], name + ".description_templates");
      tpl.consumable = readBool(entry, "consumable");
      tpl.singleUse = readBool(entry, "single_use");
      tpl.providesDefense = readBool(entry, "provides_defense");
      templates.push_back(std::move(tpl));
    }
    if (templates.empty()) {
      throw TableError("'templates' must not be empty");
    }

    std::vector<ItemSet> sets;
    if (!root["item_sets"].isNull()) {
      for (const auto &[name, entry] :
           requireObject(root["item_sets"], "item_sets")) {
        ItemSet set{name, readStringList(entry, "item_sets." + name)};
        if (set.templates.empty()) {
          throw TableError(std::format("item set '{}' is empty", name));
        }
        sets.push_back(std::move(set));
      }
    }

    m_itemTemplates = std::move(templates);
    m_itemTemplateIndex = buildIndex(m_itemTemplates);
    m_itemSets = std::move(sets);
    m_itemSetIndex = buildIndex(m_itemSets);
  } catch (const TableError &e) {
    TEMPLATE_ERROR(std::string("TemplateManager::loadItemsFromJsonString - ") +
                   e.what());
    return false;
  }

  TEMPLATE_DEBUG(std::format("Loaded {} item templates and {} item sets",
                             m_itemTemplates.size(), m_itemSets.size()));
  return true;
}

bool TemplateManager::loadProfessionsFromJsonString(const std::string &json) {
  JsonValue root;
  if (!parseRoot(json, "ProfessionsFromJsonString", root)) {
    return false;
  }

  try {
    std::vector<Profession> professions;
    for (const auto &[name, entry] :
         requireObject(root["professions"], "professions")) {
      Profession prof;
      prof.name = name;
      prof.weight = readWeight(entry, name);
      prof.title = readString(entry, "title", name);
      prof.baseStats = readIntMap(entry["base_stats"], name + ".base_stats");
      prof.skills = readStringList(entry["skills"], name + ".skills");
      prof.dialogue = readStringList(entry["dialogue"], name + ".dialogue");
      prof.races = readStringList(entry["races"], name + ".races");
      prof.factions = readStringList(entry["factions"], name + ".factions");
      if (!entry["item_set"].isNull()) {
        prof.itemSet = readString(entry, "item_set", "");
      }
      prof.descriptionTemplates = readStringList(
          entry["description_templates"], name + ".description_templates");
      professions.push_back(std::move(prof));
    }

    GenericNpcProfile generic;
    const JsonValue &genericJson = root["generic"];
    if (!genericJson.isNull()) {
      requireObject(genericJson, "generic");
      generic.title = readString(genericJson, "title", generic.title);
      generic.baseStats =
          readIntMap(genericJson["base_stats"], "generic.base_stats");
      generic.skills = readStringList(genericJson["skills"], "generic.skills");
      generic.dialogue =
          readStringList(genericJson["dialogue"], "generic.dialogue");
      generic.descriptionTemplates = readStringList(
          genericJson["description_templates"], "generic.description_templates");
    }

    m_professions = std::move(professions);
    m_professionIndex = buildIndex(m_professions);
    m_generic = std::move(generic);
  } catch (const TableError &e) {
    TEMPLATE_ERROR(
        std::string("TemplateManager::loadProfessionsFromJsonString - ") +
        e.what());
    return false;
  }

  TEMPLATE_DEBUG(std::format("Loaded {} professions", m_professions.size()));
  return true;
}

bool TemplateManager::loadRacesFromJsonString(const std::string &json) {
  JsonValue root;
  if (!parseRoot(json, "RacesFromJsonString", root)) {
    return false;
  }

  try {
    std::vector<Race> races;
    for (const auto &[name, entry] : requireObject(root["races"], "races")) {
      Race race;
      race.name = name;
      race.weight = readWeight(entry, name);
      race.statModifiers =
          readIntMap(entry["stat_modifiers"], name + ".stat_modifiers");
      race.firstNames =
          readStringList(entry["first_names"], name + ".first_names");
      race.lastNames = readStringList(entry["last_names"], name + ".last_names");
      if (race.firstNames.empty()) {
        throw TableError(std::format("race '{}' has no first_names", name));
      }
      races.push_back(std::move(race));
    }
    if (races.empty()) {
      throw TableError("'races' must not be empty");
    }

    m_races = std::move(races);
    m_raceIndex = buildIndex(m_races);
  } catch (const TableError &e) {
    TEMPLATE_ERROR(std::string("TemplateManager::loadRacesFromJsonString - ") +
                   e.what());
    return false;
  }
  return true;
}

bool TemplateManager::loadFactionsFromJsonString(const std::string &json) {
  JsonValue root;
  if (!parseRoot(json, "FactionsFromJsonString", root)) {
    return false;
  }

  try {
    std::vector<Faction> factions;
    for (const auto &[name, entry] :
         requireObject(root["factions"], "factions")) {
      Faction faction;
      faction.name = name;
      faction.weight = readWeight(entry, name);
      faction.displayName = readString(entry, "name", name);
      factions.push_back(std::move(faction));
    }

    m_factions = std::move(factions);
    m_factionIndex = buildIndex(m_factions);
  } catch (const TableError &e) {
    TEMPLATE_ERROR(
        std::string("TemplateManager::loadFactionsFromJsonString - ") +
        e.what());
    return false;
  }
  return true;
}

bool TemplateManager::loadLocationsFromJsonString(const std::string &json) {
  JsonValue root;
  if (!parseRoot(json, "LocationsFromJsonString", root)) {
    return false;
  }

  try {
    std::vector<LocationTemplate> templates;
    for (const auto &[name, entry] :
         requireObject(root["templates"], "templates")) {
      LocationTemplate tpl;
      tpl.name = name;
      tpl.weight = readWeight(entry, name);
      tpl.displayName = readString(entry, "name", name);
      tpl.type = readString(entry, "type", "wilderness");
      tpl.suitableBiomes =
          readStringList(entry["suitable_biomes"], name + ".suitable_biomes");
      tpl.baseEnvironmentTags = readStringList(
          entry["base_environment_tags"], name + ".base_environment_tags");
      tpl.additionalTagCount = readRange(entry["additional_tags_count"],
                                         name + ".additional_tags_count", {});
      tpl.descriptionTemplates = readStringList(
          entry["description_templates"], name + ".description_templates");
      tpl.npcSpawnCount =
          readRange(entry["npc_spawn_count"], name + ".npc_spawn_count", {});
      tpl.spawnableProfessions = readStringList(
          entry["spawnable_npcs"], name + ".spawnable_npcs");
      tpl.itemSpawnCount =
          readRange(entry["item_spawn_count"], name + ".item_spawn_count", {});
      tpl.spawnableItems =
          readStringList(entry["spawnable_items"], name + ".spawnable_items");
      tpl.canConnectTo =
          readStringList(entry["can_connect_to"], name + ".can_connect_to");
      templates.push_back(std::move(tpl));
    }
    if (templates.empty()) {
      throw TableError("'templates' must not be empty");
    }

    m_locationTemplates = std::move(templates);
    m_locationTemplateIndex = buildIndex(m_locationTemplates);
  } catch (const TableError &e) {
    TEMPLATE_ERROR(
        std::string("TemplateManager::loadLocationsFromJsonString - ") +
        e.what());
    return false;
  }
  return true;
}

bool TemplateManager::loadBiomesFromJsonString(const std::string &json) {
  JsonValue root;
  if (!parseRoot(json, "BiomesFromJsonString", root)) {
    return false;
  }

  try {
    std::vector<Biome> biomes;
    for (const auto &[name, entry] : requireObject(root["biomes"], "biomes")) {
      Biome biome;
      biome.name = name;
      biome.weight = readWeight(entry, name);
      biome.displayName = readString(entry, "name", name);
      const JsonValue &offset = entry["temperature_offset"];
      if (offset.isNumber()) {
        biome.temperatureOffset = offset.asNumber();
      }
      if (!entry["weather_weights"].isNull()) {
        for (const auto &[weather, factor] : requireObject(
                 entry["weather_weights"], name + ".weather_weights")) {
          if (!factor.isNumber() || factor.asNumber() < 0.0) {
            throw TableError(std::format(
                "'{}.weather_weights.{}' must be a non-negative number", name,
                weather));
          }
          biome.weatherWeights[weather] = factor.asNumber();
        }
      }
      biomes.push_back(std::move(biome));
    }

    m_biomes = std::move(biomes);
    m_biomeIndex = buildIndex(m_biomes);
  } catch (const TableError &e) {
    TEMPLATE_ERROR(std::string("TemplateManager::loadBiomesFromJsonString - ") +
                   e.what());
    return false;
  }
  return true;
}

bool TemplateManager::isComplete() const {
  return !m_attributes.qualities.empty() && !m_attributes.rarities.empty() &&
         !m_itemTemplates.empty() && !m_races.empty() &&
         !m_locationTemplates.empty();
}

const ItemTemplate &
TemplateManager::getItemTemplate(const std::string &name) const {
  return lookup(m_itemTemplates, m_itemTemplateIndex, "item template", name);
}

bool TemplateManager::hasItemTemplate(const std::string &name) const {
  return m_itemTemplateIndex.count(name) > 0;
}

const ItemSet &TemplateManager::getItemSet(const std::string &name) const {
  return lookup(m_itemSets, m_itemSetIndex, "item set", name);
}

bool TemplateManager::hasItemSet(const std::string &name) const {
  return m_itemSetIndex.count(name) > 0;
}

const Profession &
TemplateManager::getProfession(const std::string &name) const {
  return lookup(m_professions, m_professionIndex, "profession", name);
}

bool TemplateManager::hasProfession(const std::string &name) const {
  return m_professionIndex.count(name) > 0;
}

const Race &TemplateManager::getRace(const std::string &name) const {
  return lookup(m_races, m_raceIndex, "race", name);
}

bool TemplateManager::hasRace(const std::string &name) const {
  return m_raceIndex.count(name) > 0;
}

const Faction &TemplateManager::getFaction(const std::string &name) const {
  return lookup(m_factions, m_factionIndex, "faction", name);
}

bool TemplateManager::hasFaction(const std::string &name) const {
  return m_factionIndex.count(name) > 0;
}

const LocationTemplate &
TemplateManager::getLocationTemplate(const std::string &name) const {
  return lookup(m_locationTemplates, m_locationTemplateIndex,
                "location template", name);
}

bool TemplateManager::hasLocationTemplate(const std::string &name) const {
  return m_locationTemplateIndex.count(name) > 0;
}

const Biome &TemplateManager::getBiome(const std::string &name) const {
  return lookup(m_biomes, m_biomeIndex, "biome", name);
}

bool TemplateManager::hasBiome(const std::string &name) const {
  return m_biomeIndex.count(name) > 0;
}

size_t TemplateManager::qualityRank(const std::string &name) const {
  const auto &tiers = m_attributes.qualities;
  for (size_t i = 0; i < tiers.size(); ++i) {
    if (tiers[i].name == name) {
      return i;
    }
  }
  throw LookupError("quality", name);
}

size_t TemplateManager::rarityRank(const std::string &name) const {
  const auto &tiers = m_attributes.rarities;
  for (size_t i = 0; i < tiers.size(); ++i) {
    if (tiers[i].name == name) {
      return i;
    }
  }
  throw LookupError("rarity", name);
}

const Tier &TemplateManager::getQuality(const std::string &name) const {
  return m_attributes.qualities[qualityRank(name)];
}

const Tier &TemplateManager::getRarity(const std::string &name) const {
  return m_attributes.rarities[rarityRank(name)];
}

const StatRange &TemplateManager::getStat(const std::string &name) const {
  for (const auto &stat : m_attributes.stats) {
    if (stat.name == name) {
      return stat;
    }
  }
  throw LookupError("stat", name);
}

} // namespace Realmforge
