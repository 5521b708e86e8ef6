/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/ContentGenerator.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "managers/TemplateManager.hpp"
#include "utils/TextTemplate.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <stdexcept>

namespace Realmforge {

namespace {

constexpr int kMaxIdAttempts = 1000;
constexpr double kReuseProbability = 0.5;

template <typename T> std::vector<double> weightsOf(const std::vector<T> &items) {
  std::vector<double> weights;
  weights.reserve(items.size());
  for (const auto &item : items) {
    weights.push_back(item.weight);
  }
  return weights;
}

// Appends values not already present, keeping first-seen order
void appendUnique(std::vector<std::string> &target,
                  const std::vector<std::string> &values) {
  for (const auto &value : values) {
    if (std::find(target.begin(), target.end(), value) == target.end()) {
      target.push_back(value);
    }
  }
}

bool contains(const std::vector<std::string> &values, const std::string &value) {
  return std::find(values.begin(), values.end(), value) != values.end();
}

} // namespace

ContentGenerator::ContentGenerator(
    std::shared_ptr<const TemplateManager> templates, uint64_t seed)
    : m_templates(std::move(templates)), m_random(seed) {
  if (!m_templates) {
    throw std::invalid_argument("ContentGenerator requires a template store");
  }
  GENERATOR_INFO(std::format("Content generator created with seed {}", seed));
}

void ContentGenerator::reseed(uint64_t seed) {
  m_random.reseed(seed);
  GENERATOR_DEBUG(std::format("Reseeded generator with {}", seed));
}

// ---------------------------------------------------------------------------
// Items
// ---------------------------------------------------------------------------

const ItemTemplate &ContentGenerator::pickItemTemplate() {
  const auto &templates = m_templates->getItemTemplates();
  if (templates.empty()) {
    throw LookupError("item template", "<any>");
  }
  return templates[m_random.weightedIndex(weightsOf(templates))];
}

std::map<std::string, int> ContentGenerator::rollStats(int count) {
  std::map<std::string, int> stats;
  const auto &pool = m_templates->getAttributes().stats;
  if (count <= 0 || pool.empty()) {
    return stats;
  }
  for (const StatRange &range :
       m_random.sample(pool, static_cast<size_t>(count))) {
    const int value = m_random.uniformInt(range.min, range.max);
    if (value != 0) {
      stats[range.name] = value;
    }
  }
  return stats;
}

Item ContentGenerator::rollItem(const ItemTemplate &tmpl) {
  const AttributePools &attributes = m_templates->getAttributes();

  Item item;
  item.type = tmpl.type;
  item.subtype = tmpl.subtype;
  item.templateName = tmpl.name;

  const std::string &baseName = m_random.choice(tmpl.baseNames);

  double qualityMultiplier = 1.0;
  double rarityMultiplier = 1.0;
  if (tmpl.hasQuality && !attributes.qualities.empty()) {
    const Tier &tier = attributes.qualities[m_random.weightedIndex(
        weightsOf(attributes.qualities))];
    item.quality = tier.name;
    qualityMultiplier = tier.multiplier;
  }
  if (tmpl.hasRarity && !attributes.rarities.empty()) {
    const Tier &tier = attributes.rarities[m_random.weightedIndex(
        weightsOf(attributes.rarities))];
    item.rarity = tier.name;
    rarityMultiplier = tier.multiplier;
  }
  if (tmpl.hasMaterial && !attributes.materials.empty()) {
    item.material = m_random.choice(attributes.materials);
  }

  item.stats =
      rollStats(m_random.uniformInt(tmpl.statCount.min, tmpl.statCount.max));

  const int baseValue =
      m_random.uniformInt(tmpl.valueRange.min, tmpl.valueRange.max);
  item.value = std::max(
      0, static_cast<int>(std::floor(baseValue * qualityMultiplier *
                                     rarityMultiplier)));

  std::string name;
  if (item.quality) {
    name = *item.quality + " ";
  }
  if (item.material) {
    name += capitalize(*item.material) + " ";
  }
  item.name = name + baseName;

  if (tmpl.damageTypeCount && !attributes.damageTypes.empty()) {
    const int count = m_random.uniformInt(tmpl.damageTypeCount->min,
                                          tmpl.damageTypeCount->max);
    if (count > 0) {
      item.damageTypes =
          m_random.sample(attributes.damageTypes, static_cast<size_t>(count));
    }
  }

  if (!tmpl.descriptionTemplates.empty()) {
    const std::string &text = m_random.choice(tmpl.descriptionTemplates);
    TemplateValues values{
        {"quality", item.quality ? toLower(*item.quality) : ""},
        {"rarity", item.rarity ? toLower(*item.rarity) : ""},
        {"material", item.material.value_or("")},
        {"base_name", toLower(baseName)},
    };
    if (!attributes.tactileAdjectives.empty()) {
      values["tactile_adjective"] = m_random.choice(attributes.tactileAdjectives);
    }
    if (!attributes.visualAdjectives.empty()) {
      values["visual_adjective"] = m_random.choice(attributes.visualAdjectives);
    }
    item.description = fillTemplate(text, values);
  }

  if (tmpl.consumable) {
    item.properties.emplace_back("consumable");
  }
  if (tmpl.singleUse) {
    item.properties.emplace_back("single_use");
  }
  if (tmpl.providesDefense) {
    item.properties.emplace_back("provides_defense");
  }
  return item;
}

ContentGenerator::ResolvedConstraints
ContentGenerator::resolveTiers(const ItemConstraints &constraints) const {
  ResolvedConstraints resolved;
  if (constraints.minQuality) {
    resolved.minQuality = m_templates->qualityRank(*constraints.minQuality);
  }
  if (constraints.maxQuality) {
    resolved.maxQuality = m_templates->qualityRank(*constraints.maxQuality);
  }
  if (constraints.minRarity) {
    resolved.minRarity = m_templates->rarityRank(*constraints.minRarity);
  }
  if (constraints.maxRarity) {
    resolved.maxRarity = m_templates->rarityRank(*constraints.maxRarity);
  }
  return resolved;
}

bool ContentGenerator::satisfies(const Item &item,
                                 const ItemConstraints &constraints,
                                 const ResolvedConstraints &tiers) const {
  if (tiers.minQuality || tiers.maxQuality) {
    if (!item.quality) {
      return false;
    }
    const size_t rank = m_templates->qualityRank(*item.quality);
    if ((tiers.minQuality && rank < *tiers.minQuality) ||
        (tiers.maxQuality && rank > *tiers.maxQuality)) {
      return false;
    }
  }

  if (tiers.minRarity || tiers.maxRarity) {
    if (!item.rarity) {
      return false;
    }
    const size_t rank = m_templates->rarityRank(*item.rarity);
    if ((tiers.minRarity && rank < *tiers.minRarity) ||
        (tiers.maxRarity && rank > *tiers.maxRarity)) {
      return false;
    }
  }

  if (constraints.minValue && item.value < *constraints.minValue) {
    return false;
  }
  if (constraints.maxValue && item.value > *constraints.maxValue) {
    return false;
  }

  if (item.material && contains(constraints.excludedMaterials, *item.material)) {
    return false;
  }
  return true;
}

void ContentGenerator::addRequiredStats(Item &item,
                                        const std::vector<std::string> &stats) {
  for (const auto &statName : stats) {
    if (item.stats.count(statName)) {
      continue;
    }
    const StatRange &range = m_templates->getStat(statName);
    int value = m_random.uniformInt(range.min, range.max);
    if (value == 0) {
      value = range.max != 0 ? range.max : range.min;
    }
    if (value != 0) {
      item.stats[statName] = value;
    }
  }
}

Item ContentGenerator::generateItem(const std::optional<std::string> &templateName,
                                    const ItemConstraints &constraints) {
  // Resolve every name before drawing so bad input fails fast
  const ItemTemplate *fixed =
      templateName ? &m_templates->getItemTemplate(*templateName) : nullptr;
  const ResolvedConstraints tiers = resolveTiers(constraints);
  for (const auto &statName : constraints.requiredStats) {
    m_templates->getStat(statName);
  }

  for (int attempt = 1; attempt <= MAX_ITEM_ATTEMPTS; ++attempt) {
    const ItemTemplate &tmpl = fixed ? *fixed : pickItemTemplate();
    Item item = rollItem(tmpl);
    if (satisfies(item, constraints, tiers)) {
      addRequiredStats(item, constraints.requiredStats);
      if (attempt > 1) {
        GENERATOR_DEBUG(std::format("Item '{}' accepted on attempt {}",
                                    item.name, attempt));
      }
      return item;
    }
  }

  GENERATOR_WARN(std::format("Item constraints unsatisfied after {} attempts",
                             MAX_ITEM_ATTEMPTS));
  throw GenerationExhausted(
      std::format("Item generation ({})", templateName.value_or("any template")),
      MAX_ITEM_ATTEMPTS);
}

std::vector<Item> ContentGenerator::generateItemsFromSet(const std::string &setName,
                                                         std::optional<int> count) {
  const ItemSet &set = m_templates->getItemSet(setName);
  const int total = count ? std::max(0, *count) : m_random.uniformInt(1, 5);

  std::vector<Item> items;
  items.reserve(static_cast<size_t>(total));
  for (int i = 0; i < total; ++i) {
    items.push_back(generateItem(m_random.choice(set.templates)));
  }
  return items;
}

// ---------------------------------------------------------------------------
// NPCs
// ---------------------------------------------------------------------------

std::string ContentGenerator::pickName(const Race &race) {
  std::string name = m_random.choice(race.firstNames);
  if (!race.lastNames.empty()) {
    name += " " + m_random.choice(race.lastNames);
  }
  return name;
}

std::string ContentGenerator::describeNpc(const std::vector<std::string> &templates,
                                          const NpcRecord &npc) {
  if (templates.empty()) {
    return {};
  }
  const AttributePools &attributes = m_templates->getAttributes();
  const std::string &text = m_random.choice(templates);

  TemplateValues values{
      {"name", npc.name},
      {"title", toLower(npc.title)},
      {"race", toLower(npc.race)},
  };
  if (npc.faction) {
    values["faction"] = m_templates->getFaction(*npc.faction).displayName;
  }
  if (!attributes.npcTraits.empty()) {
    values["trait"] = m_random.choice(attributes.npcTraits);
  }
  if (!attributes.tactileAdjectives.empty()) {
    values["tactile_adjective"] = m_random.choice(attributes.tactileAdjectives);
  }
  if (!attributes.visualAdjectives.empty()) {
    values["visual_adjective"] = m_random.choice(attributes.visualAdjectives);
  }
  return fillTemplate(text, values);
}

NpcRecord ContentGenerator::generateGenericNpc(
    const std::optional<std::string> &race,
    const std::optional<std::string> &faction) {
  const GenericNpcProfile &profile = m_templates->getGenericProfile();
  const auto &races = m_templates->getRaces();
  if (!race && races.empty()) {
    throw LookupError("race", "<any>");
  }
  const Race &chosenRace = race ? m_templates->getRace(*race)
                                : races[m_random.weightedIndex(weightsOf(races))];
  if (faction) {
    m_templates->getFaction(*faction);
  }

  NpcRecord npc;
  npc.race = chosenRace.name;
  npc.faction = faction;
  npc.name = pickName(chosenRace);
  npc.title = profile.title;

  for (const auto &[stat, base] : profile.baseStats) {
    auto modifier = chosenRace.statModifiers.find(stat);
    const int raw =
        base + (modifier != chosenRace.statModifiers.end() ? modifier->second : 0);
    npc.stats[stat] = std::max(1, raw + m_random.uniformInt(-2, 2));
  }

  npc.skills = profile.skills;
  if (!profile.dialogue.empty()) {
    npc.dialogue = m_random.choice(profile.dialogue);
  }
  npc.description = describeNpc(profile.descriptionTemplates, npc);
  return npc;
}

NpcRecord ContentGenerator::generateNpc(const std::vector<std::string> &professions,
                                        const std::optional<std::string> &race,
                                        const std::optional<std::string> &faction) {
  if (professions.empty()) {
    return generateGenericNpc(race, faction);
  }

  std::vector<const Profession *> profs;
  profs.reserve(professions.size());
  for (const auto &name : professions) {
    profs.push_back(&m_templates->getProfession(name));
  }

  // Race: pinned, else drawn from the union of the professions' pools
  const Race *chosenRace = nullptr;
  if (race) {
    chosenRace = &m_templates->getRace(*race);
  } else {
    std::vector<std::string> pool;
    for (const Profession *prof : profs) {
      appendUnique(pool, prof->races);
    }
    std::vector<const Race *> candidates;
    for (const auto &name : pool) {
      if (m_templates->hasRace(name)) {
        candidates.push_back(&m_templates->getRace(name));
      } else {
        GENERATOR_WARN(std::format("Profession lists unknown race '{}'", name));
      }
    }
    if (candidates.empty()) {
      const auto &races = m_templates->getRaces();
      if (races.empty()) {
        throw LookupError("race", "<any>");
      }
      chosenRace = &races[m_random.weightedIndex(weightsOf(races))];
    } else {
      std::vector<double> weights;
      for (const Race *candidate : candidates) {
        weights.push_back(candidate->weight);
      }
      chosenRace = candidates[m_random.weightedIndex(weights)];
    }
  }

  // Faction: pinned, else from the union; an empty union means no faction
  std::optional<std::string> chosenFaction;
  if (faction) {
    chosenFaction = m_templates->getFaction(*faction).name;
  } else {
    std::vector<std::string> pool;
    for (const Profession *prof : profs) {
      appendUnique(pool, prof->factions);
    }
    std::vector<const Faction *> candidates;
    for (const auto &name : pool) {
      if (m_templates->hasFaction(name)) {
        candidates.push_back(&m_templates->getFaction(name));
      }
    }
    if (!candidates.empty()) {
      std::vector<double> weights;
      for (const Faction *candidate : candidates) {
        weights.push_back(candidate->weight);
      }
      chosenFaction = candidates[m_random.weightedIndex(weights)]->name;
    }
  }

  NpcRecord npc;
  npc.professions = professions;
  npc.race = chosenRace->name;
  npc.faction = chosenFaction;
  npc.name = pickName(*chosenRace);

  // Mean over the professions that define each stat, floored
  std::map<std::string, std::pair<int, int>> totals;
  for (const Profession *prof : profs) {
    for (const auto &[stat, value] : prof->baseStats) {
      auto &[sum, count] = totals[stat];
      sum += value;
      ++count;
    }
  }
  for (const auto &[stat, total] : totals) {
    const int mean = static_cast<int>(
        std::floor(static_cast<double>(total.first) / total.second));
    auto modifier = chosenRace->statModifiers.find(stat);
    const int raw =
        mean + (modifier != chosenRace->statModifiers.end() ? modifier->second : 0);
    npc.stats[stat] = std::max(1, raw + m_random.uniformInt(-1, 1));
  }

  for (const Profession *prof : profs) {
    appendUnique(npc.skills, prof->skills);
  }

  for (size_t i = 0; i < profs.size(); ++i) {
    npc.title += (i ? " / " : "") + profs[i]->title;
  }

  const Profession &speaker = *profs[m_random.index(profs.size())];
  if (!speaker.dialogue.empty()) {
    npc.dialogue = m_random.choice(speaker.dialogue);
  }

  const auto &descriptionTemplates = profs.front()->descriptionTemplates.empty()
                                         ? m_templates->getGenericProfile()
                                               .descriptionTemplates
                                         : profs.front()->descriptionTemplates;
  npc.description = describeNpc(descriptionTemplates, npc);

  for (const Profession *prof : profs) {
    if (prof->itemSet) {
      auto items = generateItemsFromSet(*prof->itemSet, m_random.uniformInt(1, 3));
      npc.inventory.insert(npc.inventory.end(),
                           std::make_move_iterator(items.begin()),
                           std::make_move_iterator(items.end()));
    }
  }
  return npc;
}

// ---------------------------------------------------------------------------
// Locations and the session graph
// ---------------------------------------------------------------------------

const LocationTemplate &ContentGenerator::pickLocationTemplate() {
  const auto &templates = m_templates->getLocationTemplates();
  if (templates.empty()) {
    throw LookupError("location template", "<any>");
  }
  return templates[m_random.weightedIndex(weightsOf(templates))];
}

std::string ContentGenerator::pickBiome(const LocationTemplate &tmpl,
                                        const std::optional<std::string> &biome) {
  if (biome) {
    return m_templates->getBiome(*biome).name;
  }
  if (tmpl.suitableBiomes.empty()) {
    return FALLBACK_BIOME;
  }

  std::vector<double> weights;
  weights.reserve(tmpl.suitableBiomes.size());
  for (const auto &name : tmpl.suitableBiomes) {
    weights.push_back(m_templates->hasBiome(name)
                          ? m_templates->getBiome(name).weight
                          : 1.0);
  }
  return tmpl.suitableBiomes[m_random.weightedIndex(weights)];
}

std::string ContentGenerator::makeLocationId(const std::string &templateName) {
  for (int attempt = 0; attempt < kMaxIdAttempts; ++attempt) {
    std::string id =
        std::format("{}_{}", templateName, m_random.uniformInt(1000, 9999));
    if (!m_arenaIndex.count(id)) {
      return id;
    }
  }
  throw GenerationExhausted(std::format("Unique id for '{}'", templateName),
                            kMaxIdAttempts);
}

size_t ContentGenerator::addNode(const LocationTemplate &tmpl,
                                 const std::string &biome, int depth) {
  const AttributePools &attributes = m_templates->getAttributes();

  LocationRecord record;
  record.id = makeLocationId(tmpl.name);
  record.name = tmpl.displayName.empty() ? tmpl.name : tmpl.displayName;
  record.type = tmpl.type;
  record.templateName = tmpl.name;
  record.biome = biome;

  record.environmentTags = tmpl.baseEnvironmentTags;
  const int extraTags = m_random.uniformInt(tmpl.additionalTagCount.min,
                                            tmpl.additionalTagCount.max);
  if (extraTags > 0) {
    std::vector<std::string> available;
    for (const auto &tag : attributes.environmentTags) {
      if (!contains(record.environmentTags, tag)) {
        available.push_back(tag);
      }
    }
    appendUnique(record.environmentTags,
                 m_random.sample(available, static_cast<size_t>(extraTags)));
  }

  if (!tmpl.descriptionTemplates.empty()) {
    const std::string &text = m_random.choice(tmpl.descriptionTemplates);
    TemplateValues values{{"name", record.name}};
    values["biome"] = m_templates->hasBiome(biome)
                          ? m_templates->getBiome(biome).displayName
                          : biome;
    if (!attributes.visualAdjectives.empty()) {
      values["visual_adjective"] = m_random.choice(attributes.visualAdjectives);
    }
    if (!attributes.tactileAdjectives.empty()) {
      values["tactile_adjective"] = m_random.choice(attributes.tactileAdjectives);
    }
    const size_t tagSlots = std::min<size_t>(3, record.environmentTags.size());
    for (size_t i = 0; i < tagSlots; ++i) {
      values[std::format("environment_tag_{}", i + 1)] =
          toLower(record.environmentTags[i]);
    }
    record.description = fillTemplate(text, values);
  }

  const int npcCount =
      m_random.uniformInt(tmpl.npcSpawnCount.min, tmpl.npcSpawnCount.max);
  for (int i = 0; i < npcCount; ++i) {
    if (tmpl.spawnableProfessions.empty()) {
      record.npcs.push_back(generateNpc());
    } else {
      record.npcs.push_back(
          generateNpc({m_random.choice(tmpl.spawnableProfessions)}));
    }
  }

  const int itemCount =
      m_random.uniformInt(tmpl.itemSpawnCount.min, tmpl.itemSpawnCount.max);
  if (!tmpl.spawnableItems.empty()) {
    for (int i = 0; i < itemCount; ++i) {
      record.items.push_back(generateItem(m_random.choice(tmpl.spawnableItems)));
    }
  }

  const size_t index = m_arena.size();
  m_arenaIndex.emplace(record.id, index);
  m_arena.push_back(GraphNode{std::move(record), depth});
  GENERATOR_DEBUG(std::format("Generated location {} at depth {}",
                              m_arena[index].record.id, depth));
  return index;
}

void ContentGenerator::link(size_t from, size_t to) {
  LocationRecord &a = m_arena[from].record;
  LocationRecord &b = m_arena[to].record;
  a.connections[b.templateName] = b.id;
  b.connections[a.templateName] = a.id;
}

void ContentGenerator::assignEdges(size_t nodeIndex, int maxConnections) {
  if (m_arena[nodeIndex].depth >= kMaxConnectionDepth || maxConnections <= 0) {
    return;
  }

  // Copy what we need: addNode() may grow the arena
  const std::string ownTemplate = m_arena[nodeIndex].record.templateName;
  const int depth = m_arena[nodeIndex].depth;
  const LocationTemplate &tmpl = m_templates->getLocationTemplate(ownTemplate);

  std::vector<std::string> freeTypes;
  for (const auto &type : tmpl.canConnectTo) {
    if (m_arena[nodeIndex].record.connections.count(type) ||
        contains(freeTypes, type)) {
      continue;
    }
    if (!m_templates->hasLocationTemplate(type)) {
      GENERATOR_WARN(std::format("Template '{}' connects to unknown '{}'",
                                 ownTemplate, type));
      continue;
    }
    freeTypes.push_back(type);
  }
  if (freeTypes.empty()) {
    return;
  }

  const int slotCount = m_random.uniformInt(
      1, std::min(maxConnections, static_cast<int>(freeTypes.size())));

  for (const auto &type : m_random.sample(freeTypes, static_cast<size_t>(slotCount))) {
    std::vector<size_t> candidates;
    for (size_t i = 0; i < m_arena.size(); ++i) {
      if (i != nodeIndex && m_arena[i].record.templateName == type &&
          !m_arena[i].record.connections.count(ownTemplate)) {
        candidates.push_back(i);
      }
    }

    size_t target;
    if (!candidates.empty() && m_random.chance(kReuseProbability)) {
      target = candidates[m_random.index(candidates.size())];
    } else {
      const LocationTemplate &neighbor = m_templates->getLocationTemplate(type);
      target = addNode(neighbor, pickBiome(neighbor, std::nullopt), depth + 1);
    }
    link(nodeIndex, target);
  }
}

LocationRecord
ContentGenerator::generateLocation(const std::optional<std::string> &templateName,
                                   bool connect, int maxConnections,
                                   const std::optional<std::string> &biome) {
  const LocationTemplate &tmpl = templateName
                                     ? m_templates->getLocationTemplate(*templateName)
                                     : pickLocationTemplate();
  const std::string chosenBiome = pickBiome(tmpl, biome);

  const size_t index =
      addNode(tmpl, chosenBiome, connect ? 0 : kMaxConnectionDepth);
  if (connect) {
    assignEdges(index, maxConnections);
  }
  return m_arena[index].record;
}

GeneratedWorld ContentGenerator::generateWorld(int count) {
  clearSession();

  std::vector<size_t> roots;
  for (int i = 0; i < count; ++i) {
    const LocationTemplate &tmpl = pickLocationTemplate();
    roots.push_back(addNode(tmpl, pickBiome(tmpl, std::nullopt), 0));
  }
  for (size_t root : roots) {
    assignEdges(root, WORLD_ROOT_CONNECTIONS);
  }

  GeneratedWorld world;
  world.locations.reserve(m_arena.size());
  for (const auto &node : m_arena) {
    const LocationRecord &record = node.record;
    LocationSummary entry;
    entry.name = record.name;
    entry.type = record.type;
    for (const auto &[type, neighborId] : record.connections) {
      entry.connections.push_back(neighborId);
    }
    entry.npcCount = record.npcs.size();
    entry.itemCount = record.items.size();
    world.summary.emplace(record.id, std::move(entry));
    world.locations.push_back(record);
  }

  GENERATOR_INFO(std::format("Generated world: {} roots, {} locations", count,
                             world.locations.size()));
  return world;
}

void ContentGenerator::clearSession() {
  m_arena.clear();
  m_arenaIndex.clear();
}

std::vector<LocationRecord> ContentGenerator::getSessionLocations() const {
  std::vector<LocationRecord> records;
  records.reserve(m_arena.size());
  for (const auto &node : m_arena) {
    records.push_back(node.record);
  }
  return records;
}

// ---------------------------------------------------------------------------
// Weather
// ---------------------------------------------------------------------------

WeatherSnapshot ContentGenerator::generateWeather(const std::string &biome,
                                                  Season season,
                                                  TimeOfDay timeOfDay) {
  const SeasonConfig config = SeasonConfig::getDefault(season);
  std::vector<double> weights(config.weatherProbs.begin(),
                              config.weatherProbs.end());

  double offset = 0.0;
  if (m_templates->hasBiome(biome)) {
    const Biome &entry = m_templates->getBiome(biome);
    offset = entry.temperatureOffset;
    for (size_t i = 0; i < weights.size(); ++i) {
      auto it = entry.weatherWeights.find(
          weatherTypeName(static_cast<WeatherType>(i)));
      if (it != entry.weatherWeights.end()) {
        weights[i] *= it->second;
      }
    }
  }

  WeatherSnapshot weather;
  weather.condition = static_cast<WeatherType>(m_random.weightedIndex(weights));
  weather.temperature =
      m_random.uniformReal(config.minTemperature, config.maxTemperature) + offset;
  weather.season = seasonName(season);
  weather.timeOfDay = timeOfDayName(timeOfDay);
  weather.biome = biome;
  return weather;
}

} // namespace Realmforge
