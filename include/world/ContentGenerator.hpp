/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CONTENT_GENERATOR_HPP
#define CONTENT_GENERATOR_HPP

#include "core/Random.hpp"
#include "core/TimeManager.hpp"
#include "world/GeneratedContent.hpp"
#include "world/Weather.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace Realmforge {

class TemplateManager;
struct ItemTemplate;
struct LocationTemplate;
struct Race;

/**
 * @brief Caller constraints for generateItem()
 *
 * Tier bounds are inclusive and compare positions in the attribute pool's
 * declared order. An item whose template has no quality (or rarity) never
 * satisfies a bound on that tier.
 */
struct ItemConstraints {
  std::optional<std::string> minQuality;
  std::optional<std::string> maxQuality;
  std::optional<std::string> minRarity;
  std::optional<std::string> maxRarity;
  std::optional<int> minValue;
  std::optional<int> maxValue;
  std::vector<std::string> excludedMaterials;
  // Added to the stat map after the other constraints pass
  std::vector<std::string> requiredStats;
};

/**
 * @brief Seeded procedural generator for items, NPCs, locations and worlds
 *
 * Every draw goes through the generator's single Random instance, so two
 * generators built with the same seed and driven by the same call sequence
 * produce identical records.
 *
 * Locations produced during one session live in an arena that later calls
 * may link to; generateWorld() and clearSession() reset it.
 */
class ContentGenerator {
public:
  static constexpr int MAX_ITEM_ATTEMPTS = 100;
  static constexpr int DEFAULT_MAX_CONNECTIONS = 3;
  static constexpr int WORLD_ROOT_CONNECTIONS = 2;
  static constexpr const char *FALLBACK_BIOME = "temperate_forest";

  ContentGenerator(std::shared_ptr<const TemplateManager> templates,
                   uint64_t seed);

  ContentGenerator(const ContentGenerator &) = delete;
  ContentGenerator &operator=(const ContentGenerator &) = delete;

  /**
   * @brief Generates one item, resampling until the constraints hold
   *
   * An explicit template is kept across attempts; otherwise a template is
   * drawn by weight on every attempt.
   *
   * @throws LookupError for unknown template, tier or stat names
   * @throws GenerationExhausted after MAX_ITEM_ATTEMPTS failed attempts
   */
  Item generateItem(const std::optional<std::string> &templateName = std::nullopt,
                    const ItemConstraints &constraints = {});

  /**
   * @brief Generates count items, each from a uniformly chosen template of
   * the set (count defaults to 1..5)
   * @throws LookupError for an unknown set
   */
  std::vector<Item> generateItemsFromSet(const std::string &setName,
                                         std::optional<int> count = std::nullopt);

  /**
   * @brief Composes an NPC from zero or more professions
   *
   * With no professions the generic profile is used. Pinned race and faction
   * override the profession pools.
   *
   * @throws LookupError for unknown profession, race or faction names
   */
  NpcRecord generateNpc(const std::vector<std::string> &professions = {},
                        const std::optional<std::string> &race = std::nullopt,
                        const std::optional<std::string> &faction = std::nullopt);

  /**
   * @brief Generates a location and, when connect is set, its neighbors
   *
   * Neighbors are either reused from the session arena or freshly generated
   * one level deep; every edge is mirrored on both endpoints. The returned
   * copy reflects the location's edges at return time.
   *
   * @throws LookupError for an unknown template or biome
   */
  LocationRecord
  generateLocation(const std::optional<std::string> &templateName = std::nullopt,
                   bool connect = true,
                   int maxConnections = DEFAULT_MAX_CONNECTIONS,
                   const std::optional<std::string> &biome = std::nullopt);

  /**
   * @brief Clears the session and generates count connected root locations
   *
   * The result usually holds more than count locations because roots pull
   * in fresh neighbors.
   */
  GeneratedWorld generateWorld(int count);

  /**
   * @brief Rolls weather for a biome at the given calendar position
   *
   * Season odds are scaled by the biome's weather weights; unknown biomes
   * use the unscaled season table.
   */
  WeatherSnapshot generateWeather(const std::string &biome, Season season,
                                  TimeOfDay timeOfDay);

  void clearSession();
  std::vector<LocationRecord> getSessionLocations() const;
  size_t getSessionSize() const { return m_arena.size(); }

  /**
   * @brief Restarts the random stream from a new seed
   *
   * Used after a snapshot load, which does not carry the stream position.
   */
  void reseed(uint64_t seed);
  uint64_t getSeed() const { return m_random.getSeed(); }

  const TemplateManager &getTemplates() const { return *m_templates; }

  // Shared stream for simulation-side draws (NPC decisions, starting gold)
  Random &getRandom() { return m_random; }

private:
  struct GraphNode {
    LocationRecord record;
    int depth{0};
  };

  // Only nodes shallower than this get their own edges
  static constexpr int kMaxConnectionDepth = 1;

  struct ResolvedConstraints {
    std::optional<size_t> minQuality;
    std::optional<size_t> maxQuality;
    std::optional<size_t> minRarity;
    std::optional<size_t> maxRarity;
  };

  ResolvedConstraints resolveTiers(const ItemConstraints &constraints) const;
  Item rollItem(const ItemTemplate &tmpl);
  bool satisfies(const Item &item, const ItemConstraints &constraints,
                 const ResolvedConstraints &tiers) const;
  void addRequiredStats(Item &item, const std::vector<std::string> &stats);
  std::map<std::string, int> rollStats(int count);

  NpcRecord generateGenericNpc(const std::optional<std::string> &race,
                               const std::optional<std::string> &faction);
  std::string describeNpc(const std::vector<std::string> &templates,
                          const NpcRecord &npc);
  std::string pickName(const Race &race);

  const ItemTemplate &pickItemTemplate();
  const LocationTemplate &pickLocationTemplate();
  std::string pickBiome(const LocationTemplate &tmpl,
                        const std::optional<std::string> &biome);
  std::string makeLocationId(const std::string &templateName);

  size_t addNode(const LocationTemplate &tmpl, const std::string &biome,
                 int depth);
  void assignEdges(size_t nodeIndex, int maxConnections);
  void link(size_t from, size_t to);

  std::shared_ptr<const TemplateManager> m_templates;
  Random m_random;

  std::vector<GraphNode> m_arena;
  std::unordered_map<std::string, size_t> m_arenaIndex;
};

} // namespace Realmforge

#endif // CONTENT_GENERATOR_HPP
