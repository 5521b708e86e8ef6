/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE ContentGeneratorTests
#include <boost/test/unit_test.hpp>

#include "../common/TestTemplates.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "managers/TemplateManager.hpp"
#include "world/ContentGenerator.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <string>
#include <vector>

using namespace Realmforge;

// ============================================================================
// Test Fixture
// ============================================================================

class GeneratorFixture {
public:
    GeneratorFixture()
        : templates(RealmforgeTest::makeTemplates()), generator(templates, 42) {
        REALM_ENABLE_BENCHMARK_MODE();
    }

    ~GeneratorFixture() {
        REALM_DISABLE_BENCHMARK_MODE();
    }

protected:
    // Every connection must be mirrored on the neighbor, under our template
    static void checkBidirectional(const std::vector<LocationRecord> &locations) {
        std::map<std::string, const LocationRecord *> byId;
        for (const auto &location : locations) {
            byId[location.id] = &location;
        }
        for (const auto &location : locations) {
            for (const auto &[type, neighborId] : location.connections) {
                auto it = byId.find(neighborId);
                BOOST_REQUIRE_MESSAGE(it != byId.end(),
                                      "dangling connection " << neighborId);
                const LocationRecord &neighbor = *it->second;
                BOOST_CHECK_EQUAL(neighbor.templateName, type);
                auto back = neighbor.connections.find(location.templateName);
                BOOST_REQUIRE(back != neighbor.connections.end());
                BOOST_CHECK_EQUAL(back->second, location.id);
            }
        }
    }

    std::shared_ptr<TemplateManager> templates;
    ContentGenerator generator;
};

// ============================================================================
// ITEM GENERATION TESTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(ItemTests, GeneratorFixture)

BOOST_AUTO_TEST_CASE(TestSameSeedSameItems) {
    ContentGenerator other(templates, 42);
    for (int i = 0; i < 20; ++i) {
        Item a = generator.generateItem(std::string("weapon_melee"));
        Item b = other.generateItem(std::string("weapon_melee"));
        BOOST_CHECK(a == b);
    }
}

BOOST_AUTO_TEST_CASE(TestDifferentSeedsDiverge) {
    ContentGenerator other(templates, 43);
    bool differs = false;
    for (int i = 0; i < 20 && !differs; ++i) {
        differs = !(generator.generateItem() == other.generateItem());
    }
    BOOST_CHECK(differs);
}

BOOST_AUTO_TEST_CASE(TestMeleeWeaponShape) {
    for (int i = 0; i < 50; ++i) {
        Item item = generator.generateItem(std::string("weapon_melee"));

        BOOST_CHECK_EQUAL(item.type, "weapon");
        BOOST_CHECK_EQUAL(item.subtype, "melee");
        BOOST_CHECK_EQUAL(item.templateName, "weapon_melee");
        BOOST_REQUIRE(item.quality && item.rarity && item.material);
        BOOST_CHECK(item.name.find(*item.quality) == 0);
        BOOST_CHECK_EQUAL(item.damageTypes.size(), 1u);
        BOOST_CHECK(!item.stats.empty() && item.stats.size() <= 2);
        for (const auto &[stat, value] : item.stats) {
            BOOST_CHECK_NE(value, 0);
        }

        // floor(base * quality * rarity) with base 20..60
        BOOST_CHECK_GE(item.value, 10);
        BOOST_CHECK_LE(item.value, 600);
        BOOST_CHECK(item.description.find('{') == std::string::npos);
        BOOST_CHECK(!item.description.empty());
    }
}

BOOST_AUTO_TEST_CASE(TestConsumableFlags) {
    Item potion = generator.generateItem(std::string("consumable"));
    BOOST_CHECK(!potion.quality.has_value());
    BOOST_CHECK(!potion.material.has_value());
    BOOST_CHECK(potion.hasProperty("consumable"));
    BOOST_CHECK(potion.hasProperty("single_use"));
    BOOST_CHECK(!potion.hasProperty("provides_defense"));
    BOOST_CHECK_GE(potion.value, 5);
    BOOST_CHECK_LE(potion.value, 15);

    Item armor = generator.generateItem(std::string("armor"));
    BOOST_CHECK(armor.hasProperty("provides_defense"));
}

BOOST_AUTO_TEST_CASE(TestMinimumRarityHolds) {
    const size_t rareRank = templates->rarityRank("Rare");
    ItemConstraints constraints;
    constraints.minRarity = "Rare";

    for (int i = 0; i < 1000; ++i) {
        Item item = generator.generateItem(std::string("weapon_melee"), constraints);
        BOOST_REQUIRE(item.rarity.has_value());
        BOOST_REQUIRE_GE(templates->rarityRank(*item.rarity), rareRank);
    }
}

BOOST_AUTO_TEST_CASE(TestQualityWindowAndValueBounds) {
    ItemConstraints constraints;
    constraints.minQuality = "Common";
    constraints.maxQuality = "Fine";
    constraints.minValue = 30;

    for (int i = 0; i < 200; ++i) {
        Item item = generator.generateItem(std::string("armor"), constraints);
        const size_t rank = templates->qualityRank(*item.quality);
        BOOST_CHECK(rank >= 1 && rank <= 2);
        BOOST_CHECK_GE(item.value, 30);
    }
}

BOOST_AUTO_TEST_CASE(TestExcludedMaterials) {
    ItemConstraints constraints;
    constraints.excludedMaterials = {"iron", "steel", "oak"};

    for (int i = 0; i < 100; ++i) {
        Item item = generator.generateItem(std::string("jewelry"), constraints);
        BOOST_REQUIRE(item.material.has_value());
        BOOST_CHECK_EQUAL(*item.material, "silver");
    }
}

BOOST_AUTO_TEST_CASE(TestRequiredStatsAreAdded) {
    ItemConstraints constraints;
    constraints.requiredStats = {"defense"};

    for (int i = 0; i < 50; ++i) {
        Item item = generator.generateItem(std::string("consumable"), constraints);
        BOOST_REQUIRE(item.stats.count("defense"));
        BOOST_CHECK_GE(item.stats.at("defense"), 2);
        BOOST_CHECK_LE(item.stats.at("defense"), 8);
    }
}

BOOST_AUTO_TEST_CASE(TestUnsatisfiableConstraintsExhaust) {
    ItemConstraints constraints;
    constraints.maxValue = 1;

    try {
        generator.generateItem(std::string("weapon_melee"), constraints);
        BOOST_FAIL("expected GenerationExhausted");
    } catch (const GenerationExhausted &e) {
        BOOST_CHECK_EQUAL(e.attempts(), ContentGenerator::MAX_ITEM_ATTEMPTS);
    }
}

BOOST_AUTO_TEST_CASE(TestUnknownNamesFailFast) {
    BOOST_CHECK_THROW(generator.generateItem(std::string("laser_rifle")), LookupError);

    ItemConstraints badTier;
    badTier.minQuality = "Divine";
    BOOST_CHECK_THROW(generator.generateItem(std::nullopt, badTier), LookupError);

    ItemConstraints badStat;
    badStat.requiredStats = {"luck"};
    BOOST_CHECK_THROW(generator.generateItem(std::nullopt, badStat), LookupError);
}

BOOST_AUTO_TEST_CASE(TestItemsFromSet) {
    auto items = generator.generateItemsFromSet("smith_goods", 6);
    BOOST_CHECK_EQUAL(items.size(), 6u);
    for (const auto &item : items) {
        BOOST_CHECK(item.templateName == "weapon_melee" || item.templateName == "armor");
    }

    auto some = generator.generateItemsFromSet("alchemy_goods");
    BOOST_CHECK(some.size() >= 1 && some.size() <= 5);

    BOOST_CHECK(generator.generateItemsFromSet("trinkets", 0).empty());
    BOOST_CHECK_THROW(generator.generateItemsFromSet("no_such_set"), LookupError);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// NPC GENERATION TESTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(NpcTests, GeneratorFixture)

BOOST_AUTO_TEST_CASE(TestMultiProfessionSkillUnion) {
    NpcRecord npc = generator.generateNpc({"blacksmith", "merchant"});

    const std::vector<std::string> expected{"smithing", "haggling", "appraisal"};
    BOOST_CHECK_EQUAL_COLLECTIONS(npc.skills.begin(), npc.skills.end(),
                                  expected.begin(), expected.end());
    BOOST_CHECK_EQUAL(npc.title, "Blacksmith / Merchant");
    BOOST_CHECK_EQUAL(npc.professions.size(), 2u);

    const std::set<std::string> races{"human", "dwarf", "elf"};
    BOOST_CHECK(races.count(npc.race));
    BOOST_REQUIRE(npc.faction.has_value());
    BOOST_CHECK(*npc.faction == "smiths_guild" || *npc.faction == "merchants_guild");

    // Stats are the union of both professions' stats
    BOOST_CHECK(npc.stats.count("strength"));
    BOOST_CHECK(npc.stats.count("agility"));
    BOOST_CHECK(npc.stats.count("charisma"));

    // One to three items from each profession's set
    BOOST_CHECK(npc.inventory.size() >= 2 && npc.inventory.size() <= 6);
}

BOOST_AUTO_TEST_CASE(TestStatsFollowMeanAndRace) {
    for (int i = 0; i < 50; ++i) {
        NpcRecord npc = generator.generateNpc({"blacksmith"}, std::string("dwarf"));
        BOOST_CHECK_EQUAL(npc.race, "dwarf");
        // 14 base + 2 dwarf modifier, jitter of one either way
        BOOST_CHECK_GE(npc.stats.at("strength"), 15);
        BOOST_CHECK_LE(npc.stats.at("strength"), 17);
        BOOST_CHECK_GE(npc.stats.at("agility"), 7);
        BOOST_CHECK_LE(npc.stats.at("agility"), 9);
    }
}

BOOST_AUTO_TEST_CASE(TestNameComesFromRace) {
    NpcRecord npc = generator.generateNpc({"alchemist"});
    BOOST_CHECK_EQUAL(npc.race, "elf");
    BOOST_CHECK(npc.name.find("Moonbrook") != std::string::npos);
    BOOST_CHECK(!npc.inventory.empty());
    for (const auto &item : npc.inventory) {
        BOOST_CHECK_EQUAL(item.templateName, "consumable");
    }
}

BOOST_AUTO_TEST_CASE(TestNoFactionPoolMeansNoFaction) {
    NpcRecord guard = generator.generateNpc({"guard"});
    BOOST_CHECK(!guard.faction.has_value());
    BOOST_CHECK(guard.inventory.empty());
    BOOST_CHECK_EQUAL(guard.dialogue, "");
}

BOOST_AUTO_TEST_CASE(TestPinnedFaction) {
    NpcRecord npc = generator.generateNpc({"guard"}, std::nullopt,
                                          std::string("merchants_guild"));
    BOOST_REQUIRE(npc.faction.has_value());
    BOOST_CHECK_EQUAL(*npc.faction, "merchants_guild");
}

BOOST_AUTO_TEST_CASE(TestGenericNpc) {
    NpcRecord npc = generator.generateNpc();
    BOOST_CHECK(npc.professions.empty());
    BOOST_CHECK_EQUAL(npc.title, "Villager");
    BOOST_REQUIRE_EQUAL(npc.skills.size(), 1u);
    BOOST_CHECK_EQUAL(npc.skills[0], "gossip");
    BOOST_CHECK_EQUAL(npc.dialogue, "Good day.");
    BOOST_CHECK(npc.description.find(npc.name) == 0);
    for (const auto &[stat, value] : npc.stats) {
        BOOST_CHECK_GE(value, 1);
    }
}

BOOST_AUTO_TEST_CASE(TestUnknownInputsThrow) {
    BOOST_CHECK_THROW(generator.generateNpc({"astronaut"}), LookupError);
    BOOST_CHECK_THROW(generator.generateNpc({"guard"}, std::string("robot")), LookupError);
    BOOST_CHECK_THROW(generator.generateNpc({}, std::nullopt, std::string("pirates")),
                      LookupError);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// LOCATION AND WORLD TESTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(LocationTests, GeneratorFixture)

BOOST_AUTO_TEST_CASE(TestStandaloneLocation) {
    LocationRecord forge = generator.generateLocation(std::string("forge"), false);

    BOOST_CHECK(forge.connections.empty());
    BOOST_CHECK_EQUAL(forge.type, "building");
    BOOST_CHECK_EQUAL(forge.name, "Forge");
    BOOST_CHECK_EQUAL(forge.biome, "grassland");
    BOOST_CHECK(forge.id.rfind("forge_", 0) == 0);
    BOOST_CHECK_EQUAL(forge.id.size(), std::string("forge_1234").size());
    BOOST_REQUIRE_EQUAL(forge.npcs.size(), 1u);
    BOOST_CHECK_EQUAL(forge.npcs[0].professions[0], "blacksmith");
    BOOST_CHECK_EQUAL(generator.getSessionSize(), 1u);
}

BOOST_AUTO_TEST_CASE(TestLocationContents) {
    for (int i = 0; i < 20; ++i) {
        LocationRecord village = generator.generateLocation(std::string("village"), false);
        BOOST_CHECK(village.npcs.size() >= 1 && village.npcs.size() <= 3);
        BOOST_CHECK_LE(village.items.size(), 2u);
        BOOST_REQUIRE(!village.environmentTags.empty());
        BOOST_CHECK_EQUAL(village.environmentTags[0], "quiet");

        std::set<std::string> unique(village.environmentTags.begin(),
                                     village.environmentTags.end());
        BOOST_CHECK_EQUAL(unique.size(), village.environmentTags.size());
        BOOST_CHECK(village.description.find("Village sits in the") == 0);
    }
}

BOOST_AUTO_TEST_CASE(TestPinnedBiome) {
    LocationRecord village = generator.generateLocation(
        std::string("village"), false, 3, std::string("temperate_forest"));
    BOOST_CHECK_EQUAL(village.biome, "temperate_forest");
    BOOST_CHECK(village.description.find("Temperate Forest") != std::string::npos);

    BOOST_CHECK_THROW(generator.generateLocation(std::string("village"), false, 3,
                                                 std::string("lava_sea")),
                      LookupError);
}

BOOST_AUTO_TEST_CASE(TestConnectionsAreBidirectional) {
    for (int i = 0; i < 10; ++i) {
        LocationRecord root = generator.generateLocation(std::string("village"));
        BOOST_CHECK(!root.connections.empty());
        BOOST_CHECK_LE(root.connections.size(), 3u);
    }
    checkBidirectional(generator.getSessionLocations());
}

BOOST_AUTO_TEST_CASE(TestConnectionLimit) {
    LocationRecord root = generator.generateLocation(std::string("village"), true, 1);
    BOOST_CHECK_EQUAL(root.connections.size(), 1u);
}

BOOST_AUTO_TEST_CASE(TestGenerateWorld) {
    GeneratedWorld world = generator.generateWorld(6);

    BOOST_CHECK_GE(world.locations.size(), 6u);
    BOOST_CHECK_EQUAL(world.summary.size(), world.locations.size());
    BOOST_CHECK_EQUAL(generator.getSessionSize(), world.locations.size());
    checkBidirectional(world.locations);

    for (const auto &location : world.locations) {
        const LocationSummary &entry = world.summary.at(location.id);
        BOOST_CHECK_EQUAL(entry.name, location.name);
        BOOST_CHECK_EQUAL(entry.connections.size(), location.connections.size());
        BOOST_CHECK_EQUAL(entry.npcCount, location.npcs.size());
        BOOST_CHECK(world.findLocation(location.id) != nullptr);
    }
    BOOST_CHECK(world.findLocation("nowhere_0000") == nullptr);
}

BOOST_AUTO_TEST_CASE(TestWorldIsDeterministic) {
    ContentGenerator other(templates, 42);
    GeneratedWorld a = generator.generateWorld(4);
    GeneratedWorld b = other.generateWorld(4);

    BOOST_REQUIRE_EQUAL(a.locations.size(), b.locations.size());
    for (size_t i = 0; i < a.locations.size(); ++i) {
        BOOST_CHECK(a.locations[i] == b.locations[i]);
    }
}

BOOST_AUTO_TEST_CASE(TestNewWorldClearsSession) {
    generator.generateLocation(std::string("forge"), false);
    generator.generateLocation(std::string("forge"), false);
    BOOST_CHECK_EQUAL(generator.getSessionSize(), 2u);

    generator.clearSession();
    BOOST_CHECK_EQUAL(generator.getSessionSize(), 0u);

    GeneratedWorld world = generator.generateWorld(1);
    BOOST_CHECK_EQUAL(generator.getSessionSize(), world.locations.size());
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// WEATHER TESTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(WeatherTests, GeneratorFixture)

BOOST_AUTO_TEST_CASE(TestSeasonRulesOutWeather) {
    for (int i = 0; i < 300; ++i) {
        WeatherSnapshot weather =
            generator.generateWeather("grassland", Season::Summer, TimeOfDay::Morning);
        BOOST_CHECK(weather.condition != WeatherType::Snowy);
        BOOST_CHECK(weather.condition != WeatherType::Foggy);
        BOOST_CHECK_GE(weather.temperature, 70.0);
        BOOST_CHECK_LE(weather.temperature, 95.0);
    }
}

BOOST_AUTO_TEST_CASE(TestBiomeWeightsAndOffset) {
    for (int i = 0; i < 50; ++i) {
        WeatherSnapshot weather =
            generator.generateWeather("tundra", Season::Winter, TimeOfDay::Night);
        BOOST_CHECK(weather.condition == WeatherType::Snowy);
        BOOST_CHECK_LE(weather.temperature, 15.0);
        BOOST_CHECK_EQUAL(weather.season, "Winter");
        BOOST_CHECK_EQUAL(weather.timeOfDay, "night");
        BOOST_CHECK_EQUAL(weather.biome, "tundra");
    }
}

BOOST_AUTO_TEST_CASE(TestUnknownBiomeUsesSeasonDefaults) {
    WeatherSnapshot weather =
        generator.generateWeather("unmapped", Season::Fall, TimeOfDay::Dusk);
    BOOST_CHECK_GE(weather.temperature, 40.0);
    BOOST_CHECK_LE(weather.temperature, 65.0);
    BOOST_CHECK(weather.condition != WeatherType::Snowy);
}

BOOST_AUTO_TEST_CASE(TestWeatherNames) {
    BOOST_CHECK_EQUAL(std::string(weatherTypeName(WeatherType::Stormy)), "stormy");
    auto parsed = weatherTypeFromName("foggy");
    BOOST_REQUIRE(parsed.has_value());
    BOOST_CHECK(*parsed == WeatherType::Foggy);
    BOOST_CHECK(!weatherTypeFromName("hail"));
}

BOOST_AUTO_TEST_SUITE_END()
