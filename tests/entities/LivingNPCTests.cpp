/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE LivingNPCTests
#include <boost/test/unit_test.hpp>

#include "../common/TestTemplates.hpp"
#include "core/Logger.hpp"
#include "entities/EntityFactory.hpp"
#include "entities/LivingNPC.hpp"
#include "utils/JsonReader.hpp"
#include "world/World.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

using namespace Realmforge;

// ============================================================================
// Test Fixture
// ============================================================================

class LivingNPCFixture {
public:
    LivingNPCFixture() {
        REALM_ENABLE_BENCHMARK_MODE();
        SimulationConfig config;
        config.saveDirectory =
            (std::filesystem::temp_directory_path() / "realmforge_npc_test").string();
        world = std::make_unique<World>(RealmforgeTest::makeTemplates(), 42, config);

        world->addLocation(EntityFactory::createLocation(makeLocation("loc_a", "Millbrook")));
        world->addLocation(EntityFactory::createLocation(makeLocation("loc_b", "Stonecross")));
    }

    ~LivingNPCFixture() {
        REALM_DISABLE_BENCHMARK_MODE();
    }

protected:
    std::unique_ptr<World> world;

    static LocationRecord makeLocation(const std::string &id, const std::string &name) {
        LocationRecord record;
        record.id = id;
        record.name = name;
        record.type = "settlement";
        record.templateName = "village";
        record.biome = "grassland";
        return record;
    }

    LivingNPC &addNpc(const std::string &id, std::vector<std::string> professions) {
        NpcRecord record;
        record.name = "Borin Ironfoot";
        record.title = "Test";
        record.professions = std::move(professions);
        record.race = "dwarf";
        record.stats = {{"strength", 15}};
        LivingNPC &npc = world->addNpc(
            std::make_unique<LivingNPC>(id, std::move(record), std::string("loc_a"), 100));
        world->getLocation("loc_a")->addNpc(id, world->getEvents());
        return npc;
    }
};

// ============================================================================
// NEEDS TESTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(NeedsTests, LivingNPCFixture)

BOOST_AUTO_TEST_CASE(TestNeedsAreClamped) {
    LivingNPC &npc = addNpc("npc_1", {"guard"});
    npc.setEnergy(150.0);
    npc.setHunger(-5.0);
    npc.setMood(1000.0);

    BOOST_CHECK_EQUAL(npc.getEnergy(), LivingNPC::MAX_NEED);
    BOOST_CHECK_EQUAL(npc.getHunger(), 0.0);
    BOOST_CHECK_EQUAL(npc.getMood(), LivingNPC::MAX_NEED);
}

BOOST_AUTO_TEST_CASE(TestExhaustedWorkerFallsAsleep) {
    LivingNPC &npc = addNpc("npc_1", {"blacksmith"});
    npc.setActivity(NpcActivity::Working);
    npc.setEnergy(15.0);

    world->step(1);
    BOOST_CHECK_EQUAL(npc.getActivity(), NpcActivity::Sleeping);
    BOOST_CHECK_EQUAL(npc.getActivityMinutes(), 0.0);
}

BOOST_AUTO_TEST_CASE(TestHungerInterruptsIdle) {
    LivingNPC &npc = addNpc("npc_1", {"guard"});
    npc.setHunger(85.0);

    world->step(1);
    BOOST_CHECK_EQUAL(npc.getActivity(), NpcActivity::Eating);

    // Eating outpaces the hunger drift until the NPC is satisfied
    world->update(80.0);
    BOOST_CHECK_EQUAL(npc.getActivity(), NpcActivity::Idle);
    BOOST_CHECK_LT(npc.getHunger(), 20.0);
}

BOOST_AUTO_TEST_CASE(TestSleepRestoresEnergy) {
    LivingNPC &npc = addNpc("npc_1", {"guard"});
    npc.setEnergy(40.0);
    npc.startSleeping();

    world->step(10);
    BOOST_CHECK_CLOSE(npc.getEnergy(), 45.0, 1e-6);
    BOOST_CHECK_CLOSE(npc.getHunger(), 1.0, 1e-6);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// ACTIVITY TRANSITION TESTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(ActivityTransitionTests, LivingNPCFixture)

BOOST_AUTO_TEST_CASE(TestTiredIdlerSleepsAtNight) {
    world->getTime().setTime(1, 1, 23, 0);
    LivingNPC &tired = addNpc("npc_1", {"guard"});
    tired.setEnergy(55.0);
    LivingNPC &rested = addNpc("npc_2", {"guard"});
    rested.setEnergy(75.0);

    world->step(1);
    BOOST_CHECK_EQUAL(tired.getActivity(), NpcActivity::Sleeping);
    BOOST_CHECK(rested.getActivity() != NpcActivity::Sleeping);
}

BOOST_AUTO_TEST_CASE(TestTiredIdlerStaysUpInDaylight) {
    world->getTime().setTime(1, 1, 18, 0);
    LivingNPC &npc = addNpc("npc_1", {});
    npc.setEnergy(55.0);

    world->step(1);
    BOOST_CHECK(npc.getActivity() != NpcActivity::Sleeping);
}

BOOST_AUTO_TEST_CASE(TestHungryIdlerEats) {
    LivingNPC &npc = addNpc("npc_1", {});
    npc.setHunger(60.0);

    world->step(1);
    BOOST_CHECK_EQUAL(npc.getActivity(), NpcActivity::Eating);
}

BOOST_AUTO_TEST_CASE(TestWorkComesBeforeMildHunger) {
    LivingNPC &npc = addNpc("npc_1", {"guard"});
    npc.setHunger(60.0);
    BOOST_REQUIRE(world->getTime().isWorkingHours());

    world->step(1);
    BOOST_CHECK_EQUAL(npc.getActivity(), NpcActivity::Working);
}

BOOST_AUTO_TEST_CASE(TestSleeperWakesWhenRested) {
    world->getTime().setTime(1, 1, 1, 0);
    LivingNPC &rested = addNpc("npc_1", {"guard"});
    rested.setEnergy(91.0);
    rested.startSleeping();
    LivingNPC &drowsy = addNpc("npc_2", {"guard"});
    drowsy.setEnergy(80.0);
    drowsy.startSleeping();

    world->step(1);
    BOOST_CHECK_EQUAL(rested.getActivity(), NpcActivity::Idle);
    BOOST_CHECK_EQUAL(drowsy.getActivity(), NpcActivity::Sleeping);
}

BOOST_AUTO_TEST_CASE(TestSleeperWakesForWorkingHours) {
    LivingNPC &npc = addNpc("npc_1", {"guard"});
    npc.setEnergy(55.0);
    npc.startSleeping();
    BOOST_REQUIRE(world->getTime().isWorkingHours());

    world->step(1);
    BOOST_CHECK_EQUAL(npc.getActivity(), NpcActivity::Idle);

    // The same energy at night keeps the NPC in bed
    world->getTime().setTime(1, 2, 2, 0);
    npc.setEnergy(55.0);
    npc.startSleeping();
    world->step(1);
    BOOST_CHECK_EQUAL(npc.getActivity(), NpcActivity::Sleeping);
}

BOOST_AUTO_TEST_CASE(TestSocializingLiftsMood) {
    LivingNPC &npc = addNpc("npc_1", {});
    npc.setMood(50.0);
    npc.startSocializing();
    BOOST_CHECK_EQUAL(npc.getActivity(), NpcActivity::Socializing);
    BOOST_CHECK_CLOSE(npc.getMood(), 55.0, 1e-9);

    npc.setMood(98.0);
    npc.startSocializing();
    BOOST_CHECK_EQUAL(npc.getMood(), LivingNPC::MAX_NEED);
}

BOOST_AUTO_TEST_CASE(TestSocializingEndsAfterTenMinutes) {
    LivingNPC &npc = addNpc("npc_1", {});
    npc.startSocializing();

    world->step(10);
    BOOST_CHECK_EQUAL(npc.getActivity(), NpcActivity::Socializing);
    BOOST_CHECK_CLOSE(npc.getActivityMinutes(), 10.0, 1e-9);

    world->step(1);
    BOOST_CHECK_EQUAL(npc.getActivity(), NpcActivity::Idle);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// SCHEDULE TESTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(ScheduleTests, LivingNPCFixture)

BOOST_AUTO_TEST_CASE(TestWorkerStartsShiftDuringWorkHours) {
    LivingNPC &npc = addNpc("npc_1", {"guard"});
    BOOST_REQUIRE(world->getTime().isWorkingHours());

    world->step(1);
    BOOST_CHECK_EQUAL(npc.getActivity(), NpcActivity::Working);

    auto started = world->getEvents().getEventsByType(EventTypeId::NpcStartedWorking);
    BOOST_REQUIRE_EQUAL(started.size(), 1u);
    BOOST_CHECK_EQUAL(started[0].sourceId.value_or(""), "npc_1");
    BOOST_CHECK_EQUAL(started[0].locationId.value_or(""), "loc_a");
}

BOOST_AUTO_TEST_CASE(TestTiredWorkerStopsWorking) {
    LivingNPC &npc = addNpc("npc_1", {"guard"});
    world->step(1);
    BOOST_REQUIRE_EQUAL(npc.getActivity(), NpcActivity::Working);

    // 480 minutes of work drain 72 energy, leaving the guard below 30
    world->update(480.0);
    BOOST_CHECK_EQUAL(npc.getActivity(), NpcActivity::Idle);
    BOOST_CHECK_LT(npc.getEnergy(), 30.0);
}

BOOST_AUTO_TEST_CASE(TestProfessionsDecideWorkAndCraft) {
    LivingNPC &smith = addNpc("npc_1", {"blacksmith"});
    LivingNPC &guard = addNpc("npc_2", {"guard"});
    LivingNPC &jeweler = addNpc("npc_3", {"jeweler"});
    LivingNPC &drifter = addNpc("npc_4", {});

    BOOST_CHECK(smith.shouldWork() && smith.canCraft());
    BOOST_CHECK(guard.shouldWork() && !guard.canCraft());
    BOOST_CHECK(!jeweler.shouldWork() && jeweler.canCraft());
    BOOST_CHECK(!drifter.shouldWork() && !drifter.canCraft());
    BOOST_CHECK_EQUAL(drifter.getProfession(), "wanderer");
    BOOST_CHECK_EQUAL(smith.getProfession(), "blacksmith");
}

BOOST_AUTO_TEST_CASE(TestNonWorkerNeverStartsShift) {
    LivingNPC &jeweler = addNpc("npc_1", {"jeweler"});
    for (int i = 0; i < 30; ++i) {
        world->step(5);
        BOOST_CHECK(jeweler.getActivity() != NpcActivity::Working);
    }
}

BOOST_AUTO_TEST_CASE(TestBlacksmithCraftsWhileWorking) {
    LivingNPC &smith = addNpc("npc_1", {"blacksmith"});
    world->step(1);
    BOOST_REQUIRE_EQUAL(smith.getActivity(), NpcActivity::Working);

    // Each 5 minute tick rolls a 5% craft chance
    for (int i = 0; i < 100 && smith.getInventory().empty(); ++i) {
        smith.setEnergy(100.0);
        world->step(5);
    }
    BOOST_REQUIRE(!smith.getInventory().empty());

    const Item &item = smith.getInventory().front();
    BOOST_CHECK(item.templateName == "weapon_melee" || item.templateName == "armor");

    auto crafted = world->getEvents().getEventsByType(EventTypeId::ItemCrafted);
    BOOST_REQUIRE(!crafted.empty());
    BOOST_CHECK_EQUAL(crafted[0].sourceId.value_or(""), "npc_1");
    BOOST_CHECK(crafted[0].data.contains("item"));
}

BOOST_AUTO_TEST_CASE(TestJewelerCraftsJewelry) {
    // Jewelers craft but only work alongside a working profession
    LivingNPC &artisan = addNpc("npc_1", {"merchant", "jeweler"});
    BOOST_CHECK(artisan.canCraft());
    world->step(1);
    BOOST_REQUIRE_EQUAL(artisan.getActivity(), NpcActivity::Working);

    for (int i = 0; i < 100 && artisan.getInventory().empty(); ++i) {
        artisan.setEnergy(100.0);
        world->step(5);
    }
    BOOST_REQUIRE(!artisan.getInventory().empty());
    BOOST_CHECK_EQUAL(artisan.getInventory().front().templateName, "jewelry");
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// TRAVEL TESTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(TravelTests, LivingNPCFixture)

BOOST_AUTO_TEST_CASE(TestTravelArrivesAfterAnHour) {
    LivingNPC &npc = addNpc("npc_1", {"guard"});
    BOOST_REQUIRE(world->moveNpc("npc_1", "loc_b"));
    BOOST_CHECK_EQUAL(npc.getActivity(), NpcActivity::Traveling);
    BOOST_CHECK_EQUAL(npc.getDestinationId().value_or(""), "loc_b");

    world->step(30);
    BOOST_CHECK_CLOSE(npc.getTravelProgress(), 0.5, 1e-6);
    BOOST_CHECK_EQUAL(npc.getLocationId().value_or(""), "loc_a");

    world->step(30);
    BOOST_CHECK_EQUAL(npc.getActivity(), NpcActivity::Idle);
    BOOST_CHECK_EQUAL(npc.getLocationId().value_or(""), "loc_b");
    BOOST_CHECK(!npc.getDestinationId().has_value());
    BOOST_CHECK(world->getLocation("loc_b")->hasNpc("npc_1"));
    BOOST_CHECK(!world->getLocation("loc_a")->hasNpc("npc_1"));

    auto arrived = world->getEvents().getEventsByType(EventTypeId::NpcArrived);
    BOOST_REQUIRE_EQUAL(arrived.size(), 1u);
    BOOST_CHECK_EQUAL(arrived[0].data.at("from_location").tryAsString().value_or(""),
                      "loc_a");
    BOOST_CHECK_EQUAL(world->getEvents().getEventsByType(EventTypeId::NpcExitedLocation).size(),
                      1u);
}

BOOST_AUTO_TEST_CASE(TestMoveToCurrentLocationIsNoop) {
    LivingNPC &npc = addNpc("npc_1", {"guard"});
    npc.moveToLocation("loc_a", world->getEvents());
    BOOST_CHECK_EQUAL(npc.getActivity(), NpcActivity::Idle);
    BOOST_CHECK(!npc.getDestinationId().has_value());
}

BOOST_AUTO_TEST_CASE(TestEventsBecomeMemories) {
    LivingNPC &npc = addNpc("npc_1", {"guard"});
    world->moveNpc("npc_1", "loc_b");
    world->step(1);

    const auto memories = npc.getMemories();
    BOOST_REQUIRE(!memories.empty());
    bool found = false;
    for (const auto &memory : memories) {
        found = found || memory.find("npc_started_traveling") != std::string::npos;
    }
    BOOST_CHECK(found);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// MEMORY AND PERSISTENCE TESTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(PersistenceTests, LivingNPCFixture)

BOOST_AUTO_TEST_CASE(TestMemoryKeepsNewestEntries) {
    LivingNPC &npc = addNpc("npc_1", {"guard"});
    for (int i = 0; i < 25; ++i) {
        npc.addMemory("memory " + std::to_string(i));
    }

    const auto memories = npc.getMemories();
    BOOST_REQUIRE_EQUAL(memories.size(), LivingNPC::MEMORY_CAPACITY);
    BOOST_CHECK_EQUAL(memories.front(), "memory 5");
    BOOST_CHECK_EQUAL(memories.back(), "memory 24");
}

BOOST_AUTO_TEST_CASE(TestSerializeRoundTrip) {
    LivingNPC &npc = addNpc("npc_1", {"blacksmith"});
    npc.setEnergy(62.5);
    npc.setHunger(33.0);
    npc.setGold(250);
    npc.addMemory("met a traveller");
    world->moveNpc("npc_1", "loc_b");
    world->step(20);

    const JsonValue state = npc.serialize();
    BOOST_CHECK_EQUAL(state["kind"].tryAsString().value_or(""), "npc");
    BOOST_CHECK_EQUAL(state["current_activity"].tryAsString().value_or(""), "traveling");

    auto restored = EntityFactory::npcFromJson(state);
    BOOST_REQUIRE(restored);
    BOOST_CHECK(restored->serialize() == state);
    BOOST_CHECK_EQUAL(restored->getGold(), 250);
    BOOST_CHECK_EQUAL(restored->getDestinationId().value_or(""), "loc_b");
    BOOST_CHECK_EQUAL(restored->getMemories().size(), npc.getMemories().size());
}

BOOST_AUTO_TEST_CASE(TestDeserializeRejectsUnknownActivity) {
    LivingNPC &npc = addNpc("npc_1", {"guard"});
    JsonValue state = npc.serialize();
    state["current_activity"] = JsonValue("dancing");

    BOOST_CHECK(!npc.deserialize(state));
    BOOST_CHECK(EntityFactory::npcFromJson(state) == nullptr);
    BOOST_CHECK(!npc.deserialize(JsonValue("not an object")));
}

BOOST_AUTO_TEST_CASE(TestOversizedNumbersFallBackToDefaults) {
    LivingNPC &npc = addNpc("npc_1", {"guard"});
    JsonValue state = npc.serialize();
    state["gold"] = JsonValue(1e20);
    state["work_start_hour"] = JsonValue(-1e20);

    auto restored = EntityFactory::npcFromJson(state);
    BOOST_REQUIRE(restored);
    BOOST_CHECK_EQUAL(restored->getGold(), EntityFactory::MIN_STARTING_GOLD);
    BOOST_CHECK_EQUAL(restored->getWorkStartHour(), 8);
}

BOOST_AUTO_TEST_CASE(TestActivityNames) {
    BOOST_CHECK_EQUAL(npcActivityName(NpcActivity::Socializing), "socializing");
    BOOST_CHECK(npcActivityFromName("sleeping") == NpcActivity::Sleeping);
    BOOST_CHECK(!npcActivityFromName("Sleeping").has_value());
}

BOOST_AUTO_TEST_SUITE_END()
