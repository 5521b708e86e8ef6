/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE TimeManagerTests
#include <boost/test/unit_test.hpp>

#include "core/Logger.hpp"
#include "core/TimeManager.hpp"
#include "utils/JsonReader.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using namespace Realmforge;

// ============================================================================
// Test Fixture
// ============================================================================

class TimeManagerFixture {
public:
    TimeManagerFixture() : time(1, 1, 8) {
        REALM_ENABLE_BENCHMARK_MODE();
    }

    ~TimeManagerFixture() {
        REALM_DISABLE_BENCHMARK_MODE();
    }

protected:
    TimeManager time;
};

// ============================================================================
// CALENDAR ARITHMETIC TESTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(CalendarTests, TimeManagerFixture)

BOOST_AUTO_TEST_CASE(TestInitialState) {
    BOOST_CHECK_EQUAL(time.getYear(), 1);
    BOOST_CHECK_EQUAL(time.getDay(), 1);
    BOOST_CHECK_EQUAL(time.getHour(), 8);
    BOOST_CHECK_EQUAL(time.getMinute(), 0);
    BOOST_CHECK_EQUAL(time.getTotalMinutes(), 0);
}

BOOST_AUTO_TEST_CASE(TestRolloverPastMidnight) {
    TimeManager late(1, 1, 23);
    auto result = late.advanceMinutes(120);

    BOOST_CHECK_EQUAL(result.minutesAdvanced, 120);
    BOOST_CHECK_EQUAL(late.getHour(), 1);
    BOOST_CHECK_EQUAL(late.getMinute(), 0);
    BOOST_CHECK_EQUAL(late.getDay(), 2);
    BOOST_CHECK_EQUAL(late.getTotalMinutes(), 120);
}

BOOST_AUTO_TEST_CASE(TestYearRollover) {
    TimeManager lastDay(3, 360, 22);
    lastDay.advanceHours(3);

    BOOST_CHECK_EQUAL(lastDay.getYear(), 4);
    BOOST_CHECK_EQUAL(lastDay.getDay(), 1);
    BOOST_CHECK_EQUAL(lastDay.getHour(), 1);
}

BOOST_AUTO_TEST_CASE(TestLargeAdvanceCarriesEveryField) {
    // Two years, five days, seven hours and thirteen minutes
    const int64_t minutes = (2 * 360 + 5) * 24 * 60 + 7 * 60 + 13;
    time.advanceMinutes(minutes);

    BOOST_CHECK_EQUAL(time.getYear(), 3);
    BOOST_CHECK_EQUAL(time.getDay(), 6);
    BOOST_CHECK_EQUAL(time.getHour(), 15);
    BOOST_CHECK_EQUAL(time.getMinute(), 13);
    BOOST_CHECK_EQUAL(time.getTotalMinutes(), minutes);
}

BOOST_AUTO_TEST_CASE(TestZeroAdvanceIsNoOp) {
    auto result = time.advanceMinutes(0);
    BOOST_CHECK_EQUAL(result.minutesAdvanced, 0);
    BOOST_CHECK_EQUAL(time.getHour(), 8);
    BOOST_CHECK_EQUAL(time.getTotalMinutes(), 0);
}

BOOST_AUTO_TEST_CASE(TestNegativeAdvanceThrows) {
    BOOST_CHECK_THROW(time.advanceMinutes(-1), std::invalid_argument);
    BOOST_CHECK_EQUAL(time.getTotalMinutes(), 0);
}

BOOST_AUTO_TEST_CASE(TestInvalidConstruction) {
    BOOST_CHECK_THROW(TimeManager(1, 0, 8), std::invalid_argument);
    BOOST_CHECK_THROW(TimeManager(1, 361, 8), std::invalid_argument);
    BOOST_CHECK_THROW(TimeManager(1, 1, 24), std::invalid_argument);
    BOOST_CHECK_THROW(TimeManager(0, 1, 8), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(TestAdvanceToTimeLaterToday) {
    time.advanceToTime(17, 30);
    BOOST_CHECK_EQUAL(time.getDay(), 1);
    BOOST_CHECK_EQUAL(time.getHour(), 17);
    BOOST_CHECK_EQUAL(time.getMinute(), 30);
    BOOST_CHECK_EQUAL(time.getTotalMinutes(), 9 * 60 + 30);
}

BOOST_AUTO_TEST_CASE(TestAdvanceToTimeWrapsToTomorrow) {
    time.advanceToTime(6);
    BOOST_CHECK_EQUAL(time.getDay(), 2);
    BOOST_CHECK_EQUAL(time.getHour(), 6);

    // Same time as now means a full day ahead
    time.advanceToTime(6);
    BOOST_CHECK_EQUAL(time.getDay(), 3);
    BOOST_CHECK_EQUAL(time.getTotalMinutes(), 22 * 60 + 24 * 60);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// DERIVED QUERY TESTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(QueryTests, TimeManagerFixture)

BOOST_AUTO_TEST_CASE(TestSeasons) {
    BOOST_CHECK(time.getSeason() == Season::Spring);

    time.setTime(1, 91, 8);
    BOOST_CHECK(time.getSeason() == Season::Summer);

    time.setTime(1, 181, 8);
    BOOST_CHECK(time.getSeason() == Season::Fall);

    time.setTime(1, 360, 8);
    BOOST_CHECK(time.getSeason() == Season::Winter);
    BOOST_CHECK_EQUAL(std::string(time.getSeasonName()), "Winter");
}

BOOST_AUTO_TEST_CASE(TestTimeOfDayBoundaries) {
    const std::vector<std::pair<int, TimeOfDay>> expected{
        {0, TimeOfDay::Night},      {5, TimeOfDay::Night},
        {6, TimeOfDay::Dawn},       {8, TimeOfDay::Morning},
        {12, TimeOfDay::Afternoon}, {17, TimeOfDay::Dusk},
        {19, TimeOfDay::Evening},   {23, TimeOfDay::Evening}};

    for (const auto &[hour, period] : expected) {
        time.setTime(1, 1, hour);
        BOOST_CHECK_MESSAGE(time.getTimeOfDay() == period,
                            "hour " << hour << " gave " << time.getTimeOfDay());
    }
}

BOOST_AUTO_TEST_CASE(TestDaylightAndWorkingHours) {
    time.setTime(1, 1, 5);
    BOOST_CHECK(!time.isDaytime());
    BOOST_CHECK(!time.isWorkingHours());

    time.setTime(1, 1, 7);
    BOOST_CHECK(time.isDaytime());
    BOOST_CHECK(!time.isWorkingHours());

    time.setTime(1, 1, 16, 59);
    BOOST_CHECK(time.isWorkingHours());

    time.setTime(1, 1, 17);
    BOOST_CHECK(!time.isWorkingHours());
    BOOST_CHECK(time.isDaytime());

    time.setTime(1, 1, 19);
    BOOST_CHECK(time.isNighttime());
}

BOOST_AUTO_TEST_CASE(TestFormatting) {
    time.setTime(2, 95, 9, 5);
    BOOST_CHECK_EQUAL(time.formatTime(), "09:05");
    BOOST_CHECK_EQUAL(time.formatDate(), "Year 2, Day 95");
    BOOST_CHECK_EQUAL(time.getMonth(), 4);
    BOOST_CHECK_EQUAL(time.getDayOfMonth(), 5);
    BOOST_CHECK_EQUAL(time.formatDateTime(),
                      "Year 2, Summer, Month 4, Day 5 - 09:05 (morning)");
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// SCHEDULED CALLBACK TESTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(SchedulingTests, TimeManagerFixture)

BOOST_AUTO_TEST_CASE(TestCallbackFiresOnExactTick) {
    int fired = 0;
    time.scheduleIn(30, [&fired]() { ++fired; }, "bell");

    time.advanceMinutes(29);
    BOOST_CHECK_EQUAL(fired, 0);

    auto result = time.advanceMinutes(1);
    BOOST_CHECK_EQUAL(fired, 1);
    BOOST_CHECK_EQUAL(result.callbacksFired, 1u);
    BOOST_CHECK_EQUAL(time.getScheduledCount(), 0u);
}

BOOST_AUTO_TEST_CASE(TestExactTickPolicySkipsOvershoot) {
    int fired = 0;
    time.scheduleIn(30, [&fired]() { ++fired; });

    time.advanceMinutes(60);
    BOOST_CHECK_EQUAL(fired, 0);
    BOOST_CHECK_EQUAL(time.getScheduledCount(), 1u);
}

BOOST_AUTO_TEST_CASE(TestFireOnOrAfterPolicyCatchesUp) {
    time.setMissedCallbackPolicy(MissedCallbackPolicy::FireOnOrAfter);
    std::vector<int> order;
    time.scheduleIn(45, [&order]() { order.push_back(2); });
    time.scheduleIn(15, [&order]() { order.push_back(1); });

    auto result = time.advanceMinutes(60);
    BOOST_CHECK_EQUAL(result.callbacksFired, 2u);
    BOOST_REQUIRE_EQUAL(order.size(), 2u);
    BOOST_CHECK_EQUAL(order[0], 1);
    BOOST_CHECK_EQUAL(order[1], 2);
}

BOOST_AUTO_TEST_CASE(TestCancelScheduled) {
    int fired = 0;
    const uint64_t id = time.scheduleIn(10, [&fired]() { ++fired; });

    BOOST_CHECK(time.cancelScheduled(id));
    BOOST_CHECK(!time.cancelScheduled(id));

    time.advanceMinutes(10);
    BOOST_CHECK_EQUAL(fired, 0);
}

BOOST_AUTO_TEST_CASE(TestThrowingCallbackIsReported) {
    int fired = 0;
    const uint64_t badId = time.scheduleIn(
        5, []() { throw std::runtime_error("boom"); }, "faulty");
    time.scheduleIn(5, [&fired]() { ++fired; });

    auto result = time.advanceMinutes(5);
    BOOST_CHECK_EQUAL(fired, 1);
    BOOST_CHECK_EQUAL(result.callbacksFired, 1u);
    BOOST_REQUIRE_EQUAL(result.failures.size(), 1u);
    BOOST_CHECK_EQUAL(result.failures[0].callbackId, badId);
    BOOST_CHECK_EQUAL(result.failures[0].label, "faulty");
    BOOST_CHECK_EQUAL(result.failures[0].tick, 5);
    BOOST_CHECK_EQUAL(result.failures[0].message, "boom");
}

BOOST_AUTO_TEST_CASE(TestCallbackMayScheduleAnother) {
    int fired = 0;
    time.scheduleIn(10, [this, &fired]() {
        ++fired;
        time.scheduleIn(10, [&fired]() { ++fired; });
    });

    time.advanceMinutes(10);
    BOOST_CHECK_EQUAL(fired, 1);
    BOOST_CHECK_EQUAL(time.getScheduledCount(), 1u);

    time.advanceMinutes(10);
    BOOST_CHECK_EQUAL(fired, 2);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// PERSISTENCE TESTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(PersistenceTests, TimeManagerFixture)

BOOST_AUTO_TEST_CASE(TestJsonRoundTrip) {
    time.advanceMinutes(3 * 24 * 60 + 75);
    JsonValue json = time.toJson();

    BOOST_CHECK_EQUAL(json["current_day"].asInt(), 4);
    BOOST_CHECK_EQUAL(json["current_hour"].asInt(), 9);
    BOOST_CHECK_EQUAL(json["current_minute"].asInt(), 15);

    TimeManager restored;
    BOOST_REQUIRE(restored.loadFromJson(json));
    BOOST_CHECK_EQUAL(restored.getDay(), 4);
    BOOST_CHECK_EQUAL(restored.getHour(), 9);
    BOOST_CHECK_EQUAL(restored.getMinute(), 15);
    BOOST_CHECK_EQUAL(restored.getTotalMinutes(), time.getTotalMinutes());
}

BOOST_AUTO_TEST_CASE(TestRejectsOutOfRangeState) {
    JsonValue json = time.toJson();
    json["current_hour"] = JsonValue(25);

    TimeManager restored(1, 50, 3);
    BOOST_CHECK(!restored.loadFromJson(json));
    BOOST_CHECK_EQUAL(restored.getDay(), 50);
    BOOST_CHECK_EQUAL(restored.getHour(), 3);
}

BOOST_AUTO_TEST_CASE(TestRejectsMissingField) {
    JsonReader reader;
    BOOST_REQUIRE(reader.parse(R"({"current_year": 1, "current_day": 2})"));

    BOOST_CHECK(!time.loadFromJson(reader.getRoot()));
    BOOST_CHECK_EQUAL(time.getDay(), 1);
}

BOOST_AUTO_TEST_SUITE_END()
