/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE LoggerTests
#include <boost/test/unit_test.hpp>

#include "core/Logger.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

using namespace Realmforge;

namespace fs = std::filesystem;

namespace {

std::string readFile(const fs::path &path) {
    std::ifstream file(path);
    return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

size_t countLogs(const fs::path &dir, const std::string &prefix) {
    size_t count = 0;
    for (const auto &entry : fs::directory_iterator(dir)) {
        const std::string name = entry.path().filename().string();
        if (entry.path().extension() == ".log" && name.rfind(prefix + "_", 0) == 0) {
            ++count;
        }
    }
    return count;
}

} // namespace

// ============================================================================
// Test Fixture
// ============================================================================

class LogDirFixture {
public:
    LogDirFixture() : logDir(fs::temp_directory_path() / "realmforge_logger_test") {
        fs::remove_all(logDir);
    }

    ~LogDirFixture() {
        std::error_code ec;
        fs::remove_all(logDir, ec);
    }

protected:
    fs::path logDir;

    void touch(const std::string &name) {
        fs::create_directories(logDir);
        std::ofstream(logDir / name) << "old\n";
    }
};

// ============================================================================
// FILE SINK TESTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(FileSinkTests, LogDirFixture)

BOOST_AUTO_TEST_CASE(TestOpenCreatesPrefixedFile) {
    LogFileSink sink(logDir / "nested", "realm");
    BOOST_CHECK(!sink.isOpen());
    BOOST_REQUIRE(sink.open());
    BOOST_CHECK(sink.isOpen());
    BOOST_CHECK(fs::exists(sink.getPath()));
    BOOST_CHECK(sink.getPath().filename().string().rfind("realm_", 0) == 0);
    BOOST_CHECK_EQUAL(sink.getPath().extension().string(), ".log");

    // Opening twice keeps the same file
    const fs::path first = sink.getPath();
    BOOST_CHECK(sink.open());
    BOOST_CHECK(sink.getPath() == first);
}

BOOST_AUTO_TEST_CASE(TestCriticalFlushesImmediately) {
    LogFileSink sink(logDir, "realm", 5, 50);
    BOOST_REQUIRE(sink.open());

    sink.write("ERROR", "World", "first problem");
    BOOST_CHECK_EQUAL(sink.getPendingLines(), 1u);

    sink.write("CRITICAL", "SaveGameManager", "disk on fire");
    BOOST_CHECK_EQUAL(sink.getPendingLines(), 0u);

    const std::string contents = readFile(sink.getPath());
    BOOST_CHECK(contents.find("[ERROR] [World] first problem") != std::string::npos);
    BOOST_CHECK(contents.find("[CRITICAL] [SaveGameManager] disk on fire") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(TestFlushEveryInterval) {
    LogFileSink sink(logDir, "realm", 5, 3);
    BOOST_REQUIRE(sink.open());

    sink.write("ERROR", "NPC", "one");
    sink.write("ERROR", "NPC", "two");
    BOOST_CHECK_EQUAL(sink.getPendingLines(), 2u);
    sink.write("ERROR", "NPC", "three");
    BOOST_CHECK_EQUAL(sink.getPendingLines(), 0u);
    BOOST_CHECK(readFile(sink.getPath()).find("[NPC] three") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(TestWriteBeforeOpenIsIgnored) {
    LogFileSink sink(logDir, "realm");
    sink.write("CRITICAL", "World", "nowhere to go");
    BOOST_CHECK_EQUAL(sink.getPendingLines(), 0u);
    BOOST_CHECK(!fs::exists(logDir));
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// ROTATION TESTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(RotationTests, LogDirFixture)

BOOST_AUTO_TEST_CASE(TestPruneRemovesOldestByName) {
    touch("realm_20240101_000000.log");
    touch("realm_20240102_000000.log");
    touch("realm_20240103_000000.log");
    touch("realm_20240104_000000.log");
    touch("other_20230101_000000.log");
    touch("realm_notes.txt");

    BOOST_CHECK_EQUAL(LogFileSink::pruneOldLogs(logDir, "realm", 2), 2u);
    BOOST_CHECK(!fs::exists(logDir / "realm_20240101_000000.log"));
    BOOST_CHECK(!fs::exists(logDir / "realm_20240102_000000.log"));
    BOOST_CHECK(fs::exists(logDir / "realm_20240104_000000.log"));

    // Other prefixes and extensions are left alone
    BOOST_CHECK(fs::exists(logDir / "other_20230101_000000.log"));
    BOOST_CHECK(fs::exists(logDir / "realm_notes.txt"));

    BOOST_CHECK_EQUAL(LogFileSink::pruneOldLogs(logDir, "realm", 2), 0u);
}

BOOST_AUTO_TEST_CASE(TestOpenKeepsConfiguredFileCount) {
    for (int day = 1; day <= 6; ++day) {
        touch("realm_2024010" + std::to_string(day) + "_000000.log");
    }

    LogFileSink sink(logDir, "realm", 3);
    BOOST_REQUIRE(sink.open());
    BOOST_CHECK_EQUAL(countLogs(logDir, "realm"), 3u);
    BOOST_CHECK(fs::exists(sink.getPath()));
    BOOST_CHECK(fs::exists(logDir / "realm_20240106_000000.log"));
}

BOOST_AUTO_TEST_CASE(TestPruneMissingDirectory) {
    BOOST_CHECK_EQUAL(LogFileSink::pruneOldLogs(logDir / "absent", "realm", 1), 0u);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// BENCHMARK MODE TESTS
// ============================================================================

BOOST_AUTO_TEST_SUITE(BenchmarkModeTests)

BOOST_AUTO_TEST_CASE(TestBenchmarkModeToggles) {
    REALM_ENABLE_BENCHMARK_MODE();
    BOOST_CHECK(Logger::IsBenchmarkMode());
    WORLD_ERROR("silenced while benchmarking");
    REALM_DISABLE_BENCHMARK_MODE();
    BOOST_CHECK(!Logger::IsBenchmarkMode());
}

BOOST_AUTO_TEST_SUITE_END()
