/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE WorldRegistryTests
#include <boost/test/unit_test.hpp>

#include "core/CoreErrors.hpp"
#include "core/Logger.hpp"
#include "storage/PlayerRepository.hpp"
#include "storage/WorldStorage.hpp"
#include "world/PlayerRegistry.hpp"
#include "world/WorldRegistry.hpp"
#include "mocks/TempDirectory.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace Lifeline;

struct WorldFixture {
    WorldFixture() : worlds(temp.path(), StorageOptions{}) {
        Logger::SetQuietMode(true);
    }

    TempDirectory temp;
    WorldRegistry worlds;
};

BOOST_FIXTURE_TEST_SUITE(WorldRegistryTestSuite, WorldFixture)

BOOST_AUTO_TEST_CASE(TestGetOrCreateReportsCreation) {
    bool created = false;
    auto first = worlds.getOrCreate("overworld", &created);
    BOOST_REQUIRE(first);
    BOOST_CHECK(created);
    BOOST_CHECK_EQUAL(first->getWorldId(), "overworld");

    auto second = worlds.getOrCreate("overworld", &created);
    BOOST_CHECK(!created);
    BOOST_CHECK(first == second);
    BOOST_CHECK_EQUAL(worlds.size(), 1u);

    // Storage opens lazily
    BOOST_CHECK(!first->isStorageOpen());
    BOOST_CHECK(first->getStorage() != nullptr);
    BOOST_CHECK(first->isStorageOpen());
    BOOST_CHECK(std::filesystem::exists(temp.path() / "overworld" / WorldStorage::DATABASE_FILE));
}

BOOST_AUTO_TEST_CASE(TestWorldIdsMustBeSafeDirectoryNames) {
    BOOST_CHECK(WorldRegistry::isValidWorldId("world_nether-2.old"));
    BOOST_CHECK(!WorldRegistry::isValidWorldId(""));
    BOOST_CHECK(!WorldRegistry::isValidWorldId(".."));
    BOOST_CHECK(!WorldRegistry::isValidWorldId("a/b"));
    BOOST_CHECK(!WorldRegistry::isValidWorldId("space here"));
    BOOST_CHECK(!WorldRegistry::isValidWorldId(std::string(129, 'w')));

    BOOST_CHECK_THROW(worlds.getOrCreate("../escape"), std::invalid_argument);
    BOOST_CHECK_EQUAL(worlds.size(), 0u);
}

BOOST_AUTO_TEST_CASE(TestRemoveClosesWorld) {
    auto world = worlds.getOrCreate("overworld");
    auto storage = world->getStorage();

    BOOST_CHECK(worlds.remove("overworld"));
    BOOST_CHECK(!worlds.remove("overworld"));
    BOOST_CHECK(worlds.find("overworld") == nullptr);

    BOOST_CHECK(world->isClosed());
    BOOST_CHECK(!storage->isOpen());
    BOOST_CHECK_THROW(world->getStorage(), std::logic_error);
    BOOST_CHECK(world->tryGetStorage() == nullptr);
}

BOOST_AUTO_TEST_CASE(TestCloseAllEmptiesRegistry) {
    auto a = worlds.getOrCreate("a");
    auto b = worlds.getOrCreate("b");
    std::vector<std::string> ids = worlds.getWorldIds();
    BOOST_REQUIRE_EQUAL(ids.size(), 2u);
    BOOST_CHECK_EQUAL(ids[0], "a");
    BOOST_CHECK_EQUAL(ids[1], "b");

    worlds.closeAll();
    BOOST_CHECK_EQUAL(worlds.size(), 0u);
    BOOST_CHECK(a->isClosed());
    BOOST_CHECK(b->isClosed());
}

BOOST_AUTO_TEST_CASE(TestCorruptStorageIsRemembered) {
    std::filesystem::create_directories(temp.path() / "broken");
    temp.writeFile("broken/world.db", std::string(4096, 'x'));

    auto world = worlds.getOrCreate("broken");
    BOOST_CHECK(world->tryGetStorage() == nullptr);
    BOOST_CHECK(world->isStorageDegraded());
    BOOST_CHECK_THROW(world->getStorage(), StorageCorrupt);

    // Player bookkeeping is skipped, not fatal
    world->recordPlayerSeen("p1");

    auto healthy = worlds.getOrCreate("healthy");
    BOOST_CHECK(healthy->tryGetStorage() != nullptr);
    BOOST_CHECK(!healthy->isStorageDegraded());
}

BOOST_AUTO_TEST_CASE(TestRecordPlayerSeen) {
    auto world = worlds.getOrCreate("overworld");
    world->recordPlayerSeen("p1");
    world->recordPlayerSeen("p2");
    world->recordPlayerSeen("p1");

    PlayerRepository players(*world->getStorage());
    BOOST_CHECK_EQUAL(players.count(), 2u);
    auto record = players.find("p1");
    BOOST_REQUIRE(record);
    BOOST_CHECK_LE(record->firstSeen, record->lastSeen);
}

BOOST_AUTO_TEST_CASE(TestRecordPlayerSeenSurvivesStorageErrors) {
    auto world = worlds.getOrCreate("overworld");
    world->getStorage()->execute("DROP TABLE players");

    BOOST_CHECK_NO_THROW(world->recordPlayerSeen("p1"));
    BOOST_CHECK(world->tryGetStorage() != nullptr);
}

BOOST_AUTO_TEST_CASE(TestCloseWithBusyStorageDoesNotThrow) {
    StorageOptions options;
    options.busyTimeout = std::chrono::milliseconds(50);
    WorldRegistry shortWaits(temp.path() / "short", options);
    auto world = shortWaits.getOrCreate("overworld");
    std::shared_ptr<WorldStorage> storage = world->getStorage();

    std::atomic<bool> holding{false};
    std::thread writer([&]() {
        storage->transaction([&](Transaction&) {
            holding = true;
            std::this_thread::sleep_for(std::chrono::milliseconds(300));
        });
    });
    while (!holding.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    BOOST_CHECK_NO_THROW(world->close());
    BOOST_CHECK(world->isClosed());

    writer.join();
    // The last owner finishes the close
    BOOST_CHECK_NO_THROW(storage.reset());
}

BOOST_AUTO_TEST_CASE(TestModuleStateSlots) {
    auto world = worlds.getOrCreate("overworld");
    int factoryCalls = 0;
    auto factory = [&factoryCalls] {
        ++factoryCalls;
        return std::make_shared<int>(42);
    };

    auto first = world->getOrCreateModuleState<int>("metabolism", factory);
    auto second = world->getOrCreateModuleState<int>("metabolism", factory);
    BOOST_CHECK_EQUAL(factoryCalls, 1);
    BOOST_CHECK(first == second);
    BOOST_CHECK_EQUAL(*world->getModuleState<int>("metabolism"), 42);
    BOOST_CHECK(world->getModuleState<int>("other") == nullptr);

    BOOST_CHECK(world->removeModuleState("metabolism"));
    BOOST_CHECK(!world->removeModuleState("metabolism"));
    BOOST_CHECK(world->getModuleState<int>("metabolism") == nullptr);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(PlayerRegistryTestSuite)

BOOST_AUTO_TEST_CASE(TestBindReportsPreviousWorld) {
    PlayerRegistry players;
    BOOST_CHECK(!players.bind("p1", "overworld"));
    auto previous = players.bind("p1", "nether");
    BOOST_REQUIRE(previous);
    BOOST_CHECK_EQUAL(*previous, "overworld");
    BOOST_CHECK_EQUAL(*players.getWorld("p1"), "nether");
    BOOST_CHECK_EQUAL(players.size(), 1u);
}

BOOST_AUTO_TEST_CASE(TestPlayersInWorldAreSorted) {
    PlayerRegistry players;
    players.bind("zed", "overworld");
    players.bind("amy", "overworld");
    players.bind("bob", "nether");

    std::vector<std::string> inOverworld = players.getPlayersIn("overworld");
    BOOST_REQUIRE_EQUAL(inOverworld.size(), 2u);
    BOOST_CHECK_EQUAL(inOverworld[0], "amy");
    BOOST_CHECK_EQUAL(inOverworld[1], "zed");

    BOOST_CHECK(players.unbind("amy"));
    BOOST_CHECK(!players.unbind("amy"));
    BOOST_CHECK(!players.getWorld("amy"));
    BOOST_CHECK(players.getPlayersIn("void").empty());
}

BOOST_AUTO_TEST_SUITE_END()
