/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE MetabolismConfigTests
#include <boost/test/unit_test.hpp>

#include "core/Logger.hpp"
#include "managers/ConfigStore.hpp"
#include "metabolism/ActivityState.hpp"
#include "metabolism/MetabolismConfig.hpp"
#include "utils/JsonReader.hpp"
#include "mocks/TempDirectory.hpp"

#include <string>

using namespace Lifeline;

namespace {

JsonValue parse(const std::string& text) {
    JsonReader reader;
    BOOST_REQUIRE_MESSAGE(reader.parse(text), reader.getLastError());
    return reader.getRoot();
}

bool isValid(const std::string& text, std::string& error) {
    return MetabolismConfig::validate(parse(text), error);
}

} // namespace

struct MetabolismConfigFixture {
    MetabolismConfigFixture() : store(temp.path()) {
        Logger::SetQuietMode(true);
        store.getMigrations().registerMigrations(MetabolismConfig::DOCUMENT_NAME,
                                                 MetabolismConfig::migrations());
    }

    TempDirectory temp;
    ConfigStore store;
};

BOOST_AUTO_TEST_SUITE(ActivityStateTestSuite)

BOOST_AUTO_TEST_CASE(TestClassificationPriority) {
    MovementFlags flags;
    BOOST_CHECK(classifyMovement(flags) == ActivityState::Idle);

    flags.walking = true;
    BOOST_CHECK(classifyMovement(flags) == ActivityState::Walking);
    flags.swimming = true;
    BOOST_CHECK(classifyMovement(flags) == ActivityState::Swimming);
    flags.sprinting = true;
    BOOST_CHECK(classifyMovement(flags) == ActivityState::Sprinting);
    flags.inCombat = true;
    BOOST_CHECK(classifyMovement(flags) == ActivityState::Combat);

    MovementFlags running;
    running.running = true;
    BOOST_CHECK(classifyMovement(running) == ActivityState::Walking);
}

BOOST_AUTO_TEST_CASE(TestActivityKeys) {
    BOOST_CHECK_EQUAL(std::string(activityKey(ActivityState::Sprinting)), "sprinting");
    BOOST_CHECK(activityFromKey("combat") == ActivityState::Combat);
    BOOST_CHECK(!activityFromKey("flying"));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(MetabolismConfigTestSuite, MetabolismConfigFixture)

BOOST_AUTO_TEST_CASE(TestDefaultsAreValid) {
    MetabolismConfig defaults;
    std::string error;
    BOOST_CHECK_MESSAGE(MetabolismConfig::validate(defaults.toJson(), error), error);

    BOOST_CHECK_EQUAL(defaults.stats.size(), 3u);
    BOOST_CHECK_EQUAL(defaults.effects.size(), 12u);
    BOOST_CHECK_EQUAL(defaults.stats.at("hunger").getMultiplier(ActivityState::Combat), 2.5);
    BOOST_CHECK_EQUAL(defaults.stats.at("energy").getMultiplier(ActivityState::Idle), 0.3);
}

BOOST_AUTO_TEST_CASE(TestJsonRoundTripKeepsValues) {
    MetabolismConfig config;
    config.tickPeriodMs = 250;
    config.stats["hunger"].rate = 4.0;
    config.stats["hunger"].activityMultipliers.erase("swimming");

    MetabolismConfig copy = MetabolismConfig::fromJson(config.toJson());
    BOOST_CHECK_EQUAL(copy.tickPeriodMs, 250);
    BOOST_CHECK_EQUAL(copy.stats.at("hunger").rate, 4.0);
    // Missing multipliers count as 1.0
    BOOST_CHECK_EQUAL(copy.stats.at("hunger").getMultiplier(ActivityState::Swimming), 1.0);
    BOOST_CHECK_EQUAL(copy.effects.size(), config.effects.size());
}

BOOST_AUTO_TEST_CASE(TestMissingFileWritesCurrentVersion) {
    MetabolismConfig config = store.load<MetabolismConfig>(MetabolismConfig::DOCUMENT_NAME);
    BOOST_CHECK(store.getStatus("metabolism") == ConfigLoadStatus::CreatedDefault);
    BOOST_CHECK_EQUAL(config.flushIntervalTicks, 60);

    JsonValue written = parse(temp.readFile("metabolism.json"));
    BOOST_CHECK_EQUAL(written.getInt("configVersion", 0), MetabolismConfig::CURRENT_VERSION);
    BOOST_CHECK(written["stats"].hasKey("thirst"));
}

BOOST_AUTO_TEST_CASE(TestLegacyDocumentMigratesToCurrent) {
    const std::string legacy = R"({
        "hunger": {"baseDepletionRateSeconds": 3000, "activityMultipliers": {"sprinting": 2.0}},
        "thirst": {"baseDepletionRateSeconds": 2400},
        "energy": {"baseDepletionRateSeconds": 6000},
        "tickPeriodMs": 500,
        "saveIntervalSeconds": 30,
        "serverNote": "keep"
    })";
    temp.writeFile("metabolism.json", legacy);

    MetabolismConfig config = store.load<MetabolismConfig>(MetabolismConfig::DOCUMENT_NAME);
    BOOST_REQUIRE(store.getStatus("metabolism") == ConfigLoadStatus::Migrated);
    BOOST_CHECK_EQUAL(temp.readFile("metabolism.v1.json.backup"), legacy);

    // 100 units over 3000 s is 2 per minute
    BOOST_CHECK_CLOSE(config.stats.at("hunger").rate, 2.0, 1e-9);
    BOOST_CHECK_CLOSE(config.stats.at("thirst").rate, 2.5, 1e-9);
    BOOST_CHECK_CLOSE(config.stats.at("energy").rate, 1.0, 1e-9);
    BOOST_CHECK_EQUAL(config.stats.at("hunger").getMultiplier(ActivityState::Sprinting), 2.0);
    BOOST_CHECK_EQUAL(config.stats.at("hunger").max, 100.0);

    // 30 s at 500 ms per tick
    BOOST_CHECK_EQUAL(config.flushIntervalTicks, 60);
    BOOST_CHECK_EQUAL(config.effects.size(), 12u);

    JsonValue written = parse(temp.readFile("metabolism.json"));
    BOOST_CHECK_EQUAL(written.getInt("configVersion", 0), 3);
    BOOST_CHECK(!written.hasKey("hunger"));
    BOOST_CHECK(!written.hasKey("saveIntervalSeconds"));
    BOOST_CHECK_EQUAL(written.getString("serverNote", ""), "keep");
}

BOOST_AUTO_TEST_CASE(TestPartialLegacyDocumentOnlyGetsMatchingEffects) {
    temp.writeFile("metabolism.json", R"({"hunger": {"baseDepletionRateSeconds": 600}})");

    MetabolismConfig config = store.load<MetabolismConfig>(MetabolismConfig::DOCUMENT_NAME);
    BOOST_REQUIRE(store.getStatus("metabolism") == ConfigLoadStatus::Migrated);
    BOOST_CHECK_EQUAL(config.stats.size(), 1u);
    BOOST_CHECK_CLOSE(config.stats.at("hunger").rate, 10.0, 1e-9);
    BOOST_CHECK_EQUAL(config.effects.size(), 4u);
    for (const auto& effect : config.effects) {
        BOOST_CHECK_EQUAL(effect.stat, "hunger");
    }
}

BOOST_AUTO_TEST_CASE(TestBrokenLegacyRateKeepsOriginalFile) {
    const std::string legacy = R"({"hunger": {"baseDepletionRateSeconds": 0}})";
    temp.writeFile("metabolism.json", legacy);

    MetabolismConfig config = store.load<MetabolismConfig>(MetabolismConfig::DOCUMENT_NAME);
    BOOST_CHECK(store.getStatus("metabolism") == ConfigLoadStatus::MigrationFailed);
    BOOST_CHECK_EQUAL(temp.readFile("metabolism.json"), legacy);
    BOOST_CHECK_EQUAL(config.stats.size(), 3u);
}

BOOST_AUTO_TEST_CASE(TestValidationFailures) {
    std::string error;
    BOOST_CHECK(!isValid(R"({"tickPeriodMs": 10})", error));
    BOOST_CHECK(error.find("tickPeriodMs") != std::string::npos);

    BOOST_CHECK(!isValid(R"({"flushIntervalTicks": 0})", error));
    BOOST_CHECK(!isValid(R"({"hysteresisEpsilon": 0})", error));
    BOOST_CHECK(!isValid(R"({"stats": {"hunger": {"min": 50, "max": 10}}})", error));
    BOOST_CHECK(!isValid(R"({"stats": {"hunger": {"default": 150}}})", error));
    BOOST_CHECK(!isValid(R"({"stats": {"hunger": {"rate": "fast"}}})", error));

    BOOST_CHECK(!isValid(R"({"stats": {"hunger": {"activityMultipliers": {"flying": 2}}}})",
                         error));
    BOOST_CHECK(error.find("flying") != std::string::npos);

    BOOST_CHECK(!isValid(R"({"effects": [{"name": "Odd", "stat": "hunger",
                                           "direction": "sideways", "enter": 1, "exit": 5}]})",
                         error));
    BOOST_CHECK(!isValid(R"({"effects": [{"name": "Ghost", "stat": "mana",
                                           "direction": "low", "enter": 1, "exit": 5}]})",
                         error));
    BOOST_CHECK(!isValid(R"({"effects": [
            {"name": "Same", "stat": "hunger", "direction": "low", "enter": 10, "exit": 20},
            {"name": "Same", "stat": "hunger", "direction": "low", "enter": 30, "exit": 40}]})",
                         error));

    // Dead zone narrower than the epsilon
    BOOST_CHECK(!isValid(R"({"hysteresisEpsilon": 2.0, "effects": [
            {"name": "Tight", "stat": "hunger", "direction": "low", "enter": 50, "exit": 51}]})",
                         error));
    BOOST_CHECK(isValid(R"({"hysteresisEpsilon": 0.5, "effects": [
            {"name": "Tight", "stat": "hunger", "direction": "low", "enter": 50, "exit": 51}]})",
                        error));
}

BOOST_AUTO_TEST_CASE(TestInvalidCurrentDocumentFallsBackToDefaults) {
    temp.writeFile("metabolism.json", R"({"configVersion": 3, "tickPeriodMs": 5})");
    MetabolismConfig config = store.load<MetabolismConfig>(MetabolismConfig::DOCUMENT_NAME);
    BOOST_CHECK(store.getStatus("metabolism") == ConfigLoadStatus::ValidationFailed);
    BOOST_CHECK_EQUAL(config.tickPeriodMs, 1000);
}

BOOST_AUTO_TEST_SUITE_END()
