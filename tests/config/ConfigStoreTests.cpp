/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE ConfigStoreTests
#include <boost/test/unit_test.hpp>

#include "config/ConfigMigration.hpp"
#include "core/CoreErrors.hpp"
#include "core/Logger.hpp"
#include "managers/ConfigStore.hpp"
#include "utils/JsonReader.hpp"
#include "mocks/TempDirectory.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using namespace Lifeline;

namespace {

// v1 stored the rate per half minute; v2 stores it per minute
struct RateConfig {
    static constexpr int CURRENT_VERSION = 2;

    double rate{100.0};
    std::string label{"default"};

    static RateConfig fromJson(const JsonValue& document) {
        RateConfig config;
        config.rate = document.getNumber("rate", config.rate);
        config.label = document.getString("label", config.label);
        return config;
    }

    JsonValue toJson() const {
        JsonValue document = JsonValue::object();
        document["rate"] = JsonValue(rate);
        document["label"] = JsonValue(label);
        return document;
    }

    static bool validate(const JsonValue& document, std::string& error) {
        if (document.hasKey("rate") && !document["rate"].isNumber()) {
            error = "rate must be a number";
            return false;
        }
        if (fromJson(document).rate <= 0.0) {
            error = "rate must be positive";
            return false;
        }
        return true;
    }

    static std::vector<ConfigMigration> migrations() {
        return {{1, 2, "rate per minute", [](JsonValue document) {
                     if (!document["rate"].isNumber()) {
                         throw std::invalid_argument("rate is not a number");
                     }
                     document["rate"] = JsonValue(document["rate"].asNumber() * 2.0);
                     return document;
                 }}};
    }
};

// Only knows how to get from v2 to v3
struct LayeredConfig {
    static constexpr int CURRENT_VERSION = 3;

    int layers{1};

    static LayeredConfig fromJson(const JsonValue& document) {
        LayeredConfig config;
        config.layers = document.getInt("layers", config.layers);
        return config;
    }

    JsonValue toJson() const {
        JsonValue document = JsonValue::object();
        document["layers"] = JsonValue(layers);
        return document;
    }

    static bool validate(const JsonValue&, std::string&) { return true; }
};

} // namespace

struct ConfigStoreFixture {
    ConfigStoreFixture() : store(temp.path()) {
        Logger::SetQuietMode(true);
        store.getMigrations().registerMigrations("rate", RateConfig::migrations());
    }

    JsonValue readBack(const std::string& file) {
        JsonReader reader;
        BOOST_REQUIRE_MESSAGE(reader.parse(temp.readFile(file)), reader.getLastError());
        return reader.getRoot();
    }

    TempDirectory temp;
    ConfigStore store;
};

BOOST_FIXTURE_TEST_SUITE(ConfigStoreTestSuite, ConfigStoreFixture)

BOOST_AUTO_TEST_CASE(TestMissingFileCreatesDefaults) {
    RateConfig config = store.load<RateConfig>("rate");
    BOOST_CHECK_EQUAL(config.rate, 100.0);
    BOOST_CHECK(store.getStatus("rate") == ConfigLoadStatus::CreatedDefault);

    BOOST_REQUIRE(temp.exists("rate.json"));
    JsonValue written = readBack("rate.json");
    BOOST_CHECK_EQUAL(written.getInt("configVersion", 0), 2);
    BOOST_CHECK_EQUAL(written.getNumber("rate", 0.0), 100.0);

    auto cached = store.get<RateConfig>("rate");
    BOOST_REQUIRE(cached);
    BOOST_CHECK_EQUAL(cached->label, "default");
}

BOOST_AUTO_TEST_CASE(TestOldVersionIsBackedUpAndMigrated) {
    const std::string original = "{ \"rate\": 480,\n  \"label\": \"legacy\" }\n";
    temp.writeFile("rate.json", original);

    RateConfig config = store.load<RateConfig>("rate");
    BOOST_CHECK(store.getStatus("rate") == ConfigLoadStatus::Migrated);
    BOOST_CHECK_EQUAL(config.rate, 960.0);
    BOOST_CHECK_EQUAL(config.label, "legacy");

    // Backup holds the exact original bytes
    BOOST_REQUIRE(temp.exists("rate.v1.json.backup"));
    BOOST_CHECK_EQUAL(temp.readFile("rate.v1.json.backup"), original);

    JsonValue written = readBack("rate.json");
    BOOST_CHECK_EQUAL(written.getInt("configVersion", 0), 2);
    BOOST_CHECK_EQUAL(written.getNumber("rate", 0.0), 960.0);
}

BOOST_AUTO_TEST_CASE(TestMigrationIsIdempotent) {
    temp.writeFile("rate.json", "{\"configVersion\": 1, \"rate\": 480}");
    store.load<RateConfig>("rate");
    const std::string afterFirst = temp.readFile("rate.json");

    RateConfig again = store.load<RateConfig>("rate");
    BOOST_CHECK(store.getStatus("rate") == ConfigLoadStatus::Loaded);
    BOOST_CHECK_EQUAL(again.rate, 960.0);
    BOOST_CHECK_EQUAL(temp.readFile("rate.json"), afterFirst);
}

BOOST_AUTO_TEST_CASE(TestUnknownKeysSurviveMigrationAndSave) {
    temp.writeFile("rate.json", "{\"rate\": 10, \"notes\": {\"author\": \"ops\"}}");
    RateConfig config = store.load<RateConfig>("rate");

    JsonValue migrated = readBack("rate.json");
    BOOST_CHECK_EQUAL(migrated["notes"].getString("author", ""), "ops");

    config.rate = 42.0;
    BOOST_REQUIRE(store.save("rate", config));
    JsonValue saved = readBack("rate.json");
    BOOST_CHECK_EQUAL(saved.getNumber("rate", 0.0), 42.0);
    BOOST_CHECK_EQUAL(saved["notes"].getString("author", ""), "ops");
    BOOST_CHECK_EQUAL(store.get<RateConfig>("rate")->rate, 42.0);
}

BOOST_AUTO_TEST_CASE(TestMissingMigrationStepLeavesFileUntouched) {
    store.getMigrations().registerMigrations(
        "layered", {{2, 3, "add layers", [](JsonValue document) { return document; }}});
    const std::string original = "{\"configVersion\": 1, \"layers\": 4}";
    temp.writeFile("layered.json", original);

    LayeredConfig config = store.load<LayeredConfig>("layered");
    BOOST_CHECK(store.getStatus("layered") == ConfigLoadStatus::MigrationFailed);
    BOOST_CHECK_EQUAL(config.layers, 1);
    BOOST_CHECK_EQUAL(temp.readFile("layered.json"), original);
    BOOST_CHECK(!temp.exists("layered.v1.json.backup"));
}

BOOST_AUTO_TEST_CASE(TestThrowingTransformRestoresOriginal) {
    const std::string original = "{\"rate\": \"fast\"}";
    temp.writeFile("rate.json", original);

    RateConfig config = store.load<RateConfig>("rate");
    BOOST_CHECK(store.getStatus("rate") == ConfigLoadStatus::MigrationFailed);
    BOOST_CHECK_EQUAL(config.rate, 100.0);
    BOOST_CHECK_EQUAL(temp.readFile("rate.json"), original);
}

BOOST_AUTO_TEST_CASE(TestInvalidAfterMigrationRestoresOriginal) {
    const std::string original = "{\"rate\": -5}";
    temp.writeFile("rate.json", original);

    RateConfig config = store.load<RateConfig>("rate");
    BOOST_CHECK(store.getStatus("rate") == ConfigLoadStatus::MigrationFailed);
    BOOST_CHECK_EQUAL(config.rate, 100.0);
    BOOST_CHECK_EQUAL(temp.readFile("rate.json"), original);
    BOOST_CHECK(temp.exists("rate.v1.json.backup"));
}

BOOST_AUTO_TEST_CASE(TestParseErrorKeepsCopyAndUsesDefaults) {
    const std::string original = "{\"rate\": 12,";
    temp.writeFile("rate.json", original);

    RateConfig config = store.load<RateConfig>("rate");
    BOOST_CHECK(store.getStatus("rate") == ConfigLoadStatus::ParseFailed);
    BOOST_CHECK_EQUAL(config.rate, 100.0);
    BOOST_CHECK_EQUAL(temp.readFile("rate.json"), original);
    BOOST_CHECK_EQUAL(temp.readFile("rate.parse-error.json.backup"), original);
}

BOOST_AUTO_TEST_CASE(TestCurrentVersionValidationFailure) {
    temp.writeFile("rate.json", "{\"configVersion\": 2, \"rate\": 0}");
    RateConfig config = store.load<RateConfig>("rate");
    BOOST_CHECK(store.getStatus("rate") == ConfigLoadStatus::ValidationFailed);
    BOOST_CHECK_EQUAL(config.rate, 100.0);
}

BOOST_AUTO_TEST_CASE(TestNewerVersionLoadsWithoutDowngrade) {
    const std::string original = "{\"configVersion\": 7, \"rate\": 33}";
    temp.writeFile("rate.json", original);

    RateConfig config = store.load<RateConfig>("rate");
    BOOST_CHECK(store.getStatus("rate") == ConfigLoadStatus::Loaded);
    BOOST_CHECK_EQUAL(config.rate, 33.0);
    BOOST_CHECK_EQUAL(temp.readFile("rate.json"), original);
}

BOOST_AUTO_TEST_CASE(TestReloadNotifiesListeners) {
    store.load<RateConfig>("rate");

    std::vector<double> seen;
    size_t id = store.registerChangeListener<RateConfig>(
        "rate", [&seen](const RateConfig& config) { seen.push_back(config.rate); });

    temp.writeFile("rate.json", "{\"configVersion\": 2, \"rate\": 50}");
    std::vector<std::string> reloaded = store.reload("rate");
    BOOST_REQUIRE_EQUAL(reloaded.size(), 1u);
    BOOST_CHECK_EQUAL(reloaded[0], "rate");
    BOOST_REQUIRE_EQUAL(seen.size(), 1u);
    BOOST_CHECK_EQUAL(seen[0], 50.0);
    BOOST_CHECK_EQUAL(store.get<RateConfig>("rate")->rate, 50.0);

    store.unregisterChangeListener(id);
    store.reload();
    BOOST_CHECK_EQUAL(seen.size(), 1u);

    BOOST_CHECK(store.reload("never-loaded").empty());
}

BOOST_AUTO_TEST_CASE(TestThrowingListenerDoesNotBlockOthers) {
    store.load<RateConfig>("rate");
    int calls = 0;
    store.registerChangeListener<RateConfig>(
        "rate", [](const RateConfig&) { throw std::runtime_error("listener bug"); });
    store.registerChangeListener<RateConfig>("rate", [&calls](const RateConfig&) { ++calls; });

    store.reload("rate");
    BOOST_CHECK_EQUAL(calls, 1);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(ConfigMigrationRegistryTestSuite)

BOOST_AUTO_TEST_CASE(TestMalformedChainsRejected) {
    ConfigMigrationRegistry registry;
    auto identity = [](JsonValue document) { return document; };

    BOOST_CHECK_THROW(registry.registerMigrations("skip", {{1, 3, "skips", identity}}),
                      ConfigMigrationFailed);
    BOOST_CHECK_THROW(registry.registerMigrations(
                          "gap", {{1, 2, "a", identity}, {3, 4, "b", identity}}),
                      ConfigMigrationFailed);
    BOOST_CHECK_THROW(registry.registerMigrations(
                          "twice", {{1, 2, "a", identity}, {1, 2, "b", identity}}),
                      ConfigMigrationFailed);
    BOOST_CHECK_THROW(registry.registerMigrations("empty", {{1, 2, "none", nullptr}}),
                      ConfigMigrationFailed);
    BOOST_CHECK(!registry.hasMigrations("gap"));
}

BOOST_AUTO_TEST_CASE(TestApplyStampsVersion) {
    ConfigMigrationRegistry registry;
    registry.registerMigrations("doc", {{2, 3, "b", [](JsonValue document) {
                                             document["b"] = JsonValue(true);
                                             return document;
                                         }},
                                        {1, 2, "a", [](JsonValue document) {
                                             document["a"] = JsonValue(true);
                                             return document;
                                         }}});

    JsonValue result = registry.apply("doc", JsonValue::object(), 1, 3);
    BOOST_CHECK(result.getBool("a", false));
    BOOST_CHECK(result.getBool("b", false));
    BOOST_CHECK_EQUAL(result.getInt("configVersion", 0), 3);

    std::string error;
    BOOST_CHECK(registry.validateChain("doc", 1, 3, error));
    BOOST_CHECK(!registry.validateChain("doc", 1, 4, error));
    BOOST_CHECK(error.find("v3") != std::string::npos);
}

BOOST_AUTO_TEST_SUITE_END()
