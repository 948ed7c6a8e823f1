/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE JsonReaderTest
#include "utils/JsonReader.hpp"
#include <boost/test/unit_test.hpp>

#include "mocks/TempDirectory.hpp"

#include <cmath>
#include <limits>
#include <string>

using namespace Lifeline;

BOOST_AUTO_TEST_SUITE(JsonValueTests)

BOOST_AUTO_TEST_CASE(TestBasicTypes) {
  JsonValue nullVal;
  BOOST_CHECK(nullVal.isNull());
  BOOST_CHECK_EQUAL(nullVal.getType(), JsonType::Null);
  BOOST_CHECK_EQUAL(nullVal.toString(), "null");

  JsonValue trueVal(true);
  BOOST_CHECK(trueVal.isBool());
  BOOST_CHECK_EQUAL(trueVal.toString(), "true");

  JsonValue rate(2.5);
  BOOST_CHECK(rate.isNumber());
  BOOST_CHECK_EQUAL(rate.asNumber(), 2.5);
  BOOST_CHECK_EQUAL(JsonValue(60).asInt(), 60);

  JsonValue name("hunger");
  BOOST_CHECK(name.isString());
  BOOST_CHECK_EQUAL(name.toString(), "\"hunger\"");
}

BOOST_AUTO_TEST_CASE(TestFallbackAccessors) {
  JsonValue stat = JsonValue::object();
  stat["rate"] = JsonValue(2.0);
  stat["enabled"] = JsonValue(false);
  stat["label"] = JsonValue("Hungry");

  BOOST_CHECK_EQUAL(stat.getNumber("rate", 9.0), 2.0);
  BOOST_CHECK_EQUAL(stat.getNumber("missing", 9.0), 9.0);
  // Mistyped members fall back as well
  BOOST_CHECK_EQUAL(stat.getNumber("label", 9.0), 9.0);
  BOOST_CHECK_EQUAL(stat.getBool("enabled", true), false);
  BOOST_CHECK_EQUAL(stat.getString("label", ""), "Hungry");
  BOOST_CHECK_EQUAL(stat.getInt("rate", 0), 2);

  // Lookups on a non-object never throw
  JsonValue scalar(3.0);
  BOOST_CHECK(scalar["anything"].isNull());
  BOOST_CHECK_EQUAL(scalar.getInt("anything", 7), 7);
  BOOST_CHECK(!scalar.hasKey("anything"));
}

BOOST_AUTO_TEST_CASE(TestSafeAccessors) {
  JsonValue text("test");
  JsonValue number(42);

  BOOST_CHECK_EQUAL(text.tryAsString().value(), "test");
  BOOST_CHECK_EQUAL(number.tryAsInt().value(), 42);
  BOOST_CHECK(!text.tryAsInt().has_value());
  BOOST_CHECK(!number.tryAsString().has_value());
  BOOST_CHECK(number.tryAsObject() == nullptr);
  BOOST_CHECK(number.tryAsArray() == nullptr);
}

BOOST_AUTO_TEST_CASE(TestMutation) {
  JsonValue document;
  document["stats"]["hunger"]["rate"] = JsonValue(2.0);
  BOOST_CHECK(document.isObject());
  BOOST_CHECK_EQUAL(document["stats"]["hunger"].getNumber("rate", 0.0), 2.0);

  BOOST_CHECK(document["stats"].erase("hunger"));
  BOOST_CHECK(!document["stats"].erase("hunger"));
  BOOST_CHECK_EQUAL(document["stats"].size(), 0u);

  JsonValue list = JsonValue::array();
  list.push(JsonValue("Peckish"));
  list.push(JsonValue("Hungry"));
  BOOST_CHECK_EQUAL(list.size(), 2u);
  BOOST_CHECK_EQUAL(list[1].asString(), "Hungry");
}

BOOST_AUTO_TEST_CASE(TestOverlayMergesObjects) {
  JsonReader base;
  BOOST_REQUIRE(base.parse(R"({"stats": {"hunger": {"rate": 2, "min": 0}}, "enabled": true})"));
  JsonReader patch;
  BOOST_REQUIRE(patch.parse(R"({"stats": {"hunger": {"rate": 3}}, "tickPeriodMs": 500})"));

  JsonValue merged = base.getRoot();
  merged.overlay(patch.getRoot());

  BOOST_CHECK_EQUAL(merged["stats"]["hunger"].getNumber("rate", 0), 3.0);
  BOOST_CHECK_EQUAL(merged["stats"]["hunger"].getNumber("min", -1), 0.0);
  BOOST_CHECK_EQUAL(merged.getBool("enabled", false), true);
  BOOST_CHECK_EQUAL(merged.getInt("tickPeriodMs", 0), 500);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(JsonReaderParsingTests)

BOOST_AUTO_TEST_CASE(TestBasicParsing) {
  JsonReader reader;

  BOOST_CHECK(reader.parse("null"));
  BOOST_CHECK(reader.getRoot().isNull());

  BOOST_CHECK(reader.parse("false"));
  BOOST_CHECK_EQUAL(reader.getRoot().asBool(), false);

  BOOST_CHECK(reader.parse("-123"));
  BOOST_CHECK_EQUAL(reader.getRoot().asInt(), -123);

  BOOST_CHECK(reader.parse("1.5e2"));
  BOOST_CHECK_EQUAL(reader.getRoot().asNumber(), 150.0);

  BOOST_CHECK(reader.parse("  \t\n  42  \r\n  "));
  BOOST_CHECK_EQUAL(reader.getRoot().asInt(), 42);
}

BOOST_AUTO_TEST_CASE(TestStringEscapes) {
  JsonReader reader;

  BOOST_CHECK(reader.parse("\"line\\nbreak\""));
  BOOST_CHECK_EQUAL(reader.getRoot().asString(), "line\nbreak");

  BOOST_CHECK(reader.parse("\"quote\\\"here\""));
  BOOST_CHECK_EQUAL(reader.getRoot().asString(), "quote\"here");

  BOOST_CHECK(reader.parse("\"\\u0041\""));
  BOOST_CHECK_EQUAL(reader.getRoot().asString(), "A");

  // Two-byte and surrogate-pair code points
  BOOST_CHECK(reader.parse("\"\\u00e9\""));
  BOOST_CHECK_EQUAL(reader.getRoot().asString(), "\xC3\xA9");
  BOOST_CHECK(reader.parse("\"\\ud83d\\ude00\""));
  BOOST_CHECK_EQUAL(reader.getRoot().asString(), "\xF0\x9F\x98\x80");
}

BOOST_AUTO_TEST_CASE(TestConfigDocument) {
  JsonReader reader;
  std::string document = R"({
        "configVersion": 3,
        "tickPeriodMs": 1000,
        "stats": {
            "hunger": {
                "rate": 2.0,
                "activityMultipliers": {"idle": 1.0, "sprinting": 2.0}
            }
        },
        "effects": [
            {"name": "Peckish", "stat": "hunger", "direction": "low", "enter": 75, "exit": 85}
        ]
    })";

  BOOST_REQUIRE(reader.parse(document));
  const auto& root = reader.getRoot();
  BOOST_CHECK_EQUAL(root.getInt("configVersion", 0), 3);

  const auto& hunger = root["stats"]["hunger"];
  BOOST_CHECK_EQUAL(hunger["activityMultipliers"].getNumber("sprinting", 0.0), 2.0);

  const auto& effects = root["effects"];
  BOOST_REQUIRE(effects.isArray());
  BOOST_CHECK_EQUAL(effects.size(), 1u);
  BOOST_CHECK_EQUAL(effects[0].getString("name", ""), "Peckish");
  BOOST_CHECK_EQUAL(effects[0].getNumber("exit", 0.0), 85.0);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(JsonReaderErrorTests)

BOOST_AUTO_TEST_CASE(TestInvalidJSON) {
  JsonReader reader;

  BOOST_CHECK(!reader.parse(""));
  BOOST_CHECK(!reader.parse("hello"));
  BOOST_CHECK(!reader.parse("{\"key\": \"value\",}"));
  BOOST_CHECK(!reader.parse("[1, 2, 3,]"));
  BOOST_CHECK(!reader.parse("{\"key\": \"value\""));
  BOOST_CHECK(!reader.parse("123."));
  BOOST_CHECK(!reader.parse("\"hello"));
  BOOST_CHECK(!reader.parse("\"hello\\x\""));
  BOOST_CHECK(!reader.parse("42 43"));
  BOOST_CHECK(!reader.parse("{42: \"value\"}"));
  BOOST_CHECK(!reader.parse("[1 2 3]"));
  BOOST_CHECK(!reader.parse("truee"));
  BOOST_CHECK(!reader.getLastError().empty());
}

BOOST_AUTO_TEST_CASE(TestErrorReportsPosition) {
  JsonReader reader;
  BOOST_CHECK(!reader.parse("{\n  \"rate\": 2,\n  \"min\" 0\n}"));
  BOOST_CHECK(reader.getLastError().find("Line 3") != std::string::npos);

  // A failed parse leaves no partial document behind
  BOOST_CHECK(reader.getRoot().isNull());

  BOOST_CHECK(reader.parse("{}"));
  BOOST_CHECK(reader.getLastError().empty());
}

BOOST_AUTO_TEST_CASE(TestNestingLimit) {
  JsonReader reader;
  std::string deep(200, '[');
  deep += std::string(200, ']');
  BOOST_CHECK(!reader.parse(deep));
  BOOST_CHECK(reader.getLastError().find("depth") != std::string::npos);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(JsonWriterTests)

BOOST_AUTO_TEST_CASE(TestNumberFormatting) {
  BOOST_CHECK_EQUAL(JsonWriter::formatNumber(60.0), "60");
  BOOST_CHECK_EQUAL(JsonWriter::formatNumber(-3.0), "-3");
  BOOST_CHECK_EQUAL(JsonWriter::formatNumber(0.1), "0.1");
  BOOST_CHECK_EQUAL(JsonWriter::formatNumber(std::numeric_limits<double>::quiet_NaN()), "null");
}

BOOST_AUTO_TEST_CASE(TestEscaping) {
  BOOST_CHECK_EQUAL(JsonWriter::escapeString("a\"b"), "\"a\\\"b\"");
  BOOST_CHECK_EQUAL(JsonWriter::escapeString("tab\there"), "\"tab\\there\"");
  BOOST_CHECK_EQUAL(JsonWriter::escapeString(std::string(1, '\x01')), "\"\\u0001\"");
}

BOOST_AUTO_TEST_CASE(TestWrittenDocumentReadsBack) {
  JsonValue document = JsonValue::object();
  document["configVersion"] = JsonValue(3);
  document["statusLineThreshold"] = JsonValue(0.3);
  document["stats"]["thirst"]["rate"] = JsonValue(2.5);
  document["effects"].push(JsonValue("Parched"));

  std::string text = JsonWriter(2).write(document);
  BOOST_CHECK(text.find("\n  \"configVersion\": 3") != std::string::npos);

  JsonReader reader;
  BOOST_REQUIRE(reader.parse(text));
  BOOST_CHECK(reader.getRoot() == document);
  BOOST_CHECK_EQUAL(document.toString(),
                    "{\"configVersion\":3,\"effects\":[\"Parched\"],"
                    "\"stats\":{\"thirst\":{\"rate\":2.5}},\"statusLineThreshold\":0.3}");
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(JsonReaderFileTests)

BOOST_AUTO_TEST_CASE(TestFileLoading) {
  TempDirectory temp;
  temp.writeFile("metabolism.json", R"({"enabled": false, "stats": {"energy": {"rate": 2.5}}})");

  JsonReader reader;
  BOOST_REQUIRE(reader.loadFromFile((temp / "metabolism.json").string()));
  const auto& root = reader.getRoot();
  BOOST_CHECK_EQUAL(root.getBool("enabled", true), false);
  BOOST_CHECK_EQUAL(root["stats"]["energy"].getNumber("rate", 0.0), 2.5);

  JsonValue taken = reader.takeRoot();
  BOOST_CHECK(taken.isObject());
}

BOOST_AUTO_TEST_CASE(TestNonExistentFile) {
  TempDirectory temp;
  JsonReader reader;
  BOOST_CHECK(!reader.loadFromFile((temp / "missing.json").string()));
  BOOST_CHECK(reader.getLastError().find("Could not open file") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(TestWriteToFile) {
  TempDirectory temp;
  JsonValue document = JsonValue::object();
  document["debug"] = JsonValue(true);

  BOOST_REQUIRE(JsonWriter().writeToFile(document, (temp / "core.json").string()));
  BOOST_CHECK_EQUAL(temp.readFile("core.json"), "{\n  \"debug\": true\n}\n");
}

BOOST_AUTO_TEST_SUITE_END()
