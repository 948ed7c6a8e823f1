/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE HysteresisControllerTests
#include <boost/test/unit_test.hpp>

#include "metabolism/EffectBandSet.hpp"
#include "metabolism/HysteresisController.hpp"
#include "metabolism/MetabolismConfig.hpp"
#include "metabolism/StatVector.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

using namespace Lifeline;

BOOST_AUTO_TEST_SUITE(HysteresisControllerTestSuite)

BOOST_AUTO_TEST_CASE(TestLowDirectionEntersAndExits) {
    HysteresisController hungry("Hungry", 50.0, 60.0, EffectDirection::Low);
    BOOST_CHECK(!hungry.isActive());

    BOOST_CHECK(!hungry.evaluate(55.0));
    auto entered = hungry.evaluate(50.0);
    BOOST_REQUIRE(entered);
    BOOST_CHECK(*entered == TransitionEvent::Entered);
    BOOST_CHECK(hungry.isActive());

    BOOST_CHECK(!hungry.evaluate(59.9));
    auto exited = hungry.evaluate(60.0);
    BOOST_REQUIRE(exited);
    BOOST_CHECK(*exited == TransitionEvent::Exited);
    BOOST_CHECK(!hungry.isActive());
}

BOOST_AUTO_TEST_CASE(TestHighDirectionMirrors) {
    HysteresisController wellFed("Well-Fed", 90.0, 80.0, EffectDirection::High);
    BOOST_CHECK(!wellFed.evaluate(89.0));
    BOOST_CHECK(wellFed.evaluate(95.0) == TransitionEvent::Entered);
    BOOST_CHECK(!wellFed.evaluate(81.0));
    BOOST_CHECK(wellFed.evaluate(80.0) == TransitionEvent::Exited);
}

BOOST_AUTO_TEST_CASE(TestNoFlickerInsideDeadZone) {
    HysteresisController tired("Tired", 75.0, 85.0, EffectDirection::Low);
    BOOST_REQUIRE(tired.evaluate(74.0) == TransitionEvent::Entered);

    // Noise around the entry threshold never toggles the effect
    int transitions = 0;
    for (int i = 0; i < 1000; ++i) {
        double noisy = 75.0 + 9.0 * std::sin(i * 0.37);
        if (tired.evaluate(noisy)) {
            ++transitions;
        }
    }
    BOOST_CHECK_EQUAL(transitions, 0);
    BOOST_CHECK(tired.isActive());
}

BOOST_AUTO_TEST_CASE(TestNanIsIgnored) {
    HysteresisController thirsty("Thirsty", 75.0, 85.0, EffectDirection::Low);
    BOOST_CHECK(!thirsty.evaluate(std::numeric_limits<double>::quiet_NaN()));
    BOOST_CHECK(!thirsty.isActive());
}

BOOST_AUTO_TEST_CASE(TestDeadZoneMustExceedEpsilon) {
    BOOST_CHECK_THROW(HysteresisController("Equal", 50.0, 50.0, EffectDirection::Low),
                      std::invalid_argument);
    BOOST_CHECK_THROW(HysteresisController("Inverted", 60.0, 50.0, EffectDirection::Low),
                      std::invalid_argument);
    BOOST_CHECK_THROW(HysteresisController("Narrow", 50.0, 50.5, EffectDirection::Low, 1.0),
                      std::invalid_argument);
    BOOST_CHECK_THROW(HysteresisController("WrongSide", 80.0, 90.0, EffectDirection::High),
                      std::invalid_argument);
    BOOST_CHECK_THROW(HysteresisController("Infinite", 50.0,
                                           std::numeric_limits<double>::infinity(),
                                           EffectDirection::Low),
                      std::invalid_argument);
    BOOST_CHECK_NO_THROW(HysteresisController("Exact", 50.0, 51.0, EffectDirection::Low, 1.0));
    BOOST_CHECK_NO_THROW(HysteresisController("Fine", 50.0, 50.5, EffectDirection::Low, 0.5));
}

BOOST_AUTO_TEST_CASE(TestReset) {
    HysteresisController starving("Starving", 25.0, 35.0, EffectDirection::Low);
    starving.evaluate(10.0);
    BOOST_CHECK(starving.isActive());
    starving.reset();
    BOOST_CHECK(!starving.isActive());
    BOOST_CHECK(starving.evaluate(10.0) == TransitionEvent::Entered);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(EffectBandSetTestSuite)

namespace {

StatVector hungerAt(double value) {
    StatVector stats;
    stats.define("hunger", value, 0.0, 100.0);
    return stats;
}

} // namespace

BOOST_AUTO_TEST_CASE(TestTiersStackAndLabelIsMostSevere) {
    EffectBandSet bands(MetabolismConfig::defaultEffects(), 1.0);
    BOOST_CHECK_EQUAL(bands.size(), 12u);

    auto transitions = bands.evaluate(hungerAt(45.0));
    // Peckish and Hungry enter together, in ascending severity
    BOOST_REQUIRE_EQUAL(transitions.size(), 2u);
    BOOST_CHECK_EQUAL(transitions[0].effect, "Peckish");
    BOOST_CHECK_EQUAL(transitions[0].severity, 1);
    BOOST_CHECK_EQUAL(transitions[1].effect, "Hungry");
    BOOST_CHECK(transitions[1].event == TransitionEvent::Entered);

    auto label = bands.getLabel("hunger", EffectDirection::Low);
    BOOST_REQUIRE(label);
    BOOST_CHECK_EQUAL(*label, "Hungry");

    std::vector<std::string> active = bands.getActiveEffects();
    std::vector<std::string> expected{"Hungry", "Peckish"};
    BOOST_CHECK_EQUAL_COLLECTIONS(active.begin(), active.end(), expected.begin(), expected.end());
}

BOOST_AUTO_TEST_CASE(TestRecoveryExitsTierByTier) {
    EffectBandSet bands(MetabolismConfig::defaultEffects(), 1.0);
    bands.evaluate(hungerAt(20.0));
    BOOST_CHECK_EQUAL(*bands.getLabel("hunger", EffectDirection::Low), "Starving");

    // 34 is still inside Starving's dead zone
    BOOST_CHECK(bands.evaluate(hungerAt(34.0)).empty());

    auto transitions = bands.evaluate(hungerAt(62.0));
    BOOST_REQUIRE_EQUAL(transitions.size(), 2u);
    BOOST_CHECK_EQUAL(transitions[0].effect, "Hungry");
    BOOST_CHECK(transitions[0].event == TransitionEvent::Exited);
    BOOST_CHECK_EQUAL(transitions[1].effect, "Starving");
    BOOST_CHECK_EQUAL(*bands.getLabel("hunger", EffectDirection::Low), "Peckish");
}

BOOST_AUTO_TEST_CASE(TestUnknownStatsLeaveBandsAlone) {
    EffectBandSet bands(MetabolismConfig::defaultEffects(), 1.0);
    StatVector stats;
    stats.define("stamina", 0.0, 0.0, 100.0);
    BOOST_CHECK(bands.evaluate(stats).empty());
    BOOST_CHECK(bands.getLabels().empty());
}

BOOST_AUTO_TEST_CASE(TestBuffAndDebuffBandsAreSeparate) {
    EffectBandSet bands(MetabolismConfig::defaultEffects(), 1.0);
    StatVector stats;
    stats.define("hunger", 95.0, 0.0, 100.0);
    stats.define("thirst", 10.0, 0.0, 100.0);
    bands.evaluate(stats);

    BOOST_CHECK_EQUAL(*bands.getLabel("hunger", EffectDirection::High), "Well-Fed");
    BOOST_CHECK(!bands.getLabel("hunger", EffectDirection::Low));
    BOOST_CHECK_EQUAL(*bands.getLabel("thirst", EffectDirection::Low), "Dehydrated");

    std::vector<std::string> labels = bands.getLabels();
    BOOST_CHECK_EQUAL(labels.size(), 2u);

    bands.reset();
    BOOST_CHECK(bands.getActiveEffects().empty());
}

BOOST_AUTO_TEST_CASE(TestRebuiltSetKeepsActiveEffects) {
    EffectBandSet previous(MetabolismConfig::defaultEffects(), 1.0);
    StatVector stats;
    stats.define("hunger", 40.0, 0.0, 100.0);
    BOOST_REQUIRE_EQUAL(previous.evaluate(stats).size(), 2u);

    std::vector<EffectDefinition> withoutHungry;
    for (const auto& effect : MetabolismConfig::defaultEffects()) {
        if (effect.name != "Hungry") {
            withoutHungry.push_back(effect);
        }
    }
    EffectBandSet rebuilt(withoutHungry, 1.0);
    std::vector<EffectTransition> removed = rebuilt.adoptStateFrom(previous);
    BOOST_REQUIRE_EQUAL(removed.size(), 1u);
    BOOST_CHECK_EQUAL(removed[0].effect, "Hungry");
    BOOST_CHECK_EQUAL(removed[0].stat, "hunger");
    BOOST_CHECK(removed[0].event == TransitionEvent::Exited);

    std::vector<std::string> active = rebuilt.getActiveEffects();
    BOOST_REQUIRE_EQUAL(active.size(), 1u);
    BOOST_CHECK_EQUAL(active[0], "Peckish");
    // Peckish was carried over, so it does not enter again
    BOOST_CHECK(rebuilt.evaluate(stats).empty());
}

BOOST_AUTO_TEST_CASE(TestClearExitsEveryActiveEffect) {
    EffectBandSet bands(MetabolismConfig::defaultEffects(), 1.0);
    StatVector stats;
    stats.define("hunger", 40.0, 0.0, 100.0);
    bands.evaluate(stats);

    std::vector<EffectTransition> exited = bands.clear();
    BOOST_REQUIRE_EQUAL(exited.size(), 2u);
    for (const auto& transition : exited) {
        BOOST_CHECK(transition.event == TransitionEvent::Exited);
    }
    BOOST_CHECK(bands.getActiveEffects().empty());
    BOOST_CHECK(bands.clear().empty());
}

BOOST_AUTO_TEST_CASE(TestBadBandRejected) {
    std::vector<EffectDefinition> definitions{
        {"Broken", "hunger", EffectDirection::Low, 50.0, 50.2, 1}};
    BOOST_CHECK_THROW(EffectBandSet(definitions, 1.0), std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END()
