/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef METABOLISM_CONFIG_HPP
#define METABOLISM_CONFIG_HPP

#include "config/ConfigMigration.hpp"
#include "metabolism/ActivityState.hpp"
#include "metabolism/EffectBandSet.hpp"
#include "utils/JsonReader.hpp"

#include <map>
#include <string>
#include <vector>

namespace Lifeline {

struct StatConfig {
    bool enabled{true};
    double rate{2.0};           // Units per minute at multiplier 1.0
    double min{0.0};
    double max{100.0};
    double defaultValue{100.0};
    std::map<std::string, double> activityMultipliers;

    // Missing multipliers count as 1.0
    double getMultiplier(ActivityState activity) const;
};

/**
 * @brief Tunables of the metabolism module (metabolism.json)
 *
 * Version history:
 *   v1  top-level stat objects with baseDepletionRateSeconds (time to empty)
 *   v2  stats section with per-minute rates and explicit bounds
 *   v3  configurable effects; saveIntervalSeconds became flushIntervalTicks
 */
struct MetabolismConfig {
    static constexpr int CURRENT_VERSION = 3;
    static constexpr const char* DOCUMENT_NAME = "metabolism";

    bool enabled{true};
    int tickPeriodMs{1000};
    int flushIntervalTicks{60};
    double hysteresisEpsilon{1.0};
    double statusLineThreshold{0.5};
    std::map<std::string, StatConfig> stats{defaultStats()};
    std::vector<EffectDefinition> effects{defaultEffects()};

    static MetabolismConfig fromJson(const JsonValue& document);
    JsonValue toJson() const;
    static bool validate(const JsonValue& document, std::string& error);
    static std::vector<ConfigMigration> migrations();

    static std::map<std::string, StatConfig> defaultStats();
    static std::vector<EffectDefinition> defaultEffects();
};

} // namespace Lifeline

#endif // METABOLISM_CONFIG_HPP
