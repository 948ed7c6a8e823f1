/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "metabolism/MetabolismConfig.hpp"

#include <cmath>
#include <set>
#include <stdexcept>

namespace Lifeline {

namespace {

// v1 stats had no bounds; they always spanned 0..100
constexpr double LEGACY_STAT_SPAN = 100.0;

StatConfig makeStat(double rate, std::map<std::string, double> multipliers) {
    StatConfig stat;
    stat.rate = rate;
    stat.activityMultipliers = std::move(multipliers);
    return stat;
}

EffectDefinition makeEffect(const char* name, const char* stat, EffectDirection direction,
                            double enter, double exit, int severity) {
    return EffectDefinition{name, stat, direction, enter, exit, severity};
}

StatConfig statFromJson(const JsonValue& json) {
    StatConfig stat;
    stat.enabled = json.getBool("enabled", stat.enabled);
    stat.rate = json.getNumber("rate", stat.rate);
    stat.min = json.getNumber("min", stat.min);
    stat.max = json.getNumber("max", stat.max);
    stat.defaultValue = json.getNumber("default", stat.max);
    if (const JsonObject* multipliers = json["activityMultipliers"].tryAsObject()) {
        for (const auto& [activity, value] : *multipliers) {
            if (auto number = value.tryAsNumber()) {
                stat.activityMultipliers[activity] = *number;
            }
        }
    }
    return stat;
}

std::optional<EffectDirection> directionFromString(const std::string& text) {
    if (text == "low") {
        return EffectDirection::Low;
    }
    if (text == "high") {
        return EffectDirection::High;
    }
    return std::nullopt;
}

JsonValue effectsToJson(const std::vector<EffectDefinition>& effects) {
    JsonValue array = JsonValue::array();
    for (const auto& effect : effects) {
        JsonValue entry = JsonValue::object();
        entry["name"] = JsonValue(effect.name);
        entry["stat"] = JsonValue(effect.stat);
        entry["direction"] = JsonValue(toString(effect.direction));
        entry["enter"] = JsonValue(effect.enter);
        entry["exit"] = JsonValue(effect.exit);
        entry["severity"] = JsonValue(effect.severity);
        array.push(std::move(entry));
    }
    return array;
}

// Default effects restricted to stats the document actually defines
std::vector<EffectDefinition> defaultEffectsFor(const JsonValue& document) {
    std::vector<EffectDefinition> effects = MetabolismConfig::defaultEffects();
    const JsonObject* stats = document["stats"].tryAsObject();
    if (stats == nullptr) {
        return effects;
    }
    std::vector<EffectDefinition> kept;
    for (auto& effect : effects) {
        if (stats->find(effect.stat) != stats->end()) {
            kept.push_back(std::move(effect));
        }
    }
    return kept;
}

bool validateStat(const std::string& name, const JsonValue& json, std::string& error) {
    if (!json.isObject()) {
        error = "stats." + name + " must be an object";
        return false;
    }
    for (const char* key : {"rate", "min", "max", "default"}) {
        if (json.hasKey(key) && !json[key].isNumber()) {
            error = "stats." + name + "." + key + " must be a number";
            return false;
        }
    }
    StatConfig stat = statFromJson(json);
    if (!std::isfinite(stat.rate) || !std::isfinite(stat.min) || !std::isfinite(stat.max)) {
        error = "stats." + name + " has non-finite values";
        return false;
    }
    if (stat.min >= stat.max) {
        error = "stats." + name + ": min must be below max";
        return false;
    }
    if (stat.defaultValue < stat.min || stat.defaultValue > stat.max) {
        error = "stats." + name + ": default must lie within [min, max]";
        return false;
    }
    if (json.hasKey("activityMultipliers")) {
        const JsonObject* multipliers = json["activityMultipliers"].tryAsObject();
        if (multipliers == nullptr) {
            error = "stats." + name + ".activityMultipliers must be an object";
            return false;
        }
        for (const auto& [activity, value] : *multipliers) {
            if (!activityFromKey(activity)) {
                error = "stats." + name + ": unknown activity '" + activity + "'";
                return false;
            }
            if (!value.isNumber() || !std::isfinite(value.asNumber())) {
                error = "stats." + name + ".activityMultipliers." + activity +
                        " must be a number";
                return false;
            }
        }
    }
    return true;
}

} // anonymous namespace

double StatConfig::getMultiplier(ActivityState activity) const {
    auto it = activityMultipliers.find(activityKey(activity));
    return it != activityMultipliers.end() ? it->second : 1.0;
}

std::map<std::string, StatConfig> MetabolismConfig::defaultStats() {
    return {
        {"energy", makeStat(2.5, {{"idle", 0.3}, {"walking", 1.0}, {"sprinting", 2.0},
                                  {"swimming", 1.6}, {"combat", 2.2}})},
        {"hunger", makeStat(2.0, {{"idle", 1.0}, {"walking", 1.3}, {"sprinting", 2.0},
                                  {"swimming", 1.8}, {"combat", 2.5}})},
        {"thirst", makeStat(2.5, {{"idle", 1.0}, {"walking", 1.2}, {"sprinting", 1.8},
                                  {"swimming", 1.3}, {"combat", 2.2}})},
    };
}

std::vector<EffectDefinition> MetabolismConfig::defaultEffects() {
    const auto low = EffectDirection::Low;
    const auto high = EffectDirection::High;
    return {
        makeEffect("Peckish", "hunger", low, 75.0, 85.0, 1),
        makeEffect("Hungry", "hunger", low, 50.0, 60.0, 2),
        makeEffect("Starving", "hunger", low, 25.0, 35.0, 3),
        makeEffect("Thirsty", "thirst", low, 75.0, 85.0, 1),
        makeEffect("Parched", "thirst", low, 50.0, 60.0, 2),
        makeEffect("Dehydrated", "thirst", low, 25.0, 35.0, 3),
        makeEffect("Tired", "energy", low, 75.0, 85.0, 1),
        makeEffect("Drowsy", "energy", low, 50.0, 60.0, 2),
        makeEffect("Exhausted", "energy", low, 25.0, 35.0, 3),
        makeEffect("Well-Fed", "hunger", high, 90.0, 80.0, 1),
        makeEffect("Hydrated", "thirst", high, 90.0, 80.0, 1),
        makeEffect("Energized", "energy", high, 90.0, 80.0, 1),
    };
}

MetabolismConfig MetabolismConfig::fromJson(const JsonValue& document) {
    MetabolismConfig config;
    config.enabled = document.getBool("enabled", config.enabled);
    config.tickPeriodMs = document.getInt("tickPeriodMs", config.tickPeriodMs);
    config.flushIntervalTicks = document.getInt("flushIntervalTicks", config.flushIntervalTicks);
    config.hysteresisEpsilon = document.getNumber("hysteresisEpsilon", config.hysteresisEpsilon);
    config.statusLineThreshold =
        document.getNumber("statusLineThreshold", config.statusLineThreshold);

    if (const JsonObject* stats = document["stats"].tryAsObject()) {
        config.stats.clear();
        for (const auto& [name, json] : *stats) {
            if (json.isObject()) {
                config.stats[name] = statFromJson(json);
            }
        }
    }

    config.effects = defaultEffectsFor(document);
    if (const JsonArray* effects = document["effects"].tryAsArray()) {
        config.effects.clear();
        for (const auto& json : *effects) {
            auto direction = directionFromString(json.getString("direction", "low"));
            config.effects.push_back(EffectDefinition{
                json.getString("name", ""), json.getString("stat", ""),
                direction.value_or(EffectDirection::Low), json.getNumber("enter", 0.0),
                json.getNumber("exit", 0.0), json.getInt("severity", 1)});
        }
    }
    return config;
}

JsonValue MetabolismConfig::toJson() const {
    JsonValue document = JsonValue::object();
    document["enabled"] = JsonValue(enabled);
    document["tickPeriodMs"] = JsonValue(tickPeriodMs);
    document["flushIntervalTicks"] = JsonValue(flushIntervalTicks);
    document["hysteresisEpsilon"] = JsonValue(hysteresisEpsilon);
    document["statusLineThreshold"] = JsonValue(statusLineThreshold);

    JsonValue statsJson = JsonValue::object();
    for (const auto& [name, stat] : stats) {
        JsonValue entry = JsonValue::object();
        entry["enabled"] = JsonValue(stat.enabled);
        entry["rate"] = JsonValue(stat.rate);
        entry["min"] = JsonValue(stat.min);
        entry["max"] = JsonValue(stat.max);
        entry["default"] = JsonValue(stat.defaultValue);
        JsonValue multipliers = JsonValue::object();
        for (const auto& [activity, multiplier] : stat.activityMultipliers) {
            multipliers[activity] = JsonValue(multiplier);
        }
        entry["activityMultipliers"] = std::move(multipliers);
        statsJson[name] = std::move(entry);
    }
    document["stats"] = std::move(statsJson);
    document["effects"] = effectsToJson(effects);
    return document;
}

bool MetabolismConfig::validate(const JsonValue& document, std::string& error) {
    if (!document.isObject()) {
        error = "document must be an object";
        return false;
    }

    MetabolismConfig config = fromJson(document);
    if (config.tickPeriodMs < 50 || config.tickPeriodMs > 60000) {
        error = "tickPeriodMs must be between 50 and 60000";
        return false;
    }
    if (config.flushIntervalTicks < 1) {
        error = "flushIntervalTicks must be at least 1";
        return false;
    }
    if (!std::isfinite(config.hysteresisEpsilon) || config.hysteresisEpsilon <= 0.0) {
        error = "hysteresisEpsilon must be positive";
        return false;
    }
    if (!std::isfinite(config.statusLineThreshold) || config.statusLineThreshold < 0.0) {
        error = "statusLineThreshold must not be negative";
        return false;
    }

    if (document.hasKey("stats")) {
        const JsonObject* stats = document["stats"].tryAsObject();
        if (stats == nullptr) {
            error = "stats must be an object";
            return false;
        }
        for (const auto& [name, json] : *stats) {
            if (!validateStat(name, json, error)) {
                return false;
            }
        }
    }

    if (document.hasKey("effects")) {
        const JsonArray* effects = document["effects"].tryAsArray();
        if (effects == nullptr) {
            error = "effects must be an array";
            return false;
        }
        for (const auto& json : *effects) {
            std::string direction = json.getString("direction", "");
            if (!directionFromString(direction)) {
                error = "effect '" + json.getString("name", "?") +
                        "' needs direction \"low\" or \"high\"";
                return false;
            }
        }
    }

    std::set<std::string> names;
    for (const auto& effect : config.effects) {
        if (effect.name.empty() || !names.insert(effect.name).second) {
            error = "effect names must be unique and non-empty ('" + effect.name + "')";
            return false;
        }
        if (config.stats.find(effect.stat) == config.stats.end()) {
            error = "effect '" + effect.name + "' refers to unknown stat '" + effect.stat + "'";
            return false;
        }
        try {
            HysteresisController check(effect.name, effect.enter, effect.exit, effect.direction,
                                       config.hysteresisEpsilon);
        } catch (const std::invalid_argument& e) {
            error = e.what();
            return false;
        }
    }
    return true;
}

std::vector<ConfigMigration> MetabolismConfig::migrations() {
    return {
        {1, 2, "move stats into 'stats' and convert seconds-to-empty into units per minute",
         [](JsonValue document) {
             std::vector<std::string> legacyStats;
             for (const auto& [key, value] : document.asObject()) {
                 if (value.isObject() && value.hasKey("baseDepletionRateSeconds")) {
                     legacyStats.push_back(key);
                 }
             }

             for (const auto& name : legacyStats) {
                 JsonValue stat = document[name];
                 double seconds = stat.getNumber("baseDepletionRateSeconds", 0.0);
                 if (!std::isfinite(seconds) || seconds <= 0.0) {
                     throw std::invalid_argument(name + ".baseDepletionRateSeconds must be positive");
                 }
                 stat.erase("baseDepletionRateSeconds");
                 stat["rate"] = JsonValue(LEGACY_STAT_SPAN * 60.0 / seconds);
                 stat["min"] = JsonValue(0.0);
                 stat["max"] = JsonValue(LEGACY_STAT_SPAN);
                 stat["default"] = JsonValue(LEGACY_STAT_SPAN);
                 document["stats"][name] = std::move(stat);
                 document.erase(name);
             }
             return document;
         }},
        {2, 3, "add effects and replace saveIntervalSeconds with flushIntervalTicks",
         [](JsonValue document) {
             if (!document.hasKey("effects")) {
                 document["effects"] = effectsToJson(defaultEffectsFor(document));
             }
             if (document.hasKey("saveIntervalSeconds")) {
                 double seconds = document.getNumber("saveIntervalSeconds", 60.0);
                 int periodMs = document.getInt("tickPeriodMs", 1000);
                 if (periodMs <= 0) {
                     throw std::invalid_argument("tickPeriodMs must be positive");
                 }
                 int ticks = static_cast<int>(std::lround(seconds * 1000.0 / periodMs));
                 document["flushIntervalTicks"] = JsonValue(ticks < 1 ? 1 : ticks);
                 document.erase("saveIntervalSeconds");
             }
             return document;
         }},
    };
}

} // namespace Lifeline
