/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef EFFECT_BAND_SET_HPP
#define EFFECT_BAND_SET_HPP

#include "metabolism/HysteresisController.hpp"

#include <optional>
#include <string>
#include <vector>

namespace Lifeline {

class StatVector;

struct EffectDefinition {
    std::string name;
    std::string stat;
    EffectDirection direction{EffectDirection::Low};
    double enter{0.0};
    double exit{0.0};
    int severity{1};
};

struct EffectTransition {
    std::string effect;
    std::string stat;
    TransitionEvent event;
    int severity;
};

/**
 * @brief One player's effect controllers, grouped into bands.
 *
 * A band is every effect on the same stat and direction (e.g. the three
 * hunger debuff tiers). Controllers in a band are evaluated independently in
 * ascending severity; the band's label is its most severe active effect.
 */
class EffectBandSet {
public:
    EffectBandSet() = default;

    /**
     * @throws std::invalid_argument from HysteresisController for a bad band
     */
    EffectBandSet(const std::vector<EffectDefinition>& definitions, double epsilon);

    /**
     * @brief Evaluates every band against the stats; stats not in the
     *        vector leave their bands untouched
     */
    std::vector<EffectTransition> evaluate(const StatVector& stats);

    // Active effect names, sorted
    std::vector<std::string> getActiveEffects() const;

    std::optional<std::string> getLabel(const std::string& stat, EffectDirection direction) const;

    // Most severe active effect of every band that has one
    std::vector<std::string> getLabels() const;

    /**
     * @brief Takes over the active state of same-named effects from a set
     *        built for an older config
     * @return an Exited transition for every effect that was active in
     *         previous and no longer exists here
     */
    std::vector<EffectTransition> adoptStateFrom(const EffectBandSet& previous);

    // Exits every active effect
    std::vector<EffectTransition> clear();

    void reset();
    size_t size() const;

private:
    struct Band {
        std::string stat;
        EffectDirection direction;
        std::vector<HysteresisController> controllers;
        std::vector<int> severities;
    };

    HysteresisController* findController(const std::string& effect);

    std::vector<Band> m_bands;
};

} // namespace Lifeline

#endif // EFFECT_BAND_SET_HPP
