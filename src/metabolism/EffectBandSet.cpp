/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "metabolism/EffectBandSet.hpp"
#include "metabolism/StatVector.hpp"

#include <algorithm>
#include <numeric>

namespace Lifeline {

EffectBandSet::EffectBandSet(const std::vector<EffectDefinition>& definitions, double epsilon) {
    // Stable sort keeps config order for equal severities
    std::vector<size_t> order(definitions.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        const auto& lhs = definitions[a];
        const auto& rhs = definitions[b];
        if (lhs.stat != rhs.stat) {
            return lhs.stat < rhs.stat;
        }
        if (lhs.direction != rhs.direction) {
            return lhs.direction < rhs.direction;
        }
        return lhs.severity < rhs.severity;
    });

    for (size_t index : order) {
        const EffectDefinition& definition = definitions[index];
        if (m_bands.empty() || m_bands.back().stat != definition.stat ||
            m_bands.back().direction != definition.direction) {
            m_bands.push_back(Band{definition.stat, definition.direction, {}, {}});
        }
        Band& band = m_bands.back();
        band.controllers.emplace_back(definition.name, definition.enter, definition.exit,
                                      definition.direction, epsilon);
        band.severities.push_back(definition.severity);
    }
}

std::vector<EffectTransition> EffectBandSet::evaluate(const StatVector& stats) {
    std::vector<EffectTransition> transitions;
    for (Band& band : m_bands) {
        const StatValue* stat = stats.find(band.stat);
        if (stat == nullptr) {
            continue;
        }
        for (size_t i = 0; i < band.controllers.size(); ++i) {
            HysteresisController& controller = band.controllers[i];
            if (auto event = controller.evaluate(stat->value)) {
                transitions.push_back(
                    EffectTransition{controller.getEffect(), band.stat, *event, band.severities[i]});
            }
        }
    }
    return transitions;
}

std::vector<std::string> EffectBandSet::getActiveEffects() const {
    std::vector<std::string> active;
    for (const Band& band : m_bands) {
        for (const HysteresisController& controller : band.controllers) {
            if (controller.isActive()) {
                active.push_back(controller.getEffect());
            }
        }
    }
    std::sort(active.begin(), active.end());
    return active;
}

std::optional<std::string> EffectBandSet::getLabel(const std::string& stat,
                                                   EffectDirection direction) const {
    for (const Band& band : m_bands) {
        if (band.stat != stat || band.direction != direction) {
            continue;
        }
        for (auto it = band.controllers.rbegin(); it != band.controllers.rend(); ++it) {
            if (it->isActive()) {
                return it->getEffect();
            }
        }
        return std::nullopt;
    }
    return std::nullopt;
}

std::vector<std::string> EffectBandSet::getLabels() const {
    std::vector<std::string> labels;
    for (const Band& band : m_bands) {
        if (auto label = getLabel(band.stat, band.direction)) {
            labels.push_back(*label);
        }
    }
    return labels;
}

HysteresisController* EffectBandSet::findController(const std::string& effect) {
    for (Band& band : m_bands) {
        for (HysteresisController& controller : band.controllers) {
            if (controller.getEffect() == effect) {
                return &controller;
            }
        }
    }
    return nullptr;
}

std::vector<EffectTransition> EffectBandSet::adoptStateFrom(const EffectBandSet& previous) {
    std::vector<EffectTransition> removed;
    for (const Band& band : previous.m_bands) {
        for (size_t i = 0; i < band.controllers.size(); ++i) {
            const HysteresisController& old = band.controllers[i];
            if (!old.isActive()) {
                continue;
            }
            if (HysteresisController* current = findController(old.getEffect())) {
                current->setActive(true);
            } else {
                removed.push_back(EffectTransition{old.getEffect(), band.stat,
                                                   TransitionEvent::Exited, band.severities[i]});
            }
        }
    }
    return removed;
}

std::vector<EffectTransition> EffectBandSet::clear() {
    std::vector<EffectTransition> exited;
    for (Band& band : m_bands) {
        for (size_t i = 0; i < band.controllers.size(); ++i) {
            HysteresisController& controller = band.controllers[i];
            if (controller.isActive()) {
                controller.reset();
                exited.push_back(EffectTransition{controller.getEffect(), band.stat,
                                                  TransitionEvent::Exited, band.severities[i]});
            }
        }
    }
    return exited;
}

void EffectBandSet::reset() {
    for (Band& band : m_bands) {
        for (HysteresisController& controller : band.controllers) {
            controller.reset();
        }
    }
}

size_t EffectBandSet::size() const {
    size_t count = 0;
    for (const Band& band : m_bands) {
        count += band.controllers.size();
    }
    return count;
}

} // namespace Lifeline
