/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "metabolism/HysteresisController.hpp"

#include <cmath>
#include <stdexcept>

namespace Lifeline {

const char* toString(EffectDirection direction) {
    return direction == EffectDirection::Low ? "low" : "high";
}

const char* toString(TransitionEvent event) {
    return event == TransitionEvent::Entered ? "Entered" : "Exited";
}

HysteresisController::HysteresisController(std::string effect, double enterThreshold,
                                           double exitThreshold, EffectDirection direction,
                                           double epsilon)
    : m_effect(std::move(effect)),
      m_enter(enterThreshold),
      m_exit(exitThreshold),
      m_direction(direction) {
    if (!std::isfinite(m_enter) || !std::isfinite(m_exit) || !std::isfinite(epsilon) ||
        epsilon <= 0.0) {
        throw std::invalid_argument("Effect '" + m_effect + "' has non-finite thresholds");
    }
    double deadZone = (m_direction == EffectDirection::Low) ? m_exit - m_enter : m_enter - m_exit;
    if (deadZone < epsilon) {
        throw std::invalid_argument("Effect '" + m_effect + "' (" + toString(m_direction) +
                                    "): enter " + std::to_string(m_enter) + " and exit " +
                                    std::to_string(m_exit) + " must be at least " +
                                    std::to_string(epsilon) + " apart on the exit side");
    }
}

std::optional<TransitionEvent> HysteresisController::evaluate(double value) {
    if (std::isnan(value)) {
        return std::nullopt;
    }

    bool low = (m_direction == EffectDirection::Low);
    if (!m_active) {
        bool enters = low ? value <= m_enter : value >= m_enter;
        if (enters) {
            m_active = true;
            return TransitionEvent::Entered;
        }
    } else {
        bool exits = low ? value >= m_exit : value <= m_exit;
        if (exits) {
            m_active = false;
            return TransitionEvent::Exited;
        }
    }
    return std::nullopt;
}

} // namespace Lifeline
