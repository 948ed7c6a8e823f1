/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef HYSTERESIS_CONTROLLER_HPP
#define HYSTERESIS_CONTROLLER_HPP

#include <cstdint>
#include <optional>
#include <string>

namespace Lifeline {

enum class EffectDirection : uint8_t {
    Low,   // Active while the value is low (debuffs)
    High   // Active while the value is high (buffs)
};

enum class TransitionEvent : uint8_t {
    Entered,
    Exited
};

const char* toString(EffectDirection direction);
const char* toString(TransitionEvent event);

/**
 * @brief Two-threshold state machine turning a continuous value into an on/off effect.
 *
 * Low direction: enters when value <= enter, exits when value >= exit, with
 * exit - enter >= epsilon. High direction mirrors it. Between the thresholds
 * the state never changes, so noisy input cannot make the effect flicker.
 */
class HysteresisController {
public:
    /**
     * @throws std::invalid_argument if the thresholds are not finite or the
     *         dead zone is narrower than epsilon
     */
    HysteresisController(std::string effect, double enterThreshold, double exitThreshold,
                         EffectDirection direction, double epsilon = 1.0);

    /**
     * @brief Feeds one sample
     * @return the transition caused by this sample, if any
     */
    std::optional<TransitionEvent> evaluate(double value);

    [[nodiscard]] bool isActive() const { return m_active; }
    void reset() { m_active = false; }
    void setActive(bool active) { m_active = active; }

    const std::string& getEffect() const { return m_effect; }
    double getEnterThreshold() const { return m_enter; }
    double getExitThreshold() const { return m_exit; }
    EffectDirection getDirection() const { return m_direction; }

private:
    std::string m_effect;
    double m_enter;
    double m_exit;
    EffectDirection m_direction;
    bool m_active{false};
};

} // namespace Lifeline

#endif // HYSTERESIS_CONTROLLER_HPP
