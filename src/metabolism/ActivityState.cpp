/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "metabolism/ActivityState.hpp"

namespace Lifeline {

ActivityState classifyMovement(const MovementFlags& flags) {
    if (flags.inCombat) {
        return ActivityState::Combat;
    }
    if (flags.sprinting) {
        return ActivityState::Sprinting;
    }
    if (flags.swimming) {
        return ActivityState::Swimming;
    }
    if (flags.walking || flags.running) {
        return ActivityState::Walking;
    }
    return ActivityState::Idle;
}

const char* activityKey(ActivityState state) {
    switch (state) {
    case ActivityState::Idle:
        return "idle";
    case ActivityState::Walking:
        return "walking";
    case ActivityState::Sprinting:
        return "sprinting";
    case ActivityState::Swimming:
        return "swimming";
    case ActivityState::Combat:
        return "combat";
    }
    return "idle";
}

std::optional<ActivityState> activityFromKey(const std::string& key) {
    for (ActivityState state : {ActivityState::Idle, ActivityState::Walking,
                                ActivityState::Sprinting, ActivityState::Swimming,
                                ActivityState::Combat}) {
        if (key == activityKey(state)) {
            return state;
        }
    }
    return std::nullopt;
}

} // namespace Lifeline
