/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ACTIVITY_STATE_HPP
#define ACTIVITY_STATE_HPP

#include "host/HostInterfaces.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace Lifeline {

enum class ActivityState : uint8_t {
    Idle,
    Walking,
    Sprinting,
    Swimming,
    Combat
};

// Combat > Sprinting > Swimming > Walking > Idle
ActivityState classifyMovement(const MovementFlags& flags);

// Lower-case key used for activityMultipliers in metabolism.json
const char* activityKey(ActivityState state);

std::optional<ActivityState> activityFromKey(const std::string& key);

} // namespace Lifeline

#endif // ACTIVITY_STATE_HPP
