/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef HOST_INTERFACES_HPP
#define HOST_INTERFACES_HPP

/**
 * @file HostInterfaces.hpp
 * @brief What the embedding game server supplies to the core
 *
 * The host publishes implementations into the ServiceRegistry (owner "host")
 * before AppContext::init(). Modules fall back to neutral behavior when an
 * interface is absent.
 */

#include <string>

namespace Lifeline {

/**
 * @brief Movement signal sampled once per tick per player
 */
struct MovementFlags {
    bool walking{false};
    bool running{false};
    bool sprinting{false};
    bool swimming{false};
    bool inCombat{false};
};

class ActivitySource {
public:
    virtual ~ActivitySource() = default;

    /**
     * @brief Current movement state of a player in a world
     * @throws ActivityClassificationUnavailable when the host has no data
     *         for the player this tick
     */
    virtual MovementFlags sample(const std::string& worldId, const std::string& playerId) = 0;
};

/**
 * @brief Receives effect changes and status summaries. Fire-and-forget.
 *
 * Called on the world's tick thread; implementations must not block.
 */
class EffectSink {
public:
    virtual ~EffectSink() = default;

    virtual void onEffectChanged(const std::string& worldId, const std::string& playerId,
                                 const std::string& effect, bool active) = 0;

    virtual void onStatusLine(const std::string& /*worldId*/, const std::string& /*playerId*/,
                              const std::string& /*line*/) {}
};

} // namespace Lifeline

#endif // HOST_INTERFACES_HPP
