/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PLAYER_REGISTRY_HPP
#define PLAYER_REGISTRY_HPP

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace Lifeline {

// Which world each connected player is currently in
class PlayerRegistry {
public:
    /**
     * @brief Records that a player is now in a world
     * @return the world the player was in before, if any
     */
    std::optional<std::string> bind(const std::string& playerId, const std::string& worldId);

    bool unbind(const std::string& playerId);
    std::optional<std::string> getWorld(const std::string& playerId) const;
    std::vector<std::string> getPlayersIn(const std::string& worldId) const;
    size_t size() const;

private:
    mutable std::mutex m_mutex;
    std::unordered_map<std::string, std::string> m_sessions;
};

} // namespace Lifeline

#endif // PLAYER_REGISTRY_HPP
