/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/PlayerRegistry.hpp"

#include <algorithm>

namespace Lifeline {

std::optional<std::string> PlayerRegistry::bind(const std::string& playerId,
                                                const std::string& worldId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::optional<std::string> previous;
    auto it = m_sessions.find(playerId);
    if (it != m_sessions.end()) {
        previous = it->second;
        it->second = worldId;
    } else {
        m_sessions.emplace(playerId, worldId);
    }
    return previous;
}

bool PlayerRegistry::unbind(const std::string& playerId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_sessions.erase(playerId) > 0;
}

std::optional<std::string> PlayerRegistry::getWorld(const std::string& playerId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_sessions.find(playerId);
    if (it == m_sessions.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> PlayerRegistry::getPlayersIn(const std::string& worldId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> players;
    for (const auto& [playerId, world] : m_sessions) {
        if (world == worldId) {
            players.push_back(playerId);
        }
    }
    std::sort(players.begin(), players.end());
    return players;
}

size_t PlayerRegistry::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_sessions.size();
}

} // namespace Lifeline
