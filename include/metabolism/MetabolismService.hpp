/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef METABOLISM_SERVICE_HPP
#define METABOLISM_SERVICE_HPP

#include "metabolism/StatVector.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace Lifeline {

class MetabolismEngine;
class PlayerRegistry;

/**
 * @brief Host-facing queries over every world's metabolism engine.
 *
 * Published in the ServiceRegistry by MetabolismModule. Player lookups go
 * through the PlayerRegistry, so only connected players resolve.
 */
class MetabolismService {
public:
    explicit MetabolismService(const PlayerRegistry& players) : m_players(players) {}

    void addEngine(std::shared_ptr<MetabolismEngine> engine);
    std::shared_ptr<MetabolismEngine> removeEngine(const std::string& worldId);
    std::shared_ptr<MetabolismEngine> getEngine(const std::string& worldId) const;
    std::vector<std::shared_ptr<MetabolismEngine>> getEngines() const;

    std::optional<StatVector> getStats(const std::string& playerId) const;
    std::vector<std::string> getActiveEffects(const std::string& playerId) const;
    bool restore(const std::string& playerId, const std::string& stat, double amount);

    // Respawn: defaults back, effects cleared
    bool resetStats(const std::string& playerId);

    /**
     * @brief Writes every changed player of a world now
     * @return false if the world has no metabolism engine
     */
    bool forceFlush(const std::string& worldId);

private:
    std::shared_ptr<MetabolismEngine> engineForPlayer(const std::string& playerId) const;

    const PlayerRegistry& m_players;
    mutable std::mutex m_mutex;
    std::map<std::string, std::shared_ptr<MetabolismEngine>> m_engines;
};

} // namespace Lifeline

#endif // METABOLISM_SERVICE_HPP
