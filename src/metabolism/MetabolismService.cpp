/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "metabolism/MetabolismService.hpp"
#include "core/Logger.hpp"
#include "metabolism/MetabolismEngine.hpp"
#include "world/PlayerRegistry.hpp"

namespace Lifeline {

void MetabolismService::addEngine(std::shared_ptr<MetabolismEngine> engine) {
    std::lock_guard<std::mutex> lock(m_mutex);
    const std::string worldId = engine->getWorldId();
    m_engines[worldId] = std::move(engine);
}

std::shared_ptr<MetabolismEngine> MetabolismService::removeEngine(const std::string& worldId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_engines.find(worldId);
    if (it == m_engines.end()) {
        return nullptr;
    }
    std::shared_ptr<MetabolismEngine> engine = std::move(it->second);
    m_engines.erase(it);
    return engine;
}

std::shared_ptr<MetabolismEngine> MetabolismService::getEngine(const std::string& worldId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_engines.find(worldId);
    return it != m_engines.end() ? it->second : nullptr;
}

std::vector<std::shared_ptr<MetabolismEngine>> MetabolismService::getEngines() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::shared_ptr<MetabolismEngine>> engines;
    engines.reserve(m_engines.size());
    for (const auto& [worldId, engine] : m_engines) {
        engines.push_back(engine);
    }
    return engines;
}

std::shared_ptr<MetabolismEngine>
MetabolismService::engineForPlayer(const std::string& playerId) const {
    auto worldId = m_players.getWorld(playerId);
    return worldId ? getEngine(*worldId) : nullptr;
}

std::optional<StatVector> MetabolismService::getStats(const std::string& playerId) const {
    auto engine = engineForPlayer(playerId);
    return engine ? engine->getStats(playerId) : std::nullopt;
}

std::vector<std::string> MetabolismService::getActiveEffects(const std::string& playerId) const {
    auto engine = engineForPlayer(playerId);
    return engine ? engine->getActiveEffects(playerId) : std::vector<std::string>{};
}

bool MetabolismService::restore(const std::string& playerId, const std::string& stat,
                                double amount) {
    auto engine = engineForPlayer(playerId);
    return engine && engine->restore(playerId, stat, amount);
}

bool MetabolismService::resetStats(const std::string& playerId) {
    auto engine = engineForPlayer(playerId);
    if (!engine || !engine->resetStats(playerId)) {
        METABOLISM_DEBUG("resetStats: player " + playerId + " is not active in any world");
        return false;
    }
    return true;
}

bool MetabolismService::forceFlush(const std::string& worldId) {
    auto engine = getEngine(worldId);
    if (!engine) {
        METABOLISM_WARN("forceFlush: no metabolism engine for world '" + worldId + "'");
        return false;
    }
    size_t staged = engine->forceFlush();
    METABOLISM_DEBUG("forceFlush '" + worldId + "': " + std::to_string(staged) + " players staged");
    return true;
}

} // namespace Lifeline
