/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/WorldRegistry.hpp"
#include "core/Logger.hpp"

#include <algorithm>
#include <stdexcept>

namespace Lifeline {

WorldRegistry::WorldRegistry(std::filesystem::path dataDir, StorageOptions options)
    : m_dataDir(std::move(dataDir)), m_options(options) {}

WorldRegistry::~WorldRegistry() { closeAll(); }

bool WorldRegistry::isValidWorldId(const std::string& worldId) {
    if (worldId.empty() || worldId.size() > 128 || worldId == "." || worldId == "..") {
        return false;
    }
    return std::all_of(worldId.begin(), worldId.end(), [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
               c == '-' || c == '_' || c == '.';
    });
}

std::shared_ptr<WorldContext> WorldRegistry::getOrCreate(const std::string& worldId,
                                                         bool* created) {
    if (!isValidWorldId(worldId)) {
        throw std::invalid_argument("Invalid world id '" + worldId + "'");
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_worlds.find(worldId);
    if (it != m_worlds.end()) {
        if (created != nullptr) {
            *created = false;
        }
        return it->second;
    }

    auto context = std::make_shared<WorldContext>(worldId, m_dataDir, m_options);
    m_worlds.emplace(worldId, context);
    if (created != nullptr) {
        *created = true;
    }
    WORLD_INFO("Registered world '" + worldId + "'");
    return context;
}

std::shared_ptr<WorldContext> WorldRegistry::find(const std::string& worldId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_worlds.find(worldId);
    return it != m_worlds.end() ? it->second : nullptr;
}

bool WorldRegistry::remove(const std::string& worldId) {
    std::shared_ptr<WorldContext> context;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_worlds.find(worldId);
        if (it == m_worlds.end()) {
            return false;
        }
        context = std::move(it->second);
        m_worlds.erase(it);
    }
    context->close();
    return true;
}

void WorldRegistry::closeAll() {
    std::map<std::string, std::shared_ptr<WorldContext>> worlds;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        worlds.swap(m_worlds);
    }
    for (auto& [worldId, context] : worlds) {
        context->close();
    }
}

std::vector<std::string> WorldRegistry::getWorldIds() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> ids;
    ids.reserve(m_worlds.size());
    for (const auto& [worldId, context] : m_worlds) {
        ids.push_back(worldId);
    }
    return ids;
}

size_t WorldRegistry::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_worlds.size();
}

} // namespace Lifeline
