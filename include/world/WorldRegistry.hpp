/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef WORLD_REGISTRY_HPP
#define WORLD_REGISTRY_HPP

#include "storage/WorldStorage.hpp"
#include "world/WorldContext.hpp"

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace Lifeline {

/**
 * @brief Maps world ids to their live WorldContext.
 *
 * Contexts are created on first reference and closed when removed. Callers
 * holding a shared_ptr keep the object alive, but after removal it is closed
 * and its storage refuses further use.
 */
class WorldRegistry {
public:
    WorldRegistry(std::filesystem::path dataDir, StorageOptions options);
    ~WorldRegistry();

    WorldRegistry(const WorldRegistry&) = delete;
    WorldRegistry& operator=(const WorldRegistry&) = delete;

    /**
     * @brief Returns the context for a world, creating it if needed
     * @param created set to true when this call created the context
     * @throws std::invalid_argument for ids that are not a safe directory name
     */
    std::shared_ptr<WorldContext> getOrCreate(const std::string& worldId,
                                              bool* created = nullptr);

    std::shared_ptr<WorldContext> find(const std::string& worldId) const;

    /**
     * @brief Forgets and closes a world
     * @return false if the world was not registered
     */
    bool remove(const std::string& worldId);

    void closeAll();

    std::vector<std::string> getWorldIds() const;
    size_t size() const;

    const std::filesystem::path& getDataDir() const { return m_dataDir; }

    static bool isValidWorldId(const std::string& worldId);

private:
    std::filesystem::path m_dataDir;
    StorageOptions m_options;

    mutable std::mutex m_mutex;
    std::map<std::string, std::shared_ptr<WorldContext>> m_worlds;
};

} // namespace Lifeline

#endif // WORLD_REGISTRY_HPP
