/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef WORLD_CONTEXT_HPP
#define WORLD_CONTEXT_HPP

#include "storage/WorldStorage.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace Lifeline {

/**
 * @brief Everything the core keeps for one live world.
 *
 * Owns the world's storage (opened on first use, closed exactly once) and a
 * private state slot per module. Storage that fails with StorageCorrupt or
 * SchemaMismatch is remembered as unavailable and the world carries on in
 * memory.
 */
class WorldContext {
public:
    WorldContext(std::string worldId, std::filesystem::path dataDir,
                 StorageOptions options);
    ~WorldContext();

    WorldContext(const WorldContext&) = delete;
    WorldContext& operator=(const WorldContext&) = delete;

    const std::string& getWorldId() const { return m_worldId; }

    /**
     * @brief Storage for this world, opening it on first call.
     * @throws StorageCorrupt, SchemaMismatch, StorageBusy, std::logic_error
     *         after close()
     */
    std::shared_ptr<WorldStorage> getStorage();

    /**
     * @brief Like getStorage() but returns nullptr when storage is unavailable.
     */
    std::shared_ptr<WorldStorage> tryGetStorage();

    bool isStorageOpen() const;
    bool isStorageDegraded() const;

    /**
     * @brief Upserts the player row; storage problems are logged, not thrown.
     */
    void recordPlayerSeen(const std::string& playerId);

    template<typename T, typename Factory>
    std::shared_ptr<T> getOrCreateModuleState(const std::string& moduleId, Factory&& factory)
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        auto it = m_moduleState.find(moduleId);
        if (it != m_moduleState.end()) {
            return std::static_pointer_cast<T>(it->second);
        }
        std::shared_ptr<T> state = factory();
        m_moduleState[moduleId] = state;
        return state;
    }

    template<typename T>
    std::shared_ptr<T> getModuleState(const std::string& moduleId) const
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        auto it = m_moduleState.find(moduleId);
        if (it == m_moduleState.end()) {
            return nullptr;
        }
        return std::static_pointer_cast<T>(it->second);
    }

    bool removeModuleState(const std::string& moduleId);

    /**
     * @brief Drops module state and closes storage. Only the first call acts.
     */
    void close();
    bool isClosed() const;

private:
    std::string m_worldId;
    std::filesystem::path m_dataDir;
    StorageOptions m_options;

    mutable std::mutex m_storageMutex;
    std::shared_ptr<WorldStorage> m_storage;
    std::string m_storageFailure;
    bool m_failureIsSchema{false};
    bool m_closed{false};

    mutable std::mutex m_stateMutex;
    std::unordered_map<std::string, std::shared_ptr<void>> m_moduleState;
};

} // namespace Lifeline

#endif // WORLD_CONTEXT_HPP
