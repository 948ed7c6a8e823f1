/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/WorldContext.hpp"
#include "core/CoreErrors.hpp"
#include "core/Logger.hpp"
#include "storage/PlayerRepository.hpp"

#include <stdexcept>

namespace Lifeline {

WorldContext::WorldContext(std::string worldId, std::filesystem::path dataDir,
                           StorageOptions options)
    : m_worldId(std::move(worldId)), m_dataDir(std::move(dataDir)), m_options(options) {}

WorldContext::~WorldContext() { close(); }

std::shared_ptr<WorldStorage> WorldContext::getStorage() {
    std::lock_guard<std::mutex> lock(m_storageMutex);
    if (m_closed) {
        throw std::logic_error("World '" + m_worldId + "' is closed");
    }
    if (m_storage) {
        return m_storage;
    }
    if (!m_storageFailure.empty()) {
        if (m_failureIsSchema) {
            throw SchemaMismatch(m_storageFailure);
        }
        throw StorageCorrupt(m_storageFailure);
    }

    try {
        m_storage = WorldStorage::open(m_dataDir, m_worldId, m_options);
    } catch (const StorageCorrupt& e) {
        m_storageFailure = e.what();
        WORLD_CRITICAL("World '" + m_worldId + "' storage is corrupt, running in memory only: " +
                       e.what());
        throw;
    } catch (const SchemaMismatch& e) {
        m_storageFailure = e.what();
        m_failureIsSchema = true;
        WORLD_CRITICAL("World '" + m_worldId +
                       "' storage schema mismatch, running in memory only: " + e.what());
        throw;
    }
    return m_storage;
}

std::shared_ptr<WorldStorage> WorldContext::tryGetStorage() {
    try {
        return getStorage();
    } catch (const LifelineError& e) {
        WORLD_DEBUG("World '" + m_worldId + "' storage unavailable: " + e.what());
        return nullptr;
    } catch (const std::logic_error& e) {
        WORLD_DEBUG(e.what());
        return nullptr;
    }
}

bool WorldContext::isStorageOpen() const {
    std::lock_guard<std::mutex> lock(m_storageMutex);
    return m_storage != nullptr && m_storage->isOpen();
}

bool WorldContext::isStorageDegraded() const {
    std::lock_guard<std::mutex> lock(m_storageMutex);
    return !m_storageFailure.empty();
}

void WorldContext::recordPlayerSeen(const std::string& playerId) {
    auto storage = tryGetStorage();
    if (!storage) {
        return;
    }
    try {
        PlayerRepository(*storage).recordSeen(playerId, PlayerRepository::nowMs());
    } catch (const StorageBusy& e) {
        WORLD_WARN("World '" + m_worldId + "' could not record player '" + playerId +
                   "': " + e.what());
    } catch (const LifelineError& e) {
        WORLD_ERROR("World '" + m_worldId + "' failed to record player '" + playerId +
                    "': " + e.what());
    }
}

bool WorldContext::removeModuleState(const std::string& moduleId) {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_moduleState.erase(moduleId) > 0;
}

void WorldContext::close() {
    std::shared_ptr<WorldStorage> storage;
    {
        std::lock_guard<std::mutex> lock(m_storageMutex);
        if (m_closed) {
            return;
        }
        m_closed = true;
        storage = std::move(m_storage);
    }

    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        m_moduleState.clear();
    }

    if (storage) {
        try {
            storage->close();
        } catch (const StorageBusy& e) {
            // The last owner of the storage retries on release
            WORLD_ERROR("World '" + m_worldId + "' storage still busy at close: " + e.what());
        }
    }
    WORLD_INFO("World '" + m_worldId + "' closed");
}

bool WorldContext::isClosed() const {
    std::lock_guard<std::mutex> lock(m_storageMutex);
    return m_closed;
}

} // namespace Lifeline
