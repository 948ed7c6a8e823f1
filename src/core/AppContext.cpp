/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/AppContext.hpp"
#include "core/Logger.hpp"

#include <stdexcept>

namespace Lifeline {

AppContext::AppContext(std::filesystem::path configDir, std::filesystem::path dataDir)
    : m_dataDir(std::move(dataDir)), m_configStore(std::move(configDir)) {}

AppContext::~AppContext() {
    shutdown();
}

void AppContext::registerModuleFactory(const std::string& moduleId, ModuleFactory factory) {
    if (m_initialized) {
        CORE_WARN("Module factory '" + moduleId + "' registered after init; ignored");
        return;
    }
    m_factories.emplace_back(moduleId, std::move(factory));
}

bool AppContext::init() {
    if (m_initialized) {
        CORE_WARN("AppContext already initialized");
        return true;
    }
    if (m_shutDown) {
        CORE_ERROR("AppContext cannot be re-initialized after shutdown");
        return false;
    }

    m_configStore.getMigrations().registerMigrations(CoreConfig::DOCUMENT_NAME,
                                                     CoreConfig::migrations());
    m_coreConfig = m_configStore.load<CoreConfig>(CoreConfig::DOCUMENT_NAME);
    Logger::SetVerbose(m_coreConfig.debug);
    Logger::SetLogDirectory((m_dataDir / "logs").string());
    CORE_INFO("Loaded core config (" +
              std::string(toString(m_configStore.getStatus(CoreConfig::DOCUMENT_NAME))) + ")");

    m_coreListenerId = m_configStore.registerChangeListener<CoreConfig>(
        CoreConfig::DOCUMENT_NAME, [](const CoreConfig& config) {
            Logger::SetVerbose(config.debug);
            CORE_INFO("Core config reloaded; storage and thread settings apply on restart");
        });

    if (!m_threads.init(static_cast<unsigned int>(m_coreConfig.ioThreads))) {
        CORE_CRITICAL("Failed to start the I/O thread pool");
        return false;
    }

    StorageOptions options;
    options.busyTimeout = std::chrono::milliseconds(m_coreConfig.busyTimeoutMs);
    options.readerConnections = static_cast<size_t>(m_coreConfig.readerConnections);
    m_worlds = std::make_unique<WorldRegistry>(m_dataDir, options);

    for (auto& [moduleId, factory] : m_factories) {
        if (!m_coreConfig.isModuleEnabled(moduleId)) {
            CORE_INFO("Module '" + moduleId + "' disabled in core config");
            continue;
        }
        std::unique_ptr<Module> module = factory();
        if (!module || module->getId() != moduleId) {
            CORE_ERROR("Factory for '" + moduleId + "' produced no matching module");
            continue;
        }
        m_modules.registerModule(std::move(module));
    }
    for (const auto& moduleId : m_coreConfig.enabledModules) {
        if (m_modules.getModule(moduleId) == nullptr) {
            CORE_WARN("Enabled module '" + moduleId + "' is not available");
        }
    }

    if (!m_modules.initialize(*this)) {
        CORE_CRITICAL("Module dependency graph is invalid; not starting");
        m_threads.clean();
        return false;
    }

    m_initialized = true;
    CORE_INFO("Lifeline initialized with data directory " + m_dataDir.string());
    return true;
}

WorldRegistry& AppContext::getWorlds() {
    if (!m_worlds) {
        throw std::logic_error("AppContext::getWorlds() called before init()");
    }
    return *m_worlds;
}

std::chrono::milliseconds AppContext::getShutdownFlushTimeout() const {
    return std::chrono::milliseconds(m_coreConfig.shutdownFlushTimeoutMs);
}

bool AppContext::onWorldAdded(const std::string& worldId) {
    if (!m_initialized || m_shutDown) {
        CORE_WARN("World '" + worldId + "' added while not running");
        return false;
    }
    bool created = false;
    std::shared_ptr<WorldContext> world;
    try {
        world = m_worlds->getOrCreate(worldId, &created);
    } catch (const std::invalid_argument& e) {
        CORE_ERROR(std::string("Rejected world: ") + e.what());
        return false;
    }
    if (created) {
        WORLD_INFO("World '" + worldId + "' added");
        m_modules.dispatch("onWorldAdded", [&world](Module& module) {
            module.onWorldAdded(*world);
        });
    }
    return true;
}

bool AppContext::onWorldRemoved(const std::string& worldId) {
    if (!m_worlds) {
        return false;
    }
    std::shared_ptr<WorldContext> world = m_worlds->find(worldId);
    if (!world) {
        CORE_WARN("Removal of unknown world '" + worldId + "'");
        return false;
    }

    for (const auto& playerId : m_players.getPlayersIn(worldId)) {
        m_players.unbind(playerId);
        world->recordPlayerSeen(playerId);
    }
    m_modules.dispatch("onWorldRemoving", [&world](Module& module) {
        module.onWorldRemoving(*world);
    });
    m_worlds->remove(worldId);
    WORLD_INFO("World '" + worldId + "' removed");
    return true;
}

bool AppContext::onPlayerJoin(const std::string& playerId, const std::string& worldId) {
    if (playerId.empty()) {
        CORE_ERROR("Player join without an id ignored");
        return false;
    }
    if (!onWorldAdded(worldId)) {
        return false;
    }
    std::shared_ptr<WorldContext> world = m_worlds->find(worldId);
    if (!world) {
        return false;
    }

    std::optional<std::string> previous = m_players.getWorld(playerId);
    if (previous && *previous == worldId) {
        CORE_DEBUG("Player " + playerId + " already in '" + worldId + "'");
        return true;
    }
    if (previous) {
        // World switch: leave the old world before joining the new one
        leaveWorld(playerId, *previous);
    }

    m_players.bind(playerId, worldId);
    world->recordPlayerSeen(playerId);
    m_modules.dispatch("onPlayerJoin", [&](Module& module) {
        module.onPlayerJoin(playerId, *world);
    });
    return true;
}

bool AppContext::onPlayerLeave(const std::string& playerId) {
    std::optional<std::string> worldId = m_players.getWorld(playerId);
    if (!worldId) {
        CORE_DEBUG("Leave for unknown player " + playerId);
        return false;
    }
    leaveWorld(playerId, *worldId);
    return true;
}

void AppContext::leaveWorld(const std::string& playerId, const std::string& worldId) {
    m_players.unbind(playerId);
    std::shared_ptr<WorldContext> world = m_worlds ? m_worlds->find(worldId) : nullptr;
    if (!world) {
        return;
    }
    world->recordPlayerSeen(playerId);
    m_modules.dispatch("onPlayerLeave", [&](Module& module) {
        module.onPlayerLeave(playerId, *world);
    });
}

std::vector<std::string> AppContext::reloadConfig(const std::optional<std::string>& moduleId) {
    if (!m_initialized) {
        CORE_WARN("Config reload requested before init");
        return {};
    }

    std::vector<std::string> reloaded = m_configStore.reload(moduleId);
    if (moduleId) {
        Module* module = m_modules.getModule(*moduleId);
        if (module != nullptr && module->getState() == ModuleState::Started) {
            m_modules.dispatch("onConfigReload", [module](Module& candidate) {
                if (&candidate == module) {
                    candidate.onConfigReload();
                }
            });
        }
    } else {
        m_modules.dispatch("onConfigReload", [](Module& module) { module.onConfigReload(); });
    }
    CORE_INFO("Reloaded " + std::to_string(reloaded.size()) + " config documents");
    return reloaded;
}

void AppContext::shutdown() {
    if (m_shutDown) {
        return;
    }
    m_shutDown = true;

    if (m_initialized) {
        CORE_INFO("Shutting down Lifeline");
        for (const auto& worldId : m_worlds->getWorldIds()) {
            onWorldRemoved(worldId);
        }
        m_modules.shutdownAll();
        m_configStore.unregisterChangeListener(m_coreListenerId);
        m_worlds->closeAll();
    }
    m_threads.clean();
    m_initialized = false;
    CORE_INFO("Lifeline shutdown complete");
}

} // namespace Lifeline
