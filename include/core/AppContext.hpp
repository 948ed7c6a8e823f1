/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef APP_CONTEXT_HPP
#define APP_CONTEXT_HPP

#include "config/CoreConfig.hpp"
#include "core/ServiceRegistry.hpp"
#include "core/ThreadSystem.hpp"
#include "managers/ConfigStore.hpp"
#include "modules/ModuleManager.hpp"
#include "world/PlayerRegistry.hpp"
#include "world/WorldRegistry.hpp"

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace Lifeline {

/**
 * @brief Owns every core system and is the host's single entry point.
 *
 * Constructed explicitly by the host and passed by reference to modules in
 * Module::onSetup(); nothing in the core is a global.
 *
 * Usage:
 *   AppContext app(configDir, dataDir);
 *   app.registerModuleFactory("metabolism", [] { return std::make_unique<MetabolismModule>(); });
 *   if (!app.init()) { return 1; }
 *   app.onPlayerJoin(playerId, worldId);
 *   ...
 *   app.shutdown();
 */
class AppContext {
public:
    using ModuleFactory = std::function<std::unique_ptr<Module>()>;

    AppContext(std::filesystem::path configDir, std::filesystem::path dataDir);
    ~AppContext();

    AppContext(const AppContext&) = delete;
    AppContext& operator=(const AppContext&) = delete;

    /**
     * @brief Makes a module available; it is created in init() only if
     *        core.json lists it in enabledModules
     */
    void registerModuleFactory(const std::string& moduleId, ModuleFactory factory);

    /**
     * @brief Loads core.json, starts the I/O pool and brings modules up
     * @return false if the process should not start (dependency cycle, I/O pool)
     */
    bool init();

    /**
     * @brief Stops every world (final flush), shuts modules down in reverse
     *        order and stops the I/O pool. Only the first call acts.
     */
    void shutdown();

    // Host notifications
    bool onWorldAdded(const std::string& worldId);
    bool onWorldRemoved(const std::string& worldId);
    bool onPlayerJoin(const std::string& playerId, const std::string& worldId);
    bool onPlayerLeave(const std::string& playerId);

    /**
     * @brief Re-reads config documents and tells modules
     * @param moduleId limit the reload to one module's document
     * @return names of the documents reloaded
     */
    std::vector<std::string> reloadConfig(const std::optional<std::string>& moduleId = std::nullopt);

    ThreadSystem& getThreadSystem() { return m_threads; }
    ConfigStore& getConfigStore() { return m_configStore; }
    ServiceRegistry& getServices() { return m_services; }
    PlayerRegistry& getPlayers() { return m_players; }
    ModuleManager& getModules() { return m_modules; }
    const CoreConfig& getCoreConfig() const { return m_coreConfig; }

    /**
     * @throws std::logic_error before init()
     */
    WorldRegistry& getWorlds();

    [[nodiscard]] bool isInitialized() const { return m_initialized; }
    std::chrono::milliseconds getShutdownFlushTimeout() const;

private:
    void leaveWorld(const std::string& playerId, const std::string& worldId);

    std::filesystem::path m_dataDir;
    CoreConfig m_coreConfig;

    ThreadSystem m_threads;
    ConfigStore m_configStore;
    ServiceRegistry m_services;
    PlayerRegistry m_players;
    std::unique_ptr<WorldRegistry> m_worlds;
    ModuleManager m_modules;

    std::vector<std::pair<std::string, ModuleFactory>> m_factories;
    size_t m_coreListenerId{0};
    bool m_initialized{false};
    bool m_shutDown{false};
};

} // namespace Lifeline

#endif // APP_CONTEXT_HPP
