/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef MODULE_MANAGER_HPP
#define MODULE_MANAGER_HPP

#include "modules/Module.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace Lifeline {

class AppContext;
class ServiceRegistry;

/**
 * @brief Owns modules and drives their lifecycle in dependency order.
 *
 * Usage:
 * @code
 * ModuleManager modules;
 * modules.registerModule(std::make_unique<MetabolismModule>());
 * if (!modules.initialize(context)) { return 1; } // dependency cycle
 * ...
 * modules.shutdownAll();
 * @endcode
 */
class ModuleManager {
public:
    ModuleManager() = default;
    ~ModuleManager() = default;

    ModuleManager(const ModuleManager&) = delete;
    ModuleManager& operator=(const ModuleManager&) = delete;

    /**
     * @brief Adds a module before initialize()
     * @return false for a null module, a duplicate id or after initialize()
     */
    bool registerModule(std::unique_ptr<Module> module);

    /**
     * @brief Topologically sorts registered modules (Kahn's algorithm).
     *
     * Ties keep registration order. Dependencies on unregistered modules are
     * ignored here and reported when the module is set up.
     *
     * @param error receives the modules involved in a cycle
     * @return false if the dependency graph has a cycle
     */
    bool resolveOrder(std::vector<Module*>& order, std::string& error) const;

    /**
     * @brief Runs setup then start for every module.
     *
     * Individual failures are logged as ModuleLifecycleFailed, withdraw the
     * module's services and exclude it from later phases.
     *
     * @return false only for a dependency cycle; nothing is set up then
     */
    bool initialize(AppContext& context);

    /**
     * @brief Reverse-order shutdown of every module whose setup completed.
     * Exceptions are logged and do not stop the sequence.
     */
    void shutdownAll();

    /**
     * @brief Calls @p hook on every Started module, isolating failures.
     */
    void dispatch(const std::string& hookName, const std::function<void(Module&)>& hook);

    Module* getModule(const std::string& moduleId) const;
    ModuleState getState(const std::string& moduleId) const;
    std::vector<std::string> getStartOrder() const;
    std::vector<std::string> getFailedModules() const;
    size_t size() const { return m_modules.size(); }

private:
    bool runPhase(Module& module, const char* phase, const std::function<void()>& action);
    void markFailed(Module& module, const std::string& reason);
    bool dependenciesHealthy(Module& module);

    std::vector<std::unique_ptr<Module>> m_modules;
    std::vector<Module*> m_order;
    ServiceRegistry* m_services{nullptr};
    bool m_initialized{false};
    bool m_shutDown{false};
};

} // namespace Lifeline

#endif // MODULE_MANAGER_HPP
