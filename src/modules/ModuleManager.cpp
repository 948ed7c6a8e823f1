/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "modules/ModuleManager.hpp"
#include "core/AppContext.hpp"
#include "core/CoreErrors.hpp"
#include "core/Logger.hpp"
#include "core/ServiceRegistry.hpp"

#include <set>
#include <unordered_map>

namespace Lifeline {

const char* toString(ModuleState state) {
    switch (state) {
    case ModuleState::Registered:
        return "Registered";
    case ModuleState::SetUp:
        return "SetUp";
    case ModuleState::Started:
        return "Started";
    case ModuleState::Stopped:
        return "Stopped";
    case ModuleState::Failed:
        return "Failed";
    }
    return "Unknown";
}

bool ModuleManager::registerModule(std::unique_ptr<Module> module) {
    if (!module) {
        MODULE_ERROR("Refusing to register a null module");
        return false;
    }
    if (m_initialized) {
        MODULE_ERROR("Module '" + module->getId() + "' registered after initialization");
        return false;
    }
    if (getModule(module->getId()) != nullptr) {
        MODULE_ERROR("Module '" + module->getId() + "' is already registered");
        return false;
    }
    MODULE_DEBUG("Registered module '" + module->getId() + "'");
    m_modules.push_back(std::move(module));
    return true;
}

bool ModuleManager::resolveOrder(std::vector<Module*>& order, std::string& error) const {
    std::unordered_map<std::string, size_t> indexById;
    for (size_t i = 0; i < m_modules.size(); ++i) {
        indexById[m_modules[i]->getId()] = i;
    }

    std::vector<size_t> inDegree(m_modules.size(), 0);
    std::vector<std::vector<size_t>> dependents(m_modules.size());
    for (size_t i = 0; i < m_modules.size(); ++i) {
        std::set<size_t> seen;
        for (const auto& dependency : m_modules[i]->getDependencies()) {
            auto it = indexById.find(dependency);
            if (it == indexById.end() || !seen.insert(it->second).second) {
                continue;
            }
            dependents[it->second].push_back(i);
            ++inDegree[i];
        }
    }

    // Ordered set keeps registration order among ready modules
    std::set<size_t> ready;
    for (size_t i = 0; i < m_modules.size(); ++i) {
        if (inDegree[i] == 0) {
            ready.insert(i);
        }
    }

    order.clear();
    while (!ready.empty()) {
        size_t current = *ready.begin();
        ready.erase(ready.begin());
        order.push_back(m_modules[current].get());
        for (size_t dependent : dependents[current]) {
            if (--inDegree[dependent] == 0) {
                ready.insert(dependent);
            }
        }
    }

    if (order.size() != m_modules.size()) {
        error = "dependency cycle among modules:";
        for (size_t i = 0; i < m_modules.size(); ++i) {
            if (inDegree[i] > 0) {
                error += " '" + m_modules[i]->getId() + "'";
            }
        }
        return false;
    }
    return true;
}

bool ModuleManager::initialize(AppContext& context) {
    if (m_initialized) {
        MODULE_WARN("ModuleManager already initialized");
        return true;
    }

    std::string error;
    if (!resolveOrder(m_order, error)) {
        m_order.clear();
        MODULE_CRITICAL("Cannot start: " + error);
        return false;
    }

    m_initialized = true;
    m_services = &context.getServices();

    for (Module* module : m_order) {
        if (!dependenciesHealthy(*module)) {
            continue;
        }
        if (runPhase(*module, "setup", [&]() { module->onSetup(context); })) {
            module->m_setupCompleted = true;
            module->m_state = ModuleState::SetUp;
        }
    }

    for (Module* module : m_order) {
        if (module->m_state != ModuleState::SetUp || !dependenciesHealthy(*module)) {
            continue;
        }
        if (runPhase(*module, "start", [module]() { module->onStart(); })) {
            module->m_state = ModuleState::Started;
            MODULE_INFO("Module '" + module->getId() + "' started");
        }
    }

    size_t failed = getFailedModules().size();
    MODULE_INFO("Initialized " + std::to_string(m_order.size() - failed) + " of " +
                std::to_string(m_order.size()) + " modules");
    return true;
}

bool ModuleManager::dependenciesHealthy(Module& module) {
    for (const auto& dependency : module.getDependencies()) {
        Module* target = getModule(dependency);
        if (target == nullptr) {
            markFailed(module, "missing dependency '" + dependency + "'");
            return false;
        }
        if (target->m_state == ModuleState::Failed) {
            markFailed(module, "dependency '" + dependency + "' failed");
            return false;
        }
    }
    return true;
}

bool ModuleManager::runPhase(Module& module, const char* phase,
                             const std::function<void()>& action) {
    try {
        action();
        return true;
    } catch (const std::exception& e) {
        markFailed(module, std::string(phase) + " failed: " + e.what());
        return false;
    } catch (...) {
        markFailed(module, std::string(phase) + " failed: unknown exception");
        return false;
    }
}

void ModuleManager::markFailed(Module& module, const std::string& reason) {
    module.m_state = ModuleState::Failed;
    module.m_failureReason = reason;
    if (m_services != nullptr) {
        size_t withdrawn = m_services->removeOwnedBy(module.getId());
        if (withdrawn > 0) {
            MODULE_DEBUG("Withdrew " + std::to_string(withdrawn) + " services of '" +
                         module.getId() + "'");
        }
    }
    ModuleLifecycleFailed failure(module.getId(), reason);
    MODULE_ERROR(failure.what());
}

void ModuleManager::shutdownAll() {
    if (!m_initialized || m_shutDown) {
        return;
    }
    m_shutDown = true;

    for (auto it = m_order.rbegin(); it != m_order.rend(); ++it) {
        Module* module = *it;
        if (!module->m_setupCompleted) {
            continue;
        }
        try {
            module->onShutdown();
        } catch (const std::exception& e) {
            MODULE_ERROR("Module '" + module->getId() + "' shutdown threw: " + e.what());
        } catch (...) {
            MODULE_ERROR("Module '" + module->getId() + "' shutdown threw an unknown exception");
        }
        if (module->m_state != ModuleState::Failed) {
            module->m_state = ModuleState::Stopped;
        }
        if (m_services != nullptr) {
            m_services->removeOwnedBy(module->getId());
        }
        MODULE_INFO("Module '" + module->getId() + "' shut down");
    }
}

void ModuleManager::dispatch(const std::string& hookName,
                             const std::function<void(Module&)>& hook) {
    for (Module* module : m_order) {
        if (module->m_state != ModuleState::Started) {
            continue;
        }
        try {
            hook(*module);
        } catch (const std::exception& e) {
            MODULE_ERROR("Module '" + module->getId() + "' " + hookName + " threw: " + e.what());
        } catch (...) {
            MODULE_ERROR("Module '" + module->getId() + "' " + hookName +
                         " threw an unknown exception");
        }
    }
}

Module* ModuleManager::getModule(const std::string& moduleId) const {
    for (const auto& module : m_modules) {
        if (module->getId() == moduleId) {
            return module.get();
        }
    }
    return nullptr;
}

ModuleState ModuleManager::getState(const std::string& moduleId) const {
    Module* module = getModule(moduleId);
    return module != nullptr ? module->getState() : ModuleState::Failed;
}

std::vector<std::string> ModuleManager::getStartOrder() const {
    std::vector<std::string> ids;
    for (Module* module : m_order) {
        ids.push_back(module->getId());
    }
    return ids;
}

std::vector<std::string> ModuleManager::getFailedModules() const {
    std::vector<std::string> ids;
    for (Module* module : m_order) {
        if (module->getState() == ModuleState::Failed) {
            ids.push_back(module->getId());
        }
    }
    return ids;
}

} // namespace Lifeline
