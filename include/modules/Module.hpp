/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef MODULE_HPP
#define MODULE_HPP

/**
 * @file Module.hpp
 * @brief Base class for independently loadable feature modules
 *
 * A module declares the modules it depends on and is driven through
 * setup -> start -> shutdown by the ModuleManager, in dependency order.
 * A failure in any phase only takes out that module (and anything that
 * depends on it); the rest keep running.
 *
 * Key characteristics:
 * - Owned by the ModuleManager (not singletons)
 * - Publishes services into the ServiceRegistry during onSetup()
 * - Receives world and player events only while Started
 */

#include <string>
#include <vector>

namespace Lifeline {

class AppContext;
class WorldContext;

enum class ModuleState {
    Registered,
    SetUp,
    Started,
    Stopped,
    Failed
};

const char* toString(ModuleState state);

class Module
{
public:
    virtual ~Module() = default;

    Module(const Module&) = delete;
    Module& operator=(const Module&) = delete;

    [[nodiscard]] const std::string& getId() const { return m_id; }
    [[nodiscard]] const std::vector<std::string>& getDependencies() const { return m_dependencies; }
    [[nodiscard]] ModuleState getState() const { return m_state; }
    [[nodiscard]] const std::string& getFailureReason() const { return m_failureReason; }

    /**
     * @brief Acquire configuration and publish services
     * @throws anything derived from std::exception to fail the module
     */
    virtual void onSetup(AppContext& context) = 0;

    // Begin active work; dependencies are already started
    virtual void onStart() {}

    // Release everything; dependents are already shut down
    virtual void onShutdown() {}

    virtual void onWorldAdded(WorldContext& /*world*/) {}
    virtual void onWorldRemoving(WorldContext& /*world*/) {}
    virtual void onPlayerJoin(const std::string& /*playerId*/, WorldContext& /*world*/) {}
    virtual void onPlayerLeave(const std::string& /*playerId*/, WorldContext& /*world*/) {}

    // Config documents were re-read; pick up changed values
    virtual void onConfigReload() {}

protected:
    Module(std::string id, std::vector<std::string> dependencies = {})
        : m_id(std::move(id)), m_dependencies(std::move(dependencies)) {}

private:
    friend class ModuleManager;

    std::string m_id;
    std::vector<std::string> m_dependencies;
    ModuleState m_state{ModuleState::Registered};
    std::string m_failureReason;
    bool m_setupCompleted{false};
};

} // namespace Lifeline

#endif // MODULE_HPP
