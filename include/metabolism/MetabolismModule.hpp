/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef METABOLISM_MODULE_HPP
#define METABOLISM_MODULE_HPP

#include "metabolism/MetabolismConfig.hpp"
#include "modules/Module.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace Lifeline {

class ActivitySource;
class EffectSink;
class MetabolismEngine;
class MetabolismService;
class TickScheduler;

/**
 * @brief Runs a MetabolismEngine and its TickScheduler for every live world.
 *
 * Setup loads metabolism.json and publishes MetabolismService. World runtimes
 * live in each WorldContext's module state slot and are torn down (stop
 * ticking, final flush, release) before the world's storage closes.
 */
class MetabolismModule : public Module {
public:
    static constexpr const char* MODULE_ID = "metabolism";

    MetabolismModule();
    ~MetabolismModule() override;

    void onSetup(AppContext& context) override;
    void onStart() override;
    void onShutdown() override;

    void onWorldAdded(WorldContext& world) override;
    void onWorldRemoving(WorldContext& world) override;
    void onPlayerJoin(const std::string& playerId, WorldContext& world) override;
    void onPlayerLeave(const std::string& playerId, WorldContext& world) override;

    MetabolismConfig getConfig() const;

private:
    struct WorldRuntime;

    void teardown(WorldContext& world);
    void onConfigChanged(const MetabolismConfig& config);

    AppContext* m_context{nullptr};
    std::shared_ptr<MetabolismService> m_service;
    std::shared_ptr<ActivitySource> m_activity;
    std::shared_ptr<EffectSink> m_sink;

    mutable std::mutex m_configMutex;
    MetabolismConfig m_config;
    std::optional<size_t> m_listenerId;
};

} // namespace Lifeline

#endif // METABOLISM_MODULE_HPP
