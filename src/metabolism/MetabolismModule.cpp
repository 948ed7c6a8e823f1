/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "metabolism/MetabolismModule.hpp"
#include "core/AppContext.hpp"
#include "core/CoreErrors.hpp"
#include "core/Logger.hpp"
#include "core/TickScheduler.hpp"
#include "host/HostInterfaces.hpp"
#include "metabolism/MetabolismEngine.hpp"
#include "metabolism/MetabolismRepository.hpp"
#include "metabolism/MetabolismService.hpp"
#include "world/WorldContext.hpp"

#include <stdexcept>

namespace Lifeline {

struct MetabolismModule::WorldRuntime {
    std::shared_ptr<MetabolismEngine> engine;
    std::unique_ptr<TickScheduler> scheduler;
};

MetabolismModule::MetabolismModule() : Module(MODULE_ID) {}

MetabolismModule::~MetabolismModule() = default;

void MetabolismModule::onSetup(AppContext& context) {
    m_context = &context;
    ConfigStore& store = context.getConfigStore();

    if (!store.getMigrations().hasMigrations(MetabolismConfig::DOCUMENT_NAME)) {
        store.getMigrations().registerMigrations(MetabolismConfig::DOCUMENT_NAME,
                                                 MetabolismConfig::migrations());
    }
    MetabolismConfig config = store.load<MetabolismConfig>(MetabolismConfig::DOCUMENT_NAME);
    METABOLISM_INFO("Loaded metabolism config (" +
                    std::string(toString(store.getStatus(MetabolismConfig::DOCUMENT_NAME))) +
                    "), " + std::to_string(config.stats.size()) + " stats, " +
                    std::to_string(config.effects.size()) + " effects");
    {
        std::lock_guard<std::mutex> lock(m_configMutex);
        m_config = std::move(config);
    }

    m_service = std::make_shared<MetabolismService>(context.getPlayers());
    if (!context.getServices().add<MetabolismService>(getId(), m_service)) {
        throw std::runtime_error("MetabolismService is already registered");
    }

    m_activity = context.getServices().get<ActivitySource>();
    m_sink = context.getServices().get<EffectSink>();
    if (!m_activity) {
        METABOLISM_WARN("No ActivitySource from the host; every player counts as idle");
    }

    m_listenerId = store.registerChangeListener<MetabolismConfig>(
        MetabolismConfig::DOCUMENT_NAME,
        [this](const MetabolismConfig& updated) { onConfigChanged(updated); });
}

void MetabolismModule::onStart() {
    MetabolismConfig config = getConfig();
    METABOLISM_INFO(std::string("Metabolism ") + (config.enabled ? "enabled" : "disabled") +
                    ", tick " + std::to_string(config.tickPeriodMs) + "ms, flush every " +
                    std::to_string(config.flushIntervalTicks) + " ticks");
}

void MetabolismModule::onShutdown() {
    if (m_context == nullptr) {
        return;
    }
    if (m_listenerId) {
        m_context->getConfigStore().unregisterChangeListener(*m_listenerId);
        m_listenerId.reset();
    }

    // Worlds still live at this point were never removed by the host
    for (const auto& worldId : m_context->getWorlds().getWorldIds()) {
        if (auto world = m_context->getWorlds().find(worldId)) {
            teardown(*world);
        }
    }
    m_service.reset();
}

void MetabolismModule::onWorldAdded(WorldContext& world) {
    std::shared_ptr<WorldStorage> storage = world.tryGetStorage();
    if (storage) {
        try {
            int version = MetabolismRepository(*storage).ensureSchema();
            METABOLISM_DEBUG("World '" + world.getWorldId() + "' metabolism schema v" +
                             std::to_string(version));
        } catch (const LifelineError& e) {
            METABOLISM_CRITICAL("Metabolism tables unusable in '" + world.getWorldId() +
                                "': " + e.what());
            storage.reset();
        }
    }

    MetabolismConfig config = getConfig();
    auto runtime = world.getOrCreateModuleState<WorldRuntime>(getId(), [&]() {
        auto created = std::make_shared<WorldRuntime>();
        created->engine = std::make_shared<MetabolismEngine>(
            world.getWorldId(), storage, m_context->getThreadSystem(), config, m_activity, m_sink);
        created->scheduler = std::make_unique<TickScheduler>("Tick[" + world.getWorldId() + "]");
        return created;
    });

    if (runtime->scheduler->isRunning()) {
        return;
    }
    std::shared_ptr<MetabolismEngine> engine = runtime->engine;
    m_service->addEngine(engine);
    runtime->scheduler->start(std::chrono::milliseconds(config.tickPeriodMs),
                              [engine](double elapsedSeconds) { engine->tick(elapsedSeconds); });
}

void MetabolismModule::onWorldRemoving(WorldContext& world) {
    teardown(world);
}

void MetabolismModule::teardown(WorldContext& world) {
    auto runtime = world.getModuleState<WorldRuntime>(getId());
    if (!runtime) {
        return;
    }

    runtime->scheduler->stop();
    bool flushed = runtime->engine->shutdown(m_context->getShutdownFlushTimeout());
    if (!flushed) {
        METABOLISM_ERROR("World '" + world.getWorldId() +
                         "' closed before every metabolism write completed");
    }
    if (m_service) {
        m_service->removeEngine(world.getWorldId());
    }
    world.removeModuleState(getId());
}

void MetabolismModule::onPlayerJoin(const std::string& playerId, WorldContext& world) {
    auto runtime = world.getModuleState<WorldRuntime>(getId());
    if (!runtime) {
        METABOLISM_WARN("Join of " + playerId + " in '" + world.getWorldId() +
                        "' before its metabolism runtime exists");
        return;
    }
    runtime->engine->join(playerId);
}

void MetabolismModule::onPlayerLeave(const std::string& playerId, WorldContext& world) {
    if (auto runtime = world.getModuleState<WorldRuntime>(getId())) {
        runtime->engine->leave(playerId);
    }
}

void MetabolismModule::onConfigChanged(const MetabolismConfig& config) {
    ConfigLoadStatus status =
        m_context->getConfigStore().getStatus(MetabolismConfig::DOCUMENT_NAME);
    if (status == ConfigLoadStatus::ParseFailed || status == ConfigLoadStatus::MigrationFailed ||
        status == ConfigLoadStatus::ValidationFailed) {
        METABOLISM_WARN(std::string("Reloaded metabolism config rejected (") + toString(status) +
                        "); keeping the current values");
        return;
    }

    {
        std::lock_guard<std::mutex> lock(m_configMutex);
        m_config = config;
    }

    for (const auto& worldId : m_context->getWorlds().getWorldIds()) {
        auto world = m_context->getWorlds().find(worldId);
        auto runtime = world ? world->getModuleState<WorldRuntime>(getId()) : nullptr;
        if (!runtime) {
            continue;
        }
        runtime->engine->applyConfig(config);
        runtime->scheduler->setPeriod(std::chrono::milliseconds(config.tickPeriodMs));
    }
    METABOLISM_INFO("Metabolism config change queued for the next tick");
}

MetabolismConfig MetabolismModule::getConfig() const {
    std::lock_guard<std::mutex> lock(m_configMutex);
    return m_config;
}

} // namespace Lifeline
