/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "metabolism/MetabolismEngine.hpp"
#include "core/CoreErrors.hpp"
#include "core/Logger.hpp"
#include "core/ThreadSystem.hpp"
#include "metabolism/MetabolismRepository.hpp"
#include "storage/WorldStorage.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <thread>

namespace Lifeline {

namespace {

constexpr int BUSY_RETRIES = 3;
constexpr std::chrono::milliseconds BUSY_BACKOFF{10};

// Runs on the I/O pool; holds the storage alive but never the engine
void persistWithBackoff(WorldStorage& storage, const FlushKey& key, const StatVector& stats) {
    MetabolismRepository repository(storage);
    for (int attempt = 0;; ++attempt) {
        try {
            repository.save(key.playerId, stats);
            return;
        } catch (const StorageBusy&) {
            if (attempt >= BUSY_RETRIES) {
                throw;
            }
            std::this_thread::sleep_for(BUSY_BACKOFF * (1 << attempt));
        }
    }
}

std::map<std::string, double> loadWithBackoff(WorldStorage& storage, const std::string& playerId) {
    MetabolismRepository repository(storage);
    for (int attempt = 0;; ++attempt) {
        try {
            return repository.load(playerId);
        } catch (const StorageBusy&) {
            if (attempt >= BUSY_RETRIES) {
                throw;
            }
            std::this_thread::sleep_for(BUSY_BACKOFF * (1 << attempt));
        }
    }
}

} // anonymous namespace

const char* toString(PlayerPhase phase) {
    switch (phase) {
    case PlayerPhase::Uninitialized:
        return "Uninitialized";
    case PlayerPhase::Active:
        return "Active";
    case PlayerPhase::Suspended:
        return "Suspended";
    case PlayerPhase::Terminated:
        return "Terminated";
    }
    return "Unknown";
}

MetabolismEngine::MetabolismEngine(std::string worldId, std::shared_ptr<WorldStorage> storage,
                                   ThreadSystem& io, MetabolismConfig config,
                                   std::shared_ptr<ActivitySource> activity,
                                   std::shared_ptr<EffectSink> sink)
    : m_worldId(std::move(worldId)),
      m_storage(std::move(storage)),
      m_activity(std::move(activity)),
      m_sink(std::move(sink)),
      m_config(std::move(config)) {
    if (m_storage) {
        std::shared_ptr<WorldStorage> target = m_storage;
        m_queue = std::make_unique<WriteBehindQueue<FlushKey, StatVector>>(
            io,
            [target](const FlushKey& key, const StatVector& stats) {
                persistWithBackoff(*target, key, stats);
            },
            "Metabolism[" + m_worldId + "]");
    } else {
        METABOLISM_CRITICAL("World '" + m_worldId +
                            "' has no usable storage; metabolism runs in memory only");
    }
}

MetabolismEngine::~MetabolismEngine() {
    if (!isShutdown()) {
        shutdown(std::chrono::milliseconds(0));
    }
}

MetabolismEngine::PlayerState
MetabolismEngine::createState(const std::map<std::string, double>& persisted) const {
    PlayerState state;
    state.phase = PlayerPhase::Active;

    for (const auto& [name, value] : persisted) {
        auto configured = m_config.stats.find(name);
        if (configured != m_config.stats.end()) {
            state.stats.define(name, value, configured->second.min, configured->second.max);
        } else {
            // Not configured any more: keep the stored value as it is
            state.stats.define(name, value, std::min(0.0, value), std::max(100.0, value));
        }
    }
    rebuildForConfig(state);
    return state;
}

std::vector<EffectTransition> MetabolismEngine::rebuildForConfig(PlayerState& state) const {
    for (const auto& [name, stat] : m_config.stats) {
        if (state.stats.has(name)) {
            state.stats.setBounds(name, stat.min, stat.max);
        } else {
            state.stats.define(name, stat.defaultValue, stat.min, stat.max);
        }
    }
    EffectBandSet effects(m_config.effects, m_config.hysteresisEpsilon);
    std::vector<EffectTransition> removed = effects.adoptStateFrom(state.effects);
    state.effects = std::move(effects);
    return removed;
}

bool MetabolismEngine::admitKnownPlayer(const std::string& playerId) {
    if (m_shutdown) {
        METABOLISM_WARN("Join of " + playerId + " after world '" + m_worldId +
                        "' shut down ignored");
        return true;
    }
    auto it = m_players.find(playerId);
    if (it == m_players.end()) {
        return false;
    }
    if (it->second.phase == PlayerPhase::Active) {
        METABOLISM_DEBUG("Player " + playerId + " already active in '" + m_worldId + "'");
        return true;
    }
    it->second.phase = PlayerPhase::Active;
    METABOLISM_INFO("Player " + playerId + " resumed in '" + m_worldId + "'");
    return true;
}

void MetabolismEngine::join(const std::string& playerId) {
    std::vector<Notification> notifications;
    for (;;) {
        uint64_t releases = 0;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (admitKnownPlayer(playerId)) {
                return;
            }
            releases = m_releases;
        }

        // Disk read happens outside the engine lock; tick must not wait on it
        std::map<std::string, double> persisted;
        if (m_storage) {
            persisted = loadWithBackoff(*m_storage, playerId);
        }

        std::lock_guard<std::mutex> lock(m_mutex);
        if (admitKnownPlayer(playerId)) {
            return;
        }
        if (releases != m_releases) {
            // A player was written and released meanwhile; the rows may be stale
            continue;
        }

        PlayerState state = createState(persisted);
        Notification notification{playerId, state.effects.evaluate(state.stats),
                                  buildStatusLine(state)};
        notifications.push_back(std::move(notification));
        m_players.emplace(playerId, std::move(state));
        markDirty(playerId);
        METABOLISM_INFO("Player " + playerId + " joined '" + m_worldId + "'");
        break;
    }
    deliver(notifications);
}

void MetabolismEngine::leave(const std::string& playerId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_players.find(playerId);
    if (it == m_players.end() || it->second.phase != PlayerPhase::Active) {
        return;
    }

    if (!m_queue) {
        // Nothing to write to, so the stats go with the player
        m_players.erase(it);
        ++m_releases;
        METABOLISM_INFO("Player " + playerId + " left '" + m_worldId +
                        "'; in-memory stats discarded");
        return;
    }

    it->second.phase = PlayerPhase::Suspended;
    m_queue->stage(FlushKey{m_worldId, playerId}, it->second.stats);
    m_dirty.erase(playerId);
    m_queue->flush(FlushKey{m_worldId, playerId}, TaskPriority::High);
    METABOLISM_INFO("Player " + playerId + " suspended in '" + m_worldId + "'");
}

void MetabolismEngine::tick(double elapsedSeconds) {
    if (!std::isfinite(elapsedSeconds) || elapsedSeconds < 0.0) {
        elapsedSeconds = 0.0;
    }

    std::vector<Notification> notifications;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_shutdown) {
            return;
        }
        applyPendingConfig(notifications);
        ++m_tickCount;
        if (m_config.enabled) {
            advanceActive(elapsedSeconds, notifications);
        }
    }
    deliver(notifications);
}

void MetabolismEngine::advanceActive(double elapsedSeconds,
                                     std::vector<Notification>& notifications) {
    for (auto& [playerId, state] : m_players) {
        if (state.phase != PlayerPhase::Active) {
            continue;
        }
        try {
            ActivityState activity = classify(playerId);
            if (advancePlayer(state, activity, elapsedSeconds)) {
                markDirty(playerId);
            }
            Notification notification{playerId, state.effects.evaluate(state.stats),
                                      buildStatusLine(state)};
            if (!notification.transitions.empty() || !notification.statusLine.empty()) {
                notifications.push_back(std::move(notification));
            }
        } catch (const std::exception& e) {
            METABOLISM_ERROR("Tick failed for player " + playerId + " in '" + m_worldId +
                             "': " + e.what());
        }
    }

    if (++m_ticksSinceFlush >= m_config.flushIntervalTicks) {
        m_ticksSinceFlush = 0;
        if (stageDirty() > 0) {
            m_queue->flush(TaskPriority::Normal);
        }
    }
    sweepSuspended();
}

void MetabolismEngine::applyPendingConfig(std::vector<Notification>& notifications) {
    if (!m_pendingConfig) {
        return;
    }
    m_config = std::move(*m_pendingConfig);
    m_pendingConfig.reset();
    for (auto& [playerId, state] : m_players) {
        try {
            std::vector<EffectTransition> removed = rebuildForConfig(state);
            markDirty(playerId);
            if (!removed.empty() && state.phase == PlayerPhase::Active) {
                notifications.push_back(Notification{playerId, std::move(removed), {}});
            }
        } catch (const std::exception& e) {
            METABOLISM_ERROR("Could not apply new config to player " + playerId + ": " +
                             e.what());
        }
    }
    METABOLISM_INFO("Applied new metabolism config to world '" + m_worldId + "'");
}

ActivityState MetabolismEngine::classify(const std::string& playerId) const {
    if (!m_activity) {
        return ActivityState::Idle;
    }
    try {
        return classifyMovement(m_activity->sample(m_worldId, playerId));
    } catch (const ActivityClassificationUnavailable& e) {
        METABOLISM_DEBUG("No activity for " + playerId + ", treating as idle: " + e.what());
        return ActivityState::Idle;
    }
}

bool MetabolismEngine::advancePlayer(PlayerState& state, ActivityState activity,
                                     double elapsedSeconds) {
    bool changed = false;
    for (const auto& [name, stat] : m_config.stats) {
        if (!stat.enabled) {
            continue;
        }
        const StatValue* current = state.stats.find(name);
        if (current == nullptr) {
            continue;
        }
        double multiplier = stat.getMultiplier(activity);
        double next = current->value - stat.rate * multiplier * elapsedSeconds / 60.0;
        changed = state.stats.set(name, next) || changed;
    }
    return changed;
}

std::string MetabolismEngine::buildStatusLine(PlayerState& state) const {
    bool moved = !state.reportedOnce;
    for (const auto& [name, stat] : state.stats) {
        auto configured = m_config.stats.find(name);
        if (configured == m_config.stats.end() || !configured->second.enabled) {
            continue;
        }
        auto it = state.lastReported.find(name);
        if (it == state.lastReported.end() ||
            std::fabs(stat.value - it->second) > m_config.statusLineThreshold) {
            moved = true;
            break;
        }
    }
    if (!moved) {
        return {};
    }

    std::string line = m_statusLine.compose(StatusView{state.stats, state.effects, m_config});
    for (const auto& [name, stat] : state.stats) {
        auto configured = m_config.stats.find(name);
        if (configured != m_config.stats.end() && configured->second.enabled) {
            state.lastReported[name] = stat.value;
        }
    }
    state.reportedOnce = true;
    return line;
}

void MetabolismEngine::markDirty(const std::string& playerId) {
    if (m_queue) {
        m_dirty.insert(playerId);
    }
}

size_t MetabolismEngine::stageDirty() {
    if (!m_queue) {
        return 0;
    }
    size_t staged = 0;
    for (const auto& playerId : m_dirty) {
        auto it = m_players.find(playerId);
        if (it == m_players.end()) {
            continue;
        }
        m_queue->stage(FlushKey{m_worldId, playerId}, it->second.stats);
        ++staged;
    }
    m_dirty.clear();
    return staged;
}

void MetabolismEngine::sweepSuspended() {
    if (!m_queue) {
        return;
    }
    for (auto it = m_players.begin(); it != m_players.end();) {
        const std::string& playerId = it->first;
        if (it->second.phase == PlayerPhase::Suspended && m_dirty.count(playerId) == 0 &&
            !m_queue->isPending(FlushKey{m_worldId, playerId})) {
            METABOLISM_DEBUG("Released stats of " + playerId + " in '" + m_worldId + "'");
            it = m_players.erase(it);
            ++m_releases;
        } else {
            ++it;
        }
    }
}

void MetabolismEngine::deliver(const std::vector<Notification>& notifications) const {
    if (!m_sink) {
        return;
    }
    for (const auto& notification : notifications) {
        try {
            for (const auto& transition : notification.transitions) {
                m_sink->onEffectChanged(m_worldId, notification.playerId, transition.effect,
                                        transition.event == TransitionEvent::Entered);
            }
            if (!notification.statusLine.empty()) {
                m_sink->onStatusLine(m_worldId, notification.playerId, notification.statusLine);
            }
        } catch (const std::exception& e) {
            METABOLISM_WARN("Effect sink failed for " + notification.playerId + ": " + e.what());
        }
    }
}

std::optional<StatVector> MetabolismEngine::getStats(const std::string& playerId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_players.find(playerId);
    if (it == m_players.end()) {
        return std::nullopt;
    }
    return it->second.stats;
}

std::vector<std::string> MetabolismEngine::getActiveEffects(const std::string& playerId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_players.find(playerId);
    return it != m_players.end() ? it->second.effects.getActiveEffects()
                                 : std::vector<std::string>{};
}

std::vector<std::string> MetabolismEngine::getEffectLabels(const std::string& playerId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_players.find(playerId);
    return it != m_players.end() ? it->second.effects.getLabels() : std::vector<std::string>{};
}

PlayerPhase MetabolismEngine::getPhase(const std::string& playerId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_players.find(playerId);
    return it != m_players.end() ? it->second.phase : PlayerPhase::Uninitialized;
}

bool MetabolismEngine::restore(const std::string& playerId, const std::string& stat,
                               double amount) {
    if (!std::isfinite(amount)) {
        return false;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_players.find(playerId);
    if (it == m_players.end() || it->second.phase != PlayerPhase::Active ||
        !it->second.stats.has(stat)) {
        return false;
    }
    if (it->second.stats.adjust(stat, amount)) {
        markDirty(playerId);
    }
    return true;
}

bool MetabolismEngine::setStat(const std::string& playerId, const std::string& stat,
                               double value) {
    if (!std::isfinite(value)) {
        return false;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_players.find(playerId);
    if (it == m_players.end() || it->second.phase != PlayerPhase::Active ||
        !it->second.stats.has(stat)) {
        return false;
    }
    if (it->second.stats.set(stat, value)) {
        markDirty(playerId);
    }
    METABOLISM_INFO("Set " + stat + " of " + playerId + " to " + std::to_string(value));
    return true;
}

bool MetabolismEngine::resetStats(const std::string& playerId) {
    Notification notification{playerId, {}, {}};
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_players.find(playerId);
        if (it == m_players.end() || it->second.phase != PlayerPhase::Active) {
            return false;
        }
        PlayerState& state = it->second;
        for (const auto& [name, stat] : m_config.stats) {
            state.stats.set(name, stat.defaultValue);
        }
        // Buffs are dropped too; the next tick re-enters whatever the defaults earn
        notification.transitions = state.effects.clear();
        state.reportedOnce = false;
        notification.statusLine = buildStatusLine(state);

        if (m_queue) {
            m_queue->stage(FlushKey{m_worldId, playerId}, state.stats);
            m_dirty.erase(playerId);
            m_queue->flush(FlushKey{m_worldId, playerId}, TaskPriority::High);
        }
        METABOLISM_INFO("Reset stats of " + playerId + " in '" + m_worldId + "'");
    }
    deliver({notification});
    return true;
}

size_t MetabolismEngine::forceFlush() {
    std::lock_guard<std::mutex> lock(m_mutex);
    size_t staged = stageDirty();
    if (m_queue) {
        m_queue->flush(TaskPriority::High);
    }
    return staged;
}

bool MetabolismEngine::waitForFlush(std::chrono::milliseconds timeout) const {
    return m_queue ? m_queue->waitUntilIdle(timeout) : true;
}

void MetabolismEngine::applyConfig(const MetabolismConfig& config) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_pendingConfig = config;
}

bool MetabolismEngine::shutdown(std::chrono::milliseconds timeout) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_shutdown) {
            return true;
        }
        m_shutdown = true;
        for (auto& [playerId, state] : m_players) {
            if (state.phase == PlayerPhase::Active) {
                markDirty(playerId);
            }
            state.phase = PlayerPhase::Terminated;
        }
        stageDirty();
        if (m_queue) {
            m_queue->flush(TaskPriority::High);
        }
    }

    bool flushed = waitForFlush(timeout);
    size_t pending = getPendingWrites();
    if (!flushed || pending > 0) {
        METABOLISM_ERROR("World '" + m_worldId + "' shut down with " + std::to_string(pending) +
                         " unsaved player snapshots");
        flushed = false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    size_t players = m_players.size();
    m_players.clear();
    m_dirty.clear();
    METABOLISM_INFO("Metabolism for world '" + m_worldId + "' terminated (" +
                    std::to_string(players) + " players)");
    return flushed;
}

bool MetabolismEngine::isShutdown() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_shutdown;
}

size_t MetabolismEngine::getPlayerCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_players.size();
}

size_t MetabolismEngine::getPendingWrites() const {
    return m_queue ? m_queue->pendingCount() : 0;
}

uint64_t MetabolismEngine::getTickCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_tickCount;
}

MetabolismConfig MetabolismEngine::getConfig() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_config;
}

} // namespace Lifeline
