/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef METABOLISM_ENGINE_HPP
#define METABOLISM_ENGINE_HPP

/**
 * @file MetabolismEngine.hpp
 * @brief Per-world stat simulation with write-behind persistence
 *
 * One engine exists per live world and is ticked by that world's
 * TickScheduler. Each tick depletes (or restores) every enabled stat of every
 * Active player by rate * multiplier(activity) * elapsed / 60, clamps it,
 * re-evaluates effects and reports changes to the EffectSink.
 *
 * Player lifecycle:
 *   Uninitialized -> Active (join) -> Suspended (leave) -> Active (rejoin)
 *   Any -> Terminated (engine shutdown)
 *
 * A Suspended player is flushed immediately and dropped from memory once that
 * flush has landed. Without storage a leaving player is dropped at once. Changed stats are otherwise flushed every
 * flushIntervalTicks ticks on the I/O pool; the tick never waits for disk.
 */

#include "host/HostInterfaces.hpp"
#include "metabolism/EffectBandSet.hpp"
#include "metabolism/MetabolismConfig.hpp"
#include "metabolism/StatVector.hpp"
#include "metabolism/StatusLine.hpp"
#include "storage/WriteBehindQueue.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace Lifeline {

class ThreadSystem;
class WorldStorage;

enum class PlayerPhase : uint8_t {
    Uninitialized,
    Active,
    Suspended,
    Terminated
};

const char* toString(PlayerPhase phase);

struct FlushKey {
    std::string worldId;
    std::string playerId;

    bool operator<(const FlushKey& other) const {
        return worldId != other.worldId ? worldId < other.worldId : playerId < other.playerId;
    }
};

class MetabolismEngine {
public:
    /**
     * @param storage the world's storage, or nullptr to run in memory only
     * @param activity movement source; nullptr treats everyone as idle
     * @param sink effect and status receiver; may be nullptr
     */
    MetabolismEngine(std::string worldId, std::shared_ptr<WorldStorage> storage,
                     ThreadSystem& io, MetabolismConfig config,
                     std::shared_ptr<ActivitySource> activity,
                     std::shared_ptr<EffectSink> sink);
    ~MetabolismEngine();

    MetabolismEngine(const MetabolismEngine&) = delete;
    MetabolismEngine& operator=(const MetabolismEngine&) = delete;

    /**
     * @brief Activates a player, resuming a Suspended one or loading from storage
     *
     * Stored stats are read without holding the engine lock.
     * @throws StorageBusy if the stored stats could not be read in time
     */
    void join(const std::string& playerId);

    // Suspends a player and flushes its stats right away
    void leave(const std::string& playerId);

    /**
     * @brief Advances the simulation; called only from the world's tick thread
     * @param elapsedSeconds real time since the previous tick; negative or
     *        non-finite values count as zero
     */
    void tick(double elapsedSeconds);

    std::optional<StatVector> getStats(const std::string& playerId) const;
    std::vector<std::string> getActiveEffects(const std::string& playerId) const;
    std::vector<std::string> getEffectLabels(const std::string& playerId) const;
    PlayerPhase getPhase(const std::string& playerId) const;

    /**
     * @brief Adds to a stat (food, drink, rest); clamped like any other change
     * @return false if the player is not active or has no such stat
     */
    bool restore(const std::string& playerId, const std::string& stat, double amount);

    // Administrative override of a single stat value
    bool setStat(const std::string& playerId, const std::string& stat, double value);

    /**
     * @brief Respawn reset: every configured stat back to its default and
     *        every active effect exited
     *
     * The reset is written through immediately. The next tick re-enters any
     * effect the default values qualify for.
     * @return false if the player is not active
     */
    bool resetStats(const std::string& playerId);

    /**
     * @brief Queues every changed player for writing now
     * @return number of players staged
     */
    size_t forceFlush();

    // Waits for in-flight writes; false on timeout
    bool waitForFlush(std::chrono::milliseconds timeout) const;

    /**
     * @brief Replaces the configuration at the start of the next tick
     */
    void applyConfig(const MetabolismConfig& config);

    /**
     * @brief Terminates every player, flushes and waits (bounded) for the writes
     * @return false if writes were still pending when the timeout expired
     */
    bool shutdown(std::chrono::milliseconds timeout);

    const std::string& getWorldId() const { return m_worldId; }
    [[nodiscard]] bool isDegraded() const { return m_queue == nullptr; }
    [[nodiscard]] bool isShutdown() const;
    size_t getPlayerCount() const;
    size_t getPendingWrites() const;
    uint64_t getTickCount() const;
    MetabolismConfig getConfig() const;

private:
    struct PlayerState {
        PlayerPhase phase{PlayerPhase::Uninitialized};
        StatVector stats;
        EffectBandSet effects;
        std::map<std::string, double> lastReported;
        bool reportedOnce{false};
    };

    struct Notification {
        std::string playerId;
        std::vector<EffectTransition> transitions;
        std::string statusLine;
    };

    PlayerState createState(const std::map<std::string, double>& persisted) const;
    // Returns Exited transitions for active effects the config dropped
    std::vector<EffectTransition> rebuildForConfig(PlayerState& state) const;
    bool admitKnownPlayer(const std::string& playerId);
    void applyPendingConfig(std::vector<Notification>& notifications);
    void advanceActive(double elapsedSeconds, std::vector<Notification>& notifications);
    ActivityState classify(const std::string& playerId) const;
    bool advancePlayer(PlayerState& state, ActivityState activity, double elapsedSeconds);
    std::string buildStatusLine(PlayerState& state) const;
    void markDirty(const std::string& playerId);
    size_t stageDirty();
    void sweepSuspended();
    void deliver(const std::vector<Notification>& notifications) const;

    std::string m_worldId;
    std::shared_ptr<WorldStorage> m_storage;
    std::shared_ptr<ActivitySource> m_activity;
    std::shared_ptr<EffectSink> m_sink;
    std::unique_ptr<WriteBehindQueue<FlushKey, StatVector>> m_queue;
    StatusLineComposer m_statusLine{StatusLineComposer::makeDefault()};

    mutable std::mutex m_mutex;
    MetabolismConfig m_config;
    std::optional<MetabolismConfig> m_pendingConfig;
    std::map<std::string, PlayerState> m_players;
    std::set<std::string> m_dirty;
    uint64_t m_tickCount{0};
    uint64_t m_releases{0};
    int m_ticksSinceFlush{0};
    bool m_shutdown{false};
};

} // namespace Lifeline

#endif // METABOLISM_ENGINE_HPP
