/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef TICK_SCHEDULER_HPP
#define TICK_SCHEDULER_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace Lifeline {

/**
 * TickScheduler runs one fixed-period simulation loop on its own thread.
 *
 * - At most one tick is in flight; a tick that overruns delays the next one
 *   instead of queueing catch-up ticks.
 * - The handler receives the real seconds elapsed since the previous tick
 *   started.
 * - stop() lets the in-flight tick finish and joins the thread.
 *
 * One scheduler exists per live world.
 */
class TickScheduler {
public:
    using TickHandler = std::function<void(double elapsedSeconds)>;

    explicit TickScheduler(std::string name);

    /**
     * Destructor - stops the loop if still running
     */
    ~TickScheduler();

    /**
     * Start ticking
     * @param period time between tick starts
     * @param handler called on the scheduler thread for every tick
     * @return false if already running or the period is not positive
     */
    bool start(std::chrono::milliseconds period, TickHandler handler);

    /**
     * Stop ticking and join the thread
     * Safe to call more than once; must not be called from the handler
     */
    void stop();

    /**
     * Change the period; takes effect from the next wait
     */
    void setPeriod(std::chrono::milliseconds period);

    std::chrono::milliseconds getPeriod() const;
    bool isRunning() const { return m_running.load(std::memory_order_acquire); }
    uint64_t getTickCount() const { return m_tickCount.load(std::memory_order_relaxed); }
    uint64_t getOverrunCount() const { return m_overrunCount.load(std::memory_order_relaxed); }
    const std::string& getName() const { return m_name; }

private:
    void run();

    std::string m_name;
    TickHandler m_handler;
    std::thread m_thread;

    mutable std::mutex m_mutex;
    std::condition_variable m_wakeup;
    std::chrono::milliseconds m_period{1000};
    bool m_stopRequested{false};

    std::atomic<bool> m_running{false};
    std::atomic<uint64_t> m_tickCount{0};
    std::atomic<uint64_t> m_overrunCount{0};

    TickScheduler(const TickScheduler&) = delete;
    TickScheduler& operator=(const TickScheduler&) = delete;
};

} // namespace Lifeline

#endif // TICK_SCHEDULER_HPP
