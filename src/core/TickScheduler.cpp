/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/TickScheduler.hpp"
#include "core/Logger.hpp"

#include <exception>

namespace Lifeline {

TickScheduler::TickScheduler(std::string name)
    : m_name(std::move(name))
{
}

TickScheduler::~TickScheduler() {
    stop();
}

bool TickScheduler::start(std::chrono::milliseconds period, TickHandler handler) {
    if (period.count() <= 0 || !handler) {
        SCHEDULER_ERROR(m_name + ": refusing to start with period " +
                        std::to_string(period.count()) + "ms");
        return false;
    }
    if (m_running.load(std::memory_order_acquire)) {
        SCHEDULER_WARN(m_name + " already running");
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_period = period;
        m_stopRequested = false;
    }
    m_handler = std::move(handler);
    m_running.store(true, std::memory_order_release);
    m_thread = std::thread(&TickScheduler::run, this);

    SCHEDULER_INFO(m_name + " started (" + std::to_string(period.count()) + "ms period)");
    return true;
}

void TickScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stopRequested = true;
    }
    m_wakeup.notify_all();

    if (m_thread.joinable()) {
        m_thread.join();
        SCHEDULER_INFO(m_name + " stopped after " + std::to_string(getTickCount()) + " ticks");
    }
    m_running.store(false, std::memory_order_release);
}

void TickScheduler::setPeriod(std::chrono::milliseconds period) {
    if (period.count() <= 0) {
        SCHEDULER_WARN(m_name + ": ignoring non-positive period");
        return;
    }
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_period = period;
    }
    m_wakeup.notify_all();
}

std::chrono::milliseconds TickScheduler::getPeriod() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_period;
}

void TickScheduler::run() {
    using Clock = std::chrono::steady_clock;

    Clock::time_point lastTick = Clock::now();
    Clock::time_point nextTick = lastTick;

    while (true) {
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            nextTick = lastTick + m_period;
            // Re-evaluated on every wakeup so setPeriod() applies to the current wait
            while (!m_stopRequested && Clock::now() < nextTick) {
                m_wakeup.wait_until(lock, nextTick);
                nextTick = lastTick + m_period;
            }
            if (m_stopRequested) {
                break;
            }
        }

        Clock::time_point tickStart = Clock::now();
        double elapsedSeconds = std::chrono::duration<double>(tickStart - lastTick).count();
        lastTick = tickStart;

        try {
            m_handler(elapsedSeconds);
        } catch (const std::exception& e) {
            SCHEDULER_ERROR(m_name + " tick threw: " + std::string(e.what()));
        }
        m_tickCount.fetch_add(1, std::memory_order_relaxed);

        Clock::duration tickDuration = Clock::now() - tickStart;
        if (tickDuration > getPeriod()) {
            m_overrunCount.fetch_add(1, std::memory_order_relaxed);
            SCHEDULER_WARN(m_name + " tick overran its period (" +
                           std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(
                               tickDuration).count()) + "ms)");
        }
    }
}

} // namespace Lifeline
